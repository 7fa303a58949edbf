#pragma once

#include <cstddef>
#include <cstdint>
#include <string>


namespace statesync::core::sync {

// -----------------------------------------------------------------------------
// Point-in-time metrics of a Session (copied out, never updated in place).
// -----------------------------------------------------------------------------
struct Metrics {
    // --- headline ---
    bool connected{false};
    std::size_t queue_depth{0};
    std::size_t buffered_count{0};          // events awaiting event_ack, in flight or not
    std::uint32_t reconnect_attempts{0};

    // --- link ---
    std::string status{"disconnected"};
    std::uint32_t active_connection{0};     // 0 = none
    std::size_t open_connections{0};
    std::uint64_t connection_switches{0};

    // --- outbound ---
    std::uint64_t messages_sent{0};
    std::uint64_t send_retries{0};
    std::uint64_t messages_failed{0};
    std::uint64_t messages_evicted{0};
    std::uint64_t messages_dropped{0};
    std::size_t in_flight_events{0};

    // --- inbound ---
    std::uint64_t messages_received{0};
    std::uint64_t invalid_messages{0};
    std::uint64_t unknown_messages{0};      // unmodeled type, no catch-all
    std::uint64_t unhandled_messages{0};    // known type, no handler
    std::uint64_t handler_errors{0};

    // --- requests ---
    std::size_t pending_responses{0};
    std::uint64_t responses_resolved{0};
    std::uint64_t responses_timed_out{0};
};

} // namespace statesync::core::sync
