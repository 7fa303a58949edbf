#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

#include "statesync/core/sync/error.hpp"
#include "statesync/core/transport/parse_url.hpp"
#include "lcr/log/logger.hpp"


namespace statesync::core::sync {

// -----------------------------------------------------------------------------
// Client configuration
// -----------------------------------------------------------------------------
struct Config {
    /// Endpoint of the remote authority (ws:// or wss://).
    std::string endpoint_url{"ws://localhost:8765"};

    /// Parallel connections to the same endpoint; one is active.
    std::uint32_t pool_size{1};

    /// Reconnect delay = min(cap, base * 2^attempt).
    std::chrono::milliseconds reconnect_base{1000};
    std::chrono::milliseconds reconnect_cap{30000};

    /// -1 = unlimited. Once exhausted the client parks in Offline.
    std::int32_t max_reconnect_attempts{-1};

    /// Ping cadence, and how many consecutive unanswered pings end a connection.
    std::chrono::milliseconds heartbeat_interval{30000};
    std::uint32_t heartbeat_max_missed{2};

    /// Default timeout of send_and_await().
    std::chrono::milliseconds message_timeout{10000};

    /// Window for the authority to answer the handshake.
    std::chrono::milliseconds handshake_timeout{5000};

    /// Bound of the blocking connect() call.
    std::chrono::milliseconds connect_timeout{5000};

    /// Outbound queue bound (all priority tiers together).
    std::size_t queue_capacity{1000};

    /// Offline buffer bound.
    std::size_t buffer_capacity{500};

    /// Send attempts per message before it is reported as failed.
    std::uint32_t max_send_retries{3};

    /// Identity announced in the handshake.
    std::string platform{"cpp"};
    std::vector<std::string> capabilities{"state_sync", "context_update", "event_stream"};
};

// Returns Error::None or Error::InvalidConfig (reason is logged).
[[nodiscard]]
inline Error validate(const Config& cfg) {
    transport::ParsedUrl url;
    if (transport::parse_url(cfg.endpoint_url, url) != transport::Error::None) {
        SS_ERROR("[CONFIG] Invalid endpoint url: '" << cfg.endpoint_url << "'");
        return Error::InvalidConfig;
    }
    if (cfg.pool_size == 0) {
        SS_ERROR("[CONFIG] pool_size must be >= 1");
        return Error::InvalidConfig;
    }
    if (cfg.reconnect_base.count() <= 0) {
        SS_ERROR("[CONFIG] reconnect_base must be > 0");
        return Error::InvalidConfig;
    }
    if (cfg.reconnect_cap < cfg.reconnect_base) {
        SS_ERROR("[CONFIG] reconnect_cap (" << cfg.reconnect_cap.count() << " ms) is below reconnect_base (" << cfg.reconnect_base.count() << " ms)");
        return Error::InvalidConfig;
    }
    if (cfg.max_reconnect_attempts < -1) {
        SS_ERROR("[CONFIG] max_reconnect_attempts must be -1 (unlimited) or >= 0");
        return Error::InvalidConfig;
    }
    if (cfg.heartbeat_interval.count() <= 0 || cfg.heartbeat_max_missed == 0) {
        SS_ERROR("[CONFIG] heartbeat_interval and heartbeat_max_missed must be > 0");
        return Error::InvalidConfig;
    }
    if (cfg.message_timeout.count() <= 0 || cfg.handshake_timeout.count() <= 0 || cfg.connect_timeout.count() <= 0) {
        SS_ERROR("[CONFIG] timeouts must be > 0");
        return Error::InvalidConfig;
    }
    if (cfg.queue_capacity == 0 || cfg.buffer_capacity == 0) {
        SS_ERROR("[CONFIG] queue_capacity and buffer_capacity must be > 0");
        return Error::InvalidConfig;
    }
    if (cfg.max_send_retries == 0) {
        SS_ERROR("[CONFIG] max_send_retries must be >= 1");
        return Error::InvalidConfig;
    }
    if (cfg.platform.empty()) {
        SS_ERROR("[CONFIG] platform must not be empty");
        return Error::InvalidConfig;
    }
    return Error::None;
}

} // namespace statesync::core::sync
