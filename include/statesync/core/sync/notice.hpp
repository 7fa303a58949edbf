#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "statesync/core/sync/error.hpp"


namespace statesync::core::sync {

// ===============================================================
// LIFECYCLE NOTICES
// ===============================================================
//
// Observable side effects of the core that are not inbound messages.
// They are queued while the session mutates its state and delivered to
// notice handlers at the end of poll(), so a handler may safely call back
// into the session (submit, send_and_await, ...).
//
enum class NoticeKind : std::uint8_t {
    Connected,          // pool gained an active connection
    Disconnected,       // pool lost its last usable connection (or disconnect())
    ConnectionSwitch,   // active role moved to a standby
    StatusChanged,      // reconnection supervisor changed state
    StateChanged,       // state_sync applied to the store
    Milestone,          // threshold crossed for the first time
    QueueOverflow,      // incoming message dropped by a full queue
    MessageFailed,      // message dropped after exhausting its send retries
    HandshakeRejected,  // authority refused a pool member
};

[[nodiscard]]
inline constexpr std::string_view to_string(NoticeKind k) noexcept {
    switch (k) {
        case NoticeKind::Connected:         return "connected";
        case NoticeKind::Disconnected:      return "disconnected";
        case NoticeKind::ConnectionSwitch:  return "connection_switch";
        case NoticeKind::StatusChanged:     return "status_changed";
        case NoticeKind::StateChanged:      return "state_changed";
        case NoticeKind::Milestone:         return "milestone";
        case NoticeKind::QueueOverflow:     return "queue_overflow";
        case NoticeKind::MessageFailed:     return "message_failed";
        case NoticeKind::HandshakeRejected: return "handshake_rejected";
        default:                            return "unknown";
    }
}

inline constexpr std::size_t NOTICE_KIND_COUNT = static_cast<std::size_t>(NoticeKind::HandshakeRejected) + 1;

// Fields are meaningful per kind:
//   detail       status string, milestone label, rejection reason
//   message_id   QueueOverflow / MessageFailed
//   from / to    ConnectionSwitch (connection ids); Connected uses `to`
//   value        StateChanged / Milestone
//   error        MessageFailed (SendFailure), QueueOverflow, Disconnected
struct Notice {
    NoticeKind kind{NoticeKind::StatusChanged};
    std::string detail;
    std::string message_id;
    std::uint32_t from{0};
    std::uint32_t to{0};
    double value{0.0};
    Error error{Error::None};
};

} // namespace statesync::core::sync
