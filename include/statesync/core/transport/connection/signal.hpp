/*
===============================================================================
 Connection Signals
===============================================================================

connection::Signal represents externally observable, edge-triggered facts
emitted by transport::Connection via its poll_signal() interface.

The Connection does not expose its internal FSM or timers. The owning pool
reacts to these facts to elect, demote and replace the active connection.

-------------------------------------------------------------------------------
 Signal Meanings
-------------------------------------------------------------------------------

Opened
  Transport is up and the handshake frame has been written.

Ready
  The remote authority accepted the handshake. The connection is now
  eligible to carry outbound traffic.

Failed
  The connection attempt failed before becoming Ready (transport error,
  handshake timeout or handshake rejection). last_error() tells which.

Lost
  A Ready connection went down (transport close, transport error or missed
  heartbeats). Emitted at most once per instance, never after Failed.

HeartbeatDue
  The heartbeat interval elapsed and the pong budget is not yet exhausted.
  The owner is expected to call send_heartbeat().

===============================================================================
*/

#pragma once

#include <cstdint>
#include <string_view>


namespace statesync::core::transport::connection {

enum class Signal : uint8_t {
    None,
    Opened,
    Ready,
    Failed,
    Lost,
    HeartbeatDue,
};

[[nodiscard]]
inline std::string_view to_string(Signal sig) noexcept {
    switch (sig) {
        case Signal::None:         return "None";
        case Signal::Opened:       return "Opened";
        case Signal::Ready:        return "Ready";
        case Signal::Failed:       return "Failed";
        case Signal::Lost:         return "Lost";
        case Signal::HeartbeatDue: return "HeartbeatDue";
        default:                   return "Unknown";
    }
}

} // namespace statesync::core::transport::connection
