#pragma once

#include <cstdint>
#include <string_view>


namespace statesync::core::sync {

// ===============================================================
// LINK STATUS
// ===============================================================
enum class LinkStatus : std::uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting,
    Offline
};

[[nodiscard]]
inline constexpr std::string_view to_string(LinkStatus s) noexcept {
    switch (s) {
        case LinkStatus::Disconnected: return "disconnected";
        case LinkStatus::Connecting:   return "connecting";
        case LinkStatus::Connected:    return "connected";
        case LinkStatus::Reconnecting: return "reconnecting";
        case LinkStatus::Offline:      return "offline";
        default:                       return "unknown";
    }
}

} // namespace statesync::core::sync
