#pragma once

#include <cstdint>
#include <cstddef>
#include <string_view>


namespace statesync::core::protocol {

// Transmission priority. All High messages leave before any Normal, all
// Normal before any Low; FIFO within a tier.
enum class Priority : std::uint8_t {
    High   = 0,
    Normal = 1,
    Low    = 2
};

inline constexpr std::size_t PRIORITY_TIERS = 3;

[[nodiscard]]
inline constexpr std::size_t tier(Priority p) noexcept {
    return static_cast<std::size_t>(p);
}

[[nodiscard]]
inline constexpr std::string_view to_string(Priority p) noexcept {
    switch (p) {
        case Priority::High:   return "high";
        case Priority::Normal: return "normal";
        case Priority::Low:    return "low";
        default:               return "normal";
    }
}

// Unknown names resolve to Normal.
[[nodiscard]]
inline constexpr Priority priority_from_string(std::string_view s) noexcept {
    if (s == "high") return Priority::High;
    if (s == "low")  return Priority::Low;
    return Priority::Normal;
}

} // namespace statesync::core::protocol
