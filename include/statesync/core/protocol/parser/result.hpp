#pragma once

#include <cstdint>
#include <string_view>


namespace statesync::core::protocol::parser {

// ===============================================
// PARSER RESULT ENUM
// ===============================================
enum class Result : std::uint8_t {
    Ok             = 0,            // Helper-level success (structurally valid)
    Ignored        = 1,            // Not applicable
    InvalidJson    = 2,            // Structural failure
    InvalidSchema  = 3,            // Missing required field, type mismatch, etc.
    InvalidValue   = 4,            // Field present but semantically invalid
    Parsed         = 5             // Message parsed successfully
};

[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Ok:             return "Ok";
        case Result::Ignored:        return "Ignored";
        case Result::InvalidJson:    return "InvalidJson";
        case Result::InvalidSchema:  return "InvalidSchema";
        case Result::InvalidValue:   return "InvalidValue";
        case Result::Parsed:         return "Parsed";
        default:                     return "unknown";
    }
}

} // namespace statesync::core::protocol::parser
