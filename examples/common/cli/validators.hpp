#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "statesync/core/transport/parse_url.hpp"


namespace statesync::examples::cli {

// -------------------------------------------------------------
// WebSocket URL validator
// -------------------------------------------------------------
inline auto ws_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        core::transport::ParsedUrl url;
        if (core::transport::parse_url(value, url) == core::transport::Error::None) {
            return {};
        }
        return "URL must be ws://host[:port][/path] or wss://host[:port][/path]";
    },
    "WebSocket URL validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::IsMember({"trace", "debug", "info", "warn", "error", "fatal", "off"});


// -------------------------------------------------------------
// Priority validator
// -------------------------------------------------------------
inline auto priority_validator = CLI::IsMember({"high", "normal", "low"});

} // namespace statesync::examples::cli
