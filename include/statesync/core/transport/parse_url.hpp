#pragma once

#include <string>
#include <string_view>
#include <cstdlib>
#include <cstddef>

#include "statesync/core/transport/error.hpp"


namespace statesync::core::transport {

    // Contains parsed URL components
    struct ParsedUrl {
        bool secure{false};   // true = wss, false = ws
        std::string host;
        std::string port;
        std::string path;
    };


    // ---------------------------------------------------------------------
    // Minimal URL parser supporting ws:// and wss://
    // Accepts the common endpoint shapes and rejects malformed inputs
    // without attempting full RFC compliance.
    //
    // Example inputs:
    //   ws://localhost:8765
    //   wss://sync.example.com/v1/stream
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_url(std::string_view url, ParsedUrl& out) noexcept {
        out = ParsedUrl{};
        // 1) Extract scheme
        constexpr std::string_view ws  = "ws://";
        constexpr std::string_view wss = "wss://";
        std::size_t pos = 0;
        if (url.substr(0, ws.size()) == ws) {
            out.secure = false;
            pos = ws.size();
        }
        else if (url.substr(0, wss.size()) == wss) {
            out.secure = true;
            pos = wss.size();
        }
        else {
            return Error::InvalidUrl;
        }
        // 2) Extract host[:port]
        const std::size_t slash = url.find('/', pos);
        const std::string_view hostport = (slash == std::string_view::npos) ? url.substr(pos) : url.substr(pos, slash - pos);
        if (hostport.empty()) {
            return Error::InvalidUrl;
        }
        // 3) Split host and port
        const std::size_t colon = hostport.find(':');
        if (colon != std::string_view::npos) {
            out.host = std::string(hostport.substr(0, colon));
            out.port = std::string(hostport.substr(colon + 1));
        } else {
            out.host = std::string(hostport);
            out.port = (out.secure) ? "443" : "80";
        }
        // 4) Path (default "/" if missing)
        out.path = (slash == std::string_view::npos) ? std::string("/") : std::string(url.substr(slash));

        // Invariants check --------------------------------

        if (out.host.empty() || out.port.empty() || out.port.size() > 5) {
            return Error::InvalidUrl;
        }
        for (char c : out.port) {
            if (c < '0' || c > '9') {
                return Error::InvalidUrl;
            }
        }
        const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return Error::InvalidUrl;
        }
        // ---------------------------------------------------

        return Error::None;
    }

} // namespace statesync::core::transport
