#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "statesync/client.hpp"
#include "lcr/log/logger.hpp"


namespace statesync::examples::cli {

struct Params {
    Config config{};
    std::vector<std::string> events;
    std::string priority = "normal";
    std::string conversation_id;
    std::vector<std::string> topics;
    std::string summary;
    std::uint32_t run_seconds = 30;
    std::string log_level = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  URL              : " << config.endpoint_url << "\n"
           << "  Pool size        : " << config.pool_size << "\n"
           << "  Reconnect        : base " << config.reconnect_base.count() << " ms, cap "
           << config.reconnect_cap.count() << " ms, max attempts " << config.max_reconnect_attempts << "\n"
           << "  Heartbeat        : " << config.heartbeat_interval.count() << " ms x " << config.heartbeat_max_missed << "\n"
           << "  Message timeout  : " << config.message_timeout.count() << " ms\n"
           << "  Queue / buffer   : " << config.queue_capacity << " / " << config.buffer_capacity << "\n"
           << "  Platform         : " << config.platform << "\n"
           << "  Events           : " << events.size() << " (" << priority << ")\n"
           << "  Run for          : " << run_seconds << " s\n"
           << "  Log Level        : " << log_level << "\n";
    }
};

// Maps every Config option to a flag. Durations are given in milliseconds.
[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};
    auto& cfg = params.config;

    std::int64_t reconnect_base_ms = cfg.reconnect_base.count();
    std::int64_t reconnect_cap_ms = cfg.reconnect_cap.count();
    std::int64_t heartbeat_ms = cfg.heartbeat_interval.count();
    std::int64_t message_timeout_ms = cfg.message_timeout.count();
    std::int64_t handshake_timeout_ms = cfg.handshake_timeout.count();
    std::int64_t connect_timeout_ms = cfg.connect_timeout.count();

    app.add_option("--url", cfg.endpoint_url, "WebSocket endpoint of the remote authority")->check(ws_url_validator)->default_val(cfg.endpoint_url);
    app.add_option("--pool-size", cfg.pool_size, "Parallel connections (one active)")->check(CLI::Range(1u, 16u))->default_val(cfg.pool_size);
    app.add_option("--reconnect-base-ms", reconnect_base_ms, "Reconnect backoff base")->check(CLI::PositiveNumber)->default_val(reconnect_base_ms);
    app.add_option("--reconnect-cap-ms", reconnect_cap_ms, "Reconnect backoff cap")->check(CLI::PositiveNumber)->default_val(reconnect_cap_ms);
    app.add_option("--max-reconnect-attempts", cfg.max_reconnect_attempts, "-1 = unlimited")->check(CLI::Range(-1, 1'000'000))->default_val(cfg.max_reconnect_attempts);
    app.add_option("--heartbeat-ms", heartbeat_ms, "Heartbeat interval")->check(CLI::PositiveNumber)->default_val(heartbeat_ms);
    app.add_option("--heartbeat-max-missed", cfg.heartbeat_max_missed, "Missed pongs before a connection is dropped")->check(CLI::Range(1u, 100u))->default_val(cfg.heartbeat_max_missed);
    app.add_option("--message-timeout-ms", message_timeout_ms, "Default send_and_await timeout")->check(CLI::PositiveNumber)->default_val(message_timeout_ms);
    app.add_option("--handshake-timeout-ms", handshake_timeout_ms, "Handshake answer window")->check(CLI::PositiveNumber)->default_val(handshake_timeout_ms);
    app.add_option("--connect-timeout-ms", connect_timeout_ms, "Bound of the blocking connect")->check(CLI::PositiveNumber)->default_val(connect_timeout_ms);
    app.add_option("--queue-capacity", cfg.queue_capacity, "Outbound queue bound")->check(CLI::PositiveNumber)->default_val(cfg.queue_capacity);
    app.add_option("--buffer-capacity", cfg.buffer_capacity, "Offline buffer bound")->check(CLI::PositiveNumber)->default_val(cfg.buffer_capacity);
    app.add_option("--max-send-retries", cfg.max_send_retries, "Send attempts per message")->check(CLI::Range(1u, 100u))->default_val(cfg.max_send_retries);
    app.add_option("--platform", cfg.platform, "Platform tag announced in the handshake")->default_val(cfg.platform);
    app.add_option("-e,--event", params.events, "Event content to submit (repeatable)");
    app.add_option("-p,--priority", params.priority, "Priority of submitted events")->check(priority_validator)->default_val(params.priority);
    app.add_option("--conversation", params.conversation_id, "Conversation id to share as context");
    app.add_option("--topic", params.topics, "Conversation topic (repeatable)");
    app.add_option("--summary", params.summary, "Conversation summary");
    app.add_option("-t,--run-seconds", params.run_seconds, "How long to stay connected")->check(CLI::Range(1u, 86'400u))->default_val(params.run_seconds);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);

    app.footer(
        "Connects, mirrors the remote state and submits the given events.\n"
        "Press Ctrl+C to stop early."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    cfg.reconnect_base = std::chrono::milliseconds{reconnect_base_ms};
    cfg.reconnect_cap = std::chrono::milliseconds{reconnect_cap_ms};
    cfg.heartbeat_interval = std::chrono::milliseconds{heartbeat_ms};
    cfg.message_timeout = std::chrono::milliseconds{message_timeout_ms};
    cfg.handshake_timeout = std::chrono::milliseconds{handshake_timeout_ms};
    cfg.connect_timeout = std::chrono::milliseconds{connect_timeout_ms};

    if (core::sync::validate(cfg) != core::sync::Error::None) {
        std::cerr << "Invalid configuration (see log)\n";
        std::exit(EXIT_FAILURE);
    }

    lcr::log::Logger::instance().set_level(params.log_level);
    return params;
}

} // namespace statesync::examples::cli
