#include <atomic>
#include <csignal>
#include <chrono>
#include <iostream>
#include <thread>

#include "statesync.hpp"
using namespace statesync;

#include "common/cli/params.hpp"
namespace cli = statesync::examples::cli;

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    // -------------------------------------------------------------
    // Signal handling
    // -------------------------------------------------------------
    std::signal(SIGINT, on_signal);

    // -------------------------------------------------------------
    // CLI parsing
    // -------------------------------------------------------------
    const auto params = cli::configure(argc, argv, "statesync - State Synchronization Client\n"
        "Mirrors the state broadcast by a remote authority and submits local events,\n"
        "buffering them while offline and replaying them after reconnection.\n"
    );
    std::cout << "statesync " << version_major << "." << version_minor << "." << version_patch << "\n";
    params.dump("=== statesync Parameters ===", std::cout);

    // -------------------------------------------------------------
    // Client setup
    // -------------------------------------------------------------
    Client client{params.config};

    client.on(NoticeKind::StatusChanged, [](const Notice& n) {
        std::cout << "[statesync] status: " << n.detail << "\n";
    });
    client.on(NoticeKind::ConnectionSwitch, [](const Notice& n) {
        std::cout << "[statesync] failover #" << n.from << " -> #" << n.to << "\n";
    });
    client.on(NoticeKind::StateChanged, [](const Notice& n) {
        std::cout << "[statesync] state: " << n.value << " (" << n.detail << ")\n";
    });
    client.on(NoticeKind::Milestone, [](const Notice& n) {
        std::cout << "[statesync] milestone reached: " << n.detail << " (" << n.value << ")\n";
    });
    client.on(NoticeKind::MessageFailed, [](const Notice& n) {
        std::cerr << "[statesync] message " << n.message_id << " failed: " << to_string(n.error) << "\n";
    });
    client.on(NoticeKind::QueueOverflow, [](const Notice& n) {
        std::cerr << "[statesync] queue overflow, message " << n.message_id << " displaced\n";
    });
    client.on(MessageType::Error, [](const Message& msg) {
        if (const auto* err = msg.get<payload::ErrorReport>()) {
            std::cerr << "[statesync] authority error " << err->code << ": " << err->message << "\n";
        }
    });

    const auto err = client.connect();
    if (err != TransportError::None) {
        // Not fatal: events are buffered and the client keeps reconnecting
        std::cerr << "[statesync] connect failed (" << to_string(err) << "), continuing offline\n";
    }

    // -------------------------------------------------------------
    // Share context and submit events
    // -------------------------------------------------------------
    if (!params.conversation_id.empty()) {
        (void)client.update_context(params.conversation_id, params.topics, params.summary);
    }
    const auto priority = core::protocol::priority_from_string(params.priority);
    for (const auto& content : params.events) {
        const auto id = client.submit(content, {{"source", "cli"}}, priority);
        std::cout << "[statesync] submitted event " << id << "\n";
    }

    // -------------------------------------------------------------
    // Main polling loop (runs until Ctrl+C or timeout)
    // -------------------------------------------------------------
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(params.run_seconds);
    client.run_while([&] {
        return running.load() && std::chrono::steady_clock::now() < deadline;
    });

    // -------------------------------------------------------------
    // Report
    // -------------------------------------------------------------
    const auto state = client.state();
    const auto m = client.metrics();
    std::cout << "\n=== Final state ===\n"
              << "  value      : " << state.value << "\n"
              << "  phase      : " << state.phase << "\n"
              << "  trend      : " << to_string(state.trend) << "\n"
              << "  samples    : " << state.history.size() << "\n"
              << "  milestones : " << state.milestones.size() << "\n"
              << "=== Metrics ===\n"
              << "  status     : " << m.status << "\n"
              << "  sent       : " << m.messages_sent << "\n"
              << "  received   : " << m.messages_received << "\n"
              << "  failed     : " << m.messages_failed << "\n"
              << "  queued     : " << m.queue_depth << "\n"
              << "  buffered   : " << m.buffered_count << "\n"
              << "  reconnects : " << m.reconnect_attempts << "\n";

    client.disconnect();
    return 0;
}
