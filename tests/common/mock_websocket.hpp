#pragma once

/*
===============================================================================
 MockWebSocket
===============================================================================

Scripted, single-threaded implementation of transport::WebSocketConcept.

Behavior:
  - connect() consumes the next entry of the connect script (default: None).
    On success an Open event is queued unless auto-open is disabled.
  - Every frame passed to send() is recorded per instance and in a global
    wire log shared by all instances (the "server view").
  - Optional responders play the authority's part synchronously:
      auth  → auth_ack (accepted unless the handshake script says otherwise)
      ping  → pong (ref_id = ping id)
      event → event_ack (ref_id = event id)
  - Tests push inbound frames and transport failures with emit_*().

The Connection owns its WebSocket, so script and responders are static and
the instance of a given pool member is reached through member(i).ws().
===============================================================================
*/

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <vector>

#include "statesync/core/transport/concepts.hpp"
#include "statesync/core/protocol/message.hpp"
#include "statesync/core/protocol/parser/router.hpp"
#include "lcr/log/logger.hpp"


namespace statesync::core::transport::test {

// One frame written by the client, as the authority would decode it.
struct Frame {
    protocol::MessageType type{protocol::MessageType::Unknown};
    std::string id;
    std::string ref_id;
    std::string raw;
};

class MockWebSocket {
public:
    MockWebSocket() = default;
    MockWebSocket(const MockWebSocket&) = delete;
    MockWebSocket& operator=(const MockWebSocket&) = delete;

    // ---------------------------------------------------------------------
    // transport::WebSocketConcept
    // ---------------------------------------------------------------------
    inline Error connect(const ParsedUrl& url) noexcept {
        ++connect_count_;
        last_host_ = url.host;
        Error result = Error::None;
        if (!connect_script_.empty()) {
            result = connect_script_.front();
            connect_script_.pop_front();
        }
        if (result != Error::None) {
            SS_DEBUG("[MockWebSocket] connect() scripted failure: " << to_string(result));
            return result;
        }
        if (auto_open_) {
            emit_open();
        }
        return Error::None;
    }

    inline void close() noexcept {
        ++close_count_;
        if (open_) {
            open_ = false;
            events_.push_back(websocket::Event::make_close());
        }
    }

    inline bool send(std::string_view msg) noexcept {
        if (!open_ || fail_sends_ || fail_all_sends_) {
            ++failed_sends_;
            return false;
        }
        Frame frame = decode_(msg);
        sent_.push_back(frame);
        wire_log_.push_back(frame);
        respond_(frame);
        return true;
    }

    inline bool poll_message(std::string& out) noexcept {
        if (inbox_.empty()) {
            return false;
        }
        out = std::move(inbox_.front());
        inbox_.pop_front();
        return true;
    }

    inline bool poll_event(websocket::Event& out) noexcept {
        if (events_.empty()) {
            return false;
        }
        out = events_.front();
        events_.pop_front();
        return true;
    }

    // ---------------------------------------------------------------------
    // Test helpers (per instance)
    // ---------------------------------------------------------------------
    inline void emit_open() {
        open_ = true;
        events_.push_back(websocket::Event::make_open());
    }

    inline void emit_message(std::string frame) {
        inbox_.push_back(std::move(frame));
    }

    // Remote close (EOF / close frame)
    inline void emit_close() {
        open_ = false;
        events_.push_back(websocket::Event::make_close());
    }

    // Transport failure: Error followed by Close, as real bindings report it
    inline void emit_error(Error err = Error::TransportFailure) {
        open_ = false;
        events_.push_back(websocket::Event::make_error(err));
        events_.push_back(websocket::Event::make_close());
    }

    inline void set_fail_sends(bool on) noexcept { fail_sends_ = on; }

    [[nodiscard]] inline bool is_open() const noexcept { return open_; }
    [[nodiscard]] inline const std::vector<Frame>& sent() const noexcept { return sent_; }
    [[nodiscard]] inline std::size_t failed_sends() const noexcept { return failed_sends_; }

    [[nodiscard]]
    inline std::size_t count_sent(protocol::MessageType type) const noexcept {
        return count_(sent_, type);
    }

    // ---------------------------------------------------------------------
    // Test helpers (global)
    // ---------------------------------------------------------------------
    static inline void reset() {
        connect_script_.clear();
        handshake_script_.clear();
        wire_log_.clear();
        auto_open_ = true;
        auto_handshake_ = true;
        auto_pong_ = true;
        auto_event_ack_ = false;
        fail_all_sends_ = false;
        connect_count_ = 0;
        close_count_ = 0;
        next_server_id_ = 1;
        last_host_.clear();
    }

    static inline void script_connect(Error result) { connect_script_.push_back(result); }
    static inline void script_handshake(bool accept) { handshake_script_.push_back(accept); }

    static inline void set_auto_open(bool on) noexcept { auto_open_ = on; }
    static inline void set_auto_handshake(bool on) noexcept { auto_handshake_ = on; }
    static inline void set_auto_pong(bool on) noexcept { auto_pong_ = on; }
    static inline void set_auto_event_ack(bool on) noexcept { auto_event_ack_ = on; }
    static inline void set_fail_all_sends(bool on) noexcept { fail_all_sends_ = on; }

    [[nodiscard]] static inline int connect_count() noexcept { return connect_count_; }
    [[nodiscard]] static inline int close_count() noexcept { return close_count_; }
    [[nodiscard]] static inline const std::string& last_host() noexcept { return last_host_; }
    [[nodiscard]] static inline const std::vector<Frame>& wire_log() noexcept { return wire_log_; }

    [[nodiscard]]
    static inline std::size_t count_wire(protocol::MessageType type) noexcept {
        return count_(wire_log_, type);
    }

    // Number of times a frame with envelope id `id` reached the wire
    [[nodiscard]]
    static inline std::size_t count_wire_id(std::string_view id) noexcept {
        std::size_t n = 0;
        for (const auto& f : wire_log_) {
            n += (f.id == id) ? 1 : 0;
        }
        return n;
    }

    [[nodiscard]]
    static inline std::string server_id() {
        return "srv-" + std::to_string(next_server_id_++);
    }

private:
    bool open_{false};
    bool fail_sends_{false};
    std::size_t failed_sends_{0};
    std::deque<std::string> inbox_;
    std::deque<websocket::Event> events_;
    std::vector<Frame> sent_;

    inline static std::deque<Error> connect_script_{};
    inline static std::deque<bool> handshake_script_{};
    inline static std::vector<Frame> wire_log_{};
    inline static bool auto_open_{true};
    inline static bool auto_handshake_{true};
    inline static bool auto_pong_{true};
    inline static bool auto_event_ack_{false};
    inline static bool fail_all_sends_{false};
    inline static int connect_count_{0};
    inline static int close_count_{0};
    inline static std::uint64_t next_server_id_{1};
    inline static std::string last_host_{};

    [[nodiscard]]
    static inline std::size_t count_(const std::vector<Frame>& frames, protocol::MessageType type) noexcept {
        std::size_t n = 0;
        for (const auto& f : frames) {
            n += (f.type == type) ? 1 : 0;
        }
        return n;
    }

    [[nodiscard]]
    static inline Frame decode_(std::string_view raw) {
        static protocol::parser::Router router;
        Frame frame;
        frame.raw = std::string(raw);
        protocol::Message msg;
        if (router.parse(raw, msg) == protocol::parser::Result::Parsed) {
            frame.type = msg.type;
            frame.id = msg.id;
            frame.ref_id = msg.ref_id;
        }
        return frame;
    }

    inline void respond_(const Frame& frame) {
        switch (frame.type) {
        case protocol::MessageType::Auth:
            if (auto_handshake_) {
                protocol::payload::AuthAck ack;
                if (!handshake_script_.empty()) {
                    ack.accepted = handshake_script_.front();
                    handshake_script_.pop_front();
                }
                if (!ack.accepted) {
                    ack.reason = "instance not allowed";
                }
                emit_message(protocol::make_message(server_id(), protocol::MessageType::AuthAck, std::move(ack)).to_json());
            }
            break;

        case protocol::MessageType::Ping:
            if (auto_pong_) {
                protocol::payload::Pong pong;
                pong.ref_id = frame.id;
                emit_message(protocol::make_message(server_id(), protocol::MessageType::Pong, std::move(pong)).to_json());
            }
            break;

        case protocol::MessageType::Event:
            if (auto_event_ack_) {
                protocol::payload::EventAck ack;
                ack.ref_id = frame.id;
                emit_message(protocol::make_message(server_id(), protocol::MessageType::EventAck, std::move(ack)).to_json());
            }
            break;

        default:
            break;
        }
    }
};

static_assert(WebSocketConcept<MockWebSocket>);

} // namespace statesync::core::transport::test
