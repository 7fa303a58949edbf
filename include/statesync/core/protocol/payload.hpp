#pragma once

#include <string>
#include <vector>
#include <map>
#include <variant>
#include <cstdint>
#include <type_traits>

#include "statesync/core/protocol/message_type.hpp"
#include "lcr/json.hpp"


namespace statesync::core::protocol {
namespace payload {

/*
===============================================================================
 Typed payloads
===============================================================================

Message.payload is a tagged union keyed by the message type. Each alternative
owns its own JSON writer; parsing lives in protocol::parser.

Writers append to a caller-owned std::string and never fail.
===============================================================================
*/

// Authoritative state broadcast. `value` is opaque to the client.
struct StateSync {
    double value{0.0};
    std::string phase;
    std::map<std::string, double> metrics;

    void write_json(std::string& out) const {
        out += '{';
        lcr::json::append_key(out, "value");
        lcr::json::append(out, value);
        out += ',';
        lcr::json::append_key(out, "phase");
        lcr::json::append_string(out, phase);
        out += ',';
        lcr::json::append_key(out, "metrics");
        out += '{';
        bool first = true;
        for (const auto& [key, v] : metrics) {
            if (!first) out += ',';
            first = false;
            lcr::json::append_key(out, key);
            lcr::json::append(out, v);
        }
        out += "}}";
    }
};

// Conversation context shared with the authority.
struct ContextUpdate {
    std::string conversation_id;
    std::vector<std::string> topics;
    std::string summary;

    void write_json(std::string& out) const {
        out += '{';
        lcr::json::append_key(out, "conversation_id");
        lcr::json::append_string(out, conversation_id);
        out += ',';
        lcr::json::append_key(out, "topics");
        out += '[';
        for (std::size_t i = 0; i < topics.size(); ++i) {
            if (i) out += ',';
            lcr::json::append_string(out, topics[i]);
        }
        out += "],";
        lcr::json::append_key(out, "summary");
        lcr::json::append_string(out, summary);
        out += '}';
    }
};

// Locally generated domain event (submit()).
struct DomainEvent {
    std::string content;
    std::map<std::string, std::string> context;
    std::string platform;
    std::string instance_id;

    void write_json(std::string& out) const {
        out += '{';
        lcr::json::append_key(out, "content");
        lcr::json::append_string(out, content);
        out += ',';
        lcr::json::append_key(out, "context");
        out += '{';
        bool first = true;
        for (const auto& [key, v] : context) {
            if (!first) out += ',';
            first = false;
            lcr::json::append_key(out, key);
            lcr::json::append_string(out, v);
        }
        out += "},";
        lcr::json::append_key(out, "platform");
        lcr::json::append_string(out, platform);
        out += ',';
        lcr::json::append_key(out, "instance_id");
        lcr::json::append_string(out, instance_id);
        out += '}';
    }
};

struct EventAck {
    std::string ref_id;

    void write_json(std::string& out) const {
        out += '{';
        lcr::json::append_key(out, "ref_id");
        lcr::json::append_string(out, ref_id);
        out += '}';
    }
};

struct Ping {
    void write_json(std::string& out) const {
        out += "{}";
    }
};

struct Pong {
    std::string ref_id; // optional

    void write_json(std::string& out) const {
        if (ref_id.empty()) {
            out += "{}";
            return;
        }
        out += '{';
        lcr::json::append_key(out, "ref_id");
        lcr::json::append_string(out, ref_id);
        out += '}';
    }
};

// Error report from the authority.
struct ErrorReport {
    std::string code;
    std::string message;
    std::string ref_id;

    void write_json(std::string& out) const {
        out += '{';
        lcr::json::append_key(out, "code");
        lcr::json::append_string(out, code);
        out += ',';
        lcr::json::append_key(out, "message");
        lcr::json::append_string(out, message);
        if (!ref_id.empty()) {
            out += ',';
            lcr::json::append_key(out, "ref_id");
            lcr::json::append_string(out, ref_id);
        }
        out += '}';
    }
};

// Application handshake (identify + declare capabilities).
struct Auth {
    std::string instance_id;
    std::string platform;
    std::vector<std::string> capabilities;
    std::string version{"1.0"};
    std::uint32_t pool_index{0};

    void write_json(std::string& out) const {
        out += '{';
        lcr::json::append_key(out, "instance_id");
        lcr::json::append_string(out, instance_id);
        out += ',';
        lcr::json::append_key(out, "platform");
        lcr::json::append_string(out, platform);
        out += ',';
        lcr::json::append_key(out, "capabilities");
        out += '[';
        for (std::size_t i = 0; i < capabilities.size(); ++i) {
            if (i) out += ',';
            lcr::json::append_string(out, capabilities[i]);
        }
        out += "],";
        lcr::json::append_key(out, "version");
        lcr::json::append_string(out, version);
        out += ',';
        lcr::json::append_key(out, "pool_index");
        lcr::json::append(out, static_cast<std::uint64_t>(pool_index));
        out += '}';
    }
};

struct AuthAck {
    bool accepted{true};
    std::string reason;

    void write_json(std::string& out) const {
        out += '{';
        lcr::json::append_key(out, "accepted");
        lcr::json::append(out, accepted);
        if (!reason.empty()) {
            out += ',';
            lcr::json::append_key(out, "reason");
            lcr::json::append_string(out, reason);
        }
        out += '}';
    }
};

// Asks the authority to re-broadcast its state.
struct SyncRequest {
    std::string reason{"force_sync"};

    void write_json(std::string& out) const {
        out += '{';
        lcr::json::append_key(out, "reason");
        lcr::json::append_string(out, reason);
        out += '}';
    }
};

// Payload of a type this client does not model, kept as minified JSON.
struct Raw {
    std::string json{"null"};

    void write_json(std::string& out) const {
        out += json.empty() ? std::string("null") : json;
    }
};

} // namespace payload


// std::monostate stands for a null / absent payload.
using Payload = std::variant<
    std::monostate,
    payload::StateSync,
    payload::ContextUpdate,
    payload::DomainEvent,
    payload::EventAck,
    payload::Ping,
    payload::Pong,
    payload::ErrorReport,
    payload::Auth,
    payload::AuthAck,
    payload::SyncRequest,
    payload::Raw
>;

// Returns true if `p` is a valid payload for `type`. A null payload is
// valid for every type; Raw is reserved for Unknown.
[[nodiscard]]
inline bool payload_matches(MessageType type, const Payload& p) noexcept {
    switch (p.index()) {
        case 0:  return true;
        case 1:  return type == MessageType::StateSync;
        case 2:  return type == MessageType::ContextUpdate;
        case 3:  return type == MessageType::Event;
        case 4:  return type == MessageType::EventAck;
        case 5:  return type == MessageType::Ping;
        case 6:  return type == MessageType::Pong;
        case 7:  return type == MessageType::Error;
        case 8:  return type == MessageType::Auth;
        case 9:  return type == MessageType::AuthAck;
        case 10: return type == MessageType::SyncRequest;
        case 11: return type == MessageType::Unknown;
        default: return false;
    }
}

inline void write_payload_json(std::string& out, const Payload& p) {
    std::visit([&out](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            out += "null";
        } else {
            value.write_json(out);
        }
    }, p);
}

} // namespace statesync::core::protocol
