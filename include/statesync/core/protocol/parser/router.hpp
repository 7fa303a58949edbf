#pragma once

#include <string>
#include <string_view>

#include <simdjson.h>

#include "statesync/core/protocol/message.hpp"
#include "statesync/core/protocol/message_type.hpp"
#include "statesync/core/protocol/parser/adapters.hpp"
#include "statesync/core/protocol/parser/helpers.hpp"
#include "statesync/core/protocol/parser/result.hpp"
#include "lcr/log/logger.hpp"


namespace statesync::core {
namespace protocol {
namespace parser {

/*
================================================================================
Wire Message Parsing Architecture
================================================================================

1) Router (this class)
   • Parses the raw frame once with the simdjson DOM parser
   • Validates the envelope (type required; id, timestamp, payload optional)
   • Selects the payload adapter from the type string
   • Logs failures with actionable diagnostics

2) Adapters (adapters.hpp)
   • Turn a payload object into its typed payload struct
   • Distinguish invalid schema from invalid values

3) Helpers (helpers.hpp)
   • Strict JSON primitives, no logging, no semantics

Unknown type strings are not an error: the message is kept with its raw type
spelling and its payload re-serialized (minified) into payload::Raw, so the
dispatcher can still hand it to a catch-all handler.
================================================================================
*/

class Router {
public:
    Router() = default;

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    // Parses one inbound frame into `out`. On anything but Parsed, `out` is
    // left in an unspecified state.
    [[nodiscard]]
    inline Result parse(std::string_view raw, Message& out) {
        out = Message{};
        simdjson::dom::element root;
        auto error = parser_.parse(raw.data(), raw.size()).get(root);
        if (error) {
            SS_WARN("[PARSER] JSON parse error: " << simdjson::error_message(error) << " in message: " << raw);
            return Result::InvalidJson;
        }
        if (helper::require_object(root) != Result::Ok) {
            SS_WARN("[PARSER] Envelope is not an object: " << raw);
            return Result::InvalidSchema;
        }
        // --- envelope ---
        std::string type;
        if (helper::parse_string_required(root, "type", type) != Result::Ok) {
            SS_WARN("[PARSER] Missing or invalid 'type' field: " << raw);
            return Result::InvalidSchema;
        }
        bool present = false;
        if (helper::parse_string_optional(root, "id", out.id, present) != Result::Ok) {
            SS_WARN("[PARSER] Invalid 'id' field: " << raw);
            return Result::InvalidSchema;
        }
        if (helper::parse_int64_optional(root, "timestamp", out.timestamp, present) != Result::Ok) {
            SS_WARN("[PARSER] Invalid 'timestamp' field: " << raw);
            return Result::InvalidSchema;
        }
        std::string priority;
        if (helper::parse_string_optional(root, "priority", priority, present) == Result::Ok && present) {
            out.priority = priority_from_string(priority);
        }
        out.type = message_type_from_string(type);
        if (out.type == MessageType::Unknown) {
            out.raw_type = std::move(type);
        }
        // --- payload ---
        simdjson::dom::element payload;
        bool has_payload = false;
        if (root["payload"].get(payload) == simdjson::SUCCESS && !payload.is_null()) {
            has_payload = true;
        }
        if (has_payload && out.type != MessageType::Unknown && helper::require_object(payload) != Result::Ok) {
            SS_WARN("[PARSER] '" << out.type_name() << "' payload is not an object: " << raw);
            return Result::InvalidSchema;
        }
        if (has_payload && payload.type() == simdjson::dom::element_type::OBJECT) {
            (void)helper::parse_string_optional(payload, "ref_id", out.ref_id, present);
        }
        const Result r = route_payload_(out, has_payload, payload);
        if (r != Result::Ok) {
            SS_WARN("[PARSER] Invalid '" << out.type_name() << "' payload (" << to_string(r) << "): " << raw);
            return r;
        }
        return Result::Parsed;
    }

private:
    simdjson::dom::parser parser_;

    template <typename T, typename Fn>
    [[nodiscard]]
    inline Result adapt_(Message& out, const simdjson::dom::element& payload, Fn&& fn) {
        T value;
        const Result r = fn(payload, value);
        if (r == Result::Ok) {
            out.payload = std::move(value);
        }
        return r;
    }

    [[nodiscard]]
    inline Result route_payload_(Message& out, bool has_payload, const simdjson::dom::element& payload) {
        // Types whose payload carries required fields
        switch (out.type) {
            case MessageType::StateSync:
            case MessageType::EventAck:
            case MessageType::Event:
            case MessageType::Auth:
                if (!has_payload) {
                    return Result::InvalidSchema;
                }
                break;
            default:
                break;
        }
        if (!has_payload) {
            // Null payloads still get their typed defaults where one exists
            switch (out.type) {
                case MessageType::Ping:    out.payload = payload::Ping{}; break;
                case MessageType::Pong:    out.payload = payload::Pong{}; break;
                case MessageType::AuthAck: out.payload = payload::AuthAck{}; break;
                default: break;
            }
            return Result::Ok;
        }

        switch (out.type) {
            case MessageType::StateSync:
                return adapt_<payload::StateSync>(out, payload, adapter::parse_state_sync);
            case MessageType::ContextUpdate:
                return adapt_<payload::ContextUpdate>(out, payload, adapter::parse_context_update);
            case MessageType::Event:
                return adapt_<payload::DomainEvent>(out, payload, adapter::parse_domain_event);
            case MessageType::EventAck:
                return adapt_<payload::EventAck>(out, payload, adapter::parse_event_ack);
            case MessageType::Ping:
                out.payload = payload::Ping{};
                return Result::Ok;
            case MessageType::Pong:
                return adapt_<payload::Pong>(out, payload, adapter::parse_pong);
            case MessageType::Error:
                return adapt_<payload::ErrorReport>(out, payload, adapter::parse_error_report);
            case MessageType::Auth:
                return adapt_<payload::Auth>(out, payload, adapter::parse_auth);
            case MessageType::AuthAck:
                return adapt_<payload::AuthAck>(out, payload, adapter::parse_auth_ack);
            case MessageType::SyncRequest:
                return adapt_<payload::SyncRequest>(out, payload, adapter::parse_sync_request);
            case MessageType::Unknown:
            default:
                out.payload = payload::Raw{simdjson::minify(payload)};
                return Result::Ok;
        }
    }
};

} // namespace parser
} // namespace protocol
} // namespace statesync::core
