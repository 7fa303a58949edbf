#pragma once

#include <string>
#include <string_view>

#include "statesync/core/protocol/payload.hpp"
#include "statesync/core/protocol/parser/helpers.hpp"
#include "statesync/core/protocol/parser/result.hpp"

#include "simdjson.h"

/*
================================================================================
Payload Adapters (Domain-Aware Field Parsing)
================================================================================

Adapters sit between the Router and the low-level helpers. Each one turns a
payload object into its typed payload struct.

  • Required fields missing or mistyped  → InvalidSchema
  • Fields present but meaningless       → InvalidValue
  • Unknown extra fields                 → ignored

Adapters never log; the Router reports failures with the raw frame.
================================================================================
*/

namespace statesync::core::protocol::parser::adapter {

// Non-string values in free-form maps are kept as their minified JSON text.
inline std::string scalar_text_(const simdjson::dom::element& v) {
    std::string_view sv;
    if (!v.get(sv)) {
        return std::string(sv);
    }
    return simdjson::minify(v);
}

[[nodiscard]]
inline Result parse_state_sync(const simdjson::dom::element& obj, payload::StateSync& out) {
    if (helper::parse_double_required(obj, "value", out.value) != Result::Ok) {
        return Result::InvalidSchema;
    }
    if (!(out.value == out.value)) { // NaN
        return Result::InvalidValue;
    }
    bool present = false;
    if (helper::parse_string_optional(obj, "phase", out.phase, present) != Result::Ok) {
        return Result::InvalidSchema;
    }
    simdjson::dom::element metrics;
    if (helper::parse_object_optional(obj, "metrics", metrics, present) != Result::Ok) {
        return Result::InvalidSchema;
    }
    out.metrics.clear();
    if (present) {
        simdjson::dom::object fields;
        if (metrics.get(fields)) {
            return Result::InvalidSchema;
        }
        for (auto field : fields) {
            double v = 0.0;
            if (field.value.get(v)) {
                continue; // non-numeric metrics are not mirrored
            }
            out.metrics.emplace(std::string(field.key), v);
        }
    }
    return Result::Ok;
}

[[nodiscard]]
inline Result parse_context_update(const simdjson::dom::element& obj, payload::ContextUpdate& out) {
    bool present = false;
    if (helper::parse_string_optional(obj, "conversation_id", out.conversation_id, present) != Result::Ok) {
        return Result::InvalidSchema;
    }
    if (helper::parse_string_array_optional(obj, "topics", out.topics, present) != Result::Ok) {
        return Result::InvalidSchema;
    }
    if (helper::parse_string_optional(obj, "summary", out.summary, present) != Result::Ok) {
        return Result::InvalidSchema;
    }
    return Result::Ok;
}

[[nodiscard]]
inline Result parse_domain_event(const simdjson::dom::element& obj, payload::DomainEvent& out) {
    if (helper::parse_string_required(obj, "content", out.content) != Result::Ok) {
        return Result::InvalidSchema;
    }
    bool present = false;
    simdjson::dom::element context;
    if (helper::parse_object_optional(obj, "context", context, present) != Result::Ok) {
        return Result::InvalidSchema;
    }
    out.context.clear();
    if (present) {
        simdjson::dom::object fields;
        if (context.get(fields)) {
            return Result::InvalidSchema;
        }
        for (auto field : fields) {
            out.context.emplace(std::string(field.key), scalar_text_(field.value));
        }
    }
    if (helper::parse_string_optional(obj, "platform", out.platform, present) != Result::Ok) {
        return Result::InvalidSchema;
    }
    if (helper::parse_string_optional(obj, "instance_id", out.instance_id, present) != Result::Ok) {
        return Result::InvalidSchema;
    }
    return Result::Ok;
}

[[nodiscard]]
inline Result parse_event_ack(const simdjson::dom::element& obj, payload::EventAck& out) {
    if (helper::parse_string_required(obj, "ref_id", out.ref_id) != Result::Ok) {
        return Result::InvalidSchema;
    }
    return out.ref_id.empty() ? Result::InvalidValue : Result::Ok;
}

[[nodiscard]]
inline Result parse_pong(const simdjson::dom::element& obj, payload::Pong& out) {
    bool present = false;
    if (helper::parse_string_optional(obj, "ref_id", out.ref_id, present) != Result::Ok) {
        return Result::InvalidSchema;
    }
    return Result::Ok;
}

[[nodiscard]]
inline Result parse_error_report(const simdjson::dom::element& obj, payload::ErrorReport& out) {
    bool present = false;
    // Some servers send numeric codes
    simdjson::dom::element code;
    if (!obj["code"].get(code) && !code.is_null()) {
        out.code = scalar_text_(code);
    }
    if (helper::parse_string_optional(obj, "message", out.message, present) != Result::Ok) {
        return Result::InvalidSchema;
    }
    if (helper::parse_string_optional(obj, "ref_id", out.ref_id, present) != Result::Ok) {
        return Result::InvalidSchema;
    }
    return Result::Ok;
}

[[nodiscard]]
inline Result parse_auth(const simdjson::dom::element& obj, payload::Auth& out) {
    if (helper::parse_string_required(obj, "instance_id", out.instance_id) != Result::Ok) {
        return Result::InvalidSchema;
    }
    bool present = false;
    if (helper::parse_string_optional(obj, "platform", out.platform, present) != Result::Ok) {
        return Result::InvalidSchema;
    }
    if (helper::parse_string_array_optional(obj, "capabilities", out.capabilities, present) != Result::Ok) {
        return Result::InvalidSchema;
    }
    if (helper::parse_string_optional(obj, "version", out.version, present) != Result::Ok) {
        return Result::InvalidSchema;
    }
    auto r = helper::parse_uint32_optional(obj, "pool_index", out.pool_index, present);
    if (r != Result::Ok) {
        return r;
    }
    return Result::Ok;
}

// A bare {} acknowledgement counts as accepted.
[[nodiscard]]
inline Result parse_auth_ack(const simdjson::dom::element& obj, payload::AuthAck& out) {
    bool present = false;
    out.accepted = true;
    if (helper::parse_bool_optional(obj, "accepted", out.accepted, present) != Result::Ok) {
        return Result::InvalidSchema;
    }
    if (!present) {
        out.accepted = true;
    }
    if (helper::parse_string_optional(obj, "reason", out.reason, present) != Result::Ok) {
        return Result::InvalidSchema;
    }
    return Result::Ok;
}

[[nodiscard]]
inline Result parse_sync_request(const simdjson::dom::element& obj, payload::SyncRequest& out) {
    bool present = false;
    if (helper::parse_string_optional(obj, "reason", out.reason, present) != Result::Ok) {
        return Result::InvalidSchema;
    }
    return Result::Ok;
}

} // namespace statesync::core::protocol::parser::adapter
