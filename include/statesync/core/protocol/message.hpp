#pragma once

#include <string>
#include <cstdint>
#include <chrono>
#include <utility>

#include "statesync/core/protocol/message_type.hpp"
#include "statesync/core/protocol/priority.hpp"
#include "statesync/core/protocol/payload.hpp"
#include "lcr/json.hpp"


namespace statesync::core::protocol {

// Milliseconds since the Unix epoch (sender wall clock). Used for staleness
// checks only, never for ordering.
[[nodiscard]]
inline std::int64_t wall_clock_ms() noexcept {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

/*
===============================================================================
 protocol::Message
===============================================================================

The wire-level unit:

    {"id":"<uuid>","type":"<type>","payload":{...}|null,"timestamp":<ms>}

Outbound messages additionally carry "priority", which receivers ignore.

`ref_id` is filled by the parser from payload.ref_id when present and is the
preferred correlation key for pending responses; when absent the envelope id
is used instead.
===============================================================================
*/
struct Message {
    std::string id;
    MessageType type{MessageType::Unknown};
    std::string raw_type;               // wire spelling, set for Unknown types
    Payload payload{};
    std::int64_t timestamp{0};
    Priority priority{Priority::Normal};
    std::string ref_id;                 // inbound only

    [[nodiscard]]
    inline std::string_view type_name() const noexcept {
        if (type == MessageType::Unknown && !raw_type.empty()) {
            return raw_type;
        }
        return to_string(type);
    }

    [[nodiscard]]
    inline const std::string& correlation_id() const noexcept {
        return ref_id.empty() ? id : ref_id;
    }

    template <typename T>
    [[nodiscard]]
    inline const T* get() const noexcept {
        return std::get_if<T>(&payload);
    }

    void write_json(std::string& out) const {
        out += '{';
        lcr::json::append_key(out, "id");
        lcr::json::append_string(out, id);
        out += ',';
        lcr::json::append_key(out, "type");
        lcr::json::append_string(out, type_name());
        out += ',';
        lcr::json::append_key(out, "payload");
        write_payload_json(out, payload);
        out += ',';
        lcr::json::append_key(out, "timestamp");
        lcr::json::append(out, timestamp);
        out += ',';
        lcr::json::append_key(out, "priority");
        lcr::json::append_string(out, to_string(priority));
        out += '}';
    }

    // Convenience method (allocating) for tests / logging.
    [[nodiscard]]
    std::string to_json() const {
        std::string out;
        out.reserve(128);
        write_json(out);
        return out;
    }
};

// Builds an outbound message stamped with the current wall clock.
[[nodiscard]]
inline Message make_message(std::string id, MessageType type, Payload payload, Priority priority = Priority::Normal) {
    Message msg;
    msg.id = std::move(id);
    msg.type = type;
    msg.payload = std::move(payload);
    msg.timestamp = wall_clock_ms();
    msg.priority = priority;
    return msg;
}

} // namespace statesync::core::protocol
