#pragma once

#include <cstdint>
#include <string>

// ----------------------------------------------------------------------------
// Frames sent by the authority, as they appear on the wire
// ----------------------------------------------------------------------------

namespace json::server {

inline std::string state_sync(double value, const std::string& phase, std::int64_t timestamp = 1700000000000) {
    return R"({"id":"srv-state","type":"state_sync","payload":{"value":)" + std::to_string(value) +
           R"(,"phase":")" + phase + R"(","metrics":{"coherence":0.5}},"timestamp":)" +
           std::to_string(timestamp) + R"(,"priority":"normal"})";
}

inline std::string event_ack(const std::string& ref_id) {
    return R"({"id":"srv-ack","type":"event_ack","payload":{"ref_id":")" + ref_id +
           R"("},"timestamp":1700000000000})";
}

// Response correlated through payload.ref_id
inline std::string context_reply(const std::string& ref_id, const std::string& summary) {
    return R"({"id":"srv-ctx","type":"context_update","payload":{"conversation_id":"c-1","topics":["sync"],"summary":")" +
           summary + R"(","ref_id":")" + ref_id + R"("},"timestamp":1700000000000})";
}

inline std::string error_report(const std::string& code, const std::string& message, const std::string& ref_id = "") {
    return R"({"id":"srv-err","type":"error","payload":{"code":")" + code + R"(","message":")" + message +
           R"(","ref_id":")" + ref_id + R"("},"timestamp":1700000000000})";
}

inline std::string ping(const std::string& id) {
    return R"({"id":")" + id + R"(","type":"ping","payload":null,"timestamp":1700000000000})";
}

inline std::string unknown(const std::string& type) {
    return R"({"id":"srv-x","type":")" + type + R"(","payload":{"anything":[1,2,3]},"timestamp":1700000000000})";
}

} // namespace json::server
