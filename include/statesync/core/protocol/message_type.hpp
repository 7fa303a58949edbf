#pragma once

#include <cstdint>
#include <string_view>


namespace statesync::core::protocol {

// ===============================================
// MESSAGE TYPE ENUM
// ===============================================
//
// Every wire type the client understands. New types are added here; a type
// is never inferred from payload shape. Any other wire string parses as
// Unknown and keeps its raw spelling on the Message.
//
enum class MessageType : std::uint8_t {
    StateSync,
    ContextUpdate,
    Event,
    EventAck,
    Ping,
    Pong,
    Error,
    // --- handshake / control ---
    Auth,
    AuthAck,
    SyncRequest,
    Unknown
};

inline constexpr std::size_t MESSAGE_TYPE_COUNT = static_cast<std::size_t>(MessageType::Unknown) + 1;

[[nodiscard]]
inline constexpr std::string_view to_string(MessageType t) noexcept {
    switch (t) {
        case MessageType::StateSync:     return "state_sync";
        case MessageType::ContextUpdate: return "context_update";
        case MessageType::Event:         return "event";
        case MessageType::EventAck:      return "event_ack";
        case MessageType::Ping:          return "ping";
        case MessageType::Pong:          return "pong";
        case MessageType::Error:         return "error";
        case MessageType::Auth:          return "auth";
        case MessageType::AuthAck:       return "auth_ack";
        case MessageType::SyncRequest:   return "sync_request";
        default:                         return "unknown";
    }
}

[[nodiscard]]
inline constexpr MessageType message_type_from_string(std::string_view s) noexcept {
    if (s == "state_sync")     return MessageType::StateSync;
    if (s == "context_update") return MessageType::ContextUpdate;
    if (s == "event")          return MessageType::Event;
    if (s == "event_ack")      return MessageType::EventAck;
    if (s == "ping")           return MessageType::Ping;
    if (s == "pong")           return MessageType::Pong;
    if (s == "error")          return MessageType::Error;
    if (s == "auth")           return MessageType::Auth;
    if (s == "auth_ack")       return MessageType::AuthAck;
    if (s == "sync_request")   return MessageType::SyncRequest;
    return MessageType::Unknown;
}

} // namespace statesync::core::protocol
