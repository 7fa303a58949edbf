#pragma once

#include <array>
#include <cstdint>
#include <exception>
#include <string_view>
#include <utility>
#include <vector>

#include "statesync/core/protocol/message.hpp"
#include "statesync/core/protocol/message_type.hpp"
#include "statesync/core/sync/handler.hpp"
#include "statesync/core/sync/notice.hpp"
#include "lcr/log/logger.hpp"


namespace statesync::core::sync {

/*
===============================================================================
 sync::Dispatcher
===============================================================================

Observer registry for inbound messages and lifecycle notices.

- Any number of handlers per message type / notice kind, invoked in
  registration order.
- Handlers are addressed by the HandlerId returned from on(); off() removes
  exactly that registration.
- Handlers registered for MessageType::Unknown form the catch-all: they
  receive messages whose type is not modeled. Without a catch-all those are
  counted as unrouted. A known type nobody subscribed to (pong, event_ack
  and the like, already handled inside the Session) is only counted as
  unhandled.
- A throwing handler is caught at this boundary, logged and counted. The
  remaining handlers still run and nothing propagates into the poll loop.

Handlers run on the polling thread. The handler list is copied before
invocation, so a handler may register or remove handlers (itself included)
while being dispatched.
===============================================================================
*/
class Dispatcher {
public:
    Dispatcher() = default;
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    [[nodiscard]]
    inline HandlerId on(protocol::MessageType type, MessageHandler handler) {
        const HandlerId id = next_id_++;
        messages_[index_(type)].push_back({id, std::move(handler)});
        return id;
    }

    [[nodiscard]]
    inline HandlerId on(NoticeKind kind, NoticeHandler handler) {
        const HandlerId id = next_id_++;
        notices_[static_cast<std::size_t>(kind)].push_back({id, std::move(handler)});
        return id;
    }

    inline bool off(protocol::MessageType type, HandlerId id) {
        return erase_(messages_[index_(type)], id);
    }

    inline bool off(NoticeKind kind, HandlerId id) {
        return erase_(notices_[static_cast<std::size_t>(kind)], id);
    }

    // Returns the number of handlers invoked.
    inline std::size_t dispatch(const protocol::Message& msg) {
        const auto& slot = messages_[index_(msg.type)];
        if (slot.empty()) {
            if (msg.type == protocol::MessageType::Unknown) {
                ++unrouted_;
                SS_TRACE("[DISPATCH] No catch-all for '" << msg.type_name() << "' message");
            } else {
                ++unhandled_;
                SS_TRACE("[DISPATCH] No handler for '" << msg.type_name() << "' message");
            }
            return 0;
        }
        const auto handlers = slot;
        for (const auto& [id, fn] : handlers) {
            invoke_(fn, msg, msg.type_name());
        }
        return handlers.size();
    }

    inline std::size_t dispatch(const Notice& notice) {
        const auto handlers = notices_[static_cast<std::size_t>(notice.kind)];
        for (const auto& [id, fn] : handlers) {
            invoke_(fn, notice, to_string(notice.kind));
        }
        return handlers.size();
    }

    [[nodiscard]]
    inline std::size_t handler_count(protocol::MessageType type) const noexcept {
        return messages_[index_(type)].size();
    }

    [[nodiscard]]
    inline std::size_t handler_count(NoticeKind kind) const noexcept {
        return notices_[static_cast<std::size_t>(kind)].size();
    }

    [[nodiscard]] inline std::uint64_t handler_errors() const noexcept { return handler_errors_; }
    [[nodiscard]] inline std::uint64_t unrouted() const noexcept { return unrouted_; }
    [[nodiscard]] inline std::uint64_t unhandled() const noexcept { return unhandled_; }

private:
    template <typename Fn>
    using Registry = std::vector<std::pair<HandlerId, Fn>>;

    std::array<Registry<MessageHandler>, protocol::MESSAGE_TYPE_COUNT> messages_;
    std::array<Registry<NoticeHandler>, NOTICE_KIND_COUNT> notices_;
    HandlerId next_id_{1};
    std::uint64_t handler_errors_{0};
    std::uint64_t unrouted_{0};
    std::uint64_t unhandled_{0};

    [[nodiscard]]
    static constexpr std::size_t index_(protocol::MessageType type) noexcept {
        return static_cast<std::size_t>(type);
    }

    template <typename Fn>
    static bool erase_(Registry<Fn>& registry, HandlerId id) {
        for (auto it = registry.begin(); it != registry.end(); ++it) {
            if (it->first == id) {
                registry.erase(it);
                return true;
            }
        }
        return false;
    }

    template <typename Fn, typename Arg>
    inline void invoke_(const Fn& fn, const Arg& arg, std::string_view what) noexcept {
        try {
            fn(arg);
        }
        catch (const std::exception& e) {
            ++handler_errors_;
            SS_ERROR("[DISPATCH] Handler for '" << what << "' threw: " << e.what());
        }
        catch (...) {
            ++handler_errors_;
            SS_ERROR("[DISPATCH] Handler for '" << what << "' threw a non-standard exception");
        }
    }
};

} // namespace statesync::core::sync
