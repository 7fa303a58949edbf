#pragma once

#include <cstdint>
#include <functional>

#include "statesync/core/protocol/message.hpp"
#include "statesync/core/sync/notice.hpp"


namespace statesync::core::sync {

using HandlerId = std::uint64_t;
inline constexpr HandlerId INVALID_HANDLER = 0;

using MessageHandler = std::function<void(const protocol::Message&)>;
using NoticeHandler = std::function<void(const Notice&)>;

} // namespace statesync::core::sync
