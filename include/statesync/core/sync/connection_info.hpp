#pragma once

#include <chrono>
#include <cstdint>

#include "statesync/core/transport/state.hpp"


namespace statesync::core::sync {

// Observability snapshot of one member.
struct ConnectionInfo {
    std::uint32_t id{0};
    std::uint32_t pool_index{0};
    transport::State state{transport::State::Connecting};
    bool ready{false};
    bool active{false};
    std::uint64_t sent{0};
    std::uint64_t received{0};
    std::uint64_t errors{0};
    std::chrono::milliseconds idle{0};  // time since last activity
};

} // namespace statesync::core::sync
