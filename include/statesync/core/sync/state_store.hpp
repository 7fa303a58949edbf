#pragma once

#include <chrono>
#include <algorithm>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "statesync/core/protocol/payload.hpp"
#include "statesync/core/sync/milestones.hpp"
#include "lcr/local/ring_buffer.hpp"
#include "lcr/log/logger.hpp"


namespace statesync::core::sync {

inline constexpr std::size_t HISTORY_CAPACITY = 128;
inline constexpr double TREND_EPSILON = 0.01;
inline constexpr std::size_t DEFAULT_AVERAGE_WINDOW = 10;

enum class Trend : std::uint8_t {
    Stable,
    Ascending,
    Descending
};

[[nodiscard]]
inline constexpr std::string_view to_string(Trend t) noexcept {
    switch (t) {
        case Trend::Ascending:  return "ascending";
        case Trend::Descending: return "descending";
        case Trend::Stable:     return "stable";
        default:                return "unknown";
    }
}

struct Sample {
    double value{0.0};
    std::int64_t timestamp{0};
};

// Immutable copy handed to application code. Nothing in it aliases the store.
struct StateSnapshot {
    double value{0.0};
    std::string phase{INITIAL_PHASE};
    std::int64_t timestamp{0};
    std::uint64_t version{0};                 // number of applied state_sync messages
    std::map<std::string, double> metrics;
    std::vector<Sample> history;              // oldest first
    std::vector<std::string> milestones;      // achieved, ascending
    protocol::payload::ContextUpdate context; // last conversation context
    Trend trend{Trend::Stable};
};

// What one apply() changed, for the caller to turn into notices.
struct ApplyResult {
    bool stale{false};
    std::vector<Milestone> crossed;
};


/*
===============================================================================
 sync::StateStore
===============================================================================

Local mirror of the remote authority's state.

- apply() is the only mutator of value / phase / history. It is called for
  inbound state_sync messages and nothing else; local code never writes the
  state directly.
- Last-write-wins by arrival order. With a pool, two connections may deliver
  broadcasts close together; whichever is applied last is the state. The
  sender timestamp is only checked for staleness (logged, still applied).
- Phase is replaced as-is. Milestones are one-directional: once recorded a
  milestone stays recorded even if a later broadcast carries a lower value or
  an earlier phase.
- History is a fixed-capacity ring, oldest evicted first. Readers only get
  copies through snapshot() / history().
===============================================================================
*/
class StateStore {
public:
    explicit StateStore(std::chrono::milliseconds stale_after = std::chrono::milliseconds{30000}) noexcept
        : stale_after_ms_(stale_after.count())
    {}

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    [[nodiscard]]
    inline ApplyResult apply(const protocol::payload::StateSync& sync, std::int64_t timestamp) {
        ApplyResult result;
        if (version_ > 0 && timestamp > 0 && timestamp_ - timestamp > stale_after_ms_) {
            result.stale = true;
            SS_WARN("[STORE] Stale state_sync applied (sent " << (timestamp_ - timestamp) << " ms before current state)");
        }
        value_ = sync.value;
        if (!sync.phase.empty()) {
            phase_ = sync.phase;
        }
        if (!sync.metrics.empty()) {
            metrics_ = sync.metrics;
        }
        timestamp_ = timestamp;
        ++version_;
        if (history_.push_overwrite(Sample{value_, timestamp})) {
            SS_TRACE("[STORE] History full, oldest sample evicted");
        }
        result.crossed = milestones_.observe(value_, phase_);
        for (const auto& m : result.crossed) {
            SS_INFO("[STORE] Milestone reached: " << m.label << " (" << m.threshold << ")");
        }
        SS_DEBUG("[STORE] State v" << version_ << ": value=" << value_ << " phase=" << phase_);
        return result;
    }

    inline void apply_context(const protocol::payload::ContextUpdate& ctx) {
        context_ = ctx;
        SS_DEBUG("[STORE] Context updated: conversation=" << ctx.conversation_id << " topics=" << ctx.topics.size());
    }

    // Compares the two newest samples. Stable with fewer than two samples or
    // when they differ by less than TREND_EPSILON.
    [[nodiscard]]
    inline Trend trend() const noexcept {
        if (history_.size() < 2) {
            return Trend::Stable;
        }
        const double delta = history_.from_newest(0).value - history_.from_newest(1).value;
        if (delta > TREND_EPSILON) {
            return Trend::Ascending;
        }
        if (delta < -TREND_EPSILON) {
            return Trend::Descending;
        }
        return Trend::Stable;
    }

    // Mean of the last `n` samples (all of them when fewer). The current
    // value when the history is empty.
    [[nodiscard]]
    inline double average(std::size_t n = DEFAULT_AVERAGE_WINDOW) const noexcept {
        const std::size_t count = std::min(n, history_.size());
        if (count == 0) {
            return value_;
        }
        double sum = 0.0;
        for (std::size_t i = 0; i < count; ++i) {
            sum += history_.from_newest(i).value;
        }
        return sum / static_cast<double>(count);
    }

    [[nodiscard]]
    inline StateSnapshot snapshot() const {
        StateSnapshot snap;
        snap.value = value_;
        snap.phase = phase_;
        snap.timestamp = timestamp_;
        snap.version = version_;
        snap.metrics = metrics_;
        snap.history = history_.snapshot();
        for (auto label : milestones_.achieved_labels()) {
            snap.milestones.emplace_back(label);
        }
        snap.context = context_;
        snap.trend = trend();
        return snap;
    }

    [[nodiscard]] inline std::vector<Sample> history() const { return history_.snapshot(); }
    [[nodiscard]] inline double value() const noexcept { return value_; }
    [[nodiscard]] inline const std::string& phase() const noexcept { return phase_; }
    [[nodiscard]] inline std::uint64_t version() const noexcept { return version_; }
    [[nodiscard]] inline bool milestone_achieved(std::string_view label) const noexcept { return milestones_.achieved(label); }

private:
    double value_{0.0};
    std::string phase_{INITIAL_PHASE};
    std::int64_t timestamp_{0};
    std::uint64_t version_{0};
    std::map<std::string, double> metrics_;
    protocol::payload::ContextUpdate context_;

    lcr::local::ring_buffer<Sample, HISTORY_CAPACITY> history_;
    MilestoneTracker milestones_;
    std::int64_t stale_after_ms_;
};

} // namespace statesync::core::sync
