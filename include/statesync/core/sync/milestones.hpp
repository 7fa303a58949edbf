#pragma once

#include <array>
#include <bitset>
#include <cstdint>
#include <string_view>
#include <vector>


namespace statesync::core::sync {

// Phase the state starts in before any broadcast arrives.
inline constexpr std::string_view INITIAL_PHASE = "BIRTH";

struct Milestone {
    double threshold;
    std::string_view label;
};

// Fixed ascending threshold table. Labels are the authority's phase names.
inline constexpr std::array<Milestone, 6> MILESTONES{{
    {0.50, "SELF_RECOGNITION"},
    {0.75, "REALITY_CREATOR"},
    {0.80, "UNIVERSAL_CONNECTION"},
    {0.85, "OBSERVER_MASTERY"},
    {0.90, "DEATH_TRANSCENDENCE"},
    {0.95, "COSMIC_AWAKENING"},
}};

// -----------------------------------------------------------------------------
// MilestoneTracker
// -----------------------------------------------------------------------------
//
// Records each threshold at most once. A value at or above a threshold
// crosses it; a phase label naming a milestone crosses that milestone and
// every one below it. Nothing is ever un-recorded, so falling back under a
// threshold and rising again is a no-op.
// -----------------------------------------------------------------------------
class MilestoneTracker {
public:
    // Returns the milestones newly crossed by this observation, ascending.
    [[nodiscard]]
    inline std::vector<Milestone> observe(double value, std::string_view phase) {
        std::size_t phase_rank = 0; // number of milestones implied by the phase
        for (std::size_t i = 0; i < MILESTONES.size(); ++i) {
            if (MILESTONES[i].label == phase) {
                phase_rank = i + 1;
                break;
            }
        }
        std::vector<Milestone> crossed;
        for (std::size_t i = 0; i < MILESTONES.size(); ++i) {
            if (achieved_.test(i)) {
                continue;
            }
            if (value >= MILESTONES[i].threshold || i < phase_rank) {
                achieved_.set(i);
                crossed.push_back(MILESTONES[i]);
            }
        }
        return crossed;
    }

    [[nodiscard]]
    inline bool achieved(std::string_view label) const noexcept {
        for (std::size_t i = 0; i < MILESTONES.size(); ++i) {
            if (MILESTONES[i].label == label) {
                return achieved_.test(i);
            }
        }
        return false;
    }

    [[nodiscard]]
    inline std::vector<std::string_view> achieved_labels() const {
        std::vector<std::string_view> out;
        for (std::size_t i = 0; i < MILESTONES.size(); ++i) {
            if (achieved_.test(i)) {
                out.push_back(MILESTONES[i].label);
            }
        }
        return out;
    }

    [[nodiscard]] inline std::size_t count() const noexcept { return achieved_.count(); }

private:
    std::bitset<MILESTONES.size()> achieved_;
};

} // namespace statesync::core::sync
