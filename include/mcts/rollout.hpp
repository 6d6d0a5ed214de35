#pragma once

#include "core/game_state.hpp"
#include "core/territory.hpp"
#include <random>
#include <vector>

namespace mcts {

// Every random choice in the search draws from one explicitly passed source
using Rng = std::mt19937;

class RolloutPolicy {
public:
    RolloutPolicy() = default;
    ~RolloutPolicy() = default;

    // Play uniformly random legal actions until the game ends. `state` is
    // left at the terminal position. Returns each player's reward.
    std::vector<double> simulate(core::GameState& state, Rng& rng);

    // Reward of every player for a final score: their share of all claimed
    // cells, or an even split when nothing is claimed. Sums to 1.
    static std::vector<double> evaluate_result(const std::vector<int>& points);

    int last_rollout_length() const noexcept { return last_rollout_length_; }

private:
    core::Territory territory_;
    std::vector<core::Coord> moves_;
    int last_rollout_length_ = 0;
};

} // namespace mcts
