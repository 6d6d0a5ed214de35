#include "mcts/rollout.hpp"
#include "utils/profiler.hpp"
#include <numeric>

namespace mcts {

std::vector<double> RolloutPolicy::simulate(core::GameState& state, Rng& rng) {
    HOBOGO_PROFILE_SCOPE("RolloutPolicy::simulate");

    const core::Board& board = state.board();
    int moves_played = 0;

    while (true) {
        territory_.analyze(board, state.num_players());
        if (territory_.volatile_count() == 0) {
            break;
        }

        moves_.clear();
        for (std::size_t i = 0; i < board.cell_count(); ++i) {
            if (!board.at(i) && territory_.is_volatile(i)) {
                moves_.push_back(board.coord_at(i));
            }
        }

        std::uniform_int_distribution<std::size_t> dist(0, moves_.size() - 1);
        state.play(core::Action::move(moves_[dist(rng)]), territory_);
        moves_played++;
    }

    last_rollout_length_ = moves_played;
    return evaluate_result(territory_.points());
}

std::vector<double> RolloutPolicy::evaluate_result(const std::vector<int>& points) {
    std::vector<double> rewards(points.size(), 0.0);
    if (points.empty()) {
        return rewards;
    }

    int total = std::accumulate(points.begin(), points.end(), 0);
    for (std::size_t p = 0; p < points.size(); ++p) {
        rewards[p] = total > 0 ? static_cast<double>(points[p]) / total
                               : 1.0 / static_cast<double>(points.size());
    }
    return rewards;
}

} // namespace mcts
