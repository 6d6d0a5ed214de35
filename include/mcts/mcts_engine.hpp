#pragma once

#include "mcts_node.hpp"
#include "rollout.hpp"
#include "core/game_state.hpp"
#include "core/territory.hpp"
#include <chrono>
#include <cmath>
#include <iosfwd>
#include <optional>
#include <vector>

namespace mcts {

struct Config {
    double exploration_constant;  // UCB1 exploration parameter

    Config() : exploration_constant(std::sqrt(2.0)) {}
};

// Multiplayer UCT. Each node's mover maximizes their own share of the
// final territory; the tree is private to one decision.
class MCTSEngine {
public:
    struct ChildStats {
        core::Action action;
        int visits = 0;
        double mean_reward = 0.0;  // For the player choosing at the root
    };

    explicit MCTSEngine(core::GameState root_state, const Config& config = Config());
    ~MCTSEngine() = default;

    MCTSEngine(const MCTSEngine&) = delete;
    MCTSEngine& operator=(const MCTSEngine&) = delete;

    // One selection / expansion / rollout / backpropagation pass
    void iterate(Rng& rng);

    // Most visited root action, nullopt before any expansion or on a finished game.
    // Children tied on visits and mean reward are picked between with `rng`.
    std::optional<core::Action> best_action(Rng& rng) const;

    // Convenience loops. The budget is checked between iterations only and
    // at least one iteration always runs.
    std::optional<core::Action> search(Rng& rng, int iterations);
    std::optional<core::Action> search(Rng& rng, std::chrono::duration<double> budget);

    // Statistics
    const core::GameState& root_state() const noexcept { return root_state_; }
    const Config& config() const noexcept { return config_; }
    const NodeArena& tree() const noexcept { return arena_; }
    int iterations() const noexcept { return iterations_; }
    std::size_t tree_size() const noexcept { return arena_.size(); }
    int root_visits() const noexcept { return arena_[ROOT_NODE].visits; }
    std::vector<ChildStats> top_children(int count = 5) const;
    void print_stats(std::ostream& out, int top_n = 5) const;

private:
    NodeId make_node(const core::GameState& state, NodeId parent, const core::Action& action);
    NodeId select_child(NodeId node, Rng& rng) const;
    NodeId expand(NodeId node, core::GameState& state, Rng& rng);
    void advance(core::GameState& state, const core::Action& action);
    void backpropagate(const std::vector<double>& rewards);

    core::GameState root_state_;
    Config config_;
    NodeArena arena_;
    RolloutPolicy rollout_policy_;

    // Reused between iterations
    core::Territory scratch_;
    std::vector<NodeId> path_;
    mutable std::vector<NodeId> ties_;

    int iterations_ = 0;
};

} // namespace mcts
