#include "mcts/mcts_engine.hpp"
#include "utils/profiler.hpp"
#include "utils/timer.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <limits>
#include <utility>

namespace mcts {

MCTSEngine::MCTSEngine(core::GameState root_state, const Config& config)
    : root_state_(std::move(root_state)), config_(config) {
    make_node(root_state_, NO_NODE, core::Action::pass());
}

NodeId MCTSEngine::make_node(const core::GameState& state, NodeId parent, const core::Action& action) {
    Node node;
    node.rewards.assign(state.num_players(), 0.0);
    node.to_move = state.next_player();
    node.parent = parent;
    node.action = action;

    node.untried_actions = state.legal_actions(scratch_);
    if (scratch_.volatile_count() == 0) {
        // Finished games are never expanded
        node.terminal = true;
        node.untried_actions.clear();
    }
    return arena_.allocate(std::move(node));
}

void MCTSEngine::iterate(Rng& rng) {
    HOBOGO_PROFILE_SCOPE("MCTSEngine::iterate");

    core::GameState state = root_state_;
    NodeId current = ROOT_NODE;
    path_.clear();
    path_.push_back(current);

    // Selection
    {
        HOBOGO_PROFILE_SCOPE("MCTSEngine::select");
        while (arena_[current].is_fully_expanded() && !arena_[current].is_leaf()) {
            current = select_child(current, rng);
            advance(state, arena_[current].action);
            path_.push_back(current);
        }
    }

    // Expansion
    if (!arena_[current].terminal && !arena_[current].is_fully_expanded()) {
        current = expand(current, state, rng);
        path_.push_back(current);
    }

    // Rollout, then backpropagation
    std::vector<double> rewards = rollout_policy_.simulate(state, rng);
    backpropagate(rewards);

    iterations_++;
}

NodeId MCTSEngine::select_child(NodeId id, Rng& rng) const {
    const Node& node = arena_[id];

    double best_value = -std::numeric_limits<double>::infinity();
    ties_.clear();
    for (const auto& [action, child_id] : node.children) {
        double value = arena_[child_id].ucb1_value(node.to_move, node.visits, config_.exploration_constant);
        if (value > best_value) {
            best_value = value;
            ties_.clear();
            ties_.push_back(child_id);
        } else if (value == best_value) {
            ties_.push_back(child_id);
        }
    }

    if (ties_.size() == 1) {
        return ties_.front();
    }
    std::uniform_int_distribution<std::size_t> dist(0, ties_.size() - 1);
    return ties_[dist(rng)];
}

NodeId MCTSEngine::expand(NodeId id, core::GameState& state, Rng& rng) {
    HOBOGO_PROFILE_SCOPE("MCTSEngine::expand");

    std::vector<core::Action>& untried = arena_[id].untried_actions;
    std::uniform_int_distribution<std::size_t> dist(0, untried.size() - 1);
    std::size_t pick = dist(rng);
    std::swap(untried[pick], untried.back());
    core::Action action = untried.back();
    untried.pop_back();

    advance(state, action);

    // make_node may grow the arena, so no Node references are held across it
    NodeId child = make_node(state, id, action);
    arena_[id].children.emplace(action, child);
    return child;
}

void MCTSEngine::advance(core::GameState& state, const core::Action& action) {
    scratch_.analyze(state.board(), state.num_players());
    state.play(action, scratch_);
}

void MCTSEngine::backpropagate(const std::vector<double>& rewards) {
    HOBOGO_PROFILE_SCOPE("MCTSEngine::backpropagate");
    for (NodeId id : path_) {
        Node& node = arena_[id];
        node.visits++;
        for (std::size_t p = 0; p < rewards.size(); ++p) {
            node.rewards[p] += rewards[p];
        }
    }
}

std::optional<core::Action> MCTSEngine::best_action(Rng& rng) const {
    const Node& root = arena_[ROOT_NODE];
    if (root.children.empty()) {
        return std::nullopt;
    }

    // Most visits, then best mean for the root mover; exact ties are drawn
    // at random so mirror moves are not decided by map order
    ties_.clear();
    const Node* best = nullptr;
    for (const auto& [action, child_id] : root.children) {
        const Node& child = arena_[child_id];
        bool better = best == nullptr || child.visits > best->visits ||
                      (child.visits == best->visits &&
                       child.mean_reward(root.to_move) > best->mean_reward(root.to_move));
        if (better) {
            best = &child;
            ties_.clear();
            ties_.push_back(child_id);
        } else if (child.visits == best->visits &&
                   child.mean_reward(root.to_move) == best->mean_reward(root.to_move)) {
            ties_.push_back(child_id);
        }
    }

    if (ties_.size() == 1) {
        return arena_[ties_.front()].action;
    }
    std::uniform_int_distribution<std::size_t> dist(0, ties_.size() - 1);
    return arena_[ties_[dist(rng)]].action;
}

std::optional<core::Action> MCTSEngine::search(Rng& rng, int iterations) {
    do {
        iterate(rng);
    } while (--iterations > 0);
    return best_action(rng);
}

std::optional<core::Action> MCTSEngine::search(Rng& rng, std::chrono::duration<double> budget) {
    utils::Timer timer;
    timer.start();
    do {
        iterate(rng);
    } while (!timer.has_elapsed(budget));
    return best_action(rng);
}

std::vector<MCTSEngine::ChildStats> MCTSEngine::top_children(int count) const {
    const Node& root = arena_[ROOT_NODE];

    std::vector<ChildStats> stats;
    stats.reserve(root.children.size());
    for (const auto& [action, child_id] : root.children) {
        const Node& child = arena_[child_id];
        stats.push_back(ChildStats{action, child.visits, child.mean_reward(root.to_move)});
    }

    // Sort by visit count (descending)
    std::stable_sort(stats.begin(), stats.end(), [](const ChildStats& a, const ChildStats& b) {
        return a.visits > b.visits;
    });

    if (count >= 0 && static_cast<int>(stats.size()) > count) {
        stats.resize(count);
    }
    return stats;
}

void MCTSEngine::print_stats(std::ostream& out, int top_n) const {
    out << "Iterations: " << iterations_
        << ", tree nodes: " << arena_.size()
        << ", root visits: " << root_visits() << "\n";

    auto children = top_children(top_n);
    if (children.empty()) {
        out << "  (no expanded actions)\n";
        return;
    }
    for (const ChildStats& child : children) {
        out << "  " << std::left << std::setw(6) << child.action.to_string()
            << std::right << " visits: " << std::setw(7) << child.visits
            << "  mean share: " << std::fixed << std::setprecision(3) << child.mean_reward
            << std::defaultfloat << "\n";
    }
}

} // namespace mcts
