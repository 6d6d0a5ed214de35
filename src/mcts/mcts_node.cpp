#include "mcts/mcts_node.hpp"
#include <cmath>
#include <limits>
#include <new>
#include <utility>

namespace mcts {

double Node::ucb1_value(core::Player player, int parent_visits, double exploration_constant) const noexcept {
    if (visits == 0) {
        return std::numeric_limits<double>::infinity(); // Unvisited nodes get highest priority
    }

    double exploitation = mean_reward(player);
    if (parent_visits <= 1) {
        return exploitation; // ln(1) == 0
    }

    double exploration = exploration_constant *
                         std::sqrt(std::log(static_cast<double>(parent_visits)) / visits);
    return exploitation + exploration;
}

NodeId NodeArena::allocate(Node node) {
    if (nodes_.size() >= static_cast<std::size_t>(NO_NODE)) {
        throw std::bad_alloc();
    }
    nodes_.push_back(std::move(node));
    return static_cast<NodeId>(nodes_.size() - 1);
}

} // namespace mcts
