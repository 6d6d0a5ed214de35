#pragma once

#include "core/action.hpp"
#include "core/coord.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

namespace mcts {

using NodeId = uint32_t;

constexpr NodeId ROOT_NODE = 0;
constexpr NodeId NO_NODE = UINT32_MAX;

// Tree node. Nodes refer to each other by arena index only, the state a
// node stands for is rebuilt by replaying actions from the root.
struct Node {
    // Hot data (touched every iteration)
    int visits = 0;
    std::vector<double> rewards;  // Accumulated reward, one slot per player
    core::Player to_move = 0;     // Player choosing among this node's children

    // Cold data
    NodeId parent = NO_NODE;
    core::Action action;          // Action that led here from the parent
    bool terminal = false;
    std::vector<core::Action> untried_actions;
    std::map<core::Action, NodeId> children;

    bool is_fully_expanded() const noexcept { return untried_actions.empty(); }
    bool is_leaf() const noexcept { return children.empty(); }

    double mean_reward(core::Player player) const noexcept {
        return visits > 0 ? rewards[player] / visits : 0.0;
    }

    // UCB1 from the perspective of `player`, who chooses at the parent
    double ucb1_value(core::Player player, int parent_visits, double exploration_constant) const noexcept;
};

// Flat node storage; the whole tree is released at once when the arena goes.
class NodeArena {
public:
    NodeArena() = default;

    // Non-copyable, a tree belongs to one search
    NodeArena(const NodeArena&) = delete;
    NodeArena& operator=(const NodeArena&) = delete;
    NodeArena(NodeArena&&) = default;
    NodeArena& operator=(NodeArena&&) = default;

    // Index stays valid until reset(). References may move on allocate().
    NodeId allocate(Node node);

    Node& operator[](NodeId id) noexcept { return nodes_[id]; }
    const Node& operator[](NodeId id) const noexcept { return nodes_[id]; }

    std::size_t size() const noexcept { return nodes_.size(); }
    bool empty() const noexcept { return nodes_.empty(); }
    void reserve(std::size_t count) { nodes_.reserve(count); }
    void reset() noexcept { nodes_.clear(); }

private:
    std::vector<Node> nodes_;
};

} // namespace mcts
