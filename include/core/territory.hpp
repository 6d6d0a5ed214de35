#pragma once

#include "board.hpp"
#include <array>
#include <limits>
#include <vector>

namespace core {

// One full territory analysis of a board: per-player BFS distances,
// influence and volatility of every cell.
//
// Distances are 4-connected and only travel through empty cells, so any
// stone is a wall for everybody. A connected region of empty cells that
// only one player reaches is sealed: that player owns all of it for the
// rest of the game. Regions reached by two or more players stay volatile.
// Until every participant has a stone, all empty cells are neutral and
// volatile.
//
// Buffers are kept between calls to analyze(), so reusing one instance
// across many boards (rollouts) does not allocate after warm-up.
class Territory {
public:
    static constexpr int UNREACHABLE = std::numeric_limits<int>::max();

    Territory() = default;

    void analyze(const Board& board, int num_players);

    // Results of the last analyze()
    int num_players() const noexcept { return num_players_; }
    int distance(Player player, std::size_t index) const noexcept {
        return distances_[static_cast<std::size_t>(player) * cell_count_ + index];
    }
    bool has_stones(Player player) const noexcept { return has_stones_[player]; }
    bool all_players_placed() const noexcept { return all_players_placed_; }

    const Influence& influence(std::size_t index) const noexcept { return influence_[index]; }
    bool is_volatile(std::size_t index) const noexcept { return volatile_[index]; }
    const std::vector<Influence>& influence_map() const noexcept { return influence_; }
    const std::vector<bool>& volatile_cells() const noexcept { return volatile_; }

    // Empty cells that still accept a stone
    int volatile_count() const noexcept { return volatile_count_; }
    std::vector<int> points() const;

    // True when this analysis describes exactly `board`'s current stones
    bool matches(const Board& board) const noexcept {
        return board.width() == width_ && board.height() == height_ &&
               board.stone_count() == stone_count_ && board.cells() == cells_;
    }

private:
    void flood(const Board& board, Player player);

    int width_ = 0;
    int height_ = 0;
    int stone_count_ = -1;
    std::size_t cell_count_ = 0;
    int num_players_ = 0;
    bool all_players_placed_ = false;
    int volatile_count_ = 0;

    std::vector<Cell> cells_;     // Stones the analysis was made from
    std::vector<int> distances_;  // [player * cell_count + index]
    std::vector<int> queue_;
    std::vector<Influence> influence_;
    std::vector<bool> volatile_;
    std::array<bool, MAX_PLAYERS> has_stones_{};
};

} // namespace core
