#pragma once

#include "coord.hpp"
#include <cstddef>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <vector>

namespace core {

// Raised when a transition would break the placement rules. Reaching it
// means the caller skipped the legality check.
class InvalidMove : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Who claims a cell, and whether that claim is a stone or open territory
struct Influence {
    std::optional<Player> claimant;
    bool occupied = false;

    std::optional<Player> player() const noexcept { return claimant; }
    bool is_occupied() const noexcept { return occupied; }

    bool operator==(const Influence& other) const noexcept {
        return claimant == other.claimant && occupied == other.occupied;
    }
    bool operator!=(const Influence& other) const noexcept {
        return !(*this == other);
    }
};

class Board {
public:
    // Lazy row-major walk over every cell; cheap to copy and restart
    class CoordRange {
    public:
        class iterator {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = Coord;
            using difference_type = std::ptrdiff_t;
            using pointer = const Coord*;
            using reference = Coord;

            iterator(int width, std::size_t index) : width_(width), index_(index) {}

            Coord operator*() const noexcept {
                return Coord{static_cast<int>(index_ % width_), static_cast<int>(index_ / width_)};
            }
            iterator& operator++() noexcept { ++index_; return *this; }
            iterator operator++(int) noexcept { iterator tmp = *this; ++index_; return tmp; }
            bool operator==(const iterator& other) const noexcept { return index_ == other.index_; }
            bool operator!=(const iterator& other) const noexcept { return index_ != other.index_; }

        private:
            int width_;
            std::size_t index_;
        };

        CoordRange(int width, int height) : width_(width), height_(height) {}

        iterator begin() const noexcept { return iterator(width_, 0); }
        iterator end() const noexcept {
            return iterator(width_, static_cast<std::size_t>(width_) * height_);
        }
        std::size_t size() const noexcept { return static_cast<std::size_t>(width_) * height_; }

    private:
        int width_;
        int height_;
    };

    Board(int width, int height);
    // Restore from a saved occupancy grid (row-major, width * height cells)
    Board(int width, int height, std::vector<Cell> cells);

    // Dimensions
    int width() const noexcept { return width_; }
    int height() const noexcept { return height_; }
    std::size_t cell_count() const noexcept { return cells_.size(); }

    // Addressing
    CoordRange coords() const noexcept { return CoordRange(width_, height_); }
    std::optional<std::size_t> index(Coord c) const noexcept;
    bool contains(Coord c) const noexcept;
    Coord coord_at(std::size_t index) const noexcept {
        return Coord{static_cast<int>(index % width_), static_cast<int>(index / width_)};
    }

    // Cell access, throws std::out_of_range outside the grid
    const Cell& operator[](Coord c) const;
    const Cell& at(std::size_t index) const;
    const std::vector<Cell>& cells() const noexcept { return cells_; }

    // The only write. Called from GameState transitions.
    void place(Coord c, Player player);

    // Occupancy
    bool is_empty() const noexcept { return stone_count_ == 0; }
    bool is_full() const noexcept { return static_cast<std::size_t>(stone_count_) == cells_.size(); }
    int stone_count() const noexcept { return stone_count_; }

    // Rules, derived on demand (see Territory)
    Influence influence(Coord c, int num_players) const;
    std::vector<Influence> influence_map(int num_players) const;
    std::vector<bool> volatile_cells(int num_players) const;
    bool is_valid_move(Coord c, Player player, int num_players) const;
    std::vector<int> points(int num_players) const;
    bool is_game_over(int num_players) const;

    bool operator==(const Board& other) const noexcept {
        return width_ == other.width_ && height_ == other.height_ && cells_ == other.cells_;
    }
    bool operator!=(const Board& other) const noexcept { return !(*this == other); }

private:
    int width_;
    int height_;
    std::vector<Cell> cells_;
    int stone_count_ = 0;
};

} // namespace core
