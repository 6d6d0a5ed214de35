#include "core/board.hpp"
#include "core/territory.hpp"
#include <string>
#include <utility>

namespace core {

Board::Board(int width, int height)
    : width_(width), height_(height) {
    if (width < 1 || height < 1) {
        throw std::invalid_argument("Board: dimensions must be positive, got " +
                                    std::to_string(width) + "x" + std::to_string(height));
    }
    cells_.assign(static_cast<std::size_t>(width) * height, Cell{});
}

Board::Board(int width, int height, std::vector<Cell> cells)
    : Board(width, height) {
    if (cells.size() != cells_.size()) {
        throw std::invalid_argument("Board: expected " + std::to_string(cells_.size()) +
                                    " cells, got " + std::to_string(cells.size()));
    }
    for (const Cell& cell : cells) {
        if (cell && *cell >= MAX_PLAYERS) {
            throw std::invalid_argument("Board: stone owner out of range: " +
                                        std::to_string(*cell));
        }
        if (cell) ++stone_count_;
    }
    cells_ = std::move(cells);
}

std::optional<std::size_t> Board::index(Coord c) const noexcept {
    if (!contains(c)) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(c.y) * width_ + c.x;
}

bool Board::contains(Coord c) const noexcept {
    return c.x >= 0 && c.x < width_ && c.y >= 0 && c.y < height_;
}

const Cell& Board::operator[](Coord c) const {
    auto i = index(c);
    if (!i) {
        throw std::out_of_range("Board: no cell at (" + std::to_string(c.x) + ", " +
                                std::to_string(c.y) + ")");
    }
    return cells_[*i];
}

const Cell& Board::at(std::size_t index) const {
    return cells_.at(index);
}

void Board::place(Coord c, Player player) {
    auto i = index(c);
    if (!i) {
        throw std::out_of_range("Board: cannot place outside the board at (" +
                                std::to_string(c.x) + ", " + std::to_string(c.y) + ")");
    }
    if (cells_[*i]) {
        throw InvalidMove("Board: cell " + c.to_string() + " is already occupied");
    }
    if (player >= MAX_PLAYERS) {
        throw std::invalid_argument("Board: player out of range: " + std::to_string(player));
    }
    cells_[*i] = player;
    ++stone_count_;
}

Influence Board::influence(Coord c, int num_players) const {
    auto i = index(c);
    if (!i) {
        throw std::out_of_range("Board: no influence outside the board at (" +
                                std::to_string(c.x) + ", " + std::to_string(c.y) + ")");
    }
    Territory territory;
    territory.analyze(*this, num_players);
    return territory.influence(*i);
}

std::vector<Influence> Board::influence_map(int num_players) const {
    Territory territory;
    territory.analyze(*this, num_players);
    return territory.influence_map();
}

std::vector<bool> Board::volatile_cells(int num_players) const {
    Territory territory;
    territory.analyze(*this, num_players);
    return territory.volatile_cells();
}

bool Board::is_valid_move(Coord c, Player player, int num_players) const {
    auto i = index(c);
    if (!i || cells_[*i] || static_cast<int>(player) >= num_players) {
        return false;
    }
    Territory territory;
    territory.analyze(*this, num_players);
    return territory.is_volatile(*i);
}

std::vector<int> Board::points(int num_players) const {
    Territory territory;
    territory.analyze(*this, num_players);
    return territory.points();
}

bool Board::is_game_over(int num_players) const {
    if (is_full()) {
        return true;
    }
    Territory territory;
    territory.analyze(*this, num_players);
    return territory.volatile_count() == 0;
}

} // namespace core
