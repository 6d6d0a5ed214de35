#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace core {

using Player = uint8_t;

// Occupancy of one cell: empty, or the stone of exactly one player
using Cell = std::optional<Player>;

// Game logic works for any count >= 2; this only bounds fixed-size buffers
constexpr int MAX_PLAYERS = 16;

struct Coord {
    int x = 0;
    int y = 0;

    Coord() = default;
    Coord(int x, int y) : x(x), y(y) {}

    // Chess-like names: columns A, B, C... rows 1, 2, 3...
    char get_col_label() const noexcept { return static_cast<char>('A' + x); }
    int get_row_label() const noexcept { return y + 1; }
    std::string to_string() const {
        return std::string(1, get_col_label()) + std::to_string(get_row_label());
    }

    bool operator==(const Coord& other) const noexcept {
        return x == other.x && y == other.y;
    }

    bool operator!=(const Coord& other) const noexcept {
        return !(*this == other);
    }

    // Row-major, matches Board::coords()
    bool operator<(const Coord& other) const noexcept {
        if (y != other.y) return y < other.y;
        return x < other.x;
    }
};

} // namespace core
