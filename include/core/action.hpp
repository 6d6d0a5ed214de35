#pragma once

#include "coord.hpp"
#include <cstdint>
#include <string>

namespace core {

// A turn choice: skip, or place the mover's stone at `coord`.
// Ordered so it can key the search tree's child maps.
struct Action {
    enum class Kind : uint8_t {
        Pass = 0,
        Move = 1
    };

    Kind kind = Kind::Pass;
    Coord coord;  // Meaningful for Move only

    Action() = default;

    static Action pass() noexcept { return Action(); }
    static Action move(Coord c) noexcept {
        Action action;
        action.kind = Kind::Move;
        action.coord = c;
        return action;
    }

    bool is_pass() const noexcept { return kind == Kind::Pass; }
    bool is_move() const noexcept { return kind == Kind::Move; }

    std::string to_string() const { return is_pass() ? "pass" : coord.to_string(); }

    bool operator==(const Action& other) const noexcept {
        if (kind != other.kind) return false;
        return is_pass() || coord == other.coord;
    }

    bool operator!=(const Action& other) const noexcept {
        return !(*this == other);
    }

    // Pass sorts before every move, moves sort row-major
    bool operator<(const Action& other) const noexcept {
        if (kind != other.kind) return kind < other.kind;
        return is_move() && coord < other.coord;
    }
};

} // namespace core
