#pragma once

#include "core/coord.hpp"

namespace game {

struct Settings {
    static constexpr int MIN_BOARD_SIZE = 5;
    static constexpr int MAX_BOARD_SIZE = 17;
    static constexpr int MAX_HUMANS = 4;
    static constexpr int MAX_BOTS = 4;
    static constexpr double MIN_THINK_TIME = 0.01;  // seconds
    static constexpr double MAX_THINK_TIME = 3.0;

    int board_size = 9;
    int num_humans = 1;
    int num_bots = 1;
    bool humans_first = true;       // Going first is a big advantage
    double bot_think_time = 1.0;    // seconds per bot move

    int num_players() const noexcept { return num_humans + num_bots; }

    // Humans are players 0..num_humans-1, bots come after them
    core::Player starting_player() const noexcept {
        return humans_first ? 0 : static_cast<core::Player>(num_humans);
    }

    // Clamped to the playable ranges, with at least two participants
    Settings normalized() const;

    bool operator==(const Settings& other) const noexcept {
        return board_size == other.board_size && num_humans == other.num_humans &&
               num_bots == other.num_bots && humans_first == other.humans_first &&
               bot_think_time == other.bot_think_time;
    }
    bool operator!=(const Settings& other) const noexcept { return !(*this == other); }
};

} // namespace game
