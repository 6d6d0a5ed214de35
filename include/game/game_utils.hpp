#pragma once

#include "core/action.hpp"
#include "core/coord.hpp"
#include "core/game_state.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace game {

class Match;

class GameUtils {
public:
    // Coordinate parsing/display ("C3" <-> (2, 2))
    static std::optional<core::Coord> parse_coord(const std::string& text);
    static std::string coord_name(core::Coord c);
    static std::string action_name(const core::Action& action);

    // Board printing
    static char stone_glyph(core::Player player);
    static char territory_glyph(core::Player player, bool sealed);
    static void print_board(std::ostream& out, const core::GameState& state);
    static void print_standings(std::ostream& out, const Match& match);
    static void print_match(std::ostream& out, const Match& match);
    static void print_legend(std::ostream& out);

    // Player with the strictly highest score; nullopt when the top is shared
    static std::optional<core::Player> sole_leader(const std::vector<int>& points);

    // "1.25 s", "340 ms"
    static std::string format_duration(double seconds);
};

} // namespace game
