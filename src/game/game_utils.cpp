#include "game/game_utils.hpp"
#include "game/match.hpp"
#include "core/territory.hpp"
#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace game {

std::optional<core::Coord> GameUtils::parse_coord(const std::string& text) {
    std::size_t begin = text.find_first_not_of(" \t\r\n");
    std::size_t end = text.find_last_not_of(" \t\r\n");
    if (begin == std::string::npos || end - begin < 1) {
        return std::nullopt;
    }

    char col_char = static_cast<char>(std::toupper(static_cast<unsigned char>(text[begin])));
    if (col_char < 'A' || col_char > 'Z') {
        return std::nullopt;
    }

    int row = 0;
    for (std::size_t i = begin + 1; i <= end; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i])) || row > 1000) {
            return std::nullopt;
        }
        row = row * 10 + (text[i] - '0');
    }
    if (row < 1) {
        return std::nullopt;
    }

    return core::Coord{col_char - 'A', row - 1};
}

std::string GameUtils::coord_name(core::Coord c) {
    return c.to_string();
}

std::string GameUtils::action_name(const core::Action& action) {
    return action.to_string();
}

namespace {

// One glyph per player up to MAX_PLAYERS
constexpr char STONE_GLYPHS[] = "0123456789*+#@%&";
static_assert(sizeof(STONE_GLYPHS) - 1 == core::MAX_PLAYERS, "one stone glyph per player");

} // namespace

char GameUtils::stone_glyph(core::Player player) {
    return player < core::MAX_PLAYERS ? STONE_GLYPHS[player] : '?';
}

char GameUtils::territory_glyph(core::Player player, bool sealed) {
    if (player >= core::MAX_PLAYERS) {
        return '?';
    }
    // Lowercase while contested, uppercase once sealed
    return static_cast<char>((sealed ? 'A' : 'a') + player);
}

void GameUtils::print_board(std::ostream& out, const core::GameState& state) {
    const core::Board& board = state.board();

    core::Territory territory;
    territory.analyze(board, state.num_players());

    out << "    ";
    for (int x = 0; x < board.width(); x++) {
        out << static_cast<char>('A' + x) << " ";
    }
    out << "\n";

    for (int y = 0; y < board.height(); y++) {
        out << std::setw(3) << (y + 1) << " ";
        for (int x = 0; x < board.width(); x++) {
            std::size_t i = *board.index(core::Coord{x, y});
            const core::Influence& influence = territory.influence(i);

            if (influence.is_occupied()) {
                out << stone_glyph(*influence.player());
            } else if (influence.player()) {
                out << territory_glyph(*influence.player(), !territory.is_volatile(i));
            } else {
                out << (territory.is_volatile(i) ? '.' : ' ');
            }
            out << " ";
        }
        out << (y + 1) << "\n";
    }

    out << "    ";
    for (int x = 0; x < board.width(); x++) {
        out << static_cast<char>('A' + x) << " ";
    }
    out << "\n";
}

void GameUtils::print_standings(std::ostream& out, const Match& match) {
    const core::GameState& state = match.state();
    std::vector<int> score = state.points();

    out << "Standings:\n";
    for (int p = 0; p < state.num_players(); ++p) {
        out << "  " << p << " " << std::left << std::setw(16)
            << match.player_name(static_cast<core::Player>(p))
            << std::right << std::setw(4) << score[p] << "\n";
    }
}

void GameUtils::print_match(std::ostream& out, const Match& match) {
    print_board(out, match.state());

    if (match.is_game_over()) {
        auto leader = sole_leader(match.state().points());
        out << "Game over! "
            << (leader ? match.player_name(*leader) + " wins" : std::string("Draw")) << "\n";
    } else {
        core::Player next = match.state().next_player();
        out << match.player_name(next)
            << (match.is_human(next) ? " to play" : " is thinking...") << "\n";
    }
    print_standings(out, match);
}

void GameUtils::print_legend(std::ostream& out) {
    out << "Legend: stones 0-9 then * + # @ % & for players 10-15, "
        << "a-p contested territory, A-P sealed territory, . open ground\n";
}

std::optional<core::Player> GameUtils::sole_leader(const std::vector<int>& points) {
    std::optional<core::Player> leader;
    int best = -1;
    bool shared = false;
    for (std::size_t p = 0; p < points.size(); ++p) {
        if (points[p] > best) {
            best = points[p];
            leader = static_cast<core::Player>(p);
            shared = false;
        } else if (points[p] == best) {
            shared = true;
        }
    }
    if (shared) {
        return std::nullopt;
    }
    return leader;
}

std::string GameUtils::format_duration(double seconds) {
    std::ostringstream oss;
    if (seconds < 1.0) {
        oss << static_cast<int>(seconds * 1000.0 + 0.5) << " ms";
    } else {
        oss << std::fixed << std::setprecision(2) << seconds << " s";
    }
    return oss.str();
}

} // namespace game
