#include "core/game_state.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace core {

namespace {

void check_players(int num_players, Player next_player) {
    if (num_players < 2 || num_players > MAX_PLAYERS) {
        throw std::invalid_argument("GameState: need 2.." + std::to_string(MAX_PLAYERS) +
                                    " players, got " + std::to_string(num_players));
    }
    if (next_player >= num_players) {
        throw std::invalid_argument("GameState: player " + std::to_string(next_player) +
                                    " is not in a " + std::to_string(num_players) +
                                    " player game");
    }
}

} // namespace

GameState::GameState(int board_size, int num_players, Player starting_player)
    : GameState(board_size, board_size, num_players, starting_player) {
}

GameState::GameState(int width, int height, int num_players, Player starting_player)
    : board_(width, height), next_player_(starting_player), num_players_(num_players) {
    check_players(num_players, starting_player);
}

GameState::GameState(Board board, Player next_player, int num_players)
    : board_(std::move(board)), next_player_(next_player), num_players_(num_players) {
    check_players(num_players, next_player);
    for (const Cell& cell : board_.cells()) {
        if (cell && *cell >= num_players) {
            throw std::invalid_argument("GameState: stone of player " + std::to_string(*cell) +
                                        " in a " + std::to_string(num_players) + " player game");
        }
    }
}

GameState GameState::apply(const Action& action) const {
    GameState next = *this;
    next.play(action);
    return next;
}

void GameState::play(const Action& action) {
    if (action.is_move()) {
        if (!board_.is_valid_move(action.coord, next_player_, num_players_)) {
            throw InvalidMove("GameState: " + action.to_string() + " is not a legal move for player " +
                              std::to_string(next_player_));
        }
        board_.place(action.coord, next_player_);
    }
    advance_turn();
}

void GameState::play(const Action& action, const Territory& analysis) {
    if (action.is_move()) {
        if (!analysis.matches(board_) || analysis.num_players() != num_players_) {
            throw std::logic_error("GameState: territory analysis is stale");
        }
        auto i = board_.index(action.coord);
        if (!i || board_.at(*i) || !analysis.is_volatile(*i)) {
            throw InvalidMove("GameState: " + action.to_string() + " is not a legal move for player " +
                              std::to_string(next_player_));
        }
        board_.place(action.coord, next_player_);
    }
    advance_turn();
}

std::vector<Action> GameState::legal_actions() const {
    Territory scratch;
    return legal_actions(scratch);
}

std::vector<Action> GameState::legal_actions(Territory& scratch) const {
    scratch.analyze(board_, num_players_);

    std::vector<Action> actions;
    actions.reserve(scratch.volatile_count());
    for (std::size_t i = 0; i < board_.cell_count(); ++i) {
        if (!board_.at(i) && scratch.is_volatile(i)) {
            actions.push_back(Action::move(board_.coord_at(i)));
        }
    }

    if (actions.empty()) {
        actions.push_back(Action::pass());
    }
    return actions;
}

} // namespace core
