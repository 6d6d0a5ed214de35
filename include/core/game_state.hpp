#pragma once

#include "action.hpp"
#include "board.hpp"
#include "territory.hpp"
#include <vector>

namespace core {

// A board plus turn order: the unit the search engine simulates.
// Copyable on purpose, every simulated branch works on its own copy.
class GameState {
private:
    Board board_;
    Player next_player_ = 0;
    int num_players_ = 2;

    void advance_turn() noexcept {
        next_player_ = static_cast<Player>((next_player_ + 1) % num_players_);
    }

public:
    // Fresh square game
    GameState(int board_size, int num_players, Player starting_player);
    GameState(int width, int height, int num_players, Player starting_player);
    // Rebuild a saved game, throws std::invalid_argument on an inconsistent snapshot
    GameState(Board board, Player next_player, int num_players);

    // Accessors
    const Board& board() const noexcept { return board_; }
    Player next_player() const noexcept { return next_player_; }
    int num_players() const noexcept { return num_players_; }

    // Transitions. Illegal moves throw InvalidMove.
    GameState apply(const Action& action) const;
    void play(const Action& action);
    // Same as play(), trusting `analysis` to describe the current board
    void play(const Action& action, const Territory& analysis);

    // Move generation. Exactly {Pass} when no placement is possible.
    std::vector<Action> legal_actions() const;
    std::vector<Action> legal_actions(Territory& scratch) const;

    // Queries bound to this game's player count
    bool is_terminal() const { return board_.is_game_over(num_players_); }
    std::vector<int> points() const { return board_.points(num_players_); }
    Influence influence(Coord c) const { return board_.influence(c, num_players_); }
    std::vector<bool> volatile_cells() const { return board_.volatile_cells(num_players_); }
    bool is_valid_move(Coord c) const { return board_.is_valid_move(c, next_player_, num_players_); }

    bool operator==(const GameState& other) const noexcept {
        return next_player_ == other.next_player_ && num_players_ == other.num_players_ &&
               board_ == other.board_;
    }
    bool operator!=(const GameState& other) const noexcept { return !(*this == other); }
};

// Free-function form of GameState::apply
inline GameState apply(const GameState& state, const Action& action) {
    return state.apply(action);
}

} // namespace core
