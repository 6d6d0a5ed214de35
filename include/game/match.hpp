#pragma once

#include "settings.hpp"
#include "core/action.hpp"
#include "core/game_state.hpp"
#include "mcts/rollout.hpp"
#include <optional>
#include <string>

namespace game {

// Authoritative game: owns the state humans and bots take turns on,
// plus a one-step undo.
class Match {
public:
    explicit Match(const Settings& settings = Settings());

    // Restart; the running game is kept for undo unless nothing was played yet
    void new_game(const Settings& settings);
    void new_game() { new_game(settings_); }

    const core::GameState& state() const noexcept { return state_; }
    const Settings& settings() const noexcept { return settings_; }

    bool is_human(core::Player player) const noexcept {
        return static_cast<int>(player) < settings_.num_humans;
    }
    bool is_game_over() const { return state_.is_terminal(); }
    bool next_player_is_human() const {
        return is_human(state_.next_player()) && !is_game_over();
    }

    // Place the current human's stone. False (and no change) when illegal.
    bool play_human(core::Coord coord);

    // Search for the configured think time and apply the bot's choice.
    // Returns the applied action, nullopt when the game is already over.
    std::optional<core::Action> play_bot(mcts::Rng& rng);

    // Apply an already chosen action for whoever is to move
    void apply(const core::Action& action, bool remember_for_undo = false);

    bool can_undo() const noexcept { return undo_.has_value(); }
    bool undo();

    // "Yellow", "Pink (bot)", ...
    std::string player_name(core::Player player) const;

private:
    struct Snapshot {
        Settings settings;
        core::GameState state;
    };

    Settings settings_;
    core::GameState state_;
    std::optional<Snapshot> undo_;
};

} // namespace game
