#include "game/match.hpp"
#include "mcts/mcts_engine.hpp"
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

namespace game {

namespace {

core::GameState fresh_state(const Settings& settings) {
    return core::GameState(settings.board_size, settings.num_players(), settings.starting_player());
}

} // namespace

Match::Match(const Settings& settings)
    : settings_(settings.normalized()), state_(fresh_state(settings_)) {
}

void Match::new_game(const Settings& settings) {
    if (!state_.board().is_empty()) {
        undo_ = Snapshot{settings_, state_};
    }
    settings_ = settings.normalized();
    state_ = fresh_state(settings_);
}

bool Match::play_human(core::Coord coord) {
    if (!next_player_is_human() || !state_.is_valid_move(coord)) {
        return false;
    }
    apply(core::Action::move(coord), true);
    return true;
}

std::optional<core::Action> Match::play_bot(mcts::Rng& rng) {
    if (is_game_over()) {
        return std::nullopt;
    }
    if (is_human(state_.next_player())) {
        throw std::logic_error("Match: " + player_name(state_.next_player()) + " is not a bot");
    }

    mcts::MCTSEngine engine(state_);
    auto choice = engine.search(rng, std::chrono::duration<double>(settings_.bot_think_time));

    // No decision means nothing to place
    core::Action action = choice.value_or(core::Action::pass());
    apply(action);
    return action;
}

void Match::apply(const core::Action& action, bool remember_for_undo) {
    core::GameState next = state_.apply(action);
    if (remember_for_undo) {
        undo_ = Snapshot{settings_, state_};
    }
    state_ = std::move(next);
}

bool Match::undo() {
    if (!undo_) {
        return false;
    }
    settings_ = undo_->settings;
    state_ = undo_->state;
    undo_.reset();
    return true;
}

std::string Match::player_name(core::Player player) const {
    static const char* const NAMES[] = {"Yellow", "Pink", "Green", "Purple"};

    std::string name = player < 4 ? NAMES[player] : std::to_string(player);
    if (!is_human(player)) {
        name += " (bot)";
    }
    return name;
}

} // namespace game
