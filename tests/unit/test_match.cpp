#include <gtest/gtest.h>
#include "game/match.hpp"
#include <stdexcept>

using namespace game;
using core::Action;
using core::Coord;

class MatchTest : public ::testing::Test {
protected:
    static Settings settings(int humans, int bots, bool humans_first = true) {
        Settings s;
        s.board_size = 5;
        s.num_humans = humans;
        s.num_bots = bots;
        s.humans_first = humans_first;
        s.bot_think_time = 0.02;
        return s;
    }
};

TEST_F(MatchTest, SettingsAreNormalized) {
    Settings s;
    s.board_size = 40;
    s.num_humans = 0;
    s.num_bots = 0;
    s.bot_think_time = 10.0;
    s.humans_first = false;

    Settings n = s.normalized();
    EXPECT_EQ(n.board_size, Settings::MAX_BOARD_SIZE);
    EXPECT_EQ(n.num_players(), 2);
    EXPECT_EQ(n.num_humans, 2);
    EXPECT_DOUBLE_EQ(n.bot_think_time, Settings::MAX_THINK_TIME);
    EXPECT_TRUE(n.humans_first);

    s.board_size = 1;
    s.num_bots = 9;
    EXPECT_EQ(s.normalized().board_size, Settings::MIN_BOARD_SIZE);
    EXPECT_EQ(s.normalized().num_bots, Settings::MAX_BOTS);
    EXPECT_EQ(Settings().normalized(), Settings());
}

TEST_F(MatchTest, StartingPlayer) {
    EXPECT_EQ(settings(2, 1).starting_player(), 0);
    EXPECT_EQ(settings(2, 1, false).starting_player(), 2);

    Match match(settings(1, 2, false));
    EXPECT_EQ(match.state().next_player(), 1);
    EXPECT_FALSE(match.next_player_is_human());
}

TEST_F(MatchTest, PlayerNames) {
    Match match(settings(1, 2));
    EXPECT_EQ(match.player_name(0), "Yellow");
    EXPECT_EQ(match.player_name(1), "Pink (bot)");
    EXPECT_EQ(match.player_name(2), "Green (bot)");
    EXPECT_TRUE(match.is_human(0));
    EXPECT_FALSE(match.is_human(2));
}

TEST_F(MatchTest, HumanMoveAndUndo) {
    Match match(settings(2, 0));
    EXPECT_FALSE(match.can_undo());

    ASSERT_TRUE(match.play_human(Coord{1, 1}));
    ASSERT_TRUE(match.play_human(Coord{3, 3}));
    EXPECT_EQ(match.state().next_player(), 0);
    EXPECT_TRUE(match.can_undo());

    // Only the last move comes back
    EXPECT_TRUE(match.undo());
    EXPECT_EQ(match.state().next_player(), 1);
    EXPECT_TRUE((match.state().board()[Coord{1, 1}].has_value()));
    EXPECT_FALSE((match.state().board()[Coord{3, 3}].has_value()));
    EXPECT_FALSE(match.undo());
}

TEST_F(MatchTest, IllegalHumanMoveIsRejected) {
    Match match(settings(2, 0));
    ASSERT_TRUE(match.play_human(Coord{1, 1}));

    EXPECT_FALSE(match.play_human(Coord{1, 1}));
    EXPECT_FALSE(match.play_human(Coord{7, 0}));
    EXPECT_EQ(match.state().next_player(), 1);
    EXPECT_EQ(match.state().board().stone_count(), 1);
}

TEST_F(MatchTest, HumanCannotMoveForBot) {
    Match match(settings(1, 1));
    ASSERT_TRUE(match.play_human(Coord{2, 2}));
    EXPECT_FALSE(match.play_human(Coord{0, 0}));
}

TEST_F(MatchTest, NewGameKeepsPlayedGameForUndo) {
    Match match(settings(2, 0));
    match.new_game();
    EXPECT_FALSE(match.can_undo());

    ASSERT_TRUE(match.play_human(Coord{0, 0}));
    match.new_game(settings(3, 0));
    EXPECT_EQ(match.state().num_players(), 3);
    EXPECT_TRUE(match.state().board().is_empty());

    ASSERT_TRUE(match.undo());
    EXPECT_EQ(match.state().num_players(), 2);
    EXPECT_EQ(match.settings().num_humans, 2);
    EXPECT_EQ(match.state().board().stone_count(), 1);
}

TEST_F(MatchTest, BotPlaysLegalMove) {
    Match match(settings(1, 1, false));
    mcts::Rng rng(17);

    core::GameState before = match.state();
    auto action = match.play_bot(rng);

    ASSERT_TRUE(action.has_value());
    ASSERT_TRUE(action->is_move());
    EXPECT_TRUE(before.is_valid_move(action->coord));
    EXPECT_EQ(match.state().board()[action->coord], core::Cell(1));
    EXPECT_TRUE(match.next_player_is_human());
    EXPECT_THROW(match.play_bot(rng), std::logic_error);
}

TEST_F(MatchTest, BotsFinishTheGame) {
    Match match(settings(0, 2));
    mcts::Rng rng(3);

    int turns = 0;
    while (!match.is_game_over()) {
        ASSERT_TRUE(match.play_bot(rng).has_value());
        ASSERT_LT(++turns, 200);
    }
    EXPECT_FALSE(match.play_bot(rng).has_value());
}
