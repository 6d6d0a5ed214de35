#include <gtest/gtest.h>
#include "core/game_state.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>

using namespace core;

class GameStateTest : public ::testing::Test {
protected:
    GameState game{5, 2, 0};

    static bool contains(const std::vector<Action>& actions, const Action& action) {
        return std::find(actions.begin(), actions.end(), action) != actions.end();
    }
};

TEST_F(GameStateTest, FreshGame) {
    EXPECT_EQ(game.next_player(), 0);
    EXPECT_EQ(game.num_players(), 2);
    EXPECT_TRUE(game.board().is_empty());
    EXPECT_FALSE(game.is_terminal());
    EXPECT_EQ(game.legal_actions().size(), 25u);
}

TEST_F(GameStateTest, MovePlacesStoneAndPassesTurn) {
    game.play(Action::move(Coord{2, 3}));

    EXPECT_EQ((game.board()[Coord{2, 3}]), Cell(0));
    EXPECT_EQ(game.next_player(), 1);
    EXPECT_EQ(game.legal_actions().size(), 24u);
    EXPECT_FALSE(contains(game.legal_actions(), Action::move(Coord{2, 3})));
}

TEST_F(GameStateTest, PassOnlyAdvancesTurn) {
    GameState before = game;
    game.play(Action::pass());

    EXPECT_EQ(game.board(), before.board());
    EXPECT_EQ(game.next_player(), 1);
}

TEST_F(GameStateTest, TurnsCycleThroughAllPlayers) {
    GameState three(5, 3, 1);
    three.play(Action::move(Coord{0, 0}));
    EXPECT_EQ(three.next_player(), 2);
    three.play(Action::pass());
    EXPECT_EQ(three.next_player(), 0);
    three.play(Action::pass());
    EXPECT_EQ(three.next_player(), 1);
}

TEST_F(GameStateTest, IllegalMoveThrows) {
    game.play(Action::move(Coord{1, 1}));

    EXPECT_THROW(game.play(Action::move(Coord{1, 1})), InvalidMove);
    EXPECT_THROW(game.play(Action::move(Coord{9, 9})), InvalidMove);
    EXPECT_EQ(game.next_player(), 1);
}

TEST_F(GameStateTest, ApplyLeavesOriginalUntouched) {
    GameState before = game;
    GameState after = game.apply(Action::move(Coord{4, 4}));
    GameState free_after = apply(game, Action::move(Coord{4, 4}));

    EXPECT_EQ(game, before);
    EXPECT_EQ(after, free_after);
    EXPECT_NE(after, before);
    EXPECT_EQ((after.board()[Coord{4, 4}]), Cell(0));
}

TEST_F(GameStateTest, FinishedGameOnlyPasses) {
    Board board(5, 5);
    for (int y = 0; y < 5; ++y) {
        board.place(Coord{1, y}, 0);
        board.place(Coord{2, y}, 1);
    }

    for (Player p = 0; p < 2; ++p) {
        GameState state(board, p, 2);
        EXPECT_TRUE(state.is_terminal());
        EXPECT_EQ(state.legal_actions(), std::vector<Action>{Action::pass()});
        EXPECT_EQ(state.points(), (std::vector<int>{10, 15}));
    }
}

TEST_F(GameStateTest, LegalActionsAreRowMajor) {
    game.play(Action::move(Coord{0, 0}));
    game.play(Action::move(Coord{4, 4}));

    std::vector<Action> actions = game.legal_actions();
    EXPECT_TRUE(std::is_sorted(actions.begin(), actions.end()));
    for (const Action& action : actions) {
        EXPECT_TRUE(action.is_move());
        EXPECT_TRUE(game.is_valid_move(action.coord));
    }
}

TEST_F(GameStateTest, StaleAnalysisIsRejected) {
    Territory analysis;
    analysis.analyze(game.board(), game.num_players());
    game.play(Action::move(Coord{0, 0}));

    EXPECT_THROW(game.play(Action::move(Coord{1, 0}), analysis), std::logic_error);

    analysis.analyze(game.board(), game.num_players());
    game.play(Action::move(Coord{1, 0}), analysis);
    EXPECT_EQ((game.board()[Coord{1, 0}]), Cell(1));
}

TEST_F(GameStateTest, AnalysisOfAnotherLayoutIsRejected) {
    // A1 is sealed for player 0 on the real board
    Board real(5, 1);
    real.place(Coord{1, 0}, 0);
    real.place(Coord{3, 0}, 1);
    GameState state(real, 1, 2);

    // Same size and stone count, but player 1 has no stone yet so A1 is open
    Board other(5, 1);
    other.place(Coord{2, 0}, 0);
    other.place(Coord{4, 0}, 0);
    Territory analysis;
    analysis.analyze(other, 2);
    ASSERT_TRUE(analysis.is_volatile(0));

    EXPECT_FALSE(analysis.matches(state.board()));
    EXPECT_THROW(state.play(Action::move(Coord{0, 0}), analysis), std::logic_error);
    EXPECT_FALSE((state.board()[Coord{0, 0}].has_value()));
    EXPECT_EQ(state.next_player(), 1);

    analysis.analyze(state.board(), 2);
    EXPECT_TRUE(analysis.matches(state.board()));
    EXPECT_THROW(state.play(Action::move(Coord{0, 0}), analysis), InvalidMove);
}

TEST_F(GameStateTest, RestoreValidatesSnapshot) {
    Board board(5, 5);
    board.place(Coord{0, 0}, 2);

    EXPECT_THROW(GameState(board, 0, 2), std::invalid_argument);
    EXPECT_THROW(GameState(Board(5, 5), 2, 2), std::invalid_argument);
    EXPECT_THROW(GameState(Board(5, 5), 0, 1), std::invalid_argument);
    EXPECT_THROW(GameState(5, MAX_PLAYERS + 1, 0), std::invalid_argument);
    EXPECT_NO_THROW(GameState(board, 2, 3));
}

TEST_F(GameStateTest, ActionOrderingAndNames) {
    EXPECT_LT(Action::pass(), Action::move(Coord{0, 0}));
    EXPECT_LT(Action::move(Coord{4, 0}), Action::move(Coord{0, 1}));
    EXPECT_EQ(Action::pass().to_string(), "pass");
    EXPECT_EQ(Action::move(Coord{2, 2}).to_string(), "C3");
}
