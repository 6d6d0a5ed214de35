#include <gtest/gtest.h>
#include "mcts/mcts_engine.hpp"
#include <algorithm>
#include <numeric>
#include <vector>

using namespace core;
using namespace mcts;

class CompleteGamesTest : public ::testing::Test {
protected:
    struct Record {
        GameState final_state;
        std::vector<Player> movers;
    };

    // Bots play every seat until the game is over
    static Record play_out(GameState state, int iterations, uint32_t seed) {
        Rng rng(seed);
        Record record{state, {}};

        int safety = 0;
        while (!state.is_terminal()) {
            std::vector<Action> legal = state.legal_actions();

            MCTSEngine engine(state);
            auto choice = engine.search(rng, iterations);
            EXPECT_TRUE(choice.has_value());
            Action action = choice.value_or(Action::pass());
            EXPECT_NE(std::find(legal.begin(), legal.end(), action), legal.end())
                << action.to_string() << " was not legal";

            record.movers.push_back(state.next_player());
            state.play(action);

            if (++safety > static_cast<int>(state.board().cell_count()) * 2) {
                ADD_FAILURE() << "game did not finish";
                break;
            }
        }
        record.final_state = state;
        return record;
    }
};

TEST_F(CompleteGamesTest, ThreeBotsFinishASmallBoard) {
    Record record = play_out(GameState(6, 3, 0), 150, 12345);
    const GameState& final_state = record.final_state;

    EXPECT_TRUE(final_state.is_terminal());
    EXPECT_EQ(final_state.legal_actions(), std::vector<Action>{Action::pass()});

    // Turns cycle 0, 1, 2, 0, ...
    for (std::size_t i = 0; i < record.movers.size(); ++i) {
        EXPECT_EQ(record.movers[i], static_cast<Player>(i % 3));
    }

    std::vector<int> points = final_state.points();
    ASSERT_EQ(points.size(), 3u);
    int total = std::accumulate(points.begin(), points.end(), 0);
    EXPECT_LE(total, 36);
    for (int p = 0; p < 3; ++p) {
        EXPECT_GT(points[p], 0) << "player " << p;
    }
}

TEST_F(CompleteGamesTest, TwoBotsOnRectangularBoard) {
    Record record = play_out(GameState(7, 4, 2, 1), 100, 99);

    EXPECT_TRUE(record.final_state.is_terminal());
    ASSERT_FALSE(record.movers.empty());
    EXPECT_EQ(record.movers.front(), 1);
    EXPECT_EQ(record.final_state.board().stone_count(), static_cast<int>(record.movers.size()));
}

TEST_F(CompleteGamesTest, EveryStoneBelongsToItsMover) {
    GameState state(5, 4, 0);
    Rng rng(31);

    while (!state.is_terminal()) {
        MCTSEngine engine(state);
        auto choice = engine.search(rng, 60);
        ASSERT_TRUE(choice.has_value());
        ASSERT_TRUE(choice->is_move());

        Player mover = state.next_player();
        Coord target = choice->coord;
        state.play(*choice);
        EXPECT_EQ(state.board()[target], Cell(mover));
        EXPECT_EQ(state.next_player(), static_cast<Player>((mover + 1) % 4));
    }
}
