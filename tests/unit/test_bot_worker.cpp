#include <gtest/gtest.h>
#include "game/bot_worker.hpp"
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace game;
using core::Action;
using core::Coord;
using core::GameState;

class BotWorkerTest : public ::testing::Test {
protected:
    BotWorker worker;

    void wait_until_ready() {
        while (worker.status() == BotWorker::Status::Thinking) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }
};

TEST_F(BotWorkerTest, StatusTransitions) {
    EXPECT_EQ(worker.status(), BotWorker::Status::Idle);

    GameState state(5, 2, 0);
    worker.start(state, std::chrono::milliseconds(30), 1);
    EXPECT_NE(worker.status(), BotWorker::Status::Idle);
    EXPECT_THROW(worker.start(state, std::chrono::milliseconds(30), 2), std::logic_error);

    wait_until_ready();
    EXPECT_EQ(worker.status(), BotWorker::Status::Ready);

    auto action = worker.take();
    EXPECT_EQ(worker.status(), BotWorker::Status::Idle);
    ASSERT_TRUE(action.has_value());
    EXPECT_TRUE(state.is_valid_move(action->coord));
    EXPECT_GE(worker.last_iterations(), 1);
}

TEST_F(BotWorkerTest, TakeWithoutStartThrows) {
    EXPECT_THROW(worker.take(), std::logic_error);

    worker.start(GameState(5, 2, 0), std::chrono::milliseconds(5), 4);
    ASSERT_TRUE(worker.take().has_value());

    // The decision can only be taken once
    EXPECT_THROW(worker.take(), std::logic_error);
    EXPECT_EQ(worker.status(), BotWorker::Status::Idle);
}

TEST_F(BotWorkerTest, CancelStopsEarly) {
    GameState state(9, 2, 0);
    worker.start(state, std::chrono::seconds(30), 5);
    worker.cancel();

    auto action = worker.take();
    ASSERT_TRUE(action.has_value());
    EXPECT_TRUE(state.is_valid_move(action->coord));
}

TEST_F(BotWorkerTest, FinishedGameYieldsNoAction) {
    core::Board board(5, 5);
    for (int y = 0; y < 5; ++y) {
        board.place(Coord{1, y}, 0);
        board.place(Coord{2, y}, 1);
    }

    worker.start(GameState(board, 1, 2), std::chrono::milliseconds(5), 3);
    EXPECT_FALSE(worker.take().has_value());
}

TEST_F(BotWorkerTest, CanBeReused) {
    GameState state(5, 3, 0);
    for (int turn = 0; turn < 3; ++turn) {
        worker.start(state, std::chrono::milliseconds(10), static_cast<uint32_t>(turn));
        auto action = worker.take();
        ASSERT_TRUE(action.has_value());
        state.play(*action);
    }
    EXPECT_EQ(state.board().stone_count(), 3);
}
