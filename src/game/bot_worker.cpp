#include "game/bot_worker.hpp"
#include "utils/timer.hpp"
#include <exception>
#include <stdexcept>
#include <utility>

namespace game {

BotWorker::~BotWorker() {
    cancel();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void BotWorker::start(core::GameState snapshot, std::chrono::duration<double> think_time,
                      uint32_t seed, const mcts::Config& config) {
    if (status() != Status::Idle) {
        throw std::logic_error("BotWorker: previous decision not taken yet");
    }
    if (thread_.joinable()) {
        thread_.join();
    }

    result_.reset();
    error_ = nullptr;
    stop_.store(false, std::memory_order_relaxed);
    status_.store(Status::Thinking, std::memory_order_release);
    thread_ = std::thread(&BotWorker::run, this, std::move(snapshot), think_time, seed, config);
}

void BotWorker::run(core::GameState snapshot, std::chrono::duration<double> think_time,
                    uint32_t seed, mcts::Config config) {
    try {
        mcts::Rng rng(seed);
        mcts::MCTSEngine engine(std::move(snapshot), config);

        utils::Timer timer;
        timer.start();
        do {
            engine.iterate(rng);
        } while (!timer.has_elapsed(think_time) && !stop_.load(std::memory_order_relaxed));

        result_ = engine.best_action(rng);
        last_iterations_ = engine.iterations();
    } catch (...) {
        // Handed to the thread that calls take()
        error_ = std::current_exception();
    }
    status_.store(Status::Ready, std::memory_order_release);
}

std::optional<core::Action> BotWorker::take() {
    if (status() == Status::Idle) {
        throw std::logic_error("BotWorker: no decision was started");
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    status_.store(Status::Idle, std::memory_order_release);

    if (error_) {
        std::exception_ptr error = error_;
        error_ = nullptr;
        std::rethrow_exception(error);
    }

    std::optional<core::Action> result = result_;
    result_.reset();
    return result;
}

} // namespace game
