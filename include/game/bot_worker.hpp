#pragma once

#include "core/action.hpp"
#include "core/game_state.hpp"
#include "mcts/mcts_engine.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <thread>

namespace game {

// Runs one bot decision on a background thread so the caller can keep
// servicing input. The worker owns its snapshot and tree outright and
// hands back a single action.
class BotWorker {
public:
    enum class Status {
        Idle,      // Nothing started, or result already taken
        Thinking,  // Search running
        Ready      // take() will return the decision
    };

    BotWorker() = default;
    ~BotWorker();

    BotWorker(const BotWorker&) = delete;
    BotWorker& operator=(const BotWorker&) = delete;

    // Throws std::logic_error if a decision is still outstanding
    void start(core::GameState snapshot, std::chrono::duration<double> think_time,
               uint32_t seed, const mcts::Config& config = mcts::Config());

    Status status() const noexcept { return status_.load(std::memory_order_acquire); }

    // Ask the search to finish after its current iteration
    void cancel() noexcept { stop_.store(true, std::memory_order_relaxed); }

    // Blocks until the search is done. nullopt means no legal move: pass.
    // Rethrows anything the search threw. Throws std::logic_error when
    // nothing was started.
    std::optional<core::Action> take();

    int last_iterations() const noexcept { return last_iterations_; }

private:
    void run(core::GameState snapshot, std::chrono::duration<double> think_time,
             uint32_t seed, mcts::Config config);

    std::thread thread_;
    std::atomic<Status> status_{Status::Idle};
    std::atomic<bool> stop_{false};
    std::optional<core::Action> result_;
    std::exception_ptr error_;
    int last_iterations_ = 0;
};

} // namespace game
