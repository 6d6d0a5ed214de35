#pragma once

#include <chrono>

namespace utils {

// Wall-clock stopwatch. Reads the running time while started,
// the frozen interval once stopped.
class Timer {
public:
    Timer();
    ~Timer() = default;

    void start();
    void stop();
    double elapsed_ms() const;
    double elapsed_seconds() const;
    bool is_running() const noexcept { return running_; }

    // True once the running time reaches `budget`
    template <typename Rep, typename Period>
    bool has_elapsed(std::chrono::duration<Rep, Period> budget) const {
        return elapsed() >= std::chrono::duration_cast<std::chrono::steady_clock::duration>(budget);
    }

private:
    std::chrono::steady_clock::duration elapsed() const;

    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point end_time_;
    bool running_;
};

} // namespace utils
