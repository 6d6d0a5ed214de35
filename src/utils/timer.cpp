#include "utils/timer.hpp"

namespace utils {

Timer::Timer()
    : start_time_(std::chrono::steady_clock::now()),
      end_time_(start_time_),
      running_(true) {
}

void Timer::start() {
    start_time_ = std::chrono::steady_clock::now();
    running_ = true;
}

void Timer::stop() {
    if (running_) {
        end_time_ = std::chrono::steady_clock::now();
        running_ = false;
    }
}

std::chrono::steady_clock::duration Timer::elapsed() const {
    auto end = running_ ? std::chrono::steady_clock::now() : end_time_;
    return end - start_time_;
}

double Timer::elapsed_ms() const {
    return std::chrono::duration<double, std::milli>(elapsed()).count();
}

double Timer::elapsed_seconds() const {
    return std::chrono::duration<double>(elapsed()).count();
}

} // namespace utils
