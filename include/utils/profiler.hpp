#pragma once

// Section timing for the search hot paths. Compiled in only when
// HOBOGO_ENABLE_PROFILING is defined (cmake -DHOBOGO_ENABLE_PROFILING=ON),
// otherwise every macro below expands to nothing.

#include <ostream>

#ifdef HOBOGO_ENABLE_PROFILING

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace utils {

class Profiler {
public:
    struct SectionStats {
        uint64_t call_count = 0;
        double total_time_ns = 0.0;
    };

    static Profiler& instance() {
        static Profiler profiler;
        return profiler;
    }

    void record(const char* section, double duration_ns) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& stats = sections_[section];
        stats.call_count++;
        stats.total_time_ns += duration_ns;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        sections_.clear();
    }

    void print_report(std::ostream& out) const {
        std::lock_guard<std::mutex> lock(mutex_);

        out << "\n=== Profiler Report ===\n";
        if (sections_.empty()) {
            out << "No profiling data collected.\n";
            return;
        }

        std::vector<std::pair<std::string, SectionStats>> sorted(sections_.begin(), sections_.end());
        std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
            return a.second.total_time_ns > b.second.total_time_ns;
        });

        double grand_total = 0.0;
        for (const auto& entry : sorted) {
            grand_total += entry.second.total_time_ns;
        }

        out << std::left << std::setw(28) << "Section"
            << std::right << std::setw(14) << "Total Time"
            << std::setw(10) << "   %"
            << std::setw(14) << "Calls"
            << std::setw(14) << "Avg/Call" << "\n";
        out << std::string(80, '-') << "\n";

        for (const auto& [name, stats] : sorted) {
            double avg_ns = stats.call_count > 0 ? stats.total_time_ns / stats.call_count : 0.0;
            double pct = grand_total > 0 ? stats.total_time_ns / grand_total * 100.0 : 0.0;
            out << std::left << std::setw(28) << name
                << std::right << std::setw(10) << std::fixed << std::setprecision(2)
                << stats.total_time_ns / 1e6 << " ms"
                << std::setw(8) << std::setprecision(1) << pct << " %"
                << std::setw(14) << stats.call_count
                << std::setw(10) << std::setprecision(1) << avg_ns << " ns\n";
        }
        out << std::string(80, '-') << "\n";
    }

private:
    Profiler() = default;
    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, SectionStats> sections_;
};

// Records the lifetime of the enclosing scope under `section`
class ScopedTimer {
public:
    explicit ScopedTimer(const char* section)
        : section_(section), start_(std::chrono::steady_clock::now()) {
    }

    ~ScopedTimer() {
        auto end = std::chrono::steady_clock::now();
        Profiler::instance().record(section_, std::chrono::duration<double, std::nano>(end - start_).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    const char* section_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace utils

#define HOBOGO_PROFILE_CONCAT_INNER(a, b) a##b
#define HOBOGO_PROFILE_CONCAT(a, b) HOBOGO_PROFILE_CONCAT_INNER(a, b)
#define HOBOGO_PROFILE_SCOPE(name) \
    ::utils::ScopedTimer HOBOGO_PROFILE_CONCAT(hobogo_profile_timer_, __LINE__)(name)

#else // HOBOGO_ENABLE_PROFILING

namespace utils {

class Profiler {
public:
    static Profiler& instance() {
        static Profiler profiler;
        return profiler;
    }
    void print_report(std::ostream&) const {}
    void reset() {}
};

} // namespace utils

#define HOBOGO_PROFILE_SCOPE(name) ((void)0)

#endif // HOBOGO_ENABLE_PROFILING
