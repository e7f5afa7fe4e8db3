/**
 * @file profiler.hpp
 * @brief Wall-clock timing of render phases
 *
 * Categories are recorded from worker threads, so totals are atomics and
 * the category table is guarded by a mutex.
 */

#pragma once

#include <chrono>
#include <string>
#include <map>
#include <atomic>
#include <mutex>
#include <iostream>
#include <iomanip>
#include <ostream>
#include <cstdint>

namespace slabray {

/**
 * @brief Per-category timing accumulator
 *
 * Usage:
 *   { ProfileScope scope("Scene Load"); ... }
 *   Profiler::instance().report();
 */
class Profiler {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::duration<double, std::milli>;

    struct Stats {
        std::atomic<std::uint64_t> total_ns{0};
        std::atomic<std::uint64_t> call_count{0};
    };

    static Profiler& instance() {
        static Profiler inst;
        return inst;
    }

    /**
     * @brief Drop all categories; the enabled flag is kept
     */
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.clear();
    }

    void set_enabled(bool enabled) { enabled_ = enabled; }
    bool is_enabled() const { return enabled_; }

    void record(const std::string& category, Duration duration) {
        if (!enabled_) return;

        Stats& s = get_stats(category);
        s.total_ns.fetch_add(static_cast<std::uint64_t>(duration.count() * 1e6),
                             std::memory_order_relaxed);
        s.call_count.fetch_add(1, std::memory_order_relaxed);
    }

    /**
     * @brief Total milliseconds recorded for a category (0 if unknown)
     */
    double total_ms(const std::string& category) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = stats_.find(category);
        return it == stats_.end() ? 0.0 : it->second.total_ns.load() / 1e6;
    }

    /**
     * @brief Print one row per category with its share of "Total Render"
     */
    void report(std::ostream& out = std::cout) const {
        std::lock_guard<std::mutex> lock(mutex_);

        if (stats_.empty()) {
            out << "Profiler: No data collected.\n";
            return;
        }

        auto total_it = stats_.find("Total Render");
        double frame_ns = total_it == stats_.end() ? 0.0
                                                   : static_cast<double>(total_it->second.total_ns.load());

        out << "\n===== RENDER PROFILE =====\n";
        out << std::left << std::setw(18) << "Phase"
            << std::right << std::setw(12) << "Total (ms)"
            << std::setw(8) << "Calls"
            << std::setw(9) << "Frame %" << "\n";
        out << std::string(47, '-') << "\n";

        for (const auto& [name, stats] : stats_) {
            double ns = static_cast<double>(stats.total_ns.load());
            out << std::left << std::setw(18) << name
                << std::right << std::fixed << std::setprecision(1)
                << std::setw(12) << ns / 1e6
                << std::setw(8) << stats.call_count.load();
            if (frame_ns > 0.0) {
                out << std::setw(8) << 100.0 * ns / frame_ns << "%";
            } else {
                out << std::setw(9) << "-";
            }
            out << "\n";
        }
        out << "==========================\n\n";
    }

private:
    Profiler() = default;
    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    Stats& get_stats(const std::string& category) {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_[category];
    }

    mutable std::mutex mutex_;
    std::map<std::string, Stats> stats_;
    std::atomic<bool> enabled_{false};
};

/**
 * @brief RAII scope timer
 */
class ProfileScope {
public:
    explicit ProfileScope(const std::string& category)
        : category_(category), start_(Profiler::Clock::now()) {}

    ~ProfileScope() {
        Profiler::instance().record(category_, Profiler::Clock::now() - start_);
    }

private:
    std::string category_;
    Profiler::Clock::time_point start_;
};

/**
 * @brief One-shot stopwatch
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;

    Timer() : start_(Clock::now()) {}

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

    double elapsed_sec() const {
        return elapsed_ms() / 1000.0;
    }

private:
    Clock::time_point start_;
};

} // namespace slabray
