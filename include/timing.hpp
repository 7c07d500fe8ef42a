#pragma once

#include <chrono>
#include <string>
#include <map>
#include <iostream>
#include <iomanip>

namespace lbflow {

/// Wall-clock stopwatch started at construction
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& name);

    const std::string& name() const { return name_; }

    /// Get elapsed time in seconds
    double elapsed() const;

    /// Stop timer and return elapsed time
    double stop();

private:
    std::string name_;
    std::chrono::steady_clock::time_point start_;
    bool stopped_ = false;
    double elapsed_time_ = 0.0;
};

/// Global timing statistics collector
/// Categories used by the solver: lbm_macroscopic, lbm_collision,
/// lbm_streaming, lbm_boundary, lbm_step (whole step), io_* (output).
class TimingStats {
public:
    static TimingStats& instance();

    /// Record a timing measurement
    void record(const std::string& name, double seconds);

    /// Get total time for a category
    double total(const std::string& name) const;

    /// Get number of calls for a category
    int count(const std::string& name) const;

    /// Get average time per call
    double average(const std::string& name) const;

    /// Reset all statistics
    void reset();

    /// Print summary to stdout
    void print_summary(std::ostream& os = std::cout) const;

    /// Print lattice throughput (million lattice updates per second)
    /// based on the lbm_step category
    void print_throughput(long long cell_count, std::ostream& os = std::cout) const;

private:
    TimingStats() = default;

    struct Stats {
        double total_time = 0.0;
        int num_calls = 0;
    };
    std::map<std::string, Stats> stats_;
};

/// RAII timer that automatically records to TimingStats
class AutoTimer {
public:
    explicit AutoTimer(const std::string& name);
    ~AutoTimer();

private:
    std::string name_;
    std::chrono::steady_clock::time_point start_;
};

#define LBFLOW_TIMER_CONCAT_(a, b) a##b
#define LBFLOW_TIMER_CONCAT(a, b) LBFLOW_TIMER_CONCAT_(a, b)

/// Macro for easy timing
#define TIMED_SCOPE(name) lbflow::AutoTimer LBFLOW_TIMER_CONCAT(_timer_, __LINE__)(name)

} // namespace lbflow
