#pragma once

#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <mutex>
#include <vector>

namespace orotune {

/// Summary of recorded compute times
struct TimingStats {
    double min_ms = 0.0;
    double max_ms = 0.0;
    double mean_ms = 0.0;
    double std_ms = 0.0;
    double p50_ms = 0.0;
    double p95_ms = 0.0;
    size_t sample_count = 0;
};

/**
 * @brief Compute-time statistics of per-unit analysis work
 *
 * Worker threads record into one tracker; updates are serialized by a mutex.
 * Percentiles are computed over the most recent `window_size` samples.
 */
class LatencyTracker {
public:
    explicit LatencyTracker(size_t window_size = 1000)
        : window_size_(window_size) {
        samples_.reserve(window_size);
    }

    void record(Duration latency) {
        const double ms = to_milliseconds(latency);
        std::lock_guard<std::mutex> lock(mutex_);

        if (samples_.size() >= window_size_) {
            samples_.erase(samples_.begin());
        }
        samples_.push_back(ms);

        total_samples_++;
        sum_ += ms;
        sum_sq_ += ms * ms;
        min_ = std::min(min_, ms);
        max_ = std::max(max_, ms);
    }

    void record_since(Timestamp start) {
        record(Clock::now() - start);
    }

    TimingStats get_stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (samples_.empty()) {
            return {};
        }

        TimingStats stats;
        stats.sample_count = total_samples_;
        stats.min_ms = min_;
        stats.max_ms = max_;
        stats.mean_ms = sum_ / static_cast<double>(total_samples_);

        const double variance = sum_sq_ / static_cast<double>(total_samples_) -
                                stats.mean_ms * stats.mean_ms;
        stats.std_ms = std::sqrt(std::max(0.0, variance));

        std::vector<double> sorted = samples_;
        std::sort(sorted.begin(), sorted.end());
        auto percentile = [&](double p) {
            return sorted[static_cast<size_t>(p * static_cast<double>(sorted.size() - 1))];
        };
        stats.p50_ms = percentile(0.50);
        stats.p95_ms = percentile(0.95);
        return stats;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        samples_.clear();
        total_samples_ = 0;
        sum_ = 0.0;
        sum_sq_ = 0.0;
        min_ = std::numeric_limits<double>::max();
        max_ = 0.0;
    }

    size_t sample_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_samples_;
    }

private:
    size_t window_size_;
    std::vector<double> samples_;
    mutable std::mutex mutex_;

    size_t total_samples_ = 0;
    double sum_ = 0.0;
    double sum_sq_ = 0.0;
    double min_ = std::numeric_limits<double>::max();
    double max_ = 0.0;
};

/**
 * @brief RAII scope timer recording into a LatencyTracker
 */
class ScopeTimer {
public:
    explicit ScopeTimer(LatencyTracker& tracker)
        : tracker_(tracker), start_(Clock::now()) {}

    ~ScopeTimer() {
        tracker_.record(Clock::now() - start_);
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;

    Duration elapsed() const {
        return Clock::now() - start_;
    }

private:
    LatencyTracker& tracker_;
    Timestamp start_;
};

#define OROTUNE_TIMED_SCOPE(tracker) \
    ::orotune::ScopeTimer _scope_timer_##__LINE__(tracker)

}  // namespace orotune
