#pragma once

#include "clock.hpp"
#include "../common/constants.hpp"
#include <cstdint>
#include <deque>

namespace termbar {
namespace core {

// Sliding window of per-interval throughput samples. A sample is taken on
// the first record() after more than RATE_SAMPLE_INTERVAL_MS have passed
// since the window opened; at most RATE_WINDOW_CAPACITY samples are kept.
class RateEstimator {
public:
    explicit RateEstimator(Clock::TimePoint start);
    
    void reset(Clock::TimePoint now);
    void record(int64_t delta, Clock::TimePoint now);
    
    // Mean of the window, or total_amount / elapsed_seconds when the window is
    // empty or use_overall is set. Zero when no time has elapsed.
    double rate(double total_amount, double elapsed_seconds, bool use_overall = false) const;
    
    bool hasSamples() const { return !samples_.empty(); }
    size_t sampleCount() const { return samples_.size(); }
    double windowAverage() const;
    
    Clock::TimePoint windowStart() const { return window_start_; }

private:
    Clock::TimePoint window_start_;
    int64_t count_since_window_start_;
    std::deque<double> samples_;
};

}}
