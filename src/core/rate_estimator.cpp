#include "termbar/core/rate_estimator.hpp"
#include <numeric>

namespace termbar {
namespace core {

RateEstimator::RateEstimator(Clock::TimePoint start)
    : window_start_(start),
      count_since_window_start_(0) {}

void RateEstimator::reset(Clock::TimePoint now) {
    window_start_ = now;
    count_since_window_start_ = 0;
    samples_.clear();
}

void RateEstimator::record(int64_t delta, Clock::TimePoint now) {
    count_since_window_start_ += delta;
    
    double elapsed = secondsBetween(window_start_, now);
    if (elapsed * 1000.0 <= static_cast<double>(constants::bar::RATE_SAMPLE_INTERVAL_MS)) {
        return;
    }
    
    samples_.push_back(static_cast<double>(count_since_window_start_) / elapsed);
    if (samples_.size() > constants::bar::RATE_WINDOW_CAPACITY) {
        samples_.pop_front();
    }
    
    window_start_ = now;
    count_since_window_start_ = 0;
}

double RateEstimator::windowAverage() const {
    if (samples_.empty()) {
        return 0.0;
    }
    return std::accumulate(samples_.begin(), samples_.end(), 0.0) / samples_.size();
}

double RateEstimator::rate(double total_amount, double elapsed_seconds, bool use_overall) const {
    if (!samples_.empty() && !use_overall) {
        return windowAverage();
    }
    if (elapsed_seconds <= 0.0) {
        return 0.0;
    }
    return total_amount / elapsed_seconds;
}

}}
