#pragma once

#include "clock.hpp"
#include "layout.hpp"
#include "options.hpp"
#include "rate_estimator.hpp"
#include "../io/output_writer.hpp"
#include "../io/terminal.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace termbar {
namespace core {

struct BarSnapshot {
    // Fraction of max reached, 0.0 - 1.0.
    double percent_complete = 0.0;
    double bytes_processed = 0.0;
    double seconds_elapsed = 0.0;
    double seconds_remaining = 0.0;
    double throughput_kbps = 0.0;
};

// Thread-safe single-line progress bar. Every public member takes the same
// lock for its whole duration, including the sink write and the completion
// callback; a slow sink therefore serializes concurrent updates.
//
// Pass constants::bar::UNKNOWN_LENGTH as max for a spinner that wraps its
// counter instead of filling.
class ProgressBar {
public:
    ProgressBar(int64_t max,
                BarOptions options = BarOptions{},
                std::shared_ptr<io::OutputSink> sink = nullptr,
                std::shared_ptr<io::TerminalSizeProvider> terminal = nullptr,
                std::shared_ptr<Clock> clock = nullptr);
    
    ProgressBar(const ProgressBar&) = delete;
    ProgressBar& operator=(const ProgressBar&) = delete;
    
    // stderr, width 10, 65ms throttle, count and it/s, full width.
    static std::unique_ptr<ProgressBar> createDefault(int64_t max, const std::string& description = "");
    // Like createDefault, with byte count and kB/s instead of it/s.
    static std::unique_ptr<ProgressBar> createDefaultBytes(int64_t max_bytes, const std::string& description = "");
    
    // Throws BarError: INVALID_CONFIGURATION when max is 0, COUNTER_OVERFLOW
    // when the result would pass max, COUNTER_UNDERFLOW when it would drop
    // below 0, or SINK_WRITE_FAILED from the render. Range errors leave the
    // state untouched.
    void add(int64_t delta);
    void set(int64_t value);
    void finish();
    
    void reset();
    void clear();
    void renderBlank();
    
    void describe(const std::string& description);
    
    // Keeps the old max and throws INVALID_CONFIGURATION for new_max <= 0, or
    // COUNTER_OVERFLOW when a determinate bar has already counted past it.
    void changeMax(int64_t new_max);
    
    int64_t getMax() const;
    int64_t current() const;
    bool isFinished() const;
    bool isIndeterminate() const { return ignore_length_; }
    
    // Byte sink interface: advances by size and returns size.
    size_t write(const char* data, size_t size);
    
    BarSnapshot snapshot() const;

private:
    struct State {
        explicit State(Clock::TimePoint now);
        
        int64_t current_count = 0;
        double current_bytes = 0.0;
        int current_percent = 0;
        int last_percent = 0;
        int fill_width = 0;
        
        Clock::TimePoint start_time;
        Clock::TimePoint last_shown;
        RateEstimator rate;
        
        int max_line_width = 0;
        bool finished = false;
    };
    
    mutable std::mutex mutex_;
    BarOptions options_;
    int64_t max_;
    bool ignore_length_;
    
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<io::TerminalSizeProvider> terminal_;
    io::OutputWriter writer_;
    State state_;
    
    void addLocked(int64_t delta);
    void updateDerivedLocked();
    void renderLocked(Clock::TimePoint now, bool bypass_throttle);
    RenderedLine layoutLocked(Clock::TimePoint now) const;
    void requireMaxLocked() const;
    void requireInRangeLocked(int64_t value) const;
};

}}
