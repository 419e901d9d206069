#include "termbar/core/progress_bar.hpp"
#include "termbar/core/error_codes.hpp"
#include "termbar/common/constants.hpp"
#include "termbar/common/logger.hpp"
#include <algorithm>
#include <unistd.h>

namespace termbar {
namespace core {

ProgressBar::State::State(Clock::TimePoint now)
    : start_time(now),
      last_shown(now),
      rate(now) {}

ProgressBar::ProgressBar(int64_t max,
                         BarOptions options,
                         std::shared_ptr<io::OutputSink> sink,
                         std::shared_ptr<io::TerminalSizeProvider> terminal,
                         std::shared_ptr<Clock> clock)
    : options_(std::move(options)),
      max_(max),
      ignore_length_(false),
      clock_(clock ? std::move(clock) : steadyClock()),
      terminal_(terminal ? std::move(terminal) : io::stdoutTerminal()),
      writer_(sink ? std::move(sink) : io::stdoutSink()),
      state_(clock_->now()) {
    validateOptions(options_);
    
    if (max_ == constants::bar::UNKNOWN_LENGTH) {
        ignore_length_ = true;
        max_ = options_.width;
        options_.predict_time = false;
    }
    
    common::Logger::instance().debug("[Bar] Created | max={} | width={} | indeterminate={}",
                                     max_, options_.width, ignore_length_);
    
    if (options_.render_blank_state) {
        renderBlank();
    }
}

std::unique_ptr<ProgressBar> ProgressBar::createDefault(int64_t max, const std::string& description) {
    auto sink = io::stderrSink();
    
    BarOptions options = presetOptions(description);
    options.show_iterations_per_second = true;
    options.on_completion = [sink]() { sink->write("\n"); };
    
    auto bar = std::make_unique<ProgressBar>(max, std::move(options), sink,
                                             std::make_shared<io::IoctlTerminalSize>(STDERR_FILENO));
    bar->renderBlank();
    return bar;
}

std::unique_ptr<ProgressBar> ProgressBar::createDefaultBytes(int64_t max_bytes, const std::string& description) {
    auto sink = io::stderrSink();
    
    BarOptions options = presetOptions(description);
    options.show_bytes = true;
    options.on_completion = [sink]() { sink->write("\n"); };
    
    auto bar = std::make_unique<ProgressBar>(max_bytes, std::move(options), sink,
                                             std::make_shared<io::IoctlTerminalSize>(STDERR_FILENO));
    bar->renderBlank();
    return bar;
}

void ProgressBar::add(int64_t delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    addLocked(delta);
}

void ProgressBar::set(int64_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireMaxLocked();
    
    if (ignore_length_) {
        value %= max_;
        if (value < 0) {
            value += max_;
        }
    } else {
        requireInRangeLocked(value);
    }
    // both operands now lie in [0, max], so the difference cannot overflow
    addLocked(value - state_.current_count);
}

void ProgressBar::finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    requireMaxLocked();
    
    auto now = clock_->now();
    state_.current_count = max_;
    state_.rate.record(0, now);
    updateDerivedLocked();
    state_.last_percent = state_.current_percent;
    
    renderLocked(now, true);
}

void ProgressBar::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = State(clock_->now());
}

void ProgressBar::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    writer_.clear(state_.max_line_width);
}

void ProgressBar::renderBlank() {
    std::lock_guard<std::mutex> lock(mutex_);
    requireMaxLocked();
    renderLocked(clock_->now(), true);
}

void ProgressBar::describe(const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    options_.description = description;
}

void ProgressBar::changeMax(int64_t new_max) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (new_max <= 0) {
        throw BarError(BarErrorCode::INVALID_CONFIGURATION,
                       "max must be greater than 0, got " + std::to_string(new_max));
    }
    if (!ignore_length_ && state_.current_count > new_max) {
        throw BarError(BarErrorCode::COUNTER_OVERFLOW,
                       std::to_string(state_.current_count) + " > new max " + std::to_string(new_max));
    }
    max_ = new_max;
    addLocked(0);
}

int64_t ProgressBar::getMax() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_;
}

int64_t ProgressBar::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.current_count;
}

bool ProgressBar::isFinished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.finished;
}

size_t ProgressBar::write(const char*, size_t size) {
    add(static_cast<int64_t>(size));
    return size;
}

BarSnapshot ProgressBar::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    BarSnapshot snapshot;
    double count = static_cast<double>(state_.current_count);
    double max = static_cast<double>(max_);
    
    if (max_ != 0) {
        snapshot.percent_complete = count / max;
    }
    snapshot.bytes_processed = state_.current_bytes;
    snapshot.seconds_elapsed = secondsBetween(state_.start_time, clock_->now());
    
    if (state_.current_count > 0) {
        snapshot.seconds_remaining = snapshot.seconds_elapsed / count * (max - count);
    }
    if (snapshot.seconds_elapsed > 0.0) {
        snapshot.throughput_kbps = state_.current_bytes / 1024.0 / snapshot.seconds_elapsed;
    }
    return snapshot;
}

void ProgressBar::requireMaxLocked() const {
    if (max_ == 0) {
        throw BarError(BarErrorCode::INVALID_CONFIGURATION, "max must be greater than 0");
    }
}

void ProgressBar::requireInRangeLocked(int64_t value) const {
    if (value < 0) {
        throw BarError(BarErrorCode::COUNTER_UNDERFLOW, std::to_string(value) + " < 0");
    }
    if (value > max_) {
        throw BarError(BarErrorCode::COUNTER_OVERFLOW,
                       std::to_string(value) + " > " + std::to_string(max_));
    }
}

void ProgressBar::addLocked(int64_t delta) {
    requireMaxLocked();
    
    int64_t next;
    if (ignore_length_) {
        next = (state_.current_count + delta % max_) % max_;
        if (next < 0) {
            next += max_;
        }
    } else {
        // checked before any mutation: a rejected call changes nothing
        if (delta > 0 && state_.current_count > max_ - delta) {
            common::Logger::instance().debug("[Bar] Overflow rejected | current={} | delta={} | max={}",
                                             state_.current_count, delta, max_);
            throw BarError(BarErrorCode::COUNTER_OVERFLOW,
                           std::to_string(state_.current_count) + " + " + std::to_string(delta) +
                           " > " + std::to_string(max_));
        }
        // current_count >= 0 here, so the sum cannot wrap
        if (delta < 0 && state_.current_count + delta < 0) {
            common::Logger::instance().debug("[Bar] Underflow rejected | current={} | delta={}",
                                             state_.current_count, delta);
            throw BarError(BarErrorCode::COUNTER_UNDERFLOW,
                           std::to_string(state_.current_count) + " + (" + std::to_string(delta) + ") < 0");
        }
        next = state_.current_count + delta;
    }
    
    auto now = clock_->now();
    state_.current_count = next;
    state_.current_bytes += static_cast<double>(delta);
    state_.rate.record(delta, now);
    updateDerivedLocked();
    
    bool percent_changed = state_.current_percent != state_.last_percent && state_.current_percent > 0;
    state_.last_percent = state_.current_percent;
    
    // live rate and count annotations change on every call
    if (percent_changed || options_.show_iterations_per_second || options_.show_iterations_count) {
        renderLocked(now, false);
    }
}

void ProgressBar::updateDerivedLocked() {
    double fraction = static_cast<double>(state_.current_count) / static_cast<double>(max_);
    state_.fill_width = static_cast<int>(fraction * options_.width);
    state_.current_percent = static_cast<int>(fraction * 100);
}

void ProgressBar::renderLocked(Clock::TimePoint now, bool bypass_throttle) {
    if (state_.finished) {
        return;
    }
    
    bool complete = state_.current_count >= max_;
    if (!bypass_throttle && !complete && now - state_.last_shown < options_.throttle) {
        return;
    }
    
    if (complete) {
        state_.finished = true;
        
        if (options_.clear_on_finish) {
            writer_.clear(state_.max_line_width);
        } else {
            RenderedLine line = layoutLocked(now);
            writer_.present(line.text, state_.max_line_width);
            state_.max_line_width = std::max(state_.max_line_width, line.width);
        }
        state_.last_shown = now;
        
        common::Logger::instance().debug("[Bar] Completed | max={} | elapsed={:.3f}s",
                                         max_, secondsBetween(state_.start_time, now));
        
        if (options_.on_completion) {
            options_.on_completion();
        }
        return;
    }
    
    RenderedLine line = layoutLocked(now);
    writer_.present(line.text, state_.max_line_width);
    state_.max_line_width = std::max(state_.max_line_width, line.width);
    state_.last_shown = now;
}

RenderedLine ProgressBar::layoutLocked(Clock::TimePoint now) const {
    LayoutState layout_state;
    layout_state.current_count = state_.current_count;
    layout_state.current_bytes = state_.current_bytes;
    layout_state.current_percent = state_.current_percent;
    layout_state.fill_width = state_.fill_width;
    layout_state.seconds_since_start = secondsBetween(state_.start_time, now);
    layout_state.average_rate = state_.rate.rate(state_.current_bytes,
                                                 layout_state.seconds_since_start,
                                                 state_.finished);
    
    if (options_.full_width && !ignore_length_) {
        layout_state.terminal_columns = terminal_->columns();
    }
    
    return layoutLine(LayoutConfig{options_, max_, ignore_length_}, layout_state);
}

}}
