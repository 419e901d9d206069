#pragma once

#include "../common/constants.hpp"
#include <chrono>
#include <functional>
#include <string>

namespace termbar {
namespace core {

// Glyphs the bar is drawn with.
struct Theme {
    std::string saucer;
    std::string saucer_head;
    std::string saucer_padding;
    std::string bar_start;
    std::string bar_end;
};

Theme defaultTheme();

struct BarOptions {
    int width = constants::config_defaults::BAR_WIDTH;
    Theme theme = defaultTheme();
    std::string description;
    
    bool render_blank_state = false;
    bool color_codes = false;
    bool show_bytes = false;
    bool show_iterations_per_second = false;
    bool show_iterations_count = false;
    bool predict_time = constants::config_defaults::BAR_PREDICT_TIME;
    bool clear_on_finish = false;
    bool full_width = false;
    
    std::chrono::nanoseconds throttle{0};
    int spinner_type = constants::config_defaults::BAR_SPINNER_TYPE;
    
    // Runs once, on the thread that completes the bar, while the bar's lock
    // is held. Calling back into the same bar from here deadlocks.
    std::function<void()> on_completion;
};

// Throws BarError(INVALID_CONFIGURATION).
void validateOptions(const BarOptions& options);

// Settings shared by ProgressBar::createDefault and createDefaultBytes.
BarOptions presetOptions(const std::string& description);

}}
