#pragma once

#include "options.hpp"
#include <cstdint>
#include <string>

namespace termbar {
namespace core {

struct LayoutConfig {
    const BarOptions& options;
    int64_t max;
    bool ignore_length;
};

struct LayoutState {
    int64_t current_count = 0;
    double current_bytes = 0.0;
    int current_percent = 0;
    int fill_width = 0;
    double seconds_since_start = 0.0;
    double average_rate = 0.0;
    // Consulted only in full-width determinate mode.
    int terminal_columns = 0;
};

struct RenderedLine {
    std::string text;
    // Code points a terminal will occupy: excludes "\r" and, with color
    // codes enabled, ANSI escapes.
    int width = 0;
};

RenderedLine layoutLine(const LayoutConfig& config, const LayoutState& state);

// "(12/40, 3.000 kB/s, 5 it/s)" or "" when no annotation flag is set.
std::string buildAnnotations(const LayoutConfig& config, const LayoutState& state);

// Bar width that pins a full-width line to the terminal's column count.
int fullWidthBarWidth(const LayoutConfig& config,
                      int terminal_columns,
                      const std::string& annotations,
                      const std::string& elapsed,
                      const std::string& remaining);

}}
