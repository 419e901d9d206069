#include "termbar/core/layout.hpp"
#include "termbar/core/spinners.hpp"
#include "termbar/format/color_markup.hpp"
#include "termbar/format/humanize.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <vector>

namespace termbar {
namespace core {

namespace {

std::string repeat(const std::string& glyph, int count) {
    std::string result;
    if (count <= 0 || glyph.empty()) {
        return result;
    }
    result.reserve(glyph.size() * static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        result += glyph;
    }
    return result;
}

int visibleWidth(const std::string& text, bool color_codes) {
    if (color_codes) {
        return format::displayWidth(format::colorize(text), true);
    }
    return format::displayWidth(text);
}

std::string remainingTime(const LayoutConfig& config, const LayoutState& state) {
    if (!std::isfinite(state.average_rate) || state.average_rate <= 0.0) {
        return "0s";
    }
    double left = (1.0 / state.average_rate) *
                  (static_cast<double>(config.max) - static_cast<double>(state.current_count));
    return format::formatDurationTruncated(left);
}

std::string spinnerFrame(int spinner_type, double seconds_since_start) {
    const auto& frames = spinnerFrames(spinner_type);
    int64_t ticks = static_cast<int64_t>(seconds_since_start * 1000.0) / constants::bar::SPINNER_FRAME_MS;
    if (ticks < 0) {
        ticks = 0;
    }
    return frames[static_cast<size_t>(ticks % static_cast<int64_t>(frames.size()))];
}

std::string saucerBody(const LayoutConfig& config, int fill_width, int width) {
    const Theme& theme = config.options.theme;
    if (fill_width <= 0) {
        return "";
    }
    
    std::string body = repeat(config.ignore_length ? theme.saucer_padding : theme.saucer, fill_width - 1);
    
    // a full bar keeps the plain saucer for its last cell
    if (theme.saucer_head.empty() || fill_width == width) {
        body += theme.saucer;
    } else {
        body += theme.saucer_head;
    }
    return body;
}

}

std::string buildAnnotations(const LayoutConfig& config, const LayoutState& state) {
    const BarOptions& options = config.options;
    std::vector<std::string> clauses;
    
    if (options.show_iterations_count) {
        if (!config.ignore_length) {
            if (options.show_bytes) {
                clauses.push_back(format::humanizeBytes(state.current_bytes, false) + "/" +
                                  format::humanizeBytes(static_cast<double>(config.max), true));
            } else {
                clauses.push_back(fmt::format("{:.0f}/{}", state.current_bytes, config.max));
            }
        } else {
            if (options.show_bytes) {
                clauses.push_back(format::humanizeBytes(state.current_bytes, true));
            } else {
                clauses.push_back(fmt::format("{:.0f}/-", state.current_bytes));
            }
        }
    }
    
    if (options.show_bytes) {
        double kb_per_second = state.average_rate / 1024.0;
        if (kb_per_second > 1024.0) {
            clauses.push_back(fmt::format("{:.3f} MB/s", kb_per_second / 1024.0));
        } else if (kb_per_second > 0) {
            clauses.push_back(fmt::format("{:.3f} kB/s", kb_per_second));
        }
    }
    
    if (options.show_iterations_per_second) {
        if (state.average_rate > 1) {
            clauses.push_back(fmt::format("{:.0f} it/s", state.average_rate));
        } else {
            clauses.push_back(fmt::format("{:.0f} it/min", 60 * state.average_rate));
        }
    }
    
    if (clauses.empty()) {
        return "";
    }
    std::string joined = "(";
    for (size_t i = 0; i < clauses.size(); ++i) {
        if (i > 0) {
            joined += ", ";
        }
        joined += clauses[i];
    }
    return joined + ")";
}

int fullWidthBarWidth(const LayoutConfig& config,
                      int terminal_columns,
                      const std::string& annotations,
                      const std::string& elapsed,
                      const std::string& remaining) {
    const BarOptions& options = config.options;
    bool color = options.color_codes;
    
    int fixed = constants::bar::LAYOUT_FIXED_COLUMNS +
                visibleWidth(options.theme.bar_start, color) +
                visibleWidth(options.theme.bar_end, color);
    
    int width = terminal_columns
        - visibleWidth(options.description, color)
        - fixed
        - visibleWidth(annotations, color)
        - visibleWidth(elapsed, color)
        - visibleWidth(remaining, color);
    
    return std::max(width, 0);
}

RenderedLine layoutLine(const LayoutConfig& config, const LayoutState& state) {
    const BarOptions& options = config.options;
    const Theme& theme = options.theme;
    
    std::string annotations = buildAnnotations(config, state);
    
    std::string elapsed;
    std::string remaining;
    if (options.predict_time) {
        elapsed = format::formatDurationTruncated(state.seconds_since_start);
        remaining = remainingTime(config, state);
    }
    
    int width = options.width;
    int fill_width = state.fill_width;
    if (options.full_width && !config.ignore_length) {
        width = fullWidthBarWidth(config, state.terminal_columns, annotations, elapsed, remaining);
        fill_width = static_cast<int>(static_cast<double>(state.current_percent) / 100.0 * width);
    }
    fill_width = std::max(0, std::min(fill_width, width));
    
    std::string text;
    if (config.ignore_length) {
        text = fmt::format("\r{} {} {} ",
                           spinnerFrame(options.spinner_type, state.seconds_since_start),
                           options.description,
                           annotations);
    } else {
        text = fmt::format("\r{}{:4d}% {}{}{}{} {}",
                           options.description,
                           state.current_percent,
                           theme.bar_start,
                           saucerBody(config, fill_width, width),
                           repeat(theme.saucer_padding, width - fill_width),
                           theme.bar_end,
                           annotations);
        if (elapsed.empty()) {
            text += " ";
        } else {
            text += fmt::format(" [{}:{}]", elapsed, remaining);
        }
    }
    
    if (options.color_codes) {
        text = format::colorize(text);
    }
    
    RenderedLine line;
    line.width = format::displayWidth(text, options.color_codes);
    line.text = std::move(text);
    return line;
}

}}
