#include "termbar/format/humanize.hpp"
#include <spdlog/fmt/fmt.h>
#include <array>
#include <cmath>
#include <limits>

namespace termbar {
namespace format {

std::string humanizeBytes(double bytes, bool with_suffix) {
    static const std::array<const char*, 7> sizes = {" B", " kB", " MB", " GB", " TB", " PB", " EB"};
    const double base = 1000.0;
    
    if (bytes < 10) {
        return fmt::format("{:2.0f} B", bytes);
    }
    
    size_t exponent = static_cast<size_t>(std::floor(std::log(bytes) / std::log(base)));
    if (exponent >= sizes.size()) {
        exponent = sizes.size() - 1;
    }
    
    double value = std::floor(bytes / std::pow(base, static_cast<double>(exponent)) * 10 + 0.5) / 10;
    const char* suffix = with_suffix ? sizes[exponent] : "";
    
    if (value < 10) {
        return fmt::format("{:.1f}{}", value, suffix);
    }
    return fmt::format("{:.0f}{}", value, suffix);
}

std::string formatDuration(int64_t seconds) {
    if (seconds == 0) {
        return "0s";
    }
    
    std::string result;
    uint64_t remaining;
    if (seconds < 0) {
        result = "-";
        remaining = static_cast<uint64_t>(-(seconds + 1)) + 1;
    } else {
        remaining = static_cast<uint64_t>(seconds);
    }
    
    uint64_t hours = remaining / 3600;
    uint64_t minutes = (remaining % 3600) / 60;
    uint64_t secs = remaining % 60;
    
    if (hours > 0) {
        result += fmt::format("{}h{}m{}s", hours, minutes, secs);
    } else if (minutes > 0) {
        result += fmt::format("{}m{}s", minutes, secs);
    } else {
        result += fmt::format("{}s", secs);
    }
    return result;
}

std::string formatDurationTruncated(double seconds) {
    if (!std::isfinite(seconds)) {
        return "0s";
    }
    
    constexpr double limit = static_cast<double>(std::numeric_limits<int64_t>::max());
    if (seconds >= limit || seconds <= -limit) {
        return "0s";
    }
    return formatDuration(static_cast<int64_t>(std::trunc(seconds)));
}

}}
