#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace termbar {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "1.0.0";
    
    inline std::string getFullVersion() {
        return std::string("termbar v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "termbar";
    constexpr const char* LOGGER_NAME = "termbar";
    constexpr const char* CONFIG_ENV = "TERMBAR_CONFIG";
    constexpr const char* CONFIG_FILE_NAME = "termbar.toml";
    constexpr const char* SYSTEM_CONFIG_DIR = "/etc/termbar";
}

namespace bar {
    // Passed as max when the total is not known.
    constexpr int64_t UNKNOWN_LENGTH = -1;
    
    constexpr int DEFAULT_WIDTH = 40;
    constexpr int DEFAULT_SPINNER_TYPE = 9;
    constexpr int MAX_SPINNER_TYPE = 75;
    constexpr int DEFAULT_TERMINAL_COLUMNS = 80;
    
    constexpr size_t RATE_WINDOW_CAPACITY = 10;
    constexpr int64_t RATE_SAMPLE_INTERVAL_MS = 500;
    constexpr int64_t SPINNER_FRAME_MS = 100;
    
    // Layout characters outside the bar body, description and annotations.
    constexpr int LAYOUT_FIXED_COLUMNS = 11;
    
    constexpr int PRESET_WIDTH = 10;
    constexpr int64_t PRESET_THROTTLE_MS = 65;
    constexpr int PRESET_SPINNER_TYPE = 14;
}

namespace limits {
    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 3;
    constexpr size_t COPY_BUFFER_SIZE = 64 * 1024;
}

namespace config_defaults {
    constexpr int BAR_WIDTH = bar::DEFAULT_WIDTH;
    constexpr int64_t BAR_THROTTLE_MS = 0;
    constexpr int BAR_SPINNER_TYPE = bar::DEFAULT_SPINNER_TYPE;
    constexpr bool BAR_PREDICT_TIME = true;
    
    constexpr size_t LOG_ROTATION_SIZE_MB = limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    constexpr size_t LOG_MAX_FILES = limits::DEFAULT_LOG_MAX_FILES;
}

}
}
