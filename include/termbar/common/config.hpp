#pragma once

#include "../core/options.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace termbar {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct LoggingConfig {
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

struct BarConfig {
    int width;
    int64_t throttle_ms;
    int spinner_type;
    core::Theme theme;
    bool show_bytes;
    bool show_iterations_count;
    bool show_iterations_per_second;
    bool predict_time;
    bool clear_on_finish;
    bool full_width;
    bool color_codes;
};

struct GlobalConfig {
    std::string log_file;
    LogLevel log_level;
    LoggingConfig logging;
    BarConfig bar;
};

class Config {
public:
    static Config& instance();
    
    Config();
    
    // Loads config_file, or the first readable file on the search path when
    // empty. Missing files leave the defaults in place.
    bool load(const std::string& config_file = "");
    
    std::optional<std::string> findBestConfig() const;
    std::vector<std::string> getConfigSearchPaths() const;
    
    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }
    
    core::BarOptions barOptions(const std::string& description = "") const;
    
    std::string getConfigPath() const { return current_config_path_; }
    
    static GlobalConfig createDefaultConfig();
    static std::optional<LogLevel> parseLogLevel(const std::string& level);

private:
    GlobalConfig global_;
    std::string current_config_path_;
    
    bool tryLoadTomlFile(const std::string& path, const std::string& description);
};

}}
