#include "termbar/common/config.hpp"
#include "termbar/common/constants.hpp"
#include "termbar/common/logger.hpp"
#include <toml.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <unistd.h>

namespace termbar {
namespace common {

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;
    
    GlobalConfig config;
    
    config.log_file = "";
    config.log_level = LogLevel::WARN;
    
    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;
    
    config.bar.width = BAR_WIDTH;
    config.bar.throttle_ms = BAR_THROTTLE_MS;
    config.bar.spinner_type = BAR_SPINNER_TYPE;
    config.bar.theme = core::defaultTheme();
    config.bar.show_bytes = false;
    config.bar.show_iterations_count = false;
    config.bar.show_iterations_per_second = false;
    config.bar.predict_time = BAR_PREDICT_TIME;
    config.bar.clear_on_finish = false;
    config.bar.full_width = false;
    config.bar.color_codes = false;
    
    return config;
}

std::optional<LogLevel> Config::parseLogLevel(const std::string& level) {
    std::string upper = level;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return std::nullopt;
}

std::vector<std::string> Config::getConfigSearchPaths() const {
    std::vector<std::string> paths;
    
    if (const char* env = std::getenv(constants::system::CONFIG_ENV)) {
        paths.push_back(env);
    }
    
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        if (*xdg) {
            paths.push_back(std::string(xdg) + "/termbar/" + constants::system::CONFIG_FILE_NAME);
        }
    }
    
    if (const char* home = std::getenv("HOME")) {
        paths.push_back(std::string(home) + "/.config/termbar/" + constants::system::CONFIG_FILE_NAME);
    }
    
    paths.push_back(std::string(constants::system::SYSTEM_CONFIG_DIR) + "/" +
                    constants::system::CONFIG_FILE_NAME);
    
    return paths;
}

std::optional<std::string> Config::findBestConfig() const {
    for (const auto& path : getConfigSearchPaths()) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }
    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    if (!config_file.empty()) {
        return tryLoadTomlFile(config_file, "Config file");
    }
    
    auto best = findBestConfig();
    if (!best) {
        Logger::instance().debug("[Config] No config file found, using defaults");
        return false;
    }
    return tryLoadTomlFile(*best, "Config file");
}

bool Config::tryLoadTomlFile(const std::string& path, const std::string& description) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().debug("[Config] {} not found | path={}", description, path);
        return false;
    }
    
    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().debug("[Config] {} not readable | path={}", description, path);
        return false;
    }
    
    try {
        auto data = toml::parse(path);
        
        if (data.contains("global")) {
            auto global_section = data.at("global");
            
            if (global_section.contains("log_file")) {
                global_.log_file = toml::find<std::string>(global_section, "log_file");
            }
            if (global_section.contains("log_level")) {
                auto level = parseLogLevel(toml::find<std::string>(global_section, "log_level"));
                if (level) {
                    global_.log_level = *level;
                }
            }
        }
        
        if (data.contains("logging")) {
            auto logging_section = data.at("logging");
            
            if (logging_section.contains("rotation_size_mb")) {
                global_.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
            }
            if (logging_section.contains("max_files")) {
                global_.logging.max_files = toml::find<size_t>(logging_section, "max_files");
            }
            if (logging_section.contains("format")) {
                std::string format_str = toml::find<std::string>(logging_section, "format");
                global_.logging.format = (format_str == "json") ? LogFormat::JSON : LogFormat::TEXT;
            }
        }
        
        if (data.contains("bar")) {
            auto bar_section = data.at("bar");
            auto& bar = global_.bar;
            
            if (bar_section.contains("width")) {
                bar.width = toml::find<int>(bar_section, "width");
            }
            if (bar_section.contains("throttle_ms")) {
                bar.throttle_ms = toml::find<int64_t>(bar_section, "throttle_ms");
            }
            if (bar_section.contains("spinner_type")) {
                bar.spinner_type = toml::find<int>(bar_section, "spinner_type");
            }
            if (bar_section.contains("saucer")) {
                bar.theme.saucer = toml::find<std::string>(bar_section, "saucer");
            }
            if (bar_section.contains("saucer_head")) {
                bar.theme.saucer_head = toml::find<std::string>(bar_section, "saucer_head");
            }
            if (bar_section.contains("saucer_padding")) {
                bar.theme.saucer_padding = toml::find<std::string>(bar_section, "saucer_padding");
            }
            if (bar_section.contains("bar_start")) {
                bar.theme.bar_start = toml::find<std::string>(bar_section, "bar_start");
            }
            if (bar_section.contains("bar_end")) {
                bar.theme.bar_end = toml::find<std::string>(bar_section, "bar_end");
            }
            if (bar_section.contains("show_bytes")) {
                bar.show_bytes = toml::find<bool>(bar_section, "show_bytes");
            }
            if (bar_section.contains("show_count")) {
                bar.show_iterations_count = toml::find<bool>(bar_section, "show_count");
            }
            if (bar_section.contains("show_its")) {
                bar.show_iterations_per_second = toml::find<bool>(bar_section, "show_its");
            }
            if (bar_section.contains("predict_time")) {
                bar.predict_time = toml::find<bool>(bar_section, "predict_time");
            }
            if (bar_section.contains("clear_on_finish")) {
                bar.clear_on_finish = toml::find<bool>(bar_section, "clear_on_finish");
            }
            if (bar_section.contains("full_width")) {
                bar.full_width = toml::find<bool>(bar_section, "full_width");
            }
            if (bar_section.contains("color_codes")) {
                bar.color_codes = toml::find<bool>(bar_section, "color_codes");
            }
        }
        
        current_config_path_ = path;
        Logger::instance().info("[Config] {} loaded | path={}", description, path);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().warn("[Config] {} parse failed | path={} | error={}", 
                                description, path, e.what());
        return false;
    }
}

core::BarOptions Config::barOptions(const std::string& description) const {
    const auto& bar = global_.bar;
    
    core::BarOptions options;
    options.description = description;
    options.width = bar.width;
    options.theme = bar.theme;
    options.throttle = std::chrono::milliseconds(bar.throttle_ms);
    options.spinner_type = bar.spinner_type;
    options.show_bytes = bar.show_bytes;
    options.show_iterations_count = bar.show_iterations_count;
    options.show_iterations_per_second = bar.show_iterations_per_second;
    options.predict_time = bar.predict_time;
    options.clear_on_finish = bar.clear_on_finish;
    options.full_width = bar.full_width;
    options.color_codes = bar.color_codes;
    return options;
}

}}
