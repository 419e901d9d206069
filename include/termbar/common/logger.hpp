#pragma once

#include "config.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <string>

namespace termbar {
namespace common {

enum class LogMode {
    CONSOLE_ONLY,
    FILE_ONLY
};

// Process logger. Calls made before initialize() are dropped, so the
// library stays silent unless the embedding program opts in.
class Logger {
public:
    static Logger& instance();
    
    void initialize(LogMode mode, const std::string& log_file, LogLevel level, const LoggingConfig& logging_config);
    void setLevel(LogLevel level);
    void shutdown();
    
    template<typename... Args>
    void error(const std::string& format, Args&&... args) {
        write(spdlog::level::err, format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void warn(const std::string& format, Args&&... args) {
        write(spdlog::level::warn, format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void info(const std::string& format, Args&&... args) {
        write(spdlog::level::info, format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void debug(const std::string& format, Args&&... args) {
        write(spdlog::level::debug, format, std::forward<Args>(args)...);
    }
    
    void flush();
    
    bool isInitialized() const { return initialized_; }

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> logger_;
    bool initialized_ = false;
    LogFormat current_format_ = LogFormat::TEXT;
    
    template<typename... Args>
    void write(spdlog::level::level_enum level, const std::string& format, Args&&... args) {
        if (logger_ && logger_->should_log(level)) {
            logger_->log(level, fmt::runtime(format), std::forward<Args>(args)...);
        }
    }
    
    spdlog::level::level_enum toSpdlogLevel(LogLevel level);
    spdlog::sink_ptr makeConsoleSink(spdlog::level::level_enum level);
    std::string getLogFileWithSuffix(LogFormat format, const std::string& base_path) const;
};

}}
