#include "termbar/common/logger.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using termbar::common::Logger;
using termbar::common::LogFormat;
using termbar::common::LogLevel;
using termbar::common::LogMode;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("termbar_logger_test_" + std::to_string(::getpid()));
        Logger::instance().shutdown();
    }
    
    void TearDown() override {
        Logger::instance().shutdown();
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }
    
    static std::string readFile(const std::filesystem::path& path) {
        std::ifstream in(path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }
    
    std::filesystem::path dir_;
};

TEST_F(LoggerTest, DropsMessagesBeforeInitialize) {
    EXPECT_FALSE(Logger::instance().isInitialized());
    EXPECT_NO_THROW(Logger::instance().info("[Test] ignored | n={}", 1));
}

TEST_F(LoggerTest, WritesTextLogFile) {
    auto log_file = dir_ / "bar.log";
    termbar::common::LoggingConfig logging{1, 2, LogFormat::TEXT};
    
    Logger::instance().initialize(LogMode::FILE_ONLY, log_file.string(), LogLevel::INFO, logging);
    ASSERT_TRUE(Logger::instance().isInitialized());
    
    Logger::instance().info("[Test] Hello | n={}", 42);
    Logger::instance().debug("[Test] Hidden");
    Logger::instance().flush();
    
    std::string content = readFile(log_file);
    EXPECT_NE(content.find("[info] [Test] Hello | n=42"), std::string::npos) << content;
    EXPECT_EQ(content.find("Hidden"), std::string::npos);
}

TEST_F(LoggerTest, JsonFormatRenamesFile) {
    auto log_file = dir_ / "bar.log";
    termbar::common::LoggingConfig logging{1, 2, LogFormat::JSON};
    
    Logger::instance().initialize(LogMode::FILE_ONLY, log_file.string(), LogLevel::DEBUG, logging);
    Logger::instance().warn("[Test] Structured");
    Logger::instance().flush();
    
    std::string content = readFile(dir_ / "bar.json.log");
    EXPECT_NE(content.find(R"("level":"warning")"), std::string::npos) << content;
    EXPECT_NE(content.find("[Test] Structured"), std::string::npos);
}
