#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "termbar/common/config.hpp"
#include "termbar/common/constants.hpp"
#include "termbar/common/logger.hpp"
#include "cli/copy_command.hpp"
#include "cli/count_command.hpp"
#include "cli/spin_command.hpp"

namespace {

void initialize_logging(const std::string& config_file, const std::string& level_override) {
    auto& config = termbar::common::Config::instance();
    if (!config.load(config_file) && !config_file.empty()) {
        throw std::runtime_error("failed to load configuration: " + config_file);
    }
    
    auto level = config.global().log_level;
    if (!level_override.empty()) {
        auto parsed = termbar::common::Config::parseLogLevel(level_override);
        if (!parsed) {
            throw std::invalid_argument("unknown log level: " + level_override);
        }
        level = *parsed;
    }
    
    // Console logging shares stderr with the bar, so it is only used when
    // no log file is configured.
    const auto& log_file = config.global().log_file;
    termbar::common::Logger::instance().initialize(
        log_file.empty() ? termbar::common::LogMode::CONSOLE_ONLY
                         : termbar::common::LogMode::FILE_ONLY,
        log_file,
        level,
        config.global().logging
    );
    
    if (!config.getConfigPath().empty()) {
        termbar::common::Logger::instance().debug("[Main] Config loaded | path={}",
                                                  config.getConfigPath());
    }
}

}

int main(int argc, char** argv) {
    try {
        CLI::App app{termbar::constants::system::APPLICATION_NAME, "termbar"};
        app.set_version_flag("--version,-v", termbar::constants::version::getFullVersion());
        app.require_subcommand(0, 1);
        
        std::string config_file;
        std::string log_level;
        app.add_option("-c,--config", config_file, "Configuration file")
           ->check(CLI::ExistingFile);
        app.add_option("--log-level", log_level, "Log level (error, warn, info, debug)");
        
        auto count_cmd = std::make_unique<termbar::cli::CountCommand>();
        auto spin_cmd = std::make_unique<termbar::cli::SpinCommand>();
        auto copy_cmd = std::make_unique<termbar::cli::CopyCommand>();
        
        count_cmd->setup(app.add_subcommand("count", "Count up to a number with a progress bar"));
        spin_cmd->setup(app.add_subcommand("spin", "Show a spinner for a while"));
        copy_cmd->setup(app.add_subcommand("copy", "Copy a file with a byte progress bar"));
        
        CLI11_PARSE(app, argc, argv);
        
        initialize_logging(config_file, log_level);
        
        int result = 0;
        if (count_cmd->wasCalled()) {
            result = count_cmd->execute();
        } else if (spin_cmd->wasCalled()) {
            result = spin_cmd->execute();
        } else if (copy_cmd->wasCalled()) {
            result = copy_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
        }
        
        termbar::common::Logger::instance().shutdown();
        return result;
        
    } catch (const CLI::ParseError& e) {
        return 1;
    } catch (const std::exception& e) {
        termbar::common::Logger::instance().error("[Main] Command failed | error={}", e.what());
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}
