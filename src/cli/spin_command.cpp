#include "spin_command.hpp"
#include "termbar/common/constants.hpp"
#include "termbar/common/logger.hpp"
#include "termbar/core/progress_bar.hpp"
#include <chrono>
#include <thread>
#include <unistd.h>

namespace termbar {
namespace cli {

SpinCommand::SpinCommand() = default;

void SpinCommand::setup(CLI::App* subcommand) {
    subcommand->add_option("-d,--duration-ms", duration_ms_, "How long to spin")
              ->check(CLI::Range(0, 3600000));
    subcommand->add_option("-i,--interval-ms", interval_ms_, "Pause between updates")
              ->check(CLI::Range(1, 60000));
    spinner_option_ = subcommand->add_option("-s,--spinner", spinner_type_, "Spinner style")
                                ->check(CLI::Range(0, constants::bar::MAX_SPINNER_TYPE));
    subcommand->add_option("-D,--description", description_, "Text shown after the spinner");
    
    registerCallback(subcommand);
}

int SpinCommand::execute() {
    auto sink = io::stderrSink();
    
    core::BarOptions options = baseOptions(sink);
    options.clear_on_finish = true;
    options.on_completion = nullptr;
    if (spinner_option_->count() > 0) {
        options.spinner_type = spinner_type_;
    }
    
    core::ProgressBar bar(constants::bar::UNKNOWN_LENGTH, std::move(options), sink,
                          std::make_shared<io::IoctlTerminalSize>(STDERR_FILENO));
    
    common::Logger::instance().info("[Spin] Starting | duration_ms={} | interval_ms={}",
                                    duration_ms_, interval_ms_);
    
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(duration_ms_);
    while (std::chrono::steady_clock::now() < deadline) {
        bar.add(1);
        std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms_));
    }
    
    bar.finish();
    return 0;
}

}}
