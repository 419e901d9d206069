#include "count_command.hpp"
#include "termbar/common/logger.hpp"
#include "termbar/core/progress_bar.hpp"
#include "termbar/format/json_formatter.hpp"
#include "termbar/io/terminal.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>
#include <unistd.h>

namespace termbar {
namespace cli {

CountCommand::CountCommand() = default;

void CountCommand::setup(CLI::App* subcommand) {
    subcommand->add_option("max", max_, "Target count")
              ->required()
              ->check(CLI::PositiveNumber);
    subcommand->add_option("-s,--step", step_, "Amount added per tick")
              ->check(CLI::PositiveNumber);
    subcommand->add_option("-d,--delay-ms", delay_ms_, "Pause between ticks in milliseconds")
              ->check(CLI::Range(0, 60000));
    subcommand->add_option("-D,--description", description_, "Text shown before the bar");
    width_option_ = subcommand->add_option("-w,--width", width_, "Bar width in cells")
                              ->check(CLI::Range(1, 1000));
    throttle_option_ = subcommand->add_option("-t,--throttle-ms", throttle_ms_,
                                              "Minimum time between redraws")
                                 ->check(CLI::NonNegativeNumber);
    subcommand->add_flag("--its", show_its_, "Show iterations per second");
    subcommand->add_flag("--count", show_count_, "Show current/total count");
    subcommand->add_flag("-f,--full-width", full_width_, "Stretch the bar to the terminal width");
    subcommand->add_flag("--json", json_output_, "Print the final state as JSON on stdout");
    
    registerCallback(subcommand);
}

int CountCommand::execute() {
    auto sink = io::stderrSink();
    
    core::BarOptions options = baseOptions(sink);
    options.show_iterations_per_second |= show_its_;
    options.show_iterations_count |= show_count_;
    options.full_width |= full_width_;
    if (width_option_->count() > 0) {
        options.width = width_;
    }
    if (throttle_option_->count() > 0) {
        options.throttle = std::chrono::milliseconds(throttle_ms_);
    }
    
    core::ProgressBar bar(max_, std::move(options), sink,
                          std::make_shared<io::IoctlTerminalSize>(STDERR_FILENO));
    bar.renderBlank();
    
    common::Logger::instance().info("[Count] Starting | max={} | step={} | delay_ms={}",
                                    max_, step_, delay_ms_);
    
    while (bar.current() < max_) {
        bar.add(std::min(step_, max_ - bar.current()));
        if (delay_ms_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
        }
    }
    
    if (json_output_) {
        format::JsonFormatter().format(bar.snapshot(), std::cout);
    }
    return 0;
}

}}
