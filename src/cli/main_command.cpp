#include "main_command.hpp"
#include "termbar/common/config.hpp"
#include "termbar/io/terminal.hpp"
#include <unistd.h>

namespace termbar {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

void MainCommand::registerCallback(CLI::App* subcommand) {
    subcommand_ = subcommand;
    subcommand->callback([this]() { was_called_ = true; });
}

core::BarOptions MainCommand::baseOptions(const std::shared_ptr<io::OutputSink>& sink) const {
    core::BarOptions options = common::Config::instance().barOptions(description_);
    options.color_codes = options.color_codes && io::isTerminal(STDERR_FILENO);
    options.on_completion = [sink]() { sink->write("\n"); };
    return options;
}

}}
