#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>

namespace termbar {
namespace cli {

// Runs the indeterminate spinner for a fixed time.
class SpinCommand : public MainCommand {
public:
    SpinCommand();
    
    void setup(CLI::App* subcommand);
    int execute();

private:
    int duration_ms_ = 3000;
    int interval_ms_ = 50;
    int spinner_type_ = 0;
    CLI::Option* spinner_option_ = nullptr;
};

}}
