#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <cstdint>

namespace termbar {
namespace cli {

// Drives a determinate bar from 0 to max at a fixed pace.
class CountCommand : public MainCommand {
public:
    CountCommand();
    
    void setup(CLI::App* subcommand);
    int execute();

private:
    int64_t max_ = 100;
    int64_t step_ = 1;
    int delay_ms_ = 20;
    bool show_its_ = false;
    bool show_count_ = false;
    bool full_width_ = false;
    bool json_output_ = false;
    CLI::Option* width_option_ = nullptr;
    CLI::Option* throttle_option_ = nullptr;
    int width_ = 0;
    int64_t throttle_ms_ = 0;
};

}}
