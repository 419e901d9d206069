#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace termbar {
namespace cli {

// Copies a file while showing a byte progress bar on stderr.
class CopyCommand : public MainCommand {
public:
    CopyCommand();
    
    void setup(CLI::App* subcommand);
    int execute();

private:
    std::string source_path_;
    std::string target_path_;
    bool json_output_ = false;
};

}}
