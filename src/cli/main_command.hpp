#pragma once

#include "termbar/core/options.hpp"
#include "termbar/io/output_sink.hpp"
#include <CLI/CLI.hpp>
#include <memory>
#include <string>

namespace termbar {
namespace cli {

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();
    
    bool wasCalled() const { return was_called_; }

protected:
    CLI::App* subcommand_ = nullptr;
    bool was_called_ = false;
    std::string description_;
    
    void registerCallback(CLI::App* subcommand);
    
    // Config-file bar options with the description applied. Colors stay off
    // unless stderr is a terminal; a newline goes to sink on completion.
    core::BarOptions baseOptions(const std::shared_ptr<io::OutputSink>& sink) const;
};

}}
