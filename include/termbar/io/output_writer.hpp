#pragma once

#include "output_sink.hpp"
#include <memory>
#include <string>

namespace termbar {
namespace io {

// Overwrites the current terminal line in place. Every call is a single
// sink write followed by a best-effort sync.
class OutputWriter {
public:
    explicit OutputWriter(std::shared_ptr<OutputSink> sink);
    
    // "\r" + max_line_width spaces + "\r"
    void clear(int max_line_width);
    
    // Clear sequence followed by the frame; the frame carries its own "\r".
    void present(const std::string& frame, int max_line_width);
    
    // Raw write, used for completion output such as a trailing newline.
    void emit(const std::string& data);
    
    const std::shared_ptr<OutputSink>& sink() const { return sink_; }

private:
    std::shared_ptr<OutputSink> sink_;
    
    static std::string clearSequence(int max_line_width);
};

}}
