#include "termbar/io/output_writer.hpp"
#include "termbar/common/logger.hpp"
#include <stdexcept>

namespace termbar {
namespace io {

OutputWriter::OutputWriter(std::shared_ptr<OutputSink> sink) : sink_(std::move(sink)) {
    if (!sink_) {
        throw std::invalid_argument("OutputWriter requires a sink");
    }
}

std::string OutputWriter::clearSequence(int max_line_width) {
    std::string sequence = "\r";
    if (max_line_width > 0) {
        sequence.append(static_cast<size_t>(max_line_width), ' ');
    }
    sequence += "\r";
    return sequence;
}

void OutputWriter::clear(int max_line_width) {
    emit(clearSequence(max_line_width));
}

void OutputWriter::present(const std::string& frame, int max_line_width) {
    emit(clearSequence(max_line_width) + frame);
}

void OutputWriter::emit(const std::string& data) {
    sink_->write(data);
    
    if (sink_->supportsSync() && !sink_->sync()) {
        common::Logger::instance().debug("[Writer] Sink sync failed, ignoring");
    }
}

}}
