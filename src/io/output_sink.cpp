#include "termbar/io/output_sink.hpp"
#include "termbar/core/error_codes.hpp"
#include <cerrno>
#include <system_error>
#include <unistd.h>

namespace termbar {
namespace io {

OstreamSink::OstreamSink(std::ostream& out) : out_(out) {}

void OstreamSink::write(const std::string& data) {
    out_.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out_) {
        out_.clear();
        throw core::BarError(core::BarErrorCode::SINK_WRITE_FAILED, "stream is in a failed state");
    }
}

bool OstreamSink::sync() {
    out_.flush();
    if (!out_) {
        out_.clear();
        return false;
    }
    return true;
}

FileDescriptorSink::FileDescriptorSink(int fd) : fd_(fd) {}

void FileDescriptorSink::write(const std::string& data) {
    const char* ptr = data.data();
    size_t remaining = data.size();
    
    while (remaining > 0) {
        ssize_t written = ::write(fd_, ptr, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw core::BarError(core::BarErrorCode::SINK_WRITE_FAILED,
                                 std::error_code(errno, std::generic_category()),
                                 "fd=" + std::to_string(fd_));
        }
        ptr += written;
        remaining -= static_cast<size_t>(written);
    }
}

bool FileDescriptorSink::sync() {
    // terminals and pipes reject fsync with EINVAL
    return ::fsync(fd_) == 0;
}

std::shared_ptr<OutputSink> stdoutSink() {
    return std::make_shared<FileDescriptorSink>(STDOUT_FILENO);
}

std::shared_ptr<OutputSink> stderrSink() {
    return std::make_shared<FileDescriptorSink>(STDERR_FILENO);
}

}}
