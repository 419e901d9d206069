#include "termbar/io/stream_adapter.hpp"
#include "termbar/core/progress_bar.hpp"
#include "termbar/common/logger.hpp"
#include <cerrno>
#include <system_error>
#include <vector>
#include <unistd.h>

namespace termbar {
namespace io {

namespace {

[[noreturn]] void throwErrno(const char* operation) {
    throw std::system_error(errno, std::generic_category(), operation);
}

}

FileDescriptorReader::FileDescriptorReader(int fd, bool owns_fd)
    : fd_(fd), owns_fd_(owns_fd) {}

FileDescriptorReader::~FileDescriptorReader() {
    if (owns_fd_ && fd_ >= 0) {
        ::close(fd_);
    }
}

size_t FileDescriptorReader::read(char* buffer, size_t size) {
    while (true) {
        ssize_t n = ::read(fd_, buffer, size);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno != EINTR) {
            throwErrno("read");
        }
    }
}

void FileDescriptorReader::close() {
    if (fd_ < 0) {
        return;
    }
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
        throwErrno("close");
    }
}

FileDescriptorWriter::FileDescriptorWriter(int fd, bool owns_fd)
    : fd_(fd), owns_fd_(owns_fd) {}

FileDescriptorWriter::~FileDescriptorWriter() {
    if (owns_fd_ && fd_ >= 0) {
        ::close(fd_);
    }
}

size_t FileDescriptorWriter::write(const char* data, size_t size) {
    size_t written = 0;
    while (written < size) {
        ssize_t n = ::write(fd_, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throwErrno("write");
        }
        written += static_cast<size_t>(n);
    }
    return written;
}

void FileDescriptorWriter::close() {
    if (fd_ < 0) {
        return;
    }
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
        throwErrno("close");
    }
}

size_t IstreamReader::read(char* buffer, size_t size) {
    in_.read(buffer, static_cast<std::streamsize>(size));
    if (in_.bad()) {
        throw std::system_error(std::make_error_code(std::errc::io_error), "istream read");
    }
    return static_cast<size_t>(in_.gcount());
}

size_t OstreamWriter::write(const char* data, size_t size) {
    out_.write(data, static_cast<std::streamsize>(size));
    if (!out_) {
        throw std::system_error(std::make_error_code(std::errc::io_error), "ostream write");
    }
    return size;
}

ProgressReader::ProgressReader(ByteReader& inner, core::ProgressBar& bar)
    : inner_(inner), bar_(bar) {}

size_t ProgressReader::read(char* buffer, size_t size) {
    size_t n = inner_.read(buffer, size);
    if (n > 0) {
        bar_.add(static_cast<int64_t>(n));
    }
    return n;
}

void ProgressReader::close() {
    if (inner_.supportsClose()) {
        inner_.close();
        return;
    }
    bar_.finish();
}

ProgressWriter::ProgressWriter(ByteWriter& inner, core::ProgressBar& bar)
    : inner_(inner), bar_(bar) {}

size_t ProgressWriter::write(const char* data, size_t size) {
    size_t n = inner_.write(data, size);
    if (n > 0) {
        bar_.add(static_cast<int64_t>(n));
    }
    return n;
}

void ProgressWriter::close() {
    if (inner_.supportsClose()) {
        inner_.close();
        return;
    }
    bar_.finish();
}

size_t copyStream(ByteReader& reader, ByteWriter& writer, size_t buffer_size) {
    std::vector<char> buffer(buffer_size > 0 ? buffer_size : 1);
    size_t total = 0;
    
    while (true) {
        size_t n = reader.read(buffer.data(), buffer.size());
        if (n == 0) {
            break;
        }
        writer.write(buffer.data(), n);
        total += n;
    }
    
    common::Logger::instance().debug("[Stream] Copy finished | bytes={}", total);
    return total;
}

}}
