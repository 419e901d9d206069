#pragma once

#include <cstddef>
#include <istream>
#include <ostream>

namespace termbar {
namespace core {
class ProgressBar;
}

namespace io {

class ByteReader {
public:
    virtual ~ByteReader() = default;
    
    // Returns 0 at end of input; throws std::system_error on failure.
    virtual size_t read(char* buffer, size_t size) = 0;
    
    virtual bool supportsClose() const { return false; }
    virtual void close() {}
};

class ByteWriter {
public:
    virtual ~ByteWriter() = default;
    
    // Writes the whole buffer; throws std::system_error on failure.
    virtual size_t write(const char* data, size_t size) = 0;
    
    virtual bool supportsClose() const { return false; }
    virtual void close() {}
};

class FileDescriptorReader : public ByteReader {
public:
    FileDescriptorReader(int fd, bool owns_fd);
    ~FileDescriptorReader() override;
    
    FileDescriptorReader(const FileDescriptorReader&) = delete;
    FileDescriptorReader& operator=(const FileDescriptorReader&) = delete;
    
    size_t read(char* buffer, size_t size) override;
    bool supportsClose() const override { return true; }
    void close() override;

private:
    int fd_;
    bool owns_fd_;
};

class FileDescriptorWriter : public ByteWriter {
public:
    FileDescriptorWriter(int fd, bool owns_fd);
    ~FileDescriptorWriter() override;
    
    FileDescriptorWriter(const FileDescriptorWriter&) = delete;
    FileDescriptorWriter& operator=(const FileDescriptorWriter&) = delete;
    
    size_t write(const char* data, size_t size) override;
    bool supportsClose() const override { return true; }
    void close() override;

private:
    int fd_;
    bool owns_fd_;
};

class IstreamReader : public ByteReader {
public:
    explicit IstreamReader(std::istream& in) : in_(in) {}
    size_t read(char* buffer, size_t size) override;

private:
    std::istream& in_;
};

class OstreamWriter : public ByteWriter {
public:
    explicit OstreamWriter(std::ostream& out) : out_(out) {}
    size_t write(const char* data, size_t size) override;

private:
    std::ostream& out_;
};

// Advances the bar by the byte count of every successful read. Closing
// closes the wrapped reader when it can be closed, and finishes the bar
// otherwise.
class ProgressReader : public ByteReader {
public:
    ProgressReader(ByteReader& inner, core::ProgressBar& bar);
    
    size_t read(char* buffer, size_t size) override;
    bool supportsClose() const override { return true; }
    void close() override;

private:
    ByteReader& inner_;
    core::ProgressBar& bar_;
};

class ProgressWriter : public ByteWriter {
public:
    ProgressWriter(ByteWriter& inner, core::ProgressBar& bar);
    
    size_t write(const char* data, size_t size) override;
    bool supportsClose() const override { return true; }
    void close() override;

private:
    ByteWriter& inner_;
    core::ProgressBar& bar_;
};

// Pumps reader into writer until end of input; returns bytes copied.
size_t copyStream(ByteReader& reader, ByteWriter& writer, size_t buffer_size);

}}
