#pragma once

#include <memory>
#include <ostream>
#include <string>

namespace termbar {
namespace io {

// Byte destination for rendered frames.
class OutputSink {
public:
    virtual ~OutputSink() = default;
    
    // Throws core::BarError(SINK_WRITE_FAILED).
    virtual void write(const std::string& data) = 0;
    
    virtual bool supportsSync() const { return false; }
    
    // Returns false on failure; callers treat syncing as best effort.
    virtual bool sync() { return true; }
};

class OstreamSink : public OutputSink {
public:
    explicit OstreamSink(std::ostream& out);
    
    void write(const std::string& data) override;
    bool supportsSync() const override { return true; }
    bool sync() override;

private:
    std::ostream& out_;
};

class FileDescriptorSink : public OutputSink {
public:
    // The descriptor is borrowed, never closed.
    explicit FileDescriptorSink(int fd);
    
    void write(const std::string& data) override;
    bool supportsSync() const override { return true; }
    bool sync() override;
    
    int fd() const { return fd_; }

private:
    int fd_;
};

std::shared_ptr<OutputSink> stdoutSink();
std::shared_ptr<OutputSink> stderrSink();

}}
