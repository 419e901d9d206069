#pragma once

#include <memory>

namespace termbar {
namespace io {

class TerminalSizeProvider {
public:
    virtual ~TerminalSizeProvider() = default;
    virtual int columns() const = 0;
};

// Queries the terminal attached to fd on every call.
class IoctlTerminalSize : public TerminalSizeProvider {
public:
    explicit IoctlTerminalSize(int fd);
    int columns() const override;

private:
    int fd_;
};

class FixedTerminalSize : public TerminalSizeProvider {
public:
    explicit FixedTerminalSize(int columns) : columns_(columns) {}
    int columns() const override { return columns_; }

private:
    int columns_;
};

std::shared_ptr<TerminalSizeProvider> stdoutTerminal();

bool isTerminal(int fd);

}}
