#include "termbar/io/terminal.hpp"
#include "termbar/common/constants.hpp"
#include <sys/ioctl.h>
#include <unistd.h>

namespace termbar {
namespace io {

IoctlTerminalSize::IoctlTerminalSize(int fd) : fd_(fd) {}

int IoctlTerminalSize::columns() const {
    struct winsize w;
    if (ioctl(fd_, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return w.ws_col;
    }
    return constants::bar::DEFAULT_TERMINAL_COLUMNS;
}

std::shared_ptr<TerminalSizeProvider> stdoutTerminal() {
    return std::make_shared<IoctlTerminalSize>(STDOUT_FILENO);
}

bool isTerminal(int fd) {
    return isatty(fd) != 0;
}

}}
