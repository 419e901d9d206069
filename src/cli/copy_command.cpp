#include "copy_command.hpp"
#include "termbar/common/constants.hpp"
#include "termbar/common/logger.hpp"
#include "termbar/core/progress_bar.hpp"
#include "termbar/format/json_formatter.hpp"
#include "termbar/io/stream_adapter.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <sys/stat.h>
#include <unistd.h>

namespace termbar {
namespace cli {

CopyCommand::CopyCommand() = default;

void CopyCommand::setup(CLI::App* subcommand) {
    subcommand->add_option("source", source_path_, "File to copy")
              ->required()
              ->check(CLI::ExistingFile);
    subcommand->add_option("target", target_path_, "Destination path")
              ->required();
    subcommand->add_option("-D,--description", description_, "Text shown before the bar");
    subcommand->add_flag("--json", json_output_, "Print the final state as JSON on stdout");
    
    registerCallback(subcommand);
}

int CopyCommand::execute() {
    int in_fd = ::open(source_path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (in_fd < 0) {
        std::cerr << "Error: cannot open " << source_path_ << ": " << std::strerror(errno) << "\n";
        return 1;
    }
    io::FileDescriptorReader reader(in_fd, true);
    
    struct stat st;
    if (::fstat(in_fd, &st) != 0) {
        std::cerr << "Error: cannot stat " << source_path_ << ": " << std::strerror(errno) << "\n";
        return 1;
    }
    
    int out_fd = ::open(target_path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (out_fd < 0) {
        std::cerr << "Error: cannot open " << target_path_ << ": " << std::strerror(errno) << "\n";
        return 1;
    }
    io::FileDescriptorWriter writer(out_fd, true);
    
    int64_t total = st.st_size > 0 ? static_cast<int64_t>(st.st_size) : constants::bar::UNKNOWN_LENGTH;
    std::string description = description_.empty() ? source_path_ : description_;
    
    auto bar = core::ProgressBar::createDefaultBytes(total, description);
    io::ProgressReader progress_reader(reader, *bar);
    
    common::Logger::instance().info("[Copy] Starting | source={} | target={} | size={}",
                                    source_path_, target_path_, static_cast<int64_t>(st.st_size));
    
    size_t copied = io::copyStream(progress_reader, writer, constants::limits::COPY_BUFFER_SIZE);
    
    bar->finish();
    writer.close();
    progress_reader.close();
    
    common::Logger::instance().info("[Copy] Done | bytes={}", copied);
    
    if (json_output_) {
        format::JsonFormatter().format(bar->snapshot(), std::cout);
    }
    return 0;
}

}}
