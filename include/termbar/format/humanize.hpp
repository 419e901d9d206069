#pragma once

#include <cstdint>
#include <string>

namespace termbar {
namespace format {

// Decimal (base 1000) size, e.g. "1.5 kB" or "12 MB". Values below 10 are
// always printed as bytes with the " B" suffix.
std::string humanizeBytes(double bytes, bool with_suffix);

// Whole-second duration in the "1h2m3s" style; zero is "0s".
std::string formatDuration(int64_t seconds);

// Truncates toward zero; non-finite input formats as "0s".
std::string formatDurationTruncated(double seconds);

}}
