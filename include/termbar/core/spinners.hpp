#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace termbar {
namespace core {

// Number of spinner variants, addressable by index 0..spinnerCount()-1.
size_t spinnerCount();

// Throws std::out_of_range for an invalid index.
const std::vector<std::string>& spinnerFrames(int spinner_type);

}}
