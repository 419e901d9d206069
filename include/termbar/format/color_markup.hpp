#pragma once

#include <string>

namespace termbar {
namespace format {

// Replaces "[red]", "[_blue_]", "[bold]", "[reset]" and the other known
// markup tags with ANSI SGR escapes. Unknown tags are left untouched. If any
// tag was replaced and append_reset is set, "\033[0m" is appended.
std::string colorize(const std::string& markup, bool append_reset = true);

// Removes CSI escape sequences ("\033[...X").
std::string stripAnsi(const std::string& text);

// Code point count, ignoring carriage returns. When exclude_escapes is set,
// ANSI escapes do not count either.
int displayWidth(const std::string& text, bool exclude_escapes = false);

}}
