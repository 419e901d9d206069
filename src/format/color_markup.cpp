#include "termbar/format/color_markup.hpp"
#include <regex>
#include <unordered_map>

namespace termbar {
namespace format {

namespace {

const std::unordered_map<std::string, std::string>& colorCodes() {
    static const std::unordered_map<std::string, std::string> codes = {
        {"default", "39"},
        {"_default_", "49"},
        
        {"black", "30"},
        {"red", "31"},
        {"green", "32"},
        {"yellow", "33"},
        {"blue", "34"},
        {"magenta", "35"},
        {"cyan", "36"},
        {"light_gray", "37"},
        {"dark_gray", "90"},
        {"light_red", "91"},
        {"light_green", "92"},
        {"light_yellow", "93"},
        {"light_blue", "94"},
        {"light_magenta", "95"},
        {"light_cyan", "96"},
        {"white", "97"},
        
        {"_black_", "40"},
        {"_red_", "41"},
        {"_green_", "42"},
        {"_yellow_", "43"},
        {"_blue_", "44"},
        {"_magenta_", "45"},
        {"_cyan_", "46"},
        {"_light_gray_", "47"},
        {"_dark_gray_", "100"},
        {"_light_red_", "101"},
        {"_light_green_", "102"},
        {"_light_yellow_", "103"},
        {"_light_blue_", "104"},
        {"_light_magenta_", "105"},
        {"_light_cyan_", "106"},
        {"_white_", "107"},
        
        {"bold", "1"},
        {"dim", "2"},
        {"underline", "4"},
        {"blink_slow", "5"},
        {"blink_fast", "6"},
        {"invert", "7"},
        {"hidden", "8"},
        
        {"reset", "0"},
        {"reset_bold", "21"}
    };
    return codes;
}

const std::regex& markupPattern() {
    static const std::regex pattern(R"(\[[a-z0-9_-]+\])", std::regex::icase);
    return pattern;
}

const std::regex& ansiPattern() {
    static const std::regex pattern("\x1b\\[[0-9;]*[a-zA-Z]");
    return pattern;
}

}

std::string colorize(const std::string& markup, bool append_reset) {
    const auto& codes = colorCodes();
    std::string result;
    result.reserve(markup.size());
    bool colored = false;
    
    auto begin = std::sregex_iterator(markup.begin(), markup.end(), markupPattern());
    auto end = std::sregex_iterator();
    size_t last = 0;
    
    for (auto it = begin; it != end; ++it) {
        const auto& match = *it;
        size_t pos = static_cast<size_t>(match.position(0));
        result.append(markup, last, pos - last);
        
        std::string tag = match.str(0);
        std::string name = tag.substr(1, tag.size() - 2);
        auto code = codes.find(name);
        if (code != codes.end()) {
            result += "\033[" + code->second + "m";
            colored = true;
        } else {
            result += tag;
        }
        
        last = pos + static_cast<size_t>(match.length(0));
    }
    result.append(markup, last, std::string::npos);
    
    if (colored && append_reset) {
        result += "\033[0m";
    }
    return result;
}

std::string stripAnsi(const std::string& text) {
    return std::regex_replace(text, ansiPattern(), "");
}

int displayWidth(const std::string& text, bool exclude_escapes) {
    const std::string visible = exclude_escapes ? stripAnsi(text) : text;
    
    int width = 0;
    for (unsigned char c : visible) {
        if (c == '\r') {
            continue;
        }
        // continuation bytes belong to the preceding code point
        if ((c & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

}}
