#include "termbar/core/options.hpp"
#include "termbar/core/error_codes.hpp"
#include <string>

namespace termbar {
namespace core {

Theme defaultTheme() {
    return Theme{"█", "", " ", "|", "|"};
}

void validateOptions(const BarOptions& options) {
    if (options.spinner_type < 0 || options.spinner_type > constants::bar::MAX_SPINNER_TYPE) {
        throw BarError(BarErrorCode::INVALID_CONFIGURATION,
                       "spinner type must be between 0 and " +
                       std::to_string(constants::bar::MAX_SPINNER_TYPE));
    }
    if (options.width < 0) {
        throw BarError(BarErrorCode::INVALID_CONFIGURATION, "width must not be negative");
    }
    if (options.throttle.count() < 0) {
        throw BarError(BarErrorCode::INVALID_CONFIGURATION, "throttle must not be negative");
    }
}

BarOptions presetOptions(const std::string& description) {
    BarOptions options;
    options.description = description;
    options.width = constants::bar::PRESET_WIDTH;
    options.throttle = std::chrono::milliseconds(constants::bar::PRESET_THROTTLE_MS);
    options.show_iterations_count = true;
    options.spinner_type = constants::bar::PRESET_SPINNER_TYPE;
    options.full_width = true;
    return options;
}

}}
