#include "termbar/core/error_codes.hpp"

namespace termbar {
namespace core {

namespace {

// "CODE: message" or "CODE: message (detail)"
std::string composeMessage(BarErrorCode code, const std::string& detail) {
    std::string result = std::string(BarErrorCodeHelper::toString(code)) + ": " +
                         BarErrorCodeHelper::getMessage(code);
    if (!detail.empty()) {
        result += " (" + detail + ")";
    }
    return result;
}

}

BarError::BarError(BarErrorCode code, const std::string& detail)
    : std::runtime_error(composeMessage(code, detail)),
      code_(code) {}

BarError::BarError(BarErrorCode code, std::error_code cause, const std::string& detail)
    : std::runtime_error(composeMessage(
          code, detail.empty() ? cause.message() : detail + ": " + cause.message())),
      code_(code),
      cause_(cause) {}

}}
