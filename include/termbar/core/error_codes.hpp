#pragma once

#include "../common/error_framework.hpp"
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_map>

namespace termbar {
namespace core {

enum class BarErrorCode {
    INVALID_CONFIGURATION = 100,
    COUNTER_OVERFLOW = 200,
    COUNTER_UNDERFLOW = 201,
    SINK_WRITE_FAILED = 300
};

using BarErrorCodeHelper = common::ErrorRegistry<BarErrorCode>;

class BarError : public std::runtime_error {
public:
    explicit BarError(BarErrorCode code, const std::string& detail = "");
    BarError(BarErrorCode code, std::error_code cause, const std::string& detail = "");
    
    BarErrorCode code() const noexcept { return code_; }
    
    // Set only for SINK_WRITE_FAILED raised from a failing system call.
    const std::error_code& cause() const noexcept { return cause_; }

private:
    BarErrorCode code_;
    std::error_code cause_;
};

}
}

namespace termbar {
namespace common {

template<>
inline const std::unordered_map<core::BarErrorCode, ErrorInfo<core::BarErrorCode>>& 
ErrorRegistry<core::BarErrorCode>::getInfoMap() {
    static const std::unordered_map<core::BarErrorCode, ErrorInfo<core::BarErrorCode>> map = {
        {core::BarErrorCode::INVALID_CONFIGURATION, {
            core::BarErrorCode::INVALID_CONFIGURATION,
            "INVALID_CONFIGURATION",
            "Invalid progress bar configuration"
        }},
        {core::BarErrorCode::COUNTER_OVERFLOW, {
            core::BarErrorCode::COUNTER_OVERFLOW,
            "COUNTER_OVERFLOW",
            "Current number exceeds max"
        }},
        {core::BarErrorCode::COUNTER_UNDERFLOW, {
            core::BarErrorCode::COUNTER_UNDERFLOW,
            "COUNTER_UNDERFLOW",
            "Current number below zero"
        }},
        {core::BarErrorCode::SINK_WRITE_FAILED, {
            core::BarErrorCode::SINK_WRITE_FAILED,
            "SINK_WRITE_FAILED",
            "Failed to write to output"
        }}
    };
    return map;
}

}
}
