#pragma once

#include <chrono>
#include <memory>

namespace termbar {
namespace core {

class Clock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SteadyClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::steady_clock::now(); }
};

std::shared_ptr<Clock> steadyClock();

inline double secondsBetween(Clock::TimePoint from, Clock::TimePoint to) {
    return std::chrono::duration<double>(to - from).count();
}

}}
