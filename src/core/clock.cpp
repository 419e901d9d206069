#include "termbar/core/clock.hpp"

namespace termbar {
namespace core {

std::shared_ptr<Clock> steadyClock() {
    static std::shared_ptr<Clock> clock = std::make_shared<SteadyClock>();
    return clock;
}

}}
