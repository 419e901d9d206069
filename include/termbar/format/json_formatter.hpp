#pragma once

#include "../core/progress_bar.hpp"
#include <nlohmann/json.hpp>
#include <ostream>

namespace termbar {
namespace format {

nlohmann::json toJson(const core::BarSnapshot& snapshot);

class JsonFormatter {
public:
    explicit JsonFormatter(bool pretty = true) : pretty_(pretty) {}
    
    void format(const core::BarSnapshot& snapshot, std::ostream& out) const;

private:
    bool pretty_;
};

}}
