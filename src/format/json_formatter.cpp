#include "termbar/format/json_formatter.hpp"

namespace termbar {
namespace format {

nlohmann::json toJson(const core::BarSnapshot& snapshot) {
    nlohmann::json j;
    j["percent_complete"] = snapshot.percent_complete;
    j["bytes_processed"] = snapshot.bytes_processed;
    j["seconds_elapsed"] = snapshot.seconds_elapsed;
    j["seconds_remaining"] = snapshot.seconds_remaining;
    j["throughput_kbps"] = snapshot.throughput_kbps;
    return j;
}

void JsonFormatter::format(const core::BarSnapshot& snapshot, std::ostream& out) const {
    out << toJson(snapshot).dump(pretty_ ? 2 : -1) << "\n";
}

}}
