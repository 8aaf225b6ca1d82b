#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "ddmstatus/status/StatusSnapshot.hpp"

namespace ddmstatus {

nlohmann::json toJson(const StatusSnapshot& snap);

// Prometheus text exposition, "ddmstatus_" prefix.
std::string toPrometheus(const StatusSnapshot& snap);

// Plain-text summary for terminals and the ctl client.
std::string toSummary(const StatusSnapshot& snap);

}
