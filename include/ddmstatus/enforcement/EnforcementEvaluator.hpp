#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ddmstatus/enforcement/CivilTime.hpp"

namespace ddmstatus::enforcement {

// Log line shape:
//   ...|EnforcedInstallDate:2026-03-13T12:00:00|VersionString:26.3|...
inline constexpr const char* kEnforcementMarker = "EnforcedInstallDate";
inline constexpr const char* kDeadlineKey       = "EnforcedInstallDate:";
inline constexpr const char* kVersionKey        = "VersionString:";

// Deadline and required version always come from the same log line.
struct EnforcementRecord {
    CivilTime deadline;
    std::string required_version;
};

using Version = std::vector<uint64_t>;

struct EnforcementStatus {
    bool is_up_to_date{true};
    std::optional<int> days_remaining;
    std::optional<EnforcementRecord> record;   // pass-through for display
};

bool operator==(const EnforcementRecord& a, const EnforcementRecord& b);
bool operator==(const EnforcementStatus& a, const EnforcementStatus& b);

// Dotted string to segments. Empty segments are skipped; a segment that
// is not all digits keeps its slot and counts as 0.
Version parseVersion(const std::string& text);

// Most recent (last in document order) enforcement entry, or nullopt when
// there is none or the line is incomplete or its date does not parse.
std::optional<EnforcementRecord> parseLatestEnforcement(const std::string& log_text);

// -1, 0 or 1. Missing trailing segments compare as 0.
int compareVersions(const std::string& a, const std::string& b);
int compareVersions(const Version& a, const Version& b);

// Pure: same inputs, same output. Never throws on malformed input; every
// anomaly degrades to "up to date, no deadline".
EnforcementStatus evaluate(const std::string& installed_version,
                           const std::string& log_text,
                           const CivilTime& now);

}
