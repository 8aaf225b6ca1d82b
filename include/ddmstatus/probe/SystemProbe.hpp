#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "ddmstatus/enforcement/CivilTime.hpp"

// Readers for the local system state fed into a snapshot. None of them
// throw; failures come back as nullopt or a placeholder and are logged
// under [PROBE].
namespace ddmstatus::probe {

inline constexpr const char* kVersionPlaceholder = "\xE2\x80\x93";   // "–"

struct DiskSpace {
    double free_gb{0.0};        // decimal GB (1e9 bytes)
    double free_percent{0.0};
};

std::optional<std::string> readTextFile(const std::string& path);

// VERSION_ID from os-release text, quotes stripped. Placeholder if absent.
std::string parseOsReleaseVersion(const std::string& text);
std::string readInstalledVersion(const std::string& os_release_path);

std::optional<DiskSpace> readDiskSpace(const std::string& mount_path);

// First field of /proc/uptime, in whole seconds.
std::optional<uint64_t> parseUptimeSeconds(const std::string& text);
std::optional<uint64_t> readUptimeSeconds(const std::string& proc_uptime_path);
int uptimeDays(uint64_t seconds);

bool isUpdateStaged(const std::string& marker_path);

enforcement::CivilTime localNow();

}
