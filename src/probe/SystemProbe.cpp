#include "ddmstatus/probe/SystemProbe.hpp"
#include <sys/statvfs.h>
#include <cerrno>
#include <cmath>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace ddmstatus::probe {

std::optional<std::string> readTextFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return std::nullopt;

    std::string data(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>()
    );
    if (in.bad()) return std::nullopt;
    return data;
}

std::string parseOsReleaseVersion(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("VERSION_ID=", 0) != 0) continue;

        std::string value = line.substr(std::strlen("VERSION_ID="));
        while (!value.empty() && (value.back() == '\r' || value.back() == ' ')) value.pop_back();
        if (value.size() >= 2 &&
            (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        if (value.empty()) break;
        return value;
    }
    return kVersionPlaceholder;
}

std::string readInstalledVersion(const std::string& os_release_path) {
    auto text = readTextFile(os_release_path);
    if (!text) {
        std::cerr << "[PROBE] cannot read " << os_release_path << "\n";
        return kVersionPlaceholder;
    }
    return parseOsReleaseVersion(*text);
}

std::optional<DiskSpace> readDiskSpace(const std::string& mount_path) {
    struct statvfs st{};
    if (::statvfs(mount_path.c_str(), &st) != 0) {
        std::cerr << "[PROBE] statvfs(" << mount_path << "): "
                  << std::strerror(errno) << "\n";
        return std::nullopt;
    }

    const double total = static_cast<double>(st.f_blocks) * st.f_frsize;
    const double avail = static_cast<double>(st.f_bavail) * st.f_frsize;
    if (total <= 0.0) return std::nullopt;

    DiskSpace ds;
    ds.free_gb      = avail / 1e9;
    ds.free_percent = (avail / total) * 100.0;
    return ds;
}

std::optional<uint64_t> parseUptimeSeconds(const std::string& text) {
    std::istringstream in(text);
    double seconds = -1.0;
    if (!(in >> seconds) || !std::isfinite(seconds) || seconds < 0.0) return std::nullopt;
    // 2^64 as a double; anything at or above it does not fit.
    if (seconds >= 18446744073709551616.0) return std::nullopt;
    return static_cast<uint64_t>(seconds);
}

std::optional<uint64_t> readUptimeSeconds(const std::string& proc_uptime_path) {
    auto text = readTextFile(proc_uptime_path);
    if (!text) {
        std::cerr << "[PROBE] cannot read " << proc_uptime_path << "\n";
        return std::nullopt;
    }
    return parseUptimeSeconds(*text);
}

int uptimeDays(uint64_t seconds) {
    return static_cast<int>(seconds / 86400ULL);
}

bool isUpdateStaged(const std::string& marker_path) {
    std::error_code ec;
    return fs::exists(marker_path, ec);
}

enforcement::CivilTime localNow() {
    auto now = std::chrono::system_clock::now();
    return enforcement::fromLocalTime(std::chrono::system_clock::to_time_t(now));
}

}
