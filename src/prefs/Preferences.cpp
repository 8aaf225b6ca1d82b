#include "ddmstatus/prefs/Preferences.hpp"
#include "ddmstatus/probe/SystemProbe.hpp"
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <limits>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace ddmstatus {

static int intOr(const json& j, const char* key, int fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) return fallback;
    if (it->is_number_unsigned()) {
        auto v = it->get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return fallback;
        return static_cast<int>(v);
    }
    auto v = it->get<std::int64_t>();
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return fallback;
    return static_cast<int>(v);
}

static std::string stringOr(const json& j, const char* key, const std::string& fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

std::optional<std::string> Preferences::phoneUri() const {
    if (support_team_phone.empty()) return std::nullopt;
    std::string digits;
    for (char c : support_team_phone) {
        if (c != ' ') digits.push_back(c);
    }
    return "tel:" + digits;
}

std::optional<std::string> Preferences::emailUri() const {
    if (support_team_email.empty()) return std::nullopt;
    return "mailto:" + support_team_email;
}

std::optional<std::string> Preferences::websiteUri() const {
    if (support_team_website.empty()) return std::nullopt;
    return support_team_website;
}

bool operator==(const Preferences& a, const Preferences& b) {
    return a.minimum_free_percent == b.minimum_free_percent &&
           a.excessive_uptime_days == b.excessive_uptime_days &&
           a.support_team_name == b.support_team_name &&
           a.support_team_phone == b.support_team_phone &&
           a.support_team_email == b.support_team_email &&
           a.support_team_website == b.support_team_website;
}

Preferences preferencesFromJson(const json& j) {
    Preferences d;
    if (!j.is_object()) return d;

    Preferences p;
    p.minimum_free_percent  = intOr(j, "MinimumDiskFreePercentage", d.minimum_free_percent);
    p.excessive_uptime_days = intOr(j, "DaysOfExcessiveUptimeWarning", d.excessive_uptime_days);
    p.support_team_name     = stringOr(j, "SupportTeamName", d.support_team_name);
    p.support_team_phone    = stringOr(j, "SupportTeamPhone", d.support_team_phone);
    p.support_team_email    = stringOr(j, "SupportTeamEmail", d.support_team_email);
    p.support_team_website  = stringOr(j, "SupportTeamWebsite", d.support_team_website);
    return p;
}

Preferences parsePreferences(const std::string& text) {
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            std::cerr << "[PREFS] preference document is not an object\n";
            return Preferences{};
        }
        return preferencesFromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[PREFS] parse failed: " << e.what() << "\n";
        return Preferences{};
    }
}

Preferences loadPreferences(const std::string& managed_path, const std::string& local_path) {
    std::error_code ec;
    std::string chosen;
    if (fs::exists(managed_path, ec)) {
        chosen = managed_path;
    } else if (fs::exists(local_path, ec)) {
        chosen = local_path;
    } else {
        return Preferences{};
    }

    auto text = probe::readTextFile(chosen);
    if (!text) {
        std::cerr << "[PREFS] cannot read " << chosen << "\n";
        return Preferences{};
    }
    return parsePreferences(*text);
}

}
