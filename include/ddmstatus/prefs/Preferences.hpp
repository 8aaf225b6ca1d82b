#pragma once
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ddmstatus {

// Administrator-tunable thresholds and support contact details.
struct Preferences {
    int minimum_free_percent{10};     // MinimumDiskFreePercentage
    int excessive_uptime_days{7};     // DaysOfExcessiveUptimeWarning, 0 = off
    std::string support_team_name{"IT Support"};
    std::string support_team_phone;
    std::string support_team_email;
    std::string support_team_website;

    // tel:/mailto:/web links, each only when the field is set.
    std::optional<std::string> phoneUri() const;
    std::optional<std::string> emailUri() const;
    std::optional<std::string> websiteUri() const;
};

bool operator==(const Preferences& a, const Preferences& b);

// Each key falls back to its default when missing or of the wrong type.
Preferences preferencesFromJson(const nlohmann::json& j);

// Defaults if `text` is not a JSON object.
Preferences parsePreferences(const std::string& text);

// Managed file wins over the local one; defaults when neither exists.
Preferences loadPreferences(const std::string& managed_path, const std::string& local_path);

}
