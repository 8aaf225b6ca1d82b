#include "ddmstatus/status/StatusSnapshot.hpp"

namespace ddmstatus {

static const char* const kDash  = probe::kVersionPlaceholder;   // "–"
static const char* const kCheck = "\xE2\x9C\x93";   // "✓"

const char* urgencyName(Urgency u) {
    switch (u) {
        case Urgency::UpToDate:  return "up_to_date";
        case Urgency::Scheduled: return "scheduled";
        case Urgency::Elevated:  return "elevated";
        case Urgency::High:      return "high";
        case Urgency::Critical:  return "critical";
        case Urgency::Unknown:   return "unknown";
    }
    return "unknown";
}

const char* urgencyColor(Urgency u) {
    switch (u) {
        case Urgency::UpToDate:  return "green";
        case Urgency::Scheduled: return "blue";
        case Urgency::Elevated:  return "yellow";
        case Urgency::High:      return "orange";
        case Urgency::Critical:  return "red";
        case Urgency::Unknown:   return "gray";
    }
    return "gray";
}

Urgency urgencyFor(const enforcement::EnforcementStatus& status) {
    if (status.is_up_to_date) return Urgency::UpToDate;
    if (!status.days_remaining) return Urgency::Unknown;

    const int days = *status.days_remaining;
    if (days <= 1) return Urgency::Critical;
    if (days <= 3) return Urgency::High;
    if (days <= 7) return Urgency::Elevated;
    return Urgency::Scheduled;
}

bool StatusSnapshot::diskSpaceOK() const {
    return free_space_percent >= static_cast<double>(prefs.minimum_free_percent);
}

bool StatusSnapshot::uptimeOK() const {
    return prefs.excessive_uptime_days == 0 ||
           last_reboot_days < prefs.excessive_uptime_days;
}

std::string StatusSnapshot::badgeText() const {
    if (enforcement.is_up_to_date) return kCheck;
    if (enforcement.days_remaining) return std::to_string(*enforcement.days_remaining);
    return kDash;
}

std::string StatusSnapshot::deadlineText() const {
    if (!enforcement.record) return kDash;
    return enforcement::formatLong(enforcement.record->deadline);
}

std::string StatusSnapshot::requiredVersionText() const {
    if (!enforcement.record) return kDash;
    return enforcement.record->required_version;
}

std::string StatusSnapshot::lastRebootText() const {
    if (last_reboot_days == 0) return "Today";
    return std::to_string(last_reboot_days) + " day(s) ago";
}

StatusSnapshot collectSnapshot(const SourcePaths& paths, const enforcement::CivilTime& now) {
    StatusSnapshot snap;
    snap.taken_at = now;
    snap.installed_version = probe::readInstalledVersion(paths.os_release);

    // A missing log means no enforcement entry: evaluates as up to date.
    std::string log_text = probe::readTextFile(paths.enforcement_log).value_or(std::string());
    snap.enforcement = enforcement::evaluate(snap.installed_version, log_text, now);

    if (auto disk = probe::readDiskSpace(paths.disk_mount)) {
        snap.free_space_gb      = disk->free_gb;
        snap.free_space_percent = disk->free_percent;
    }

    if (auto up = probe::readUptimeSeconds(paths.uptime)) {
        snap.last_reboot_days = probe::uptimeDays(*up);
    }

    snap.update_staged = probe::isUpdateStaged(paths.staged_marker);
    snap.prefs = loadPreferences(paths.managed_prefs, paths.local_prefs);
    return snap;
}

}
