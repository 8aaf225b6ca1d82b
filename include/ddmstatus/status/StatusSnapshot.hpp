#pragma once
#include <string>

#include "ddmstatus/config/AgentConfig.hpp"
#include "ddmstatus/enforcement/CivilTime.hpp"
#include "ddmstatus/enforcement/EnforcementEvaluator.hpp"
#include "ddmstatus/prefs/Preferences.hpp"
#include "ddmstatus/probe/SystemProbe.hpp"

namespace ddmstatus {

// How close a pending update is to its enforcement deadline.
enum class Urgency {
    UpToDate,
    Scheduled,   // more than a week left
    Elevated,    // <= 7 days
    High,        // <= 3 days
    Critical,    // <= 1 day, or overdue
    Unknown      // pending, no deadline
};

const char* urgencyName(Urgency u);
const char* urgencyColor(Urgency u);
Urgency urgencyFor(const enforcement::EnforcementStatus& status);

// Everything one refresh learned. Replaced wholesale on every refresh.
struct StatusSnapshot {
    enforcement::CivilTime taken_at;
    std::string installed_version{probe::kVersionPlaceholder};
    enforcement::EnforcementStatus enforcement;
    double free_space_gb{0.0};
    double free_space_percent{0.0};
    int last_reboot_days{0};
    bool update_staged{false};
    Preferences prefs;

    bool diskSpaceOK() const;
    bool uptimeOK() const;
    Urgency urgency() const { return urgencyFor(enforcement); }

    std::string badgeText() const;        // "✓", day count, or "–"
    std::string deadlineText() const;     // long date or "–"
    std::string requiredVersionText() const;
    std::string lastRebootText() const;   // "Today" / "<n> day(s) ago"
};

// Runs every probe against `paths` and evaluates enforcement at `now`.
StatusSnapshot collectSnapshot(const SourcePaths& paths, const enforcement::CivilTime& now);

}
