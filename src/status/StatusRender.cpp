#include "ddmstatus/status/StatusRender.hpp"
#include <cstdio>
#include <sstream>

using json = nlohmann::json;

namespace ddmstatus {

static std::string escapeLabel(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n";  break;
            default:   out += c;
        }
    }
    return out;
}

static std::string diskText(const StatusSnapshot& snap) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.1f GB (%.0f%%)",
                  snap.free_space_gb, snap.free_space_percent);
    return buf;
}

json toJson(const StatusSnapshot& snap) {
    const auto& e = snap.enforcement;
    const Urgency u = snap.urgency();

    json update;
    update["up_to_date"]     = e.is_up_to_date;
    update["urgency"]        = urgencyName(u);
    update["color"]          = urgencyColor(u);
    update["badge"]          = snap.badgeText();
    update["staged"]         = snap.update_staged;
    update["deadline_text"]  = snap.deadlineText();
    update["days_remaining"] = e.days_remaining ? json(*e.days_remaining) : json(nullptr);
    if (e.record) {
        update["required_version"] = e.record->required_version;
        update["deadline"]         = enforcement::formatIsoLocal(e.record->deadline);
    } else {
        update["required_version"] = nullptr;
        update["deadline"]         = nullptr;
    }

    json disk;
    disk["free_gb"]         = snap.free_space_gb;
    disk["free_percent"]    = snap.free_space_percent;
    disk["minimum_percent"] = snap.prefs.minimum_free_percent;
    disk["ok"]              = snap.diskSpaceOK();

    json uptime;
    uptime["last_reboot_days"] = snap.last_reboot_days;
    uptime["warning_days"]     = snap.prefs.excessive_uptime_days;
    uptime["ok"]               = snap.uptimeOK();
    uptime["text"]             = snap.lastRebootText();

    json links = json::object();
    if (auto v = snap.prefs.phoneUri())   links["phone"]   = *v;
    if (auto v = snap.prefs.emailUri())   links["email"]   = *v;
    if (auto v = snap.prefs.websiteUri()) links["website"] = *v;

    json support;
    support["name"]    = snap.prefs.support_team_name;
    support["phone"]   = snap.prefs.support_team_phone;
    support["email"]   = snap.prefs.support_team_email;
    support["website"] = snap.prefs.support_team_website;
    support["links"]   = links;

    json root;
    root["taken_at"]          = enforcement::formatIsoLocal(snap.taken_at);
    root["installed_version"] = snap.installed_version;
    root["update"]            = update;
    root["system"]            = {{"disk", disk}, {"uptime", uptime}};
    root["support"]           = support;
    return root;
}

std::string toPrometheus(const StatusSnapshot& snap) {
    const auto& e = snap.enforcement;
    std::ostringstream out;

    out << "ddmstatus_info{installed_version=\"" << escapeLabel(snap.installed_version)
        << "\",required_version=\""
        << escapeLabel(e.record ? e.record->required_version : std::string())
        << "\",urgency=\"" << urgencyName(snap.urgency()) << "\"} 1\n";
    out << "ddmstatus_up_to_date " << (e.is_up_to_date ? 1 : 0) << "\n";
    if (e.days_remaining) {
        out << "ddmstatus_days_remaining " << *e.days_remaining << "\n";
    }
    out << "ddmstatus_update_staged " << (snap.update_staged ? 1 : 0) << "\n"
        << "ddmstatus_disk_free_gb " << snap.free_space_gb << "\n"
        << "ddmstatus_disk_free_percent " << snap.free_space_percent << "\n"
        << "ddmstatus_disk_ok " << (snap.diskSpaceOK() ? 1 : 0) << "\n"
        << "ddmstatus_last_reboot_days " << snap.last_reboot_days << "\n"
        << "ddmstatus_uptime_ok " << (snap.uptimeOK() ? 1 : 0) << "\n";
    return out.str();
}

std::string toSummary(const StatusSnapshot& snap) {
    const auto& e = snap.enforcement;
    std::ostringstream out;

    out << "[" << snap.badgeText() << "] "
        << (e.is_up_to_date ? "System is up to date" : "Update required") << "\n"
        << "Installed: " << snap.installed_version << "\n";

    if (!e.is_up_to_date) {
        out << "\nUpdate\n"
            << "  Required version  " << snap.requiredVersionText() << "\n"
            << "  Deadline          " << snap.deadlineText() << "\n"
            << "  Days remaining    " << e.days_remaining.value_or(0)
            << " (" << urgencyName(snap.urgency()) << ")\n";
        if (snap.update_staged) {
            out << "  Update downloaded\n";
        }
    }

    out << "\nSystem\n"
        << "  Disk space   " << (snap.diskSpaceOK() ? "ok   " : "LOW  ")
        << diskText(snap) << "\n"
        << "  Last reboot  " << (snap.uptimeOK() ? "ok   " : "WARN ")
        << snap.lastRebootText() << "\n";

    out << "\n" << snap.prefs.support_team_name << "\n";
    if (auto v = snap.prefs.phoneUri())   out << "  " << *v << "\n";
    if (auto v = snap.prefs.emailUri())   out << "  " << *v << "\n";
    if (auto v = snap.prefs.websiteUri()) out << "  " << *v << "\n";
    return out.str();
}

}
