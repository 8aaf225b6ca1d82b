#include "ddmstatus/enforcement/EnforcementEvaluator.hpp"
#include <algorithm>
#include <charconv>
#include <cstring>
#include <string_view>

namespace ddmstatus::enforcement {

static constexpr const char* kWhitespace = " \t\r\n\v\f";

static std::string_view trim(std::string_view s) {
    size_t start = s.find_first_not_of(kWhitespace);
    if (start == std::string_view::npos) return {};
    size_t end = s.find_last_not_of(kWhitespace);
    return s.substr(start, end - start + 1);
}

// Walks lines from the end of the text. Returns the first one (i.e. the last
// in document order) containing `marker`.
static std::optional<std::string_view> lastLineContaining(std::string_view text,
                                                          std::string_view marker) {
    size_t end = text.size();
    for (;;) {
        size_t nl = (end == 0) ? std::string_view::npos : text.rfind('\n', end - 1);
        size_t begin = (nl == std::string_view::npos) ? 0 : nl + 1;

        std::string_view line = text.substr(begin, end - begin);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

        if (line.find(marker) != std::string_view::npos) return line;
        if (nl == std::string_view::npos) return std::nullopt;
        end = nl;
    }
}

bool operator==(const EnforcementRecord& a, const EnforcementRecord& b) {
    return a.deadline == b.deadline && a.required_version == b.required_version;
}

bool operator==(const EnforcementStatus& a, const EnforcementStatus& b) {
    return a.is_up_to_date == b.is_up_to_date &&
           a.days_remaining == b.days_remaining &&
           a.record == b.record;
}

Version parseVersion(const std::string& text) {
    Version out;
    std::string_view rest(text);

    while (!rest.empty()) {
        size_t dot = rest.find('.');
        std::string_view seg = rest.substr(0, dot);
        rest = (dot == std::string_view::npos) ? std::string_view{} : rest.substr(dot + 1);

        if (seg.empty()) continue;

        uint64_t value = 0;
        const char* first = seg.data();
        const char* last  = seg.data() + seg.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr != last) value = 0;
        out.push_back(value);
    }
    return out;
}

std::optional<EnforcementRecord> parseLatestEnforcement(const std::string& log_text) {
    auto found = lastLineContaining(log_text, kEnforcementMarker);
    if (!found) return std::nullopt;
    std::string_view line = *found;

    size_t date_pos    = line.find(kDeadlineKey);
    size_t version_pos = line.find(kVersionKey);
    if (date_pos == std::string_view::npos || version_pos == std::string_view::npos) {
        return std::nullopt;
    }

    std::string_view after_date = line.substr(date_pos + std::strlen(kDeadlineKey));
    size_t date_bar = after_date.find('|');
    if (date_bar == std::string_view::npos) return std::nullopt;

    auto deadline = parseIsoLocal(std::string(after_date.substr(0, date_bar)));
    if (!deadline) return std::nullopt;

    std::string_view after_version = line.substr(version_pos + std::strlen(kVersionKey));
    size_t version_bar = after_version.find('|');
    std::string_view version = (version_bar == std::string_view::npos)
        ? trim(after_version)
        : after_version.substr(0, version_bar);

    EnforcementRecord rec;
    rec.deadline = *deadline;
    rec.required_version = std::string(version);
    return rec;
}

int compareVersions(const Version& a, const Version& b) {
    const size_t n = std::max(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        uint64_t pa = i < a.size() ? a[i] : 0;
        uint64_t pb = i < b.size() ? b[i] : 0;
        if (pa < pb) return -1;
        if (pa > pb) return 1;
    }
    return 0;
}

int compareVersions(const std::string& a, const std::string& b) {
    return compareVersions(parseVersion(a), parseVersion(b));
}

EnforcementStatus evaluate(const std::string& installed_version,
                           const std::string& log_text,
                           const CivilTime& now) {
    EnforcementStatus status;

    auto record = parseLatestEnforcement(log_text);
    if (!record) return status;

    status.is_up_to_date  = compareVersions(installed_version, record->required_version) >= 0;
    status.days_remaining = static_cast<int>(calendarDaysBetween(now, record->deadline));
    status.record         = std::move(*record);
    return status;
}

}
