#pragma once
// =============================================================================
// ConfigLoader.hpp - INI File Parser for the ddmstatus agent
// =============================================================================
// [section] headers, key = value pairs, '#' and ';' comments.
// Keys are stored as "section.key".
// =============================================================================

#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

namespace ddmstatus {

class ConfigLoader {
public:
    // Tries `path` first, then the standard locations. Returns false when no
    // file was found; callers fall back to built-in defaults.
    bool load(const std::string& path = "");

    // Parses an already-open stream. Returns false if no key was found.
    bool parse(std::istream& in);

    std::string get(const std::string& section, const std::string& key,
                    const std::string& defaultVal = "") const;
    int getInt(const std::string& section, const std::string& key, int defaultVal = 0) const;

    const std::string& getConfigPath() const { return configPath_; }

    static std::vector<std::string> searchPaths(const std::string& path);

    void dump() const;

private:
    std::unordered_map<std::string, std::string> values_;
    std::string configPath_;
};

} // namespace ddmstatus
