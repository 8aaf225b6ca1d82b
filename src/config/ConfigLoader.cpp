#include "ddmstatus/config/ConfigLoader.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace ddmstatus {

std::vector<std::string> ConfigLoader::searchPaths(const std::string& path) {
    std::vector<std::string> paths;
    if (!path.empty()) paths.push_back(path);
    paths.push_back("ddmstatus.ini");
    paths.push_back("/etc/ddmstatus/ddmstatus.ini");
    return paths;
}

bool ConfigLoader::load(const std::string& path) {
    const auto paths = searchPaths(path);

    for (const auto& p : paths) {
        std::ifstream file(p);
        if (file.is_open()) {
            configPath_ = p;
            return parse(file);
        }
    }

    std::cerr << "[CONFIG] no config file found, using defaults. Searched:\n";
    for (const auto& p : paths) {
        std::cerr << "  - " << p << "\n";
    }
    return false;
}

bool ConfigLoader::parse(std::istream& in) {
    std::string line;
    std::string currentSection;

    while (std::getline(in, line)) {
        // Trim whitespace
        size_t start = line.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) continue;
        line = line.substr(start);

        size_t end = line.find_last_not_of(" \t\r\n");
        if (end != std::string::npos) {
            line = line.substr(0, end + 1);
        }

        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[') {
            size_t closePos = line.find(']');
            if (closePos != std::string::npos) {
                currentSection = line.substr(1, closePos - 1);
            }
            continue;
        }

        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos) continue;

        std::string key = line.substr(0, eqPos);
        std::string value = line.substr(eqPos + 1);

        end = key.find_last_not_of(" \t");
        if (end != std::string::npos) key = key.substr(0, end + 1);

        start = value.find_first_not_of(" \t");
        value = (start == std::string::npos) ? std::string() : value.substr(start);

        values_[currentSection + "." + key] = value;
    }

    return !values_.empty();
}

std::string ConfigLoader::get(const std::string& section, const std::string& key,
                              const std::string& defaultVal) const {
    auto it = values_.find(section + "." + key);
    if (it != values_.end()) {
        return it->second;
    }
    return defaultVal;
}

int ConfigLoader::getInt(const std::string& section, const std::string& key, int defaultVal) const {
    std::string val = get(section, key);
    if (val.empty()) return defaultVal;
    try {
        size_t used = 0;
        int v = std::stoi(val, &used);
        if (used != val.size()) throw std::invalid_argument(val);
        return v;
    } catch (const std::exception&) {
        std::cerr << "[CONFIG] " << section << "." << key << " = '" << val
                  << "' is not an integer, using " << defaultVal << "\n";
        return defaultVal;
    }
}

void ConfigLoader::dump() const {
    std::cout << "[CONFIG] Loaded from: "
              << (configPath_.empty() ? "<defaults>" : configPath_) << "\n";
    for (const auto& kv : values_) {
        std::cout << "  " << kv.first << " = " << kv.second << "\n";
    }
}

} // namespace ddmstatus
