#pragma once
#include <cstdint>
#include <string>

#include "ddmstatus/config/ConfigLoader.hpp"

namespace ddmstatus {

// Where each input of a snapshot is read from.
struct SourcePaths {
    std::string enforcement_log{"/var/log/install.log"};
    std::string os_release{"/etc/os-release"};
    std::string disk_mount{"/"};
    std::string uptime{"/proc/uptime"};
    std::string staged_marker{"/System/Volumes/Update/Prepared"};
    std::string managed_prefs{"/etc/ddmstatus/managed/com.github.ddmstatusapp.json"};
    std::string local_prefs{"/etc/ddmstatus/com.github.ddmstatusapp.json"};
};

struct AgentConfig {
    SourcePaths paths;
    int refresh_interval_sec{3600};
    uint16_t http_port{8787};
    std::string http_address{"127.0.0.1"};

    // Missing keys keep their defaults. Out-of-range numbers are logged
    // and replaced by the default.
    static AgentConfig fromLoader(const ConfigLoader& cfg);
};

}
