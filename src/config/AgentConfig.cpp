#include "ddmstatus/config/AgentConfig.hpp"
#include <iostream>

namespace ddmstatus {

AgentConfig AgentConfig::fromLoader(const ConfigLoader& cfg) {
    AgentConfig out;
    SourcePaths& p = out.paths;

    p.enforcement_log = cfg.get("paths", "enforcement_log", p.enforcement_log);
    p.os_release      = cfg.get("paths", "os_release", p.os_release);
    p.disk_mount      = cfg.get("paths", "disk_mount", p.disk_mount);
    p.uptime          = cfg.get("paths", "uptime", p.uptime);
    p.staged_marker   = cfg.get("paths", "staged_marker", p.staged_marker);
    p.managed_prefs   = cfg.get("paths", "managed_prefs", p.managed_prefs);
    p.local_prefs     = cfg.get("paths", "local_prefs", p.local_prefs);

    int interval = cfg.getInt("agent", "refresh_interval_sec", out.refresh_interval_sec);
    if (interval < 1) {
        std::cerr << "[CONFIG] agent.refresh_interval_sec must be >= 1, got "
                  << interval << "\n";
    } else {
        out.refresh_interval_sec = interval;
    }

    int port = cfg.getInt("http", "port", out.http_port);
    if (port < 1 || port > 65535) {
        std::cerr << "[CONFIG] http.port out of range: " << port << "\n";
    } else {
        out.http_port = static_cast<uint16_t>(port);
    }
    out.http_address = cfg.get("http", "address", out.http_address);

    return out;
}

}
