// =============================================================================
// tests/config_test.cpp - INI loader, agent config and preference files
// =============================================================================

#include <sstream>

#include "TestHarness.hpp"
#include "ddmstatus/config/AgentConfig.hpp"
#include "ddmstatus/config/ConfigLoader.hpp"
#include "ddmstatus/prefs/Preferences.hpp"

using namespace ddmstatus;

namespace {

class ConfigTest : public testing::TestHarness {
public:
    ConfigTest() : TestHarness("config") {}

    void run_all_tests() {
        test_ini_parsing();
        test_agent_config();
        test_preferences_json();
        test_preference_file_priority();
        test_support_links();
        print_summary();
    }

private:
    testing::TempDir dir_{"ddmstatus_config"};

    void test_ini_parsing() {
        section("INI parsing");

        std::istringstream in(
            "# comment\n"
            "; another\n"
            "[paths]\n"
            "  enforcement_log =  /tmp/install.log  \n"
            "\n"
            "[agent]\n"
            "refresh_interval_sec=60\n"
            "broken = 12abc\n");
        ConfigLoader cfg;
        check(cfg.parse(in), "parse finds keys");
        check_eq(cfg.get("paths", "enforcement_log"), std::string("/tmp/install.log"),
                 "value trimmed");
        check_eq(cfg.getInt("agent", "refresh_interval_sec", 0), 60, "integer value");
        check_eq(cfg.getInt("agent", "broken", 7), 7, "non-integer falls back");
        check_eq(cfg.getInt("agent", "absent", 5), 5, "absent falls back");
        check_eq(cfg.get("agent", "enforcement_log", "unset"), std::string("unset"),
                 "keys are per section");

        std::istringstream empty("# only comments\n");
        ConfigLoader none;
        check(!none.parse(empty), "no keys means false");

        std::string path = dir_.write("agent.ini", "[http]\nport = 9000\n");
        ConfigLoader fromFile;
        check(fromFile.load(path), "explicit file loads");
        check_eq(fromFile.getConfigPath(), path, "config path recorded");
        check_eq(fromFile.getInt("http", "port", 0), 9000, "value from file");

        auto paths = ConfigLoader::searchPaths("/x/y.ini");
        check(!paths.empty() && paths.front() == "/x/y.ini", "explicit path searched first");
        std::cout << "\n";
    }

    void test_agent_config() {
        section("agent config");

        ConfigLoader empty;
        AgentConfig def = AgentConfig::fromLoader(empty);
        check_eq(def.paths.enforcement_log, std::string("/var/log/install.log"), "default log path");
        check_eq(def.refresh_interval_sec, 3600, "hourly by default");
        check_eq(def.http_port, uint16_t(8787), "default port");
        check_eq(def.paths.staged_marker, std::string("/System/Volumes/Update/Prepared"),
                 "default staged marker");

        std::istringstream in(
            "[paths]\nenforcement_log = /srv/install.log\nlocal_prefs = /srv/prefs.json\n"
            "[agent]\nrefresh_interval_sec = 0\n"
            "[http]\nport = 70000\naddress = 0.0.0.0\n");
        ConfigLoader cfg;
        cfg.parse(in);
        AgentConfig ac = AgentConfig::fromLoader(cfg);
        check_eq(ac.paths.enforcement_log, std::string("/srv/install.log"), "log path override");
        check_eq(ac.paths.local_prefs, std::string("/srv/prefs.json"), "prefs path override");
        check_eq(ac.paths.os_release, std::string("/etc/os-release"), "unset path keeps default");
        check_eq(ac.refresh_interval_sec, 3600, "zero interval rejected");
        check_eq(ac.http_port, uint16_t(8787), "out-of-range port rejected");
        check_eq(ac.http_address, std::string("0.0.0.0"), "address override");
        std::cout << "\n";
    }

    void test_preferences_json() {
        section("preference documents");

        Preferences def;
        check_eq(def.minimum_free_percent, 10, "disk default");
        check_eq(def.excessive_uptime_days, 7, "uptime default");
        check_eq(def.support_team_name, std::string("IT Support"), "team name default");

        Preferences p = parsePreferences(R"({
            "MinimumDiskFreePercentage": 15,
            "DaysOfExcessiveUptimeWarning": 0,
            "SupportTeamName": "Service Desk",
            "SupportTeamPhone": "+41 21 000 00 00",
            "SupportTeamEmail": "help@example.org",
            "SupportTeamWebsite": "https://help.example.org"
        })");
        check_eq(p.minimum_free_percent, 15, "disk threshold read");
        check_eq(p.excessive_uptime_days, 0, "uptime warning disabled");
        check_eq(p.support_team_name, std::string("Service Desk"), "team name read");
        check_eq(p.support_team_email, std::string("help@example.org"), "email read");

        Preferences mixed = parsePreferences(R"({
            "MinimumDiskFreePercentage": "twenty",
            "DaysOfExcessiveUptimeWarning": 3.5,
            "SupportTeamName": 42,
            "SupportTeamPhone": "123"
        })");
        check_eq(mixed.minimum_free_percent, 10, "wrong-typed int falls back");
        check_eq(mixed.excessive_uptime_days, 7, "float falls back");
        check_eq(mixed.support_team_name, std::string("IT Support"), "wrong-typed string falls back");
        check_eq(mixed.support_team_phone, std::string("123"), "valid key alongside bad ones");

        Preferences wide = parsePreferences(R"({
            "MinimumDiskFreePercentage": 4294967306,
            "DaysOfExcessiveUptimeWarning": -4294967296
        })");
        check_eq(wide.minimum_free_percent, 10, "integer above int range falls back");
        check_eq(wide.excessive_uptime_days, 7, "integer below int range falls back");

        Preferences edge = parsePreferences(R"({"MinimumDiskFreePercentage": 2147483647})");
        check_eq(edge.minimum_free_percent, 2147483647, "largest int accepted");

        check(parsePreferences("{not json") == Preferences{}, "unparsable text gives defaults");
        check(parsePreferences("[1,2,3]") == Preferences{}, "non-object gives defaults");
        std::cout << "\n";
    }

    void test_preference_file_priority() {
        section("preference file priority");

        std::string managed = dir_.write("managed.json", R"({"SupportTeamName":"Managed"})");
        std::string local   = dir_.write("local.json", R"({"SupportTeamName":"Local","MinimumDiskFreePercentage":20})");
        std::string absent  = dir_.file("absent.json");

        Preferences both = loadPreferences(managed, local);
        check_eq(both.support_team_name, std::string("Managed"), "managed wins");
        check_eq(both.minimum_free_percent, 10, "local values are not merged in");

        Preferences localOnly = loadPreferences(absent, local);
        check_eq(localOnly.support_team_name, std::string("Local"), "local used without managed");
        check_eq(localOnly.minimum_free_percent, 20, "local value read");

        check(loadPreferences(absent, dir_.file("also-absent.json")) == Preferences{},
              "no files gives defaults");

        std::string broken = dir_.write("broken.json", "{{{");
        check(loadPreferences(broken, local) == Preferences{},
              "broken managed file gives defaults, not the local file");
        std::cout << "\n";
    }

    void test_support_links() {
        section("support links");

        Preferences p;
        check(!p.phoneUri() && !p.emailUri() && !p.websiteUri(), "no links by default");

        p.support_team_phone = "+41 21 555 12 34";
        p.support_team_email = "it@example.org";
        p.support_team_website = "https://it.example.org";
        check(p.phoneUri() && *p.phoneUri() == "tel:+41215551234", "phone spaces removed");
        check(p.emailUri() && *p.emailUri() == "mailto:it@example.org", "mailto link");
        check(p.websiteUri() && *p.websiteUri() == "https://it.example.org", "website verbatim");
        std::cout << "\n";
    }
};

}

int main() {
    ConfigTest tester;
    tester.run_all_tests();
    return tester.exit_code();
}
