// =============================================================================
// tests/probe_test.cpp - system state readers
// =============================================================================

#include "TestHarness.hpp"
#include "ddmstatus/probe/SystemProbe.hpp"

using namespace ddmstatus;

namespace {

class ProbeTest : public testing::TestHarness {
public:
    ProbeTest() : TestHarness("probe") {}

    void run_all_tests() {
        test_os_release();
        test_uptime();
        test_files();
        test_disk();
        test_clock();
        print_summary();
    }

private:
    testing::TempDir dir_{"ddmstatus_probe"};

    void test_os_release() {
        section("os-release version");

        check_eq(probe::parseOsReleaseVersion(
                     "NAME=\"Ubuntu\"\nVERSION_ID=\"22.04\"\nID=ubuntu\n"),
                 std::string("22.04"), "quoted VERSION_ID");
        check_eq(probe::parseOsReleaseVersion("ID=debian\nVERSION_ID=12\n"),
                 std::string("12"), "bare VERSION_ID");
        check_eq(probe::parseOsReleaseVersion("VERSION_ID='15.6'\r\n"),
                 std::string("15.6"), "single quotes and CRLF");
        check_eq(probe::parseOsReleaseVersion("NAME=Arch\nID=arch\n"),
                 std::string(probe::kVersionPlaceholder), "missing VERSION_ID gives placeholder");
        check_eq(probe::parseOsReleaseVersion("VERSION_ID=\"\"\n"),
                 std::string(probe::kVersionPlaceholder), "empty VERSION_ID gives placeholder");
        check_eq(probe::parseOsReleaseVersion("MY_VERSION_ID=9\n"),
                 std::string(probe::kVersionPlaceholder), "prefix must match at line start");

        std::string path = dir_.write("os-release", "VERSION_ID=\"26.2\"\n");
        check_eq(probe::readInstalledVersion(path), std::string("26.2"), "read from file");
        check_eq(probe::readInstalledVersion(dir_.file("missing")),
                 std::string(probe::kVersionPlaceholder), "unreadable file gives placeholder");
        std::cout << "\n";
    }

    void test_uptime() {
        section("uptime");

        auto secs = probe::parseUptimeSeconds("694861.53 2713204.48\n");
        check(secs && *secs == 694861, "first field truncated to seconds");
        check(!probe::parseUptimeSeconds("garbage"), "garbage rejected");
        check(!probe::parseUptimeSeconds("-5 0"), "negative rejected");
        check(!probe::parseUptimeSeconds("1e30 0"), "value beyond 64 bits rejected");
        auto big = probe::parseUptimeSeconds("1e19 0");
        check(big && *big == 10000000000000000000ULL, "large value within 64 bits kept");

        check_eq(probe::uptimeDays(0), 0, "zero seconds is today");
        check_eq(probe::uptimeDays(86399), 0, "under a day is today");
        check_eq(probe::uptimeDays(86400), 1, "one day");
        check_eq(probe::uptimeDays(694861), 8, "eight days");

        std::string path = dir_.write("uptime", "172800.00 100.00\n");
        auto read = probe::readUptimeSeconds(path);
        check(read && *read == 172800, "read from file");
        check(!probe::readUptimeSeconds(dir_.file("nope")), "missing file");
        std::cout << "\n";
    }

    void test_files() {
        section("file helpers");

        std::string path = dir_.write("log", "line1\nline2\n");
        auto text = probe::readTextFile(path);
        check(text && *text == "line1\nline2\n", "whole file read");
        check(!probe::readTextFile(dir_.file("absent")), "absent file is nullopt");

        check(probe::isUpdateStaged(path), "existing marker is staged");
        check(!probe::isUpdateStaged(dir_.file("Prepared")), "missing marker is not staged");
        std::cout << "\n";
    }

    void test_disk() {
        section("disk space");

        auto root = probe::readDiskSpace("/");
        check(root.has_value(), "statvfs on /");
        if (root) {
            check(root->free_percent >= 0.0 && root->free_percent <= 100.0, "percent in range");
            check(root->free_gb >= 0.0, "free GB non-negative");
        }
        check(!probe::readDiskSpace(dir_.file("no/such/mount")), "bad path is nullopt");
        std::cout << "\n";
    }

    void test_clock() {
        section("local clock");

        auto now = probe::localNow();
        check(now.year >= 2024, "plausible year");
        check(now.month >= 1 && now.month <= 12, "month in range");
        check(now.day >= 1 && now.day <= enforcement::daysInMonth(now.year, now.month),
              "day in range");
        std::cout << "\n";
    }
};

}

int main() {
    ProbeTest tester;
    tester.run_all_tests();
    return tester.exit_code();
}
