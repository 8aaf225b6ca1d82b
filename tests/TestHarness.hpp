#pragma once
// =============================================================================
// TestHarness.hpp - pass/fail bookkeeping shared by the test executables
// =============================================================================

#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace ddmstatus::testing {

class TestHarness {
public:
    explicit TestHarness(const char* title) : title_(title) {}

    int exit_code() const { return tests_failed_ == 0 ? 0 : 1; }

protected:
    void section(const char* name) {
        std::cout << "Testing " << name << "...\n";
    }

    void test_pass(const char* name) {
        std::cout << "  \xE2\x9C\x93 " << name << "\n";
        tests_passed_++;
    }

    void test_fail(const char* name, const std::string& reason) {
        std::cout << "  \xE2\x9C\x97 " << name << " - " << reason << "\n";
        tests_failed_++;
    }

    void check(bool ok, const char* name, const std::string& reason = "condition false") {
        if (ok) test_pass(name);
        else test_fail(name, reason);
    }

    template <typename A, typename B>
    void check_eq(const A& actual, const B& expected, const char* name) {
        if (actual == expected) {
            test_pass(name);
        } else {
            std::ostringstream why;
            why << "got '" << actual << "', expected '" << expected << "'";
            test_fail(name, why.str());
        }
    }

    void print_summary() {
        std::cout << "\n== " << title_ << ": "
                  << tests_passed_ << " passed, " << tests_failed_ << " failed ==\n";
        if (tests_failed_ == 0) {
            std::cout << "ALL TESTS PASSED\n";
        } else {
            std::cout << "SOME TESTS FAILED\n";
        }
    }

private:
    const char* title_;
    int tests_passed_ = 0;
    int tests_failed_ = 0;
};

// Scratch directory removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        namespace fs = std::filesystem;
        static int created = 0;
        path_ = fs::temp_directory_path() /
                (tag + "_" + std::to_string(::getpid()) + "_" + std::to_string(++created));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string file(const std::string& name) const { return (path_ / name).string(); }

    std::string write(const std::string& name, const std::string& content) const {
        std::string p = file(name);
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p;
    }

private:
    std::filesystem::path path_;
};

}
