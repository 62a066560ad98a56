#pragma once

/**
 * @file test_common.h
 * @brief Minimal check helpers shared by the Huginn test executables
 *
 * Each test is a function returning TestResult. A suite runs every test
 * (or only the ones named with --test-<name>) and exits non-zero if any
 * failed, so the executables plug straight into CTest.
 */

#include "huginn/types.h"
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <random>
#include <string>
#include <thread>
#include <vector>

struct TestResult {
    std::string test_name;
    bool passed = false;
    std::string expected;
    std::string actual;
    std::string details;
};

inline void print_result(const TestResult& r) {
    std::cout << (r.passed ? "    ✓ " : "    ✗ ") << r.test_name;
    if (!r.details.empty()) {
        std::cout << " - " << r.details;
    }
    if (!r.passed) {
        if (!r.expected.empty()) std::cout << "\n      Expected: " << r.expected;
        if (!r.actual.empty()) std::cout << "\n      Actual:   " << r.actual;
    }
    std::cout << "\n";
}

inline int print_summary(const std::string& suite, const std::vector<TestResult>& results) {
    size_t failed = 0;
    for (const auto& r : results) {
        if (!r.passed) ++failed;
    }

    std::cout << "\n═══════════════════════════════════════════════════════════\n";
    std::cout << suite << ": " << (results.size() - failed) << " passed, "
              << failed << " failed, " << results.size() << " total\n";
    std::cout << "═══════════════════════════════════════════════════════════\n";
    return failed > 0 ? 1 : 0;
}

// Printable form of a checked value
template <typename T>
std::string test_value(const T& value) {
    using huginn::to_string;
    using std::to_string;
    return to_string(value);
}

inline std::string test_value(const std::string& value) {
    return "\"" + value + "\"";
}

inline std::string test_value(const char* value) {
    return test_value(std::string(value ? value : ""));
}

#define ASSERT_TRUE(_cond, _m)                                                  \
    do {                                                                        \
        if (!(_cond)) {                                                         \
            TestResult _fail_result;                                            \
            _fail_result.details = std::string(_m) + " [" #_cond "]";           \
            return _fail_result;                                                \
        }                                                                       \
    } while (0)

#define ASSERT_EQ(_a, _e, _m)                                                   \
    do {                                                                        \
        auto _av = (_a);                                                        \
        auto _ev = (_e);                                                        \
        if (!(_av == _ev)) {                                                    \
            TestResult _fail_result;                                            \
            _fail_result.expected = test_value(_ev);                            \
            _fail_result.actual = test_value(_av);                              \
            _fail_result.details = (_m);                                        \
            return _fail_result;                                                \
        }                                                                       \
    } while (0)

inline TestResult make_pass_result() {
    TestResult r;
    r.passed = true;
    return r;
}

#define TEST_PASS() make_pass_result()

/**
 * @brief Ordered test runner
 *
 * No arguments runs everything; --test-<name> runs a subset.
 */
class TestSuite {
public:
    explicit TestSuite(const std::string& name) : suite_name_(name) {}

    void add(const std::string& test_name, std::function<TestResult()> fn) {
        tests_[test_name] = std::move(fn);
        order_.push_back(test_name);
    }

    int run(int argc, char** argv) {
        std::cout << "═══════════════════════════════════════════════════════════\n";
        std::cout << suite_name_ << "\n";
        std::cout << "═══════════════════════════════════════════════════════════\n";

        std::vector<std::string> selected;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg.rfind("--test-", 0) == 0) {
                selected.push_back(arg.substr(7));
            }
        }
        if (selected.empty()) {
            selected = order_;
        }

        std::vector<TestResult> results;
        for (const auto& name : selected) {
            TestResult r;
            auto it = tests_.find(name);
            if (it == tests_.end()) {
                r.details = "Unknown test name";
            } else {
                std::cout << "\n[" << name << "]\n";
                try {
                    r = it->second();
                } catch (const std::exception& e) {
                    r = TestResult{};
                    r.details = std::string("Unexpected exception: ") + e.what();
                }
            }
            r.test_name = name;
            print_result(r);
            results.push_back(r);
        }

        return print_summary(suite_name_, results);
    }

private:
    std::string suite_name_;
    std::map<std::string, std::function<TestResult()>> tests_;
    std::vector<std::string> order_;
};

/**
 * @brief Scratch directory removed on scope exit
 */
class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "-" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

/**
 * @brief Poll a condition until it holds or the timeout expires
 */
inline bool wait_until(const std::function<bool()>& condition,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return condition();
}
