#pragma once

// =============================================================================
// velo - Test Registration and Execution Framework
// =============================================================================
//
// Self-contained test framework with pytest-style output.
//
// Features:
//   - Auto-registration via __COUNTER__
//   - Test suites and grouping
//   - Skip markers (static and runtime)
//   - Assertion macros with expected/actual output
//   - Name, suite and exclude filters
//   - TAP output, fail-fast
//
// Usage:
//   VELO_TEST_BEGIN
//
//   VELO_TEST_UNIT(my_test) {
//       VELO_ASSERT_EQ(1 + 1, 2);
//   }
//
//   VELO_TEST_SUITE(math_tests)
//   VELO_TEST_CASE(addition) { ... }
//   VELO_TEST_SUITE_END
//
//   VELO_TEST_END
//   VELO_TEST_MAIN()
//
// CLI:
//   ./test --help                     # Show all options
//   ./test --filter "tau"             # Filter by name pattern
//   ./test --suite kinetics           # Filter by suite
//   ./test --exclude "slow"           # Exclude by name pattern
//   ./test --tap                      # TAP format output
//   ./test --fail-fast                # Stop on first failure
//   ./test --list                     # List tests
//   ./test -v / -q                    # Verbose / quiet
//
// =============================================================================

#ifndef VELO_TEST_CORE_HPP
#define VELO_TEST_CORE_HPP

#include <array>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#if defined(__unix__) || defined(__APPLE__)
#include <unistd.h>
#define VELO_TEST_UNIX_LIKE 1
#else
#define VELO_TEST_UNIX_LIKE 0
#endif

// =============================================================================
// Configuration
// =============================================================================

namespace velo::test {

constexpr std::size_t MAX_TEST_UNITS = 1024;
constexpr int DEFAULT_TERMINAL_WIDTH = 80;

} // namespace velo::test

// =============================================================================
// ANSI Color Codes
// =============================================================================

namespace velo::test::color {

inline bool& enabled() {
    static bool on = true;
    return on;
}

inline const char* pick(const char* code) { return enabled() ? code : ""; }

inline const char* reset()   { return pick("\033[0m"); }
inline const char* bold()    { return pick("\033[1m"); }
inline const char* dim()     { return pick("\033[2m"); }
inline const char* red()     { return pick("\033[38;5;203m"); }
inline const char* green()   { return pick("\033[38;5;114m"); }
inline const char* yellow()  { return pick("\033[38;5;221m"); }
inline const char* cyan()    { return pick("\033[38;5;80m"); }
inline const char* gray()    { return pick("\033[38;5;245m"); }

} // namespace velo::test::color

// =============================================================================
// Utilities
// =============================================================================

namespace velo::test::util {

inline bool is_tty() {
#if VELO_TEST_UNIX_LIKE
    return isatty(fileno(stdout)) != 0;
#else
    return false;
#endif
}

inline std::string format_duration(double ms) {
    char buf[32];
    if (ms < 1.0) {
        std::snprintf(buf, sizeof(buf), "%.0fus", ms * 1000.0);
    } else if (ms < 1000.0) {
        std::snprintf(buf, sizeof(buf), "%.1fms", ms);
    } else {
        std::snprintf(buf, sizeof(buf), "%.2fs", ms / 1000.0);
    }
    return buf;
}

} // namespace velo::test::util

// =============================================================================
// Exceptions
// =============================================================================

namespace velo::test {

class TestException : public std::exception {
public:
    TestException(const char* file, int line, const std::string& message,
                  const std::string& expected = "", const std::string& actual = "")
        : file_(file), line_(line), message_(message),
          expected_(expected), actual_(actual) {

        std::ostringstream oss;
        oss << file << ":" << line << ": " << message;
        if (!expected.empty() || !actual.empty()) {
            oss << "\n  Expected: " << expected;
            oss << "\n  Actual:   " << actual;
        }
        full_message_ = oss.str();
    }

    const char* what() const noexcept override { return full_message_.c_str(); }
    const char* file() const { return file_; }
    int line() const { return line_; }
    const std::string& message() const { return message_; }
    const std::string& expected() const { return expected_; }
    const std::string& actual() const { return actual_; }

private:
    const char* file_;
    int line_;
    std::string message_;
    std::string expected_;
    std::string actual_;
    std::string full_message_;
};

class SkipException : public std::exception {
public:
    explicit SkipException(const std::string& reason = "") : reason_(reason) {}
    const char* what() const noexcept override {
        return reason_.empty() ? "Test skipped" : reason_.c_str();
    }
    const std::string& reason() const { return reason_; }

private:
    std::string reason_;
};

} // namespace velo::test

// =============================================================================
// Test Metadata and Results
// =============================================================================

namespace velo::test {

enum class TestStatus {
    PENDING,
    PASSED,
    FAILED,
    SKIPPED,
    ERROR
};

inline const char* status_string(TestStatus status) {
    switch (status) {
        case TestStatus::PENDING: return "PENDING";
        case TestStatus::PASSED:  return "PASSED";
        case TestStatus::FAILED:  return "FAILED";
        case TestStatus::SKIPPED: return "SKIPPED";
        case TestStatus::ERROR:   return "ERROR";
    }
    return "UNKNOWN";
}

using test_func_t = void(*)();

struct TestInfo {
    test_func_t func = nullptr;
    const char* name_str = nullptr;
    const char* file = nullptr;
    int line = 0;
    const char* suite = nullptr;
    bool skip = false;
    const char* skip_reason = nullptr;
};

struct TestResult {
    const TestInfo* test = nullptr;
    TestStatus status = TestStatus::PENDING;
    double duration_ms = 0.0;
    std::string error_message;
    std::string expected_value;
    std::string actual_value;
};

} // namespace velo::test

// =============================================================================
// Global Test Storage
// =============================================================================

namespace velo::test::detail {

inline std::array<TestInfo, MAX_TEST_UNITS>& get_tests() {
    static std::array<TestInfo, MAX_TEST_UNITS> tests{};
    return tests;
}

inline std::size_t& get_count() {
    static std::size_t count = 0;
    return count;
}

inline const char*& current_suite() {
    static const char* suite = nullptr;
    return suite;
}

} // namespace velo::test::detail

// =============================================================================
// Test Configuration
// =============================================================================

namespace velo::test {

enum class OutputMode {
    HUMAN,
    TAP,
    QUIET
};

struct Config {
    OutputMode mode = OutputMode::HUMAN;
    const char* filter = nullptr;
    const char* exclude = nullptr;
    const char* suite_filter = nullptr;
    bool fail_fast = false;
    bool verbose = false;
    bool list_tests = false;

    static Config& instance() {
        static Config cfg;
        return cfg;
    }
};

inline void print_help(const char* prog_name) {
    std::printf("Usage: %s [options]\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -h, --help            Show this help\n");
    std::printf("  -f, --filter PATTERN  Run tests whose name contains PATTERN\n");
    std::printf("  -e, --exclude PATTERN Skip tests whose name contains PATTERN\n");
    std::printf("  -s, --suite PATTERN   Run tests of suites matching PATTERN\n");
    std::printf("  -x, --fail-fast       Stop on first failure\n");
    std::printf("  -l, --list            List tests and exit\n");
    std::printf("      --tap             TAP output\n");
    std::printf("      --no-color        Disable colors\n");
    std::printf("  -v, --verbose         Verbose output\n");
    std::printf("  -q, --quiet           Only print failures and the summary\n");
}

inline void parse_args(int argc, char* argv[]) {
    auto& cfg = Config::instance();
    color::enabled() = util::is_tty();

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](const char* opt) -> const char* {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "Missing value for %s\n", opt);
                std::exit(2);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            print_help(argv[0]);
            std::exit(0);
        } else if (arg == "-f" || arg == "--filter") {
            cfg.filter = next("--filter");
        } else if (arg == "-e" || arg == "--exclude") {
            cfg.exclude = next("--exclude");
        } else if (arg == "-s" || arg == "--suite") {
            cfg.suite_filter = next("--suite");
        } else if (arg == "-x" || arg == "--fail-fast") {
            cfg.fail_fast = true;
        } else if (arg == "-l" || arg == "--list") {
            cfg.list_tests = true;
        } else if (arg == "--tap") {
            cfg.mode = OutputMode::TAP;
            color::enabled() = false;
        } else if (arg == "--no-color") {
            color::enabled() = false;
        } else if (arg == "-v" || arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            cfg.mode = OutputMode::QUIET;
        } else {
            std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
            print_help(argv[0]);
            std::exit(2);
        }
    }
}

// =============================================================================
// Reporters
// =============================================================================

class Reporter {
public:
    virtual ~Reporter() = default;
    virtual void on_run_start(int total_tests) = 0;
    virtual void on_test_end(const TestResult& result) = 0;
    virtual void on_run_end(const std::vector<TestResult>& results, double total_time) = 0;
};

class HumanReporter : public Reporter {
public:
    explicit HumanReporter(bool quiet) : quiet_(quiet) {}

    void on_run_start(int total_tests) override {
        if (quiet_) return;
        std::printf("%s======== test session starts ========%s\n", color::bold(), color::reset());
        std::printf("collected %d item(s)\n\n", total_tests);
    }

    void on_test_end(const TestResult& result) override {
        const bool failed = result.status == TestStatus::FAILED || result.status == TestStatus::ERROR;
        if (quiet_ && !failed) return;

        const char* c = color::green();
        if (failed) c = color::red();
        else if (result.status == TestStatus::SKIPPED) c = color::yellow();

        std::printf("%s%-8s%s ", c, status_string(result.status), color::reset());
        if (result.test->suite) {
            std::printf("%s%s::%s", color::gray(), result.test->suite, color::reset());
        }
        std::printf("%s %s(%s)%s\n", result.test->name_str, color::dim(),
                    util::format_duration(result.duration_ms).c_str(), color::reset());

        if (failed || (result.status == TestStatus::SKIPPED && Config::instance().verbose)) {
            std::printf("    %s\n", result.error_message.c_str());
        }
    }

    void on_run_end(const std::vector<TestResult>& results, double total_time) override {
        int passed = 0, failed = 0, skipped = 0;
        for (const auto& r : results) {
            switch (r.status) {
                case TestStatus::PASSED:  ++passed; break;
                case TestStatus::SKIPPED: ++skipped; break;
                case TestStatus::FAILED:
                case TestStatus::ERROR:   ++failed; break;
                default: break;
            }
        }
        const char* c = failed > 0 ? color::red() : color::green();
        std::printf("\n%s%s==== %d passed, %d failed, %d skipped in %.2fs ====%s\n",
                    color::bold(), c, passed, failed, skipped, total_time, color::reset());
    }

private:
    bool quiet_;
};

class TAPReporter : public Reporter {
public:
    void on_run_start(int total_tests) override {
        std::printf("TAP version 13\n1..%d\n", total_tests);
    }

    void on_test_end(const TestResult& result) override {
        ++test_num_;
        const bool ok = result.status == TestStatus::PASSED || result.status == TestStatus::SKIPPED;
        std::printf("%s %d - %s", ok ? "ok" : "not ok", test_num_, result.test->name_str);
        if (result.status == TestStatus::SKIPPED) {
            std::printf(" # SKIP %s", result.error_message.c_str());
        }
        std::printf("\n");
        if (!ok) {
            std::printf("  ---\n  message: \"%s\"\n  ...\n", result.error_message.c_str());
        }
    }

    void on_run_end(const std::vector<TestResult>&, double) override {}

private:
    int test_num_ = 0;
};

// =============================================================================
// Test Runner
// =============================================================================

class Runner {
public:
    Runner() : cfg_(Config::instance()) {
        if (cfg_.mode == OutputMode::TAP) {
            reporter_ = std::make_unique<TAPReporter>();
        } else {
            reporter_ = std::make_unique<HumanReporter>(cfg_.mode == OutputMode::QUIET);
        }
    }

    int run() {
        const auto& tests = detail::get_tests();
        const std::size_t count = detail::get_count();

        std::vector<std::size_t> test_indices;
        for (std::size_t i = 0; i < count; ++i) {
            if (!tests[i].func) continue;
            if (!should_run(tests[i])) continue;
            test_indices.push_back(i);
        }

        if (cfg_.list_tests) {
            for (std::size_t idx : test_indices) {
                std::printf("%s%s%s\n", tests[idx].suite ? tests[idx].suite : "",
                            tests[idx].suite ? "::" : "", tests[idx].name_str);
            }
            return 0;
        }

        reporter_->on_run_start(static_cast<int>(test_indices.size()));
        const auto start_time = std::chrono::steady_clock::now();

        for (std::size_t idx : test_indices) {
            results_.push_back(run_test(tests[idx]));
            reporter_->on_test_end(results_.back());
            if (cfg_.fail_fast && is_failure(results_.back().status)) break;
        }

        const double total_time = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_time).count();
        reporter_->on_run_end(results_, total_time);

        for (const auto& r : results_) {
            if (is_failure(r.status)) return 1;
        }
        return 0;
    }

private:
    const Config& cfg_;
    std::unique_ptr<Reporter> reporter_;
    std::vector<TestResult> results_;

    static bool is_failure(TestStatus status) {
        return status == TestStatus::FAILED || status == TestStatus::ERROR;
    }

    bool should_run(const TestInfo& test) const {
        if (cfg_.filter && std::strstr(test.name_str, cfg_.filter) == nullptr) {
            return false;
        }
        if (cfg_.exclude && std::strstr(test.name_str, cfg_.exclude) != nullptr) {
            return false;
        }
        if (cfg_.suite_filter) {
            if (!test.suite || std::strstr(test.suite, cfg_.suite_filter) == nullptr) {
                return false;
            }
        }
        return true;
    }

    static TestResult run_test(const TestInfo& test) {
        TestResult result;
        result.test = &test;

        if (test.skip) {
            result.status = TestStatus::SKIPPED;
            result.error_message = test.skip_reason ? test.skip_reason : "";
            return result;
        }

        const auto start = std::chrono::steady_clock::now();
        try {
            test.func();
            result.status = TestStatus::PASSED;
        } catch (const SkipException& e) {
            result.status = TestStatus::SKIPPED;
            result.error_message = e.reason();
        } catch (const TestException& e) {
            result.status = TestStatus::FAILED;
            result.error_message = e.what();
            result.expected_value = e.expected();
            result.actual_value = e.actual();
        } catch (const std::exception& e) {
            result.status = TestStatus::ERROR;
            result.error_message = std::string("Unhandled exception: ") + e.what();
        } catch (...) {
            result.status = TestStatus::ERROR;
            result.error_message = "Unhandled non-standard exception";
        }
        result.duration_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
        return result;
    }
};

} // namespace velo::test

// =============================================================================
// Assertion Macros
// =============================================================================

namespace velo::test::detail {

template<typename T>
inline std::string to_string_impl(const T& value) {
    if constexpr (std::is_enum_v<T>) {
        return std::to_string(static_cast<long long>(value));
    } else if constexpr (std::is_same_v<T, unsigned char> || std::is_same_v<T, signed char>) {
        return std::to_string(static_cast<int>(value));
    } else {
        std::ostringstream oss;
        oss << std::boolalpha << value;
        return oss.str();
    }
}

inline std::string to_string_impl(const char* value) {
    return value ? std::string("\"") + value + "\"" : "nullptr";
}

inline std::string to_string_impl(const std::string& value) {
    return "\"" + value + "\"";
}

inline std::string to_string_impl(std::nullptr_t) {
    return "nullptr";
}

template<typename T>
inline std::string to_string_impl(T* ptr) {
    if (!ptr) return "nullptr";
    std::ostringstream oss;
    oss << "0x" << std::hex << reinterpret_cast<std::uintptr_t>(ptr);
    return oss.str();
}

template<typename T>
inline std::string value_to_string(const T& value) {
    return to_string_impl(value);
}

} // namespace velo::test::detail

#define VELO_ASSERT_MSG(expr, msg) \
    do { \
        if (!(expr)) { \
            throw ::velo::test::TestException(__FILE__, __LINE__, msg); \
        } \
    } while (0)

#define VELO_ASSERT_EQ(expected, actual) \
    do { \
        auto&& _exp = (expected); \
        auto&& _act = (actual); \
        if (!(_exp == _act)) { \
            throw ::velo::test::TestException(__FILE__, __LINE__, \
                "Expected equality: " #expected " == " #actual, \
                ::velo::test::detail::value_to_string(_exp), \
                ::velo::test::detail::value_to_string(_act)); \
        } \
    } while (0)

#define VELO_ASSERT_NE(expected, actual) \
    do { \
        auto&& _exp = (expected); \
        auto&& _act = (actual); \
        if (_exp == _act) { \
            throw ::velo::test::TestException(__FILE__, __LINE__, \
                "Expected inequality: " #expected " != " #actual, \
                "not " + ::velo::test::detail::value_to_string(_exp), \
                ::velo::test::detail::value_to_string(_act)); \
        } \
    } while (0)

#define VELO_ASSERT_LT(a, b) \
    do { \
        auto&& _a = (a); \
        auto&& _b = (b); \
        if (!(_a < _b)) { \
            throw ::velo::test::TestException(__FILE__, __LINE__, \
                "Expected: " #a " < " #b, \
                "< " + ::velo::test::detail::value_to_string(_b), \
                ::velo::test::detail::value_to_string(_a)); \
        } \
    } while (0)

#define VELO_ASSERT_LE(a, b) \
    do { \
        auto&& _a = (a); \
        auto&& _b = (b); \
        if (!(_a <= _b)) { \
            throw ::velo::test::TestException(__FILE__, __LINE__, \
                "Expected: " #a " <= " #b, \
                "<= " + ::velo::test::detail::value_to_string(_b), \
                ::velo::test::detail::value_to_string(_a)); \
        } \
    } while (0)

#define VELO_ASSERT_GT(a, b) \
    do { \
        auto&& _a = (a); \
        auto&& _b = (b); \
        if (!(_a > _b)) { \
            throw ::velo::test::TestException(__FILE__, __LINE__, \
                "Expected: " #a " > " #b, \
                "> " + ::velo::test::detail::value_to_string(_b), \
                ::velo::test::detail::value_to_string(_a)); \
        } \
    } while (0)

#define VELO_ASSERT_GE(a, b) \
    do { \
        auto&& _a = (a); \
        auto&& _b = (b); \
        if (!(_a >= _b)) { \
            throw ::velo::test::TestException(__FILE__, __LINE__, \
                "Expected: " #a " >= " #b, \
                ">= " + ::velo::test::detail::value_to_string(_b), \
                ::velo::test::detail::value_to_string(_a)); \
        } \
    } while (0)

#define VELO_ASSERT_TRUE(expr) \
    do { \
        if (!(expr)) { \
            throw ::velo::test::TestException(__FILE__, __LINE__, \
                "Expected true: " #expr, "true", "false"); \
        } \
    } while (0)

#define VELO_ASSERT_FALSE(expr) \
    do { \
        if (expr) { \
            throw ::velo::test::TestException(__FILE__, __LINE__, \
                "Expected false: " #expr, "false", "true"); \
        } \
    } while (0)

#define VELO_ASSERT_NOT_NULL(ptr) \
    do { \
        auto&& _ptr = (ptr); \
        if (_ptr == nullptr) { \
            throw ::velo::test::TestException(__FILE__, __LINE__, \
                "Expected non-null: " #ptr, "non-null", "nullptr"); \
        } \
    } while (0)

#define VELO_ASSERT_NULL(ptr) \
    do { \
        auto&& _ptr = (ptr); \
        if (_ptr != nullptr) { \
            throw ::velo::test::TestException(__FILE__, __LINE__, \
                "Expected nullptr: " #ptr, "nullptr", \
                ::velo::test::detail::value_to_string(_ptr)); \
        } \
    } while (0)

#define VELO_ASSERT_NEAR(expected, actual, tolerance) \
    do { \
        auto _exp = static_cast<double>(expected); \
        auto _act = static_cast<double>(actual); \
        auto _tol = static_cast<double>(tolerance); \
        if (!(std::abs(_exp - _act) <= _tol)) { \
            throw ::velo::test::TestException(__FILE__, __LINE__, \
                "Expected near: |" #expected " - " #actual "| <= " #tolerance, \
                std::to_string(_exp) + " +/- " + std::to_string(_tol), \
                std::to_string(_act)); \
        } \
    } while (0)

#define VELO_ASSERT_NAN(value) \
    do { \
        auto _v = static_cast<double>(value); \
        if (!std::isnan(_v)) { \
            throw ::velo::test::TestException(__FILE__, __LINE__, \
                "Expected NaN: " #value, "nan", std::to_string(_v)); \
        } \
    } while (0)

#define VELO_ASSERT_FINITE(value) \
    do { \
        auto _v = static_cast<double>(value); \
        if (!std::isfinite(_v)) { \
            throw ::velo::test::TestException(__FILE__, __LINE__, \
                "Expected finite: " #value, "finite", std::to_string(_v)); \
        } \
    } while (0)

#define VELO_ASSERT_STR_EQ(expected, actual) \
    do { \
        std::string _exp(expected); \
        std::string _act(actual); \
        if (_exp != _act) { \
            throw ::velo::test::TestException(__FILE__, __LINE__, \
                "String mismatch", \
                "\"" + _exp + "\"", \
                "\"" + _act + "\""); \
        } \
    } while (0)

#define VELO_ASSERT_THROWS(expr, exception_type) \
    do { \
        bool _caught = false; \
        try { \
            expr; \
        } catch (const exception_type&) { \
            _caught = true; \
        } catch (...) { \
            throw ::velo::test::TestException(__FILE__, __LINE__, \
                "Wrong exception type thrown by: " #expr, \
                #exception_type, "different exception"); \
        } \
        if (!_caught) { \
            throw ::velo::test::TestException(__FILE__, __LINE__, \
                "Expected exception not thrown: " #expr, \
                #exception_type, "no exception"); \
        } \
    } while (0)

#define VELO_ASSERT_NO_THROW(expr) \
    do { \
        try { \
            expr; \
        } catch (const std::exception& e) { \
            throw ::velo::test::TestException(__FILE__, __LINE__, \
                "Unexpected exception: " #expr, \
                "no exception", e.what()); \
        } catch (...) { \
            throw ::velo::test::TestException(__FILE__, __LINE__, \
                "Unexpected exception: " #expr, \
                "no exception", "unknown exception"); \
        } \
    } while (0)

#define VELO_FAIL(msg) \
    throw ::velo::test::TestException(__FILE__, __LINE__, msg)

#define VELO_SKIP(reason) \
    throw ::velo::test::SkipException(reason)

#define VELO_SKIP_IF(condition, reason) \
    do { \
        if (condition) { \
            throw ::velo::test::SkipException(reason); \
        } \
    } while (0)

// =============================================================================
// Test Registration Macros
// =============================================================================

#define VELO_TEST_BEGIN \
    namespace { \
    static constexpr std::size_t _velo_test_base = __COUNTER__;

#define VELO_TEST_UNIT(name) \
    static void _velo_test_##name(); \
    [[maybe_unused]] static bool _velo_reg_##name = []() { \
        constexpr std::size_t idx = __COUNTER__ - _velo_test_base - 1; \
        static_assert(idx < ::velo::test::MAX_TEST_UNITS, "too many tests in one file"); \
        auto& test_info = ::velo::test::detail::get_tests()[idx]; \
        test_info.func = _velo_test_##name; \
        test_info.name_str = #name; \
        test_info.file = __FILE__; \
        test_info.line = __LINE__; \
        test_info.suite = ::velo::test::detail::current_suite(); \
        if (idx + 1 > ::velo::test::detail::get_count()) { \
            ::velo::test::detail::get_count() = idx + 1; \
        } \
        return true; \
    }(); \
    static void _velo_test_##name()

#define VELO_TEST_SKIP(name, reason) \
    static void _velo_test_##name(); \
    [[maybe_unused]] static bool _velo_reg_##name = []() { \
        constexpr std::size_t idx = __COUNTER__ - _velo_test_base - 1; \
        auto& test_info = ::velo::test::detail::get_tests()[idx]; \
        test_info.func = _velo_test_##name; \
        test_info.name_str = #name; \
        test_info.file = __FILE__; \
        test_info.line = __LINE__; \
        test_info.suite = ::velo::test::detail::current_suite(); \
        test_info.skip = true; \
        test_info.skip_reason = reason; \
        if (idx + 1 > ::velo::test::detail::get_count()) { \
            ::velo::test::detail::get_count() = idx + 1; \
        } \
        return true; \
    }(); \
    static void _velo_test_##name()

#define VELO_TEST_SUITE(name) \
    namespace _velo_suite_##name { \
    [[maybe_unused]] static bool _velo_suite_init = []() { \
        ::velo::test::detail::current_suite() = #name; \
        return true; \
    }();

#define VELO_TEST_SUITE_END \
    [[maybe_unused]] static bool _velo_suite_cleanup = []() { \
        ::velo::test::detail::current_suite() = nullptr; \
        return true; \
    }(); \
    }

#define VELO_TEST_CASE(name) VELO_TEST_UNIT(name)

#define VELO_TEST_END \
    } /* anonymous namespace */

#define VELO_TEST_MAIN() \
    int main(int argc, char* argv[]) { \
        ::velo::test::parse_args(argc, argv); \
        ::velo::test::Runner runner; \
        return runner.run(); \
    }

#endif // VELO_TEST_CORE_HPP
