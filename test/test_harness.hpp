// test/test_harness.hpp
#pragma once

#include <cmath>
#include <iostream>
#include <string>

// ANSI color codes
#define COLOR_GREEN  "\033[32m"
#define COLOR_RED    "\033[31m"
#define COLOR_YELLOW "\033[33m"
#define COLOR_RESET  "\033[0m"

struct TestResult {
    int passed = 0;
    int failed = 0;

    void pass(const std::string& msg) {
        std::cout << COLOR_GREEN << "  ✓ " << msg << COLOR_RESET << "\n";
        ++passed;
    }

    void fail(const std::string& msg) {
        std::cout << COLOR_RED << "  ✗ " << msg << COLOR_RESET << "\n";
        ++failed;
    }

    void check(bool ok, const std::string& msg) {
        if (ok) {
            pass(msg);
        } else {
            fail(msg);
        }
    }

    void summary() {
        std::cout << "\n========================================\n";
        if (failed == 0) {
            std::cout << COLOR_GREEN << "ALL TESTS PASSED" << COLOR_RESET;
        } else {
            std::cout << COLOR_RED << "SOME TESTS FAILED" << COLOR_RESET;
        }
        std::cout << " (" << passed << " passed, " << failed << " failed)\n";
        std::cout << "========================================\n";
    }
};

// Helper: Check if value is close to expected
inline bool is_close(double actual, double expected, double tolerance = 0.0001) {
    if (std::abs(expected) < 1e-9) {
        return std::abs(actual) < tolerance;
    }
    return std::abs(actual - expected) / std::abs(expected) < tolerance;
}

inline void print_title(const std::string& title) {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║  " << title;
    for (size_t i = title.size(); i < 60; ++i) std::cout << ' ';
    std::cout << "║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";
}

// Expect `fn` to throw E; passes/fails with `msg`
template <typename E, typename Fn>
void expect_throw(TestResult& result, Fn&& fn, const std::string& msg) {
    try {
        fn();
    } catch (const E& e) {
        result.pass(msg + " (" + e.what() + ")");
        return;
    } catch (const std::exception& e) {
        result.fail(msg + ": wrong exception: " + e.what());
        return;
    }
    result.fail(msg + ": nothing thrown");
}
