/*
 * ============================================================================
 * PromptShield Test Runner
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * main() for the unit test executable. Test cases live in the *_Tests.cpp
 * files linked into the same binary.
 *
 * ============================================================================
 */

#include <gtest/gtest.h>

#include <chrono>
#include <iomanip>
#include <iostream>

// Prints per-suite timings and a pass/fail summary around the default output.
class SummaryTestListener : public ::testing::EmptyTestEventListener {
public:
    void OnTestProgramStart(const ::testing::UnitTest& unit_test) override {
        std::cout << "\n";
        std::cout << "========================================================================\n";
        std::cout << "  PromptShield Unit Tests (" << unit_test.total_test_count() << " tests)\n";
        std::cout << "========================================================================\n\n";
    }

    void OnTestSuiteStart(const ::testing::TestSuite& /*test_suite*/) override {
        suite_start_time_ = std::chrono::steady_clock::now();
    }

    void OnTestSuiteEnd(const ::testing::TestSuite& test_suite) override {
        const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - suite_start_time_);

        std::cout << "  " << std::left << std::setw(32) << test_suite.name()
                  << " passed " << test_suite.successful_test_count()
                  << "/" << test_suite.total_test_count()
                  << " (" << duration.count() << " ms)\n";
    }

    void OnTestIterationEnd(const ::testing::UnitTest& unit_test, int /*iteration*/) override {
        const int total = unit_test.test_to_run_count();
        const int failed = unit_test.failed_test_count();

        std::cout << "\n========================================================================\n";
        std::cout << "  TEST SUMMARY\n";
        std::cout << "========================================================================\n";
        std::cout << "  Total Tests:   " << total << "\n";
        if (total > 0) {
            std::cout << "  Passed:        " << std::setw(3) << unit_test.successful_test_count()
                      << " (" << std::fixed << std::setprecision(1)
                      << (100.0 * unit_test.successful_test_count() / total) << "%)\n";
            std::cout << "  Failed:        " << std::setw(3) << failed
                      << " (" << std::fixed << std::setprecision(1)
                      << (100.0 * failed / total) << "%)\n";
        }
        std::cout << "========================================================================\n\n";
    }

private:
    std::chrono::steady_clock::time_point suite_start_time_{};
};

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    if (::testing::UnitTest::GetInstance()->total_test_count() == 0) {
        std::cerr << "ERROR: No tests were found. Check that the *_Tests.cpp files are linked.\n";
        return 1;
    }

    ::testing::UnitTest::GetInstance()->listeners().Append(new SummaryTestListener());

    return RUN_ALL_TESTS();
}
