/**
 * @file TestFramework.h
 * @brief Shared testing framework for the PiPal test suites
 *
 * This file provides common testing infrastructure including test result tracking,
 * execution timing, and standardized test execution macros used across all
 * test executables. Each executable returns non-zero when a test failed so CTest
 * reports it.
 *
 * @author PiPal Team
 * @date 2026
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <thread>

#include "utils/Logger.h"

//=============================================================================
// TEST RESULTS TRACKING
//=============================================================================

struct TestResults {
  int total_tests = 0;
  int passed_tests = 0;
  int failed_tests = 0;
  uint64_t total_execution_time_us = 0;

  void add_result(bool passed, uint64_t execution_time) noexcept {
    total_tests++;
    total_execution_time_us += execution_time;
    if (passed) {
      passed_tests++;
    } else {
      failed_tests++;
    }
  }

  float get_success_percentage() const noexcept {
    return total_tests > 0 ? (static_cast<float>(passed_tests) / total_tests * 100.0f) : 0.0f;
  }

  float get_total_time_ms() const noexcept {
    return total_execution_time_us / 1000.0f;
  }
};

inline uint64_t test_time_us() noexcept {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
                                   std::chrono::steady_clock::now().time_since_epoch())
                                   .count());
}

inline void test_sleep_ms(int ms) noexcept {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

//=============================================================================
// TEST EXECUTION MACROS
//=============================================================================

#define RUN_TEST(test_func)                                                                        \
  do {                                                                                             \
    pipal::Logger::GetInstance().Info(TAG, "Running: " #test_func);                               \
    uint64_t start_time = test_time_us();                                                          \
    bool result = test_func();                                                                     \
    uint64_t end_time = test_time_us();                                                            \
    uint64_t execution_time = end_time - start_time;                                               \
    g_test_results.add_result(result, execution_time);                                             \
    if (result) {                                                                                  \
      pipal::Logger::GetInstance().Info(TAG, "[SUCCESS] PASSED: " #test_func " ({:.2f} ms)",       \
                                        execution_time / 1000.0);                                  \
    } else {                                                                                       \
      pipal::Logger::GetInstance().Error(TAG, "[FAILED] FAILED: " #test_func " ({:.2f} ms)",       \
                                         execution_time / 1000.0);                                 \
    }                                                                                              \
  } while (0)

/// Fail the enclosing test with a message when @p cond does not hold.
#define TEST_CHECK(cond)                                                                           \
  do {                                                                                             \
    if (!(cond)) {                                                                                 \
      pipal::Logger::GetInstance().Error(TAG, "Check failed at line {}: {}", __LINE__, #cond);     \
      return false;                                                                                \
    }                                                                                              \
  } while (0)

//=============================================================================
// TEST OUTPUT HELPERS
//=============================================================================

inline void print_test_summary(const TestResults& test_results, const char* test_suite_name,
                               const char* tag) noexcept {
  auto& log = pipal::Logger::GetInstance();
  log.Info(tag, "=== {} TEST SUMMARY ===", test_suite_name);
  log.Info(tag, "Total: {}, Passed: {}, Failed: {}, Success: {:.2f}%, Time: {:.2f} ms",
           test_results.total_tests, test_results.passed_tests, test_results.failed_tests,
           test_results.get_success_percentage(), test_results.get_total_time_ms());

  if (test_results.failed_tests == 0) {
    log.Info(tag, "[SUCCESS] ALL {} TESTS PASSED!", test_suite_name);
  } else {
    log.Error(tag, "[FAILED] Some tests failed. Review the results above.");
  }
}

/// Process exit code for a finished suite.
inline int test_exit_code(const TestResults& test_results) noexcept {
  return test_results.failed_tests == 0 ? 0 : 1;
}
