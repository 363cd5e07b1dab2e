/**
 * @file LineRegistryTest.cpp
 * @brief Exclusivity tests for the process-wide line and instance flags
 *
 * Covers:
 *   - single winner per line, re-claim after release
 *   - LineToken RAII and move semantics
 *   - concurrent claim races (line and facade instance)
 *
 * @author PiPal Team
 * @date 2026
 */

#include <atomic>
#include <thread>
#include <utility>
#include <vector>

#include "TestFramework.h"
#include "managers/LineRegistry.h"

using namespace pipal;

static const char* TAG = "LineRegistryTest";
static TestResults g_test_results;

// ── Helpers ───────────────────────────────────────────────────────────────

static LineRegistry& REG() noexcept { return LineRegistry::GetInstance(); }

/// Start @p threads claimers at once and count how many won.
template <typename ClaimFn>
static int RaceClaims(int threads, ClaimFn claim) noexcept {
  std::atomic<bool> go{false};
  std::atomic<int> winners{0};
  std::vector<std::thread> pool;
  pool.reserve(threads);
  for (int i = 0; i < threads; ++i) {
    pool.emplace_back([&]() {
      while (!go.load()) {
        std::this_thread::yield();
      }
      if (claim()) {
        winners.fetch_add(1);
      }
    });
  }
  go.store(true);
  for (auto& t : pool) {
    t.join();
  }
  return winners.load();
}

// ── Tests ─────────────────────────────────────────────────────────────────

static bool test_double_claim_refused() noexcept {
  REG().ResetForTesting();
  TEST_CHECK(REG().TryClaimLine(4));
  TEST_CHECK(!REG().TryClaimLine(4));
  TEST_CHECK(REG().IsLineClaimed(4));
  REG().ReleaseLine(4);
  TEST_CHECK(!REG().IsLineClaimed(4));
  TEST_CHECK(REG().TryClaimLine(4));
  REG().ReleaseLine(4);
  return true;
}

static bool test_out_of_range_line() noexcept {
  REG().ResetForTesting();
  TEST_CHECK(!REG().TryClaimLine(static_cast<uint8_t>(kMaxLines)));
  TEST_CHECK(!REG().TryClaimLine(255));
  TEST_CHECK(!REG().IsLineClaimed(200));
  TEST_CHECK(!REG().ClaimLine(60).has_value());
  return true;
}

static bool test_token_releases_on_scope_exit() noexcept {
  REG().ResetForTesting();
  {
    std::optional<LineToken> token = REG().ClaimLine(21);
    TEST_CHECK(token.has_value());
    TEST_CHECK(token->GetLine() == 21);
    TEST_CHECK(!REG().ClaimLine(21).has_value());
    TEST_CHECK(REG().ClaimedLineCount() == 1);
  }
  TEST_CHECK(!REG().IsLineClaimed(21));
  TEST_CHECK(REG().ClaimedLineCount() == 0);
  return true;
}

static bool test_token_move_keeps_claim() noexcept {
  REG().ResetForTesting();
  std::optional<LineToken> first = REG().ClaimLine(9);
  TEST_CHECK(first.has_value());

  LineToken moved(std::move(*first));
  first.reset();
  TEST_CHECK(moved.IsValid());
  TEST_CHECK(REG().IsLineClaimed(9));

  LineToken target;
  target = std::move(moved);
  TEST_CHECK(!moved.IsValid());
  TEST_CHECK(REG().IsLineClaimed(9));

  target.Reset();
  TEST_CHECK(!REG().IsLineClaimed(9));
  target.Reset();
  TEST_CHECK(!REG().IsLineClaimed(9));
  return true;
}

static bool test_move_assign_releases_previous() noexcept {
  REG().ResetForTesting();
  std::optional<LineToken> a = REG().ClaimLine(1);
  std::optional<LineToken> b = REG().ClaimLine(2);
  TEST_CHECK(a.has_value() && b.has_value());
  *a = std::move(*b);
  TEST_CHECK(!REG().IsLineClaimed(1));
  TEST_CHECK(REG().IsLineClaimed(2));
  TEST_CHECK(a->GetLine() == 2);
  return true;
}

static bool test_concurrent_line_race_single_winner() noexcept {
  for (int round = 0; round < 50; ++round) {
    REG().ResetForTesting();
    const int winners = RaceClaims(8, []() { return REG().TryClaimLine(7); });
    TEST_CHECK(winners == 1);
    TEST_CHECK(REG().IsLineClaimed(7));
  }
  REG().ResetForTesting();
  return true;
}

static bool test_concurrent_instance_race_single_winner() noexcept {
  for (int round = 0; round < 50; ++round) {
    REG().ResetForTesting();
    const int winners = RaceClaims(8, []() { return REG().TryClaimInstance(); });
    TEST_CHECK(winners == 1);
    TEST_CHECK(REG().IsInstanceClaimed());
  }
  REG().ReleaseInstance();
  TEST_CHECK(!REG().IsInstanceClaimed());
  TEST_CHECK(REG().TryClaimInstance());
  REG().ResetForTesting();
  return true;
}

// ── Entry Point ───────────────────────────────────────────────────────────

int main() {
  RUN_TEST(test_double_claim_refused);
  RUN_TEST(test_out_of_range_line);
  RUN_TEST(test_token_releases_on_scope_exit);
  RUN_TEST(test_token_move_keeps_claim);
  RUN_TEST(test_move_assign_releases_previous);
  RUN_TEST(test_concurrent_line_race_single_winner);
  RUN_TEST(test_concurrent_instance_race_single_winner);

  print_test_summary(g_test_results, "LINE REGISTRY", TAG);
  return test_exit_code(g_test_results);
}
