/**
 * @file test_blocking_detector.cpp
 * @brief Tests for blocking_detector.hpp
 */

#include "fsup/blocking_detector.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>

using fsup::BlockingDetector;
using fsup::DetectorState;

namespace {

void Feed(BlockingDetector& d, uint32_t id) {
  REQUIRE(d.NotifyPoisonReceived(id).has_value());
}

/// Drive a fresh detector to BLOCKED with ids first, first+1, first+2.
void DriveToBlocked(BlockingDetector& d, uint32_t first) {
  Feed(d, first);
  Feed(d, first + 1U);
  Feed(d, first + 2U);
  REQUIRE(d.State() == DetectorState::kBlocked);
}

}  // namespace

// ============================================================================
// Initial state
// ============================================================================

TEST_CASE("BlockingDetector: fresh detector is INIT and not blocked", "[blocking_detector]") {
  BlockingDetector d;
  REQUIRE(d.State() == DetectorState::kInit);
  REQUIRE_FALSE(d.IsBlocked());
  REQUIRE_FALSE(d.LastPoisonId().has_value());
  REQUIRE(d.MaxId() == fsup::kDefaultMaxProbeId);
  REQUIRE(d.PeekProbeId() == 0U);
}

TEST_CASE("BlockingDetector: first poison always starts the run", "[blocking_detector]") {
  const uint32_t ids[] = {0U, 1U, 42U, 9999U, 10000U};
  for (uint32_t id : ids) {
    BlockingDetector d;
    Feed(d, id);
    REQUIRE(d.State() == DetectorState::kBlockedInter1);
    REQUIRE_FALSE(d.IsBlocked());
  }
}

// ============================================================================
// Consecutive runs
// ============================================================================

TEST_CASE("BlockingDetector: consecutive ids reach BLOCKED then FINAL", "[blocking_detector]") {
  BlockingDetector d;
  Feed(d, 4U);
  REQUIRE(d.State() == DetectorState::kBlockedInter1);

  Feed(d, 5U);
  REQUIRE(d.State() == DetectorState::kBlockedInter2);
  REQUIRE_FALSE(d.IsBlocked());

  Feed(d, 6U);
  REQUIRE(d.State() == DetectorState::kBlocked);
  REQUIRE(d.IsBlocked());

  Feed(d, 7U);
  REQUIRE(d.State() == DetectorState::kFinal);
  REQUIRE_FALSE(d.IsBlocked());

  Feed(d, 8U);
  REQUIRE(d.State() == DetectorState::kFinal);
}

TEST_CASE("BlockingDetector: run started from INTER_1 via 5, 6, 7", "[blocking_detector]") {
  BlockingDetector d;
  Feed(d, 100U);  // INTER_1, unrelated id
  Feed(d, 5U);    // gap: stays INTER_1, predecessor now 5
  REQUIRE(d.State() == DetectorState::kBlockedInter1);
  Feed(d, 6U);
  REQUIRE(d.State() == DetectorState::kBlockedInter2);
  Feed(d, 7U);
  REQUIRE(d.State() == DetectorState::kBlocked);
  REQUIRE(d.IsBlocked());
  Feed(d, 8U);
  REQUIRE(d.State() == DetectorState::kFinal);
  REQUIRE_FALSE(d.IsBlocked());
}

TEST_CASE("BlockingDetector: same id twice is not consecutive", "[blocking_detector]") {
  BlockingDetector d;
  Feed(d, 10U);
  Feed(d, 11U);
  REQUIRE(d.State() == DetectorState::kBlockedInter2);
  Feed(d, 11U);
  REQUIRE(d.State() == DetectorState::kBlockedInter1);
}

// ============================================================================
// Broken runs
// ============================================================================

TEST_CASE("BlockingDetector: gap in INTER_2 resets to INTER_1", "[blocking_detector]") {
  BlockingDetector d;
  Feed(d, 20U);
  Feed(d, 21U);
  REQUIRE(d.State() == DetectorState::kBlockedInter2);

  Feed(d, 30U);
  REQUIRE(d.State() == DetectorState::kBlockedInter1);

  // Progress restarts from the id that broke the run.
  Feed(d, 31U);
  REQUIRE(d.State() == DetectorState::kBlockedInter2);
  Feed(d, 32U);
  REQUIRE(d.IsBlocked());
}

TEST_CASE("BlockingDetector: gap in INTER_1 keeps INTER_1", "[blocking_detector]") {
  BlockingDetector d;
  Feed(d, 1U);
  Feed(d, 3U);
  REQUIRE(d.State() == DetectorState::kBlockedInter1);
  Feed(d, 2U);
  REQUIRE(d.State() == DetectorState::kBlockedInter1);
}

TEST_CASE("BlockingDetector: gap does not leave BLOCKED", "[blocking_detector]") {
  BlockingDetector d;
  DriveToBlocked(d, 50U);
  Feed(d, 500U);
  REQUIRE(d.State() == DetectorState::kBlocked);
  REQUIRE(d.IsBlocked());

  // The gap id becomes the new predecessor.
  Feed(d, 501U);
  REQUIRE(d.State() == DetectorState::kFinal);
}

TEST_CASE("BlockingDetector: FINAL is terminal", "[blocking_detector]") {
  BlockingDetector d;
  DriveToBlocked(d, 0U);
  Feed(d, 3U);
  REQUIRE(d.State() == DetectorState::kFinal);

  Feed(d, 77U);
  REQUIRE(d.State() == DetectorState::kFinal);
  Feed(d, 78U);
  REQUIRE(d.State() == DetectorState::kFinal);
  REQUIRE_FALSE(d.IsBlocked());
}

// ============================================================================
// Wraparound
// ============================================================================

TEST_CASE("BlockingDetector: max id followed by 0 is consecutive", "[blocking_detector][wrap]") {
  BlockingDetector d;
  Feed(d, 9999U);
  Feed(d, 10000U);
  REQUIRE(d.State() == DetectorState::kBlockedInter2);
  REQUIRE(d.LastPoisonId().value() == -1);

  Feed(d, 0U);
  REQUIRE(d.State() == DetectorState::kBlocked);
  REQUIRE(d.LastPoisonId().value() == 0);
}

TEST_CASE("BlockingDetector: wrap as the first transition after INIT", "[blocking_detector][wrap]") {
  BlockingDetector d;
  Feed(d, 10000U);
  REQUIRE(d.State() == DetectorState::kBlockedInter1);
  Feed(d, 0U);
  REQUIRE(d.State() == DetectorState::kBlockedInter2);
  Feed(d, 1U);
  REQUIRE(d.IsBlocked());
}

TEST_CASE("BlockingDetector: max id followed by max id is a gap", "[blocking_detector][wrap]") {
  BlockingDetector d;
  Feed(d, 10000U);
  Feed(d, 0U);
  REQUIRE(d.State() == DetectorState::kBlockedInter2);
  Feed(d, 10000U);
  REQUIRE(d.State() == DetectorState::kBlockedInter1);
}

TEST_CASE("BlockingDetector: custom max id wraps at its own bound", "[blocking_detector][wrap]") {
  BlockingDetector d(7U);
  Feed(d, 6U);
  Feed(d, 7U);
  Feed(d, 0U);
  REQUIRE(d.IsBlocked());
}

// ============================================================================
// Range validation
// ============================================================================

TEST_CASE("BlockingDetector: out-of-range id is rejected untouched", "[blocking_detector]") {
  BlockingDetector d;
  auto r = d.NotifyPoisonReceived(10001U);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == fsup::DetectorError::kIdOutOfRange);
  REQUIRE(d.State() == DetectorState::kInit);
  REQUIRE_FALSE(d.LastPoisonId().has_value());

  Feed(d, 41U);
  Feed(d, 42U);
  REQUIRE_FALSE(d.NotifyPoisonReceived(0xFFFFFFFFU).has_value());
  REQUIRE(d.State() == DetectorState::kBlockedInter2);
  REQUIRE(d.LastPoisonId().value() == 42);

  Feed(d, 43U);
  REQUIRE(d.IsBlocked());
}

// ============================================================================
// Probe id allocation
// ============================================================================

TEST_CASE("BlockingDetector: probe ids cycle 0..max and wrap", "[blocking_detector][probe]") {
  BlockingDetector d;
  for (uint32_t expected = 0U; expected <= fsup::kDefaultMaxProbeId; ++expected) {
    REQUIRE(d.AllocateProbeId() == expected);
  }
  REQUIRE(d.AllocateProbeId() == 0U);
  REQUIRE(d.AllocateProbeId() == 1U);
  REQUIRE(d.AllocateProbeId() == 2U);
}

TEST_CASE("BlockingDetector: probe counter is independent from poison state", "[blocking_detector][probe]") {
  BlockingDetector d(3U);
  REQUIRE(d.AllocateProbeId() == 0U);
  DriveToBlocked(d, 0U);
  REQUIRE(d.AllocateProbeId() == 1U);
  REQUIRE(d.AllocateProbeId() == 2U);
  REQUIRE(d.AllocateProbeId() == 3U);
  REQUIRE(d.AllocateProbeId() == 0U);
  REQUIRE(d.State() == DetectorState::kBlocked);
}

// ============================================================================
// Reset / names
// ============================================================================

TEST_CASE("BlockingDetector: Reset returns to a fresh detector", "[blocking_detector]") {
  BlockingDetector d(50U);
  (void)d.AllocateProbeId();
  DriveToBlocked(d, 10U);

  d.Reset();
  REQUIRE(d.State() == DetectorState::kInit);
  REQUIRE_FALSE(d.LastPoisonId().has_value());
  REQUIRE(d.PeekProbeId() == 0U);
  REQUIRE(d.MaxId() == 50U);
}

TEST_CASE("BlockingDetector: state names", "[blocking_detector]") {
  REQUIRE(std::string(fsup::DetectorStateName(DetectorState::kInit)) == "INIT");
  REQUIRE(std::string(fsup::DetectorStateName(DetectorState::kBlockedInter1)) == "BLOCKED_INTER_1");
  REQUIRE(std::string(fsup::DetectorStateName(DetectorState::kBlockedInter2)) == "BLOCKED_INTER_2");
  REQUIRE(std::string(fsup::DetectorStateName(DetectorState::kBlocked)) == "BLOCKED");
  REQUIRE(std::string(fsup::DetectorStateName(DetectorState::kFinal)) == "FINAL");
}

// ============================================================================
// End-to-end
// ============================================================================

TEST_CASE("BlockingDetector: 42, 43, 44 then a stray 99", "[blocking_detector][scenario]") {
  BlockingDetector d;
  REQUIRE(d.State() == DetectorState::kInit);

  Feed(d, 42U);
  REQUIRE(d.State() == DetectorState::kBlockedInter1);
  REQUIRE_FALSE(d.IsBlocked());

  Feed(d, 43U);
  REQUIRE(d.State() == DetectorState::kBlockedInter2);

  Feed(d, 44U);
  REQUIRE(d.State() == DetectorState::kBlocked);
  REQUIRE(d.IsBlocked());

  Feed(d, 99U);
  REQUIRE(d.State() == DetectorState::kBlocked);
  REQUIRE(d.IsBlocked());
}
