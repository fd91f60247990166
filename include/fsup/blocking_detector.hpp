/**
 * @file blocking_detector.hpp
 * @brief Per-formula stuck detection driven by reflected poison notifications.
 *
 * The dispatcher tags each probe sent to a formula with an id from
 * AllocateProbeId(). When a probe makes the formula fail, the id comes back
 * through NotifyPoisonReceived(). Three consecutive failing ids after the
 * first one mark the formula as blocked:
 *
 *   INIT --any--> INTER_1 --next--> INTER_2 --next--> BLOCKED --next--> FINAL
 *                    ^                 |
 *                    +----- gap -------+
 *
 * A gap in the id sequence discards partial progress; a formula already
 * BLOCKED or FINAL stays there. IsBlocked() is true in BLOCKED only, so the
 * dispatcher sees the signal once and FINAL marks it as already handled.
 *
 * Ids live in [0, max_id] and wrap from max_id back to 0. The predecessor is
 * kept signed so that max_id is stored as -1 and a following 0 still counts as
 * its successor.
 *
 * Not thread-safe: the owner serializes NotifyPoisonReceived() and
 * AllocateProbeId() per instance. No heap, no I/O.
 */

#ifndef FSUP_BLOCKING_DETECTOR_HPP_
#define FSUP_BLOCKING_DETECTOR_HPP_

#include "fsup/log.hpp"
#include "fsup/platform.hpp"
#include "fsup/vocabulary.hpp"

#include <cstdint>

namespace fsup {

/// Inclusive upper bound of the probe id space.
static constexpr uint32_t kDefaultMaxProbeId = 10000U;

enum class DetectorState : uint8_t {
  kInit = 0,
  kBlockedInter1,
  kBlockedInter2,
  kBlocked,
  kFinal,
};

enum class DetectorError : uint8_t {
  kIdOutOfRange = 0,  ///< Poison id greater than max_id.
};

inline const char* DetectorStateName(DetectorState state) noexcept {
  switch (state) {
    case DetectorState::kInit:
      return "INIT";
    case DetectorState::kBlockedInter1:
      return "BLOCKED_INTER_1";
    case DetectorState::kBlockedInter2:
      return "BLOCKED_INTER_2";
    case DetectorState::kBlocked:
      return "BLOCKED";
    case DetectorState::kFinal:
      return "FINAL";
  }
  return "UNKNOWN";
}

class BlockingDetector final {
 public:
  BlockingDetector() noexcept : BlockingDetector(kDefaultMaxProbeId) {}

  /// @pre max_id > 0 and max_id fits in int32_t.
  explicit BlockingDetector(uint32_t max_id) noexcept : max_id_(max_id) {
    FSUP_ASSERT(max_id_ > 0U && max_id_ <= static_cast<uint32_t>(INT32_MAX));
  }

  /**
   * @brief Record a poison notification reflected by the formula.
   *
   * At most one transition per call. Rejects ids above max_id without
   * touching any state.
   */
  expected<void, DetectorError> NotifyPoisonReceived(uint32_t poison_id) noexcept {
    if (FSUP_UNLIKELY(poison_id > max_id_)) {
      FSUP_LOG_WARN("Detector", "poison id %u outside [0, %u] rejected", poison_id, max_id_);
      return expected<void, DetectorError>::error(DetectorError::kIdOutOfRange);
    }

    const DetectorState prev = state_;
    if (state_ == DetectorState::kInit) {
      state_ = DetectorState::kBlockedInter1;
    } else if (IsSuccessor(poison_id)) {
      state_ = Advance(state_);
    } else if (state_ != DetectorState::kBlocked && state_ != DetectorState::kFinal) {
      state_ = DetectorState::kBlockedInter1;
    }

    last_poison_id_ = (poison_id == max_id_) ? -1 : static_cast<int32_t>(poison_id);
    has_last_poison_ = true;

    if (prev != state_) {
      FSUP_LOG_DEBUG("Detector", "poison %u: %s -> %s", poison_id, DetectorStateName(prev),
                     DetectorStateName(state_));
    }
    return expected<void, DetectorError>::success();
  }

  bool IsBlocked() const noexcept { return state_ == DetectorState::kBlocked; }

  /// Returns the next probe id and advances the counter, wrapping max_id -> 0.
  uint32_t AllocateProbeId() noexcept {
    const uint32_t id = next_probe_id_;
    next_probe_id_ = (next_probe_id_ == max_id_) ? 0U : next_probe_id_ + 1U;
    return id;
  }

  /// Back to the freshly constructed state (same max_id).
  void Reset() noexcept {
    state_ = DetectorState::kInit;
    last_poison_id_ = 0;
    has_last_poison_ = false;
    next_probe_id_ = 0U;
  }

  DetectorState State() const noexcept { return state_; }

  /// Stored predecessor: -1 after max_id, empty before the first notification.
  optional<int32_t> LastPoisonId() const noexcept {
    return has_last_poison_ ? optional<int32_t>(last_poison_id_) : optional<int32_t>();
  }

  uint32_t PeekProbeId() const noexcept { return next_probe_id_; }
  uint32_t MaxId() const noexcept { return max_id_; }

 private:
  bool IsSuccessor(uint32_t poison_id) const noexcept {
    return has_last_poison_ && static_cast<int64_t>(poison_id) == static_cast<int64_t>(last_poison_id_) + 1;
  }

  static DetectorState Advance(DetectorState state) noexcept {
    switch (state) {
      case DetectorState::kBlockedInter1:
        return DetectorState::kBlockedInter2;
      case DetectorState::kBlockedInter2:
        return DetectorState::kBlocked;
      case DetectorState::kBlocked:
        return DetectorState::kFinal;
      case DetectorState::kInit:
      case DetectorState::kFinal:
        break;
    }
    return state;
  }

  DetectorState state_{DetectorState::kInit};
  int32_t last_poison_id_{0};
  bool has_last_poison_{false};
  uint32_t max_id_;
  uint32_t next_probe_id_{0U};
};

}  // namespace fsup

#endif  // FSUP_BLOCKING_DETECTOR_HPP_
