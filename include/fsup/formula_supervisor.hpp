/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file formula_supervisor.hpp
 * @brief Dispatcher-side registry of formulas and their blocking detectors.
 *
 * One BlockingDetector per registered formula, stored in a fixed slot array.
 * The registry serializes every detector access behind a single mutex, so the
 * dispatcher may probe from one thread while poison notifications arrive on
 * another.
 *
 * Design:
 * - Fixed-capacity slot array, no heap allocation.
 * - A detector is created on Register(), dropped on Unregister(), and
 *   recreated on Replace(); state never crosses worker identities.
 * - The blocked hook fires once, on entry into BLOCKED. It runs outside the
 *   mutex (collect-release-execute) and may call back into the registry.
 * - The hook only decides; kRestart makes the registry install a fresh
 *   detector for the replacement worker the caller spawns. Without a hook a
 *   blocked worker stays BLOCKED until the caller acts on IsBlocked().
 * - A WorkerId carries the slot index and the registration epoch of that
 *   slot, so a handle kept after Unregister() never reaches a later worker.
 *
 * Typical usage:
 *
 *   fsup::FormulaSupervisor<16> sup;
 *   sup.SetOnBlocked([](uint32_t id, const char* name, void* ctx) {
 *     static_cast<Dispatcher*>(ctx)->RespawnFormula(id);
 *     return fsup::BlockedAction::kRestart;
 *   }, &dispatcher);
 *
 *   auto id = sup.Register("rapl-formula").value();
 *   uint32_t probe = sup.NextProbeId(id).value();   // tag outgoing report
 *   ...
 *   sup.OnPoisonReceived(id, reflected_probe_id);   // on formula failure
 */

#ifndef FSUP_FORMULA_SUPERVISOR_HPP_
#define FSUP_FORMULA_SUPERVISOR_HPP_

#include "fsup/blocking_detector.hpp"
#include "fsup/config.hpp"
#include "fsup/log.hpp"
#include "fsup/platform.hpp"
#include "fsup/vocabulary.hpp"

#include <cstdint>

#include <mutex>

namespace fsup {

// ============================================================================
// WorkerId - Strong type for registry handles
// ============================================================================

struct WorkerIdTag {};

/// Low 16 bits: slot index. High 16 bits: registration epoch of the slot.
using WorkerId = NewType<uint32_t, WorkerIdTag>;

static constexpr uint32_t kWorkerSlotBits = 16U;
static constexpr uint32_t kWorkerSlotMask = (1U << kWorkerSlotBits) - 1U;

// ============================================================================
// SupervisorError
// ============================================================================

enum class SupervisorError : uint8_t {
  kSlotsFull = 0,  ///< All worker slots are occupied.
  kNotRegistered,  ///< Worker id not found or already unregistered.
  kIdOutOfRange,   ///< Poison id outside [0, max_probe_id].
};

/// Decision returned by the blocked hook.
enum class BlockedAction : uint8_t {
  kKeep = 0,  ///< Leave the detector in BLOCKED.
  kRestart,   ///< Worker is being replaced: install a fresh detector.
};

// ============================================================================
// SupervisorConfig
// ============================================================================

struct SupervisorConfig {
  uint32_t max_probe_id = kDefaultMaxProbeId;
};

/**
 * @brief Read the [supervisor] section.
 *
 * Keys: max_probe_id (> 0), log_level. A valid log_level is applied to the
 * global logger immediately.
 */
inline expected<SupervisorConfig, ConfigError> LoadSupervisorConfig(const ConfigStore& cfg) {
  SupervisorConfig out;

  const optional<int32_t> max_id = cfg.FindInt("supervisor", "max_probe_id");
  if (max_id.has_value()) {
    if (max_id.value() <= 0) {
      FSUP_LOG_ERROR("Supervisor", "max_probe_id must be positive, got %d", max_id.value());
      return expected<SupervisorConfig, ConfigError>::error(ConfigError::kInvalidValue);
    }
    out.max_probe_id = static_cast<uint32_t>(max_id.value());
  } else if (cfg.HasKey("supervisor", "max_probe_id")) {
    return expected<SupervisorConfig, ConfigError>::error(ConfigError::kInvalidValue);
  }

  if (cfg.HasKey("supervisor", "log_level")) {
    const char* name = cfg.GetString("supervisor", "log_level");
    log::Level level = log::Level::kInfo;
    if (!log::ParseLevel(name, &level)) {
      FSUP_LOG_ERROR("Supervisor", "unknown log_level '%s'", name);
      return expected<SupervisorConfig, ConfigError>::error(ConfigError::kInvalidValue);
    }
    log::SetLevel(level);
  }

  return expected<SupervisorConfig, ConfigError>::success(out);
}

// ============================================================================
// WorkerInfo - Diagnostic snapshot for a single worker
// ============================================================================

struct WorkerInfo {
  uint32_t worker_id;         ///< WorkerId::value() of the current registration.
  const char* name;           ///< Pointer into the slot, valid during the callback.
  DetectorState state;
  optional<int32_t> last_poison_id;
  uint32_t next_probe_id;
  uint32_t blocked_count;     ///< Times this slot entered BLOCKED.
  uint32_t generation;        ///< Replace() calls since registration.
};

// ============================================================================
// FormulaSupervisor
// ============================================================================

/**
 * @brief Maps formula identity to its BlockingDetector.
 *
 * @tparam MaxWorkers  Maximum number of concurrently supervised formulas.
 */
template <uint32_t MaxWorkers = 32>
class FormulaSupervisor final {
  static_assert(MaxWorkers > 0, "MaxWorkers must be greater than 0");
  static_assert(MaxWorkers <= kWorkerSlotMask + 1U, "MaxWorkers exceeds the WorkerId slot field");

 public:
  using BlockedCallback = BlockedAction (*)(uint32_t worker_id, const char* name, void* ctx);

  explicit FormulaSupervisor(const SupervisorConfig& cfg = SupervisorConfig{}) noexcept : cfg_(cfg) {
    FSUP_ASSERT(cfg_.max_probe_id > 0U);
  }

  FormulaSupervisor(const FormulaSupervisor&) = delete;
  FormulaSupervisor& operator=(const FormulaSupervisor&) = delete;
  FormulaSupervisor(FormulaSupervisor&&) = delete;
  FormulaSupervisor& operator=(FormulaSupervisor&&) = delete;

  // --------------------------------------------------------------------------
  // Registration
  // --------------------------------------------------------------------------

  /**
   * @brief Start supervising a formula with a fresh detector in INIT.
   *
   * @param name  Formula name (max 32 chars, truncated if longer).
   */
  expected<WorkerId, SupervisorError> Register(const char* name) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    for (uint32_t i = 0U; i < MaxWorkers; ++i) {
      Slot& slot = slots_[i];
      if (!slot.active) {
        slot.name.assign(TruncateToCapacity, name);
        slot.detector = BlockingDetector(cfg_.max_probe_id);
        slot.blocked_count = 0U;
        slot.generation = 0U;
        slot.epoch = (slot.epoch == kWorkerSlotMask) ? 1U : slot.epoch + 1U;
        slot.active = true;
        FSUP_LOG_INFO("Supervisor", "formula '%s' registered in slot %u (epoch %u)", slot.name.c_str(), i,
                      slot.epoch);
        return expected<WorkerId, SupervisorError>::success(MakeId(i, slot.epoch));
      }
    }
    FSUP_LOG_ERROR("Supervisor", "no free slot for formula '%s'", name);
    return expected<WorkerId, SupervisorError>::error(SupervisorError::kSlotsFull);
  }

  expected<void, SupervisorError> Unregister(WorkerId id) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot* slot = FindLocked(id);
    if (slot == nullptr) {
      return expected<void, SupervisorError>::error(SupervisorError::kNotRegistered);
    }
    slot->active = false;
    FSUP_LOG_INFO("Supervisor", "formula '%s' unregistered", slot->name.c_str());
    return expected<void, SupervisorError>::success();
  }

  /// The formula behind `id` was replaced: discard its detector and start over.
  expected<void, SupervisorError> Replace(WorkerId id) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot* slot = FindLocked(id);
    if (slot == nullptr) {
      return expected<void, SupervisorError>::error(SupervisorError::kNotRegistered);
    }
    ReplaceLocked(*slot);
    return expected<void, SupervisorError>::success();
  }

  // --------------------------------------------------------------------------
  // Probe / poison flow
  // --------------------------------------------------------------------------

  expected<uint32_t, SupervisorError> NextProbeId(WorkerId id) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot* slot = FindLocked(id);
    if (slot == nullptr) {
      return expected<uint32_t, SupervisorError>::error(SupervisorError::kNotRegistered);
    }
    return expected<uint32_t, SupervisorError>::success(slot->detector.AllocateProbeId());
  }

  /**
   * @brief Feed a reflected poison id to the formula's detector.
   *
   * @return State reached by this notification. When it is BLOCKED the hook
   *         has already run, and if it returned kRestart the slot now holds a
   *         fresh detector in INIT. With no hook the detector stays BLOCKED.
   */
  expected<DetectorState, SupervisorError> OnPoisonReceived(WorkerId id, uint32_t poison_id) noexcept {
    BlockedCallback fn = nullptr;
    void* ctx = nullptr;
    FixedString<32> name;
    uint32_t generation = 0U;
    DetectorState reached = DetectorState::kInit;

    {
      std::lock_guard<std::mutex> lock(mutex_);
      Slot* slot = FindLocked(id);
      if (slot == nullptr) {
        return expected<DetectorState, SupervisorError>::error(SupervisorError::kNotRegistered);
      }

      const bool was_blocked = slot->detector.IsBlocked();
      if (!slot->detector.NotifyPoisonReceived(poison_id).has_value()) {
        return expected<DetectorState, SupervisorError>::error(SupervisorError::kIdOutOfRange);
      }
      reached = slot->detector.State();

      if (was_blocked || reached != DetectorState::kBlocked) {
        return expected<DetectorState, SupervisorError>::success(reached);
      }

      ++slot->blocked_count;
      FSUP_LOG_WARN("Supervisor", "formula '%s' blocked (poison %u, occurrence %u)", slot->name.c_str(),
                    poison_id, slot->blocked_count);
      fn = on_blocked_;
      ctx = blocked_ctx_;
      name = slot->name;
      generation = slot->generation;
    }

    if (fn == nullptr) {
      return expected<DetectorState, SupervisorError>::success(reached);
    }
    if (fn(id.value(), name.c_str(), ctx) == BlockedAction::kRestart) {
      std::lock_guard<std::mutex> lock(mutex_);
      Slot* slot = FindLocked(id);
      // Skip if the hook already replaced this registration or dropped it.
      if (slot != nullptr && slot->generation == generation) {
        ReplaceLocked(*slot);
      }
    }
    return expected<DetectorState, SupervisorError>::success(reached);
  }

  // --------------------------------------------------------------------------
  // Query
  // --------------------------------------------------------------------------

  /// False for unknown ids.
  bool IsBlocked(WorkerId id) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    const Slot* slot = FindLocked(id);
    return slot != nullptr && slot->detector.IsBlocked();
  }

  expected<DetectorState, SupervisorError> GetState(WorkerId id) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    const Slot* slot = FindLocked(id);
    if (slot == nullptr) {
      return expected<DetectorState, SupervisorError>::error(SupervisorError::kNotRegistered);
    }
    return expected<DetectorState, SupervisorError>::success(slot->detector.State());
  }

  uint32_t ActiveCount() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t count = 0U;
    for (uint32_t i = 0U; i < MaxWorkers; ++i) {
      if (slots_[i].active) ++count;
    }
    return count;
  }

  /// Workers whose detector currently reports IsBlocked().
  uint32_t BlockedCount() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t count = 0U;
    for (uint32_t i = 0U; i < MaxWorkers; ++i) {
      if (slots_[i].active && slots_[i].detector.IsBlocked()) ++count;
    }
    return count;
  }

  static constexpr uint32_t Capacity() noexcept { return MaxWorkers; }

  const SupervisorConfig& GetConfig() const noexcept { return cfg_; }

  /// Callback signature: void(const WorkerInfo&). Runs under the mutex.
  template <typename Fn>
  void ForEachWorker(Fn&& fn) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (uint32_t i = 0U; i < MaxWorkers; ++i) {
      const Slot& slot = slots_[i];
      if (!slot.active) continue;
      WorkerInfo info{MakeId(i, slot.epoch).value(),
                      slot.name.c_str(),
                      slot.detector.State(),
                      slot.detector.LastPoisonId(),
                      slot.detector.PeekProbeId(),
                      slot.blocked_count,
                      slot.generation};
      fn(info);
    }
  }

  // --------------------------------------------------------------------------
  // Hook
  // --------------------------------------------------------------------------

  void SetOnBlocked(BlockedCallback fn, void* ctx = nullptr) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    on_blocked_ = fn;
    blocked_ctx_ = ctx;
  }

 private:
  struct Slot {
    bool active{false};
    FixedString<32> name;
    BlockingDetector detector;
    uint32_t blocked_count{0U};
    uint32_t generation{0U};
    uint32_t epoch{0U};  ///< Bumped on every Register(); 0 is never handed out.
  };

  static WorkerId MakeId(uint32_t idx, uint32_t epoch) noexcept {
    return WorkerId((epoch << kWorkerSlotBits) | idx);
  }

  Slot* FindLocked(WorkerId id) noexcept {
    const uint32_t idx = id.value() & kWorkerSlotMask;
    const uint32_t epoch = id.value() >> kWorkerSlotBits;
    if (idx >= MaxWorkers) return nullptr;
    Slot& slot = slots_[idx];
    if (!slot.active || slot.epoch != epoch) return nullptr;
    return &slot;
  }

  const Slot* FindLocked(WorkerId id) const noexcept {
    const uint32_t idx = id.value() & kWorkerSlotMask;
    const uint32_t epoch = id.value() >> kWorkerSlotBits;
    if (idx >= MaxWorkers) return nullptr;
    const Slot& slot = slots_[idx];
    if (!slot.active || slot.epoch != epoch) return nullptr;
    return &slot;
  }

  void ReplaceLocked(Slot& slot) noexcept {
    slot.detector.Reset();
    ++slot.generation;
    FSUP_LOG_INFO("Supervisor", "formula '%s' replaced (generation %u)", slot.name.c_str(), slot.generation);
  }

  const SupervisorConfig cfg_;
  Slot slots_[MaxWorkers];
  mutable std::mutex mutex_;
  BlockedCallback on_blocked_{nullptr};
  void* blocked_ctx_{nullptr};
};

}  // namespace fsup

#endif  // FSUP_FORMULA_SUPERVISOR_HPP_
