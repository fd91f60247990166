// formula_supervisor_demo.cpp -- Stuck formula detection in a simulated dispatcher.
//
// Three formulas receive tagged reports. "rapl" always succeeds, "smartwatts"
// fails on every report from round 5 on, "flaky" fails on scattered rounds
// only. Each failure reflects the report id back as a poison notification.
// The stalled formula is detected, respawned, and detected again.
//
// Usage: formula_supervisor_demo [config.ini]

#include "fsup/config.hpp"
#include "fsup/formula_supervisor.hpp"
#include "fsup/log.hpp"

#include <cstdint>
#include <cstdio>

// Simulated formulas ---------------------------------------------------------

struct Formula {
  const char* name;
  uint32_t stall_from;        ///< First round that fails forever (0 = never).
  uint32_t flaky_every;       ///< Fails when round % flaky_every == 0 (0 = never).
  uint32_t respawns;
  uint32_t worker_id;         ///< Registry handle, set after Register().
};

static bool HandleReport(const Formula& f, uint32_t round) {
  if (f.stall_from != 0U && round >= f.stall_from) return false;
  if (f.flaky_every != 0U && round % f.flaky_every == 0U) return false;
  return true;
}

using Supervisor = fsup::FormulaSupervisor<8>;

static Formula g_formulas[] = {
    {"rapl", 0U, 0U, 0U, 0U},
    {"smartwatts", 5U, 0U, 0U, 0U},
    {"flaky", 0U, 3U, 0U, 0U},
};

static fsup::BlockedAction OnBlocked(uint32_t worker_id, const char* name, void* ctx) {
  auto* formulas = static_cast<Formula*>(ctx);
  for (uint32_t i = 0U; i < 3U; ++i) {
    if (formulas[i].worker_id == worker_id) {
      FSUP_LOG_WARN("demo", "respawning formula '%s' (worker %#x)", name, worker_id);
      ++formulas[i].respawns;
      return fsup::BlockedAction::kRestart;
    }
  }
  return fsup::BlockedAction::kKeep;
}

int main(int argc, char** argv) {
  fsup::log::Init();

  fsup::SupervisorConfig sup_cfg;
  if (argc > 1) {
    fsup::MultiConfig cfg;
    auto loaded = cfg.LoadFile(argv[1]);
    if (!loaded.has_value()) {
      FSUP_LOG_ERROR("demo", "cannot load %s (error %u)", argv[1],
                     static_cast<unsigned>(loaded.get_error()));
      return 1;
    }
    auto parsed = fsup::LoadSupervisorConfig(cfg);
    if (!parsed.has_value()) {
      FSUP_LOG_ERROR("demo", "invalid [supervisor] section in %s", argv[1]);
      return 1;
    }
    sup_cfg = parsed.value();
  }
  FSUP_LOG_INFO("demo", "max_probe_id=%u", sup_cfg.max_probe_id);

  Supervisor sup(sup_cfg);
  sup.SetOnBlocked(&OnBlocked, g_formulas);

  fsup::WorkerId ids[3] = {fsup::WorkerId(0U), fsup::WorkerId(0U), fsup::WorkerId(0U)};
  for (uint32_t i = 0U; i < 3U; ++i) {
    auto reg = sup.Register(g_formulas[i].name);
    if (!reg.has_value()) {
      FSUP_LOG_ERROR("demo", "registration of '%s' failed", g_formulas[i].name);
      return 1;
    }
    ids[i] = reg.value();
    g_formulas[i].worker_id = ids[i].value();
  }

  for (uint32_t round = 1U; round <= 20U; ++round) {
    for (uint32_t i = 0U; i < 3U; ++i) {
      auto probe = sup.NextProbeId(ids[i]);
      if (!probe.has_value()) continue;
      if (!HandleReport(g_formulas[i], round)) {
        auto state = sup.OnPoisonReceived(ids[i], probe.value());
        if (state.has_value()) {
          FSUP_LOG_DEBUG("demo", "round %u: '%s' poison %u -> %s", round, g_formulas[i].name,
                         probe.value(), fsup::DetectorStateName(state.value()));
        }
      }
    }
  }

  std::printf("\n%-12s %-16s %10s %8s %10s\n", "formula", "state", "generation", "blocked", "next_probe");
  sup.ForEachWorker([](const fsup::WorkerInfo& info) {
    std::printf("%-12s %-16s %10u %8u %10u\n", info.name, fsup::DetectorStateName(info.state),
                info.generation, info.blocked_count, info.next_probe_id);
  });
  for (const Formula& f : g_formulas) {
    std::printf("%s respawned %u time(s)\n", f.name, f.respawns);
  }

  fsup::log::Shutdown();
  return 0;
}
