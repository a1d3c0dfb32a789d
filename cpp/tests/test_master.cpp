// ═════════════════════════════════════════════════════════════
// HOVERTANK CORE: TEST UNITY BUILD
// ═════════════════════════════════════════════════════════════
// Headless test binary. No Godot dependency.
// Build: cmake -S . -B build && cmake --build build
// Run:   ctest --test-dir build
// ═════════════════════════════════════════════════════════════

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

// ── Flecs ───────────────────────────────────────────────────
#include <flecs.h>

// ── Pure C++ simulation code (Godot-free) ───────────────────
#include "../src/ecs/config_loader.h"
#include "../src/ecs/hovertank_components.h"
#include "../src/ecs/hovertank_systems.h"
#include "../src/ecs/sim_runtime.h"

// Define the runtime that normally lives in world_manager.cpp
namespace hovertank {
SimRuntime g_runtime;
}

#include "../src/ecs/hovertank_log.cpp"
#include "../src/ecs/timer_queue.cpp"
#include "../src/ecs/sim_runtime.cpp"
#include "../src/ecs/config_loader.cpp"
#include "../src/ecs/vitals_systems.cpp"
#include "../src/ecs/locomotion_systems.cpp"
#include "../src/ecs/module_systems.cpp"
#include "../src/ecs/weapon_systems.cpp"

// ── Test Infrastructure ─────────────────────────────────────
#include "test_harness.h"

// ── Test Suites (domain-based) ──────────────────────────────
#include "test_invariants.cpp"
#include "test_locomotion.cpp"
#include "test_combat.cpp"
#include "test_vitals.cpp"
#include "test_modules.cpp"
#include "test_config.cpp"
#include "test_perf.cpp"
