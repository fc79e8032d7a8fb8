// ═════════════════════════════════════════════════════════════
// PHOTON CLASH: TEST UNITY BUILD
// ═════════════════════════════════════════════════════════════
// Headless test binary. No Godot dependency.
// Build: cmake -S . -B build && cmake --build build
// Run:   ctest --test-dir build   (or build/photon_tests)
// ═════════════════════════════════════════════════════════════

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

// ── Flecs ───────────────────────────────────────────────────
#include <flecs.h>

// ── Pure C++ simulation code (Godot-free) ───────────────────
#include "../src/ecs/match_snapshot.h"
#include "../src/ecs/match_world.h"
#include "../src/ecs/obstacle_query.h"
#include "../src/ecs/photon_components.h"
#include "../src/ecs/photon_definitions.h"
#include "../src/ecs/photon_systems.h"

// One TU: the same unity build the core library uses
#include "../src/ecs/photon_master.cpp"

// ── Test Infrastructure ─────────────────────────────────────
#include "test_harness.h"

// ── Test Suites (domain-based) ──────────────────────────────
#include "test_mover.cpp"
#include "test_abilities.cpp"
#include "test_combat.cpp"
#include "test_match.cpp"
#include "test_invariants.cpp"
#include "test_data.cpp"
#include "test_perf.cpp"
