// ═════════════════════════════════════════════════════════════
// PHOTON CLASH: HEADLESS TEST HARNESS
// ═════════════════════════════════════════════════════════════
// RAII fixture for doctest. Each TEST_CASE_FIXTURE gets a
// pristine flecs::world with the full match pipeline registered.
// No Godot dependency.
// ═════════════════════════════════════════════════════════════
#pragma once
#include <doctest/doctest.h>
#include <vector>

using namespace photon;

// Plenty of photons so spawn tests are never starved by accident
inline MatchConfig test_config() {
  MatchConfig cfg;
  cfg.starting_photons = 100000;
  return cfg;
}

// ── RAII Test Fixture ───────────────────────────────────────
struct MatchTestHarness {
  flecs::world ecs;
  std::vector<MatchEvent> events;

  MatchTestHarness() {
    init_match(ecs, test_config(), default_definitions());
    set_event_hook(ecs, [this](const MatchEvent &ev) { events.push_back(ev); });
  }

  // Deterministic frame stepping. 0.25s is exact in binary, so
  // elapsed time and per-tick damage stay exact too.
  void step(int frames = 1, float dt = 0.25f) {
    for (int i = 0; i < frames; i++)
      advance(ecs, dt);
  }

  // Unit standing still at (x, y) with an empty queue
  flecs::entity spawn(uint8_t owner, UnitType type, float x, float y) {
    uint32_t id = 0;
    REQUIRE(spawn_unit(ecs, owner, type, {x, y}, {x, y}, &id));
    clear_commands(ecs, id);
    return find_unit(ecs, id);
  }

  flecs::entity base(uint8_t owner, BaseType type, float x, float y) {
    return find_base(ecs, create_base(ecs, owner, type, {x, y}));
  }

  // ── Readers (flecs v4 get<T>() returns a const ref) ──
  static float hp(flecs::entity e) { return e.get<Health>().hp; }
  static Position pos(flecs::entity e) { return e.get<Position>(); }
  static uint32_t uid(flecs::entity e) { return e.get<UnitId>().id; }
  static uint32_t bid(flecs::entity e) { return e.get<BaseId>().id; }
  static const AbilityEffects &effects(flecs::entity e) {
    return e.get<AbilityEffects>();
  }

  static void set_hp(flecs::entity e, float value) {
    e.get_mut<Health>().hp = value;
  }
  static void place(flecs::entity e, float x, float y) {
    e.get_mut<Position>() = {x, y};
  }

  double elapsed() { return ecs.get<MatchClock>().elapsed; }

  int count_events(MatchEventKind kind) const {
    int n = 0;
    for (const MatchEvent &ev : events) {
      if (ev.kind == kind)
        n++;
    }
    return n;
  }
};
