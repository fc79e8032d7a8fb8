#ifndef PHOTON_MATCH_WORLD_H
#define PHOTON_MATCH_WORLD_H

#include "photon_components.h"
#include <flecs.h>
#include <functional>
#include <vector>

namespace photon {

// ═════════════════════════════════════════════════════════════
// MATCH API
//
// Everything an issuing layer (Godot host, AI, replay driver,
// tests) is allowed to do to a match. Illegal requests return
// false and leave the world untouched.
// ═════════════════════════════════════════════════════════════

// Registers components, singletons, phases and systems. Call once per world.
void init_match(flecs::world &ecs, const MatchConfig &config,
                const DefinitionTable &definitions, bool track_stats = true);

// One simulation tick. No-op (false) when dt <= 0 or the match is decided.
bool advance(flecs::world &ecs, float dt);

void set_obstacles(flecs::world &ecs, const std::vector<ObstacleRect> &rects);
void set_event_hook(flecs::world &ecs,
                    std::function<void(const MatchEvent &)> hook);

// ─── Setup ──────────────────────────────────────────────────
uint32_t create_base(flecs::world &ecs, uint8_t owner, BaseType type,
                     Position position);

// Deducts cost, records stats, queues a move to the (obstacle-safe) rally
// point. `out_id` receives the new UnitId on success.
bool spawn_unit(flecs::world &ecs, uint8_t owner, UnitType type,
                Position spawn, Position rally, uint32_t *out_id = nullptr);

// ─── Unit orders ────────────────────────────────────────────
bool queue_command(flecs::world &ecs, uint32_t unit_id,
                   const CommandNode &node);
bool clear_commands(flecs::world &ecs, uint32_t unit_id);

// Appends the way back of a patrol leg (target and return swapped).
bool queue_patrol_return(flecs::world &ecs, uint32_t unit_id,
                         const CommandNode &node);

// ─── Base orders ────────────────────────────────────────────
bool set_base_target(flecs::world &ecs, uint32_t base_id, Position target);
bool clear_base_target(flecs::world &ecs, uint32_t base_id);
bool select_base(flecs::world &ecs, uint32_t base_id, bool selected);
bool fire_laser(flecs::world &ecs, uint32_t base_id, float dir_x,
                float dir_y);

// ─── Lookups ────────────────────────────────────────────────
flecs::entity find_unit(flecs::world &ecs, uint32_t unit_id);
flecs::entity find_base(flecs::world &ecs, uint32_t base_id);
int unit_count(flecs::world &ecs, uint8_t owner);
int photons(flecs::world &ecs, uint8_t owner);
int winner(flecs::world &ecs); // NO_WINNER while undecided

} // namespace photon

#endif // PHOTON_MATCH_WORLD_H
