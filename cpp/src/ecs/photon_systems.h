#ifndef PHOTON_SYSTEMS_H
#define PHOTON_SYSTEMS_H

#include "photon_components.h"
#include <flecs.h>

namespace photon {

// Pipeline phases, in tick order. Each depends on the previous one so flecs
// runs them strictly in sequence inside ecs.progress().
struct MatchPhases {
  flecs::entity_t economy;
  flecs::entity_t units;
  flecs::entity_t bases;
  flecs::entity_t combat;
  flecs::entity_t time_limit;
  flecs::entity_t victory;
};

void register_match_phases(flecs::world &ecs);

// Clock + income
void register_economy_systems(flecs::world &ecs);

// Command queue mover + ability cooldown
void register_unit_systems(flecs::world &ecs);

// Deferred ability effect ticker (same phase, after the mover)
void register_ability_systems(flecs::world &ecs);

// Base movement, laser/auto-attack cooldowns, regeneration, assault shield
void register_base_systems(flecs::world &ecs);

// Unit attacks, defense auto-attack, death sweep
void register_combat_systems(flecs::world &ecs);

// Time limit tie-break, base destruction
void register_victory_systems(flecs::world &ecs);

// ─── Shared helpers (used by systems and the match API) ─────

enum DamageKind : uint8_t {
  DAMAGE_RANGED = 0, // armor + ranged shield factor
  DAMAGE_MELEE,      // ignores armor, melee shield factor
  DAMAGE_PURE        // ignores armor and shields (base laser)
};

// Ranged damage scaled by armor / (armor + 100).
float armor_scaled(float damage, float armor);

// Smallest shield factor over allied shield bearers covering (x, y).
// 1.0 when nobody covers the point.
float shield_factor(flecs::world &w, uint8_t owner, float x, float y,
                    DamageKind kind);

// Applies damage to a unit or base entity and records MatchStats.
// Returns the damage actually dealt.
float damage_unit(flecs::world &w, flecs::entity target, float amount,
                  DamageKind kind, uint8_t attacker_owner);
float damage_base(flecs::world &w, flecs::entity target, float amount,
                  DamageKind kind, uint8_t attacker_owner);

void emit_event(flecs::world &w, MatchEventKind kind, int owner, uint32_t id,
                float x, float y, float amount);

// Starts the caster's ability toward (target_x, target_y) along
// (dir_x, dir_y). Silent no-op (returns false) while on cooldown.
bool execute_ability(flecs::entity caster, float target_x, float target_y,
                     float dir_x, float dir_y);

// Base laser along (dir_x, dir_y). False while on cooldown.
bool fire_base_laser(flecs::entity base, float dir_x, float dir_y);

} // namespace photon

#endif // PHOTON_SYSTEMS_H
