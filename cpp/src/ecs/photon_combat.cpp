#include "photon_components.h"
#include "photon_systems.h"
#include <cmath>

namespace photon {

// ═════════════════════════════════════════════════════════════
// COMBAT RESOLUTION
//
// Continuous damage: attack_damage * attack_rate * dt * multiplier.
// Nearest visible enemy unit in range first, then (if the unit
// may damage structures) the nearest enemy base in range + base
// radius. Dead units are swept only after everybody has fired.
// ═════════════════════════════════════════════════════════════

void register_combat_systems(flecs::world &ecs) {
  const MatchPhases &phases = ecs.get<MatchPhases>();

  // ── System: Unit Attacks ──────────────────────────────────
  ecs.system<const Position, const UnitKind, const Owner, const Veterancy>(
         "UnitAttack")
      .kind(phases.combat)
      .each([](flecs::entity e, const Position &pos, const UnitKind &kind,
               const Owner &owner, const Veterancy &vet) {
        flecs::world w = e.world();
        float dt = w.delta_time();
        if (dt <= 0.0f)
          return;

        const UnitDefinition &def = w.get<DefinitionTable>().unit(kind.type);
        if (def.attack_type == ATTACK_NONE)
          return;

        float damage =
            def.attack_damage * def.attack_rate * dt * vet.damage_multiplier;
        DamageKind dk =
            def.attack_type == ATTACK_MELEE ? DAMAGE_MELEE : DAMAGE_RANGED;

        // Step 1: nearest non-cloaked enemy unit
        flecs::entity target = flecs::entity::null();
        float best_sq = def.attack_range * def.attack_range;
        w.each([&](flecs::entity t, const Position &tp, const Owner &to,
                   const AbilityEffects &tfx) {
          if (to.player == owner.player || tfx.cloak.active)
            return;
          float dx = tp.x - pos.x;
          float dy = tp.y - pos.y;
          float d2 = dx * dx + dy * dy;
          if (d2 <= best_sq) {
            best_sq = d2;
            target = t;
          }
        });

        if (target.is_valid()) {
          damage_unit(w, target, damage, dk, owner.player);
          return;
        }
        if (!def.can_damage_structures)
          return;

        // Step 2: nearest enemy structure
        float reach = def.attack_range + BASE_RADIUS;
        best_sq = reach * reach;
        w.each([&](flecs::entity b, const Position &bp, const Owner &bo,
                   const BaseState &) {
          if (bo.player == owner.player)
            return;
          float dx = bp.x - pos.x;
          float dy = bp.y - pos.y;
          float d2 = dx * dx + dy * dy;
          if (d2 <= best_sq) {
            best_sq = d2;
            target = b;
          }
        });

        if (target.is_valid())
          damage_base(w, target, damage, dk, owner.player);
      });

  // ── System: Defense Base Auto-Attack ──────────────────────
  // Discrete shots gated by attack_cooldown (ticked in BaseUpdate).
  ecs.system<const Position, BaseState, const Owner>("BaseAutoAttack")
      .kind(phases.combat)
      .each([](flecs::entity e, const Position &pos, BaseState &state,
               const Owner &owner) {
        flecs::world w = e.world();
        if (w.delta_time() <= 0.0f)
          return;

        const BaseDefinition &def = w.get<DefinitionTable>().base(state.type);
        if (def.attack_rate <= 0.0f || state.attack_cooldown > 0.0f)
          return;

        flecs::entity target = flecs::entity::null();
        bool target_is_base = false;
        float best_sq = def.attack_range * def.attack_range;

        w.each([&](flecs::entity t, const Position &tp, const Owner &to,
                   const AbilityEffects &tfx) {
          if (to.player == owner.player || tfx.cloak.active)
            return;
          float dx = tp.x - pos.x;
          float dy = tp.y - pos.y;
          float d2 = dx * dx + dy * dy;
          if (d2 <= best_sq) {
            best_sq = d2;
            target = t;
          }
        });
        w.each([&](flecs::entity b, const Position &bp, const Owner &bo,
                   const BaseState &) {
          if (bo.player == owner.player)
            return;
          float dx = bp.x - pos.x;
          float dy = bp.y - pos.y;
          float d2 = dx * dx + dy * dy;
          if (d2 < best_sq) {
            best_sq = d2;
            target = b;
            target_is_base = true;
          }
        });

        if (!target.is_valid())
          return;

        if (target_is_base)
          damage_base(w, target, def.attack_damage, DAMAGE_RANGED,
                      owner.player);
        else
          damage_unit(w, target, def.attack_damage, DAMAGE_RANGED,
                      owner.player);
        state.attack_cooldown = 1.0f / def.attack_rate;
      });

  // ── System: Death Sweep ───────────────────────────────────
  // Destruction is deferred to the end of the frame; nothing after
  // this phase reads units.
  ecs.system<const Health, const Owner, const UnitId, const Position>(
         "DeathSweep")
      .kind(phases.combat)
      .each([](flecs::entity e, const Health &h, const Owner &owner,
               const UnitId &id, const Position &pos) {
        if (h.hp > 0.0f)
          return;
        flecs::world w = e.world();

        if (w.has<MatchStats>()) {
          MatchStats &stats = w.get_mut<MatchStats>();
          stats.units_killed[owner.player == 0 ? 1 : 0]++;
        }
        emit_event(w, EVENT_DEATH, owner.player, id.id, pos.x, pos.y, 0.0f);
        e.destruct();
      });
}

// ═════════════════════════════════════════════════════════════
// BASE LASER
//
// 20m beam, 0.5m wide. Pierces every enemy on the line; armor
// and shields do not apply.
// ═════════════════════════════════════════════════════════════
bool fire_base_laser(flecs::entity base, float dir_x, float dir_y) {
  if (!base.is_alive() || !base.has<BaseState>())
    return false;

  BaseState &state = base.get_mut<BaseState>();
  if (state.laser_cooldown > 0.0f)
    return false;

  float len = std::sqrt(dir_x * dir_x + dir_y * dir_y);
  if (len <= 0.0f)
    return false;
  float nx = dir_x / len;
  float ny = dir_y / len;

  flecs::world w = base.world();
  const Position origin = base.get<Position>();
  uint8_t team = base.get<Owner>().player;
  constexpr float HALF_WIDTH = LASER_WIDTH * 0.5f;

  state.laser_cooldown = LASER_COOLDOWN;
  emit_event(w, EVENT_LASER_FIRE, team, base.get<BaseId>().id, origin.x,
             origin.y, 0.0f);

  w.each([&](flecs::entity t, const Position &tp, const Owner &to,
             const UnitId &) {
    if (to.player == team)
      return;
    float tx = tp.x - origin.x;
    float ty = tp.y - origin.y;
    float projected = tx * nx + ty * ny;
    float perp = std::fabs(tx * ny - ty * nx);
    if (projected > 0.0f && projected < LASER_RANGE && perp < HALF_WIDTH)
      damage_unit(w, t, LASER_DAMAGE_UNIT, DAMAGE_PURE, team);
  });

  w.each([&](flecs::entity t, const Position &tp, const Owner &to,
             const BaseId &) {
    if (to.player == team)
      return;
    float tx = tp.x - origin.x;
    float ty = tp.y - origin.y;
    float projected = tx * nx + ty * ny;
    float perp = std::fabs(tx * ny - ty * nx);
    if (projected > 0.0f && projected < LASER_RANGE &&
        perp < HALF_WIDTH + BASE_RADIUS)
      damage_base(w, t, LASER_DAMAGE_BASE, DAMAGE_PURE, team);
  });
  return true;
}

} // namespace photon
