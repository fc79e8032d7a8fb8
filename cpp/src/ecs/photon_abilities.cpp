#include "photon_components.h"
#include "photon_systems.h"
#include <algorithm>
#include <cmath>
#include <vector>

namespace photon {

// ═════════════════════════════════════════════════════════════
// ABILITY EXECUTOR
//
// One behavior per unit type. Cooldown must be exactly zero;
// anything else is a silent no-op. Deferred abilities only arm
// a slot here, the ticker below resolves them against the match
// clock.
// ═════════════════════════════════════════════════════════════

static float match_now(flecs::world &w) {
  return (float)w.get<MatchClock>().elapsed;
}

static void normalize(float &x, float &y) {
  float len = std::sqrt(x * x + y * y);
  if (len <= 0.0f) {
    x = 0.0f;
    y = 0.0f;
    return;
  }
  x /= len;
  y /= len;
}

// ── Burst fire: 10 shots over a 0.3 rad cone, re-targeted per shot ──
static bool burst_fire(flecs::world &w, flecs::entity caster,
                       const UnitDefinition &def, float dir_x, float dir_y) {
  constexpr int SHOTS = 10;
  constexpr float CONE = 0.3f; // radians, total spread
  constexpr float SHOT_DAMAGE = 2.0f;

  normalize(dir_x, dir_y);
  if (dir_x == 0.0f && dir_y == 0.0f)
    return true; // fired into nothing

  const Position origin = caster.get<Position>();
  uint8_t team = caster.get<Owner>().player;
  float damage = SHOT_DAMAGE * caster.get<Veterancy>().damage_multiplier;
  float range_sq = def.attack_range * def.attack_range;
  float heading = std::atan2(dir_y, dir_x);

  for (int i = 0; i < SHOTS; i++) {
    float angle = heading + CONE * ((float)i / (float)(SHOTS - 1) - 0.5f);
    float sx = std::cos(angle);
    float sy = std::sin(angle);

    flecs::entity hit = flecs::entity::null();
    float best_sq = range_sq;
    w.each([&](flecs::entity t, const Position &tp, const Owner &to,
               const AbilityEffects &tfx) {
      if (to.player == team || tfx.cloak.active)
        return;
      float tx = tp.x - origin.x;
      float ty = tp.y - origin.y;
      float d2 = tx * tx + ty * ty;
      if (d2 > best_sq)
        return;
      float projected = tx * sx + ty * sy;
      float perp = std::fabs(tx * sy - ty * sx);
      if (projected > 0.0f && perp < UNIT_RADIUS) {
        best_sq = d2;
        hit = t;
      }
    });

    if (hit.is_valid())
      damage_unit(w, hit, damage, DAMAGE_RANGED, team);
  }
  return true;
}

// ── Dash strike: teleport onto the nearest enemy near the anchor ──
static bool dash_strike(flecs::world &w, flecs::entity caster,
                        const UnitDefinition &def, float target_x,
                        float target_y) {
  constexpr float SEARCH_RADIUS = 3.0f;
  constexpr float DAMAGE_FACTOR = 3.0f;
  constexpr float DASH_FLAG_SECONDS = 0.3f;

  uint8_t team = caster.get<Owner>().player;
  flecs::entity victim = flecs::entity::null();
  float best_sq = SEARCH_RADIUS * SEARCH_RADIUS;
  Position landing = {0.0f, 0.0f};

  w.each([&](flecs::entity t, const Position &tp, const Owner &to,
             const AbilityEffects &tfx) {
    if (to.player == team || tfx.cloak.active)
      return;
    float dx = tp.x - target_x;
    float dy = tp.y - target_y;
    float d2 = dx * dx + dy * dy;
    if (d2 <= best_sq) {
      best_sq = d2;
      victim = t;
      landing = tp;
    }
  });

  if (!victim.is_valid())
    return false;

  caster.get_mut<Position>() = landing;
  float damage = def.attack_damage * DAMAGE_FACTOR *
                 caster.get<Veterancy>().damage_multiplier;
  damage_unit(w, victim, damage, DAMAGE_MELEE, team);

  AbilityEffects &fx = caster.get_mut<AbilityEffects>();
  fx.dash = {true, match_now(w) + DASH_FLAG_SECONDS};
  return true;
}

// ── Line jump: arm a 0.5s telegraph, resolved by the ticker ──
static bool line_jump(flecs::world &w, flecs::entity caster, float dir_x,
                      float dir_y) {
  constexpr float TELEGRAPH_SECONDS = 0.5f;
  constexpr float JUMP_DAMAGE = 20.0f;

  float len = std::sqrt(dir_x * dir_x + dir_y * dir_y);
  float reach = std::min(len, ABILITY_MAX_RANGE);
  normalize(dir_x, dir_y);

  const Position &pos = caster.get<Position>();
  float now = match_now(w);
  float damage = JUMP_DAMAGE * caster.get<Veterancy>().damage_multiplier;

  AbilityEffects &fx = caster.get_mut<AbilityEffects>();
  fx.line_jump = {true,
                  false,
                  now,
                  now + TELEGRAPH_SECONDS,
                  pos.x,
                  pos.y,
                  pos.x + dir_x * reach,
                  pos.y + dir_y * reach,
                  dir_x,
                  dir_y,
                  damage};
  return true;
}

// ── Heal pulse: instant area heal, 1s display slot ──
static bool heal_pulse(flecs::world &w, flecs::entity caster) {
  constexpr float RADIUS = 5.0f;
  constexpr float UNIT_HEAL = 50.0f;
  constexpr float BASE_HEAL = 100.0f;

  const Position origin = caster.get<Position>();
  uint8_t team = caster.get<Owner>().player;
  float r2 = RADIUS * RADIUS;

  w.each([&](flecs::entity, const Position &p, const Owner &o, Health &h,
             const UnitId &) {
    if (o.player != team)
      return;
    float dx = p.x - origin.x;
    float dy = p.y - origin.y;
    if (dx * dx + dy * dy <= r2)
      h.hp = std::min(h.max_hp, h.hp + UNIT_HEAL);
  });
  w.each([&](flecs::entity, const Position &p, const Owner &o, Health &h,
             const BaseId &) {
    if (o.player != team)
      return;
    float dx = p.x - origin.x;
    float dy = p.y - origin.y;
    if (dx * dx + dy * dy <= r2)
      h.hp = std::min(h.max_hp, h.hp + BASE_HEAL);
  });

  AbilityEffects &fx = caster.get_mut<AbilityEffects>();
  fx.heal_pulse = {true, match_now(w) + 1.0f, RADIUS};
  return true;
}

// ── Missile barrage: lock up to 6 targets ahead, resolve in 1.5s ──
static bool missile_barrage(flecs::world &w, flecs::entity caster, float dir_x,
                            float dir_y) {
  constexpr float LOCK_RANGE = 12.0f;
  constexpr float MISSILE_DAMAGE = 15.0f;
  constexpr float FLIGHT_SECONDS = 1.5f;

  struct Lock {
    float d2;
    float x, y;
  };

  normalize(dir_x, dir_y);
  const Position origin = caster.get<Position>();
  uint8_t team = caster.get<Owner>().player;

  std::vector<Lock> locks;
  w.each([&](flecs::entity, const Position &tp, const Owner &to,
             const AbilityEffects &tfx) {
    if (to.player == team || tfx.cloak.active)
      return;
    float tx = tp.x - origin.x;
    float ty = tp.y - origin.y;
    float d2 = tx * tx + ty * ty;
    if (d2 > LOCK_RANGE * LOCK_RANGE)
      return;
    if (tx * dir_x + ty * dir_y <= 0.0f)
      return;
    locks.push_back({d2, tp.x, tp.y});
  });
  std::stable_sort(locks.begin(), locks.end(),
                   [](const Lock &a, const Lock &b) { return a.d2 < b.d2; });

  MissileBarrageSlot slot = {};
  slot.active = true;
  slot.resolved = false;
  slot.resolve_time = match_now(w) + FLIGHT_SECONDS;
  float damage = MISSILE_DAMAGE * caster.get<Veterancy>().damage_multiplier;
  for (const Lock &lock : locks) {
    if (slot.count >= MAX_MISSILES)
      break;
    slot.missiles[slot.count++] = {lock.x, lock.y, damage};
  }

  caster.get_mut<AbilityEffects>().missiles = slot;
  return true;
}

bool execute_ability(flecs::entity caster, float target_x, float target_y,
                     float dir_x, float dir_y) {
  if (!caster.is_alive() || !caster.has<AbilityState>() ||
      !caster.has<AbilityEffects>())
    return false;

  flecs::world w = caster.world();
  if (caster.get<AbilityState>().cooldown != 0.0f)
    return false;

  const UnitDefinition &def =
      w.get<DefinitionTable>().unit(caster.get<UnitKind>().type);
  float now = match_now(w);
  float mult = caster.get<Veterancy>().damage_multiplier;

  bool fired = false;
  switch (def.ability) {
  case ABILITY_NONE:
    break;
  case ABILITY_BURST_FIRE:
    fired = burst_fire(w, caster, def, dir_x, dir_y);
    break;
  case ABILITY_DASH_STRIKE:
    fired = dash_strike(w, caster, def, target_x, target_y);
    break;
  case ABILITY_LINE_JUMP:
    fired = line_jump(w, caster, dir_x, dir_y);
    break;
  case ABILITY_SHIELD:
    caster.get_mut<AbilityEffects>().shield = {true, now + 5.0f, 4.0f,
                                               SHIELD_DAMAGE_FACTOR, 1.0f};
    fired = true;
    break;
  case ABILITY_CLOAK:
    caster.get_mut<AbilityEffects>().cloak = {true, now + 5.0f};
    fired = true;
    break;
  case ABILITY_BOMBARDMENT:
    caster.get_mut<AbilityEffects>().bombardment = {
        true, now + 1.5f, now + 2.0f, target_x, target_y, 3.0f,
        40.0f * mult, 80.0f * mult};
    fired = true;
    break;
  case ABILITY_HEAL_PULSE:
    fired = heal_pulse(w, caster);
    break;
  case ABILITY_MISSILE_BARRAGE:
    fired = missile_barrage(w, caster, dir_x, dir_y);
    break;
  }

  if (!fired)
    return false;

  caster.get_mut<AbilityState>().cooldown = def.ability_cooldown;

  const Position &p = caster.get<Position>();
  emit_event(w, EVENT_ABILITY_CAST, caster.get<Owner>().player,
             caster.get<UnitId>().id, p.x, p.y, (float)def.ability);
  return true;
}

// ═════════════════════════════════════════════════════════════
// ABILITY EFFECT TICKER
//
// Every unit, every tick, whatever its queue is doing. Single
// instant effects (missiles, line jump) flip `resolved` before
// applying anything and clear the slot in the same call.
// ═════════════════════════════════════════════════════════════

static void tick_bombardment(flecs::world &w, BombardmentSlot &b,
                             uint8_t team, float now, float dt) {
  if (now > b.impact_time && now < b.end_time) {
    float r2 = b.radius * b.radius;
    w.each([&](flecs::entity t, const Position &tp, const Owner &to,
               const UnitId &) {
      if (to.player == team)
        return;
      float dx = tp.x - b.x;
      float dy = tp.y - b.y;
      if (dx * dx + dy * dy <= r2)
        damage_unit(w, t, b.unit_dps * dt, DAMAGE_RANGED, team);
    });
    w.each([&](flecs::entity t, const Position &tp, const Owner &to,
               const BaseId &) {
      if (to.player == team)
        return;
      float dx = tp.x - b.x;
      float dy = tp.y - b.y;
      if (dx * dx + dy * dy <= r2)
        damage_base(w, t, b.base_dps * dt, DAMAGE_RANGED, team);
    });
  }
  if (now >= b.end_time)
    b.active = false;
}

static void resolve_missiles(flecs::world &w, MissileBarrageSlot &m,
                             uint8_t team) {
  constexpr float HIT_RADIUS = 0.5f;
  m.resolved = true;

  for (int i = 0; i < m.count; i++) {
    const Missile &missile = m.missiles[i];
    flecs::entity hit = flecs::entity::null();
    float best_sq = HIT_RADIUS * HIT_RADIUS;
    w.each([&](flecs::entity t, const Position &tp, const Owner &to,
               const UnitId &) {
      if (to.player == team)
        return;
      float dx = tp.x - missile.target_x;
      float dy = tp.y - missile.target_y;
      float d2 = dx * dx + dy * dy;
      if (d2 < best_sq) {
        best_sq = d2;
        hit = t;
      }
    });
    // Target moved away: the missile lands on empty ground
    if (hit.is_valid())
      damage_unit(w, hit, missile.damage, DAMAGE_RANGED, team);
  }
  m.active = false;
}

static void resolve_line_jump(flecs::world &w, LineJumpSlot &j, Position &pos,
                              uint8_t team) {
  constexpr float HIT_RADIUS = 1.0f; // one unit footprint
  j.resolved = true;

  float dx = j.end_x - j.start_x;
  float dy = j.end_y - j.start_y;
  float len = std::sqrt(dx * dx + dy * dy);
  int steps = (int)std::ceil(len * 10.0f);

  std::vector<flecs::entity_t> struck;
  for (int i = 0; i <= steps; i++) {
    float t = steps > 0 ? (float)i / (float)steps : 0.0f;
    float cx = j.start_x + dx * t;
    float cy = j.start_y + dy * t;
    w.each([&](flecs::entity target, const Position &tp, const Owner &to,
               const UnitId &) {
      if (to.player == team)
        return;
      if (std::find(struck.begin(), struck.end(), target.id()) != struck.end())
        return;
      float ex = tp.x - cx;
      float ey = tp.y - cy;
      if (ex * ex + ey * ey < HIT_RADIUS * HIT_RADIUS) {
        struck.push_back(target.id());
        damage_unit(w, target, j.damage, DAMAGE_MELEE, team);
      }
    });
  }

  pos.x = j.end_x;
  pos.y = j.end_y;
  j.active = false;
}

void register_ability_systems(flecs::world &ecs) {
  const MatchPhases &phases = ecs.get<MatchPhases>();

  ecs.system<Position, AbilityEffects, const Owner>("AbilityEffectTicker")
      .kind(phases.units)
      .each([](flecs::entity e, Position &pos, AbilityEffects &fx,
               const Owner &owner) {
        flecs::world w = e.world();
        float dt = w.delta_time();
        if (dt <= 0.0f)
          return;
        float now = match_now(w);

        if (fx.shield.active && now > fx.shield.end_time)
          fx.shield.active = false;
        if (fx.cloak.active && now > fx.cloak.end_time)
          fx.cloak.active = false;
        if (fx.heal_pulse.active && now > fx.heal_pulse.end_time)
          fx.heal_pulse.active = false;
        if (fx.dash.active && now > fx.dash.end_time)
          fx.dash.active = false;

        if (fx.bombardment.active)
          tick_bombardment(w, fx.bombardment, owner.player, now, dt);

        if (fx.missiles.active && !fx.missiles.resolved &&
            now >= fx.missiles.resolve_time)
          resolve_missiles(w, fx.missiles, owner.player);

        if (fx.line_jump.active && !fx.line_jump.resolved &&
            now >= fx.line_jump.resolve_time)
          resolve_line_jump(w, fx.line_jump, pos, owner.player);
      });
}

} // namespace photon
