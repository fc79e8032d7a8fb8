#include "photon_systems.h"
#include "obstacle_query.h"
#include "photon_components.h"
#include <algorithm>
#include <cmath>

namespace photon {

// ═════════════════════════════════════════════════════════════
// TICK ORDER
//
// Economy → Units (mover, then ability ticker) → Bases →
// Combat (attacks, then death sweep) → Time limit → Victory.
// The tie-break reads damage totals written by Combat, so this
// order is fixed here rather than left to registration order.
// ═════════════════════════════════════════════════════════════
void register_match_phases(flecs::world &ecs) {
  flecs::entity economy =
      ecs.entity("EconomyPhase").add(flecs::Phase).depends_on(flecs::OnUpdate);
  flecs::entity units =
      ecs.entity("UnitPhase").add(flecs::Phase).depends_on(economy);
  flecs::entity bases =
      ecs.entity("BasePhase").add(flecs::Phase).depends_on(units);
  flecs::entity combat =
      ecs.entity("CombatPhase").add(flecs::Phase).depends_on(bases);
  flecs::entity time_limit =
      ecs.entity("TimeLimitPhase").add(flecs::Phase).depends_on(combat);
  flecs::entity victory =
      ecs.entity("VictoryPhase").add(flecs::Phase).depends_on(time_limit);

  ecs.set<MatchPhases>({economy.id(), units.id(), bases.id(), combat.id(),
                        time_limit.id(), victory.id()});
}

// ─── Shared damage / event helpers ──────────────────────────

float armor_scaled(float damage, float armor) {
  if (armor <= 0.0f)
    return damage;
  return damage * (1.0f - armor / (armor + 100.0f));
}

float shield_factor(flecs::world &w, uint8_t owner, float x, float y,
                    DamageKind kind) {
  if (kind == DAMAGE_PURE)
    return 1.0f;

  float factor = 1.0f;
  w.each([&](flecs::entity, const Position &p, const Owner &o,
             const AbilityEffects &fx) {
    if (o.player != owner || !fx.shield.active)
      return;
    float dx = p.x - x;
    float dy = p.y - y;
    if (dx * dx + dy * dy > fx.shield.radius * fx.shield.radius)
      return;
    float f = (kind == DAMAGE_RANGED) ? fx.shield.ranged_factor
                                      : fx.shield.melee_factor;
    if (f < factor)
      factor = f;
  });
  return factor;
}

float damage_unit(flecs::world &w, flecs::entity target, float amount,
                  DamageKind kind, uint8_t attacker_owner) {
  if (!target.is_alive() || !target.has<Health>() || amount <= 0.0f)
    return 0.0f;

  const Position &p = target.get<Position>();
  const Owner &o = target.get<Owner>();

  float dealt = amount;
  if (kind == DAMAGE_RANGED && target.has<Armor>())
    dealt = armor_scaled(dealt, target.get<Armor>().value);
  dealt *= shield_factor(w, o.player, p.x, p.y, kind);

  Health &h = target.get_mut<Health>();
  h.hp -= dealt;

  if (w.has<MatchStats>()) {
    MatchStats &stats = w.get_mut<MatchStats>();
    stats.damage_dealt[attacker_owner % PLAYER_COUNT] += dealt;
  }
  return dealt;
}

float damage_base(flecs::world &w, flecs::entity target, float amount,
                  DamageKind kind, uint8_t attacker_owner) {
  if (!target.is_alive() || !target.has<BaseState>() || amount <= 0.0f)
    return 0.0f;

  const BaseState &state = target.get<BaseState>();
  const Owner &o = target.get<Owner>();

  float dealt = amount;
  if (kind == DAMAGE_RANGED && target.has<Armor>())
    dealt = armor_scaled(dealt, target.get<Armor>().value);
  if (kind != DAMAGE_PURE && state.shield_active)
    dealt *= SHIELD_DAMAGE_FACTOR;

  Health &h = target.get_mut<Health>();
  h.hp -= dealt;

  if (w.has<MatchStats>()) {
    MatchStats &stats = w.get_mut<MatchStats>();
    stats.damage_dealt[attacker_owner % PLAYER_COUNT] += dealt;
    stats.base_damage_taken[o.player % PLAYER_COUNT] += dealt;
  }

  const Position &p = target.get<Position>();
  emit_event(w, EVENT_BASE_DAMAGE, o.player, target.get<BaseId>().id, p.x,
             p.y, dealt);
  return dealt;
}

void emit_event(flecs::world &w, MatchEventKind kind, int owner, uint32_t id,
                float x, float y, float amount) {
  if (!w.has<EventHooks>())
    return;
  const EventHooks &hooks = w.get<EventHooks>();
  if (!hooks.on_event)
    return;
  hooks.on_event(MatchEvent{kind, owner, id, x, y, amount});
}

// ═════════════════════════════════════════════════════════════
// ECONOMY: clock + discrete income
// ═════════════════════════════════════════════════════════════

void register_economy_systems(flecs::world &ecs) {
  const MatchPhases &phases = ecs.get<MatchPhases>();

  // Income rate steps up every 10s. Grants land once per whole
  // second so every payout is auditable.
  ecs.system<MatchClock>("EconomyTick")
      .kind(phases.economy)
      .each([](flecs::entity e, MatchClock &clock) {
        flecs::world w = e.world();
        float dt = w.delta_time();
        if (dt <= 0.0f)
          return;

        clock.elapsed += dt;

        Economy &eco = w.get_mut<Economy>();
        int rate = (int)std::floor(clock.elapsed / INCOME_STEP_SECONDS) + 1;
        for (int p = 0; p < PLAYER_COUNT; p++)
          eco.players[p].income_rate = rate;

        clock.income_timer += dt;
        while (clock.income_timer >= 1.0) {
          clock.income_timer -= 1.0;
          for (int p = 0; p < PLAYER_COUNT; p++)
            eco.players[p].photons += eco.players[p].income_rate;
        }
      });
}

// ═════════════════════════════════════════════════════════════
// UNITS: command queue mover
// ═════════════════════════════════════════════════════════════

enum StepResult : uint8_t { STEP_MOVING = 0, STEP_ARRIVED, STEP_BLOCKED };

// One straight-line step toward (tx, ty). Blocked steps leave the
// unit where it is. Every successful step feeds promotion credit,
// weighted by how many move orders are still queued.
static StepResult step_toward(Position &pos, Veterancy &vet,
                              const CommandQueue &queue, float tx, float ty,
                              float speed, float dt, const MatchConfig &cfg,
                              const Obstacles &obstacles) {
  float dx = tx - pos.x;
  float dy = ty - pos.y;
  float dist = std::sqrt(dx * dx + dy * dy);
  if (dist < ARRIVAL_EPSILON)
    return STEP_ARRIVED;

  float step = speed * dt;
  if (step > dist)
    step = dist; // Don't overshoot

  float nx = pos.x + (dx / dist) * step;
  float ny = pos.y + (dy / dist) * step;
  if (obstacle_collides(obstacles, nx, ny, UNIT_RADIUS))
    return STEP_BLOCKED;

  pos.x = nx;
  pos.y = ny;

  float weight = 1.0f + cfg.queue_bonus_per_node * (float)queue.move_count();
  vet.distance_credit += step * weight;
  vet.distance_traveled += step;
  while (vet.distance_credit >= cfg.promotion_threshold) {
    vet.distance_credit -= cfg.promotion_threshold;
    vet.damage_multiplier *= cfg.promotion_multiplier;
  }

  return (dist - step) < ARRIVAL_EPSILON ? STEP_ARRIVED : STEP_MOVING;
}

void register_unit_systems(flecs::world &ecs) {
  const MatchPhases &phases = ecs.get<MatchPhases>();

  ecs.system<Position, CommandQueue, Veterancy, AbilityState,
             const AbilityEffects, const UnitKind>("CommandMover")
      .kind(phases.units)
      .each([](flecs::entity e, Position &pos, CommandQueue &queue,
               Veterancy &vet, AbilityState &ability,
               const AbilityEffects &fx, const UnitKind &kind) {
        flecs::world w = e.world();
        float dt = w.delta_time();
        if (dt <= 0.0f)
          return;

        if (ability.cooldown > 0.0f) {
          ability.cooldown -= dt;
          if (ability.cooldown < 0.0f)
            ability.cooldown = 0.0f;
        }

        if (queue.empty())
          return;
        // Telegraphed jump: hold position until it resolves
        if (fx.line_jump.active)
          return;

        const MatchConfig &cfg = w.get<MatchConfig>();
        const Obstacles &obstacles = w.get<Obstacles>();
        float speed = w.get<DefinitionTable>().unit(kind.type).move_speed;

        CommandNode &node = queue.front();
        switch (node.type) {
        case CMD_MOVE:
        case CMD_ATTACK_MOVE:
        case CMD_PATROL: {
          StepResult r = step_toward(pos, vet, queue, node.x, node.y, speed,
                                     dt, cfg, obstacles);
          if (r != STEP_MOVING)
            queue.pop();
          break;
        }
        case CMD_ABILITY: {
          float dx = node.x - pos.x;
          float dy = node.y - pos.y;
          if (dx * dx + dy * dy > ARRIVAL_EPSILON * ARRIVAL_EPSILON) {
            StepResult r = step_toward(pos, vet, queue, node.x, node.y, speed,
                                       dt, cfg, obstacles);
            if (r == STEP_BLOCKED) {
              queue.pop();
              break;
            }
            if (r == STEP_MOVING)
              break;
          }
          // At the anchor: fire (or fizzle on cooldown) and retire
          CommandNode cast = node;
          queue.pop();
          execute_ability(e, cast.x, cast.y, cast.dir_x, cast.dir_y);
          break;
        }
        }
      });
}

// ═════════════════════════════════════════════════════════════
// BASES: movement, cooldowns, support regen, assault shield
// ═════════════════════════════════════════════════════════════

void register_base_systems(flecs::world &ecs) {
  const MatchPhases &phases = ecs.get<MatchPhases>();

  ecs.system<Position, BaseState, Health, const Owner>("BaseUpdate")
      .kind(phases.bases)
      .each([](flecs::entity e, Position &pos, BaseState &state, Health &h,
               const Owner &owner) {
        flecs::world w = e.world();
        float dt = w.delta_time();
        if (dt <= 0.0f)
          return;

        constexpr float BASE_ACCELERATION = 15.0f; // m/s^2
        constexpr float PULSE_DISPLAY = 0.5f;       // seconds

        if (state.laser_cooldown > 0.0f)
          state.laser_cooldown = std::max(0.0f, state.laser_cooldown - dt);
        if (state.attack_cooldown > 0.0f)
          state.attack_cooldown = std::max(0.0f, state.attack_cooldown - dt);

        const BaseDefinition &def = w.get<DefinitionTable>().base(state.type);

        // ── Movement ──
        bool moving = false;
        if (state.has_target && !def.can_move) {
          state.has_target = false;
        } else if (state.has_target) {
          float dx = state.target_x - pos.x;
          float dy = state.target_y - pos.y;
          float dist = std::sqrt(dx * dx + dy * dy);
          if (dist < ARRIVAL_EPSILON) {
            state.has_target = false;
          } else {
            state.current_speed = std::min(
                def.move_speed, state.current_speed + BASE_ACCELERATION * dt);
            float step = std::min(state.current_speed * dt, dist);
            pos.x += (dx / dist) * step;
            pos.y += (dy / dist) * step;
            moving = step > 0.0f;
            if (dist - step < ARRIVAL_EPSILON)
              state.has_target = false;
          }
        }
        if (!state.has_target)
          state.current_speed = 0.0f;

        if (def.shield_while_moving)
          state.shield_active = moving;

        // ── Support: regeneration field ──
        if (def.regen_rate > 0.0f && h.hp > 0.0f) {
          float heal = def.regen_rate * dt;
          float r2 = def.regen_radius * def.regen_radius;
          uint8_t team = owner.player;
          Position center = pos;
          w.each([&](flecs::entity, const Position &up, const Owner &uo,
                     Health &uh, const UnitId &) {
            if (uo.player != team || uh.hp <= 0.0f)
              return;
            float dx = up.x - center.x;
            float dy = up.y - center.y;
            if (dx * dx + dy * dy > r2)
              return;
            uh.hp = std::min(uh.max_hp, uh.hp + heal);
          });
          h.hp = std::min(h.max_hp, h.hp + heal * 0.5f);

          if (def.regen_interval > 0.0f) {
            state.regen_timer += dt;
            if (state.regen_timer >= def.regen_interval) {
              state.regen_timer -= def.regen_interval;
              state.pulse_end_time =
                  (float)w.get<MatchClock>().elapsed + PULSE_DISPLAY;
            }
          }
        }
      });
}

// ═════════════════════════════════════════════════════════════
// VICTORY: time limit tie-break, then base destruction
// ═════════════════════════════════════════════════════════════

static void decide(flecs::world &w, MatchOutcome &outcome, int winner) {
  outcome.decided = true;
  outcome.winner = winner;
  emit_event(w, EVENT_VICTORY, winner, 0, 0.0f, 0.0f, 0.0f);
}

void register_victory_systems(flecs::world &ecs) {
  const MatchPhases &phases = ecs.get<MatchPhases>();

  // Less damage taken wins; equal → more damage dealt; equal → draw.
  // A destroyed base is left to VictoryCheck so it always takes precedence.
  ecs.system<MatchOutcome>("TimeLimitCheck")
      .kind(phases.time_limit)
      .each([](flecs::entity e, MatchOutcome &outcome) {
        if (outcome.decided)
          return;
        flecs::world w = e.world();
        const MatchConfig &cfg = w.get<MatchConfig>();
        if (cfg.match_time_limit <= 0.0f)
          return;
        if (w.get<MatchClock>().elapsed < (double)cfg.match_time_limit)
          return;

        float taken[PLAYER_COUNT] = {0.0f, 0.0f};
        bool present[PLAYER_COUNT] = {false, false};
        bool destroyed = false;
        w.each([&](flecs::entity, const BaseId &, const Owner &o,
                   const Health &h) {
          int p = o.player % PLAYER_COUNT;
          present[p] = true;
          taken[p] += h.max_hp - h.hp;
          if (h.hp <= 0.0f)
            destroyed = true;
        });
        if (destroyed || !present[0] || !present[1])
          return;

        if (taken[0] < taken[1]) {
          decide(w, outcome, 0);
        } else if (taken[1] < taken[0]) {
          decide(w, outcome, 1);
        } else if (w.has<MatchStats>()) {
          const MatchStats &stats = w.get<MatchStats>();
          if (stats.damage_dealt[0] > stats.damage_dealt[1])
            decide(w, outcome, 0);
          else if (stats.damage_dealt[1] > stats.damage_dealt[0])
            decide(w, outcome, 1);
          else
            decide(w, outcome, DRAW);
        } else {
          decide(w, outcome, DRAW);
        }
      });

  // First destroyed base (lowest BaseId) hands the match to the other side.
  ecs.system<MatchOutcome>("VictoryCheck")
      .kind(phases.victory)
      .each([](flecs::entity e, MatchOutcome &outcome) {
        if (outcome.decided)
          return;
        flecs::world w = e.world();

        bool found = false;
        uint32_t lowest_id = 0;
        int loser = 0;
        w.each([&](flecs::entity, const BaseId &id, const Owner &o,
                   const Health &h) {
          if (h.hp > 0.0f)
            return;
          if (!found || id.id < lowest_id) {
            found = true;
            lowest_id = id.id;
            loser = o.player;
          }
        });
        if (found)
          decide(w, outcome, loser == 0 ? 1 : 0);
      });
}

} // namespace photon
