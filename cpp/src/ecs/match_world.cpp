#include "match_world.h"
#include "obstacle_query.h"
#include "photon_components.h"
#include "photon_systems.h"

namespace photon {

constexpr uint32_t PLAYER_COLORS[PLAYER_COUNT] = {0x3B82F6FFu, 0xEF4444FFu};

void init_match(flecs::world &ecs, const MatchConfig &config,
                const DefinitionTable &definitions, bool track_stats) {
  // Register core components
  ecs.component<Position>("Position");
  ecs.component<UnitId>("UnitId");
  ecs.component<BaseId>("BaseId");
  ecs.component<Owner>("Owner");
  ecs.component<UnitKind>("UnitKind");
  ecs.component<Health>("Health");
  ecs.component<Armor>("Armor");
  ecs.component<Veterancy>("Veterancy");
  ecs.component<AbilityState>("AbilityState");
  ecs.component<CommandQueue>("CommandQueue");
  ecs.component<AbilityEffects>("AbilityEffects");
  ecs.component<BaseState>("BaseState");

  // Singletons (must exist before any system is registered)
  // Out-of-range values are clamped: a zero cap would drop the rally move
  // and a non-positive threshold would never stop promoting.
  MatchConfig cfg = config;
  if (cfg.queue_max_length > MAX_QUEUE_NODES)
    cfg.queue_max_length = MAX_QUEUE_NODES;
  if (cfg.queue_max_length < 1)
    cfg.queue_max_length = 1;
  if (!(cfg.promotion_threshold > 0.0f))
    cfg.promotion_threshold = MatchConfig{}.promotion_threshold;
  if (!(cfg.promotion_multiplier >= 1.0f))
    cfg.promotion_multiplier = 1.0f;
  ecs.set<MatchConfig>(cfg);
  ecs.set<DefinitionTable>(definitions);
  ecs.set<MatchClock>({0.0, 0.0});
  ecs.set<MatchOutcome>({false, NO_WINNER});
  ecs.set<IdCounters>({1, 1});
  ecs.set<Obstacles>({});

  Economy eco = {};
  for (int p = 0; p < PLAYER_COUNT; p++)
    eco.players[p] = {cfg.starting_photons, 1, PLAYER_COLORS[p]};
  ecs.set<Economy>(eco);

  if (track_stats)
    ecs.set<MatchStats>({});

  // Phases first, then systems in tick order
  register_match_phases(ecs);
  register_economy_systems(ecs);
  register_unit_systems(ecs);
  register_ability_systems(ecs);
  register_base_systems(ecs);
  register_combat_systems(ecs);
  register_victory_systems(ecs);
}

bool advance(flecs::world &ecs, float dt) {
  // flecs reads dt == 0 as "measure the frame time": never pass it on
  if (dt <= 0.0f)
    return false;
  if (ecs.get<MatchOutcome>().decided)
    return false;
  ecs.progress(dt);
  return true;
}

void set_obstacles(flecs::world &ecs, const std::vector<ObstacleRect> &rects) {
  ecs.get_mut<Obstacles>().rects = rects;
}

void set_event_hook(flecs::world &ecs,
                    std::function<void(const MatchEvent &)> hook) {
  EventHooks hooks;
  hooks.on_event = std::move(hook);
  ecs.set<EventHooks>(hooks);
}

// ═════════════════════════════════════════════════════════════
// SETUP
// ═════════════════════════════════════════════════════════════

uint32_t create_base(flecs::world &ecs, uint8_t owner, BaseType type,
                     Position position) {
  const BaseDefinition &def = ecs.get<DefinitionTable>().base(type);
  IdCounters &ids = ecs.get_mut<IdCounters>();
  uint32_t id = ids.next_base_id++;

  BaseState state = {};
  state.type = type;

  ecs.entity()
      .set<Position>(position)
      .set<BaseId>({id})
      .set<Owner>({(uint8_t)(owner % PLAYER_COUNT)})
      .set<Health>({def.hp, def.hp})
      .set<Armor>({def.armor})
      .set<BaseState>(state);
  return id;
}

bool spawn_unit(flecs::world &ecs, uint8_t owner, UnitType type,
                Position spawn, Position rally, uint32_t *out_id) {
  if (owner >= PLAYER_COUNT || type >= UNIT_TYPE_COUNT)
    return false;
  if (ecs.get<MatchOutcome>().decided)
    return false;

  const MatchConfig &cfg = ecs.get<MatchConfig>();
  if (!cfg.unit_enabled(type))
    return false;

  const UnitDefinition &def = ecs.get<DefinitionTable>().unit(type);
  Economy &eco = ecs.get_mut<Economy>();
  if (eco.players[owner].photons < def.cost)
    return false;

  eco.players[owner].photons -= def.cost;
  if (ecs.has<MatchStats>()) {
    MatchStats &stats = ecs.get_mut<MatchStats>();
    stats.units_trained[owner]++;
    stats.photons_spent[owner] += def.cost;
  }

  IdCounters &ids = ecs.get_mut<IdCounters>();
  uint32_t id = ids.next_unit_id++;

  Position rally_point = safe_rally_point(ecs.get<Obstacles>(), spawn, rally);
  CommandQueue queue = {};
  queue.push(move_command(rally_point.x, rally_point.y), cfg.queue_max_length);

  ecs.entity()
      .set<Position>(spawn)
      .set<UnitId>({id})
      .set<Owner>({owner})
      .set<UnitKind>({type})
      .set<Health>({def.hp, def.hp})
      .set<Armor>({def.armor})
      .set<Veterancy>({1.0f, 0.0f, 0.0f})
      .set<AbilityState>({0.0f})
      .set<CommandQueue>(queue)
      .set<AbilityEffects>({});

  emit_event(ecs, EVENT_SPAWN, owner, id, spawn.x, spawn.y, (float)def.cost);
  if (out_id)
    *out_id = id;
  return true;
}

// ═════════════════════════════════════════════════════════════
// ORDERS
// ═════════════════════════════════════════════════════════════

bool queue_command(flecs::world &ecs, uint32_t unit_id,
                   const CommandNode &node) {
  flecs::entity e = find_unit(ecs, unit_id);
  if (!e.is_valid())
    return false;
  int cap = ecs.get<MatchConfig>().queue_max_length;
  return e.get_mut<CommandQueue>().push(node, cap);
}

bool clear_commands(flecs::world &ecs, uint32_t unit_id) {
  flecs::entity e = find_unit(ecs, unit_id);
  if (!e.is_valid())
    return false;
  e.get_mut<CommandQueue>().clear();
  return true;
}

bool queue_patrol_return(flecs::world &ecs, uint32_t unit_id,
                         const CommandNode &node) {
  if (node.type != CMD_PATROL)
    return false;
  return queue_command(
      ecs, unit_id, patrol_command(node.return_x, node.return_y, node.x, node.y));
}

bool set_base_target(flecs::world &ecs, uint32_t base_id, Position target) {
  flecs::entity e = find_base(ecs, base_id);
  if (!e.is_valid())
    return false;
  BaseState &state = e.get_mut<BaseState>();
  if (!ecs.get<DefinitionTable>().base(state.type).can_move)
    return false;
  state.has_target = true;
  state.target_x = target.x;
  state.target_y = target.y;
  return true;
}

bool clear_base_target(flecs::world &ecs, uint32_t base_id) {
  flecs::entity e = find_base(ecs, base_id);
  if (!e.is_valid())
    return false;
  BaseState &state = e.get_mut<BaseState>();
  state.has_target = false;
  state.current_speed = 0.0f;
  return true;
}

bool select_base(flecs::world &ecs, uint32_t base_id, bool selected) {
  flecs::entity e = find_base(ecs, base_id);
  if (!e.is_valid())
    return false;
  e.get_mut<BaseState>().selected = selected;
  return true;
}

bool fire_laser(flecs::world &ecs, uint32_t base_id, float dir_x,
                float dir_y) {
  if (ecs.get<MatchOutcome>().decided)
    return false;
  flecs::entity e = find_base(ecs, base_id);
  if (!e.is_valid() || e.get<Health>().hp <= 0.0f)
    return false;
  return fire_base_laser(e, dir_x, dir_y);
}

// ═════════════════════════════════════════════════════════════
// LOOKUPS
// ═════════════════════════════════════════════════════════════

flecs::entity find_unit(flecs::world &ecs, uint32_t unit_id) {
  flecs::entity found = flecs::entity::null();
  ecs.each([&](flecs::entity e, const UnitId &id) {
    if (id.id == unit_id)
      found = e;
  });
  return found;
}

flecs::entity find_base(flecs::world &ecs, uint32_t base_id) {
  flecs::entity found = flecs::entity::null();
  ecs.each([&](flecs::entity e, const BaseId &id) {
    if (id.id == base_id)
      found = e;
  });
  return found;
}

int unit_count(flecs::world &ecs, uint8_t owner) {
  int count = 0;
  ecs.each([&](flecs::entity, const UnitId &, const Owner &o) {
    if (o.player == owner)
      count++;
  });
  return count;
}

int photons(flecs::world &ecs, uint8_t owner) {
  if (owner >= PLAYER_COUNT)
    return 0;
  return ecs.get<Economy>().players[owner].photons;
}

int winner(flecs::world &ecs) {
  const MatchOutcome &outcome = ecs.get<MatchOutcome>();
  return outcome.decided ? outcome.winner : NO_WINNER;
}

} // namespace photon
