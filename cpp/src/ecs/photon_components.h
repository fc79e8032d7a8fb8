#ifndef PHOTON_COMPONENTS_H
#define PHOTON_COMPONENTS_H

#include <cstdint>
#include <functional>
#include <vector>

/**
 * Photon Clash: ECS Component Definitions
 *
 * POD structs for every unit, base and match singleton. No pointers and no
 * virtual functions on per-entity data. Singletons (Economy, MatchClock,
 * DefinitionTable, Obstacles, EventHooks) may hold containers since there
 * is exactly one of each per world.
 */

// ─── Match Constants ──────────────────────────────────────
constexpr int PLAYER_COUNT = 2;
constexpr float ARRIVAL_EPSILON = 0.1f;  // meters
constexpr float UNIT_RADIUS = 0.5f;      // 1m unit footprint
constexpr float BASE_RADIUS = 1.5f;      // 3m base footprint
constexpr int MAX_QUEUE_NODES = 32;      // hard storage cap, config cap <= this
constexpr float ABILITY_MAX_RANGE = 10.0f;
constexpr float SHIELD_DAMAGE_FACTOR = 0.5f; // shields reduce, never block

constexpr float LASER_RANGE = 20.0f;
constexpr float LASER_WIDTH = 0.5f;
constexpr float LASER_DAMAGE_UNIT = 200.0f;
constexpr float LASER_DAMAGE_BASE = 300.0f;
constexpr float LASER_COOLDOWN = 10.0f;

constexpr float INCOME_STEP_SECONDS = 10.0f;
constexpr int NO_WINNER = -2; // decided == false
constexpr int DRAW = -1;

// ─── Static Definitions ───────────────────────────────────
enum UnitType : uint8_t {
  UNIT_MARINE = 0,
  UNIT_WARRIOR,
  UNIT_SNAKER,
  UNIT_TANK,
  UNIT_SCOUT,
  UNIT_ARTILLERY,
  UNIT_MEDIC,
  UNIT_INTERCEPTOR,
  UNIT_TYPE_COUNT
};

enum AttackType : uint8_t { ATTACK_NONE = 0, ATTACK_RANGED, ATTACK_MELEE };

enum AbilityKind : uint8_t {
  ABILITY_NONE = 0,
  ABILITY_BURST_FIRE,
  ABILITY_DASH_STRIKE,
  ABILITY_LINE_JUMP,
  ABILITY_SHIELD,
  ABILITY_CLOAK,
  ABILITY_BOMBARDMENT,
  ABILITY_HEAL_PULSE,
  ABILITY_MISSILE_BARRAGE
};

enum BaseType : uint8_t {
  BASE_STANDARD = 0,
  BASE_DEFENSE,
  BASE_SUPPORT,
  BASE_ASSAULT,
  BASE_TYPE_COUNT
};

struct UnitDefinition {
  float hp;
  float armor;
  float move_speed;
  AttackType attack_type;
  float attack_range;
  float attack_damage;
  float attack_rate; // attacks per second
  int cost;
  AbilityKind ability;
  float ability_cooldown;
  bool can_damage_structures;
}; // 40 bytes

struct BaseDefinition {
  float hp;
  float armor;
  bool can_move;
  float move_speed;

  // Auto-attack (defense). attack_rate == 0 disables it.
  float attack_range;
  float attack_damage;
  float attack_rate;

  // Regeneration (support). regen_rate == 0 disables it.
  float regen_radius;
  float regen_rate;     // hp per second to allied units
  float regen_interval; // seconds between display pulses

  bool shield_while_moving; // assault
}; // 44 bytes

struct DefinitionTable {
  UnitDefinition units[UNIT_TYPE_COUNT];
  BaseDefinition bases[BASE_TYPE_COUNT];

  const UnitDefinition &unit(UnitType t) const { return units[t]; }
  const BaseDefinition &base(BaseType t) const { return bases[t]; }
};

// ─── Configuration (Singleton) ────────────────────────────
struct MatchConfig {
  int queue_max_length = 20;
  float match_time_limit = 0.0f; // seconds, 0 = no limit
  float promotion_threshold = 10.0f;
  float promotion_multiplier = 1.1f;
  float queue_bonus_per_node = 0.1f;
  uint32_t enabled_units = 0xFFu; // bit per UnitType
  int starting_photons = 0;

  bool unit_enabled(UnitType t) const {
    return t < UNIT_TYPE_COUNT && (enabled_units & (1u << t)) != 0;
  }
};

// ─── Spatial ──────────────────────────────────────────────
struct Position {
  float x, y;
}; // 8 bytes

// ─── Identity ─────────────────────────────────────────────
struct UnitId {
  uint32_t id;
}; // 4 bytes
struct BaseId {
  uint32_t id;
}; // 4 bytes
struct Owner {
  uint8_t player;
}; // 1 byte, 0 or 1
struct UnitKind {
  UnitType type;
}; // 1 byte

// ─── Unit State ───────────────────────────────────────────
struct Health {
  float hp;     // may dip below 0 until the death sweep
  float max_hp;
}; // 8 bytes
struct Armor {
  float value;
}; // 4 bytes
struct Veterancy {
  float damage_multiplier; // starts at 1.0, never decreases
  float distance_traveled;
  float distance_credit; // toward the next promotion
}; // 12 bytes
struct AbilityState {
  float cooldown; // seconds, floored at 0
}; // 4 bytes

// ─── Orders: Command Queue ────────────────────────────────
enum CommandType : uint8_t {
  CMD_MOVE = 0,
  CMD_ABILITY,
  CMD_ATTACK_MOVE,
  CMD_PATROL
};

struct CommandNode {
  CommandType type;
  float x, y;               // target / ability anchor
  float dir_x, dir_y;       // CMD_ABILITY only
  float return_x, return_y; // CMD_PATROL only
}; // 28 bytes

inline CommandNode move_command(float x, float y) {
  return {CMD_MOVE, x, y, 0.0f, 0.0f, 0.0f, 0.0f};
}
inline CommandNode ability_command(float x, float y, float dir_x,
                                   float dir_y) {
  return {CMD_ABILITY, x, y, dir_x, dir_y, 0.0f, 0.0f};
}
inline CommandNode attack_move_command(float x, float y) {
  return {CMD_ATTACK_MOVE, x, y, 0.0f, 0.0f, 0.0f, 0.0f};
}
inline CommandNode patrol_command(float x, float y, float return_x,
                                  float return_y) {
  return {CMD_PATROL, x, y, 0.0f, 0.0f, return_x, return_y};
}

// Fixed ring buffer. Only the head node is ever processed.
struct CommandQueue {
  CommandNode nodes[MAX_QUEUE_NODES];
  uint8_t head;
  uint8_t count;

  bool empty() const { return count == 0; }
  int size() const { return count; }

  CommandNode &front() { return nodes[head]; }
  const CommandNode &at(int i) const {
    return nodes[(head + i) % MAX_QUEUE_NODES];
  }

  bool push(const CommandNode &node, int cap) {
    if (cap > MAX_QUEUE_NODES)
      cap = MAX_QUEUE_NODES;
    if (count >= cap)
      return false;
    nodes[(head + count) % MAX_QUEUE_NODES] = node;
    count++;
    return true;
  }

  void pop() {
    if (count == 0)
      return;
    head = (uint8_t)((head + 1) % MAX_QUEUE_NODES);
    count--;
  }

  void clear() {
    head = 0;
    count = 0;
  }

  int move_count() const {
    int n = 0;
    for (int i = 0; i < count; i++) {
      if (at(i).type == CMD_MOVE)
        n++;
    }
    return n;
  }
};

// ─── Abilities: Deferred Effect Slots ─────────────────────
// Each slot is one optional instance. Arming overwrites, never stacks.
// Times are MatchClock::elapsed (simulation time), never wall clock.
struct ShieldSlot {
  bool active;
  float end_time;
  float radius;
  float ranged_factor; // applied to ranged damage on covered allies
  float melee_factor;
};
struct CloakSlot {
  bool active;
  float end_time;
};
struct BombardmentSlot {
  bool active;
  float impact_time;
  float end_time;
  float x, y;
  float radius;
  float unit_dps;
  float base_dps;
};
struct HealPulseSlot {
  bool active;
  float end_time; // display only
  float radius;
};

constexpr int MAX_MISSILES = 6;
struct Missile {
  float target_x, target_y; // locked at cast time
  float damage;
};
struct MissileBarrageSlot {
  bool active;
  bool resolved;
  uint8_t count;
  float resolve_time;
  Missile missiles[MAX_MISSILES];
};

struct LineJumpSlot {
  bool active;
  bool resolved;
  float start_time;
  float resolve_time;
  float start_x, start_y; // unit holds position while telegraphed
  float end_x, end_y;
  float dir_x, dir_y;
  float damage;
};

struct DashSlot {
  bool active;
  float end_time; // cosmetic
};

struct AbilityEffects {
  ShieldSlot shield;
  CloakSlot cloak;
  BombardmentSlot bombardment;
  HealPulseSlot heal_pulse;
  MissileBarrageSlot missiles;
  LineJumpSlot line_jump;
  DashSlot dash;
};

// ─── Bases ────────────────────────────────────────────────
struct BaseState {
  BaseType type;
  bool selected;
  bool has_target;
  float target_x, target_y;
  float current_speed;
  float laser_cooldown;
  float attack_cooldown; // defense auto-attack
  float regen_timer;     // support pulse cadence
  float pulse_end_time;  // support pulse display slot
  bool shield_active;    // assault, while moving
}; // 36 bytes

// ─── Match Singletons ─────────────────────────────────────
struct MatchClock {
  double elapsed;     // accumulated simulation seconds
  double income_timer; // sub-second accumulator
};

struct PlayerEconomy {
  int photons;
  int income_rate; // cached, derived from elapsed time
  uint32_t color;  // RGBA for the renderer
};

struct Economy {
  PlayerEconomy players[PLAYER_COUNT];
};

// Optional. Presence enables aggregation.
struct MatchStats {
  int units_trained[PLAYER_COUNT];
  int units_killed[PLAYER_COUNT];
  float damage_dealt[PLAYER_COUNT];
  int photons_spent[PLAYER_COUNT];
  float base_damage_taken[PLAYER_COUNT]; // indexed by the base's owner
};

struct MatchOutcome {
  bool decided;
  int winner; // 0, 1, DRAW; NO_WINNER while undecided
};

struct IdCounters {
  uint32_t next_unit_id;
  uint32_t next_base_id;
};

// ─── Collaborators ────────────────────────────────────────
// Axis-aligned rectangle, centered.
struct ObstacleRect {
  float x, y;
  float width, height;
};

struct Obstacles {
  std::vector<ObstacleRect> rects;
};

enum MatchEventKind : uint8_t {
  EVENT_SPAWN = 0,
  EVENT_DEATH,
  EVENT_BASE_DAMAGE,
  EVENT_ABILITY_CAST,
  EVENT_LASER_FIRE,
  EVENT_VICTORY
};

struct MatchEvent {
  MatchEventKind kind;
  int owner;     // acting owner (winner for EVENT_VICTORY)
  uint32_t id;   // UnitId / BaseId, 0 if none
  float x, y;
  float amount;  // damage, cost, ...
};

// Fire-and-forget. An empty callback is a no-op.
struct EventHooks {
  std::function<void(const MatchEvent &)> on_event;
};

#endif // PHOTON_COMPONENTS_H
