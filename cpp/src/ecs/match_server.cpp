#include "match_server.h"
#include "match_snapshot.h"
#include "match_world.h"
#include "photon_components.h"
#include "photon_definitions.h"
#include <godot_cpp/classes/engine.hpp>
#include <godot_cpp/classes/file_access.hpp>
#include <godot_cpp/variant/utility_functions.hpp>
#include <string>

// ═══════════════════════════════════════════════════════════════
// BUFFER FORMAT CONTRACT
//
// Units, 8 floats each:
//   [0] unit_id  [1] owner  [2] type  [3] x
//   [4] y        [5] hp     [6] max_hp [7] flags
// Bases, 8 floats each:
//   [0] base_id  [1] owner  [2] type  [3] x
//   [4] y        [5] hp     [6] max_hp [7] flags
//
// Unit flags: 1 shielded, 2 cloaked, 4 telegraphing, 8 dashing
// Base flags: 1 selected, 2 shield, 4 regen pulse, 8 laser ready
// ═══════════════════════════════════════════════════════════════
constexpr int UNIT_STRIDE = 8;
constexpr int BASE_STRIDE = 8;

static void log_match_event(const MatchEvent &ev) {
  using godot::UtilityFunctions;
  switch (ev.kind) {
  case EVENT_SPAWN:
    UtilityFunctions::print("[PhotonClash] Player ", ev.owner, " trained unit #",
                            (int64_t)ev.id, " (", (int)ev.amount,
                            " photons)");
    break;
  case EVENT_DEATH:
    UtilityFunctions::print("[PhotonClash] Unit #", (int64_t)ev.id,
                            " of player ", ev.owner, " destroyed at (", ev.x,
                            ", ", ev.y, ")");
    break;
  case EVENT_BASE_DAMAGE:
    // Continuous fire would flood the console; only report real hits
    if (ev.amount >= 10.0f)
      UtilityFunctions::print("[PhotonClash] Base #", (int64_t)ev.id,
                              " took ", ev.amount, " damage");
    break;
  case EVENT_ABILITY_CAST:
    UtilityFunctions::print("[PhotonClash] Unit #", (int64_t)ev.id,
                            " cast ability ", (int)ev.amount);
    break;
  case EVENT_LASER_FIRE:
    UtilityFunctions::print("[PhotonClash] Base #", (int64_t)ev.id,
                            " fired its laser");
    break;
  case EVENT_VICTORY:
    if (ev.owner == DRAW)
      UtilityFunctions::print("[PhotonClash] Match over: draw.");
    else
      UtilityFunctions::print("[PhotonClash] Match over: player ", ev.owner,
                              " wins.");
    break;
  }
}

// Reads one definitions file into `table`. Missing files are not an
// error, the built-in tables stay in place.
static void load_definition_file(const char *path, DefinitionTable &table,
                                 MatchConfig &config) {
  godot::String file_path = path;
  if (!godot::FileAccess::file_exists(file_path)) {
    godot::UtilityFunctions::print("[PhotonClash] ", file_path,
                                   " not found, using built-in stats.");
    return;
  }

  godot::String content = godot::FileAccess::get_file_as_string(file_path);
  std::string error;
  if (!photon::load_definitions(content.utf8().get_data(), table, &config,
                                error)) {
    godot::UtilityFunctions::printerr("[PhotonClash] Failed to load ",
                                      file_path, ": ", error.c_str());
    return;
  }
  godot::UtilityFunctions::print("[PhotonClash] Loaded ", file_path);
}

namespace godot {

PhotonServer::PhotonServer() {}

PhotonServer::~PhotonServer() {}

void PhotonServer::_bind_methods() {
  // Setup
  ClassDB::bind_method(D_METHOD("create_base", "owner", "base_type", "x", "y"),
                       &PhotonServer::create_base);
  ClassDB::bind_method(
      D_METHOD("add_obstacle", "x", "y", "width", "height"),
      &PhotonServer::add_obstacle);

  // Units
  ClassDB::bind_method(D_METHOD("spawn_unit", "owner", "unit_type", "spawn_x",
                                "spawn_y", "rally_x", "rally_y"),
                       &PhotonServer::spawn_unit);
  ClassDB::bind_method(D_METHOD("order_move", "unit_id", "x", "y"),
                       &PhotonServer::order_move);
  ClassDB::bind_method(D_METHOD("order_attack_move", "unit_id", "x", "y"),
                       &PhotonServer::order_attack_move);
  ClassDB::bind_method(
      D_METHOD("order_patrol", "unit_id", "x", "y", "return_x", "return_y"),
      &PhotonServer::order_patrol);
  ClassDB::bind_method(
      D_METHOD("order_ability", "unit_id", "x", "y", "dir_x", "dir_y"),
      &PhotonServer::order_ability);
  ClassDB::bind_method(D_METHOD("clear_orders", "unit_id"),
                       &PhotonServer::clear_orders);

  // Bases
  ClassDB::bind_method(D_METHOD("move_base", "base_id", "x", "y"),
                       &PhotonServer::move_base);
  ClassDB::bind_method(D_METHOD("stop_base", "base_id"),
                       &PhotonServer::stop_base);
  ClassDB::bind_method(D_METHOD("set_base_selected", "base_id", "selected"),
                       &PhotonServer::set_base_selected);
  ClassDB::bind_method(D_METHOD("fire_laser", "base_id", "dir_x", "dir_y"),
                       &PhotonServer::fire_laser);

  // Queries
  ClassDB::bind_method(D_METHOD("get_photons", "owner"),
                       &PhotonServer::get_photons);
  ClassDB::bind_method(D_METHOD("get_unit_count", "owner"),
                       &PhotonServer::get_unit_count);
  ClassDB::bind_method(D_METHOD("get_winner"), &PhotonServer::get_winner);
  ClassDB::bind_method(D_METHOD("get_unit_buffer"),
                       &PhotonServer::get_unit_buffer);
  ClassDB::bind_method(D_METHOD("get_unit_buffer_count"),
                       &PhotonServer::get_unit_buffer_count);
  ClassDB::bind_method(D_METHOD("get_base_buffer"),
                       &PhotonServer::get_base_buffer);
  ClassDB::bind_method(D_METHOD("get_base_buffer_count"),
                       &PhotonServer::get_base_buffer_count);

  // Snapshot
  ClassDB::bind_method(D_METHOD("save_match"), &PhotonServer::save_match);
  ClassDB::bind_method(D_METHOD("load_match", "snapshot"),
                       &PhotonServer::load_match);
}

void PhotonServer::_ready() {
  if (Engine::get_singleton()->is_editor_hint()) {
    return;
  }
  init_match_world();
}

void PhotonServer::init_match_world() {
  UtilityFunctions::print("[PhotonClash] Initializing match world...");

  DefinitionTable definitions = photon::default_definitions();
  MatchConfig config;
  load_definition_file("res://res/data/units.json", definitions, config);
  load_definition_file("res://res/data/bases.json", definitions, config);

  photon::init_match(ecs, config, definitions);
  photon::set_event_hook(ecs, log_match_event);
  match_ready = true;

  UtilityFunctions::print("[PhotonClash] Match ready, queue cap ",
                          config.queue_max_length, ", time limit ",
                          config.match_time_limit, "s.");
}

void PhotonServer::_process(double delta) {
  if (Engine::get_singleton()->is_editor_hint() || !match_ready) {
    return;
  }

  photon::advance(ecs, (float)delta);
  sync_buffers();
}

// ═══════════════════════════════════════════════════════════════
// SETUP
// ═══════════════════════════════════════════════════════════════

int PhotonServer::create_base(int owner, int base_type, float x, float y) {
  if (!match_ready || owner < 0 || owner >= PLAYER_COUNT || base_type < 0 ||
      base_type >= BASE_TYPE_COUNT) {
    UtilityFunctions::printerr("[PhotonClash] create_base rejected (owner ",
                               owner, ", type ", base_type, ")");
    return -1;
  }
  uint32_t id = photon::create_base(ecs, (uint8_t)owner, (BaseType)base_type,
                                    {x, y});
  UtilityFunctions::print("[PhotonClash] Base #", (int64_t)id, " (",
                          photon::base_type_name((BaseType)base_type),
                          ") for player ", owner, " at (", x, ", ", y, ")");
  return (int)id;
}

void PhotonServer::add_obstacle(float x, float y, float width, float height) {
  if (!match_ready)
    return;
  std::vector<ObstacleRect> rects = ecs.get<Obstacles>().rects;
  rects.push_back({x, y, width, height});
  photon::set_obstacles(ecs, rects);
}

// ═══════════════════════════════════════════════════════════════
// UNITS
// ═══════════════════════════════════════════════════════════════

int PhotonServer::spawn_unit(int owner, int unit_type, float spawn_x,
                             float spawn_y, float rally_x, float rally_y) {
  if (!match_ready || owner < 0 || owner >= PLAYER_COUNT || unit_type < 0 ||
      unit_type >= UNIT_TYPE_COUNT)
    return -1;

  uint32_t id = 0;
  if (!photon::spawn_unit(ecs, (uint8_t)owner, (UnitType)unit_type,
                          {spawn_x, spawn_y}, {rally_x, rally_y}, &id))
    return -1;
  return (int)id;
}

bool PhotonServer::order_move(int unit_id, float x, float y) {
  return match_ready &&
         photon::queue_command(ecs, (uint32_t)unit_id, move_command(x, y));
}

bool PhotonServer::order_attack_move(int unit_id, float x, float y) {
  return match_ready && photon::queue_command(ecs, (uint32_t)unit_id,
                                              attack_move_command(x, y));
}

bool PhotonServer::order_patrol(int unit_id, float x, float y, float return_x,
                                float return_y) {
  if (!match_ready)
    return false;
  CommandNode leg = patrol_command(x, y, return_x, return_y);
  if (!photon::queue_command(ecs, (uint32_t)unit_id, leg))
    return false;
  return photon::queue_patrol_return(ecs, (uint32_t)unit_id, leg);
}

bool PhotonServer::order_ability(int unit_id, float x, float y, float dir_x,
                                 float dir_y) {
  return match_ready &&
         photon::queue_command(ecs, (uint32_t)unit_id,
                               ability_command(x, y, dir_x, dir_y));
}

bool PhotonServer::clear_orders(int unit_id) {
  return match_ready && photon::clear_commands(ecs, (uint32_t)unit_id);
}

// ═══════════════════════════════════════════════════════════════
// BASES
// ═══════════════════════════════════════════════════════════════

bool PhotonServer::move_base(int base_id, float x, float y) {
  return match_ready && photon::set_base_target(ecs, (uint32_t)base_id, {x, y});
}

bool PhotonServer::stop_base(int base_id) {
  return match_ready && photon::clear_base_target(ecs, (uint32_t)base_id);
}

bool PhotonServer::set_base_selected(int base_id, bool selected) {
  return match_ready && photon::select_base(ecs, (uint32_t)base_id, selected);
}

bool PhotonServer::fire_laser(int base_id, float dir_x, float dir_y) {
  return match_ready &&
         photon::fire_laser(ecs, (uint32_t)base_id, dir_x, dir_y);
}

// ═══════════════════════════════════════════════════════════════
// QUERIES
// ═══════════════════════════════════════════════════════════════

int PhotonServer::get_photons(int owner) {
  if (!match_ready || owner < 0 || owner >= PLAYER_COUNT)
    return 0;
  return photon::photons(ecs, (uint8_t)owner);
}

int PhotonServer::get_unit_count(int owner) {
  if (!match_ready || owner < 0 || owner >= PLAYER_COUNT)
    return 0;
  return photon::unit_count(ecs, (uint8_t)owner);
}

int PhotonServer::get_winner() {
  return match_ready ? photon::winner(ecs) : NO_WINNER;
}

PackedFloat32Array PhotonServer::get_unit_buffer() const {
  return unit_buffer;
}

int PhotonServer::get_unit_buffer_count() const { return unit_buffer_count; }

PackedFloat32Array PhotonServer::get_base_buffer() const {
  return base_buffer;
}

int PhotonServer::get_base_buffer_count() const { return base_buffer_count; }

// ── Sequential repack of both renderer buffers ─────────────────
void PhotonServer::sync_buffers() {
  auto units = ecs.query_builder<const UnitId, const Owner, const UnitKind,
                                 const Position, const Health,
                                 const AbilityEffects>()
                   .build();

  unit_buffer_count = units.count();
  unit_buffer.resize(unit_buffer_count * UNIT_STRIDE);
  if (unit_buffer_count > 0) {
    float *dest = unit_buffer.ptrw();
    int idx = 0;
    units.each([&](const UnitId &id, const Owner &o, const UnitKind &k,
                   const Position &p, const Health &h,
                   const AbilityEffects &fx) {
      int offset = idx * UNIT_STRIDE;
      int flags = (fx.shield.active ? 1 : 0) | (fx.cloak.active ? 2 : 0) |
                  (fx.line_jump.active ? 4 : 0) | (fx.dash.active ? 8 : 0);
      dest[offset + 0] = (float)id.id;
      dest[offset + 1] = (float)o.player;
      dest[offset + 2] = (float)k.type;
      dest[offset + 3] = p.x;
      dest[offset + 4] = p.y;
      dest[offset + 5] = h.hp;
      dest[offset + 6] = h.max_hp;
      dest[offset + 7] = (float)flags;
      idx++;
    });
  }

  float now = (float)ecs.get<MatchClock>().elapsed;
  auto bases = ecs.query_builder<const BaseId, const Owner, const BaseState,
                                 const Position, const Health>()
                   .build();

  base_buffer_count = bases.count();
  base_buffer.resize(base_buffer_count * BASE_STRIDE);
  if (base_buffer_count > 0) {
    float *dest = base_buffer.ptrw();
    int idx = 0;
    bases.each([&](const BaseId &id, const Owner &o, const BaseState &s,
                   const Position &p, const Health &h) {
      int offset = idx * BASE_STRIDE;
      int flags = (s.selected ? 1 : 0) | (s.shield_active ? 2 : 0) |
                  (s.pulse_end_time > now ? 4 : 0) |
                  (s.laser_cooldown <= 0.0f ? 8 : 0);
      dest[offset + 0] = (float)id.id;
      dest[offset + 1] = (float)o.player;
      dest[offset + 2] = (float)s.type;
      dest[offset + 3] = p.x;
      dest[offset + 4] = p.y;
      dest[offset + 5] = h.hp;
      dest[offset + 6] = h.max_hp;
      dest[offset + 7] = (float)flags;
      idx++;
    });
  }
}

// ═══════════════════════════════════════════════════════════════
// SNAPSHOT
// ═══════════════════════════════════════════════════════════════

String PhotonServer::save_match() {
  if (!match_ready)
    return String();
  std::string text = photon::save_snapshot(ecs).dump();
  return String(text.c_str());
}

bool PhotonServer::load_match(const String &snapshot) {
  if (!match_ready)
    return false;

  std::string error;
  try {
    nlohmann::json j = nlohmann::json::parse(snapshot.utf8().get_data());
    if (!photon::load_snapshot(ecs, j, error)) {
      UtilityFunctions::printerr("[PhotonClash] Snapshot rejected: ",
                                 error.c_str());
      return false;
    }
  } catch (nlohmann::json::parse_error &e) {
    UtilityFunctions::printerr("[PhotonClash] Snapshot parse error: ",
                               e.what());
    return false;
  }

  sync_buffers();
  UtilityFunctions::print("[PhotonClash] Snapshot restored.");
  return true;
}

} // namespace godot
