#include "match_snapshot.h"
#include "photon_components.h"
#include "photon_definitions.h"
#include <algorithm>
#include <vector>

using json = nlohmann::json;

namespace photon {

constexpr int SNAPSHOT_VERSION = 1;

static const char *COMMAND_NAMES[] = {"move", "ability", "attack_move",
                                      "patrol"};

// ═════════════════════════════════════════════════════════════
// SAVE
// ═════════════════════════════════════════════════════════════

static json command_to_json(const CommandNode &n) {
  json j = {{"type", COMMAND_NAMES[n.type]}, {"x", n.x}, {"y", n.y}};
  if (n.type == CMD_ABILITY) {
    j["dir_x"] = n.dir_x;
    j["dir_y"] = n.dir_y;
  } else if (n.type == CMD_PATROL) {
    j["return_x"] = n.return_x;
    j["return_y"] = n.return_y;
  }
  return j;
}

// Only armed slots are written; an absent key is an empty slot.
static json effects_to_json(const AbilityEffects &fx) {
  json j = json::object();
  if (fx.shield.active)
    j["shield"] = {{"end_time", fx.shield.end_time},
                   {"radius", fx.shield.radius},
                   {"ranged_factor", fx.shield.ranged_factor},
                   {"melee_factor", fx.shield.melee_factor}};
  if (fx.cloak.active)
    j["cloak"] = {{"end_time", fx.cloak.end_time}};
  if (fx.bombardment.active)
    j["bombardment"] = {{"impact_time", fx.bombardment.impact_time},
                        {"end_time", fx.bombardment.end_time},
                        {"x", fx.bombardment.x},
                        {"y", fx.bombardment.y},
                        {"radius", fx.bombardment.radius},
                        {"unit_dps", fx.bombardment.unit_dps},
                        {"base_dps", fx.bombardment.base_dps}};
  if (fx.heal_pulse.active)
    j["heal_pulse"] = {{"end_time", fx.heal_pulse.end_time},
                       {"radius", fx.heal_pulse.radius}};
  if (fx.missiles.active) {
    json missiles = json::array();
    for (int i = 0; i < fx.missiles.count; i++) {
      const Missile &m = fx.missiles.missiles[i];
      missiles.push_back(
          {{"x", m.target_x}, {"y", m.target_y}, {"damage", m.damage}});
    }
    j["missiles"] = {{"resolve_time", fx.missiles.resolve_time},
                     {"resolved", fx.missiles.resolved},
                     {"targets", missiles}};
  }
  if (fx.line_jump.active)
    j["line_jump"] = {{"start_time", fx.line_jump.start_time},
                      {"resolve_time", fx.line_jump.resolve_time},
                      {"resolved", fx.line_jump.resolved},
                      {"start_x", fx.line_jump.start_x},
                      {"start_y", fx.line_jump.start_y},
                      {"end_x", fx.line_jump.end_x},
                      {"end_y", fx.line_jump.end_y},
                      {"dir_x", fx.line_jump.dir_x},
                      {"dir_y", fx.line_jump.dir_y},
                      {"damage", fx.line_jump.damage}};
  if (fx.dash.active)
    j["dash"] = {{"end_time", fx.dash.end_time}};
  return j;
}

json save_snapshot(flecs::world &ecs) {
  json j;
  j["version"] = SNAPSHOT_VERSION;

  const MatchClock &clock = ecs.get<MatchClock>();
  j["clock"] = {{"elapsed", clock.elapsed},
                {"income_timer", clock.income_timer}};

  const Economy &eco = ecs.get<Economy>();
  j["economy"] = json::array();
  for (int p = 0; p < PLAYER_COUNT; p++)
    j["economy"].push_back({{"photons", eco.players[p].photons},
                            {"income_rate", eco.players[p].income_rate},
                            {"color", eco.players[p].color}});

  const MatchOutcome &outcome = ecs.get<MatchOutcome>();
  j["outcome"] = {{"decided", outcome.decided}, {"winner", outcome.winner}};

  const IdCounters &ids = ecs.get<IdCounters>();
  j["ids"] = {{"next_unit_id", ids.next_unit_id},
              {"next_base_id", ids.next_base_id}};

  const MatchConfig &cfg = ecs.get<MatchConfig>();
  j["config"] = {{"queue_max_length", cfg.queue_max_length},
                 {"match_time_limit", cfg.match_time_limit},
                 {"promotion_threshold", cfg.promotion_threshold},
                 {"promotion_multiplier", cfg.promotion_multiplier},
                 {"queue_bonus_per_node", cfg.queue_bonus_per_node},
                 {"enabled_units", cfg.enabled_units},
                 {"starting_photons", cfg.starting_photons}};

  if (ecs.has<MatchStats>()) {
    const MatchStats &s = ecs.get<MatchStats>();
    json stats = json::array();
    for (int p = 0; p < PLAYER_COUNT; p++)
      stats.push_back({{"units_trained", s.units_trained[p]},
                       {"units_killed", s.units_killed[p]},
                       {"damage_dealt", s.damage_dealt[p]},
                       {"photons_spent", s.photons_spent[p]},
                       {"base_damage_taken", s.base_damage_taken[p]}});
    j["stats"] = stats;
  }

  j["obstacles"] = json::array();
  for (const ObstacleRect &r : ecs.get<Obstacles>().rects)
    j["obstacles"].push_back(
        {{"x", r.x}, {"y", r.y}, {"width", r.width}, {"height", r.height}});

  // Units, in id order so equal worlds give equal documents
  std::vector<json> units;
  ecs.each([&](flecs::entity e, const UnitId &id, const Owner &o,
               const UnitKind &k, const Position &p, const Health &h) {
    const Veterancy &vet = e.get<Veterancy>();
    const CommandQueue &queue = e.get<CommandQueue>();

    json commands = json::array();
    for (int i = 0; i < queue.size(); i++)
      commands.push_back(command_to_json(queue.at(i)));

    units.push_back({{"id", id.id},
                     {"owner", o.player},
                     {"type", unit_type_name(k.type)},
                     {"x", p.x},
                     {"y", p.y},
                     {"hp", h.hp},
                     {"max_hp", h.max_hp},
                     {"armor", e.get<Armor>().value},
                     {"damage_multiplier", vet.damage_multiplier},
                     {"distance_traveled", vet.distance_traveled},
                     {"distance_credit", vet.distance_credit},
                     {"ability_cooldown", e.get<AbilityState>().cooldown},
                     {"queue", commands},
                     {"effects", effects_to_json(e.get<AbilityEffects>())}});
  });
  std::sort(units.begin(), units.end(), [](const json &a, const json &b) {
    return a["id"].get<uint32_t>() < b["id"].get<uint32_t>();
  });
  j["units"] = units;

  std::vector<json> bases;
  ecs.each([&](flecs::entity e, const BaseId &id, const Owner &o,
               const BaseState &s, const Position &p, const Health &h) {
    bases.push_back({{"id", id.id},
                     {"owner", o.player},
                     {"type", base_type_name(s.type)},
                     {"x", p.x},
                     {"y", p.y},
                     {"hp", h.hp},
                     {"max_hp", h.max_hp},
                     {"armor", e.get<Armor>().value},
                     {"selected", s.selected},
                     {"has_target", s.has_target},
                     {"target_x", s.target_x},
                     {"target_y", s.target_y},
                     {"current_speed", s.current_speed},
                     {"laser_cooldown", s.laser_cooldown},
                     {"attack_cooldown", s.attack_cooldown},
                     {"regen_timer", s.regen_timer},
                     {"pulse_end_time", s.pulse_end_time},
                     {"shield_active", s.shield_active}});
  });
  std::sort(bases.begin(), bases.end(), [](const json &a, const json &b) {
    return a["id"].get<uint32_t>() < b["id"].get<uint32_t>();
  });
  j["bases"] = bases;
  return j;
}

// ═════════════════════════════════════════════════════════════
// LOAD
//
// Everything is parsed into staging structs first. The world is
// only touched once the whole document has been accepted.
// ═════════════════════════════════════════════════════════════

struct StagedUnit {
  uint32_t id;
  uint8_t owner;
  UnitType type;
  Position pos;
  Health health;
  Armor armor;
  Veterancy vet;
  AbilityState ability;
  CommandQueue queue;
  AbilityEffects effects;
};

struct StagedBase {
  uint32_t id;
  uint8_t owner;
  Position pos;
  Health health;
  Armor armor;
  BaseState state;
};

static uint8_t owner_from_json(const json &j, std::string &error, bool &ok) {
  int owner = j.at("owner").get<int>();
  if (owner < 0 || owner >= PLAYER_COUNT) {
    error = "owner out of range: " + std::to_string(owner);
    ok = false;
  }
  return (uint8_t)owner;
}

static bool command_from_json(const json &j, CommandNode &out,
                              std::string &error) {
  std::string type = j.at("type").get<std::string>();
  float x = j.at("x").get<float>();
  float y = j.at("y").get<float>();
  if (type == "move") {
    out = move_command(x, y);
  } else if (type == "ability") {
    out = ability_command(x, y, j.value("dir_x", 0.0f), j.value("dir_y", 0.0f));
  } else if (type == "attack_move") {
    out = attack_move_command(x, y);
  } else if (type == "patrol") {
    out = patrol_command(x, y, j.at("return_x").get<float>(),
                         j.at("return_y").get<float>());
  } else {
    error = "unknown command type '" + type + "'";
    return false;
  }
  return true;
}

static bool effects_from_json(const json &j, AbilityEffects &fx,
                              std::string &error) {
  fx = {};
  if (j.contains("shield")) {
    const json &s = j["shield"];
    fx.shield = {true, s.at("end_time").get<float>(),
                 s.at("radius").get<float>(),
                 s.at("ranged_factor").get<float>(),
                 s.at("melee_factor").get<float>()};
  }
  if (j.contains("cloak"))
    fx.cloak = {true, j["cloak"].at("end_time").get<float>()};
  if (j.contains("bombardment")) {
    const json &b = j["bombardment"];
    fx.bombardment = {true,
                      b.at("impact_time").get<float>(),
                      b.at("end_time").get<float>(),
                      b.at("x").get<float>(),
                      b.at("y").get<float>(),
                      b.at("radius").get<float>(),
                      b.at("unit_dps").get<float>(),
                      b.at("base_dps").get<float>()};
  }
  if (j.contains("heal_pulse")) {
    const json &h = j["heal_pulse"];
    fx.heal_pulse = {true, h.at("end_time").get<float>(),
                     h.at("radius").get<float>()};
  }
  if (j.contains("missiles")) {
    const json &m = j["missiles"];
    const json &targets = m.at("targets");
    if (targets.size() > (size_t)MAX_MISSILES) {
      error = "too many missiles in barrage";
      return false;
    }
    fx.missiles.active = true;
    fx.missiles.resolved = m.value("resolved", false);
    fx.missiles.resolve_time = m.at("resolve_time").get<float>();
    for (const json &t : targets) {
      fx.missiles.missiles[fx.missiles.count++] = {
          t.at("x").get<float>(), t.at("y").get<float>(),
          t.at("damage").get<float>()};
    }
  }
  if (j.contains("line_jump")) {
    const json &l = j["line_jump"];
    fx.line_jump = {true,
                    l.value("resolved", false),
                    l.at("start_time").get<float>(),
                    l.at("resolve_time").get<float>(),
                    l.at("start_x").get<float>(),
                    l.at("start_y").get<float>(),
                    l.at("end_x").get<float>(),
                    l.at("end_y").get<float>(),
                    l.at("dir_x").get<float>(),
                    l.at("dir_y").get<float>(),
                    l.at("damage").get<float>()};
  }
  if (j.contains("dash"))
    fx.dash = {true, j["dash"].at("end_time").get<float>()};
  return true;
}

static bool stage_unit(const json &u, int queue_cap, StagedUnit &out,
                       std::string &error) {
  bool ok = true;
  out.id = u.at("id").get<uint32_t>();
  out.owner = owner_from_json(u, error, ok);
  if (!ok)
    return false;

  std::string type = u.at("type").get<std::string>();
  if (!parse_unit_type(type, out.type)) {
    error = "unit " + std::to_string(out.id) + ": unknown type '" + type + "'";
    return false;
  }

  out.pos = {u.at("x").get<float>(), u.at("y").get<float>()};
  out.health = {u.at("hp").get<float>(), u.at("max_hp").get<float>()};
  out.armor = {u.value("armor", 0.0f)};
  out.vet = {u.value("damage_multiplier", 1.0f),
             u.value("distance_traveled", 0.0f),
             u.value("distance_credit", 0.0f)};
  out.ability = {u.value("ability_cooldown", 0.0f)};

  out.queue = {};
  if (u.contains("queue")) {
    for (const json &c : u["queue"]) {
      CommandNode node;
      if (!command_from_json(c, node, error))
        return false;
      if (!out.queue.push(node, queue_cap)) {
        error = "unit " + std::to_string(out.id) + ": queue exceeds cap";
        return false;
      }
    }
  }

  if (u.contains("effects"))
    return effects_from_json(u["effects"], out.effects, error);
  out.effects = {};
  return true;
}

static bool stage_base(const json &b, StagedBase &out, std::string &error) {
  bool ok = true;
  out.id = b.at("id").get<uint32_t>();
  out.owner = owner_from_json(b, error, ok);
  if (!ok)
    return false;

  std::string type = b.at("type").get<std::string>();
  BaseState s = {};
  if (!parse_base_type(type, s.type)) {
    error = "base " + std::to_string(out.id) + ": unknown type '" + type + "'";
    return false;
  }

  out.pos = {b.at("x").get<float>(), b.at("y").get<float>()};
  out.health = {b.at("hp").get<float>(), b.at("max_hp").get<float>()};
  out.armor = {b.value("armor", 0.0f)};

  s.selected = b.value("selected", false);
  s.has_target = b.value("has_target", false);
  s.target_x = b.value("target_x", 0.0f);
  s.target_y = b.value("target_y", 0.0f);
  s.current_speed = b.value("current_speed", 0.0f);
  s.laser_cooldown = b.value("laser_cooldown", 0.0f);
  s.attack_cooldown = b.value("attack_cooldown", 0.0f);
  s.regen_timer = b.value("regen_timer", 0.0f);
  s.pulse_end_time = b.value("pulse_end_time", 0.0f);
  s.shield_active = b.value("shield_active", false);
  out.state = s;
  return true;
}

bool load_snapshot(flecs::world &ecs, const json &snapshot,
                   std::string &error) {
  MatchClock clock;
  Economy eco = {};
  MatchOutcome outcome;
  IdCounters ids;
  MatchConfig cfg = ecs.get<MatchConfig>();
  bool has_stats = false;
  MatchStats stats = {};
  Obstacles obstacles;
  std::vector<StagedUnit> units;
  std::vector<StagedBase> bases;

  try {
    int version = snapshot.at("version").get<int>();
    if (version != SNAPSHOT_VERSION) {
      error = "unsupported snapshot version " + std::to_string(version);
      return false;
    }

    const json &c = snapshot.at("clock");
    clock = {c.at("elapsed").get<double>(), c.at("income_timer").get<double>()};

    const json &economy = snapshot.at("economy");
    if (economy.size() != (size_t)PLAYER_COUNT) {
      error = "economy must list exactly two players";
      return false;
    }
    for (int p = 0; p < PLAYER_COUNT; p++) {
      const json &pe = economy[(size_t)p];
      eco.players[p] = {pe.at("photons").get<int>(),
                        pe.value("income_rate", 1),
                        pe.value("color", 0xFFFFFFFFu)};
    }

    const json &o = snapshot.at("outcome");
    outcome = {o.at("decided").get<bool>(), o.at("winner").get<int>()};

    const json &id = snapshot.at("ids");
    ids = {id.at("next_unit_id").get<uint32_t>(),
           id.at("next_base_id").get<uint32_t>()};

    if (snapshot.contains("config")) {
      const json &m = snapshot["config"];
      cfg.queue_max_length = m.value("queue_max_length", cfg.queue_max_length);
      cfg.match_time_limit = m.value("match_time_limit", cfg.match_time_limit);
      cfg.promotion_threshold =
          m.value("promotion_threshold", cfg.promotion_threshold);
      cfg.promotion_multiplier =
          m.value("promotion_multiplier", cfg.promotion_multiplier);
      cfg.queue_bonus_per_node =
          m.value("queue_bonus_per_node", cfg.queue_bonus_per_node);
      cfg.enabled_units = m.value("enabled_units", cfg.enabled_units);
      cfg.starting_photons = m.value("starting_photons", cfg.starting_photons);
      if (!validate_match_config(cfg, error))
        return false;
    }

    if (snapshot.contains("stats")) {
      const json &s = snapshot["stats"];
      if (s.size() != (size_t)PLAYER_COUNT) {
        error = "stats must list exactly two players";
        return false;
      }
      has_stats = true;
      for (int p = 0; p < PLAYER_COUNT; p++) {
        const json &ps = s[(size_t)p];
        stats.units_trained[p] = ps.value("units_trained", 0);
        stats.units_killed[p] = ps.value("units_killed", 0);
        stats.damage_dealt[p] = ps.value("damage_dealt", 0.0f);
        stats.photons_spent[p] = ps.value("photons_spent", 0);
        stats.base_damage_taken[p] = ps.value("base_damage_taken", 0.0f);
      }
    }

    if (snapshot.contains("obstacles")) {
      for (const json &r : snapshot["obstacles"])
        obstacles.rects.push_back(
            {r.at("x").get<float>(), r.at("y").get<float>(),
             r.at("width").get<float>(), r.at("height").get<float>()});
    }

    for (const json &u : snapshot.at("units")) {
      StagedUnit staged;
      if (!stage_unit(u, cfg.queue_max_length, staged, error))
        return false;
      if (staged.id == 0 || staged.id >= ids.next_unit_id) {
        error = "unit id " + std::to_string(staged.id) +
                " outside [1, next_unit_id)";
        return false;
      }
      for (const StagedUnit &other : units) {
        if (other.id == staged.id) {
          error = "duplicate unit id " + std::to_string(staged.id);
          return false;
        }
      }
      units.push_back(staged);
    }
    for (const json &b : snapshot.at("bases")) {
      StagedBase staged;
      if (!stage_base(b, staged, error))
        return false;
      if (staged.id == 0 || staged.id >= ids.next_base_id) {
        error = "base id " + std::to_string(staged.id) +
                " outside [1, next_base_id)";
        return false;
      }
      for (const StagedBase &other : bases) {
        if (other.id == staged.id) {
          error = "duplicate base id " + std::to_string(staged.id);
          return false;
        }
      }
      bases.push_back(staged);
    }
  } catch (json::exception &e) {
    error = e.what();
    return false;
  }

  // ── Commit ──
  ecs.delete_with<UnitId>();
  ecs.delete_with<BaseId>();

  ecs.set<MatchClock>(clock);
  ecs.set<Economy>(eco);
  ecs.set<MatchOutcome>(outcome);
  ecs.set<IdCounters>(ids);
  ecs.set<MatchConfig>(cfg);
  ecs.set<Obstacles>(obstacles);
  if (has_stats)
    ecs.set<MatchStats>(stats);
  else
    ecs.remove<MatchStats>();

  for (const StagedUnit &u : units) {
    ecs.entity()
        .set<Position>(u.pos)
        .set<UnitId>({u.id})
        .set<Owner>({u.owner})
        .set<UnitKind>({u.type})
        .set<Health>(u.health)
        .set<Armor>(u.armor)
        .set<Veterancy>(u.vet)
        .set<AbilityState>(u.ability)
        .set<CommandQueue>(u.queue)
        .set<AbilityEffects>(u.effects);
  }
  for (const StagedBase &b : bases) {
    ecs.entity()
        .set<Position>(b.pos)
        .set<BaseId>({b.id})
        .set<Owner>({b.owner})
        .set<Health>(b.health)
        .set<Armor>(b.armor)
        .set<BaseState>(b.state);
  }
  return true;
}

} // namespace photon
