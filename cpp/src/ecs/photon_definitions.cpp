#include "photon_definitions.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace photon {

static const char *UNIT_NAMES[UNIT_TYPE_COUNT] = {
    "marine", "warrior", "snaker",    "tank",
    "scout",  "artillery", "medic", "interceptor"};

static const char *BASE_NAMES[BASE_TYPE_COUNT] = {"standard", "defense",
                                                  "support", "assault"};

static const char *ABILITY_NAMES[] = {
    "none",   "burst_fire", "dash_strike", "line_jump",      "shield",
    "cloak", "bombardment", "heal_pulse", "missile_barrage"};
constexpr int ABILITY_NAME_COUNT = sizeof(ABILITY_NAMES) / sizeof(ABILITY_NAMES[0]);

DefinitionTable default_definitions() {
  DefinitionTable t = {};

  //                  hp    armor speed attack        range dmg   rate cost
  //                  ability              cd     structures
  t.units[UNIT_MARINE] = {40.0f, 0.0f, 4.0f, ATTACK_RANGED, 8.0f, 6.0f, 2.0f,
                          25, ABILITY_BURST_FIRE, 5.0f, true};
  t.units[UNIT_WARRIOR] = {120.0f, 0.0f, 3.0f, ATTACK_MELEE, 1.0f, 18.0f, 1.0f,
                           40, ABILITY_DASH_STRIKE, 8.0f, true};
  t.units[UNIT_SNAKER] = {70.0f, 0.0f, 4.5f, ATTACK_NONE, 0.0f, 0.0f, 0.0f,
                          30, ABILITY_LINE_JUMP, 6.0f, false};
  t.units[UNIT_TANK] = {200.0f, 0.0f, 2.0f, ATTACK_RANGED, 6.0f, 12.0f, 0.8f,
                        60, ABILITY_SHIELD, 12.0f, true};
  t.units[UNIT_SCOUT] = {30.0f, 0.0f, 6.0f, ATTACK_RANGED, 5.0f, 4.0f, 3.0f,
                         20, ABILITY_CLOAK, 15.0f, false};
  t.units[UNIT_ARTILLERY] = {50.0f, 0.0f, 2.5f, ATTACK_RANGED, 15.0f, 8.0f,
                             0.5f, 50, ABILITY_BOMBARDMENT, 10.0f, true};
  t.units[UNIT_MEDIC] = {60.0f, 0.0f, 3.5f, ATTACK_NONE, 0.0f, 0.0f, 0.0f,
                         35, ABILITY_HEAL_PULSE, 7.0f, false};
  t.units[UNIT_INTERCEPTOR] = {55.0f, 0.0f, 5.5f, ATTACK_RANGED, 10.0f, 5.0f,
                               2.5f, 45, ABILITY_MISSILE_BARRAGE, 8.0f, true};

  //                   hp     armor move  speed range dmg   rate
  //                   regen_r regen hp/s interval shield
  t.bases[BASE_STANDARD] = {1000.0f, 0.0f, true, 1.5f, 0.0f, 0.0f, 0.0f,
                            0.0f,    0.0f, 0.0f, false};
  t.bases[BASE_DEFENSE] = {1200.0f, 0.0f, false, 0.0f, 8.0f, 15.0f, 1.0f,
                           0.0f,    0.0f, 0.0f,  false};
  t.bases[BASE_SUPPORT] = {900.0f, 0.0f, true, 1.5f, 0.0f, 0.0f, 0.0f,
                           8.0f,   15.0f, 2.0f, false};
  t.bases[BASE_ASSAULT] = {800.0f, 0.0f, true, 2.5f, 0.0f, 0.0f, 0.0f,
                           0.0f,   0.0f, 0.0f, true};
  return t;
}

const char *unit_type_name(UnitType type) {
  return type < UNIT_TYPE_COUNT ? UNIT_NAMES[type] : "unknown";
}

const char *base_type_name(BaseType type) {
  return type < BASE_TYPE_COUNT ? BASE_NAMES[type] : "unknown";
}

bool parse_unit_type(const std::string &name, UnitType &out) {
  for (int i = 0; i < UNIT_TYPE_COUNT; i++) {
    if (name == UNIT_NAMES[i]) {
      out = (UnitType)i;
      return true;
    }
  }
  return false;
}

bool parse_base_type(const std::string &name, BaseType &out) {
  for (int i = 0; i < BASE_TYPE_COUNT; i++) {
    if (name == BASE_NAMES[i]) {
      out = (BaseType)i;
      return true;
    }
  }
  return false;
}

static bool parse_attack_type(const std::string &name, AttackType &out) {
  if (name == "none")
    out = ATTACK_NONE;
  else if (name == "ranged")
    out = ATTACK_RANGED;
  else if (name == "melee")
    out = ATTACK_MELEE;
  else
    return false;
  return true;
}

static bool parse_ability(const std::string &name, AbilityKind &out) {
  for (int i = 0; i < ABILITY_NAME_COUNT; i++) {
    if (name == ABILITY_NAMES[i]) {
      out = (AbilityKind)i;
      return true;
    }
  }
  return false;
}

static bool read_unit(const json &u, DefinitionTable &t, std::string &error) {
  std::string unit_id = u.at("unit_id").get<std::string>();
  UnitType type;
  if (!parse_unit_type(unit_id, type)) {
    error = "unknown unit_id '" + unit_id + "'";
    return false;
  }

  UnitDefinition &d = t.units[type];
  d.hp = u.value("hp", d.hp);
  d.armor = u.value("armor", d.armor);
  d.move_speed = u.value("move_speed", d.move_speed);
  d.attack_range = u.value("attack_range", d.attack_range);
  d.attack_damage = u.value("attack_damage", d.attack_damage);
  d.attack_rate = u.value("attack_rate", d.attack_rate);
  d.cost = u.value("cost", d.cost);
  d.ability_cooldown = u.value("ability_cooldown", d.ability_cooldown);
  d.can_damage_structures =
      u.value("can_damage_structures", d.can_damage_structures);

  if (u.contains("attack_type")) {
    std::string name = u["attack_type"].get<std::string>();
    if (!parse_attack_type(name, d.attack_type)) {
      error = unit_id + ": unknown attack_type '" + name + "'";
      return false;
    }
  }
  if (u.contains("ability")) {
    std::string name = u["ability"].get<std::string>();
    if (!parse_ability(name, d.ability)) {
      error = unit_id + ": unknown ability '" + name + "'";
      return false;
    }
  }

  if (d.hp <= 0.0f || d.cost < 0 || d.ability_cooldown < 0.0f) {
    error = unit_id + ": hp must be positive, cost and cooldown non-negative";
    return false;
  }
  return true;
}

static bool read_base(const json &b, DefinitionTable &t, std::string &error) {
  std::string base_id = b.at("base_id").get<std::string>();
  BaseType type;
  if (!parse_base_type(base_id, type)) {
    error = "unknown base_id '" + base_id + "'";
    return false;
  }

  BaseDefinition &d = t.bases[type];
  d.hp = b.value("hp", d.hp);
  d.armor = b.value("armor", d.armor);
  d.can_move = b.value("can_move", d.can_move);
  d.move_speed = b.value("move_speed", d.move_speed);
  d.shield_while_moving = b.value("shield_while_moving", d.shield_while_moving);

  if (b.contains("auto_attack")) {
    auto &a = b["auto_attack"];
    d.attack_range = a.value("range", d.attack_range);
    d.attack_damage = a.value("damage", d.attack_damage);
    d.attack_rate = a.value("rate", d.attack_rate);
  }
  if (b.contains("regeneration")) {
    auto &r = b["regeneration"];
    d.regen_radius = r.value("radius", d.regen_radius);
    d.regen_rate = r.value("rate", d.regen_rate);
    d.regen_interval = r.value("pulse_interval", d.regen_interval);
  }

  if (d.hp <= 0.0f) {
    error = base_id + ": hp must be positive";
    return false;
  }
  return true;
}

static bool read_match(const json &m, MatchConfig &c, std::string &error) {
  c.queue_max_length = m.value("queue_max_length", c.queue_max_length);
  c.match_time_limit = m.value("match_time_limit", c.match_time_limit);
  c.promotion_threshold = m.value("promotion_threshold", c.promotion_threshold);
  c.promotion_multiplier =
      m.value("promotion_multiplier", c.promotion_multiplier);
  c.queue_bonus_per_node =
      m.value("queue_bonus_per_node", c.queue_bonus_per_node);
  c.starting_photons = m.value("starting_photons", c.starting_photons);

  if (m.contains("enabled_units")) {
    uint32_t mask = 0;
    for (auto &name : m["enabled_units"]) {
      UnitType type;
      if (!parse_unit_type(name.get<std::string>(), type)) {
        error = "match: unknown enabled unit '" + name.get<std::string>() + "'";
        return false;
      }
      mask |= 1u << type;
    }
    c.enabled_units = mask;
  }

  return validate_match_config(c, error);
}

bool validate_match_config(const MatchConfig &c, std::string &error) {
  if (c.queue_max_length < 1 || c.queue_max_length > MAX_QUEUE_NODES) {
    error = "match: queue_max_length must be in [1, " +
            std::to_string(MAX_QUEUE_NODES) + "]";
    return false;
  }
  if (!(c.promotion_threshold > 0.0f) || !(c.promotion_multiplier >= 1.0f)) {
    error = "match: promotion_threshold must be positive and "
            "promotion_multiplier at least 1";
    return false;
  }
  return true;
}

bool load_definitions(const std::string &json_text, DefinitionTable &table,
                      MatchConfig *config, std::string &error) {
  DefinitionTable staged = table;
  MatchConfig staged_config = config ? *config : MatchConfig{};

  try {
    json j = json::parse(json_text);

    if (j.contains("units")) {
      for (auto &unit : j["units"]) {
        if (!read_unit(unit, staged, error))
          return false;
      }
    }
    if (j.contains("bases")) {
      for (auto &base : j["bases"]) {
        if (!read_base(base, staged, error))
          return false;
      }
    }
    if (config && j.contains("match")) {
      if (!read_match(j["match"], staged_config, error))
        return false;
    }
  } catch (json::exception &e) {
    error = e.what();
    return false;
  }

  table = staged;
  if (config)
    *config = staged_config;
  return true;
}

} // namespace photon
