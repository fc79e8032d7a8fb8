#ifndef PHOTON_DEFINITIONS_H
#define PHOTON_DEFINITIONS_H

#include "photon_components.h"
#include <string>

namespace photon {

// Built-in stat tables (Photon Clash defaults).
DefinitionTable default_definitions();

const char *unit_type_name(UnitType type);
const char *base_type_name(BaseType type);
bool parse_unit_type(const std::string &name, UnitType &out);
bool parse_base_type(const std::string &name, BaseType &out);

// Overrides `table` (and `config` when non-null) from a JSON document:
//   { "units": [ { "unit_id": "marine", "hp": 40, ... } ],
//     "bases": [ { "base_id": "defense", ... } ],
//     "match": { "queue_max_length": 20, ... } }
// Fields that are absent keep their current value. On failure nothing is
// modified and `error` holds the reason.
// Ranges every MatchConfig must satisfy before a tick can run: queue cap in
// [1, MAX_QUEUE_NODES], positive promotion threshold, multiplier >= 1.
bool validate_match_config(const MatchConfig &config, std::string &error);

bool load_definitions(const std::string &json_text, DefinitionTable &table,
                      MatchConfig *config, std::string &error);

} // namespace photon

#endif // PHOTON_DEFINITIONS_H
