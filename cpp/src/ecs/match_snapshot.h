#ifndef PHOTON_MATCH_SNAPSHOT_H
#define PHOTON_MATCH_SNAPSHOT_H

#include <flecs.h>
#include <nlohmann/json.hpp>
#include <string>

namespace photon {

// Full match state as JSON: clock, economy, outcome, id counters, stats,
// config, obstacles, and every unit (queue and effect slots included) and
// base. Definitions are not part of the snapshot.
nlohmann::json save_snapshot(flecs::world &ecs);

// Replaces the state of an initialised match world with `snapshot`.
// All-or-nothing: on a missing or malformed field the world is left as it
// was and `error` holds the reason.
bool load_snapshot(flecs::world &ecs, const nlohmann::json &snapshot,
                   std::string &error);

} // namespace photon

#endif // PHOTON_MATCH_SNAPSHOT_H
