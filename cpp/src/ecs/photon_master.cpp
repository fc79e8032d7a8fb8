// ═════════════════════════════════════════════════════════════════════════════
// PHOTON CLASH: UNITY BUILD
// ═════════════════════════════════════════════════════════════════════════════
// Compile ONLY this file for the simulation core. One Translation Unit means
// one copy of flecs' static component id cache (flecs::type_id<T>::id), so
// w.each<T>() resolves the same ids in every included file.
//
// Godot-free. The GDExtension host (match_server.cpp) links against it.
//
// ORDER MATTERS: leaf modules first, then systems, then the match API.
// ═════════════════════════════════════════════════════════════════════════════

// 1. Data (stat tables, JSON definitions)
#include "photon_definitions.cpp"

// 2. Obstacle field (pure geometry)
#include "obstacle_query.cpp"

// 3. Systems (phases, mover, economy, bases, victory)
#include "photon_systems.cpp"
#include "photon_abilities.cpp"
#include "photon_combat.cpp"

// 4. Match API + tick coordinator
#include "match_world.cpp"

// 5. State export
#include "match_snapshot.cpp"
