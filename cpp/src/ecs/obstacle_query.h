#ifndef PHOTON_OBSTACLE_QUERY_H
#define PHOTON_OBSTACLE_QUERY_H

#include "photon_components.h"

namespace photon {

// Circle vs axis-aligned rectangles. Pure, no world access.
bool obstacle_collides(const Obstacles &obstacles, float x, float y,
                       float radius);

// Nearest point on the spawn->rally segment that a unit can stand on.
// Steps back toward the spawn point in 0.5m increments (20 tries), then
// falls back to the spawn point itself.
Position safe_rally_point(const Obstacles &obstacles, Position spawn,
                          Position rally);

} // namespace photon

#endif // PHOTON_OBSTACLE_QUERY_H
