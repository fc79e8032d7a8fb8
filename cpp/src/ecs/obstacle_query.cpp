#include "obstacle_query.h"
#include <algorithm>
#include <cmath>

namespace photon {

bool obstacle_collides(const Obstacles &obstacles, float x, float y,
                       float radius) {
  for (const ObstacleRect &r : obstacles.rects) {
    float half_w = r.width * 0.5f;
    float half_h = r.height * 0.5f;

    // Closest point on the rectangle to the circle center
    float cx = std::max(r.x - half_w, std::min(x, r.x + half_w));
    float cy = std::max(r.y - half_h, std::min(y, r.y + half_h));

    float dx = x - cx;
    float dy = y - cy;
    if (dx * dx + dy * dy < radius * radius)
      return true;
  }
  return false;
}

Position safe_rally_point(const Obstacles &obstacles, Position spawn,
                          Position rally) {
  if (!obstacle_collides(obstacles, rally.x, rally.y, UNIT_RADIUS))
    return rally;

  constexpr float STEP = 0.5f;
  constexpr int MAX_STEPS = 20;

  float dx = spawn.x - rally.x;
  float dy = spawn.y - rally.y;
  float len = std::sqrt(dx * dx + dy * dy);
  if (len <= 0.0f)
    return spawn;
  dx /= len;
  dy /= len;

  for (int i = 1; i <= MAX_STEPS; i++) {
    float travel = STEP * (float)i;
    if (travel >= len)
      break; // walked all the way back
    Position candidate = {rally.x + dx * travel, rally.y + dy * travel};
    if (!obstacle_collides(obstacles, candidate.x, candidate.y, UNIT_RADIUS))
      return candidate;
  }
  return spawn;
}

} // namespace photon
