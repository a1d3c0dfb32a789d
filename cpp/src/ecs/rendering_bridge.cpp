#include "rendering_bridge.h"
#include "hovertank_components.h"
#include "hovertank_systems.h"
#include <cmath>

namespace hovertank {

// ═══════════════════════════════════════════════════════════════
// WALL BUFFER FORMAT
//
// 16 floats per instance, row-major 3×4 + 4 custom:
//
//   [0]  right.x   [1]  up.x   [2]  fwd.x   [3]  origin.x
//   [4]  right.y   [5]  up.y   [6]  fwd.y   [7]  origin.y
//   [8]  right.z   [9]  up.z   [10] fwd.z   [11] origin.z
//   [12] health    [13] phase  [14] rise_t  [15] 0
//
// Basis columns carry the half extents so a unit cube mesh renders
// at the wall's size.
// ═══════════════════════════════════════════════════════════════
static void write_wall(float *dest, int offset, const DeployableWall &w) {
  float s = std::sin(w.yaw);
  float c = std::cos(w.yaw);
  Vec3 center = wall_center(w);

  float sx = w.half_w * 2.0f;
  float sy = w.half_h * 2.0f;
  float sz = w.half_d * 2.0f;

  // Yaw about +Y: right = (c, 0, -s), fwd = (s, 0, c)
  dest[offset + 0] = c * sx;
  dest[offset + 1] = 0.0f;
  dest[offset + 2] = s * sz;
  dest[offset + 3] = center.x;

  dest[offset + 4] = 0.0f;
  dest[offset + 5] = sy;
  dest[offset + 6] = 0.0f;
  dest[offset + 7] = center.y;

  dest[offset + 8] = -s * sx;
  dest[offset + 9] = 0.0f;
  dest[offset + 10] = c * sz;
  dest[offset + 11] = center.z;

  dest[offset + 12] = w.max_health > 0.0f ? w.health / w.max_health : 0.0f;
  dest[offset + 13] = (float)w.phase;
  dest[offset + 14] = w.rise_t;
  dest[offset + 15] = 0.0f;
}

void sync_walls(flecs::world &ecs, godot::PackedFloat32Array &buffer_out,
                int &count_out) {
  auto q = ecs.query_builder<const DeployableWall>().build();

  int active_count = 0;
  q.each([&](const DeployableWall &w) {
    if (w.phase != WALL_DEBRIS)
      active_count++;
  });
  count_out = active_count;

  if (active_count == 0) {
    if (buffer_out.size() != 0)
      buffer_out.resize(0);
    return;
  }

  int required_size = active_count * FLOATS_PER_WALL;
  if (buffer_out.size() != required_size)
    buffer_out.resize(required_size);

  float *dest = buffer_out.ptrw();
  int idx = 0;
  q.each([&](const DeployableWall &w) {
    if (w.phase == WALL_DEBRIS)
      return;
    write_wall(dest, idx * FLOATS_PER_WALL, w);
    idx++;
  });
}

// ═══════════════════════════════════════════════════════════════
// PROJECTILE BUFFER
// ═══════════════════════════════════════════════════════════════
void sync_projectiles(flecs::world &ecs, godot::PackedFloat32Array &buffer_out,
                      int &count_out) {
  auto q = ecs.query_builder<const Projectile>().build();

  int active_count = 0;
  q.each([&](const Projectile &p) {
    if (p.alive)
      active_count++;
  });
  count_out = active_count;

  if (active_count == 0) {
    if (buffer_out.size() != 0)
      buffer_out.resize(0);
    return;
  }

  int required_size = active_count * FLOATS_PER_PROJECTILE;
  if (buffer_out.size() != required_size)
    buffer_out.resize(required_size);

  float *dest = buffer_out.ptrw();
  int idx = 0;
  q.each([&](const Projectile &p) {
    if (!p.alive)
      return;
    int offset = idx * FLOATS_PER_PROJECTILE;
    dest[offset + 0] = p.pos.x;
    dest[offset + 1] = p.pos.y;
    dest[offset + 2] = p.pos.z;
    dest[offset + 3] = p.vel.x;
    dest[offset + 4] = p.vel.y;
    dest[offset + 5] = p.vel.z;
    dest[offset + 6] = (float)p.archetype;
    dest[offset + 7] = p.tracer ? 1.0f : 0.0f;
    idx++;
  });
}

} // namespace hovertank
