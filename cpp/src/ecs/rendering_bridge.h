#ifndef HOVERTANK_RENDERING_BRIDGE_H
#define HOVERTANK_RENDERING_BRIDGE_H

#include <flecs.h>
#include <godot_cpp/variant/packed_float32_array.hpp>

namespace hovertank {

// ═══════════════════════════════════════════════════════════════
// RENDER BUFFERS
//
// Flat float arrays rebuilt once per physics tick. GDScript hands
// the wall buffer to RenderingServer.multimesh_set_buffer() and
// reads the projectile buffer to place tracer meshes.
// ═══════════════════════════════════════════════════════════════
constexpr int FLOATS_PER_PROJECTILE = 8;
constexpr int FLOATS_PER_WALL = 16;

// [x, y, z, vx, vy, vz, archetype, tracer]
void sync_projectiles(flecs::world &ecs, godot::PackedFloat32Array &buffer_out,
                      int &count_out);

// MultiMesh 3×4 transform + [health_frac, phase, rise_t, 0]
void sync_walls(flecs::world &ecs, godot::PackedFloat32Array &buffer_out,
                int &count_out);

} // namespace hovertank

#endif // HOVERTANK_RENDERING_BRIDGE_H
