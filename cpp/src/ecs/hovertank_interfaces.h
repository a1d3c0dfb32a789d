#ifndef HOVERTANK_INTERFACES_H
#define HOVERTANK_INTERFACES_H

#include "hovertank_math.h"
#include <cstdint>
#include <functional>
#include <string>

/**
 * HoverTank Core: External Collaborator Contracts
 *
 * The core never owns a physics engine, a scene graph or any
 * presentation layer. Everything outside the simulation is reached
 * through these narrow interfaces. The Godot bridge implements them
 * on top of RigidBody3D / PhysicsDirectSpaceState3D; the tests
 * implement them with fakes.
 *
 * Collaborators may throw std::exception from any call. Per-tick entry
 * points catch and log (throttled); nothing here is expected to be
 * noexcept.
 */

namespace hovertank {

// ─── Dynamics Body Adapter ────────────────────────────────
enum MotionType : uint8_t { MOTION_DYNAMIC = 0, MOTION_KINEMATIC = 1 };

class DynamicsBody {
public:
  virtual ~DynamicsBody() = default;

  // False once the engine-side body has been freed.
  virtual bool is_valid() const = 0;
  // Same id space as RayHit::collider_id, used to ignore self hits.
  virtual uint64_t collider_id() const = 0;

  virtual float mass() const = 0;
  virtual Vec3 position() const = 0;
  virtual Quat orientation() const = 0;

  virtual Vec3 linear_velocity() const = 0;
  virtual void set_linear_velocity(const Vec3 &v) = 0;
  virtual Vec3 angular_velocity() const = 0;
  virtual void set_angular_velocity(const Vec3 &w) = 0;

  virtual void apply_force(const Vec3 &force, const Vec3 &at_point) = 0;
  virtual void apply_impulse(const Vec3 &impulse, const Vec3 &at_point) = 0;
  virtual void apply_torque(const Vec3 &torque) = 0;
  virtual void apply_angular_impulse(const Vec3 &impulse) = 0;

  virtual void set_motion_type(MotionType type) = 0;
  // Forced teleport only (respawn / stuck reset).
  virtual void set_target_transform(const Vec3 &position,
                                    const Quat &orientation) = 0;
};

// ─── Scene Query ──────────────────────────────────────────
struct RayHit {
  bool hit;
  Vec3 point;
  Vec3 normal;
  float distance;
  uint64_t collider_id; // engine-side id (Godot instance id)
  bool solid;           // false for triggers / pickups / effects
};

// Return false to skip a candidate collider.
using RayFilter = std::function<bool(const RayHit &candidate)>;

class SceneQuery {
public:
  virtual ~SceneQuery() = default;
  virtual RayHit raycast(const Vec3 &origin, const Vec3 &direction,
                         float max_distance, const RayFilter &filter) = 0;
};

// ─── Fire-and-forget presentation sinks ──────────────────
// Default bodies are no-ops so implementers override only what they show.

class HudSink {
public:
  virtual ~HudSink() = default;
  virtual void set_health(float current, float max) {}
  virtual void set_fuel(float current, float max) {}
  virtual void show_hit_marker(float damage) {}
  virtual void show_damage(float amount, const Vec3 &from) {}
  virtual void set_module_cooldown(int key, float cooldown_ms) {}
  virtual void add_active_effect(const std::string &name, float duration_ms) {}
  virtual void remove_active_effect(const std::string &name) {}
  virtual void set_respawn_countdown(float seconds_left) {}
};

class EffectsSink {
public:
  virtual ~EffectsSink() = default;
  virtual void create_muzzle_flash(const Vec3 &pos, const Vec3 &dir) {}
  virtual void create_hit_spark(const Vec3 &pos) {}
  virtual void create_explosion(const Vec3 &pos, float radius) {}
  virtual void create_chain_arc(const Vec3 &from, const Vec3 &to) {}
  virtual void create_beam(const Vec3 &from, const Vec3 &to, bool heal) {}
  virtual void create_wall_debris(const Vec3 &pos, int pieces) {}
  virtual void create_consumable_effect(const Vec3 &pos, const char *kind) {}
};

class SoundSink {
public:
  virtual ~SoundSink() = default;
  virtual void play_shoot(const Vec3 &pos) {}
  virtual void play_hit(const Vec3 &pos, float damage) {}
  virtual void play_explosion(const Vec3 &pos) {}
  virtual void play_module(int key) {}
};

class ChatSink {
public:
  virtual ~ChatSink() = default;
  virtual void log(const std::string &text) {}
  virtual void success(const std::string &text) {}
  virtual void combat(const std::string &text) {}
};

class ProgressionSink {
public:
  virtual ~ProgressionSink() = default;
  virtual void record_shot(const std::string &weapon_id) {}
  virtual void record_damage_dealt(float amount) {}
  virtual void record_kill() {}
};

// Damage that lands on mirrored external targets (AI tanks, network
// players) is forwarded here so the owning manager can react.
class DamageSink {
public:
  virtual ~DamageSink() = default;
  virtual void on_damage(uint64_t target_id, float amount) {}
  virtual void on_death(uint64_t target_id) {}
};

// ─── Network shot replication (exposed) ──────────────────
struct ShotEvent {
  Vec3 position;
  Vec3 direction;
  float aim_pitch;
  float damage;
  std::string weapon_id;
  double timestamp_ms;
};
using ShootCallback = std::function<void(const ShotEvent &)>;

// Supplies the respawn pose. Returns false to use the default.
using RespawnProvider = std::function<bool(Vec3 &position, Quat &orientation)>;

} // namespace hovertank

#endif // HOVERTANK_INTERFACES_H
