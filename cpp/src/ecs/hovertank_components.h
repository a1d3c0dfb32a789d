#ifndef HOVERTANK_COMPONENTS_H
#define HOVERTANK_COMPONENTS_H

#include "hovertank_math.h"
#include <cstdint>

/**
 * HoverTank Core: ECS Component Definitions
 *
 * POD structs only. The one exception is BodyLink, a non-owning pointer
 * to the engine-side rigid body; the body outlives the entity, and
 * invalidation is detected through DynamicsBody::is_valid().
 */

namespace hovertank {

class DynamicsBody;

// ─── Timers ────────────────────────────────────────────────
// 0 = no pending timer. Ids are never reused.
struct TimerHandle {
  uint32_t id;
}; // 4 bytes

// ─── Identity / Tags ──────────────────────────────────────
struct TeamId {
  uint8_t team;
}; // 1 byte
struct IsAlive {};     // Tag
struct Vehicle {};     // Tag: driven by the locomotion controller
struct LocalPlayer {}; // Tag: owns HUD feedback

// Generation counter of a vehicle's life. Bumped on death and respawn.
// Timers scheduled in a previous life compare against it and drop.
struct LifeId {
  uint32_t generation;
}; // 4 bytes

enum TargetKind : uint8_t { TARGET_VEHICLE = 0, TARGET_TURRET = 1 };

struct Targetable {
  TargetKind kind;
  float hit_radius; // 4.0 vehicles, 5.0 turret bases
}; // 8 bytes

// Pose of an entity without a dynamics body (emplacements, proxies).
struct StaticPose {
  Vec3 pos;
  float yaw;
}; // 16 bytes

// Engine-side id of a mirrored external target (0 = none).
struct ExternalId {
  uint64_t id;
}; // 8 bytes

// ─── Dynamics ─────────────────────────────────────────────
struct BodyLink {
  DynamicsBody *body;
}; // 8 bytes, non-owning

// Snapshot of the body as resolved by the previous physics step.
struct BodyState {
  Vec3 pos;
  Quat rot;
  Vec3 lin_vel;
  Vec3 ang_vel;
  float mass;
  bool valid;
}; // 60 bytes

// One accumulated vector per force channel. Flushed once per tick.
struct ForceAccumulator {
  Vec3 vertical;
  Vec3 planar;
  Vec3 correction_torque;
  Vec3 yaw_torque;
  Vec3 impulse;
  Vec3 angular_impulse;
}; // 72 bytes

struct VehicleStats {
  float mass;
  float ride_height;
  float move_speed;
  float turn_speed;
  float acceleration;
  float turn_accel;
  float stability_torque;
  float yaw_damping;
  float side_friction;
  float side_drag;
  float fwd_drag;
  float angular_drag;
  float hover_stiffness;
  float hover_damping;
  float upright_force;
  float upright_damp;
  float emergency_force;
  float down_force;
  float vehicle_height;
  float max_health;
  float max_fuel;
  float fuel_rate; // per second of drive input
}; // 88 bytes

VehicleStats default_vehicle_stats();

// ─── Locomotion ───────────────────────────────────────────
struct DriveInput {
  float throttle; // target, [-1, 1]
  float steer;    // target, [-1, 1]
  float turret;   // target, [-1, 1]
  float aim_pitch;
}; // 16 bytes

struct DriveState {
  float smooth_throttle;
  float smooth_steer;
  float turret_smooth;
  float turret_yaw;       // relative to chassis
  float turret_accel;     // 0..1 ramp
  float turret_hold_time; // seconds of continuous turret input
  float ground_y;         // cached ground height
  uint8_t ground_ticks;   // ticks left before the ground ray is recast
  bool moving;
}; // 32 bytes

struct ObstacleProbe {
  float height;        // max obstruction height above ground, 0 = clear
  uint8_t ticks_left;  // cache lifetime
}; // 8 bytes

struct RecoveryState {
  float grace_ms;   // time spent fallen / stuck
  Vec3 last_valid_pos;
  float last_valid_yaw;
  bool has_valid_pose;
}; // 24 bytes

// ─── Vitals ───────────────────────────────────────────────
struct Health {
  float current;
  float max;
}; // 8 bytes

struct Fuel {
  float current;
  float max;
  float rate;
  bool empty;
}; // 16 bytes

struct Armor {
  float armor_bonus; // 0..1 mitigation
  bool shield_active;
  bool stealth_active;
}; // 8 bytes

// Advisory only unless CombatRules::invulnerability_blocks_damage.
struct Invulnerability {
  bool active;
  double expires_ms;
  TimerHandle timer;
}; // 24 bytes

// Struck by a tracer round; visible to allies until expiry.
struct Marked {
  double expires_ms;
}; // 8 bytes

// ─── Respawn ──────────────────────────────────────────────
enum RespawnPhase : uint8_t {
  RESPAWN_ALIVE = 0,
  RESPAWN_DEAD_COUNTDOWN,
  RESPAWN_TELEPORT,
  RESPAWN_HOLD_KINEMATIC,
  RESPAWN_RELEASE
};

struct RespawnState {
  RespawnPhase phase;
  bool restore_vitals; // false for a stuck reset (pose only)
  int hold_ticks;
  float countdown_ms;
  Vec3 target_pos;
  float target_yaw;
}; // 32 bytes

// ─── Weapons ──────────────────────────────────────────────
enum Archetype : uint8_t {
  ARCH_STANDARD = 0,
  ARCH_PIERCING,
  ARCH_EXPLOSIVE,
  ARCH_HOMING,
  ARCH_CHAIN,
  ARCH_MULTI_SHOT,
  ARCH_SPLIT,
  ARCH_BEAM,
  ARCH_COUNT
};

struct WeaponStats {
  char weapon_id[24];
  Archetype archetype;
  float damage;
  float cooldown_ms;
  float projectile_speed;
  float barrel_length;
  float recoil_force;
  float recoil_torque;
  float gravity;
  float ttl_ms;
  // Archetype-specific
  float explosion_radius;
  float chain_range;
  int chain_max_targets;
  float homing_strength;
  float homing_range;
  int pellet_count;
  float spread;
  float pellet_damage_frac;
  float split_distance;
  int split_count;
  float split_damage_frac;
  float beam_range;
  float beam_heal;
}; // 112 bytes

WeaponStats default_weapon_stats(Archetype archetype);

struct WeaponState {
  double last_shot_ms;
  float cooldown_ms;      // current, modules may change it
  float base_cooldown_ms; // baseline restored after modules
  bool reloading;
  TimerHandle reload_timer;
  float recoil_offset; // visual barrel offset, decays to 0
  uint8_t tracer_count;
  double last_tracer_ms;
}; // 40 bytes

// ─── Projectiles ──────────────────────────────────────────
struct Projectile {
  Vec3 pos;
  Vec3 prev_pos;
  Vec3 vel;
  float damage;
  float gravity;
  uint64_t owner;
  uint64_t last_hit;
  double spawn_ms;
  double split_at_ms; // 0 = never
  float ttl_ms;
  // Copied from WeaponStats at spawn so the round outlives a weapon swap.
  // EXPLOSIVE: blast radius. CHAIN: hop range. HOMING: acquisition range.
  float effect_radius;
  // HOMING: steer strength. SPLIT: child damage fraction.
  float effect_strength;
  Archetype archetype;
  uint8_t team;
  uint8_t ricochets;
  uint8_t effect_count; // CHAIN: max targets. SPLIT: children.
  bool tracer;
  bool alive; // cleared exactly once by dispose_projectile()
}; // ~104 bytes

// ─── Modules ──────────────────────────────────────────────
enum ModuleKind : uint8_t {
  MODULE_DEPLOY_WALL = 0, // key 6
  MODULE_RAPID_RELOAD,    // key 7
  MODULE_AUTO_AIM,        // key 8
  MODULE_EVASIVE,         // key 9
  MODULE_CHARGED_JUMP,    // key 0
  MODULE_COUNT
};

enum ModulePhase : uint8_t {
  MODULE_IDLE = 0,
  MODULE_ACTIVE,
  MODULE_COOLDOWN
};

struct ModuleSlot {
  ModulePhase phase;
  double started_ms;
  double cooldown_until_ms;
  float duration_ms;
  float cooldown_ms;
  TimerHandle timer; // the single pending transition
}; // 32 bytes

struct ModuleBank {
  ModuleSlot slots[MODULE_COUNT];
  float evasive_dir;
  double evasive_last_flip_ms;
  double auto_aim_last_fire_ms;
  bool jump_charging;
  double jump_charge_start_ms;
}; // ~200 bytes

// Durations and cooldowns per slot, every slot IDLE.
ModuleBank default_module_bank();

// ─── Deployable walls ─────────────────────────────────────
enum WallPhase : uint8_t { WALL_RISING = 0, WALL_STANDING, WALL_DEBRIS };

struct DeployableWall {
  Vec3 pos; // centre at full height
  float yaw;
  float half_w, half_h, half_d;
  float health;
  float max_health;
  float ground_y;
  float rise_t; // 0..1
  double spawn_ms;
  uint64_t owner;
  uint32_t seq; // spawn order, oldest retired first
  WallPhase phase;
  TimerHandle timer; // expiry, then debris removal
}; // ~72 bytes

} // namespace hovertank

#endif // HOVERTANK_COMPONENTS_H
