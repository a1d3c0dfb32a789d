#ifndef HOVERTANK_SYSTEMS_H
#define HOVERTANK_SYSTEMS_H

#include "hovertank_components.h"
#include "hovertank_interfaces.h"
#include <flecs.h>
#include <string>

namespace hovertank {

// Body snapshot, respawn state machine, fuel drain, force flush
void register_vitals_systems(flecs::world &ecs);

// Hover, upright correction, drive, damping, obstacle assist, turret,
// fall/stuck recovery
void register_locomotion_systems(flecs::world &ecs);

// Module ticks: auto-aim, evasive maneuver, jump charge, wall rise
void register_module_systems(flecs::world &ecs);

// Recoil decay, projectile flight + hit resolution, tracer marks
void register_weapon_systems(flecs::world &ecs);

// Everything above, in tick order. The force flush is registered last so
// every channel contribution of the tick is in before it runs.
void register_all_systems(flecs::world &ecs);

// ═════════════════════════════════════════════════════════════
// Spawning
// ═════════════════════════════════════════════════════════════
flecs::entity spawn_vehicle(flecs::world &ecs, DynamicsBody *body,
                            const VehicleStats &stats,
                            const WeaponStats &weapon, uint8_t team);

// Stationary emplacement (turret base).
flecs::entity spawn_turret(flecs::world &ecs, const Vec3 &pos, uint8_t team,
                           float max_health);

// Mirror of a vehicle owned outside the core (AI, remote player). Damage
// is forwarded to DamageSink with the external id.
flecs::entity spawn_target_proxy(flecs::world &ecs, uint64_t external_id,
                                 const Vec3 &pos, uint8_t team,
                                 float max_health);

// ═════════════════════════════════════════════════════════════
// Targets
// ═════════════════════════════════════════════════════════════
bool is_live_target(flecs::entity e);
bool target_position(flecs::entity e, Vec3 &out);

// Nearest live Targetable of another team within max_range.
// kind_filter < 0 accepts every kind.
flecs::entity nearest_enemy(flecs::world &ecs, const Vec3 &from, uint8_t team,
                            float max_range, flecs::entity_t exclude = 0,
                            int kind_filter = -1);

// ═════════════════════════════════════════════════════════════
// Weapons
// ═════════════════════════════════════════════════════════════
enum FireResult : uint8_t {
  FIRE_OK = 0,
  FIRE_NOT_ALIVE,
  FIRE_RELOADING,
  FIRE_COOLDOWN,
  FIRE_BLOCKED, // barrel obstructed, no cooldown consumed
  FIRE_NO_AMMO, // tracer rounds only
  FIRE_INVALID
};

const char *archetype_name(Archetype archetype);
// Case-sensitive lower-case names ("standard", "piercing", ...).
bool archetype_from_name(const std::string &name, Archetype &out);
// Truncates to fit WeaponStats::weapon_id.
void set_weapon_id(WeaponStats &stats, const std::string &id);

FireResult fire(flecs::entity vehicle);
FireResult fire_tracer(flecs::entity vehicle);

// Shot direction: turret yaw on the horizontal plane, pitch from the aim
// value (not the chassis tilt).
Vec3 aim_direction(const BodyState &body, const DriveState &drive,
                   float aim_pitch);
Vec3 muzzle_position(const BodyState &body, const Vec3 &dir,
                     float barrel_length);

// Idempotent. Returns false if the projectile was already disposed.
bool dispose_projectile(flecs::entity projectile);

// ═════════════════════════════════════════════════════════════
// Damage / health / fuel
// ═════════════════════════════════════════════════════════════

// Returns the damage actually subtracted (after shield/stealth/armor).
float take_damage(flecs::entity target, float amount,
                  const Vec3 *attacker_pos = nullptr);
void heal(flecs::entity target, float amount);
void add_fuel(flecs::entity vehicle, float amount);
void set_armor_bonus(flecs::entity vehicle, float bonus);
void set_invulnerable(flecs::entity vehicle, float duration_ms);
bool is_invulnerable(flecs::entity vehicle);

// Death transition: clears inputs, cancels the life's timers, enters the
// respawn countdown. take_damage calls it at zero health.
void kill_vehicle(flecs::entity vehicle);

// Teleport to the last valid pose through the kinematic hold phases.
void force_reset(flecs::entity vehicle);

// ═════════════════════════════════════════════════════════════
// Modules
// ═════════════════════════════════════════════════════════════
enum ModuleResult : uint8_t {
  MODULE_ACTIVATED = 0,
  MODULE_ALREADY_ACTIVE,
  MODULE_ON_COOLDOWN,
  MODULE_NOT_ALIVE,
  MODULE_REFUSED, // precondition failed (falling, no body)
  MODULE_INVALID
};

// Keyboard keys 6,7,8,9,0. Returns false for any other key.
bool module_for_key(int key, ModuleKind &out);
int module_key(ModuleKind kind);

ModuleResult activate_module(flecs::entity vehicle, ModuleKind kind);
bool begin_jump_charge(flecs::entity vehicle);
bool release_jump_charge(flecs::entity vehicle);

// Returns true when this hit destroyed the wall.
bool damage_wall(flecs::entity wall, float amount);
int wall_count(flecs::world &ecs, flecs::entity_t owner);
// Centre at the current rise height.
Vec3 wall_center(const DeployableWall &wall);

// Nearest wall crossed by segment a→b, tested against the wall's box in
// its local frame. Walls in DEBRIS are ignored. Null entity when clear.
flecs::entity wall_on_segment(flecs::world &ecs, const Vec3 &a,
                              const Vec3 &b);

// Cancels module timers and returns every slot to IDLE (respawn).
void reset_modules(flecs::entity vehicle);

} // namespace hovertank

#endif // HOVERTANK_SYSTEMS_H
