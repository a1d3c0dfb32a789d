#ifndef HOVERTANK_WORLD_MANAGER_H
#define HOVERTANK_WORLD_MANAGER_H

#include "hovertank_interfaces.h"
#include <flecs.h>
#include <godot_cpp/classes/node.hpp>
#include <godot_cpp/classes/rigid_body3d.hpp>
#include <godot_cpp/variant/node_path.hpp>
#include <godot_cpp/variant/packed_float32_array.hpp>
#include <memory>
#include <vector>

namespace godot {

class TankServer;

// ─── RigidBody3D → DynamicsBody ───────────────────────────
// Holds the instance id, not the pointer: a freed node reports
// is_valid() == false instead of dangling.
class GodotBody : public hovertank::DynamicsBody {
public:
  explicit GodotBody(RigidBody3D *body);

  bool is_valid() const override;
  uint64_t collider_id() const override { return body_id; }

  float mass() const override;
  hovertank::Vec3 position() const override;
  hovertank::Quat orientation() const override;

  hovertank::Vec3 linear_velocity() const override;
  void set_linear_velocity(const hovertank::Vec3 &v) override;
  hovertank::Vec3 angular_velocity() const override;
  void set_angular_velocity(const hovertank::Vec3 &w) override;

  void apply_force(const hovertank::Vec3 &force,
                   const hovertank::Vec3 &at_point) override;
  void apply_impulse(const hovertank::Vec3 &impulse,
                     const hovertank::Vec3 &at_point) override;
  void apply_torque(const hovertank::Vec3 &torque) override;
  void apply_angular_impulse(const hovertank::Vec3 &impulse) override;

  void set_motion_type(hovertank::MotionType type) override;
  void set_target_transform(const hovertank::Vec3 &position,
                            const hovertank::Quat &orientation) override;

private:
  RigidBody3D *get() const;
  uint64_t body_id;
};

// ─── PhysicsDirectSpaceState3D → SceneQuery ───────────────
class GodotSceneQuery : public hovertank::SceneQuery {
public:
  explicit GodotSceneQuery(TankServer *server) : server(server) {}
  hovertank::RayHit raycast(const hovertank::Vec3 &origin,
                            const hovertank::Vec3 &direction,
                            float max_distance,
                            const hovertank::RayFilter &filter) override;

private:
  TankServer *server;
};

// HUD / damage events re-emitted as TankServer signals.
class SignalHud : public hovertank::HudSink {
public:
  explicit SignalHud(TankServer *server) : server(server) {}
  void set_health(float current, float max) override;
  void set_fuel(float current, float max) override;
  void show_hit_marker(float damage) override;
  void set_module_cooldown(int key, float cooldown_ms) override;
  void add_active_effect(const std::string &name, float duration_ms) override;
  void remove_active_effect(const std::string &name) override;
  void set_respawn_countdown(float seconds_left) override;

private:
  TankServer *server;
};

class SignalChat : public hovertank::ChatSink {
public:
  explicit SignalChat(TankServer *server) : server(server) {}
  void log(const std::string &text) override;
  void success(const std::string &text) override;
  void combat(const std::string &text) override;

private:
  TankServer *server;
};

class SignalDamage : public hovertank::DamageSink {
public:
  explicit SignalDamage(TankServer *server) : server(server) {}
  void on_damage(uint64_t target_id, float amount) override;
  void on_death(uint64_t target_id) override;

private:
  TankServer *server;
};

class TankServer : public Node {
  GDCLASS(TankServer, Node)

private:
  flecs::world ecs;

  std::vector<std::unique_ptr<GodotBody>> bodies;
  std::unique_ptr<GodotSceneQuery> scene_query;
  std::unique_ptr<SignalHud> hud_sink;
  std::unique_ptr<SignalChat> chat_sink;
  std::unique_ptr<SignalDamage> damage_sink;

  flecs::entity player;

  // Mirrored target tanks: proxy entity + node instance id.
  struct ProxyLink {
    flecs::entity entity;
    uint64_t node_id;
  };
  std::vector<ProxyLink> proxies;

  PackedFloat32Array projectile_buffer;
  int projectile_count = 0;
  PackedFloat32Array wall_buffer;
  int wall_count = 0;

  void load_config();
  void refresh_proxies();
  bool player_ready() const;

protected:
  static void _bind_methods();

public:
  TankServer();
  ~TankServer();

  void _ready() override;
  void _physics_process(double delta) override;

  void init_ecs();

  // --- GDScript API: spawning ---
  int64_t spawn_player_tank(const NodePath &body_path, const String &vehicle_id,
                            const String &weapon_id);
  int64_t spawn_target_tank(const NodePath &body_path, int team);
  int64_t spawn_turret(float x, float y, float z, int team);

  // --- Input ---
  void set_drive_input(float throttle, float steer, float turret);
  void set_aim_pitch(float pitch);

  // --- Combat ---
  int fire();
  int fire_tracer();
  int activate_module(int key);
  bool begin_jump_charge();
  bool release_jump_charge();

  // --- Vitals ---
  float take_damage(float amount);
  void heal(float amount);
  void add_fuel(float amount);
  float get_health() const;
  float get_fuel() const;
  bool is_alive() const;

  // --- Rendering ---
  PackedFloat32Array get_projectile_buffer() const;
  int get_projectile_count() const;
  PackedFloat32Array get_wall_buffer() const;
  int get_wall_count() const;
};

} // namespace godot

#endif // HOVERTANK_WORLD_MANAGER_H
