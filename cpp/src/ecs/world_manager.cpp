#include "world_manager.h"
#include "config_loader.h"
#include "hovertank_components.h"
#include "hovertank_systems.h"
#include "rendering_bridge.h"
#include "sim_runtime.h"
#include <godot_cpp/classes/engine.hpp>
#include <godot_cpp/classes/file_access.hpp>
#include <godot_cpp/classes/node3d.hpp>
#include <godot_cpp/classes/physics_direct_space_state3d.hpp>
#include <godot_cpp/classes/physics_ray_query_parameters3d.hpp>
#include <godot_cpp/classes/viewport.hpp>
#include <godot_cpp/classes/world3d.hpp>
#include <godot_cpp/core/object.hpp>
#include <godot_cpp/variant/utility_functions.hpp>
#include <stdexcept>

// ═══════════════════════════════════════════════════════════════
// GOLDEN TU: the simulation runtime lives here for the extension.
// Clock, timers, rules and collaborator slots are shared by every
// system included in hovertank_master.cpp.
// ═══════════════════════════════════════════════════════════════
namespace hovertank {
SimRuntime g_runtime;
}

using hovertank::Quat;
using hovertank::Vec3;

static godot::Vector3 to_godot(const Vec3 &v) {
  return godot::Vector3(v.x, v.y, v.z);
}
static Vec3 from_godot(const godot::Vector3 &v) {
  return {(float)v.x, (float)v.y, (float)v.z};
}

static void godot_log_sink(hovertank::LogLevel level, const std::string &line) {
  godot::String text(line.c_str());
  switch (level) {
  case hovertank::LOG_ERROR:
    godot::UtilityFunctions::printerr(text);
    break;
  case hovertank::LOG_WARN:
    godot::UtilityFunctions::push_warning(text);
    break;
  default:
    godot::UtilityFunctions::print(text);
    break;
  }
}

namespace godot {

// ═══════════════════════════════════════════════════════════════
// GodotBody
// ═══════════════════════════════════════════════════════════════

GodotBody::GodotBody(RigidBody3D *body)
    : body_id(body ? (uint64_t)body->get_instance_id() : 0) {}

RigidBody3D *GodotBody::get() const {
  if (body_id == 0)
    throw std::runtime_error("GodotBody: no body bound");
  RigidBody3D *b = Object::cast_to<RigidBody3D>(ObjectDB::get_instance(body_id));
  if (!b)
    throw std::runtime_error("GodotBody: body was freed");
  return b;
}

bool GodotBody::is_valid() const {
  if (body_id == 0)
    return false;
  RigidBody3D *b = Object::cast_to<RigidBody3D>(ObjectDB::get_instance(body_id));
  return b != nullptr && b->is_inside_tree();
}

float GodotBody::mass() const { return (float)get()->get_mass(); }

Vec3 GodotBody::position() const {
  return from_godot(get()->get_global_position());
}

Quat GodotBody::orientation() const {
  Quaternion q = get()->get_global_transform().basis.get_rotation_quaternion();
  return {(float)q.x, (float)q.y, (float)q.z, (float)q.w};
}

Vec3 GodotBody::linear_velocity() const {
  return from_godot(get()->get_linear_velocity());
}

void GodotBody::set_linear_velocity(const Vec3 &v) {
  get()->set_linear_velocity(to_godot(v));
}

Vec3 GodotBody::angular_velocity() const {
  return from_godot(get()->get_angular_velocity());
}

void GodotBody::set_angular_velocity(const Vec3 &w) {
  get()->set_angular_velocity(to_godot(w));
}

// Godot takes the application point as an offset from the body origin.
void GodotBody::apply_force(const Vec3 &force, const Vec3 &at_point) {
  RigidBody3D *b = get();
  b->apply_force(to_godot(force), to_godot(at_point) - b->get_global_position());
}

void GodotBody::apply_impulse(const Vec3 &impulse, const Vec3 &at_point) {
  RigidBody3D *b = get();
  b->apply_impulse(to_godot(impulse),
                   to_godot(at_point) - b->get_global_position());
}

void GodotBody::apply_torque(const Vec3 &torque) {
  get()->apply_torque(to_godot(torque));
}

void GodotBody::apply_angular_impulse(const Vec3 &impulse) {
  get()->apply_torque_impulse(to_godot(impulse));
}

void GodotBody::set_motion_type(hovertank::MotionType type) {
  RigidBody3D *b = get();
  if (type == hovertank::MOTION_KINEMATIC) {
    b->set_freeze_mode(RigidBody3D::FREEZE_MODE_KINEMATIC);
    b->set_freeze_enabled(true);
  } else {
    b->set_freeze_enabled(false);
  }
}

void GodotBody::set_target_transform(const Vec3 &position, const Quat &orientation) {
  Quaternion q((real_t)orientation.x, (real_t)orientation.y,
               (real_t)orientation.z, (real_t)orientation.w);
  get()->set_global_transform(Transform3D(Basis(q), to_godot(position)));
}

// ═══════════════════════════════════════════════════════════════
// GodotSceneQuery
//
// intersect_ray has no per-candidate callback, so a rejected collider
// is added to the exclude list and the ray is cast again.
// ═══════════════════════════════════════════════════════════════
hovertank::RayHit GodotSceneQuery::raycast(const Vec3 &origin, const Vec3 &direction,
                                           float max_distance,
                                           const hovertank::RayFilter &filter) {
  constexpr int MAX_REJECTS = 8;
  hovertank::RayHit miss = {false, {0, 0, 0}, {0, 1, 0}, 0.0f, 0, false};

  Viewport *vp = server->get_viewport();
  if (!vp)
    return miss;
  Ref<World3D> world = vp->find_world_3d();
  if (world.is_null())
    return miss;
  PhysicsDirectSpaceState3D *space = world->get_direct_space_state();
  if (!space)
    return miss;

  Vector3 from = to_godot(origin);
  Vector3 to = to_godot(origin + hovertank::normalize(direction) * max_distance);
  Ref<PhysicsRayQueryParameters3D> query = PhysicsRayQueryParameters3D::create(from, to);
  TypedArray<RID> exclude;

  for (int attempt = 0; attempt <= MAX_REJECTS; attempt++) {
    query->set_exclude(exclude);
    Dictionary result = space->intersect_ray(query);
    if (result.is_empty())
      return miss;

    hovertank::RayHit hit;
    hit.hit = true;
    hit.point = from_godot(result["position"]);
    hit.normal = from_godot(result["normal"]);
    hit.distance = hovertank::distance(origin, hit.point);
    hit.collider_id = (uint64_t)(int64_t)result["collider_id"];
    hit.solid = true; // areas are not collided by default

    if (!filter || filter(hit))
      return hit;
    exclude.push_back(result["rid"]);
  }
  return miss;
}

// ═══════════════════════════════════════════════════════════════
// Signal sinks
// ═══════════════════════════════════════════════════════════════

void SignalHud::set_health(float current, float max) {
  server->emit_signal("health_changed", current, max);
}
void SignalHud::set_fuel(float current, float max) {
  server->emit_signal("fuel_changed", current, max);
}
void SignalHud::show_hit_marker(float damage) {
  server->emit_signal("hit_marker", damage);
}
void SignalHud::set_module_cooldown(int key, float cooldown_ms) {
  server->emit_signal("module_cooldown", key, cooldown_ms);
}
void SignalHud::add_active_effect(const std::string &name, float duration_ms) {
  server->emit_signal("effect_started", String(name.c_str()), duration_ms);
}
void SignalHud::remove_active_effect(const std::string &name) {
  server->emit_signal("effect_ended", String(name.c_str()));
}
void SignalHud::set_respawn_countdown(float seconds_left) {
  server->emit_signal("respawn_countdown", seconds_left);
}

void SignalChat::log(const std::string &text) {
  server->emit_signal("chat_message", String("log"), String(text.c_str()));
}
void SignalChat::success(const std::string &text) {
  server->emit_signal("chat_message", String("success"), String(text.c_str()));
}
void SignalChat::combat(const std::string &text) {
  server->emit_signal("chat_message", String("combat"), String(text.c_str()));
}

void SignalDamage::on_damage(uint64_t target_id, float amount) {
  server->emit_signal("target_damaged", (int64_t)target_id, amount);
}
void SignalDamage::on_death(uint64_t target_id) {
  server->emit_signal("target_destroyed", (int64_t)target_id);
}

// ═══════════════════════════════════════════════════════════════
// TankServer
// ═══════════════════════════════════════════════════════════════

TankServer::TankServer() {}

TankServer::~TankServer() {
  // The runtime outlives this node; drop every pointer into it.
  hovertank::g_runtime.reset();
  hovertank::set_log_sink(nullptr);
}

void TankServer::_bind_methods() {
  // Spawning
  ClassDB::bind_method(D_METHOD("spawn_player_tank", "body_path", "vehicle_id", "weapon_id"),
                       &TankServer::spawn_player_tank);
  ClassDB::bind_method(D_METHOD("spawn_target_tank", "body_path", "team"),
                       &TankServer::spawn_target_tank);
  ClassDB::bind_method(D_METHOD("spawn_turret", "x", "y", "z", "team"),
                       &TankServer::spawn_turret);

  // Input
  ClassDB::bind_method(D_METHOD("set_drive_input", "throttle", "steer", "turret"),
                       &TankServer::set_drive_input);
  ClassDB::bind_method(D_METHOD("set_aim_pitch", "pitch"), &TankServer::set_aim_pitch);

  // Combat
  ClassDB::bind_method(D_METHOD("fire"), &TankServer::fire);
  ClassDB::bind_method(D_METHOD("fire_tracer"), &TankServer::fire_tracer);
  ClassDB::bind_method(D_METHOD("activate_module", "key"), &TankServer::activate_module);
  ClassDB::bind_method(D_METHOD("begin_jump_charge"), &TankServer::begin_jump_charge);
  ClassDB::bind_method(D_METHOD("release_jump_charge"), &TankServer::release_jump_charge);

  // Vitals
  ClassDB::bind_method(D_METHOD("take_damage", "amount"), &TankServer::take_damage);
  ClassDB::bind_method(D_METHOD("heal", "amount"), &TankServer::heal);
  ClassDB::bind_method(D_METHOD("add_fuel", "amount"), &TankServer::add_fuel);
  ClassDB::bind_method(D_METHOD("get_health"), &TankServer::get_health);
  ClassDB::bind_method(D_METHOD("get_fuel"), &TankServer::get_fuel);
  ClassDB::bind_method(D_METHOD("is_alive"), &TankServer::is_alive);

  // Rendering
  ClassDB::bind_method(D_METHOD("get_projectile_buffer"), &TankServer::get_projectile_buffer);
  ClassDB::bind_method(D_METHOD("get_projectile_count"), &TankServer::get_projectile_count);
  ClassDB::bind_method(D_METHOD("get_wall_buffer"), &TankServer::get_wall_buffer);
  ClassDB::bind_method(D_METHOD("get_wall_count"), &TankServer::get_wall_count);

  ADD_SIGNAL(MethodInfo("health_changed", PropertyInfo(Variant::FLOAT, "current"),
                        PropertyInfo(Variant::FLOAT, "max")));
  ADD_SIGNAL(MethodInfo("fuel_changed", PropertyInfo(Variant::FLOAT, "current"),
                        PropertyInfo(Variant::FLOAT, "max")));
  ADD_SIGNAL(MethodInfo("hit_marker", PropertyInfo(Variant::FLOAT, "damage")));
  ADD_SIGNAL(MethodInfo("module_cooldown", PropertyInfo(Variant::INT, "key"),
                        PropertyInfo(Variant::FLOAT, "cooldown_ms")));
  ADD_SIGNAL(MethodInfo("effect_started", PropertyInfo(Variant::STRING, "name"),
                        PropertyInfo(Variant::FLOAT, "duration_ms")));
  ADD_SIGNAL(MethodInfo("effect_ended", PropertyInfo(Variant::STRING, "name")));
  ADD_SIGNAL(MethodInfo("respawn_countdown", PropertyInfo(Variant::FLOAT, "seconds_left")));
  ADD_SIGNAL(MethodInfo("chat_message", PropertyInfo(Variant::STRING, "channel"),
                        PropertyInfo(Variant::STRING, "text")));
  ADD_SIGNAL(MethodInfo("target_damaged", PropertyInfo(Variant::INT, "target_id"),
                        PropertyInfo(Variant::FLOAT, "amount")));
  ADD_SIGNAL(MethodInfo("target_destroyed", PropertyInfo(Variant::INT, "target_id")));
  ADD_SIGNAL(MethodInfo("shot_fired", PropertyInfo(Variant::VECTOR3, "position"),
                        PropertyInfo(Variant::VECTOR3, "direction"),
                        PropertyInfo(Variant::FLOAT, "aim_pitch"),
                        PropertyInfo(Variant::FLOAT, "damage"),
                        PropertyInfo(Variant::STRING, "weapon_id")));
}

void TankServer::_ready() {
  if (Engine::get_singleton()->is_editor_hint()) {
    return;
  }
  init_ecs();
}

void TankServer::init_ecs() {
  hovertank::set_log_sink(godot_log_sink);
  UtilityFunctions::print("[HoverTank] Initializing ECS...");

  ecs.component<hovertank::TeamId>("TeamId");
  ecs.component<hovertank::IsAlive>("IsAlive");
  ecs.component<hovertank::Vehicle>("Vehicle");
  ecs.component<hovertank::LocalPlayer>("LocalPlayer");
  ecs.component<hovertank::BodyState>("BodyState");
  ecs.component<hovertank::VehicleStats>("VehicleStats");
  ecs.component<hovertank::Health>("Health");
  ecs.component<hovertank::Fuel>("Fuel");
  ecs.component<hovertank::WeaponStats>("WeaponStats");
  ecs.component<hovertank::WeaponState>("WeaponState");
  ecs.component<hovertank::Projectile>("Projectile");
  ecs.component<hovertank::ModuleBank>("ModuleBank");
  ecs.component<hovertank::DeployableWall>("DeployableWall");

  scene_query = std::make_unique<GodotSceneQuery>(this);
  hud_sink = std::make_unique<SignalHud>(this);
  chat_sink = std::make_unique<SignalChat>(this);
  damage_sink = std::make_unique<SignalDamage>(this);

  hovertank::g_runtime.reset();
  hovertank::Collaborators io = {};
  io.scene = scene_query.get();
  io.hud = hud_sink.get();
  io.chat = chat_sink.get();
  io.damage = damage_sink.get();
  io.on_shoot = [this](const hovertank::ShotEvent &ev) {
    emit_signal("shot_fired", to_godot(ev.position), to_godot(ev.direction),
                ev.aim_pitch, ev.damage, String(ev.weapon_id.c_str()));
  };
  hovertank::g_runtime.set_collaborators(io);

  // rules.json first: spawn defaults read from it.
  load_config();

  hovertank::register_all_systems(ecs);

  UtilityFunctions::print("[HoverTank] ECS ready, systems registered.");
}

void TankServer::load_config() {
  struct ConfigFile {
    const char *path;
    int (*load)(flecs::world &, const std::string &);
  };
  const ConfigFile files[] = {
      {"res://res/data/rules.json", hovertank::load_rules_json},
      {"res://res/data/vehicles.json", hovertank::load_vehicles_json},
      {"res://res/data/weapons.json", hovertank::load_weapons_json},
  };

  for (const auto &f : files) {
    String path = f.path;
    if (!FileAccess::file_exists(path)) {
      UtilityFunctions::printerr("Failed to find ", path);
      continue;
    }
    String content = FileAccess::get_file_as_string(path);
    int n = f.load(ecs, std::string(content.utf8().get_data()));
    UtilityFunctions::print("[HoverTank] ", path, ": ", n, " entries");
  }
}

void TankServer::_physics_process(double delta) {
  if (Engine::get_singleton()->is_editor_hint()) {
    return;
  }

  refresh_proxies();

  // Clock + timers, then the ECS tick
  hovertank::pre_tick(ecs, (float)delta);
  ecs.progress((float)delta);

  hovertank::sync_projectiles(ecs, projectile_buffer, projectile_count);
  hovertank::sync_walls(ecs, wall_buffer, wall_count);
}

// Target tanks are driven elsewhere (AI, network); mirror their pose.
void TankServer::refresh_proxies() {
  for (auto it = proxies.begin(); it != proxies.end();) {
    Node3D *node = Object::cast_to<Node3D>(ObjectDB::get_instance(it->node_id));
    if (!node || !it->entity.is_alive()) {
      if (it->entity.is_alive())
        it->entity.destruct();
      it = proxies.erase(it);
      continue;
    }
    hovertank::StaticPose &pose = it->entity.get_mut<hovertank::StaticPose>();
    pose.pos = from_godot(node->get_global_position());
    pose.yaw = (float)node->get_global_rotation().y;
    ++it;
  }
}

bool TankServer::player_ready() const {
  return player.is_valid() && player.is_alive();
}

// ── Spawning ──────────────────────────────────────────────────

int64_t TankServer::spawn_player_tank(const NodePath &body_path, const String &vehicle_id,
                                      const String &weapon_id) {
  RigidBody3D *body = Object::cast_to<RigidBody3D>(get_node_or_null(body_path));
  if (!body) {
    UtilityFunctions::printerr("[HoverTank] spawn_player_tank: no RigidBody3D at ",
                               body_path);
    return -1;
  }

  bodies.push_back(std::make_unique<GodotBody>(body));
  player = hovertank::spawn_vehicle_from_prefab(
      ecs, bodies.back().get(), std::string(vehicle_id.utf8().get_data()),
      std::string(weapon_id.utf8().get_data()), 0);
  player.add<hovertank::LocalPlayer>();

  UtilityFunctions::print("[HoverTank] Player tank spawned (", vehicle_id, " / ",
                          weapon_id, ")");
  return (int64_t)player.id();
}

int64_t TankServer::spawn_target_tank(const NodePath &body_path, int team) {
  Node3D *node = Object::cast_to<Node3D>(get_node_or_null(body_path));
  if (!node) {
    UtilityFunctions::printerr("[HoverTank] spawn_target_tank: no Node3D at ", body_path);
    return -1;
  }

  uint64_t node_id = (uint64_t)node->get_instance_id();
  flecs::entity e = hovertank::spawn_target_proxy(
      ecs, node_id, from_godot(node->get_global_position()), (uint8_t)team,
      hovertank::default_vehicle_stats().max_health);
  proxies.push_back({e, node_id});
  return (int64_t)e.id();
}

int64_t TankServer::spawn_turret(float x, float y, float z, int team) {
  flecs::entity e = hovertank::spawn_turret(ecs, Vec3{x, y, z}, (uint8_t)team,
                                            hovertank::default_vehicle_stats().max_health);
  return (int64_t)e.id();
}

// ── Input ─────────────────────────────────────────────────────

void TankServer::set_drive_input(float throttle, float steer, float turret) {
  if (!player_ready())
    return;
  hovertank::DriveInput &in = player.get_mut<hovertank::DriveInput>();
  in.throttle = hovertank::clampf(throttle, -1.0f, 1.0f);
  in.steer = hovertank::clampf(steer, -1.0f, 1.0f);
  in.turret = hovertank::clampf(turret, -1.0f, 1.0f);
}

void TankServer::set_aim_pitch(float pitch) {
  if (!player_ready())
    return;
  player.get_mut<hovertank::DriveInput>().aim_pitch = pitch;
}

// ── Combat ────────────────────────────────────────────────────

int TankServer::fire() {
  if (!player_ready())
    return (int)hovertank::FIRE_INVALID;
  return (int)hovertank::fire(player);
}

int TankServer::fire_tracer() {
  if (!player_ready())
    return (int)hovertank::FIRE_INVALID;
  return (int)hovertank::fire_tracer(player);
}

int TankServer::activate_module(int key) {
  hovertank::ModuleKind kind;
  if (!player_ready() || !hovertank::module_for_key(key, kind))
    return (int)hovertank::MODULE_INVALID;
  return (int)hovertank::activate_module(player, kind);
}

bool TankServer::begin_jump_charge() {
  return player_ready() && hovertank::begin_jump_charge(player);
}

bool TankServer::release_jump_charge() {
  return player_ready() && hovertank::release_jump_charge(player);
}

// ── Vitals ────────────────────────────────────────────────────

float TankServer::take_damage(float amount) {
  if (!player_ready())
    return 0.0f;
  return hovertank::take_damage(player, amount);
}

void TankServer::heal(float amount) {
  if (player_ready())
    hovertank::heal(player, amount);
}

void TankServer::add_fuel(float amount) {
  if (player_ready())
    hovertank::add_fuel(player, amount);
}

float TankServer::get_health() const {
  if (!player_ready() || !player.has<hovertank::Health>())
    return 0.0f;
  return player.get<hovertank::Health>().current;
}

float TankServer::get_fuel() const {
  if (!player_ready() || !player.has<hovertank::Fuel>())
    return 0.0f;
  return player.get<hovertank::Fuel>().current;
}

bool TankServer::is_alive() const {
  return player_ready() && player.has<hovertank::IsAlive>();
}

// ── Rendering ─────────────────────────────────────────────────

PackedFloat32Array TankServer::get_projectile_buffer() const { return projectile_buffer; }
int TankServer::get_projectile_count() const { return projectile_count; }
PackedFloat32Array TankServer::get_wall_buffer() const { return wall_buffer; }
int TankServer::get_wall_count() const { return wall_count; }

} // namespace godot
