#include "config_loader.h"
#include "hovertank_components.h"
#include "hovertank_systems.h"
#include "sim_runtime.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace hovertank {

static std::string vehicle_prefab_name(const std::string &id) {
  return "vehicle_" + id;
}

static std::string weapon_prefab_name(const std::string &id) {
  return "weapon_" + id;
}

// ─── Stat blocks ──────────────────────────────────────────
// Keys mirror the struct fields. Anything absent keeps its default.

static void read_vehicle_stats(const json &j, VehicleStats &s) {
  s.mass = j.value("mass", s.mass);
  s.ride_height = j.value("ride_height", s.ride_height);
  s.move_speed = j.value("move_speed", s.move_speed);
  s.turn_speed = j.value("turn_speed", s.turn_speed);
  s.acceleration = j.value("acceleration", s.acceleration);
  s.turn_accel = j.value("turn_accel", s.turn_accel);
  s.stability_torque = j.value("stability_torque", s.stability_torque);
  s.yaw_damping = j.value("yaw_damping", s.yaw_damping);
  s.side_friction = j.value("side_friction", s.side_friction);
  s.side_drag = j.value("side_drag", s.side_drag);
  s.fwd_drag = j.value("fwd_drag", s.fwd_drag);
  s.angular_drag = j.value("angular_drag", s.angular_drag);
  s.hover_stiffness = j.value("hover_stiffness", s.hover_stiffness);
  s.hover_damping = j.value("hover_damping", s.hover_damping);
  s.upright_force = j.value("upright_force", s.upright_force);
  s.upright_damp = j.value("upright_damp", s.upright_damp);
  s.emergency_force = j.value("emergency_force", s.emergency_force);
  s.down_force = j.value("down_force", s.down_force);
  s.vehicle_height = j.value("vehicle_height", s.vehicle_height);
  s.max_health = j.value("max_health", s.max_health);
  s.max_fuel = j.value("max_fuel", s.max_fuel);
  s.fuel_rate = j.value("fuel_rate", s.fuel_rate);
}

static void read_weapon_stats(const json &j, WeaponStats &w) {
  w.damage = j.value("damage", w.damage);
  w.cooldown_ms = j.value("cooldown_ms", w.cooldown_ms);
  w.projectile_speed = j.value("projectile_speed", w.projectile_speed);
  w.barrel_length = j.value("barrel_length", w.barrel_length);
  w.recoil_force = j.value("recoil_force", w.recoil_force);
  w.recoil_torque = j.value("recoil_torque", w.recoil_torque);
  w.gravity = j.value("gravity", w.gravity);
  w.ttl_ms = j.value("ttl_ms", w.ttl_ms);
  w.explosion_radius = j.value("explosion_radius", w.explosion_radius);
  w.chain_range = j.value("chain_range", w.chain_range);
  w.chain_max_targets = j.value("chain_max_targets", w.chain_max_targets);
  w.homing_strength = j.value("homing_strength", w.homing_strength);
  w.homing_range = j.value("homing_range", w.homing_range);
  w.pellet_count = j.value("pellet_count", w.pellet_count);
  w.spread = j.value("spread", w.spread);
  w.pellet_damage_frac = j.value("pellet_damage_frac", w.pellet_damage_frac);
  w.split_distance = j.value("split_distance", w.split_distance);
  w.split_count = j.value("split_count", w.split_count);
  w.split_damage_frac = j.value("split_damage_frac", w.split_damage_frac);
  w.beam_range = j.value("beam_range", w.beam_range);
  w.beam_heal = j.value("beam_heal", w.beam_heal);
}

static void read_rules(const json &j, CombatRules &r) {
  r.map_border = j.value("map_border", r.map_border);
  r.dispose_xz = j.value("dispose_xz", r.dispose_xz);
  r.dispose_y_min = j.value("dispose_y_min", r.dispose_y_min);
  r.dispose_y_max = j.value("dispose_y_max", r.dispose_y_max);
  r.ground_ricochet_y = j.value("ground_ricochet_y", r.ground_ricochet_y);
  r.ricochet_reset_y = j.value("ricochet_reset_y", r.ricochet_reset_y);
  r.max_ricochets = j.value("max_ricochets", r.max_ricochets);
  r.ricochet_min_speed = j.value("ricochet_min_speed", r.ricochet_min_speed);
  r.ricochet_max_incidence =
      j.value("ricochet_max_incidence", r.ricochet_max_incidence);
  r.ricochet_speed_keep = j.value("ricochet_speed_keep", r.ricochet_speed_keep);
  r.projectile_ttl_ms = j.value("projectile_ttl_ms", r.projectile_ttl_ms);

  r.vehicle_hit_radius = j.value("vehicle_hit_radius", r.vehicle_hit_radius);
  r.turret_hit_radius = j.value("turret_hit_radius", r.turret_hit_radius);
  r.tracer_hit_radius = j.value("tracer_hit_radius", r.tracer_hit_radius);

  r.invulnerability_ms = j.value("invulnerability_ms", r.invulnerability_ms);
  r.invulnerability_blocks_damage =
      j.value("invulnerability_blocks_damage", r.invulnerability_blocks_damage);
  r.shield_factor = j.value("shield_factor", r.shield_factor);
  r.stealth_factor = j.value("stealth_factor", r.stealth_factor);
  r.respawn_delay_ms = j.value("respawn_delay_ms", r.respawn_delay_ms);
  r.respawn_hold_ticks = j.value("respawn_hold_ticks", r.respawn_hold_ticks);
  if (j.contains("default_spawn")) {
    const json &p = j["default_spawn"];
    if (p.is_array() && p.size() == 3)
      r.default_spawn = {p[0].get<float>(), p[1].get<float>(),
                         p[2].get<float>()};
    else
      log_warn("[Config] default_spawn must be [x, y, z], ignored");
  }

  r.max_walls = j.value("max_walls", r.max_walls);
  r.wall_max_health = j.value("wall_max_health", r.wall_max_health);
  r.wall_lifetime_ms = j.value("wall_lifetime_ms", r.wall_lifetime_ms);

  r.tracer_ammo = j.value("tracer_ammo", r.tracer_ammo);
  r.tracer_damage = j.value("tracer_damage", r.tracer_damage);
  r.tracer_cooldown_ms = j.value("tracer_cooldown_ms", r.tracer_cooldown_ms);
  r.tracer_mark_ms = j.value("tracer_mark_ms", r.tracer_mark_ms);

  r.log_throttle_ms = j.value("log_throttle_ms", r.log_throttle_ms);
}

// ═════════════════════════════════════════════════════════════
// Loaders
// ═════════════════════════════════════════════════════════════

int load_vehicles_json(flecs::world &ecs, const std::string &text) {
  int count = 0;
  try {
    json j = json::parse(text);
    if (!j.contains("vehicles")) {
      log_warn("[Config] vehicles.json has no \"vehicles\" array");
      return 0;
    }

    for (auto &entry : j["vehicles"]) {
      std::string vehicle_id = entry["vehicle_id"].get<std::string>();
      VehicleStats stats = default_vehicle_stats();
      if (entry.contains("stats"))
        read_vehicle_stats(entry["stats"], stats);

      auto prefab = ecs.prefab(vehicle_prefab_name(vehicle_id).c_str());
      prefab.set<VehicleStats>(stats);
      log_info("[Config] Created vehicle prefab: ", vehicle_id);
      count++;
    }
  } catch (json::parse_error &e) {
    log_error("[Config] Parse error in vehicles.json: ", e.what());
  } catch (json::type_error &e) {
    log_error("[Config] Type error in vehicles.json: ", e.what());
  }
  return count;
}

int load_weapons_json(flecs::world &ecs, const std::string &text) {
  int count = 0;
  try {
    json j = json::parse(text);
    if (!j.contains("weapons")) {
      log_warn("[Config] weapons.json has no \"weapons\" array");
      return 0;
    }

    for (auto &entry : j["weapons"]) {
      std::string weapon_id = entry["weapon_id"].get<std::string>();
      std::string arch_name = entry.value("archetype", std::string("standard"));

      Archetype arch;
      if (!archetype_from_name(arch_name, arch)) {
        log_warn("[Config] weapon '", weapon_id, "': unknown archetype '",
                 arch_name, "', using standard");
        arch = ARCH_STANDARD;
      }

      WeaponStats stats = default_weapon_stats(arch);
      set_weapon_id(stats, weapon_id);
      if (entry.contains("stats"))
        read_weapon_stats(entry["stats"], stats);

      auto prefab = ecs.prefab(weapon_prefab_name(weapon_id).c_str());
      prefab.set<WeaponStats>(stats);
      log_info("[Config] Created weapon prefab: ", weapon_id, " (",
               archetype_name(arch), ")");
      count++;
    }
  } catch (json::parse_error &e) {
    log_error("[Config] Parse error in weapons.json: ", e.what());
  } catch (json::type_error &e) {
    log_error("[Config] Type error in weapons.json: ", e.what());
  }
  return count;
}

int load_rules_json(flecs::world &ecs, const std::string &text) {
  try {
    json j = json::parse(text);
    const json &body = j.contains("rules") ? j["rules"] : j;
    // Parse into a copy so a type error halfway through keeps the old set.
    CombatRules rules = g_runtime.rules;
    read_rules(body, rules);
    g_runtime.rules = rules;
    log_info("[Config] Combat rules loaded (", body.size(), " keys)");
    return (int)body.size();
  } catch (json::parse_error &e) {
    log_error("[Config] Parse error in rules.json: ", e.what());
  } catch (json::type_error &e) {
    log_error("[Config] Type error in rules.json: ", e.what());
  }
  return 0;
}

// ═════════════════════════════════════════════════════════════
// Prefab lookup / spawn
// ═════════════════════════════════════════════════════════════

flecs::entity find_vehicle_prefab(flecs::world &ecs,
                                  const std::string &vehicle_id) {
  return ecs.lookup(vehicle_prefab_name(vehicle_id).c_str());
}

flecs::entity find_weapon_prefab(flecs::world &ecs,
                                 const std::string &weapon_id) {
  return ecs.lookup(weapon_prefab_name(weapon_id).c_str());
}

flecs::entity spawn_vehicle_from_prefab(flecs::world &ecs, DynamicsBody *body,
                                        const std::string &vehicle_id,
                                        const std::string &weapon_id,
                                        uint8_t team) {
  VehicleStats stats = default_vehicle_stats();
  flecs::entity vp = find_vehicle_prefab(ecs, vehicle_id);
  if (vp.is_valid() && vp.has<VehicleStats>())
    stats = vp.get<VehicleStats>();
  else
    log_warn("[Config] No vehicle prefab '", vehicle_id, "', using defaults");

  WeaponStats weapon = default_weapon_stats(ARCH_STANDARD);
  flecs::entity wp = find_weapon_prefab(ecs, weapon_id);
  if (wp.is_valid() && wp.has<WeaponStats>()) {
    weapon = wp.get<WeaponStats>();
  } else {
    Archetype arch;
    if (archetype_from_name(weapon_id, arch))
      weapon = default_weapon_stats(arch);
    else
      log_warn("[Config] No weapon prefab '", weapon_id, "', using standard");
  }

  return spawn_vehicle(ecs, body, stats, weapon, team);
}

} // namespace hovertank
