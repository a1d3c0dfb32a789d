#include "hovertank_components.h"
#include "hovertank_systems.h"
#include "sim_runtime.h"
#include <cmath>

// NOTE: g_runtime is defined in world_manager.cpp (the golden TU) and in
// test_master.cpp for the headless binary.

namespace hovertank {

VehicleStats default_vehicle_stats() {
  VehicleStats s;
  s.mass = 1875.0f;
  s.ride_height = 1.0f;
  s.move_speed = 24.0f;
  s.turn_speed = 2.5f;
  s.acceleration = 10000.0f;
  s.turn_accel = 11000.0f;
  s.stability_torque = 2000.0f;
  s.yaw_damping = 4500.0f;
  s.side_friction = 17000.0f;
  s.side_drag = 8000.0f;
  s.fwd_drag = 7000.0f;
  s.angular_drag = 5000.0f;
  s.hover_stiffness = 3500.0f;
  s.hover_damping = 30000.0f;
  s.upright_force = 10000.0f;
  s.upright_damp = 7000.0f;
  s.emergency_force = 15000.0f;
  s.down_force = 4000.0f;
  s.vehicle_height = 0.8f;
  s.max_health = 100.0f;
  s.max_fuel = 500.0f;
  s.fuel_rate = 0.5f;
  return s;
}

// ═════════════════════════════════════════════════════════════
// Spawning
// ═════════════════════════════════════════════════════════════

static BodyState read_body(DynamicsBody *body, float fallback_mass) {
  BodyState bs = {};
  bs.rot = QUAT_IDENTITY;
  bs.mass = fallback_mass;
  if (!body)
    return bs;
  try {
    if (!body->is_valid())
      return bs;
    bs.pos = body->position();
    bs.rot = body->orientation();
    bs.lin_vel = body->linear_velocity();
    bs.ang_vel = body->angular_velocity();
    bs.mass = body->mass();
    bs.valid = true;
  } catch (const std::exception &ex) {
    log_error_throttled("read_body", "[Spawn] body read failed: ", ex.what());
  }
  return bs;
}

flecs::entity spawn_vehicle(flecs::world &ecs, DynamicsBody *body,
                            const VehicleStats &stats,
                            const WeaponStats &weapon, uint8_t team) {
  const CombatRules &rules = g_runtime.rules;
  BodyState bs = read_body(body, stats.mass);

  WeaponState ws = {};
  ws.last_shot_ms = -1e12;
  ws.cooldown_ms = weapon.cooldown_ms;
  ws.base_cooldown_ms = weapon.cooldown_ms;
  ws.tracer_count = (uint8_t)rules.tracer_ammo;
  ws.last_tracer_ms = -1e12;

  DriveState ds = {};
  ds.ground_y = 0.0f;

  RecoveryState rec = {};
  rec.last_valid_pos = bs.valid ? bs.pos : rules.default_spawn;
  rec.last_valid_yaw = bs.valid ? yaw_of(local_forward(bs.rot)) : 0.0f;
  rec.has_valid_pose = bs.valid;

  RespawnState rs = {};
  rs.phase = RESPAWN_ALIVE;

  auto e = ecs.entity()
               .add<Vehicle>()
               .set<TeamId>({team})
               .set<LifeId>({1})
               .set<BodyLink>({body})
               .set<BodyState>(bs)
               .set<ForceAccumulator>({})
               .set<VehicleStats>(stats)
               .set<DriveInput>({0.0f, 0.0f, 0.0f, 0.0f})
               .set<DriveState>(ds)
               .set<ObstacleProbe>({0.0f, 0})
               .set<RecoveryState>(rec)
               .set<Health>({stats.max_health, stats.max_health})
               .set<Fuel>({stats.max_fuel, stats.max_fuel, stats.fuel_rate,
                           false})
               .set<Armor>({0.0f, false, false})
               .set<Invulnerability>({false, 0.0, {0}})
               .set<WeaponStats>(weapon)
               .set<WeaponState>(ws)
               .set<ModuleBank>(default_module_bank())
               .set<RespawnState>(rs)
               .set<Targetable>({TARGET_VEHICLE, rules.vehicle_hit_radius})
               .add<IsAlive>();

  log_info("[HoverTank] Vehicle ", e.id(), " spawned (team ", (int)team,
           ", weapon ", weapon.weapon_id, ")");
  return e;
}

flecs::entity spawn_turret(flecs::world &ecs, const Vec3 &pos, uint8_t team,
                           float max_health) {
  return ecs.entity()
      .set<TeamId>({team})
      .set<StaticPose>({pos, 0.0f})
      .set<Health>({max_health, max_health})
      .set<Targetable>({TARGET_TURRET, g_runtime.rules.turret_hit_radius})
      .add<IsAlive>();
}

flecs::entity spawn_target_proxy(flecs::world &ecs, uint64_t external_id,
                                 const Vec3 &pos, uint8_t team,
                                 float max_health) {
  return ecs.entity()
      .set<TeamId>({team})
      .set<StaticPose>({pos, 0.0f})
      .set<ExternalId>({external_id})
      .set<Health>({max_health, max_health})
      .set<Targetable>({TARGET_VEHICLE, g_runtime.rules.vehicle_hit_radius})
      .add<IsAlive>();
}

// ═════════════════════════════════════════════════════════════
// Targets
// ═════════════════════════════════════════════════════════════

// Health is checked as well as the tag: IsAlive removal is deferred while
// systems run, so a target killed earlier in the tick still carries it.
bool is_live_target(flecs::entity e) {
  if (!e.is_valid() || !e.is_alive())
    return false;
  if (!e.has<IsAlive>() || !e.has<Health>())
    return false;
  return e.get<Health>().current > 0.0f;
}

bool target_position(flecs::entity e, Vec3 &out) {
  if (e.has<BodyState>()) {
    const BodyState &bs = e.get<BodyState>();
    if (bs.valid) {
      out = bs.pos;
      return true;
    }
  }
  if (e.has<StaticPose>()) {
    out = e.get<StaticPose>().pos;
    return true;
  }
  return false;
}

flecs::entity nearest_enemy(flecs::world &ecs, const Vec3 &from, uint8_t team,
                            float max_range, flecs::entity_t exclude,
                            int kind_filter) {
  flecs::entity best = flecs::entity::null();
  float best_d2 = max_range * max_range;

  ecs.each([&](flecs::entity t, const Targetable &tg, const TeamId &tt) {
    if (t.id() == exclude || tt.team == team)
      return;
    if (kind_filter >= 0 && (int)tg.kind != kind_filter)
      return;
    if (!is_live_target(t))
      return;
    Vec3 p;
    if (!target_position(t, p))
      return;
    float d2 = length_sq(p - from);
    if (d2 <= best_d2) {
      best_d2 = d2;
      best = t;
    }
  });
  return best;
}

// ═════════════════════════════════════════════════════════════
// Damage / Health / Fuel
// ═════════════════════════════════════════════════════════════

bool is_invulnerable(flecs::entity vehicle) {
  if (!vehicle.is_valid() || !vehicle.is_alive() ||
      !vehicle.has<Invulnerability>())
    return false;
  const Invulnerability &inv = vehicle.get<Invulnerability>();
  return inv.active && g_runtime.now_ms < inv.expires_ms;
}

float take_damage(flecs::entity target, float amount,
                  const Vec3 *attacker_pos) {
  if (!is_live_target(target))
    return 0.0f;
  if (!is_finite(amount) || amount <= 0.0f)
    return 0.0f;

  const CombatRules &rules = g_runtime.rules;
  bool invulnerable = is_invulnerable(target);
  if (invulnerable && rules.invulnerability_blocks_damage)
    return 0.0f;

  float dmg = amount;
  if (target.has<Armor>()) {
    const Armor &armor = target.get<Armor>();
    if (armor.shield_active)
      dmg = std::round(dmg * rules.shield_factor);
    if (armor.stealth_active)
      dmg = std::round(dmg * rules.stealth_factor);
    if (armor.armor_bonus > 0.0f)
      dmg = std::round(dmg * (1.0f - armor.armor_bonus));
  }

  Health &h = target.get_mut<Health>();
  h.current = std::max(0.0f, h.current - dmg);

  Vec3 pos = {0.0f, 0.0f, 0.0f};
  target_position(target, pos);

  try {
    if (target.has<LocalPlayer>()) {
      hud().set_health(h.current, h.max);
      // Invulnerability is advisory: the window only mutes feedback.
      if (attacker_pos && !invulnerable)
        hud().show_damage(dmg, *attacker_pos);
    }
    sound().play_hit(pos, dmg);
    if (target.has<ExternalId>())
      damage_sink().on_damage(target.get<ExternalId>().id, dmg);
  } catch (const std::exception &ex) {
    log_error_throttled("damage_sinks", "[Damage] sink failed: ", ex.what());
  }

  if (h.current <= 0.0f)
    kill_vehicle(target);
  return dmg;
}

void heal(flecs::entity target, float amount) {
  if (!is_live_target(target) || !(amount > 0.0f))
    return;
  Health &h = target.get_mut<Health>();
  h.current = std::min(h.max, h.current + amount);
  if (target.has<LocalPlayer>())
    hud().set_health(h.current, h.max);
}

void add_fuel(flecs::entity vehicle, float amount) {
  if (!vehicle.is_valid() || !vehicle.is_alive() || !vehicle.has<Fuel>())
    return;
  if (!(amount > 0.0f))
    return;
  Fuel &f = vehicle.get_mut<Fuel>();
  f.current = std::min(f.max, f.current + amount);
  if (f.current > 0.0f)
    f.empty = false;
  if (vehicle.has<LocalPlayer>())
    hud().set_fuel(f.current, f.max);
}

void set_armor_bonus(flecs::entity vehicle, float bonus) {
  if (!vehicle.is_valid() || !vehicle.is_alive() || !vehicle.has<Armor>())
    return;
  vehicle.get_mut<Armor>().armor_bonus = clampf(bonus, 0.0f, 1.0f);
}

void set_invulnerable(flecs::entity vehicle, float duration_ms) {
  if (!vehicle.is_valid() || !vehicle.is_alive() ||
      !vehicle.has<Invulnerability>())
    return;
  Invulnerability &inv = vehicle.get_mut<Invulnerability>();
  g_runtime.timers.cancel(inv.timer);
  inv.active = true;
  inv.expires_ms = g_runtime.now_ms + duration_ms;
  inv.timer = g_runtime.timers.schedule(
      g_runtime.now_ms, duration_ms, vehicle, [](flecs::entity owner) {
        Invulnerability &i = owner.get_mut<Invulnerability>();
        i.active = false;
        i.timer.id = 0;
      });
}

static void zero_body_velocity(DynamicsBody *body) {
  if (!body || !body->is_valid())
    return;
  body->set_linear_velocity({0.0f, 0.0f, 0.0f});
  body->set_angular_velocity({0.0f, 0.0f, 0.0f});
}

void kill_vehicle(flecs::entity vehicle) {
  if (!vehicle.is_valid() || !vehicle.is_alive() || !vehicle.has<IsAlive>())
    return;

  Vec3 pos = {0.0f, 0.0f, 0.0f};
  target_position(vehicle, pos);

  vehicle.remove<IsAlive>();
  if (vehicle.has<Health>())
    vehicle.get_mut<Health>().current = 0.0f;

  try {
    fx().create_explosion(pos, 5.0f);
    sound().play_explosion(pos);
    if (vehicle.has<ExternalId>())
      damage_sink().on_death(vehicle.get<ExternalId>().id);
  } catch (const std::exception &ex) {
    log_error_throttled("death_sinks", "[Death] sink failed: ", ex.what());
  }

  // Turrets and proxies stop here: no body, no respawn.
  if (!vehicle.has<Vehicle>())
    return;

  // Everything scheduled for this life is void from here on.
  vehicle.get_mut<LifeId>().generation++;
  WeaponState &ws = vehicle.get_mut<WeaponState>();
  g_runtime.timers.cancel(ws.reload_timer);
  ws.reloading = false;
  Invulnerability &inv = vehicle.get_mut<Invulnerability>();
  g_runtime.timers.cancel(inv.timer);
  inv.active = false;
  reset_modules(vehicle);

  vehicle.get_mut<DriveInput>() = {0.0f, 0.0f, 0.0f, 0.0f};
  DriveState &ds = vehicle.get_mut<DriveState>();
  ds.smooth_throttle = 0.0f;
  ds.smooth_steer = 0.0f;
  ds.turret_smooth = 0.0f;
  ds.turret_accel = 0.0f;
  ds.turret_hold_time = 0.0f;

  try {
    zero_body_velocity(vehicle.get<BodyLink>().body);
  } catch (const std::exception &ex) {
    log_error_throttled("death_body", "[Death] body reset failed: ",
                        ex.what());
  }

  RespawnState &rs = vehicle.get_mut<RespawnState>();
  rs.phase = RESPAWN_DEAD_COUNTDOWN;
  rs.restore_vitals = true;
  rs.countdown_ms = g_runtime.rules.respawn_delay_ms;
  rs.hold_ticks = 0;

  if (vehicle.has<LocalPlayer>()) {
    hud().set_health(0.0f, vehicle.get<Health>().max);
    chat().combat("Vehicle destroyed. Respawning...");
  }
  log_info("[HoverTank] Vehicle ", vehicle.id(), " destroyed");
}

void force_reset(flecs::entity vehicle) {
  if (!vehicle.is_valid() || !vehicle.is_alive() ||
      !vehicle.has<RespawnState>())
    return;
  RespawnState &rs = vehicle.get_mut<RespawnState>();
  if (rs.phase != RESPAWN_ALIVE)
    return;

  const RecoveryState &rec = vehicle.get<RecoveryState>();
  rs.phase = RESPAWN_TELEPORT;
  rs.restore_vitals = false;
  rs.hold_ticks = 0;
  rs.target_pos = rec.has_valid_pose ? rec.last_valid_pos
                                     : g_runtime.rules.default_spawn;
  rs.target_yaw = rec.has_valid_pose ? rec.last_valid_yaw : 0.0f;

  DriveState &ds = vehicle.get_mut<DriveState>();
  ds.smooth_throttle = 0.0f;
  ds.smooth_steer = 0.0f;

  log_warn("[Recovery] Vehicle ", vehicle.id(), " reset to (",
           rs.target_pos.x, ", ", rs.target_pos.y, ", ", rs.target_pos.z,
           ")");
}

// Restore the baseline loadout at the end of the respawn sequence.
static void complete_respawn(flecs::entity e, const RespawnState &rs) {
  const CombatRules &rules = g_runtime.rules;

  e.get_mut<LifeId>().generation++;

  Health &h = e.get_mut<Health>();
  h.current = h.max;
  Fuel &f = e.get_mut<Fuel>();
  f.current = f.max;
  f.empty = false;

  WeaponState &ws = e.get_mut<WeaponState>();
  g_runtime.timers.cancel(ws.reload_timer);
  ws.reloading = false;
  ws.last_shot_ms = -1e12;
  ws.cooldown_ms = ws.base_cooldown_ms;
  ws.recoil_offset = 0.0f;
  ws.tracer_count = (uint8_t)rules.tracer_ammo;

  reset_modules(e);

  e.get_mut<DriveInput>() = {0.0f, 0.0f, 0.0f, 0.0f};
  DriveState &ds = e.get_mut<DriveState>();
  ds = DriveState{};
  ds.ground_y = rs.target_pos.y - e.get<VehicleStats>().ride_height;

  RecoveryState &rec = e.get_mut<RecoveryState>();
  rec.grace_ms = 0.0f;
  rec.last_valid_pos = rs.target_pos;
  rec.last_valid_yaw = rs.target_yaw;
  rec.has_valid_pose = true;

  e.add<IsAlive>();
  set_invulnerable(e, rules.invulnerability_ms);

  if (e.has<LocalPlayer>()) {
    hud().set_health(h.current, h.max);
    hud().set_fuel(f.current, f.max);
    hud().set_respawn_countdown(0.0f);
    chat().success("Respawned");
  }
  log_info("[HoverTank] Vehicle ", e.id(), " respawned");
}

// ═════════════════════════════════════════════════════════════
// Systems
// ═════════════════════════════════════════════════════════════

void register_vitals_systems(flecs::world &ecs) {

  // ── System 1: Body Snapshot (PreUpdate) ─────────────────────
  // Reads what the physics engine resolved on the previous step. Every
  // controller system works on this copy; nothing reads the body twice.
  // A non-finite velocity is zeroed at the source and the vehicle sits
  // out the tick.
  ecs.system<const BodyLink, BodyState, const VehicleStats>("BodySnapshot")
      .kind(flecs::PreUpdate)
      .each([](flecs::entity e, const BodyLink &link, BodyState &bs,
               const VehicleStats &stats) {
        bs.valid = false;
        if (!link.body)
          return;
        try {
          if (!link.body->is_valid())
            return;
          Vec3 lin = link.body->linear_velocity();
          Vec3 ang = link.body->angular_velocity();
          if (!is_finite(lin) || !is_finite(ang)) {
            link.body->set_linear_velocity({0.0f, 0.0f, 0.0f});
            link.body->set_angular_velocity({0.0f, 0.0f, 0.0f});
            log_error_throttled("nan_velocity", "[BodySnapshot] vehicle ",
                                e.id(), " had non-finite velocity, zeroed");
            return;
          }
          Vec3 pos = link.body->position();
          Quat rot = link.body->orientation();
          if (!is_finite(pos) || !is_finite(rot.w) || !is_finite(rot.x) ||
              !is_finite(rot.y) || !is_finite(rot.z))
            return;
          bs.pos = pos;
          bs.rot = rot;
          bs.lin_vel = lin;
          bs.ang_vel = ang;
          float m = link.body->mass();
          bs.mass = (m > 0.0f && is_finite(m)) ? m : stats.mass;
          bs.valid = true;
        } catch (const std::exception &ex) {
          log_error_throttled("snapshot", "[BodySnapshot] ", ex.what());
        }
      });

  // ── System 2: Respawn State Machine (PreUpdate) ─────────────
  // DEAD_COUNTDOWN → TELEPORT → HOLD_KINEMATIC (N ticks) → RELEASE.
  // Tick counts, not wall-clock timers: the body is re-pinned every
  // hold tick until the engine has settled the teleport.
  ecs.system<RespawnState, const BodyLink>("RespawnStateMachine")
      .kind(flecs::PreUpdate)
      .each([](flecs::entity e, RespawnState &rs, const BodyLink &link) {
        if (rs.phase == RESPAWN_ALIVE)
          return;
        float dt = e.world().delta_time();
        const CombatRules &rules = g_runtime.rules;
        DynamicsBody *body = link.body;

        try {
          bool body_ok = body && body->is_valid();
          switch (rs.phase) {
          case RESPAWN_DEAD_COUNTDOWN: {
            rs.countdown_ms -= dt * 1000.0f;
            if (e.has<LocalPlayer>())
              hud().set_respawn_countdown(
                  std::max(0.0f, rs.countdown_ms / 1000.0f));
            if (rs.countdown_ms > 0.0f)
              return;
            Vec3 pos = rules.default_spawn;
            Quat rot = QUAT_IDENTITY;
            if (g_runtime.io.respawn && g_runtime.io.respawn(pos, rot)) {
              rs.target_pos = pos;
              rs.target_yaw = yaw_of(local_forward(rot));
            } else {
              rs.target_pos = rules.default_spawn;
              rs.target_yaw = 0.0f;
            }
            rs.phase = RESPAWN_TELEPORT;
            break;
          }
          case RESPAWN_TELEPORT:
            if (body_ok) {
              body->set_motion_type(MOTION_KINEMATIC);
              body->set_target_transform(rs.target_pos,
                                         quat_from_yaw(rs.target_yaw));
              zero_body_velocity(body);
            }
            rs.hold_ticks = rules.respawn_hold_ticks;
            rs.phase = RESPAWN_HOLD_KINEMATIC;
            break;
          case RESPAWN_HOLD_KINEMATIC:
            if (body_ok) {
              body->set_target_transform(rs.target_pos,
                                         quat_from_yaw(rs.target_yaw));
              zero_body_velocity(body);
            }
            if (--rs.hold_ticks <= 0)
              rs.phase = RESPAWN_RELEASE;
            break;
          case RESPAWN_RELEASE:
            if (body_ok) {
              body->set_motion_type(MOTION_DYNAMIC);
              zero_body_velocity(body);
            }
            if (rs.restore_vitals)
              complete_respawn(e, rs);
            rs.phase = RESPAWN_ALIVE;
            break;
          default:
            break;
          }
        } catch (const std::exception &ex) {
          log_error_throttled("respawn", "[Respawn] ", ex.what());
        }
      });

  // ── System 3: Fuel Drain ────────────────────────────────────
  // Proportional to time spent with drive input. Empty fuel gates the
  // drive smoothing in DriveSystem until add_fuel().
  ecs.system<Fuel, const DriveInput>("FuelDrain")
      .with<IsAlive>()
      .each([](flecs::entity e, Fuel &f, const DriveInput &in) {
        float dt = e.world().delta_time();
        if (dt <= 0.0f)
          return;
        if (std::fabs(in.throttle) <= 0.1f && std::fabs(in.steer) <= 0.1f)
          return;
        if (f.empty)
          return;
        f.current -= f.rate * dt;
        if (f.current <= 0.0f) {
          f.current = 0.0f;
          f.empty = true;
          if (e.has<LocalPlayer>())
            chat().log("Out of fuel");
        }
        if (e.has<LocalPlayer>())
          hud().set_fuel(f.current, f.max);
      });

  // ── System 4: Force Flush (PostUpdate) ──────────────────────
  // One apply_force, one apply_torque, one impulse pair per body per
  // tick. A channel that came out non-finite is dropped on its own.
  ecs.system<const BodyLink, const BodyState, ForceAccumulator>("ForceFlush")
      .kind(flecs::PostUpdate)
      .each([](flecs::entity e, const BodyLink &link, const BodyState &bs,
               ForceAccumulator &acc) {
        ForceAccumulator pending = acc;
        acc = ForceAccumulator{};
        if (!bs.valid || !link.body)
          return;

        Vec3 force = {0.0f, 0.0f, 0.0f};
        Vec3 torque = {0.0f, 0.0f, 0.0f};
        int dropped = 0;
        auto add = [&dropped](Vec3 &sum, const Vec3 &channel) {
          if (is_finite(channel))
            sum += channel;
          else
            dropped++;
        };
        add(force, pending.vertical);
        add(force, pending.planar);
        add(torque, pending.correction_torque);
        add(torque, pending.yaw_torque);
        Vec3 impulse = {0.0f, 0.0f, 0.0f};
        Vec3 ang_impulse = {0.0f, 0.0f, 0.0f};
        add(impulse, pending.impulse);
        add(ang_impulse, pending.angular_impulse);
        if (dropped > 0)
          log_error_throttled("flush_nan", "[ForceFlush] vehicle ", e.id(),
                              ": dropped ", dropped, " non-finite channel(s)");

        try {
          if (!link.body->is_valid())
            return;
          if (length_sq(force) > 0.0f)
            link.body->apply_force(force, bs.pos);
          if (length_sq(torque) > 0.0f)
            link.body->apply_torque(torque);
          if (length_sq(impulse) > 0.0f)
            link.body->apply_impulse(impulse, bs.pos);
          if (length_sq(ang_impulse) > 0.0f)
            link.body->apply_angular_impulse(ang_impulse);
        } catch (const std::exception &ex) {
          log_error_throttled("flush", "[ForceFlush] ", ex.what());
        }
      });

  // ── System 5: Tracer Mark Expiry ────────────────────────────
  ecs.system<const Marked>("MarkExpiry").each([](flecs::entity e,
                                                 const Marked &m) {
    if (g_runtime.now_ms >= m.expires_ms)
      e.remove<Marked>();
  });
}

void register_all_systems(flecs::world &ecs) {
  register_vitals_systems(ecs);
  register_locomotion_systems(ecs);
  register_module_systems(ecs);
  register_weapon_systems(ecs);
}

} // namespace hovertank
