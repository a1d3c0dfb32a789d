#include "hovertank_components.h"
#include "hovertank_systems.h"
#include "sim_runtime.h"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <vector>

namespace hovertank {

// ═════════════════════════════════════════════════════════════
// Weapon tables
// ═════════════════════════════════════════════════════════════

static const char *const ARCHETYPE_NAMES[ARCH_COUNT] = {
    "standard", "piercing",   "explosive", "homing",
    "chain",    "multi_shot", "split",     "beam"};

const char *archetype_name(Archetype archetype) {
  if (archetype >= ARCH_COUNT)
    return "standard";
  return ARCHETYPE_NAMES[archetype];
}

bool archetype_from_name(const std::string &name, Archetype &out) {
  for (int i = 0; i < ARCH_COUNT; i++) {
    if (name == ARCHETYPE_NAMES[i]) {
      out = (Archetype)i;
      return true;
    }
  }
  return false;
}

void set_weapon_id(WeaponStats &stats, const std::string &id) {
  std::memset(stats.weapon_id, 0, sizeof(stats.weapon_id));
  std::strncpy(stats.weapon_id, id.c_str(), sizeof(stats.weapon_id) - 1);
}

WeaponStats default_weapon_stats(Archetype archetype) {
  WeaponStats w;
  std::memset(&w, 0, sizeof(w));
  w.archetype = archetype;
  w.damage = 25.0f;
  w.cooldown_ms = 2000.0f;
  w.projectile_speed = 200.0f;
  w.barrel_length = 2.1f;
  w.recoil_force = 2500.0f;
  w.recoil_torque = 10000.0f;
  w.gravity = 0.0f;
  w.ttl_ms = 6000.0f;
  w.explosion_radius = 6.0f;
  w.chain_range = 15.0f;
  w.chain_max_targets = 3;
  w.homing_strength = 0.15f;
  w.homing_range = 50.0f;
  w.pellet_count = 5;
  w.spread = 0.3f;
  w.pellet_damage_frac = 0.4f;
  w.split_distance = 20.0f;
  w.split_count = 4;
  w.split_damage_frac = 0.6f;
  w.beam_range = 50.0f;
  w.beam_heal = 15.0f;

  switch (archetype) {
  case ARCH_PIERCING:
    set_weapon_id(w, "railgun");
    w.damage = 60.0f;
    w.cooldown_ms = 5000.0f;
    w.projectile_speed = 500.0f;
    w.barrel_length = 3.5f;
    break;
  case ARCH_EXPLOSIVE:
    set_weapon_id(w, "rocket");
    w.damage = 45.0f;
    w.cooldown_ms = 3000.0f;
    w.projectile_speed = 150.0f;
    w.explosion_radius = 8.0f;
    break;
  case ARCH_HOMING:
    set_weapon_id(w, "homing");
    w.damage = 30.0f;
    w.cooldown_ms = 2500.0f;
    w.projectile_speed = 120.0f;
    break;
  case ARCH_CHAIN:
    set_weapon_id(w, "tesla");
    w.damage = 20.0f;
    w.cooldown_ms = 1800.0f;
    w.projectile_speed = 190.0f;
    w.barrel_length = 1.8f;
    break;
  case ARCH_MULTI_SHOT:
    set_weapon_id(w, "shotgun");
    w.damage = 40.0f;
    w.cooldown_ms = 2500.0f;
    w.projectile_speed = 160.0f;
    w.barrel_length = 1.7f;
    break;
  case ARCH_SPLIT:
    set_weapon_id(w, "cluster");
    w.damage = 25.0f;
    w.cooldown_ms = 2800.0f;
    w.projectile_speed = 170.0f;
    break;
  case ARCH_BEAM:
    set_weapon_id(w, "laser");
    w.damage = 30.0f;
    w.cooldown_ms = 1500.0f;
    w.projectile_speed = 400.0f;
    w.barrel_length = 2.8f;
    break;
  default:
    set_weapon_id(w, "standard");
    break;
  }
  return w;
}

// ═════════════════════════════════════════════════════════════
// Aim / muzzle
// ═════════════════════════════════════════════════════════════

Vec3 aim_direction(const BodyState &body, const DriveState &drive,
                   float aim_pitch) {
  constexpr float MIN_PITCH = -PI / 3.0f;
  constexpr float MAX_PITCH = PI / 6.0f;

  float pitch = clampf(is_finite(aim_pitch) ? aim_pitch : 0.0f, MIN_PITCH,
                       MAX_PITCH);
  float yaw = yaw_of(local_forward(body.rot)) + drive.turret_yaw;
  Vec3 flat = {std::sin(yaw), 0.0f, std::cos(yaw)};
  return normalize(flat * std::cos(pitch) + WORLD_UP * std::sin(pitch));
}

Vec3 muzzle_position(const BodyState &body, const Vec3 &dir,
                     float barrel_length) {
  constexpr float BARREL_PIVOT_HEIGHT = 0.9f;
  Vec3 pivot = body.pos + local_up(body.rot) * BARREL_PIVOT_HEIGHT;
  return pivot + dir * (barrel_length * 0.5f);
}

// Horizontal right of a travel direction (falls back to +X when vertical).
static Vec3 right_of(const Vec3 &dir) {
  Vec3 r = normalize(cross(WORLD_UP, dir));
  if (length_sq(r) == 0.0f)
    return {1.0f, 0.0f, 0.0f};
  return r;
}

// ═════════════════════════════════════════════════════════════
// Projectile lifecycle
// ═════════════════════════════════════════════════════════════

bool dispose_projectile(flecs::entity projectile) {
  if (!projectile.is_valid() || !projectile.is_alive() ||
      !projectile.has<Projectile>())
    return false;
  Projectile &p = projectile.get_mut<Projectile>();
  if (!p.alive)
    return false;
  p.alive = false;
  projectile.destruct();
  return true;
}

static flecs::entity spawn_projectile(flecs::world &w, flecs::entity owner,
                                      const WeaponStats &ws, const Vec3 &pos,
                                      const Vec3 &vel, float damage,
                                      Archetype archetype, bool tracer) {
  const CombatRules &rules = g_runtime.rules;
  double now = g_runtime.now_ms;

  Projectile p;
  std::memset(&p, 0, sizeof(p));
  p.pos = pos;
  p.prev_pos = pos;
  p.vel = vel;
  p.damage = damage;
  p.gravity = ws.gravity;
  p.owner = owner.id();
  p.last_hit = 0;
  p.spawn_ms = now;
  p.split_at_ms = 0.0;
  p.ttl_ms = ws.ttl_ms > 0.0f ? ws.ttl_ms : rules.projectile_ttl_ms;
  p.archetype = archetype;
  p.team = owner.has<TeamId>() ? owner.get<TeamId>().team : 0;
  p.tracer = tracer;
  p.alive = true;

  switch (archetype) {
  case ARCH_EXPLOSIVE:
    p.effect_radius = ws.explosion_radius;
    break;
  case ARCH_CHAIN:
    p.effect_radius = ws.chain_range;
    p.effect_count = (uint8_t)std::max(1, std::min(ws.chain_max_targets, 255));
    break;
  case ARCH_HOMING:
    p.effect_radius = ws.homing_range;
    p.effect_strength = ws.homing_strength;
    break;
  case ARCH_SPLIT: {
    float speed = length(vel);
    if (speed > 0.0f)
      p.split_at_ms = now + (double)(ws.split_distance / speed) * 1000.0;
    p.effect_strength = ws.split_damage_frac;
    p.effect_count = (uint8_t)std::max(0, std::min(ws.split_count, 255));
    break;
  }
  default:
    break;
  }

  return w.entity().set<Projectile>(p);
}

// ═════════════════════════════════════════════════════════════
// Hit application
// ═════════════════════════════════════════════════════════════

static flecs::entity owner_entity(flecs::world &w, uint64_t owner_id) {
  if (owner_id == 0)
    return flecs::entity::null();
  flecs::entity owner = w.entity(owner_id);
  if (!owner.is_alive())
    return flecs::entity::null();
  return owner;
}

// Damage through the damage model plus the shooter-side feedback.
static float apply_hit(flecs::world &w, flecs::entity target, float damage,
                       uint64_t owner_id, const Vec3 &from) {
  float dealt = take_damage(target, damage, &from);
  if (dealt <= 0.0f)
    return 0.0f;

  flecs::entity owner = owner_entity(w, owner_id);
  if (owner.is_valid() && owner.has<LocalPlayer>()) {
    try {
      hud().show_hit_marker(dealt);
      progression().record_damage_dealt(dealt);
      if (!is_live_target(target))
        progression().record_kill();
    } catch (const std::exception &ex) {
      log_error_throttled("hit_sinks", "[Hit] sink failed: ", ex.what());
    }
  }
  return dealt;
}

// Every live enemy within radius, damage falling off linearly to 50% at
// the rim. Victims are collected first; kills restructure the world.
static void detonate(flecs::world &w, const Vec3 &at, float radius,
                     float damage, uint64_t owner_id, uint8_t team) {
  try {
    fx().create_explosion(at, radius);
    sound().play_explosion(at);
  } catch (const std::exception &ex) {
    log_error_throttled("explosion_fx", "[Explosion] ", ex.what());
  }
  if (radius <= 0.0f)
    return;

  std::vector<std::pair<flecs::entity, float>> victims;
  w.each([&](flecs::entity t, const Targetable &, const TeamId &tt) {
    if (tt.team == team || t.id() == owner_id || !is_live_target(t))
      return;
    Vec3 p;
    if (!target_position(t, p))
      return;
    float d = distance(p, at);
    if (d <= radius)
      victims.push_back({t, d});
  });

  for (const auto &v : victims) {
    float mult = 1.0f - (v.second / radius) * 0.5f;
    apply_hit(w, v.first, std::round(damage * mult), owner_id, at);
  }
}

// First hop is the struck target; each further hop jumps to the nearest
// enemy not yet hit within range of the previous one, at 70% damage.
static void chain_from(flecs::world &w, flecs::entity first, float damage,
                       float range, int max_targets, uint64_t owner_id,
                       uint8_t team, const Vec3 &from) {
  std::vector<flecs::entity_t> hit;
  flecs::entity current = first;
  Vec3 prev_pos = from;
  float dmg = damage;

  for (int i = 0; i < max_targets && current.is_valid(); i++) {
    Vec3 pos;
    if (!target_position(current, pos))
      break;
    apply_hit(w, current, dmg, owner_id, prev_pos);
    hit.push_back(current.id());
    if (i > 0) {
      try {
        fx().create_chain_arc(prev_pos, pos);
      } catch (const std::exception &ex) {
        log_error_throttled("chain_fx", "[Chain] ", ex.what());
      }
    }
    prev_pos = pos;
    dmg = std::round(dmg * 0.7f);

    flecs::entity next = flecs::entity::null();
    float best_d2 = range * range;
    w.each([&](flecs::entity t, const Targetable &, const TeamId &tt) {
      if (tt.team == team || t.id() == owner_id)
        return;
      if (std::find(hit.begin(), hit.end(), t.id()) != hit.end())
        return;
      if (!is_live_target(t))
        return;
      Vec3 p;
      if (!target_position(t, p))
        return;
      float d2 = length_sq(p - pos);
      if (d2 <= best_d2) {
        best_d2 = d2;
        next = t;
      }
    });
    current = next;
  }
}

// Squared distance from c to segment a→b, with the segment parameter.
static float segment_dist_sq(const Vec3 &a, const Vec3 &b, const Vec3 &c,
                             float &t_out) {
  Vec3 ab = b - a;
  float len_sq = length_sq(ab);
  float t = len_sq > 0.0f ? clampf(dot(c - a, ab) / len_sq, 0.0f, 1.0f) : 0.0f;
  t_out = t;
  return length_sq(a + ab * t - c);
}

// Earliest target of the given kind crossed this tick.
static flecs::entity struck_target(flecs::world &w, const Projectile &p,
                                   TargetKind kind, float radius_override) {
  flecs::entity best = flecs::entity::null();
  float best_t = 2.0f;
  w.each([&](flecs::entity t, const Targetable &tg, const TeamId &tt) {
    if (tg.kind != kind || tt.team == p.team)
      return;
    if (t.id() == p.owner || t.id() == p.last_hit)
      return;
    if (!is_live_target(t))
      return;
    Vec3 c;
    if (!target_position(t, c))
      return;
    float r = radius_override > 0.0f ? radius_override : tg.hit_radius;
    float s;
    if (segment_dist_sq(p.prev_pos, p.pos, c, s) <= r * r && s < best_t) {
      best_t = s;
      best = t;
    }
  });
  return best;
}

// ═════════════════════════════════════════════════════════════
// Firing
// ═════════════════════════════════════════════════════════════

// Instant ray. Enemies take damage; a friendly target, or the ray
// resolving back on the firer, heals the firer.
static void fire_beam(flecs::world &w, flecs::entity v, const WeaponStats &ws,
                      const Vec3 &muzzle, const Vec3 &dir) {
  uint8_t team = v.get<TeamId>().team;
  float range = ws.beam_range;
  float geometry_dist = range;
  bool self_hit = false;

  uint64_t self = 0;
  const BodyLink &link = v.get<BodyLink>();
  if (link.body)
    self = link.body->collider_id();

  try {
    RayHit hit = scene().raycast(muzzle, dir, range, [](const RayHit &h) {
      return h.solid;
    });
    if (hit.hit) {
      geometry_dist = hit.distance;
      self_hit = self != 0 && hit.collider_id == self;
    }
  } catch (const std::exception &ex) {
    log_error_throttled("beam_ray", "[Beam] ", ex.what());
  }

  flecs::entity best = flecs::entity::null();
  float best_along = geometry_dist;
  w.each([&](flecs::entity t, const Targetable &tg, const TeamId &) {
    if (t.id() == v.id() || !is_live_target(t))
      return;
    Vec3 c;
    if (!target_position(t, c))
      return;
    float along = dot(c - muzzle, dir);
    if (along < 0.0f || along > best_along)
      return;
    if (length_sq(muzzle + dir * along - c) <= tg.hit_radius * tg.hit_radius) {
      best_along = along;
      best = t;
    }
  });

  bool heal_self = self_hit && !best.is_valid();
  if (best.is_valid()) {
    if (best.get<TeamId>().team == team)
      heal_self = true;
    else
      apply_hit(w, best, ws.damage, v.id(), muzzle);
  }

  if (heal_self) {
    const Health &h = v.get<Health>();
    float missing = h.max - h.current;
    heal(v, std::min(ws.beam_heal, missing));
  }

  try {
    fx().create_beam(muzzle, muzzle + dir * best_along, heal_self);
  } catch (const std::exception &ex) {
    log_error_throttled("beam_fx", "[Beam] ", ex.what());
  }
}

static void fire_pellets(flecs::world &w, flecs::entity v,
                         const WeaponStats &ws, const Vec3 &muzzle,
                         const Vec3 &dir) {
  int n = std::max(1, ws.pellet_count);
  Vec3 right = right_of(dir);
  for (int i = 0; i < n; i++) {
    float a = n > 1 ? ((float)i - (float)(n - 1) * 0.5f) * ws.spread /
                          (float)(n - 1)
                    : 0.0f;
    Vec3 d = normalize(dir + right * std::sin(a) + WORLD_UP * std::sin(a * 0.5f));
    spawn_projectile(w, v, ws, muzzle, d * ws.projectile_speed,
                     ws.damage * ws.pellet_damage_frac, ARCH_MULTI_SHOT,
                     false);
  }
}

FireResult fire(flecs::entity vehicle) {
  if (!vehicle.is_valid() || !vehicle.is_alive() ||
      !vehicle.has<WeaponState>() || !vehicle.has<WeaponStats>())
    return FIRE_INVALID;
  if (!vehicle.has<IsAlive>())
    return FIRE_NOT_ALIVE;

  WeaponState &st = vehicle.get_mut<WeaponState>();
  // Copied: a kill outside a system can move this row within its table.
  const WeaponStats ws = vehicle.get<WeaponStats>();
  double now = g_runtime.now_ms;

  if (st.reloading)
    return FIRE_RELOADING;
  if (now - st.last_shot_ms < st.cooldown_ms)
    return FIRE_COOLDOWN;

  const BodyState &bs = vehicle.get<BodyState>();
  if (!bs.valid)
    return FIRE_INVALID;

  const DriveState &ds = vehicle.get<DriveState>();
  float pitch = vehicle.get<DriveInput>().aim_pitch;
  Vec3 dir = aim_direction(bs, ds, pitch);
  Vec3 muzzle = muzzle_position(bs, dir, ws.barrel_length);
  if (!is_finite(dir) || !is_finite(muzzle) || length_sq(dir) == 0.0f)
    return FIRE_INVALID;

  flecs::world w = vehicle.world();

  // Barrel pressed against geometry: no shot, no cooldown.
  constexpr float BARREL_CLEARANCE = 1.5f;
  const BodyLink &link = vehicle.get<BodyLink>();
  uint64_t self = link.body ? link.body->collider_id() : 0;
  try {
    RayHit block = scene().raycast(
        muzzle, dir, BARREL_CLEARANCE, [self](const RayHit &h) {
          return h.solid && h.collider_id != self;
        });
    if (block.hit)
      return FIRE_BLOCKED;
  } catch (const std::exception &ex) {
    log_error_throttled("barrel_ray", "[Fire] barrel check: ", ex.what());
  }

  st.last_shot_ms = now;
  st.reloading = true;
  g_runtime.timers.cancel(st.reload_timer);
  st.reload_timer = g_runtime.timers.schedule(
      now, st.cooldown_ms, vehicle, [](flecs::entity owner) {
        WeaponState &s = owner.get_mut<WeaponState>();
        s.reloading = false;
        s.reload_timer.id = 0;
      });

  // Recoil: push back along the barrel and kick the nose up.
  ForceAccumulator &acc = vehicle.get_mut<ForceAccumulator>();
  acc.impulse += dir * -ws.recoil_force;
  acc.angular_impulse += local_right(bs.rot) * -ws.recoil_torque;
  st.recoil_offset = -1.6f;

  try {
    fx().create_muzzle_flash(muzzle, dir);
    sound().play_shoot(muzzle);
    if (vehicle.has<LocalPlayer>())
      progression().record_shot(ws.weapon_id);
  } catch (const std::exception &ex) {
    log_error_throttled("fire_sinks", "[Fire] sink failed: ", ex.what());
  }

  // Muzzle already inside a deployable wall: the wall eats the shot.
  constexpr float POINT_BLANK = 0.5f;
  flecs::entity wall = wall_on_segment(w, muzzle, muzzle + dir * POINT_BLANK);
  if (wall.is_valid()) {
    damage_wall(wall, ws.damage);
  } else {
    switch (ws.archetype) {
    case ARCH_BEAM:
      fire_beam(w, vehicle, ws, muzzle, dir);
      break;
    case ARCH_MULTI_SHOT:
      fire_pellets(w, vehicle, ws, muzzle, dir);
      break;
    default:
      spawn_projectile(w, vehicle, ws, muzzle, dir * ws.projectile_speed,
                       ws.damage, ws.archetype, false);
      break;
    }
  }

  if (g_runtime.io.on_shoot) {
    ShotEvent ev;
    ev.position = muzzle;
    ev.direction = dir;
    ev.aim_pitch = pitch;
    ev.damage = ws.damage;
    ev.weapon_id = ws.weapon_id;
    ev.timestamp_ms = now;
    try {
      g_runtime.io.on_shoot(ev);
    } catch (const std::exception &ex) {
      log_error_throttled("on_shoot", "[Fire] shoot callback: ", ex.what());
    }
  }
  return FIRE_OK;
}

FireResult fire_tracer(flecs::entity vehicle) {
  if (!vehicle.is_valid() || !vehicle.is_alive() ||
      !vehicle.has<WeaponState>() || !vehicle.has<WeaponStats>())
    return FIRE_INVALID;
  if (!vehicle.has<IsAlive>())
    return FIRE_NOT_ALIVE;

  const CombatRules &rules = g_runtime.rules;
  WeaponState &st = vehicle.get_mut<WeaponState>();
  double now = g_runtime.now_ms;
  if (st.tracer_count == 0)
    return FIRE_NO_AMMO;
  if (now - st.last_tracer_ms < rules.tracer_cooldown_ms)
    return FIRE_COOLDOWN;

  const BodyState &bs = vehicle.get<BodyState>();
  if (!bs.valid)
    return FIRE_INVALID;
  const WeaponStats &ws = vehicle.get<WeaponStats>();
  Vec3 dir = aim_direction(bs, vehicle.get<DriveState>(),
                           vehicle.get<DriveInput>().aim_pitch);
  Vec3 muzzle = muzzle_position(bs, dir, ws.barrel_length);

  st.tracer_count--;
  st.last_tracer_ms = now;

  flecs::world w = vehicle.world();
  spawn_projectile(w, vehicle, ws, muzzle, dir * ws.projectile_speed,
                   rules.tracer_damage, ARCH_STANDARD, true);
  try {
    fx().create_muzzle_flash(muzzle, dir);
    sound().play_shoot(muzzle);
  } catch (const std::exception &ex) {
    log_error_throttled("fire_sinks", "[Tracer] sink failed: ", ex.what());
  }
  return FIRE_OK;
}

// ═════════════════════════════════════════════════════════════
// Flight helpers
// ═════════════════════════════════════════════════════════════

static void split_projectile(flecs::world &w, const Projectile &p) {
  float speed = length(p.vel);
  Vec3 dir = normalize(p.vel);
  if (speed <= 0.0f || length_sq(dir) == 0.0f)
    return;
  Vec3 right = right_of(dir);
  Vec3 up = normalize(cross(dir, right));
  int n = p.effect_count;

  for (int i = 0; i < n; i++) {
    float a = (float)i * 2.0f * PI / (float)n;
    Vec3 d = normalize(dir + right * (std::cos(a) * 0.2f) +
                       up * (std::sin(a) * 0.2f));
    Projectile c = p;
    c.prev_pos = p.pos;
    c.vel = d * speed;
    c.damage = std::round(p.damage * p.effect_strength);
    c.archetype = ARCH_STANDARD;
    c.split_at_ms = 0.0;
    c.effect_count = 0;
    c.effect_strength = 0.0f;
    c.ricochets = 0;
    c.last_hit = 0;
    c.spawn_ms = g_runtime.now_ms;
    c.alive = true;
    w.entity().set<Projectile>(c);
  }
}

static void steer_homing(flecs::world &w, Projectile &p) {
  flecs::entity target =
      nearest_enemy(w, p.pos, p.team, p.effect_radius, p.owner);
  if (!target.is_valid())
    return;
  Vec3 tp;
  if (!target_position(target, tp))
    return;
  float speed = length(p.vel);
  Vec3 to = normalize(tp - p.pos);
  Vec3 d = normalize(normalize(p.vel) + to * p.effect_strength);
  if (length_sq(d) > 0.0f)
    p.vel = d * speed;
}

static bool can_ricochet(const Projectile &p, const CombatRules &rules) {
  return p.ricochets < rules.max_ricochets &&
         length(p.vel) > rules.ricochet_min_speed;
}

static void hit_spark(const Vec3 &at) {
  try {
    fx().create_hit_spark(at);
  } catch (const std::exception &ex) {
    log_error_throttled("hit_fx", "[Hit] ", ex.what());
  }
}

// Resolves a struck target. Returns true when the projectile is spent.
static bool resolve_target_hit(flecs::world &w, Projectile &p,
                               flecs::entity target) {
  const CombatRules &rules = g_runtime.rules;
  Vec3 at = p.pos;
  target_position(target, at);
  hit_spark(at);

  if (p.tracer) {
    apply_hit(w, target, p.damage, p.owner, p.prev_pos);
    if (is_live_target(target))
      target.set<Marked>({g_runtime.now_ms + rules.tracer_mark_ms});
    return true;
  }

  switch (p.archetype) {
  case ARCH_PIERCING:
    apply_hit(w, target, p.damage, p.owner, p.prev_pos);
    p.last_hit = target.id();
    p.damage = std::max(p.damage * 0.7f, 5.0f);
    return false;
  case ARCH_EXPLOSIVE:
    detonate(w, p.pos, p.effect_radius, p.damage, p.owner, p.team);
    return true;
  case ARCH_CHAIN:
    chain_from(w, target, p.damage, p.effect_radius, p.effect_count, p.owner,
               p.team, p.prev_pos);
    return true;
  default:
    apply_hit(w, target, p.damage, p.owner, p.prev_pos);
    return true;
  }
}

static void fly_projectile(flecs::entity e, Projectile &p) {
  if (!p.alive)
    return;
  float dt = e.world().delta_time();
  if (dt <= 0.0f)
    return;

  flecs::world w = e.world();
  const CombatRules &rules = g_runtime.rules;
  double now = g_runtime.now_ms;

  // 1. Integrate
  p.prev_pos = p.pos;
  if (p.gravity != 0.0f)
    p.vel.y -= p.gravity * dt;
  p.pos += p.vel * dt;
  if (!is_finite(p.pos) || !is_finite(p.vel)) {
    dispose_projectile(e);
    return;
  }

  // 2. Split
  if (p.archetype == ARCH_SPLIT && p.split_at_ms > 0.0 &&
      now >= p.split_at_ms) {
    split_projectile(w, p);
    dispose_projectile(e);
    return;
  }

  // 3. Deployable walls
  flecs::entity wall = wall_on_segment(w, p.prev_pos, p.pos);
  if (wall.is_valid()) {
    damage_wall(wall, p.damage);
    if (p.archetype == ARCH_EXPLOSIVE)
      detonate(w, p.pos, p.effect_radius, p.damage, p.owner, p.team);
    else
      hit_spark(p.pos);
    dispose_projectile(e);
    return;
  }

  // 4. Homing
  if (p.archetype == ARCH_HOMING)
    steer_homing(w, p);

  // 5. Turrets, then vehicles
  float radius = p.tracer ? rules.tracer_hit_radius : 0.0f;
  const TargetKind order[2] = {TARGET_TURRET, TARGET_VEHICLE};
  for (TargetKind kind : order) {
    flecs::entity target = struck_target(w, p, kind, radius);
    if (!target.is_valid())
      continue;
    if (resolve_target_hit(w, p, target)) {
      dispose_projectile(e);
      return;
    }
    break;
  }

  // 6. Ground ricochet
  if (p.pos.y < rules.ground_ricochet_y) {
    Vec3 dir = normalize(p.vel);
    bool shallow =
        std::fabs(dot(dir, WORLD_UP)) < rules.ricochet_max_incidence;
    if (shallow && can_ricochet(p, rules)) {
      p.vel = reflect(p.vel, WORLD_UP) * rules.ricochet_speed_keep;
      p.pos.y = rules.ricochet_reset_y;
      p.ricochets++;
      hit_spark(p.pos);
    } else if (p.archetype == ARCH_EXPLOSIVE) {
      detonate(w, p.pos, p.effect_radius, p.damage, p.owner, p.team);
      dispose_projectile(e);
      return;
    }
  }

  // 7. Map border
  Vec3 n = {0.0f, 0.0f, 0.0f};
  if (p.pos.x > rules.map_border)
    n.x = -1.0f;
  else if (p.pos.x < -rules.map_border)
    n.x = 1.0f;
  if (p.pos.z > rules.map_border)
    n.z = -1.0f;
  else if (p.pos.z < -rules.map_border)
    n.z = 1.0f;
  if (length_sq(n) > 0.0f && can_ricochet(p, rules)) {
    n = normalize(n);
    p.vel = reflect(p.vel, n) * rules.ricochet_speed_keep;
    p.pos.x = clampf(p.pos.x, -rules.map_border, rules.map_border);
    p.pos.z = clampf(p.pos.z, -rules.map_border, rules.map_border);
    p.ricochets++;
  }

  // 8. Bounds
  if (p.pos.y < rules.dispose_y_min || p.pos.y > rules.dispose_y_max ||
      std::fabs(p.pos.x) > rules.dispose_xz ||
      std::fabs(p.pos.z) > rules.dispose_xz) {
    dispose_projectile(e);
    return;
  }

  // 9. TTL
  if (now - p.spawn_ms >= p.ttl_ms)
    dispose_projectile(e);
}

void register_weapon_systems(flecs::world &ecs) {

  // ── System 1: Recoil Decay ──────────────────────────────────
  ecs.system<WeaponState>("RecoilDecay").each([](WeaponState &st) {
    if (st.recoil_offset == 0.0f)
      return;
    st.recoil_offset += (0.0f - st.recoil_offset) * 0.3f;
    if (std::fabs(st.recoil_offset) < 1e-3f)
      st.recoil_offset = 0.0f;
  });

  // ═════════════════════════════════════════════════════════════
  // SYSTEM 2: Projectile Flight
  //
  // Polled hit resolution, not collision callbacks: thin fast rounds
  // tunnel through engine contacts. Branch order is fixed and the
  // first branch that disposes the round ends it for the tick:
  //   integrate → split → walls → homing → turrets → vehicles →
  //   ground ricochet → border → bounds → TTL
  // ═════════════════════════════════════════════════════════════
  ecs.system<Projectile>("ProjectileFlight")
      .each([](flecs::entity e, Projectile &p) {
        try {
          fly_projectile(e, p);
        } catch (const std::exception &ex) {
          log_error_throttled("projectile", "[ProjectileFlight] ", ex.what());
        }
      });
}

} // namespace hovertank
