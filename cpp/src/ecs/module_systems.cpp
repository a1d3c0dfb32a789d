#include "hovertank_components.h"
#include "hovertank_systems.h"
#include "sim_runtime.h"
#include <algorithm>
#include <cmath>
#include <vector>

namespace hovertank {

// ═════════════════════════════════════════════════════════════
// Module table
// ═════════════════════════════════════════════════════════════

namespace {

struct ModuleDef {
  int key;
  const char *name;
  float duration_ms;
  float cooldown_ms;
};

const ModuleDef MODULE_DEFS[MODULE_COUNT] = {
    {6, "Deploy Wall", 0.0f, 10000.0f},
    {7, "Rapid Reload", 10000.0f, 15000.0f},
    {8, "Auto Aim", 10000.0f, 20000.0f},
    {9, "Evasive Maneuver", 10000.0f, 12000.0f},
    {0, "Charged Jump", 0.0f, 5000.0f},
};

constexpr float JUMP_FULL_CHARGE_MS = 10000.0f;
constexpr float JUMP_BASE_IMPULSE = 20000.0f;
constexpr float JUMP_MAX_IMPULSE = 500000.0f;
constexpr float JUMP_MAX_FALL_SPEED = -5.0f;

constexpr float AUTO_AIM_RANGE = 200.0f;
constexpr float AUTO_AIM_STEP = 0.15f;  // rad per tick
constexpr float AUTO_AIM_SNAP = 0.05f;
constexpr float AUTO_AIM_FIRE_ERR = 0.1f;

constexpr float EVASIVE_FLIP_MS = 1500.0f;
constexpr float EVASIVE_RANGE = 80.0f;
constexpr float EVASIVE_LATERAL = 10000.0f;
constexpr float EVASIVE_RETREAT = 5000.0f;

constexpr float WALL_DISTANCE = 8.0f;
constexpr float WALL_RISE_MS = 1000.0f;
constexpr float WALL_DEBRIS_MS = 1000.0f;

} // namespace

bool module_for_key(int key, ModuleKind &out) {
  for (int i = 0; i < MODULE_COUNT; i++) {
    if (MODULE_DEFS[i].key == key) {
      out = (ModuleKind)i;
      return true;
    }
  }
  return false;
}

int module_key(ModuleKind kind) {
  if (kind >= MODULE_COUNT)
    return -1;
  return MODULE_DEFS[kind].key;
}

ModuleBank default_module_bank() {
  ModuleBank bank = {};
  for (int i = 0; i < MODULE_COUNT; i++) {
    bank.slots[i].phase = MODULE_IDLE;
    bank.slots[i].duration_ms = MODULE_DEFS[i].duration_ms;
    bank.slots[i].cooldown_ms = MODULE_DEFS[i].cooldown_ms;
  }
  bank.evasive_dir = 1.0f;
  bank.auto_aim_last_fire_ms = -1e12;
  return bank;
}

// ═════════════════════════════════════════════════════════════
// Slot transitions
//
// IDLE → ACTIVE → COOLDOWN → IDLE. Each slot holds exactly one
// pending timer; every transition cancels it before scheduling the
// next, so a stale handle can never fire into a later phase.
// ═════════════════════════════════════════════════════════════

static void notify(const std::string &text) {
  try {
    chat().log(text);
  } catch (const std::exception &ex) {
    log_error_throttled("module_chat", "[Module] ", ex.what());
  }
}

static void enter_cooldown(flecs::entity v, ModuleKind kind) {
  ModuleSlot &slot = v.get_mut<ModuleBank>().slots[kind];
  double now = g_runtime.now_ms;
  g_runtime.timers.cancel(slot.timer);
  slot.phase = MODULE_COOLDOWN;
  slot.cooldown_until_ms = now + slot.cooldown_ms;
  slot.timer = g_runtime.timers.schedule(
      now, slot.cooldown_ms, v, [kind](flecs::entity owner) {
        ModuleSlot &s = owner.get_mut<ModuleBank>().slots[kind];
        s.phase = MODULE_IDLE;
        s.timer.id = 0;
        if (owner.has<LocalPlayer>())
          hud().set_module_cooldown(MODULE_DEFS[kind].key, 0.0f);
      });
  if (v.has<LocalPlayer>())
    hud().set_module_cooldown(MODULE_DEFS[kind].key, slot.cooldown_ms);
}

static void deactivate_module(flecs::entity v, ModuleKind kind) {
  ModuleBank &bank = v.get_mut<ModuleBank>();
  ModuleSlot &slot = bank.slots[kind];
  if (slot.phase != MODULE_ACTIVE)
    return;

  if (kind == MODULE_RAPID_RELOAD && v.has<WeaponState>()) {
    WeaponState &ws = v.get_mut<WeaponState>();
    ws.cooldown_ms = ws.base_cooldown_ms;
  }

  if (v.has<LocalPlayer>()) {
    hud().remove_active_effect(MODULE_DEFS[kind].name);
    notify(std::string(MODULE_DEFS[kind].name) + " ended");
  }
  enter_cooldown(v, kind);
}

static void enter_active(flecs::entity v, ModuleKind kind) {
  ModuleSlot &slot = v.get_mut<ModuleBank>().slots[kind];
  double now = g_runtime.now_ms;
  g_runtime.timers.cancel(slot.timer);
  slot.phase = MODULE_ACTIVE;
  slot.started_ms = now;
  slot.timer = g_runtime.timers.schedule(
      now, slot.duration_ms, v,
      [kind](flecs::entity owner) {
        owner.get_mut<ModuleBank>().slots[kind].timer.id = 0;
        deactivate_module(owner, kind);
      });

  if (v.has<LocalPlayer>()) {
    hud().add_active_effect(MODULE_DEFS[kind].name, slot.duration_ms);
    notify(std::string(MODULE_DEFS[kind].name) + " activated");
  }
  sound().play_module(MODULE_DEFS[kind].key);
}

// ═════════════════════════════════════════════════════════════
// Deployable walls
// ═════════════════════════════════════════════════════════════

Vec3 wall_center(const DeployableWall &wall) {
  // Rises from fully buried (centre at ground - 4) to standing
  // (centre at ground + half height).
  float buried = wall.ground_y - 4.0f;
  float standing = wall.pos.y;
  return {wall.pos.x, buried + (standing - buried) * wall.rise_t, wall.pos.z};
}

int wall_count(flecs::world &ecs, flecs::entity_t owner) {
  int count = 0;
  ecs.each([&](const DeployableWall &w) {
    if (w.owner == owner && w.phase != WALL_DEBRIS)
      count++;
  });
  return count;
}

// Liang-Barsky slab clip of a→b against the box in wall space. Returns
// the entry parameter in [0,1], or a negative value on a miss.
static float segment_box_entry(const DeployableWall &wall, const Vec3 &a,
                               const Vec3 &b) {
  Quat inv = quat_from_yaw(-wall.yaw);
  Vec3 c = wall_center(wall);
  Vec3 la = rotate(inv, a - c);
  Vec3 lb = rotate(inv, b - c);
  Vec3 d = lb - la;

  const float p0[3] = {la.x, la.y, la.z};
  const float dv[3] = {d.x, d.y, d.z};
  const float half[3] = {wall.half_w, wall.half_h, wall.half_d};
  float t0 = 0.0f, t1 = 1.0f;
  for (int i = 0; i < 3; i++) {
    if (std::fabs(dv[i]) < 1e-8f) {
      if (p0[i] < -half[i] || p0[i] > half[i])
        return -1.0f;
      continue;
    }
    float inv_d = 1.0f / dv[i];
    float ta = (-half[i] - p0[i]) * inv_d;
    float tb = (half[i] - p0[i]) * inv_d;
    if (ta > tb)
      std::swap(ta, tb);
    t0 = std::max(t0, ta);
    t1 = std::min(t1, tb);
    if (t0 > t1)
      return -1.0f;
  }
  return t0;
}

flecs::entity wall_on_segment(flecs::world &ecs, const Vec3 &a,
                              const Vec3 &b) {
  flecs::entity best = flecs::entity::null();
  float best_t = 2.0f;
  ecs.each([&](flecs::entity e, const DeployableWall &w) {
    if (w.phase == WALL_DEBRIS)
      return;
    float t = segment_box_entry(w, a, b);
    if (t >= 0.0f && t < best_t) {
      best_t = t;
      best = e;
    }
  });
  return best;
}

static void break_wall(flecs::entity wall) {
  DeployableWall &w = wall.get_mut<DeployableWall>();
  if (w.phase == WALL_DEBRIS)
    return;
  w.phase = WALL_DEBRIS;
  w.health = 0.0f;
  g_runtime.timers.cancel(w.timer);

  try {
    fx().create_wall_debris(wall_center(w), 8 + (int)(w.seq % 5));
  } catch (const std::exception &ex) {
    log_error_throttled("wall_fx", "[Wall] ", ex.what());
  }

  w.timer = g_runtime.timers.schedule(
      g_runtime.now_ms, WALL_DEBRIS_MS, wall,
      [](flecs::entity owner) { owner.destruct(); });
}

bool damage_wall(flecs::entity wall, float amount) {
  if (!wall.is_valid() || !wall.is_alive() || !wall.has<DeployableWall>())
    return false;
  if (!is_finite(amount) || amount <= 0.0f)
    return false;
  DeployableWall &w = wall.get_mut<DeployableWall>();
  if (w.phase == WALL_DEBRIS)
    return false;

  w.health = std::max(0.0f, w.health - amount);
  try {
    fx().create_hit_spark(wall_center(w));
  } catch (const std::exception &ex) {
    log_error_throttled("wall_fx", "[Wall] ", ex.what());
  }
  if (w.health > 0.0f)
    return false;
  break_wall(wall);
  return true;
}

// Retires the owner's oldest walls until there is room for one more.
static void enforce_wall_cap(flecs::world &ecs, flecs::entity_t owner) {
  int cap = std::max(1, g_runtime.rules.max_walls);
  std::vector<std::pair<uint32_t, flecs::entity>> walls;
  ecs.each([&](flecs::entity e, const DeployableWall &w) {
    if (w.owner == owner && w.phase != WALL_DEBRIS)
      walls.push_back({w.seq, e});
  });
  if ((int)walls.size() < cap)
    return;
  std::sort(walls.begin(), walls.end(),
            [](const std::pair<uint32_t, flecs::entity> &a,
               const std::pair<uint32_t, flecs::entity> &b) {
              return a.first < b.first;
            });
  int excess = (int)walls.size() - cap + 1;
  for (int i = 0; i < excess; i++) {
    flecs::entity old = walls[i].second;
    g_runtime.timers.cancel(old.get_mut<DeployableWall>().timer);
    old.destruct();
  }
}

static bool deploy_wall(flecs::entity v) {
  const BodyState &bs = v.get<BodyState>();
  if (!bs.valid)
    return false;
  const CombatRules &rules = g_runtime.rules;
  flecs::world ecs = v.world();

  Vec3 dir = aim_direction(bs, v.get<DriveState>(), 0.0f);
  Vec3 flat = normalize(Vec3{dir.x, 0.0f, dir.z});
  if (length_sq(flat) == 0.0f)
    return false;
  Vec3 muzzle = muzzle_position(bs, flat, v.get<WeaponStats>().barrel_length);
  Vec3 spot = muzzle + flat * WALL_DISTANCE;

  const BodyLink &link = v.get<BodyLink>();
  uint64_t self = link.body ? link.body->collider_id() : 0;
  float ground = 0.0f;
  try {
    RayHit hit = scene().raycast(spot + WORLD_UP * 10.0f, {0.0f, -1.0f, 0.0f},
                                 30.0f, [self](const RayHit &h) {
                                   return h.solid && h.collider_id != self;
                                 });
    if (hit.hit)
      ground = hit.point.y;
  } catch (const std::exception &ex) {
    log_error_throttled("wall_ray", "[Wall] ground ray: ", ex.what());
  }

  enforce_wall_cap(ecs, v.id());

  DeployableWall w = {};
  w.half_w = 3.0f;
  w.half_h = 2.0f;
  w.half_d = 0.25f;
  w.pos = {spot.x, ground + w.half_h, spot.z};
  w.yaw = std::atan2(flat.x, flat.z);
  w.health = rules.wall_max_health;
  w.max_health = rules.wall_max_health;
  w.ground_y = ground;
  w.rise_t = 0.0f;
  w.spawn_ms = g_runtime.now_ms;
  w.owner = v.id();
  w.seq = ++g_runtime.wall_seq;
  w.phase = WALL_RISING;

  flecs::entity wall = ecs.entity();
  w.timer = g_runtime.timers.schedule(
      g_runtime.now_ms, rules.wall_lifetime_ms, wall,
      [](flecs::entity owner) {
        owner.get_mut<DeployableWall>().timer.id = 0;
        break_wall(owner);
      });
  wall.set<DeployableWall>(w);
  return true;
}

// ═════════════════════════════════════════════════════════════
// Activation
// ═════════════════════════════════════════════════════════════

bool begin_jump_charge(flecs::entity vehicle) {
  if (!vehicle.is_valid() || !vehicle.is_alive() ||
      !vehicle.has<ModuleBank>() || !vehicle.has<IsAlive>())
    return false;
  ModuleBank &bank = vehicle.get_mut<ModuleBank>();
  ModuleSlot &slot = bank.slots[MODULE_CHARGED_JUMP];
  double now = g_runtime.now_ms;
  if (bank.jump_charging || slot.phase == MODULE_ACTIVE)
    return false;
  if (slot.phase == MODULE_COOLDOWN && now < slot.cooldown_until_ms)
    return false;
  const BodyState &bs = vehicle.get<BodyState>();
  if (!bs.valid || bs.lin_vel.y < JUMP_MAX_FALL_SPEED)
    return false;

  g_runtime.timers.cancel(slot.timer);
  slot.phase = MODULE_ACTIVE;
  slot.started_ms = now;
  bank.jump_charging = true;
  bank.jump_charge_start_ms = now;
  if (vehicle.has<LocalPlayer>())
    hud().add_active_effect(MODULE_DEFS[MODULE_CHARGED_JUMP].name,
                            JUMP_FULL_CHARGE_MS);
  return true;
}

bool release_jump_charge(flecs::entity vehicle) {
  if (!vehicle.is_valid() || !vehicle.is_alive() ||
      !vehicle.has<ModuleBank>())
    return false;
  ModuleBank &bank = vehicle.get_mut<ModuleBank>();
  if (!bank.jump_charging)
    return false;
  bank.jump_charging = false;

  float ratio = clampf(
      (float)(g_runtime.now_ms - bank.jump_charge_start_ms) /
          JUMP_FULL_CHARGE_MS,
      0.0f, 1.0f);
  float impulse =
      JUMP_BASE_IMPULSE + (JUMP_MAX_IMPULSE - JUMP_BASE_IMPULSE) * ratio;
  vehicle.get_mut<ForceAccumulator>().impulse += WORLD_UP * impulse;

  if (vehicle.has<LocalPlayer>()) {
    hud().remove_active_effect(MODULE_DEFS[MODULE_CHARGED_JUMP].name);
    notify("Jump! (" + std::to_string((int)std::round(ratio * 100.0f)) +
           "% charge)");
  }
  sound().play_module(MODULE_DEFS[MODULE_CHARGED_JUMP].key);
  enter_cooldown(vehicle, MODULE_CHARGED_JUMP);
  return true;
}

ModuleResult activate_module(flecs::entity vehicle, ModuleKind kind) {
  if (kind >= MODULE_COUNT)
    return MODULE_INVALID;
  if (!vehicle.is_valid() || !vehicle.is_alive() ||
      !vehicle.has<ModuleBank>())
    return MODULE_INVALID;
  if (!vehicle.has<IsAlive>())
    return MODULE_NOT_ALIVE;

  const ModulePhase before = vehicle.get<ModuleBank>().slots[kind].phase;
  if (before == MODULE_ACTIVE)
    return MODULE_ALREADY_ACTIVE;
  if (before == MODULE_COOLDOWN &&
      g_runtime.now_ms < vehicle.get<ModuleBank>().slots[kind].cooldown_until_ms)
    return MODULE_ON_COOLDOWN;

  try {
    switch (kind) {
    case MODULE_DEPLOY_WALL:
      if (!deploy_wall(vehicle))
        return MODULE_REFUSED;
      enter_cooldown(vehicle, kind);
      sound().play_module(MODULE_DEFS[kind].key);
      break;
    case MODULE_RAPID_RELOAD: {
      WeaponState &ws = vehicle.get_mut<WeaponState>();
      ws.cooldown_ms = ws.base_cooldown_ms * 0.5f;
      enter_active(vehicle, kind);
      break;
    }
    case MODULE_AUTO_AIM:
      enter_active(vehicle, kind);
      break;
    case MODULE_EVASIVE: {
      // Every run opens with a dodge to the right
      ModuleBank &bank = vehicle.get_mut<ModuleBank>();
      bank.evasive_dir = 1.0f;
      bank.evasive_last_flip_ms = g_runtime.now_ms;
      enter_active(vehicle, kind);
      break;
    }
    case MODULE_CHARGED_JUMP:
      if (!begin_jump_charge(vehicle))
        return MODULE_REFUSED;
      break;
    default:
      return MODULE_INVALID;
    }
  } catch (const std::exception &ex) {
    log_error_throttled("module_activate", "[Module] activation: ",
                        ex.what());
    // A slot that never left its phase did not activate.
    if (vehicle.get<ModuleBank>().slots[kind].phase == before)
      return MODULE_REFUSED;
  }
  return MODULE_ACTIVATED;
}

void reset_modules(flecs::entity vehicle) {
  if (!vehicle.is_valid() || !vehicle.is_alive() ||
      !vehicle.has<ModuleBank>())
    return;
  ModuleBank &bank = vehicle.get_mut<ModuleBank>();
  for (int i = 0; i < MODULE_COUNT; i++) {
    ModuleSlot &slot = bank.slots[i];
    g_runtime.timers.cancel(slot.timer);
    slot.phase = MODULE_IDLE;
    slot.started_ms = 0.0;
    slot.cooldown_until_ms = 0.0;
  }
  bank.jump_charging = false;
  bank.evasive_dir = 1.0f;
  bank.evasive_last_flip_ms = 0.0;

  if (vehicle.has<WeaponState>()) {
    WeaponState &ws = vehicle.get_mut<WeaponState>();
    ws.cooldown_ms = ws.base_cooldown_ms;
  }
}

// ═════════════════════════════════════════════════════════════
// Systems
// ═════════════════════════════════════════════════════════════

void register_module_systems(flecs::world &ecs) {

  // ═════════════════════════════════════════════════════════════
  // SYSTEM 1: Auto Aim
  //
  // Bounded-rate turret slew toward the nearest live enemy, snapping
  // inside a small window. Fires through the normal fire path once
  // the error is small, so cooldown and reload still apply.
  // ═════════════════════════════════════════════════════════════
  ecs.system<const ModuleBank, DriveState, const BodyState,
             const WeaponState, const TeamId>("AutoAim")
      .with<IsAlive>()
      .each([](flecs::entity e, const ModuleBank &bank, DriveState &ds,
               const BodyState &bs, const WeaponState &ws,
               const TeamId &team) {
        if (bank.slots[MODULE_AUTO_AIM].phase != MODULE_ACTIVE || !bs.valid)
          return;

        flecs::world w = e.world();
        flecs::entity target =
            nearest_enemy(w, bs.pos, team.team, AUTO_AIM_RANGE, e.id());
        if (!target.is_valid())
          return;
        Vec3 tp;
        if (!target_position(target, tp))
          return;

        Vec3 to = tp - bs.pos;
        float chassis_yaw = yaw_of(local_forward(bs.rot));
        float err = wrap_angle(yaw_of(to) - (chassis_yaw + ds.turret_yaw));
        if (std::fabs(err) < AUTO_AIM_SNAP)
          ds.turret_yaw += err;
        else
          ds.turret_yaw += clampf(err, -AUTO_AIM_STEP, AUTO_AIM_STEP);
        ds.turret_yaw = wrap_angle(ds.turret_yaw);

        float remaining =
            wrap_angle(yaw_of(to) - (chassis_yaw + ds.turret_yaw));
        if (std::fabs(remaining) < AUTO_AIM_FIRE_ERR && !ws.reloading) {
          try {
            if (fire(e) == FIRE_OK)
              e.get_mut<ModuleBank>().auto_aim_last_fire_ms = g_runtime.now_ms;
          } catch (const std::exception &ex) {
            log_error_throttled("auto_aim", "[AutoAim] ", ex.what());
          }
        }
      });

  // ═════════════════════════════════════════════════════════════
  // SYSTEM 2: Evasive Maneuver
  //
  // Lateral impulse that flips side every 1.5 s, plus a retreat
  // impulse away from the nearest enemy. Only while one is in range.
  // ═════════════════════════════════════════════════════════════
  ecs.system<ModuleBank, const BodyState, const TeamId, ForceAccumulator>(
         "EvasiveManeuver")
      .with<IsAlive>()
      .each([](flecs::entity e, ModuleBank &bank, const BodyState &bs,
               const TeamId &team, ForceAccumulator &acc) {
        if (bank.slots[MODULE_EVASIVE].phase != MODULE_ACTIVE || !bs.valid)
          return;
        float dt = e.world().delta_time();
        double now = g_runtime.now_ms;

        if (now - bank.evasive_last_flip_ms >= EVASIVE_FLIP_MS) {
          bank.evasive_dir = -bank.evasive_dir;
          bank.evasive_last_flip_ms = now;
        }

        flecs::world w = e.world();
        flecs::entity enemy =
            nearest_enemy(w, bs.pos, team.team, EVASIVE_RANGE, e.id());
        if (!enemy.is_valid())
          return;
        Vec3 ep;
        if (!target_position(enemy, ep))
          return;

        Vec3 right = local_right(bs.rot);
        Vec3 to_enemy = normalize(Vec3{ep.x - bs.pos.x, 0.0f, ep.z - bs.pos.z});
        acc.impulse += right * (EVASIVE_LATERAL * bank.evasive_dir * dt);
        acc.impulse += to_enemy * (-EVASIVE_RETREAT * dt);
      });

  // ── System 3: Jump Charge auto-release at full charge ───────
  ecs.system<const ModuleBank>("JumpCharge")
      .with<IsAlive>()
      .each([](flecs::entity e, const ModuleBank &bank) {
        if (!bank.jump_charging)
          return;
        if (g_runtime.now_ms - bank.jump_charge_start_ms >= JUMP_FULL_CHARGE_MS)
          release_jump_charge(e);
      });

  // ── System 4: Wall Rise (cubic ease-out) ────────────────────
  ecs.system<DeployableWall>("WallRise").each([](DeployableWall &w) {
    if (w.phase != WALL_RISING)
      return;
    float t = clampf((float)(g_runtime.now_ms - w.spawn_ms) / WALL_RISE_MS,
                     0.0f, 1.0f);
    float inv = 1.0f - t;
    w.rise_t = 1.0f - inv * inv * inv;
    if (t >= 1.0f) {
      w.rise_t = 1.0f;
      w.phase = WALL_STANDING;
    }
  });
}

} // namespace hovertank
