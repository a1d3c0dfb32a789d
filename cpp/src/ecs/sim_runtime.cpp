#include "sim_runtime.h"

namespace hovertank {

namespace {

class NullSceneQuery : public SceneQuery {
public:
  RayHit raycast(const Vec3 &, const Vec3 &, float,
                 const RayFilter &) override {
    return RayHit{false, {0, 0, 0}, {0, 1, 0}, 0.0f, 0, false};
  }
};

NullSceneQuery s_null_scene;
HudSink s_null_hud;
EffectsSink s_null_fx;
SoundSink s_null_sound;
ChatSink s_null_chat;
ProgressionSink s_null_progression;
DamageSink s_null_damage;

} // namespace

CombatRules default_combat_rules() {
  CombatRules r;
  r.map_border = 1000.0f;
  r.dispose_xz = 1200.0f;
  r.dispose_y_min = -10.0f;
  r.dispose_y_max = 100.0f;
  r.ground_ricochet_y = 0.6f;
  r.ricochet_reset_y = 0.7f;
  r.max_ricochets = 3;
  r.ricochet_min_speed = 15.0f;
  r.ricochet_max_incidence = 0.65f; // ~50 degrees from the surface normal
  r.ricochet_speed_keep = 0.8f;
  r.projectile_ttl_ms = 6000.0f;

  r.vehicle_hit_radius = 4.0f;
  r.turret_hit_radius = 5.0f;
  r.tracer_hit_radius = 4.5f;

  r.invulnerability_ms = 3000.0f;
  r.invulnerability_blocks_damage = false;
  r.shield_factor = 0.5f;
  r.stealth_factor = 0.8f;
  r.respawn_delay_ms = 3000.0f;
  r.respawn_hold_ticks = 6;
  r.default_spawn = {0.0f, 1.2f, 0.0f};

  r.max_walls = 10;
  r.wall_max_health = 100.0f;
  r.wall_lifetime_ms = 10000.0f;

  r.tracer_ammo = 5;
  r.tracer_damage = 10.0f;
  r.tracer_cooldown_ms = 1800.0f;
  r.tracer_mark_ms = 15000.0f;

  r.log_throttle_ms = 2000.0f;
  return r;
}

void SimRuntime::reset() {
  now_ms = 0.0;
  tick = 0;
  wall_seq = 0;
  rules = default_combat_rules();
  timers.clear();
  errors.clear();
  set_collaborators(Collaborators{});
}

void SimRuntime::set_collaborators(const Collaborators &c) {
  io = c;
  if (!io.scene)
    io.scene = &s_null_scene;
  if (!io.hud)
    io.hud = &s_null_hud;
  if (!io.fx)
    io.fx = &s_null_fx;
  if (!io.sound)
    io.sound = &s_null_sound;
  if (!io.chat)
    io.chat = &s_null_chat;
  if (!io.progression)
    io.progression = &s_null_progression;
  if (!io.damage)
    io.damage = &s_null_damage;
}

void pre_tick(flecs::world &ecs, float dt) {
  if (dt > 0.0f)
    g_runtime.now_ms += (double)dt * 1000.0;
  g_runtime.tick++;

  try {
    g_runtime.timers.pump(ecs, g_runtime.now_ms);
  } catch (const std::exception &e) {
    log_error_throttled("timers", "[TimerPump] callback failed: ", e.what());
  }
}

} // namespace hovertank
