#ifndef HOVERTANK_SIM_RUNTIME_H
#define HOVERTANK_SIM_RUNTIME_H

#include "hovertank_interfaces.h"
#include "hovertank_log.h"
#include "timer_queue.h"
#include <flecs.h>

namespace hovertank {

// ─── Tunable world rules (rules.json) ─────────────────────
struct CombatRules {
  // Projectile envelope
  float map_border;          // ricochet walls at |x|,|z| > border
  float dispose_xz;          // hard dispose beyond this
  float dispose_y_min;
  float dispose_y_max;
  float ground_ricochet_y;   // below this a round is "at the ground"
  float ricochet_reset_y;    // lifted here after a ground bounce
  int max_ricochets;
  float ricochet_min_speed;
  float ricochet_max_incidence; // |dot(dir, normal)| below this bounces
  float ricochet_speed_keep;
  float projectile_ttl_ms;

  // Hit radii (distance-to-centre tests)
  float vehicle_hit_radius;
  float turret_hit_radius;
  float tracer_hit_radius;

  // Vitals
  float invulnerability_ms;
  bool invulnerability_blocks_damage;
  float shield_factor;
  float stealth_factor;
  float respawn_delay_ms;
  int respawn_hold_ticks;
  Vec3 default_spawn;

  // Walls
  int max_walls;
  float wall_max_health;
  float wall_lifetime_ms;

  // Tracers
  int tracer_ammo;
  float tracer_damage;
  float tracer_cooldown_ms;
  float tracer_mark_ms;

  float log_throttle_ms;
};

CombatRules default_combat_rules();

// ─── Collaborators ────────────────────────────────────────
// Never null after SimRuntime::reset(); unset slots point at no-op sinks.
struct Collaborators {
  SceneQuery *scene;
  HudSink *hud;
  EffectsSink *fx;
  SoundSink *sound;
  ChatSink *chat;
  ProgressionSink *progression;
  DamageSink *damage;
  ShootCallback on_shoot;
  RespawnProvider respawn;
};

// ═════════════════════════════════════════════════════════════
// GOLDEN TU: g_runtime is defined once, in world_manager.cpp for the
// extension and in test_master.cpp for the headless tests.
// Clock, timers and collaborators for the single simulation.
// ═════════════════════════════════════════════════════════════
struct SimRuntime {
  double now_ms = 0.0;
  uint64_t tick = 0;
  uint32_t wall_seq = 0;
  CombatRules rules = default_combat_rules();
  Collaborators io = {};
  TimerQueue timers;
  ErrorThrottle errors;

  SimRuntime() { reset(); }
  void reset();
  // Null entries fall back to the no-op sinks.
  void set_collaborators(const Collaborators &c);
};

extern SimRuntime g_runtime;

// Advance the clock and fire due timers. Call once per frame, before
// ecs.progress(dt).
void pre_tick(flecs::world &ecs, float dt);

// Throttled error line, keyed per fault site.
template <typename... Args>
void log_error_throttled(const std::string &key, const Args &...args) {
  if (g_runtime.errors.allow(key, g_runtime.now_ms,
                             g_runtime.rules.log_throttle_ms))
    log_error(args...);
}

inline SceneQuery &scene() { return *g_runtime.io.scene; }
inline HudSink &hud() { return *g_runtime.io.hud; }
inline EffectsSink &fx() { return *g_runtime.io.fx; }
inline SoundSink &sound() { return *g_runtime.io.sound; }
inline ChatSink &chat() { return *g_runtime.io.chat; }
inline ProgressionSink &progression() { return *g_runtime.io.progression; }
inline DamageSink &damage_sink() { return *g_runtime.io.damage; }

} // namespace hovertank

#endif // HOVERTANK_SIM_RUNTIME_H
