#include "hovertank_components.h"
#include "hovertank_systems.h"
#include "sim_runtime.h"
#include <algorithm>
#include <cmath>

namespace hovertank {

// Forces only while the chassis is under player control: a valid snapshot
// this tick and no teleport sequence in progress.
static bool controller_active(flecs::entity e, const BodyState &bs) {
  if (!bs.valid)
    return false;
  if (e.has<RespawnState>() &&
      e.get<RespawnState>().phase != RESPAWN_ALIVE)
    return false;
  return true;
}

static RayFilter ignore_self(const BodyLink &link) {
  uint64_t self = link.body ? link.body->collider_id() : 0;
  return [self](const RayHit &h) { return h.solid && h.collider_id != self; };
}

// Pitch/roll of the chassis up vector, radians.
static void tilt_angles(const Vec3 &up, float &tilt_x, float &tilt_z) {
  tilt_x = std::asin(clampf(up.z, -1.0f, 1.0f));
  tilt_z = std::asin(clampf(-up.x, -1.0f, 1.0f));
}

void register_locomotion_systems(flecs::world &ecs) {

  // ═════════════════════════════════════════════════════════════
  // SYSTEM 1: Velocity Sanitizer
  //
  // Caps vertical speed (soft blend toward the clamp), adds an
  // emergency brake on fast climbs, and hard-caps angular speed.
  // Writes straight to the body so the rest of the tick sees the
  // sanitized values.
  // ═════════════════════════════════════════════════════════════
  ecs.system<const BodyLink, BodyState, ForceAccumulator>("VelocitySanitizer")
      .with<IsAlive>()
      .with<Vehicle>()
      .each([](flecs::entity e, const BodyLink &link, BodyState &bs,
               ForceAccumulator &acc) {
        if (!controller_active(e, bs))
          return;

        constexpr float MAX_UP_SPEED = 4.0f;
        constexpr float MAX_DOWN_SPEED = 35.0f;
        constexpr float CLIMB_BRAKE_START = 3.0f;
        constexpr float MAX_ANGULAR_SPEED = 2.5f;

        try {
          float vy = bs.lin_vel.y;
          float clamped = clampf(vy, -MAX_DOWN_SPEED, MAX_UP_SPEED);
          if (std::fabs(vy - clamped) > 0.1f) {
            bs.lin_vel.y = vy * 0.7f + clamped * 0.3f;
            link.body->set_linear_velocity(bs.lin_vel);
          }
          if (bs.lin_vel.y > CLIMB_BRAKE_START)
            acc.vertical.y +=
                -(bs.lin_vel.y - CLIMB_BRAKE_START) * bs.mass * 200.0f;

          float w = length(bs.ang_vel);
          if (w > MAX_ANGULAR_SPEED) {
            bs.ang_vel = bs.ang_vel * (MAX_ANGULAR_SPEED / w);
            link.body->set_angular_velocity(bs.ang_vel);
          }
        } catch (const std::exception &ex) {
          log_error_throttled("sanitize", "[VelocitySanitizer] ", ex.what());
        }
      });

  // ═════════════════════════════════════════════════════════════
  // SYSTEM 2: Hover
  //
  // Spring-damper toward ground + ride height. Below target the
  // lift is clamped hard (tighter while moving) so the chassis never
  // launches; above target only downward damping and clamp forces
  // act. Ground height is a cached downward ray.
  // ═════════════════════════════════════════════════════════════
  ecs.system<const BodyLink, const BodyState, DriveState, const VehicleStats,
             ForceAccumulator>("Hover")
      .with<IsAlive>()
      .with<Vehicle>()
      .each([](flecs::entity e, const BodyLink &link, const BodyState &bs,
               DriveState &ds, const VehicleStats &stats,
               ForceAccumulator &acc) {
        if (!controller_active(e, bs))
          return;

        constexpr float GROUND_RAY_LIFT = 0.5f;
        constexpr float GROUND_RAY_LENGTH = 10.0f;
        constexpr uint8_t GROUND_CACHE_TICKS = 3;

        if (ds.ground_ticks == 0) {
          try {
            RayHit hit = scene().raycast(bs.pos + WORLD_UP * GROUND_RAY_LIFT,
                                         {0.0f, -1.0f, 0.0f},
                                         GROUND_RAY_LENGTH, ignore_self(link));
            ds.ground_y = hit.hit ? hit.point.y : 0.0f;
          } catch (const std::exception &ex) {
            log_error_throttled("ground_ray", "[Hover] ground ray: ",
                                ex.what());
            ds.ground_y = 0.0f;
          }
          ds.ground_ticks = GROUND_CACHE_TICKS - 1;
        } else {
          ds.ground_ticks--;
        }

        Vec3 fwd = local_forward(bs.rot);
        float fwd_speed = dot(bs.lin_vel, fwd);
        bool moving = std::fabs(fwd_speed) > 0.5f;
        ds.moving = moving;

        float mass = bs.mass;
        float target_y = ds.ground_y + stats.ride_height;
        float dy = target_y - bs.pos.y; // > 0: below ride height
        float vy = bs.lin_vel.y;
        float fy = 0.0f;

        if (dy > 0.0f) {
          float sens = moving ? 0.15f : 1.0f;
          float k = stats.hover_stiffness *
                    (1.0f + std::min(std::fabs(dy) * 0.015f, 0.08f) * sens);
          float c = stats.hover_damping * (moving ? 4.0f : 2.0f);
          fy = dy * k - vy * c;
          float base = std::fabs(vy) > 30.0f
                           ? 600.0f
                           : (std::fabs(vy) > 15.0f ? 1200.0f : 2000.0f);
          if (moving)
            base *= 0.2f;
          float cap = std::min(base, stats.hover_stiffness * 0.4f);
          fy = clampf(fy, -cap, cap);
        } else {
          fy = -vy * stats.hover_damping * 3.0f;
          if (dy < -0.15f)
            fy -= std::fabs(dy) * mass * 100.0f;
        }

        float above = -dy;
        if (above > 0.1f) {
          fy += std::max(-above * mass * 120.0f, -mass * 400.0f);
          if (vy > 0.5f)
            fy -= vy * mass * 25.0f;
        }
        if (above > 0.5f) {
          fy -= mass * 500.0f;
          if (vy > 0.0f)
            fy -= vy * mass * 50.0f;
        }

        acc.vertical.y += fy;
      });

  // ═════════════════════════════════════════════════════════════
  // SYSTEM 3: Upright Correction
  //
  // Tilt tiers (slight / moderate / severe / critical) pick the
  // torque gain and cap. Moderate and worse add an emergency torque
  // and a small lift. Downforce presses the chassis while driving.
  // ═════════════════════════════════════════════════════════════
  ecs.system<const BodyState, const DriveState, const VehicleStats,
             ForceAccumulator>("UprightCorrection")
      .with<IsAlive>()
      .with<Vehicle>()
      .each([](flecs::entity e, const BodyState &bs, const DriveState &ds,
               const VehicleStats &stats, ForceAccumulator &acc) {
        if (!controller_active(e, bs))
          return;

        Vec3 up = local_up(bs.rot);
        float tilt_x, tilt_z;
        tilt_angles(up, tilt_x, tilt_z);
        float tilt = std::max(std::fabs(tilt_x), std::fabs(tilt_z));

        bool slight = up.y < 0.80f || tilt > 0.25f;
        bool moderate = up.y < 0.65f || tilt > 0.5f;
        bool severe = up.y < 0.45f || tilt > 0.7f;
        bool critical = up.y < 0.25f || tilt > 1.1f;

        Vec3 fwd = local_forward(bs.rot);
        float abs_fwd = std::fabs(dot(bs.lin_vel, fwd));
        bool moving = ds.moving;

        float max_torque = critical   ? 15000.0f
                           : severe   ? 10000.0f
                           : moderate ? 6000.0f
                                      : 4000.0f;
        if (moving)
          max_torque *= 0.7f;

        float s = moving ? 0.3f : 1.0f;
        float m = moving ? 0.5f : 1.0f;
        float cx = -tilt_x * stats.upright_force * 0.6f * s * m -
                   bs.ang_vel.x * stats.upright_damp * s * m;
        float cz = -tilt_z * stats.upright_force * 0.6f * s * m -
                   bs.ang_vel.z * stats.upright_damp * s * m;

        if (slight) {
          float gain = critical ? 2.0f : severe ? 1.6f : moderate ? 1.3f : 1.1f;
          if (moving)
            gain *= 0.8f;
          cx *= gain;
          cz *= gain;
        }
        float mag = std::sqrt(cx * cx + cz * cz);
        if (mag > max_torque) {
          float scale = max_torque / mag;
          cx *= scale;
          cz *= scale;
        }

        float lift = 0.0f;
        if (moderate) {
          float g = critical ? 2.0f : severe ? 1.5f : 1.2f;
          if (moving)
            g *= 0.7f;
          float ex = -tilt_x * stats.emergency_force * g * 0.6f;
          float ez = -tilt_z * stats.emergency_force * g * 0.6f;
          float emax = max_torque * (critical ? 1.8f : severe ? 1.5f : 1.2f);
          float emag = std::sqrt(ex * ex + ez * ez);
          if (emag > emax) {
            float scale = emax / emag;
            ex *= scale;
            ez *= scale;
          }
          cx += ex;
          cz += ez;
          if (up.y < 0.65f)
            lift = stats.emergency_force * (0.65f - up.y);
        }

        float down = 0.0f;
        if (abs_fwd > 1.0f)
          down += stats.down_force * (1.0f - up.y) * 0.5f;
        if (std::fabs(ds.smooth_throttle) > 0.1f)
          down += std::fabs(ds.smooth_throttle) * stats.down_force * 0.4f;

        acc.correction_torque += Vec3{cx, 0.0f, cz};
        acc.vertical.y += lift - down;
      });

  // ═════════════════════════════════════════════════════════════
  // SYSTEM 4: Drive
  //
  // Low-pass filtered throttle/steer, speed-tracking drive force,
  // speed-dependent turn torque, side friction. Empty fuel pins
  // the smoothed inputs at zero.
  // ═════════════════════════════════════════════════════════════
  ecs.system<const BodyState, DriveState, const DriveInput, const Fuel,
             const VehicleStats, ForceAccumulator>("Drive")
      .with<IsAlive>()
      .with<Vehicle>()
      .each([](flecs::entity e, const BodyState &bs, DriveState &ds,
               const DriveInput &in, const Fuel &fuel,
               const VehicleStats &stats, ForceAccumulator &acc) {
        if (!controller_active(e, bs))
          return;

        if (fuel.empty) {
          ds.smooth_throttle = 0.0f;
          ds.smooth_steer = 0.0f;
        } else {
          float thr = clampf(in.throttle, -1.0f, 1.0f);
          float steer = clampf(in.steer, -1.0f, 1.0f);
          ds.smooth_throttle += (thr - ds.smooth_throttle) * 0.12f;
          ds.smooth_steer += (steer - ds.smooth_steer) * 0.18f;
        }

        Vec3 fwd = local_forward(bs.rot);
        Vec3 right = local_right(bs.rot);
        float fwd_speed = dot(bs.lin_vel, fwd);
        float abs_fwd = std::fabs(fwd_speed);
        float mass = bs.mass;

        if (std::fabs(ds.smooth_throttle) > 0.05f) {
          float target = ds.smooth_throttle * stats.move_speed;
          float diff = target - fwd_speed;
          bool decelerating = fwd_speed * diff < 0.0f;
          float f = diff * stats.acceleration * 0.8f *
                    (decelerating ? 1.5f : 1.0f);
          float max_f = stats.move_speed * mass * 2.0f;
          acc.planar += fwd * clampf(f, -max_f, max_f);
        }

        float speed_ratio =
            stats.move_speed > 0.0f ? abs_fwd / stats.move_speed : 0.0f;
        float turn_mult = 1.0f + (1.0f - speed_ratio) * 0.5f;
        float target_rate = ds.smooth_steer * stats.turn_speed * turn_mult;
        float wy = bs.ang_vel.y;
        bool turning = std::fabs(ds.smooth_steer) > 0.1f;
        float yaw = (target_rate - wy) * stats.turn_accel *
                    (turning ? 1.2f : 1.5f);
        if (speed_ratio > 0.3f && std::fabs(ds.smooth_steer) > 0.2f)
          yaw += -wy * stats.stability_torque * speed_ratio * 0.5f;
        if (std::fabs(ds.smooth_steer) < 0.05f)
          yaw += -wy * stats.yaw_damping * 0.7f;
        acc.yaw_torque.y += yaw;

        float side = dot(bs.lin_vel, right);
        acc.planar += right * (-side * stats.side_friction *
                               (1.0f + speed_ratio * 0.5f));
      });

  // ═════════════════════════════════════════════════════════════
  // SYSTEM 5: Idle Damping
  // ═════════════════════════════════════════════════════════════
  ecs.system<const BodyState, const DriveState, const VehicleStats,
             ForceAccumulator>("IdleDamping")
      .with<IsAlive>()
      .with<Vehicle>()
      .each([](flecs::entity e, const BodyState &bs, const DriveState &ds,
               const VehicleStats &stats, ForceAccumulator &acc) {
        if (!controller_active(e, bs))
          return;
        if (std::fabs(ds.smooth_throttle) >= 0.05f ||
            std::fabs(ds.smooth_steer) >= 0.05f)
          return;

        Vec3 fwd = local_forward(bs.rot);
        Vec3 right = local_right(bs.rot);
        acc.planar += right * (-dot(bs.lin_vel, right) * stats.side_drag);
        acc.planar += fwd * (-dot(bs.lin_vel, fwd) * stats.fwd_drag);
        acc.yaw_torque.y += -bs.ang_vel.y * stats.angular_drag;
      });

  // ═════════════════════════════════════════════════════════════
  // SYSTEM 6: Obstacle Assist
  //
  // Three short forward probes (curb, mid, 45° up) report the
  // tallest obstruction above ground. Anything up to the chassis
  // height gets a proportional lift and forward boost while the
  // throttle is open. The lift shares the hover vertical channel.
  // ═════════════════════════════════════════════════════════════
  ecs.system<const BodyLink, const BodyState, const DriveState,
             const VehicleStats, ObstacleProbe, ForceAccumulator>(
         "ObstacleAssist")
      .with<IsAlive>()
      .with<Vehicle>()
      .each([](flecs::entity e, const BodyLink &link, const BodyState &bs,
               const DriveState &ds, const VehicleStats &stats,
               ObstacleProbe &probe, ForceAccumulator &acc) {
        if (!controller_active(e, bs))
          return;

        constexpr float PROBE_LENGTH = 2.5f;
        constexpr float LOW_PROBE_Y = 0.3f;
        constexpr float MID_PROBE_Y = 0.8f;
        constexpr uint8_t OBSTACLE_CACHE_TICKS = 4;

        Vec3 fwd = local_forward(bs.rot);
        Vec3 flat = normalize(Vec3{fwd.x, 0.0f, fwd.z});
        if (length_sq(flat) == 0.0f)
          return;

        if (probe.ticks_left == 0) {
          float ground = ds.ground_y;
          Vec3 low = {bs.pos.x, ground + LOW_PROBE_Y, bs.pos.z};
          Vec3 mid = {bs.pos.x, ground + MID_PROBE_Y, bs.pos.z};
          Vec3 rising = normalize(flat + WORLD_UP);
          RayFilter filter = ignore_self(link);

          float tallest = 0.0f;
          try {
            const Vec3 origins[3] = {low, mid, low};
            const Vec3 dirs[3] = {flat, flat, rising};
            for (int i = 0; i < 3; i++) {
              RayHit hit = scene().raycast(origins[i], dirs[i], PROBE_LENGTH,
                                           filter);
              if (hit.hit)
                tallest = std::max(tallest, hit.point.y - ground);
            }
          } catch (const std::exception &ex) {
            log_error_throttled("obstacle_ray", "[ObstacleAssist] ",
                                ex.what());
            tallest = 0.0f;
          }
          probe.height = tallest;
          probe.ticks_left = OBSTACLE_CACHE_TICKS - 1;
        } else {
          probe.ticks_left--;
        }

        if (probe.height <= 0.0f || probe.height > stats.vehicle_height)
          return;
        if (ds.smooth_throttle <= 0.1f || stats.vehicle_height <= 0.0f)
          return;

        float ratio = probe.height / stats.vehicle_height;
        acc.vertical.y += bs.mass * 20.0f * ratio;
        acc.planar += flat * (bs.mass * 6.0f * ratio * ds.smooth_throttle);
      });

  // ═════════════════════════════════════════════════════════════
  // SYSTEM 7: Turret Traverse
  // ═════════════════════════════════════════════════════════════
  ecs.system<DriveState, const DriveInput>("TurretTraverse")
      .with<IsAlive>()
      .with<Vehicle>()
      .each([](flecs::entity e, DriveState &ds, const DriveInput &in) {
        float dt = e.world().delta_time();
        if (dt <= 0.0f)
          return;

        constexpr float TURRET_LERP = 0.15f;
        constexpr float TURRET_BASE_RATE = 0.06f; // rad per tick at full ramp

        float target = clampf(in.turret, -1.0f, 1.0f);
        if (std::fabs(target) > 0.01f) {
          ds.turret_hold_time += dt;
          ds.turret_accel = std::min(1.0f, 0.01f + ds.turret_hold_time * 0.99f);
        } else {
          ds.turret_hold_time = 0.0f;
          ds.turret_accel *= 0.8f;
        }
        ds.turret_smooth += (target - ds.turret_smooth) * TURRET_LERP;
        float step = ds.turret_smooth * TURRET_BASE_RATE * ds.turret_accel;
        if (is_finite(step))
          ds.turret_yaw = wrap_angle(ds.turret_yaw + step);
      });

  // ═════════════════════════════════════════════════════════════
  // SYSTEM 8: Fall / Stuck Recovery
  //
  // Fallen or stuck for longer than the grace period → force reset
  // to the last upright pose through the kinematic hold sequence.
  // ═════════════════════════════════════════════════════════════
  ecs.system<const BodyState, RecoveryState>("FallRecovery")
      .with<IsAlive>()
      .with<Vehicle>()
      .each([](flecs::entity e, const BodyState &bs, RecoveryState &rec) {
        if (!controller_active(e, bs))
          return;
        float dt = e.world().delta_time();

        constexpr float RESET_GRACE_MS = 2000.0f;

        Vec3 up = local_up(bs.rot);
        float tilt_x, tilt_z;
        tilt_angles(up, tilt_x, tilt_z);

        bool fallen = bs.pos.y < -10.0f || up.y < 0.2f ||
                      std::fabs(tilt_x) > 1.2f || std::fabs(tilt_z) > 1.2f;
        bool stuck = length(bs.lin_vel) < 0.5f &&
                     length(bs.ang_vel) < 0.1f && up.y < 0.4f;

        if (fallen || stuck) {
          rec.grace_ms += dt * 1000.0f;
          if (rec.grace_ms > RESET_GRACE_MS) {
            rec.grace_ms = 0.0f;
            force_reset(e);
          }
          return;
        }

        rec.grace_ms = 0.0f;
        if (up.y > 0.9f && bs.pos.y > -1.0f) {
          rec.last_valid_pos = bs.pos;
          rec.last_valid_yaw = yaw_of(local_forward(bs.rot));
          rec.has_valid_pose = true;
        }
      });
}

} // namespace hovertank
