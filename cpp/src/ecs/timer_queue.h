#ifndef HOVERTANK_TIMER_QUEUE_H
#define HOVERTANK_TIMER_QUEUE_H

#include "hovertank_components.h"
#include <flecs.h>
#include <functional>
#include <vector>

namespace hovertank {

// One-shot deferred callbacks keyed by an explicit handle.
//
// Every wait in the core (reload, module durations, wall expiry,
// invulnerability) goes through here instead of a self-rescheduling
// callback. pump() runs once per tick from pre_tick(), outside
// ecs.progress(), so callbacks see a non-deferred world.
//
// A callback is dropped instead of run when its owner entity no longer
// exists, or when the owner carries a LifeId whose generation differs
// from the one captured at schedule time (the vehicle died or respawned
// in between).
class TimerQueue {
public:
  using Callback = std::function<void(flecs::entity owner)>;

  TimerHandle schedule(double now_ms, double delay_ms, flecs::entity owner,
                       Callback cb);

  // Clears the handle. Cancelling a fired or unknown handle is a no-op.
  void cancel(TimerHandle &handle);
  void cancel_owner(flecs::entity_t owner);

  bool pending(TimerHandle handle) const;
  size_t size() const { return entries_.size(); }

  // Runs every entry due at or before now_ms, earliest first.
  int pump(flecs::world &world, double now_ms);

  void clear();

private:
  struct Entry {
    uint32_t id;
    double due_ms;
    flecs::entity_t owner;
    uint32_t life;
    bool has_life;
    Callback cb;
  };

  std::vector<Entry> entries_;
  std::vector<uint32_t> cancelled_in_pump_;
  uint32_t next_id_ = 1;
  bool pumping_ = false;
};

} // namespace hovertank

#endif // HOVERTANK_TIMER_QUEUE_H
