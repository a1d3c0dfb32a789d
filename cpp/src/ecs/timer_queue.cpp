#include "timer_queue.h"
#include "hovertank_log.h"
#include <algorithm>

namespace hovertank {

TimerHandle TimerQueue::schedule(double now_ms, double delay_ms,
                                 flecs::entity owner, Callback cb) {
  Entry entry;
  entry.id = next_id_++;
  entry.due_ms = now_ms + (delay_ms > 0.0 ? delay_ms : 0.0);
  entry.owner = owner.id();
  entry.has_life = owner.is_valid() && owner.has<LifeId>();
  entry.life = entry.has_life ? owner.get<LifeId>().generation : 0;
  entry.cb = std::move(cb);
  entries_.push_back(std::move(entry));
  return TimerHandle{entries_.back().id};
}

void TimerQueue::cancel(TimerHandle &handle) {
  if (handle.id == 0)
    return;
  uint32_t id = handle.id;
  if (pumping_)
    cancelled_in_pump_.push_back(id);
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [id](const Entry &e) { return e.id == id; }),
                 entries_.end());
  handle.id = 0;
}

void TimerQueue::cancel_owner(flecs::entity_t owner) {
  if (pumping_) {
    for (const auto &e : entries_) {
      if (e.owner == owner)
        cancelled_in_pump_.push_back(e.id);
    }
  }
  entries_.erase(
      std::remove_if(entries_.begin(), entries_.end(),
                     [owner](const Entry &e) { return e.owner == owner; }),
      entries_.end());
}

bool TimerQueue::pending(TimerHandle handle) const {
  if (handle.id == 0)
    return false;
  for (const auto &e : entries_) {
    if (e.id == handle.id)
      return true;
  }
  return false;
}

int TimerQueue::pump(flecs::world &world, double now_ms) {
  // Pull due entries out first: callbacks may schedule or cancel.
  std::vector<Entry> due;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->due_ms <= now_ms) {
      due.push_back(std::move(*it));
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
  std::sort(due.begin(), due.end(), [](const Entry &a, const Entry &b) {
    return a.due_ms != b.due_ms ? a.due_ms < b.due_ms : a.id < b.id;
  });

  int fired = 0;
  pumping_ = true;
  cancelled_in_pump_.clear();
  for (auto &entry : due) {
    // A callback earlier in this batch may have cancelled this one.
    if (std::find(cancelled_in_pump_.begin(), cancelled_in_pump_.end(),
                  entry.id) != cancelled_in_pump_.end())
      continue;

    if (entry.owner == 0)
      continue;
    flecs::entity owner = world.entity(entry.owner);
    if (!owner.is_alive())
      continue;
    if (entry.has_life &&
        (!owner.has<LifeId>() ||
         owner.get<LifeId>().generation != entry.life))
      continue;

    try {
      entry.cb(owner);
      fired++;
    } catch (const std::exception &ex) {
      log_error("[TimerQueue] timer ", entry.id, " failed: ", ex.what());
    }
  }
  pumping_ = false;
  cancelled_in_pump_.clear();
  return fired;
}

void TimerQueue::clear() {
  entries_.clear();
  cancelled_in_pump_.clear();
  pumping_ = false;
}

} // namespace hovertank
