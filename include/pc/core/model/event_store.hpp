// File: include/pc/core/model/event_store.hpp
#pragma once

#include <cstddef>
#include <map>
#include <vector>

#include "pc/core/types.hpp"

namespace pc {

// Latest known check-in per author for one run.
// Invariant: for every key, the stored timestamp is >= every timestamp
// ever submitted for that key. Equal timestamps keep the first-seen event.
class EventStore {
 public:
  EventStore() = default;

  // Merge a batch. Pure with respect to everything but the store; batches may
  // arrive in any order and the result is the same.
  EventStore& update(const std::vector<Event>& new_events);

  [[nodiscard]] std::size_t size() const noexcept { return events_.size(); }
  [[nodiscard]] bool empty() const noexcept { return events_.empty(); }
  [[nodiscard]] bool contains(const DedupKey& key) const { return events_.count(key) != 0; }

  // nullptr when the author was never seen.
  [[nodiscard]] const Event* find(const DedupKey& key) const;

  // All stored events, ordered by dedup key. This order seeds clustering.
  [[nodiscard]] std::vector<Event> events() const;

  bool operator==(const EventStore& other) const { return events_ == other.events_; }
  bool operator!=(const EventStore& other) const { return !(*this == other); }

 private:
  std::map<DedupKey, Event> events_;
};

// Free-function form: update(store, batch) -> updated store.
EventStore update(EventStore store, const std::vector<Event>& new_events);

}  // namespace pc
