// File: src/core/model/event_store.cpp
#include "pc/core/model/event_store.hpp"

#include <utility>

namespace pc {

EventStore& EventStore::update(const std::vector<Event>& new_events) {
  for (const Event& e : new_events) {
    auto it = events_.find(e.key());
    if (it == events_.end()) {
      events_.emplace(e.key(), e);
      continue;
    }
    // Strictly newer only: ties preserve the first-seen event.
    if (e.timestamp() > it->second.timestamp()) {
      it->second = e;
    }
  }
  return *this;
}

const Event* EventStore::find(const DedupKey& key) const {
  const auto it = events_.find(key);
  return it == events_.end() ? nullptr : &it->second;
}

std::vector<Event> EventStore::events() const {
  std::vector<Event> out;
  out.reserve(events_.size());
  for (const auto& kv : events_) out.push_back(kv.second);
  return out;
}

EventStore update(EventStore store, const std::vector<Event>& new_events) {
  store.update(new_events);
  return store;
}

}  // namespace pc
