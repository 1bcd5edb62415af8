// File: src/core/report/report_sink.cpp
#include "pc/core/report/report_sink.hpp"

#include <algorithm>

namespace pc {

std::vector<std::string> PartyReport::participant_names() const {
  std::vector<std::string> out;
  out.reserve(members.size());
  for (const Event& e : members) out.push_back(e.name());
  return out;
}

std::vector<std::string> PartyReport::participant_keys() const {
  std::vector<std::string> out;
  out.reserve(members.size());
  for (const Event& e : members) out.push_back(e.key().display());
  return out;
}

std::vector<std::string> PartyReport::distinct_place_names() const {
  std::vector<std::string> out;
  for (const std::string& p : place_names) {
    if (std::find(out.begin(), out.end(), p) == out.end()) out.push_back(p);
  }
  return out;
}

std::string join_human(const std::vector<std::string>& items, const std::string& last_sep) {
  if (items.empty()) return "";
  if (items.size() == 1) return items.front();

  std::string out;
  for (std::size_t i = 0; i + 1 < items.size(); ++i) {
    if (i > 0) out += ", ";
    out += items[i];
  }
  out += last_sep;
  out += items.back();
  return out;
}

}  // namespace pc
