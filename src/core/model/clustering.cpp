// File: src/core/model/clustering.cpp
#include "pc/core/model/clustering.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

#include "pc/core/model/spacetime.hpp"

namespace pc {
namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

// Dense symmetric matrix, row-major.
class DistanceMatrix {
 public:
  explicit DistanceMatrix(std::size_t n) : n_(n), d_(n * n, 0.0) {}

  double get(std::size_t i, std::size_t j) const { return d_[i * n_ + j]; }
  void set(std::size_t i, std::size_t j, double v) {
    d_[i * n_ + j] = v;
    d_[j * n_ + i] = v;
  }

 private:
  std::size_t n_;
  std::vector<double> d_;
};

}  // namespace

Dendrogram::Dendrogram(std::size_t leaf_count, std::vector<MergeNode> merges)
    : leaf_count_(leaf_count), merges_(std::move(merges)) {}

std::size_t Dendrogram::root() const noexcept {
  if (merges_.empty()) return 0;
  return leaf_count_ + merges_.size() - 1;
}

std::vector<std::size_t> Dendrogram::leaves(std::size_t node) const {
  std::vector<std::size_t> out;
  std::vector<std::size_t> stack{node};
  while (!stack.empty()) {
    const std::size_t cur = stack.back();
    stack.pop_back();
    if (is_leaf(cur)) {
      out.push_back(cur);
      continue;
    }
    const MergeNode& m = merges_[cur - leaf_count_];
    stack.push_back(m.right);
    stack.push_back(m.left);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<std::vector<std::size_t>> Dendrogram::cut(double threshold) const {
  std::vector<std::vector<std::size_t>> groups;
  if (empty()) return groups;

  // Descend from the root until a node was merged at or below the threshold.
  std::vector<std::size_t> stack{root()};
  while (!stack.empty()) {
    const std::size_t node = stack.back();
    stack.pop_back();
    if (is_leaf(node)) {
      groups.push_back({node});
      continue;
    }
    const MergeNode& m = merges_[node - leaf_count_];
    if (m.distance <= threshold) {
      groups.push_back(leaves(node));
      continue;
    }
    stack.push_back(m.right);
    stack.push_back(m.left);
  }

  std::sort(groups.begin(), groups.end(),
            [](const auto& a, const auto& b) { return a.front() < b.front(); });
  return groups;
}

Dendrogram build_single_linkage(std::size_t n, const PairwiseDistance& distance) {
  if (n == 0) return Dendrogram{};

  DistanceMatrix d(n);
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = i + 1; j < n; ++j) {
      const double v = distance(i, j);
      // A NaN would poison every comparison below; treat it as unreachable.
      d.set(i, j, std::isnan(v) ? kInf : v);
    }
  }

  // Slot i is alive while i is the representative (smallest member) of a cluster.
  std::vector<bool> active(n, true);
  std::vector<std::size_t> node_of(n);
  std::vector<std::size_t> size_of(n, 1);
  for (std::size_t i = 0; i < n; ++i) node_of[i] = i;

  std::vector<MergeNode> merges;
  merges.reserve(n - 1);

  for (std::size_t step = 0; step + 1 < n; ++step) {
    bool found = false;
    std::size_t best_a = 0;
    std::size_t best_b = 0;
    double best_d = kInf;

    // Ascending (a, b) with a strict '<' keeps the lexicographically first pair on ties.
    for (std::size_t a = 0; a < n; ++a) {
      if (!active[a]) continue;
      for (std::size_t b = a + 1; b < n; ++b) {
        if (!active[b]) continue;
        const double v = d.get(a, b);
        if (!found || v < best_d) {
          found = true;
          best_a = a;
          best_b = b;
          best_d = v;
        }
      }
    }

    merges.push_back(MergeNode{node_of[best_a], node_of[best_b], best_d,
                               size_of[best_a] + size_of[best_b]});

    // Single linkage: d(k, a+b) = min(d(k, a), d(k, b)).
    for (std::size_t k = 0; k < n; ++k) {
      if (!active[k] || k == best_a || k == best_b) continue;
      d.set(best_a, k, std::min(d.get(best_a, k), d.get(best_b, k)));
    }

    active[best_b] = false;
    node_of[best_a] = n + step;
    size_of[best_a] += size_of[best_b];
  }

  return Dendrogram(n, std::move(merges));
}

SpacetimeClusterer::SpacetimeClusterer(std::vector<Event> events) : events_(std::move(events)) {
  dendrogram_ = build_single_linkage(events_.size(), [this](std::size_t i, std::size_t j) {
    return spacelike_interval(events_[i], events_[j]);
  });
}

std::vector<Cluster> SpacetimeClusterer::clusters_at(double threshold) const {
  std::vector<Cluster> out;
  for (const auto& group : dendrogram_.cut(threshold)) {
    Cluster c;
    c.reserve(group.size());
    for (std::size_t idx : group) c.push_back(events_[idx]);
    out.push_back(std::move(c));
  }
  return out;
}

}  // namespace pc
