// File: include/pc/core/model/clustering.hpp
#pragma once

#include <cstddef>
#include <functional>
#include <vector>

#include "pc/core/types.hpp"

namespace pc {

// One agglomeration step. Node ids follow the usual linkage-matrix layout:
// leaves are 0..n-1, the k-th merge creates node n+k.
struct MergeNode {
  std::size_t left = 0;   // child holding the smaller representative
  std::size_t right = 0;
  double distance = 0.0;  // may be +infinity for causally disconnected groups
  std::size_t size = 0;   // leaves below this node
};

// Full binary merge tree over n leaves (n-1 merges; none for n < 2).
class Dendrogram {
 public:
  Dendrogram() = default;
  Dendrogram(std::size_t leaf_count, std::vector<MergeNode> merges);

  [[nodiscard]] std::size_t leaf_count() const noexcept { return leaf_count_; }
  [[nodiscard]] const std::vector<MergeNode>& merges() const noexcept { return merges_; }
  [[nodiscard]] bool empty() const noexcept { return leaf_count_ == 0; }

  [[nodiscard]] bool is_leaf(std::size_t node) const noexcept { return node < leaf_count_; }
  [[nodiscard]] std::size_t root() const noexcept;

  // Leaves below `node`, ascending.
  [[nodiscard]] std::vector<std::size_t> leaves(std::size_t node) const;

  // Level cut: every maximal subtree whose merge distance is <= threshold
  // becomes one group. Groups are ordered by their smallest leaf; leaves
  // within a group ascend.
  [[nodiscard]] std::vector<std::vector<std::size_t>> cut(double threshold) const;

 private:
  std::size_t leaf_count_ = 0;
  std::vector<MergeNode> merges_;
};

// Symmetric distance between items i and j (i != j).
using PairwiseDistance = std::function<double(std::size_t, std::size_t)>;

// Agglomerative clustering with single linkage (minimum pairwise distance).
// Ties between equal minimum distances go to the lexicographically smallest
// pair of representatives (smallest member index of each cluster), so the
// result depends only on input order.
Dendrogram build_single_linkage(std::size_t n, const PairwiseDistance& distance);

// Space-time clustering of check-ins under spacelike_interval.
class SpacetimeClusterer {
 public:
  // Events should arrive in a stable order (EventStore::events() gives key order).
  explicit SpacetimeClusterer(std::vector<Event> events);

  [[nodiscard]] const std::vector<Event>& events() const noexcept { return events_; }
  [[nodiscard]] const Dendrogram& dendrogram() const noexcept { return dendrogram_; }

  // Flat partition at `threshold` (metres-equivalent).
  [[nodiscard]] std::vector<Cluster> clusters_at(double threshold) const;

 private:
  std::vector<Event> events_;
  Dendrogram dendrogram_;
};

}  // namespace pc
