#pragma once
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "recmatch/util/util.hpp"

namespace recmatch::cluster {

/** Disjoint-set forest over dense ids 0..n-1 (path halving, union by size). */
class DisjointSet {
public:
  explicit DisjointSet(std::size_t n);

  std::size_t find(std::size_t x) noexcept;

  /** Returns the root of the merged set. */
  std::size_t unite(std::size_t a, std::size_t b) noexcept;

  std::size_t size() const noexcept { return parent_.size(); }

private:
  std::vector<std::size_t> parent_;
  std::vector<std::size_t> rank_size_;
};

/**
 * Whether key_a and key_b live in one key space (deduplication) or in two
 * (cross-matching: equal key values from different tables are distinct nodes).
 */
enum class KeySpace : std::uint8_t { Shared, Separate };

/**
 * A group of records whose every pair of members is directly linked by a
 * pair inside the queried score interval (size() >= 2).
 *  - keys_a: members that appear as key_a, ascending; in a shared key space
 *    every member is here
 *  - keys_b: members that appear as key_b in a separate key space, ascending
 *  - pairs: the pairs among members, score descending
 */
struct Cluster {
  std::vector<util::RowKey> keys_a;
  std::vector<util::RowKey> keys_b;
  std::vector<util::ScoredPair> pairs;

  std::size_t size() const noexcept { return keys_a.size() + keys_b.size(); }

  double top_score() const noexcept {
    return pairs.empty() ? 0.0 : pairs.front().score;
  }
};

/**
 * Groups scored pairs into clique clusters.
 * Thread-safety: YES (stateless; all temporaries are local).
 */
class IClusterBuilder {
public:
  virtual ~IClusterBuilder() = default;

  /**
   * Purpose:
   *   (1) merge pairs, in the given order, into connected components
   *       (raw clusters) with a disjoint-set forest,
   *   (2) split each raw cluster into cliques: visit nodes lowest key
   *       first; from each unvisited seed grow a clique breadth-first,
   *       admitting a neighbour only if it is adjacent to every member,
   *   (3) drop singletons and recover each clique's member pairs.
   *
   * Preconditions:
   *   - 'pairs' are ordered highest score first (the order that decides
   *     which edges form clusters when scores tie is the given order).
   *   - no pair links a node to itself; each unordered pair appears once.
   *
   * Postconditions:
   *   - every 2-combination of a cluster's keys is one of its pairs;
   *   - clusters ordered by top score descending, then by smallest key.
   *
   * Errors: InvalidArgument for self pairs, Internal if an invariant breaks.
   * Complexity: O(P * α(N)) for merging plus O(sum deg^2) for clique growth.
   */
  virtual util::Expected<std::vector<Cluster>>
  build(std::span<const util::ScoredPair> pairs, KeySpace space) const = 0;
};

/** Default greedy clique builder. */
std::unique_ptr<IClusterBuilder> make_clique_cluster_builder();

} // namespace recmatch::cluster
