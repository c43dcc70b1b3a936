#include "recmatch/cluster/cluster.hpp"

#include <algorithm>
#include <deque>
#include <map>
#include <numeric>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace recmatch::cluster {
using util::Expected;
using util::MatchError;
using util::RowKey;
using util::ScoredPair;

// -----------------------------
// DisjointSet
// -----------------------------

DisjointSet::DisjointSet(std::size_t n) : parent_(n), rank_size_(n, 1) {
  std::iota(parent_.begin(), parent_.end(), std::size_t{0});
}

std::size_t DisjointSet::find(std::size_t x) noexcept {
  while (parent_[x] != x) {
    parent_[x] = parent_[parent_[x]];
    x = parent_[x];
  }
  return x;
}

std::size_t DisjointSet::unite(std::size_t a, std::size_t b) noexcept {
  a = find(a);
  b = find(b);
  if (a == b) return a;
  if (rank_size_[a] < rank_size_[b]) std::swap(a, b);
  parent_[b] = a;
  rank_size_[a] += rank_size_[b];
  return a;
}

// -----------------------------
// Helpers
// -----------------------------

namespace {
// Node identity: key plus side (0 = left, 1 = right; always 0 when shared).
using Node = std::pair<RowKey, std::uint8_t>;

struct Edge {
  std::size_t u;
  std::size_t v;
  std::size_t pair_idx; // into the input span
};

struct NodeCluster {
  std::vector<std::size_t> nodes; // ascending
  std::vector<std::size_t> pair_idx;
};

inline std::pair<std::size_t, std::size_t> ordered(std::size_t a,
                                                   std::size_t b) noexcept {
  return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
}

// Splits one connected component into cliques.
Expected<std::vector<NodeCluster>>
split_into_cliques(const std::vector<Edge>& edges, std::vector<bool>& visited) {
  std::map<std::size_t, std::vector<std::size_t>> adj;
  std::map<std::pair<std::size_t, std::size_t>, std::size_t> edge_of;
  for (const auto& e : edges) {
    adj[e.u].push_back(e.v);
    adj[e.v].push_back(e.u);
    edge_of.emplace(ordered(e.u, e.v), e.pair_idx);
  }
  for (auto& kv : adj) {
    std::sort(kv.second.begin(), kv.second.end());
    kv.second.erase(std::unique(kv.second.begin(), kv.second.end()),
                    kv.second.end());
  }

  auto adjacent = [&adj](std::size_t a, std::size_t b) {
    const auto& n = adj.at(a);
    return std::binary_search(n.begin(), n.end(), b);
  };

  std::vector<NodeCluster> out;
  for (const auto& [seed, seed_nbrs] : adj) {
    if (visited[seed]) continue;
    std::vector<std::size_t> clique{seed};
    visited[seed] = true;
    std::deque<std::size_t> frontier{seed};

    while (!frontier.empty()) {
      const std::size_t cur = frontier.front();
      frontier.pop_front();
      for (const std::size_t nb : adj.at(cur)) {
        if (visited[nb]) continue;
        const bool full = std::all_of(
            clique.begin(), clique.end(),
            [&](std::size_t m) { return adjacent(nb, m); });
        if (!full) continue;
        visited[nb] = true;
        clique.push_back(nb);
        frontier.push_back(nb);
      }
    }
    if (clique.size() < 2) continue;

    std::sort(clique.begin(), clique.end());
    NodeCluster nc;
    for (std::size_t i = 0; i < clique.size(); ++i) {
      for (std::size_t j = i + 1; j < clique.size(); ++j) {
        const auto it = edge_of.find(ordered(clique[i], clique[j]));
        if (it == edge_of.end()) return tl::unexpected(MatchError::Internal);
        nc.pair_idx.push_back(it->second);
      }
    }
    nc.nodes = std::move(clique);
    out.push_back(std::move(nc));
  }
  return out;
}
} // namespace

// -----------------------------
// Builder
// -----------------------------

class CliqueClusterBuilder final : public IClusterBuilder {
public:
  Expected<std::vector<Cluster>>
  build(std::span<const ScoredPair> pairs, KeySpace space) const override {
    const std::uint8_t right = space == KeySpace::Separate ? 1 : 0;

    // Dense ids in ascending key order, so lower keys seed cliques first.
    std::vector<Node> nodes;
    nodes.reserve(pairs.size() * 2);
    for (const auto& p : pairs) {
      nodes.emplace_back(p.key_a, std::uint8_t{0});
      nodes.emplace_back(p.key_b, right);
    }
    std::sort(nodes.begin(), nodes.end());
    nodes.erase(std::unique(nodes.begin(), nodes.end()), nodes.end());
    auto id_of = [&nodes](const Node& n) {
      return static_cast<std::size_t>(
          std::lower_bound(nodes.begin(), nodes.end(), n) - nodes.begin());
    };

    std::vector<Edge> edges;
    edges.reserve(pairs.size());
    for (std::size_t i = 0; i < pairs.size(); ++i) {
      const std::size_t u = id_of({pairs[i].key_a, std::uint8_t{0}});
      const std::size_t v = id_of({pairs[i].key_b, right});
      if (u == v) return tl::unexpected(MatchError::InvalidArgument);
      edges.push_back(Edge{u, v, i});
    }

    // Raw clusters: connected components, edges kept per root in input order.
    DisjointSet ds(nodes.size());
    for (const auto& e : edges) ds.unite(e.u, e.v);
    std::map<std::size_t, std::vector<Edge>> raw;
    for (const auto& e : edges) raw[ds.find(e.u)].push_back(e);

    std::vector<NodeCluster> cliques;
    std::vector<bool> visited(nodes.size(), false);
    for (const auto& kv : raw) {
      auto partE = split_into_cliques(kv.second, visited);
      if (!partE) return tl::unexpected(partE.error());
      for (auto& c : *partE) cliques.push_back(std::move(c));
    }
    spdlog::debug("cluster builder: {} pairs, {} raw clusters, {} cliques",
                  pairs.size(), raw.size(), cliques.size());

    std::vector<Cluster> out;
    out.reserve(cliques.size());
    for (auto& nc : cliques) {
      std::stable_sort(nc.pair_idx.begin(), nc.pair_idx.end(),
                       [&pairs](std::size_t x, std::size_t y) {
                         return pairs[x].score > pairs[y].score;
                       });
      Cluster c;
      for (const auto id : nc.nodes) {
        auto& side = nodes[id].second == 0 ? c.keys_a : c.keys_b;
        side.push_back(nodes[id].first);
      }
      c.pairs.reserve(nc.pair_idx.size());
      for (const auto idx : nc.pair_idx) c.pairs.push_back(pairs[idx]);
      out.push_back(std::move(c));
    }

    // Order: best pair first, then lowest member key (ids follow key order).
    std::vector<std::size_t> order(out.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::sort(order.begin(), order.end(), [&](std::size_t x, std::size_t y) {
      if (out[x].top_score() != out[y].top_score())
        return out[x].top_score() > out[y].top_score();
      return cliques[x].nodes.front() < cliques[y].nodes.front();
    });
    std::vector<Cluster> sorted;
    sorted.reserve(out.size());
    for (const auto i : order) sorted.push_back(std::move(out[i]));
    return sorted;
  }
};

std::unique_ptr<IClusterBuilder> make_clique_cluster_builder() {
  return std::make_unique<CliqueClusterBuilder>();
}
} // namespace recmatch::cluster
