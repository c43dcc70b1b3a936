#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <vector>

#include "recmatch/cluster/cluster.hpp"

using recmatch::cluster::Cluster;
using recmatch::cluster::DisjointSet;
using recmatch::cluster::KeySpace;
using recmatch::cluster::make_clique_cluster_builder;
using recmatch::util::MatchError;
using recmatch::util::RowKey;
using recmatch::util::ScoredPair;

namespace {
ScoredPair sp(double s, std::int64_t a, std::int64_t b) {
  return ScoredPair{s, RowKey{a}, RowKey{b}};
}

std::vector<RowKey> keys(std::initializer_list<std::int64_t> ks) {
  std::vector<RowKey> out;
  for (auto k : ks) out.emplace_back(k);
  return out;
}

bool has_pair(const Cluster& c, const RowKey& x, const RowKey& y) {
  return std::any_of(c.pairs.begin(), c.pairs.end(), [&](const ScoredPair& p) {
    return (p.key_a == x && p.key_b == y) || (p.key_a == y && p.key_b == x);
  });
}
} // namespace

// -----------------------------
// A) Disjoint set
// -----------------------------

TEST(DisjointSet, UniteAndFind) {
  DisjointSet ds(5);
  EXPECT_EQ(ds.size(), 5u);
  ds.unite(0, 1);
  ds.unite(2, 3);
  EXPECT_EQ(ds.find(0), ds.find(1));
  EXPECT_EQ(ds.find(2), ds.find(3));
  EXPECT_NE(ds.find(0), ds.find(2));
  EXPECT_EQ(ds.find(4), 4u);

  const auto root = ds.unite(1, 3);
  EXPECT_EQ(ds.find(0), root);
  EXPECT_EQ(ds.find(2), root);
  EXPECT_EQ(ds.unite(0, 2), root);
}

// -----------------------------
// B) Clique splitting
// -----------------------------

TEST(CliqueBuilder, Triangle_IsOneCluster) {
  const std::vector<ScoredPair> pairs{sp(0.9, 0, 1), sp(0.85, 1, 2),
                                      sp(0.8, 0, 2)};
  auto r = make_clique_cluster_builder()->build(pairs, KeySpace::Shared);
  ASSERT_TRUE(r.has_value());
  ASSERT_EQ(r->size(), 1u);
  EXPECT_EQ((*r)[0].keys_a, keys({0, 1, 2}));
  EXPECT_TRUE((*r)[0].keys_b.empty());
  EXPECT_EQ((*r)[0].size(), 3u);
  EXPECT_EQ((*r)[0].pairs, pairs);
  EXPECT_DOUBLE_EQ((*r)[0].top_score(), 0.9);
}

TEST(CliqueBuilder, Path_SplitsAndDropsSingleton) {
  const std::vector<ScoredPair> pairs{sp(0.9, 0, 1), sp(0.8, 1, 2)};
  auto r = make_clique_cluster_builder()->build(pairs, KeySpace::Shared);
  ASSERT_TRUE(r.has_value());
  ASSERT_EQ(r->size(), 1u);
  EXPECT_EQ((*r)[0].keys_a, keys({0, 1}));
  EXPECT_EQ((*r)[0].pairs, std::vector<ScoredPair>{sp(0.9, 0, 1)});
}

TEST(CliqueBuilder, EveryMemberPairIsPresent_AndNoneCanBeAdded) {
  // K4 minus the 2-3 edge.
  const std::vector<ScoredPair> pairs{sp(0.95, 0, 1), sp(0.9, 0, 2),
                                      sp(0.9, 0, 3), sp(0.85, 1, 2),
                                      sp(0.8, 1, 3)};
  auto r = make_clique_cluster_builder()->build(pairs, KeySpace::Shared);
  ASSERT_TRUE(r.has_value());
  ASSERT_EQ(r->size(), 1u);
  const auto& c = (*r)[0];
  EXPECT_EQ(c.keys_a, keys({0, 1, 2}));
  for (std::size_t i = 0; i < c.keys_a.size(); ++i)
    for (std::size_t j = i + 1; j < c.keys_a.size(); ++j)
      EXPECT_TRUE(has_pair(c, c.keys_a[i], c.keys_a[j]));
  EXPECT_TRUE(std::is_sorted(c.pairs.begin(), c.pairs.end(),
                             [](const ScoredPair& x, const ScoredPair& y) {
                               return x.score > y.score;
                             }));
  // 3 is linked to 0 and 1 but not 2.
  EXPECT_FALSE(has_pair(c, RowKey{std::int64_t{2}}, RowKey{std::int64_t{3}}));
}

TEST(CliqueBuilder, Clusters_OrderedByTopScore_ThenSmallestKey) {
  const std::vector<ScoredPair> pairs{sp(0.99, 40, 41), sp(0.9, 5, 6),
                                      sp(0.9, 1, 2)};
  auto r = make_clique_cluster_builder()->build(pairs, KeySpace::Shared);
  ASSERT_TRUE(r.has_value());
  ASSERT_EQ(r->size(), 3u);
  EXPECT_EQ((*r)[0].keys_a, keys({40, 41}));
  EXPECT_EQ((*r)[1].keys_a, keys({1, 2}));
  EXPECT_EQ((*r)[2].keys_a, keys({5, 6}));
}

TEST(CliqueBuilder, EmptyInput_NoClusters) {
  auto r = make_clique_cluster_builder()->build({}, KeySpace::Shared);
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->empty());
}

// -----------------------------
// C) Key spaces
// -----------------------------

TEST(CliqueBuilder, SelfPair_InSharedSpace_IsInvalid) {
  const std::vector<ScoredPair> pairs{sp(1.0, 3, 3)};
  auto r = make_clique_cluster_builder()->build(pairs, KeySpace::Shared);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), MatchError::InvalidArgument);
}

TEST(CliqueBuilder, SeparateSpace_EqualKeysAreDistinctNodes) {
  // Left 0 - right 0 - left 1: a path across tables, not a triangle.
  const std::vector<ScoredPair> pairs{sp(1.0, 0, 0), sp(0.8, 1, 0)};
  auto r = make_clique_cluster_builder()->build(pairs, KeySpace::Separate);
  ASSERT_TRUE(r.has_value());
  ASSERT_EQ(r->size(), 1u);
  EXPECT_EQ((*r)[0].keys_a, keys({0}));
  EXPECT_EQ((*r)[0].keys_b, keys({0}));
  EXPECT_EQ((*r)[0].pairs, std::vector<ScoredPair>{sp(1.0, 0, 0)});
}
