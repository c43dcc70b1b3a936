#pragma once
#include <cstdint>
#include <memory>
#include <span>
#include <utility>
#include <variant>
#include <vector>

#include "recmatch/cluster/cluster.hpp"
#include "recmatch/filter/filter.hpp"
#include "recmatch/index/index.hpp"
#include "recmatch/score/score.hpp"
#include "recmatch/util/util.hpp"
#include "recmatch/variator/variator.hpp"

namespace recmatch::match {

/** Cross-matching (two tables) or deduplication (one table). */
enum class Mode : std::uint8_t { Match, Dedup };

/**
 * Scorer given at construction: a scorer object, a field -> similarity
 * mapping (shorthand for the sim-sum scorer) or a two-row callback.
 */
using ScorerSpec = std::variant<std::shared_ptr<const score::IScorer>,
                                score::FieldSimilarities, score::ScoreFn>;

/**
 * Construction inputs.
 *  - table_b: null selects deduplication of table_a
 *  - variator: null means every row is its only variation
 *  - filters: a pair is dropped as soon as one filter rejects it
 */
struct MatcherSetup {
  std::shared_ptr<const index::IIndex> index;
  ScorerSpec scorer;
  std::shared_ptr<const util::Table> table_a;
  std::shared_ptr<const util::Table> table_b;
  std::shared_ptr<const variator::IVariator> variator;
  std::vector<std::shared_ptr<const filter::IFilter>> filters;
};

/**
 * Closed score interval [lower, upper].
 * Errors when used: InvalidArgument if a bound is NaN or lower > upper.
 */
struct RangeParams {
  double lower{0.7};
  double upper{1.0};
};

/** Cluster members by table; keys_b stays empty in dedup mode. */
struct ClusterKeys {
  std::vector<util::RowKey> keys_a;
  std::vector<util::RowKey> keys_b;

  bool operator==(const ClusterKeys&) const = default;
};

/**
 * Scored, immutable result of one matching run.
 *
 * All pairs are scored eagerly at construction; queries never mutate the
 * matcher. Clusters are rebuilt for every query interval.
 * Thread-safety: YES (const).
 */
class IMatcher {
public:
  virtual ~IMatcher() = default;

  virtual Mode mode() const noexcept = 0;

  virtual const util::Table& table_a() const noexcept = 0;

  /** Same table as table_a() in deduplication mode. */
  virtual const util::Table& table_b() const noexcept = 0;

  /**
   * Every kept pair, ascending by score (stable with respect to candidate
   * order). In match mode at most one pair per left key and per right key.
   */
  virtual std::span<const util::ScoredPair> pairs() const noexcept = 0;

  /** scores()[i] == pairs()[i].score. */
  virtual std::span<const double> scores() const noexcept = 0;

  /** Pairs with lower <= score <= upper, ascending. */
  virtual util::Expected<std::span<const util::ScoredPair>>
  pairs_within(const RangeParams& range) const = 0;

  /**
   * Purpose: Clique clusters over the pairs inside 'range', processed from
   * the highest score down (see cluster::IClusterBuilder::build).
   * In match mode left and right keys are distinct nodes.
   */
  virtual util::Expected<std::vector<cluster::Cluster>>
  clusters_within(const RangeParams& range) const = 0;

  /** Member keys of clusters_within(range), same order. */
  virtual util::Expected<std::vector<ClusterKeys>>
  cluster_keys_within(const RangeParams& range) const = 0;

  /** Number of pairs with score >= threshold. */
  virtual std::size_t count_at_or_above(double threshold) const noexcept = 0;
};

/**
 * [first, last) positions in ascending 'scores' with lo <= score <= hi.
 * Yields an empty range when lo > hi.
 */
std::pair<std::size_t, std::size_t>
closed_range(std::span<const double> scores, double lo, double hi) noexcept;

/** [first, last) positions in ascending 'scores' with lo < score <= hi. */
std::pair<std::size_t, std::size_t>
half_open_range(std::span<const double> scores, double lo, double hi) noexcept;

/** InvalidArgument for NaN bounds or lower > upper. */
util::Expected<void> validate(const RangeParams& range);

/**
 * Purpose:
 *   Run the whole pipeline once:
 *     (1) candidate pairs from the index (match or dedup pairer),
 *     (2) drop pairs rejected by any filter,
 *     (3) score every variation of a against every variation of b and keep
 *         the maximum non-refused score,
 *     (4) stable sort ascending by score,
 *     (5) match mode only: greedy one-to-one reduction from the top score
 *         down; a pair survives only if neither key was claimed already.
 *
 * Errors:
 *   - InvalidArgument: null index/table or empty scorer spec; a scorer
 *     returned a score outside [0, 1]
 *   - DuplicateKey / FieldMismatch: from the pairer
 *   - Unscored: every variation combination of some pair was refused
 *   - anything the index, filters, variator or scorer report
 *
 * Complexity: O(C * V^2 * S + C log C) for C candidates, V variations per
 * row and S the scorer cost.
 */
util::Expected<std::unique_ptr<IMatcher>>
make_threshold_matcher(MatcherSetup setup);

} // namespace recmatch::match
