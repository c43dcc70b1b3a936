#include "recmatch/match/match.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <set>
#include <unordered_map>
#include <utility>

#include <spdlog/spdlog.h>

#include "recmatch/pair/pair.hpp"

namespace recmatch::match {
using cluster::Cluster;
using cluster::IClusterBuilder;
using cluster::KeySpace;
using pair::CandidatePair;
using pair::IPairer;
using score::IScorer;
using util::Expected;
using util::MatchError;
using util::Row;
using util::RowKey;
using util::ScoredPair;

// -----------------------------
// Range helpers
// -----------------------------

std::pair<std::size_t, std::size_t>
closed_range(std::span<const double> scores, double lo, double hi) noexcept {
  if (!(lo <= hi)) return {0, 0};
  const auto first = std::lower_bound(scores.begin(), scores.end(), lo);
  const auto last = std::upper_bound(first, scores.end(), hi);
  return {static_cast<std::size_t>(first - scores.begin()),
          static_cast<std::size_t>(last - scores.begin())};
}

std::pair<std::size_t, std::size_t>
half_open_range(std::span<const double> scores, double lo, double hi) noexcept {
  if (!(lo < hi)) return {0, 0};
  const auto first = std::upper_bound(scores.begin(), scores.end(), lo);
  const auto last = std::upper_bound(first, scores.end(), hi);
  return {static_cast<std::size_t>(first - scores.begin()),
          static_cast<std::size_t>(last - scores.begin())};
}

Expected<void> validate(const RangeParams& range) {
  if (std::isnan(range.lower) || std::isnan(range.upper) ||
      range.lower > range.upper)
    return tl::unexpected(MatchError::InvalidArgument);
  return {};
}

// -----------------------------
// Pipeline stages
// -----------------------------

namespace {
Expected<std::shared_ptr<const IScorer>> resolve_scorer(ScorerSpec spec) {
  if (auto* s = std::get_if<std::shared_ptr<const IScorer>>(&spec)) {
    if (!*s) return tl::unexpected(MatchError::InvalidArgument);
    return std::move(*s);
  }
  if (auto* f = std::get_if<score::FieldSimilarities>(&spec)) {
    if (f->empty()) return tl::unexpected(MatchError::InvalidArgument);
    return std::shared_ptr<const IScorer>(
        score::make_sim_sum_scorer(std::move(*f)));
  }
  auto& fn = std::get<score::ScoreFn>(spec);
  if (!fn) return tl::unexpected(MatchError::InvalidArgument);
  return std::shared_ptr<const IScorer>(score::make_func_scorer(std::move(fn)));
}

Expected<bool> passes_filters(
    const CandidatePair& p,
    const std::vector<std::shared_ptr<const filter::IFilter>>& filters) {
  for (const auto& f : filters) {
    if (!f) return tl::unexpected(MatchError::InvalidArgument);
    auto ok = f->valid(*p.a, *p.b);
    if (!ok) return tl::unexpected(ok.error());
    if (!*ok) return false;
  }
  return true;
}

// Variations are computed once per row and reused across its pairs.
class VariationCache {
public:
  explicit VariationCache(const variator::IVariator& v) : v_(v) {
  }

  Expected<const std::vector<Row>*> get(const Row& row) {
    auto it = cache_.find(&row);
    if (it == cache_.end()) {
      auto vars = v_.variations(row);
      if (!vars) return tl::unexpected(vars.error());
      if (vars->empty()) return tl::unexpected(MatchError::Internal);
      it = cache_.emplace(&row, std::move(*vars)).first;
    }
    return &it->second;
  }

private:
  const variator::IVariator& v_;
  std::unordered_map<const Row*, std::vector<Row>> cache_;
};

// Highest non-refused score over every variation combination.
Expected<double> best_score(const IScorer& scorer, const std::vector<Row>& va,
                            const std::vector<Row>& vb) {
  std::optional<double> best;
  for (const auto& ra : va) {
    for (const auto& rb : vb) {
      auto v = scorer.score(ra, rb);
      if (!v) return tl::unexpected(v.error());
      if (score::refused(*v)) continue;
      const double s = std::get<double>(*v);
      if (!(s >= 0.0 && s <= 1.0)) {
        spdlog::error("matcher: score {} for ({}, {}) is outside [0, 1]", s,
                      util::to_string(ra.key), util::to_string(rb.key));
        return tl::unexpected(MatchError::InvalidArgument);
      }
      if (!best || s > *best) best = s;
    }
  }
  if (!best) {
    spdlog::error("matcher: every scorer refused pair ({}, {}); wrap veto "
                  "scorers in a max/min combinator",
                  util::to_string(va.front().key),
                  util::to_string(vb.front().key));
    return tl::unexpected(MatchError::Unscored);
  }
  return *best;
}

// Keeps, from the top score down, pairs whose keys are both unclaimed.
std::vector<ScoredPair> one_to_one(std::vector<ScoredPair> sorted) {
  std::set<RowKey> claimed_a;
  std::set<RowKey> claimed_b;
  std::vector<ScoredPair> kept;
  for (auto it = sorted.rbegin(); it != sorted.rend(); ++it) {
    if (claimed_a.count(it->key_a) || claimed_b.count(it->key_b)) continue;
    claimed_a.insert(it->key_a);
    claimed_b.insert(it->key_b);
    kept.push_back(std::move(*it));
  }
  std::reverse(kept.begin(), kept.end());
  return kept;
}
} // namespace

// -----------------------------
// Matcher
// -----------------------------

class ThresholdMatcher final : public IMatcher {
public:
  ThresholdMatcher(Mode mode, std::unique_ptr<IPairer> pairer,
                   std::vector<ScoredPair> pairs)
    : mode_(mode), pairer_(std::move(pairer)), pairs_(std::move(pairs)),
      builder_(cluster::make_clique_cluster_builder()) {
    scores_.reserve(pairs_.size());
    for (const auto& p : pairs_) scores_.push_back(p.score);
  }

  Mode mode() const noexcept override { return mode_; }
  const util::Table& table_a() const noexcept override {
    return pairer_->table_a();
  }
  const util::Table& table_b() const noexcept override {
    return pairer_->table_b();
  }
  std::span<const ScoredPair> pairs() const noexcept override { return pairs_; }
  std::span<const double> scores() const noexcept override { return scores_; }

  Expected<std::span<const ScoredPair>>
  pairs_within(const RangeParams& range) const override {
    if (auto ok = validate(range); !ok) return tl::unexpected(ok.error());
    const auto [first, last] = closed_range(scores_, range.lower, range.upper);
    return std::span<const ScoredPair>(pairs_).subspan(first, last - first);
  }

  Expected<std::vector<Cluster>>
  clusters_within(const RangeParams& range) const override {
    auto sel = pairs_within(range);
    if (!sel) return tl::unexpected(sel.error());
    const std::vector<ScoredPair> highest_first(sel->rbegin(), sel->rend());
    return builder_->build(highest_first, mode_ == Mode::Match
                                              ? KeySpace::Separate
                                              : KeySpace::Shared);
  }

  Expected<std::vector<ClusterKeys>>
  cluster_keys_within(const RangeParams& range) const override {
    auto clusters = clusters_within(range);
    if (!clusters) return tl::unexpected(clusters.error());
    std::vector<ClusterKeys> out;
    out.reserve(clusters->size());
    for (auto& c : *clusters)
      out.push_back(ClusterKeys{std::move(c.keys_a), std::move(c.keys_b)});
    return out;
  }

  std::size_t count_at_or_above(double threshold) const noexcept override {
    const auto first =
        std::lower_bound(scores_.begin(), scores_.end(), threshold);
    return static_cast<std::size_t>(scores_.end() - first);
  }

private:
  Mode mode_;
  std::unique_ptr<IPairer> pairer_;
  std::vector<ScoredPair> pairs_; // ascending by score
  std::vector<double> scores_;    // parallel to pairs_
  std::unique_ptr<IClusterBuilder> builder_;
};

// -----------------------------
// Factory
// -----------------------------

Expected<std::unique_ptr<IMatcher>> make_threshold_matcher(MatcherSetup setup) {
  if (!setup.index || !setup.table_a)
    return tl::unexpected(MatchError::InvalidArgument);

  auto scorerE = resolve_scorer(std::move(setup.scorer));
  if (!scorerE) return tl::unexpected(scorerE.error());
  const IScorer& scorer = **scorerE;

  const Mode mode = setup.table_b ? Mode::Match : Mode::Dedup;
  auto pairerE =
      mode == Mode::Match
        ? pair::make_match_pairer(setup.table_a, setup.table_b, setup.index)
        : pair::make_dedup_pairer(setup.table_a, setup.index);
  if (!pairerE) return tl::unexpected(pairerE.error());

  auto candidates = (*pairerE)->pairs();
  if (!candidates) return tl::unexpected(candidates.error());

  std::shared_ptr<const variator::IVariator> var = setup.variator;
  if (!var) var = variator::make_identity_variator();
  VariationCache variations(*var);

  std::vector<ScoredPair> scored;
  scored.reserve(candidates->size());
  for (const auto& cand : *candidates) {
    auto keep = passes_filters(cand, setup.filters);
    if (!keep) return tl::unexpected(keep.error());
    if (!*keep) continue;

    auto va = variations.get(*cand.a);
    if (!va) return tl::unexpected(va.error());
    auto vb = variations.get(*cand.b);
    if (!vb) return tl::unexpected(vb.error());

    auto s = best_score(scorer, **va, **vb);
    if (!s) return tl::unexpected(s.error());
    scored.push_back(ScoredPair{*s, cand.a->key, cand.b->key});
  }
  spdlog::debug("matcher: {} of {} candidate pairs passed the filters",
                scored.size(), candidates->size());

  std::stable_sort(scored.begin(), scored.end(),
                   [](const ScoredPair& x, const ScoredPair& y) {
                     return x.score < y.score;
                   });
  const std::size_t before = scored.size();
  if (mode == Mode::Match) scored = one_to_one(std::move(scored));

  spdlog::info("matcher: {} mode, {} scored pairs, {} kept",
               mode == Mode::Match ? "match" : "dedup", before, scored.size());
  return std::unique_ptr<IMatcher>(std::make_unique<ThresholdMatcher>(
      mode, std::move(*pairerE), std::move(scored)));
}
} // namespace recmatch::match
