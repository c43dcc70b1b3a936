#include "recmatch/report/report.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include <spdlog/spdlog.h>

namespace recmatch::report {
using match::IMatcher;
using match::RangeParams;
using util::Expected;
using util::MatchError;
using util::RowKey;
using util::ScoredPair;
using util::Table;
using util::Value;

namespace {
// Slack for accumulated step error when walking sub-range bounds.
constexpr double kBoundEps = 1e-9;

Expected<std::vector<Value>> values_of(const Table& t, const RowKey& key,
                                       const std::vector<std::string>& fields) {
  const auto pos = t.find(key);
  if (!pos) {
    spdlog::error("report: no row with key '{}'", util::to_string(key));
    return tl::unexpected(MatchError::NotFound);
  }
  const auto& row = t.row(*pos);
  std::vector<Value> out;
  out.reserve(fields.size());
  for (const auto& f : fields) {
    const Value* v = row.find(f);
    if (!v) return tl::unexpected(MatchError::MissingField);
    out.push_back(*v);
  }
  return out;
}

class ReportWriter {
public:
  explicit ReportWriter(const IMatcher& m) : m_(m) {
    report_.fields = m.table_a().fields();
  }

  Expected<void> add_pair(const ScoredPair& p, std::size_t pair_idx,
                          std::optional<std::size_t> cluster_idx,
                          const std::optional<std::string>& score_range) {
    auto va = values_of(m_.table_a(), p.key_a, report_.fields);
    if (!va) return tl::unexpected(va.error());
    auto vb = values_of(m_.table_b(), p.key_b, report_.fields);
    if (!vb) return tl::unexpected(vb.error());

    report_.rows.push_back(ReportRow{cluster_idx, score_range, pair_idx,
                                     p.score, p.key_a, std::move(*va)});
    report_.rows.push_back(ReportRow{cluster_idx, score_range, pair_idx,
                                     p.score, p.key_b, std::move(*vb)});
    return {};
  }

  Report take() { return std::move(report_); }

private:
  const IMatcher& m_;
  Report report_;
};

std::string range_label(double hi, double lo) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f-%.2f", hi, lo);
  return buf;
}
} // namespace

// -----------------------------
// Cluster / pair reports
// -----------------------------

Expected<Report> cluster_report(const IMatcher& matcher,
                                const ReportParams& params) {
  auto clusters =
      matcher.clusters_within(RangeParams{params.lower, params.upper});
  if (!clusters) return tl::unexpected(clusters.error());

  ReportWriter w(matcher);
  for (std::size_t ci = 0; ci < clusters->size(); ++ci) {
    const auto& c = (*clusters)[ci];
    const bool all_exact =
        std::all_of(c.pairs.begin(), c.pairs.end(),
                    [](const ScoredPair& p) { return p.score == 1.0; });
    if (!params.include_exact_matches && all_exact) continue;
    for (std::size_t pi = 0; pi < c.pairs.size(); ++pi) {
      if (auto ok = w.add_pair(c.pairs[pi], pi, ci, std::nullopt); !ok)
        return tl::unexpected(ok.error());
    }
  }
  return w.take();
}

Expected<Report> all_pairs_report(const IMatcher& matcher,
                                  const ReportParams& params) {
  auto pairs = matcher.pairs_within(RangeParams{params.lower, params.upper});
  if (!pairs) return tl::unexpected(pairs.error());

  ReportWriter w(matcher);
  std::size_t pair_idx = 0;
  for (auto it = pairs->rbegin(); it != pairs->rend(); ++it, ++pair_idx) {
    if (!params.include_exact_matches && it->score == 1.0) continue;
    if (auto ok = w.add_pair(*it, pair_idx, std::nullopt, std::nullopt); !ok)
      return tl::unexpected(ok.error());
  }
  return w.take();
}

// -----------------------------
// Sampling
// -----------------------------

Expected<std::vector<double>> sample_bounds(const SampleParams& params) {
  if (std::isnan(params.lower) || std::isnan(params.upper) ||
      params.lower > params.upper || !(params.step > 0.0))
    return tl::unexpected(MatchError::InvalidArgument);

  std::vector<double> bounds;
  for (std::size_t i = 0;; ++i) {
    const double b = params.upper - static_cast<double>(i) * params.step;
    if (!(b > params.lower + kBoundEps)) break;
    bounds.push_back(b);
  }
  bounds.push_back(params.lower);
  return bounds;
}

Expected<Report> sample_pairs_report(const IMatcher& matcher,
                                     const SampleParams& params) {
  auto boundsE = sample_bounds(params);
  if (!boundsE) return tl::unexpected(boundsE.error());
  const auto& bounds = *boundsE;

  const auto pairs = matcher.pairs();
  ReportWriter w(matcher);
  for (std::size_t i = 0; i + 1 < bounds.size(); ++i) {
    const double hi = bounds[i];
    const double lo = bounds[i + 1];
    const auto [first, last] = match::half_open_range(matcher.scores(), lo, hi);
    const std::size_t end = std::min(last, first + params.sample_counts);
    const std::optional<std::string> label = range_label(hi, lo);

    std::size_t pair_idx = 0;
    for (std::size_t k = end; k > first; --k, ++pair_idx) {
      const auto& p = pairs[k - 1];
      if (!params.include_exact_matches && p.score == 1.0) continue;
      if (auto ok = w.add_pair(p, pair_idx, std::nullopt, label); !ok)
        return tl::unexpected(ok.error());
    }
  }
  return w.take();
}

// -----------------------------
// Decision
// -----------------------------

Expected<Decision> decide(const IMatcher& matcher, double match_threshold) {
  if (std::isnan(match_threshold))
    return tl::unexpected(MatchError::InvalidArgument);

  Decision d;
  d.match_threshold = match_threshold;
  d.matched_pairs = matcher.count_at_or_above(match_threshold);
  const auto pct = [&d](std::size_t n) {
    return n == 0 ? 0.0
                  : static_cast<double>(d.matched_pairs) /
                        static_cast<double>(n) * 100.0;
  };
  d.percent_of_a = pct(matcher.table_a().size());
  d.percent_of_b = pct(matcher.table_b().size());
  return d;
}

void log_decision(const Decision& d) {
  spdlog::info("for threshold {:.3f}: {} matched pairs ({}% of A, {}% of B)",
               d.match_threshold, d.matched_pairs,
               static_cast<long long>(d.percent_of_a),
               static_cast<long long>(d.percent_of_b));
}
} // namespace recmatch::report
