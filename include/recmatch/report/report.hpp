#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "recmatch/match/match.hpp"
#include "recmatch/util/util.hpp"

namespace recmatch::report {

/**
 * Report interval and exact-match handling.
 *  - lower/upper: closed score interval
 *  - include_exact_matches: false drops pairs (or whole clusters) scoring 1.0
 */
struct ReportParams {
  double lower{0.7};
  double upper{1.0};
  bool include_exact_matches{true};
};

/**
 * Sampling configuration.
 * Units:
 *  - sample_counts: pairs kept per sub-range (the lowest-scoring ones)
 *  - step: sub-range width, walking down from upper to lower
 */
struct SampleParams {
  std::size_t sample_counts{5};
  double lower{0.7};
  double upper{1.0};
  double step{0.05};
  bool include_exact_matches{true};
};

/**
 * One output line: one record of a pair. Every pair contributes two lines,
 * left record first. values follow Report::fields.
 *  - cluster_idx: set by cluster_report only
 *  - score_range: set by sample_pairs_report only ("upper-lower", 2 decimals)
 */
struct ReportRow {
  std::optional<std::size_t> cluster_idx;
  std::optional<std::string> score_range;
  std::size_t pair_idx{};
  double sim_score{};
  util::RowKey row_key;
  std::vector<util::Value> values;
};

/** Tabular report; fields are the left table's field names in order. */
struct Report {
  std::vector<std::string> fields;
  std::vector<ReportRow> rows;
};

/** How many pairs a single threshold accepts. */
struct Decision {
  double match_threshold{};
  std::size_t matched_pairs{};
  double percent_of_a{}; // matched_pairs / |A| * 100
  double percent_of_b{}; // matched_pairs / |B| * 100
};

/**
 * Purpose: Clusters within [lower, upper], best cluster first; pairs inside a
 * cluster by score descending.
 * Postconditions: with include_exact_matches == false, clusters whose pairs
 * all scored exactly 1.0 are skipped (their index is still consumed).
 * Errors: InvalidArgument on a bad interval; NotFound if a key has no row.
 */
util::Expected<Report> cluster_report(const match::IMatcher& matcher,
                                      const ReportParams& params = {});

/** Pairs within [lower, upper] by score descending. */
util::Expected<Report> all_pairs_report(const match::IMatcher& matcher,
                                        const ReportParams& params = {});

/**
 * Sub-range bounds for sampling, highest first: upper, upper - step, ...
 * (while above lower), then lower. Consecutive entries form (lo, hi].
 * Errors: InvalidArgument for NaN bounds, lower > upper or step <= 0.
 */
util::Expected<std::vector<double>> sample_bounds(const SampleParams& params);

/**
 * Purpose: For each sub-range (lo, hi] from sample_bounds(), the
 * sample_counts lowest-scoring pairs, listed highest first.
 */
util::Expected<Report> sample_pairs_report(const match::IMatcher& matcher,
                                           const SampleParams& params = {});

/** Pairs scoring >= match_threshold, absolute and relative to each table. */
util::Expected<Decision> decide(const match::IMatcher& matcher,
                                double match_threshold);

/** Writes the decision at info level. */
void log_decision(const Decision& d);

} // namespace recmatch::report
