#pragma once
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "recmatch/similarity/similarity.hpp"
#include "recmatch/util/util.hpp"

namespace recmatch::score {

/** A scorer's statement that it cannot judge a pair; not an error. */
struct Refusal {
  std::string reason;
};

/** Either a similarity in [0, 1] or a refusal. */
using Verdict = std::variant<double, Refusal>;

inline bool refused(const Verdict& v) noexcept {
  return std::holds_alternative<Refusal>(v);
}

/**
 * Turns two records into one similarity score.
 *
 * Refusals travel in the Verdict; Expected errors are reserved for
 * structural problems (missing fields, type mismatches).
 * Thread-safety: YES (const).
 */
class IScorer {
public:
  virtual ~IScorer() = default;

  virtual util::Expected<Verdict> score(const util::Row& a,
                                        const util::Row& b) const = 0;
};

/** Ordered field -> similarity mapping. */
using FieldSimilarities =
std::vector<std::pair<std::string,
                      std::shared_ptr<const similarity::ISimilarity>>>;

using ScoreFn = std::function<double(const util::Row&, const util::Row&)>;
using TransformFn = std::function<double(double)>;

/** Row key -> external grouping value, consulted by the override scorer. */
using GroupValues = std::unordered_map<util::RowKey, util::Value>;

/**
 * Root-mean-square of per-field similarities; a null on either side gives
 * that field 0. Never refuses.
 * Errors: InvalidArgument (no fields), MissingField, TypeMismatch.
 */
std::unique_ptr<IScorer> make_sim_sum_scorer(FieldSimilarities fields);

/**
 * Veto scorer: returns 'score' when 'field' holds equal non-null values on
 * both sides, otherwise refuses. A missing field refuses with
 * ignore_missing, else fails with MissingField. Must be wrapped in a
 * max/min combinator.
 */
std::unique_ptr<IScorer> make_absolute_scorer(std::string field, double score,
                                              bool ignore_missing = false);

/** Max over non-refusing children; refuses only when every child refuses. */
std::unique_ptr<IScorer>
make_max_scorer(std::vector<std::shared_ptr<const IScorer>> children);

/** Min over non-refusing children; refuses only when every child refuses. */
std::unique_ptr<IScorer>
make_min_scorer(std::vector<std::shared_ptr<const IScorer>> children);

/**
 * Wraps 'inner'; when both rows have a grouping value and the values are
 * equal, the inner score is passed through 'transform' (result clamped to
 * [0, 1]). Inner refusals pass through unchanged.
 */
std::unique_ptr<IScorer> make_override_scorer(
    std::shared_ptr<const IScorer> inner, GroupValues values,
    TransformFn transform);

/** Delegates to a caller-supplied function (result clamped to [0, 1]). */
std::unique_ptr<IScorer> make_func_scorer(ScoreFn fn);

} // namespace recmatch::score
