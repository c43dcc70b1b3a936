#pragma once
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "recmatch/util/util.hpp"

namespace recmatch::similarity {

/**
 * Jaro-Winkler parameters.
 *  - prefix_weight: boost per common leading character (max 4 characters)
 */
struct JaroWinklerParams {
  double prefix_weight{0.1};
};

/**
 * Date proximity parameters.
 *  - days_max_diff: days; closer dates score 1 - days / days_max_diff
 */
struct DateParams {
  int days_max_diff{30};
};

/**
 * Field similarity: compares two non-null cell values.
 * Postconditions: result in [0, 1]; 1 means identical.
 * Thread-safety: YES (stateless apart from configuration).
 */
class ISimilarity {
public:
  virtual ~ISimilarity() = default;

  /**
   * Errors: TypeMismatch when a value is not of the kind this similarity
   * understands (e.g. numbers given to a string similarity).
   */
  virtual util::Expected<double>
  sim(const util::Value& a, const util::Value& b) const = 0;
};

using SimilarityFn = std::function<double(const util::Value&,
                                          const util::Value&)>;

/**
 * Levenshtein ratio (substitution costs 2): 2*LCS / (|a|+|b|), over the
 * fold_to_ascii() forms of both strings.
 */
std::unique_ptr<ISimilarity> make_string_similarity();

/**
 * Jaro-Winkler over the fold_to_ascii() forms; favours common prefixes, good
 * for person names.
 */
std::unique_ptr<ISimilarity>
make_jaro_winkler_similarity(JaroWinklerParams params = {});

/**
 * Dates: 1 - days/days_max_diff when closer than days_max_diff; 0.5 when the
 * year matches and day/month are swapped; Levenshtein ratio of YYYYMMDD when
 * year and day match; otherwise 0.
 */
std::unique_ptr<ISimilarity> make_date_similarity(DateParams params = {});

/** Numbers: max(0, 1 - |a-b| / d_max). */
std::unique_ptr<ISimilarity> make_absolute_numerical_similarity(double d_max);

/** Numbers: max(0, 1 - pct / pc_max), pct relative to the larger magnitude. */
std::unique_ptr<ISimilarity> make_relative_numerical_similarity(double pc_max);

/** Caller-supplied similarity; result clamped to [0, 1]. */
std::unique_ptr<ISimilarity> make_func_similarity(SimilarityFn fn);

// -----------------------------
// Raw string metrics (byte-wise)
// -----------------------------

/**
 * UTF-8 text with Latin-1 and Latin Extended-A letters (U+00C0..U+017F)
 * spelled in ASCII: "José" -> "Jose", "Æsir" -> "AEsir", "straße" ->
 * "strasse". Other code points and malformed bytes are copied unchanged.
 */
std::string fold_to_ascii(std::string_view s);

double levenshtein_ratio(std::string_view a, std::string_view b);
double jaro(std::string_view a, std::string_view b);
double jaro_winkler(std::string_view a, std::string_view b,
                    double prefix_weight);

} // namespace recmatch::similarity
