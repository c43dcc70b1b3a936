#include "recmatch/similarity/similarity.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

namespace recmatch::similarity {
using util::Date;
using util::Expected;
using util::MatchError;
using util::Value;

// -----------------------------
// ASCII folding
// -----------------------------

namespace {
constexpr unsigned kFoldFirst = 0xC0;
constexpr unsigned kFoldLast = 0x17F;

// ASCII spelling of U+00C0..U+017F.
constexpr const char* kFold[kFoldLast - kFoldFirst + 1] = {
    // U+00C0
    "A", "A", "A", "A", "A", "A", "AE", "C", "E", "E", "E", "E", "I", "I", "I",
    "I",
    // U+00D0
    "D", "N", "O", "O", "O", "O", "O", "x", "O", "U", "U", "U", "U", "Y", "Th",
    "ss",
    // U+00E0
    "a", "a", "a", "a", "a", "a", "ae", "c", "e", "e", "e", "e", "i", "i", "i",
    "i",
    // U+00F0
    "d", "n", "o", "o", "o", "o", "o", "/", "o", "u", "u", "u", "u", "y", "th",
    "y",
    // U+0100
    "A", "a", "A", "a", "A", "a", "C", "c", "C", "c", "C", "c", "C", "c", "D",
    "d",
    // U+0110
    "D", "d", "E", "e", "E", "e", "E", "e", "E", "e", "E", "e", "G", "g", "G",
    "g",
    // U+0120
    "G", "g", "G", "g", "H", "h", "H", "h", "I", "i", "I", "i", "I", "i", "I",
    "i",
    // U+0130
    "I", "i", "IJ", "ij", "J", "j", "K", "k", "q", "L", "l", "L", "l", "L",
    "l", "L",
    // U+0140
    "l", "L", "l", "N", "n", "N", "n", "N", "n", "'n", "NG", "ng", "O", "o",
    "O", "o",
    // U+0150
    "O", "o", "OE", "oe", "R", "r", "R", "r", "R", "r", "S", "s", "S", "s",
    "S", "s",
    // U+0160
    "S", "s", "T", "t", "T", "t", "T", "t", "U", "u", "U", "u", "U", "u", "U",
    "u",
    // U+0170
    "U", "u", "U", "u", "W", "w", "Y", "y", "Y", "Z", "z", "Z", "z", "Z", "z",
    "s",
};
} // namespace

std::string fold_to_ascii(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size();) {
    const auto c0 = static_cast<unsigned char>(s[i]);
    // The folded range is all two-byte sequences.
    if ((c0 & 0xE0u) == 0xC0u && i + 1 < s.size()) {
      const auto c1 = static_cast<unsigned char>(s[i + 1]);
      if ((c1 & 0xC0u) == 0x80u) {
        const unsigned cp = ((c0 & 0x1Fu) << 6) | (c1 & 0x3Fu);
        if (cp >= kFoldFirst && cp <= kFoldLast) {
          out += kFold[cp - kFoldFirst];
          i += 2;
          continue;
        }
      }
    }
    out += s[i];
    ++i;
  }
  return out;
}

// -----------------------------
// Raw metrics
// -----------------------------

double levenshtein_ratio(std::string_view a, std::string_view b) {
  const std::size_t lensum = a.size() + b.size();
  if (lensum == 0) return 1.0;

  // With substitution cost 2 the distance is |a|+|b| - 2*LCS.
  std::vector<std::size_t> prev(b.size() + 1, 0), cur(b.size() + 1, 0);
  for (std::size_t i = 1; i <= a.size(); ++i) {
    for (std::size_t j = 1; j <= b.size(); ++j) {
      cur[j] = (a[i - 1] == b[j - 1])
                 ? prev[j - 1] + 1
                 : std::max(prev[j], cur[j - 1]);
    }
    std::swap(prev, cur);
  }
  const std::size_t lcs = prev[b.size()];
  return static_cast<double>(2 * lcs) / static_cast<double>(lensum);
}

double jaro(std::string_view a, std::string_view b) {
  if (a.empty() && b.empty()) return 1.0;
  if (a.empty() || b.empty()) return 0.0;

  const std::size_t longest = std::max(a.size(), b.size());
  const std::size_t window = longest / 2 > 0 ? longest / 2 - 1 : 0;

  std::vector<bool> a_hit(a.size(), false), b_hit(b.size(), false);
  std::size_t m = 0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    const std::size_t lo = i > window ? i - window : 0;
    const std::size_t hi = std::min(i + window + 1, b.size());
    for (std::size_t j = lo; j < hi; ++j) {
      if (b_hit[j] || a[i] != b[j]) continue;
      a_hit[i] = b_hit[j] = true;
      ++m;
      break;
    }
  }
  if (m == 0) return 0.0;

  std::size_t half_transpositions = 0;
  for (std::size_t i = 0, j = 0; i < a.size(); ++i) {
    if (!a_hit[i]) continue;
    while (!b_hit[j]) ++j;
    if (a[i] != b[j]) ++half_transpositions;
    ++j;
  }
  const double md = static_cast<double>(m);
  const double t = static_cast<double>(half_transpositions) / 2.0;
  return (md / static_cast<double>(a.size()) +
          md / static_cast<double>(b.size()) + (md - t) / md) / 3.0;
}

double jaro_winkler(std::string_view a, std::string_view b,
                    double prefix_weight) {
  const double j = jaro(a, b);
  std::size_t l = 0;
  const std::size_t max_l = std::min<std::size_t>({4, a.size(), b.size()});
  while (l < max_l && a[l] == b[l]) ++l;
  return j + static_cast<double>(l) * prefix_weight * (1.0 - j);
}

// -----------------------------
// Field similarities
// -----------------------------

namespace {
inline double clamp01(double v) noexcept {
  if (!(v > 0.0)) return 0.0; // NaN -> 0
  return v > 1.0 ? 1.0 : v;
}

std::string yyyymmdd(const Date& d) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d%02u%02u", static_cast<int>(d.year()),
                static_cast<unsigned>(d.month()),
                static_cast<unsigned>(d.day()));
  return buf;
}
} // namespace

class StringSimilarity final : public ISimilarity {
public:
  Expected<double> sim(const Value& a, const Value& b) const override {
    const auto* sa = std::get_if<std::string>(&a);
    const auto* sb = std::get_if<std::string>(&b);
    if (!sa || !sb) return tl::unexpected(MatchError::TypeMismatch);
    return levenshtein_ratio(fold_to_ascii(*sa), fold_to_ascii(*sb));
  }
};

class JaroWinklerSimilarity final : public ISimilarity {
public:
  explicit JaroWinklerSimilarity(JaroWinklerParams p) : p_(p) {
  }

  Expected<double> sim(const Value& a, const Value& b) const override {
    const auto* sa = std::get_if<std::string>(&a);
    const auto* sb = std::get_if<std::string>(&b);
    if (!sa || !sb) return tl::unexpected(MatchError::TypeMismatch);
    return clamp01(jaro_winkler(fold_to_ascii(*sa), fold_to_ascii(*sb),
                                p_.prefix_weight));
  }

private:
  JaroWinklerParams p_;
};

class DateSimilarity final : public ISimilarity {
public:
  explicit DateSimilarity(DateParams p) : p_(p) {
  }

  Expected<double> sim(const Value& a, const Value& b) const override {
    const auto* da = std::get_if<Date>(&a);
    const auto* db = std::get_if<Date>(&b);
    if (!da || !db || !da->ok() || !db->ok())
      return tl::unexpected(MatchError::TypeMismatch);

    const auto days = std::chrono::sys_days(*da) - std::chrono::sys_days(*db);
    const auto d = std::abs(days.count());
    if (d < p_.days_max_diff)
      return 1.0 - static_cast<double>(d) / static_cast<double>(p_.days_max_diff);

    const unsigned am = static_cast<unsigned>(da->month());
    const unsigned ad = static_cast<unsigned>(da->day());
    const unsigned bm = static_cast<unsigned>(db->month());
    const unsigned bd = static_cast<unsigned>(db->day());
    if (da->year() == db->year() && am == bd && ad == bm) return 0.5;
    if (da->year() == db->year() && ad == bd)
      return levenshtein_ratio(yyyymmdd(*da), yyyymmdd(*db));
    return 0.0;
  }

private:
  DateParams p_;
};

class AbsoluteNumericalSimilarity final : public ISimilarity {
public:
  explicit AbsoluteNumericalSimilarity(double d_max) : d_max_(d_max) {
  }

  Expected<double> sim(const Value& a, const Value& b) const override {
    const auto na = util::as_number(a);
    const auto nb = util::as_number(b);
    if (!na || !nb) return tl::unexpected(MatchError::TypeMismatch);
    const double diff = std::abs(*na - *nb);
    if (d_max_ <= 0.0) return diff == 0.0 ? 1.0 : 0.0;
    return clamp01(1.0 - diff / d_max_);
  }

private:
  double d_max_;
};

class RelativeNumericalSimilarity final : public ISimilarity {
public:
  explicit RelativeNumericalSimilarity(double pc_max) : pc_max_(pc_max) {
  }

  Expected<double> sim(const Value& a, const Value& b) const override {
    const auto na = util::as_number(a);
    const auto nb = util::as_number(b);
    if (!na || !nb) return tl::unexpected(MatchError::TypeMismatch);
    const double diff = std::abs(*na - *nb);
    if (diff == 0.0) return 1.0;
    const double base = std::max(std::abs(*na), std::abs(*nb));
    const double pct = diff / base * 100.0;
    if (pc_max_ <= 0.0) return 0.0;
    return clamp01(1.0 - pct / pc_max_);
  }

private:
  double pc_max_;
};

class FuncSimilarity final : public ISimilarity {
public:
  explicit FuncSimilarity(SimilarityFn fn) : fn_(std::move(fn)) {
  }

  Expected<double> sim(const Value& a, const Value& b) const override {
    if (!fn_) return tl::unexpected(MatchError::InvalidArgument);
    return clamp01(fn_(a, b));
  }

private:
  SimilarityFn fn_;
};

// -----------------------------
// Factories
// -----------------------------

std::unique_ptr<ISimilarity> make_string_similarity() {
  return std::make_unique<StringSimilarity>();
}

std::unique_ptr<ISimilarity>
make_jaro_winkler_similarity(JaroWinklerParams params) {
  return std::make_unique<JaroWinklerSimilarity>(params);
}

std::unique_ptr<ISimilarity> make_date_similarity(DateParams params) {
  return std::make_unique<DateSimilarity>(params);
}

std::unique_ptr<ISimilarity> make_absolute_numerical_similarity(double d_max) {
  return std::make_unique<AbsoluteNumericalSimilarity>(d_max);
}

std::unique_ptr<ISimilarity> make_relative_numerical_similarity(double pc_max) {
  return std::make_unique<RelativeNumericalSimilarity>(pc_max);
}

std::unique_ptr<ISimilarity> make_func_similarity(SimilarityFn fn) {
  return std::make_unique<FuncSimilarity>(std::move(fn));
}
} // namespace recmatch::similarity
