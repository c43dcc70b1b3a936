#include <gtest/gtest.h>
#include <chrono>
#include <string>

#include "recmatch/similarity/similarity.hpp"

using namespace recmatch::similarity;
using recmatch::util::Date;
using recmatch::util::MatchError;
using recmatch::util::Value;

namespace {
Value s(const char* v) { return Value{std::string(v)}; }
Value n(double v) { return Value{v}; }
Value d(int y, unsigned m, unsigned dd) {
  return Value{Date{std::chrono::year{y}, std::chrono::month{m},
                    std::chrono::day{dd}}};
}

double sim_of(const ISimilarity& f, const Value& a, const Value& b) {
  auto r = f.sim(a, b);
  EXPECT_TRUE(r.has_value());
  return r.value_or(-1.0);
}
} // namespace

// -----------------------------
// A) String metrics
// -----------------------------

TEST(StringSimilarity, IndelRatio) {
  auto f = make_string_similarity();
  EXPECT_DOUBLE_EQ(sim_of(*f, s("abc"), s("abc")), 1.0);
  EXPECT_DOUBLE_EQ(sim_of(*f, s("abc"), s("123")), 0.0);
  EXPECT_DOUBLE_EQ(sim_of(*f, s("abce"), s("abcd")), 0.75);
  EXPECT_DOUBLE_EQ(sim_of(*f, s(""), s("")), 1.0);
}

TEST(StringSimilarity, NonString_IsTypeMismatch) {
  auto f = make_string_similarity();
  auto r = f->sim(s("abc"), n(1.0));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), MatchError::TypeMismatch);
}

TEST(FoldToAscii, LatinLettersSpelledInAscii) {
  EXPECT_EQ(fold_to_ascii("Jos\xC3\xA9"), "Jose");
  EXPECT_EQ(fold_to_ascii("\xC3\x86sir"), "AEsir");
  EXPECT_EQ(fold_to_ascii("stra\xC3\x9F" "e"), "strasse");
  EXPECT_EQ(fold_to_ascii("\xC5\x81\xC3\xB3" "d\xC5\xBA"), "Lodz");
  EXPECT_EQ(fold_to_ascii("plain ascii"), "plain ascii");
}

TEST(FoldToAscii, OtherBytesCopied) {
  // Euro sign (three bytes) and a truncated two-byte lead.
  EXPECT_EQ(fold_to_ascii("5\xE2\x82\xAC"), "5\xE2\x82\xAC");
  EXPECT_EQ(fold_to_ascii("a\xC3"), "a\xC3");
}

TEST(StringSimilarity, AccentsFoldBeforeComparing) {
  auto f = make_string_similarity();
  EXPECT_DOUBLE_EQ(sim_of(*f, s("Jos\xC3\xA9"), s("Jose")), 1.0);
  auto jw = make_jaro_winkler_similarity();
  EXPECT_DOUBLE_EQ(sim_of(*jw, s("Bj\xC3\xB6rk"), s("Bjork")), 1.0);
}

TEST(JaroWinklerSimilarity, PrefixBoost) {
  JaroWinklerParams p;
  p.prefix_weight = 0.2;
  auto f = make_jaro_winkler_similarity(p);
  EXPECT_DOUBLE_EQ(sim_of(*f, s("abc"), s("abc")), 1.0);
  EXPECT_DOUBLE_EQ(sim_of(*f, s("abc"), s("123")), 0.0);
  EXPECT_NEAR(sim_of(*f, s("abce"), s("abcd")), 0.9333333333333333, 1e-12);
  EXPECT_NEAR(sim_of(*f, s("wbcd"), s("abcd")), 0.8333333333333334, 1e-12);
}

TEST(JaroWinklerSimilarity, RawJaro_CountsTranspositions) {
  EXPECT_NEAR(jaro("martha", "marhta"), 0.9444444444444445, 1e-12);
  EXPECT_NEAR(jaro_winkler("martha", "marhta", 0.1), 0.9611111111111111,
              1e-12);
  EXPECT_DOUBLE_EQ(jaro("", "abc"), 0.0);
}

// -----------------------------
// B) Dates
// -----------------------------

TEST(DateSimilarity, ProximitySwapAndDigits) {
  auto f = make_date_similarity();
  EXPECT_DOUBLE_EQ(sim_of(*f, d(2000, 10, 11), d(2000, 10, 11)), 1.0);
  // within 30 days
  EXPECT_NEAR(sim_of(*f, d(2000, 10, 11), d(2000, 10, 5)), 0.8, 1e-12);
  EXPECT_NEAR(sim_of(*f, d(2000, 10, 11), d(2000, 11, 5)), 0.16666666666666663,
              1e-12);
  // unrelated
  EXPECT_DOUBLE_EQ(sim_of(*f, d(2000, 10, 11), d(2001, 3, 15)), 0.0);
  // day and month swapped
  EXPECT_DOUBLE_EQ(sim_of(*f, d(2000, 9, 11), d(2000, 11, 9)), 0.5);
  // same year and day, month differs
  EXPECT_DOUBLE_EQ(sim_of(*f, d(2000, 3, 20), d(2000, 8, 20)), 0.875);
}

TEST(DateSimilarity, NonDate_IsTypeMismatch) {
  auto f = make_date_similarity();
  auto r = f->sim(d(2000, 1, 1), s("2000-01-01"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), MatchError::TypeMismatch);
}

// -----------------------------
// C) Numbers
// -----------------------------

TEST(AbsoluteNumericalSimilarity, LinearFalloff) {
  auto f = make_absolute_numerical_similarity(10);
  EXPECT_DOUBLE_EQ(sim_of(*f, n(10), n(10)), 1.0);
  EXPECT_DOUBLE_EQ(sim_of(*f, n(8.9), n(8.9)), 1.0);
  EXPECT_DOUBLE_EQ(sim_of(*f, n(10), n(5)), 0.5);
  EXPECT_DOUBLE_EQ(sim_of(*f, n(10), n(15)), 0.5);
  EXPECT_NEAR(sim_of(*f, n(8.2), n(3.1)), 0.49, 1e-12);
  EXPECT_DOUBLE_EQ(sim_of(*f, n(40), n(10)), 0.0);
  // ints and doubles mix
  EXPECT_DOUBLE_EQ(sim_of(*f, Value{std::int64_t{10}}, n(5)), 0.5);
}

TEST(RelativeNumericalSimilarity, PercentFalloff) {
  auto f = make_relative_numerical_similarity(30);
  EXPECT_DOUBLE_EQ(sim_of(*f, n(10000), n(10000)), 1.0);
  EXPECT_DOUBLE_EQ(sim_of(*f, n(8.9), n(8.9)), 1.0);
  EXPECT_NEAR(sim_of(*f, n(10000), n(8500)), 0.5, 1e-12);
  EXPECT_NEAR(sim_of(*f, n(8500), n(10000)), 0.5, 1e-12);
  EXPECT_DOUBLE_EQ(sim_of(*f, n(8.2), n(3.1)), 0.0);
  EXPECT_DOUBLE_EQ(sim_of(*f, n(10000), n(7000)), 0.0);
}

TEST(FuncSimilarity, ResultIsClamped) {
  auto f = make_func_similarity(
      [](const Value&, const Value&) { return 1.7; });
  EXPECT_DOUBLE_EQ(sim_of(*f, s("a"), s("b")), 1.0);

  auto empty = make_func_similarity(SimilarityFn{});
  auto r = empty->sim(s("a"), s("b"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), MatchError::InvalidArgument);
}
