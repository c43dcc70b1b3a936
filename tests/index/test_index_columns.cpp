#include <gtest/gtest.h>
#include <limits>
#include <vector>

#include "recmatch/index/index.hpp"
#include "test_utils_table.hpp"

using recmatch::index::BucketKey;
using recmatch::index::ColumnsIndexOptions;
using recmatch::index::make_columns_index;
using recmatch::index::make_noop_index;
using recmatch::util::MatchError;
using recmatch::util::RowKey;
using testtable::key;
using testtable::num;
using testtable::sc;
using testtable::str;

// -----------------------------
// A) No-op index
// -----------------------------

TEST(NoopIndex, SingleBucket_HoldsWholeTable) {
  auto t = testtable::make_table({"a", "b"}, {{num(1), num(2)},
                                              {num(3), num(4)}});
  auto idx = make_noop_index();
  auto h = idx->keys(*t);
  ASSERT_TRUE(h.has_value());

  const auto keys = h->keys();
  ASSERT_EQ(keys.size(), 1u);
  EXPECT_EQ(keys[0], BucketKey::of({sc(0)}));

  auto rows = idx->bucket(*h, keys[0]);
  ASSERT_TRUE(rows.has_value());
  EXPECT_EQ(testtable::row_keys(*rows),
            (std::vector<RowKey>{key(0), key(1)}));
}

// -----------------------------
// B) Field-based index
// -----------------------------

TEST(ColumnsIndex, SingleField_OneBucketPerValue) {
  auto t = testtable::make_keyed_table(
      {"c", "d"}, {{key("x"), {num(1), num(2)}},
                   {key("y"), {num(2), num(4)}},
                   {key("z"), {num(3), num(4)}}});
  auto idx = make_columns_index({"c"});
  auto h = idx->keys(*t);
  ASSERT_TRUE(h.has_value());
  EXPECT_EQ(h->keys(), (std::vector<BucketKey>{BucketKey::of({sc(1)}),
                                               BucketKey::of({sc(2)}),
                                               BucketKey::of({sc(3)})}));

  auto b2 = idx->bucket(*h, BucketKey::of({sc(2)}));
  ASSERT_TRUE(b2.has_value());
  EXPECT_EQ(testtable::row_keys(*b2), (std::vector<RowKey>{key("y")}));
}

TEST(ColumnsIndex, MultiField_KeyIsTuple) {
  auto t = testtable::make_keyed_table(
      {"c", "d"}, {{key("z"), {num(1), num(2)}},
                   {key("x"), {num(2), num(4)}},
                   {key("c"), {num(3), num(4)}}});
  auto idx = make_columns_index({"c", "d"});
  auto h = idx->keys(*t);
  ASSERT_TRUE(h.has_value());
  EXPECT_EQ(h->bucket_count(), 3u);
  EXPECT_TRUE(h->contains(BucketKey::of({sc(1), sc(2)})));
  EXPECT_TRUE(h->contains(BucketKey::of({sc(2), sc(4)})));
  EXPECT_TRUE(h->contains(BucketKey::of({sc(3), sc(4)})));

  auto b = idx->bucket(*h, BucketKey::of({sc(3), sc(4)}));
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(testtable::row_keys(*b), (std::vector<RowKey>{key("c")}));
}

TEST(ColumnsIndex, MissingField_FailsUnlessIgnored) {
  auto t = testtable::make_table({"a", "b"}, {{num(1), num(2)},
                                              {num(3), num(4)}});
  {
    auto h = make_columns_index({"c"})->keys(*t);
    ASSERT_FALSE(h.has_value());
    EXPECT_EQ(h.error(), MatchError::MissingField);
  }
  {
    ColumnsIndexOptions opts;
    opts.ignore_missing = true;
    auto h = make_columns_index({"c"}, opts)->keys(*t);
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(h->bucket_count(), 0u);
  }
}

TEST(ColumnsIndex, ListCell_WithoutIndexElements_IsTypeMismatch) {
  auto t = testtable::make_table(
      {"col1"}, {{testtable::list({sc("a"), sc("b")})}});
  auto h = make_columns_index({"col1"})->keys(*t);
  ASSERT_FALSE(h.has_value());
  EXPECT_EQ(h.error(), MatchError::TypeMismatch);
}

TEST(ColumnsIndex, IndexElements_RowInOneBucketPerElement) {
  auto t = testtable::make_table(
      {"col1", "col2"},
      {{testtable::list({sc("a"), sc("b")}), str("q")},
       {testtable::list({sc("c")}), str("w")},
       {testtable::list({sc("b")}), str("e")}});
  ColumnsIndexOptions opts;
  opts.index_elements = true;
  auto idx = make_columns_index({"col1"}, opts);
  auto h = idx->keys(*t);
  ASSERT_TRUE(h.has_value());
  EXPECT_EQ(h->keys(), (std::vector<BucketKey>{BucketKey::of({sc("a")}),
                                               BucketKey::of({sc("b")}),
                                               BucketKey::of({sc("c")})}));

  auto a = idx->bucket(*h, BucketKey::of({sc("a")}));
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(testtable::row_keys(*a), (std::vector<RowKey>{key(0)}));

  auto b = idx->bucket(*h, BucketKey::of({sc("b")}));
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(testtable::row_keys(*b), (std::vector<RowKey>{key(0), key(2)}));
}

TEST(ColumnsIndex, IndexElements_MultiField_CartesianProduct) {
  auto t = testtable::make_table(
      {"col1", "col2", "col3"},
      {{testtable::list({sc("a"), sc("b")}), str("q"),
        testtable::list({sc(1)})},
       {testtable::list({sc("c")}), str("w"), testtable::list({sc(2), sc(3)})},
       {testtable::list({sc("b")}), str("e"), testtable::list({sc(1)})}});
  ColumnsIndexOptions opts;
  opts.index_elements = true;
  auto idx = make_columns_index({"col1", "col3"}, opts);
  auto h = idx->keys(*t);
  ASSERT_TRUE(h.has_value());
  EXPECT_EQ(h->bucket_count(), 4u);
  EXPECT_TRUE(h->contains(BucketKey::of({sc("a"), sc(1)})));
  EXPECT_TRUE(h->contains(BucketKey::of({sc("b"), sc(1)})));
  EXPECT_TRUE(h->contains(BucketKey::of({sc("c"), sc(2)})));
  EXPECT_TRUE(h->contains(BucketKey::of({sc("c"), sc(3)})));

  auto b1 = idx->bucket(*h, BucketKey::of({sc("b"), sc(1)}));
  ASSERT_TRUE(b1.has_value());
  EXPECT_EQ(testtable::row_keys(*b1), (std::vector<RowKey>{key(0), key(2)}));
}

TEST(ColumnsIndex, NullCells_ShareOneBucket) {
  auto t = testtable::make_table({"a"}, {{testtable::null()},
                                         {num(1)},
                                         {testtable::null()}});
  auto idx = make_columns_index({"a"});
  auto h = idx->keys(*t);
  ASSERT_TRUE(h.has_value());
  EXPECT_EQ(h->bucket_count(), 2u);

  auto b = idx->bucket(*h, BucketKey::of({recmatch::util::Scalar{}}));
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(testtable::row_keys(*b), (std::vector<RowKey>{key(0), key(2)}));
}

TEST(ColumnsIndex, NaNCell_JoinsNullBucket) {
  using recmatch::util::Scalar;
  using recmatch::util::Value;
  const double nan = std::numeric_limits<double>::quiet_NaN();
  auto t = testtable::make_table(
      {"v"}, {{Value{1.0}}, {Value{nan}}, {Value{2.0}}, {Value{3.0}}});
  auto idx = make_columns_index({"v"});
  auto h = idx->keys(*t);
  ASSERT_TRUE(h.has_value());
  EXPECT_EQ(h->bucket_count(), 4u);

  auto one = idx->bucket(*h, BucketKey::of({Scalar{1.0}}));
  ASSERT_TRUE(one.has_value());
  EXPECT_EQ(testtable::row_keys(*one), (std::vector<RowKey>{key(0)}));

  auto null_bucket = idx->bucket(*h, BucketKey::of({Scalar{}}));
  ASSERT_TRUE(null_bucket.has_value());
  EXPECT_EQ(testtable::row_keys(*null_bucket), (std::vector<RowKey>{key(1)}));
}

TEST(ColumnsIndex, NaNListElement_JoinsNullBucket) {
  using recmatch::util::Scalar;
  using recmatch::util::Value;
  const double nan = std::numeric_limits<double>::quiet_NaN();
  auto t = testtable::make_table(
      {"v"}, {{Value{recmatch::util::List{Scalar{nan}, Scalar{1.0}}}},
              {testtable::null()}});
  auto idx = make_columns_index({"v"}, ColumnsIndexOptions{true, false});
  auto h = idx->keys(*t);
  ASSERT_TRUE(h.has_value());
  EXPECT_EQ(h->bucket_count(), 2u);

  auto null_bucket = idx->bucket(*h, BucketKey::of({Scalar{}}));
  ASSERT_TRUE(null_bucket.has_value());
  EXPECT_EQ(testtable::row_keys(*null_bucket),
            (std::vector<RowKey>{key(0), key(1)}));
}
