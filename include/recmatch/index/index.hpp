#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "recmatch/util/util.hpp"

namespace recmatch::index {

/**
 * Identifies one bucket. Field-based indices fill parts (one scalar per
 * indexed field); intersection composites fill subkeys (one key per child).
 */
class BucketKey {
public:
  BucketKey() = default;

  static BucketKey of(std::vector<util::Scalar> parts);
  static BucketKey combine(std::vector<BucketKey> subkeys);

  const std::vector<util::Scalar>& parts() const noexcept { return parts_; }
  const std::vector<BucketKey>& subkeys() const noexcept { return subkeys_; }

  friend bool operator==(const BucketKey& a, const BucketKey& b);
  friend bool operator<(const BucketKey& a, const BucketKey& b);

private:
  std::vector<util::Scalar> parts_;
  std::vector<BucketKey> subkeys_;
};

std::string to_string(const BucketKey& key);

/** Bucket key -> row keys of that bucket (sorted, unique for field-based). */
using BucketMap = std::map<BucketKey, std::vector<util::RowKey>>;

/**
 * Result of indexing one table. Must be passed back to the index that issued
 * it when retrieving buckets.
 *
 * Lifetime: refers to the indexed table; the caller keeps the table alive.
 * Thread-safety: immutable after creation; safe for concurrent const access.
 */
class IndexHandle {
public:
  IndexHandle() = default;

  /** Distinct bucket keys found, ascending. */
  std::vector<BucketKey> keys() const;
  bool contains(const BucketKey& key) const;
  std::size_t bucket_count() const noexcept;
  const util::Table* table() const noexcept { return table_; }

private:
  friend class IIndex;

  std::uint64_t owner_{0};
  const util::Table* table_{nullptr};
  std::shared_ptr<const BucketMap> buckets_;
};

/**
 * Blocking index: partitions a table so only rows sharing a bucket are compared.
 *
 * Sub-classes implement key_rows(); keys()/bucket() are shared.
 * Thread-safety: YES (const; indexing state lives in the returned handle).
 */
class IIndex {
public:
  virtual ~IIndex() = default;

  /**
   * Purpose: Map every bucket key of 'table' to the keys of its rows.
   * Errors: MissingField / TypeMismatch from field-based indices.
   * Complexity: index-specific, typically O(rows).
   */
  virtual util::Expected<BucketMap> key_rows(const util::Table& table) const
  = 0;

  /**
   * Purpose: Index 'table' and return a handle holding its bucket keys.
   * Postconditions: handle.keys() lists the distinct bucket keys.
   */
  util::Expected<IndexHandle> keys(const util::Table& table) const;

  /**
   * Purpose: Rows of one bucket, in bucket order.
   * Errors:
   *  - UnregisteredTable: handle was not produced by this index's keys()
   *  - NotFound: key is not a bucket of the handle's table
   */
  util::Expected<std::vector<const util::Row*>>
  bucket(const IndexHandle& handle, const BucketKey& key) const;

protected:
  IIndex();

private:
  std::uint64_t token_;
};

/**
 * Field-based index options.
 *  - index_elements: list-valued cells put the row into one bucket per element;
 *    with several fields the bucket keys are the cartesian product
 *  - ignore_missing: a missing field yields zero buckets instead of MissingField
 */
struct ColumnsIndexOptions {
  bool index_elements{false};
  bool ignore_missing{false};
};

/** How a composite index joins its children's buckets. */
enum class CombineMode : std::uint8_t {
  Union,       // OR: bucket keys of all children, rows merged per equal key
  Intersection // AND: cartesian product of keys, rows intersected, empty dropped
};

/** Single bucket holding the whole table. */
std::unique_ptr<IIndex> make_noop_index();

/** Bucket key = tuple of the values of 'fields'. */
std::unique_ptr<IIndex> make_columns_index(std::vector<std::string> fields,
                                           ColumnsIndexOptions opts = {});

/** Composite over 'children' (children may be shared between composites). */
std::unique_ptr<IIndex>
make_multi_index(std::vector<std::shared_ptr<const IIndex>> children,
                 CombineMode mode = CombineMode::Union);

} // namespace recmatch::index
