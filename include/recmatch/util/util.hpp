#pragma once
#include <chrono>
#include <compare>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <tl/expected.hpp>      // tl::expected

namespace recmatch::util {
// -----------------------------
// Error domain (no exceptions)
// -----------------------------

/**
 * Recoverable errors for all recmatch operations.
 * No exceptions are thrown by this library.
 *
 * Meanings:
 *  - InvalidArgument: argument value/range preconditions violated
 *  - DuplicateKey: a table holds the same row key more than once
 *  - FieldMismatch: two tables matched against each other have different fields
 *  - UnregisteredTable: bucket lookup with a handle this index never issued
 *  - MissingField: a required field is absent and absence is not tolerated
 *  - TypeMismatch: a value has the wrong type for the requested comparison
 *  - NotFound: bucket key / row key missing
 *  - Unscored: every scorer refused a pair and nothing could fall back
 *  - Internal: invariant broken or unexpected state (bug)
 */
enum class MatchError : std::uint16_t {
  None = 0,
  InvalidArgument,
  DuplicateKey,
  FieldMismatch,
  UnregisteredTable,
  MissingField,
  TypeMismatch,
  NotFound,
  Unscored,
  Internal
};

/** Short, stable name for an error. Thread-safe. */
std::string_view error_name(MatchError) noexcept;

/** Human-friendly description. Thread-safe. */
std::string_view error_description(MatchError) noexcept;

/** Project-wide expected alias. Prefer returning this in APIs that can fail. */
template <typename T>
using Expected = tl::expected<T, MatchError>;

// -----------------------------
// Cell values
// -----------------------------

using Date = std::chrono::year_month_day;
using Null = std::monostate;

/** A single cell value; std::monostate is null. */
using Scalar = std::variant<Null, bool, std::int64_t, double, std::string,
                            Date>;

/** List-valued cell (e.g. aliases); used by index-by-element blocking. */
using List = std::vector<Scalar>;

/** What a table cell may hold. */
using Value = std::variant<Null, bool, std::int64_t, double, std::string, Date,
                           List>;

/** Stable, comparable, hashable row identifier. */
using RowKey = std::variant<std::int64_t, std::string>;

bool is_null(const Value& v) noexcept;
bool is_null(const Scalar& s) noexcept;

/** Numeric view of int/double cells; nullopt for anything else. */
std::optional<double> as_number(const Value& v) noexcept;

/** Scalar view of a non-list cell; nullopt for lists. */
std::optional<Scalar> as_scalar(const Value& v);

Value to_value(const Scalar& s);

/**
 * Equality with numeric promotion (int 3 == double 3.0).
 * Null never equals anything, itself included.
 */
bool values_equal(const Value& a, const Value& b);

/**
 * Ordering across numbers, strings, dates and bools.
 * Returns unordered for mismatched kinds, nulls and lists.
 */
std::partial_ordering compare_values(const Value& a, const Value& b);

std::string to_string(const Scalar& s);
std::string to_string(const Value& v);
std::string to_string(const RowKey& k);

// -----------------------------
// Rows & tables
// -----------------------------

/** Ordered field names plus name lookup; shared by every row of a table. */
class Schema {
public:
  explicit Schema(std::vector<std::string> fields);

  const std::vector<std::string>& fields() const noexcept { return fields_; }
  std::size_t size() const noexcept { return fields_.size(); }
  std::optional<std::size_t> position(std::string_view field) const;

private:
  std::vector<std::string> fields_;
  std::map<std::string, std::size_t, std::less<>> pos_;
};

/**
 * One record. values[i] belongs to schema->fields()[i].
 * Thread-safety: safe for concurrent const access.
 */
struct Row {
  RowKey key;
  std::vector<Value> values;
  std::shared_ptr<const Schema> schema;

  /** Cell by field name; nullptr when the field does not exist. */
  const Value* find(std::string_view field) const;
  Value* find(std::string_view field);
};

/**
 * Ordered collection of rows with a fixed field set.
 * Duplicate keys are accepted on append and rejected by the matcher
 * (see first_duplicate_key) so that callers get a single structural check.
 */
class Table {
public:
  /** Fails with InvalidArgument when a field name repeats. */
  static Expected<Table> create(std::vector<std::string> fields);

  /** Fails with InvalidArgument when values.size() != fields().size(). */
  Expected<void> append(RowKey key, std::vector<Value> values);

  std::size_t size() const noexcept { return rows_.size(); }
  bool empty() const noexcept { return rows_.empty(); }
  const Row& row(std::size_t i) const noexcept { return rows_[i]; }
  const std::vector<Row>& rows() const noexcept { return rows_; }
  const std::vector<std::string>& fields() const noexcept {
    return schema_->fields();
  }
  const std::shared_ptr<const Schema>& schema() const noexcept {
    return schema_;
  }

  /** Position of the first row with this key. */
  std::optional<std::size_t> find(const RowKey& key) const;

  std::optional<RowKey> first_duplicate_key() const;
  bool has_unique_keys() const { return !first_duplicate_key().has_value(); }

  /** Same field names, order ignored. */
  bool same_fields(const Table& other) const;

private:
  explicit Table(std::shared_ptr<const Schema> schema)
    : schema_(std::move(schema)) {
  }

  std::shared_ptr<const Schema> schema_;
  std::vector<Row> rows_;
  std::unordered_map<RowKey, std::size_t> by_key_; // first occurrence
  std::optional<RowKey> duplicate_;
};

// -----------------------------
// Match results
// -----------------------------

/**
 * key_a belongs to the left table, key_b to the right one.
 * In deduplication both come from the same table and key_a precedes key_b.
 */
struct ScoredPair {
  double score{};
  RowKey key_a;
  RowKey key_b;

  bool operator==(const ScoredPair&) const = default;
};
} // namespace recmatch::util
