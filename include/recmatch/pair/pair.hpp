#pragma once
#include <memory>
#include <vector>

#include "recmatch/index/index.hpp"
#include "recmatch/util/util.hpp"

namespace recmatch::pair {

/** Two rows to be compared; a from the left table, b from the right one. */
struct CandidatePair {
  const util::Row* a{nullptr};
  const util::Row* b{nullptr};
};

/**
 * Produces the candidate pairs of a matching run, restricted to rows that
 * share a bucket of the configured index. A pair found in several buckets
 * is produced once.
 *
 * Thread-safety: YES (const; owns its tables).
 */
class IPairer {
public:
  virtual ~IPairer() = default;

  /** Left set of records. */
  virtual const util::Table& table_a() const = 0;

  /** Right set of records (same table as table_a() when deduplicating). */
  virtual const util::Table& table_b() const = 0;

  /**
   * Purpose: Enumerate candidate pairs.
   *   - cross-matching: every left row x every right row of each bucket key
   *     present in both tables
   *   - deduplication: every 2-combination of rows inside each bucket,
   *     in bucket order (no self pairs, no reversed duplicates)
   * Errors: propagated from the index (MissingField, TypeMismatch, ...).
   * Complexity: O(sum over shared buckets of |A_k| * |B_k|).
   */
  virtual util::Expected<std::vector<CandidatePair>> pairs() const = 0;
};

/**
 * Cross-matching pairer.
 * Errors: DuplicateKey if either table repeats a row key; FieldMismatch if
 * the field sets differ; InvalidArgument for null inputs.
 */
util::Expected<std::unique_ptr<IPairer>>
make_match_pairer(std::shared_ptr<const util::Table> table_a,
                  std::shared_ptr<const util::Table> table_b,
                  std::shared_ptr<const index::IIndex> index);

/**
 * Deduplication pairer.
 * Errors: DuplicateKey if the table repeats a row key; InvalidArgument for
 * null inputs.
 */
util::Expected<std::unique_ptr<IPairer>>
make_dedup_pairer(std::shared_ptr<const util::Table> table,
                  std::shared_ptr<const index::IIndex> index);

} // namespace recmatch::pair
