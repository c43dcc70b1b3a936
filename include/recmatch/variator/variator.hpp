#pragma once
#include <memory>
#include <string>
#include <vector>

#include "recmatch/util/util.hpp"

namespace recmatch::variator {

/**
 * Expands a record into alternate versions (e.g. first/last name swapped).
 * The matcher scores every variant combination and keeps the maximum.
 * Thread-safety: YES (const).
 */
class IVariator {
public:
  virtual ~IVariator() = default;

  /**
   * Postconditions: the first element is the input row unchanged; the
   * sequence is finite and the same input yields the same sequence.
   */
  virtual util::Expected<std::vector<util::Row>>
  variations(const util::Row& row) const = 0;
};

/** Yields the row itself only. */
std::unique_ptr<IVariator> make_identity_variator();

/**
 * Yields the row, then a copy with field_a and field_b swapped unless both
 * are null or they hold equal values.
 * Errors: MissingField if either field does not exist.
 */
std::unique_ptr<IVariator> make_swap_variator(std::string field_a,
                                              std::string field_b);

} // namespace recmatch::variator
