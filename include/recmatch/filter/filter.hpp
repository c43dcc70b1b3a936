#pragma once
#include <functional>
#include <memory>
#include <string>

#include "recmatch/util/util.hpp"

namespace recmatch::filter {

/**
 * Pair predicate applied before scoring. An index decides which pairs may be
 * compared; a filter discards some of those.
 * Thread-safety: YES (const).
 */
class IFilter {
public:
  virtual ~IFilter() = default;

  /**
   * Purpose: true keeps the pair, false drops it.
   * Errors: MissingField / TypeMismatch on malformed rows.
   */
  virtual util::Expected<bool> valid(const util::Row& a,
                                     const util::Row& b) const = 0;
};

using FilterFn = std::function<bool(const util::Row&, const util::Row&)>;

/**
 * Keeps pairs whose values of 'field' differ (a null on either side keeps
 * the pair). With ignore_missing a missing field keeps the pair instead of
 * failing with MissingField.
 */
std::unique_ptr<IFilter> make_dissimilar_filter(std::string field,
                                                bool ignore_missing = false);

/**
 * Keeps pairs whose [start, end] ranges do not overlap:
 * a.end < b.start || a.start > b.end. A null or NaN bound is open, so a
 * comparison against it is false. Non-null bounds of incomparable kinds are
 * TypeMismatch.
 */
std::unique_ptr<IFilter> make_non_overlapping_filter(std::string start,
                                                     std::string end);

/** Caller-supplied predicate. */
std::unique_ptr<IFilter> make_func_filter(FilterFn fn);

} // namespace recmatch::filter
