#include "recmatch/filter/filter.hpp"

#include <cmath>
#include <compare>
#include <utility>

#include <spdlog/spdlog.h>

namespace recmatch::filter {
using util::Expected;
using util::MatchError;
using util::Row;
using util::Value;

namespace {
// Null and NaN bounds are open: any comparison against them is false.
bool open_bound(const Value& v) noexcept {
  if (util::is_null(v)) return true;
  const auto n = util::as_number(v);
  return n && std::isnan(*n);
}

// x < y, false for an open bound; TypeMismatch for incomparable kinds.
Expected<bool> before(const Value& x, const Value& y) {
  if (open_bound(x) || open_bound(y)) return false;
  const auto c = util::compare_values(x, y);
  if (c == std::partial_ordering::unordered)
    return tl::unexpected(MatchError::TypeMismatch);
  return c < 0;
}
} // namespace

class DissimilarFilter final : public IFilter {
public:
  DissimilarFilter(std::string field, bool ignore_missing)
    : field_(std::move(field)), ignore_missing_(ignore_missing) {
  }

  Expected<bool> valid(const Row& a, const Row& b) const override {
    const Value* va = a.find(field_);
    const Value* vb = b.find(field_);
    if (!va || !vb) {
      if (ignore_missing_) return true;
      spdlog::error("dissimilar filter: field '{}' does not exist", field_);
      return tl::unexpected(MatchError::MissingField);
    }
    if (util::is_null(*va) || util::is_null(*vb)) return true;
    return !util::values_equal(*va, *vb);
  }

private:
  std::string field_;
  bool ignore_missing_;
};

class NonOverlappingFilter final : public IFilter {
public:
  NonOverlappingFilter(std::string start, std::string end)
    : start_(std::move(start)), end_(std::move(end)) {
  }

  Expected<bool> valid(const Row& a, const Row& b) const override {
    const Value* as = a.find(start_);
    const Value* ae = a.find(end_);
    const Value* bs = b.find(start_);
    const Value* be = b.find(end_);
    if (!as || !ae || !bs || !be)
      return tl::unexpected(MatchError::MissingField);

    auto a_first = before(*ae, *bs);
    if (!a_first) return tl::unexpected(a_first.error());
    auto b_first = before(*be, *as);
    if (!b_first) return tl::unexpected(b_first.error());
    return *a_first || *b_first;
  }

private:
  std::string start_;
  std::string end_;
};

class FuncFilter final : public IFilter {
public:
  explicit FuncFilter(FilterFn fn) : fn_(std::move(fn)) {
  }

  Expected<bool> valid(const Row& a, const Row& b) const override {
    if (!fn_) return tl::unexpected(MatchError::InvalidArgument);
    return fn_(a, b);
  }

private:
  FilterFn fn_;
};

std::unique_ptr<IFilter> make_dissimilar_filter(std::string field,
                                                bool ignore_missing) {
  return std::make_unique<DissimilarFilter>(std::move(field), ignore_missing);
}

std::unique_ptr<IFilter> make_non_overlapping_filter(std::string start,
                                                     std::string end) {
  return std::make_unique<NonOverlappingFilter>(std::move(start),
                                                std::move(end));
}

std::unique_ptr<IFilter> make_func_filter(FilterFn fn) {
  return std::make_unique<FuncFilter>(std::move(fn));
}
} // namespace recmatch::filter
