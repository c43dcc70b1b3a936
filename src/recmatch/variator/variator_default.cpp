#include "recmatch/variator/variator.hpp"

#include <utility>

namespace recmatch::variator {
using util::Expected;
using util::MatchError;
using util::Row;
using util::Value;

class IdentityVariator final : public IVariator {
public:
  Expected<std::vector<Row>> variations(const Row& row) const override {
    return std::vector<Row>{row};
  }
};

class SwapVariator final : public IVariator {
public:
  SwapVariator(std::string field_a, std::string field_b)
    : a_(std::move(field_a)), b_(std::move(field_b)) {
  }

  Expected<std::vector<Row>> variations(const Row& row) const override {
    const Value* va = row.find(a_);
    const Value* vb = row.find(b_);
    if (!va || !vb) return tl::unexpected(MatchError::MissingField);

    std::vector<Row> out{row};
    const bool both_null = util::is_null(*va) && util::is_null(*vb);
    if (both_null || *va == *vb) return out;

    Row swapped = row;
    std::swap(*swapped.find(a_), *swapped.find(b_));
    out.push_back(std::move(swapped));
    return out;
  }

private:
  std::string a_;
  std::string b_;
};

std::unique_ptr<IVariator> make_identity_variator() {
  return std::make_unique<IdentityVariator>();
}

std::unique_ptr<IVariator> make_swap_variator(std::string field_a,
                                              std::string field_b) {
  return std::make_unique<SwapVariator>(std::move(field_a), std::move(field_b));
}
} // namespace recmatch::variator
