#include "recmatch/score/score.hpp"

#include <cmath>
#include <optional>
#include <utility>

#include <spdlog/spdlog.h>

namespace recmatch::score {
using util::Expected;
using util::MatchError;
using util::Row;
using util::Value;

namespace {
inline double clamp01(double v) noexcept {
  if (!(v > 0.0)) return 0.0; // NaN -> 0
  return v > 1.0 ? 1.0 : v;
}
} // namespace

// -----------------------------
// Weighted sum (RMS of field similarities)
// -----------------------------

class SimSumScorer final : public IScorer {
public:
  explicit SimSumScorer(FieldSimilarities fields) : fields_(std::move(fields)) {
  }

  Expected<Verdict> score(const Row& a, const Row& b) const override {
    if (fields_.empty()) return tl::unexpected(MatchError::InvalidArgument);

    double sum_sq = 0.0;
    for (const auto& [field, sim] : fields_) {
      if (!sim) return tl::unexpected(MatchError::InvalidArgument);
      const Value* va = a.find(field);
      const Value* vb = b.find(field);
      if (!va || !vb) {
        spdlog::error("sim-sum scorer: field '{}' does not exist", field);
        return tl::unexpected(MatchError::MissingField);
      }
      if (util::is_null(*va) || util::is_null(*vb)) continue; // contributes 0

      auto s = sim->sim(*va, *vb);
      if (!s) return tl::unexpected(s.error());
      sum_sq += *s * *s;
    }
    return Verdict{
        clamp01(std::sqrt(sum_sq / static_cast<double>(fields_.size())))};
  }

private:
  FieldSimilarities fields_;
};

// -----------------------------
// Absolute (veto)
// -----------------------------

class AbsoluteScorer final : public IScorer {
public:
  AbsoluteScorer(std::string field, double score, bool ignore_missing)
    : field_(std::move(field)), score_(clamp01(score)),
      ignore_missing_(ignore_missing) {
  }

  Expected<Verdict> score(const Row& a, const Row& b) const override {
    const Value* va = a.find(field_);
    const Value* vb = b.find(field_);
    if (!va || !vb) {
      if (ignore_missing_)
        return Verdict{Refusal{"field does not exist in one of the records"}};
      spdlog::error("absolute scorer: field '{}' does not exist", field_);
      return tl::unexpected(MatchError::MissingField);
    }
    if (util::is_null(*va) || util::is_null(*vb))
      return Verdict{Refusal{"one of the values is null"}};
    if (util::values_equal(*va, *vb)) return Verdict{score_};
    return Verdict{Refusal{"values are not equal"}};
  }

private:
  std::string field_;
  double score_;
  bool ignore_missing_;
};

// -----------------------------
// Max / Min combinators
// -----------------------------

template <typename Better>
class ExtremumScorer final : public IScorer {
public:
  explicit ExtremumScorer(std::vector<std::shared_ptr<const IScorer>> children)
    : children_(std::move(children)) {
  }

  Expected<Verdict> score(const Row& a, const Row& b) const override {
    std::optional<double> best;
    for (const auto& child : children_) {
      if (!child) return tl::unexpected(MatchError::InvalidArgument);
      auto v = child->score(a, b);
      if (!v) return tl::unexpected(v.error());
      if (refused(*v)) continue;
      const double s = std::get<double>(*v);
      if (!best || Better{}(s, *best)) best = s;
    }
    if (!best) return Verdict{Refusal{"all children refuse to score"}};
    return Verdict{*best};
  }

private:
  std::vector<std::shared_ptr<const IScorer>> children_;
};

// -----------------------------
// Override
// -----------------------------

class OverrideScorer final : public IScorer {
public:
  OverrideScorer(std::shared_ptr<const IScorer> inner, GroupValues values,
                 TransformFn transform)
    : inner_(std::move(inner)), values_(std::move(values)),
      transform_(std::move(transform)) {
  }

  Expected<Verdict> score(const Row& a, const Row& b) const override {
    if (!inner_ || !transform_)
      return tl::unexpected(MatchError::InvalidArgument);
    auto v = inner_->score(a, b);
    if (!v || refused(*v)) return v;

    const auto ga = values_.find(a.key);
    const auto gb = values_.find(b.key);
    if (ga == values_.end() || gb == values_.end()) return v;
    if (!util::values_equal(ga->second, gb->second)) return v;
    return Verdict{clamp01(transform_(std::get<double>(*v)))};
  }

private:
  std::shared_ptr<const IScorer> inner_;
  GroupValues values_;
  TransformFn transform_;
};

// -----------------------------
// Callback
// -----------------------------

class FuncScorer final : public IScorer {
public:
  explicit FuncScorer(ScoreFn fn) : fn_(std::move(fn)) {
  }

  Expected<Verdict> score(const Row& a, const Row& b) const override {
    if (!fn_) return tl::unexpected(MatchError::InvalidArgument);
    return Verdict{clamp01(fn_(a, b))};
  }

private:
  ScoreFn fn_;
};

// -----------------------------
// Factories
// -----------------------------

std::unique_ptr<IScorer> make_sim_sum_scorer(FieldSimilarities fields) {
  return std::make_unique<SimSumScorer>(std::move(fields));
}

std::unique_ptr<IScorer> make_absolute_scorer(std::string field, double score,
                                              bool ignore_missing) {
  return std::make_unique<AbsoluteScorer>(std::move(field), score,
                                          ignore_missing);
}

std::unique_ptr<IScorer>
make_max_scorer(std::vector<std::shared_ptr<const IScorer>> children) {
  return std::make_unique<ExtremumScorer<std::greater<double>>>(
      std::move(children));
}

std::unique_ptr<IScorer>
make_min_scorer(std::vector<std::shared_ptr<const IScorer>> children) {
  return std::make_unique<ExtremumScorer<std::less<double>>>(
      std::move(children));
}

std::unique_ptr<IScorer> make_override_scorer(
    std::shared_ptr<const IScorer> inner, GroupValues values,
    TransformFn transform) {
  return std::make_unique<OverrideScorer>(std::move(inner), std::move(values),
                                          std::move(transform));
}

std::unique_ptr<IScorer> make_func_scorer(ScoreFn fn) {
  return std::make_unique<FuncScorer>(std::move(fn));
}
} // namespace recmatch::score
