#include "recmatch/pair/pair.hpp"

#include <set>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace recmatch::pair {
using index::IIndex;
using index::IndexHandle;
using util::Expected;
using util::MatchError;
using util::Row;
using util::Table;

namespace {
using SeenSet = std::set<std::pair<const Row*, const Row*>>;

Expected<void> ensure_unique_keys(const Table& t, const char* which) {
  if (const auto dup = t.first_duplicate_key()) {
    spdlog::error("{} table: row key '{}' appears more than once", which,
                  util::to_string(*dup));
    return tl::unexpected(MatchError::DuplicateKey);
  }
  return {};
}
} // namespace

// -----------------------------
// Cross-matching
// -----------------------------

class MatchPairer final : public IPairer {
public:
  MatchPairer(std::shared_ptr<const Table> a, std::shared_ptr<const Table> b,
              std::shared_ptr<const IIndex> index)
    : a_(std::move(a)), b_(std::move(b)), index_(std::move(index)) {
  }

  const Table& table_a() const override { return *a_; }
  const Table& table_b() const override { return *b_; }

  Expected<std::vector<CandidatePair>> pairs() const override {
    auto ha = index_->keys(*a_);
    if (!ha) return tl::unexpected(ha.error());
    auto hb = index_->keys(*b_);
    if (!hb) return tl::unexpected(hb.error());

    std::vector<CandidatePair> out;
    SeenSet seen;
    for (const auto& key : ha->keys()) {
      if (!hb->contains(key)) continue;
      auto rows_a = index_->bucket(*ha, key);
      if (!rows_a) return tl::unexpected(rows_a.error());
      auto rows_b = index_->bucket(*hb, key);
      if (!rows_b) return tl::unexpected(rows_b.error());
      for (const Row* ra : *rows_a) {
        for (const Row* rb : *rows_b) {
          if (seen.emplace(ra, rb).second) out.push_back(CandidatePair{ra, rb});
        }
      }
    }
    spdlog::debug("match pairer: {} candidate pairs", out.size());
    return out;
  }

private:
  std::shared_ptr<const Table> a_;
  std::shared_ptr<const Table> b_;
  std::shared_ptr<const IIndex> index_;
};

// -----------------------------
// Deduplication
// -----------------------------

class DedupPairer final : public IPairer {
public:
  DedupPairer(std::shared_ptr<const Table> t,
              std::shared_ptr<const IIndex> index)
    : t_(std::move(t)), index_(std::move(index)) {
  }

  const Table& table_a() const override { return *t_; }
  const Table& table_b() const override { return *t_; }

  Expected<std::vector<CandidatePair>> pairs() const override {
    auto h = index_->keys(*t_);
    if (!h) return tl::unexpected(h.error());

    std::vector<CandidatePair> out;
    SeenSet seen;
    for (const auto& key : h->keys()) {
      auto rowsE = index_->bucket(*h, key);
      if (!rowsE) return tl::unexpected(rowsE.error());
      const auto& rows = *rowsE;
      for (std::size_t i = 0; i < rows.size(); ++i) {
        for (std::size_t j = i + 1; j < rows.size(); ++j) {
          // Unordered identity: the same two rows may meet in another bucket.
          const auto id = rows[i] < rows[j]
                            ? std::make_pair(rows[i], rows[j])
                            : std::make_pair(rows[j], rows[i]);
          if (seen.insert(id).second)
            out.push_back(CandidatePair{rows[i], rows[j]});
        }
      }
    }
    spdlog::debug("dedup pairer: {} candidate pairs", out.size());
    return out;
  }

private:
  std::shared_ptr<const Table> t_;
  std::shared_ptr<const IIndex> index_;
};

// -----------------------------
// Factories
// -----------------------------

Expected<std::unique_ptr<IPairer>>
make_match_pairer(std::shared_ptr<const Table> table_a,
                  std::shared_ptr<const Table> table_b,
                  std::shared_ptr<const IIndex> index) {
  if (!table_a || !table_b || !index)
    return tl::unexpected(MatchError::InvalidArgument);
  if (auto ok = ensure_unique_keys(*table_a, "left"); !ok)
    return tl::unexpected(ok.error());
  if (auto ok = ensure_unique_keys(*table_b, "right"); !ok)
    return tl::unexpected(ok.error());
  if (!table_a->same_fields(*table_b)) {
    spdlog::error("match pairer: tables have different fields ({} vs {})",
                  table_a->fields().size(), table_b->fields().size());
    return tl::unexpected(MatchError::FieldMismatch);
  }
  return std::unique_ptr<IPairer>(std::make_unique<MatchPairer>(
      std::move(table_a), std::move(table_b), std::move(index)));
}

Expected<std::unique_ptr<IPairer>>
make_dedup_pairer(std::shared_ptr<const Table> table,
                  std::shared_ptr<const IIndex> index) {
  if (!table || !index) return tl::unexpected(MatchError::InvalidArgument);
  if (auto ok = ensure_unique_keys(*table, "dedup"); !ok)
    return tl::unexpected(ok.error());
  return std::unique_ptr<IPairer>(
      std::make_unique<DedupPairer>(std::move(table), std::move(index)));
}
} // namespace recmatch::pair
