#include "recmatch/index/index.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <iterator>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>
#include "recmatch/util/util.hpp"

namespace recmatch::index {
using util::Expected;
using util::List;
using util::MatchError;
using util::Row;
using util::RowKey;
using util::Scalar;
using util::Table;
using util::Value;

// -----------------------------
// BucketKey
// -----------------------------

BucketKey BucketKey::of(std::vector<Scalar> parts) {
  BucketKey k;
  k.parts_ = std::move(parts);
  return k;
}

BucketKey BucketKey::combine(std::vector<BucketKey> subkeys) {
  BucketKey k;
  k.subkeys_ = std::move(subkeys);
  return k;
}

bool operator==(const BucketKey& a, const BucketKey& b) {
  return a.parts_ == b.parts_ && a.subkeys_ == b.subkeys_;
}

bool operator<(const BucketKey& a, const BucketKey& b) {
  if (a.parts_ != b.parts_) return a.parts_ < b.parts_;
  return std::lexicographical_compare(a.subkeys_.begin(), a.subkeys_.end(),
                                      b.subkeys_.begin(), b.subkeys_.end());
}

std::string to_string(const BucketKey& key) {
  std::string out = "(";
  bool first = true;
  for (const auto& p : key.parts()) {
    if (!first) out += ", ";
    out += util::to_string(p);
    first = false;
  }
  for (const auto& s : key.subkeys()) {
    if (!first) out += ", ";
    out += to_string(s);
    first = false;
  }
  out += ")";
  return out;
}

// -----------------------------
// Handle + shared keys()/bucket()
// -----------------------------

std::vector<BucketKey> IndexHandle::keys() const {
  std::vector<BucketKey> out;
  if (!buckets_) return out;
  out.reserve(buckets_->size());
  for (const auto& kv : *buckets_) out.push_back(kv.first);
  return out;
}

bool IndexHandle::contains(const BucketKey& key) const {
  return buckets_ && buckets_->count(key) > 0;
}

std::size_t IndexHandle::bucket_count() const noexcept {
  return buckets_ ? buckets_->size() : 0;
}

namespace {
std::uint64_t next_token() noexcept {
  static std::atomic<std::uint64_t> counter{0};
  return ++counter; // 0 is reserved for "no owner"
}
} // namespace

IIndex::IIndex() : token_(next_token()) {
}

Expected<IndexHandle> IIndex::keys(const Table& table) const {
  auto mapE = key_rows(table);
  if (!mapE) return tl::unexpected(mapE.error());

  IndexHandle h;
  h.owner_ = token_;
  h.table_ = &table;
  h.buckets_ = std::make_shared<const BucketMap>(std::move(*mapE));
  spdlog::debug("index: {} buckets over {} rows", h.buckets_->size(),
                table.size());
  return h;
}

Expected<std::vector<const Row*>>
IIndex::bucket(const IndexHandle& handle, const BucketKey& key) const {
  if (handle.owner_ != token_ || !handle.table_ || !handle.buckets_)
    return tl::unexpected(MatchError::UnregisteredTable);
  const auto it = handle.buckets_->find(key);
  if (it == handle.buckets_->end())
    return tl::unexpected(MatchError::NotFound);

  std::vector<const Row*> rows;
  rows.reserve(it->second.size());
  for (const auto& rk : it->second) {
    const auto pos = handle.table_->find(rk);
    if (!pos) return tl::unexpected(MatchError::Internal);
    rows.push_back(&handle.table_->row(*pos));
  }
  return rows;
}

// -----------------------------
// Noop
// -----------------------------

class NoopIndex final : public IIndex {
public:
  Expected<BucketMap> key_rows(const Table& table) const override {
    BucketMap m;
    auto& rows = m[BucketKey::of({Scalar{std::int64_t{0}}})];
    rows.reserve(table.size());
    for (const auto& r : table.rows()) rows.push_back(r.key);
    return m;
  }
};

// -----------------------------
// Columns
// -----------------------------

namespace {
inline void sort_unique(std::vector<RowKey>& v) {
  std::sort(v.begin(), v.end());
  v.erase(std::unique(v.begin(), v.end()), v.end());
}
} // namespace

class ColumnsIndex final : public IIndex {
public:
  ColumnsIndex(std::vector<std::string> fields, ColumnsIndexOptions opts)
    : fields_(std::move(fields)), opts_(opts) {
  }

  Expected<BucketMap> key_rows(const Table& table) const override {
    BucketMap m;
    for (const auto& f : fields_) {
      if (table.schema()->position(f)) continue;
      if (opts_.ignore_missing) return m;
      spdlog::error("columns index: field '{}' does not exist", f);
      return tl::unexpected(MatchError::MissingField);
    }

    std::vector<std::vector<Scalar>> per_field(fields_.size());
    for (const auto& row : table.rows()) {
      for (std::size_t i = 0; i < fields_.size(); ++i) {
        auto elemsE = elements(*row.find(fields_[i]));
        if (!elemsE) return tl::unexpected(elemsE.error());
        per_field[i] = std::move(*elemsE);
      }
      // Cartesian product of per-field elements (a single tuple unless
      // index_elements expands lists).
      std::vector<std::vector<Scalar>> tuples{{}};
      for (const auto& elems : per_field) {
        std::vector<std::vector<Scalar>> next;
        next.reserve(tuples.size() * elems.size());
        for (const auto& t : tuples) {
          for (const auto& e : elems) {
            auto nt = t;
            nt.push_back(e);
            next.push_back(std::move(nt));
          }
        }
        tuples = std::move(next);
      }
      for (auto& t : tuples)
        m[BucketKey::of(std::move(t))].push_back(row.key);
    }
    for (auto& kv : m) sort_unique(kv.second);
    return m;
  }

private:
  // NaN has no place in the key order; it joins the null bucket.
  static Scalar blockable(Scalar s) {
    if (const auto* d = std::get_if<double>(&s); d && std::isnan(*d))
      return Scalar{util::Null{}};
    return s;
  }

  Expected<std::vector<Scalar>> elements(const Value& v) const {
    if (const auto* list = std::get_if<List>(&v)) {
      if (!opts_.index_elements) {
        spdlog::error(
            "columns index: list-valued cell needs index_elements");
        return tl::unexpected(MatchError::TypeMismatch);
      }
      std::vector<Scalar> out;
      out.reserve(list->size());
      for (const auto& e : *list) out.push_back(blockable(e));
      return out;
    }
    return std::vector<Scalar>{blockable(*util::as_scalar(v))};
  }

  std::vector<std::string> fields_;
  ColumnsIndexOptions opts_;
};

// -----------------------------
// Multi (union / intersection)
// -----------------------------

class MultiIndex final : public IIndex {
public:
  MultiIndex(std::vector<std::shared_ptr<const IIndex>> children,
             CombineMode mode)
    : children_(std::move(children)), mode_(mode) {
  }

  Expected<BucketMap> key_rows(const Table& table) const override {
    std::vector<BucketMap> maps;
    maps.reserve(children_.size());
    for (const auto& child : children_) {
      if (!child) return tl::unexpected(MatchError::InvalidArgument);
      auto mE = child->key_rows(table);
      if (!mE) return tl::unexpected(mE.error());
      maps.push_back(std::move(*mE));
    }
    return mode_ == CombineMode::Union ? unite(maps) : intersect(maps);
  }

private:
  static BucketMap unite(std::vector<BucketMap>& maps) {
    BucketMap out;
    for (auto& m : maps) {
      for (auto& kv : m) {
        auto& rows = out[kv.first];
        rows.insert(rows.end(), kv.second.begin(), kv.second.end());
      }
    }
    for (auto& kv : out) sort_unique(kv.second);
    return out;
  }

  static BucketMap intersect(std::vector<BucketMap>& maps) {
    BucketMap out;
    if (maps.empty()) return out;

    struct Partial {
      std::vector<BucketKey> subkeys;
      std::vector<RowKey> rows; // sorted
    };
    std::vector<Partial> partials{Partial{}};
    bool first = true;
    for (auto& m : maps) {
      std::vector<Partial> next;
      for (const auto& p : partials) {
        for (const auto& kv : m) {
          auto rows = kv.second;
          std::sort(rows.begin(), rows.end());
          if (!first) {
            std::vector<RowKey> common;
            std::set_intersection(p.rows.begin(), p.rows.end(), rows.begin(),
                                  rows.end(), std::back_inserter(common));
            rows = std::move(common);
          }
          // An empty intersection stays empty; prune it here.
          if (rows.empty()) continue;
          Partial np{p.subkeys, std::move(rows)};
          np.subkeys.push_back(kv.first);
          next.push_back(std::move(np));
        }
      }
      partials = std::move(next);
      first = false;
    }
    for (auto& p : partials)
      out.emplace(BucketKey::combine(std::move(p.subkeys)), std::move(p.rows));
    return out;
  }

  std::vector<std::shared_ptr<const IIndex>> children_;
  CombineMode mode_;
};

// -----------------------------
// Factories
// -----------------------------

std::unique_ptr<IIndex> make_noop_index() {
  return std::make_unique<NoopIndex>();
}

std::unique_ptr<IIndex> make_columns_index(std::vector<std::string> fields,
                                           ColumnsIndexOptions opts) {
  return std::make_unique<ColumnsIndex>(std::move(fields), opts);
}

std::unique_ptr<IIndex>
make_multi_index(std::vector<std::shared_ptr<const IIndex>> children,
                 CombineMode mode) {
  return std::make_unique<MultiIndex>(std::move(children), mode);
}
} // namespace recmatch::index
