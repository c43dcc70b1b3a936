#include "recmatch/util/util.hpp"

#include <cstdio>
#include <type_traits>
#include <utility>

namespace recmatch::util {
std::string_view error_name(MatchError e) noexcept {
  switch (e) {
    case MatchError::None:
      return "None";
    case MatchError::InvalidArgument:
      return "InvalidArgument";
    case MatchError::DuplicateKey:
      return "DuplicateKey";
    case MatchError::FieldMismatch:
      return "FieldMismatch";
    case MatchError::UnregisteredTable:
      return "UnregisteredTable";
    case MatchError::MissingField:
      return "MissingField";
    case MatchError::TypeMismatch:
      return "TypeMismatch";
    case MatchError::NotFound:
      return "NotFound";
    case MatchError::Unscored:
      return "Unscored";
    case MatchError::Internal:
      return "Internal";
  }
  return "Unknown";
}

std::string_view error_description(MatchError e) noexcept {
  switch (e) {
    case MatchError::None:
      return "Success";
    case MatchError::InvalidArgument:
      return "An input argument violated preconditions.";
    case MatchError::DuplicateKey:
      return "Table row keys contain duplicates; keys must be unique.";
    case MatchError::FieldMismatch:
      return "Matched tables do not have the same fields.";
    case MatchError::UnregisteredTable:
      return "Table was not indexed by this index; call keys() first.";
    case MatchError::MissingField:
      return "A required field does not exist in the record.";
    case MatchError::TypeMismatch:
      return "Value type is not supported by this comparison.";
    case MatchError::NotFound:
      return "Requested item does not exist.";
    case MatchError::Unscored:
      return "Every scorer refused the pair; wrap refusing scorers in a "
          "max/min combinator.";
    case MatchError::Internal:
      return "An internal invariant was violated (bug).";
  }
  return "Unknown error";
}

// -----------------------------
// Values
// -----------------------------

bool is_null(const Value& v) noexcept {
  return std::holds_alternative<Null>(v);
}

bool is_null(const Scalar& s) noexcept {
  return std::holds_alternative<Null>(s);
}

std::optional<double> as_number(const Value& v) noexcept {
  if (const auto* i = std::get_if<std::int64_t>(&v))
    return static_cast<double>(*i);
  if (const auto* d = std::get_if<double>(&v)) return *d;
  return std::nullopt;
}

std::optional<Scalar> as_scalar(const Value& v) {
  return std::visit(
      [](const auto& x) -> std::optional<Scalar> {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, List>) {
          return std::nullopt;
        } else {
          return Scalar{x};
        }
      },
      v);
}

Value to_value(const Scalar& s) {
  return std::visit([](const auto& x) -> Value { return x; }, s);
}

bool values_equal(const Value& a, const Value& b) {
  if (is_null(a) || is_null(b)) return false;
  const auto na = as_number(a);
  const auto nb = as_number(b);
  if (na && nb) return *na == *nb;
  return a == b;
}

std::partial_ordering compare_values(const Value& a, const Value& b) {
  const auto na = as_number(a);
  const auto nb = as_number(b);
  if (na && nb) return *na <=> *nb;
  if (a.index() != b.index()) return std::partial_ordering::unordered;
  if (const auto* s = std::get_if<std::string>(&a))
    return *s <=> std::get<std::string>(b);
  if (const auto* d = std::get_if<Date>(&a)) return *d <=> std::get<Date>(b);
  if (const auto* f = std::get_if<bool>(&a)) return *f <=> std::get<bool>(b);
  return std::partial_ordering::unordered;
}

namespace {
std::string date_to_string(const Date& d) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(d.year()),
                static_cast<unsigned>(d.month()),
                static_cast<unsigned>(d.day()));
  return buf;
}

std::string double_to_string(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%g", v);
  return buf;
}
} // namespace

std::string to_string(const Scalar& s) {
  return to_string(to_value(s));
}

std::string to_string(const Value& v) {
  return std::visit(
      [](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, Null>) {
          return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
          return x ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return std::to_string(x);
        } else if constexpr (std::is_same_v<T, double>) {
          return double_to_string(x);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return x;
        } else if constexpr (std::is_same_v<T, Date>) {
          return date_to_string(x);
        } else {
          std::string out = "[";
          for (std::size_t i = 0; i < x.size(); ++i) {
            if (i) out += ", ";
            out += to_string(x[i]);
          }
          out += "]";
          return out;
        }
      },
      v);
}

std::string to_string(const RowKey& k) {
  if (const auto* i = std::get_if<std::int64_t>(&k)) return std::to_string(*i);
  return std::get<std::string>(k);
}

// -----------------------------
// Schema / Row / Table
// -----------------------------

Schema::Schema(std::vector<std::string> fields) : fields_(std::move(fields)) {
  for (std::size_t i = 0; i < fields_.size(); ++i) pos_.emplace(fields_[i], i);
}

std::optional<std::size_t> Schema::position(std::string_view field) const {
  const auto it = pos_.find(field);
  if (it == pos_.end()) return std::nullopt;
  return it->second;
}

const Value* Row::find(std::string_view field) const {
  if (!schema) return nullptr;
  const auto p = schema->position(field);
  if (!p || *p >= values.size()) return nullptr;
  return &values[*p];
}

Value* Row::find(std::string_view field) {
  if (!schema) return nullptr;
  const auto p = schema->position(field);
  if (!p || *p >= values.size()) return nullptr;
  return &values[*p];
}

Expected<Table> Table::create(std::vector<std::string> fields) {
  auto schema = std::make_shared<const Schema>(std::move(fields));
  // Schema keeps the first position per name, so a repeat maps elsewhere.
  for (std::size_t i = 0; i < schema->size(); ++i) {
    if (schema->position(schema->fields()[i]) != i)
      return tl::unexpected(MatchError::InvalidArgument);
  }
  return Table(std::move(schema));
}

Expected<void> Table::append(RowKey key, std::vector<Value> values) {
  if (values.size() != schema_->size())
    return tl::unexpected(MatchError::InvalidArgument);
  const auto [it, inserted] = by_key_.emplace(key, rows_.size());
  if (!inserted && !duplicate_) duplicate_ = key;
  rows_.push_back(Row{std::move(key), std::move(values), schema_});
  return {};
}

std::optional<std::size_t> Table::find(const RowKey& key) const {
  const auto it = by_key_.find(key);
  if (it == by_key_.end()) return std::nullopt;
  return it->second;
}

std::optional<RowKey> Table::first_duplicate_key() const {
  return duplicate_;
}

bool Table::same_fields(const Table& other) const {
  if (fields().size() != other.fields().size()) return false;
  for (const auto& f : fields()) {
    if (!other.schema_->position(f)) return false;
  }
  return true;
}
} // namespace recmatch::util
