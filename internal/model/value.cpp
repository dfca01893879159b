#include "internal/model/value.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <type_traits>

namespace mapper::model {

namespace {

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::optional<std::int64_t> ParseInt(const std::string& text) {
  if (text.empty()) return std::nullopt;
  errno           = 0;
  char*     end   = nullptr;
  long long value = std::strtoll(text.c_str(), &end, 10);
  if (errno != 0 || end == nullptr || *end != '\0') return std::nullopt;
  return static_cast<std::int64_t>(value);
}

std::optional<double> ParseDouble(const std::string& text) {
  if (text.empty()) return std::nullopt;
  errno        = 0;
  char*  end   = nullptr;
  double value = std::strtod(text.c_str(), &end);
  if (errno != 0 || end == nullptr || *end != '\0' || std::isnan(value)) return std::nullopt;
  return value;
}

std::optional<double> AsNumber(const Value& value) {
  if (const auto* i = std::get_if<std::int64_t>(&value)) return static_cast<double>(*i);
  if (const auto* d = std::get_if<double>(&value)) return *d;
  return std::nullopt;
}

// Unordered pairs (a NaN operand) yield nullopt.
template <typename T>
std::optional<int> ThreeWay(const T& a, const T& b) {
  if (a < b) return -1;
  if (b < a) return 1;
  if (a == b) return 0;
  return std::nullopt;
}

} // namespace

std::optional<FieldType> ParseFieldType(std::string_view tag) {
  const auto t = Lower(tag);
  if (t == "integer" || t == "int" || t == "int64" || t == "long") return FieldType::kInteger;
  if (t == "float" || t == "real" || t == "double") return FieldType::kFloat;
  if (t == "text" || t == "string" || t == "str") return FieldType::kText;
  if (t == "boolean" || t == "bool") return FieldType::kBoolean;
  if (t == "timestamp" || t == "datetime") return FieldType::kTimestamp;
  if (t == "identifier" || t == "id") return FieldType::kIdentifier;
  return std::nullopt;
}

std::string_view TypeName(const Value& value) {
  switch (value.index()) {
    case 0:
      return "null";
    case 1:
      return ToString(FieldType::kInteger);
    case 2:
      return ToString(FieldType::kFloat);
    case 3:
      return ToString(FieldType::kText);
    case 4:
      return ToString(FieldType::kBoolean);
    case 5:
      return ToString(FieldType::kTimestamp);
    default:
      return ToString(FieldType::kIdentifier);
  }
}

std::optional<Value> Coerce(const Value& value, FieldType type) {
  if (IsNull(value)) {
    return value;
  }

  switch (type) {
    case FieldType::kInteger:
      if (std::holds_alternative<std::int64_t>(value)) return value;
      return std::nullopt;

    case FieldType::kFloat:
      if (const auto* d = std::get_if<double>(&value)) {
        if (std::isnan(*d)) return std::nullopt;
        return value;
      }
      if (const auto* i = std::get_if<std::int64_t>(&value)) return Value{static_cast<double>(*i)};
      return std::nullopt;

    case FieldType::kText:
      if (std::holds_alternative<std::string>(value)) return value;
      return std::nullopt;

    case FieldType::kBoolean:
      if (std::holds_alternative<bool>(value)) return value;
      return std::nullopt;

    case FieldType::kTimestamp:
      if (const auto* tp = std::get_if<util::TimePoint>(&value)) return Value{util::TruncateToMicros(*tp)};
      if (const auto* s = std::get_if<std::string>(&value)) {
        if (auto parsed = util::ParseIso8601(*s)) return Value{*parsed};
      }
      return std::nullopt;

    case FieldType::kIdentifier:
      if (std::holds_alternative<Identifier>(value)) return value;
      if (const auto* i = std::get_if<std::int64_t>(&value)) {
        if (*i >= 0) return Value{Identifier{static_cast<std::uint64_t>(*i)}};
      }
      return std::nullopt;
  }
  return std::nullopt;
}

std::optional<Value> ParseValue(const std::string& text, FieldType type) {
  if (text == "null" || text == "~") {
    return Value{Null{}};
  }

  switch (type) {
    case FieldType::kInteger:
      if (auto i = ParseInt(text)) return Value{*i};
      return std::nullopt;

    case FieldType::kFloat:
      if (auto d = ParseDouble(text)) return Value{*d};
      return std::nullopt;

    case FieldType::kText:
      return Value{text};

    case FieldType::kBoolean: {
      const auto t = Lower(text);
      if (t == "true" || t == "yes" || t == "1") return Value{true};
      if (t == "false" || t == "no" || t == "0") return Value{false};
      return std::nullopt;
    }

    case FieldType::kTimestamp:
      if (auto tp = util::ParseIso8601(text)) return Value{*tp};
      return std::nullopt;

    case FieldType::kIdentifier:
      if (auto i = ParseInt(text); i && *i >= 0) return Value{Identifier{static_cast<std::uint64_t>(*i)}};
      return std::nullopt;
  }
  return std::nullopt;
}

std::optional<int> Compare(const Value& a, const Value& b) {
  if (IsNull(a) || IsNull(b)) {
    return std::nullopt;
  }

  if (a.index() == b.index()) {
    return std::visit(
        [&b](const auto& lhs) -> std::optional<int> {
          using T = std::decay_t<decltype(lhs)>;
          if constexpr (std::is_same_v<T, Null>) {
            return std::nullopt;
          } else {
            return ThreeWay(lhs, std::get<T>(b));
          }
        },
        a);
  }

  auto na = AsNumber(a);
  auto nb = AsNumber(b);
  if (na && nb) {
    return ThreeWay(*na, *nb);
  }
  return std::nullopt;
}

bool Equals(const Value& a, const Value& b) {
  if (IsNull(a) || IsNull(b)) {
    return IsNull(a) && IsNull(b);
  }
  auto cmp = Compare(a, b);
  return cmp && *cmp == 0;
}

std::string ToString(const Value& value) {
  std::ostringstream out;
  std::visit(
      [&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Null>) {
          out << "null";
        } else if constexpr (std::is_same_v<T, std::string>) {
          out << '"' << v << '"';
        } else if constexpr (std::is_same_v<T, bool>) {
          out << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, util::TimePoint>) {
          out << util::FormatIso8601(v);
        } else if constexpr (std::is_same_v<T, Identifier>) {
          out << v.value;
        } else {
          out << v;
        }
      },
      value);
  return out.str();
}

} // namespace mapper::model
