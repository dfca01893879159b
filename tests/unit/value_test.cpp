#include "internal/model/value.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>

namespace {

using mapper::model::Coerce;
using mapper::model::Compare;
using mapper::model::Equals;
using mapper::model::FieldType;
using mapper::model::Identifier;
using mapper::model::Null;
using mapper::model::ParseFieldType;
using mapper::model::ParseValue;
using mapper::model::Value;

void TestFieldTypeAliases() {
  assert(ParseFieldType("integer") == FieldType::kInteger);
  assert(ParseFieldType("INT") == FieldType::kInteger);
  assert(ParseFieldType("string") == FieldType::kText);
  assert(ParseFieldType("bool") == FieldType::kBoolean);
  assert(ParseFieldType("datetime") == FieldType::kTimestamp);
  assert(ParseFieldType("id") == FieldType::kIdentifier);
  assert(!ParseFieldType("blob").has_value());
}

void TestCoerceWidensIntegers() {
  auto as_float = Coerce(Value{std::int64_t{3}}, FieldType::kFloat);
  assert(as_float.has_value());
  assert(std::get<double>(*as_float) == 3.0);

  auto as_id = Coerce(Value{std::int64_t{7}}, FieldType::kIdentifier);
  assert(as_id.has_value());
  assert(std::get<Identifier>(*as_id) == Identifier{7});

  assert(!Coerce(Value{std::int64_t{-1}}, FieldType::kIdentifier).has_value());
  assert(!Coerce(Value{2.5}, FieldType::kInteger).has_value());
  assert(!Coerce(Value{std::string("30")}, FieldType::kInteger).has_value());
  assert(!Coerce(Value{true}, FieldType::kInteger).has_value());
}

void TestCoerceNullPassesThrough() {
  auto coerced = Coerce(Value{Null{}}, FieldType::kInteger);
  assert(coerced.has_value());
  assert(mapper::model::IsNull(*coerced));
}

void TestCoerceTimestampFromText() {
  auto coerced = Coerce(Value{std::string("2024-03-01T12:30:00.250Z")}, FieldType::kTimestamp);
  assert(coerced.has_value());
  const auto tp = std::get<mapper::util::TimePoint>(*coerced);
  assert(mapper::util::FormatIso8601(tp) == "2024-03-01T12:30:00.250000Z");

  assert(!Coerce(Value{std::string("yesterday")}, FieldType::kTimestamp).has_value());
}

void TestCoerceTruncatesTimestampsToMicros() {
  const auto base  = mapper::util::FromUnixMicros(1'700'000'000'000'000);
  const auto fine  = base + std::chrono::nanoseconds(999);
  auto       value = Coerce(Value{fine}, FieldType::kTimestamp);
  assert(value.has_value());
  assert(std::get<mapper::util::TimePoint>(*value) == base);
}

void TestParseValue() {
  assert(std::get<std::int64_t>(*ParseValue("42", FieldType::kInteger)) == 42);
  assert(!ParseValue("42x", FieldType::kInteger).has_value());
  assert(std::get<double>(*ParseValue("1.5", FieldType::kFloat)) == 1.5);
  assert(std::get<bool>(*ParseValue("yes", FieldType::kBoolean)) == true);
  assert(std::get<bool>(*ParseValue("False", FieldType::kBoolean)) == false);
  assert(!ParseValue("maybe", FieldType::kBoolean).has_value());
  assert(std::get<std::string>(*ParseValue("hello", FieldType::kText)) == "hello");
  assert(mapper::model::IsNull(*ParseValue("null", FieldType::kText)));
  assert(mapper::model::IsNull(*ParseValue("~", FieldType::kInteger)));
  assert(std::get<Identifier>(*ParseValue("9", FieldType::kIdentifier)) == Identifier{9});
}

void TestCompareAndEquals() {
  assert(*Compare(Value{std::int64_t{1}}, Value{std::int64_t{2}}) < 0);
  assert(*Compare(Value{2.5}, Value{std::int64_t{2}}) > 0);
  assert(*Compare(Value{std::string("b")}, Value{std::string("a")}) > 0);
  assert(!Compare(Value{Null{}}, Value{std::int64_t{1}}).has_value());
  assert(!Compare(Value{std::string("1")}, Value{std::int64_t{1}}).has_value());

  assert(Equals(Value{std::int64_t{3}}, Value{3.0}));
  assert(Equals(Value{Null{}}, Value{Null{}}));
  assert(!Equals(Value{Null{}}, Value{std::int64_t{0}}));
  assert(!Equals(Value{false}, Value{std::int64_t{0}}));
}

void TestNaNIsUnordered() {
  const double nan = std::numeric_limits<double>::quiet_NaN();

  assert(!Compare(Value{nan}, Value{1.0}).has_value());
  assert(!Compare(Value{1.0}, Value{nan}).has_value());
  assert(!Compare(Value{nan}, Value{std::int64_t{1}}).has_value());
  assert(!Compare(Value{nan}, Value{nan}).has_value());
  assert(!Equals(Value{nan}, Value{nan}));
  assert(!Equals(Value{nan}, Value{0.0}));

  assert(!Coerce(Value{nan}, FieldType::kFloat).has_value());
  assert(!ParseValue("nan", FieldType::kFloat).has_value());
  assert(!ParseValue("NaN", FieldType::kFloat).has_value());
}

void TestToString() {
  assert(mapper::model::ToString(Value{std::string("Alice")}) == "\"Alice\"");
  assert(mapper::model::ToString(Value{Null{}}) == "null");
  assert(mapper::model::ToString(Value{true}) == "true");
  assert(mapper::model::ToString(Value{Identifier{12}}) == "12");
}

void TestIso8601RoundTrip() {
  auto parsed = mapper::util::ParseIso8601("2023-11-14 22:13:20");
  assert(parsed.has_value());
  assert(mapper::util::ToUnixMicros(*parsed) == 1'700'000'000'000'000);
  assert(mapper::util::FormatIso8601(*parsed) == "2023-11-14T22:13:20Z");
  assert(!mapper::util::ParseIso8601("2023-11-14T22:13:20.1234567Z").has_value());
}

} // namespace

int main() {
  TestFieldTypeAliases();
  TestCoerceWidensIntegers();
  TestCoerceNullPassesThrough();
  TestCoerceTimestampFromText();
  TestCoerceTruncatesTimestampsToMicros();
  TestParseValue();
  TestCompareAndEquals();
  TestNaNIsUnordered();
  TestToString();
  TestIso8601RoundTrip();

  std::cout << "mapper_unit_value: pass\n";
  return 0;
}
