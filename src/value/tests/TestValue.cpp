/**
 * @file TestValue.cpp
 * @brief Unit tests for value::Value kinds, conversions and equality.
 */

#include <catch2/catch_test_macros.hpp>

#include "zbson/core/Constants.hpp"
#include "zbson/value/Value.hpp"

#include <chrono>
#include <limits>
#include <string>

namespace zbson::value {

TEST_CASE("Host values convert to the matching kind", "[value]")
{
    CHECK(Value{}.kind() == Kind::kNull);
    CHECK(Value{nullptr}.kind() == Kind::kNull);
    CHECK(Value{true}.kind() == Kind::kBoolean);
    CHECK(Value{42}.kind() == Kind::kInteger);
    CHECK(Value{std::numeric_limits<core::u64>::max()}.kind() == Kind::kInteger);
    CHECK(Value{1.5}.kind() == Kind::kDouble);
    CHECK(Value{1.5f}.kind() == Kind::kDouble);
    CHECK(Value{"text"}.kind() == Kind::kString);
    CHECK(Value{std::string{"text"}}.kind() == Kind::kString);
    CHECK(Value{Array{1, 2}}.kind() == Kind::kArray);
    CHECK(Value{Document{}}.kind() == Kind::kDocument);
    CHECK(Value{Int32{7}}.kind() == Kind::kInt32);
    CHECK(Value{Foreign{}}.kind() == Kind::kForeign);
}

TEST_CASE("Integer kinds compare by numeric value", "[value]")
{
    CHECK(Value{5} == Value{Int32{5}});
    CHECK(Value{Int64{5}} == Value{UInt64{5}});
    CHECK(Value{Int32{-1}} == Value{-1});
    CHECK_FALSE(Value{Int32{-1}} == Value{UInt64{0xFFFFFFFFFFFFFFFFull}});
    CHECK_FALSE(Value{5} == Value{5.0});
    CHECK_FALSE(Value{1} == Value{true});
}

TEST_CASE("asInteger widens every integer kind", "[value]")
{
    CHECK((Value{Int32{-7}}.asInteger() == core::i128{-7}));
    CHECK((Value{UInt64{std::numeric_limits<core::u64>::max()}}.asInteger() == core::kUInt64Max));
    CHECK_FALSE(Value{"7"}.asInteger().has_value());
}

TEST_CASE("Foreign values never compare equal", "[value]")
{
    const Value foreign{Foreign{std::any{3}}};
    CHECK_FALSE(foreign == foreign);
}

TEST_CASE("Nested containers compare structurally", "[value]")
{
    const Value lhs{Document{{"list", Array{1, "two", Document{{"x", 3.0}}}}}};
    const Value rhs{Document{{"list", Array{Int64{1}, "two", Document{{"x", 3.0}}}}}};
    const Value other{Document{{"list", Array{"two", 1, Document{{"x", 3.0}}}}}};

    CHECK(lhs == rhs);
    CHECK_FALSE(lhs == other);
}

TEST_CASE("ObjectId renders as lowercase hex", "[value][objectid]")
{
    ObjectId oid;
    for (core::usize i = 0; i < oid.bytes.size(); ++i)
        oid.bytes[i] = static_cast<core::byte>(0xA0 + i);

    CHECK(oid.toHex() == "a0a1a2a3a4a5a6a7a8a9aaab");
    CHECK(ObjectId{}.toHex() == std::string(24, '0'));
}

TEST_CASE("DateTime converts to and from epoch milliseconds", "[value][datetime]")
{
    using namespace std::chrono;

    const auto dt = DateTime::fromMillis(1'700'000'000'123);
    CHECK(dt.hasTimezone);
    CHECK(dt.toMillis() == 1'700'000'000'123);
    CHECK(DateTime::fromMillis(-1).toMillis() == -1);

    DateTime fine;
    fine.time = DateTime::TimePoint{microseconds{1'499}};
    CHECK(fine.toMillis() == 1);

    fine.time = DateTime::TimePoint{microseconds{1'501}};
    CHECK(fine.toMillis() == 2);

    fine.time = DateTime::TimePoint{microseconds{2'500}};
    CHECK(fine.toMillis() == 2);
}

TEST_CASE("kindName labels each kind", "[value]")
{
    CHECK(kindName(Kind::kDocument) == "document");
    CHECK(kindName(Kind::kForeign) == "foreign");
    CHECK(kindName(Kind::kObjectId) == "object_id");
}

} // namespace zbson::value
