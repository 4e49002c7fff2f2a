/**
 * @file TestEncoder.cpp
 * @brief Unit tests for codec::Encoder element dispatch, hooks and warnings.
 */

#include <catch2/catch_test_macros.hpp>

#include "zbson/codec/Encoder.hpp"
#include "zbson/core/Constants.hpp"
#include "zbson/value/IDocumentCodable.hpp"

#include <any>
#include <initializer_list>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace zbson::codec {

namespace {

using value::Array;
using value::Document;
using value::Value;

std::vector<core::byte> bytes(std::initializer_list<int> values)
{
    std::vector<core::byte> out;
    out.reserve(values.size());
    for (int v : values)
        out.push_back(static_cast<core::byte>(v));
    return out;
}

core::Expected<std::vector<core::byte>> encodeWith(const EncodeOptions &options, const Value &root)
{
    Encoder encoder{options};
    return encoder.encode(root);
}

core::Expected<std::vector<core::byte>> encodeDefault(const Value &root)
{
    return encodeWith(EncodeOptions{}, root);
}

/// Tag byte of the first element of a single-element document.
core::u8 firstTag(const std::vector<core::byte> &encoded)
{
    return static_cast<core::u8>(encoded.at(4));
}

std::string renderStep(const TraversalStep &step)
{
    if (const auto *name = std::get_if<std::string>(&step.key))
        return *name;
    return "#" + std::to_string(std::get<core::usize>(step.key));
}

class Tag final : public value::DocumentCodableBase<Tag> {
public:
    static constexpr std::string_view kTypeName = "Tag";

    core::Expected<Document> toDocument() const override { return Document{{"v", 1}}; }
};

} // anonymous namespace

TEST_CASE("Encoder writes booleans byte for byte", "[codec][encoder]")
{
    const auto no = encodeDefault(Document{{"key", false}});
    const auto yes = encodeDefault(Document{{"key", true}});

    REQUIRE(no.has_value());
    REQUIRE(yes.has_value());
    CHECK(*no == bytes({0x0b, 0x00, 0x00, 0x00, 0x08, 'k', 'e', 'y', 0x00, 0x00, 0x00}));
    CHECK(*yes == bytes({0x0b, 0x00, 0x00, 0x00, 0x08, 'k', 'e', 'y', 0x00, 0x01, 0x00}));
}

TEST_CASE("Encoder writes the empty document as five bytes", "[codec][encoder]")
{
    const auto encoded = encodeDefault(Document{});
    REQUIRE(encoded.has_value());
    CHECK(*encoded == bytes({0x05, 0x00, 0x00, 0x00, 0x00}));
}

TEST_CASE("selectIntegerType follows the range rule", "[codec][encoder][integer]")
{
    const auto tagOf = [](core::i128 v) { return selectIntegerType(v).value(); };

    CHECK(tagOf(0) == ElementType::kInt32);
    CHECK(tagOf(-1) == ElementType::kInt32);
    CHECK(tagOf(core::kInt32Max) == ElementType::kInt32);
    CHECK(tagOf(core::kInt32Min) == ElementType::kInt32);
    CHECK(tagOf(core::kInt32Max + 1) == ElementType::kInt64);
    CHECK(tagOf(core::kInt32Min - 1) == ElementType::kInt64);
    CHECK(tagOf(core::kInt64Max) == ElementType::kInt64);
    CHECK(tagOf(core::kInt64Min) == ElementType::kInt64);
    CHECK(tagOf(core::kInt64Max + 1) == ElementType::kUInt64);
    CHECK(tagOf(core::kUInt64Max) == ElementType::kUInt64);
}

TEST_CASE("selectIntegerType rejects values outside 64 bits", "[codec][encoder][integer]")
{
    const auto tooBig = selectIntegerType(core::kUInt64Max + 1);
    REQUIRE_FALSE(tooBig.has_value());
    CHECK(tooBig.error().code() == core::ErrorCode::kIntegerOverflow);
    CHECK(tooBig.error().message().find("18446744073709551616") != std::string::npos);

    const auto tooSmall = selectIntegerType(core::kInt64Min - 1);
    REQUIRE_FALSE(tooSmall.has_value());
    CHECK(tooSmall.error().code() == core::ErrorCode::kIntegerOverflow);
}

TEST_CASE("Encoder emits the selected integer width", "[codec][encoder][integer]")
{
    const auto small = encodeDefault(Document{{"a", 1}});
    REQUIRE(small.has_value());
    CHECK(*small == bytes({0x0c, 0x00, 0x00, 0x00, 0x10, 'a', 0x00, 0x01, 0x00, 0x00, 0x00, 0x00}));

    const auto wide = encodeDefault(Document{{"a", core::i64{1} << 40}});
    REQUIRE(wide.has_value());
    CHECK(firstTag(*wide) == 0x12);
    CHECK(wide->size() == 16);

    const auto huge = encodeDefault(Document{{"a", std::numeric_limits<core::u64>::max()}});
    REQUIRE(huge.has_value());
    CHECK(firstTag(*huge) == 0x11);

    const auto overflow = encodeDefault(Document{{"a", Value{value::Integer{core::kUInt64Max + 1}}}});
    REQUIRE_FALSE(overflow.has_value());
    CHECK(overflow.error().code() == core::ErrorCode::kIntegerOverflow);
}

TEST_CASE("Width markers bypass the range rule", "[codec][encoder][integer]")
{
    const auto forced = encodeDefault(Document{{"a", value::Int64{1}}});
    REQUIRE(forced.has_value());
    CHECK(firstTag(*forced) == 0x12);

    const auto unsignedSmall = encodeDefault(Document{{"a", value::UInt64{1}}});
    REQUIRE(unsignedSmall.has_value());
    CHECK(firstTag(*unsignedSmall) == 0x11);

    const auto narrow = encodeDefault(Document{{"a", value::Int32{-5}}});
    REQUIRE(narrow.has_value());
    CHECK(firstTag(*narrow) == 0x10);
}

TEST_CASE("Encoder writes doubles and narrows decimals", "[codec][encoder]")
{
    const auto dbl = encodeDefault(Document{{"d", 1.0}});
    const auto dec = encodeDefault(Document{{"d", value::Decimal{1.0L}}});

    REQUIRE(dbl.has_value());
    REQUIRE(dec.has_value());
    CHECK(*dbl == bytes({0x10, 0x00, 0x00, 0x00, 0x01, 'd', 0x00,
                         0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xF0, 0x3F, 0x00}));
    CHECK(*dec == *dbl);
}

TEST_CASE("Encoder writes binary, uuid and object id payloads", "[codec][encoder]")
{
    SECTION("binary keeps its subtype")
    {
        value::Binary bin;
        bin.data = bytes({0x01, 0x02});
        bin.subtype = 0x80;

        const auto encoded = encodeDefault(Document{{"b", bin}});
        REQUIRE(encoded.has_value());
        CHECK(*encoded == bytes({0x0f, 0x00, 0x00, 0x00, 0x05, 'b', 0x00,
                                 0x02, 0x00, 0x00, 0x00, 0x80, 0x01, 0x02, 0x00}));
    }

    SECTION("uuid is binary subtype 4")
    {
        value::Uuid uuid;
        uuid.bytes[0] = core::byte{0xAA};
        uuid.bytes[15] = core::byte{0xBB};

        const auto encoded = encodeDefault(Document{{"u", uuid}});
        REQUIRE(encoded.has_value());
        REQUIRE(encoded->size() == 4 + 3 + 4 + 1 + 16 + 1);
        CHECK(firstTag(*encoded) == 0x05);
        CHECK(static_cast<core::u8>((*encoded)[7]) == 16);
        CHECK(static_cast<core::u8>((*encoded)[11]) == core::kBinarySubtypeUuid);
        CHECK((*encoded)[12] == core::byte{0xAA});
        CHECK((*encoded)[27] == core::byte{0xBB});
    }

    SECTION("object id is twelve raw bytes")
    {
        value::ObjectId oid;
        oid.bytes.fill(core::byte{0x11});

        const auto encoded = encodeDefault(Document{{"o", oid}});
        REQUIRE(encoded.has_value());
        CHECK(firstTag(*encoded) == 0x07);
        CHECK(encoded->size() == 4 + 3 + 12 + 1);
    }
}

TEST_CASE("Encoder writes datetimes as epoch milliseconds", "[codec][encoder][datetime]")
{
    const auto encoded = encodeDefault(Document{{"t", value::DateTime::fromMillis(1000)}});
    REQUIRE(encoded.has_value());
    CHECK(*encoded == bytes({0x10, 0x00, 0x00, 0x00, 0x09, 't', 0x00,
                             0xE8, 0x03, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}));
}

TEST_CASE("Naive datetimes raise a MissingTimezone warning", "[codec][encoder][datetime]")
{
    std::vector<WarningCode> warnings;
    const auto options = EncodeOptions::Builder{}
        .onWarning([&warnings](WarningCode code, std::string_view) { warnings.push_back(code); })
        .build();

    auto naive = value::DateTime::fromMillis(5);
    naive.hasTimezone = false;

    const auto encoded = encodeWith(options, Document{{"t", naive}, {"u", value::DateTime::fromMillis(6)}});
    REQUIRE(encoded.has_value());
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0] == WarningCode::kMissingTimezone);
    CHECK(static_cast<core::u8>((*encoded)[7]) == 5);
}

TEST_CASE("Encoder writes strings with length and NUL", "[codec][encoder]")
{
    const auto encoded = encodeDefault(Document{{"s", "hi"}});
    REQUIRE(encoded.has_value());
    CHECK(*encoded == bytes({0x0f, 0x00, 0x00, 0x00, 0x02, 's', 0x00,
                             0x03, 0x00, 0x00, 0x00, 'h', 'i', 0x00, 0x00}));
}

TEST_CASE("Encoder names array elements by index", "[codec][encoder]")
{
    const auto encoded = encodeDefault(Document{{"l", Array{true, nullptr}}});
    REQUIRE(encoded.has_value());
    CHECK(*encoded == bytes({0x14, 0x00, 0x00, 0x00,
                             0x04, 'l', 0x00,
                             0x0c, 0x00, 0x00, 0x00,
                             0x08, '0', 0x00, 0x01,
                             0x0A, '1', 0x00,
                             0x00,
                             0x00}));
}

TEST_CASE("Encoder rejects names containing NUL", "[codec][encoder]")
{
    Document doc;
    doc.set(std::string{"bad\0name", 8}, 1);

    const auto encoded = encodeDefault(doc);
    REQUIRE_FALSE(encoded.has_value());
    CHECK(encoded.error().code() == core::ErrorCode::kInvalidName);
}

TEST_CASE("Encoder requires a document root", "[codec][encoder]")
{
    const auto encoded = encodeDefault(Value{42});
    REQUIRE_FALSE(encoded.has_value());
    CHECK(encoded.error().code() == core::ErrorCode::kInvalidArgument);
}

TEST_CASE("Encoder injects the class marker for custom objects", "[codec][encoder][object]")
{
    const Value root{value::CustomObject{std::make_shared<const Tag>()}};

    const auto encoded = encodeDefault(root);
    REQUIRE(encoded.has_value());

    const std::string text{reinterpret_cast<const char *>(encoded->data()), encoded->size()};
    CHECK(text.find(std::string{core::kClassMarkerKey}) != std::string::npos);
    CHECK(text.find("Tag") != std::string::npos);

    const auto empty = encodeDefault(Value{value::CustomObject{}});
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().code() == core::ErrorCode::kInvalidArgument);
}

TEST_CASE("Traversal hook controls key order", "[codec][encoder][traversal]")
{
    const auto options = EncodeOptions::Builder{}
        .traversal([](const Document &doc, const TraversalStack &) {
            auto keys = doc.keys();
            return std::vector<std::string>(keys.rbegin(), keys.rend());
        })
        .build();

    const auto reversed = encodeWith(options, Document{{"a", 1}, {"b", 2}});
    const auto natural = encodeDefault(Document{{"b", 2}, {"a", 1}});

    REQUIRE(reversed.has_value());
    REQUIRE(natural.has_value());
    CHECK(*reversed == *natural);
}

TEST_CASE("Traversal hook may skip keys but not invent them", "[codec][encoder][traversal]")
{
    SECTION("subset")
    {
        const auto options = EncodeOptions::Builder{}
            .traversal([](const Document &, const TraversalStack &) {
                return std::vector<std::string>{"keep"};
            })
            .build();

        const auto subset = encodeWith(options, Document{{"keep", true}, {"drop", false}});
        const auto expected = encodeDefault(Document{{"keep", true}});
        REQUIRE(subset.has_value());
        REQUIRE(expected.has_value());
        CHECK(*subset == *expected);
    }

    SECTION("unknown key")
    {
        const auto options = EncodeOptions::Builder{}
            .traversal([](const Document &, const TraversalStack &) {
                return std::vector<std::string>{"ghost"};
            })
            .build();

        const auto result = encodeWith(options, Document{{"real", 1}});
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == core::ErrorCode::kInvalidArgument);
    }
}

TEST_CASE("Traversal hook sees the path to each document", "[codec][encoder][traversal]")
{
    std::vector<std::vector<std::string>> paths;
    std::vector<const Value *> parents;

    const auto options = EncodeOptions::Builder{}
        .traversal([&](const Document &doc, const TraversalStack &stack) {
            std::vector<std::string> path;
            for (const auto &step : stack)
                path.push_back(renderStep(step));
            paths.push_back(std::move(path));
            parents.push_back(stack.empty() ? nullptr : stack.back().parent);
            return doc.keys();
        })
        .build();

    const Value root{Document{
        {"outer", Document{{"inner", 1}}},
        {"list", Array{Document{{"x", 2}}}},
    }};

    const auto encoded = encodeWith(options, root);
    REQUIRE(encoded.has_value());

    REQUIRE(paths.size() == 3);
    CHECK(paths[0].empty());
    CHECK(paths[1] == std::vector<std::string>{"outer"});
    CHECK(paths[2] == std::vector<std::string>{"list", "#0"});

    CHECK(parents[1] == &root);
    REQUIRE(parents[2] != nullptr);
    CHECK(parents[2]->is<Array>());
}

TEST_CASE("Unknown values go through the unknown-value hook", "[codec][encoder][unknown]")
{
    struct Opaque
    {
        int id;
    };

    const Document doc{{"w", value::Foreign{Opaque{7}}}};

    SECTION("without a hook")
    {
        const auto result = encodeDefault(doc);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == core::ErrorCode::kUnknownSerializer);
        CHECK(result.error().message().find("key 'w'") != std::string::npos);
    }

    SECTION("the error names the readable host type")
    {
        const auto result = encodeDefault(Document{{"list", value::Foreign{std::vector<int>{1, 2}}}});
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().message().find("std::vector<int") != std::string::npos);
        CHECK(result.error().message().find("St6vector") == std::string::npos);
    }

    SECTION("hook substitutes an encodable value")
    {
        std::vector<int> seen;
        const auto options = EncodeOptions::Builder{}
            .onUnknown([&seen](const Value &unknown) -> Value {
                const auto *opaque = std::any_cast<Opaque>(&unknown.getIf<value::Foreign>()->payload);
                seen.push_back(opaque ? opaque->id : -1);
                return Value{"opaque"};
            })
            .build();

        const auto result = encodeWith(options, doc);
        const auto expected = encodeDefault(Document{{"w", "opaque"}});
        REQUIRE(result.has_value());
        REQUIRE(expected.has_value());
        CHECK(*result == *expected);
        CHECK(seen == std::vector<int>{7});
    }

    SECTION("hook that cannot resolve the value")
    {
        const auto options = EncodeOptions::Builder{}
            .onUnknown([](const Value &unknown) { return unknown; })
            .build();

        const auto result = encodeWith(options, doc);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == core::ErrorCode::kUnknownSerializer);
    }
}

} // namespace zbson::codec
