// /////////////////////////////////////////////////////////////////////////////
/// @file Scalars.hpp
/// @brief Leaf value types carried by a zbson::value::Value.
///
/// Width markers, binary payloads, identifiers, and timestamps. Each type
/// maps onto exactly one element tag on the wire.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#ifndef ZBSON_VALUE_SCALARS_HPP
    #define ZBSON_VALUE_SCALARS_HPP

#include <zbson/core/Constants.hpp>
#include <zbson/core/Types.hpp>

#include <any>
#include <array>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace zbson::value {

class IDocumentCodable;

/// @brief Null / absent value.
struct Null
{
    bool operator==(const Null&) const = default;
};

/// @brief Host integer whose wire width is chosen by the range rule.
struct Integer
{
    core::i128 value{0};
};

/// @brief Explicit 32-bit width marker, bypasses the range rule.
struct Int32
{
    core::i32 value{0};
};

/// @brief Explicit signed 64-bit width marker.
struct Int64
{
    core::i64 value{0};
};

/// @brief Explicit unsigned 64-bit width marker.
struct UInt64
{
    core::u64 value{0};
};

/// @brief Extended-precision decimal, narrowed to a double on encode.
struct Decimal
{
    long double value{0};

    bool operator==(const Decimal&) const = default;
};

/// @brief Byte string with a binary subtype.
struct Binary
{
    std::vector<core::byte> data;
    core::u8 subtype{core::kBinarySubtypeGeneric};

    bool operator==(const Binary&) const = default;
};

/// @brief 128-bit unique identifier, stored as its 16 raw bytes.
struct Uuid
{
    std::array<core::byte, core::kUuidSize> bytes{};

    bool operator==(const Uuid&) const = default;
};

/// @brief 12-byte object identifier.
struct ObjectId
{
    std::array<core::byte, core::kObjectIdSize> bytes{};

    /// @brief Lowercase hexadecimal rendering, two characters per byte.
    [[nodiscard]] std::string toHex() const;

    bool operator==(const ObjectId&) const = default;
};

/// @brief UTC timestamp with microsecond resolution.
///
/// @c hasTimezone is false for naive local-less timestamps; such values are
/// encoded as if they were UTC and raise a MissingTimezone warning.
struct DateTime
{
    using TimePoint = std::chrono::sys_time<std::chrono::microseconds>;

    /// Millisecond offsets representable by TimePoint.
    static constexpr core::i64 kMaxMillis = TimePoint::duration::max().count() / 1000;
    static constexpr core::i64 kMinMillis = TimePoint::duration::min().count() / 1000;

    TimePoint time{};
    bool hasTimezone{true};

    [[nodiscard]] static constexpr bool isRepresentable(core::i64 millis) noexcept
    {
        return millis >= kMinMillis && millis <= kMaxMillis;
    }

    /// @brief Timestamp at @p millis milliseconds from the Unix epoch (UTC).
    /// @pre isRepresentable(millis)
    [[nodiscard]] static DateTime fromMillis(core::i64 millis) noexcept;

    /// @brief Milliseconds from the Unix epoch, rounded to nearest.
    [[nodiscard]] core::i64 toMillis() const noexcept;

    bool operator==(const DateTime&) const = default;
};

/// @brief Application object encoded through its IDocumentCodable interface.
struct CustomObject
{
    std::shared_ptr<const IDocumentCodable> object;
};

/// @brief Host value outside the closed type set.
///
/// Only encodable when an unknown-value hook maps it to something else.
struct Foreign
{
    std::any payload;
};

} // namespace zbson::value

#endif // ZBSON_VALUE_SCALARS_HPP
