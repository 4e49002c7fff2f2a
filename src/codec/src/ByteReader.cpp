// /////////////////////////////////////////////////////////////////////////////
/// @file ByteReader.cpp
/// @brief ByteReader implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <zbson/codec/ByteReader.hpp>
#include <zbson/codec/Utf8.hpp>

#include <algorithm>
#include <bit>

namespace zbson::codec {

ByteReader::ByteReader(std::span<const core::byte> data) noexcept
    : data_{data}
{}

template <typename U>
core::Expected<U> ByteReader::readLittleEndian()
{
    if (remaining() < sizeof(U)) [[unlikely]]
    {
        return core::makeError(core::ErrorCode::kMalformedDocument,
                               "Unexpected end of buffer");
    }

    U value = 0;
    for (core::usize i = 0; i < sizeof(U); ++i)
    {
        value |= static_cast<U>(static_cast<U>(data_[cursor_ + i]) << (8 * i));
    }
    cursor_ += sizeof(U);
    return value;
}

// -------------------------------------------------------------------------- //
//  Fixed width                                                               //
// -------------------------------------------------------------------------- //

core::Expected<core::u8> ByteReader::readU8()
{
    return readLittleEndian<core::u8>();
}

core::Expected<core::i32> ByteReader::readI32()
{
    auto r = readLittleEndian<core::u32>();
    if (!r.has_value()) return std::unexpected(std::move(r.error()));
    return static_cast<core::i32>(*r);
}

core::Expected<core::i64> ByteReader::readI64()
{
    auto r = readLittleEndian<core::u64>();
    if (!r.has_value()) return std::unexpected(std::move(r.error()));
    return static_cast<core::i64>(*r);
}

core::Expected<core::u64> ByteReader::readU64()
{
    return readLittleEndian<core::u64>();
}

core::Expected<core::f64> ByteReader::readF64()
{
    auto r = readLittleEndian<core::u64>();
    if (!r.has_value()) return std::unexpected(std::move(r.error()));
    return std::bit_cast<core::f64>(*r);
}

core::Expected<std::span<const core::byte>> ByteReader::readBytes(core::usize count)
{
    if (remaining() < count) [[unlikely]]
    {
        return core::makeError(core::ErrorCode::kMalformedDocument,
                               "Unexpected end of buffer");
    }

    auto out = data_.subspan(cursor_, count);
    cursor_ += count;
    return out;
}

// -------------------------------------------------------------------------- //
//  Strings                                                                   //
// -------------------------------------------------------------------------- //

core::Expected<std::string_view> ByteReader::readCString()
{
    const auto begin = data_.begin() + static_cast<core::isize>(cursor_);
    const auto nul = std::find(begin, data_.end(), core::byte{0});
    if (nul == data_.end())
    {
        return core::makeError(core::ErrorCode::kMalformedDocument,
                               "Unterminated element name");
    }

    const auto length = static_cast<core::usize>(nul - begin);
    std::string_view name{reinterpret_cast<const char*>(data_.data() + cursor_), length};
    cursor_ += length + 1;
    return name;
}

core::Expected<std::string> ByteReader::readString()
{
    const auto start = cursor_;
    const auto length = ZBSON_TRY(readI32());

    if (length < 1 || static_cast<core::usize>(length) > remaining())
    {
        cursor_ = start;
        return core::makeError(core::ErrorCode::kMalformedDocument,
                               "String length out of bounds");
    }

    const auto bytes = data_.subspan(cursor_, static_cast<core::usize>(length));
    if (bytes.back() != core::byte{0})
    {
        cursor_ = start;
        return core::makeError(core::ErrorCode::kMalformedDocument,
                               "String is missing its NUL terminator");
    }

    std::string text{reinterpret_cast<const char*>(bytes.data()), bytes.size() - 1};
    if (!isValidUtf8(text))
    {
        cursor_ = start;
        return core::makeError(core::ErrorCode::kInvalidUtf8,
                               "String payload is not valid UTF-8");
    }

    cursor_ += bytes.size();
    return text;
}

// -------------------------------------------------------------------------- //
//  Cursor                                                                    //
// -------------------------------------------------------------------------- //

core::Expected<core::u8> ByteReader::peekAt(core::usize offset) const
{
    if (offset >= data_.size())
    {
        return core::makeError(core::ErrorCode::kMalformedDocument,
                               "Offset past end of buffer");
    }
    return static_cast<core::u8>(data_[offset]);
}

core::Expected<void> ByteReader::seek(core::usize offset)
{
    if (offset > data_.size())
    {
        return core::makeError(core::ErrorCode::kMalformedDocument,
                               "Offset past end of buffer");
    }
    cursor_ = offset;
    return {};
}

} // namespace zbson::codec
