// /////////////////////////////////////////////////////////////////////////////
/// @file ByteWriter.cpp
/// @brief ByteWriter implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <zbson/codec/ByteWriter.hpp>

#include <bit>
#include <utility>

namespace zbson::codec {

ByteWriter::ByteWriter() noexcept = default;
ByteWriter::~ByteWriter() = default;

ByteWriter::ByteWriter(ByteWriter&&) noexcept = default;
ByteWriter& ByteWriter::operator=(ByteWriter&&) noexcept = default;

template <typename U>
void ByteWriter::writeLittleEndian(U value)
{
    for (core::usize i = 0; i < sizeof(U); ++i)
    {
        buffer_.push_back(static_cast<core::byte>((value >> (8 * i)) & 0xFFu));
    }
}

// -------------------------------------------------------------------------- //
//  Fixed width                                                               //
// -------------------------------------------------------------------------- //

void ByteWriter::writeU8(core::u8 value) { buffer_.push_back(static_cast<core::byte>(value)); }

void ByteWriter::writeI32(core::i32 value) { writeLittleEndian(static_cast<core::u32>(value)); }
void ByteWriter::writeI64(core::i64 value) { writeLittleEndian(static_cast<core::u64>(value)); }
void ByteWriter::writeU64(core::u64 value) { writeLittleEndian(value); }

void ByteWriter::writeF64(core::f64 value)
{
    writeLittleEndian(std::bit_cast<core::u64>(value));
}

void ByteWriter::writeBytes(std::span<const core::byte> bytes)
{
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

// -------------------------------------------------------------------------- //
//  Strings                                                                   //
// -------------------------------------------------------------------------- //

core::Expected<void> ByteWriter::writeCString(std::string_view name)
{
    if (name.find('\0') != std::string_view::npos)
    {
        return core::makeError(core::ErrorCode::kInvalidName,
                               "Element names may not include NUL bytes");
    }

    const auto* first = reinterpret_cast<const core::byte*>(name.data());
    buffer_.insert(buffer_.end(), first, first + name.size());
    buffer_.push_back(core::byte{0});
    return {};
}

void ByteWriter::writeString(std::string_view value)
{
    writeI32(static_cast<core::i32>(value.size() + 1));
    const auto* first = reinterpret_cast<const core::byte*>(value.data());
    buffer_.insert(buffer_.end(), first, first + value.size());
    buffer_.push_back(core::byte{0});
}

// -------------------------------------------------------------------------- //
//  Length prefixes                                                           //
// -------------------------------------------------------------------------- //

core::usize ByteWriter::reserveI32()
{
    const auto offset = buffer_.size();
    buffer_.resize(buffer_.size() + 4, core::byte{0});
    return offset;
}

void ByteWriter::patchI32(core::usize offset, core::i32 value)
{
    const auto bits = static_cast<core::u32>(value);
    for (core::usize i = 0; i < 4; ++i)
    {
        buffer_[offset + i] = static_cast<core::byte>((bits >> (8 * i)) & 0xFFu);
    }
}

// -------------------------------------------------------------------------- //
//  Query                                                                     //
// -------------------------------------------------------------------------- //

core::usize ByteWriter::size() const noexcept { return buffer_.size(); }

std::span<const core::byte> ByteWriter::data() const noexcept { return buffer_; }

std::vector<core::byte> ByteWriter::release() noexcept
{
    return std::exchange(buffer_, {});
}

} // namespace zbson::codec
