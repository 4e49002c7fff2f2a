// /////////////////////////////////////////////////////////////////////////////
/// @file ByteWriter.hpp
/// @brief Little-endian append-only byte buffer for the encoder.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <zbson/core/Types.hpp>
#include <zbson/core/Error.hpp>

#include <span>
#include <string_view>
#include <vector>

namespace zbson::codec {

// /////////////////////////////////////////////////////////////////////////////
/// @class ByteWriter
/// @brief Grows a byte buffer with fixed-width little-endian fields,
///        NUL-terminated names, and length-prefixed strings.
///
/// Container lengths are unknown until their elements are written, so the
/// writer hands out placeholder offsets that are patched afterwards.
// /////////////////////////////////////////////////////////////////////////////
class ByteWriter final
{
public:
    ByteWriter() noexcept;
    ~ByteWriter();

    ByteWriter(const ByteWriter&) = delete;
    ByteWriter& operator=(const ByteWriter&) = delete;

    ByteWriter(ByteWriter&&) noexcept;
    ByteWriter& operator=(ByteWriter&&) noexcept;

    // --------------------------------------------------------------------- //
    //  Fixed width                                                           //
    // --------------------------------------------------------------------- //

    void writeU8(core::u8 value);
    void writeI32(core::i32 value);
    void writeI64(core::i64 value);
    void writeU64(core::u64 value);

    /// @brief Writes the IEEE-754 bit pattern of @p value.
    void writeF64(core::f64 value);

    /// @brief Writes raw bytes verbatim.
    void writeBytes(std::span<const core::byte> bytes);

    // --------------------------------------------------------------------- //
    //  Strings                                                               //
    // --------------------------------------------------------------------- //

    /// @brief Writes @p name followed by a NUL terminator.
    /// @return InvalidName if @p name already contains a NUL byte.
    [[nodiscard]] core::Expected<void> writeCString(std::string_view name);

    /// @brief Writes int32(size + 1), the bytes, and a NUL terminator.
    void writeString(std::string_view value);

    // --------------------------------------------------------------------- //
    //  Length prefixes                                                       //
    // --------------------------------------------------------------------- //

    /// @brief Reserves four bytes for a length written later.
    /// @return Offset of the placeholder.
    [[nodiscard]] core::usize reserveI32();

    /// @brief Overwrites the placeholder at @p offset with @p value.
    void patchI32(core::usize offset, core::i32 value);

    // --------------------------------------------------------------------- //
    //  Query                                                                 //
    // --------------------------------------------------------------------- //

    [[nodiscard]] core::usize size() const noexcept;
    [[nodiscard]] std::span<const core::byte> data() const noexcept;

    /// @brief Moves the buffer out, leaving the writer empty.
    [[nodiscard]] std::vector<core::byte> release() noexcept;

private:
    template <typename U>
    void writeLittleEndian(U value);

    std::vector<core::byte> buffer_;
};

} // namespace zbson::codec
