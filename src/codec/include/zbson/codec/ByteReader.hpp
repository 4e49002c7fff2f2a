// /////////////////////////////////////////////////////////////////////////////
/// @file ByteReader.hpp
/// @brief Bounds-checked little-endian cursor over an encoded buffer.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <zbson/core/Types.hpp>
#include <zbson/core/Error.hpp>

#include <span>
#include <string>
#include <string_view>

namespace zbson::codec {

// /////////////////////////////////////////////////////////////////////////////
/// @class ByteReader
/// @brief Read-only view with a movable cursor.
///
/// Every read that would cross the end of the view fails with
/// MalformedDocument and leaves the cursor where it was.
// /////////////////////////////////////////////////////////////////////////////
class ByteReader final
{
public:
    explicit ByteReader(std::span<const core::byte> data) noexcept;

    // --------------------------------------------------------------------- //
    //  Fixed width                                                           //
    // --------------------------------------------------------------------- //

    [[nodiscard]] core::Expected<core::u8>  readU8();
    [[nodiscard]] core::Expected<core::i32> readI32();
    [[nodiscard]] core::Expected<core::i64> readI64();
    [[nodiscard]] core::Expected<core::u64> readU64();
    [[nodiscard]] core::Expected<core::f64> readF64();

    /// @brief Returns a view of the next @p count bytes and skips them.
    [[nodiscard]] core::Expected<std::span<const core::byte>> readBytes(core::usize count);

    // --------------------------------------------------------------------- //
    //  Strings                                                               //
    // --------------------------------------------------------------------- //

    /// @brief Reads up to the next NUL byte and skips the terminator.
    /// @return The bytes before the NUL; no encoding check is made.
    [[nodiscard]] core::Expected<std::string_view> readCString();

    /// @brief Reads an int32-length-prefixed, NUL-terminated UTF-8 string.
    /// @return InvalidUtf8 when the payload is not valid UTF-8.
    [[nodiscard]] core::Expected<std::string> readString();

    // --------------------------------------------------------------------- //
    //  Cursor                                                                //
    // --------------------------------------------------------------------- //

    [[nodiscard]] core::usize position() const noexcept { return cursor_; }
    [[nodiscard]] core::usize size() const noexcept { return data_.size(); }
    [[nodiscard]] core::usize remaining() const noexcept { return data_.size() - cursor_; }

    /// @brief Peeks at the byte at absolute offset @p offset.
    [[nodiscard]] core::Expected<core::u8> peekAt(core::usize offset) const;

    /// @brief Moves the cursor to absolute offset @p offset.
    [[nodiscard]] core::Expected<void> seek(core::usize offset);

private:
    template <typename U>
    [[nodiscard]] core::Expected<U> readLittleEndian();

    std::span<const core::byte> data_;
    core::usize                 cursor_{0};
};

} // namespace zbson::codec
