// /////////////////////////////////////////////////////////////////////////////
/// @file Decoder.hpp
/// @brief Byte-stream to value-tree decoder.
///
/// A document is decoded by a small state machine
/// (ReadLength -> ReadElement* -> Done) that recurses for nested documents
/// and arrays. Any malformed byte aborts the whole decode.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <zbson/codec/ByteReader.hpp>
#include <zbson/codec/ElementType.hpp>
#include <zbson/codec/Options.hpp>
#include <zbson/core/Error.hpp>
#include <zbson/core/Types.hpp>
#include <zbson/value/Value.hpp>

#include <span>

namespace zbson::codec {

/// @brief Outcome of decoding one length-prefixed container.
struct DecodeResult
{
    /// Offset one past the container's terminating NUL.
    core::usize end{0};
    value::Value value;
};

class Decoder final
{
public:
    Decoder(std::span<const core::byte> data, const DecodeOptions& options) noexcept;
    ~Decoder();

    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;

    /**
     * @brief Decodes the container starting at offset @p base.
     * @param base    Offset of the container's length prefix.
     * @param asArray Decode element values positionally, discarding names.
     * @return The end offset and the decoded Document, Array, or (for
     *         documents carrying a class marker) reconstructed object.
     */
    [[nodiscard]] core::Expected<DecodeResult> decodeDocument(core::usize base, bool asArray = false);

private:
    /// @brief State machine behind decodeDocument; the container must end at
    ///        or before @p limit.
    [[nodiscard]] core::Expected<DecodeResult> decodeContainer(
        core::usize base, bool asArray, core::usize limit);

    /// @brief Decodes one payload of @p type at the cursor, bounded by
    ///        @p limit (the offset of the enclosing terminator).
    [[nodiscard]] core::Expected<value::Value> decodeValue(ElementType type, core::usize limit);

    [[nodiscard]] core::Expected<value::Value> decodeBinary();

    ByteReader           reader_;
    const DecodeOptions& options_;
};

} // namespace zbson::codec
