// /////////////////////////////////////////////////////////////////////////////
/// @file Encoder.hpp
/// @brief Recursive value-tree to byte-stream encoder.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <zbson/codec/ByteWriter.hpp>
#include <zbson/codec/ElementType.hpp>
#include <zbson/codec/Options.hpp>
#include <zbson/core/Error.hpp>
#include <zbson/core/Types.hpp>
#include <zbson/value/Value.hpp>

#include <string_view>
#include <vector>

namespace zbson::codec {

/// @brief Wire tag selected for a host integer by the narrowest-width rule.
/// @return IntegerOverflow outside [-2^63, 2^64 - 1].
[[nodiscard]] core::Expected<ElementType> selectIntegerType(core::i128 value);

// /////////////////////////////////////////////////////////////////////////////
/// @class Encoder
/// @brief Walks a value tree depth-first and appends elements to a buffer.
///
/// One encoder serves one top-level call: it owns the traversal stack
/// exposed to the traversal hook and the output buffer.
// /////////////////////////////////////////////////////////////////////////////
class Encoder final
{
public:
    explicit Encoder(const EncodeOptions& options);
    ~Encoder();

    Encoder(const Encoder&) = delete;
    Encoder& operator=(const Encoder&) = delete;

    /// @brief Encodes a root Document or CustomObject.
    /// @return The complete buffer, or InvalidArgument for any other root.
    [[nodiscard]] core::Expected<std::vector<core::byte>> encode(const value::Value& root);

private:
    /// @brief Dispatches one named element by value kind.
    [[nodiscard]] core::Expected<void> encodeElement(
        std::string_view name, const value::Value& element);

    [[nodiscard]] core::Expected<void> encodeDocument(
        const value::Document& document, const value::Value& parent);

    [[nodiscard]] core::Expected<void> encodeArray(
        const value::Array& array, const value::Value& parent);

    [[nodiscard]] core::Expected<void> encodeObject(
        const value::CustomObject& custom, const value::Value& parent);

    [[nodiscard]] core::Expected<void> encodeInteger(
        std::string_view name, core::i128 integer);

    [[nodiscard]] core::Expected<void> writeHeader(ElementType type, std::string_view name);

    [[nodiscard]] core::Expected<std::vector<std::string>> documentKeys(
        const value::Document& document) const;

    const EncodeOptions& options_;
    ByteWriter           writer_;
    TraversalStack       stack_;
};

} // namespace zbson::codec
