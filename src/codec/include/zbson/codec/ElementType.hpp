/**
 * @file ElementType.hpp
 * @brief One-byte element tags shared by the encoder and decoder.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef ZBSON_CODEC_ELEMENTTYPE_HPP
    #define ZBSON_CODEC_ELEMENTTYPE_HPP

#include <zbson/core/Types.hpp>

#include <string_view>

namespace zbson::codec {

/**
 * @brief Supported element tags.
 *
 * Undefined (0x06), regex (0x0B), DBPointer (0x0C), JavaScript (0x0D,
 * 0x0F) and symbol (0x0E) are not supported. 0x11 carries an
 * unsigned 64-bit integer rather than the MongoDB-internal timestamp.
 */
enum class ElementType : core::u8 {
    kDouble   = 0x01,
    kString   = 0x02,
    kDocument = 0x03,
    kArray    = 0x04,
    kBinary   = 0x05,
    kObjectId = 0x07,
    kBoolean  = 0x08,
    kDateTime = 0x09,
    kNull     = 0x0A,
    kInt32    = 0x10,
    kUInt64   = 0x11,
    kInt64    = 0x12,
};

/**
 * @brief Whether @p tag is one of the recognised element tags.
 */
[[nodiscard]] constexpr bool isKnownElementType(core::u8 tag) noexcept
{
    switch (static_cast<ElementType>(tag))
    {
        case ElementType::kDouble:
        case ElementType::kString:
        case ElementType::kDocument:
        case ElementType::kArray:
        case ElementType::kBinary:
        case ElementType::kObjectId:
        case ElementType::kBoolean:
        case ElementType::kDateTime:
        case ElementType::kNull:
        case ElementType::kInt32:
        case ElementType::kUInt64:
        case ElementType::kInt64:
            return true;
    }
    return false;
}

[[nodiscard]] constexpr std::string_view elementTypeName(ElementType type) noexcept
{
    switch (type)
    {
        case ElementType::kDouble:   return "double";
        case ElementType::kString:   return "string";
        case ElementType::kDocument: return "document";
        case ElementType::kArray:    return "array";
        case ElementType::kBinary:   return "binary";
        case ElementType::kObjectId: return "object_id";
        case ElementType::kBoolean:  return "boolean";
        case ElementType::kDateTime: return "UTCdatetime";
        case ElementType::kNull:     return "none";
        case ElementType::kInt32:    return "int32";
        case ElementType::kUInt64:   return "uint64";
        case ElementType::kInt64:    return "int64";
    }
    return "unknown";
}

} // namespace zbson::codec

#endif // ZBSON_CODEC_ELEMENTTYPE_HPP
