/**
 * @file Constants.hpp
 * @brief Wire-format constants.
 *
 * Sizes, binary subtypes, integer range limits, and the reserved class
 * marker key are centralised here so the encoder and decoder agree on a
 * single definition.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ZBSON_CORE_CONSTANTS_HPP
    #define ZBSON_CORE_CONSTANTS_HPP

    #include "Types.hpp"

    #include <limits>
    #include <string_view>

namespace zbson::core {

/// @brief Length prefix (4) plus terminating NUL (1).
inline constexpr usize kMinDocumentSize       = 5;

inline constexpr u8    kBinarySubtypeGeneric  = 0x00;
inline constexpr u8    kBinarySubtypeUuidOld  = 0x03;
inline constexpr u8    kBinarySubtypeUuid     = 0x04;

inline constexpr usize kUuidSize              = 16;
inline constexpr usize kObjectIdSize          = 12;

inline constexpr i128  kInt32Min              = std::numeric_limits<i32>::min();
inline constexpr i128  kInt32Max              = std::numeric_limits<i32>::max();
inline constexpr i128  kInt64Min              = std::numeric_limits<i64>::min();
inline constexpr i128  kInt64Max              = std::numeric_limits<i64>::max();
inline constexpr i128  kUInt64Max             = std::numeric_limits<u64>::max();

/// @brief Element injected into the document of every custom object.
inline constexpr std::string_view kClassMarkerKey = "$$__CLASS_NAME__$$";

} // namespace zbson::core

#endif // ZBSON_CORE_CONSTANTS_HPP
