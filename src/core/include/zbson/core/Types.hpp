/**
 * @file Types.hpp
 * @brief Scalar aliases used across the codec.
 *
 * The wire format is built from little-endian i32 / i64 / u64 fields and
 * IEEE-754 doubles over raw std::byte buffers. Host integers are widened to
 * i128 so that the full range of both i64 and u64 can be classified before
 * a wire width is chosen.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ZBSON_CORE_TYPES_HPP
    #define ZBSON_CORE_TYPES_HPP

    #include <cstddef>
    #include <cstdint>

namespace zbson::core {

using byte  = std::byte;
using usize = std::size_t;
using isize = std::ptrdiff_t;

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

__extension__ using i128 = __int128;

using f64 = double;

} // namespace zbson::core

#endif // ZBSON_CORE_TYPES_HPP
