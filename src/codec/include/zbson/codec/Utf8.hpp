/**
 * @file Utf8.hpp
 * @brief Strict UTF-8 validation for decoded text.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef ZBSON_CODEC_UTF8_HPP
    #define ZBSON_CODEC_UTF8_HPP

#include <string_view>

namespace zbson::codec {

/**
 * @brief Checks that @p text is well-formed UTF-8.
 *
 * Rejects overlong forms, UTF-16 surrogates, code points above U+10FFFF,
 * and truncated sequences.
 */
[[nodiscard]] bool isValidUtf8(std::string_view text) noexcept;

} // namespace zbson::codec

#endif // ZBSON_CODEC_UTF8_HPP
