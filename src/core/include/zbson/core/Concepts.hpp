/**
 * @file Concepts.hpp
 * @brief C++20 concepts constraining the host-value conversions.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ZBSON_CORE_CONCEPTS_HPP
    #define ZBSON_CORE_CONCEPTS_HPP

    #include "Types.hpp"

    #include <concepts>
    #include <type_traits>

namespace zbson::core {

/**
 * @brief A host integer subject to the narrowest-width rule on encode.
 *
 * Excludes bool (encoded as a boolean element) and character types
 * (which read as text, not numbers), includes the 128-bit extension.
 */
template <typename T>
concept HostInteger = (std::integral<T> || std::same_as<std::remove_cv_t<T>, i128>)
    && !std::same_as<std::remove_cv_t<T>, bool>
    && !std::same_as<std::remove_cv_t<T>, char>
    && !std::same_as<std::remove_cv_t<T>, char8_t>;

/**
 * @brief A host floating-point type narrowed to an IEEE-754 double.
 */
template <typename T>
concept HostFloating = std::floating_point<T>;

} // namespace zbson::core

#endif // ZBSON_CORE_CONCEPTS_HPP
