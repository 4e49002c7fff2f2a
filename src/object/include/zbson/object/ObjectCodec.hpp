/**
 * @file ObjectCodec.hpp
 * @brief Class-marker injection and custom object reconstruction.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef ZBSON_OBJECT_OBJECTCODEC_HPP
    #define ZBSON_OBJECT_OBJECTCODEC_HPP

#include <zbson/core/Error.hpp>
#include <zbson/value/IDocumentCodable.hpp>
#include <zbson/value/Value.hpp>

namespace zbson::object {

class ClassRegistry;

/**
 * @brief Document form of @p object with the class marker set to its
 *        type name.
 *
 * A marker element already present in the object's own document is
 * overwritten in place.
 */
[[nodiscard]] core::Expected<value::Document> toMarkedDocument(
    const value::IDocumentCodable& object);

/**
 * @brief Whether @p document carries the class marker element.
 */
[[nodiscard]] bool hasClassMarker(const value::Document& document) noexcept;

/**
 * @brief Rebuilds the object described by a marked document.
 * @param document Decoded document, marker included.
 * @param registry Registry to consult; null behaves like an empty registry.
 * @return The factory's result, or MissingClassDefinition when the marker
 *         is not text or names an unregistered type.
 */
[[nodiscard]] core::Expected<value::Value> fromMarkedDocument(
    const value::Document& document, const ClassRegistry* registry);

} // namespace zbson::object

#endif // ZBSON_OBJECT_OBJECTCODEC_HPP
