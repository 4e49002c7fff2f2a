/**
 * @file IDocumentCodable.hpp
 * @brief Interface for application objects encoded as documents.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ZBSON_VALUE_IDOCUMENTCODABLE_HPP
    #define ZBSON_VALUE_IDOCUMENTCODABLE_HPP

#include <zbson/core/Error.hpp>
#include <zbson/value/Value.hpp>

#include <string_view>

namespace zbson::value {

/**
 * @brief Object that encodes itself as a plain document.
 *
 * The encoder adds the class marker element carrying typeName(); the
 * decoder hands the marked document back to the factory registered under
 * that name in an object::ClassRegistry.
 */
class IDocumentCodable
{
public:
    virtual ~IDocumentCodable() = default;

    /**
     * @brief Identifier this object is registered under.
     * @return Type name written to the class marker element.
     */
    [[nodiscard]] virtual std::string_view typeName() const noexcept = 0;

    /**
     * @brief Snapshot of the object's state as a plain document.
     * @return The document, or the error that prevented producing it.
     */
    [[nodiscard]] virtual core::Expected<Document> toDocument() const = 0;
};

/**
 * @brief Base for registrable types: typeName() is @c Derived::kTypeName,
 *        the same name ClassRegistry::add<Derived>() registers.
 */
template <typename Derived>
class DocumentCodableBase : public IDocumentCodable
{
public:
    [[nodiscard]] std::string_view typeName() const noexcept final
    {
        return Derived::kTypeName;
    }
};

} // namespace zbson::value

#endif // ZBSON_VALUE_IDOCUMENTCODABLE_HPP
