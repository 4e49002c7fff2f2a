/**
 * @file ObjectCodec.cpp
 * @brief Class-marker handling for custom objects.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <zbson/object/ObjectCodec.hpp>
#include <zbson/object/ClassRegistry.hpp>
#include <zbson/core/Constants.hpp>

#include <string>

namespace zbson::object {

core::Expected<value::Document> toMarkedDocument(const value::IDocumentCodable& object)
{
    auto document = ZBSON_TRY(object.toDocument());
    document.set(std::string{core::kClassMarkerKey}, std::string{object.typeName()});
    return document;
}

bool hasClassMarker(const value::Document& document) noexcept
{
    return document.contains(core::kClassMarkerKey);
}

core::Expected<value::Value> fromMarkedDocument(
    const value::Document& document, const ClassRegistry* registry)
{
    const auto* marker = document.find(core::kClassMarkerKey);
    const auto* typeName = marker ? marker->getIf<std::string>() : nullptr;
    if (typeName == nullptr)
    {
        return core::makeError(core::ErrorCode::kMissingClassDefinition,
                               "Class marker does not hold a type name");
    }

    if (registry == nullptr)
    {
        return core::makeError(core::ErrorCode::kMissingClassDefinition,
                               "No class definition for class " + *typeName +
                               " (no registry configured)");
    }

    return registry->instantiate(*typeName, document);
}

} // namespace zbson::object
