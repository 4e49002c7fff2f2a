// /////////////////////////////////////////////////////////////////////////////
/// @file ClassRegistry.hpp
/// @brief Type-name to factory table for custom object reconstruction.
///
/// A registry is populated once (typically at startup) and then handed to
/// decode calls through codec::DecodeOptions. Lookups are read-only and may
/// run concurrently; registration must not race with anything.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <zbson/core/Error.hpp>
#include <zbson/core/Types.hpp>
#include <zbson/value/IDocumentCodable.hpp>
#include <zbson/value/Value.hpp>

#include <concepts>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace zbson::object {

/// @brief Builds a value from a decoded document that carries the class
///        marker (marker element included).
using Factory = std::function<core::Expected<value::Value>(const value::Document&)>;

/// @brief An application type the registry can rebuild without knowing its
///        constructor parameters.
template <typename T>
concept DocumentCodable = std::derived_from<T, value::DocumentCodableBase<T>>
    && requires(const value::Document& doc) {
        { T::kTypeName } -> std::convertible_to<std::string_view>;
        { T::fromDocument(doc) } -> std::same_as<core::Expected<T>>;
    };

class ClassRegistry final
{
public:
    ClassRegistry();
    ~ClassRegistry();

    ClassRegistry(const ClassRegistry&) = delete;
    ClassRegistry& operator=(const ClassRegistry&) = delete;

    ClassRegistry(ClassRegistry&&) noexcept;
    ClassRegistry& operator=(ClassRegistry&&) noexcept;

    /// @brief Associates @p typeName with @p factory, replacing any previous
    ///        factory of the same name.
    void add(std::string typeName, Factory factory);

    /// @brief Registers @p T under T::kTypeName.
    template <DocumentCodable T>
    void add()
    {
        add(std::string{T::kTypeName}, [](const value::Document& doc) -> core::Expected<value::Value> {
            auto built = T::fromDocument(doc);
            if (!built.has_value())
                return std::unexpected(std::move(built.error()));
            return value::Value{value::CustomObject{std::make_shared<const T>(std::move(*built))}};
        });
    }

    /// @brief Registers every type of the pack.
    template <DocumentCodable... Ts>
    void addAll()
    {
        (add<Ts>(), ...);
    }

    [[nodiscard]] bool           contains(std::string_view typeName) const noexcept;
    [[nodiscard]] const Factory* find(std::string_view typeName) const noexcept;
    [[nodiscard]] core::usize    size() const noexcept;

    /// @brief Runs the factory registered under @p typeName on @p document.
    /// @return MissingClassDefinition if no factory is registered.
    [[nodiscard]] core::Expected<value::Value> instantiate(
        std::string_view typeName, const value::Document& document) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace zbson::object
