// /////////////////////////////////////////////////////////////////////////////
/// @file Value.hpp
/// @brief Closed tagged union of every value the codec can carry.
///
/// Value is the boundary between host data and the wire format: host
/// integers, floats, text, and containers convert implicitly, anything
/// else must be wrapped in a Foreign and resolved by an unknown-value hook
/// at encode time.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#ifndef ZBSON_VALUE_VALUE_HPP
    #define ZBSON_VALUE_VALUE_HPP

#include <zbson/core/Concepts.hpp>
#include <zbson/core/Types.hpp>
#include <zbson/value/Scalars.hpp>

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace zbson::value {

class Value;

/// @brief Ordered sequence of values, encoded with index-derived names.
using Array = std::vector<Value>;

// /////////////////////////////////////////////////////////////////////////////
/// @class Document
/// @brief Insertion-ordered mapping from element name to Value.
///
/// Names are unique: setting an existing name replaces its value in place
/// and keeps its position.
// /////////////////////////////////////////////////////////////////////////////
class Document
{
public:
    struct Entry;

    using Container      = std::vector<Entry>;
    using iterator       = Container::iterator;
    using const_iterator = Container::const_iterator;

    Document();
    Document(std::initializer_list<std::pair<std::string, Value>> entries);
    ~Document();

    Document(const Document&);
    Document(Document&&) noexcept;
    Document& operator=(const Document&);
    Document& operator=(Document&&) noexcept;

    /// @brief Insert @p name or replace its current value.
    void set(std::string name, Value value);

    [[nodiscard]] const Value* find(std::string_view name) const noexcept;
    [[nodiscard]] Value*       find(std::string_view name) noexcept;
    [[nodiscard]] bool         contains(std::string_view name) const noexcept;

    /// @brief Remove @p name. Returns false when it was not present.
    bool erase(std::string_view name);

    [[nodiscard]] core::usize size() const noexcept;
    [[nodiscard]] bool        empty() const noexcept;

    /// @brief Element names in insertion order.
    [[nodiscard]] std::vector<std::string> keys() const;

    [[nodiscard]] iterator       begin() noexcept;
    [[nodiscard]] iterator       end() noexcept;
    [[nodiscard]] const_iterator begin() const noexcept;
    [[nodiscard]] const_iterator end() const noexcept;

    /// @brief Equal when both hold the same names mapped to equal values,
    ///        regardless of order.
    friend bool operator==(const Document& lhs, const Document& rhs);

private:
    Container entries_;
};

/// @brief Discriminator of a Value, in variant index order.
enum class Kind : core::u8
{
    kNull = 0,
    kBoolean,
    kInteger,
    kInt32,
    kInt64,
    kUInt64,
    kDouble,
    kDecimal,
    kString,
    kBinary,
    kUuid,
    kObjectId,
    kDateTime,
    kDocument,
    kArray,
    kCustomObject,
    kForeign
};

/// @brief Human-readable kind name used in diagnostics.
[[nodiscard]] std::string_view kindName(Kind kind) noexcept;

// /////////////////////////////////////////////////////////////////////////////
/// @class Value
/// @brief One node of a value tree.
// /////////////////////////////////////////////////////////////////////////////
class Value
{
public:
    using Storage = std::variant<
        Null, bool, Integer, Int32, Int64, UInt64, double, Decimal,
        std::string, Binary, Uuid, ObjectId, DateTime,
        Document, Array, CustomObject, Foreign>;

    Value() = default;
    Value(std::nullptr_t) : storage_{Null{}} {}
    Value(Null v) : storage_{v} {}
    Value(bool v) : storage_{v} {}

    template <core::HostInteger T>
    Value(T v) : storage_{Integer{static_cast<core::i128>(v)}} {}

    template <core::HostFloating T>
    Value(T v) : storage_{static_cast<double>(v)} {}

    Value(Integer v) : storage_{v} {}
    Value(Int32 v) : storage_{v} {}
    Value(Int64 v) : storage_{v} {}
    Value(UInt64 v) : storage_{v} {}
    Value(Decimal v) : storage_{v} {}

    Value(const char* v) : storage_{std::string{v}} {}
    Value(std::string_view v) : storage_{std::string{v}} {}
    Value(std::string v) : storage_{std::move(v)} {}

    Value(Binary v) : storage_{std::move(v)} {}
    Value(Uuid v) : storage_{v} {}
    Value(ObjectId v) : storage_{v} {}
    Value(DateTime v) : storage_{v} {}
    Value(Document v) : storage_{std::move(v)} {}
    Value(Array v) : storage_{std::move(v)} {}
    Value(CustomObject v) : storage_{std::move(v)} {}
    Value(Foreign v) : storage_{std::move(v)} {}

    [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(storage_.index()); }

    template <typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(storage_); }

    /// @brief Pointer to the held alternative, or null on kind mismatch.
    template <typename T>
    [[nodiscard]] const T* getIf() const noexcept { return std::get_if<T>(&storage_); }

    template <typename T>
    [[nodiscard]] T* getIf() noexcept { return std::get_if<T>(&storage_); }

    [[nodiscard]] const Storage& storage() const noexcept { return storage_; }

    /// @brief Numeric value of any of the four integer kinds.
    [[nodiscard]] std::optional<core::i128> asInteger() const noexcept;

    /// @brief Integer kinds compare by numeric value; every other kind must
    ///        match exactly.
    friend bool operator==(const Value& lhs, const Value& rhs);

private:
    Storage storage_{};
};

struct Document::Entry
{
    std::string name;
    Value value;
};

} // namespace zbson::value

#endif // ZBSON_VALUE_VALUE_HPP
