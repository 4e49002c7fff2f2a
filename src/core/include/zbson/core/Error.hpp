/**
 * @file Error.hpp
 * @brief Codec error taxonomy and the Expected<T> result type.
 *
 * Every encode or decode failure is reported as a core::Error inside a
 * std::expected. No exception crosses the public API; the first error met
 * aborts the whole call and no partial output is returned.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ZBSON_CORE_ERROR_HPP
    #define ZBSON_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <source_location>
    #include <string>
    #include <string_view>
    #include <utility>

namespace zbson::core {

enum class ErrorCode : u16 {
    kNone = 0,

    /// Caller misuse: bad root kind, traversal key not in the document.
    kInvalidArgument,

    // Encode
    kInvalidName,
    kUnknownSerializer,
    kIntegerOverflow,

    // Decode
    kMalformedDocument,
    kUnknownElementType,
    kInvalidUtf8,
    kMissingClassDefinition,
};

[[nodiscard]] constexpr std::string_view toString(ErrorCode code) noexcept
{
    switch (code)
    {
        case ErrorCode::kNone:                   return "None";
        case ErrorCode::kInvalidArgument:        return "InvalidArgument";
        case ErrorCode::kInvalidName:            return "InvalidName";
        case ErrorCode::kUnknownSerializer:      return "UnknownSerializerError";
        case ErrorCode::kIntegerOverflow:        return "IntegerOverflow";
        case ErrorCode::kMalformedDocument:      return "MalformedDocument";
        case ErrorCode::kUnknownElementType:     return "UnknownElementType";
        case ErrorCode::kInvalidUtf8:            return "InvalidUtf8";
        case ErrorCode::kMissingClassDefinition: return "MissingClassDefinition";
    }
    return "Unknown";
}

/**
 * @brief A failed codec operation: what went wrong, and where it was raised.
 */
class Error final {
public:
    explicit Error(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : _code(code), _message(std::move(message)), _location(loc) {}

    [[nodiscard]] ErrorCode            code()     const { return _code; }
    [[nodiscard]] const std::string   &message()  const { return _message; }
    [[nodiscard]] std::source_location location() const { return _location; }

    /// @brief "<CodeName>: <message>", the form written to the log.
    [[nodiscard]] std::string describe() const
    {
        std::string out{toString(_code)};
        out += ": ";
        out += _message;
        return out;
    }

private:
    ErrorCode            _code;
    std::string          _message;
    std::source_location _location;
};

template <typename T>
using Expected = std::expected<T, Error>;

/// @brief Builds the error branch of an Expected, capturing the caller's location.
[[nodiscard]] inline std::unexpected<Error> makeError(
    ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<Error>(Error{code, std::move(message), loc});
}

} // namespace zbson::core

/**
 * @brief Yields the value of an Expected expression, or returns its error
 *        from the enclosing function.
 *
 * Relies on GNU statement expressions.
 */
#define ZBSON_TRY(expr)                                                   \
    ({                                                                     \
        auto &&_zbson_result = (expr);                                     \
        if (!_zbson_result.has_value()) [[unlikely]]                       \
            return std::unexpected(std::move(_zbson_result.error()));      \
        std::move(_zbson_result.value());                                  \
    })

/// @brief ZBSON_TRY for Expected<void> (and any result whose value is unused).
#define ZBSON_TRY_VOID(expr)                                              \
    do {                                                                   \
        if (auto &&_zbson_result = (expr); !_zbson_result.has_value())     \
            [[unlikely]]                                                   \
            return std::unexpected(std::move(_zbson_result.error()));      \
    } while (false)

#endif // ZBSON_CORE_ERROR_HPP
