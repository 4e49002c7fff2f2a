// /////////////////////////////////////////////////////////////////////////////
/// @file Options.hpp
/// @brief Encode / decode configuration (Builder pattern).
///
/// Immutable option sets built through fluent builders. They carry the
/// caller-supplied hooks for a single top-level encode or decode call.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <zbson/core/Types.hpp>
#include <zbson/value/Value.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace zbson::object { class ClassRegistry; }

namespace zbson::codec {

/// @brief Key used to reach a container from its parent.
using StepKey = std::variant<std::string, core::usize>;

/// @brief One ancestor frame of the encoder's depth-first walk.
struct TraversalStep
{
    /// Container holding the element being encoded. For custom objects this
    /// is the Value wrapping the object, not its generated document.
    const value::Value* parent{nullptr};

    /// Element name (documents) or index (arrays).
    StepKey key;
};

using TraversalStack = std::vector<TraversalStep>;

/// @brief Produces the order in which a document's keys are encoded.
///
/// The returned keys are used verbatim; completeness and uniqueness are the
/// hook's responsibility.
using TraversalHook = std::function<std::vector<std::string>(
    const value::Document& document, const TraversalStack& stack)>;

/// @brief Maps a value the encoder cannot classify to an encodable one.
using UnknownHook = std::function<value::Value(const value::Value& unknown)>;

/// @brief Non-fatal conditions raised while encoding.
enum class WarningCode : core::u8
{
    kMissingTimezone = 0
};

using WarningHandler = std::function<void(WarningCode code, std::string_view message)>;

/// @brief Immutable encoder configuration.
class EncodeOptions
{
public:
    /// @brief Fluent builder for EncodeOptions.
    class Builder
    {
    public:
        Builder& traversal(TraversalHook hook);
        Builder& onUnknown(UnknownHook hook);

        /// @brief Replaces the default handler, which logs through core::Log.
        Builder& onWarning(WarningHandler handler);

        [[nodiscard]] EncodeOptions build() const;

    private:
        TraversalHook  traversal_;
        UnknownHook    onUnknown_;
        WarningHandler onWarning_;
    };

    [[nodiscard]] const TraversalHook&  traversal() const noexcept { return traversal_; }
    [[nodiscard]] const UnknownHook&    onUnknown() const noexcept { return onUnknown_; }
    [[nodiscard]] const WarningHandler& onWarning() const noexcept { return onWarning_; }

    /// @brief Routes @p code to the configured handler or to the log.
    void warn(WarningCode code, std::string_view message) const;

private:
    friend class Builder;

    TraversalHook  traversal_;
    UnknownHook    onUnknown_;
    WarningHandler onWarning_;
};

/// @brief Immutable decoder configuration.
class DecodeOptions
{
public:
    /// @brief Fluent builder for DecodeOptions.
    class Builder
    {
    public:
        /// @brief Registry consulted for documents carrying a class marker.
        ///        Must outlive every decode call using these options.
        Builder& registry(const object::ClassRegistry* registry) noexcept;

        [[nodiscard]] DecodeOptions build() const noexcept;

    private:
        const object::ClassRegistry* registry_{nullptr};
    };

    [[nodiscard]] const object::ClassRegistry* registry() const noexcept { return registry_; }

private:
    friend class Builder;

    const object::ClassRegistry* registry_{nullptr};
};

} // namespace zbson::codec
