// /////////////////////////////////////////////////////////////////////////////
/// @file Options.cpp
/// @brief EncodeOptions / DecodeOptions builder implementations.
// /////////////////////////////////////////////////////////////////////////////

#include <zbson/codec/Options.hpp>
#include <zbson/core/Log.hpp>

#include <utility>

namespace zbson::codec {

EncodeOptions::Builder& EncodeOptions::Builder::traversal(TraversalHook hook)
{
    traversal_ = std::move(hook);
    return *this;
}

EncodeOptions::Builder& EncodeOptions::Builder::onUnknown(UnknownHook hook)
{
    onUnknown_ = std::move(hook);
    return *this;
}

EncodeOptions::Builder& EncodeOptions::Builder::onWarning(WarningHandler handler)
{
    onWarning_ = std::move(handler);
    return *this;
}

EncodeOptions EncodeOptions::Builder::build() const
{
    EncodeOptions opts;
    opts.traversal_ = traversal_;
    opts.onUnknown_ = onUnknown_;
    opts.onWarning_ = onWarning_;
    return opts;
}

void EncodeOptions::warn(WarningCode code, std::string_view message) const
{
    if (onWarning_)
    {
        onWarning_(code, message);
        return;
    }
    core::Log::warn("codec", message);
}

DecodeOptions::Builder& DecodeOptions::Builder::registry(const object::ClassRegistry* registry) noexcept
{
    registry_ = registry;
    return *this;
}

DecodeOptions DecodeOptions::Builder::build() const noexcept
{
    DecodeOptions opts;
    opts.registry_ = registry_;
    return opts;
}

} // namespace zbson::codec
