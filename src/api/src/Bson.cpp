/**
 * @file Bson.cpp
 * @brief encode / decode entry points.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <zbson/Bson.hpp>
#include <zbson/codec/Encoder.hpp>
#include <zbson/core/Log.hpp>

#include <utility>

namespace zbson {

core::Expected<std::vector<core::byte>> encode(const Value& root, const EncodeOptions& options)
{
    codec::Encoder encoder{options};
    auto encoded = encoder.encode(root);
    if (!encoded.has_value() && core::Log::enabled(core::LogLevel::kDebug))
        core::Log::debug("codec", "encode failed: " + encoded.error().describe());
    return encoded;
}

core::Expected<DecodeResult> decodePrefix(
    std::span<const core::byte> data, const DecodeOptions& options)
{
    codec::Decoder decoder{data, options};
    auto decoded = decoder.decodeDocument(0);
    if (!decoded.has_value())
        core::Log::debug("codec", "decode failed: " + decoded.error().describe());
    return decoded;
}

core::Expected<Value> decode(std::span<const core::byte> data, const DecodeOptions& options)
{
    auto decoded = ZBSON_TRY(decodePrefix(data, options));
    return std::move(decoded.value);
}

} // namespace zbson
