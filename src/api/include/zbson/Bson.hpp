/**
 * @file Bson.hpp
 * @brief Public entry points of the zbson codec.
 *
 * Includes everything a caller needs to build value trees, register custom
 * object types, and encode or decode whole documents.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ZBSON_BSON_HPP
    #define ZBSON_BSON_HPP

#include <zbson/codec/Decoder.hpp>
#include <zbson/codec/Options.hpp>
#include <zbson/core/Error.hpp>
#include <zbson/core/Types.hpp>
#include <zbson/object/ClassRegistry.hpp>
#include <zbson/value/IDocumentCodable.hpp>
#include <zbson/value/Value.hpp>

#include <span>
#include <vector>

namespace zbson {

using value::Value;
using value::Document;
using value::Array;

using codec::EncodeOptions;
using codec::DecodeOptions;
using codec::DecodeResult;
using object::ClassRegistry;

/**
 * @brief Encodes a document (or custom object) into its wire form.
 * @param root    A Document or CustomObject.
 * @param options Traversal, unknown-value, and warning hooks.
 * @return The encoded bytes, or the first error met during the walk.
 */
[[nodiscard]] core::Expected<std::vector<core::byte>> encode(
    const Value& root, const EncodeOptions& options = {});

/**
 * @brief Decodes the document at the start of @p data.
 *
 * Bytes after the document's terminator are not read.
 *
 * @param data    Encoded bytes.
 * @param options Registry used to rebuild custom objects.
 * @return The decoded Document, or the object rebuilt from it.
 */
[[nodiscard]] core::Expected<Value> decode(
    std::span<const core::byte> data, const DecodeOptions& options = {});

/**
 * @brief Like decode, but also reports where the document ended.
 *
 * DecodeResult::end is the offset one past the terminator, where the next
 * document of a concatenated stream begins.
 */
[[nodiscard]] core::Expected<DecodeResult> decodePrefix(
    std::span<const core::byte> data, const DecodeOptions& options = {});

} // namespace zbson

#endif // ZBSON_BSON_HPP
