// /////////////////////////////////////////////////////////////////////////////
/// @file Decoder.cpp
/// @brief Decoder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <zbson/codec/Decoder.hpp>
#include <zbson/codec/Utf8.hpp>
#include <zbson/core/Constants.hpp>
#include <zbson/core/Log.hpp>
#include <zbson/object/ObjectCodec.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace zbson::codec {

namespace {

enum class State : core::u8
{
    kReadLength,
    kReadElement,
    kDone
};

} // anonymous namespace

Decoder::Decoder(std::span<const core::byte> data, const DecodeOptions& options) noexcept
    : reader_{data}
    , options_{options}
{}

Decoder::~Decoder() = default;

core::Expected<DecodeResult> Decoder::decodeDocument(core::usize base, bool asArray)
{
    return decodeContainer(base, asArray, reader_.size());
}

core::Expected<DecodeResult> Decoder::decodeContainer(
    core::usize base, bool asArray, core::usize limit)
{
    ZBSON_TRY_VOID(reader_.seek(base));

    State           state = State::kReadLength;
    core::usize     end   = 0;
    value::Document document;
    value::Array    array;

    while (state != State::kDone)
    {
        switch (state)
        {
            case State::kReadLength:
            {
                const auto length = ZBSON_TRY(reader_.readI32());
                if (length < static_cast<core::i32>(core::kMinDocumentSize) ||
                    static_cast<core::usize>(length) > limit - base)
                {
                    return core::makeError(core::ErrorCode::kMalformedDocument,
                                           "Document length " + std::to_string(length) +
                                           " at offset " + std::to_string(base) +
                                           " is out of bounds");
                }

                end = base + static_cast<core::usize>(length);
                const auto terminator = ZBSON_TRY(reader_.peekAt(end - 1));
                if (terminator != 0)
                {
                    return core::makeError(core::ErrorCode::kMalformedDocument,
                                           "Missing NUL terminator in document at offset " +
                                           std::to_string(base));
                }

                state = (reader_.position() < end - 1) ? State::kReadElement : State::kDone;
                break;
            }

            case State::kReadElement:
            {
                const auto tag  = ZBSON_TRY(reader_.readU8());
                const auto name = ZBSON_TRY(reader_.readCString());
                if (reader_.position() > end - 1)
                {
                    return core::makeError(core::ErrorCode::kMalformedDocument,
                                           "Element name overruns its document");
                }

                if (!isKnownElementType(tag))
                {
                    return core::makeError(core::ErrorCode::kUnknownElementType,
                                           "Unknown element type: " + std::to_string(tag));
                }

                const auto type = static_cast<ElementType>(tag);
                auto element = ZBSON_TRY(decodeValue(type, end - 1));
                if (reader_.position() > end - 1)
                {
                    return core::makeError(core::ErrorCode::kMalformedDocument,
                                           "Element '" + std::string{name} + "' (" +
                                           std::string{elementTypeName(type)} +
                                           ") overruns its document");
                }

                if (asArray)
                {
                    array.push_back(std::move(element));
                }
                else
                {
                    if (!isValidUtf8(name))
                        core::Log::debug("codec", "element name is not valid UTF-8, keeping raw bytes");
                    document.set(std::string{name}, std::move(element));
                }

                if (reader_.position() >= end - 1)
                    state = State::kDone;
                break;
            }

            case State::kDone:
                break;
        }
    }

    ZBSON_TRY_VOID(reader_.seek(end));

    if (asArray)
        return DecodeResult{end, value::Value{std::move(array)}};

    if (object::hasClassMarker(document))
    {
        auto rebuilt = ZBSON_TRY(object::fromMarkedDocument(document, options_.registry()));
        return DecodeResult{end, std::move(rebuilt)};
    }

    return DecodeResult{end, value::Value{std::move(document)}};
}

core::Expected<value::Value> Decoder::decodeValue(ElementType type, core::usize limit)
{
    switch (type)
    {
        case ElementType::kDouble:
            return value::Value{ZBSON_TRY(reader_.readF64())};

        case ElementType::kString:
            return value::Value{ZBSON_TRY(reader_.readString())};

        case ElementType::kDocument:
        case ElementType::kArray:
        {
            auto nested = ZBSON_TRY(decodeContainer(reader_.position(),
                                                    type == ElementType::kArray, limit));
            return std::move(nested.value);
        }

        case ElementType::kBinary:
            return decodeBinary();

        case ElementType::kObjectId:
        {
            const auto bytes = ZBSON_TRY(reader_.readBytes(core::kObjectIdSize));
            value::ObjectId oid;
            std::copy(bytes.begin(), bytes.end(), oid.bytes.begin());
            return value::Value{oid.toHex()};
        }

        case ElementType::kBoolean:
            return value::Value{ZBSON_TRY(reader_.readU8()) != 0};

        case ElementType::kDateTime:
        {
            const auto millis = ZBSON_TRY(reader_.readI64());
            if (!value::DateTime::isRepresentable(millis))
            {
                return core::makeError(core::ErrorCode::kMalformedDocument,
                                       "Datetime out of range: " + std::to_string(millis) + " ms");
            }
            return value::Value{value::DateTime::fromMillis(millis)};
        }

        case ElementType::kNull:
            return value::Value{};

        case ElementType::kInt32:
            return value::Value{value::Int32{ZBSON_TRY(reader_.readI32())}};

        case ElementType::kUInt64:
            return value::Value{value::UInt64{ZBSON_TRY(reader_.readU64())}};

        case ElementType::kInt64:
            return value::Value{value::Int64{ZBSON_TRY(reader_.readI64())}};
    }

    return core::makeError(core::ErrorCode::kUnknownElementType,
                           "Unknown element type: " +
                           std::to_string(static_cast<unsigned>(type)));
}

core::Expected<value::Value> Decoder::decodeBinary()
{
    const auto length = ZBSON_TRY(reader_.readI32());
    if (length < 0)
    {
        return core::makeError(core::ErrorCode::kMalformedDocument,
                               "Negative binary length " + std::to_string(length));
    }

    const auto subtype = ZBSON_TRY(reader_.readU8());
    const auto bytes   = ZBSON_TRY(reader_.readBytes(static_cast<core::usize>(length)));

    const bool isUuid = subtype == core::kBinarySubtypeUuid || subtype == core::kBinarySubtypeUuidOld;
    if (isUuid && bytes.size() == core::kUuidSize)
    {
        value::Uuid uuid;
        std::copy(bytes.begin(), bytes.end(), uuid.bytes.begin());
        return value::Value{uuid};
    }

    value::Binary binary;
    binary.data.assign(bytes.begin(), bytes.end());
    binary.subtype = subtype;
    return value::Value{std::move(binary)};
}

} // namespace zbson::codec
