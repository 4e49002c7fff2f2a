// /////////////////////////////////////////////////////////////////////////////
/// @file Encoder.cpp
/// @brief Encoder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <zbson/codec/Encoder.hpp>
#include <zbson/core/Constants.hpp>
#include <zbson/object/ObjectCodec.hpp>

#include <cxxabi.h>

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <memory>
#include <string>
#include <utility>

namespace zbson::codec {

namespace {

/// @brief Pushes a traversal frame for the lifetime of one element.
class StackFrame final
{
public:
    StackFrame(TraversalStack& stack, const value::Value& parent, StepKey key)
        : stack_{stack}
    {
        stack_.push_back(TraversalStep{&parent, std::move(key)});
    }

    ~StackFrame() { stack_.pop_back(); }

    StackFrame(const StackFrame&) = delete;
    StackFrame& operator=(const StackFrame&) = delete;

private:
    TraversalStack& stack_;
};

std::string toDecimalString(core::i128 value)
{
    if (value == 0)
        return "0";

    const bool negative = value < 0;
    // Work in the unsigned domain so that the minimum value does not overflow.
    __extension__ unsigned __int128 magnitude = negative
        ? static_cast<unsigned __int128>(-(value + 1)) + 1
        : static_cast<unsigned __int128>(value);

    std::string digits;
    while (magnitude != 0)
    {
        digits.push_back(static_cast<char>('0' + static_cast<int>(magnitude % 10)));
        magnitude /= 10;
    }
    if (negative)
        digits.push_back('-');
    std::reverse(digits.begin(), digits.end());
    return digits;
}

/// @brief Readable host type name; the mangled name if demangling fails.
std::string demangle(const char* mangled)
{
    int status = 0;
    const std::unique_ptr<char, decltype(&std::free)> readable{
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), &std::free};
    if (status != 0 || !readable)
        return mangled;
    return readable.get();
}

std::string describe(const value::Value& element)
{
    std::string out{value::kindName(element.kind())};
    if (const auto* foreign = element.getIf<value::Foreign>())
    {
        out += " (";
        out += foreign->payload.has_value() ? demangle(foreign->payload.type().name()) : "empty";
        out += ")";
    }
    return out;
}

} // anonymous namespace

core::Expected<ElementType> selectIntegerType(core::i128 value)
{
    if (value > core::kUInt64Max || value < core::kInt64Min)
    {
        return core::makeError(core::ErrorCode::kIntegerOverflow,
                               "Integer " + toDecimalString(value) +
                               " does not fit in a signed or unsigned 64-bit element");
    }

    if (value < core::kInt32Min || (value > core::kInt32Max && value <= core::kInt64Max))
        return ElementType::kInt64;

    if (value > core::kInt64Max)
        return ElementType::kUInt64;

    return ElementType::kInt32;
}

Encoder::Encoder(const EncodeOptions& options)
    : options_{options}
{}

Encoder::~Encoder() = default;

core::Expected<std::vector<core::byte>> Encoder::encode(const value::Value& root)
{
    stack_.clear();
    writer_ = ByteWriter{};

    if (const auto* document = root.getIf<value::Document>())
    {
        ZBSON_TRY_VOID(encodeDocument(*document, root));
    }
    else if (const auto* custom = root.getIf<value::CustomObject>())
    {
        ZBSON_TRY_VOID(encodeObject(*custom, root));
    }
    else
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "Root value must be a document or custom object, got " +
                               std::string{value::kindName(root.kind())});
    }

    return writer_.release();
}

// -------------------------------------------------------------------------- //
//  Containers                                                                //
// -------------------------------------------------------------------------- //

core::Expected<std::vector<std::string>> Encoder::documentKeys(
    const value::Document& document) const
{
    if (options_.traversal())
        return options_.traversal()(document, stack_);
    return document.keys();
}

core::Expected<void> Encoder::encodeDocument(
    const value::Document& document, const value::Value& parent)
{
    const auto start = writer_.reserveI32();

    const auto keys = ZBSON_TRY(documentKeys(document));
    for (const auto& name : keys)
    {
        const value::Value* element = document.find(name);
        if (element == nullptr)
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   "Traversal produced key '" + name +
                                   "' which is not in the document");
        }

        StackFrame frame{stack_, parent, name};
        ZBSON_TRY_VOID(encodeElement(name, *element));
    }

    writer_.writeU8(0);

    const auto length = writer_.size() - start;
    if (length > static_cast<core::usize>(std::numeric_limits<core::i32>::max()))
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "Document exceeds the 2 GiB length limit");
    }
    writer_.patchI32(start, static_cast<core::i32>(length));
    return {};
}

core::Expected<void> Encoder::encodeArray(const value::Array& array, const value::Value& parent)
{
    const auto start = writer_.reserveI32();

    for (core::usize i = 0; i < array.size(); ++i)
    {
        StackFrame frame{stack_, parent, i};
        ZBSON_TRY_VOID(encodeElement(std::to_string(i), array[i]));
    }

    writer_.writeU8(0);

    const auto length = writer_.size() - start;
    if (length > static_cast<core::usize>(std::numeric_limits<core::i32>::max()))
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "Array exceeds the 2 GiB length limit");
    }
    writer_.patchI32(start, static_cast<core::i32>(length));
    return {};
}

core::Expected<void> Encoder::encodeObject(
    const value::CustomObject& custom, const value::Value& parent)
{
    if (!custom.object)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "Custom object holds no instance");
    }

    const auto document = ZBSON_TRY(object::toMarkedDocument(*custom.object));
    return encodeDocument(document, parent);
}

// -------------------------------------------------------------------------- //
//  Elements                                                                  //
// -------------------------------------------------------------------------- //

core::Expected<void> Encoder::writeHeader(ElementType type, std::string_view name)
{
    writer_.writeU8(static_cast<core::u8>(type));
    return writer_.writeCString(name);
}

core::Expected<void> Encoder::encodeInteger(std::string_view name, core::i128 integer)
{
    const auto type = ZBSON_TRY(selectIntegerType(integer));
    ZBSON_TRY_VOID(writeHeader(type, name));

    if (type == ElementType::kInt32)
        writer_.writeI32(static_cast<core::i32>(integer));
    else if (type == ElementType::kUInt64)
        writer_.writeU64(static_cast<core::u64>(integer));
    else
        writer_.writeI64(static_cast<core::i64>(integer));
    return {};
}

core::Expected<void> Encoder::encodeElement(std::string_view name, const value::Value& element)
{
    using value::Kind;

    switch (element.kind())
    {
        case Kind::kBoolean:
            ZBSON_TRY_VOID(writeHeader(ElementType::kBoolean, name));
            writer_.writeU8(*element.getIf<bool>() ? 1 : 0);
            return {};

        case Kind::kInteger:
            return encodeInteger(name, element.getIf<value::Integer>()->value);

        case Kind::kInt32:
            ZBSON_TRY_VOID(writeHeader(ElementType::kInt32, name));
            writer_.writeI32(element.getIf<value::Int32>()->value);
            return {};

        case Kind::kInt64:
            ZBSON_TRY_VOID(writeHeader(ElementType::kInt64, name));
            writer_.writeI64(element.getIf<value::Int64>()->value);
            return {};

        case Kind::kUInt64:
            ZBSON_TRY_VOID(writeHeader(ElementType::kUInt64, name));
            writer_.writeU64(element.getIf<value::UInt64>()->value);
            return {};

        case Kind::kDouble:
            ZBSON_TRY_VOID(writeHeader(ElementType::kDouble, name));
            writer_.writeF64(*element.getIf<double>());
            return {};

        case Kind::kDecimal:
            ZBSON_TRY_VOID(writeHeader(ElementType::kDouble, name));
            writer_.writeF64(static_cast<core::f64>(element.getIf<value::Decimal>()->value));
            return {};

        case Kind::kString:
            ZBSON_TRY_VOID(writeHeader(ElementType::kString, name));
            writer_.writeString(*element.getIf<std::string>());
            return {};

        case Kind::kBinary:
        {
            const auto& binary = *element.getIf<value::Binary>();
            ZBSON_TRY_VOID(writeHeader(ElementType::kBinary, name));
            writer_.writeI32(static_cast<core::i32>(binary.data.size()));
            writer_.writeU8(binary.subtype);
            writer_.writeBytes(binary.data);
            return {};
        }

        case Kind::kUuid:
        {
            const auto& uuid = *element.getIf<value::Uuid>();
            ZBSON_TRY_VOID(writeHeader(ElementType::kBinary, name));
            writer_.writeI32(static_cast<core::i32>(uuid.bytes.size()));
            writer_.writeU8(core::kBinarySubtypeUuid);
            writer_.writeBytes(uuid.bytes);
            return {};
        }

        case Kind::kObjectId:
            ZBSON_TRY_VOID(writeHeader(ElementType::kObjectId, name));
            writer_.writeBytes(element.getIf<value::ObjectId>()->bytes);
            return {};

        case Kind::kDateTime:
        {
            const auto& dt = *element.getIf<value::DateTime>();
            if (!dt.hasTimezone)
            {
                options_.warn(WarningCode::kMissingTimezone,
                              "Input datetime has no timezone, assuming UTC");
            }
            ZBSON_TRY_VOID(writeHeader(ElementType::kDateTime, name));
            writer_.writeI64(dt.toMillis());
            return {};
        }

        case Kind::kNull:
            return writeHeader(ElementType::kNull, name);

        case Kind::kDocument:
            ZBSON_TRY_VOID(writeHeader(ElementType::kDocument, name));
            return encodeDocument(*element.getIf<value::Document>(), element);

        case Kind::kArray:
            ZBSON_TRY_VOID(writeHeader(ElementType::kArray, name));
            return encodeArray(*element.getIf<value::Array>(), element);

        case Kind::kCustomObject:
            ZBSON_TRY_VOID(writeHeader(ElementType::kDocument, name));
            return encodeObject(*element.getIf<value::CustomObject>(), element);

        case Kind::kForeign:
            break;
    }

    if (options_.onUnknown())
    {
        const value::Value substitute = options_.onUnknown()(element);
        if (!substitute.is<value::Foreign>())
            return encodeElement(name, substitute);
    }

    return core::makeError(core::ErrorCode::kUnknownSerializer,
                           "Unable to serialize: key '" + std::string{name} +
                           "' value of type " + describe(element));
}

} // namespace zbson::codec
