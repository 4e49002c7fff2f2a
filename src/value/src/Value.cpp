// /////////////////////////////////////////////////////////////////////////////
/// @file Value.cpp
/// @brief Document, Value, and scalar helper implementations.
// /////////////////////////////////////////////////////////////////////////////

#include <zbson/value/Value.hpp>
#include <zbson/value/IDocumentCodable.hpp>

#include <algorithm>
#include <type_traits>

namespace zbson::value {

// -------------------------------------------------------------------------- //
//  Scalars                                                                   //
// -------------------------------------------------------------------------- //

std::string ObjectId::toHex() const
{
    static constexpr char kDigits[] = "0123456789abcdef";

    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto b : bytes)
    {
        const auto v = static_cast<core::u8>(b);
        out.push_back(kDigits[v >> 4]);
        out.push_back(kDigits[v & 0x0F]);
    }
    return out;
}

DateTime DateTime::fromMillis(core::i64 millis) noexcept
{
    DateTime dt;
    dt.time = TimePoint{std::chrono::milliseconds{millis}};
    dt.hasTimezone = true;
    return dt;
}

core::i64 DateTime::toMillis() const noexcept
{
    // Half-to-even, computed in integers so the clock limits cannot overflow.
    const core::i64 micros = time.time_since_epoch().count();
    core::i64 millis = micros / 1000;
    core::i64 rest   = micros % 1000;
    if (rest < 0)
    {
        rest += 1000;
        --millis;
    }
    if (rest > 500 || (rest == 500 && (millis & 1) != 0))
        ++millis;
    return millis;
}

// -------------------------------------------------------------------------- //
//  Document                                                                  //
// -------------------------------------------------------------------------- //

Document::Document() = default;

Document::Document(std::initializer_list<std::pair<std::string, Value>> entries)
{
    entries_.reserve(entries.size());
    for (const auto& [name, value] : entries)
    {
        set(name, value);
    }
}

Document::~Document() = default;

Document::Document(const Document&) = default;
Document::Document(Document&&) noexcept = default;
Document& Document::operator=(const Document&) = default;
Document& Document::operator=(Document&&) noexcept = default;

void Document::set(std::string name, Value value)
{
    if (auto* existing = find(name))
    {
        *existing = std::move(value);
        return;
    }
    entries_.push_back(Entry{std::move(name), std::move(value)});
}

const Value* Document::find(std::string_view name) const noexcept
{
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [name](const Entry& e) { return e.name == name; });
    return (it != entries_.end()) ? &it->value : nullptr;
}

Value* Document::find(std::string_view name) noexcept
{
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [name](const Entry& e) { return e.name == name; });
    return (it != entries_.end()) ? &it->value : nullptr;
}

bool Document::contains(std::string_view name) const noexcept
{
    return find(name) != nullptr;
}

bool Document::erase(std::string_view name)
{
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [name](const Entry& e) { return e.name == name; });
    if (it == entries_.end())
        return false;
    entries_.erase(it);
    return true;
}

core::usize Document::size() const noexcept { return entries_.size(); }
bool Document::empty() const noexcept { return entries_.empty(); }

std::vector<std::string> Document::keys() const
{
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_)
    {
        out.push_back(e.name);
    }
    return out;
}

Document::iterator Document::begin() noexcept { return entries_.begin(); }
Document::iterator Document::end() noexcept { return entries_.end(); }
Document::const_iterator Document::begin() const noexcept { return entries_.begin(); }
Document::const_iterator Document::end() const noexcept { return entries_.end(); }

bool operator==(const Document& lhs, const Document& rhs)
{
    if (lhs.size() != rhs.size())
        return false;

    for (const auto& e : lhs)
    {
        const Value* other = rhs.find(e.name);
        if (other == nullptr || !(*other == e.value))
            return false;
    }
    return true;
}

// -------------------------------------------------------------------------- //
//  Value                                                                     //
// -------------------------------------------------------------------------- //

std::string_view kindName(Kind kind) noexcept
{
    switch (kind)
    {
        case Kind::kNull:         return "null";
        case Kind::kBoolean:      return "boolean";
        case Kind::kInteger:      return "integer";
        case Kind::kInt32:        return "int32";
        case Kind::kInt64:        return "int64";
        case Kind::kUInt64:       return "uint64";
        case Kind::kDouble:       return "double";
        case Kind::kDecimal:      return "decimal";
        case Kind::kString:       return "string";
        case Kind::kBinary:       return "binary";
        case Kind::kUuid:         return "uuid";
        case Kind::kObjectId:     return "object_id";
        case Kind::kDateTime:     return "datetime";
        case Kind::kDocument:     return "document";
        case Kind::kArray:        return "array";
        case Kind::kCustomObject: return "custom_object";
        case Kind::kForeign:      return "foreign";
    }
    return "unknown";
}

std::optional<core::i128> Value::asInteger() const noexcept
{
    if (const auto* v = getIf<Integer>()) return v->value;
    if (const auto* v = getIf<Int32>())   return static_cast<core::i128>(v->value);
    if (const auto* v = getIf<Int64>())   return static_cast<core::i128>(v->value);
    if (const auto* v = getIf<UInt64>())  return static_cast<core::i128>(v->value);
    return std::nullopt;
}

namespace {

bool sameObject(const CustomObject& lhs, const CustomObject& rhs)
{
    if (lhs.object == rhs.object)
        return true;
    if (!lhs.object || !rhs.object)
        return false;
    if (lhs.object->typeName() != rhs.object->typeName())
        return false;

    auto l = lhs.object->toDocument();
    auto r = rhs.object->toDocument();
    return l.has_value() && r.has_value() && *l == *r;
}

} // anonymous namespace

bool operator==(const Value& lhs, const Value& rhs)
{
    const auto li = lhs.asInteger();
    const auto ri = rhs.asInteger();
    if (li.has_value() || ri.has_value())
        return li.has_value() && ri.has_value() && *li == *ri;

    if (lhs.kind() != rhs.kind())
        return false;

    return std::visit(
        [&rhs](const auto& l) -> bool
        {
            using T = std::decay_t<decltype(l)>;
            const T& r = *rhs.getIf<T>();

            if constexpr (std::is_same_v<T, CustomObject>)
                return sameObject(l, r);
            else if constexpr (std::is_same_v<T, Foreign>)
                return false;
            else if constexpr (std::is_same_v<T, Integer> || std::is_same_v<T, Int32> ||
                               std::is_same_v<T, Int64> || std::is_same_v<T, UInt64>)
                return false; // handled numerically above
            else
                return l == r;
        },
        lhs.storage());
}

} // namespace zbson::value
