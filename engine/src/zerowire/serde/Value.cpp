#include <zerowire/serde/Value.hpp>

#include <cmath>
#include <limits>

namespace zerowire::serde
{

const Value *Value::find(std::string_view key) const noexcept
{
    const Object *entries = asObject();
    if (entries == nullptr)
        return nullptr;

    for (const auto &[k, v] : *entries)
    {
        const std::string *name = k.asString();
        if (name != nullptr && *name == key)
            return &v;
    }
    return nullptr;
}

std::optional<std::int64_t> Value::toI64() const noexcept
{
    if (const auto *i = asInt())
        return *i;
    if (const auto *u = asUInt())
    {
        if (*u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
            return std::nullopt;
        return static_cast<std::int64_t>(*u);
    }
    return std::nullopt;
}

bool operator==(const Value &a, const Value &b)
{
    // NaN 끼리는 같은 값으로 본다 (JSON null <-> NaN 왕복 비교용)
    if (a.kind() == Value::Kind::Float && b.kind() == Value::Kind::Float)
    {
        const double x = *a.asFloat();
        const double y = *b.asFloat();
        if (std::isnan(x) && std::isnan(y))
            return true;
        return x == y && std::signbit(x) == std::signbit(y);
    }
    return a.data_ == b.data_;
}

std::string_view toString(Value::Kind kind) noexcept
{
    switch (kind)
    {
    case Value::Kind::Null:
        return "null";
    case Value::Kind::Bool:
        return "bool";
    case Value::Kind::Int:
        return "int";
    case Value::Kind::UInt:
        return "uint";
    case Value::Kind::Float:
        return "float";
    case Value::Kind::String:
        return "string";
    case Value::Kind::Bytes:
        return "bytes";
    case Value::Kind::Array:
        return "array";
    case Value::Kind::Object:
        return "object";
    }
    return "unknown";
}

} // namespace zerowire::serde
