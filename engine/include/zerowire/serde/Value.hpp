#pragma once

#include <zerowire/serde/Describe.hpp>
#include <zerowire/serde/Deserialize.hpp>
#include <zerowire/serde/Error.hpp>
#include <zerowire/serde/Serialize.hpp>
#include <zerowire/serde/Visitor.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace zerowire::serde
{

/// 스키마 없는 동적 값. deserializeAny 로 만들고 그대로 다시 직렬화할 수 있다.
///
/// - 음이 아닌 정수는 UInt, 음수는 Int 로 모인다 (두 포맷 모두 같은 규칙).
/// - Object 는 삽입 순서를 유지하는 (key, value) 목록. 키는 아무 Value 나 될 수 있다
///   (MessagePack map 키). JSON 으로 내보낼 때는 문자열/정수/bool 키만 허용된다.
class Value
{
  public:
    enum class Kind : std::uint8_t
    {
        Null,
        Bool,
        Int,
        UInt,
        Float,
        String,
        Bytes,
        Array,
        Object,
    };

    using Array = std::vector<Value>;
    using Object = std::vector<std::pair<Value, Value>>;

    Value() noexcept = default;
    explicit Value(bool v) : data_(v) {}
    explicit Value(std::int64_t v) : data_(v) {}
    explicit Value(std::uint64_t v) : data_(v) {}
    explicit Value(double v) : data_(v) {}
    explicit Value(std::string v) : data_(std::move(v)) {}
    explicit Value(std::string_view v) : data_(std::string(v)) {}
    explicit Value(const char *v) : data_(std::string(v)) {}
    explicit Value(ByteBuf v) : data_(std::move(v)) {}
    explicit Value(Array v) : data_(std::move(v)) {}
    explicit Value(Object v) : data_(std::move(v)) {}

    [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(data_.index()); }
    [[nodiscard]] bool isNull() const noexcept { return kind() == Kind::Null; }

    // 해당 kind 가 아니면 nullptr
    [[nodiscard]] const bool *asBool() const noexcept { return std::get_if<bool>(&data_); }
    [[nodiscard]] const std::int64_t *asInt() const noexcept { return std::get_if<std::int64_t>(&data_); }
    [[nodiscard]] const std::uint64_t *asUInt() const noexcept { return std::get_if<std::uint64_t>(&data_); }
    [[nodiscard]] const double *asFloat() const noexcept { return std::get_if<double>(&data_); }
    [[nodiscard]] const std::string *asString() const noexcept { return std::get_if<std::string>(&data_); }
    [[nodiscard]] const ByteBuf *asBytes() const noexcept { return std::get_if<ByteBuf>(&data_); }
    [[nodiscard]] const Array *asArray() const noexcept { return std::get_if<Array>(&data_); }
    [[nodiscard]] const Object *asObject() const noexcept { return std::get_if<Object>(&data_); }

    [[nodiscard]] Array *asArray() noexcept { return std::get_if<Array>(&data_); }
    [[nodiscard]] Object *asObject() noexcept { return std::get_if<Object>(&data_); }

    /// Object 에서 문자열 키로 찾기. Object 가 아니거나 없으면 nullptr.
    [[nodiscard]] const Value *find(std::string_view key) const noexcept;

    /// 부호와 상관없이 정수 값을 i64 로 (범위 밖이면 nullopt)
    [[nodiscard]] std::optional<std::int64_t> toI64() const noexcept;

    friend bool operator==(const Value &a, const Value &b);

  private:
    std::variant<std::monostate, bool, std::int64_t, std::uint64_t, double, std::string, ByteBuf,
                 Array, Object>
        data_{};
};

[[nodiscard]] std::string_view toString(Value::Kind kind) noexcept;

class ValueVisitor : public Visitor<ValueVisitor>
{
  public:
    explicit ValueVisitor(Value &out) noexcept : out_(out) {}
    std::string_view expecting() const noexcept { return "any valid value"; }

    template <class De>
    typename De::Error visitBool(De &, bool v)
    {
        out_ = Value(v);
        return {};
    }
    template <class De>
    typename De::Error visitI64(De &, std::int64_t v)
    {
        out_ = v < 0 ? Value(v) : Value(static_cast<std::uint64_t>(v));
        return {};
    }
    template <class De>
    typename De::Error visitU64(De &, std::uint64_t v)
    {
        out_ = Value(v);
        return {};
    }
    template <class De>
    typename De::Error visitF64(De &, double v)
    {
        out_ = Value(v);
        return {};
    }
    template <class De>
    typename De::Error visitStr(De &, std::string_view v)
    {
        out_ = Value(v);
        return {};
    }
    template <class De>
    typename De::Error visitBytes(De &, std::span<const std::uint8_t> v)
    {
        out_ = Value(ByteBuf{std::vector<std::uint8_t>(v.begin(), v.end())});
        return {};
    }
    template <class De>
    typename De::Error visitUnit(De &)
    {
        out_ = Value();
        return {};
    }
    template <class De>
    typename De::Error visitNone(De &)
    {
        out_ = Value();
        return {};
    }
    template <class De>
    typename De::Error visitSome(De &de)
    {
        return serde::deserialize(de, out_);
    }
    template <class De, class Access>
    typename De::Error visitSeq(De &, Access &acc)
    {
        Value::Array items;
        items.reserve(acc.sizeHint());
        for (;;)
        {
            Value item;
            bool got = false;
            ZW_TRY(acc.nextElement(item, got));
            if (!got)
                break;
            items.push_back(std::move(item));
        }
        out_ = Value(std::move(items));
        return {};
    }
    template <class De, class Access>
    typename De::Error visitMap(De &, Access &acc)
    {
        Value::Object entries;
        for (;;)
        {
            Value key;
            bool got = false;
            ZW_TRY(acc.nextKey(key, got));
            if (!got)
                break;
            Value value;
            ZW_TRY(acc.nextValue(value));
            entries.emplace_back(std::move(key), std::move(value));
        }
        out_ = Value(std::move(entries));
        return {};
    }

  private:
    Value &out_;
};

template <>
struct Deserialize<Value>
{
    template <class De>
    static typename De::Error deserialize(De &de, Value &out)
    {
        ValueVisitor v(out);
        return de.deserializeAny(v);
    }
};

template <>
struct Serialize<Value>
{
    template <class Ser>
    static typename Ser::Error serialize(const Value &v, Ser &ser)
    {
        switch (v.kind())
        {
        case Value::Kind::Null:
            return ser.serializeUnit();
        case Value::Kind::Bool:
            return ser.serializeBool(*v.asBool());
        case Value::Kind::Int:
            return ser.serializeI64(*v.asInt());
        case Value::Kind::UInt:
            return ser.serializeU64(*v.asUInt());
        case Value::Kind::Float:
            return ser.serializeF64(*v.asFloat());
        case Value::Kind::String:
            return ser.serializeStr(*v.asString());
        case Value::Kind::Bytes:
            return ser.serializeBytes(std::span<const std::uint8_t>(v.asBytes()->bytes));
        case Value::Kind::Array:
        {
            const Value::Array &items = *v.asArray();
            typename Ser::SerializeSeq seq;
            ZW_TRY(ser.serializeSeq(std::optional<std::size_t>(items.size()), seq));
            for (const Value &item : items)
                ZW_TRY(seq.serializeElement(item));
            return seq.end();
        }
        case Value::Kind::Object:
        {
            const Value::Object &entries = *v.asObject();
            typename Ser::SerializeMap map;
            ZW_TRY(ser.serializeMap(std::optional<std::size_t>(entries.size()), map));
            for (const auto &[key, value] : entries)
            {
                ZW_TRY(map.serializeKey(key));
                ZW_TRY(map.serializeValue(value));
            }
            return map.end();
        }
        }
        return ser.custom("unknown value kind {}", static_cast<int>(v.kind()));
    }
};

} // namespace zerowire::serde
