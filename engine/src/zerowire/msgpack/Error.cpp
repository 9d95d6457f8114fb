#include <zerowire/msgpack/Error.hpp>

namespace zerowire::msgpack
{

std::string_view toString(DeError e) noexcept
{
    switch (e)
    {
    case DeError::Ok:
        return "ok";
    case DeError::UnexpectedEof:
        return "Unexpected end of MessagePack input";
    case DeError::ReservedCode:
        return "Reserved MessagePack code in input";
    case DeError::UnsupportedExt:
        return "Unsupported MessagePack extension code in input";
    case DeError::InvalidInteger:
        return "Could not coerce integer to a deserialized type";
    case DeError::InvalidType:
        return "Invalid type";
    case DeError::InvalidUnicodeCodePoint:
        return "Invalid unicode code point";
    case DeError::ExpectedInteger:
        return "Expected MessagePack integer";
    case DeError::ExpectedNumber:
        return "Expected MessagePack number";
    case DeError::ExpectedString:
        return "Expected MessagePack string";
    case DeError::ExpectedBin:
        return "Expected MessagePack bin";
    case DeError::ExpectedNil:
        return "Expected MessagePack nil";
    case DeError::ExpectedArray:
        return "Expected MessagePack array";
    case DeError::ExpectedMap:
        return "Expected MessagePack map";
    case DeError::ExpectedStruct:
        return "Expected MessagePack map or array";
    case DeError::ExpectedIdentifier:
        return "Expected a struct field or enum variant identifier";
    case DeError::TrailingElements:
        return "Too many elements for a deserialized type";
    case DeError::InvalidLength:
        return "Invalid length";
    case DeError::DepthLimitExceeded:
        return "MessagePack nesting exceeds the depth limit";
    case DeError::Custom:
        return "error while deserializing MessagePack";
    }
    return "unknown";
}

std::string_view toString(SerError e) noexcept
{
    switch (e)
    {
    case SerError::Ok:
        return "ok";
    case SerError::Writer:
        return "error writing to the output sink";
    case SerError::MapLength:
        return "unknown or invalid map length";
    case SerError::SeqLength:
        return "unknown or invalid sequence length";
    case SerError::StrLength:
        return "invalid string length";
    case SerError::DataLength:
        return "invalid byte array length";
    case SerError::FormatError:
        return "error collecting a string";
    case SerError::Custom:
        return "error while serializing MessagePack";
    }
    return "unknown";
}

} // namespace zerowire::msgpack
