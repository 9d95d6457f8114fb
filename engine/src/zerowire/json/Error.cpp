#include <zerowire/json/Error.hpp>

namespace zerowire::json
{

std::string_view toString(DeError e) noexcept
{
    switch (e)
    {
    case DeError::Ok:
        return "ok";
    case DeError::UnexpectedEof:
        return "Unexpected end of JSON input";
    case DeError::InvalidEscapeSequence:
        return "Invalid JSON string escape sequence";
    case DeError::StringControlChar:
        return "A control ASCII character found in a JSON string";
    case DeError::ExpectedColon:
        return "Expected `':'`";
    case DeError::ExpectedArrayCommaOrEnd:
        return "Expected `','` or `']'`";
    case DeError::LeadingArrayComma:
        return "JSON array content starts with a leading `,`";
    case DeError::TrailingArrayComma:
        return "JSON array content ends with a trailing `,`";
    case DeError::ExpectedObjectCommaOrEnd:
        return "Expected `','` or `'}'`";
    case DeError::LeadingObjectComma:
        return "JSON object content starts with a leading `,`";
    case DeError::TrailingObjectComma:
        return "JSON object content ends with a trailing `,`";
    case DeError::ExpectedToken:
        return "Expected either `true`, `false`, or `null`.";
    case DeError::ExpectedNull:
        return "Expected `null`";
    case DeError::ExpectedString:
        return "Expected `\"`";
    case DeError::ExpectedArrayEnd:
        return "Expected ']'";
    case DeError::ExpectedArray:
        return "Expeced a JSON array";
    case DeError::ExpectedObject:
        return "Expected a JSON object";
    case DeError::ExpectedEnumValue:
        return "Expected this character to start a JSON value";
    case DeError::ExpectedEnumObjectEnd:
        return "Expected this character to be `'}'`";
    case DeError::InvalidNumber:
        return "Invalid number.";
    case DeError::InvalidType:
        return "Invalid type";
    case DeError::InvalidUnicodeCodePoint:
        return "Invalid unicode code point";
    case DeError::KeyMustBeAString:
        return "Object key is not a string.";
    case DeError::TrailingCharacters:
        return "JSON has non-whitespace trailing characters after the value.";
    case DeError::UnexpectedChar:
        return "Unexpected token while parsing a JSON value";
    case DeError::InvalidLength:
        return "Invalid length";
    case DeError::DepthLimitExceeded:
        return "JSON nesting exceeds the depth limit";
    case DeError::Custom:
        return "JSON does not match deserializer’s expected format.";
    }
    return "unknown JSON error";
}

std::string_view toString(SerError e) noexcept
{
    switch (e)
    {
    case SerError::Ok:
        return "ok";
    case SerError::Writer:
        return "error writing to the output sink";
    case SerError::InvalidKeyType:
        return "invalid JSON object key data type";
    case SerError::FormatError:
        return "error while collecting a string";
    case SerError::Custom:
        return "error while serializing JSON";
    }
    return "unknown JSON error";
}

} // namespace zerowire::json
