#include "WirecatApplication.hpp"

#include <zerowire/core/Logger.hpp>
#include <zerowire/json/Json.hpp>
#include <zerowire/msgpack/MessageFramer.hpp>
#include <zerowire/msgpack/MsgPack.hpp>
#include <zerowire/sink/ByteSink.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace wirecat
{

namespace
{

using zerowire::serde::ErrorMessage;
using zerowire::serde::Value;

// Custom 이면 visitor 가 남긴 본문을 붙인다
template <class E>
[[noreturn]] void throwCodecError(const char *stage, E err, const ErrorMessage &message)
{
    std::string what = std::string(stage) + ": " + std::string(toString(err));
    if (!message.view().empty())
        what += " (" + std::string(message.view()) + ")";
    throw std::runtime_error(what);
}

template <class Encoder>
void encodeJson(const Value &value, std::string &out)
{
    zerowire::sink::StringWriter writer(out);
    ErrorMessage message;
    const auto err = zerowire::json::toWriterWithEncoder<Encoder>(writer, value, &message);
    if (err != zerowire::json::SerError::Ok)
        throwCodecError("json encode", err, message);
}

const char *modeName(zerowire::core::WirecatConfig::Mode mode) noexcept
{
    return mode == zerowire::core::WirecatConfig::Mode::JsonToMsgpack ? "json2msgpack"
                                                                      : "msgpack2json";
}

} // namespace

WirecatApplication::WirecatApplication(const zerowire::core::GlobalConfig &cfg) : cfg_(cfg) {}

void WirecatApplication::run()
{
    std::vector<std::uint8_t> input = readInput();
    const std::size_t inBytes = input.size();

    SLOG_DEBUG("Wirecat", "Start", "mode={} in={}", modeName(cfg_.wirecat.mode), inBytes);

    if (cfg_.wirecat.mode == zerowire::core::WirecatConfig::Mode::JsonToMsgpack)
    {
        std::vector<std::uint8_t> out;
        jsonToMsgpack(input, out);
        writeOutput(out);
        SLOG_INFO("Wirecat", "Converted", "in={} out={}", inBytes, out.size());
        return;
    }

    std::string out;
    const std::size_t messages = msgpackToJson(input, out);
    writeOutput(zerowire::sink::asBytes(out));
    SLOG_INFO("Wirecat", "Converted", "in={} out={} messages={}", inBytes, out.size(), messages);
}

void WirecatApplication::jsonToMsgpack(std::span<std::uint8_t> input,
                                       std::vector<std::uint8_t> &out) const
{
    Value value;
    ErrorMessage message;
    const auto derr = zerowire::json::fromMutSlice(input, value, &message,
                                                   zerowire::effectiveMaxDepth(cfg_.codec));
    if (derr != zerowire::json::DeError::Ok)
        throwCodecError("json decode", derr, message);

    zerowire::sink::VectorWriter writer(out);
    const auto serr = cfg_.codec.msgpackProfile == zerowire::MsgpackProfile::Named
                          ? zerowire::msgpack::toWriterNamed(writer, value, &message)
                          : zerowire::msgpack::toWriter(writer, value, &message);
    if (serr != zerowire::msgpack::SerError::Ok)
        throwCodecError("msgpack encode", serr, message);
}

std::size_t WirecatApplication::msgpackToJson(std::span<const std::uint8_t> input,
                                              std::string &out) const
{
    zerowire::msgpack::MessageFramer framer(zerowire::effectiveMaxMessageLen(cfg_.codec));

    std::size_t messages = 0;
    std::size_t offset = 0;
    while (!input.empty())
    {
        std::span<const std::uint8_t> frame;
        const auto r = framer.tryFrame(input, frame);
        if (r == zerowire::msgpack::FrameResult::NeedMore)
            throw std::runtime_error("msgpack decode: truncated message at offset " +
                                     std::to_string(offset));
        if (r == zerowire::msgpack::FrameResult::Invalid)
            throw std::runtime_error(std::string("msgpack decode: ") + framer.lastErrorReason());

        Value value;
        std::size_t consumed = 0;
        ErrorMessage message;
        const auto derr = zerowire::msgpack::fromSlice(frame, value, consumed, &message,
                                                       zerowire::effectiveMaxDepth(cfg_.codec));
        if (derr != zerowire::msgpack::DeError::Ok)
            throwCodecError("msgpack decode", derr, message);

        writeJson(value, out);
        out.push_back('\n');

        input = input.subspan(frame.size());
        offset += frame.size();
        ++messages;
    }
    return messages;
}

void WirecatApplication::writeJson(const Value &value, std::string &out) const
{
    namespace json = zerowire::json;
    switch (cfg_.codec.jsonBytes)
    {
    case zerowire::JsonBytes::Array:
        encodeJson<json::ArrayByteEncoder>(value, out);
        return;
    case zerowire::JsonBytes::Hex:
        encodeJson<json::HexStrByteEncoder>(value, out);
        return;
    case zerowire::JsonBytes::Base64:
        encodeJson<json::Base64ByteEncoder>(value, out);
        return;
    case zerowire::JsonBytes::Pass:
        encodeJson<json::PassThroughByteEncoder>(value, out);
        return;
    }
}

std::vector<std::uint8_t> WirecatApplication::readInput() const
{
    const std::size_t limit = zerowire::effectiveMaxInputBytes(cfg_.codec);

    std::ifstream file;
    std::istream *is = &std::cin;
    if (!cfg_.wirecat.input.empty())
    {
        file.open(cfg_.wirecat.input, std::ios::binary);
        if (!file.is_open())
            throw std::runtime_error("failed to open input: " + cfg_.wirecat.input);
        is = &file;
    }

    std::vector<std::uint8_t> data;
    char chunk[4096];
    while (is->read(chunk, sizeof(chunk)) || is->gcount() > 0)
    {
        const auto n = static_cast<std::size_t>(is->gcount());
        if (data.size() + n > limit)
        {
            SLOG_WARN("Wirecat", "InputTooLarge", "limit={}", limit);
            throw std::runtime_error("input exceeds max_input_bytes (" + std::to_string(limit) +
                                     ")");
        }
        data.insert(data.end(), chunk, chunk + n);
    }
    if (is->bad())
        throw std::runtime_error("failed to read input");
    return data;
}

void WirecatApplication::writeOutput(std::span<const std::uint8_t> bytes) const
{
    std::ofstream file;
    std::ostream *os = &std::cout;
    if (!cfg_.wirecat.output.empty())
    {
        file.open(cfg_.wirecat.output, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
            throw std::runtime_error("failed to open output: " + cfg_.wirecat.output);
        os = &file;
    }

    os->write(reinterpret_cast<const char *>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    os->flush();
    if (!*os)
        throw std::runtime_error("failed to write output");
}

} // namespace wirecat
