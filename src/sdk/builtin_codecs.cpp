//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <zcli/sdk/codec.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>

namespace zcli
{
namespace sdk
{
namespace
{

constexpr const char* Base64Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64Encode(const Payload& bytes)
{
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3)
    {
        const std::uint32_t triple = (static_cast<std::uint32_t>(bytes[i]) << 16U) |
                                     (static_cast<std::uint32_t>(bytes[i + 1]) << 8U) | bytes[i + 2];
        out.push_back(Base64Alphabet[(triple >> 18U) & 0x3FU]);
        out.push_back(Base64Alphabet[(triple >> 12U) & 0x3FU]);
        out.push_back(Base64Alphabet[(triple >> 6U) & 0x3FU]);
        out.push_back(Base64Alphabet[triple & 0x3FU]);
    }

    const std::size_t rest = bytes.size() - i;
    if (rest == 1)
    {
        const std::uint32_t triple = static_cast<std::uint32_t>(bytes[i]) << 16U;
        out.push_back(Base64Alphabet[(triple >> 18U) & 0x3FU]);
        out.push_back(Base64Alphabet[(triple >> 12U) & 0x3FU]);
        out.append("==");
    }
    else if (rest == 2)
    {
        const std::uint32_t triple =
            (static_cast<std::uint32_t>(bytes[i]) << 16U) | (static_cast<std::uint32_t>(bytes[i + 1]) << 8U);
        out.push_back(Base64Alphabet[(triple >> 18U) & 0x3FU]);
        out.push_back(Base64Alphabet[(triple >> 12U) & 0x3FU]);
        out.push_back(Base64Alphabet[(triple >> 6U) & 0x3FU]);
        out.push_back('=');
    }
    return out;
}

int base64Digit(const char ch)
{
    if ((ch >= 'A') && (ch <= 'Z'))
    {
        return ch - 'A';
    }
    if ((ch >= 'a') && (ch <= 'z'))
    {
        return ch - 'a' + 26;  // NOLINT(*-magic-numbers)
    }
    if ((ch >= '0') && (ch <= '9'))
    {
        return ch - '0' + 52;  // NOLINT(*-magic-numbers)
    }
    if (ch == '+')
    {
        return 62;  // NOLINT(*-magic-numbers)
    }
    if (ch == '/')
    {
        return 63;  // NOLINT(*-magic-numbers)
    }
    return -1;
}

/// RFC 4648 decoding: canonical alphabet, padded to a multiple of 4, `=` only at the end.
///
/// ASCII whitespace (line breaks of wrapped or `echo`-ed values) is ignored.
///
Payload base64Decode(const std::string& input)
{
    std::string text;
    text.reserve(input.size());
    for (const char ch : input)
    {
        if (std::isspace(static_cast<unsigned char>(ch)) == 0)
        {
            text.push_back(ch);
        }
    }

    if ((text.size() % 4) != 0)
    {
        throw CodecError("Invalid base64 length " + std::to_string(text.size()) + " (must be a multiple of 4).");
    }

    Payload out;
    out.reserve((text.size() / 4) * 3);

    for (std::size_t i = 0; i < text.size(); i += 4)
    {
        const bool is_last = (i + 4) == text.size();

        std::array<int, 4> digits{};
        std::size_t        padding = 0;
        for (std::size_t j = 0; j < 4; ++j)
        {
            const char ch = text[i + j];
            if (ch == '=')
            {
                if (!is_last || (j < 2))
                {
                    throw CodecError("Invalid base64 padding at position " + std::to_string(i + j) + ".");
                }
                ++padding;
                digits[j] = 0;
                continue;
            }
            if (padding > 0)
            {
                throw CodecError("Invalid base64 padding at position " + std::to_string(i + j) + ".");
            }
            digits[j] = base64Digit(ch);
            if (digits[j] < 0)
            {
                throw CodecError("Invalid base64 character at position " + std::to_string(i + j) + ".");
            }
        }

        const auto triple = (static_cast<std::uint32_t>(digits[0]) << 18U) |
                            (static_cast<std::uint32_t>(digits[1]) << 12U) |
                            (static_cast<std::uint32_t>(digits[2]) << 6U) | static_cast<std::uint32_t>(digits[3]);

        out.push_back(static_cast<std::uint8_t>((triple >> 16U) & 0xFFU));
        if (padding < 2)
        {
            out.push_back(static_cast<std::uint8_t>((triple >> 8U) & 0xFFU));
        }
        if (padding < 1)
        {
            out.push_back(static_cast<std::uint8_t>(triple & 0xFFU));
        }
    }
    return out;
}

/// Parses a JSON document, keeping the order of object members.
///
nlohmann::ordered_json parseJson(const std::string& text)
{
    try
    {
        return nlohmann::ordered_json::parse(text);

    } catch (const nlohmann::ordered_json::parse_error& ex)
    {
        throw CodecError(std::string{"Invalid JSON: "} + ex.what());
    }
}

/// Renders JSON on a single line. Floats are rendered in their shortest round-trip form.
///
std::string renderJsonCompact(const nlohmann::ordered_json& value)
{
    return value.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

}  // namespace

void registerBuiltinCodecs(CodecRegistry& registry)
{
    registry.registerCodec(
        "text",
        [](const std::string&, const std::string& value) { return Payload(value.begin(), value.end()); },
        [](const std::string&, const Payload& payload) { return std::string(payload.begin(), payload.end()); });

    registry.registerCodec(
        "base64",
        [](const std::string&, const std::string& value) { return base64Decode(value); },
        [](const std::string&, const Payload& payload) { return base64Encode(payload); });

    registry.registerCodec(
        "json",
        [](const std::string&, const std::string& value) {
            //
            parseJson(value);
            return Payload(value.begin(), value.end());
        },
        [](const std::string&, const Payload& payload) {
            //
            return renderJsonCompact(parseJson(std::string(payload.begin(), payload.end())));
        });
}

}  // namespace sdk
}  // namespace zcli
