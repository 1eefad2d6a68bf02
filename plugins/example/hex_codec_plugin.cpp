//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <zcli/sdk/codec.hpp>
#include <zcli/sdk/codec_plugin.hpp>

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>

// Example codec plugin: `hex` renders payloads as lowercase hexadecimal digits (f.e. `48656c6c6f`).
//
// Build it as a module library and point `ZCLI_CODEC_PLUGIN_PATH` (or `--codec-plugin`) to it.

namespace
{

constexpr const char* HexDigits = "0123456789abcdef";

int hexValue(const char ch)
{
    const auto lower = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    if ((lower >= '0') && (lower <= '9'))
    {
        return lower - '0';
    }
    if ((lower >= 'a') && (lower <= 'f'))
    {
        return lower - 'a' + 10;  // NOLINT(*-magic-numbers)
    }
    return -1;
}

zcli::sdk::Payload encodeHex(const std::string&, const std::string& value)
{
    if ((value.size() % 2) != 0)
    {
        throw zcli::sdk::CodecError("Hex value must have an even number of digits.");
    }

    zcli::sdk::Payload payload;
    payload.reserve(value.size() / 2);
    for (std::size_t i = 0; i < value.size(); i += 2)
    {
        const int high = hexValue(value[i]);
        const int low  = hexValue(value[i + 1]);
        if ((high < 0) || (low < 0))
        {
            throw zcli::sdk::CodecError("Invalid hex digit at position " + std::to_string(i) + ".");
        }
        payload.push_back(static_cast<std::uint8_t>((high << 4) | low));  // NOLINT(*-signed-bitwise)
    }
    return payload;
}

std::string decodeHex(const std::string&, const zcli::sdk::Payload& payload)
{
    std::string text;
    text.reserve(payload.size() * 2);
    for (const auto byte : payload)
    {
        text.push_back(HexDigits[byte >> 4U]);
        text.push_back(HexDigits[byte & 0x0FU]);
    }
    return text;
}

}  // namespace

extern "C" void zcli_register_codecs(zcli::sdk::CodecRegistrar& registrar)
{
    registrar.addEncoder("hex", &encodeHex);
    registrar.addDecoder("hex", &decodeHex);
}
