// SPDX-License-Identifier: Apache-2.0
#include "Base64.hpp"

#include <array>
#include <cstdint>
#include <format>

namespace meetlink::base64
{

namespace
{

    constexpr auto Alphabet =
        std::string_view { "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/" };

    constexpr auto Invalid = uint8_t { 0xFF };

    constexpr auto DecodeTable = [] {
        auto table = std::array<uint8_t, 256> {};
        table.fill(Invalid);
        for (auto i = std::size_t { 0 }; i < Alphabet.size(); ++i)
            table[static_cast<unsigned char>(Alphabet[i])] = static_cast<uint8_t>(i);
        return table;
    }();

    constexpr auto isWhitespace(char c) -> bool
    {
        return c == ' ' || c == '\n' || c == '\r' || c == '\t';
    }

} // namespace

auto encode(std::span<const std::byte> data) -> std::string
{
    auto out = std::string {};
    out.reserve((data.size() + 2) / 3 * 4);

    auto i = std::size_t { 0 };
    for (; i + 2 < data.size(); i += 3)
    {
        auto const triple = (std::to_integer<uint32_t>(data[i]) << 16)
                            | (std::to_integer<uint32_t>(data[i + 1]) << 8)
                            | std::to_integer<uint32_t>(data[i + 2]);
        out += Alphabet[(triple >> 18) & 0x3F];
        out += Alphabet[(triple >> 12) & 0x3F];
        out += Alphabet[(triple >> 6) & 0x3F];
        out += Alphabet[triple & 0x3F];
    }

    auto const remaining = data.size() - i;
    if (remaining == 1)
    {
        auto const value = std::to_integer<uint32_t>(data[i]) << 16;
        out += Alphabet[(value >> 18) & 0x3F];
        out += Alphabet[(value >> 12) & 0x3F];
        out += "==";
    }
    else if (remaining == 2)
    {
        auto const value =
            (std::to_integer<uint32_t>(data[i]) << 16) | (std::to_integer<uint32_t>(data[i + 1]) << 8);
        out += Alphabet[(value >> 18) & 0x3F];
        out += Alphabet[(value >> 12) & 0x3F];
        out += Alphabet[(value >> 6) & 0x3F];
        out += '=';
    }

    return out;
}

auto decode(std::string_view text) -> Result<std::vector<std::byte>>
{
    auto out = std::vector<std::byte> {};
    out.reserve(text.size() / 4 * 3);

    auto accumulator = uint32_t { 0 };
    auto bits = 0;
    auto symbols = std::size_t { 0 };
    auto padding = std::size_t { 0 };

    for (auto const c: text)
    {
        if (isWhitespace(c))
            continue;

        if (c == '=')
        {
            ++padding;
            continue;
        }

        if (padding > 0)
            return makeError(ErrorCode::ParseError, "base64: data after padding");

        auto const value = DecodeTable[static_cast<unsigned char>(c)];
        if (value == Invalid)
            return makeError(ErrorCode::ParseError,
                             std::format("base64: invalid character 0x{:02x}", static_cast<unsigned char>(c)));

        accumulator = (accumulator << 6) | value;
        bits += 6;
        ++symbols;

        if (bits >= 8)
        {
            bits -= 8;
            out.push_back(static_cast<std::byte>((accumulator >> bits) & 0xFF));
        }
    }

    if (symbols % 4 == 1 || padding > 2)
        return makeError(ErrorCode::ParseError, "base64: truncated input");

    return out;
}

} // namespace meetlink::base64
