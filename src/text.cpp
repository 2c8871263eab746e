/**
 * Copyright (C) 2023 Osmozis SA - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

#include <muxcurl/text.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace muxcurl
{
namespace
{
bool
_valid_utf8(std::string_view in) noexcept
{
    size_t i{ 0 };
    while (i < std::size(in))
    {
        const auto c{ static_cast<unsigned char>(in[i]) };
        size_t     len{ 0 };
        uint32_t   cp{ 0 };

        if (c < 0x80)
        {
            ++i;
            continue;
        }
        else if (0xC2 <= c && c <= 0xDF)
        {
            len = 1;
            cp  = c & 0x1F;
        }
        else if (0xE0 <= c && c <= 0xEF)
        {
            len = 2;
            cp  = c & 0x0F;
        }
        else if (0xF0 <= c && c <= 0xF4)
        {
            len = 3;
            cp  = c & 0x07;
        }
        else
            return false;

        if (i + len >= std::size(in)) return false;
        for (size_t k{ 1 }; k <= len; ++k)
        {
            const auto cc{ static_cast<unsigned char>(in[i + k]) };
            if (0x80 != (cc & 0xC0)) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong forms, surrogates, out of range
        if ((2 == len && cp < 0x800) || (3 == len && cp < 0x10000) || (0xD800 <= cp && cp <= 0xDFFF) ||
            cp > 0x10FFFF)
            return false;

        i += len + 1;
    }
    return true;
}
} // namespace

/**
 * @brief decode - Turn received bytes into text
 *
 * @param in The bytes
 * @param enc The encoding of the bytes (ENC_RAW to get them untouched)
 * @param out The result
 * @return false if the bytes are not valid for the encoding (out is left untouched)
 */
bool
decode(std::string_view in, Encoding enc, std::string& out)
{
    switch (enc)
    {
        case ENC_RAW: out.assign(in); return true;
        case ENC_UTF8:
            if (!_valid_utf8(in)) return false;
            out.assign(in);
            return true;
        case ENC_ASCII:
            if (std::any_of(std::cbegin(in), std::cend(in), [](char c) { return c & 0x80; })) return false;
            out.assign(in);
            return true;
        case ENC_LATIN1: {
            std::string res;
            res.reserve(std::size(in));
            for (auto c : in)
            {
                const auto b{ static_cast<unsigned char>(c) };
                if (b < 0x80)
                {
                    res.push_back(c);
                }
                else
                {
                    res.push_back(static_cast<char>(0xC0 | (b >> 6)));
                    res.push_back(static_cast<char>(0x80 | (b & 0x3F)));
                }
            }
            out = std::move(res);
            return true;
        }
        default: break;
    }
    return false;
}

/**
 * @brief sanitized - Hide credentials from a diagnostic line
 *
 * The value of authorization/authenticate headers (after the scheme, if any) and the user of "Proxy auth using" lines
 * are replaced by their length. They may appear anywhere in the line, and a line already sanitized is kept as is.
 * e.g. "Proxy-Authorization: Basic dXNlcjpwYXNz" -> "Proxy-Authorization: Basic sanitized len(13)"
 * @param msg The diagnostic line
 * @return The line, safe to display
 */
std::string
sanitized(std::string_view msg)
{
    static constexpr std::string_view _using{ "proxy auth using " };
    static constexpr std::string_view _keys[]{ "authorization: ", "authenticate: " };
    static constexpr std::string_view _done{ " sanitized len(" };

    std::string lower(msg);
    std::transform(std::begin(lower), std::end(lower), std::begin(lower),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    size_t cut{ std::string::npos };
    for (auto key : _keys)
    {
        if (auto pos{ lower.find(key) }; std::string::npos != pos)
        {
            const auto value{ pos + std::size(key) };
            cut = lower.find(' ', value);
            // A bare token
            if (std::string::npos == cut) cut = value - 1;
            break;
        }
    }
    if (std::string::npos == cut)
    {
        if (auto pos{ lower.find(_using) }; std::string::npos != pos) cut = lower.find(' ', pos + std::size(_using));
    }

    if (std::string::npos == cut || cut + 1 >= std::size(msg)) return std::string(msg);
    if (0 == lower.compare(cut, std::size(_done), _done)) return std::string(msg);

    return std::string(msg.substr(0, cut)) + " sanitized len(" + std::to_string(std::size(msg) - cut) + ")";
}

} // namespace muxcurl
