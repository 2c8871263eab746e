/**
 * Copyright (C) 2023 Osmozis SA - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

/**
 * @file text.hpp
 * @brief Text helpers shared by the transfers: byte decoding and sanitizing of diagnostic lines
 * @author lhm
 */

#ifndef INCLUDE_MUXCURL_TEXT_H
#define INCLUDE_MUXCURL_TEXT_H

#include <string>
#include <string_view>

namespace muxcurl
{
/**
 * @brief Encoding describes how received bytes are turned into text
 */
typedef enum
{
    ENC_RAW = 0, /*!< No decoding, bytes are returned as received */
    ENC_UTF8,    /*!< Bytes must be valid UTF-8 */
    ENC_ASCII,   /*!< Bytes must be 7-bit ASCII */
    ENC_LATIN1   /*!< ISO-8859-1, transcoded to UTF-8 */
} Encoding;

bool decode(std::string_view in, Encoding enc, std::string& out);

std::string sanitized(std::string_view msg);

} // namespace muxcurl

#endif // INCLUDE_MUXCURL_TEXT_H
