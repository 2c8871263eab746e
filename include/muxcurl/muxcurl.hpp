/**
 * Copyright (C) 2023 Osmozis SA - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

/**
 * @file muxcurl.hpp
 * @brief The only inclusion header you will need
 * @author lhm
 */

#ifndef INCLUDE_MUXCURL_MUXCURL_H
#define INCLUDE_MUXCURL_MUXCURL_H

#include "auth_cache.hpp"
#include "handle.hpp"
#include "headers.hpp"
#include "mhandle.hpp"
#include "text.hpp"

#endif // INCLUDE_MUXCURL_MUXCURL_H
