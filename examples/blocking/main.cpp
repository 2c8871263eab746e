/**
 * Copyright (C) 2023 Osmozis SA - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

/**
 * @file main.cpp
 * @brief This is an example of how to use muxcurl to perform a blocking transfer, optionally through an
 * authenticating proxy.
 *
 * Usage: muxcurl-blocking <url> [proxy port [user [password [mechanisms]]]]
 *
 * The transfer is performed twice: the second time, the proxy authentication mechanism learnt by the first one is
 * used directly.
 */

#include <muxcurl/muxcurl.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

using namespace muxcurl;

int
main(int argc, char** argv)
{
    if (argc < 2)
    {
        spdlog::error("Usage: {} <url> [proxy port [user [password [mechanisms]]]]", argv[0]);
        return EXIT_FAILURE;
    }

    spdlog::set_level(spdlog::level::debug);
    spdlog::info("Using {}", handle::engine_version());

    handle hdl;
    hdl.set_cb_debug([](std::string_view line) { spdlog::debug("{}", line); });
    hdl.set_cb_done([](int rc) { spdlog::info("DONE: {}", rc); });

    for (int i{ 0 }; i < 2; ++i)
    {
        auto ret{ hdl.configure(argv[1]) };
        if (handle::HDL_OK == ret) ret = hdl.set_debug();
        if (handle::HDL_OK == ret && argc > 3) ret = hdl.set_proxy(argv[2], std::atol(argv[3]));
        if (handle::HDL_OK == ret && argc > 4)
            ret = hdl.set_auth(argv[4], (argc > 5) ? argv[5] : "", (argc > 6) ? argv[6] : "ANY");
        if (handle::HDL_OK == ret) ret = hdl.buffer();

        if (handle::HDL_OK != ret)
        {
            spdlog::error("Unable to setup the transfer: {}", handle::retCode2Str(ret));
            return EXIT_FAILURE;
        }

        // Perform the transfer with the blocking interface
        ret = hdl.perform();

        long          code{ 0 };
        unsigned long mech{ 0 };
        std::string   data;
        hdl.get_response(code);
        hdl.get_auth_used(mech);

        if (handle::HDL_OK != ret)
        {
            spdlog::error("Transfer failed ({}): {} {}", handle::retCode2Str(ret), code, hdl.errstr());
            return EXIT_FAILURE;
        }

        if (handle::HDL_OK != hdl.get_data(data, ENC_UTF8)) hdl.get_data(data, ENC_LATIN1);
        spdlog::info("[{}] {} - {} bytes, proxy auth {}", i, code, std::size(data), auth_cache::mechanism_name(mech));
    }

    return EXIT_SUCCESS;
}
