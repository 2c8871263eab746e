/**
 * Copyright (C) 2023 Osmozis SA - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

/**
 * @file main.cpp
 * @brief This is an example of how to use muxcurl to perform asynchronous (i.e. non-blocking) network transfers.
 * To do so, we will use the event-driven interface of muxcurl.
 * Basically, the workflow is supposed to look like this :
 * <ul>
 * <li>1 - Setup a session to hold the transfers (\see muxcurl::mhandle) </li>
 * <li>2 - Setup one or more single transfer (\see muxcurl::handle) </li>
 * <li>3 - Add your transfers to the session and let your loop do the magic </li>
 * </ul>
 *
 * In this example, every url given on the command line is downloaded 5 times, in parallel.
 */

#include <Loop.h>
#include <muxcurl/muxcurl.hpp>

#include <spdlog/spdlog.h>

#include <signal.h>
#include <string.h>

#include <cstdlib>
#include <memory>
#include <vector>

using namespace muxcurl;
using namespace loop;

#define ROUNDS 5

int
main(int argc, char** argv)
{
    if (argc < 2)
    {
        spdlog::error("Usage: {} <url> [url...]", argv[0]);
        return EXIT_FAILURE;
    }

    // 0 - We setup everything we need
    Loop myLoop;

    auto sigintEvt = Loop::UNIX_SIGNAL(SIGINT, myLoop);
    sigintEvt.onEvent([&myLoop](int) {
        spdlog::warn("{}", strsignal(SIGINT));
        myLoop.exit();
    });

    auto sigtermEvt = Loop::UNIX_SIGNAL(SIGTERM, myLoop);
    sigtermEvt.onEvent([&myLoop](int) {
        spdlog::warn("{}", strsignal(SIGTERM));
        myLoop.exit();
    });

    // 1 - Setup our session
    mhandle sess(myLoop);
    sess.set_cb_debug([](std::string_view line) { spdlog::debug("{}", line); });
    sess.set_cb_error([&myLoop](int rc) {
        spdlog::error("Session failed ({})", rc);
        myLoop.exit();
    });
    sess.set_max_host_connections(4);

    // 2 - Setup our transfers
    std::vector<std::unique_ptr<handle>> hdls;
    size_t                               finished{ 0 };

    for (int i{ 1 }; i < argc; ++i)
    {
        auto& hdl{ hdls.emplace_back(std::make_unique<handle>()) };
        auto  h{ hdl.get() };

        if (handle::HDL_OK != h->configure(argv[i]) || handle::HDL_OK != h->buffer())
        {
            spdlog::error("Invalid url '{}'", argv[i]);
            return EXIT_FAILURE;
        }

        h->set_cb_done([h, &sess, &myLoop, &finished, &hdls, round = 0](int rc) mutable {
            long code{ 0 };
            h->get_response(code);
            spdlog::info("[DONE][{}][{}] {} - {} ({})", h->url(), round, code,
                         handle::retCode2Str(static_cast<handle::HDL_RetCode>(rc)), h->errstr());

            if (handle::HDL_MULTI_STOPPED == rc) return;

            // The transfer has been released: it can be performed again right away
            if (++round < ROUNDS)
                sess.add_handle(*h);
            else if (std::size(hdls) == ++finished)
                myLoop.exit();
        });

        // 3 - Perform our transfer by adding it to the session
        if (auto ret{ sess.add_handle(*h) }; mhandle::MHDL_OK != ret)
        {
            spdlog::error("Unable to add '{}': {}", argv[i], mhandle::retCode2Str(ret));
            return EXIT_FAILURE;
        }
    }

    myLoop.run();
    sess.close();

    return EXIT_SUCCESS;
}
