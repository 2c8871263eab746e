/**
 * Copyright (C) 2023 Osmozis SA - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

/**
 * @file main.cpp
 * @brief This is an example of how to use muxcurl to relay client connections to their target, possibly through an
 * upstream proxy.
 *
 * Usage: muxcurl-bridge <listen port> [proxy port [user [password]]]
 *
 * Clients are served one at a time:
 * <ul>
 * <li> CONNECT requests are established by libcurl, then raw bytes are relayed (\see mhandle::tunnel_handle) </li>
 * <li> Other requests are performed with the client socket as body source and sink (\see mhandle::bridge_handle) </li>
 * </ul>
 */

#include <Loop.h>
#include <muxcurl/muxcurl.hpp>

#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstdint>
#include <cstdlib>
#include <string>

using namespace muxcurl;
using namespace loop;

#define IDLE_MS 30000

namespace
{
struct request
{
    std::string method;
    std::string target;
    std::string version;
    header_list headers;
};

// Read the request head byte per byte: the body must stay in the socket for the transfer
bool
read_request(int fd, request& req)
{
    std::string head;
    char        c;

    while (std::string::npos == head.find("\r\n\r\n"))
    {
        if (::recv(fd, &c, 1, 0) <= 0) return false;
        head.push_back(c);
        if (std::size(head) > 65536) return false;
    }

    auto eol{ head.find("\r\n") };
    auto line{ head.substr(0, eol) };
    auto sp1{ line.find(' ') };
    auto sp2{ line.rfind(' ') };
    if (std::string::npos == sp1 || sp1 == sp2) return false;

    req.method  = line.substr(0, sp1);
    req.target  = line.substr(sp1 + 1, sp2 - sp1 - 1);
    req.version = line.substr(sp2 + 1);

    for (auto pos{ eol + 2 }; pos < std::size(head) - 2;)
    {
        auto next{ head.find("\r\n", pos) };
        auto hdr{ head.substr(pos, next - pos) };

        if (auto colon{ hdr.find(':') }; std::string::npos != colon)
        {
            auto value{ hdr.substr(colon + 1) };
            value.erase(0, value.find_first_not_of(' '));
            // Hop-by-hop
            if (!iequals(hdr.substr(0, colon), "Proxy-Connection")) req.headers.set(hdr.substr(0, colon), value);
        }
        pos = next + 2;
    }
    return true;
}

void
reply(int fd, std::string_view status)
{
    const std::string msg{ "HTTP/1.1 " + std::string(status) + "\r\nContent-Length: 0\r\n\r\n" };
    ::send(fd, msg.data(), std::size(msg), MSG_NOSIGNAL);
}

void
serve(mhandle& sess, handle& hdl, int fd, int argc, char** argv)
{
    request req;
    if (!read_request(fd, req)) return;

    spdlog::info("{} {}", req.method, req.target);

    auto ret{ hdl.configure(req.target, req.method, req.version) };
    if (handle::HDL_OK == ret && argc > 3) ret = hdl.set_proxy(argv[2], std::atol(argv[3]));
    if (handle::HDL_OK == ret && argc > 4) ret = hdl.set_auth(argv[4], (argc > 5) ? argv[5] : "");
    if (handle::HDL_OK == ret) ret = hdl.set_headers(req.headers);
    if (handle::HDL_OK == ret && "CONNECT" != req.method)
        ret = hdl.bridge(handle::fd_reader(fd), handle::fd_writer(fd), handle::fd_writer(fd));

    if (handle::HDL_PROXY_AUTH_FAILED == ret)
    {
        reply(fd, "401 Unauthorized");
        return;
    }
    if (handle::HDL_OK != ret)
    {
        spdlog::warn("Rejected: {}", handle::retCode2Str(ret));
        reply(fd, "400 Bad Request");
        return;
    }

    long code{ 0 };

    if ("CONNECT" == req.method)
    {
        auto mret{ sess.do_handle(hdl, IDLE_MS) };
        hdl.get_response(code);

        if (mhandle::MHDL_OK != mret)
        {
            spdlog::warn("CONNECT failed: {} {}", code, hdl.errstr());
            reply(fd, std::to_string(code) + " Failed");
            return;
        }

        // Without tunnel, the upstream proxy answers the client itself
        if (hdl.is_tunnel()) reply(fd, "200 Connection established");
        mret = sess.tunnel_handle(hdl, fd, IDLE_MS);
        spdlog::info("Tunnel done: {}", mhandle::retCode2Str(mret));
        return;
    }

    auto mret{ sess.bridge_handle(hdl, fd, IDLE_MS) };
    hdl.get_response(code);
    if (mhandle::MHDL_OK != mret)
        spdlog::warn("Transfer failed ({}): {} {}", mhandle::retCode2Str(mret), code, hdl.errstr());
    else
        spdlog::info("Done: {}", code);
}
} // namespace

int
main(int argc, char** argv)
{
    if (argc < 2)
    {
        spdlog::error("Usage: {} <listen port> [proxy port [user [password]]]", argv[0]);
        return EXIT_FAILURE;
    }

    int listener{ ::socket(AF_INET, SOCK_STREAM, 0) };
    int one{ 1 };
    ::setsockopt(listener, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr{};
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port        = htons(static_cast<uint16_t>(std::atoi(argv[1])));

    if (0 != ::bind(listener, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) || 0 != ::listen(listener, 16))
    {
        spdlog::error("Unable to listen on port {}", argv[1]);
        return EXIT_FAILURE;
    }

    // Only runs while a transfer is served
    Loop myLoop;

    mhandle sess(myLoop);
    sess.set_cb_debug([](std::string_view line) { spdlog::debug("{}", line); });

    handle hdl;
    hdl.set_cb_debug([](std::string_view line) { spdlog::debug("{}", line); });

    spdlog::info("Relaying on 127.0.0.1:{}", argv[1]);

    // Until interrupted
    for (;;)
    {
        int fd{ ::accept(listener, nullptr, nullptr) };
        if (fd < 0) continue;

        serve(sess, hdl, fd, argc, argv);
        ::close(fd);
    }
}
