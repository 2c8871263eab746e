/**
 * Copyright (C) 2023 Osmozis SA - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

#include "test_server.hpp"

#include <muxcurl/auth_cache.hpp>
#include <muxcurl/handle.hpp>
#include <muxcurl/mhandle.hpp>

#include <Loop.h>
#include <curl/curl.h>

#include <gtest/gtest.h>

#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <any>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace muxcurl;
using namespace loop;
using muxcurl::test::echo_server;
using muxcurl::test::http_server;

namespace
{
bool
contains(const std::string& haystack, std::string_view needle)
{
    return std::string::npos != haystack.find(needle);
}

class SocketPair
{
    int fds__[2]{ -1, -1 };

public:
    SocketPair()
    {
        if (0 != ::socketpair(AF_UNIX, SOCK_STREAM, 0, fds__)) throw std::runtime_error("socketpair");
    }
    ~SocketPair()
    {
        close_client();
        if (fds__[0] >= 0) ::close(fds__[0]);
    }

    int relay() const noexcept { return fds__[0]; }
    int client() const noexcept { return fds__[1]; }

    void close_client() noexcept
    {
        if (fds__[1] >= 0) ::close(fds__[1]);
        fds__[1] = -1;
    }
};

class Session : public ::testing::Test
{
protected:
    Loop        loop__;
    mhandle     multi__{ loop__ };
    http_server server__;
};
} // namespace

/*********************************************************************************************************************/
// BOOKKEEPING

TEST_F(Session, AddRemoveAreIdempotent)
{
    handle  h;
    mhandle other{ loop__ };

    ASSERT_EQ(handle::HDL_OK, h.configure(server__.url("/hang")));
    ASSERT_EQ(handle::HDL_OK, h.buffer());

    EXPECT_EQ(mhandle::MHDL_OK, multi__.add_handle(h));
    EXPECT_EQ(mhandle::MHDL_ADD_ALREADY, multi__.add_handle(h));
    EXPECT_EQ(mhandle::MHDL_ADD_OWNED, other.add_handle(h));
    EXPECT_EQ(mhandle::MHDL_REMOVE_OWNED, other.remove_handle(h));
    EXPECT_EQ(1u, multi__.enumerate_added_handles());

    // Driven by the session
    EXPECT_EQ(handle::HDL_BAD_FUNCTION, h.perform());

    EXPECT_EQ(mhandle::MHDL_OK, multi__.remove_handle(h));
    EXPECT_EQ(mhandle::MHDL_REMOVE_ALREADY, multi__.remove_handle(h));
    EXPECT_EQ(0u, multi__.enumerate_added_handles());
    EXPECT_TRUE(multi__.check_sockets());

    // Reusable once configured again
    EXPECT_EQ(handle::HDL_OK, h.configure(server__.url("/")));
    EXPECT_EQ(handle::HDL_CONFIGURED, h.state());
}

TEST_F(Session, CloseStopsTransfers)
{
    handle h;
    int    done{ 0 };

    h.set_cb_done([&done](int rc) { done = rc; });
    ASSERT_EQ(handle::HDL_OK, h.configure(server__.url("/hang")));
    ASSERT_EQ(handle::HDL_OK, h.buffer());
    ASSERT_EQ(mhandle::MHDL_OK, multi__.add_handle(h));

    multi__.close();
    multi__.close();

    EXPECT_TRUE(multi__.is_closed());
    EXPECT_EQ(handle::HDL_MULTI_STOPPED, done);
    EXPECT_EQ(handle::HDL_COMPLETE_ERROR, h.state());
    EXPECT_TRUE(contains(h.errstr(), "Session closed"));
    EXPECT_EQ(0u, multi__.enumerate_added_handles());

    EXPECT_EQ(mhandle::MHDL_STOPPED, multi__.add_handle(h));
    EXPECT_EQ(mhandle::MHDL_STOPPED, multi__.do_handle(h));
    EXPECT_EQ(mhandle::MHDL_STOPPED, multi__.set_maxconnects(4));
}

TEST_F(Session, ReservedOptions)
{
    EXPECT_EQ(mhandle::MHDL_BAD_PARAM, multi__.set_opt(CURLMOPT_SOCKETFUNCTION, static_cast<void*>(nullptr)));
    EXPECT_EQ(mhandle::MHDL_BAD_PARAM, multi__.set_opt(CURLMOPT_TIMERDATA, static_cast<void*>(nullptr)));
    EXPECT_EQ(mhandle::MHDL_BAD_PARAM, multi__.set_opt(CURLMOPT_MAXCONNECTS, std::any{}));
    EXPECT_EQ(mhandle::MHDL_OK, multi__.set_opt(CURLMOPT_MAXCONNECTS, 8L));
    EXPECT_EQ(mhandle::MHDL_OK, multi__.set_max_host_connections(4));
}

TEST_F(Session, RetCode2Str)
{
    EXPECT_EQ("idle timeout", mhandle::retCode2Str(mhandle::MHDL_IDLE_TIMEOUT));
    EXPECT_EQ("unknown", mhandle::retCode2Str(static_cast<mhandle::MHDL_RetCode>(99)));
}

/*********************************************************************************************************************/
// BLOCKING INTERFACE

TEST_F(Session, ConcurrentTransfers)
{
    handle      get;
    handle      post;
    std::string body;
    long        code{ 0 };

    ASSERT_EQ(handle::HDL_OK, get.configure(server__.url("/a")));
    ASSERT_EQ(handle::HDL_OK, get.buffer());

    ASSERT_EQ(handle::HDL_OK, post.configure(server__.url("/b"), "POST"));
    ASSERT_EQ(handle::HDL_OK, post.set_headers({ { "Content-Length", "8" } }));
    ASSERT_EQ(handle::HDL_OK, post.buffer("test8192"));

    ASSERT_EQ(mhandle::MHDL_OK, multi__.add_handle(get));
    ASSERT_EQ(mhandle::MHDL_OK, multi__.add_handle(post));

    EXPECT_EQ(mhandle::MHDL_OK, multi__.do_handle(get, 5000));
    // May already be done: it progressed while waiting for the first one
    EXPECT_EQ(mhandle::MHDL_OK, multi__.do_handle(post, 5000));

    EXPECT_EQ(handle::HDL_OK, get.get_data(body));
    EXPECT_EQ("hello /a", body);
    EXPECT_EQ(handle::HDL_OK, post.get_response(code));
    EXPECT_EQ(200, code);
    EXPECT_EQ(handle::HDL_OK, post.get_data(body));
    EXPECT_EQ("test8192", body);

    EXPECT_EQ(0u, multi__.enumerate_added_handles());
    EXPECT_TRUE(multi__.check_sockets());
}

TEST_F(Session, SharedProxyIdentity)
{
    http_server::options opts;
    opts.require_proxy_auth = true;

    http_server proxy{ opts };
    auto        cache{ std::make_shared<auth_cache>() };
    handle      one{ cache };
    handle      two{ cache };
    std::string body;

    for (auto* h : { &one, &two })
    {
        ASSERT_EQ(handle::HDL_OK, h->configure(h == &one ? "http://origin.test/one" : "http://origin.test/two"));
        ASSERT_EQ(handle::HDL_OK, h->set_proxy("127.0.0.1", proxy.port()));
        ASSERT_EQ(handle::HDL_OK, h->set_auth("user", "pass"));
        ASSERT_EQ(handle::HDL_OK, h->buffer());
    }

    // Both negotiate before either has recorded the mechanism
    ASSERT_EQ(mhandle::MHDL_OK, multi__.add_handle(one));
    ASSERT_EQ(mhandle::MHDL_OK, multi__.add_handle(two));

    EXPECT_EQ(mhandle::MHDL_OK, multi__.do_handle(one, 5000));
    EXPECT_EQ(mhandle::MHDL_OK, multi__.do_handle(two, 5000));

    EXPECT_EQ(handle::HDL_OK, one.get_data(body));
    EXPECT_EQ("hello /one", body);
    EXPECT_EQ(handle::HDL_OK, two.get_data(body));
    EXPECT_EQ("hello /two", body);

    auto known{ cache->lookup({ "127.0.0.1", proxy.port(), "user" }) };
    EXPECT_EQ(auth_cache::AUTH_KNOWN, known.state);
    EXPECT_EQ(CURLAUTH_BASIC, known.mechanism);
    EXPECT_EQ(CURLAUTH_BASIC, cache->lookup({ "127.0.0.1", proxy.port(), "" }).mechanism);

    EXPECT_EQ(0u, multi__.enumerate_added_handles());
    EXPECT_TRUE(multi__.check_sockets());
}

TEST_F(Session, RemovedWhileAwaited)
{
    handle quick;
    handle slow;

    quick.set_cb_done([this, &slow](int) { multi__.remove_handle(slow); });

    ASSERT_EQ(handle::HDL_OK, quick.configure(server__.url("/")));
    ASSERT_EQ(handle::HDL_OK, quick.buffer());
    ASSERT_EQ(handle::HDL_OK, slow.configure(server__.url("/sleep")));
    ASSERT_EQ(handle::HDL_OK, slow.buffer());

    ASSERT_EQ(mhandle::MHDL_OK, multi__.add_handle(quick));
    EXPECT_EQ(mhandle::MHDL_STOPPED, multi__.do_handle(slow, 5000));

    EXPECT_EQ(handle::HDL_COMPLETE_OK, quick.state());
    EXPECT_EQ(handle::HDL_COMPLETE_ERROR, slow.state());
    EXPECT_TRUE(contains(slow.errstr(), "Stopped"));
    EXPECT_EQ(0u, multi__.enumerate_added_handles());
    EXPECT_TRUE(multi__.check_sockets());
}

TEST_F(Session, Utf8Response)
{
    handle      h;
    std::string body;

    ASSERT_EQ(handle::HDL_OK, h.configure(server__.url("/utf8")));
    ASSERT_EQ(handle::HDL_OK, h.buffer());
    ASSERT_EQ(mhandle::MHDL_OK, multi__.do_handle(h));

    EXPECT_EQ(handle::HDL_OK, h.get_data(body, ENC_UTF8));
    EXPECT_EQ("caf\xc3\xa9", body);
    EXPECT_EQ(handle::HDL_BAD_ENCODING, h.get_data(body, ENC_ASCII));
}

TEST_F(Session, FailedTransfer)
{
    handle h;
    long   code{ 0 };

    ASSERT_EQ(handle::HDL_OK, h.configure("http://127.0.0.1:1/", "GET", "HTTP/1.1", 5));
    ASSERT_EQ(handle::HDL_OK, h.buffer());

    EXPECT_EQ(mhandle::MHDL_TRANSFER_FAILED, multi__.do_handle(h));
    EXPECT_EQ(handle::HDL_OK, h.get_response(code));
    EXPECT_EQ(502, code);
}

TEST_F(Session, IdleTimeout)
{
    handle h;

    ASSERT_EQ(handle::HDL_OK, h.configure(server__.url("/hang")));
    ASSERT_EQ(handle::HDL_OK, h.buffer());

    EXPECT_EQ(mhandle::MHDL_IDLE_TIMEOUT, multi__.do_handle(h, 300));
    EXPECT_EQ(handle::HDL_COMPLETE_ERROR, h.state());
    EXPECT_TRUE(contains(h.errstr(), "Idle timeout"));
    EXPECT_EQ(0u, multi__.enumerate_added_handles());
    EXPECT_TRUE(multi__.check_sockets());

    // The session is still usable
    ASSERT_EQ(handle::HDL_OK, h.configure(server__.url("/after")));
    ASSERT_EQ(handle::HDL_OK, h.buffer());
    EXPECT_EQ(mhandle::MHDL_OK, multi__.do_handle(h, 5000));
}

TEST_F(Session, BridgedChunkedUpload)
{
    handle      h;
    std::string payload;
    std::string received;
    std::string headers;
    size_t      sent{ 0 };
    int         reads{ 0 };
    int         writes{ 0 };

    for (int i{ 0 }; static_cast<int>(std::size(payload)) < 100 * 1024; ++i)
        payload += "line " + std::to_string(i) + "\n";

    // No size: chunked request body
    ASSERT_EQ(handle::HDL_OK, h.configure(server__.url("/echo"), "POST"));
    ASSERT_EQ(handle::HDL_OK, h.bridge(
                                [&](char* buf, size_t sz) -> long {
                                    // Every other call has nothing ready
                                    if (0 == (reads++ % 2)) return handle::STREAM_AGAIN;

                                    const auto n{ std::min(sz, std::size(payload) - sent) };
                                    std::memcpy(buf, payload.data() + sent, n);
                                    sent += n;
                                    return static_cast<long>(n);
                                },
                                [&](const char* buf, size_t sz) -> long {
                                    // Slow consumer
                                    if (0 == (writes++ % 3)) return handle::STREAM_AGAIN;

                                    const auto n{ std::min<size_t>(sz, 1000) };
                                    received.append(buf, n);
                                    return static_cast<long>(n);
                                },
                                [&headers](const char* buf, size_t sz) -> long {
                                    headers.append(buf, sz);
                                    return static_cast<long>(sz);
                                }));

    ASSERT_EQ(mhandle::MHDL_OK, multi__.do_handle(h, 5000));
    EXPECT_EQ(std::size(payload), std::size(received));
    EXPECT_EQ(payload, received);
    EXPECT_TRUE(contains(headers, "200 OK"));
    EXPECT_GT(reads, 2);
}

TEST_F(Session, BridgeClientSocket)
{
    handle      h;
    SocketPair  sp;
    std::string out;

    ASSERT_TRUE(muxcurl::test::send_all(sp.client(), "ping"));

    ASSERT_EQ(handle::HDL_OK, h.configure(server__.url("/echo"), "POST"));
    ASSERT_EQ(handle::HDL_OK, h.set_headers({ { "Content-Length", "4" } }));
    ASSERT_EQ(handle::HDL_OK, h.bridge(handle::fd_reader(sp.relay()), handle::fd_writer(sp.relay()),
                                       handle::fd_writer(sp.relay())));

    ASSERT_EQ(mhandle::MHDL_OK, multi__.bridge_handle(h, sp.relay(), 5000));

    ASSERT_TRUE(muxcurl::test::recv_at_least(sp.client(), out, 1));
    while (!contains(out, "\r\n\r\nping"))
        ASSERT_TRUE(muxcurl::test::recv_at_least(sp.client(), out, std::size(out) + 1));

    EXPECT_EQ(0u, out.rfind("HTTP/1.1 200 OK", 0));
    EXPECT_TRUE(contains(out, "X-Method: POST"));
}

TEST_F(Session, BridgeClientClosed)
{
    handle     h;
    SocketPair sp;

    ASSERT_EQ(handle::HDL_OK, h.configure(server__.url("/sleep")));
    ASSERT_EQ(handle::HDL_OK, h.bridge(nullptr, handle::fd_writer(sp.relay())));

    sp.close_client();

    EXPECT_EQ(mhandle::MHDL_CLIENT_CLOSED, multi__.bridge_handle(h, sp.relay(), 5000));
    EXPECT_EQ(handle::HDL_COMPLETE_ERROR, h.state());
    EXPECT_TRUE(contains(h.errstr(), "Client closed"));
    EXPECT_EQ(0u, multi__.enumerate_added_handles());
    EXPECT_TRUE(multi__.check_sockets());
}

TEST_F(Session, Tunnel)
{
    echo_server target;
    handle      h;
    SocketPair  sp;
    std::string echoed;
    int         fd{ -1 };

    ASSERT_EQ(handle::HDL_OK, h.configure("127.0.0.1:" + std::to_string(target.port()), "CONNECT"));
    ASSERT_EQ(mhandle::MHDL_OK, multi__.do_handle(h, 5000));

    // The connection belongs to the transfer until the tunnel is done
    EXPECT_EQ(1u, multi__.enumerate_added_handles());
    EXPECT_EQ(handle::HDL_OK, h.get_activesocket(fd));

    ASSERT_TRUE(muxcurl::test::send_all(sp.client(), "hello tunnel"));
    std::thread client([&sp, &echoed]() {
        muxcurl::test::recv_at_least(sp.client(), echoed, 12);
        sp.close_client();
    });

    EXPECT_EQ(mhandle::MHDL_OK, multi__.tunnel_handle(h, sp.relay(), 5000));
    client.join();

    EXPECT_EQ("hello tunnel", echoed);
    EXPECT_EQ(0u, multi__.enumerate_added_handles());
}

TEST_F(Session, TunnelNeedsCompletedConnect)
{
    handle     h;
    SocketPair sp;

    ASSERT_EQ(handle::HDL_OK, h.configure(server__.url("/")));
    ASSERT_EQ(handle::HDL_OK, h.buffer());
    EXPECT_EQ(mhandle::MHDL_BAD_HANDLE, multi__.tunnel_handle(h, sp.relay()));
    EXPECT_EQ(mhandle::MHDL_BAD_PARAM, multi__.tunnel_handle(h, -1));
}

/*********************************************************************************************************************/
// EVENT-DRIVEN INTERFACE

TEST_F(Session, SharedLoop)
{
    handle        a;
    handle        b;
    int           done{ 0 };
    int           rounds{ 0 };
    Loop::Timeout safety{ loop__ };

    safety.onTimeout([this]() { loop__.exit(); });
    safety.set(10000);

    auto finished{ [&]() {
        if (2 == ++done) loop__.exit();
    } };

    ASSERT_EQ(handle::HDL_OK, a.configure(server__.url("/a")));
    ASSERT_EQ(handle::HDL_OK, a.buffer());
    a.set_cb_done([&](int) { finished(); });

    // Performed three times in a row from its own done callback
    ASSERT_EQ(handle::HDL_OK, b.configure(server__.url("/b")));
    ASSERT_EQ(handle::HDL_OK, b.buffer());
    b.set_cb_done([&](int) {
        if (++rounds < 3)
            multi__.add_handle(b);
        else
            finished();
    });

    ASSERT_EQ(mhandle::MHDL_OK, multi__.add_handle(a));
    ASSERT_EQ(mhandle::MHDL_OK, multi__.add_handle(b));
    loop__.run();
    safety.cancel();

    EXPECT_EQ(2, done);
    EXPECT_EQ(3, rounds);
    EXPECT_EQ(handle::HDL_COMPLETE_OK, a.state());
    EXPECT_EQ(handle::HDL_COMPLETE_OK, b.state());
    EXPECT_EQ(0u, multi__.enumerate_added_handles());
}

TEST_F(Session, DebugSink)
{
    handle                   h;
    std::vector<std::string> lines;

    multi__.set_cb_debug([&lines](std::string_view line) { lines.emplace_back(line); });

    ASSERT_EQ(handle::HDL_OK, h.configure(server__.url("/")));
    ASSERT_EQ(handle::HDL_OK, h.buffer());
    ASSERT_EQ(mhandle::MHDL_OK, multi__.do_handle(h));

    const auto prefix{ std::to_string(h.id()) + ": " };
    bool       added{ false };
    bool       finished{ false };
    for (const auto& l : lines)
    {
        if (0 == l.rfind(prefix + "Added GET", 0)) added = true;
        if (0 == l.rfind(prefix + "Done", 0)) finished = true;
    }
    EXPECT_TRUE(added);
    EXPECT_TRUE(finished);
}
