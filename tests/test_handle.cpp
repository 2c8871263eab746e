/**
 * Copyright (C) 2023 Osmozis SA - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

#include "test_server.hpp"

#include <muxcurl/handle.hpp>

#include <curl/curl.h>

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace muxcurl;
using muxcurl::test::http_server;

namespace
{
bool
contains(const std::string& haystack, std::string_view needle)
{
    return std::string::npos != haystack.find(needle);
}

http_server::options
auth_options(std::string password = "pass")
{
    http_server::options opts;
    opts.require_proxy_auth = true;
    opts.password           = std::move(password);
    return opts;
}
} // namespace

/*********************************************************************************************************************/
// CONFIGURATION

TEST(Handle, ConfigureRejectsBadParameters)
{
    handle h;

    EXPECT_EQ(handle::HDL_BAD_PARAM, h.configure(""));
    EXPECT_EQ(handle::HDL_BAD_PARAM, h.configure("http://127.0.0.1/", "FETCH"));
    EXPECT_EQ(handle::HDL_BAD_PARAM, h.configure("http://127.0.0.1/", "GET", "HTTP/4"));
    EXPECT_EQ(handle::HDL_BAD_PARAM, h.configure("http://127.0.0.1/", "GET", "HTTP/1.1", -1));
    EXPECT_EQ(handle::HDL_IDLE, h.state());

    EXPECT_EQ(handle::HDL_OK, h.configure("http://127.0.0.1/", "GET", "HTTP/2"));
    EXPECT_EQ(handle::HDL_CONFIGURED, h.state());
}

TEST(Handle, ConnectTargetGetsScheme)
{
    handle h;

    ASSERT_EQ(handle::HDL_OK, h.configure("example.com:443", "CONNECT"));
    EXPECT_EQ("http://example.com:443", h.url());
    EXPECT_TRUE(h.is_tunnel());

    // The client authenticates itself: the proxy gets the raw CONNECT
    ASSERT_EQ(handle::HDL_OK, h.set_proxy("127.0.0.1", 3128));
    EXPECT_FALSE(h.is_tunnel());

    ASSERT_EQ(handle::HDL_OK, h.set_auth("user", "pass", "BASIC"));
    EXPECT_TRUE(h.is_tunnel());
}

TEST(Handle, ProxyParameters)
{
    handle h;

    ASSERT_EQ(handle::HDL_OK, h.configure("http://127.0.0.1/"));
    EXPECT_EQ(handle::HDL_BAD_PARAM, h.set_proxy(""));
    EXPECT_EQ(handle::HDL_BAD_PARAM, h.set_proxy("proxy", 65536));
    EXPECT_EQ(handle::HDL_BAD_PARAM, h.set_proxy("proxy", -1));
    EXPECT_EQ(handle::HDL_OK, h.set_proxy("proxy", 3128, "localhost,127.0.0.1"));

    EXPECT_EQ(handle::HDL_BAD_PARAM, h.set_auth("user", "pass", "KERBEROS"));
    EXPECT_EQ(handle::HDL_BAD_PARAM, h.set_auth("", "pass"));
    EXPECT_EQ(handle::HDL_OK, h.set_auth("user", "pass", "NONTLM"));
}

TEST(Handle, ContentLengthMustBeNumeric)
{
    handle h;

    ASSERT_EQ(handle::HDL_OK, h.configure("http://127.0.0.1/", "POST"));
    EXPECT_EQ(handle::HDL_BAD_PARAM, h.set_headers({ { "Content-Length", "12ab" } }));
    EXPECT_EQ(handle::HDL_BAD_PARAM, h.set_headers({ { "Content-Length", "-3" } }));
    EXPECT_EQ(handle::HDL_OK, h.set_headers({ { "Content-Length", " 8 " } }));
}

TEST(Handle, RejectedHeadersAreNotApplied)
{
    handle                   h;
    std::vector<std::string> lines;

    h.set_cb_debug([&lines](std::string_view line) { lines.emplace_back(line); });

    ASSERT_EQ(handle::HDL_OK, h.configure("http://127.0.0.1/", "PUT"));
    ASSERT_EQ(handle::HDL_OK, h.set_debug());
    EXPECT_EQ(handle::HDL_BAD_PARAM, h.set_headers({ { "X-First", "1" }, { "Content-Length", "bad" } }));
    for (const auto& l : lines)
        EXPECT_FALSE(contains(l, "X-First")) << l;

    // Removal only
    EXPECT_EQ(handle::HDL_OK, h.set_headers({ { "Content-Length", "" } }));
    EXPECT_EQ(handle::HDL_CONFIGURED, h.state());
}

TEST(Handle, ResultsNotReadyBeforeCompletion)
{
    handle        h;
    long          code{ 0 };
    std::string   out;
    bool          used{ false };
    unsigned long mech{ 0 };

    EXPECT_EQ(handle::HDL_NOT_READY, h.get_response(code));

    ASSERT_EQ(handle::HDL_OK, h.configure("http://127.0.0.1/"));
    ASSERT_EQ(handle::HDL_OK, h.buffer());
    EXPECT_EQ(handle::HDL_NOT_READY, h.get_response(code));
    EXPECT_EQ(handle::HDL_NOT_READY, h.get_headers(out));
    EXPECT_EQ(handle::HDL_NOT_READY, h.get_data(out));
    EXPECT_EQ(handle::HDL_NOT_READY, h.get_used_proxy(used));
    EXPECT_EQ(handle::HDL_NOT_READY, h.get_auth_used(mech));
}

TEST(Handle, NoActiveSocketOnFreshHandle)
{
    handle h;
    int    fd{ -1 };

    EXPECT_EQ(handle::HDL_NO_ACTIVE_SOCKET, h.get_activesocket(fd));
    EXPECT_EQ(-1, fd);
}

TEST(Handle, CloseIsFinal)
{
    handle h;

    ASSERT_EQ(handle::HDL_OK, h.configure("http://127.0.0.1/"));
    h.close();
    h.close();

    EXPECT_EQ(handle::HDL_CLOSED, h.state());
    EXPECT_EQ(nullptr, h.raw());
    EXPECT_EQ(handle::HDL_BAD_FUNCTION, h.configure("http://127.0.0.1/"));
    EXPECT_EQ(handle::HDL_BAD_FUNCTION, h.set_headers({ { "A", "1" } }));
    EXPECT_EQ(handle::HDL_BAD_FUNCTION, h.buffer());
    EXPECT_EQ(handle::HDL_BAD_FUNCTION, h.perform());
}

TEST(Handle, NullCacheIsRejected)
{
    EXPECT_THROW(handle{ std::shared_ptr<auth_cache>{} }, std::invalid_argument);
}

TEST(Handle, RetCode2Str)
{
    EXPECT_EQ("OK", handle::retCode2Str(handle::HDL_OK));
    EXPECT_EQ("Unknown error", handle::retCode2Str(static_cast<handle::HDL_RetCode>(1234)));
    EXPECT_FALSE(handle::engine_version().empty());
}

/*********************************************************************************************************************/
// BLOCKING TRANSFERS

TEST(Handle, BufferedGet)
{
    http_server server;
    handle      h;
    long        code{ 0 };
    std::string body;
    std::string headers;
    int         done{ -100 };

    h.set_cb_done([&done](int rc) { done = rc; });
    ASSERT_EQ(handle::HDL_OK, h.configure(server.url("/index")));
    ASSERT_EQ(handle::HDL_OK, h.buffer());
    ASSERT_EQ(handle::HDL_OK, h.perform());

    EXPECT_EQ(CURLE_OK, done);
    EXPECT_EQ(handle::HDL_COMPLETE_OK, h.state());
    EXPECT_EQ(handle::HDL_OK, h.get_response(code));
    EXPECT_EQ(200, code);
    EXPECT_EQ(handle::HDL_OK, h.get_data(body));
    EXPECT_EQ("hello /index", body);
    EXPECT_EQ(handle::HDL_OK, h.get_headers(headers));
    EXPECT_TRUE(contains(headers, "X-Method: GET"));

    // Same curl handle, new transfer
    ASSERT_EQ(handle::HDL_OK, h.configure(server.url("/echo"), "PUT"));
    ASSERT_EQ(handle::HDL_OK, h.buffer("payload"));
    ASSERT_EQ(handle::HDL_OK, h.perform());
    EXPECT_EQ(handle::HDL_OK, h.get_data(body));
    EXPECT_EQ("payload", body);
    EXPECT_EQ(handle::HDL_OK, h.get_headers(headers));
    EXPECT_TRUE(contains(headers, "X-Method: PUT"));
}

TEST(Handle, BufferedPatch)
{
    http_server server;
    handle      h;
    std::string body;
    std::string headers;

    ASSERT_EQ(handle::HDL_OK, h.configure(server.url("/echo"), "PATCH"));
    ASSERT_EQ(handle::HDL_OK, h.buffer("{\"a\":1}"));
    ASSERT_EQ(handle::HDL_OK, h.perform());
    EXPECT_EQ(handle::HDL_OK, h.get_data(body));
    EXPECT_EQ("{\"a\":1}", body);
    EXPECT_EQ(handle::HDL_OK, h.get_headers(headers));
    EXPECT_TRUE(contains(headers, "X-Method: PATCH"));
}

TEST(Handle, BridgedGetHasNoBuffer)
{
    http_server server;
    handle      h;
    std::string received;
    std::string headers;
    std::string out;

    ASSERT_EQ(handle::HDL_OK, h.configure(server.url("/stream")));
    ASSERT_EQ(handle::HDL_OK, h.bridge(
                                nullptr,
                                [&received](const char* buf, size_t sz) -> long {
                                    received.append(buf, sz);
                                    return static_cast<long>(sz);
                                },
                                [&headers](const char* buf, size_t sz) -> long {
                                    headers.append(buf, sz);
                                    return static_cast<long>(sz);
                                }));
    ASSERT_EQ(handle::HDL_OK, h.perform());

    EXPECT_EQ("hello /stream", received);
    EXPECT_TRUE(contains(headers, "HTTP/1.1 200 OK"));
    EXPECT_EQ(handle::HDL_BAD_MODE, h.get_data(out));
    EXPECT_EQ(handle::HDL_BAD_MODE, h.get_headers(out));
}

TEST(Handle, StalledWriterEndsPerform)
{
    http_server server;
    handle      h;
    std::string received;
    long        code{ 0 };

    ASSERT_EQ(handle::HDL_OK, h.configure(server.url("/"), "GET", "HTTP/1.1", 1));
    ASSERT_EQ(handle::HDL_OK, h.bridge(nullptr, [&received](const char* buf, size_t sz) -> long {
        if (!received.empty() || 0 == sz) return handle::STREAM_AGAIN;
        received.push_back(buf[0]);
        return 1;
    }));

    EXPECT_EQ(handle::HDL_ENGINE_ERROR, h.perform());
    EXPECT_EQ(handle::HDL_COMPLETE_ERROR, h.state());
    EXPECT_EQ(CURLE_WRITE_ERROR, h.result());
    EXPECT_EQ("h", received);
    EXPECT_EQ(handle::HDL_OK, h.get_response(code));
    EXPECT_EQ(503, code);
}

TEST(Handle, Encodings)
{
    http_server server;
    handle      h;
    std::string body;

    ASSERT_EQ(handle::HDL_OK, h.configure(server.url("/latin1")));
    ASSERT_EQ(handle::HDL_OK, h.buffer());
    ASSERT_EQ(handle::HDL_OK, h.perform());

    EXPECT_EQ(handle::HDL_BAD_ENCODING, h.get_data(body, ENC_UTF8));
    EXPECT_EQ(handle::HDL_BAD_ENCODING, h.get_data(body, ENC_ASCII));
    EXPECT_EQ(handle::HDL_OK, h.get_data(body, ENC_LATIN1));
    EXPECT_EQ("caf\xc3\xa9", body);
    EXPECT_EQ(handle::HDL_OK, h.get_data(body, ENC_RAW));
    EXPECT_EQ("caf\xe9", body);
}

TEST(Handle, ConnectionRefused)
{
    handle      h;
    long        code{ 0 };
    std::string body;

    ASSERT_EQ(handle::HDL_OK, h.configure("http://127.0.0.1:1/", "GET", "HTTP/1.1", 5));
    ASSERT_EQ(handle::HDL_OK, h.buffer());
    EXPECT_EQ(handle::HDL_ENGINE_ERROR, h.perform());

    EXPECT_EQ(handle::HDL_COMPLETE_ERROR, h.state());
    EXPECT_EQ(CURLE_COULDNT_CONNECT, h.result());
    EXPECT_EQ(handle::HDL_OK, h.get_response(code));
    EXPECT_EQ(502, code);
    EXPECT_TRUE(contains(h.errstr(), "Could not connect"));
    // Results stay readable
    EXPECT_EQ(handle::HDL_OK, h.get_data(body));
}

TEST(Handle, DebugSinkNeedsDebug)
{
    http_server              server;
    handle                   h;
    std::vector<std::string> lines;

    h.set_cb_debug([&lines](std::string_view line) { lines.emplace_back(line); });

    ASSERT_EQ(handle::HDL_OK, h.configure(server.url("/")));
    ASSERT_EQ(handle::HDL_OK, h.buffer());
    ASSERT_EQ(handle::HDL_OK, h.perform());
    EXPECT_TRUE(lines.empty());

    ASSERT_EQ(handle::HDL_OK, h.configure(server.url("/")));
    ASSERT_EQ(handle::HDL_OK, h.set_debug());
    ASSERT_EQ(handle::HDL_OK, h.set_headers({ { "X-Trace", "1" } }));
    ASSERT_EQ(handle::HDL_OK, h.buffer());
    ASSERT_EQ(handle::HDL_OK, h.perform());

    ASSERT_FALSE(lines.empty());
    const auto prefix{ std::to_string(h.id()) + ": " };
    for (const auto& l : lines)
        EXPECT_EQ(0u, l.rfind(prefix, 0)) << l;
}

/*********************************************************************************************************************/
// PROXY

TEST(Handle, ProxyAuthIsLearnt)
{
    http_server server{ auth_options() };
    auto        cache{ std::make_shared<auth_cache>() };
    std::string headers;
    std::string body;
    long        code{ 0 };

    {
        handle        h{ cache };
        unsigned long mech{ 0 };
        bool          used{ false };

        ASSERT_EQ(handle::HDL_OK, h.configure("http://origin.test/first"));
        ASSERT_EQ(handle::HDL_OK, h.set_proxy("127.0.0.1", server.port()));
        ASSERT_EQ(handle::HDL_OK, h.set_auth("user", "pass"));
        ASSERT_EQ(handle::HDL_OK, h.buffer());
        ASSERT_EQ(handle::HDL_OK, h.perform());

        EXPECT_EQ(handle::HDL_OK, h.get_response(code));
        EXPECT_EQ(200, code);
        EXPECT_EQ(handle::HDL_OK, h.get_data(body));
        EXPECT_EQ("hello /first", body);
        EXPECT_EQ(handle::HDL_OK, h.get_auth_used(mech));
        EXPECT_EQ(CURLAUTH_BASIC, mech);
        EXPECT_EQ(handle::HDL_OK, h.get_used_proxy(used));
        EXPECT_TRUE(used);

        // The challenge is answered by libcurl, not reported
        EXPECT_EQ(handle::HDL_OK, h.get_headers(headers));
        EXPECT_FALSE(contains(headers, "407"));
        EXPECT_TRUE(contains(headers, "200 OK"));
    }

    EXPECT_EQ(1, server.challenges());

    auto known{ cache->lookup({ "127.0.0.1", server.port(), "user" }) };
    EXPECT_EQ(auth_cache::AUTH_KNOWN, known.state);
    EXPECT_EQ(CURLAUTH_BASIC, known.mechanism);

    // The known mechanism is used right away
    handle h{ cache };
    ASSERT_EQ(handle::HDL_OK, h.configure("http://origin.test/second"));
    ASSERT_EQ(handle::HDL_OK, h.set_proxy("127.0.0.1", server.port()));
    ASSERT_EQ(handle::HDL_OK, h.set_auth("user", "pass"));
    ASSERT_EQ(handle::HDL_OK, h.buffer());
    ASSERT_EQ(handle::HDL_OK, h.perform());
    EXPECT_EQ(handle::HDL_OK, h.get_data(body));
    EXPECT_EQ("hello /second", body);

    EXPECT_EQ(1, server.challenges());
}

TEST(Handle, ProxyAuthRoundTripResendsBody)
{
    http_server server{ auth_options() };
    handle      h{ std::make_shared<auth_cache>() };
    std::string body;

    ASSERT_EQ(handle::HDL_OK, h.configure("http://origin.test/post", "POST"));
    ASSERT_EQ(handle::HDL_OK, h.set_proxy("127.0.0.1", server.port()));
    ASSERT_EQ(handle::HDL_OK, h.set_auth("user", "pass"));
    ASSERT_EQ(handle::HDL_OK, h.buffer("form=1"));
    ASSERT_EQ(handle::HDL_OK, h.perform());

    EXPECT_EQ(handle::HDL_OK, h.get_data(body));
    EXPECT_EQ("form=1", body);
}

TEST(Handle, ProxyAuthFailureIsRemembered)
{
    http_server server{ auth_options("secret") };
    auto        cache{ std::make_shared<auth_cache>() };
    long        code{ 0 };

    // Configured before the failure is known
    handle early{ cache };
    ASSERT_EQ(handle::HDL_OK, early.configure("http://origin.test/"));
    ASSERT_EQ(handle::HDL_OK, early.set_proxy("127.0.0.1", server.port()));

    handle h{ cache };
    ASSERT_EQ(handle::HDL_OK, h.configure("http://origin.test/"));
    ASSERT_EQ(handle::HDL_OK, h.set_proxy("127.0.0.1", server.port()));
    ASSERT_EQ(handle::HDL_OK, h.set_auth("user", "wrong"));
    ASSERT_EQ(handle::HDL_OK, h.buffer());
    EXPECT_EQ(handle::HDL_PROXY_AUTH_FAILED, h.perform());

    EXPECT_EQ(handle::HDL_COMPLETE_ERROR, h.state());
    EXPECT_EQ(handle::HDL_OK, h.get_response(code));
    EXPECT_EQ(401, code);
    EXPECT_TRUE(contains(h.errstr(), "Proxy authentication failed"));
    EXPECT_EQ(auth_cache::AUTH_FAILED, cache->lookup({ "127.0.0.1", server.port(), "user" }).state);

    EXPECT_EQ(auth_cache::AUTH_FAILED, cache->lookup({ "127.0.0.1", server.port(), "" }).state);

    // Fast fail: nothing is sent
    const auto requests{ server.requests() };
    handle     other{ cache };
    ASSERT_EQ(handle::HDL_OK, other.configure("http://origin.test/"));
    EXPECT_EQ(handle::HDL_PROXY_AUTH_FAILED, other.set_proxy("127.0.0.1", server.port()));
    EXPECT_EQ(handle::HDL_CONFIGURED, other.state());

    // The credentials that failed are still refused by a handle already using the proxy
    EXPECT_EQ(handle::HDL_PROXY_AUTH_FAILED, early.set_auth("user", "secret"));
    EXPECT_EQ(handle::HDL_OK, early.set_auth("admin", "secret"));
    EXPECT_EQ(requests, server.requests());

    // Another proxy is not concerned
    EXPECT_EQ(handle::HDL_OK, other.set_proxy("127.0.0.2", server.port()));

    cache->clear();
    handle again{ cache };
    ASSERT_EQ(handle::HDL_OK, again.configure("http://origin.test/"));
    EXPECT_EQ(handle::HDL_OK, again.set_proxy("127.0.0.1", server.port()));
}

TEST(Handle, DebugSinkHidesCredentials)
{
    http_server              server{ auth_options() };
    handle                   h{ std::make_shared<auth_cache>() };
    std::vector<std::string> lines;

    h.set_cb_debug([&lines](std::string_view line) { lines.emplace_back(line); });

    ASSERT_EQ(handle::HDL_OK, h.configure("http://origin.test/"));
    ASSERT_EQ(handle::HDL_OK, h.set_debug());
    ASSERT_EQ(handle::HDL_OK, h.set_proxy("127.0.0.1", server.port()));
    ASSERT_EQ(handle::HDL_OK, h.set_auth("alice", "pw"));
    ASSERT_EQ(handle::HDL_OK, h.set_headers({ { "Authorization", "Bearer t0ken" } }));

    bool found{ false };
    for (const auto& l : lines)
    {
        EXPECT_FALSE(contains(l, "alice")) << l;
        EXPECT_FALSE(contains(l, "t0ken")) << l;
        if (contains(l, "Proxy auth using ANY sanitized len(")) found = true;
    }
    EXPECT_TRUE(found);
}

TEST(Handle, ProxyWithoutCredentialsGets407)
{
    http_server server{ auth_options() };
    handle      h{ std::make_shared<auth_cache>() };
    long        code{ 0 };
    std::string headers;

    ASSERT_EQ(handle::HDL_OK, h.configure("http://origin.test/"));
    ASSERT_EQ(handle::HDL_OK, h.set_proxy("127.0.0.1", server.port()));
    ASSERT_EQ(handle::HDL_OK, h.buffer());
    ASSERT_EQ(handle::HDL_OK, h.perform());

    // Relayed as is to whoever has the credentials
    EXPECT_EQ(handle::HDL_OK, h.get_response(code));
    EXPECT_EQ(407, code);
    EXPECT_EQ(handle::HDL_OK, h.get_headers(headers));
    EXPECT_TRUE(contains(headers, "Proxy-Authenticate: Basic"));
}

TEST(Handle, VerboseTraceIsSanitized)
{
    http_server              server{ auth_options() };
    handle                   h{ std::make_shared<auth_cache>() };
    std::vector<std::string> lines;

    h.set_cb_debug([&lines](std::string_view line) { lines.emplace_back(line); });

    ASSERT_EQ(handle::HDL_OK, h.configure("http://origin.test/"));
    ASSERT_EQ(handle::HDL_OK, h.set_verbose());
    ASSERT_EQ(handle::HDL_OK, h.set_proxy("127.0.0.1", server.port()));
    ASSERT_EQ(handle::HDL_OK, h.set_auth("user", "pass", "BASIC"));
    ASSERT_EQ(handle::HDL_OK, h.set_headers({ { "Authorization", "Bearer abcdef" } }));
    ASSERT_EQ(handle::HDL_OK, h.buffer());
    ASSERT_EQ(handle::HDL_OK, h.perform());

    const auto secret{ muxcurl::test::base64("user:pass") };
    bool       found{ false };
    for (const auto& l : lines)
    {
        EXPECT_FALSE(contains(l, secret)) << l;
        EXPECT_FALSE(contains(l, "abcdef")) << l;
        if (contains(l, "Proxy-Authorization: Basic sanitized len(")) found = true;
    }
    EXPECT_TRUE(found);
}

TEST(Handle, ProxyHeadersDroppedWhenAuthenticating)
{
    http_server              server{ auth_options() };
    handle                   h{ std::make_shared<auth_cache>() };
    std::vector<std::string> lines;

    h.set_cb_debug([&lines](std::string_view line) { lines.emplace_back(line); });

    ASSERT_EQ(handle::HDL_OK, h.configure("http://origin.test/"));
    ASSERT_EQ(handle::HDL_OK, h.set_debug());
    ASSERT_EQ(handle::HDL_OK, h.set_proxy("127.0.0.1", server.port()));
    ASSERT_EQ(handle::HDL_OK, h.set_auth("user", "pass", "BASIC"));
    // The client's own credentials for the proxy are not forwarded
    ASSERT_EQ(handle::HDL_OK, h.set_headers({ { "Proxy-Authorization", "Basic " + muxcurl::test::base64("x:y") } }));
    ASSERT_EQ(handle::HDL_OK, h.buffer());
    ASSERT_EQ(handle::HDL_OK, h.perform());

    EXPECT_EQ(0, server.challenges());

    bool skipped{ false };
    for (const auto& l : lines)
        if (contains(l, "Skipping header => Proxy-Authorization: Basic sanitized")) skipped = true;
    EXPECT_TRUE(skipped);
}

TEST(Handle, NoProxyBypassesProxy)
{
    http_server server;
    handle      h;
    bool        used{ true };
    std::string body;

    ASSERT_EQ(handle::HDL_OK, h.configure(server.url("/direct")));
    // Nothing listens there
    ASSERT_EQ(handle::HDL_OK, h.set_proxy("127.0.0.1", 1, "localhost,127.0.0.1"));
    ASSERT_EQ(handle::HDL_OK, h.buffer());
    ASSERT_EQ(handle::HDL_OK, h.perform());

    EXPECT_EQ(handle::HDL_OK, h.get_used_proxy(used));
    EXPECT_FALSE(used);
    EXPECT_EQ(handle::HDL_OK, h.get_data(body));
    EXPECT_EQ("hello /direct", body);
}

TEST(Handle, ConnectThroughTunnel)
{
    http_server            proxy;
    muxcurl::test::echo_server target;
    handle                 h;
    int                    fd{ -1 };
    long                   code{ 0 };

    // The test server answers 200 to anything, CONNECT included
    ASSERT_EQ(handle::HDL_OK, h.configure("127.0.0.1:" + std::to_string(target.port()), "CONNECT"));
    ASSERT_EQ(handle::HDL_OK, h.set_proxy("127.0.0.1", proxy.port()));
    ASSERT_EQ(handle::HDL_OK, h.set_tunnel(true));
    ASSERT_EQ(handle::HDL_OK, h.perform());

    EXPECT_EQ(handle::HDL_OK, h.get_response(code));
    EXPECT_EQ(200, code);
    EXPECT_EQ(handle::HDL_OK, h.get_activesocket(fd));
    EXPECT_GE(fd, 0);
}
