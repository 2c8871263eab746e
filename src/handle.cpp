/**
 * Copyright (C) 2023 Osmozis SA - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

#include <muxcurl/handle.hpp>
#include <muxcurl/mhandle.hpp>
#include <curl/curl.h>

#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstring>
#include <map>
#include <new>
#include <stdexcept>
#include <thread>

namespace muxcurl
{
typedef size_t (*CURL_WRITEFUNCTION_PTR)(char*, size_t, size_t, void*);
typedef size_t (*CURL_READFUNCTION_PTR)(char*, size_t, size_t, void*);
typedef int (*CURL_SEEKFUNCTION_PTR)(void*, curl_off_t, int);
typedef int (*CURL_PROGRESSFUNCTION_PTR)(void*, curl_off_t, curl_off_t, curl_off_t, curl_off_t);
typedef size_t (*CURL_BUFFERFUNCTION_PTR)(char*, size_t, size_t, void*);
typedef int (*CURL_DEBUGFUNCTION_PTR)(CURL*, curl_infotype, char*, size_t, void*);

static_assert(CURL_ERROR_SIZE <= 256, "error buffer too small");

namespace
{
constexpr std::string_view _methods[]{ "GET", "HEAD", "POST", "PUT", "PATCH", "DELETE", "OPTIONS", "TRACE", "CONNECT" };

bool
_http_version(std::string_view version, long& val) noexcept
{
    static const std::map<std::string_view, long> _versions{
        { "HTTP/1.0", CURL_HTTP_VERSION_1_0 }, { "HTTP/1.1", CURL_HTTP_VERSION_1_1 },
        { "HTTP/2", CURL_HTTP_VERSION_2_0 },   { "HTTP/2.0", CURL_HTTP_VERSION_2_0 },
        { "HTTP/3", CURL_HTTP_VERSION_3 },     { "HTTP/3.0", CURL_HTTP_VERSION_3 },
    };

    auto it{ _versions.find(version) };
    if (std::end(_versions) == it) return false;
    val = it->second;
    return true;
}

bool
_istarts_with(std::string_view str, std::string_view prefix) noexcept
{
    return std::size(str) >= std::size(prefix) && iequals(str.substr(0, std::size(prefix)), prefix);
}

std::string_view
_trim(std::string_view str) noexcept
{
    while (!str.empty() && (' ' == str.front() || '\t' == str.front()))
        str.remove_prefix(1);
    while (!str.empty() && (' ' == str.back() || '\t' == str.back() || '\r' == str.back() || '\n' == str.back()))
        str.remove_suffix(1);
    return str;
}

// Host of an URL, as parsed by libcurl
[[maybe_unused]] std::string
_url_host(const std::string& url)
{
    std::string ret;
    CURLU*      u{ curl_url() };

    if (nullptr == u) return ret;
    if (CURLUE_OK == curl_url_set(u, CURLUPART_URL, url.c_str(), CURLU_GUESS_SCHEME))
    {
        char* host{ nullptr };
        if (CURLUE_OK == curl_url_get(u, CURLUPART_HOST, &host, 0) && nullptr != host)
        {
            ret = host;
            curl_free(host);
        }
    }
    curl_url_cleanup(u);
    return ret;
}

// Same matching rules as libcurl's CURLOPT_NOPROXY
[[maybe_unused]] bool
_no_proxy_match(std::string_view no_proxy, std::string_view host) noexcept
{
    if ("*" == _trim(no_proxy)) return true;

    while (!no_proxy.empty())
    {
        auto pos{ no_proxy.find(',') };
        auto tok{ _trim(no_proxy.substr(0, pos)) };
        no_proxy = (std::string_view::npos == pos) ? std::string_view{} : no_proxy.substr(pos + 1);

        if (!tok.empty() && '.' == tok.front()) tok.remove_prefix(1);
        if (tok.empty()) continue;

        if (iequals(host, tok)) return true;
        if (std::size(host) > std::size(tok) && '.' == host[std::size(host) - std::size(tok) - 1] &&
            iequals(host.substr(std::size(host) - std::size(tok)), tok))
            return true;
    }
    return false;
}
} // namespace

//---------------------------------------------------------------------------------------------------------------------
// CONSTRUCTORS/DESTRUCTOR
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief default constructor
 * The transfer shares the process-wide authentication cache (\see auth_cache::shared)
 */
handle::handle()
  : handle(auth_cache::shared())
{}

/**
 * @brief constructor
 * @param cache The authentication cache shared with the other transfers
 */
handle::handle(std::shared_ptr<auth_cache> cache)
  : curl_handle__{ curl_easy_init() }
  , cache__{ std::move(cache) }
{
    if (nullptr == curl_handle__) throw std::runtime_error("Unable to create a session handle");
    if (!cache__) throw std::invalid_argument("A transfer needs an authentication cache");

    install_callbacks();
}

/**
 * @brief destructor
 * Performs RAII cleaning (\see handle::close)
 */
handle::~handle() noexcept
{
    close();
}

/**
 * @brief raw get the raw curl easy-handle (CURL::handle)
 * @warning You should not be using this, unless you absolutely need to use curl features that are not provided by
 * the \a muxcurl library.
 * @return then raw handle
 */
void*
handle::raw(void) noexcept
{
    return curl_handle__;
}

void
handle::install_callbacks() noexcept
{
    // See https://curl.se/libcurl/c/CURLOPT_WRITEFUNCTION.html
    constexpr auto _write{ [](char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t {
        auto This{ static_cast<handle*>(userdata) };
        return (nullptr == This) ? 0 : This->on_write(ptr, size * nmemb);
    } };
    // See https://curl.se/libcurl/c/CURLOPT_READFUNCTION.html
    constexpr auto _read{ [](char* buffer, size_t size, size_t nitems, void* userdata) -> size_t {
        auto This{ static_cast<handle*>(userdata) };
        return (nullptr == This) ? CURL_READFUNC_ABORT : This->on_read(buffer, size * nitems);
    } };
    // See https://curl.se/libcurl/c/CURLOPT_SEEKFUNCTION.html
    constexpr auto _seek{ [](void* userdata, curl_off_t offset, int origin) -> int {
        auto This{ static_cast<handle*>(userdata) };
        return (nullptr == This) ? CURL_SEEKFUNC_FAIL : This->on_seek(offset, origin);
    } };
    // See https://curl.se/libcurl/c/CURLOPT_HEADERFUNCTION.html
    constexpr auto _header{ [](char* buffer, size_t size, size_t nitems, void* userdata) -> size_t {
        auto This{ static_cast<handle*>(userdata) };
        return (nullptr == This) ? 0 : This->on_header(buffer, size * nitems);
    } };
    // See https://curl.se/libcurl/c/CURLOPT_DEBUGFUNCTION.html
    constexpr auto _debug{ [](CURL*, curl_infotype type, char* data, size_t size, void* clientp) -> int {
        auto This{ static_cast<handle*>(clientp) };
        if (nullptr != This) This->on_debug(type, data, size);
        return 0;
    } };

    auto curl{ static_cast<CURL*>(curl_handle__) };

    set_opt_ptr(CURLOPT_PRIVATE, this);
    set_opt_bool(CURLOPT_NOSIGNAL, true); // multi-threaded applications
    set_opt_ptr(CURLOPT_ERRORBUFFER, errbuf__);

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, static_cast<CURL_WRITEFUNCTION_PTR>(_write));
    set_opt_ptr(CURLOPT_WRITEDATA, this);
    curl_easy_setopt(curl, CURLOPT_READFUNCTION, static_cast<CURL_READFUNCTION_PTR>(_read));
    set_opt_ptr(CURLOPT_READDATA, this);
    curl_easy_setopt(curl, CURLOPT_SEEKFUNCTION, static_cast<CURL_SEEKFUNCTION_PTR>(_seek));
    set_opt_ptr(CURLOPT_SEEKDATA, this);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, static_cast<CURL_BUFFERFUNCTION_PTR>(_header));
    set_opt_ptr(CURLOPT_HEADERDATA, this);
    curl_easy_setopt(curl, CURLOPT_DEBUGFUNCTION, static_cast<CURL_DEBUGFUNCTION_PTR>(_debug));
    set_opt_ptr(CURLOPT_DEBUGDATA, this);

    // Needed by the debug callback, which finds out the proxy authentication mechanism in use
    set_opt_bool(CURLOPT_VERBOSE, true);

    if (cb_progress__) set_cb_progress(cb_progress__);
}

//---------------------------------------------------------------------------------------------------------------------
// UN/PAUSE TRANSFER
// \see https://curl.se/libcurl/c/curl_easy_pause.html
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief pause - Pause the transfer in one or both directions
 *
 * @param bitmask CURL pause mask (CURLPAUSE_RECV, CURLPAUSE_SEND, CURLPAUSE_ALL, CURLPAUSE_CONT)
 * @return true if the command was successfull, false otherwise
 */
bool
handle::pause(int bitmask) noexcept
{
    const auto prev{ flags__ };
    flags__ |= (bitmask & CURLPAUSE_ALL);
    return (flags__ == prev) ||
           (CURLE_OK == curl_easy_pause(static_cast<CURL*>(curl_handle__), flags__ & CURLPAUSE_ALL));
}

/**
 * @brief is_paused - Test if the transfer is paused in one or both directions
 *
 * @param bitmask CURL pause mask (CURLPAUSE_RECV, CURLPAUSE_SEND, CURLPAUSE_ALL, CURLPAUSE_CONT)
 * @return true if the transfer is paused in the required direction(s), false otherwise
 */
bool
handle::is_paused(int bitmask) const noexcept
{
    return (0 != (flags__ & bitmask));
}

/**
 * @brief unpause - Unpause the transfer in one or both directions
 *
 * @param bitmask CURL pause mask (CURLPAUSE_RECV, CURLPAUSE_SEND, CURLPAUSE_ALL, CURLPAUSE_CONT)
 * @return true if the command was successfull, false otherwise
 *
 * @note libcurl may call the transfer callbacks (and pause it again) before this returns
 */
bool
handle::unpause(int bitmask) noexcept
{
    const auto old{ flags__ };
    flags__ &= ~(bitmask & CURLPAUSE_ALL);
    return (flags__ == old) ||
           (CURLE_OK == curl_easy_pause(static_cast<CURL*>(curl_handle__), flags__ & CURLPAUSE_ALL));
}

/**
 * @brief resume - Retry the directions paused because a stream endpoint was not ready
 * @return true if a direction was unpaused
 */
bool
handle::resume() noexcept
{
    bool ret{ false };

    if (HDL_IN_PROGRESS != state__) return ret;

    if (draining__)
    {
        auto io{ std::get_if<bridged_io>(&io__) };
        long hret{ 0 };
        long bret{ 0 };

        if (nullptr != io)
        {
            hret = flush(io->pending_header, io->header_writer);
            if (0 == hret) bret = flush(io->pending_body, io->writer);
        }
        if (STREAM_AGAIN == hret || STREAM_AGAIN == bret) return ret;
        if (STREAM_ERROR == hret || STREAM_ERROR == bret) log("", "Response sink failed while draining");

        flags__ = 0;
        return true;
    }

    if (is_paused(CURLPAUSE_RECV))
    {
        auto io{ std::get_if<bridged_io>(&io__) };
        bool drained{ true };

        if (nullptr != io)
        {
            drained = (0 == flush(io->pending_header, io->header_writer)) && (0 == flush(io->pending_body, io->writer));
        }
        if (drained) ret = unpause(CURLPAUSE_RECV);
    }

    if (is_paused(CURLPAUSE_SEND)) ret = unpause(CURLPAUSE_SEND) || ret;

    return ret;
}

//---------------------------------------------------------------------------------------------------------------------
// OPTIONS
// \see https://curl.se/libcurl/c/curl_easy_setopt.html
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief get_info_long - Get an information element of type long
 * @param id The information's id to get
 * @param val The variable to stock the result to
 * @return A return code described by the \a HDL_RetCode enumerate
 *
 * @see https://curl.se/libcurl/c/curl_easy_getinfo.html
 */
handle::HDL_RetCode
handle::get_info_long(int id, long& val) const noexcept
{
    if (CURLINFO_LONG != (id & CURLINFO_TYPEMASK)) return HDL_BAD_PARAM;
    return (CURLE_OK == curl_easy_getinfo(static_cast<CURL*>(curl_handle__), static_cast<CURLINFO>(id), &val))
             ? HDL_OK
             : HDL_INTERNAL_ERROR;
}

/**
 * @brief get_info_socket - Get an information element of type socket
 * @param id The information's id to get
 * @param val The variable to stock the result to
 * @return A return code described by the \a HDL_RetCode enumerate
 */
handle::HDL_RetCode
handle::get_info_socket(int id, int& val) const noexcept
{
    curl_socket_t sock{ CURL_SOCKET_BAD };

    if (CURLINFO_SOCKET != (id & CURLINFO_TYPEMASK)) return HDL_BAD_PARAM;
    if (CURLE_OK != curl_easy_getinfo(static_cast<CURL*>(curl_handle__), static_cast<CURLINFO>(id), &sock))
        return HDL_INTERNAL_ERROR;

    val = static_cast<int>(sock);
    return HDL_OK;
}

/**
 * @brief get_info_double - Get an information element of type double
 * @param id The information's id to get
 * @param val The variable to stock the result to
 * @return A return code described by the \a HDL_RetCode enumerate
 */
handle::HDL_RetCode
handle::get_info_double(int id, double& val) const noexcept
{
    if (CURLINFO_DOUBLE != (id & CURLINFO_TYPEMASK)) return HDL_BAD_PARAM;
    return (CURLE_OK == curl_easy_getinfo(static_cast<CURL*>(curl_handle__), static_cast<CURLINFO>(id), &val))
             ? HDL_OK
             : HDL_INTERNAL_ERROR;
}

/**
 * @brief get_info_string - Get an information element of type string
 * @param id The information's id to get
 * @param val The variable to stock the result to (left empty if libcurl has nothing)
 * @return A return code described by the \a HDL_RetCode enumerate
 */
handle::HDL_RetCode
handle::get_info_string(int id, std::string& val) const noexcept
{
    char* str{ nullptr };

    if (CURLINFO_STRING != (id & CURLINFO_TYPEMASK)) return HDL_BAD_PARAM;
    if (CURLE_OK != curl_easy_getinfo(static_cast<CURL*>(curl_handle__), static_cast<CURLINFO>(id), &str))
        return HDL_INTERNAL_ERROR;

    try
    {
        val = (nullptr == str) ? std::string{} : std::string{ str };
    }
    catch (const std::bad_alloc&)
    {
        return HDL_OUT_OF_MEM;
    }
    return HDL_OK;
}

/**
 * @brief Set an option of type long
 * @param id The option's id to set
 * @param val The value to set
 * @return A return code described by the \a HDL_RetCode enumerate
 */
handle::HDL_RetCode
handle::set_opt_long(int id, long val) noexcept
{
    if (CURLOPTTYPE_LONG != (id / 10000) * 10000) return HDL_BAD_PARAM;
    return CURLE_OK == curl_easy_setopt(static_cast<CURL*>(curl_handle__), static_cast<CURLoption>(id), val)
             ? HDL_OK
             : HDL_INTERNAL_ERROR;
}

/**
 * @brief Set an option of type offset
 * @param id The option's id to set
 * @param val The value to set
 * @return A return code described by the \a HDL_RetCode enumerate
 */
handle::HDL_RetCode
handle::set_opt_offset(int id, int64_t val) noexcept
{
    if (CURLOPTTYPE_OFF_T != (id / 10000) * 10000) return HDL_BAD_PARAM;
    return CURLE_OK == curl_easy_setopt(static_cast<CURL*>(curl_handle__), static_cast<CURLoption>(id),
                                        static_cast<curl_off_t>(val))
             ? HDL_OK
             : HDL_INTERNAL_ERROR;
}

/**
 * @brief Set an option of type ptr
 * @param id The option's id to set
 * @param val The value to set
 * @return A return code described by the \a HDL_RetCode enumerate
 */
handle::HDL_RetCode
handle::set_opt_ptr(int id, const void* val) noexcept
{
    if (CURLOPTTYPE_OBJECTPOINT != (id / 10000) * 10000) return HDL_BAD_PARAM;
    return CURLE_OK == curl_easy_setopt(static_cast<CURL*>(curl_handle__), static_cast<CURLoption>(id), val)
             ? HDL_OK
             : HDL_INTERNAL_ERROR;
}

/**
 * @brief Set an option of type string
 * @param id The option's id to set
 * @param val The value to set
 * @return A return code described by the \a HDL_RetCode enumerate
 */
handle::HDL_RetCode
handle::set_opt_string(int id, const char* val) noexcept
{
    if (CURLOPTTYPE_STRINGPOINT != (id / 10000) * 10000) return HDL_BAD_PARAM;
    if (nullptr == val) return HDL_BAD_PARAM;

    strings__[id] = val;
    return CURLE_OK == curl_easy_setopt(static_cast<CURL*>(curl_handle__), static_cast<CURLoption>(id),
                                        strings__[id].c_str())
             ? HDL_OK
             : HDL_INTERNAL_ERROR;
}

/**
 * @brief Set an option of type bool
 * @param id The option's id to set
 * @param val The value to set
 * @return A return code described by the \a HDL_RetCode enumerate
 */
handle::HDL_RetCode
handle::set_opt_bool(int id, bool val) noexcept
{
    return set_opt_long(id, static_cast<long>(val ? 1 : 0));
}

/**
 * @brief Set an option of type list
 * The handle keeps its own copy of the list for as long as libcurl may use it.
 * @param id The option's id to set
 * @param val The value to set
 * @return A return code described by the \a HDL_RetCode enumerate
 */
handle::HDL_RetCode
handle::set_opt_list(int id, const header_list& val) noexcept
{
    if (CURLOPTTYPE_SLISTPOINT != (id / 10000) * 10000) return HDL_BAD_PARAM;

    curl_slist* raw{ nullptr };
    try
    {
        lists__[id] = val;
        raw         = lists__[id].build();
    }
    catch (const std::bad_alloc&)
    {
        lists__.erase(id);
        return HDL_OUT_OF_MEM;
    }

    if (CURLE_OK != curl_easy_setopt(static_cast<CURL*>(curl_handle__), static_cast<CURLoption>(id), raw))
    {
        lists__.erase(id);
        return HDL_INTERNAL_ERROR;
    }
    return HDL_OK;
}

/**
 * @brief get_info - retrieve an information from the handle
 * @param id the identifier of the info to get (\see CURL::CURLINFO_ enumerate)
 * @return A structure containing the retcode of the operation aswell as the required value
 *
 * @see https://curl.se/libcurl/c/curl_easy_getinfo.html
 */
handle::handle_ret
handle::get_info(int id) noexcept
{
    handle_ret ret{ HDL_BAD_PARAM, {} };

    if (nullptr == curl_handle__) return { HDL_BAD_FUNCTION, {} };

    switch (id & CURLINFO_TYPEMASK)
    {
        case CURLINFO_DOUBLE: {
            double val;
            if (ret.ret = get_info_double(id, val); HDL_OK == ret.ret) ret.value = val;
        }
        break;
        case CURLINFO_LONG: {
            long val;
            if (ret.ret = get_info_long(id, val); HDL_OK == ret.ret) ret.value = val;
        }
        break;
        case CURLINFO_STRING: {
            std::string val;
            if (ret.ret = get_info_string(id, val); HDL_OK == ret.ret) ret.value = val;
        }
        break;
        case CURLINFO_SOCKET: {
            int val;
            if (ret.ret = get_info_socket(id, val); HDL_OK == ret.ret) ret.value = val;
        }
        break;
        default: break;
    }

    return ret;
}

/**
 * @brief set_opt - Set an option modifying the behaviour of the handle
 * @param id The identifier of the option to set
 * @param val The value to set the option to
 * @return A return code described by the \a HDL_RetCode enumerate
 *
 * @see https://curl.se/libcurl/c/curl_easy_setopt.html
 */
handle::HDL_RetCode
handle::set_opt(int id, std::any val) noexcept
{
    HDL_RetCode ret{ HDL_BAD_PARAM };
    const auto  curType{ (id / 10000) * 10000 };

    if (nullptr == curl_handle__ || HDL_IN_PROGRESS == state__) return HDL_BAD_FUNCTION;
    if (!val.has_value()) return ret;

    // libcurl shares the same type number for lists, strings and pointers
    if (typeid(header_list) == val.type() && (CURLOPTTYPE_SLISTPOINT == curType))
    {
        ret = set_opt_list(id, std::any_cast<const header_list&>(val));
    }
    else if (typeid(long) == val.type() && (CURLOPTTYPE_LONG == curType))
    {
        ret = set_opt_long(id, std::any_cast<long>(val));
    }
    else if (typeid(long) == val.type() && (CURLOPTTYPE_OFF_T == curType))
    {
        ret = set_opt_offset(id, std::any_cast<long>(val));
    }
    else if (typeid(int64_t) == val.type() && (CURLOPTTYPE_OFF_T == curType))
    {
        ret = set_opt_offset(id, std::any_cast<int64_t>(val));
    }
    else if (typeid(std::string) == val.type() && (CURLOPTTYPE_STRINGPOINT == curType))
    {
        ret = set_opt_string(id, std::any_cast<const std::string&>(val).c_str());
    }
    else if (typeid(bool) == val.type() && (CURLOPTTYPE_LONG == curType))
    {
        ret = set_opt_bool(id, std::any_cast<bool>(val));
    }
    else if (typeid(void*) == val.type() && (CURLOPTTYPE_OBJECTPOINT == curType))
    {
        ret = set_opt_ptr(id, std::any_cast<void*>(val));
    }

    if (HDL_OK == ret && HDL_IDLE == state__) state__ = HDL_CONFIGURED;
    return ret;
}

//---------------------------------------------------------------------------------------------------------------------
// CONFIGURATION
//---------------------------------------------------------------------------------------------------------------------

// Configuration calls are refused while the transfer runs and once it is closed
handle::HDL_RetCode
handle::editable(void) noexcept
{
    if (nullptr == curl_handle__ || HDL_CLOSED == state__ || HDL_IN_PROGRESS == state__) return HDL_BAD_FUNCTION;
    if (HDL_IDLE == state__) state__ = HDL_CONFIGURED;
    return HDL_OK;
}

bool
handle::is_upload(void) const noexcept
{
    return "POST" == method__ || "PUT" == method__ || "PATCH" == method__;
}

// Response bytes accepted from libcurl that the streams did not take yet
bool
handle::has_pending(void) const noexcept
{
    auto io{ std::get_if<bridged_io>(&io__) };
    return (nullptr != io) && (!io->pending_header.empty() || !io->pending_body.empty());
}

// A CONNECT without tunnel keeps its headers for the relay
handle::HDL_RetCode
handle::apply_headers(void) noexcept
{
    if ("CONNECT" == method__ && !tunnel__) return HDL_OK;
    if (headers__.empty()) return HDL_OK;
    return set_opt_list(CURLOPT_HTTPHEADER, headers__);
}

handle::HDL_RetCode
handle::set_upload_size(long size) noexcept
{
    upload_size__ = size;
    upload_left__ = size;
    return ("PUT" == method__) ? set_opt_offset(CURLOPT_INFILESIZE_LARGE, size)
                               : set_opt_offset(CURLOPT_POSTFIELDSIZE_LARGE, size);
}

/**
 * @brief configure - Prepare the handle for a new transfer
 *
 * Every previous option is dropped (the underlying connections are kept).
 * Environment proxies are ignored: only handle::set_proxy() configures a proxy.
 * @param url The target (for CONNECT, "host:port")
 * @param method The HTTP method (GET, HEAD, POST, PUT, PATCH, DELETE, OPTIONS, TRACE or CONNECT)
 * @param version The HTTP version (HTTP/1.0, HTTP/1.1, HTTP/2 or HTTP/3)
 * @param connect_timeout Connection timeout in seconds
 * @return A return code described by the \a HDL_RetCode enumerate
 */
handle::HDL_RetCode
handle::configure(std::string_view url, std::string_view method, std::string_view version,
                  long connect_timeout) noexcept
{
    long ver{ CURL_HTTP_VERSION_1_1 };

    if (nullptr == curl_handle__ || HDL_CLOSED == state__) return HDL_BAD_FUNCTION;
    if (url.empty() || connect_timeout < 0) return HDL_BAD_PARAM;
    if (!_http_version(version, ver)) return HDL_BAD_PARAM;
    if (std::end(_methods) == std::find(std::begin(_methods), std::end(_methods), method)) return HDL_BAD_PARAM;

    reset();

    method__          = method;
    url__             = url;
    version__         = version;
    connect_timeout__ = connect_timeout;

    set_opt_string(CURLOPT_PROXY, "");
    set_opt_long(CURLOPT_CONNECTTIMEOUT, connect_timeout);

    if ("CONNECT" == method__)
    {
        set_opt_bool(CURLOPT_CONNECT_ONLY, true);
        if (std::string::npos == url__.find("://")) url__.insert(0, "http://");
        set_tunnel(true);
    }
    else if ("GET" == method__)
        set_opt_bool(CURLOPT_HTTPGET, true);
    else if ("HEAD" == method__)
        set_opt_bool(CURLOPT_NOBODY, true);
    else if ("POST" == method__)
        set_opt_bool(CURLOPT_POST, true);
    else if ("PUT" == method__)
        set_opt_bool(CURLOPT_UPLOAD, true);
    else if ("PATCH" == method__)
    {
        set_opt_bool(CURLOPT_POST, true);
        set_opt_string(CURLOPT_CUSTOMREQUEST, method__.c_str());
    }
    else
        set_opt_string(CURLOPT_CUSTOMREQUEST, method__.c_str());

    set_opt_string(CURLOPT_URL, url__.c_str());
    set_opt_long(CURLOPT_HTTP_VERSION, ver);

    log("", "Configured " + method__ + " " + url__ + " " + version__);
    state__ = HDL_CONFIGURED;
    return HDL_OK;
}

/**
 * @brief set_headers - Add request headers
 *
 * <ul>
 * <li> Proxy-* headers are dropped when the handle authenticates to the proxy itself </li>
 * <li> Content-Length of an upload sets the request body size (no chunked encoding, no "Expect: 100-continue"). An
 * empty value only removes the header </li>
 * <li> User-Agent goes through libcurl's own option </li>
 * </ul>
 * For a CONNECT without tunnel, the headers are kept for handle::tunnel_handle().
 * @param headers The headers, added to the ones already set
 * @return A return code described by the \a HDL_RetCode enumerate
 */
handle::HDL_RetCode
handle::set_headers(const header_list& headers) noexcept
{
    if (auto ret{ editable() }; HDL_OK != ret) return ret;

    const bool skip_proxy{ !proxy__.empty() && has_auth__ };
    long       upload_size{ -1 };

    // Nothing is applied if a header is invalid
    for (const auto& [name, value] : headers)
    {
        if (!iequals(name, "content-length") || !is_upload() || value.empty()) continue;

        auto val{ _trim(value) };
        auto [ptr, ec]{ std::from_chars(val.data(), val.data() + std::size(val), upload_size) };
        if (std::errc{} != ec || val.data() + std::size(val) != ptr || upload_size < 0) return HDL_BAD_PARAM;
    }

    try
    {
        for (const auto& hdr : headers)
        {
            const auto& [name, value] = hdr;

            if (skip_proxy && _istarts_with(name, "proxy-"))
            {
                log("", "Skipping header => " + header_list::line(hdr));
                continue;
            }

            if (iequals(name, "user-agent"))
            {
                set_useragent(value);
                continue;
            }

            if (iequals(name, "content-length") && is_upload() && !value.empty())
            {
                set_upload_size(upload_size);
                headers__.set("Transfer-Encoding", "");
                headers__.set("Expect", "");
            }

            log("", "Adding header => " + header_list::line(hdr));
            headers__.set(name, value);
        }

        if ("CONNECT" == method__ && !tunnel__) delayed__.merge(headers);
    }
    catch (const std::bad_alloc&)
    {
        return HDL_OUT_OF_MEM;
    }

    return apply_headers();
}

/**
 * @brief set_proxy - Go through an upstream proxy
 *
 * The authentication cache is consulted first, whatever the credentials set afterwards:
 * <ul>
 * <li> If the proxy already rejected an authentication, nothing is configured and HDL_PROXY_AUTH_FAILED is
 * returned </li>
 * <li> If a mechanism is known to work, it is used directly (no negotiation round-trip) </li>
 * </ul>
 * @param proxy The proxy host
 * @param port The proxy port (0 for libcurl's default)
 * @param no_proxy Comma separated hosts that must not go through the proxy
 * @return A return code described by the \a HDL_RetCode enumerate
 */
handle::HDL_RetCode
handle::set_proxy(std::string_view proxy, long port, std::string_view no_proxy) noexcept
{
    if (auto ret{ editable() }; HDL_OK != ret) return ret;
    if (proxy.empty() || port < 0 || port > 65535) return HDL_BAD_PARAM;

    auth_cache::lookup_ret known{};

    try
    {
        known = cache__->lookup({ std::string(proxy), port, {} });
    }
    catch (const std::bad_alloc&)
    {
        return HDL_OUT_OF_MEM;
    }

    if (auth_cache::AUTH_FAILED == known.state)
    {
        log("", "Authentication issues with this proxy server");
        return HDL_PROXY_AUTH_FAILED;
    }

    proxy__      = proxy;
    proxy_port__ = port;
    no_proxy__   = no_proxy;

    set_opt_string(CURLOPT_PROXY, proxy__.c_str());
    if (0 != port) set_opt_long(CURLOPT_PROXYPORT, port);
    if (!no_proxy__.empty()) set_opt_string(CURLOPT_NOPROXY, no_proxy__.c_str());

    if (auth_cache::AUTH_KNOWN == known.state)
    {
        log("", "Using known proxy auth " + std::string(auth_cache::mechanism_name(known.mechanism)));
        set_opt_long(CURLOPT_PROXYAUTH, static_cast<long>(known.mechanism));
    }

    // Without credentials the client talks to the proxy itself
    if ("CONNECT" == method__) set_tunnel(false);

    return HDL_OK;
}

/**
 * @brief set_auth - Authenticate to the proxy
 * Must be called after handle::set_proxy()
 *
 * @param user The user name (":" for single sign-on with the current user)
 * @param password The password (empty if none)
 * @param mechanisms Mask of CURLAUTH_* mechanisms allowed (ignored if a mechanism is known to work)
 * @return A return code described by the \a HDL_RetCode enumerate
 */
handle::HDL_RetCode
handle::set_auth(std::string_view user, std::string_view password, unsigned long mechanisms) noexcept
{
    if (auto ret{ editable() }; HDL_OK != ret) return ret;
    if (user.empty() || 0 == mechanisms) return HDL_BAD_PARAM;

    auth_cache::lookup_ret known{};
    if (!proxy__.empty())
    {
        known = cache__->lookup({ proxy__, proxy_port__, std::string(user) });
        if (auth_cache::AUTH_FAILED == known.state)
        {
            log("", "Authentication issues with this proxy server");
            return HDL_PROXY_AUTH_FAILED;
        }
    }

    user__ = user;
    if (":" == user)
    {
        set_opt_string(CURLOPT_PROXYUSERPWD, ":");
    }
    else
    {
        set_opt_string(CURLOPT_PROXYUSERNAME, user__.c_str());
        if (!password.empty()) set_opt_string(CURLOPT_PROXYPASSWORD, std::string(password).c_str());
    }

    const auto mech{ (auth_cache::AUTH_KNOWN == known.state) ? known.mechanism : mechanisms };
    log("", "Proxy auth using " + std::string(auth_cache::mechanism_name(mech)) + " with user '" + user__ + "'");

    has_auth__ = true;
    auto ret{ set_opt_long(CURLOPT_PROXYAUTH, static_cast<long>(mech)) };

    // The proxy is authenticated here, so the tunnel can be established by libcurl
    if ("CONNECT" == method__) set_tunnel(true);

    return ret;
}

handle::HDL_RetCode
handle::set_auth(std::string_view user, std::string_view password, std::string_view mechanisms) noexcept
{
    unsigned long mask{ 0 };

    if (!auth_cache::parse_mechanism(mechanisms, mask)) return HDL_BAD_PARAM;
    return set_auth(user, password, mask);
}

/**
 * @brief set_tunnel - Ask the proxy for a tunnel (CONNECT) instead of forwarding the request
 * The CONNECT response headers are not reported.
 */
handle::HDL_RetCode
handle::set_tunnel(bool enable) noexcept
{
    if (auto ret{ editable() }; HDL_OK != ret) return ret;

    tunnel__ = enable;
    set_opt_bool(CURLOPT_HTTPPROXYTUNNEL, enable);
    set_opt_bool(CURLOPT_SUPPRESS_CONNECT_HEADERS, enable);

    return apply_headers();
}

handle::HDL_RetCode
handle::set_insecure(bool enable) noexcept
{
    if (auto ret{ editable() }; HDL_OK != ret) return ret;

    set_opt_bool(CURLOPT_SSL_VERIFYPEER, !enable);
    return set_opt_long(CURLOPT_SSL_VERIFYHOST, enable ? 0L : 2L);
}

/**
 * @brief set_verbose - Forward libcurl's own trace (connection info, sent and received headers) to the debug sink
 */
handle::HDL_RetCode
handle::set_verbose(bool enable) noexcept
{
    if (auto ret{ editable() }; HDL_OK != ret) return ret;
    verbose__ = enable;
    return HDL_OK;
}

/**
 * @brief set_debug - Forward the handle's own diagnostics (configuration, failures) to the debug sink
 */
handle::HDL_RetCode
handle::set_debug(bool enable) noexcept
{
    if (auto ret{ editable() }; HDL_OK != ret) return ret;
    debug__ = enable;
    return HDL_OK;
}

/**
 * @brief set_transfer_decoding - Let libcurl decode the transfer encoding
 * Disabled, the body is relayed as sent by the server (e.g. chunked).
 */
handle::HDL_RetCode
handle::set_transfer_decoding(bool enable) noexcept
{
    if (auto ret{ editable() }; HDL_OK != ret) return ret;
    return set_opt_bool(CURLOPT_HTTP_TRANSFER_DECODING, enable);
}

handle::HDL_RetCode
handle::set_useragent(std::string_view agent) noexcept
{
    if (auto ret{ editable() }; HDL_OK != ret) return ret;
    if (agent.empty()) return HDL_OK;
    return set_opt_string(CURLOPT_USERAGENT, std::string(agent).c_str());
}

handle::HDL_RetCode
handle::set_follow(bool enable) noexcept
{
    if (auto ret{ editable() }; HDL_OK != ret) return ret;
    return set_opt_bool(CURLOPT_FOLLOWLOCATION, enable);
}

//---------------------------------------------------------------------------------------------------------------------
// I/O MODES
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief buffer - The handle keeps the response (\see handle::get_headers and handle::get_data)
 *
 * @param request The request body (sent as is, its size is announced)
 * @return A return code described by the \a HDL_RetCode enumerate
 */
handle::HDL_RetCode
handle::buffer(std::string_view request) noexcept
{
    if (auto ret{ editable() }; HDL_OK != ret) return ret;

    try
    {
        buffered_io io;
        io.request = request;
        io__       = std::move(io);

        if (is_upload())
        {
            set_upload_size(static_cast<long>(std::size(request)));
            headers__.set("Expect", "");
        }
    }
    catch (const std::bad_alloc&)
    {
        return HDL_OUT_OF_MEM;
    }

    return apply_headers();
}

/**
 * @brief bridge - Bytes are relayed between the transfer and caller streams
 *
 * The streams are called from libcurl's callbacks: they must not block.
 * A stream returning STREAM_AGAIN pauses the matching direction until it is ready again.
 * @param reader The request body source (nullptr if none)
 * @param writer The response body sink (nullptr to drop it)
 * @param header_writer The response headers sink (nullptr to drop them)
 * @return A return code described by the \a HDL_RetCode enumerate
 */
handle::HDL_RetCode
handle::bridge(TStreamRead reader, TStreamWrite writer, TStreamWrite header_writer) noexcept
{
    if (auto ret{ editable() }; HDL_OK != ret) return ret;

    bridged_io io;
    io.reader        = std::move(reader);
    io.writer        = std::move(writer);
    io.header_writer = std::move(header_writer);
    io__             = std::move(io);

    return HDL_OK;
}

/**
 * @brief fd_reader - A non-blocking stream reading a socket
 * @param fd The socket
 */
handle::TStreamRead
handle::fd_reader(int fd)
{
    return [fd](char* buf, size_t sz) -> long {
        auto ret{ ::recv(fd, buf, sz, MSG_DONTWAIT) };
        if (ret >= 0) return static_cast<long>(ret);
        if (EAGAIN == errno || EWOULDBLOCK == errno || EINTR == errno) return STREAM_AGAIN;
        return STREAM_ERROR;
    };
}

/**
 * @brief fd_writer - A non-blocking stream writing a socket
 * @param fd The socket
 */
handle::TStreamWrite
handle::fd_writer(int fd)
{
    return [fd](const char* buf, size_t sz) -> long {
        auto ret{ ::send(fd, buf, sz, MSG_DONTWAIT | MSG_NOSIGNAL) };
        if (ret >= 0) return static_cast<long>(ret);
        if (EAGAIN == errno || EWOULDBLOCK == errno || EINTR == errno) return STREAM_AGAIN;
        return STREAM_ERROR;
    };
}

//---------------------------------------------------------------------------------------------------------------------
// TRANSFER CALLBACKS
// \see https://everything.curl.dev/libcurl/callbacks
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief flush - Push bytes previously accepted from libcurl to their stream
 * @return 0 once nothing is pending, STREAM_AGAIN if bytes remain, STREAM_ERROR
 */
long
handle::flush(std::string& pending, const TStreamWrite& out) noexcept
{
    while (!pending.empty())
    {
        if (!out)
        {
            pending.clear();
            break;
        }

        auto ret{ out(pending.data(), std::size(pending)) };
        if (STREAM_ERROR == ret || ret < STREAM_ERROR) return STREAM_ERROR;
        if (STREAM_AGAIN == ret || 0 == ret) return STREAM_AGAIN;

        pending.erase(0, std::min(static_cast<size_t>(ret), std::size(pending)));
    }
    return 0;
}

/**
 * @brief deliver - Hand bytes from libcurl to a stream
 * @return sz when the bytes are taken (possibly stashed), STREAM_AGAIN if libcurl must keep them, STREAM_ERROR
 */
long
handle::deliver(std::string& pending, const TStreamWrite& out, const char* data, size_t sz) noexcept
{
    if (auto ret{ flush(pending, out) }; 0 != ret) return ret;

    auto ret{ out(data, sz) };
    if (STREAM_ERROR == ret || ret < STREAM_ERROR) return STREAM_ERROR;
    if (STREAM_AGAIN == ret || 0 == ret) return STREAM_AGAIN;

    if (static_cast<size_t>(ret) < sz) pending.assign(data + ret, sz - static_cast<size_t>(ret));
    return static_cast<long>(sz);
}

size_t
handle::on_read(char* buf, size_t sz) noexcept
{
    size_t ret{ 0 };

    if (upload_left__ >= 0)
    {
        if (0 == upload_left__) return 0;
        sz = std::min(sz, static_cast<size_t>(upload_left__));
    }

    if (auto io{ std::get_if<buffered_io>(&io__) }; nullptr != io)
    {
        ret = std::min(sz, std::size(io->request) - io->offset);
        std::memcpy(buf, io->request.data() + io->offset, ret);
        io->offset += ret;
    }
    else if (auto io{ std::get_if<bridged_io>(&io__) }; nullptr != io)
    {
        if (!io->reader || io->eof) return 0;

        auto got{ io->reader(buf, sz) };
        if (STREAM_AGAIN == got)
        {
            flags__ |= CURLPAUSE_SEND;
            return CURL_READFUNC_PAUSE;
        }
        if (got < 0)
        {
            log("", "Request body source failed");
            return CURL_READFUNC_ABORT;
        }
        if (0 == got) io->eof = true;

        ret = std::min(sz, static_cast<size_t>(got));
    }

    if (upload_left__ > 0) upload_left__ -= static_cast<long>(ret);
    return ret;
}

// Only a buffered request body can be sent again (e.g. proxy authentication round-trips)
int
handle::on_seek(int64_t offset, int origin) noexcept
{
    auto io{ std::get_if<buffered_io>(&io__) };

    if (nullptr == io || SEEK_SET != origin) return CURL_SEEKFUNC_CANTSEEK;
    if (offset < 0 || static_cast<size_t>(offset) > std::size(io->request)) return CURL_SEEKFUNC_FAIL;

    io->offset    = static_cast<size_t>(offset);
    upload_left__ = (upload_size__ >= 0) ? std::max(0L, upload_size__ - static_cast<long>(offset)) : -1;
    return CURL_SEEKFUNC_OK;
}

size_t
handle::on_write(char* buf, size_t sz) noexcept
{
    auto io{ std::get_if<bridged_io>(&io__) };

    // Body of a response whose headers were not forwarded (e.g. a 407 challenge)
    if (!headers_done__)
    {
        log("", "Skipping body => " + std::to_string(sz) + " bytes");
        return sz;
    }

    if (auto buffered{ std::get_if<buffered_io>(&io__) }; nullptr != buffered)
    {
        buffered->body.append(buf, sz);
        return sz;
    }

    if (nullptr == io || !io->writer) return sz;

    // Headers waiting for their stream go first
    auto ret{ flush(io->pending_header, io->header_writer) };
    if (0 == ret) ret = deliver(io->pending_body, io->writer, buf, sz);

    if (STREAM_AGAIN == ret)
    {
        flags__ |= CURLPAUSE_RECV;
        return CURL_WRITEFUNC_PAUSE;
    }
    if (STREAM_ERROR == ret)
    {
        log("", "Response body sink failed");
        return 0;
    }
    return sz;
}

size_t
handle::on_header(char* buf, size_t sz) noexcept
{
    const std::string_view data(buf, sz);
    const bool             blank{ "\r\n" == data || "\n" == data };

    if (suppress__)
    {
        if (blank)
        {
            suppress__ = false;
            log("", "Resuming headers");
        }
        return sz;
    }

    if (blank)
    {
        headers_done__ = true;
    }
    else if (has_auth__ && !data.empty() && 'H' == data.front() && std::string_view::npos != data.find(" 407"))
    {
        // Challenge answered by libcurl itself
        log("", "Skipping 407 headers");
        suppress__ = true;
        return sz;
    }
    else if (_istarts_with(data, "HTTP/"))
    {
        headers_done__ = false;
    }

    if (auto buffered{ std::get_if<buffered_io>(&io__) }; nullptr != buffered)
    {
        buffered->headers.append(data);
        return sz;
    }

    auto io{ std::get_if<bridged_io>(&io__) };
    if (nullptr == io || !io->header_writer) return sz;

    auto ret{ deliver(io->pending_header, io->header_writer, buf, sz) };
    if (STREAM_AGAIN == ret)
    {
        flags__ |= CURLPAUSE_RECV;
        return CURL_WRITEFUNC_PAUSE;
    }
    if (STREAM_ERROR == ret)
    {
        log("", "Response header sink failed");
        return 0;
    }
    return sz;
}

void
handle::on_debug(int type, const char* data, size_t sz) noexcept
{
    static constexpr std::string_view _auth{ "proxy-authorization:" };
    std::string_view                  prefix;

    switch (type)
    {
        case CURLINFO_TEXT: prefix = "Curl info: "; break;
        case CURLINFO_HEADER_IN: prefix = "Received header <= "; break;
        case CURLINFO_HEADER_OUT: prefix = "Sent header => "; break;
        default: return;
    }

    std::string_view text(data, sz);
    while (!text.empty())
    {
        auto pos{ text.find('\n') };
        auto line{ _trim(text.substr(0, pos)) };
        text = (std::string_view::npos == pos) ? std::string_view{} : text.substr(pos + 1);

        if (line.empty()) continue;

        // The last mechanism sent is the one the proxy accepted
        if (CURLINFO_HEADER_OUT == type && _istarts_with(line, _auth))
        {
            auto scheme{ _trim(line.substr(std::size(_auth))) };
            scheme = scheme.substr(0, scheme.find(' '));
            if (auto mech{ auth_cache::mechanism_from_scheme(scheme) }; 0 != mech) auth_used__ = mech;
        }

        if (verbose__ && cb_debug__)
        {
            std::string out{ std::to_string(id()) };
            out.append(": ").append(prefix).append(sanitized(line));
            cb_debug__(out);
        }
    }
}

void
handle::log(std::string_view prefix, std::string_view msg) const
{
    if (!debug__ || !cb_debug__) return;

    std::string line{ std::to_string(id()) };
    line.append(": ").append(prefix).append(sanitized(msg));
    cb_debug__(line);
}

//---------------------------------------------------------------------------------------------------------------------
// OPERATIONS
//---------------------------------------------------------------------------------------------------------------------

void
handle::clear_results() noexcept
{
    result__      = CURLE_OK;
    response__    = 0;
    auth_used__   = 0;
    auth_failed__ = false;
    sock__        = -1;
    errbuf__[0]   = '\0';
    errstr__.clear();
}

// Called right before the transfer is handed to libcurl
void
handle::start() noexcept
{
    clear_results();

    if (auto io{ std::get_if<buffered_io>(&io__) }; nullptr != io)
    {
        io->offset = 0;
        io->headers.clear();
        io->body.clear();
    }
    else if (auto io{ std::get_if<bridged_io>(&io__) }; nullptr != io)
    {
        io->pending_body.clear();
        io->pending_header.clear();
        io->eof = false;
    }

    upload_left__  = upload_size__;
    suppress__     = false;
    headers_done__ = false;
    draining__     = false;
    drain_code__   = 0;
    flags__        = 0;
    state__        = HDL_IN_PROGRESS;
}

/**
 * @brief finish - Collect the results of a transfer libcurl is done with
 *
 * Engine errors are mapped to the HTTP status a proxy would answer, and the authentication cache learns from the
 * outcome.
 * @param code The CURLcode of the transfer
 */
void
handle::finish(int code) noexcept
{
    const bool connect{ "CONNECT" == method__ };
    long       status{ 0 };

    draining__ = false;
    flags__    = 0;
    result__   = code;
    get_info_long(connect ? CURLINFO_HTTP_CONNECTCODE : CURLINFO_RESPONSE_CODE, status);
    response__ = status;

    if (CURLE_OK != code)
    {
        errstr__ = std::to_string(code) + "; " +
                   std::string('\0' != errbuf__[0] ? errbuf__ : curl_easy_strerror(static_cast<CURLcode>(code))) +
                   "; ";

        switch (code)
        {
            case CURLE_URL_MALFORMAT:
                response__ = 400;
                errstr__ += "URL malformed; ";
                break;
            case CURLE_UNSUPPORTED_PROTOCOL:
            case CURLE_NOT_BUILT_IN:
                response__ = 501;
                errstr__ += "Not implemented; ";
                break;
            case CURLE_COULDNT_RESOLVE_PROXY:
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_CONNECT:
                response__ = 502;
                errstr__ += "Could not connect; ";
                break;
            case CURLE_OPERATION_TIMEDOUT:
                response__ = 504;
                errstr__ += "Timed out; ";
                break;
            default: break;
        }
    }

    if (!proxy__.empty() && 407 == status)
    {
        if (CURLE_SEND_FAIL_REWIND == code)
        {
            response__ = 503;
            errstr__ += "POST/PUT rewind not supported; ";
        }
        else if (has_auth__)
        {
            response__    = 401;
            auth_failed__ = true;
            errstr__ += "Proxy authentication failed: check user/password or try different auth mechanism; ";
            try
            {
                cache__->record_failure(identity());
                cache__->record_failure(proxy_level());
            }
            catch (const std::bad_alloc&)
            {
                // Not remembered: the next attempt fails the same way
            }
        }
        else if (connect)
        {
            response__ = 407;
            errstr__ += "Proxy authentication required; ";
        }
    }
    else if (CURLE_OK == code && !proxy__.empty() && has_auth__ && 0 != auth_used__)
    {
        try
        {
            cache__->record_success(identity(), auth_used__);
            cache__->record_success(proxy_level(), auth_used__);
        }
        catch (const std::bad_alloc&)
        {
            // Negotiated again next time
        }
    }

    if (connect && CURLE_OK == code && errstr__.empty())
    {
        if (HDL_OK != get_info_socket(CURLINFO_ACTIVESOCKET, sock__) || sock__ < 0)
        {
            sock__ = -1;
            errstr__ += "Failed to get active socket; ";
        }
    }

    if (!errstr__.empty() && response__ < 400) response__ = 503;

    if (!errstr__.empty()) log("", "Connection failed: " + errstr__);
    state__ = errstr__.empty() ? HDL_COMPLETE_OK : HDL_COMPLETE_ERROR;
}

/**
 * @brief abort - Terminate a transfer libcurl did not finish
 * @param reason Why it was terminated
 */
void
handle::abort(std::string_view reason) noexcept
{
    if (HDL_IN_PROGRESS != state__) return;

    if (CURLE_OK == result__) result__ = CURLE_ABORTED_BY_CALLBACK;
    if (response__ < 400) response__ = 503;
    errstr__.append(reason).append("; ");
    draining__ = false;
    flags__    = 0;
    state__ = HDL_COMPLETE_ERROR;
    log("", "Aborted: " + std::string(reason));
}

/**
 * @brief perform - Perform a blocking transfer
 * @return HDL_OK if the transfer succeeded, HDL_PROXY_AUTH_FAILED if the proxy rejected the credentials,
 * HDL_ENGINE_ERROR otherwise (\see handle::errstr())
 *
 * @note If you want to do many transfers, you are encouraged to use the same handle (connection reusage).
 * @note Bridged streams returning STREAM_AGAIN are retried about once per second: prefer a session for them.
 * @note Response bytes a writer still refuses once libcurl is done are given up after the connect timeout
 * (\see handle::configure), the transfer then fails with CURLE_WRITE_ERROR.
 * @see https://curl.se/libcurl/c/curl_easy_perform.html
 */
handle::HDL_RetCode
handle::perform(void) noexcept
{
    if (nullptr == curl_handle__ || HDL_CLOSED == state__ || HDL_IN_PROGRESS == state__) return HDL_BAD_FUNCTION;
    if (nullptr != multi_handler__) return HDL_BAD_FUNCTION;

    // Paused streams are retried from the progress meter (at least once per second)
    if (std::holds_alternative<bridged_io>(io__))
    {
        if (!cb_progress__) set_cb_progress(nullptr);
        set_opt_bool(CURLOPT_NOPROGRESS, false);
    }

    start();
    auto code{ curl_easy_perform(static_cast<CURL*>(curl_handle__)) };

    // Hand the tail of the response to the streams
    if (has_pending())
    {
        // libcurl's own default when no connect timeout is set
        const auto deadline{ std::chrono::steady_clock::now() +
                             std::chrono::seconds(connect_timeout__ > 0 ? connect_timeout__ : 300) };

        draining__ = true;
        while (!resume())
        {
            if (std::chrono::steady_clock::now() >= deadline)
            {
                log("", "Response sink stalled");
                if (CURLE_OK == code) code = CURLE_WRITE_ERROR;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
    finish(code);

    if (cb_done__) cb_done__(code);

    if (HDL_COMPLETE_OK == state__) return HDL_OK;
    return auth_failed__ ? HDL_PROXY_AUTH_FAILED : HDL_ENGINE_ERROR;
}

/**
 * @brief reset - Reinitializes all options of a session
 * The callbacks (debug, progress, done) are kept.
 * @note It does not change connections, session ID cache, DNS cache, cookies...
 * @see https://curl.se/libcurl/c/curl_easy_reset.html
 */
void
handle::reset(void) noexcept
{
    if (nullptr == curl_handle__) return;
    if (nullptr != multi_handler__) multi_handler__->remove_handle(*this);

    curl_easy_reset(static_cast<CURL*>(curl_handle__));

    io__ = std::monostate{};
    headers__.clear();
    delayed__.clear();
    lists__.clear();
    strings__.clear();

    method__.clear();
    url__.clear();
    version__.clear();
    proxy__.clear();
    proxy_port__      = 0;
    connect_timeout__ = 60;
    no_proxy__.clear();
    user__.clear();
    has_auth__    = false;
    tunnel__      = false;
    debug__       = false;
    verbose__     = false;
    upload_size__ = -1;
    upload_left__ = -1;
    flags__       = 0;

    clear_results();
    state__ = HDL_IDLE;

    install_callbacks();
}

/**
 * @brief close - Release the transfer and its resources
 * Safe to call several times.
 */
void
handle::close(void) noexcept
{
    if (nullptr == curl_handle__) return;
    if (nullptr != multi_handler__) multi_handler__->remove_handle(*this);

    curl_easy_cleanup(static_cast<CURL*>(curl_handle__));
    curl_handle__ = nullptr;

    io__ = std::monostate{};
    headers__.clear();
    delayed__.clear();
    lists__.clear();
    strings__.clear();
    state__ = HDL_CLOSED;
}

//---------------------------------------------------------------------------------------------------------------------
// CALLBACKS
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief set_cb_progress - Set the progress meter callback
 * @param cb Called with (dltotal, dlnow, ultotal, ulnow), a non-zero return aborts the transfer
 * @return A return code described by the \a HDL_RetCode enumerate
 */
handle::HDL_RetCode
handle::set_cb_progress(const TCbProgress& cb) noexcept
{
    // See https://curl.se/libcurl/c/CURLOPT_XFERINFOFUNCTION.html
    constexpr auto _hidden{ [](void*      clientp, // pointer set with CURLOPT_XFERINFODATA
                               curl_off_t dltotal, // total number of bytes expects to download in this transfer
                               curl_off_t dlnow,   // number of bytes downloaded so far
                               curl_off_t ultotal, // total number of bytes expected to upload in this transfer
                               curl_off_t ulnow    // number of bytes uploaded so far
                               ) -> int {
        auto This{ static_cast<handle*>(clientp) };

        if (nullptr == This) return 0;

        // Nothing else resumes a blocking transfer
        if (nullptr == This->multi_handler__ && This->is_paused(CURLPAUSE_ALL)) This->resume();

        if (!This->cb_progress__) return 0;
        return This->cb_progress__(dltotal, dlnow, ultotal, ulnow);
    } };

    if (nullptr == curl_handle__) return HDL_BAD_FUNCTION;

    cb_progress__ = cb;

    auto ret{ curl_easy_setopt(static_cast<CURL*>(curl_handle__), CURLOPT_XFERINFOFUNCTION,
                               static_cast<CURL_PROGRESSFUNCTION_PTR>(_hidden)) };
    if (CURLE_OK == ret)
    {
        set_opt_ptr(CURLOPT_XFERINFODATA, this);
        set_opt_bool(CURLOPT_NOPROGRESS, !cb);
    }

    return (CURLE_OK == ret) ? HDL_OK : HDL_INTERNAL_ERROR;
}

/**
 * @brief set_cb_debug - Set the diagnostics sink
 * @param cb Receives one line per call, prefixed with the transfer id. Credentials are never included.
 * @note The handle's diagnostics need handle::set_debug(), libcurl's own trace needs handle::set_verbose()
 */
handle::HDL_RetCode
handle::set_cb_debug(const TCbDebug& cb) noexcept
{
    cb_debug__ = cb;
    return HDL_OK;
}

/**
 * @brief set_cb_done - Set the done callback
 *
 * @param cb The callback called with the CURLcode when the transfer is done (HDL_MULTI_STOPPED if its session was
 * closed).
 * @return A return code described by the \a HDL_RetCode enumerate
 *
 * @warning In asynchronous mode, when you enter this callback, the handle has been released by the session.
 * So you can immediately ask for a new transfer within the callback by calling mhandle::add_handle() again.
 */
handle::HDL_RetCode
handle::set_cb_done(const TCbDone& cb) noexcept
{
    cb_done__ = cb;
    return HDL_OK;
}

//---------------------------------------------------------------------------------------------------------------------
// RESULTS
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief get_response - HTTP status of the transfer
 * For a failed transfer, the status a proxy would answer (e.g. 502 when the server can not be reached).
 */
handle::HDL_RetCode
handle::get_response(long& code) const noexcept
{
    if (HDL_COMPLETE_OK != state__ && HDL_COMPLETE_ERROR != state__) return HDL_NOT_READY;
    code = response__;
    return HDL_OK;
}

/**
 * @brief get_headers - Response headers of a buffered transfer
 * @param out The headers, decoded
 * @param enc How to decode the bytes
 * @return HDL_NOT_READY, HDL_BAD_MODE, HDL_BAD_ENCODING or HDL_OK
 */
handle::HDL_RetCode
handle::get_headers(std::string& out, Encoding enc) const
{
    if (HDL_COMPLETE_OK != state__ && HDL_COMPLETE_ERROR != state__) return HDL_NOT_READY;

    auto io{ std::get_if<buffered_io>(&io__) };
    if (nullptr == io) return HDL_BAD_MODE;

    return decode(io->headers, enc, out) ? HDL_OK : HDL_BAD_ENCODING;
}

/**
 * @brief get_data - Response body of a buffered transfer
 * @param out The body, decoded
 * @param enc How to decode the bytes
 * @return HDL_NOT_READY, HDL_BAD_MODE, HDL_BAD_ENCODING or HDL_OK
 */
handle::HDL_RetCode
handle::get_data(std::string& out, Encoding enc) const
{
    if (HDL_COMPLETE_OK != state__ && HDL_COMPLETE_ERROR != state__) return HDL_NOT_READY;

    auto io{ std::get_if<buffered_io>(&io__) };
    if (nullptr == io) return HDL_BAD_MODE;

    return decode(io->body, enc, out) ? HDL_OK : HDL_BAD_ENCODING;
}

handle::HDL_RetCode
handle::get_activesocket(int& fd) const noexcept
{
    int sock{ -1 };

    if (nullptr == curl_handle__) return HDL_BAD_FUNCTION;
    if (HDL_OK != get_info_socket(CURLINFO_ACTIVESOCKET, sock) || sock < 0) return HDL_NO_ACTIVE_SOCKET;

    fd = sock;
    return HDL_OK;
}

/**
 * @brief get_used_proxy - Whether the transfer went through the proxy
 * (\see handle::set_proxy, the no_proxy list may exclude the target)
 */
handle::HDL_RetCode
handle::get_used_proxy(bool& used) const noexcept
{
    if (HDL_COMPLETE_OK != state__ && HDL_COMPLETE_ERROR != state__) return HDL_NOT_READY;

#if LIBCURL_VERSION_NUM >= 0x080700
    long val{ 0 };
    if (auto ret{ get_info_long(CURLINFO_USED_PROXY, val) }; HDL_OK != ret) return ret;
    used = (0 != val);
#else
    used = !proxy__.empty() && !_no_proxy_match(no_proxy__, _url_host(url__));
#endif
    return HDL_OK;
}

/**
 * @brief get_auth_used - Proxy authentication mechanism of the transfer
 * @param mechanism The CURLAUTH_* bit (0 if no authentication took place)
 */
handle::HDL_RetCode
handle::get_auth_used(unsigned long& mechanism) const noexcept
{
    if (HDL_COMPLETE_OK != state__ && HDL_COMPLETE_ERROR != state__) return HDL_NOT_READY;
    mechanism = auth_used__;
    return HDL_OK;
}

handle::HDL_RetCode
handle::get_primary_ip(std::string& ip) const noexcept
{
    if (nullptr == curl_handle__) return HDL_BAD_FUNCTION;
    return get_info_string(CURLINFO_PRIMARY_IP, ip);
}

/**
 * @brief retCode2Str - Gives a human readable string for each retcodes
 *
 * @param rc The retcode
 * @return A human-readable representation of the retcode meaning
 */
std::string_view
handle::retCode2Str(HDL_RetCode rc) noexcept
{
    static const std::map<HDL_RetCode, std::string_view> _rc2Str{
        { HDL_MULTI_STOPPED, "The multi session has been stopped" },
        { HDL_OK, "OK" },
        { HDL_BAD_PARAM, "Bad parameter" },
        { HDL_BAD_FUNCTION, "This function should not be called in this context" },
        { HDL_OUT_OF_MEM, "Out of memory" },
        { HDL_INTERNAL_ERROR, "Internal error" },
        { HDL_NOT_READY, "The transfer is not complete" },
        { HDL_NO_ACTIVE_SOCKET, "The transfer has no active socket" },
        { HDL_PROXY_AUTH_FAILED, "Proxy authentication failed" },
        { HDL_ENGINE_ERROR, "The transfer failed" },
        { HDL_BAD_MODE, "Wrong I/O mode for this operation" },
        { HDL_BAD_ENCODING, "Data can not be decoded with this encoding" },
    };

    auto it{ _rc2Str.find(rc) };
    return (std::end(_rc2Str) == it) ? "Unknown error" : it->second;
}

/**
 * @brief engine_version - Version string of libcurl and its backends
 */
std::string
handle::engine_version(void)
{
    return curl_version();
}

/**
 * @brief engine_has - Whether libcurl was built with a feature
 * @param feature A CURL_VERSION_* bit (e.g. CURL_VERSION_SSPI, CURL_VERSION_GSSAPI)
 */
bool
handle::engine_has(int feature) noexcept
{
    auto info{ curl_version_info(CURLVERSION_NOW) };
    return (nullptr != info) && (0 != (info->features & feature));
}

} // namespace muxcurl
