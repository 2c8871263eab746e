/**
 * Copyright (C) 2023 Osmozis SA - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

/**
 * @file handle.hpp
 * @brief Wrapper around curl easy handle
 * \see https://everything.curl.dev/libcurl/easyhandle for more informations
 *
 * Basically, this is a handle to a transfer.
 * It provides functionalities such as :
 * <ul>
 * <li> Control over how the upcoming transfer will be performed (method, headers, upstream proxy and its
 * authentication) </li>
 * <li> Two I/O modes : buffered (the handle keeps the response) or bridged (bytes are relayed to caller streams) </li>
 * <li> Sharing of the proxy authentication mechanism with the other transfers (\see auth_cache) </li>
 * <li> Reusability : configure() reuses the same curl handle, and therefore its connections </li>
 * </ul>
 * @author lhm
 */

#ifndef INCLUDE_MUXCURL_HANDLE_H
#define INCLUDE_MUXCURL_HANDLE_H

#include <muxcurl/auth_cache.hpp>
#include <muxcurl/headers.hpp>
#include <muxcurl/text.hpp>

#include <any>
#include <cstddef>    // size_t
#include <cstdint>    // int64_t
#include <functional> // std::function
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace muxcurl
{
class mhandle;

/*********************************************************************************************************************/
class handle
{
    friend class mhandle;

public:
    static constexpr long STREAM_AGAIN{ -1 }; /*!< Stream endpoint: nothing can be transferred without blocking */
    static constexpr long STREAM_ERROR{ -2 }; /*!< Stream endpoint: unrecoverable error */

    using TStreamRead  = std::function<long(char*, size_t)>;       // bytes read, 0 at end of stream, or STREAM_*
    using TStreamWrite = std::function<long(const char*, size_t)>; // bytes written (may be short), or STREAM_*
    using TCbProgress  = std::function<int(int64_t, int64_t, int64_t, int64_t)>;
    using TCbDebug     = std::function<void(std::string_view)>;
    using TCbDone      = std::function<void(int)>;

    /**
     * @brief HDL_RetCode describes the return codes of the muxcurl::handle class methods
     */
    typedef enum
    {
        HDL_MULTI_STOPPED = -1, /*!< In case the handle is associated to a multi session, the end of the session */
        HDL_OK            = 0,  /*!< OK */
        HDL_BAD_PARAM,          /*!< An invalid parameter was passed to a function */
        HDL_BAD_FUNCTION,       /*!< A function has been called when it should not be */
        HDL_OUT_OF_MEM,         /*!< An dynamic allocation call failed (you were probably too greedy) */
        HDL_INTERNAL_ERROR,     /*!< Internal error */
        HDL_NOT_READY,          /*!< A result was requested before the transfer completed */
        HDL_NO_ACTIVE_SOCKET,   /*!< The transfer has no live socket */
        HDL_PROXY_AUTH_FAILED,  /*!< The proxy is known to reject authentication for these credentials */
        HDL_ENGINE_ERROR,       /*!< The transfer failed (\see handle::result() and handle::errstr()) */
        HDL_BAD_MODE,           /*!< The operation does not match the I/O mode of the transfer */
        HDL_BAD_ENCODING        /*!< The received bytes are not valid in the requested encoding */
    } HDL_RetCode;

    /**
     * @brief HDL_State describes the life cycle of a transfer
     */
    typedef enum
    {
        HDL_IDLE = 0,       /*!< Created or reset, nothing configured */
        HDL_CONFIGURED,     /*!< Ready to be performed */
        HDL_IN_PROGRESS,    /*!< Being performed (blocking or by a session) */
        HDL_COMPLETE_OK,    /*!< Done, results are available */
        HDL_COMPLETE_ERROR, /*!< Done with an error, results are available */
        HDL_CLOSED          /*!< Released, nothing can be done anymore */
    } HDL_State;

    /**
     * @brief The handle_ret structure contains the answer to muxcurl::handle queries
     * - an information request (\see handle::get_info)
     */
    struct handle_ret
    {
        HDL_RetCode ret;   /*!< The return code (indicates whether it succeeded or not) */
        std::any    value; /*!< The value (if any) of the required information */
    };

private:
    // The response is kept by the handle
    struct buffered_io
    {
        std::string request{};
        size_t      offset{ 0 };
        std::string headers{};
        std::string body{};
    };

    // The bytes are relayed to caller streams
    struct bridged_io
    {
        TStreamRead  reader{};
        TStreamWrite writer{};
        TStreamWrite header_writer{};
        std::string  pending_body{};   /*!< Accepted from curl, not yet taken by writer */
        std::string  pending_header{}; /*!< Accepted from curl, not yet taken by header_writer */
        bool         eof{ false };
    };

    mhandle* multi_handler__{ nullptr };
    void*    curl_handle__{ nullptr }; /*< CURL easy handle - you do NOT want to mess with this */
    int      flags__{ 0 };
    char     errbuf__[256]{};

    std::shared_ptr<auth_cache>                          cache__{};
    std::variant<std::monostate, buffered_io, bridged_io> io__{};
    header_list                                          headers__{};
    header_list                                          delayed__{};
    std::map<int, std::string>                           strings__{};
    std::map<int, header_list>                           lists__{};

    HDL_State   state__{ HDL_IDLE };
    std::string method__{};
    std::string url__{};
    std::string version__{};
    std::string proxy__{};
    long        proxy_port__{ 0 };
    long        connect_timeout__{ 60 }; /*!< Seconds, also bounds how long perform() waits for stalled streams */
    std::string no_proxy__{};
    std::string user__{};
    bool        has_auth__{ false };
    bool        tunnel__{ false };
    bool        debug__{ false };   /*!< Handle diagnostics go to the debug sink */
    bool        verbose__{ false }; /*!< libcurl trace goes to the debug sink */
    long        upload_size__{ -1 }; /*!< Request body size when known, -1 otherwise */
    long        upload_left__{ -1 }; /*!< Remaining request body bytes when the size is known, -1 otherwise */

    bool suppress__{ false };     /*!< Inside a 407 header block that must not be forwarded */
    bool headers_done__{ false }; /*!< The forwarded header block is complete */
    bool draining__{ false };     /*!< Done for libcurl, response bytes still owed to the streams */
    int  drain_code__{ 0 };       /*!< CURLcode to report once drained */

    int           result__{ 0 };
    long          response__{ 0 };
    std::string   errstr__{};
    unsigned long auth_used__{ 0 };
    bool          auth_failed__{ false };
    int           sock__{ -1 };

    TCbProgress cb_progress__{ nullptr };
    TCbDebug    cb_debug__{ nullptr };
    TCbDone     cb_done__{ nullptr };

    handle(const handle&) = delete;
    handle& operator=(const handle&) = delete;
    handle(handle&&)                 = delete;
    handle& operator=(handle&&) = delete;

    void install_callbacks() noexcept;
    void clear_results() noexcept;
    void start() noexcept;
    void finish(int code) noexcept;
    void abort(std::string_view reason) noexcept;
    bool resume() noexcept;
    void log(std::string_view prefix, std::string_view msg) const;

    HDL_RetCode editable(void) noexcept;
    HDL_RetCode apply_headers(void) noexcept;
    HDL_RetCode set_upload_size(long size) noexcept;
    bool        is_upload(void) const noexcept;
    bool        has_pending(void) const noexcept;

    long flush(std::string& pending, const TStreamWrite& out) noexcept;
    long deliver(std::string& pending, const TStreamWrite& out, const char* data, size_t sz) noexcept;

    size_t on_read(char* buf, size_t sz) noexcept;
    int    on_seek(int64_t offset, int origin) noexcept;
    size_t on_write(char* buf, size_t sz) noexcept;
    size_t on_header(char* buf, size_t sz) noexcept;
    void   on_debug(int type, const char* data, size_t sz) noexcept;

    proxy_identity identity() const { return { proxy__, proxy_port__, user__ }; }
    proxy_identity proxy_level() const { return { proxy__, proxy_port__, {} }; }

protected:
    HDL_RetCode get_info_long(int, long&) const noexcept;
    HDL_RetCode get_info_socket(int, int&) const noexcept;
    HDL_RetCode get_info_double(int, double&) const noexcept;
    HDL_RetCode get_info_string(int, std::string&) const noexcept;

    HDL_RetCode set_opt_long(int id, long val) noexcept;
    HDL_RetCode set_opt_offset(int id, int64_t val) noexcept;
    HDL_RetCode set_opt_ptr(int id, const void* val) noexcept;
    HDL_RetCode set_opt_string(int id, const char* val) noexcept;
    HDL_RetCode set_opt_bool(int id, bool val) noexcept;
    HDL_RetCode set_opt_list(int id, const header_list& val) noexcept;

public:
    handle();
    explicit handle(std::shared_ptr<auth_cache> cache);
    ~handle() noexcept;

    void* raw(void) noexcept;
    auto  id(void) const noexcept { return reinterpret_cast<std::uintptr_t>(curl_handle__); }
    auto  state(void) const noexcept { return state__; }
    bool  completed(void) const noexcept { return HDL_COMPLETE_OK == state__ || HDL_COMPLETE_ERROR == state__; }
    auto  result(void) const noexcept { return result__; }
    auto& errstr(void) const noexcept { return errstr__; }
    auto& method(void) const noexcept { return method__; }
    auto& url(void) const noexcept { return url__; }
    auto  is_tunnel(void) const noexcept { return tunnel__; }
    auto& cache(void) const noexcept { return cache__; }

    // Configuration
    HDL_RetCode configure(std::string_view url, std::string_view method = "GET",
                          std::string_view version = "HTTP/1.1", long connect_timeout = 60) noexcept;
    HDL_RetCode set_headers(const header_list& headers) noexcept;
    HDL_RetCode set_proxy(std::string_view proxy, long port = 0, std::string_view no_proxy = {}) noexcept;
    HDL_RetCode set_auth(std::string_view user, std::string_view password, unsigned long mechanisms) noexcept;
    HDL_RetCode set_auth(std::string_view user, std::string_view password = {},
                         std::string_view mechanisms = "ANY") noexcept;
    HDL_RetCode set_tunnel(bool enable = true) noexcept;
    HDL_RetCode set_insecure(bool enable = true) noexcept;
    HDL_RetCode set_verbose(bool enable = true) noexcept;
    HDL_RetCode set_debug(bool enable = true) noexcept;
    HDL_RetCode set_transfer_decoding(bool enable = false) noexcept;
    HDL_RetCode set_useragent(std::string_view agent) noexcept;
    HDL_RetCode set_follow(bool enable = true) noexcept;

    // I/O mode
    HDL_RetCode buffer(std::string_view request = {}) noexcept;
    HDL_RetCode bridge(TStreamRead reader = nullptr, TStreamWrite writer = nullptr,
                       TStreamWrite header_writer = nullptr) noexcept;

    static TStreamRead  fd_reader(int fd);
    static TStreamWrite fd_writer(int fd);

    HDL_RetCode set_cb_progress(const TCbProgress&) noexcept;
    HDL_RetCode set_cb_debug(const TCbDebug&) noexcept;
    HDL_RetCode set_cb_done(const TCbDone&) noexcept;

    HDL_RetCode perform(void) noexcept;
    void        reset(void) noexcept;
    void        close(void) noexcept;

    bool pause(int bitmask) noexcept;
    bool unpause(int bitmask) noexcept;
    bool is_paused(int bitmask) const noexcept;

    // Results
    HDL_RetCode get_response(long& code) const noexcept;
    HDL_RetCode get_headers(std::string& out, Encoding enc = ENC_UTF8) const;
    HDL_RetCode get_data(std::string& out, Encoding enc = ENC_UTF8) const;
    HDL_RetCode get_activesocket(int& fd) const noexcept;
    HDL_RetCode get_used_proxy(bool& used) const noexcept;
    HDL_RetCode get_auth_used(unsigned long& mechanism) const noexcept;
    HDL_RetCode get_primary_ip(std::string& ip) const noexcept;

    handle_ret  get_info(int id) noexcept;
    HDL_RetCode set_opt(int id, std::any val) noexcept;

    static std::string_view retCode2Str(HDL_RetCode) noexcept;
    static std::string      engine_version(void);
    static bool             engine_has(int feature) noexcept;
};

} // namespace muxcurl

#endif // INCLUDE_MUXCURL_HANDLE_H
