/**
 * Copyright (C) 2023 Osmozis SA - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

/**
 * @file mhandle.hpp
 * @brief Wrapper around curl multi handle - It represents a session that can own several (thousands) transfers
 * @see https://everything.curl.dev/libcurl/drive/multi-socket for more informations
 *
 * In a nutshell, here are the key informations to know about the mhandle:
 * <ul>
 * <li>It allows to perform multiple parallel transfers</li>
 * <li>All the transfers are done in a single thread</li>
 * <li>It is driven by a miniloop event-loop, either the caller's own loop (add_handle() then loop.run()) or a
 * blocking wait on one transfer (do_handle(), bridge_handle(), tunnel_handle())</li>
 * <li>A blocking wait gives up after a window without any socket activity</li>
 * </ul>
 * @author lhm
 */

#ifndef INCLUDE_MUXCURL_MHANDLE_H
#define INCLUDE_MUXCURL_MHANDLE_H

#include <muxcurl/socket_map.hpp>

#include <any>
#include <cstddef>    // size_t
#include <functional> // std::function
#include <map>
#include <memory>
#include <string>
#include <string_view>

#include <Loop.h>

template<class T>
using uptr = std::unique_ptr<T>;

namespace muxcurl
{
class handle;

/*********************************************************************************************************************/
class mhandle
{
public:
    using TCbError = std::function<void(int)>;
    using TCbDebug = std::function<void(std::string_view)>;

    /*!
     * @brief MHDL_RetCode describes the return codes of the muxcurl::mhandle class methods
     */
    typedef enum
    {
        MHDL_OK = 0,          /*!< OK */
        MHDL_BAD_PARAM,       /*!< An invalid parameter was passed to a function  */
        MHDL_ADD_OWNED,       /*!< An handle who is owned by another mhandle was attempted to get added */
        MHDL_ADD_ALREADY,     /*!< An handle already owned was attempted to get added again */
        MHDL_REMOVE_OWNED,    /*!< An handle who is owned by another mhandle was attempted to get removed */
        MHDL_REMOVE_ALREADY,  /*!< An handle already removed (or never added) was attempted to get removed again */
        MHDL_BAD_HANDLE,      /*!< An handle passed-in is not a valid handle (or not in a valid state) */
        MHDL_OUT_OF_MEM,      /*!< An dynamic allocation call failed (you were probably too greedy) */
        MHDL_INTERNAL_ERROR,  /*!< Internal error */
        MHDL_TRANSFER_FAILED, /*!< The transfer completed with an error (\see handle::errstr()) */
        MHDL_IDLE_TIMEOUT,    /*!< No socket activity during the idle window */
        MHDL_CLIENT_CLOSED,   /*!< The client socket was closed by its peer */
        MHDL_STOPPED          /*!< The session has been closed (or its loop exited) */
    } MHDL_RetCode;

private:
    void*                                curl_multi__{ nullptr }; /*!< Raw curl multi-handle (CURL::CURLM) */
    std::map<void*, handle*>             handles__{};             /*!< Pool of the single transfers */
    std::map<int, uptr<loop::Loop::IO>>  ios__{};                 /*!< Pool of IOs, by socket */
    socket_map                           sockets__{};             /*!< What libcurl asked to watch */
    int running_handles__{ 0 };                                   /*!< Number of running transfers */

    TCbError cb_error__{};
    TCbDebug cb_debug__{};

    loop::Loop& loop__;

    uptr<loop::Loop::Timeout> timeout__{ nullptr }; /*!< libcurl's timer */
    uptr<loop::Loop::Timeout> idle__{ nullptr };    /*!< Idle window of a blocking wait */
    uptr<loop::Loop::Timeout> resume__{ nullptr };  /*!< Retry of the paused transfers */

    handle*               waiting__{ nullptr }; /*!< Transfer a blocking wait is waiting for */
    bool                  busy__{ false };      /*!< A blocking wait is running */
    long                  idle_ms__{ 0 };
    bool                  resume_armed__{ false };
    int                   dispatching__{ 0 };   /*!< Nesting of loop callbacks */
    MHDL_RetCode          outcome__{ MHDL_OK };
    std::function<void()> client_refresh__{};

    static constexpr long RESUME_MS{ 10 };
    static constexpr size_t TUNNEL_CHUNK{ 16384 };

    mhandle(const mhandle&) = delete;
    mhandle& operator=(const mhandle&) = delete;
    mhandle(mhandle&&)                 = delete;
    mhandle& operator=(mhandle&&) = delete;

    static int timer_callback(void*, long, void*);
    static int socket_callback(void*, int, int, void*, void*);

    void         socket_action(int fd, int mask) noexcept;
    void         schedule_resume(void) noexcept;
    void         resume_all(void) noexcept;
    void         kick_idle(void) noexcept;
    void         prune_ios(void) noexcept;
    MHDL_RetCode detach(handle&) noexcept;
    void         complete(handle&, int code) noexcept;
    MHDL_RetCode register_handle(handle&) noexcept;
    MHDL_RetCode wait_for(handle&, long idle_ms) noexcept;
    void         log(const handle*, std::string_view msg) const;

    static MHDL_RetCode outcome_of(const handle&) noexcept;

protected:
    MHDL_RetCode set_opt_long(int id, long val) noexcept;
    MHDL_RetCode set_opt_ptr(int id, const void* val) noexcept;
    MHDL_RetCode set_opt_bool(int id, bool val) noexcept;
    MHDL_RetCode set_opt_offset(int id, long val) noexcept;

    void handle_stop(int) noexcept;
    void handle_msgs(void) noexcept;

public:
    explicit mhandle(loop::Loop&);
    ~mhandle() noexcept;

    MHDL_RetCode add_handle(handle&) noexcept;
    MHDL_RetCode remove_handle(handle&) noexcept;
    MHDL_RetCode stop_handle(handle&, std::string_view reason = "Stopped") noexcept;
    auto         enumerate_added_handles(void) const noexcept { return std::size(handles__); }
    auto         enumerate_running_handles(void) const noexcept { return running_handles__; }
    bool         is_closed(void) const noexcept { return nullptr == curl_multi__; }

    // Blocking interface
    MHDL_RetCode do_handle(handle&, long idle_ms = 0) noexcept;
    MHDL_RetCode bridge_handle(handle&, int client_fd, long idle_ms = 0) noexcept;
    MHDL_RetCode tunnel_handle(handle&, int client_fd, long idle_ms = 0) noexcept;

    void close(void) noexcept;
    bool check_sockets(void) const;

    void set_cb_error(const TCbError&) noexcept;
    void set_cb_debug(const TCbDebug&) noexcept;

    MHDL_RetCode set_opt(int id, std::any val) noexcept;

    // Convenience methods used for setting options
    MHDL_RetCode set_max_concurrent_streams(long) noexcept;
    MHDL_RetCode set_max_host_connections(long) noexcept;
    MHDL_RetCode set_max_total_connections(long) noexcept;
    MHDL_RetCode set_maxconnects(long) noexcept;
    MHDL_RetCode set_pipelining(long) noexcept;
    //----------------------------------------------//

    void* raw(void) noexcept;

    static std::string_view retCode2Str(MHDL_RetCode) noexcept;
};

} // namespace muxcurl

#endif // INCLUDE_MUXCURL_MHANDLE_H
