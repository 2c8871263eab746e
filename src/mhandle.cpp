/**
 * Copyright (C) 2023 Osmozis SA - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

#include <muxcurl/handle.hpp>
#include <muxcurl/mhandle.hpp>

#include <Loop.h>
#include <curl/curl.h>

#include <sys/socket.h>

#include <cerrno>
#include <map>
#include <new>
#include <stdexcept>
#include <vector>

using namespace loop;

namespace muxcurl
{
namespace
{
bool
_would_block(void) noexcept
{
    return EAGAIN == errno || EWOULDBLOCK == errno || EINTR == errno;
}

// Counts the loop callbacks being run, so that IOs are never destroyed from within their own callback
struct dispatch_guard
{
    int& cnt;
    explicit dispatch_guard(int& c) noexcept
      : cnt{ c }
    {
        ++cnt;
    }
    ~dispatch_guard() noexcept { --cnt; }
};
} // namespace

//---------------------------------------------------------------------------------------------------------------------
// STATIC FUNCTIONS
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief timer_callback - Callback called by curl when it is interested in setting a timer inside the loop.
 *
 * @param multi_handle The session concerned..
 * @param timeout_ms The timeout when curl wants to place (or -1 to delete it)
 * @param userp Private user data pointer
 * @return A retcode indicating libcurl how its request was treated.
 */
int
mhandle::timer_callback(void* /*multi_handle*/, long timeout_ms, void* userp)
{
    mhandle* This{ static_cast<mhandle*>(userp) };

    if (-1 == timeout_ms)
        This->timeout__->cancel();
    else
        This->timeout__->set(timeout_ms);

    return CURLM_OK;
}

/**
 * @brief socket_callback - Callback called by curl when it is interested in socket events
 *
 * The IOs are kept (with no requested event) once curl is done with a socket: they are only released outside of the
 * loop callbacks (\see mhandle::prune_ios).
 * @param easy The transfer concerned
 * @param s The socket of interest
 * @param what The event(s) of interest on the socket
 * @param clientp A private callback pointer
 * @return A retcode indicating libcurl how its request was treated.
 */
int
mhandle::socket_callback(void* easy, int s, int what, void* clientp, void* /*socketp*/)
{
    mhandle* This{ static_cast<mhandle*>(clientp) };
    handle*  owner{ nullptr };

    if (auto it{ This->handles__.find(easy) }; std::end(This->handles__) != it) owner = it->second;

    int  interest{ socket_map::SOCK_NONE };
    auto it{ This->ios__.find(s) };

    try
    {
        interest = This->sockets__.update(s, owner, what);

        if (socket_map::SOCK_NONE == interest)
        {
            if (std::end(This->ios__) != it) it->second->setRequestedEvents(0);
            return CURLM_OK;
        }

        if (std::end(This->ios__) == it)
        {
            auto io{ std::make_unique<Loop::IO>(s, This->loop__) };
            io->onEvent([This, s](int evt) {
                dispatch_guard guard{ This->dispatching__ };
                int            evt_bitmask{ 0 };

                if (evt & Loop::IO::READ) evt_bitmask |= CURL_CSELECT_IN;
                if (evt & Loop::IO::WRITE) evt_bitmask |= CURL_CSELECT_OUT;

                This->kick_idle();
                This->socket_action(s, evt_bitmask);
            });
            it = This->ios__.emplace(s, std::move(io)).first;
        }
    }
    catch (const std::bad_alloc&)
    {
        // Every transfer of the session is aborted by libcurl
        return -1;
    }

    short int evts{ 0 };
    if (interest & socket_map::SOCK_IN) evts |= Loop::IO::READ;
    if (interest & socket_map::SOCK_OUT) evts |= Loop::IO::WRITE;

    it->second->setFd(s);
    it->second->setRequestedEvents(evts);

    return CURLM_OK;
}

//---------------------------------------------------------------------------------------------------------------------
// CONSTRUCTORS/DESTRUCTOR
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief mhandle - Constructor
 * @param loop The loop that will be used by the session to drive its transfer(s).
 *
 * @warning The loop should outlive the session
 * @warning The loop should not be accessed in any other thread
 */
mhandle::mhandle(loop::Loop& loop)
  : curl_multi__{ curl_multi_init() }
  , loop__{ loop }
  , timeout__{ std::make_unique<Loop::Timeout>(loop__) }
  , idle__{ std::make_unique<Loop::Timeout>(loop__) }
  , resume__{ std::make_unique<Loop::Timeout>(loop__) }
{
    if (nullptr == curl_multi__) throw std::runtime_error("Unable to create underlying stack");

    // Setup timer callback and data
    timeout__->onTimeout([this]() {
        dispatch_guard guard{ dispatching__ };
        socket_action(CURL_SOCKET_TIMEOUT, 0);
    });
    curl_multi_setopt(curl_multi__, CURLMOPT_TIMERDATA, this);
    curl_multi_setopt(curl_multi__, CURLMOPT_TIMERFUNCTION, timer_callback);

    // Setup socket callback and data
    curl_multi_setopt(curl_multi__, CURLMOPT_SOCKETDATA, this);
    curl_multi_setopt(curl_multi__, CURLMOPT_SOCKETFUNCTION, socket_callback);

    idle__->onTimeout([this]() {
        dispatch_guard guard{ dispatching__ };

        outcome__ = MHDL_IDLE_TIMEOUT;
        if (nullptr != waiting__)
        {
            log(waiting__, "Idle timeout");
            stop_handle(*waiting__, "Idle timeout");
            waiting__ = nullptr;
        }
        loop__.exit();
    });

    resume__->onTimeout([this]() {
        dispatch_guard guard{ dispatching__ };

        resume_armed__ = false;
        resume_all();
    });
}

/**
 * @brief ~mhandle - Destructor
 */
mhandle::~mhandle() noexcept
{
    close();
    ios__.clear();
}

//---------------------------------------------------------------------------------------------------------------------
// ENGINE
//---------------------------------------------------------------------------------------------------------------------

void
mhandle::socket_action(int fd, int mask) noexcept
{
    if (nullptr == curl_multi__) return;

    if (auto ret{ curl_multi_socket_action(curl_multi__, fd, mask, &running_handles__) }; CURLM_OK != ret)
    {
        handle_stop(ret);
        return;
    }

    handle_msgs();
    schedule_resume();
}

// Paused transfers are retried until their stream endpoint is ready again
void
mhandle::schedule_resume(void) noexcept
{
    if (client_refresh__) client_refresh__();
    if (resume_armed__ || nullptr == curl_multi__) return;

    for (const auto& [raw, h] : handles__)
    {
        if (!h->is_paused(CURLPAUSE_ALL)) continue;

        resume_armed__ = true;
        resume__->set(RESUME_MS);
        return;
    }
}

void
mhandle::resume_all(void) noexcept
{
    std::vector<handle*> paused;

    for (const auto& [raw, h] : handles__)
        if (h->is_paused(CURLPAUSE_ALL)) paused.push_back(h);

    for (auto h : paused)
    {
        // A previous resume may have completed (and released) this transfer
        if (this != h->multi_handler__) continue;
        h->resume();
    }

    handle_msgs();
    schedule_resume();
}

void
mhandle::kick_idle(void) noexcept
{
    if (busy__ && idle_ms__ > 0) idle__->set(idle_ms__);
}

void
mhandle::prune_ios(void) noexcept
{
    if (0 != dispatching__) return;

    for (auto it{ std::begin(ios__) }; std::end(ios__) != it;)
    {
        if (socket_map::SOCK_NONE == sockets__.interest(it->first))
            it = ios__.erase(it);
        else
            ++it;
    }
}

void
mhandle::log(const handle* h, std::string_view msg) const
{
    if (!cb_debug__) return;

    std::string line{ (nullptr == h) ? std::string{ "-" } : std::to_string(h->id()) };
    line.append(": ").append(sanitized(msg));
    cb_debug__(line);
}

mhandle::MHDL_RetCode
mhandle::outcome_of(const handle& h) noexcept
{
    switch (h.state())
    {
        case handle::HDL_COMPLETE_OK: return MHDL_OK;
        case handle::HDL_COMPLETE_ERROR: return MHDL_TRANSFER_FAILED;
        default: return MHDL_BAD_HANDLE;
    }
}

//---------------------------------------------------------------------------------------------------------------------
// HANDLERS INTERFACE
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief add_handle - Adds an handle (a transfer) to the multi session.
 *
 * By doing so, you give control of the transfer over the multi session.
 * The multi session controls a cache of connections that are shared between its transfers, so you can safely remove a
 * handler without losing connections.
 * A transfer that already completed is performed again (its previous results are dropped).
 * @param h The handle to add
 * @return A return code described by the \a MHDL_RetCode enumerate
 *
 * @note If you want to add an handle from another session, you must first remove it from its previous session.
 */
mhandle::MHDL_RetCode
mhandle::add_handle(handle& h) noexcept
{
    if (nullptr == curl_multi__) return MHDL_STOPPED;
    if (this == h.multi_handler__) return MHDL_ADD_ALREADY;
    if (nullptr != h.multi_handler__) return MHDL_ADD_OWNED;
    if (nullptr == h.raw() || handle::HDL_CLOSED == h.state() || handle::HDL_IN_PROGRESS == h.state())
        return MHDL_BAD_HANDLE;

    CURL* raw{ static_cast<CURL*>(h.raw()) };

    h.start();
    if (auto ret{ curl_multi_add_handle(curl_multi__, raw) }; CURLM_OK != ret)
    {
        h.abort(curl_multi_strerror(ret));
        return (CURLM_OUT_OF_MEMORY == ret) ? MHDL_OUT_OF_MEM : MHDL_INTERNAL_ERROR;
    }

    h.multi_handler__ = this;
    handles__[raw]    = &h;
    log(&h, "Added " + h.method() + " " + h.url());

    // Start everything if needed (first handler added)
    if (0 == running_handles__ && 0 == dispatching__) socket_action(CURL_SOCKET_TIMEOUT, 0);

    return MHDL_OK;
}

// Unregister a transfer, leaving its state as is
mhandle::MHDL_RetCode
mhandle::detach(handle& h) noexcept
{
    if (nullptr == h.multi_handler__) return MHDL_REMOVE_ALREADY;
    if (this != h.multi_handler__) return MHDL_REMOVE_OWNED;

    CURL* raw{ static_cast<CURL*>(h.raw()) };
    if (nullptr != curl_multi__)
    {
        if (auto ret{ curl_multi_remove_handle(curl_multi__, raw) }; CURLM_OK != ret) return MHDL_INTERNAL_ERROR;
    }

    h.multi_handler__ = nullptr;
    handles__.erase(raw);
    sockets__.release(&h);

    return MHDL_OK;
}

/**
 * @brief remove_handle - Removes a given handle (a transfer) from the multi_handle.
 *
 * This will remove the specified handle from this multi session control.
 * After removal, it is perfectly legal to reuse the handle (e.g. by assigning it to another multi_handle)
 * @param h The handle to remove
 * @return A return code described by the \a MHDL_RetCode enumerate (MHDL_REMOVE_ALREADY if it was not registered)
 *
 * @note The state of the transfer is left untouched (\see mhandle::stop_handle to terminate it), unless it is the
 * transfer a do_handle()/bridge_handle() call is waiting for: that call then ends it with MHDL_STOPPED.
 */
mhandle::MHDL_RetCode
mhandle::remove_handle(handle& h) noexcept
{
    auto ret{ detach(h) };
    if (MHDL_OK != ret) return ret;

    log(&h, "Removed");

    // Nothing left to wait for
    if (&h == waiting__)
    {
        waiting__ = nullptr;
        outcome__ = MHDL_STOPPED;
        loop__.exit();
    }
    return ret;
}

/**
 * @brief stop_handle - Terminate a transfer and remove it from the session
 *
 * The transfer ends in HDL_COMPLETE_ERROR, its error string carrying the reason.
 * Its done callback is not called.
 * @param h The handle to stop
 * @param reason Why it is stopped
 * @return A return code described by the \a MHDL_RetCode enumerate
 */
mhandle::MHDL_RetCode
mhandle::stop_handle(handle& h, std::string_view reason) noexcept
{
    auto ret{ detach(h) };
    if (MHDL_OK != ret) return ret;

    h.abort(reason);
    log(&h, "Stopped: " + std::string(reason));

    return ret;
}

/**
 * @brief raw get the raw curl multi-handle (CURLM::handle)
 *
 * @warning You should not be using this, unless you absolutely need to use curl features that are not provided by
 * the \a muxcurl library.
 * @return then raw multi-handle
 */
void*
mhandle::raw(void) noexcept
{
    return curl_multi__;
}

/**
 * @brief close - End the session
 *
 * Every transfer still registered is terminated (HDL_COMPLETE_ERROR) and its done callback receives
 * HDL_MULTI_STOPPED. Safe to call several times.
 */
void
mhandle::close(void) noexcept
{
    if (nullptr == curl_multi__) return;

    auto handles{ std::move(handles__) };
    handles__.clear();

    for (auto& [raw, h] : handles)
    {
        curl_multi_remove_handle(curl_multi__, static_cast<CURL*>(raw));
        h->multi_handler__ = nullptr;
        sockets__.release(h);
        h->abort("Session closed");
    }

    timeout__->cancel();
    idle__->cancel();
    resume__->cancel();
    resume_armed__ = false;

    curl_multi_cleanup(curl_multi__);
    curl_multi__      = nullptr;
    running_handles__ = 0;

    sockets__.clear();
    for (auto& [fd, io] : ios__)
        io->setRequestedEvents(0);
    prune_ios();

    if (nullptr != waiting__ || busy__)
    {
        waiting__ = nullptr;
        outcome__ = MHDL_STOPPED;
        loop__.exit();
    }

    for (auto& [raw, h] : handles)
        if (h->cb_done__) h->cb_done__(handle::HDL_MULTI_STOPPED);
}

/**
 * @brief check_sockets - Check the socket bookkeeping
 * @return true if every watched socket has a direction and belongs to libcurl or to a registered transfer
 */
bool
mhandle::check_sockets(void) const
{
    return sockets__.consistent([this](const handle* h) {
        for (const auto& [raw, registered] : handles__)
            if (registered == h) return true;
        return false;
    });
}

//---------------------------------------------------------------------------------------------------------------------
// BLOCKING INTERFACE
// The session loop runs until the awaited transfer is done. Other transfers keep progressing meanwhile.
//---------------------------------------------------------------------------------------------------------------------

mhandle::MHDL_RetCode
mhandle::register_handle(handle& h) noexcept
{
    if (nullptr == curl_multi__) return MHDL_STOPPED;
    if (busy__) return MHDL_BAD_PARAM;
    if (this == h.multi_handler__) return MHDL_OK;
    if (nullptr != h.multi_handler__) return MHDL_ADD_OWNED;

    // Already performed (e.g. while waiting for another transfer)
    if (handle::HDL_COMPLETE_OK == h.state() || handle::HDL_COMPLETE_ERROR == h.state()) return MHDL_OK;

    return add_handle(h);
}

mhandle::MHDL_RetCode
mhandle::wait_for(handle& h, long idle_ms) noexcept
{
    if (this != h.multi_handler__ || h.completed()) return outcome_of(h);

    busy__    = true;
    waiting__ = &h;
    outcome__ = MHDL_OK;
    idle_ms__ = idle_ms;
    kick_idle();

    loop__.run();

    idle__->cancel();
    busy__    = false;
    idle_ms__ = 0;

    // The loop was exited by someone else
    if (&h == waiting__)
    {
        waiting__ = nullptr;
        stop_handle(h, "Stopped");
        outcome__ = MHDL_STOPPED;
    }

    // Removed from the session while waited for
    if (nullptr == h.multi_handler__ && handle::HDL_IN_PROGRESS == h.state()) h.abort("Stopped");

    prune_ios();

    if (MHDL_OK == outcome__) return outcome_of(h);
    return outcome__;
}

/**
 * @brief do_handle - Perform a transfer and wait for its completion
 *
 * The handle is added to the session if needed. A transfer that already completed (e.g. while waiting for another
 * one) is not performed again.
 * @param h The transfer
 * @param idle_ms Give up after this many milliseconds without socket activity (0: never)
 * @return MHDL_OK, MHDL_TRANSFER_FAILED, MHDL_IDLE_TIMEOUT, MHDL_STOPPED or an add_handle() error
 */
mhandle::MHDL_RetCode
mhandle::do_handle(handle& h, long idle_ms) noexcept
{
    if (idle_ms < 0) return MHDL_BAD_PARAM;
    if (auto ret{ register_handle(h) }; MHDL_OK != ret) return ret;

    return wait_for(h, idle_ms);
}

/**
 * @brief bridge_handle - Perform a bridged transfer for a client socket and wait for its completion
 *
 * On top of do_handle(), the client socket is watched:
 * <ul>
 * <li> closed (or failed) by its peer: the transfer is stopped, MHDL_CLIENT_CLOSED </li>
 * <li> readable: a transfer paused waiting for request bytes is resumed </li>
 * <li> writable: a transfer paused waiting for the client to drain is resumed </li>
 * </ul>
 * @param h The transfer (\see handle::bridge)
 * @param client_fd The client socket
 * @param idle_ms Give up after this many milliseconds without socket activity (0: never)
 * @return MHDL_OK, MHDL_TRANSFER_FAILED, MHDL_IDLE_TIMEOUT, MHDL_CLIENT_CLOSED, MHDL_STOPPED or an add_handle() error
 */
mhandle::MHDL_RetCode
mhandle::bridge_handle(handle& h, int client_fd, long idle_ms) noexcept
{
    if (client_fd < 0 || idle_ms < 0) return MHDL_BAD_PARAM;
    if (auto ret{ register_handle(h) }; MHDL_OK != ret) return ret;
    if (this != h.multi_handler__ || h.completed()) return outcome_of(h);

    auto client{ std::make_unique<Loop::IO>(client_fd, loop__) };
    auto io{ client.get() };
    bool unread{ false }; // client bytes not taken by the transfer yet

    client_refresh__ = [this, &h, io, &unread]() {
        short int evts{ 0 };

        if (this != h.multi_handler__)
        {
            io->setRequestedEvents(0);
            return;
        }
        if (!unread || h.is_paused(CURLPAUSE_SEND)) evts |= Loop::IO::READ;
        if (h.is_paused(CURLPAUSE_RECV)) evts |= Loop::IO::WRITE;
        io->setRequestedEvents(evts);
    };

    client->onEvent([this, &h, io, client_fd, &unread](int evt) {
        dispatch_guard guard{ dispatching__ };

        kick_idle();
        if (this != h.multi_handler__) return;

        if (evt & Loop::IO::READ)
        {
            char c;
            auto ret{ ::recv(client_fd, &c, 1, MSG_PEEK | MSG_DONTWAIT) };

            if (0 == ret || (ret < 0 && !_would_block()))
            {
                log(&h, "Client closed");
                io->setRequestedEvents(0);
                waiting__ = nullptr;
                outcome__ = MHDL_CLIENT_CLOSED;
                stop_handle(h, "Client closed");
                loop__.exit();
                return;
            }

            if (ret > 0)
            {
                unread = !h.is_paused(CURLPAUSE_SEND);
                if (!unread) h.resume();
            }
        }

        if ((evt & Loop::IO::WRITE) && h.is_paused(CURLPAUSE_RECV)) h.resume();

        handle_msgs();
        schedule_resume();
    });
    client_refresh__();

    auto ret{ wait_for(h, idle_ms) };

    client_refresh__ = nullptr;
    client->setRequestedEvents(0);
    return ret;
}

/**
 * @brief tunnel_handle - Relay raw bytes between a client socket and the socket of a completed CONNECT transfer
 *
 * When the CONNECT went to a proxy without tunnelling (the client authenticates itself), the request line and the
 * request headers are sent first.
 * The relay ends when either side closes (bytes already read are still delivered) or after the idle window.
 * The transfer is then removed from the session, which closes its connection.
 * @param h The CONNECT transfer, completed
 * @param client_fd The client socket
 * @param idle_ms Give up after this many milliseconds without socket activity (0: never)
 * @return MHDL_OK, MHDL_IDLE_TIMEOUT, MHDL_STOPPED, MHDL_BAD_HANDLE or MHDL_BAD_PARAM
 */
mhandle::MHDL_RetCode
mhandle::tunnel_handle(handle& h, int client_fd, long idle_ms) noexcept
{
    if (client_fd < 0 || idle_ms < 0) return MHDL_BAD_PARAM;
    if (busy__) return MHDL_BAD_PARAM;
    if ("CONNECT" != h.method() || handle::HDL_COMPLETE_OK != h.state() || h.sock__ < 0) return MHDL_BAD_HANDLE;

    const int   server_fd{ h.sock__ };
    std::string to_server;
    std::string to_client;
    bool        closing{ false };
    bool        client_broken{ false };
    bool        server_broken{ false };
    size_t      up{ 0 };
    size_t      down{ 0 };

    // No watcher may be left on the sockets we are about to watch
    if (0 == dispatching__)
    {
        ios__.erase(server_fd);
        ios__.erase(client_fd);
    }

    if (!h.is_tunnel() && !h.proxy__.empty())
    {
        auto target{ h.url() };
        if (0 == target.rfind("http://", 0)) target.erase(0, 7);

        to_server = h.method() + " " + target + " " + h.version__ + "\r\n";
        for (const auto& hdr : h.delayed__)
            to_server.append(header_list::line(hdr)).append("\r\n");
        to_server.append("\r\n");
    }

    auto cio{ std::make_unique<Loop::IO>(client_fd, loop__) };
    auto sio{ std::make_unique<Loop::IO>(server_fd, loop__) };

    auto refresh = [&]() {
        short int cevts{ 0 };
        short int sevts{ 0 };

        if (!closing)
        {
            if (std::size(to_server) < TUNNEL_CHUNK) cevts |= Loop::IO::READ;
            if (std::size(to_client) < TUNNEL_CHUNK) sevts |= Loop::IO::READ;
        }
        if (!to_client.empty() && !client_broken) cevts |= Loop::IO::WRITE;
        if (!to_server.empty() && !server_broken) sevts |= Loop::IO::WRITE;

        cio->setRequestedEvents(cevts);
        sio->setRequestedEvents(sevts);

        if (closing && 0 == cevts && 0 == sevts) loop__.exit();
    };

    // One direction of the relay: from -> queue -> to
    auto pump = [&](int evt, int fd, std::string& out, std::string& in, size_t& cnt, bool& broken) {
        if (evt & Loop::IO::READ)
        {
            char buf[TUNNEL_CHUNK];
            auto ret{ ::recv(fd, buf, sizeof(buf), MSG_DONTWAIT) };

            if (ret > 0)
            {
                out.append(buf, static_cast<size_t>(ret));
                cnt += static_cast<size_t>(ret);
            }
            else if (0 == ret || !_would_block())
            {
                closing = true;
            }
        }
        if ((evt & Loop::IO::WRITE) && !in.empty())
        {
            auto ret{ ::send(fd, in.data(), std::size(in), MSG_DONTWAIT | MSG_NOSIGNAL) };

            if (ret > 0)
                in.erase(0, static_cast<size_t>(ret));
            else if (ret < 0 && !_would_block())
            {
                broken  = true;
                closing = true;
                in.clear();
            }
        }
    };

    cio->onEvent([&](int evt) {
        dispatch_guard guard{ dispatching__ };
        kick_idle();
        pump(evt, client_fd, to_server, to_client, up, client_broken);
        refresh();
    });
    sio->onEvent([&](int evt) {
        dispatch_guard guard{ dispatching__ };
        kick_idle();
        pump(evt, server_fd, to_client, to_server, down, server_broken);
        refresh();
    });

    log(&h, "Tunnel to " + h.url());

    busy__    = true;
    waiting__ = nullptr;
    outcome__ = MHDL_OK;
    idle_ms__ = idle_ms;
    kick_idle();
    refresh();

    loop__.run();

    idle__->cancel();
    busy__    = false;
    idle_ms__ = 0;
    cio->setRequestedEvents(0);
    sio->setRequestedEvents(0);

    if (MHDL_OK == outcome__ && !closing) outcome__ = MHDL_STOPPED;

    log(&h, "Tunnel closed: " + std::to_string(up) + " bytes up, " + std::to_string(down) + " bytes down");

    sio.reset();
    cio.reset();
    if (this == h.multi_handler__) detach(h);

    return outcome__;
}

//---------------------------------------------------------------------------------------------------------------------
// OPTIONS
// Change specific multi handle options - allowing to control the way it will behave.
// \see https://curl.se/libcurl/c/curl_multi_setopt.html
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief set_opt_long - Set an information element (\see CURLMOPT type) of type long
 *
 * @param id The information's id to set
 * @param val The value to set
 * @return A return code described by the \a MHDL_RetCode enumerate
 */
mhandle::MHDL_RetCode
mhandle::set_opt_long(int id, long val) noexcept
{
    if (nullptr == curl_multi__) return MHDL_STOPPED;
    return (CURLM_OK == curl_multi_setopt(curl_multi__, static_cast<CURLMoption>(id), val)) ? MHDL_OK
                                                                                            : MHDL_INTERNAL_ERROR;
}

/**
 * @brief set_opt_ptr - Set an information element (\see CURLMOPT type) of type ptr
 *
 * @param id The information's id to set
 * @param val The value to set
 * @return A return code described by the \a MHDL_RetCode enumerate
 */
mhandle::MHDL_RetCode
mhandle::set_opt_ptr(int id, const void* val) noexcept
{
    if (nullptr == curl_multi__) return MHDL_STOPPED;
    return (CURLM_OK == curl_multi_setopt(curl_multi__, static_cast<CURLMoption>(id), val)) ? MHDL_OK
                                                                                            : MHDL_INTERNAL_ERROR;
}

mhandle::MHDL_RetCode
mhandle::set_opt_bool(int id, bool val) noexcept
{
    return set_opt_long(id, static_cast<long>(val ? 1 : 0));
}

mhandle::MHDL_RetCode
mhandle::set_opt_offset(int id, long val) noexcept
{
    if (CURLOPTTYPE_OFF_T != (id / 10000) * 10000) return MHDL_BAD_PARAM;
    if (nullptr == curl_multi__) return MHDL_STOPPED;
    return (CURLM_OK == curl_multi_setopt(curl_multi__, static_cast<CURLMoption>(id), static_cast<curl_off_t>(val)))
             ? MHDL_OK
             : MHDL_INTERNAL_ERROR;
}

/**
 * @brief set_opt - Set an option modifying the behaviour of the session
 *
 * The socket and timer options are reserved to the session itself.
 * @param id The identifier of the option to set
 * @param val The value to set
 * @return A return code described by the \a MHDL_RetCode enumerate
 */
mhandle::MHDL_RetCode
mhandle::set_opt(int id, std::any val) noexcept
{
    MHDL_RetCode ret{ MHDL_BAD_PARAM };
    const auto   curType{ (id / 10000) * 10000 };

    if (!val.has_value()) return ret;

    switch (id)
    {
        case CURLMOPT_SOCKETFUNCTION:
        case CURLMOPT_SOCKETDATA:
        case CURLMOPT_TIMERFUNCTION:
        case CURLMOPT_TIMERDATA: return ret;
        default: break;
    }

    if (typeid(long) == val.type() && (CURLOPTTYPE_LONG == curType))
    {
        ret = set_opt_long(id, std::any_cast<long>(val));
    }
    else if (typeid(long) == val.type() && (CURLOPTTYPE_OFF_T == curType))
    {
        ret = set_opt_offset(id, std::any_cast<long>(val));
    }
    else if (typeid(bool) == val.type() && (CURLOPTTYPE_LONG == curType))
    {
        ret = set_opt_bool(id, std::any_cast<bool>(val));
    }
    else if (typeid(void*) == val.type() && (CURLOPTTYPE_OBJECTPOINT == curType))
    {
        ret = set_opt_ptr(id, std::any_cast<void*>(val));
    }

    return ret;
}

/**
 * @brief set_max_concurrent_streams - Set the maximum number of concurrent stream (HTTP/2)
 *
 * @param max The maximum number of concurrent streams for connection done using HTTP/2
 * @return A return code described by the \a MHDL_RetCode enumerate
 *
 * @note This is a convenience function - it could be performed using the generic method \see mhandle::set_opt()
 * @see https://curl.se/libcurl/c/CURLMOPT_MAX_CONCURRENT_STREAMS.html
 */
mhandle::MHDL_RetCode
mhandle::set_max_concurrent_streams(long max) noexcept
{
    return set_opt_long(CURLMOPT_MAX_CONCURRENT_STREAMS, max);
}

/**
 * @brief set_max_host_connections - Set the maximum connections to host
 *
 * @param max The maximum amount of simultaneously open connections to a single host (hostname + port)
 * @return A return code described by the \a MHDL_RetCode enumerate
 *
 * @see https://curl.se/libcurl/c/CURLMOPT_MAX_HOST_CONNECTIONS.html
 */
mhandle::MHDL_RetCode
mhandle::set_max_host_connections(long max) noexcept
{
    return set_opt_long(CURLMOPT_MAX_HOST_CONNECTIONS, max);
}

/**
 * @brief set_max_total_connections - Set the maximum number of simultaneously open connections
 *
 * When reaching the limit, the transfers will be pending until there are available connections
 * @param max The maximum amount of simultaneously open connections
 * @return A return code described by the \a MHDL_RetCode enumerate
 *
 * @see https://curl.se/libcurl/c/CURLMOPT_MAX_TOTAL_CONNECTIONS.html
 */
mhandle::MHDL_RetCode
mhandle::set_max_total_connections(long max) noexcept
{
    return set_opt_long(CURLMOPT_MAX_TOTAL_CONNECTIONS, max);
}

/**
 * @brief set_maxconnects - Set the size of the connections cache
 *
 * Setting this limit can prevent the cache from growing too much
 * @param max The maximum amount of cached connections
 * @return A return code described by the \a MHDL_RetCode enumerate
 *
 * @see https://curl.se/libcurl/c/CURLMOPT_MAXCONNECTS.html
 */
mhandle::MHDL_RetCode
mhandle::set_maxconnects(long max) noexcept
{
    return set_opt_long(CURLMOPT_MAXCONNECTS, max);
}

/**
 * @brief set_pipelining - Enable/disable HTTP/2 multiplexing
 *
 * @param mask CURLPIPE_NOTHING | CURLPIPE_MULTIPLEX
 * @return A return code described by the \a MHDL_RetCode enumerate
 *
 * @see https://curl.se/libcurl/c/CURLMOPT_PIPELINING.html
 */
mhandle::MHDL_RetCode
mhandle::set_pipelining(long mask) noexcept
{
    return set_opt_long(CURLMOPT_PIPELINING, mask);
}

//---------------------------------------------------------------------------------------------------------------------
// CALLBACKS
// The sessions are event-driven (by miniloop) and need to setup callbacks to miniloop in order to work properly
// \see https://curl.se/libcurl/c/libcurl-multi.html
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief set_cb_error - Set error callback
 *
 * @param cb The callback used when the multi-session fails
 */
void
mhandle::set_cb_error(const TCbError& cb) noexcept
{
    cb_error__ = cb;
}

/**
 * @brief set_cb_debug - Set the diagnostics sink of the session (add/remove/stop, idle, tunnel)
 */
void
mhandle::set_cb_debug(const TCbDebug& cb) noexcept
{
    cb_debug__ = cb;
}

/**
 * @brief mhandle::handle_stop - Manage the failure of the session
 *
 * This will terminate any individual transfer managed by the session (and call their done callback if any).
 * It will then cleanup its internal structures and call its error callback if any.
 * @param errCode The code associated to the stop (e.g. CURLM_OK for a 'normal' stop or another code in case of error)
 */
void
mhandle::handle_stop(int errCode) noexcept
{
    if (CURLM_OK != errCode)
        log(nullptr, std::string("Session failed: ") + curl_multi_strerror(static_cast<CURLMcode>(errCode)));

    close();

    if (CURLM_OK != errCode && cb_error__) cb_error__(errCode);
}

/**
 * @brief handle_msgs - Processes messages related to transfers
 *
 * Completed transfers are released by the session, then informed through their done callback.
 * A successful CONNECT stays registered: its connection is closed once it leaves the session (\see tunnel_handle).
 * A bridged transfer still owing response bytes to its streams is completed once they are drained.
 *
 * @see https://curl.se/libcurl/c/curl_multi_info_read.html
 */
void
mhandle::handle_msgs(void) noexcept
{
    int      dumb;
    CURLMsg* msg{ nullptr };

    while (nullptr != curl_multi__ && (msg = curl_multi_info_read(curl_multi__, &dumb)))
    {
        if (CURLMSG_DONE != msg->msg) continue;

        CURL* hdl{ msg->easy_handle };
        auto  code{ msg->data.result }; // msg is invalid once the transfer is removed
        auto  it{ handles__.find(hdl) };

        if (std::end(handles__) == it) continue;

        handle* h{ it->second };

        // Bytes accepted from libcurl are still owed to the client
        if (h->has_pending())
        {
            h->draining__   = true;
            h->drain_code__ = code;
            h->flags__      = CURLPAUSE_RECV;
            log(h, "Draining");
            continue;
        }

        complete(*h, code);
    }

    std::vector<handle*> drained;
    for (const auto& [raw, h] : handles__)
        if (h->draining__ && !h->is_paused(CURLPAUSE_ALL)) drained.push_back(h);

    for (auto h : drained)
    {
        // A previous done callback may have changed it
        if (this != h->multi_handler__ || !h->draining__) continue;
        complete(*h, h->drain_code__);
    }
}

// Release a transfer libcurl is done with, then report it
void
mhandle::complete(handle& h, int code) noexcept
{
    // libcurl closes the connection of a CONNECT transfer once it leaves the session
    const bool keep{ "CONNECT" == h.method() && CURLE_OK == code };

    if (!keep) detach(h);
    h.finish(code);
    if (keep && handle::HDL_COMPLETE_OK != h.state()) detach(h);

    log(&h,
        "Done: " + std::string(curl_easy_strerror(static_cast<CURLcode>(code))) + " (" + std::to_string(code) + ")");

    if (&h == waiting__)
    {
        waiting__ = nullptr;
        outcome__ = outcome_of(h);
        loop__.exit();
    }

    if (h.cb_done__) h.cb_done__(code);
}

/**
 * @brief retCode2Str - Gives a human readable string for each retcodes
 *
 * @param rc The retcode
 * @return A human-readable representation of the retcode meaning
 */
std::string_view
mhandle::retCode2Str(mhandle::MHDL_RetCode rc) noexcept
{
    static const std::map<MHDL_RetCode, std::string_view> _retcodeMap{
        { MHDL_OK, "ok" },
        { MHDL_BAD_PARAM, "bad parameter" },
        { MHDL_ADD_OWNED, "handle already owned by another session" },
        { MHDL_ADD_ALREADY, "handle already owned by this session" },
        { MHDL_REMOVE_OWNED, "handle already owned by another session" },
        { MHDL_REMOVE_ALREADY, "handle not owned by this session" },
        { MHDL_BAD_HANDLE, "invalid handle" },
        { MHDL_OUT_OF_MEM, "out of memory" },
        { MHDL_INTERNAL_ERROR, "internal error" },
        { MHDL_TRANSFER_FAILED, "transfer failed" },
        { MHDL_IDLE_TIMEOUT, "idle timeout" },
        { MHDL_CLIENT_CLOSED, "client closed" },
        { MHDL_STOPPED, "session stopped" },
    };

    auto it{ _retcodeMap.find(rc) };
    return (std::end(_retcodeMap) == it) ? "unknown" : it->second;
}

} // namespace muxcurl
