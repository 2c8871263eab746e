/**
 * Copyright (C) 2023 Osmozis SA - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

#include <muxcurl/socket_map.hpp>

namespace muxcurl
{
/**
 * @brief update - Apply an event reported by libcurl for a socket
 *
 * @param fd The socket
 * @param owner The transfer libcurl reported the event for (nullptr if the transfer is not one of ours)
 * @param what The event (SOCK_IN, SOCK_OUT, SOCK_INOUT or SOCK_REMOVE)
 * @return The interest now recorded for the socket (SOCK_NONE once removed)
 * @throw std::bad_alloc if a new socket cannot be recorded
 */
int
socket_map::update(int fd, handle* owner, int what)
{
    if (fd < 0) return SOCK_NONE;

    if (SOCK_REMOVE == what || SOCK_NONE == what || (what & ~SOCK_INOUT))
    {
        sockets__.erase(fd);
        return SOCK_NONE;
    }

    auto& info{ sockets__[fd] };
    info.owner    = owner;
    info.interest = what;
    return info.interest;
}

/**
 * @brief release - Detach a transfer from the sockets it owns
 *
 * The sockets stay watched: libcurl may still need them (connection cache, multiplexing) and will report their
 * removal itself.
 * @param owner The transfer leaving the session
 * @return The number of sockets that were detached
 */
int
socket_map::release(const handle* owner) noexcept
{
    int cnt{ 0 };

    if (nullptr == owner) return cnt;

    for (auto& [fd, info] : sockets__)
    {
        if (owner != info.owner) continue;
        info.owner = nullptr;
        ++cnt;
    }
    return cnt;
}

const socket_map::socket_info*
socket_map::find(int fd) const noexcept
{
    auto it{ sockets__.find(fd) };
    return (std::end(sockets__) == it) ? nullptr : &it->second;
}

int
socket_map::interest(int fd) const noexcept
{
    auto info{ find(fd) };
    return (nullptr == info) ? SOCK_NONE : info->interest;
}

handle*
socket_map::owner(int fd) const noexcept
{
    auto info{ find(fd) };
    return (nullptr == info) ? nullptr : info->owner;
}

/**
 * @brief consistent - Check the invariants of the map
 *
 * <ul>
 * <li> every recorded socket is watched in at least one direction </li>
 * <li> every owned socket belongs to a transfer that is still registered </li>
 * </ul>
 * @param registered Predicate telling whether a transfer is registered
 * @return true if both invariants hold
 */
bool
socket_map::consistent(const std::function<bool(const handle*)>& registered) const
{
    for (const auto& [fd, info] : sockets__)
    {
        if (fd < 0 || SOCK_NONE == info.interest || (info.interest & ~SOCK_INOUT)) return false;
        if (nullptr != info.owner && !registered(info.owner)) return false;
    }
    return true;
}

} // namespace muxcurl
