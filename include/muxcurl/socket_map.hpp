/**
 * Copyright (C) 2023 Osmozis SA - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

/**
 * @file socket_map.hpp
 * @brief Bookkeeping of the sockets libcurl asks the session to watch
 * @see https://curl.se/libcurl/c/CURLMOPT_SOCKETFUNCTION.html for more informations
 *
 * libcurl reports add/change/remove events for its sockets through the socket callback.
 * This map mirrors those events (socket -> owner transfer, requested directions) so that the session always watches
 * exactly what libcurl asked for.
 * Sockets used internally by libcurl (e.g. when closing cached connections) have no owner.
 * @author lhm
 */

#ifndef INCLUDE_MUXCURL_SOCKET_MAP_H
#define INCLUDE_MUXCURL_SOCKET_MAP_H

#include <cstddef> // size_t
#include <functional>
#include <iterator>
#include <map>

namespace muxcurl
{
class handle;

/*********************************************************************************************************************/
class socket_map
{
public:
    /**
     * @brief Interest describes the directions watched on a socket (values match libcurl's CURL_POLL_*)
     */
    typedef enum
    {
        SOCK_NONE   = 0, /*!< Not watched */
        SOCK_IN     = 1, /*!< Readable */
        SOCK_OUT    = 2, /*!< Writable */
        SOCK_INOUT  = 3, /*!< Both */
        SOCK_REMOVE = 4  /*!< Event only - stop watching the socket */
    } Interest;

    struct socket_info
    {
        handle* owner{ nullptr };
        int     interest{ SOCK_NONE };
    };

private:
    std::map<int, socket_info> sockets__{};

public:
    int  update(int fd, handle* owner, int what);
    int  release(const handle* owner) noexcept;
    void clear() noexcept { sockets__.clear(); }

    const socket_info* find(int fd) const noexcept;
    int                interest(int fd) const noexcept;
    handle*            owner(int fd) const noexcept;

    size_t size() const noexcept { return std::size(sockets__); }
    bool   empty() const noexcept { return sockets__.empty(); }
    auto   begin() const noexcept { return std::cbegin(sockets__); }
    auto   end() const noexcept { return std::cend(sockets__); }

    bool consistent(const std::function<bool(const handle*)>& registered) const;
};

} // namespace muxcurl

#endif // INCLUDE_MUXCURL_SOCKET_MAP_H
