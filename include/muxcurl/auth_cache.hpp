/**
 * Copyright (C) 2023 Osmozis SA - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

/**
 * @file auth_cache.hpp
 * @brief Remembers which proxy authentication mechanism works for a given upstream proxy
 * \see https://curl.se/libcurl/c/CURLOPT_PROXYAUTH.html for more informations
 *
 * libcurl negotiates proxy authentication with several round trips when more than one mechanism is allowed.
 * Once a transfer has gone through this negotiation, the mechanism the proxy accepted is stored here so that the
 * following transfers to the same proxy can ask for it directly.
 * A proxy that rejected every allowed mechanism is flagged as failed and further transfers fail fast.
 *
 * The cache is shared between transfers (and threads): lookups take a shared lock, updates an exclusive one.
 * @author lhm
 */

#ifndef INCLUDE_MUXCURL_AUTH_CACHE_H
#define INCLUDE_MUXCURL_AUTH_CACHE_H

#include <cstddef> // size_t
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <tuple>

namespace muxcurl
{
/**
 * @brief proxy_identity - Key of the cache
 * The principal is the proxy user name (":" for single sign-on). An empty principal holds what is known of the proxy
 * whatever the credentials.
 */
struct proxy_identity
{
    std::string host{};
    long        port{ 0 };
    std::string principal{};

    friend bool operator<(const proxy_identity& lhs, const proxy_identity& rhs)
    {
        return std::tie(lhs.host, lhs.port, lhs.principal) < std::tie(rhs.host, rhs.port, rhs.principal);
    }
    friend bool operator==(const proxy_identity& lhs, const proxy_identity& rhs)
    {
        return std::tie(lhs.host, lhs.port, lhs.principal) == std::tie(rhs.host, rhs.port, rhs.principal);
    }
};

/*********************************************************************************************************************/
class auth_cache
{
public:
    /**
     * @brief AUTH_State describes what is known about a proxy identity
     */
    typedef enum
    {
        AUTH_UNKNOWN = 0, /*!< Nothing negotiated yet */
        AUTH_KNOWN,       /*!< A mechanism has been confirmed working */
        AUTH_FAILED       /*!< The proxy rejected every mechanism that was tried */
    } AUTH_State;

    struct lookup_ret
    {
        AUTH_State    state{ AUTH_UNKNOWN };
        unsigned long mechanism{ 0 }; /*!< CURLAUTH_* bit of the working mechanism (if AUTH_KNOWN) */
    };

private:
    struct entry
    {
        unsigned long mechanism{ 0 };
        bool          failed{ false };
    };

    mutable std::shared_mutex         mutex__{};
    std::map<proxy_identity, entry> entries__{};

public:
    auth_cache() = default;

    auth_cache(const auth_cache&) = delete;
    auth_cache& operator=(const auth_cache&) = delete;

    static std::shared_ptr<auth_cache> shared();

    lookup_ret lookup(const proxy_identity&) const;
    void       record_success(const proxy_identity&, unsigned long mechanism);
    void       record_failure(const proxy_identity&);
    void       clear() noexcept;
    size_t     size() const noexcept;

    static bool             parse_mechanism(std::string_view str, unsigned long& mask) noexcept;
    static unsigned long    mechanism_from_scheme(std::string_view scheme) noexcept;
    static std::string_view mechanism_name(unsigned long mechanism) noexcept;
};

} // namespace muxcurl

#endif // INCLUDE_MUXCURL_AUTH_CACHE_H
