/**
 * Copyright (C) 2023 Osmozis SA - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

#include <muxcurl/auth_cache.hpp>
#include <muxcurl/headers.hpp>
#include <curl/curl.h>

#include <mutex>

namespace muxcurl
{
namespace
{
struct mechanism_desc
{
    std::string_view name;
    unsigned long    value;
};

// Single mechanisms first: mechanism_name() returns the first exact match
constexpr mechanism_desc _mechanisms[]{
    { "BASIC", CURLAUTH_BASIC },         { "DIGEST", CURLAUTH_DIGEST },   { "NTLM", CURLAUTH_NTLM },
    { "NEGOTIATE", CURLAUTH_NEGOTIATE }, { "DIGEST_IE", CURLAUTH_DIGEST_IE }, { "BEARER", CURLAUTH_BEARER },
    { "GSSNEGOTIATE", CURLAUTH_NEGOTIATE }, { "ANY", CURLAUTH_ANY },     { "ANYSAFE", CURLAUTH_ANYSAFE },
    { "NONE", CURLAUTH_NONE },
};

bool
_lookup(std::string_view name, unsigned long& val) noexcept
{
    for (const auto& m : _mechanisms)
    {
        if (iequals(m.name, name))
        {
            val = m.value;
            return true;
        }
    }
    return false;
}
} // namespace

//---------------------------------------------------------------------------------------------------------------------
// INSTANCE
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief shared - The process-wide cache, created on first use
 *
 * Transfers use it unless they are given another cache explicitly.
 */
std::shared_ptr<auth_cache>
auth_cache::shared()
{
    static const std::shared_ptr<auth_cache> _instance{ std::make_shared<auth_cache>() };
    return _instance;
}

//---------------------------------------------------------------------------------------------------------------------
// ACCESSORS
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief lookup - Get what is known about a proxy identity
 * @param id The proxy identity
 * @return AUTH_FAILED if the identity has been flagged, AUTH_KNOWN (and the mechanism) if one worked, AUTH_UNKNOWN
 * otherwise
 */
auth_cache::lookup_ret
auth_cache::lookup(const proxy_identity& id) const
{
    entry e;
    {
        std::shared_lock lock{ mutex__ };
        if (auto it{ entries__.find(id) }; std::end(entries__) != it) e = it->second;
    }

    if (e.failed) return { AUTH_FAILED, e.mechanism };
    if (0 != e.mechanism) return { AUTH_KNOWN, e.mechanism };
    return { AUTH_UNKNOWN, 0 };
}

/**
 * @brief record_success - Remember the mechanism a proxy accepted
 *
 * The last recorded mechanism wins. A failure flag set earlier is kept.
 * @param id The proxy identity
 * @param mechanism The CURLAUTH_* bit of the mechanism
 */
void
auth_cache::record_success(const proxy_identity& id, unsigned long mechanism)
{
    if (0 == mechanism) return;

    std::unique_lock lock{ mutex__ };
    entries__[id].mechanism = mechanism;
}

/**
 * @brief record_failure - Flag a proxy identity as rejecting every allowed mechanism
 * @param id The proxy identity
 */
void
auth_cache::record_failure(const proxy_identity& id)
{
    std::unique_lock lock{ mutex__ };
    entries__[id].failed = true;
}

void
auth_cache::clear() noexcept
{
    std::unique_lock lock{ mutex__ };
    entries__.clear();
}

size_t
auth_cache::size() const noexcept
{
    std::shared_lock lock{ mutex__ };
    return std::size(entries__);
}

//---------------------------------------------------------------------------------------------------------------------
// MECHANISMS
// \see https://curl.se/libcurl/c/CURLOPT_HTTPAUTH.html
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief parse_mechanism - Convert a textual mechanism mask into CURLAUTH_* bits
 *
 * Accepted values are the CURLAUTH_ suffixes (e.g. "ANY", "NTLM") and three modifiers:
 * <ul>
 * <li> NO<X> : any mechanism except X (e.g. "NONTLM") </li>
 * <li> SAFENO<X> : any safe mechanism except X (e.g. "SAFENONTLM") </li>
 * <li> ONLY<X> : X and nothing else, even when the proxy offers something else (e.g. "ONLYNTLM") </li>
 * </ul>
 * @param str The textual mask
 * @param mask The parsed mask
 * @return false if the mask is not recognized
 */
bool
auth_cache::parse_mechanism(std::string_view str, unsigned long& mask) noexcept
{
    unsigned long val{ 0 };

    if (_lookup(str, mask)) return true;

    if (0 == str.rfind("SAFENO", 0) && _lookup(str.substr(6), val))
    {
        mask = CURLAUTH_ANYSAFE & ~val;
        return true;
    }
    if (0 == str.rfind("NO", 0) && _lookup(str.substr(2), val))
    {
        mask = CURLAUTH_ANY & ~val;
        return true;
    }
    if (0 == str.rfind("ONLY", 0) && _lookup(str.substr(4), val))
    {
        mask = CURLAUTH_ONLY | val;
        return true;
    }

    return false;
}

/**
 * @brief mechanism_from_scheme - Map the scheme of an Authorization header to its CURLAUTH_* bit
 * @param scheme The scheme (e.g. "Basic", "NTLM", "Negotiate")
 * @return The mechanism, or 0 (CURLAUTH_NONE) when unknown
 */
unsigned long
auth_cache::mechanism_from_scheme(std::string_view scheme) noexcept
{
    unsigned long val{ CURLAUTH_NONE };
    if (!_lookup(scheme, val) || (val & (val - 1)) || CURLAUTH_NONE == val) return CURLAUTH_NONE;
    return val;
}

std::string_view
auth_cache::mechanism_name(unsigned long mechanism) noexcept
{
    for (const auto& m : _mechanisms)
        if (m.value == mechanism) return m.name;
    return "UNKNOWN";
}

} // namespace muxcurl
