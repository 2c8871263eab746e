/**
 * Copyright (C) 2023 Osmozis SA - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

#include <muxcurl/headers.hpp>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <new>

namespace muxcurl
{
//---------------------------------------------------------------------------------------------------------------------
// HELPERS
//---------------------------------------------------------------------------------------------------------------------

bool
iequals(std::string_view lhs, std::string_view rhs) noexcept
{
    return std::size(lhs) == std::size(rhs) &&
           std::equal(std::cbegin(lhs), std::cend(lhs), std::cbegin(rhs), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
           });
}

//---------------------------------------------------------------------------------------------------------------------
// CONSTRUCTORS/DESTRUCTOR
//---------------------------------------------------------------------------------------------------------------------

header_list::header_list(std::initializer_list<entry> init)
{
    for (const auto& [name, value] : init)
        set(name, value);
}

header_list::header_list(const header_list& o)
  : entries__{ o.entries__ }
{}

header_list&
header_list::operator=(const header_list& o)
{
    if (this != &o)
    {
        free_raw();
        entries__ = o.entries__;
    }
    return *this;
}

header_list::header_list(header_list&& o) noexcept
  : entries__{ std::move(o.entries__) }
  , raw__{ std::exchange(o.raw__, nullptr) }
{
    o.entries__.clear();
}

header_list&
header_list::operator=(header_list&& o) noexcept
{
    if (this != &o)
    {
        free_raw();
        entries__ = std::move(o.entries__);
        raw__     = std::exchange(o.raw__, nullptr);
        o.entries__.clear();
    }
    return *this;
}

header_list::~header_list() noexcept
{
    free_raw();
}

//---------------------------------------------------------------------------------------------------------------------
// MODIFIERS
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief set - Add a header, or replace the value of an existing one (case-insensitive name match)
 * @param name The header name (without the colon)
 * @param value The header value - an empty value asks libcurl to remove its own header of that name
 */
void
header_list::set(std::string_view name, std::string_view value)
{
    free_raw();

    auto it{ std::find_if(std::begin(entries__), std::end(entries__),
                          [name](const entry& e) { return iequals(e.first, name); }) };
    if (std::end(entries__) != it)
        it->second = value;
    else
        entries__.emplace_back(name, value);
}

/**
 * @brief erase - Forget a header entirely (nothing is sent to libcurl for it)
 * @return true if the header was present
 */
bool
header_list::erase(std::string_view name) noexcept
{
    auto it{ std::find_if(std::begin(entries__), std::end(entries__),
                          [name](const entry& e) { return iequals(e.first, name); }) };
    if (std::end(entries__) == it) return false;

    free_raw();
    entries__.erase(it);
    return true;
}

/**
 * @brief merge - Apply every entry of another list, keeping the order of first insertion
 */
void
header_list::merge(const header_list& o)
{
    for (const auto& [name, value] : o.entries__)
        set(name, value);
}

void
header_list::clear() noexcept
{
    free_raw();
    entries__.clear();
}

const std::string*
header_list::find(std::string_view name) const noexcept
{
    for (const auto& e : entries__)
        if (iequals(e.first, name)) return &e.second;
    return nullptr;
}

//---------------------------------------------------------------------------------------------------------------------
// RAW LIST
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief line - Format an entry the way libcurl expects it
 * "Name: value", or "Name:" for a removal
 */
std::string
header_list::line(const entry& e)
{
    return e.second.empty() ? e.first + ":" : e.first + ": " + e.second;
}

/**
 * @brief build - Get the curl_slist matching the current entries
 * @return The raw list (nullptr when empty), owned by this object
 *
 * @warning The returned pointer is invalidated by any modification of the list.
 */
curl_slist*
header_list::build()
{
    if (nullptr != raw__ || entries__.empty()) return raw__;

    curl_slist* head{ nullptr };
    for (const auto& e : entries__)
    {
        auto n{ curl_slist_append(head, line(e).c_str()) };
        if (nullptr == n)
        {
            curl_slist_free_all(head);
            throw std::bad_alloc();
        }
        head = n;
    }
    raw__ = head;
    return raw__;
}

void
header_list::free_raw() noexcept
{
    curl_slist_free_all(raw__);
    raw__ = nullptr;
}

} // namespace muxcurl
