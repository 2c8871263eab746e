/**
 * Copyright (C) 2023 Osmozis SA - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

/**
 * @file headers.hpp
 * @brief Ordered set of request headers, backed by a curl_slist
 * \see https://curl.se/libcurl/c/CURLOPT_HTTPHEADER.html for more informations
 *
 * Header names are compared case-insensitively and a later write to an existing name replaces its value in place.
 * An empty value is a removal signal: it is emitted as "Name:" so that libcurl drops its own default header.
 * @author lhm
 */

#ifndef INCLUDE_MUXCURL_HEADERS_H
#define INCLUDE_MUXCURL_HEADERS_H

#include <cstddef> // size_t
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct curl_slist;

namespace muxcurl
{
class handle;

class header_list
{
public:
    using entry          = std::pair<std::string, std::string>;
    using const_iterator = std::vector<entry>::const_iterator;

private:
    std::vector<entry> entries__{};
    curl_slist*        raw__{ nullptr }; /*!< Built on demand by header_list::build() */
    friend class handle;

    void free_raw() noexcept;

public:
    header_list() noexcept = default;
    header_list(std::initializer_list<entry>);
    header_list(const header_list& o);
    header_list& operator=(const header_list& o);
    header_list(header_list&& o) noexcept;
    header_list& operator=(header_list&& o) noexcept;
    ~header_list() noexcept;

    void set(std::string_view name, std::string_view value);
    bool erase(std::string_view name) noexcept;
    void merge(const header_list& o);
    void clear() noexcept;

    const std::string* find(std::string_view name) const noexcept;

    bool           empty() const noexcept { return entries__.empty(); }
    size_t         size() const noexcept { return entries__.size(); }
    const_iterator begin() const noexcept { return entries__.cbegin(); }
    const_iterator end() const noexcept { return entries__.cend(); }

    static std::string line(const entry&);

    // Access to the raw curl list (valid until the next modification)
    curl_slist* build();
};

bool iequals(std::string_view lhs, std::string_view rhs) noexcept;

} // namespace muxcurl

#endif // INCLUDE_MUXCURL_HEADERS_H
