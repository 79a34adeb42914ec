/*

sanitize.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace mailsend
{
namespace detail
{

/// Characters that end or corrupt a protocol line.
inline constexpr std::string_view LINE_BREAKING_CHARS{"\r\n\0", 3};

inline bool contains_crlf_or_nul(std::string_view value) noexcept
{
    return value.find_first_of(LINE_BREAKING_CHARS) != std::string_view::npos;
}

/**
Refusing a value that would split an SMTP command line.

@param value      Command argument.
@param field_name Name used in the exception text.
@throw std::invalid_argument The value contains CR, LF or NUL.
**/
inline void ensure_no_crlf_or_nul(std::string_view value, std::string_view field_name)
{
    if (contains_crlf_or_nul(value))
        throw std::invalid_argument("Invalid " + std::string(field_name) + ": CR/LF or NUL not allowed.");
}

} // namespace detail
} // namespace mailsend
