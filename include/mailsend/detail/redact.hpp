/*

redact.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Masking of SMTP AUTH secrets before a command line reaches a trace or an
error detail.

*/

#pragma once

#include <algorithm>
#include <string>
#include <string_view>

namespace mailsend::detail
{

inline constexpr std::string_view REDACTED{"<redacted>"};

[[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
{
    auto upper = [](char ch) { return ch >= 'a' && ch <= 'z' ? static_cast<char>(ch - ('a' - 'A')) : ch; };
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(),
        [&upper](char ca, char cb) { return upper(ca) == upper(cb); });
}

/// Taking the next space separated word off the front of `text`.
inline std::string_view next_word(std::string_view& text) noexcept
{
    const auto begin = text.find_first_not_of(' ');
    if (begin == std::string_view::npos)
    {
        text = {};
        return {};
    }
    text.remove_prefix(begin);
    const auto end = std::min(text.find(' '), text.size());
    const std::string_view word = text.substr(0, end);
    text.remove_prefix(end);
    return word;
}

/**
Redacting the secret part of a client line.

`AUTH <mechanism> <initial-response>` keeps the mechanism and hides the response. SASL continuation lines carry no
verb to recognize them by; they are sent with `dialog::write_secret_line()` and never reach this function.

@param line Line as sent, with or without the trailing CRLF.
@return     Line with secrets replaced by `<redacted>`, trailing CRLF preserved.
**/
[[nodiscard]] inline std::string redact_line(std::string_view line)
{
    const auto content_end = line.find_last_not_of("\r\n");
    if (content_end == std::string_view::npos)
        return std::string(line);
    const std::string_view terminator = line.substr(content_end + 1);

    std::string_view rest = line.substr(0, content_end + 1);
    const std::string_view verb = next_word(rest);
    if (!iequals_ascii(verb, "AUTH"))
        return std::string(line);
    const std::string_view mechanism = next_word(rest);
    if (next_word(rest).empty())
        return std::string(line);

    std::string redacted;
    redacted.append(verb).append(" ").append(mechanism).append(" ").append(REDACTED).append(terminator);
    return redacted;
}

} // namespace mailsend::detail
