/*

types.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mailsend/net/tls_mode.hpp>
#include <mailsend/net/tls_options.hpp>

namespace mailsend
{
namespace smtp
{

struct reply
{
    int status = 0;
    std::vector<std::string> lines;

    [[nodiscard]] bool is_positive_completion() const noexcept { return status / 100 == 2; }

    /// Status code followed by the reply text on one line, e.g. `535 5.7.8 Bad credentials`
    [[nodiscard]] std::string summary() const
    {
        std::string out = std::to_string(status);
        for (const auto& line : lines)
        {
            if (line.empty())
                continue;
            out += ' ';
            out += line;
        }
        return out;
    }
};

struct capabilities
{
    std::map<std::string, std::vector<std::string>> entries;

    [[nodiscard]] bool empty() const noexcept { return entries.empty(); }

    [[nodiscard]] bool supports(std::string_view capability) const
    {
        return entries.find(normalize_key(capability)) != entries.end();
    }

    [[nodiscard]] const std::vector<std::string>* parameters(std::string_view capability) const
    {
        auto it = entries.find(normalize_key(capability));
        return it == entries.end() ? nullptr : &it->second;
    }

private:
    [[nodiscard]] static std::string normalize_key(std::string_view key)
    {
        std::string out;
        out.reserve(key.size());
        for (char ch : key)
        {
            if (ch >= 'a' && ch <= 'z')
                out.push_back(static_cast<char>(ch - ('a' - 'A')));
            else
                out.push_back(ch);
        }
        return out;
    }
};

struct envelope
{
    std::string mail_from;
    std::vector<std::string> rcpt_to;
};

enum class auth_method
{
    auto_detect,
    plain,
    login,
    cram_md5
};

[[nodiscard]] constexpr std::string_view to_string(auth_method method) noexcept
{
    switch (method)
    {
        case auth_method::auto_detect: return "auto";
        case auth_method::plain: return "plain";
        case auth_method::login: return "login";
        case auth_method::cram_md5: return "cram-md5";
    }
    return "unknown";
}

/// Parse a mechanism name as accepted on the command line.
[[nodiscard]] inline std::optional<auth_method> auth_method_from_string(std::string_view name) noexcept
{
    if (name == "auto") return auth_method::auto_detect;
    if (name == "plain") return auth_method::plain;
    if (name == "login") return auth_method::login;
    if (name == "cram-md5") return auth_method::cram_md5;
    return std::nullopt;
}

struct options
{
    /// Name sent with EHLO/HELO; the local host name when empty.
    std::string helo_name;
    /// Server name for SNI and certificate checks; the connected host when empty.
    std::string default_sni;
    mailsend::net::tls_options tls;
    mailsend::net::tls_mode default_tls_mode = mailsend::net::tls_mode::implicit;
    auth_method auth = auth_method::auto_detect;
    /// Deadline of each network operation; none by default.
    std::optional<std::chrono::steady_clock::duration> timeout;
    bool redact_secrets_in_trace = true;
    bool use_size_extension = true;
};

} // namespace smtp
} // namespace mailsend
