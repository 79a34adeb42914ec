/*

tls_options.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <optional>
#include <string>
#include <vector>

#include <openssl/ssl.h>

#include <mailsend/detail/asio_decl.hpp>
#include <mailsend/detail/result.hpp>

namespace mailsend::net
{

enum class verify_mode
{
    none,
    peer
};

struct tls_options
{
    verify_mode verify = verify_mode::peer;
    bool verify_host = true;
    std::optional<int> min_tls_version = TLS1_2_VERSION;
    std::string cipher_list;
    bool use_default_verify_paths = true;
    std::vector<std::string> ca_files;
    bool allow_self_signed = false;

    /**
    Options accepting any certificate, used when the user asks for an unverified connection.
    **/
    [[nodiscard]] static tls_options insecure()
    {
        tls_options opt;
        opt.verify = verify_mode::none;
        opt.verify_host = false;
        opt.use_default_verify_paths = false;
        return opt;
    }
};

/**
Configure the TLS trust store for a context.
**/
inline result<void> configure_trust_store(mailsend::asio::ssl::context& ctx, const tls_options& options)
{
    if (options.verify == verify_mode::none)
        return ok();

    mailsend::asio::error_code ec;
    if (options.use_default_verify_paths)
    {
        ctx.set_default_verify_paths(ec);
        if (ec)
            return fail<void>(errc::tls_verify_failed, "TLS trust store configuration failed.", ec.message(), ec);
    }
    for (const auto& file : options.ca_files)
    {
        if (file.empty())
            continue;
        ctx.load_verify_file(file, ec);
        if (ec)
            return fail<void>(errc::tls_verify_failed, "TLS trust store configuration failed.", file + ": " + ec.message(), ec);
    }
    return ok();
}

} // namespace mailsend::net
