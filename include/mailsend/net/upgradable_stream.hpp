/*

upgradable_stream.hpp
---------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <boost/asio/ssl/host_name_verification.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <mailsend/detail/asio_decl.hpp>
#include <mailsend/detail/result.hpp>
#include <mailsend/net/tls_options.hpp>

namespace mailsend
{
namespace net
{

using mailsend::asio::any_io_executor;
using mailsend::asio::awaitable;
using mailsend::asio::tcp;
namespace ssl = mailsend::asio::ssl;

/**
Stable stream type that can be switched to TLS without changing the type.

The TCP connection is established on the plain socket, then `start_tls()` wraps it into an SSL stream; the dialog
above keeps talking to the same object.
**/
class upgradable_stream
{
public:
    using ssl_stream = ssl::stream<tcp::socket>;
    using executor_type = any_io_executor;
    using lowest_layer_type = std::remove_reference_t<decltype(std::declval<ssl_stream&>().lowest_layer())>;

    explicit upgradable_stream(tcp::socket socket)
        : stream_(std::move(socket))
    {
    }

    explicit upgradable_stream(executor_type executor)
        : stream_(tcp::socket(executor))
    {
    }

    executor_type get_executor()
    {
        return std::visit([](auto& stream) -> executor_type
        {
            return executor_type(stream.get_executor());
        }, stream_);
    }

    lowest_layer_type& lowest_layer()
    {
        return std::visit([](auto& stream) -> lowest_layer_type&
        {
            return stream.lowest_layer();
        }, stream_);
    }

    const lowest_layer_type& lowest_layer() const
    {
        return std::visit([](const auto& stream) -> const lowest_layer_type&
        {
            return stream.lowest_layer();
        }, stream_);
    }

    bool is_tls() const noexcept
    {
        return std::holds_alternative<ssl_stream>(stream_);
    }

    template<typename MutableBufferSequence, typename CompletionToken>
    auto async_read_some(const MutableBufferSequence& buffers, CompletionToken&& token)
    {
        return std::visit([&](auto& stream) -> decltype(auto)
        {
            return stream.async_read_some(buffers, std::forward<CompletionToken>(token));
        }, stream_);
    }

    template<typename ConstBufferSequence, typename CompletionToken>
    auto async_write_some(const ConstBufferSequence& buffers, CompletionToken&& token)
    {
        return std::visit([&](auto& stream) -> decltype(auto)
        {
            return stream.async_write_some(buffers, std::forward<CompletionToken>(token));
        }, stream_);
    }

    /**
    Negotiating TLS on the connected socket.

    The context is configured from the options (trust store, minimal protocol version, ciphers), the host name is sent
    as SNI and, when required, checked against the peer certificate.

    @param context TLS context, must outlive the stream.
    @param sni     Server name, also used for host name verification.
    @param opt     TLS options.
    @return        Error `tls_verify_failed` or `tls_handshake_failed` on failure.
    **/
    awaitable<mailsend::result<void>> start_tls(ssl::context& context, std::string sni, const tls_options& opt)
    {
        if (is_tls())
            co_return mailsend::ok();

        auto trust_res = configure_trust_store(context, opt);
        if (!trust_res)
            co_return mailsend::fail<void>(std::move(trust_res).error());
        auto harden_res = apply_tls_hardening(context, opt);
        if (!harden_res)
            co_return mailsend::fail<void>(std::move(harden_res).error());

        auto socket = std::move(std::get<tcp::socket>(stream_));
        stream_.template emplace<ssl_stream>(std::move(socket), context);

        auto& tls_stream = std::get<ssl_stream>(stream_);
        // Address literals are not allowed in SNI, they are still used for verification.
        if (!sni.empty() && !is_address_literal(sni) && SSL_set_tlsext_host_name(tls_stream.native_handle(), sni.c_str()) != 1)
        {
            co_return mailsend::fail<void>(errc::tls_handshake_failed,
                "TLS server name configuration failed.", openssl_error_message());
        }

        if (opt.verify == verify_mode::peer)
        {
            tls_stream.set_verify_mode(ssl::verify_peer);
            if (opt.verify_host)
            {
                if (sni.empty())
                    co_return mailsend::fail<void>(errc::tls_verify_failed,
                        "TLS hostname verification requires a host name.");
                tls_stream.set_verify_callback([verifier = ssl::host_name_verification(sni),
                    allow_self_signed = opt.allow_self_signed](bool preverified, ssl::verify_context& ctx) mutable
                {
                    if (!relax_verify(preverified, ctx, allow_self_signed))
                        return false;
                    if (verifier(true, ctx))
                        return true;
                    X509_STORE_CTX_set_error(ctx.native_handle(), X509_V_ERR_HOSTNAME_MISMATCH);
                    return false;
                });
            }
            else if (opt.allow_self_signed)
            {
                tls_stream.set_verify_callback([](bool preverified, ssl::verify_context& ctx)
                {
                    return relax_verify(preverified, ctx, true);
                });
            }
        }
        else
            tls_stream.set_verify_mode(ssl::verify_none);

        asio::error_code ec;
        co_await tls_stream.async_handshake(ssl::stream_base::client, asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
        {
            const long verify_result = SSL_get_verify_result(tls_stream.native_handle());
            if (opt.verify == verify_mode::peer && verify_result != X509_V_OK)
            {
                co_return mailsend::fail<void>(errc::tls_verify_failed, "TLS certificate verification failed.",
                    X509_verify_cert_error_string(verify_result), ec);
            }
            co_return mailsend::fail<void>(errc::tls_handshake_failed, "TLS handshake failed.", ec.message(), ec);
        }
        co_return mailsend::ok();
    }

private:
    static bool is_address_literal(const std::string& host)
    {
        asio::error_code ec;
        asio::ip::make_address(host, ec);
        return !ec;
    }

    static std::string openssl_error_message()
    {
        const unsigned long err = ERR_get_error();
        if (err == 0)
            return {};
        char buffer[256];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }

    static result<void> apply_tls_hardening(ssl::context& context, const tls_options& opt)
    {
        // Keeps a minimal version already set on the context.
        if (opt.min_tls_version.has_value())
        {
            const long current = SSL_CTX_get_min_proto_version(context.native_handle());
            if (current == 0 && SSL_CTX_set_min_proto_version(context.native_handle(), opt.min_tls_version.value()) != 1)
            {
                return fail<void>(errc::tls_handshake_failed,
                    "TLS min version configuration failed.", openssl_error_message());
            }
        }

        if (!opt.cipher_list.empty() && SSL_CTX_set_cipher_list(context.native_handle(), opt.cipher_list.c_str()) != 1)
        {
            return fail<void>(errc::tls_handshake_failed,
                "TLS cipher list configuration failed.", openssl_error_message());
        }
        return ok();
    }

    static bool relax_verify(bool preverified, ssl::verify_context& ctx, bool allow_self_signed) noexcept
    {
        if (preverified)
            return true;
        if (!allow_self_signed)
            return false;

        X509_STORE_CTX* store_ctx = ctx.native_handle();
        if (store_ctx == nullptr)
            return false;

        const int err = X509_STORE_CTX_get_error(store_ctx);
        return err == X509_V_ERR_SELF_SIGNED_CERT_IN_CHAIN || err == X509_V_ERR_DEPTH_ZERO_SELF_SIGNED_CERT;
    }

    std::variant<tcp::socket, ssl_stream> stream_;
};

} // namespace net
} // namespace mailsend
