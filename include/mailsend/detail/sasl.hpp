/*

sasl.hpp
--------

SASL authentication helpers for mailsend.
Implements encoding for PLAIN, LOGIN and CRAM-MD5 mechanisms.

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <string_view>

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <mailsend/codec/base64.hpp>
#include <mailsend/detail/result.hpp>

namespace mailsend::sasl
{

/**
 * Encode credentials for SASL PLAIN mechanism (RFC 4616).
 * Format: \0username\0password (then base64 encoded)
 *
 * @param username The user name
 * @param password The password
 * @return Base64 encoded PLAIN credentials on a single line
 */
inline std::string encode_plain(std::string_view username, std::string_view password)
{
    std::string plain;
    plain.reserve(2 + username.size() + password.size());
    plain.push_back('\0');
    plain += username;
    plain.push_back('\0');
    plain += password;

    return base64::encode_line(plain);
}

/**
 * Encode text for SASL LOGIN mechanism.
 * Returns base64 encoded text (username or password separately).
 */
inline std::string encode_login(std::string_view text)
{
    return base64::encode_line(text);
}

/**
 * Compute the CRAM-MD5 response (RFC 2195).
 * The server challenge is base64 decoded, keyed with the password through HMAC-MD5, and the reply
 * `<username> <hex digest>` is base64 encoded.
 *
 * @param username  The user name
 * @param password  The shared secret
 * @param challenge Base64 challenge as received after the 334 code
 * @return Base64 encoded response, or an error if the challenge is not valid base64
 */
inline result<std::string> encode_cram_md5(std::string_view username, std::string_view password,
    std::string_view challenge)
{
    std::string decoded;
    try
    {
        const base64 b64;
        decoded = b64.decode(challenge);
    }
    catch (const codec_error& exc)
    {
        return fail<std::string>(errc::smtp_bad_reply, "Invalid CRAM-MD5 challenge.", exc.what());
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (HMAC(EVP_md5(), password.data(), static_cast<int>(password.size()),
            reinterpret_cast<const unsigned char*>(decoded.data()), decoded.size(), digest, &digest_len) == nullptr)
    {
        return fail<std::string>(errc::internal_error, "HMAC-MD5 computation failed.");
    }

    static constexpr char hex[] = "0123456789abcdef";
    std::string response;
    response.reserve(username.size() + 1 + digest_len * 2);
    response += username;
    response += ' ';
    for (unsigned int i = 0; i < digest_len; ++i)
    {
        response.push_back(hex[digest[i] >> 4]);
        response.push_back(hex[digest[i] & 0x0F]);
    }
    return ok(base64::encode_line(response));
}

} // namespace mailsend::sasl
