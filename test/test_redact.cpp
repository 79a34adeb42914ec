/*

test_redact.cpp
---------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE redact_test

#include <boost/test/unit_test.hpp>
#include <mailsend/detail/redact.hpp>


BOOST_AUTO_TEST_CASE(redact_auth_plain)
{
    BOOST_TEST(mailsend::detail::redact_line("AUTH PLAIN AHVzZXIAcGFzcw==") == "AUTH PLAIN <redacted>");
}

BOOST_AUTO_TEST_CASE(redact_auth_keeps_crlf)
{
    BOOST_TEST(mailsend::detail::redact_line("AUTH PLAIN AHVzZXIAcGFzcw==\r\n") == "AUTH PLAIN <redacted>\r\n");
}

BOOST_AUTO_TEST_CASE(redact_auth_lower_case)
{
    BOOST_TEST(mailsend::detail::redact_line("auth plain AHVzZXIAcGFzcw==") == "auth plain <redacted>");
}

BOOST_AUTO_TEST_CASE(auth_without_response_unchanged)
{
    BOOST_TEST(mailsend::detail::redact_line("AUTH LOGIN") == "AUTH LOGIN");
    BOOST_TEST(mailsend::detail::redact_line("AUTH CRAM-MD5\r\n") == "AUTH CRAM-MD5\r\n");
}

BOOST_AUTO_TEST_CASE(commands_unchanged)
{
    BOOST_TEST(mailsend::detail::redact_line("DATA") == "DATA");
    BOOST_TEST(mailsend::detail::redact_line("QUIT\r\n") == "QUIT\r\n");
    BOOST_TEST(mailsend::detail::redact_line("EHLO client.example.com") == "EHLO client.example.com");
    BOOST_TEST(mailsend::detail::redact_line("MAIL FROM:<a@example.com>") == "MAIL FROM:<a@example.com>");
    BOOST_TEST(mailsend::detail::redact_line("") == "");
}
