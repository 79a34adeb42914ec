/*

test_sasl.cpp
-------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE sasl_test

#include <string>
#include <boost/test/unit_test.hpp>
#include <mailsend/detail/sasl.hpp>


BOOST_AUTO_TEST_CASE(plain_initial_response)
{
    BOOST_TEST(mailsend::sasl::encode_plain("tim", "tanstaaftanstaaf") == "AHRpbQB0YW5zdGFhZnRhbnN0YWFm");
}

BOOST_AUTO_TEST_CASE(login_steps)
{
    BOOST_TEST(mailsend::sasl::encode_login("user") == "dXNlcg==");
    BOOST_TEST(mailsend::sasl::encode_login("pass") == "cGFzcw==");
}

// RFC 2195, section 2
BOOST_AUTO_TEST_CASE(cram_md5_rfc_example)
{
    const auto response = mailsend::sasl::encode_cram_md5("tim", "tanstaaftanstaaf",
        "PDE4OTYuNjk3MTcwOTUyQHBvc3RvZmZpY2UucmVzdG9uLm1jaS5uZXQ+");
    BOOST_REQUIRE(response.has_value());
    BOOST_TEST(*response == "dGltIGI5MTNhNjAyYzdlZGE3YTQ5NWI0ZTZlNzMzNGQzODkw");
}

BOOST_AUTO_TEST_CASE(cram_md5_invalid_challenge)
{
    const auto response = mailsend::sasl::encode_cram_md5("tim", "secret", "not base64!");
    BOOST_REQUIRE(!response.has_value());
    BOOST_TEST(response.error().code == mailsend::errc::smtp_bad_reply);
}
