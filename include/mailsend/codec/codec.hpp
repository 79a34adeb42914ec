/*

codec.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <climits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <mailsend/export.hpp>


namespace mailsend
{


/**
Line policies and the protocol characters shared by the encoders and the SMTP data phase.
**/
class MAILSEND_EXPORT codec
{
public:

    static constexpr char CR_CHAR = '\r';
    static constexpr char LF_CHAR = '\n';
    static constexpr char DOT_CHAR = '.';

    inline static const std::string END_OF_LINE{"\r\n"};

    /**
    Line holding a single dot, terminating the SMTP data phase.
    **/
    inline static const std::string END_OF_MESSAGE{"."};

    /**
    Maximum length of encoded lines.

    `MIME` is the RFC 2045 limit of a transfer encoded line, `NONE` keeps the whole output on one line.
    **/
    enum class line_len_policy_t : std::string::size_type {MIME = 76, NONE = UINT_MAX};

    /**
    Checking whether a text needs an eight bit capable encoding.

    @param txt Text to check.
    @return    True if some octet is above 127.
    **/
    static bool is_8bit_string(std::string_view txt)
    {
        return std::any_of(txt.begin(), txt.end(), [](char ch) { return static_cast<unsigned char>(ch) > 127; });
    }

    /**
    @param line1_policy Length limit of the first line.
    @param lines_policy Length limit of the following lines, and of every line when decoding.
    **/
    codec(std::string::size_type line1_policy, std::string::size_type lines_policy)
        : line1_policy_(line1_policy), lines_policy_(lines_policy)
    {
    }

    codec(const codec&) = delete;

    codec(codec&&) = delete;

    virtual ~codec() = default;

    void operator=(const codec&) = delete;

    void operator=(codec&&) = delete;

protected:

    std::string::size_type line1_policy_;

    std::string::size_type lines_policy_;
};


/**
Malformed input given to a decoder.
**/
class codec_error : public std::runtime_error
{
public:

    explicit codec_error(const std::string& msg) : std::runtime_error(msg)
    {
    }
};


} // namespace mailsend
