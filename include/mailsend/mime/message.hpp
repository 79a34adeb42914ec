/*

message.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <openssl/sha.h>

#include <mailsend/codec/base64.hpp>
#include <mailsend/codec/codec.hpp>
#include <mailsend/export.hpp>


namespace mailsend
{


/**
Error thrown when a message cannot be formatted.
**/
class mime_error : public std::runtime_error
{
public:

    mime_error(const std::string& msg, const std::string& details) : std::runtime_error(msg), details_(details)
    {
    }

    mime_error(const char* msg, const std::string& details) : std::runtime_error(msg), details_(details)
    {
    }

    std::string details() const
    {
        return details_;
    }

protected:

    std::string details_;
};


/**
Options to customize the formatting of a message. Used by message::format().
**/
struct message_format_options_t
{
    /**
    Flag if the leading dot should be escaped.
    **/
    bool dot_escape = false;
};


/**
Plain text mail message: a `multipart/mixed` envelope holding exactly one `text/plain` part.

The message is immutable once constructed. Formatting is deterministic: no date or message id is generated and the
boundary is derived from the content, so equal inputs produce equal output.
**/
class MAILSEND_EXPORT message
{
public:

    /**
    Creating the message.

    @param from    Author address, emitted verbatim.
    @param to      Recipient address, emitted verbatim.
    @param subject Subject, encoded as RFC 2047 words when it is not ASCII.
    @param body    Text of the single part.
    @throw mime_error Empty address, or a header value containing CR, LF or NUL.
    **/
    message(std::string from, std::string to, std::string subject, std::string body);

    const std::string& from() const noexcept
    {
        return from_;
    }

    const std::string& to() const noexcept
    {
        return to_;
    }

    const std::string& subject() const noexcept
    {
        return subject_;
    }

    /**
    Body with its line endings normalized to CRLF.
    **/
    const std::string& body() const noexcept
    {
        return body_;
    }

    const std::string& boundary() const noexcept
    {
        return boundary_;
    }

    /**
    Checking whether the body is sent as UTF-8 with the Base64 transfer encoding.
    **/
    bool is_8bit_body() const noexcept
    {
        return codec::is_8bit_string(body_);
    }

    /**
    Formatting the message to a string.

    @param message_str Resulting string, the message is appended to it.
    @param opts        Options to customize formatting.
    **/
    void format(std::string& message_str, const message_format_options_t& opts = message_format_options_t{}) const;

    /**
    Overload of `format(string&, const message_format_options_t&)` returning the formatted string.
    **/
    std::string format(const message_format_options_t& opts = message_format_options_t{}) const
    {
        std::string str;
        format(str, opts);
        return str;
    }

    /**
    Encoding a header value as RFC 2047 Base64 encoded words when it contains eight bit characters.

    Each word carries at most `ENCODED_WORD_OCTETS` octets and never splits a UTF-8 sequence. Words are folded with
    CRLF followed by a space.

    @param value Header value.
    @return      Value unchanged when ASCII, encoded words otherwise.
    **/
    static std::string encode_header_value(std::string_view value);

    /**
    Replacing bare CR and bare LF with CRLF.
    **/
    static std::string normalize_line_endings(std::string_view text);

    /**
    Doubling the dot at the beginning of each line of a CRLF delimited text.
    **/
    static std::string escape_leading_dots(std::string_view text);

    inline static const std::string FROM_HEADER{"From"};
    inline static const std::string TO_HEADER{"To"};
    inline static const std::string SUBJECT_HEADER{"Subject"};
    inline static const std::string MIME_VERSION_HEADER{"MIME-Version"};
    inline static const std::string CONTENT_TYPE_HEADER{"Content-Type"};
    inline static const std::string CONTENT_TRANSFER_ENCODING_HEADER{"Content-Transfer-Encoding"};
    inline static const std::string MIME_VERSION{"1.0"};
    inline static const std::string BOUNDARY_DELIMITER{"--"};
    inline static const std::string BOUNDARY_FILL{"==============="};
    inline static const std::string CHARSET_ASCII{"us-ascii"};
    inline static const std::string CHARSET_UTF8{"utf-8"};
    inline static const std::string HEADER_SEPARATOR{": "};

    /**
    Maximum number of octets in one encoded word, so that the word fits into 75 characters.
    **/
    static constexpr std::string::size_type ENCODED_WORD_OCTETS = 45;

private:

    static void validate_header(std::string_view name, std::string_view value);

    static std::string make_boundary(const std::string& from, const std::string& to, const std::string& subject,
        const std::string& body);

    static std::string boundary_candidate(std::string_view seed, unsigned counter);

    std::string format_header() const;

    std::string format_text_part() const;

    static std::string header_line(std::string_view name, std::string_view value);

    std::string from_;
    std::string to_;
    std::string subject_;
    std::string body_;
    std::string boundary_;
};


// ------------------------------------------------------------
// Header-only implementation (C++23)
// ------------------------------------------------------------


inline message::message(std::string from, std::string to, std::string subject, std::string body)
    : from_(std::move(from)), to_(std::move(to)), subject_(std::move(subject)), body_(normalize_line_endings(body))
{
    if (from_.empty())
        throw mime_error("No author address.", "");
    if (to_.empty())
        throw mime_error("No recipient address.", "");
    validate_header(FROM_HEADER, from_);
    validate_header(TO_HEADER, to_);
    validate_header(SUBJECT_HEADER, subject_);
    boundary_ = make_boundary(from_, to_, subject_, body_);
}


void inline message::format(std::string& message_str, const message_format_options_t& opts) const
{
    std::string formatted = format_header();
    formatted += BOUNDARY_DELIMITER + boundary_ + codec::END_OF_LINE;
    formatted += format_text_part();
    formatted += codec::END_OF_LINE;
    formatted += BOUNDARY_DELIMITER + boundary_ + BOUNDARY_DELIMITER + codec::END_OF_LINE;

    if (opts.dot_escape)
        message_str += escape_leading_dots(formatted);
    else
        message_str += formatted;
}


std::string inline message::format_header() const
{
    std::string header;
    header += header_line(CONTENT_TYPE_HEADER, "multipart/mixed; boundary=\"" + boundary_ + "\"");
    header += header_line(MIME_VERSION_HEADER, MIME_VERSION);
    header += header_line(FROM_HEADER, from_);
    header += header_line(TO_HEADER, to_);
    header += header_line(SUBJECT_HEADER, encode_header_value(subject_));
    header += codec::END_OF_LINE;
    return header;
}


std::string inline message::format_text_part() const
{
    std::string part;
    if (!is_8bit_body())
    {
        part += header_line(CONTENT_TYPE_HEADER, "text/plain; charset=\"" + CHARSET_ASCII + "\"");
        part += header_line(MIME_VERSION_HEADER, MIME_VERSION);
        part += header_line(CONTENT_TRANSFER_ENCODING_HEADER, "7bit");
        part += codec::END_OF_LINE;
        part += body_;
        return part;
    }

    part += header_line(CONTENT_TYPE_HEADER, "text/plain; charset=\"" + CHARSET_UTF8 + "\"");
    part += header_line(MIME_VERSION_HEADER, MIME_VERSION);
    part += header_line(CONTENT_TRANSFER_ENCODING_HEADER, "base64");
    part += codec::END_OF_LINE;

    const auto policy = static_cast<std::string::size_type>(codec::line_len_policy_t::MIME);
    base64 b64(policy, policy);
    for (const auto& line : b64.encode(body_))
        part += line + codec::END_OF_LINE;
    return part;
}


std::string inline message::header_line(std::string_view name, std::string_view value)
{
    std::string line;
    line.reserve(name.size() + value.size() + 4);
    line.append(name);
    line += HEADER_SEPARATOR;
    line.append(value);
    line += codec::END_OF_LINE;
    return line;
}


void inline message::validate_header(std::string_view name, std::string_view value)
{
    if (value.find_first_of(std::string_view("\r\n\0", 3)) == std::string_view::npos)
        return;
    throw mime_error("Invalid header value.", std::string(name) + " contains CR, LF or NUL.");
}


std::string inline message::encode_header_value(std::string_view value)
{
    if (!codec::is_8bit_string(value))
        return std::string(value);

    const std::string prefix = "=?" + CHARSET_UTF8 + "?b?";
    const std::string suffix = "?=";
    std::string encoded;
    std::string::size_type pos = 0;
    while (pos < value.size())
    {
        std::string::size_type end = pos;
        while (end < value.size())
        {
            std::string::size_type seq_len = 1;
            const auto lead = static_cast<unsigned char>(value[end]);
            if ((lead & 0xE0) == 0xC0)
                seq_len = 2;
            else if ((lead & 0xF0) == 0xE0)
                seq_len = 3;
            else if ((lead & 0xF8) == 0xF0)
                seq_len = 4;
            seq_len = std::min(seq_len, value.size() - end);
            if (end + seq_len - pos > ENCODED_WORD_OCTETS)
                break;
            end += seq_len;
        }

        if (!encoded.empty())
            encoded += codec::END_OF_LINE + " ";
        encoded += prefix + base64::encode_line(value.substr(pos, end - pos)) + suffix;
        pos = end;
    }
    return encoded;
}


std::string inline message::normalize_line_endings(std::string_view text)
{
    std::string out;
    out.reserve(text.size() + text.size() / 32);
    for (std::string::size_type i = 0; i < text.size(); ++i)
    {
        const char ch = text[i];
        if (ch == codec::CR_CHAR)
        {
            out += codec::END_OF_LINE;
            if (i + 1 < text.size() && text[i + 1] == codec::LF_CHAR)
                ++i;
        }
        else if (ch == codec::LF_CHAR)
            out += codec::END_OF_LINE;
        else
            out += ch;
    }
    return out;
}


std::string inline message::escape_leading_dots(std::string_view text)
{
    std::string out;
    out.reserve(text.size() + 16);
    bool line_start = true;
    for (char ch : text)
    {
        if (line_start && ch == codec::DOT_CHAR)
            out += codec::DOT_CHAR;
        out += ch;
        line_start = (ch == codec::LF_CHAR);
    }
    return out;
}


std::string inline message::make_boundary(const std::string& from, const std::string& to, const std::string& subject,
    const std::string& body)
{
    std::string seed;
    seed.reserve(from.size() + to.size() + subject.size() + body.size() + 3);
    seed += from;
    seed += '\0';
    seed += to;
    seed += '\0';
    seed += subject;
    seed += '\0';
    seed += body;

    // A boundary must not occur in the content it delimits.
    unsigned counter = 0;
    std::string boundary = boundary_candidate(seed, counter);
    while (body.find(boundary) != std::string::npos)
        boundary = boundary_candidate(seed, ++counter);
    return boundary;
}


std::string inline message::boundary_candidate(std::string_view seed, unsigned counter)
{
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(seed.data()), seed.size(), digest);

    std::uint64_t value = 0;
    for (int i = 0; i < 8; ++i)
        value = (value << 8) | digest[i];

    std::string digits = std::to_string(value % 10000000000000000000ULL);
    if (digits.size() < 19)
        digits.insert(0, 19 - digits.size(), '0');

    std::string boundary = BOUNDARY_FILL + digits + "==";
    if (counter > 0)
        boundary += codec::DOT_CHAR + std::to_string(counter);
    return boundary;
}


} // namespace mailsend
