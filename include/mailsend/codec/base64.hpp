/*

base64.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <mailsend/codec/codec.hpp>
#include <mailsend/export.hpp>


namespace mailsend
{


/**
Base64 codec, used for the MIME body of eight bit text, the encoded words of the subject and the SASL exchanges.
**/
class MAILSEND_EXPORT base64 : public codec
{
public:

    inline static const std::string CHARSET{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

    /**
    Line policies are rounded down to a multiple of four, lines are only split between quartets.

    @param line1_policy Length limit of the first encoded line.
    @param lines_policy Length limit of the following lines.
    **/
    base64(std::string::size_type line1_policy, std::string::size_type lines_policy)
        : codec(line1_policy, lines_policy)
    {
        line1_policy_ -= line1_policy_ % SEXTETS_NO;
        lines_policy_ -= lines_policy_ % SEXTETS_NO;
    }

    /// Single line codec.
    base64()
        : base64(static_cast<std::string::size_type>(line_len_policy_t::NONE),
            static_cast<std::string::size_type>(line_len_policy_t::NONE))
    {
    }

    base64(const base64&) = delete;

    base64(base64&&) = delete;

    ~base64() = default;

    void operator=(const base64&) = delete;

    void operator=(base64&&) = delete;

    /**
    Encoding a text into lines of Base64, split after the quartet reaching the line policy.

    @param text Text to encode.
    @return     Encoded lines, without line terminators.
    **/
    std::vector<std::string> encode(std::string_view text) const
    {
        std::vector<std::string> lines;
        std::string line;
        std::string::size_type policy = line1_policy_;

        for (std::string::size_type pos = 0; pos < text.size(); pos += OCTETS_NO)
        {
            const std::string::size_type count = std::min<std::string::size_type>(OCTETS_NO, text.size() - pos);
            std::uint32_t group = 0;
            for (std::string::size_type i = 0; i < OCTETS_NO; i++)
                group = (group << 8) | (i < count ? static_cast<unsigned char>(text[pos + i]) : 0u);

            // The quartet carries count + 1 significant sextets, the rest is padding.
            for (std::string::size_type i = 0; i < SEXTETS_NO; i++)
                line += i <= count ? CHARSET[(group >> (18 - 6 * i)) & 0x3f] : PAD_CHAR;

            if (line.size() >= policy)
            {
                lines.push_back(std::move(line));
                line.clear();
                policy = lines_policy_;
            }
        }
        if (!line.empty())
            lines.push_back(std::move(line));
        return lines;
    }

    /**
    Encoding a text into a single Base64 line.

    @param text Text to encode.
    @return     Encoded text, empty for an empty text.
    **/
    static std::string encode_line(std::string_view text)
    {
        const base64 b64;
        auto lines = b64.encode(text);
        return lines.empty() ? std::string() : std::move(lines.front());
    }

    /**
    Decoding Base64 lines. Each line is read up to its first padding character.

    @param text        Encoded lines.
    @return            Decoded text.
    @throw codec_error Line longer than the policy, character outside of the alphabet, or a dangling sextet.
    **/
    std::string decode(const std::vector<std::string>& text) const
    {
        std::string decoded;
        std::uint32_t group = 0;
        unsigned sextets = 0;

        for (const auto& line : text)
        {
            if (line.length() > lines_policy_)
                throw codec_error("Bad line policy.");

            for (char ch : line)
            {
                if (ch == PAD_CHAR)
                    break;
                const auto value = CHARSET.find(ch);
                if (value == std::string::npos)
                    throw codec_error("Bad character `" + std::string(1, ch) + "`.");

                group = (group << 6) | static_cast<std::uint32_t>(value);
                if (++sextets == SEXTETS_NO)
                {
                    decoded += static_cast<char>((group >> 16) & 0xff);
                    decoded += static_cast<char>((group >> 8) & 0xff);
                    decoded += static_cast<char>(group & 0xff);
                    group = 0;
                    sextets = 0;
                }
            }
        }

        if (sextets == 1)
            throw codec_error("Truncated base64 input.");
        if (sextets > 0)
        {
            group <<= 6 * (SEXTETS_NO - sextets);
            decoded += static_cast<char>((group >> 16) & 0xff);
            if (sextets == 3)
                decoded += static_cast<char>((group >> 8) & 0xff);
        }
        return decoded;
    }

    std::string decode(std::string_view text) const
    {
        return decode(std::vector<std::string>{std::string(text)});
    }

private:

    static constexpr char PAD_CHAR = '=';

    static constexpr unsigned SEXTETS_NO = 4;

    static constexpr unsigned OCTETS_NO = 3;
};


} // namespace mailsend
