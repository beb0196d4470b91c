/**
 * @file utf8.hpp
 * @brief UTF-8 helpers of the string extension
 */

#ifndef ASBRIDGE_EXT_UTF8_HPP
#define ASBRIDGE_EXT_UTF8_HPP

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace asbridge::ext::utf8
{
/**
 * @brief Number of bytes of a character, decided by its first byte
 */
constexpr unsigned int u8_bytes(char first) noexcept
{
    auto b = static_cast<std::uint8_t>(first);
    if((b & 0b1111'1000) == 0b1111'0000)
        return 4;
    else if((b & 0b1111'0000) == 0b1110'0000)
        return 3;
    else if((b & 0b1110'0000) == 0b1100'0000)
        return 2;
    else
        return 1;
}

/**
 * @brief Check if a string is well-formed UTF-8
 *
 * Rejects stray continuation bytes, truncated sequences, overlong forms,
 * surrogates and code points above U+10FFFF.
 */
constexpr bool u8_validate(std::string_view str) noexcept
{
    std::size_t i = 0;
    while(i < str.size())
    {
        auto b0 = static_cast<std::uint8_t>(str[i]);
        if(b0 <= 0x7F)
        {
            ++i;
            continue;
        }

        std::size_t len;
        char32_t cp;
        char32_t min_cp;
        if((b0 & 0b1110'0000) == 0b1100'0000)
        {
            len = 2;
            cp = b0 & 0b0001'1111;
            min_cp = 0x80;
        }
        else if((b0 & 0b1111'0000) == 0b1110'0000)
        {
            len = 3;
            cp = b0 & 0b0000'1111;
            min_cp = 0x800;
        }
        else if((b0 & 0b1111'1000) == 0b1111'0000)
        {
            len = 4;
            cp = b0 & 0b0000'0111;
            min_cp = 0x10000;
        }
        else
            return false;

        if(str.size() - i < len)
            return false;
        for(std::size_t j = 1; j < len; ++j)
        {
            auto b = static_cast<std::uint8_t>(str[i + j]);
            if((b & 0b1100'0000) != 0b1000'0000)
                return false;
            cp = (cp << 6) | (b & 0b0011'1111);
        }

        if(cp < min_cp || cp > 0x10FFFF)
            return false;
        if(0xD800 <= cp && cp <= 0xDFFF)
            return false;

        i += len;
    }

    return true;
}

/**
 * @brief Count the characters of a string
 */
constexpr std::size_t u8_strlen(std::string_view str) noexcept
{
    std::size_t i = 0;
    std::size_t result = 0;
    while(i < str.size())
    {
        i += u8_bytes(str[i]);
        ++result;
    }

    return result;
}

/**
 * @brief Byte offset of the nth character
 *
 * @return Offset, or the string size if the string has no more than n characters
 */
constexpr std::size_t u8_index(std::string_view str, std::size_t n) noexcept
{
    std::size_t i = 0;
    for(std::size_t count = 0; count < n && i < str.size(); ++count)
        i += u8_bytes(str[i]);

    return i < str.size() ? i : str.size();
}

/**
 * @brief Substring of at most `len` characters starting at character `pos`
 */
constexpr std::string_view u8_substr(std::string_view str, std::size_t pos, std::size_t len = std::size_t(-1)) noexcept
{
    std::size_t begin = u8_index(str, pos);
    std::string_view rest = str.substr(begin);
    return rest.substr(0, u8_index(rest, len));
}
} // namespace asbridge::ext::utf8

#endif
