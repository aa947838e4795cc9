// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "ieee.h"

#include <cstddef>

namespace lexconv {
namespace impl {

// Maximum number of digits generated for a float or double, in any radix.
constexpr int kMaxDigits = 64;

inline char DigitChar(uint32_t d)
{
    static constexpr char kDigitChars[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";

    LEXCONV_ASSERT(d < 36);
    return kDigitChars[d];
}

// Returns the value of the digit `ch` (case-insensitive), or 36 if `ch` is not
// a digit in any radix.
inline uint32_t DigitValue(char ch)
{
    const uint32_t c = static_cast<unsigned char>(ch);

    if (c - '0' < 10)
        return c - '0';
    if (c - 'a' < 26)
        return c - 'a' + 10;
    if (c - 'A' < 26)
        return c - 'A' + 10;
    return 36;
}

inline bool IsRadixDigit(char ch, int radix)
{
    return DigitValue(ch) < static_cast<uint32_t>(radix);
}

inline char* Utoa_2Digits(char* buf, uint32_t digits)
{
    static constexpr char Digits100[200] = {
        '0','0','0','1','0','2','0','3','0','4','0','5','0','6','0','7','0','8','0','9',
        '1','0','1','1','1','2','1','3','1','4','1','5','1','6','1','7','1','8','1','9',
        '2','0','2','1','2','2','2','3','2','4','2','5','2','6','2','7','2','8','2','9',
        '3','0','3','1','3','2','3','3','3','4','3','5','3','6','3','7','3','8','3','9',
        '4','0','4','1','4','2','4','3','4','4','4','5','4','6','4','7','4','8','4','9',
        '5','0','5','1','5','2','5','3','5','4','5','5','5','6','5','7','5','8','5','9',
        '6','0','6','1','6','2','6','3','6','4','6','5','6','6','6','7','6','8','6','9',
        '7','0','7','1','7','2','7','3','7','4','7','5','7','6','7','7','7','8','7','9',
        '8','0','8','1','8','2','8','3','8','4','8','5','8','6','8','7','8','8','8','9',
        '9','0','9','1','9','2','9','3','9','4','9','5','9','6','9','7','9','8','9','9',
    };

    LEXCONV_ASSERT(digits <= 99);
    std::memcpy(buf, &Digits100[2*digits], 2*sizeof(char));
    return buf + 2;
}

inline char* Utoa_4Digits(char* buf, uint32_t digits)
{
    LEXCONV_ASSERT(digits <= 9999);
    const uint32_t q = digits / 100;
    const uint32_t r = digits % 100;
    Utoa_2Digits(buf + 0, q);
    Utoa_2Digits(buf + 2, r);
    return buf + 4;
}

inline char* Utoa_8Digits(char* buf, uint32_t digits)
{
    LEXCONV_ASSERT(digits <= 99999999);
    const uint32_t q = digits / 10000;
    const uint32_t r = digits % 10000;
    Utoa_4Digits(buf + 0, q);
    Utoa_4Digits(buf + 4, r);
    return buf + 8;
}

inline int DecimalLength(uint64_t v)
{
    LEXCONV_ASSERT(v >= 1);

    int n = 1;
    for (uint64_t p = 10; v >= p; p *= 10)
    {
        n++;
        if (n == 20)
            break;
    }
    return n;
}

inline void PrintDecimalDigits(char* buf, uint64_t output, int output_length)
{
    // We prefer 32-bit operations, even on 64-bit platforms.
    // uint32_t can store 9 digits. While the output doesn't fit into uint32_t,
    // we cut off 8 digits.
    while (static_cast<uint32_t>(output >> 32) != 0)
    {
        LEXCONV_ASSERT(output_length > 8);
        const uint64_t q = output / 100000000;
        const uint32_t r = static_cast<uint32_t>(output % 100000000);
        output = q;
        output_length -= 8;
        Utoa_8Digits(buf + output_length, r);
    }

    uint32_t output2 = static_cast<uint32_t>(output);

    while (output2 >= 10000)
    {
        LEXCONV_ASSERT(output_length > 4);
        const uint32_t q = output2 / 10000;
        const uint32_t r = output2 % 10000;
        output2 = q;
        output_length -= 4;
        Utoa_4Digits(buf + output_length, r);
    }

    if (output2 >= 100)
    {
        LEXCONV_ASSERT(output_length > 2);
        const uint32_t q = output2 / 100;
        const uint32_t r = output2 % 100;
        output2 = q;
        output_length -= 2;
        Utoa_2Digits(buf + output_length, r);
    }

    if (output2 >= 10)
    {
        LEXCONV_ASSERT(output_length == 2);
        Utoa_2Digits(buf, output2);
    }
    else
    {
        LEXCONV_ASSERT(output_length == 1);
        buf[0] = static_cast<char>('0' + output2);
    }
}

// Writes the digits of `value` in the given radix.
// Returns a pointer to the element following the digits.
inline char* PrintRadixDigits(char* buf, uint64_t value, int radix)
{
    LEXCONV_ASSERT(radix >= 2);
    LEXCONV_ASSERT(radix <= 36);

    if (value == 0)
    {
        *buf = '0';
        return buf + 1;
    }

    if (radix == 10)
    {
        const int length = DecimalLength(value);
        PrintDecimalDigits(buf, value, length);
        return buf + length;
    }

    // Generate the digits backwards, then reverse.
    const uint64_t B = static_cast<uint64_t>(radix);

    char* last = buf;
    for ( ; value != 0; value /= B)
    {
        *last++ = DigitChar(static_cast<uint32_t>(value % B));
    }

    for (char* lo = buf, *hi = last - 1; lo < hi; ++lo, --hi)
    {
        const char t = *lo;
        *lo = *hi;
        *hi = t;
    }

    return last;
}

// Appends the exponent `value` to buffer.
// Radix 10 exponents are always signed, other radices only write a '-'.
// Returns a pointer to the element following the digits.
inline char* ExponentToString(char* buffer, int value, int radix)
{
    LEXCONV_ASSERT(value > -2000);
    LEXCONV_ASSERT(value <  2000);

    int n = 0;

    if (value < 0)
    {
        buffer[n++] = '-';
        value = -value;
    }
    else if (radix == 10)
    {
        buffer[n++] = '+';
    }

    const uint32_t k = static_cast<uint32_t>(value);
    if (radix != 10)
    {
        return PrintRadixDigits(buffer + n, k, radix);
    }

    if (k < 10)
    {
        buffer[n++] = static_cast<char>('0' + k);
    }
    else if (k < 100)
    {
        Utoa_2Digits(buffer + n, k);
        n += 2;
    }
    else
    {
        const uint32_t r = k % 10;
        const uint32_t q = k / 10;
        Utoa_2Digits(buffer + n, q);
        n += 2;
        buffer[n++] = static_cast<char>('0' + r);
    }

    return buffer + n;
}

inline char* FormatFixed(char* buffer, intptr_t num_digits, intptr_t decimal_point, bool force_trailing_dot_zero)
{
    LEXCONV_ASSERT(buffer != nullptr);
    LEXCONV_ASSERT(num_digits >= 1);

    if (decimal_point >= num_digits)
    {
        // digits000[.0]
        char* const end = buffer + decimal_point;
        std::memset(buffer + num_digits, '0', static_cast<size_t>(decimal_point - num_digits));
        if (!force_trailing_dot_zero)
            return end;

        end[0] = '.';
        end[1] = '0';
        return end + 2;
    }
    else if (decimal_point > 0)
    {
        // dig.its
        std::memmove(buffer + (decimal_point + 1), buffer + decimal_point, static_cast<size_t>(num_digits - decimal_point));
        buffer[decimal_point] = '.';
        return buffer + (num_digits + 1);
    }
    else // decimal_point <= 0
    {
        // 0.[000]digits
        std::memmove(buffer + (2 + -decimal_point), buffer, static_cast<size_t>(num_digits));
        buffer[0] = '0';
        buffer[1] = '.';
        std::memset(buffer + 2, '0', static_cast<size_t>(-decimal_point));
        return buffer + (2 + (-decimal_point) + num_digits);
    }
}

inline char* FormatScientific(char* buffer, intptr_t num_digits, int exponent, bool force_trailing_dot_zero, char exponent_char, int radix)
{
    LEXCONV_ASSERT(buffer != nullptr);
    LEXCONV_ASSERT(num_digits >= 1);

    if (num_digits == 1)
    {
        // d[.0]e+123
        if (force_trailing_dot_zero)
        {
            buffer[1] = '.';
            buffer[2] = '0';
            buffer += 3;
        }
        else
        {
            buffer += 1;
        }
    }
    else
    {
        // d.igitsE+123
        std::memmove(buffer + 2, buffer + 1, static_cast<size_t>(num_digits - 1));
        buffer[1] = '.';
        buffer += 1 + num_digits;
    }

    buffer[0] = exponent_char;
    buffer = ExponentToString(buffer + 1, exponent, radix);

    return buffer;
}

// Formats the digits stored at the start of `buffer` in place, similar to
// printf's %g style: digits * radix^exponent.
// Returns a pointer to the element following the output.
inline char* Format(char* buffer, int num_digits, int exponent, bool force_trailing_dot_zero, char exponent_char, int radix)
{
    // Number of digits before the radix point.
    const int decimal_point = num_digits + exponent;

    // Fixed notation for 1e-6 <= |v| < 1e21, scientific otherwise.
    constexpr int kMinFixed = -6;
    constexpr int kMaxFixed = 21;

    if (kMinFixed < decimal_point && decimal_point <= kMaxFixed)
        return FormatFixed(buffer, num_digits, decimal_point, force_trailing_dot_zero);

    return FormatScientific(buffer, num_digits, decimal_point - 1, force_trailing_dot_zero, exponent_char, radix);
}

} // namespace impl
} // namespace lexconv
