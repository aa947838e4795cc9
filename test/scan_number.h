#pragma once

#include <cassert>
#include <string>

// value = digits * radix^exponent, with no leading or trailing zeros in digits.
// Zero is {"0", 0}.
struct ScanNumberResult {
    std::string digits;
    int exponent;
};

inline int ScanDigitValue(char ch)
{
    if ('0' <= ch && ch <= '9')
        return ch - '0';
    if ('A' <= ch && ch <= 'Z')
        return ch - 'A' + 10;
    if ('a' <= ch && ch <= 'z')
        return ch - 'a' + 10;
    return 36;
}

// Splits the output of FormatFloat for a non-negative finite number.
inline ScanNumberResult ScanNumber(char const* next, char const* last, int radix, char exponent_char)
{
    std::string digits;
    int exponent = 0;

    assert(next != last && ScanDigitValue(*next) < radix);

    bool fraction = false;
    for ( ; next != last && *next != exponent_char; ++next)
    {
        if (*next == '.')
        {
            fraction = true;
            continue;
        }

        assert(ScanDigitValue(*next) < radix);
        digits += *next;
        if (fraction)
            --exponent;
    }

    if (next != last)
    {
        ++next;

        bool negative = false;
        if (next != last && (*next == '-' || *next == '+'))
        {
            negative = (*next == '-');
            ++next;
        }
        assert(next != last);

        int e = 0;
        for ( ; next != last; ++next)
        {
            e = radix * e + ScanDigitValue(*next);
        }

        exponent += negative ? -e : e;
    }

    const size_t first_nonzero = digits.find_first_not_of('0');
    if (first_nonzero == std::string::npos)
        return {"0", 0};

    digits.erase(0, first_nonzero);
    while (digits.back() == '0')
    {
        digits.pop_back();
        ++exponent;
    }

    return {digits, exponent};
}

inline ScanNumberResult ScanNumber(std::string const& str, int radix = 10, char exponent_char = 'e')
{
    return ScanNumber(str.data(), str.data() + str.size(), radix, exponent_char);
}
