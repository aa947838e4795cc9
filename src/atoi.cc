// Copyright 2026 The lexconv Authors
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "lexconv.h"
#include "format_digits.h"

#include <limits>
#include <type_traits>

using namespace lexconv;
using namespace lexconv::impl;

//==================================================================================================
// ParseInteger
//==================================================================================================

template <typename Int>
static ParseResult<Int> Strtoi(const char* first, const char* last, const ParseIntegerOptions& options)
{
    using Unsigned = typename std::make_unsigned<Int>::type;

    const int      radix     = options.Radix();
    const char     separator = options.DigitSeparator();
    const Unsigned B         = static_cast<Unsigned>(radix);

    ParseResult<Int> result;

    const char* curr   = first;
    bool        is_neg = false;

    if (curr != last && (*curr == '-' || *curr == '+'))
    {
        is_neg = (*curr == '-');
        ++curr;
    }

    // The largest magnitude which fits into Int.
    const Unsigned limit = is_neg
        ? static_cast<Unsigned>(Unsigned{0} - static_cast<Unsigned>(std::numeric_limits<Int>::min()))
        : static_cast<Unsigned>(std::numeric_limits<Int>::max());

    if (curr != last && separator != '\0' && *curr == separator)
    {
        result.next = curr;
        result.status = ParseStatus::invalid_separator;
        return result;
    }

    if (curr == last || !IsRadixDigit(*curr, radix))
    {
        result.next = curr;
        result.status = ParseStatus::empty;
        return result;
    }

    Unsigned magnitude = 0;
    for (;;)
    {
        const Unsigned d = static_cast<Unsigned>(DigitValue(*curr));
        if (d > limit || magnitude > (limit - d) / B)
        {
            // Out of range.
            if (is_neg)
            {
                result.value = std::numeric_limits<Int>::min();
                result.status = ParseStatus::underflow;
            }
            else
            {
                result.value = std::numeric_limits<Int>::max();
                result.status = ParseStatus::overflow;
            }
            result.next = first;
            return result;
        }

        magnitude = magnitude * B + d;
        ++curr;

        if (curr == last)
            break;
        if (separator != '\0' && *curr == separator)
        {
            if (curr + 1 == last || !IsRadixDigit(curr[1], radix))
            {
                result.status = ParseStatus::invalid_separator;
                break;
            }
            ++curr;
        }
        else if (!IsRadixDigit(*curr, radix))
        {
            result.status = ParseStatus::invalid_digit;
            break;
        }
    }

    result.value = is_neg ? static_cast<Int>(Unsigned{0} - magnitude) : static_cast<Int>(magnitude);
    result.next = curr;
    return result;
}

template <typename Int>
ParseResult<Int> lexconv::ParseInteger(const char* first, const char* last, const ParseIntegerOptions& options)
{
    return Strtoi<Int>(first, last, options);
}

template <typename Int>
Int lexconv::ParseIntegerUnchecked(const char* first, const char* last, const ParseIntegerOptions& options)
{
    return Strtoi<Int>(first, last, options).value;
}

template ParseResult<int32_t> lexconv::ParseInteger<int32_t>(const char*, const char*, const ParseIntegerOptions&);
template ParseResult<uint32_t> lexconv::ParseInteger<uint32_t>(const char*, const char*, const ParseIntegerOptions&);
template ParseResult<int64_t> lexconv::ParseInteger<int64_t>(const char*, const char*, const ParseIntegerOptions&);
template ParseResult<uint64_t> lexconv::ParseInteger<uint64_t>(const char*, const char*, const ParseIntegerOptions&);
template int32_t lexconv::ParseIntegerUnchecked<int32_t>(const char*, const char*, const ParseIntegerOptions&);
template uint32_t lexconv::ParseIntegerUnchecked<uint32_t>(const char*, const char*, const ParseIntegerOptions&);
template int64_t lexconv::ParseIntegerUnchecked<int64_t>(const char*, const char*, const ParseIntegerOptions&);
template uint64_t lexconv::ParseIntegerUnchecked<uint64_t>(const char*, const char*, const ParseIntegerOptions&);
