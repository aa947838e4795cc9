// Copyright 2026 The lexconv Authors
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "lexconv.h"
#include "buffer.h"
#include "format_digits.h"

#include <type_traits>

using namespace lexconv;
using namespace lexconv::impl;

//==================================================================================================
// FormatInteger
//==================================================================================================

template <typename Int>
static char* IntegerToChars(char* buffer, Int value, int radix)
{
    using Unsigned = typename std::make_unsigned<Int>::type;

    Unsigned magnitude = static_cast<Unsigned>(value);
    if (value < 0)
    {
        *buffer++ = '-';
        magnitude = static_cast<Unsigned>(0 - magnitude);
    }

    return PrintRadixDigits(buffer, magnitude, radix);
}

template <typename Int>
size_t lexconv::FormatInteger(char* buffer, size_t buffer_size, Int value, const WriteIntegerOptions& options)
{
    RequireCapacity("FormatInteger", buffer_size, MaxLength<Int>::value);

    char* const end = IntegerToChars(buffer, value, options.Radix());
    return static_cast<size_t>(end - buffer);
}

template <typename Int>
char* lexconv::FormatIntegerRange(char* first, char* last, Int value, const WriteIntegerOptions& options)
{
    RequireCapacity("FormatIntegerRange", first, last, MaxLength<Int>::value);

    return IntegerToChars(first, value, options.Radix());
}

template size_t lexconv::FormatInteger<int32_t>(char*, size_t, int32_t, const WriteIntegerOptions&);
template size_t lexconv::FormatInteger<uint32_t>(char*, size_t, uint32_t, const WriteIntegerOptions&);
template size_t lexconv::FormatInteger<int64_t>(char*, size_t, int64_t, const WriteIntegerOptions&);
template size_t lexconv::FormatInteger<uint64_t>(char*, size_t, uint64_t, const WriteIntegerOptions&);
template char* lexconv::FormatIntegerRange<int32_t>(char*, char*, int32_t, const WriteIntegerOptions&);
template char* lexconv::FormatIntegerRange<uint32_t>(char*, char*, uint32_t, const WriteIntegerOptions&);
template char* lexconv::FormatIntegerRange<int64_t>(char*, char*, int64_t, const WriteIntegerOptions&);
template char* lexconv::FormatIntegerRange<uint64_t>(char*, char*, uint64_t, const WriteIntegerOptions&);
