// Copyright 2026 The lexconv Authors
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#include "lexconv.h"
#include "format_digits.h"
#include "strtod.h"

#include <climits>
#include <cstring>
#include <limits>

using namespace lexconv;
using namespace lexconv::impl;

//==================================================================================================
// ParseFloat
//==================================================================================================

// Exponents larger than this limit are clamped. The result is +-infinity or
// zero anyway, but the digits must still be scanned.
static constexpr int kMaxExponent = INT_MAX / 4;

static char ToLowerASCII(char ch)
{
    return ('A' <= ch && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
}

static bool StartsWith(const char* curr, const char* last, const FixedString& str)
{
    return last - curr >= str.Size() && std::memcmp(curr, str.Data(), static_cast<size_t>(str.Size())) == 0;
}

namespace {

// The significant digits of the mantissa, stored as values.
struct DigitAccumulator
{
    char    digits[kMaxSignificantRadixDigits];
    int     num_digits   = 0;
    int64_t exponent     = 0;
    bool    nonzero_tail = false;

    void AppendIntegral(uint32_t d)
    {
        if (num_digits == 0 && d == 0)
        {
            // Leading zero.
        }
        else if (num_digits < kMaxSignificantRadixDigits)
        {
            digits[num_digits++] = static_cast<char>(d);
        }
        else
        {
            ++exponent;
            nonzero_tail = nonzero_tail || d != 0;
        }
    }

    void AppendFractional(uint32_t d)
    {
        if (num_digits == 0 && d == 0)
        {
            // Move this 0 into the exponent.
            --exponent;
        }
        else if (num_digits < kMaxSignificantRadixDigits)
        {
            digits[num_digits++] = static_cast<char>(d);
            --exponent;
        }
        else
        {
            nonzero_tail = nonzero_tail || d != 0;
        }
    }
};

} // namespace

// Scans a run of digits, which must start with a digit. A digit separator is
// accepted only between two digits.
// Returns the end of the run. If the run ends at a misplaced separator,
// `bad_separator` points to it.
template <typename OnDigit>
static const char* ScanDigits(const char* curr, const char* last, int radix, char separator, const char*& bad_separator, OnDigit on_digit)
{
    LEXCONV_ASSERT(curr != last);
    LEXCONV_ASSERT(IsRadixDigit(*curr, radix));

    bad_separator = nullptr;

    while (curr != last)
    {
        const uint32_t d = DigitValue(*curr);
        if (d < static_cast<uint32_t>(radix))
        {
            on_digit(d);
            ++curr;
        }
        else if (separator != '\0' && *curr == separator)
        {
            if (curr + 1 == last || !IsRadixDigit(curr[1], radix))
            {
                bad_separator = curr;
                break;
            }
            ++curr;
        }
        else
        {
            break;
        }
    }

    return curr;
}

template <typename Float>
static ParseResult<Float> Strtod(const char* first, const char* last, const ParseFloatOptions& options)
{
    const int  radix         = options.Radix();
    const char separator     = options.DigitSeparator();
    const char exponent_char = ToLowerASCII(options.ExponentChar());

    ParseResult<Float> result;

    ParseStatus      status        = ParseStatus::success;
    Float            value         = 0;
    const char*      curr          = first;
    const char*      next          = nullptr; // the error position, if not curr
    const char*      bad_separator = nullptr;
    bool             is_neg        = false;
    bool             has_digits    = false;
    DigitAccumulator acc;

    const auto is_separator = [&](const char* p) {
        return p != last && separator != '\0' && *p == separator;
    };
    const auto is_digit = [&](const char* p) {
        return p != last && IsRadixDigit(*p, radix);
    };

    if (curr != last && (*curr == '-' || *curr == '+'))
    {
        is_neg = (*curr == '-');
        ++curr;
    }

    // Special strings. The infinity spelling starts with the inf spelling, so
    // it must be tested first.
    if (StartsWith(curr, last, options.InfinityString()))
    {
        curr += options.InfinityString().Size();
        value = std::numeric_limits<Float>::infinity();
        goto L_special;
    }
    if (StartsWith(curr, last, options.InfString()))
    {
        curr += options.InfString().Size();
        value = std::numeric_limits<Float>::infinity();
        goto L_special;
    }
    if (StartsWith(curr, last, options.NanString()))
    {
        curr += options.NanString().Size();
        value = std::numeric_limits<Float>::quiet_NaN();
        goto L_special;
    }

    // Integral part.
    if (is_separator(curr))
    {
        status = ParseStatus::invalid_separator;
        next = curr;
        goto L_empty;
    }
    if (is_digit(curr))
    {
        has_digits = true;
        curr = ScanDigits(curr, last, radix, separator, bad_separator, [&](uint32_t d) { acc.AppendIntegral(d); });
        if (bad_separator != nullptr)
        {
            status = ParseStatus::invalid_separator;
            next = bad_separator;
            goto L_convert;
        }
    }

    // Fractional part.
    // The '.' is only part of the number if it is followed by a digit.
    if (curr != last && *curr == '.')
    {
        if (is_separator(curr + 1))
        {
            status = ParseStatus::invalid_separator;
            next = curr + 1;
            goto L_check_digits;
        }
        if (is_digit(curr + 1))
        {
            has_digits = true;
            curr = ScanDigits(curr + 1, last, radix, separator, bad_separator, [&](uint32_t d) { acc.AppendFractional(d); });
            if (bad_separator != nullptr)
            {
                status = ParseStatus::invalid_separator;
                next = bad_separator;
                goto L_convert;
            }
        }
    }

    if (!has_digits)
    {
        status = ParseStatus::empty;
        next = curr;
        goto L_empty;
    }

    // Exponent.
    // The exponent is only part of the number if it has at least one digit.
    if (curr != last && ToLowerASCII(*curr) == exponent_char)
    {
        const char* p = curr + 1;

        const bool exp_is_neg = (p != last && *p == '-');
        if (p != last && (*p == '-' || *p == '+'))
        {
            ++p;
        }

        if (is_separator(p))
        {
            status = ParseStatus::invalid_separator;
            next = p;
            goto L_convert;
        }
        if (!is_digit(p))
        {
            status = ParseStatus::empty_exponent;
            next = curr;
            goto L_convert;
        }

        int num = 0;
        curr = ScanDigits(p, last, radix, separator, bad_separator, [&](uint32_t d) {
            if (num <= (kMaxExponent - static_cast<int>(d)) / radix)
                num = num * radix + static_cast<int>(d);
            else
                num = kMaxExponent;
        });

        acc.exponent += exp_is_neg ? -num : num;

        if (bad_separator != nullptr)
        {
            status = ParseStatus::invalid_separator;
            next = bad_separator;
            goto L_convert;
        }
    }

    if (curr != last)
    {
        status = ParseStatus::invalid_digit;
        next = curr;
    }

L_convert:
    {
        int64_t exponent = acc.exponent;
        if (exponent > kMaxExponent)
            exponent = kMaxExponent;
        if (exponent < -kMaxExponent)
            exponent = -kMaxExponent;

        const auto direction = MagnitudeRounding(options.Rounding(), is_neg);
        value = DigitsToFloat<Float>(acc.digits, acc.num_digits, static_cast<int>(exponent), acc.nonzero_tail, radix, direction, options.Lossy());
    }
    goto L_done;

L_check_digits:
    // A separator after the '.' ends the valid prefix before the '.'.
    if (has_digits)
        goto L_convert;
    goto L_empty;

L_special:
    if (curr != last)
    {
        status = ParseStatus::invalid_digit;
        next = curr;
    }
    goto L_done;

L_empty:
    // No valid prefix. The result is +0, whatever the sign.
    result.value = 0;
    result.next = next;
    result.status = status;
    return result;

L_done:
    result.value = is_neg ? -value : value;
    result.next = (status == ParseStatus::success) ? curr : next;
    result.status = status;
    return result;
}

template <typename Float>
ParseResult<Float> lexconv::ParseFloat(const char* first, const char* last, const ParseFloatOptions& options)
{
    LEXCONV_ASSERT(first != nullptr || first == last);

    return Strtod<Float>(first, last, options);
}

template <typename Float>
Float lexconv::ParseFloatUnchecked(const char* first, const char* last, const ParseFloatOptions& options)
{
    return Strtod<Float>(first, last, options).value;
}

template ParseResult<float> lexconv::ParseFloat<float>(const char*, const char*, const ParseFloatOptions&);
template ParseResult<double> lexconv::ParseFloat<double>(const char*, const char*, const ParseFloatOptions&);
template float lexconv::ParseFloatUnchecked<float>(const char*, const char*, const ParseFloatOptions&);
template double lexconv::ParseFloatUnchecked<double>(const char*, const char*, const ParseFloatOptions&);
