// Copyright 2019 Alexander Bolz
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include "diyfp.h"
#include "format_digits.h"

#include <limits>

namespace lexconv {
namespace impl {

//==================================================================================================
// Grisu3
//
// Shortest decimal digits computed with 64-bit integer arithmetic only. For a
// small fraction of the inputs Grisu3 cannot prove that its digits are both the
// shortest and the closest ones and reports failure instead.
//
// References:
//
// [1]  Loitsch, "Printing Floating-Point Numbers Quickly and Accurately with Integers",
//      Proceedings of the ACM SIGPLAN 2010 Conference on Programming Language Design and Implementation, PLDI 2010
//==================================================================================================

// The scaled input and its rounding interval. All three share one binary
// exponent in [kAlpha, kGamma].
//
//  ----(---+---[---------------(---+---)---------------]---+---)----
//      L   w-  L+              M-  w   M+              H-  w+  H
//
// [L, H] is the rounding interval [M-, M+] widened by the scaling error. Any
// number in [L+, H-] reads back as w, whatever the tie-breaking rule.
struct Grisu3Interval
{
    DiyFp L;
    DiyFp w;
    DiyFp H;
};

// Moves the last digit towards w, then checks that the result is unique and
// lies in the safe interval.
//
// Measured from H in units of 2^e:
//  * distance  = H - w
//  * delta     = H - L
//  * rest      = H - digits * 10^kappa
//  * ten_kappa = 10^kappa
//  * unit      = scaling error
inline bool Grisu3RoundWeed(char* digits, int num_digits, uint64_t distance, uint64_t delta, uint64_t rest, uint64_t ten_kappa, uint64_t unit)
{
    LEXCONV_ASSERT(num_digits >= 1);
    LEXCONV_ASSERT(distance <= delta);
    LEXCONV_ASSERT(rest <= delta);
    LEXCONV_ASSERT(ten_kappa > 0);
    LEXCONV_ASSERT(unit > 0);
    LEXCONV_ASSERT(distance >= unit);
    LEXCONV_ASSERT(distance <= UINT64_MAX - unit);

    // w is only known up to one unit.
    const uint64_t to_w_high = distance - unit;
    const uint64_t to_w_low  = distance + unit;

    // Decrement while the digits stay in [L, H] and get closer to w + unit.
    // The comparisons are ordered to avoid unsigned wrap-around.
    uint32_t last = static_cast<uint32_t>(digits[num_digits - 1] - '0');
    while (rest <= to_w_high
        && delta - rest > ten_kappa
        && (rest + ten_kappa <= to_w_high || rest + ten_kappa - to_w_high < to_w_high - rest))
    {
        LEXCONV_ASSERT(last != 0);
        --last;
        rest += ten_kappa;
    }

    digits[num_digits - 1] = static_cast<char>('0' + last);

    // A further decrement might be closer to w - unit. Both candidates are then
    // possible and the closer one is unknown.
    if (rest < to_w_low
        && delta - rest >= ten_kappa
        && (rest + ten_kappa <= to_w_low || rest + ten_kappa - to_w_low < to_w_low - rest))
    {
        return false;
    }

    LEXCONV_ASSERT(delta >= 4 * unit);

    // [L+, H-]
    return 2 * unit <= rest && rest <= delta - 4 * unit;
}

// Generates the digits of H from left to right and stops as soon as
// digits * 10^exponent lies in [L, H].
inline bool Grisu3DigitGen(char* digits, int& num_digits, int& exponent, const Grisu3Interval& x)
{
    static_assert(DiyFp::SignificandSize == 64, "internal error");
    static_assert(kAlpha >= -60, "internal error");
    static_assert(kGamma <= -32, "internal error");

    LEXCONV_ASSERT(x.H.e >= kAlpha);
    LEXCONV_ASSERT(x.H.e <= kGamma);
    LEXCONV_ASSERT(x.H.e == x.L.e);
    LEXCONV_ASSERT(x.H.e == x.w.e);

    const int shift = -x.H.e;
    const uint64_t one  = uint64_t{1} << shift; // 1 in units of 2^e
    const uint64_t mask = one - 1;

    uint64_t distance = Subtract(x.H, x.w).f;
    uint64_t delta    = Subtract(x.H, x.L).f;

    // H = integral + fractional * 2^e. Since shift >= 32, integral fits into 32 bits.
    const uint32_t integral = static_cast<uint32_t>(x.H.f >> shift);
    uint64_t fractional = x.H.f & mask;

    LEXCONV_ASSERT(integral >= 4);
    LEXCONV_ASSERT(integral <= 798336123); // See GetCachedPowerForBinaryExponent.

    const int k = DecimalLength(integral);
    PrintDecimalDigits(digits, integral, k);
    num_digits = k;

    if (fractional >= delta)
    {
        // Every integral digit is significant. Append fractional digits. The
        // remainder, delta, distance and the error unit are all scaled by 10 in
        // each step, so 10^-m is one unit of 2^e again.
        uint64_t unit = 1;
        for (int m = 1; ; ++m)
        {
            LEXCONV_ASSERT(num_digits < 17);
            LEXCONV_ASSERT(fractional <= UINT64_MAX / 10);

            fractional *= 10;
            delta      *= 10;
            distance   *= 10;
            unit       *= 10;

            const uint32_t d = static_cast<uint32_t>(fractional >> shift);
            LEXCONV_ASSERT(d <= 9);
            digits[num_digits++] = static_cast<char>('0' + d);
            fractional &= mask;

            if (fractional < delta)
            {
                exponent = -m;
                return Grisu3RoundWeed(digits, num_digits, distance, delta, fractional, one, unit);
            }
        }
    }

    LEXCONV_ASSERT((uint64_t{integral} << shift) + fractional >= delta);

    // Some of the integral digits are not needed. Drop trailing digits as long
    // as the dropped part stays below delta.
    uint64_t rest = fractional;
    uint64_t ten_n = one; // 10^n in units of 2^e

    int n = 0;
    for (;;)
    {
        LEXCONV_ASSERT(n <= k - 1);
        LEXCONV_ASSERT(rest < delta);

        const uint64_t d = static_cast<uint64_t>(digits[k - 1 - n] - '0');
        const uint64_t rest_n = d * ten_n + rest;
        if (rest_n >= delta)
            break;

        rest = rest_n;
        ten_n *= 10;
        ++n;
    }

    num_digits = k - n;
    exponent = n;
    return Grisu3RoundWeed(digits, num_digits, distance, delta, rest, ten_n, 1);
}

// value = digits * 10^exponent
// Returns false if the digits could not be certified. The caller must then use
// an exact algorithm.
// PRE: value must be finite and strictly positive.
// PRE: The digits buffer must hold at least max_digits10 characters.
template <typename Float>
inline bool Grisu3ToDigits(char* digits, int& num_digits, int& exponent, Float value)
{
    static_assert(DiyFp::SignificandSize >= std::numeric_limits<Float>::digits + 3,
        "Grisu3 requires at least three extra bits of precision");

    LEXCONV_ASSERT(IEEE<Float>(value).IsFinite());
    LEXCONV_ASSERT(value > 0);

    // Boundaries of Float, so that single-precision output is the shortest for a
    // single-precision parser.
    const auto b = ComputeBoundaries(value);

    LEXCONV_ASSERT(b.m_plus.e == b.m_minus.e);
    LEXCONV_ASSERT(b.m_plus.e == b.v.e);

    // Scale by c ~= 10^-k, so that the exponent lands in [kAlpha, kGamma].
    const auto cached = GetCachedPowerForBinaryExponent(b.m_plus.e);
    const DiyFp c(cached.f, cached.e);

    const DiyFp w       = Multiply(b.v,       c);
    const DiyFp w_minus = Multiply(b.m_minus, c);
    const DiyFp w_plus  = Multiply(b.m_plus,  c);

    LEXCONV_ASSERT(w_plus.e >= kAlpha);
    LEXCONV_ASSERT(w_plus.e <= kGamma);
    // Not necessarily normalized, but m+ and c are.
    LEXCONV_ASSERT(w_plus.f >= (uint64_t{1} << (64 - 2)));

    // Multiply rounds and c is inexact: widen by one unit on each side.
    const Grisu3Interval x = {
        DiyFp(w_minus.f - 1, w_minus.e),
        w,
        DiyFp(w_plus.f + 1, w_plus.e),
    };

    const bool certified = Grisu3DigitGen(digits, num_digits, exponent, x);

    // value = w * 10^k
    exponent -= cached.k;

    return certified;
}

} // namespace impl
} // namespace lexconv
