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

#include "bignum.h"
#include "format_digits.h"

#include <cmath>

namespace lexconv {
namespace impl {

//==================================================================================================
// Dragon4
//
// Implements the Dragon4 algorithm for (IEEE) binary to radix-B floating-point conversion,
// 2 <= B <= 36.
//
// References:
//
// [1]  Burger, Dybvig, "Printing Floating-Point Numbers Quickly and Accurately",
//      Proceedings of the ACM SIGPLAN 1996 Conference on Programming Language Design and Implementation, PLDI 1996
// [2]  Steele, White, "How to Print FloatingPoint Numbers Accurately",
//      Proceedings of the ACM SIGPLAN 1990 conference on Programming language design and implementation, PLDI 1990
//==================================================================================================

inline int EffectivePrecision(uint64_t f)
{
    LEXCONV_ASSERT(f != 0);
    return 64 - CountLeadingZeros64(f);
}

// Returns an estimate k of ceil(log_B(2^e)), with k <= ceil(log_B(2^e)).
inline int CeilLogRadixPow2(int e, int radix)
{
    LEXCONV_ASSERT(e >= -1200);
    LEXCONV_ASSERT(e <=  1200);

    if (radix == 10)
    {
        // ceil(log_10(2^e)) (exact for this range)
        const int x = e * 315653 + ((1 << 20) - 1);
        return x < 0 ? ~(~x >> 20) : (x >> 20);
    }

    // The fractional parts of e * log_B(2) are bounded away from 0 by far more
    // than the rounding error of this computation. The caller corrects the
    // estimate if it is too low.
    const double x = e * (std::log(2.0) / std::log(static_cast<double>(radix)));
    return static_cast<int>(std::ceil(x - 1e-10));
}

// Computes the initial values
//
//      r / s       = v / B^k
//      m_minus / s = (v - v-) / 2 / B^k
//
// with all factors of 2^e and B^k moved to the side where the exponent is
// non-negative. Returns the estimate k.
inline int ComputeInitialValuesAndEstimate(DiyInt& r, DiyInt& s, DiyInt& m_minus, uint64_t f, int e, int radix, bool lowerBoundaryIsCloser)
{
    const int boundaryShift = lowerBoundaryIsCloser ? 2 : 1;
    const int p = EffectivePrecision(f);
    LEXCONV_ASSERT(p >= 1);
    LEXCONV_ASSERT(p <= 53);
    const int k = CeilLogRadixPow2(e + (p - 1), radix);

    // r = f * 2^(boundaryShift + max(e,0)) * B^max(-k,0)
    AssignU64MulPow2(r, f, boundaryShift + Max(e, 0));
    // s = 2^(boundaryShift + max(-e,0)) * B^max(k,0)
    AssignPowRadixMulPow2(s, radix, Max(k, 0), boundaryShift + Max(-e, 0));
    // m- = 2^max(e,0) * B^max(-k,0)
    AssignPow2(m_minus, Max(e, 0));

    if (k < 0)
    {
        MulPowRadix(r, radix, -k);
        MulPowRadix(m_minus, radix, -k);
    }

    return k;
}

// v = f * 2^e = digits * B^exponent
// The generated digits are the shortest sequence which uniquely identifies v,
// and closest to v if there is more than one such sequence.
inline char* Dragon4(char* digits, int& num_digits, int& exponent, uint64_t f, int e, int radix, bool acceptBounds, bool lowerBoundaryIsCloser)
{
    LEXCONV_ASSERT(f != 0);
    LEXCONV_ASSERT(radix >= 2);
    LEXCONV_ASSERT(radix <= 36);

    const uint32_t B = static_cast<uint32_t>(radix);

    DiyInt r;
    DiyInt s;
    DiyInt m_minus;
    DiyInt m_plus;

    //
    // Compute initial values.
    // Estimate k.
    //
    int k = ComputeInitialValuesAndEstimate(r, s, m_minus, f, e, radix, lowerBoundaryIsCloser);

    // m+ = m- or m+ = 2 m-
    AssignZero(m_plus);
    std::memcpy(m_plus.bigits, m_minus.bigits, sizeof(uint32_t) * static_cast<uint32_t>(m_minus.size));
    m_plus.size = m_minus.size;
    if (lowerBoundaryIsCloser)
    {
        Mul2(m_plus);
    }

    //
    // Fixup, in case k is too low.
    //
    for (;;)
    {
        const int cmpf = CompareAdd(r, m_plus, s);
        if (acceptBounds ? (cmpf < 0) : (cmpf <= 0))
            break;

        MulAddU32(s, B);
        k++;
    }

    //
    // Generate digits from left to right.
    //
    int length = 0;
    for (;;)
    {
        MulAddU32(r, B);
        MulAddU32(m_minus, B);
        MulAddU32(m_plus, B);

        // q = r / s
        // r = r % s
        uint32_t q = (r.size > 0) ? DivMod(r, s) : 0;
        LEXCONV_ASSERT(q < B);

        const int cmp1 = Compare(r, m_minus);
        const int cmp2 = CompareAdd(r, m_plus, s);

        const bool tc1 = acceptBounds ? (cmp1 <= 0) : (cmp1 < 0);
        const bool tc2 = acceptBounds ? (cmp2 >= 0) : (cmp2 > 0);
        if (tc1 && tc2)
        {
            // Return the number closer to v.
            // If the two are equidistant from v, round the last digit to even.
            const int cmpr = CompareAdd(r, r, s);
            if (cmpr > 0 || (cmpr == 0 && q % 2 != 0))
            {
                q++;
            }
        }
        else if (!tc1 && tc2)
        {
            q++;
        }

        LEXCONV_ASSERT(q < B);
        LEXCONV_ASSERT(length < kMaxDigits);
        digits[length++] = DigitChar(q);
        k--;

        if (tc1 || tc2)
            break;
    }

    num_digits = length;
    exponent = k;

    return digits + length;
}

// v = digits * B^exponent
// PRE: value must be finite and strictly positive.
template <typename Float>
inline void Dragon4ToDigits(char* digits, int& num_digits, int& exponent, Float value, int radix)
{
    using Fp = IEEE<Float>;

    LEXCONV_ASSERT(Fp(value).IsFinite());
    LEXCONV_ASSERT(value > 0);

    const auto v = DiyFpFromFloat(value);

    const bool isEven = (v.f % 2 == 0);
    const bool acceptBounds = isEven;
    const bool lowerBoundaryIsCloser = LowerBoundaryIsCloser(value);

    Dragon4(digits, num_digits, exponent, v.f, v.e, radix, acceptBounds, lowerBoundaryIsCloser);
}

} // namespace impl
} // namespace lexconv
