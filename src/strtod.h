// Copyright 2017 Alexander Bolz
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

#pragma once

#include "lexconv.h"
#include "bignum.h"

#include <climits>
#include <cmath>
#include <limits>

namespace lexconv {
namespace impl {

//==================================================================================================
// DigitsToFloat
//
// Converts digits * radix^exponent into the nearest (or directed-rounded)
// float. The digits are stored as values in [0, radix), not as characters.
//
// The decimal path is derived from the double-conversion library:
// https://github.com/google/double-conversion
//
// The original license can be found at the end of this file.
//
// [1] Clinger, "How to read floating point numbers accurately",
//     PLDI '90 Proceedings of the ACM SIGPLAN 1990 conference on Programming language design and
//     implementation, Pages 92-101
//==================================================================================================

// Maximum number of significant digits in decimal representation.
//
// The longest possible double in decimal representation is (2^53 - 1) * 5^1074 / 10^1074,
// which has 767 digits.
// If we parse a number whose first digits are equal to a mean of 2 adjacent doubles (that
// could have up to 768 digits) the result must be rounded to the bigger one unless the tail
// consists of zeros, so we don't need to preserve all the digits.
constexpr int kMaxSignificantDigits = 767 + 1;

// Maximum number of significant digits in any other radix.
//
// The mean of 2 adjacent doubles is a multiple of 2^-1075. In an even radix
// B = 2^a * c this has at most ~875 significant digits (for B = 34). In an odd
// radix the expansion does not terminate and the result may be off by one ulp
// for inputs matching a mean in the first kMaxSignificantRadixDigits digits.
constexpr int kMaxSignificantRadixDigits = 1100;

enum class RoundingDirection {
    nearest_even,
    nearest_away,
    down, // towards zero
    up,   // away from zero
};

// Directed rounding modes round the magnitude of the input.
inline RoundingDirection MagnitudeRounding(RoundingKind kind, bool negative)
{
    switch (kind)
    {
    case RoundingKind::nearest_tie_even:
        return RoundingDirection::nearest_even;
    case RoundingKind::nearest_tie_away_zero:
        return RoundingDirection::nearest_away;
    case RoundingKind::toward_positive_infinity:
        return negative ? RoundingDirection::down : RoundingDirection::up;
    case RoundingKind::toward_negative_infinity:
        return negative ? RoundingDirection::up : RoundingDirection::down;
    case RoundingKind::toward_zero:
        return RoundingDirection::down;
    }

    LEXCONV_ASSERT(false && "invalid rounding kind");
    return RoundingDirection::nearest_even;
}

//--------------------------------------------------------------------------------------------------
// StrtodFast
//--------------------------------------------------------------------------------------------------

// Double operations detection based on target architecture.
// Linux uses a 80bit wide floating point stack on x86. This induces double rounding, which in
// turn leads to wrong results.
// An easy way to test if the floating-point operations are correct is to evaluate: 89255.0/1e22.
// If the floating-point stack is 64 bits wide then the result is equal to 89255e-22.
#if defined(_M_X64)              || \
    defined(__x86_64__)          || \
    defined(__ARMEL__)           || \
    defined(__avr32__)           || \
    defined(__hppa__)            || \
    defined(__ia64__)            || \
    defined(__mips__)            || \
    defined(__powerpc__)         || \
    defined(__ppc__)             || \
    defined(__ppc64__)           || \
    defined(_POWER)              || \
    defined(_ARCH_PPC)           || \
    defined(_ARCH_PPC64)         || \
    defined(__sparc__)           || \
    defined(__sparc)             || \
    defined(__s390__)            || \
    defined(__SH4__)             || \
    defined(__alpha__)           || \
    defined(_MIPS_ARCH_MIPS32R2) || \
    defined(__AARCH64EL__)       || \
    defined(__aarch64__)         || \
    defined(__riscv)
#define LEXCONV_CORRECT_DOUBLE_OPERATIONS 1
#elif defined(_M_IX86) || defined(__i386__) || defined(__i386)
#ifdef _WIN32
// Windows uses a 64bit wide floating point stack.
#define LEXCONV_CORRECT_DOUBLE_OPERATIONS 1
#endif
#endif

template <typename Float> struct DecimalTraits;

template <>
struct DecimalTraits<double>
{
    // 2^53 = 9007199254740992.
    // Any integer with at most 15 decimal digits will hence fit into a double
    // (which has a 53bit significand) without loss of precision.
    static constexpr int kMaxExactIntegerDigits = 15;
    // 10^22 = 4768371582031250 * 2^21 = (10^1  * 5^21) * 2^21
    static constexpr int kMaxExactPowerOfTen = 22;
    // Max double: 1.7976931348623157 * 10^308, which has 309 digits.
    // Any x >= 10^309 is interpreted as +infinity.
    static constexpr int kMaxDecimalPower = 309;
    // Min non-zero double: 4.9406564584124654 * 10^-324
    // Any x <= 10^-324 is interpreted as 0.
    static constexpr int kMinDecimalPower = -324;
};

template <>
struct DecimalTraits<float>
{
    // 2^24 = 16777216.
    static constexpr int kMaxExactIntegerDigits = 7;
    // 10^10 = 9765625 * 2^10
    static constexpr int kMaxExactPowerOfTen = 10;
    // Max float: 3.40282347 * 10^38, which has 39 digits.
    static constexpr int kMaxDecimalPower = 39;
    // Min non-zero float: 1.40129846 * 10^-45
    static constexpr int kMinDecimalPower = -46;
};

#if LEXCONV_CORRECT_DOUBLE_OPERATIONS

template <typename Float>
inline bool FastPath(Float& result, uint64_t digits, int num_digits, int exponent)
{
    using Traits = DecimalTraits<Float>;

    static constexpr double kExactPowersOfTen[] = {
        1.0e+00,
        1.0e+01,
        1.0e+02,
        1.0e+03,
        1.0e+04,
        1.0e+05,
        1.0e+06,
        1.0e+07,
        1.0e+08,
        1.0e+09,
        1.0e+10,
        1.0e+11,
        1.0e+12,
        1.0e+13,
        1.0e+14,
        1.0e+15,
        1.0e+16,
        1.0e+17,
        1.0e+18,
        1.0e+19,
        1.0e+20,
        1.0e+21,
        1.0e+22,
    };

    LEXCONV_ASSERT(num_digits <= Traits::kMaxExactIntegerDigits);

    // The significand fits into a Float.
    // If 10^exponent (resp. 10^-exponent) fits into a Float too then we can
    // compute the result simply by multiplying (resp. dividing) the two
    // numbers.
    // This is possible because IEEE guarantees that floating-point operations
    // return the best possible approximation.

    const int remaining_digits = Traits::kMaxExactIntegerDigits - num_digits;
    if (-Traits::kMaxExactPowerOfTen <= exponent && exponent <= remaining_digits + Traits::kMaxExactPowerOfTen)
    {
        Float d = static_cast<Float>(static_cast<int64_t>(digits));
        if (exponent < 0)
        {
            d /= static_cast<Float>(kExactPowersOfTen[-exponent]);
        }
        else if (exponent <= Traits::kMaxExactPowerOfTen)
        {
            d *= static_cast<Float>(kExactPowersOfTen[exponent]);
        }
        else
        {
            // The buffer is short and we can multiply it with
            // 10^remaining_digits and the remaining exponent fits into a Float.
            //
            // Eg. 123 * 10^25 = (123*1000) * 10^22

            d *= static_cast<Float>(kExactPowersOfTen[remaining_digits]); // exact
            d *= static_cast<Float>(kExactPowersOfTen[exponent - remaining_digits]);
        }
        result = d;
        return true;
    }

    return false;
}

#else // ^^^ LEXCONV_CORRECT_DOUBLE_OPERATIONS

template <typename Float>
inline bool FastPath(Float& /*result*/, uint64_t /*digits*/, int /*num_digits*/, int /*exponent*/)
{
    return false;
}

#endif // ^^^ !LEXCONV_CORRECT_DOUBLE_OPERATIONS

//--------------------------------------------------------------------------------------------------
// StrtodApprox
//--------------------------------------------------------------------------------------------------

struct DiyFpWithError // value = (x.f + delta) * 2^x.e, where |delta| <= error
{
    // We don't want to deal with fractions and therefore work with a common denominator.
    static constexpr int kDenominatorLog = 1;
    static constexpr int kDenominator = 1 << kDenominatorLog;

    DiyFp x;
    uint32_t error = 0;

    constexpr DiyFpWithError() = default;
    constexpr DiyFpWithError(DiyFp x_, uint32_t error_) : x(x_), error(error_) {}
};

// Normalize x
// and scale the error, so that the error is in ULP(x).
// An exact input may need a shift by up to 63 bits; its error stays 0.
inline void Normalize(DiyFpWithError& num)
{
    const int s = CountLeadingZeros64(num.x.f);

    num.x.f <<= s;
    num.x.e  -= s;

    if (num.error != 0)
    {
        LEXCONV_ASSERT(s < 32 && ((num.error << s) >> s) == num.error);
        num.error <<= s;
    }
}

// 2^64 = 18446744073709551616 > 10^19
// Any integer with at most 19 decimal digits will hence fit into an uint64_t.
constexpr int kMaxUint64DecimalDigits = 19;

template <typename Int>
inline Int ReadInt(const char* f, const char* l)
{
    LEXCONV_ASSERT(l - f <= std::numeric_limits<Int>::digits10);

    Int value = 0;
    for ( ; f != l; ++f)
    {
        LEXCONV_ASSERT(static_cast<unsigned char>(*f) < 10);
        value = 10 * value + static_cast<unsigned char>(*f);
    }

    return value;
}

// Returns 10^k as an exact DiyFp.
// PRE: 1 <= k < kCachedPowersDecExpStep
inline DiyFp GetAdjustmentPowerOfTen(int k)
{
    static_assert(kCachedPowersDecExpStep <= 8, "internal error");

    static constexpr uint64_t kSignificands[] = {
        0x8000000000000000, // e = -63, == 10^0 (unused)
        0xA000000000000000, // e = -60, == 10^1
        0xC800000000000000, // e = -57, == 10^2
        0xFA00000000000000, // e = -54, == 10^3
        0x9C40000000000000, // e = -50, == 10^4
        0xC350000000000000, // e = -47, == 10^5
        0xF424000000000000, // e = -44, == 10^6
        0x9896800000000000, // e = -40, == 10^7
    };

    LEXCONV_ASSERT(k > 0);
    LEXCONV_ASSERT(k < kCachedPowersDecExpStep);

    const int e = BinaryExponentFromDecimalExponent(k);
    return {kSignificands[k], e};
}

// Returns the significand size for a given order of magnitude.
//
// If v = f * 2^e with 2^(q-1) <= f < 2^q then (q+e) is v's order of magnitude.
//
// This function returns the number of significant binary digits v will have
// once it's encoded into a 'Float'. In almost all cases this is equal to
// SignificandSize. The only exceptions are subnormals. They start with
// leading zeroes and their effective significand-size is hence smaller.
template <typename Float>
inline int EffectiveSignificandSize(int order)
{
    using Fp = IEEE<Float>;

    const int s = order - Fp::MinExponent;

    if (s > Fp::SignificandSize)
        return Fp::SignificandSize;
    if (s < 0)
        return 0;

    return s;
}

// Returns `f * 2^e`.
template <typename Float>
inline Float LoadFloat(uint64_t f, int e)
{
    using Fp = IEEE<Float>;
    using Bits = typename Fp::bits_type;

    LEXCONV_ASSERT(f <= Fp::HiddenBit + Fp::SignificandMask);
    LEXCONV_ASSERT(e <= Fp::MinExponent || (f & Fp::HiddenBit) != 0);

    if (e > Fp::MaxExponent)
    {
        return std::numeric_limits<Float>::infinity();
    }
    if (e < Fp::MinExponent)
    {
        return 0;
    }

    const Bits exponent = (e == Fp::MinExponent && (f & Fp::HiddenBit) == 0)
        ? 0 // subnormal
        : static_cast<Bits>(e + Fp::ExponentBias);

    const Bits bits = static_cast<Bits>(exponent << Fp::PhysicalSignificandSize) | (static_cast<Bits>(f) & Fp::SignificandMask);

    return ReinterpretBits<Float>(bits);
}

// Approximates digits * 10^exponent with a DiyFp and a tracked error bound.
// Returns true if `result` is certified. Otherwise `result` is the correct
// value or its predecessor.
//
// PRE: num_digits + exponent <= kMaxDecimalPower
// PRE: num_digits + exponent >  kMinDecimalPower
template <typename Float>
inline bool StrtodApprox(Float& result, const char* digits, int num_digits, int exponent)
{
    using Fp = IEEE<Float>;
    using Traits = DecimalTraits<Float>;

    static_assert(DiyFp::SignificandSize == 64, "internal error");

    LEXCONV_ASSERT(num_digits > 0);
    LEXCONV_ASSERT(digits[0] > 0);
    LEXCONV_ASSERT(num_digits + exponent <= Traits::kMaxDecimalPower);
    LEXCONV_ASSERT(num_digits + exponent >  Traits::kMinDecimalPower);

    // input = (f + delta) * 2^e with |delta| <= error / kULP.

    constexpr int kLogULP = DiyFpWithError::kDenominatorLog;
    constexpr int kULP = DiyFpWithError::kDenominator;

    const int read_digits = Min(num_digits, kMaxUint64DecimalDigits);

    DiyFpWithError input;

    input.x.f = ReadInt<uint64_t>(digits, digits + read_digits);
    input.x.e = 0;
    input.error = 0;

    if (num_digits <= Traits::kMaxExactIntegerDigits)
    {
        if (FastPath(result, input.x.f, num_digits, exponent))
            return true;
    }

    if (read_digits < num_digits)
    {
        // Rounded to 19 digits: off by at most 1/2.
        input.x.f += (digits[read_digits] >= 5);
        input.error = kULP / 2;
    }

    // A rounded input has 19 digits, f > 2^59, so normalizing scales the error by at most 2^4.
    Normalize(input);
    LEXCONV_ASSERT(input.error <= 16 * (kULP / 2));

    exponent += num_digits - read_digits;

    // The error of a product is at most 1/2 plus the errors of its factors.
    const auto cached = GetCachedPowerForDecimalExponent(exponent);
    const auto cached_power = DiyFp(cached.f, cached.e);

    // Only every 8th power is cached. Multiply by the exact remainder first.
    if (cached.k != exponent)
    {
        const auto adjustment_exponent = exponent - cached.k;
        const auto adjustment_power = GetAdjustmentPowerOfTen(adjustment_exponent);

        LEXCONV_ASSERT(IsNormalized(input.x));
        LEXCONV_ASSERT(IsNormalized(adjustment_power));

        input.x = Multiply(input.x, adjustment_power);

        // Exact unless the product needs more than 64 bits.
        if (num_digits + adjustment_exponent > kMaxUint64DecimalDigits)
        {
            input.error += kULP / 2;
            LEXCONV_ASSERT(input.error <= 17 * (kULP / 2));
        }

        // Both factors were normalized: the shift is at most 1.
        Normalize(input);
        LEXCONV_ASSERT(input.error <= 34 * (kULP / 2));
    }

    LEXCONV_ASSERT(IsNormalized(input.x));
    LEXCONV_ASSERT(IsNormalized(cached_power));

    input.x = Multiply(input.x, cached_power);

    // 10^0 through 10^27 are exact in the table. The others are off by less than 1/2.
    input.error += static_cast<unsigned>(kULP / 2 + (0 <= exponent && exponent <= 27 ? 0 : kULP / 2));
    LEXCONV_ASSERT(input.error <= 36 * (kULP / 2));

    Normalize(input);
    LEXCONV_ASSERT(input.error <= 72 * (kULP / 2));

    // Round the 64-bit significand to the precision of Float, which is smaller
    // for subnormals.

    const int prec = EffectiveSignificandSize<Float>(DiyFp::SignificandSize + input.x.e);
    LEXCONV_ASSERT(prec >= 0);
    LEXCONV_ASSERT(prec <= Fp::SignificandSize);

    int excess_bits = DiyFp::SignificandSize - prec;
    if (excess_bits > DiyFp::SignificandSize - kLogULP - 1)
    {
        // Tiny subnormals: half * kULP would overflow. Pre-shift, folding the
        // dropped bits into the error and rounding the error up.
        const int s = excess_bits - (DiyFp::SignificandSize - kLogULP - 1);
        LEXCONV_ASSERT(s > 0);

        const uint64_t discarded_bits = input.x.f & ((uint64_t{1} << s) - 1);
        LEXCONV_ASSERT(discarded_bits <= UINT32_MAX);

        input.error += static_cast<uint32_t>(discarded_bits);
        input.error >>= s;
        input.error += 1;

        input.x.f >>= s;
        input.x.e  += s;

        excess_bits = DiyFp::SignificandSize - kLogULP - 1;
    }

    // f = p1 * 2^n + p2, with n = excess_bits. The result is p1 or p1 + 1,
    // unless p2 is within `error` of the midpoint 2^n / 2.

    LEXCONV_ASSERT(excess_bits >= 11);
    LEXCONV_ASSERT(excess_bits <  64);
    LEXCONV_ASSERT(excess_bits <= DiyFp::SignificandSize - kLogULP - 1);

    const uint64_t two_n = uint64_t{1} << excess_bits;

    uint64_t p2   = input.x.f & (two_n - 1);
    uint64_t half = two_n / 2;

    // Same units as the error.
    LEXCONV_ASSERT(p2   <= UINT64_MAX / kULP);
    LEXCONV_ASSERT(half <= UINT64_MAX / kULP);
    p2   *= kULP;
    half *= kULP;

    input.x.f >>= excess_bits;
    input.x.e  += excess_bits;

    LEXCONV_ASSERT(input.error > 0);
    LEXCONV_ASSERT(half >= input.error);

    bool success;
    if (p2 >= half + input.error)
    {
        success = true;

        // Carrying into bit p leaves the significand at exactly 2^p.
        ++input.x.f;
        if (input.x.f > Fp::HiddenBit + Fp::SignificandMask)
        {
            LEXCONV_ASSERT(input.x.f == (uint64_t{Fp::HiddenBit} << 1));

            input.x.f >>= 1;
            input.x.e  += 1;
        }
    }
    else if (p2 <= half - input.error)
    {
        success = true;
    }
    else
    {
        // Undecided. Keep p1, the caller decides with a bignum comparison.
        success = false;
    }

    result = LoadFloat<Float>(input.x.f, input.x.e);
    return success;
}

template <typename Float>
inline bool ComputeGuess(Float& result, const char* digits, int num_digits, int exponent)
{
    using Traits = DecimalTraits<Float>;

    LEXCONV_ASSERT(num_digits > 0);
    LEXCONV_ASSERT(num_digits <= kMaxSignificantDigits);
    LEXCONV_ASSERT(digits[0] > 0);

    if (num_digits + exponent > Traits::kMaxDecimalPower)
    {
        // Overflow.
        result = std::numeric_limits<Float>::infinity();
        return true;
    }

    if (num_digits + exponent <= Traits::kMinDecimalPower)
    {
        // Underflow.
        result = 0;
        return true;
    }

    return StrtodApprox(result, digits, num_digits, exponent);
}

//--------------------------------------------------------------------------------------------------
// StrtodBignum
//--------------------------------------------------------------------------------------------------

// Compare digits * radix^exponent with v = f * 2^e.
// If nonzero_tail is set, the digits are followed by some non-zero digits.
inline int CompareDigitsWithDiyFp(const char* digits, int num_digits, int exponent, bool nonzero_tail, int radix, DiyFp v)
{
    LEXCONV_ASSERT(num_digits > 0);
    LEXCONV_ASSERT(num_digits <= kMaxSignificantRadixDigits);

    DiyInt lhs;
    DiyInt rhs;

    AssignRadixDigits(lhs, digits, num_digits, radix);
    if (nonzero_tail)
    {
        // The tail is in (0, radix^exponent). Any value in this interval
        // compares the same against v. Use radix^(exponent - 1).
        MulAddU32(lhs, static_cast<uint32_t>(radix), 1);
        exponent--;
    }
    AssignU64(rhs, v.f);

    // radix = 2^a * c
    const auto factors = FactorRadix(radix);

    int lhs_expc = 0;
    int rhs_expc = 0;
    int lhs_exp2 = 0;
    int rhs_exp2 = 0;

    if (exponent >= 0)
    {
        lhs_expc += exponent;
        lhs_exp2 += factors.a * exponent;
    }
    else
    {
        rhs_expc -= exponent;
        rhs_exp2 -= factors.a * exponent;
    }

    if (v.e >= 0)
    {
        rhs_exp2 += v.e;
    }
    else
    {
        lhs_exp2 -= v.e;
    }

    if (lhs_expc > 0 || rhs_expc > 0)
    {
        MulPowU32((lhs_expc > 0) ? lhs : rhs, factors.c, (lhs_expc > 0) ? lhs_expc : rhs_expc);
    }

    const int diff_exp2 = lhs_exp2 - rhs_exp2;
    if (diff_exp2 != 0)
    {
        MulPow2((diff_exp2 > 0) ? lhs : rhs, (diff_exp2 > 0) ? diff_exp2 : -diff_exp2);
    }

    return Compare(lhs, rhs);
}

// Removes leading zeros and moves trailing zeros into the exponent.
// Discards the digits beyond max_digits and records them in nonzero_tail.
inline void TrimDigits(const char*& digits, int& num_digits, int& exponent, bool& nonzero_tail, int max_digits)
{
    LEXCONV_ASSERT(num_digits >= 0);
    LEXCONV_ASSERT(exponent <= INT_MAX - num_digits);

    // Ignore leading zeros
    while (num_digits > 0 && digits[0] == 0)
    {
        digits++;
        num_digits--;
    }

    // Move trailing zeros into the exponent.
    // With a non-zero tail the digits must keep their full length, otherwise
    // the tail would no longer be smaller than one unit in the last digit.
    if (!nonzero_tail)
    {
        while (num_digits > 0 && digits[num_digits - 1] == 0)
        {
            num_digits--;
            exponent++;
        }
    }

    if (num_digits > max_digits)
    {
        // Either the tail was already non-zero, or the trailing zeros have
        // been trimmed above and the last digit is non-zero.
        nonzero_tail = true;

        // Discard insignificant digits.
        exponent += num_digits - max_digits;
        num_digits = max_digits;
    }
}

//--------------------------------------------------------------------------------------------------
// DecimalToFloat
//--------------------------------------------------------------------------------------------------

// Convert the decimal representation 'digits * 10^exponent' into the nearest
// IEEE number, ties to even.
//
// PRE: digits must contain only values in the range 0...9.
// PRE: num_digits >= 0
// PRE: num_digits + exponent must not overflow.
template <typename Float>
inline Float DecimalToFloat(const char* digits, int num_digits, int exponent, bool nonzero_tail)
{
    using Fp = IEEE<Float>;

    TrimDigits(digits, num_digits, exponent, nonzero_tail, kMaxSignificantDigits);

    if (num_digits == 0)
    {
        return 0;
    }

    Float v;
    if (ComputeGuess(v, digits, num_digits, exponent) || !Fp(v).IsFinite())
    {
        return v;
    }

    // Now v is either the correct or the next-lower Float (i.e. the correct Float is v+).
    // Compare B = buffer * 10^exponent with v's upper boundary m+.
    //
    //     v             m+            v+
    //  ---+--------+----+-------------+---
    //              B

    const int cmp = CompareDigitsWithDiyFp(digits, num_digits, exponent, nonzero_tail, 10, UpperBoundary(v));
    if (cmp < 0 || (cmp == 0 && Fp(v).SignificandIsEven()))
    {
        return v;
    }
    return Fp(v).NextValue();
}

//--------------------------------------------------------------------------------------------------
// RadixToFloat
//--------------------------------------------------------------------------------------------------

enum class Magnitude {
    in_range,
    overflow,   // digits * radix^exponent >= 2^(max_exponent + 1)
    underflow,  // digits * radix^exponent <  2^(min subnormal exponent - 2)
};

// Classifies digits * radix^exponent, where the first digit is non-zero, using
// radix^(num_digits + exponent - 1) <= x < radix^(num_digits + exponent).
template <typename Float>
inline Magnitude EstimateMagnitude(int num_digits, int exponent, int radix)
{
    using Fp = IEEE<Float>;

    const double log2_radix = std::log2(static_cast<double>(radix));
    const double order = static_cast<double>(num_digits) + static_cast<double>(exponent);

    if ((order - 1) * log2_radix > std::numeric_limits<Float>::max_exponent + 1)
        return Magnitude::overflow;
    if (order * log2_radix < Fp::MinExponent - 2)
        return Magnitude::underflow;

    return Magnitude::in_range;
}

// Returns an approximation of radix^n.
inline DiyFp PowRadix(int radix, int n)
{
    LEXCONV_ASSERT(n >= 0);

    DiyFp result(uint64_t{1} << 63, -63);
    DiyFp base = Normalize(DiyFp(static_cast<uint64_t>(radix), 0));

    while (n > 0)
    {
        if (n & 1)
        {
            result = Normalize(Multiply(result, base));
        }
        n >>= 1;
        if (n > 0)
        {
            base = Normalize(Multiply(base, base));
        }
    }

    return result;
}

// Returns an approximation of 1/x.
// PRE: x is normalized.
inline DiyFp Reciprocal(DiyFp x)
{
    LEXCONV_ASSERT(IsNormalized(x));

    // q = floor(2^126 / f), with 2^62 <= q <= 2^63.
    uint64_t q = 0;
    uint64_t r = 0;
    for (int i = 126; i >= 0; --i)
    {
        const bool carry = (r >> 63) != 0;
        r = (r << 1) | (i == 126 ? 1u : 0u);
        q <<= 1;
        if (carry || r >= x.f)
        {
            r -= x.f;
            q |= 1;
        }
    }

    return Normalize(DiyFp(q, -126 - x.e));
}

// Rounds x to the nearest Float (ties up).
template <typename Float>
inline Float DiyFpToFloat(DiyFp x)
{
    using Fp = IEEE<Float>;

    if (x.f == 0)
    {
        return 0;
    }

    x = Normalize(x);

    const int prec = EffectiveSignificandSize<Float>(DiyFp::SignificandSize + x.e);
    const int excess_bits = DiyFp::SignificandSize - prec;
    if (excess_bits >= DiyFp::SignificandSize)
    {
        return 0;
    }

    uint64_t f = x.f >> excess_bits;
    int e = x.e + excess_bits;
    if (excess_bits > 0 && ((x.f >> (excess_bits - 1)) & 1) != 0)
    {
        ++f;
        if (f > Fp::HiddenBit + Fp::SignificandMask)
        {
            f >>= 1;
            e += 1;
        }
    }

    return LoadFloat<Float>(f, e);
}

// Returns a Float within a few ulps of digits * radix^exponent.
template <typename Float>
inline Float GuessRadixToFloat(const char* digits, int num_digits, int exponent, int radix)
{
    LEXCONV_ASSERT(num_digits > 0);
    LEXCONV_ASSERT(digits[0] > 0);

    const uint64_t B = static_cast<uint64_t>(radix);

    uint64_t f = 0;
    int read_digits = 0;
    for ( ; read_digits < num_digits; ++read_digits)
    {
        const uint64_t d = static_cast<unsigned char>(digits[read_digits]);
        if (f > (UINT64_MAX - d) / B)
            break;
        f = f * B + d;
    }

    // Move the remaining digits into the exponent.
    exponent += num_digits - read_digits;

    DiyFp x = Normalize(DiyFp(f, 0));
    if (exponent > 0)
    {
        x = Multiply(x, PowRadix(radix, exponent));
    }
    else if (exponent < 0)
    {
        x = Multiply(x, Reciprocal(PowRadix(radix, -exponent)));
    }

    return DiyFpToFloat<Float>(x);
}

// Moves v to the nearest Float. The candidates are compared against the
// midpoints m- and m+ of v and its neighbors.
template <typename Float>
inline Float CorrectNearest(Float v, const char* digits, int num_digits, int exponent, bool nonzero_tail, int radix, bool ties_away)
{
    using Fp = IEEE<Float>;

    constexpr Float kMax = std::numeric_limits<Float>::max();

    for (;;)
    {
        if (Fp(v).IsInf())
        {
            // The midpoint between max and "max + ulp" is the overflow
            // threshold. Max has an odd significand, so ties round to infinity.
            const int cmp = CompareDigitsWithDiyFp(digits, num_digits, exponent, nonzero_tail, radix, UpperBoundary(kMax));
            if (cmp >= 0)
                return v;
            v = kMax;
            continue;
        }

        if (v > 0)
        {
            const int cmp = CompareDigitsWithDiyFp(digits, num_digits, exponent, nonzero_tail, radix, LowerBoundary(v));
            if (cmp < 0 || (cmp == 0 && !ties_away && !Fp(v).SignificandIsEven()))
            {
                v = Fp(v).PrevValue();
                continue;
            }
        }

        const int cmp = CompareDigitsWithDiyFp(digits, num_digits, exponent, nonzero_tail, radix, UpperBoundary(v));
        if (cmp > 0 || (cmp == 0 && (ties_away || !Fp(v).SignificandIsEven())))
        {
            v = Fp(v).NextValue();
            continue;
        }

        return v;
    }
}

// Moves v to the largest Float <= digits * radix^exponent.
template <typename Float>
inline Float CorrectDown(Float v, const char* digits, int num_digits, int exponent, bool nonzero_tail, int radix)
{
    using Fp = IEEE<Float>;

    constexpr Float kMax = std::numeric_limits<Float>::max();

    for (;;)
    {
        if (Fp(v).IsInf())
        {
            v = kMax;
            continue;
        }

        const int cmp = CompareDigitsWithDiyFp(digits, num_digits, exponent, nonzero_tail, radix, DiyFpFromFloat(v));
        if (cmp < 0)
        {
            v = Fp(v).PrevValue();
            continue;
        }

        if (v == kMax)
            return v;

        const Float next = Fp(v).NextValue();
        if (CompareDigitsWithDiyFp(digits, num_digits, exponent, nonzero_tail, radix, DiyFpFromFloat(next)) >= 0)
        {
            v = next;
            continue;
        }

        return v;
    }
}

// Moves v to the smallest Float >= digits * radix^exponent.
template <typename Float>
inline Float CorrectUp(Float v, const char* digits, int num_digits, int exponent, bool nonzero_tail, int radix)
{
    using Fp = IEEE<Float>;

    constexpr Float kMax = std::numeric_limits<Float>::max();

    for (;;)
    {
        if (Fp(v).IsInf())
        {
            if (CompareDigitsWithDiyFp(digits, num_digits, exponent, nonzero_tail, radix, DiyFpFromFloat(kMax)) > 0)
                return v;
            v = kMax;
            continue;
        }

        const int cmp = CompareDigitsWithDiyFp(digits, num_digits, exponent, nonzero_tail, radix, DiyFpFromFloat(v));
        if (cmp > 0)
        {
            v = Fp(v).NextValue();
            continue;
        }

        if (v > 0)
        {
            const Float prev = Fp(v).PrevValue();
            if (prev > 0 && CompareDigitsWithDiyFp(digits, num_digits, exponent, nonzero_tail, radix, DiyFpFromFloat(prev)) <= 0)
            {
                v = prev;
                continue;
            }
        }

        return v;
    }
}

// Convert 'digits * radix^exponent' into an IEEE number, rounding the
// magnitude in the given direction.
//
// PRE: digits must contain only values in the range [0, radix).
// PRE: num_digits + exponent must not overflow.
template <typename Float>
inline Float RadixToFloat(const char* digits, int num_digits, int exponent, bool nonzero_tail, int radix, RoundingDirection direction)
{
    TrimDigits(digits, num_digits, exponent, nonzero_tail, kMaxSignificantRadixDigits);

    if (num_digits == 0)
    {
        return 0;
    }

    constexpr Float kInf = std::numeric_limits<Float>::infinity();
    constexpr Float kMax = std::numeric_limits<Float>::max();
    constexpr Float kMinSubnormal = std::numeric_limits<Float>::denorm_min();

    switch (EstimateMagnitude<Float>(num_digits, exponent, radix))
    {
    case Magnitude::overflow:
        return (direction == RoundingDirection::down) ? kMax : kInf;
    case Magnitude::underflow:
        return (direction == RoundingDirection::up) ? kMinSubnormal : 0;
    case Magnitude::in_range:
        break;
    }

    const Float guess = GuessRadixToFloat<Float>(digits, num_digits, exponent, radix);

    switch (direction)
    {
    case RoundingDirection::nearest_even:
        return CorrectNearest(guess, digits, num_digits, exponent, nonzero_tail, radix, /*ties_away*/ false);
    case RoundingDirection::nearest_away:
        return CorrectNearest(guess, digits, num_digits, exponent, nonzero_tail, radix, /*ties_away*/ true);
    case RoundingDirection::down:
        return CorrectDown(guess, digits, num_digits, exponent, nonzero_tail, radix);
    case RoundingDirection::up:
        return CorrectUp(guess, digits, num_digits, exponent, nonzero_tail, radix);
    }

    LEXCONV_ASSERT(false && "invalid rounding direction");
    return guess;
}

//--------------------------------------------------------------------------------------------------
// LossyToFloat
//--------------------------------------------------------------------------------------------------

// Accumulates the digits in a double and scales the result by radix^exponent.
// The result may be off by a few ulps.
template <typename Float>
inline Float LossyToFloat(const char* digits, int num_digits, int exponent, int radix)
{
    bool nonzero_tail = false;
    TrimDigits(digits, num_digits, exponent, nonzero_tail, kMaxSignificantRadixDigits);

    if (num_digits == 0)
    {
        return 0;
    }

    switch (EstimateMagnitude<Float>(num_digits, exponent, radix))
    {
    case Magnitude::overflow:
        return std::numeric_limits<Float>::infinity();
    case Magnitude::underflow:
        return 0;
    case Magnitude::in_range:
        break;
    }

    constexpr double kTwo64 = 18446744073709551616.0;

    double value = 0;
    for (int i = 0; i < num_digits; ++i)
    {
        if (value >= kTwo64)
        {
            exponent += num_digits - i;
            break;
        }
        value = value * radix + static_cast<unsigned char>(digits[i]);
    }

    // Split the scaling factor, so that neither half overflows nor underflows
    // when the other one would be out of range.
    const int e1 = exponent / 2;
    const int e2 = exponent - e1;
    value *= std::pow(static_cast<double>(radix), e1);
    value *= std::pow(static_cast<double>(radix), e2);

    return static_cast<Float>(value);
}

//--------------------------------------------------------------------------------------------------
// DigitsToFloat
//--------------------------------------------------------------------------------------------------

// Returns the magnitude of digits * radix^exponent.
template <typename Float>
inline Float DigitsToFloat(const char* digits, int num_digits, int exponent, bool nonzero_tail, int radix, RoundingDirection direction, bool lossy)
{
    if (lossy)
    {
        return LossyToFloat<Float>(digits, num_digits, exponent, radix);
    }

#if LEXCONV_RADIX || LEXCONV_ROUNDING
    if (radix != 10 || direction != RoundingDirection::nearest_even)
    {
        return RadixToFloat<Float>(digits, num_digits, exponent, nonzero_tail, radix, direction);
    }
#else
    LEXCONV_ASSERT(radix == 10);
    LEXCONV_ASSERT(direction == RoundingDirection::nearest_even);
#endif

    return DecimalToFloat<Float>(digits, num_digits, exponent, nonzero_tail);
}

} // namespace impl
} // namespace lexconv

/*
Copyright 2006-2011, the V8 project authors. All rights reserved.
Redistribution and use in source and binary forms, with or without
modification, are permitted provided that the following conditions are
met:

    * Redistributions of source code must retain the above copyright
      notice, this list of conditions and the following disclaimer.
    * Redistributions in binary form must reproduce the above
      copyright notice, this list of conditions and the following
      disclaimer in the documentation and/or other materials provided
      with the distribution.
    * Neither the name of Google Inc. nor the names of its
      contributors may be used to endorse or promote products derived
      from this software without specific prior written permission.

THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
"AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
THEORY OF LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE,
ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF
THE POSSIBILITY OF SUCH DAMAGE.
*/
