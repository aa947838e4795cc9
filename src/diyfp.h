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

#include "ieee.h"

#ifdef _MSC_VER
#include <intrin.h>
#endif

namespace lexconv {
namespace impl {

//==================================================================================================
// DiyFp
//
// An unsigned binary floating-point number f * 2^e with a 64-bit significand,
// used as the working precision of both Grisu3 and the decimal parser.
//
// References:
//
// [1]  Loitsch, "Printing Floating-Point Numbers Quickly and Accurately with Integers",
//      Proceedings of the ACM SIGPLAN 2010 Conference on Programming Language Design and Implementation, PLDI 2010
//==================================================================================================

inline constexpr int Min(int x, int y) { return y < x ? y : x; }
inline constexpr int Max(int x, int y) { return y < x ? x : y; }

struct DiyFp // f * 2^e
{
    static constexpr int SignificandSize = 64;

    uint64_t f = 0;
    int e = 0;

    constexpr DiyFp() = default;
    constexpr DiyFp(uint64_t f_, int e_) : f(f_), e(e_) {}
};

inline bool IsNormalized(DiyFp x)
{
    return (x.f >> 63) != 0;
}

// PRE: x.e == y.e and x.f >= y.f
inline DiyFp Subtract(DiyFp x, DiyFp y)
{
    LEXCONV_ASSERT(x.e == y.e);
    LEXCONV_ASSERT(x.f >= y.f);

    return DiyFp(x.f - y.f, x.e);
}

// Returns the upper 64 bits of x.f * y.f, rounded half up, with the exponent
// adjusted accordingly.
inline DiyFp Multiply(DiyFp x, DiyFp y)
{
    static_assert(DiyFp::SignificandSize == 64, "internal error");

    const int e = x.e + y.e + 64;

#if defined(__SIZEOF_INT128__)
    __extension__ using Uint128 = unsigned __int128;

    const Uint128 p = Uint128{x.f} * Uint128{y.f};
    const uint64_t hi = static_cast<uint64_t>(p >> 64);
    const uint64_t lo = static_cast<uint64_t>(p);

    return DiyFp(hi + (lo >> 63), e);
#elif defined(_MSC_VER) && defined(_M_X64)
    uint64_t hi = 0;
    const uint64_t lo = _umul128(x.f, y.f, &hi);

    return DiyFp(hi + (lo >> 63), e);
#else
    // Schoolbook multiplication with 32-bit limbs.
    const uint64_t x0 = x.f & 0xFFFFFFFF;
    const uint64_t x1 = x.f >> 32;
    const uint64_t y0 = y.f & 0xFFFFFFFF;
    const uint64_t y1 = y.f >> 32;

    const uint64_t p00 = x0 * y0;
    const uint64_t p01 = x0 * y1;
    const uint64_t p10 = x1 * y0;
    const uint64_t p11 = x1 * y1;

    // Bits 32..95 of the product, split into a low and a high half.
    const uint64_t middle = (p00 >> 32) + (p10 & 0xFFFFFFFF) + (p01 & 0xFFFFFFFF);
    const uint64_t hi = p11 + (p10 >> 32) + (p01 >> 32) + (middle >> 32);

    // Bit 63 of the product decides the rounding.
    const uint64_t round = (middle >> 31) & 1;

    return DiyFp(hi + round, e);
#endif
}

// PRE: x != 0
inline int CountLeadingZeros64(uint64_t x)
{
    LEXCONV_ASSERT(x != 0);

#if defined(__GNUC__)
    return __builtin_clzll(x);
#elif defined(_MSC_VER) && (defined(_M_ARM) || defined(_M_ARM64))
    return static_cast<int>(_CountLeadingZeros64(x));
#elif defined(_MSC_VER) && defined(_M_X64)
    return static_cast<int>(__lzcnt64(x));
#else
    int n = 0;
    for (uint64_t bit = uint64_t{1} << 63; (x & bit) == 0; bit >>= 1)
        ++n;
    return n;
#endif
}

// Shifts the significand left until its top bit is set.
// PRE: x.f != 0
inline DiyFp Normalize(DiyFp x)
{
    const int shift = CountLeadingZeros64(x.f);
    return DiyFp(x.f << shift, x.e - shift);
}

// Shifts the significand left until the exponent equals e.
// PRE: e <= x.e, and the shift does not lose any bits.
inline DiyFp NormalizeTo(DiyFp x, int e)
{
    const int shift = x.e - e;

    LEXCONV_ASSERT(shift >= 0);
    LEXCONV_ASSERT(((x.f << shift) >> shift) == x.f);

    return DiyFp(x.f << shift, e);
}

// Returns the exact value of a finite non-negative float. The result is not
// normalized.
template <typename Float>
inline DiyFp DiyFpFromFloat(Float value)
{
    using Fp = IEEE<Float>;

    const Fp v(value);
    LEXCONV_ASSERT(v.IsFinite());
    LEXCONV_ASSERT(!v.SignBit());

    const auto F = v.PhysicalSignificand();
    const auto E = v.PhysicalExponent();

    // Subnormals have no hidden bit and share the exponent of the smallest normal.
    if (E == 0)
        return DiyFp(F, Fp::MinExponent);

    return DiyFp(F | Fp::HiddenBit, static_cast<int>(E) - Fp::ExponentBias);
}

//==================================================================================================
// Boundaries
//
// m- and m+ are the midpoints between v and its neighbors. Every real number
// strictly between them reads back as v.
//
//      ---+-------------+-------------+-------------+-------------+---  (A)
//         v-            m-            v             m+            v+
//
//      -----------------+------+------+-------------+-------------+---  (B)
//                       v-     m-     v             m+            v+
//
// At a power of two (B) the gap below v is half the gap above, unless v is the
// smallest normal number.
//==================================================================================================

template <typename Float>
inline bool LowerBoundaryIsCloser(Float value)
{
    using Fp = IEEE<Float>;

    const auto v = DiyFpFromFloat(value);
    return v.f == Fp::HiddenBit && v.e > Fp::MinExponent;
}

// m+ = v + 2^e / 2. Not normalized.
// PRE: value must be finite and non-negative.
template <typename Float>
inline DiyFp UpperBoundary(Float value)
{
    const auto v = DiyFpFromFloat(value);
    return DiyFp(4 * v.f + 2, v.e - 2);
}

// m- = v - 2^e / 2, or v - 2^e / 4 at a power of two. Not normalized.
// PRE: value must be finite and strictly positive.
template <typename Float>
inline DiyFp LowerBoundary(Float value)
{
    LEXCONV_ASSERT(value > 0);

    const auto v = DiyFpFromFloat(value);
    const uint64_t gap = LowerBoundaryIsCloser(value) ? 1 : 2;
    return DiyFp(4 * v.f - gap, v.e - 2);
}

struct Boundaries {
    DiyFp v;
    DiyFp m_minus;
    DiyFp m_plus;
};

// Returns v normalized, and m- and m+ with the exponent of m+.
// PRE: value must be finite and strictly positive.
template <typename Float>
inline Boundaries ComputeBoundaries(Float value)
{
    LEXCONV_ASSERT(IEEE<Float>(value).IsFinite());
    LEXCONV_ASSERT(value > 0);

    // v and m+ have the same leading bit position, so they normalize to the same exponent.
    const auto v = Normalize(DiyFpFromFloat(value));
    const auto m_plus = NormalizeTo(UpperBoundary(value), v.e);
    const auto m_minus = NormalizeTo(LowerBoundary(value), m_plus.e);

    return {v, m_minus, m_plus};
}

//==================================================================================================
// Cached powers of ten
//
// Normalized approximations c ~= 10^k for every 8th k in [-348, 324]. For any
// normalized w, some c moves the exponent of c * w into [kAlpha, kGamma]. With
// kAlpha = -60 and kGamma = -32 the integral part of the product fits into 32
// bits, and the fractional part can be multiplied by 10 without overflow.
// The parser uses the same table for its decimal scaling.
//==================================================================================================

constexpr int kAlpha = -60;
constexpr int kGamma = -32;

struct CachedPower { // c = f * 2^e ~= 10^k
    uint64_t f;
    int e;
    int k;
};

constexpr int kCachedPowersSize         =   85;
constexpr int kCachedPowersMinDecExp    = -348;
constexpr int kCachedPowersMaxDecExp    =  324;
constexpr int kCachedPowersDecExpStep   =    8;

// Returns the binary exponent of a cached power for a given decimal exponent.
inline int BinaryExponentFromDecimalExponent(int k)
{
    LEXCONV_ASSERT(k <=  400);
    LEXCONV_ASSERT(k >= -400);

    // log_2(10) ~= [3; 3, 9, 2, 2, 4, 6, 2, 1, 1, 3] = 254370/76573
    // 2^15 * 254370/76573 = 108852.93980907...

    return (k * 108853 - 63 * (1 << 15)) >> 15;
}

inline CachedPower GetCachedPower(int index)
{
    // Let e = floor(log_2 10^k) + 1 - 64.
    // Negative powers of 10 are stored as: f = round_up(2^-e / 10^-k).
    // Positive powers of 10 are stored as: f = round_up(10^k / 2^e).
    static constexpr uint64_t kSignificands[/*680 bytes*/] = {
        0xFA8FD5A0081C0288, // e = -1220, k = -348
        0xBAAEE17FA23EBF76, // e = -1193, k = -340
        0x8B16FB203055AC76, // e = -1166, k = -332
        0xCF42894A5DCE35EA, // e = -1140, k = -324
        0x9A6BB0AA55653B2D, // e = -1113, k = -316
        0xE61ACF033D1A45DF, // e = -1087, k = -308
        0xAB70FE17C79AC6CA, // e = -1060, k = -300 >>> double-precision
        0xFF77B1FCBEBCDC4F, // e = -1034, k = -292
        0xBE5691EF416BD60C, // e = -1007, k = -284
        0x8DD01FAD907FFC3C, // e =  -980, k = -276
        0xD3515C2831559A83, // e =  -954, k = -268
        0x9D71AC8FADA6C9B5, // e =  -927, k = -260
        0xEA9C227723EE8BCB, // e =  -901, k = -252
        0xAECC49914078536D, // e =  -874, k = -244
        0x823C12795DB6CE57, // e =  -847, k = -236
        0xC21094364DFB5637, // e =  -821, k = -228
        0x9096EA6F3848984F, // e =  -794, k = -220
        0xD77485CB25823AC7, // e =  -768, k = -212
        0xA086CFCD97BF97F4, // e =  -741, k = -204
        0xEF340A98172AACE5, // e =  -715, k = -196
        0xB23867FB2A35B28E, // e =  -688, k = -188
        0x84C8D4DFD2C63F3B, // e =  -661, k = -180
        0xC5DD44271AD3CDBA, // e =  -635, k = -172
        0x936B9FCEBB25C996, // e =  -608, k = -164
        0xDBAC6C247D62A584, // e =  -582, k = -156
        0xA3AB66580D5FDAF6, // e =  -555, k = -148
        0xF3E2F893DEC3F126, // e =  -529, k = -140
        0xB5B5ADA8AAFF80B8, // e =  -502, k = -132
        0x87625F056C7C4A8B, // e =  -475, k = -124
        0xC9BCFF6034C13053, // e =  -449, k = -116
        0x964E858C91BA2655, // e =  -422, k = -108
        0xDFF9772470297EBD, // e =  -396, k = -100
        0xA6DFBD9FB8E5B88F, // e =  -369, k =  -92
        0xF8A95FCF88747D94, // e =  -343, k =  -84
        0xB94470938FA89BCF, // e =  -316, k =  -76
        0x8A08F0F8BF0F156B, // e =  -289, k =  -68
        0xCDB02555653131B6, // e =  -263, k =  -60
        0x993FE2C6D07B7FAC, // e =  -236, k =  -52
        0xE45C10C42A2B3B06, // e =  -210, k =  -44
        0xAA242499697392D3, // e =  -183, k =  -36 >>> single-precision
        0xFD87B5F28300CA0E, // e =  -157, k =  -28
        0xBCE5086492111AEB, // e =  -130, k =  -20
        0x8CBCCC096F5088CC, // e =  -103, k =  -12
        0xD1B71758E219652C, // e =   -77, k =   -4
        0x9C40000000000000, // e =   -50, k =    4
        0xE8D4A51000000000, // e =   -24, k =   12
        0xAD78EBC5AC620000, // e =     3, k =   20
        0x813F3978F8940984, // e =    30, k =   28
        0xC097CE7BC90715B3, // e =    56, k =   36
        0x8F7E32CE7BEA5C70, // e =    83, k =   44 <<< single-precision
        0xD5D238A4ABE98068, // e =   109, k =   52
        0x9F4F2726179A2245, // e =   136, k =   60
        0xED63A231D4C4FB27, // e =   162, k =   68
        0xB0DE65388CC8ADA8, // e =   189, k =   76
        0x83C7088E1AAB65DB, // e =   216, k =   84
        0xC45D1DF942711D9A, // e =   242, k =   92
        0x924D692CA61BE758, // e =   269, k =  100
        0xDA01EE641A708DEA, // e =   295, k =  108
        0xA26DA3999AEF774A, // e =   322, k =  116
        0xF209787BB47D6B85, // e =   348, k =  124
        0xB454E4A179DD1877, // e =   375, k =  132
        0x865B86925B9BC5C2, // e =   402, k =  140
        0xC83553C5C8965D3D, // e =   428, k =  148
        0x952AB45CFA97A0B3, // e =   455, k =  156
        0xDE469FBD99A05FE3, // e =   481, k =  164
        0xA59BC234DB398C25, // e =   508, k =  172
        0xF6C69A72A3989F5C, // e =   534, k =  180
        0xB7DCBF5354E9BECE, // e =   561, k =  188
        0x88FCF317F22241E2, // e =   588, k =  196
        0xCC20CE9BD35C78A5, // e =   614, k =  204
        0x98165AF37B2153DF, // e =   641, k =  212
        0xE2A0B5DC971F303A, // e =   667, k =  220
        0xA8D9D1535CE3B396, // e =   694, k =  228
        0xFB9B7CD9A4A7443C, // e =   720, k =  236
        0xBB764C4CA7A44410, // e =   747, k =  244
        0x8BAB8EEFB6409C1A, // e =   774, k =  252
        0xD01FEF10A657842C, // e =   800, k =  260
        0x9B10A4E5E9913129, // e =   827, k =  268
        0xE7109BFBA19C0C9D, // e =   853, k =  276
        0xAC2820D9623BF429, // e =   880, k =  284
        0x80444B5E7AA7CF85, // e =   907, k =  292
        0xBF21E44003ACDD2D, // e =   933, k =  300
        0x8E679C2F5E44FF8F, // e =   960, k =  308
        0xD433179D9C8CB841, // e =   986, k =  316
        0x9E19DB92B4E31BA9, // e =  1013, k =  324 <<< double-precision
    };

    LEXCONV_ASSERT(index >= 0);
    LEXCONV_ASSERT(index < kCachedPowersSize);

    const int k = kCachedPowersMinDecExp + index * kCachedPowersDecExpStep;
    const int e = BinaryExponentFromDecimalExponent(k);

    return {kSignificands[index], e, k};
}

// Returns c such that kAlpha <= c.e + e + 64 <= kGamma, for a normalized w = f * 2^e.
inline CachedPower GetCachedPowerForBinaryExponent(int e)
{
    LEXCONV_ASSERT(e <=  1265);
    LEXCONV_ASSERT(e >= -1392);

    // k = ceil((kAlpha - e - 1) * log_10(2))
    const int k = (e * -78913 + ((kAlpha - 1) * 78913 + (1 << 18))) >> 18;
    LEXCONV_ASSERT(k >= kCachedPowersMinDecExp);
    LEXCONV_ASSERT(k <= kCachedPowersMaxDecExp);

    const int index = static_cast<int>( static_cast<unsigned>(-kCachedPowersMinDecExp + k + (kCachedPowersDecExpStep - 1)) / kCachedPowersDecExpStep );
    LEXCONV_ASSERT(index >= 0);
    LEXCONV_ASSERT(index < kCachedPowersSize);

    const auto cached = GetCachedPower(index);
    LEXCONV_ASSERT(kAlpha <= cached.e + e + 64);
    LEXCONV_ASSERT(kGamma >= cached.e + e + 64);

    return cached;
}

// Returns the cached power c ~= 10^k with k <= e < k + kCachedPowersDecExpStep.
inline CachedPower GetCachedPowerForDecimalExponent(int e)
{
    LEXCONV_ASSERT(e >= kCachedPowersMinDecExp);
    LEXCONV_ASSERT(e <  kCachedPowersMaxDecExp + kCachedPowersDecExpStep);

    const int index = static_cast<int>( static_cast<unsigned>(-kCachedPowersMinDecExp + e) / kCachedPowersDecExpStep );
    LEXCONV_ASSERT(index >= 0);
    LEXCONV_ASSERT(index < kCachedPowersSize);

    const auto cached = GetCachedPower(index);
    LEXCONV_ASSERT(e >= cached.k);
    LEXCONV_ASSERT(e <  cached.k + kCachedPowersDecExpStep);

    return cached;
}

} // namespace impl
} // namespace lexconv
