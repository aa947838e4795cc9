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

#include <cstring>

namespace lexconv {
namespace impl {

//==================================================================================================
// DiyInt
//
// Fixed-capacity unsigned big integer, used by the exact digit generator and by
// the exact comparisons of the parser.
//==================================================================================================

struct DiyInt
{
    // The largest operands occur when parsing: up to 1101 radix-36 digits
    // (~5700 bits) scaled by a power of two reaching down to the smallest
    // subnormal (~1130 bits).
    static constexpr int MaxBits = 7680;
    static constexpr int BigitSize = 32;
    static constexpr int Capacity = (MaxBits + (BigitSize - 1)) / BigitSize;

    uint32_t bigits[Capacity]; // Least significant first.
    int      size = 0;

    DiyInt() = default;
    DiyInt(DiyInt const&) = delete;
    DiyInt& operator=(DiyInt const&) = delete;
};

inline void AssignZero(DiyInt& x)
{
    x.size = 0;
}

inline void AssignU32(DiyInt& x, uint32_t value)
{
    x.bigits[0] = value;
    x.size = (value != 0) ? 1 : 0;
}

inline void AssignU64(DiyInt& x, uint64_t value)
{
    x.bigits[0] = static_cast<uint32_t>(value);
    x.bigits[1] = static_cast<uint32_t>(value >> 32);
    x.size = (x.bigits[1] != 0) ? 2 : ((x.bigits[0] != 0) ? 1 : 0);
}

// x := A * x + B
inline void MulAddU32(DiyInt& x, uint32_t A, uint32_t B = 0)
{
    LEXCONV_ASSERT(x.size >= 0);

    if (A == 1 && B == 0)
    {
        return;
    }
    if (A == 0 || x.size <= 0)
    {
        AssignU32(x, B);
        return;
    }

    uint32_t carry = B;
    for (int i = 0; i < x.size; ++i)
    {
        const uint64_t p = uint64_t{x.bigits[i]} * A + carry;
        x.bigits[i]      = static_cast<uint32_t>(p);
        carry            = static_cast<uint32_t>(p >> 32);
    }

    if (carry != 0)
    {
        LEXCONV_ASSERT(x.size < DiyInt::Capacity);
        x.bigits[x.size++] = carry;
    }
}

// x := x * 2^e2
inline void MulPow2(DiyInt& x, int e2) // aka left-shift
{
    LEXCONV_ASSERT(x.size >= 0);
    LEXCONV_ASSERT(e2 >= 0);

    if (x.size <= 0 || e2 == 0)
        return;

    const int bigit_shift = static_cast<int>(static_cast<unsigned>(e2) / 32);
    const int bit_shift   = static_cast<int>(static_cast<unsigned>(e2) % 32);

    if (bit_shift > 0)
    {
        uint32_t carry = 0;
        for (int i = 0; i < x.size; ++i)
        {
            const uint32_t h = x.bigits[i] >> (32 - bit_shift);
            x.bigits[i]      = x.bigits[i] << bit_shift | carry;
            carry            = h;
        }

        if (carry != 0)
        {
            LEXCONV_ASSERT(x.size < DiyInt::Capacity);
            x.bigits[x.size++] = carry;
        }
    }

    if (bigit_shift > 0)
    {
        LEXCONV_ASSERT(bigit_shift <= DiyInt::Capacity);
        LEXCONV_ASSERT(x.size <= DiyInt::Capacity - bigit_shift);

        std::memmove(x.bigits + bigit_shift, x.bigits, sizeof(uint32_t) * static_cast<uint32_t>(x.size));
        std::memset(x.bigits, 0, sizeof(uint32_t) * static_cast<uint32_t>(bigit_shift));
        x.size += bigit_shift;
    }
}

// Returns the largest n such that base^n fits into an uint32_t, and stores
// base^n in `power`.
// PRE: 2 <= base <= 36
inline int MaxPowerInU32(uint32_t base, uint32_t& power)
{
    LEXCONV_ASSERT(base >= 2);
    LEXCONV_ASSERT(base <= 36);

    int n = 1;
    uint64_t p = base;
    while (p * base <= UINT32_MAX)
    {
        p *= base;
        n++;
    }

    power = static_cast<uint32_t>(p);
    return n;
}

// x := x * base^n
inline void MulPowU32(DiyInt& x, uint32_t base, int n)
{
    LEXCONV_ASSERT(n >= 0);

    if (x.size <= 0 || base == 1)
        return;

    uint32_t chunk_power = 0;
    const int chunk = MaxPowerInU32(base, chunk_power);

    for ( ; n >= chunk; n -= chunk)
    {
        MulAddU32(x, chunk_power);
    }

    uint32_t p = 1;
    for ( ; n > 0; --n)
    {
        p *= base;
    }
    MulAddU32(x, p);
}

// Splits radix = 2^a * c, with c odd.
struct RadixFactors {
    int a;
    uint32_t c;
};

inline RadixFactors FactorRadix(int radix)
{
    LEXCONV_ASSERT(radix >= 2);
    LEXCONV_ASSERT(radix <= 36);

    uint32_t c = static_cast<uint32_t>(radix);
    int a = 0;
    while (c % 2 == 0)
    {
        c /= 2;
        a++;
    }

    return {a, c};
}

// x := x * radix^n
inline void MulPowRadix(DiyInt& x, int radix, int n)
{
    const auto factors = FactorRadix(radix);

    MulPowU32(x, factors.c, n);
    MulPow2(x, factors.a * n);
}

inline void Mul2(DiyInt& x)
{
    MulPow2(x, 1);
}

// x := 2^e2
inline void AssignPow2(DiyInt& x, int e2)
{
    LEXCONV_ASSERT(e2 >= 0);

    if (e2 == 0)
    {
        AssignU32(x, 1);
        return;
    }

    const int bigit_shift = static_cast<int>(static_cast<uint32_t>(e2)) / 32;
    const int bit_shift   = static_cast<int>(static_cast<uint32_t>(e2)) % 32;

    LEXCONV_ASSERT(bigit_shift < DiyInt::Capacity);
    std::memset(x.bigits, 0, sizeof(uint32_t) * static_cast<uint32_t>(bigit_shift));

    x.bigits[bigit_shift] = 1u << bit_shift;
    x.size = bigit_shift + 1;
}

// x := value * 2^e2
inline void AssignU64MulPow2(DiyInt& x, uint64_t value, int e2)
{
    LEXCONV_ASSERT(e2 >= 0);

    AssignU64(x, value);
    MulPow2(x, e2);
}

// x := radix^n * 2^e2
inline void AssignPowRadixMulPow2(DiyInt& x, int radix, int n, int e2)
{
    AssignPow2(x, e2);
    MulPowRadix(x, radix, n);
}

// x := digits[0] digits[1] ... digits[num_digits - 1] (in the given radix)
// The digits are stored as values in [0, radix).
inline void AssignRadixDigits(DiyInt& x, const char* digits, int num_digits, int radix)
{
    LEXCONV_ASSERT(num_digits >= 0);

    uint32_t chunk_power = 0;
    const int chunk = MaxPowerInU32(static_cast<uint32_t>(radix), chunk_power);

    AssignZero(x);

    while (num_digits > 0)
    {
        const int n = Min(num_digits, chunk);

        uint32_t scale = 1;
        uint32_t value = 0;
        for (int i = 0; i < n; ++i)
        {
            LEXCONV_ASSERT(static_cast<unsigned char>(digits[i]) < static_cast<unsigned>(radix));
            scale *= static_cast<uint32_t>(radix);
            value = value * static_cast<uint32_t>(radix) + static_cast<unsigned char>(digits[i]);
        }

        MulAddU32(x, scale, value);
        digits     += n;
        num_digits -= n;
    }
}

// PRE: x != 0
inline int CountLeadingZeros32(uint32_t x)
{
    LEXCONV_ASSERT(x != 0);

#if defined(__GNUC__)
    return __builtin_clz(x);
#elif defined(_MSC_VER) && (defined(_M_IX86) || defined(_M_X64))
    return static_cast<int>(__lzcnt(x));
#else
    int n = 0;
    for (uint32_t bit = 0x80000000u; (x & bit) == 0; bit >>= 1)
        ++n;
    return n;
#endif
}

// Divides u by v, where the quotient is known to be a single digit of radix 36
// or less. Stores the remainder in u and returns the quotient.
//
// Knuth, TAOCP Vol. 2, 4.3.1, Algorithm D, specialized to one quotient bigit.
//
// PRE: u / v <= 36
inline uint32_t DivMod(DiyInt& u, DiyInt const& v)
{
    LEXCONV_ASSERT(u.size > 0);
    LEXCONV_ASSERT(v.size > 0);
    LEXCONV_ASSERT(u.bigits[u.size - 1] != 0);
    LEXCONV_ASSERT(v.bigits[v.size - 1] != 0);

    const int m = u.size;
    const int n = v.size;
    if (m < n)
    {
        return 0;
    }

    LEXCONV_ASSERT(m >= n);
    LEXCONV_ASSERT(m <= n + 1);

    // Short division.
    if (n == 1)
    {
        const uint32_t divisor = v.bigits[0];

        uint64_t quot = 0;
        uint32_t rem = 0;
        for (int i = m - 1; i >= 0; --i)
        {
            const uint64_t t = (uint64_t{rem} << 32) | u.bigits[i];
            quot = t / divisor;
            rem = static_cast<uint32_t>(t % divisor);
        }
        LEXCONV_ASSERT(quot <= 36);
        AssignU32(u, rem);
        return static_cast<uint32_t>(quot);
    }

    LEXCONV_ASSERT(n >= 2);
    LEXCONV_ASSERT(DiyInt::Capacity >= m + 1);
    if (m == n)
    {
        u.bigits[m] = 0;
    }

    // Estimate the quotient from the top bigits of u and v, both shifted so that
    // the top bit of v is set. Only the shifted top bigits are needed, so u and v
    // themselves are left unchanged.
    const int shift = CountLeadingZeros32(v.bigits[n - 1]);

    const auto top_bits = [shift](uint32_t hi, uint32_t lo) -> uint32_t {
        return shift == 0 ? hi : (hi << shift) | (lo >> (32 - shift));
    };

    const uint32_t v_lo3 = (n >= 3) ? v.bigits[n - 3] : 0;
    const uint32_t v_hi  = top_bits(v.bigits[n - 1], v.bigits[n - 2]);
    const uint32_t v_lo  = top_bits(v.bigits[n - 2], v_lo3);

    LEXCONV_ASSERT(shift == 0 || (u.bigits[n] >> (32 - shift)) == 0);

    const uint32_t u_lo3 = (n >= 3) ? u.bigits[n - 3] : 0;
    const uint32_t u_hi  = top_bits(u.bigits[n],     u.bigits[n - 1]);
    const uint32_t u_mid = top_bits(u.bigits[n - 1], u.bigits[n - 2]);
    const uint32_t u_lo  = top_bits(u.bigits[n - 2], u_lo3);

    const uint64_t u_top = uint64_t{u_hi} << 32 | u_mid;
    uint64_t q = u_top / v_hi;
    uint64_t r = u_top % v_hi;
    LEXCONV_ASSERT(q <= 38);

    // The estimate is at most 2 too large. Correct it using the next bigit.
    while (q * v_lo > (r << 32 | u_lo))
    {
        LEXCONV_ASSERT(q > 0);
        q--;
        r += v_hi;
        if (r > UINT32_MAX)
            break;
    }
    LEXCONV_ASSERT(q <= 37);

    if (q == 0)
    {
        return 0;
    }

    // u -= q * v
    uint32_t borrow = 0;
    for (int i = 0; i < n; ++i)
    {
        const uint64_t product = q * v.bigits[i] + borrow;
        const uint32_t lo = static_cast<uint32_t>(product);
        const uint32_t ui = u.bigits[i];
        borrow = static_cast<uint32_t>(product >> 32) + (ui < lo ? 1 : 0);
        u.bigits[i] = ui - lo;
    }

    // The estimate was still one too large: add v back. The carry out of the
    // top bigit cancels the borrow.
    if (borrow > u.bigits[n])
    {
        q--;

        uint32_t carry = 0;
        for (int i = 0; i < n; ++i)
        {
            const uint64_t sum = uint64_t{u.bigits[i]} + v.bigits[i] + carry;
            u.bigits[i] = static_cast<uint32_t>(sum);
            carry = static_cast<uint32_t>(sum >> 32);
        }
    }

    // The remainder is below v, and has at most n bigits.
    int size = n;
    while (size > 0 && u.bigits[size - 1] == 0)
    {
        --size;
    }
    u.size = size;

    LEXCONV_ASSERT(q <= 36);
    return static_cast<uint32_t>(q);
}

// Returns -1, 0 or +1.
inline int Compare(DiyInt const& x, DiyInt const& y)
{
    if (x.size != y.size)
        return x.size < y.size ? -1 : +1;

    for (int i = x.size - 1; i >= 0; --i)
    {
        if (x.bigits[i] != y.bigits[i])
            return x.bigits[i] < y.bigits[i] ? -1 : +1;
    }

    return 0;
}

// Returns Compare(a + b, c) without computing a + b.
inline int CompareAdd(DiyInt const& a, DiyInt const& b, DiyInt const& c)
{
    const int na = a.size;
    const int nb = b.size;
    const int nc = c.size;

    const int n = Max(na, nb);
    if (n + 1 < nc)
        return -1;
    if (n > nc)
        return +1;

    // Subtract a + b from c, from the top bigit down. All bigits above i agree
    // once the pending borrow (0 or 1) is moved into c[i]. Any larger
    // difference can no longer be compensated by the lower bigits.
    uint64_t borrow = 0;
    for (int i = nc - 1; i >= 0; --i)
    {
        LEXCONV_ASSERT(borrow == 0 || borrow == 1);

        const uint64_t ci = borrow << 32 | c.bigits[i];
        const uint64_t si = uint64_t{i < na ? a.bigits[i] : 0u} + (i < nb ? b.bigits[i] : 0u);
        if (si > ci)
            return +1;

        const uint64_t diff = ci - si;
        if (diff > 1)
            return -1;

        borrow = diff;
    }

    return borrow == 0 ? 0 : -1;
}

} // namespace impl
} // namespace lexconv
