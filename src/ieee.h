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

#include <cassert>
#include <cstdint>
#include <cstring>
#include <limits>

#ifndef LEXCONV_ASSERT
#define LEXCONV_ASSERT(X) assert(X)
#endif

namespace lexconv {
namespace impl {

template <typename Dest, typename Source>
inline Dest ReinterpretBits(Source source)
{
    static_assert(sizeof(Dest) == sizeof(Source), "size mismatch");

    Dest dest;
    std::memcpy(&dest, &source, sizeof(Source));
    return dest;
}

//==================================================================================================
// IEEE
//
// Bit-level view of a binary32 or binary64 number.
//
//      value = (-1)^s * 1.F * 2^(E - bias)     for 0 < E < 2^w - 1
//      value = (-1)^s * 0.F * 2^(1 - bias)     for E = 0
//
// Significands are handled as integers, so the exponents below are those of
// the integer significand, i.e. they include the -(p-1) offset.
//==================================================================================================

template <typename Float> struct FloatFormat;

template <>
struct FloatFormat<float>
{
    using bits_type = uint32_t;
    static constexpr int Precision    = 24;
    static constexpr int ExponentBits = 8;
};

template <>
struct FloatFormat<double>
{
    using bits_type = uint64_t;
    static constexpr int Precision    = 53;
    static constexpr int ExponentBits = 11;
};

template <typename Float>
struct IEEE
{
    static_assert(std::numeric_limits<Float>::is_iec559, "IEEE-754 implementation required");
    static_assert(std::numeric_limits<Float>::digits == FloatFormat<Float>::Precision, "unexpected precision");

    using value_type = Float;
    using bits_type  = typename FloatFormat<Float>::bits_type;

    static constexpr int       SignificandSize         = FloatFormat<Float>::Precision;            // p, with the hidden bit
    static constexpr int       PhysicalSignificandSize = SignificandSize - 1;                     // p-1, stored bits
    static constexpr int       MaxBiasedExponent       = (1 << FloatFormat<Float>::ExponentBits) - 1;
    static constexpr int       ExponentBias            = MaxBiasedExponent / 2 + PhysicalSignificandSize;
    static constexpr int       MaxExponent             = MaxBiasedExponent - 1 - ExponentBias;
    static constexpr int       MinExponent             = 1 - ExponentBias;
    static constexpr bits_type HiddenBit               = bits_type{1} << PhysicalSignificandSize;
    static constexpr bits_type SignificandMask         = HiddenBit - 1;
    static constexpr bits_type ExponentMask            = bits_type{MaxBiasedExponent} << PhysicalSignificandSize;
    static constexpr bits_type SignMask                = bits_type{1} << (8 * sizeof(bits_type) - 1);

    bits_type bits;

    explicit IEEE(bits_type bits_) : bits(bits_) {}
    explicit IEEE(value_type value) : bits(ReinterpretBits<bits_type>(value)) {}

    bits_type PhysicalSignificand() const { return bits & SignificandMask; }
    bits_type PhysicalExponent() const { return (bits & ExponentMask) >> PhysicalSignificandSize; }

    bool IsFinite() const { return (bits & ExponentMask) != ExponentMask; }
    bool IsInf() const { return !IsFinite() && PhysicalSignificand() == 0; }
    bool IsNaN() const { return !IsFinite() && PhysicalSignificand() != 0; }
    bool IsZero() const { return (bits & ~SignMask) == 0; }
    bool SignBit() const { return (bits & SignMask) != 0; }

    bool SignificandIsEven() const { return (bits & 1) == 0; }

    value_type AbsValue() const {
        return ReinterpretBits<value_type>(bits & ~SignMask);
    }

    // Successor of a non-negative value. +inf stays +inf.
    value_type NextValue() const {
        LEXCONV_ASSERT(!SignBit());
        return ReinterpretBits<value_type>(IsInf() ? bits : bits + 1);
    }

    // Predecessor of a positive value.
    value_type PrevValue() const {
        LEXCONV_ASSERT(!SignBit());
        LEXCONV_ASSERT(!IsZero());
        return ReinterpretBits<value_type>(bits - 1);
    }
};

} // namespace impl
} // namespace lexconv
