// Copyright 2026 The lexconv Authors
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

#include "lexconv.h"
#include "dragon4.h"
#include "grisu3.h"

namespace lexconv {
namespace impl {

//==================================================================================================
// Digit generators
//
// Both generators produce the shortest digit sequence which uniquely identifies
// the input, i.e. v = digits * radix^exponent. If there are several shortest
// sequences, the one closest to v is chosen.
//
// PRE: The digits buffer must hold at least kMaxDigits characters.
// PRE: value must be finite and strictly positive.
//==================================================================================================

// Dragon4 for every radix.
struct Dragon4DigitGenerator
{
    template <typename Float>
    static void ToDigits(char* digits, int& num_digits, int& exponent, Float value, int radix)
    {
        Dragon4ToDigits(digits, num_digits, exponent, value, radix);

        LEXCONV_ASSERT(num_digits > 0);
        LEXCONV_ASSERT(num_digits <= kMaxDigits);
    }
};

// Grisu3 for radix 10, with Dragon4 as a fallback if Grisu3 fails and for all
// other radices.
struct Grisu3DigitGenerator
{
    template <typename Float>
    static void ToDigits(char* digits, int& num_digits, int& exponent, Float value, int radix)
    {
        if (radix != 10 || !Grisu3ToDigits(digits, num_digits, exponent, value))
        {
            Dragon4ToDigits(digits, num_digits, exponent, value, radix);
        }

        LEXCONV_ASSERT(num_digits > 0);
        LEXCONV_ASSERT(num_digits <= kMaxDigits);
    }
};

#if LEXCONV_EXACT_DIGIT_GENERATION
using DigitGenerator = Dragon4DigitGenerator;
#else
using DigitGenerator = Grisu3DigitGenerator;
#endif

} // namespace impl
} // namespace lexconv
