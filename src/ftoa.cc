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

#include "lexconv.h"
#include "buffer.h"
#include "digit_gen.h"
#include "format_digits.h"

#include <cstring>

using namespace lexconv;
using namespace lexconv::impl;

//==================================================================================================
// FormatFloat
//==================================================================================================

static char* CopyString(char* buffer, const FixedString& str)
{
    std::memcpy(buffer, str.Data(), static_cast<size_t>(str.Size()));
    return buffer + str.Size();
}

// PRE: buffer holds at least MaxLength<Float>::value bytes.
template <typename Float>
static char* ToChars(char* buffer, Float value, const WriteFloatOptions& options)
{
    using Fp = IEEE<Float>;

    const Fp v(value);

    if (v.IsZero() && options.TrimFloats())
    {
        *buffer++ = '0';
        return buffer;
    }

    if (v.SignBit())
    {
        *buffer++ = '-';
        return ToChars(buffer, v.AbsValue(), options);
    }

    if (v.IsNaN())
    {
        return CopyString(buffer, options.NanString());
    }

    if (v.IsZero())
    {
        std::memcpy(buffer, "0.0", 3);
        return buffer + 3;
    }

    if (v.IsInf())
    {
        return CopyString(buffer, options.InfString());
    }

    int num_digits = 0;
    int exponent = 0;
    DigitGenerator::ToDigits(buffer, num_digits, exponent, value, options.Radix());

    const bool force_trailing_dot_zero = !options.TrimFloats();
    return Format(buffer, num_digits, exponent, force_trailing_dot_zero, options.ExponentChar(), options.Radix());
}

template <typename Float>
size_t lexconv::FormatFloat(char* buffer, size_t buffer_size, Float value, const WriteFloatOptions& options)
{
    RequireCapacity("FormatFloat", buffer_size, MaxLength<Float>::value);

    char* const end = ToChars(buffer, value, options);
    return static_cast<size_t>(end - buffer);
}

template <typename Float>
char* lexconv::FormatFloatRange(char* first, char* last, Float value, const WriteFloatOptions& options)
{
    RequireCapacity("FormatFloatRange", first, last, MaxLength<Float>::value);

    return ToChars(first, value, options);
}

template size_t lexconv::FormatFloat<float>(char*, size_t, float, const WriteFloatOptions&);
template size_t lexconv::FormatFloat<double>(char*, size_t, double, const WriteFloatOptions&);
template char* lexconv::FormatFloatRange<float>(char*, char*, float, const WriteFloatOptions&);
template char* lexconv::FormatFloatRange<double>(char*, char*, double, const WriteFloatOptions&);
