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
#include "format_digits.h"

using namespace lexconv;
using namespace lexconv::impl;

//==================================================================================================
// FixedString
//==================================================================================================

lexconv::impl::FixedString::FixedString(const char* str)
{
    LEXCONV_ASSERT(str != nullptr);

    while (size_ < kMaxSpecialStringLength && str[size_] != '\0')
    {
        data_[size_] = str[size_];
        ++size_;
    }
    data_[size_] = '\0';
}

//==================================================================================================
// Validation
//==================================================================================================

static bool ValidateRadix(int radix)
{
#if LEXCONV_RADIX
    return 2 <= radix && radix <= 36;
#else
    return radix == 10;
#endif
}

static char ToLowerASCII(char ch)
{
    return ('A' <= ch && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
}

static bool IsSignOrPoint(char ch)
{
    return ch == '.' || ch == '+' || ch == '-';
}

static bool ValidateExponentChar(char ch, int radix)
{
    if (ch == '\0' || IsSignOrPoint(ch))
        return false;

    return !IsRadixDigit(ch, radix);
}

// '\0' disables digit separators.
static bool ValidateIntegerSeparator(char separator, int radix)
{
    if (separator == '\0')
        return true;

    return !IsRadixDigit(separator, radix) && separator != '+' && separator != '-';
}

static bool ValidateFloatSeparator(char separator, int radix, char exponent_char)
{
    if (separator == '\0')
        return true;

    if (IsRadixDigit(separator, radix) || IsSignOrPoint(separator))
        return false;

    return ToLowerASCII(separator) != ToLowerASCII(exponent_char);
}

static bool ValidateRounding(RoundingKind rounding)
{
    switch (rounding)
    {
    case RoundingKind::nearest_tie_even:
        return true;
    case RoundingKind::nearest_tie_away_zero:
    case RoundingKind::toward_positive_infinity:
    case RoundingKind::toward_negative_infinity:
    case RoundingKind::toward_zero:
        return LEXCONV_ROUNDING != 0;
    }

    return false;
}

// Returns the length of `str`, or -1 if `str` is null, empty or too long.
static int SpecialStringLength(const char* str)
{
    if (str == nullptr)
        return -1;

    int len = 0;
    for ( ; str[len] != '\0'; ++len)
    {
        if (len == kMaxSpecialStringLength)
            return -1;
    }

    return len > 0 ? len : -1;
}

static bool ValidateNanString(const char* str)
{
    if (SpecialStringLength(str) < 0)
        return false;

    return str[0] == 'N' || str[0] == 'n';
}

static bool ValidateInfString(const char* str)
{
    if (SpecialStringLength(str) < 0)
        return false;

    return str[0] == 'I' || str[0] == 'i';
}

// Both strings start with 'I' or 'i', in either case.
// PRE: inf is a valid inf string.
static bool ValidateInfinityString(const char* str, const char* inf)
{
    if (!ValidateInfString(str))
        return false;

    return SpecialStringLength(str) >= SpecialStringLength(inf);
}

//==================================================================================================
// ParseIntegerOptions
//==================================================================================================

OptionsStatus lexconv::ParseIntegerOptions::Builder::Validate() const
{
    if (!ValidateRadix(radix_))
        return OptionsStatus::invalid_radix;
    if (!ValidateIntegerSeparator(digit_separator_, radix_))
        return OptionsStatus::invalid_digit_separator;

    return OptionsStatus::ok;
}

std::optional<ParseIntegerOptions> lexconv::ParseIntegerOptions::Builder::Build() const
{
    if (Validate() != OptionsStatus::ok)
        return std::nullopt;

    ParseIntegerOptions options;
    options.radix_ = radix_;
    options.digit_separator_ = digit_separator_;
    return options;
}

ParseIntegerOptions lexconv::ParseIntegerOptions::Decimal()
{
    return *Builder().Build();
}

#if LEXCONV_RADIX
ParseIntegerOptions lexconv::ParseIntegerOptions::Binary()
{
    return *Builder().Radix(2).Build();
}

ParseIntegerOptions lexconv::ParseIntegerOptions::Hexadecimal()
{
    return *Builder().Radix(16).Build();
}
#endif

//==================================================================================================
// ParseFloatOptions
//==================================================================================================

OptionsStatus lexconv::ParseFloatOptions::Builder::Validate() const
{
    if (!ValidateRadix(radix_))
        return OptionsStatus::invalid_radix;
    if (!ValidateExponentChar(exponent_char_, radix_))
        return OptionsStatus::invalid_exponent_char;
    if (!ValidateFloatSeparator(digit_separator_, radix_, exponent_char_))
        return OptionsStatus::invalid_digit_separator;
    if (!ValidateRounding(rounding_))
        return OptionsStatus::invalid_rounding;
    if (!ValidateNanString(nan_string_))
        return OptionsStatus::invalid_nan_string;
    if (!ValidateInfString(inf_string_))
        return OptionsStatus::invalid_inf_string;
    if (!ValidateInfinityString(infinity_string_, inf_string_))
        return OptionsStatus::invalid_infinity_string;

    return OptionsStatus::ok;
}

std::optional<ParseFloatOptions> lexconv::ParseFloatOptions::Builder::Build() const
{
    if (Validate() != OptionsStatus::ok)
        return std::nullopt;

    ParseFloatOptions options;
    options.radix_ = radix_;
    options.exponent_char_ = exponent_char_;
    options.digit_separator_ = digit_separator_;
    options.lossy_ = lossy_;
    options.rounding_ = rounding_;
    options.nan_string_ = FixedString(nan_string_);
    options.inf_string_ = FixedString(inf_string_);
    options.infinity_string_ = FixedString(infinity_string_);
    return options;
}

ParseFloatOptions lexconv::ParseFloatOptions::Decimal()
{
    return *Builder().Build();
}

#if LEXCONV_RADIX
ParseFloatOptions lexconv::ParseFloatOptions::Binary()
{
    return *Builder().Radix(2).Build();
}

ParseFloatOptions lexconv::ParseFloatOptions::Hexadecimal()
{
    return *Builder().Radix(16).ExponentChar('p').Build();
}
#endif

//==================================================================================================
// WriteIntegerOptions
//==================================================================================================

OptionsStatus lexconv::WriteIntegerOptions::Builder::Validate() const
{
    if (!ValidateRadix(radix_))
        return OptionsStatus::invalid_radix;

    return OptionsStatus::ok;
}

std::optional<WriteIntegerOptions> lexconv::WriteIntegerOptions::Builder::Build() const
{
    if (Validate() != OptionsStatus::ok)
        return std::nullopt;

    WriteIntegerOptions options;
    options.radix_ = radix_;
    return options;
}

WriteIntegerOptions lexconv::WriteIntegerOptions::Decimal()
{
    return *Builder().Build();
}

#if LEXCONV_RADIX
WriteIntegerOptions lexconv::WriteIntegerOptions::Binary()
{
    return *Builder().Radix(2).Build();
}

WriteIntegerOptions lexconv::WriteIntegerOptions::Hexadecimal()
{
    return *Builder().Radix(16).Build();
}
#endif

//==================================================================================================
// WriteFloatOptions
//==================================================================================================

OptionsStatus lexconv::WriteFloatOptions::Builder::Validate() const
{
    if (!ValidateRadix(radix_))
        return OptionsStatus::invalid_radix;
    if (!ValidateExponentChar(exponent_char_, radix_))
        return OptionsStatus::invalid_exponent_char;
    if (!ValidateNanString(nan_string_))
        return OptionsStatus::invalid_nan_string;
    if (!ValidateInfString(inf_string_))
        return OptionsStatus::invalid_inf_string;

    return OptionsStatus::ok;
}

std::optional<WriteFloatOptions> lexconv::WriteFloatOptions::Builder::Build() const
{
    if (Validate() != OptionsStatus::ok)
        return std::nullopt;

    WriteFloatOptions options;
    options.radix_ = radix_;
    options.exponent_char_ = exponent_char_;
    options.trim_floats_ = trim_floats_;
    options.nan_string_ = FixedString(nan_string_);
    options.inf_string_ = FixedString(inf_string_);
    return options;
}

WriteFloatOptions lexconv::WriteFloatOptions::Decimal()
{
    return *Builder().Build();
}

#if LEXCONV_RADIX
WriteFloatOptions lexconv::WriteFloatOptions::Binary()
{
    return *Builder().Radix(2).Build();
}

WriteFloatOptions lexconv::WriteFloatOptions::Hexadecimal()
{
    return *Builder().Radix(16).ExponentChar('p').Build();
}
#endif
