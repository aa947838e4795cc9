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

#include <cstddef>
#include <cstdint>
#include <optional>

// Support for radices other than 10.
#ifndef LEXCONV_RADIX
#define LEXCONV_RADIX 1
#endif

// Support for rounding modes other than nearest_tie_even when parsing floats.
#ifndef LEXCONV_ROUNDING
#define LEXCONV_ROUNDING 1
#endif

// Use Dragon4 for all radices, instead of Grisu3 (with a Dragon4 fallback)
// for radix 10.
#ifndef LEXCONV_EXACT_DIGIT_GENERATION
#define LEXCONV_EXACT_DIGIT_GENERATION 0
#endif

namespace lexconv {

//==================================================================================================
// Buffer sizes
//==================================================================================================

// Upper bounds for the length of any output of the Format* functions, for
// every radix, including the sign, the special strings and the exponent.
constexpr int kMaxFloat32Length = 64;
constexpr int kMaxFloat64Length = 128;
constexpr int kMaxInt32Length   = 33;
constexpr int kMaxInt64Length   = 65;

// Maximum length of the NaN and infinity spellings.
constexpr int kMaxSpecialStringLength = 32;

template <typename T> struct MaxLength;
template <> struct MaxLength<float>    { static constexpr int value = kMaxFloat32Length; };
template <> struct MaxLength<double>   { static constexpr int value = kMaxFloat64Length; };
template <> struct MaxLength<int32_t>  { static constexpr int value = kMaxInt32Length; };
template <> struct MaxLength<uint32_t> { static constexpr int value = kMaxInt32Length; };
template <> struct MaxLength<int64_t>  { static constexpr int value = kMaxInt64Length; };
template <> struct MaxLength<uint64_t> { static constexpr int value = kMaxInt64Length; };

//==================================================================================================
// Status codes
//==================================================================================================

enum class RoundingKind {
    nearest_tie_even,
    nearest_tie_away_zero,
    toward_positive_infinity,
    toward_negative_infinity,
    toward_zero,
};

enum class ParseStatus {
    success,
    empty,              // No digits.
    invalid_digit,      // Unexpected character after a valid prefix.
    empty_exponent,     // Exponent marker without digits.
    invalid_separator,  // Digit separator not placed between two digits.
    overflow,           // Integer too large.
    underflow,          // Integer too small.
};

enum class OptionsStatus {
    ok,
    invalid_radix,
    invalid_exponent_char,
    invalid_digit_separator,
    invalid_rounding,
    invalid_nan_string,
    invalid_inf_string,
    invalid_infinity_string,
};

// On failure, `next` points to the offending character and `value` holds the
// value of the longest valid prefix.
template <typename T>
struct ParseResult
{
    T value = 0;
    const char* next = nullptr;
    ParseStatus status = ParseStatus::success;

    explicit operator bool() const { return status == ParseStatus::success; }
};

//==================================================================================================
// Options
//==================================================================================================

namespace impl {

// Null-terminated string of at most kMaxSpecialStringLength characters.
class FixedString
{
    char data_[kMaxSpecialStringLength + 1] = {};
    int size_ = 0;

public:
    FixedString() = default;
    explicit FixedString(const char* str);

    const char* Data() const { return data_; }
    int Size() const { return size_; }
};

} // namespace impl

class ParseIntegerOptions
{
    int  radix_ = 10;
    char digit_separator_ = '\0';

    ParseIntegerOptions() = default;

public:
    class Builder
    {
        int  radix_ = 10;
        char digit_separator_ = '\0';

    public:
        Builder& Radix(int radix) { radix_ = radix; return *this; }
        Builder& DigitSeparator(char separator) { digit_separator_ = separator; return *this; }

        OptionsStatus Validate() const;
        std::optional<ParseIntegerOptions> Build() const;
    };

    static ParseIntegerOptions Decimal();
#if LEXCONV_RADIX
    static ParseIntegerOptions Binary();
    static ParseIntegerOptions Hexadecimal();
#endif

    int Radix() const { return radix_; }
    // Returns '\0' if digit separators are disabled.
    char DigitSeparator() const { return digit_separator_; }
};

class ParseFloatOptions
{
    int               radix_ = 10;
    char              exponent_char_ = 'e';
    char              digit_separator_ = '\0';
    bool              lossy_ = false;
    RoundingKind      rounding_ = RoundingKind::nearest_tie_even;
    impl::FixedString nan_string_;
    impl::FixedString inf_string_;
    impl::FixedString infinity_string_;

    ParseFloatOptions() = default;

public:
    class Builder
    {
        int          radix_ = 10;
        char         exponent_char_ = 'e';
        char         digit_separator_ = '\0';
        bool         lossy_ = false;
        RoundingKind rounding_ = RoundingKind::nearest_tie_even;
        const char*  nan_string_ = "NaN";
        const char*  inf_string_ = "inf";
        const char*  infinity_string_ = "infinity";

    public:
        Builder& Radix(int radix) { radix_ = radix; return *this; }
        Builder& ExponentChar(char ch) { exponent_char_ = ch; return *this; }
        Builder& DigitSeparator(char separator) { digit_separator_ = separator; return *this; }
        Builder& Lossy(bool lossy) { lossy_ = lossy; return *this; }
        Builder& Rounding(RoundingKind rounding) { rounding_ = rounding; return *this; }
        // The strings must stay alive until Build() returns.
        Builder& NanString(const char* str) { nan_string_ = str; return *this; }
        Builder& InfString(const char* str) { inf_string_ = str; return *this; }
        Builder& InfinityString(const char* str) { infinity_string_ = str; return *this; }

        OptionsStatus Validate() const;
        std::optional<ParseFloatOptions> Build() const;
    };

    static ParseFloatOptions Decimal();
#if LEXCONV_RADIX
    static ParseFloatOptions Binary();
    static ParseFloatOptions Hexadecimal();
#endif

    int Radix() const { return radix_; }
    char ExponentChar() const { return exponent_char_; }
    char DigitSeparator() const { return digit_separator_; }
    bool Lossy() const { return lossy_; }
    RoundingKind Rounding() const { return rounding_; }
    const impl::FixedString& NanString() const { return nan_string_; }
    const impl::FixedString& InfString() const { return inf_string_; }
    const impl::FixedString& InfinityString() const { return infinity_string_; }
};

class WriteIntegerOptions
{
    int radix_ = 10;

    WriteIntegerOptions() = default;

public:
    class Builder
    {
        int radix_ = 10;

    public:
        Builder& Radix(int radix) { radix_ = radix; return *this; }

        OptionsStatus Validate() const;
        std::optional<WriteIntegerOptions> Build() const;
    };

    static WriteIntegerOptions Decimal();
#if LEXCONV_RADIX
    static WriteIntegerOptions Binary();
    static WriteIntegerOptions Hexadecimal();
#endif

    int Radix() const { return radix_; }
};

class WriteFloatOptions
{
    int               radix_ = 10;
    char              exponent_char_ = 'e';
    bool              trim_floats_ = false;
    impl::FixedString nan_string_;
    impl::FixedString inf_string_;

    WriteFloatOptions() = default;

public:
    class Builder
    {
        int         radix_ = 10;
        char        exponent_char_ = 'e';
        bool        trim_floats_ = false;
        const char* nan_string_ = "NaN";
        const char* inf_string_ = "inf";

    public:
        Builder& Radix(int radix) { radix_ = radix; return *this; }
        Builder& ExponentChar(char ch) { exponent_char_ = ch; return *this; }
        Builder& TrimFloats(bool trim) { trim_floats_ = trim; return *this; }
        // The strings must stay alive until Build() returns.
        Builder& NanString(const char* str) { nan_string_ = str; return *this; }
        Builder& InfString(const char* str) { inf_string_ = str; return *this; }

        OptionsStatus Validate() const;
        std::optional<WriteFloatOptions> Build() const;
    };

    static WriteFloatOptions Decimal();
#if LEXCONV_RADIX
    static WriteFloatOptions Binary();
    static WriteFloatOptions Hexadecimal();
#endif

    int Radix() const { return radix_; }
    char ExponentChar() const { return exponent_char_; }
    bool TrimFloats() const { return trim_floats_; }
    const impl::FixedString& NanString() const { return nan_string_; }
    const impl::FixedString& InfString() const { return inf_string_; }
};

//==================================================================================================
// Conversions
//
// Float is float or double. Int is int32_t, uint32_t, int64_t or uint64_t.
//
// The Format* functions abort the process if the destination buffer holds fewer
// than MaxLength<T>::value bytes. The output is not null-terminated.
//==================================================================================================

// Writes `value` into [buffer, buffer + buffer_size).
// Returns the number of bytes written.
template <typename Float>
size_t FormatFloat(char* buffer, size_t buffer_size, Float value, const WriteFloatOptions& options);

// Writes `value` into [first, last).
// Returns a pointer to the element following the output.
template <typename Float>
char* FormatFloatRange(char* first, char* last, Float value, const WriteFloatOptions& options);

template <typename Float>
ParseResult<Float> ParseFloat(const char* first, const char* last, const ParseFloatOptions& options);

// Returns the value of the longest valid prefix of [first, last), or +0 if
// there is none.
template <typename Float>
Float ParseFloatUnchecked(const char* first, const char* last, const ParseFloatOptions& options);

template <typename Int>
size_t FormatInteger(char* buffer, size_t buffer_size, Int value, const WriteIntegerOptions& options);

template <typename Int>
char* FormatIntegerRange(char* first, char* last, Int value, const WriteIntegerOptions& options);

template <typename Int>
ParseResult<Int> ParseInteger(const char* first, const char* last, const ParseIntegerOptions& options);

// Out of range values saturate.
template <typename Int>
Int ParseIntegerUnchecked(const char* first, const char* last, const ParseIntegerOptions& options);

} // namespace lexconv
