#include <catch2/catch.hpp>

#include "lexconv.h"

#include <cfloat>
#include <cmath>
#include <cstring>
#include <limits>
#include <string>

using namespace lexconv;

//==================================================================================================
//
//==================================================================================================

template <typename Float = double>
static ParseResult<Float> Parse(const std::string& str, const ParseFloatOptions& options = ParseFloatOptions::Decimal())
{
    return ParseFloat<Float>(str.data(), str.data() + str.size(), options);
}

template <typename Float = double>
static Float ParseUnchecked(const std::string& str, const ParseFloatOptions& options = ParseFloatOptions::Decimal())
{
    return ParseFloatUnchecked<Float>(str.data(), str.data() + str.size(), options);
}

template <typename Float>
static bool SameBits(Float x, Float y)
{
    return std::memcmp(&x, &y, sizeof(Float)) == 0;
}

// Checks the status and the offset of the first byte not consumed.
template <typename Float = double>
static void CheckStatus(const std::string& str, ParseStatus status, size_t offset, Float value, const ParseFloatOptions& options = ParseFloatOptions::Decimal())
{
    CAPTURE(str);

    const auto res = Parse<Float>(str, options);
    CHECK(res.status == status);
    CHECK(static_cast<size_t>(res.next - str.data()) == offset);
    CHECK(SameBits(res.value, value));
    CHECK(SameBits(ParseUnchecked<Float>(str, options), value));
}

template <typename Float = double>
static void CheckSuccess(const std::string& str, Float value, const ParseFloatOptions& options = ParseFloatOptions::Decimal())
{
    CheckStatus<Float>(str, ParseStatus::success, str.size(), value, options);
}

static ParseFloatOptions WithRounding(RoundingKind rounding, int radix = 10, char exponent_char = 'e')
{
    return *ParseFloatOptions::Builder().Radix(radix).ExponentChar(exponent_char).Rounding(rounding).Build();
}

static ParseFloatOptions WithSeparator(char separator)
{
    return *ParseFloatOptions::Builder().DigitSeparator(separator).Build();
}

//==================================================================================================
//
//==================================================================================================

TEST_CASE("Parse - grammar")
{
    CheckSuccess("0", 0.0);
    CheckSuccess("-0", -0.0);
    CheckSuccess("+0", 0.0);
    CheckSuccess("1", 1.0);
    CheckSuccess("-1", -1.0);
    CheckSuccess("+1.5", 1.5);
    CheckSuccess(".5", 0.5);
    CheckSuccess("-.5", -0.5);
    CheckSuccess("0.000", 0.0);
    CheckSuccess("000123.4500", 123.45);
    CheckSuccess("1e5", 1e5);
    CheckSuccess("1E5", 1e5);
    CheckSuccess("1e+5", 1e5);
    CheckSuccess("1e-5", 1e-5);
    CheckSuccess("1.5e-005", 1.5e-5);
    CheckSuccess("0e999999999999999999", 0.0);
    CheckSuccess("1e-999999999999999999", 0.0);
    CheckSuccess("1e999999999999999999", std::numeric_limits<double>::infinity());
    CheckSuccess("-1e999999999999999999", -std::numeric_limits<double>::infinity());
    CheckSuccess<float>("1.2345e+38", 1.2345e+38f);
}

TEST_CASE("Parse - errors")
{
    // No digits. The value is +0, whatever the sign.
    CheckStatus("", ParseStatus::empty, 0, 0.0);
    CheckStatus("-", ParseStatus::empty, 1, 0.0);
    CheckStatus("+", ParseStatus::empty, 1, 0.0);
    CheckStatus("x", ParseStatus::empty, 0, 0.0);
    CheckStatus("-x", ParseStatus::empty, 1, 0.0);
    CheckStatus(".", ParseStatus::empty, 0, 0.0);
    CheckStatus("-.e5", ParseStatus::empty, 1, 0.0);
    CheckStatus("e5", ParseStatus::empty, 0, 0.0);

    // Trailing junk.
    CheckStatus<float>("1.0.", ParseStatus::invalid_digit, 3, 1.0f);
    CheckStatus("1.", ParseStatus::invalid_digit, 1, 1.0);
    CheckStatus("-1.", ParseStatus::invalid_digit, 2, -1.0);
    CheckStatus("1.5x", ParseStatus::invalid_digit, 3, 1.5);
    CheckStatus("12 ", ParseStatus::invalid_digit, 2, 12.0);
    CheckStatus("1e5x", ParseStatus::invalid_digit, 3, 1e5);
    CheckStatus("1a", ParseStatus::invalid_digit, 1, 1.0);

    // Incomplete exponent.
    CheckStatus("1e", ParseStatus::empty_exponent, 1, 1.0);
    CheckStatus("1e+", ParseStatus::empty_exponent, 1, 1.0);
    CheckStatus("1e-", ParseStatus::empty_exponent, 1, 1.0);
    CheckStatus("2.5ex", ParseStatus::empty_exponent, 3, 2.5);
}

TEST_CASE("Parse - digit separators")
{
    const auto options = WithSeparator('_');

    CheckSuccess("1_000", 1000.0, options);
    CheckSuccess("1_000.000_1", 1000.0001, options);
    CheckSuccess("1_0e1_0", 1e11, options);
    CheckSuccess("-1_2.5", -12.5, options);

    CheckStatus("_1", ParseStatus::invalid_separator, 0, 0.0, options);
    CheckStatus("-_1", ParseStatus::invalid_separator, 1, 0.0, options);
    CheckStatus("1_", ParseStatus::invalid_separator, 1, 1.0, options);
    CheckStatus("1__0", ParseStatus::invalid_separator, 1, 1.0, options);
    CheckStatus("1_.5", ParseStatus::invalid_separator, 1, 1.0, options);
    CheckStatus("1._5", ParseStatus::invalid_separator, 2, 1.0, options);
    CheckStatus("1.5_", ParseStatus::invalid_separator, 3, 1.5, options);
    CheckStatus("1.5_e2", ParseStatus::invalid_separator, 3, 1.5, options);
    CheckStatus("1e_2", ParseStatus::invalid_separator, 2, 1.0, options);
    CheckStatus("1e2_", ParseStatus::invalid_separator, 3, 100.0, options);

    // Separators are disabled by default.
    CheckStatus("1_000", ParseStatus::invalid_digit, 1, 1.0);
}

TEST_CASE("Parse - special strings")
{
    constexpr double kInf = std::numeric_limits<double>::infinity();

    CheckSuccess("inf", kInf);
    CheckSuccess("+inf", kInf);
    CheckSuccess("-inf", -kInf);
    CheckSuccess("infinity", kInf);
    CheckSuccess("-infinity", -kInf);
    CheckStatus("infinit", ParseStatus::invalid_digit, 3, kInf);
    CheckStatus("Inf", ParseStatus::empty, 0, 0.0);
    CheckStatus("nan", ParseStatus::empty, 0, 0.0);

    {
        const auto res = Parse("NaN");
        CHECK(res.status == ParseStatus::success);
        CHECK(std::isnan(res.value));
        CHECK(!std::signbit(res.value));
    }
    {
        const auto res = Parse("-NaN");
        CHECK(res.status == ParseStatus::success);
        CHECK(std::isnan(res.value));
        CHECK(std::signbit(res.value));
    }
    {
        const std::string str = "NaN(123)";
        const auto res = Parse<float>(str);
        CHECK(res.status == ParseStatus::invalid_digit);
        CHECK(res.next == str.data() + 3);
        CHECK(std::isnan(res.value));
    }

    const auto options = *ParseFloatOptions::Builder().NanString("nan").InfString("Inf").InfinityString("Infinity").Build();
    CheckSuccess("Inf", kInf, options);
    CheckSuccess("-Infinity", -kInf, options);
    CHECK(std::isnan(Parse("nan", options).value));
    CheckStatus("inf", ParseStatus::empty, 0, 0.0, options);

    // The infinity spelling may differ in case from the inf spelling.
    const auto mixed = *ParseFloatOptions::Builder().InfString("Inf").Build();
    CheckSuccess("Inf", kInf, mixed);
    CheckSuccess("infinity", kInf, mixed);
    CheckSuccess("-infinity", -kInf, mixed);
}

#if LEXCONV_RADIX
TEST_CASE("Parse - radix")
{
    const auto binary = ParseFloatOptions::Binary();
    const auto hexadecimal = ParseFloatOptions::Hexadecimal();

    CheckSuccess("1.1", 1.5, binary);
    CheckSuccess("-1000.01", -8.25, binary);
    CheckSuccess("1e11110", 1073741824.0, binary);
    CheckSuccess("1e-11110", 1.0 / 1073741824.0, binary);
    CheckStatus("102", ParseStatus::invalid_digit, 2, 2.0, binary);

    CheckSuccess("FF.8", 255.5, hexadecimal);
    CheckSuccess("ff.8", 255.5, hexadecimal);
    CheckSuccess("1p-A", std::ldexp(1.0, -40), hexadecimal);
    CheckSuccess("1P10", std::ldexp(1.0, 64), hexadecimal);
    CheckSuccess("0.1999999999999A", 0.1, hexadecimal);
    CheckSuccess<float>("0.199999A", 0.1f, hexadecimal);
    CheckStatus("1g", ParseStatus::invalid_digit, 1, 1.0, hexadecimal);

    const auto base36 = *ParseFloatOptions::Builder().Radix(36).ExponentChar('^').Build();
    CheckSuccess("Z", 35.0, base36);
    CheckSuccess("10.I", 36.5, base36);
    CheckSuccess("1^2", 1296.0, base36);
}
#endif

#if LEXCONV_RADIX
TEST_CASE("Parse - radix overflow and underflow")
{
    const auto binary = ParseFloatOptions::Binary();

    // 2^1024 overflows, 2^1023 does not.
    CheckSuccess("1e10000000000", std::numeric_limits<double>::infinity(), binary);
    CheckSuccess("1e1111111111", std::ldexp(1.0, 1023), binary);

    // 2^-1074 is the smallest subnormal, 2^-1075 is a tie and rounds to even (0).
    CheckSuccess("1e-10000110010", std::numeric_limits<double>::denorm_min(), binary);
    CheckSuccess("1e-10000110011", 0.0, binary);
    CheckSuccess("1.1e-10000110011", std::numeric_limits<double>::denorm_min(), binary);
}
#endif

#if LEXCONV_ROUNDING
TEST_CASE("Parse - rounding modes")
{
    const auto down = WithRounding(RoundingKind::toward_zero);
    const auto toward_pos = WithRounding(RoundingKind::toward_positive_infinity);
    const auto toward_neg = WithRounding(RoundingKind::toward_negative_infinity);
    const auto away = WithRounding(RoundingKind::nearest_tie_away_zero);

    // 0.1 rounds up to the nearest double.
    const double below = std::nextafter(0.1, 0.0);

    CheckSuccess("0.1", below, down);
    CheckSuccess("0.1", 0.1, toward_pos);
    CheckSuccess("0.1", below, toward_neg);
    CheckSuccess("0.1", 0.1, away);
    CheckSuccess("-0.1", -below, down);
    CheckSuccess("-0.1", -below, toward_pos);
    CheckSuccess("-0.1", -0.1, toward_neg);

    // Exactly representable.
    CheckSuccess("0.5", 0.5, down);
    CheckSuccess("0.5", 0.5, toward_pos);
    CheckSuccess("-0.5", -0.5, toward_neg);

    // 2^53 + 1 is halfway between 2^53 and 2^53 + 2.
    CheckSuccess("9007199254740993", 9007199254740992.0);
    CheckSuccess("9007199254740993", 9007199254740994.0, away);
    CheckSuccess("-9007199254740993", -9007199254740994.0, away);
    CheckSuccess("9007199254740993", 9007199254740992.0, down);
    CheckSuccess("9007199254740993", 9007199254740994.0, toward_pos);
    CheckSuccess("9007199254740993.0000000000000000000000000001", 9007199254740994.0);

    // Overflow and underflow.
    constexpr double kMax = std::numeric_limits<double>::max();
    constexpr double kMin = std::numeric_limits<double>::denorm_min();
    CheckSuccess("1e400", kMax, down);
    CheckSuccess("1e400", std::numeric_limits<double>::infinity(), toward_pos);
    CheckSuccess("-1e400", -kMax, toward_pos);
    CheckSuccess("1e-400", 0.0, down);
    CheckSuccess("1e-400", kMin, toward_pos);
    CheckSuccess("-1e-400", -kMin, toward_neg);
    CheckSuccess("-1e-400", -0.0, toward_pos);
    CheckSuccess("1.7976931348623158e308", kMax, down);
    CheckSuccess("1.7976931348623158e308", std::numeric_limits<double>::infinity(), toward_pos);

    // Floats.
    const auto float_down = WithRounding(RoundingKind::toward_zero);
    CheckSuccess<float>("0.1", std::nextafter(0.1f, 0.0f), float_down);
    CheckSuccess<float>("3.4028236e38", FLT_MAX, float_down);
    CheckSuccess<float>("3.4028236e38", std::numeric_limits<float>::infinity());

    // Binary input with directed rounding.
    const auto binary_down = WithRounding(RoundingKind::toward_zero, 2);
    CheckSuccess("1.00000000000000000000000000000000000000000000000000001", 1.0, binary_down);
    CheckSuccess("1.00000000000000000000000000000000000000000000000000001", 1.0);
}
#endif

TEST_CASE("Parse - lossy")
{
    const auto lossy = *ParseFloatOptions::Builder().Lossy(true).Build();

    CheckSuccess("1.5", 1.5, lossy);
    CheckSuccess("-2", -2.0, lossy);
    CheckSuccess("0", 0.0, lossy);
    CheckSuccess("1e400", std::numeric_limits<double>::infinity(), lossy);
    CheckSuccess("1e-400", 0.0, lossy);

    const double values[] = { 0.1, 3.14159, 1.5e+308, 2.2250738585072014e-308, 6.02214076e23 };
    const char* const strings[] = { "0.1", "3.14159", "1.5e+308", "2.2250738585072014e-308", "6.02214076e23" };

    for (int i = 0; i < 5; ++i)
    {
        CAPTURE(strings[i]);

        const auto res = Parse(strings[i], lossy);
        CHECK(res.status == ParseStatus::success);
        CHECK(std::fabs(res.value - values[i]) <= 4 * std::fabs(values[i]) * DBL_EPSILON);
    }
}

TEST_CASE("Parse - float")
{
    CheckSuccess<float>("3.4028235e38", FLT_MAX);
    CheckSuccess<float>("3.4028235677973366e38", FLT_MAX);
    CheckSuccess<float>("3.4028235677973367e38", std::numeric_limits<float>::infinity());
    CheckSuccess<float>("1e-45", std::numeric_limits<float>::denorm_min());
    CheckSuccess<float>("7e-46", 0.0f);
    CheckSuccess<float>("7.1e-46", std::numeric_limits<float>::denorm_min());
    CheckSuccess<float>("1.17549435e-38", FLT_MIN);
    CheckSuccess<float>("16777217", 16777216.0f);
    CheckSuccess<float>("16777219", 16777220.0f);
    CheckSuccess<float>("0.1", 0.1f);
    CheckSuccess<float>("1e10", 1e10f);
    CheckSuccess<float>("1234567e10", 1234567e10f);
}
