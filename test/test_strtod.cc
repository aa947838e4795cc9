#include <catch2/catch.hpp>

#include "lexconv.h"

#include <cfloat>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <limits>
#include <string>

using namespace lexconv;

//==================================================================================================
// Strtod
//==================================================================================================

static double FloatFromBits(uint64_t bits)
{
    double f;
    std::memcpy(&f, &bits, sizeof(uint64_t));
    return f;
}

static uint64_t BitsFromFloat(double f)
{
    uint64_t u;
    std::memcpy(&u, &f, sizeof(uint64_t));
    return u;
}

static uint32_t BitsFromFloat(float f)
{
    uint32_t u;
    std::memcpy(&u, &f, sizeof(uint32_t));
    return u;
}

template <typename Float = double>
static Float Strtod(const std::string& str)
{
    const auto res = ParseFloat<Float>(str.data(), str.data() + str.size(), ParseFloatOptions::Decimal());
    CHECK(res.status == ParseStatus::success);
    CHECK(res.next == str.data() + str.size());
    return res.value;
}

struct Dtoa1 {
    char* operator()(char* buf, int buflen, double value) const {
        return buf + FormatFloat(buf, static_cast<size_t>(buflen), value, WriteFloatOptions::Decimal());
    }
};

struct Dtoa2 {
    char* operator()(char* buf, int buflen, double value) const {
        return buf + std::snprintf(buf, static_cast<size_t>(buflen), "%.17g", value);
    }
};

struct Dtoa3 {
    char* operator()(char* buf, int buflen, double value) const {
        return buf + std::snprintf(buf, static_cast<size_t>(buflen), "%.16e", value);
    }
};

template <typename DtoaFn>
static void CheckStrtodImpl(double value)
{
    static constexpr int BUFLEN = 128;

    char buf[BUFLEN];
    char* const end = DtoaFn{}(buf, BUFLEN, value);

    CAPTURE(std::string(buf, end));

    const auto res = ParseFloat<double>(buf, end, ParseFloatOptions::Decimal());
    CHECK(res.status == ParseStatus::success);
    CHECK(res.next == end);
    CHECK(BitsFromFloat(value) == BitsFromFloat(res.value));
}

// Formats `value` in several ways and checks that all of them parse back to `value`.
static void CheckStrtod(double value)
{
    CAPTURE(value);

    CheckStrtodImpl<Dtoa1>(value);
    CheckStrtodImpl<Dtoa2>(value);
    CheckStrtodImpl<Dtoa3>(value);
}

static void CheckLiteral(const char* str, double expected)
{
    CAPTURE(str);
    CHECK(BitsFromFloat(expected) == BitsFromFloat(Strtod(str)));
    CheckStrtod(expected);
}

static void CheckLiteral(const char* str, float expected)
{
    // Drop the literal's suffix.
    std::string s(str);
    if (!s.empty() && (s.back() == 'f' || s.back() == 'F'))
        s.pop_back();

    CAPTURE(s);
    CHECK(BitsFromFloat(expected) == BitsFromFloat(Strtod<float>(s)));
}

// Compares the parser against the compiler's conversion of the same literal.
#define CHECK_LITERAL(X) CheckLiteral(#X, X)

TEST_CASE("Strtod - 1")
{
    CheckStrtod(std::numeric_limits<double>::min());
    CheckStrtod(std::numeric_limits<double>::max());
    CheckStrtod(std::numeric_limits<double>::denorm_min());
    CheckStrtod(std::numeric_limits<double>::epsilon());

    CHECK_LITERAL(9007199254740991.0);
    CHECK_LITERAL(9007199254740992.0);
    CHECK_LITERAL(9007199254740993.0); // == 9007199254740992.0
    CHECK_LITERAL(9007199254740994.0);
    CHECK_LITERAL(9007199254740995.0); // == 9007199254740996.0

    CHECK_LITERAL(10000000000000000.0);
    CHECK_LITERAL(1000000000000000.0);
    CHECK_LITERAL(100000000000000.0);

    CHECK_LITERAL(1e23);
    CHECK_LITERAL(8.589973e9);
    CHECK_LITERAL(123456789012345678901234567890.0);
    CHECK_LITERAL(0.000000000000000000000000000000000000000000001);
}

TEST_CASE("Strtod - regression")
{
    CHECK_LITERAL(1.2999999999999999E+154);
    CHECK_LITERAL(7.3177701707893310e+15);
    CHECK_LITERAL(7.2057594037927933e+16);
    CHECK_LITERAL(2.2250738585072011e-308); // PHP hang
    CHECK_LITERAL(2.2250738585072012e-308);
    CHECK_LITERAL(1.00000005960464477550e+0);
    CHECK_LITERAL(8.533e+68);
    CHECK_LITERAL(4.1006e-184);
    CHECK_LITERAL(9.998e+307);
    CHECK_LITERAL(9.9538452227e-280);
    CHECK_LITERAL(6.47660115e-260);
    CHECK_LITERAL(7.4e+47);
    CHECK_LITERAL(5.92e+48);
    CHECK_LITERAL(7.35e+66);
    CHECK_LITERAL(8.32116e+55);

    for (int i = 0; i < 53; ++i)
    {
        CheckStrtod(FloatFromBits(uint64_t{1} << i));
    }

    CheckStrtod(FloatFromBits(uint64_t{0x1} << 51));
    CheckStrtod(FloatFromBits(uint64_t{0x1} << 52));
    CheckStrtod(FloatFromBits(uint64_t{0x1} << 53));
    CheckStrtod(FloatFromBits(uint64_t{0x3} << 51));
    CheckStrtod(FloatFromBits(uint64_t{0x3} << 52));
    CheckStrtod(FloatFromBits(uint64_t{0x3} << 53));

    double d = std::numeric_limits<double>::denorm_min();
    for (int i = 0; i < 100; ++i)
    {
        CheckStrtod(d);
        d *= 2;
    }

    d = std::numeric_limits<double>::max();
    for (int i = 0; i < 100; ++i)
    {
        CheckStrtod(d);
        d /= 2;
    }

    CHECK(0.0 == Strtod("0.0000000000000001e-325"));
    CHECK(0.0 == Strtod("1.0000000000000000e-325"));
    CHECK(0.0 == Strtod("0.0000000000000001e-324"));
    CHECK(0.0 == Strtod("0.0000000000000010e-324"));
    CHECK(0.0 == Strtod("0.0000000000000100e-324"));
    CHECK(0.0 == Strtod("0.0000000000001000e-324"));
    CHECK(0.0 == Strtod("0.0000000000010000e-324"));
    CHECK(0.0 == Strtod("0.0000000000100000e-324"));
    CHECK(0.0 == Strtod("0.0000000001000000e-324"));
    CHECK(0.0 == Strtod("0.0000000010000000e-324"));
    CHECK(0.0 == Strtod("0.0000000100000000e-324"));
    CHECK(0.0 == Strtod("0.0000001000000000e-324"));
    CHECK(0.0 == Strtod("0.0000010000000000e-324"));
    CHECK(0.0 == Strtod("0.0000100000000000e-324"));
    CHECK(0.0 == Strtod("0.0001000000000000e-324"));
    CHECK(0.0 == Strtod("0.0010000000000000e-324"));
    CHECK(0.0 == Strtod("0.0100000000000000e-324"));
    CHECK(0.0 == Strtod("0.1000000000000000e-324"));
    CHECK(0.0 == Strtod("1.0000000000000000e-324"));
    CHECK(0.0 == Strtod("1e-324"));
    CHECK(0.0 == Strtod("2.4703282292062327e-324")); // below half of the smallest subnormal
    CHECK(std::numeric_limits<double>::denorm_min() == Strtod("2.4703282292062328e-324"));
}

TEST_CASE("Strtod - special")
{
    CHECK( 0.0 == Strtod("0"));
    CHECK( 0.0 == Strtod("0.0000000000000000000000000000000"));
    CHECK(-0.0 == Strtod("-0"));
    CHECK(std::signbit(Strtod("-0")));
    CHECK(!std::signbit(Strtod("+0")));

    CHECK(std::isnan(Strtod("NaN")));
    CHECK(std::isinf(Strtod("inf")));
    CHECK(std::isinf(Strtod("infinity")));
    CHECK(std::isinf(Strtod("-inf")));

    CHECK(std::numeric_limits<double>::infinity() == Strtod("1.7976931348623159e308"));
    CHECK(std::numeric_limits<double>::max() == Strtod("1.7976931348623158e308")); // below the boundary
    CHECK(std::numeric_limits<double>::infinity() == Strtod("1e309"));
    CHECK(std::numeric_limits<double>::infinity() == Strtod("1e2147483647"));
    CHECK(0.0 == Strtod("1e-2147483648"));
    CHECK(0.0 == Strtod("0e2147483647"));
}

TEST_CASE("Strtod - long input")
{
    CHECK(1280.0 == Strtod("128.000000000000000000000000000000000000000000000000000000000000"
                           "0000000000000000000000000000000000000000000000000000000000000e+1"));

    // Digits beyond the significant digit limit.
    CHECK(1.0 == Strtod("1" + std::string(1000, '0') + "e-1000"));
    CHECK(1.0 == Strtod("1" + std::string(1200, '0') + "e-1200"));
    CHECK(1.0 == Strtod("0." + std::string(1000, '0') + "1e1001"));
    CHECK(0.1 == Strtod("0." + std::string(800, '0') + "1" + std::string(800, '0') + "e800"));

    // 2^53 + 1 is a tie. Any non-zero digit after it rounds up.
    const std::string tie = "9007199254740993";
    CHECK(9007199254740992.0 == Strtod(tie + "." + std::string(1000, '0')));
    CHECK(9007199254740994.0 == Strtod(tie + "." + std::string(800, '0') + "1"));
    CHECK(9007199254740994.0 == Strtod(tie + "." + std::string(2000, '0') + "1"));
    CHECK(9007199254740992.0 == Strtod("9007199254740992." + std::string(2000, '9')));
    CHECK(9007199254740994.0 == Strtod("9007199254740993" + std::string(1500, '0') + "1e-1501"));

    // The smallest subnormal, halfway to zero, plus a tail.
    const std::string half_min = "2.4703282292062327208828439643411068618252990130716238221279284125033775363510437593264991818081799618989828234772285886546332835517796989819938739800539093906315035659515570226392290858392449105184435931802849936536152500319370457678249219365623669863658480757001585769269903706311928279558551332927834338409351978015531246597263579574622766465272827220056374006485499977096599470454020828166226237857393450736339007967761930577506740176324673600968951340535537458516661134223766678604162159680461914467291840300530057530849048765391711386591646239524912623653881879636239373280423891018672348497668235089863388587925628302755995657524455507255189313690836254779186948667994968324049705821028513185451396213837722826145437693412532098591327667236328125";
    CHECK(0.0 == Strtod(half_min + "e-324"));
    CHECK(std::numeric_limits<double>::denorm_min() == Strtod(half_min + "000000000000000000000000001e-324"));
}

TEST_CASE("Strtod - Paxson, Kahan")
{
    //
    // V. Paxson and W. Kahan, "A Program for Testing IEEE Binary-Decimal Conversion", manuscript, May 1991,
    // ftp://ftp.ee.lbl.gov/testbase-report.ps.Z    (report)
    // ftp://ftp.ee.lbl.gov/testbase.tar.Z          (program)
    //

    //
    // Table 1:
    // Stress Inputs for Conversion to 53-bit Binary, < 1/2 ULP
    //

    CHECK_LITERAL(5e+125);
    CHECK_LITERAL(69e+267);
    CHECK_LITERAL(999e-26);
    CHECK_LITERAL(7861e-34);
    CHECK_LITERAL(75569e-254);
    CHECK_LITERAL(928609e-261);
    CHECK_LITERAL(9210917e+80);
    CHECK_LITERAL(84863171e+114);
    CHECK_LITERAL(653777767e+273);
    CHECK_LITERAL(5232604057e-298);
    CHECK_LITERAL(27235667517e-109);
    CHECK_LITERAL(653532977297e-123);
    CHECK_LITERAL(3142213164987e-294);
    CHECK_LITERAL(46202199371337e-72);
    CHECK_LITERAL(231010996856685e-73);
    CHECK_LITERAL(9324754620109615e+212);
    CHECK_LITERAL(78459735791271921e+49);
    CHECK_LITERAL(272104041512242479e+200);
    CHECK_LITERAL(6802601037806061975e+198);
    CHECK_LITERAL(20505426358836677347e-221);
    CHECK_LITERAL(836168422905420598437e-234);
    CHECK_LITERAL(4891559871276714924261e+222);

    //
    // Table 2:
    // Stress Inputs for Conversion to 53-bit Binary, > 1/2 ULP
    //

    CHECK_LITERAL(9e-265);
    CHECK_LITERAL(85e-37);
    CHECK_LITERAL(623e+100);
    CHECK_LITERAL(3571e+263);
    CHECK_LITERAL(81661e+153);
    CHECK_LITERAL(920657e-23);
    CHECK_LITERAL(4603285e-24);
    CHECK_LITERAL(87575437e-309);
    CHECK_LITERAL(245540327e+122);
    CHECK_LITERAL(6138508175e+120);
    CHECK_LITERAL(83356057653e+193);
    CHECK_LITERAL(619534293513e+124);
    CHECK_LITERAL(2335141086879e+218);
    CHECK_LITERAL(36167929443327e-159);
    CHECK_LITERAL(609610927149051e-255);
    CHECK_LITERAL(3743626360493413e-165);
    CHECK_LITERAL(94080055902682397e-242);
    CHECK_LITERAL(899810892172646163e+283);
    CHECK_LITERAL(7120190517612959703e+120);
    CHECK_LITERAL(25188282901709339043e-252);
    CHECK_LITERAL(308984926168550152811e-52);
    CHECK_LITERAL(6372891218502368041059e+064);
}

TEST_CASE("Strtod - boundaries")
{
    // Boundary cases. Boundaries themselves should round to even.
    //
    // 0x1FFFFFFFFFFFF * 2^3 = 72057594037927928
    //                   next: 72057594037927936
    //               boundary: 72057594037927932  should round up.
    CHECK_LITERAL(72057594037927928e0);
    CHECK_LITERAL(72057594037927936e0);
    CHECK_LITERAL(72057594037927932e0);
    CHECK_LITERAL(7205759403792793199999e-5);
    CHECK_LITERAL(7205759403792793200001e-5);

    // 0x1FFFFFFFFFFFF * 2^10 = 9223372036854774784
    //                    next: 9223372036854775808
    //                boundary: 9223372036854775296 should round up.
    CHECK_LITERAL(9223372036854774784e0);
    CHECK_LITERAL(9223372036854775808e0);
    CHECK_LITERAL(9223372036854775296e0);
    CHECK_LITERAL(922337203685477529599999e-5);
    CHECK_LITERAL(922337203685477529600001e-5);

    // 0x1FFFFFFFFFFFF * 2^50 = 10141204801825834086073718800384
    //                    next: 10141204801825835211973625643008
    //                boundary: 10141204801825834649023672221696 should round up.
    CHECK_LITERAL(10141204801825834086073718800384e0);
    CHECK_LITERAL(10141204801825835211973625643008e0);
    CHECK_LITERAL(10141204801825834649023672221696e0);
    CHECK_LITERAL(1014120480182583464902367222169599999e-5);
    CHECK_LITERAL(1014120480182583464902367222169600001e-5);

    // 0x1FFFFFFFFFFFF * 2^99 = 5708990770823838890407843763683279797179383808
    //                    next: 5708990770823839524233143877797980545530986496
    //                boundary: 5708990770823839207320493820740630171355185152
    // The boundary should round up.
    CHECK_LITERAL(5708990770823838890407843763683279797179383808e0);
    CHECK_LITERAL(5708990770823839524233143877797980545530986496e0);
    CHECK_LITERAL(5708990770823839207320493820740630171355185152e0);
    CHECK_LITERAL(5708990770823839207320493820740630171355185151999e-3);
    CHECK_LITERAL(5708990770823839207320493820740630171355185152001e-3);

    // Largest normal and smallest normal.
    CHECK_LITERAL(1.7976931348623157e+308);
    CHECK_LITERAL(2.2250738585072014e-308);
    CHECK_LITERAL(2.2250738585072009e-308);
    CHECK_LITERAL(4.9406564584124654e-324);
}

// Few digits, but the exponent is too large for the exact fast path.
// The significand needs a large normalization shift while its error is still 0.
TEST_CASE("Strtod - short significand")
{
    CHECK_LITERAL(1.2345e38);
    CHECK_LITERAL(1.2345e38f);
    CHECK_LITERAL(1e300);
    CHECK_LITERAL(7e-300);
    CHECK_LITERAL(3e-320);
    CHECK_LITERAL(5e40);
    CHECK_LITERAL(1e-40f);
    CHECK_LITERAL(9e30f);
    CHECK_LITERAL(2e-30f);
}

TEST_CASE("Strtod - single")
{
    CHECK_LITERAL(1.0f);
    CHECK_LITERAL(0.1f);
    CHECK_LITERAL(1.17549435e-38f);
    CHECK_LITERAL(1.17549421e-38f);
    CHECK_LITERAL(1.40129846e-45f);
    CHECK_LITERAL(3.40282347e+38f);
    CHECK_LITERAL(16777216.0f);
    CHECK_LITERAL(16777217.0f);
    CHECK_LITERAL(16777218.0f);
    CHECK_LITERAL(1.00000005960464477550f);
    CHECK_LITERAL(1.00000005960464477539f);
    CHECK_LITERAL(7.038531e-26f);
    CHECK_LITERAL(4.2e-45f);
    CHECK_LITERAL(8.589973e9f);
    CHECK_LITERAL(1.4e-45f);
    CHECK_LITERAL(3.4028234e38f);
    CHECK_LITERAL(1234567.8f);
}
