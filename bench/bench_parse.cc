#include "benchmark/benchmark.h"

#include "lexconv.h"

#include <cstdint>
#include <cstdio>
#include <cstring>

#include <algorithm>
#include <limits>
#include <random>
#include <string>
#include <utility>
#include <vector>

#define BENCH_CORRECT()     1
#define BENCH_LOSSY()       1
#define BENCH_UNCHECKED()   1
#define BENCH_HEX()         LEXCONV_RADIX

static constexpr int NumFloats = 1 << 14;

using lexconv::ParseFloatOptions;
using lexconv::WriteFloatOptions;

//==================================================================================================
//
//==================================================================================================

struct S2DCorrect
{
    using value_type = double;

    value_type operator()(std::string const& str, ParseFloatOptions const& options) const
    {
        const auto res = lexconv::ParseFloat<value_type>(str.data(), str.data() + str.size(), options);
        return res.value;
    }
};

struct S2DUnchecked
{
    using value_type = double;

    value_type operator()(std::string const& str, ParseFloatOptions const& options) const
    {
        return lexconv::ParseFloatUnchecked<value_type>(str.data(), str.data() + str.size(), options);
    }
};

template <typename Converter>
static void BenchIt(benchmark::State& state, std::vector<std::string> const& numbers, ParseFloatOptions const& options)
{
    Converter convert;

    size_t index = 0;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize( convert(numbers[index], options) );
        index = (index + 1) & (NumFloats - 1);
    }
}

template <typename Converter>
static void RegisterBenchmarks(char const* name, std::vector<std::string> const& numbers, ParseFloatOptions const& options)
{
    auto* bench = benchmark::RegisterBenchmark(name, BenchIt<Converter>, numbers, options);

    bench->ComputeStatistics("min", [](std::vector<double> const& v) -> double {
        return *(std::min_element(std::begin(v), std::end(v)));
    });
    bench->Repetitions(3);
    bench->ReportAggregatesOnly();
}

class JenkinsRandom
{
    // A small noncryptographic PRNG
    // http://burtleburtle.net/bob/rand/smallprng.html

    uint32_t a;
    uint32_t b;
    uint32_t c;
    uint32_t d;

    static uint32_t Rotate(uint32_t value, int n) {
        return (value << n) | (value >> (32 - n));
    }

    uint32_t Gen() {
        const uint32_t e = a - Rotate(b, 27);
        a = b ^ Rotate(c, 17);
        b = c + d;
        c = d + e;
        d = e + a;
        return d;
    }

public:
    using result_type = uint32_t;

    static constexpr uint32_t min() { return 0; }
    static constexpr uint32_t max() { return UINT32_MAX; }

    explicit JenkinsRandom(uint32_t seed = 0) {
        a = 0xF1EA5EED;
        b = seed;
        c = seed;
        d = seed;
        for (int i = 0; i < 20; ++i) {
            static_cast<void>(Gen());
        }
    }

    uint32_t operator()() { return Gen(); }
};

static JenkinsRandom rng;

template <typename ...Args>
static inline char const* StrPrintf(char const* format, Args&&... args)
{
    char buf[1024];
    snprintf(buf, 1024, format, std::forward<Args>(args)...);
#ifdef _MSC_VER
    return _strdup(buf); // leak...
#else
    return strdup(buf); // leak...
#endif
}

//==================================================================================================
//
//==================================================================================================

static inline std::string ToString(double value, WriteFloatOptions const& options)
{
    char buf[lexconv::kMaxFloat64Length];
    const size_t length = lexconv::FormatFloat(buf, sizeof(buf), value, options);
    return std::string(buf, length);
}

static inline void RegisterNumbers(char const* name, std::vector<double> const& values)
{
    std::vector<std::string> numbers(values.size());

    std::transform(values.begin(), values.end(), numbers.begin(), [](double v) {
        return ToString(v, WriteFloatOptions::Decimal());
    });

#if BENCH_CORRECT()
    RegisterBenchmarks<S2DCorrect  >(StrPrintf("%s correct         ", name), numbers, ParseFloatOptions::Decimal());
#endif
#if BENCH_LOSSY()
    RegisterBenchmarks<S2DCorrect  >(StrPrintf("%s lossy           ", name), numbers, *ParseFloatOptions::Builder().Lossy(true).Build());
#endif
#if BENCH_UNCHECKED()
    RegisterBenchmarks<S2DUnchecked>(StrPrintf("%s unchecked       ", name), numbers, ParseFloatOptions::Decimal());
#endif

#if BENCH_HEX()
    std::vector<std::string> hex_numbers(values.size());

    std::transform(values.begin(), values.end(), hex_numbers.begin(), [](double v) {
        return ToString(v, WriteFloatOptions::Hexadecimal());
    });

    RegisterBenchmarks<S2DCorrect  >(StrPrintf("%s hexadecimal     ", name), hex_numbers, ParseFloatOptions::Hexadecimal());
#endif
}

static inline void RegisterUniform_double(char const* name, double min, double max)
{
    std::vector<double> values(NumFloats);

    std::uniform_real_distribution<double> gen(min, max);
    std::generate(values.begin(), values.end(), [&] { return gen(rng); });

    RegisterNumbers(name, values);
}

static inline void RegisterRandomBits_double(char const* name)
{
    std::vector<double> values(NumFloats);

    std::generate(values.begin(), values.end(), [] {
        for (;;)
        {
            const uint64_t bits = uint64_t{rng()} << 32 | rng();
            double f;
            std::memcpy(&f, &bits, sizeof(double));
            if (f >= 0 && f <= std::numeric_limits<double>::max())
                return f;
        }
    });

    RegisterNumbers(name, values);
}

// Short inputs with `digits` significant digits, e.g. prices or measurements.
static inline void RegisterDigits_double(char const* name, int digits, int max_scale)
{
    std::vector<std::string> numbers(NumFloats);

    std::uniform_int_distribution<int> gen_digit(0, 9);
    std::uniform_int_distribution<int> gen_scale(0, max_scale);
    std::generate(numbers.begin(), numbers.end(), [&] {
        std::string str;
        str += static_cast<char>('1' + gen_digit(rng) % 9);
        for (int i = 1; i < digits; ++i)
        {
            str += static_cast<char>('0' + gen_digit(rng));
        }
        const int scale = std::min(gen_scale(rng), digits - 1);
        if (scale > 0)
        {
            str.insert(str.size() - static_cast<size_t>(scale), 1, '.');
        }
        return str;
    });

#if BENCH_CORRECT()
    RegisterBenchmarks<S2DCorrect  >(StrPrintf("%s correct         ", name), numbers, ParseFloatOptions::Decimal());
#endif
#if BENCH_LOSSY()
    RegisterBenchmarks<S2DCorrect  >(StrPrintf("%s lossy           ", name), numbers, *ParseFloatOptions::Builder().Lossy(true).Build());
#endif
}

// Long inputs which force the bignum comparison.
static inline void RegisterLong_double(char const* name, int extra_digits)
{
    std::vector<std::string> numbers(NumFloats);

    std::uniform_real_distribution<double> gen(0.0, 1.0);
    std::generate(numbers.begin(), numbers.end(), [&] {
        char buf[1024];
        const int length = std::snprintf(buf, sizeof(buf), "%.*e", 16 + extra_digits, gen(rng));
        return std::string(buf, static_cast<size_t>(length));
    });

#if BENCH_CORRECT()
    RegisterBenchmarks<S2DCorrect  >(StrPrintf("%s correct         ", name), numbers, ParseFloatOptions::Decimal());
#endif
#if BENCH_LOSSY()
    RegisterBenchmarks<S2DCorrect  >(StrPrintf("%s lossy           ", name), numbers, *ParseFloatOptions::Builder().Lossy(true).Build());
#endif
}

//==================================================================================================
//
//==================================================================================================

int main(int argc, char** argv)
{
#if defined(__clang__)
    printf("clang %d.%d\n", __clang_major__, __clang_minor__);
#elif defined(__GNUC__)
    printf("gcc %s\n", __VERSION__);
#elif defined(_MSC_VER)
    printf("msc %d\n", _MSC_FULL_VER);
#endif

    RegisterUniform_double("warm up", 0, 1);

    RegisterUniform_double("uniform [0,1]", 0.0, 1.0);
    RegisterUniform_double("uniform [1,2]", 1.0, 2.0);
    RegisterUniform_double("uniform [8,2^10]", 8.0, 1ll << 10);
    RegisterUniform_double("uniform [2^20,2^50]", 1ll << 20, 1ll << 50);
    RegisterUniform_double("uniform [0,max]", 0.0, std::numeric_limits<double>::max());
    RegisterRandomBits_double("random-bits");

    RegisterDigits_double(" 4-digits", 4, 2);
    RegisterDigits_double(" 8-digits", 8, 4);
    RegisterDigits_double("15-digits", 15, 8);

    RegisterLong_double("30-digits ", 14);
    RegisterLong_double("100-digits", 84);

    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();
}
