#include "benchmark/benchmark.h"

#include "lexconv.h"
#include "digit_gen.h"

#include <cstdint>
#include <cstdio>
#include <cstring>

#include <algorithm>
#include <limits>
#include <random>
#include <utility>
#include <vector>

#define BENCH_SINGLE()          1
#define BENCH_DOUBLE()          1

#define BENCH_RADIX_2()         LEXCONV_RADIX

static constexpr int NumFloats = 1 << 13;

using lexconv::WriteFloatOptions;

//==================================================================================================
//
//==================================================================================================

// The public entry point, using the digit generator selected at build time.
struct F2SFormat
{
    static char const* Name() { return "FormatFloat"; }

    template <typename Float>
    size_t operator()(char* buf, int buflen, Float f, int radix) const
    {
        const auto options = radix == 10 ? WriteFloatOptions::Decimal() : *WriteFloatOptions::Builder().Radix(radix).Build();
        return lexconv::FormatFloat(buf, static_cast<size_t>(buflen), f, options);
    }
};

// Digit generation only.
template <typename Generator>
struct F2SDigits
{
    template <typename Float>
    size_t operator()(char* buf, int /*buflen*/, Float f, int radix) const
    {
        int num_digits = 0;
        int exponent = 0;
        Generator::ToDigits(buf, num_digits, exponent, f, radix);
        return static_cast<size_t>(num_digits);
    }
};

//==================================================================================================
//
//==================================================================================================

template <typename Target, typename Source>
static Target ReinterpretBits(Source const& source)
{
    static_assert(sizeof(Target) == sizeof(Source), "size mismatch");

    Target target;
    std::memcpy(&target, &source, sizeof(Source));
    return target;
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

template <typename F2S, typename Float>
static void BenchIt(benchmark::State& state, std::vector<Float> const& numbers, int radix)
{
    F2S f2s;

    char buf[128];

    size_t index = 0;
    for (auto _ : state)
    {
        const Float f = numbers[index];
        index = (index + 1) & (NumFloats - 1);

        benchmark::DoNotOptimize( f2s(buf, 128, f, radix) );
    }
}

template <typename F2S, typename Float>
static void RegisterBenchmark(char const* name, std::vector<Float> const& numbers, int radix)
{
    auto* bench = benchmark::RegisterBenchmark(name, BenchIt<F2S, Float>, numbers, radix);

    bench->ComputeStatistics("min", [](std::vector<double> const& v) -> double {
        return *(std::min_element(std::begin(v), std::end(v)));
    });
    bench->Repetitions(3);
    bench->ReportAggregatesOnly();
}

template <typename Float>
static void RegisterBenchmarks(char const* name, std::vector<Float> const& numbers)
{
    RegisterBenchmark<F2SFormat>(StrPrintf("%s FormatFloat      radix 10", name), numbers, 10);
    RegisterBenchmark<F2SDigits<lexconv::impl::Grisu3DigitGenerator>>(StrPrintf("%s Grisu3 digits    radix 10", name), numbers, 10);
    RegisterBenchmark<F2SDigits<lexconv::impl::Dragon4DigitGenerator>>(StrPrintf("%s Dragon4 digits   radix 10", name), numbers, 10);
#if BENCH_RADIX_2()
    RegisterBenchmark<F2SFormat>(StrPrintf("%s FormatFloat      radix  2", name), numbers, 2);
    RegisterBenchmark<F2SDigits<lexconv::impl::Dragon4DigitGenerator>>(StrPrintf("%s Dragon4 digits   radix  2", name), numbers, 2);
#endif
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

static inline void Register_RandomBits_double()
{
    std::vector<double> numbers(NumFloats);

    std::generate(numbers.begin(), numbers.end(), [] {
        for (;;)
        {
            const uint64_t bits = uint64_t{rng()} << 32 | rng();
            const double f = ReinterpretBits<double>(bits);
            if (f > 0 && f <= std::numeric_limits<double>::max())
                return f;
        }
    });

    RegisterBenchmarks("random-bits double", numbers);
}

static inline void Register_RandomBits_single()
{
    std::vector<float> numbers(NumFloats);

    std::generate(numbers.begin(), numbers.end(), [] {
        for (;;)
        {
            const uint32_t bits = rng();
            const float f = ReinterpretBits<float>(bits);
            if (f > 0 && f <= std::numeric_limits<float>::max())
                return f;
        }
    });

    RegisterBenchmarks("random-bits single", numbers);
}

template <typename Float>
static inline void Register_Uniform(char const* name, Float low, Float high)
{
    std::vector<Float> numbers(NumFloats);

    std::uniform_real_distribution<Float> gen(low, high);
    std::generate(numbers.begin(), numbers.end(), [&] {
        for (;;)
        {
            const Float f = gen(rng);
            if (f > 0)
                return f;
        }
    });

    RegisterBenchmarks(StrPrintf("uniform %s", name), numbers);
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

static constexpr double kPow10_double[] = {
    1e+00, 1e+01, 1e+02, 1e+03, 1e+04, 1e+05, 1e+06, 1e+07, 1e+08,
    1e+09, 1e+10, 1e+11, 1e+12, 1e+13, 1e+14, 1e+15, 1e+16, 1e+17,
};

// Numbers with exactly `digits` significant decimal digits.
static inline void Register_Digits_double(int digits)
{
    const uint64_t lo = static_cast<uint64_t>(kPow10_double[digits - 1]);
    const uint64_t hi = static_cast<uint64_t>(kPow10_double[digits]) - 1;

    std::vector<double> numbers(NumFloats);

    std::uniform_int_distribution<uint64_t> gen_significand(lo, hi);
    std::uniform_int_distribution<int> gen_exponent(0, 16);
    std::generate(numbers.begin(), numbers.end(), [&] {
        return static_cast<double>(gen_significand(rng)) / kPow10_double[gen_exponent(rng)];
    });

    RegisterBenchmarks(StrPrintf("%2d-digits double", digits), numbers);
}

static constexpr float kPow10_single[] = {
    1e+00f, 1e+01f, 1e+02f, 1e+03f, 1e+04f, 1e+05f, 1e+06f, 1e+07f, 1e+08f, 1e+09f,
};

static inline void Register_Digits_single(int digits)
{
    const uint32_t lo = static_cast<uint32_t>(kPow10_single[digits - 1]);
    const uint32_t hi = static_cast<uint32_t>(kPow10_single[digits]) - 1;

    std::vector<float> numbers(NumFloats);

    std::uniform_int_distribution<uint32_t> gen_significand(lo, hi);
    std::uniform_int_distribution<int> gen_exponent(0, 8);
    std::generate(numbers.begin(), numbers.end(), [&] {
        return static_cast<float>(gen_significand(rng)) / kPow10_single[gen_exponent(rng)];
    });

    RegisterBenchmarks(StrPrintf("%2d-digits single", digits), numbers);
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

int main(int argc, char** argv)
{
#if defined(__clang__)
    printf("clang %d.%d\n", __clang_major__, __clang_minor__);
#elif defined(__GNUC__)
    printf("gcc %s\n", __VERSION__);
#elif defined(_MSC_VER)
    printf("msc %d\n", _MSC_FULL_VER);
#endif

    printf("Preparing benchmarks...\n");

#if BENCH_DOUBLE()
    Register_RandomBits_double();
    Register_Uniform("[0,1] double", 0.0, 1.0);
    Register_Uniform("[1,2] double", 1.0, 2.0);
    Register_Uniform("[0,max] double", 0.0, 1.0e+308);

    for (int d = 1; d <= 17; ++d)
    {
        Register_Digits_double(d);
    }
#endif

#if BENCH_SINGLE()
    Register_RandomBits_single();
    Register_Uniform("[0,1] single", 0.0f, 1.0f);
    Register_Uniform("[1,2] single", 1.0f, 2.0f);
    Register_Uniform("[0,max] single", 0.0f, 1.0e+38f);

    for (int d = 1; d <= 9; ++d)
    {
        Register_Digits_single(d);
    }
#endif

    printf("Benchmarking %s\n", F2SFormat::Name());

    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();
}
