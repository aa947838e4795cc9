// Formats every single-precision number in a range of biased exponents, and
// checks that the output parses back to the same number and that it is as short
// as possible.
//
// Usage: test_all_floats [min_exponent [max_exponent [stride]]]
// The exponents are biased exponents in [0, 254]. With a stride > 1 only every
// stride-th significand of each exponent is checked, plus the largest one.

#include "lexconv.h"
#include "scan_number.h"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

using namespace lexconv;

static inline float FloatFromBits(uint32_t bits)
{
    float f;
    std::memcpy(&f, &bits, sizeof(uint32_t));
    return f;
}

static inline uint32_t BitsFromFloat(float f)
{
    uint32_t u;
    std::memcpy(&u, &f, sizeof(uint32_t));
    return u;
}

static bool ParsesTo(const std::string& str, uint32_t bits)
{
    const auto res = ParseFloat<float>(str.data(), str.data() + str.size(), ParseFloatOptions::Decimal());
    return res.status == ParseStatus::success && BitsFromFloat(res.value) == bits;
}

static std::string IncrementDecimal(std::string digits)
{
    for (auto it = digits.rbegin(); it != digits.rend(); ++it)
    {
        if (*it != '9')
        {
            ++*it;
            return digits;
        }
        *it = '0';
    }
    return "1" + digits;
}

static int ParseIntArg(const char* arg, int fallback, int min_value, int max_value)
{
    if (arg == nullptr)
        return fallback;

    const auto res = ParseInteger<int32_t>(arg, arg + std::strlen(arg), ParseIntegerOptions::Decimal());
    if (!res || res.value < min_value || res.value > max_value)
    {
        std::fprintf(stderr, "invalid argument '%s'\n", arg);
        std::exit(EXIT_FAILURE);
    }

    return res.value;
}

int main(int argc, char** argv)
{
    constexpr int P = 24;
    constexpr uint32_t MaxF = (1u << (P - 1)) - 1;

    const int MinExp = ParseIntArg(argc > 1 ? argv[1] : nullptr, 0, 0, 254);
    const int MaxExp = ParseIntArg(argc > 2 ? argv[2] : nullptr, (argc > 1) ? MinExp : 254, 0, 254);
    const uint32_t Stride = static_cast<uint32_t>(ParseIntArg(argc > 3 ? argv[3] : nullptr, 1, 1, 1 << 20));

    uint32_t num_checked = 0;
    uint32_t num_failed  = 0;

    for (int e = MinExp; e <= MaxExp; ++e)
    {
        printf("e = %3d ... ", e);
        fflush(stdout);

        uint32_t curr_num_failed = 0;
        for (uint32_t f = 0; f <= MaxF; f = (f < MaxF && MaxF - f < Stride) ? MaxF : f + Stride)
        {
            ++num_checked;

            const uint32_t bits = (static_cast<uint32_t>(e) << (P - 1)) | f;
            const float value = FloatFromBits(bits);

            char buf[kMaxFloat32Length];
            const size_t length = FormatFloat(buf, sizeof(buf), value, WriteFloatOptions::Decimal());
            const std::string str(buf, length);

            if (!ParsesTo(str, bits))
            {
                if (curr_num_failed++ < 10)
                    printf("\nFAIL: 0x%08X [%s] does not round trip", bits, str.c_str());
                continue;
            }

            if (value == 0)
                continue;

            const auto num = ScanNumber(str);
            if (num.digits.size() <= 1)
                continue;

            const std::string truncated = num.digits.substr(0, num.digits.size() - 1);
            const std::string exponent = "e" + std::to_string(num.exponent + 1);
            if (ParsesTo(truncated + exponent, bits) || ParsesTo(IncrementDecimal(truncated) + exponent, bits))
            {
                if (curr_num_failed++ < 10)
                    printf("\nFAIL: 0x%08X [%s] is not the shortest representation", bits, str.c_str());
            }
        }

        num_failed += curr_num_failed;
        if (curr_num_failed == 0)
            printf("ok\n");
        else
            printf("\n%u failures\n", curr_num_failed);
    }

    printf("done.\n");
    printf("checked: %u\n", num_checked);
    printf("failed:  %u\n", num_failed);
    return num_failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
