// File: repricer_index_test.cpp
// Table-driven adjustment cases over HTML fragments

#include <gtest/gtest.h>

#ifndef REPRICER_HAS_BENCHMARK
#define REPRICER_HAS_BENCHMARK 0
#endif

#if REPRICER_HAS_BENCHMARK
#include <benchmark/benchmark.h>
#endif
#include <cctype>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

#include "repricer.h"

using namespace repricer_cpp;

// A simple structure to hold each test case.
struct TestCase {
    std::string name;
    std::string html;
    std::string adjustment;
    std::string expected;
    std::optional<std::size_t> limit;

    TestCase(std::string const& n, std::string const& h, std::string const& a, std::string const& e,
             std::optional<std::size_t> l = std::nullopt)
        : name(n), html(h), adjustment(a), expected(e), limit(l) {}
};

// Adjusts a fragment and returns the body's inner markup.
std::string adjustFragment(std::string const& html, std::string const& adjustment,
                           std::optional<std::size_t> limit = std::nullopt) {
    auto parsed = Adjustment::parse(adjustment);
    if (!parsed) {
        ADD_FAILURE() << "Invalid adjustment in test case: " << adjustment;
        return {};
    }
    AdjustOptions opts;
    opts.fragment = true;
    opts.limit = limit;
    return adjustHtml(html, *parsed, opts);
}

static std::vector<TestCase> ALL_TEST_CASES = {
    // Absolute adjustments
    {"absolute decrease", "<p>$10.00</p>", "-2.46", "<p>$7.54</p>"},
    {"absolute increase", "<p>$10.00</p>", "+7395", "<p>$7,405.00</p>"},
    {"zero adjustment normalizes", "<p>$1,234.5</p>", "0", "<p>$1,234.50</p>"},
    {"grouped amount", "<p>$1,234.56</p>", "0", "<p>$1,234.56</p>"},
    {"gains a digit", "<p>$9.99</p>", "+0.02", "<p>$10.01</p>"},
    {"loses a digit", "<p>$100.00</p>", "-90", "<p>$10.00</p>"},
    {"gains a group separator", "<p>$999.00</p>", "+1", "<p>$1,000.00</p>"},
    {"goes negative", "<p>$5.00</p>", "-7.46", "<p>$-2.46</p>"},

    // Percentage adjustments
    {"percent decrease", "<p>$100.00</p>", "-14%", "<p>$86.00</p>"},
    {"percent increase", "<p>$50</p>", "10%", "<p>$55.00</p>"},
    {"percent rounds half up", "<p>$0.25</p>", "50%", "<p>$0.38</p>"},

    // Markup inside and around amounts
    {"digits split by tags", "<p>$1<b>2</b>3.00</p>", "+1", "<p>$1<b>2</b>4.00</p>"},
    {"split amount gains digits", "<p>$9<b>9</b>9.00</p>", "+1", "<p>$1,0<b>0</b>0.00</p>"},
    {"nested span", "<p>Total: <span>$5.00</span></p>", "+1", "<p>Total: <span>$6.00</span></p>"},
    {"trailing period", "<p>Only $5.00.</p>", "+1", "<p>Only $6.00.</p>"},
    {"fraction only", "<p>$.99</p>", "+1", "<p>$1.99</p>"},
    {"marker in attribute untouched", "<p><span title=\"$20\">$5.00</span></p>", "+1",
     "<p><span title=\"$20\">$6.00</span></p>"},
    {"marker without amount", "<p>US$ only, now $5.00</p>", "+1", "<p>US$ only, now $6.00</p>"},
    {"no prices", "<p>Free shipping</p>", "+1", "<p>Free shipping</p>"},
    {"comment inside digit run", "<p>$5<!-- x > y -->3.00</p>", "+1", "<p>$5<!-- x > y -->4.00</p>"},
    {"twenty-digit amount", "<p>$99999999999999999999</p>", "0",
     "<p>$100,000,000,000,000,000,000.00</p>"},

    // Several amounts
    {"several amounts in one element", "<p>$1.00, $2.00 and $3.00</p>", "10%",
     "<p>$1.10, $2.20 and $3.30</p>"},
    {"parent and child amounts adjusted once", "<div>$5.00 and <span>$3.00</span></div>", "+1",
     "<div>$6.00 and <span>$4.00</span></div>"},
    {"list items", "<ul><li>$1.00</li><li>$2.00</li></ul>", "+1",
     "<ul><li>$2.00</li><li>$3.00</li></ul>"},
    {"multiple paragraphs", "<p>Chair $49.99</p><p>Table $129.00</p>", "-14%",
     "<p>Chair $42.99</p><p>Table $110.94</p>"},

    // Limit
    {"limit two", "<p>$1.00</p><p>$2.00</p><p>$3.00</p>", "+1",
     "<p>$2.00</p><p>$3.00</p><p>$3.00</p>", 2},
    {"limit zero", "<p>$1.00</p><p>$2.00</p>", "+1", "<p>$1.00</p><p>$2.00</p>", 0},
};

// Each test case compares adjustFragment(html) to "expected".
class RepricerTests : public ::testing::TestWithParam<TestCase> {};

TEST_P(RepricerTests, AdjustsCorrectly)
{
    auto const& tc = GetParam();
    std::string result = adjustFragment(tc.html, tc.adjustment, tc.limit);
    EXPECT_EQ(result, tc.expected)
        << "Failure in test case: " << tc.name;
}

static std::string SanitizeName(std::string const& input, int index) {
    std::string out;
    out.reserve(input.size() + 8);
    bool lastUnderscore = false;
    for (char ch : input) {
        if (std::isalnum(static_cast<unsigned char>(ch))) {
            out.push_back(ch);
            lastUnderscore = false;
        } else {
            if (!lastUnderscore) {
                out.push_back('_');
                lastUnderscore = true;
            }
        }
    }
    while (!out.empty() && out.front() == '_') out.erase(out.begin());
    while (!out.empty() && out.back() == '_') out.pop_back();
    if (out.empty()) {
        out = "Case";
    }
    out += "_" + std::to_string(index);
    return out;
}

INSTANTIATE_TEST_SUITE_P(
    AllRepricerTests,
    RepricerTests,
    ::testing::ValuesIn(ALL_TEST_CASES),
    [](::testing::TestParamInfo<TestCase> const& info) {
        return SanitizeName(info.param.name, info.index);
    });

#if REPRICER_HAS_BENCHMARK
static void BM_Adjust(benchmark::State& state, TestCase const& testCase)
{
    for (auto _ : state) {
        auto output = adjustFragment(testCase.html, testCase.adjustment, testCase.limit);
        benchmark::DoNotOptimize(output);
    }
}

static void RegisterAllBenchmarks()
{
    for (auto const& tc : ALL_TEST_CASES) {
        benchmark::RegisterBenchmark(tc.name.c_str(),
            [tc](benchmark::State& st){ BM_Adjust(st, tc); });
    }
}
#endif

// Benchmarks are opt-in via --run_benchmarks to avoid running per-discovered test.
int main(int argc, char** argv)
{
#if REPRICER_HAS_BENCHMARK
    bool runBenchmarks = false;
#endif
    std::vector<char*> args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        if (std::strcmp(argv[i], "--run_benchmarks") == 0) {
#if REPRICER_HAS_BENCHMARK
            runBenchmarks = true;
#else
            std::fprintf(stderr, "--run_benchmarks ignored: repricer_cpp built without benchmark support\n");
#endif
            continue;
        }
        args.push_back(argv[i]);
    }
    int gargc = static_cast<int>(args.size());

    testing::InitGoogleTest(&gargc, args.data());
    int testResult = RUN_ALL_TESTS();
    // During gtest_discover_tests (uses --gtest_list_tests) we just need test names.
    if (testing::GTEST_FLAG(list_tests)) {
        return testResult;
    }
    if (testResult != 0) {
        return testResult;
    }

#if REPRICER_HAS_BENCHMARK
    if (!runBenchmarks || !testing::GTEST_FLAG(filter).empty()) {
        return 0;
    }

    int benchArgc = gargc;
    benchmark::Initialize(&benchArgc, args.data());
    RegisterAllBenchmarks();
    benchmark::RunSpecifiedBenchmarks();
#endif
    return 0;
}
