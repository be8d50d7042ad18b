#include <benchmark/benchmark.h>
#include <orotune/bout_detector.hpp>
#include <orotune/circular_tuning.hpp>
#include <orotune/permutation_test.hpp>
#include <random>

using namespace orotune;

static std::vector<double> uniform_phases(size_t n, uint32_t seed) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<double> dist(0.0, TWO_PI);
    std::vector<double> phases(n);
    for (auto& p : phases) p = dist(gen);
    return phases;
}

static void BM_CircularTuning_Estimate(benchmark::State& state) {
    CircularTuningEstimator estimator;
    const auto occupancy = uniform_phases(static_cast<size_t>(state.range(0)), 42);
    const auto spikes = uniform_phases(2000, 7);

    for (auto _ : state) {
        auto curve = estimator.estimate(spikes, occupancy, 294.0);
        benchmark::DoNotOptimize(curve);
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_CircularTuning_Estimate)->Range(1 << 12, 1 << 18);

static void BM_Kuiper_TwoSample(benchmark::State& state) {
    const auto a = uniform_phases(static_cast<size_t>(state.range(0)), 42);
    const auto b = uniform_phases(static_cast<size_t>(state.range(0)) * 10, 7);

    for (auto _ : state) {
        auto result = kuiper_two_sample(a, b);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Kuiper_TwoSample)->Range(256, 8192);

// One unit: 100 shuffles against a session of behavioral phases
static void BM_PermutationTest_Unit(benchmark::State& state) {
    PermutationSignificanceTester::Config config;
    config.seed = 1;
    PermutationSignificanceTester tester(config);
    const auto population = uniform_phases(static_cast<size_t>(state.range(0)), 42);
    const auto spikes = uniform_phases(1000, 7);

    for (auto _ : state) {
        auto result = tester.test(population, spikes, 294.0);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_PermutationTest_Unit)->Range(1 << 14, 1 << 18)->Unit(benchmark::kMillisecond);

static void BM_BoutDetector_Licking(benchmark::State& state) {
    std::mt19937 gen(42);
    std::bernoulli_distribution visible(0.3);
    std::vector<double> mask(static_cast<size_t>(state.range(0)));
    for (auto& m : mask) m = visible(gen) ? 1.0 : 0.0;

    BoutDetector detector(BoutDetector::Config::licking());
    for (auto _ : state) {
        auto detection = detector.detect(mask, 0.0034);
        benchmark::DoNotOptimize(detection);
    }
}
BENCHMARK(BM_BoutDetector_Licking)->Range(1 << 12, 1 << 20);

BENCHMARK_MAIN();
