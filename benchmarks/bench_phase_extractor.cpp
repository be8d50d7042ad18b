#include <benchmark/benchmark.h>
#include <orotune/phase_extractor.hpp>
#include <orotune/trace_aligner.hpp>
#include <cmath>
#include <random>

using namespace orotune;

static Eigen::MatrixXd make_traces(Eigen::Index n_trials, Eigen::Index frames) {
    std::mt19937 gen(42);
    std::normal_distribution<double> noise(0.0, 0.3);
    Eigen::MatrixXd traces(n_trials, frames);
    for (Eigen::Index r = 0; r < n_trials; ++r) {
        for (Eigen::Index c = 0; c < frames; ++c) {
            traces(r, c) = std::sin(TWO_PI * 7.0 * static_cast<double>(c) * 0.0034) + noise(gen);
        }
    }
    return traces;
}

static void BM_PhaseExtractor_Extract(benchmark::State& state) {
    PhaseAmplitudeExtractor extractor(PhaseAmplitudeExtractor::Config::jaw());
    const Eigen::MatrixXd traces = make_traces(state.range(0), 1471);

    for (auto _ : state) {
        auto result = extractor.extract(traces);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_PhaseExtractor_Extract)->Range(1, 256);

static void BM_PhaseExtractor_AnalyticSignal(benchmark::State& state) {
    const Eigen::VectorXd trace = make_traces(1, state.range(0)).row(0).transpose();

    for (auto _ : state) {
        auto z = PhaseAmplitudeExtractor::analytic_signal(trace);
        benchmark::DoNotOptimize(z);
    }
}
BENCHMARK(BM_PhaseExtractor_AnalyticSignal)->Arg(1470)->Arg(1471)->Arg(2048);

static void BM_TraceAligner_Align(benchmark::State& state) {
    TraceAligner aligner;
    const Eigen::MatrixXd traces = make_traces(state.range(0), 1471);

    for (auto _ : state) {
        auto aligned = aligner.align_trials(traces, 0.0034);
        benchmark::DoNotOptimize(aligned);
    }
}
BENCHMARK(BM_TraceAligner_Align)->Range(8, 256);

static void BM_ResampleFourier(benchmark::State& state) {
    const Eigen::VectorXd body = make_traces(1, 500 * state.range(0)).row(0).transpose();
    const auto target = static_cast<size_t>(body.size() * 3);

    for (auto _ : state) {
        auto resampled = dsp::resample_fourier(body, target);
        benchmark::DoNotOptimize(resampled);
    }
}
BENCHMARK(BM_ResampleFourier)->Range(8, 128);

BENCHMARK_MAIN();
