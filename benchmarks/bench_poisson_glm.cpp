#include <benchmark/benchmark.h>
#include <orotune/poisson_glm.hpp>
#include <random>

using namespace orotune;

struct GLMData {
    Eigen::MatrixXd X;
    Eigen::VectorXd y;
};

// Eight z-scored predictors as in a session design matrix
static GLMData make_data(Eigen::Index rows) {
    std::mt19937 gen(42);
    std::normal_distribution<double> dist(0.0, 1.0);
    GLMData data{Eigen::MatrixXd(rows, 8), Eigen::VectorXd(rows)};
    for (Eigen::Index r = 0; r < rows; ++r) {
        for (Eigen::Index c = 0; c < 8; ++c) data.X(r, c) = dist(gen);
    }
    Eigen::VectorXd w = Eigen::VectorXd::Constant(9, 0.1);
    w(0) = -1.0;
    const Eigen::VectorXd rate = PoissonGLM::predict(w, data.X);
    for (Eigen::Index r = 0; r < rows; ++r) {
        std::poisson_distribution<int> draw(rate(r));
        data.y(r) = static_cast<double>(draw(gen));
    }
    return data;
}

static void BM_PoissonGLM_Fit(benchmark::State& state) {
    const GLMData data = make_data(state.range(0));
    PoissonGLM glm;

    for (auto _ : state) {
        auto fit = glm.fit(data.X, data.y);
        benchmark::DoNotOptimize(fit);
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_PoissonGLM_Fit)->Range(1 << 10, 1 << 16);

// All eleven shifts of one unit
static void BM_ShiftedGLM_Unit(benchmark::State& state) {
    const GLMData train = make_data(state.range(0));
    const GLMData test = make_data(state.range(0) / 4);
    ShiftedPoissonGLMFitter fitter;

    for (auto _ : state) {
        auto result = fitter.fit(train.X, train.y, test.X, test.y);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_ShiftedGLM_Unit)->Range(1 << 12, 1 << 16)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
