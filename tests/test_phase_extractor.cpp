#include <gtest/gtest.h>
#include <orotune/phase_extractor.hpp>
#include <cmath>
#include <random>

using namespace orotune;

class PhaseExtractorTest : public ::testing::Test {
protected:
    static constexpr double kRate = 1.0 / 0.0034;
    static constexpr Eigen::Index kFrames = 1471;

    Eigen::MatrixXd sinusoid_trials(double freq_hz, Eigen::Index n_trials, double phase0 = 0.0) {
        Eigen::MatrixXd traces(n_trials, kFrames);
        for (Eigen::Index r = 0; r < n_trials; ++r) {
            for (Eigen::Index c = 0; c < kFrames; ++c) {
                const double t = static_cast<double>(c) / kRate;
                traces(r, c) = std::sin(TWO_PI * freq_hz * t + phase0 + 0.3 * static_cast<double>(r));
            }
        }
        return traces;
    }

    /// Mean instantaneous frequency of one row, away from the edges
    static double instantaneous_frequency(const Eigen::MatrixXd& phase, Eigen::Index row,
                                          Eigen::Index margin) {
        double unwrapped_span = 0.0;
        for (Eigen::Index c = margin + 1; c < phase.cols() - margin; ++c) {
            double d = phase(row, c) - phase(row, c - 1);
            while (d > PI) d -= TWO_PI;
            while (d < -PI) d += TWO_PI;
            unwrapped_span += d;
        }
        const auto steps = static_cast<double>(phase.cols() - 2 * margin - 1);
        return unwrapped_span / steps / TWO_PI * kRate;
    }
};

TEST_F(PhaseExtractorTest, RecoversInjectedFrequency) {
    PhaseAmplitudeExtractor extractor(PhaseAmplitudeExtractor::Config::jaw(kRate));

    for (double freq : {4.0, 7.0, 11.0}) {
        const auto result = extractor.extract(sinusoid_trials(freq, 3));
        ASSERT_EQ(result.phase.rows(), 3);
        ASSERT_EQ(result.phase.cols(), kFrames);
        for (Eigen::Index r = 0; r < 3; ++r) {
            EXPECT_NEAR(instantaneous_frequency(result.phase, r, 150), freq, 0.25)
                << "at " << freq << " Hz, trial " << r;
        }
    }
}

TEST_F(PhaseExtractorTest, AmplitudeTracksEnvelope) {
    PhaseAmplitudeExtractor extractor(PhaseAmplitudeExtractor::Config::jaw(kRate));
    const Eigen::MatrixXd traces = 2.5 * sinusoid_trials(6.0, 1);

    const auto result = extractor.extract(traces);
    for (Eigen::Index c = 200; c < kFrames - 200; ++c) {
        EXPECT_NEAR(result.amplitude(0, c), 2.5, 0.15);
    }
}

TEST_F(PhaseExtractorTest, TrialsAreIndependent) {
    PhaseAmplitudeExtractor extractor(PhaseAmplitudeExtractor::Config::breathing(kRate));
    Eigen::MatrixXd traces = sinusoid_trials(4.0, 2);
    const auto before = extractor.extract(traces);

    // Corrupting the second trial must leave the first untouched
    traces.row(1).setConstant(100.0);
    const auto after = extractor.extract(traces);
    EXPECT_TRUE(before.phase.row(0).isApprox(after.phase.row(0)));
    EXPECT_TRUE(before.amplitude.row(0).isApprox(after.amplitude.row(0)));
}

TEST_F(PhaseExtractorTest, PhaseLagsSineByQuarterCycle) {
    PhaseAmplitudeExtractor extractor(PhaseAmplitudeExtractor::Config::jaw(kRate));
    const auto result = extractor.extract(sinusoid_trials(6.0, 1));

    // sin(ωt) = cos(ωt - π/2), so the analytic phase is ωt - π/2
    for (Eigen::Index c = 300; c < 1100; c += 97) {
        const double t = static_cast<double>(c) / kRate;
        const double expected = TWO_PI * 6.0 * t - PI / 2.0;
        double diff = result.phase(0, c) - expected;
        diff = std::remainder(diff, TWO_PI);
        EXPECT_NEAR(diff, 0.0, 0.1);
    }
}

TEST_F(PhaseExtractorTest, AnalyticSignalOfCosineIsExponential) {
    for (Eigen::Index n : {256, 255}) {
        Eigen::VectorXd x(n);
        for (Eigen::Index i = 0; i < n; ++i) {
            x(i) = std::cos(TWO_PI * 8.0 * static_cast<double>(i) / static_cast<double>(n));
        }
        const Eigen::VectorXcd z = PhaseAmplitudeExtractor::analytic_signal(x);
        ASSERT_EQ(z.size(), n);
        for (Eigen::Index i = 0; i < n; ++i) {
            const double arg = TWO_PI * 8.0 * static_cast<double>(i) / static_cast<double>(n);
            EXPECT_NEAR(z(i).real(), std::cos(arg), 1e-9);
            EXPECT_NEAR(z(i).imag(), std::sin(arg), 1e-9);
        }
    }
}

TEST_F(PhaseExtractorTest, AnalyticSignalKeepsDc) {
    const Eigen::VectorXd x = Eigen::VectorXd::Constant(64, 3.0);
    const Eigen::VectorXcd z = PhaseAmplitudeExtractor::analytic_signal(x);
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        EXPECT_NEAR(z(i).real(), 3.0, 1e-12);
        EXPECT_NEAR(z(i).imag(), 0.0, 1e-12);
    }
    EXPECT_EQ(PhaseAmplitudeExtractor::analytic_signal(Eigen::VectorXd{}).size(), 0);
}

TEST_F(PhaseExtractorTest, PositivePhaseRange) {
    Eigen::MatrixXd phase(1, 5);
    phase << -PI, -PI / 2.0, 0.0, PI / 2.0, PI;
    const Eigen::MatrixXd shifted = to_positive_phase(phase);

    EXPECT_NEAR(shifted(0, 0), 0.0, 1e-12);
    EXPECT_NEAR(shifted(0, 1), PI / 2.0, 1e-12);
    EXPECT_NEAR(shifted(0, 2), PI, 1e-12);
    EXPECT_NEAR(shifted(0, 3), 1.5 * PI, 1e-12);
    // 2π folds onto 0
    EXPECT_NEAR(shifted(0, 4), 0.0, 1e-12);
    EXPECT_TRUE((shifted.array() >= 0.0).all() && (shifted.array() < TWO_PI).all());
}

TEST_F(PhaseExtractorTest, RejectsBandAboveNyquist) {
    PhaseAmplitudeExtractor::Config config = PhaseAmplitudeExtractor::Config::whisker(40.0);
    EXPECT_THROW(PhaseAmplitudeExtractor{config}, std::invalid_argument);

    config = PhaseAmplitudeExtractor::Config::jaw();
    config.low_hz = 20.0;
    config.high_hz = 10.0;
    EXPECT_THROW(PhaseAmplitudeExtractor{config}, std::invalid_argument);
}

TEST_F(PhaseExtractorTest, BandpassRejectsOutOfBandNoise) {
    PhaseAmplitudeExtractor extractor(PhaseAmplitudeExtractor::Config::jaw(kRate));

    std::mt19937 gen(42);
    std::normal_distribution<double> noise(0.0, 1.0);
    Eigen::VectorXd trace(kFrames);
    for (Eigen::Index c = 0; c < kFrames; ++c) {
        const double t = static_cast<double>(c) / kRate;
        // 80 Hz component sits far above the 3-15 Hz band
        trace(c) = std::sin(TWO_PI * 6.0 * t) + std::sin(TWO_PI * 80.0 * t) + 0.05 * noise(gen);
    }

    const Eigen::VectorXd filtered = extractor.bandpass(trace);
    double residual = 0.0;
    for (Eigen::Index c = 200; c < kFrames - 200; ++c) {
        const double t = static_cast<double>(c) / kRate;
        residual = std::max(residual, std::abs(filtered(c) - std::sin(TWO_PI * 6.0 * t)));
    }
    EXPECT_LT(residual, 0.2);
}
