#include <gtest/gtest.h>
#include <orotune/trace_aligner.hpp>
#include <cmath>
#include <limits>
#include <random>
#include <vector>

using namespace orotune;

class TraceAlignerTest : public ::testing::Test {
protected:
    static Eigen::VectorXd vec(std::initializer_list<double> values) {
        Eigen::VectorXd v(static_cast<Eigen::Index>(values.size()));
        Eigen::Index i = 0;
        for (double x : values) v(i++) = x;
        return v;
    }

    static void expect_vector_near(const Eigen::VectorXd& actual, const Eigen::VectorXd& expected,
                                   double tol = 1e-12) {
        ASSERT_EQ(actual.size(), expected.size());
        for (Eigen::Index i = 0; i < actual.size(); ++i) {
            EXPECT_NEAR(actual(i), expected(i), tol) << "at index " << i;
        }
    }
};

// ============================================================================
// Smoothing
// ============================================================================

TEST_F(TraceAlignerTest, MovingAverageCentersOddWindow) {
    const Eigen::VectorXd out = dsp::moving_average(vec({1, 2, 3, 4, 5}), 3);
    // Zero padding at both ends, always divided by the full window
    expect_vector_near(out, vec({1, 2, 3, 4, 3}));
}

TEST_F(TraceAlignerTest, MovingAverageEvenWindowLeansLeft) {
    const Eigen::VectorXd out = dsp::moving_average(Eigen::VectorXd::Constant(5, 4.0), 4);
    expect_vector_near(out, vec({2, 3, 4, 4, 3}));
}

TEST_F(TraceAlignerTest, MovingAverageRejectsZeroWindow) {
    EXPECT_THROW(dsp::moving_average(vec({1, 2}), 0), std::invalid_argument);
}

TEST_F(TraceAlignerTest, MedianFilterRejectsOutliers) {
    const Eigen::VectorXd out = dsp::median_filter(vec({1, 100, 3, 4, 5}), 3);
    expect_vector_near(out, vec({1, 3, 4, 4, 4}));
}

TEST_F(TraceAlignerTest, DecimateKeepsEveryStrideSample) {
    Eigen::VectorXd x(10);
    for (Eigen::Index i = 0; i < 10; ++i) x(i) = static_cast<double>(i);

    expect_vector_near(dsp::decimate(x, 3), vec({3, 6, 9}));
    expect_vector_near(dsp::decimate(x.head(9), 3), vec({3, 6}));
    EXPECT_EQ(dsp::decimated_length(3, 3), 0u);
    EXPECT_EQ(dsp::decimated_length(10, 0), 0u);
    EXPECT_EQ(dsp::decimated_length(2942, 5), 588u);
}

TEST_F(TraceAlignerTest, ConcatenateRowsIsRowMajor) {
    Eigen::MatrixXd trials(2, 3);
    trials << 1, 2, 3,
              4, 5, 6;
    expect_vector_near(dsp::concatenate_rows(trials), vec({1, 2, 3, 4, 5, 6}));
}

// ============================================================================
// Normalization
// ============================================================================

TEST_F(TraceAlignerTest, ZScoreUsesPopulationStd) {
    const double s = std::sqrt(1.5);
    expect_vector_near(dsp::zscore(vec({1, 2, 3})), vec({-s, 0.0, s}));
}

TEST_F(TraceAlignerTest, ZScoreOfConstantIsZero) {
    const Eigen::VectorXd out = dsp::zscore(Eigen::VectorXd(Eigen::VectorXd::Constant(8, 3.0)));
    EXPECT_TRUE(out.isZero());
    EXPECT_TRUE(out.allFinite());

    const Eigen::MatrixXd m = dsp::zscore(Eigen::MatrixXd(Eigen::MatrixXd::Constant(2, 4, -1.0)));
    EXPECT_TRUE(m.isZero());
}

TEST_F(TraceAlignerTest, MaskedZScoreIgnoresUnmaskedSamples) {
    const Eigen::VectorXd out = dsp::masked_zscore(vec({1, 100, 3}), vec({1, 0, 1}));
    expect_vector_near(out, vec({-1, 98, 1}));
    EXPECT_THROW(dsp::masked_zscore(vec({1, 2}), vec({1})), std::invalid_argument);
}

TEST_F(TraceAlignerTest, NonzeroZScore) {
    expect_vector_near(dsp::nonzero_zscore(vec({0, 2, 4})), vec({-3, -1, 1}));
    EXPECT_TRUE(dsp::nonzero_zscore(Eigen::VectorXd::Zero(4)).isZero());
}

TEST_F(TraceAlignerTest, ConfidenceMaskNeedsBothViews) {
    const Eigen::VectorXd mask = dsp::confidence_mask(vec({0.99, 0.99, 0.5, 0.96}),
                                                      vec({0.99, 0.2, 0.99, 0.97}), 0.95);
    expect_vector_near(mask, vec({1, 0, 0, 1}));
}

// ============================================================================
// Resampling
// ============================================================================

TEST_F(TraceAlignerTest, ResampleFourierPreservesBandLimitedSignal) {
    auto cosine = [](Eigen::Index n) {
        Eigen::VectorXd x(n);
        for (Eigen::Index i = 0; i < n; ++i) {
            x(i) = std::cos(TWO_PI * 3.0 * static_cast<double>(i) / static_cast<double>(n));
        }
        return x;
    };

    expect_vector_near(dsp::resample_fourier(cosine(100), 50), cosine(50), 1e-9);
    expect_vector_near(dsp::resample_fourier(cosine(50), 100), cosine(100), 1e-9);
    expect_vector_near(dsp::resample_fourier(cosine(64), 64), cosine(64));
}

TEST_F(TraceAlignerTest, ResampleFourierKeepsMean) {
    const Eigen::VectorXd x = Eigen::VectorXd::Constant(37, 2.5);
    const Eigen::VectorXd y = dsp::resample_fourier(x, 91);
    ASSERT_EQ(y.size(), 91);
    EXPECT_NEAR(y.mean(), 2.5, 1e-9);
    EXPECT_EQ(dsp::resample_fourier(Eigen::VectorXd{}, 5).size(), 5);
}

// ============================================================================
// Sign Correction
// ============================================================================

TEST_F(TraceAlignerTest, MedianOfFiniteSamples) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const std::vector<double> odd{3.0, 1.0, 2.0, nan};
    const std::vector<double> even{4.0, 1.0, 3.0, 2.0};
    EXPECT_DOUBLE_EQ(dsp::median(odd), 2.0);
    EXPECT_DOUBLE_EQ(dsp::median(even), 2.5);
    EXPECT_DOUBLE_EQ(dsp::median(std::vector<double>{}), 0.0);
}

TEST_F(TraceAlignerTest, CorrectSignFlipsDownwardExcursions) {
    Eigen::VectorXd down = vec({1, 1, 1, 1, -10});
    EXPECT_TRUE(dsp::correct_sign(down));
    expect_vector_near(down, vec({-1, -1, -1, -1, 10}));

    // Already upward: untouched
    Eigen::VectorXd up = vec({-1, -1, -1, -1, 10});
    EXPECT_FALSE(dsp::correct_sign(up));
    expect_vector_near(up, vec({-1, -1, -1, -1, 10}));
}

// ============================================================================
// Trace Aligner
// ============================================================================

TEST_F(TraceAlignerTest, WindowFromSampleInterval) {
    TraceAligner aligner;
    EXPECT_EQ(aligner.window_for(0.0034), 5u);
    EXPECT_EQ(aligner.window_for(0.001), 17u);
    EXPECT_EQ(aligner.window_for(0.1), 1u);
    EXPECT_THROW(aligner.window_for(0.0), std::invalid_argument);
    EXPECT_THROW(TraceAligner(TraceAligner::Config{0.0}), std::invalid_argument);
}

TEST_F(TraceAlignerTest, AlignConstantTrace) {
    TraceAligner aligner;
    const Eigen::VectorXd x = Eigen::VectorXd::Constant(2942, 2.0);
    const Eigen::VectorXd aligned = aligner.align(x, 0.0034);

    ASSERT_EQ(static_cast<size_t>(aligned.size()), aligner.aligned_length(2942, 0.0034));
    // Only the final bin reaches into the zero padding
    for (Eigen::Index i = 0; i + 1 < aligned.size(); ++i) {
        EXPECT_NEAR(aligned(i), 2.0, 1e-12);
    }
}

TEST_F(TraceAlignerTest, AlignTrialsMatchesConcatenation) {
    std::mt19937 gen(42);
    std::normal_distribution<double> noise(0.0, 1.0);
    Eigen::MatrixXd trials(3, 200);
    for (Eigen::Index r = 0; r < trials.rows(); ++r) {
        for (Eigen::Index c = 0; c < trials.cols(); ++c) trials(r, c) = noise(gen);
    }

    TraceAligner aligner;
    expect_vector_near(aligner.align_trials(trials, 0.0034),
                       aligner.align(dsp::concatenate_rows(trials), 0.0034));
}

TEST_F(TraceAlignerTest, MedianSmoothingSuppressesTrackingGlitch) {
    TraceAligner::Config config;
    config.smoothing = TraceAligner::Smoothing::Median;
    TraceAligner aligner(config);

    Eigen::VectorXd x = Eigen::VectorXd::Ones(1000);
    x(10) = 50.0;
    const Eigen::VectorXd aligned = aligner.align(x, 0.0034);
    ASSERT_EQ(aligned.size(), 199);
    EXPECT_TRUE(aligned.isOnes());
}

TEST_F(TraceAlignerTest, AlignedMaskIsBinaryAndStrict) {
    TraceAligner aligner;
    Eigen::VectorXd mask = Eigen::VectorXd::Ones(1000);
    mask(12) = 0.0;

    const Eigen::VectorXd aligned = aligner.align_mask(mask, 0.0034);
    ASSERT_EQ(aligned.size(), 199);
    // Bin k covers native samples 5k+3 .. 5k+7
    EXPECT_EQ(aligned(0), 1.0);
    EXPECT_EQ(aligned(1), 0.0);
    EXPECT_EQ(aligned(2), 1.0);
    for (Eigen::Index i = 0; i < aligned.size(); ++i) {
        EXPECT_TRUE(aligned(i) == 0.0 || aligned(i) == 1.0);
    }
}

TEST_F(TraceAlignerTest, MedianMaskKeepsMajorityValidBins) {
    TraceAligner::Config config;
    config.smoothing = TraceAligner::Smoothing::Median;
    TraceAligner aligner(config);

    // Bin 1 is read from native sample 10, filtered over samples 8 .. 12
    Eigen::VectorXd mask = Eigen::VectorXd::Ones(1000);
    mask(12) = 0.0;
    Eigen::VectorXd aligned = aligner.align_mask(mask, 0.0034);
    ASSERT_EQ(aligned.size(), 199);
    EXPECT_TRUE(aligned.isOnes());

    mask.segment(9, 3).setZero();
    aligned = aligner.align_mask(mask, 0.0034);
    EXPECT_EQ(aligned(0), 1.0);
    EXPECT_EQ(aligned(1), 0.0);
    EXPECT_EQ(aligned(2), 1.0);
}
