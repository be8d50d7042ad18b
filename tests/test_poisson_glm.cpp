#include <gtest/gtest.h>
#include <orotune/poisson_glm.hpp>
#include <cmath>
#include <random>

using namespace orotune;

class PoissonGLMTest : public ::testing::Test {
protected:
    void SetUp() override {
        true_weights_.resize(3);
        true_weights_ << 0.3, 0.8, -0.5;
    }

    Eigen::MatrixXd random_design(Eigen::Index rows) {
        std::normal_distribution<double> dist(0.0, 0.5);
        Eigen::MatrixXd X(rows, 2);
        for (Eigen::Index r = 0; r < rows; ++r) {
            X(r, 0) = dist(gen_);
            X(r, 1) = dist(gen_);
        }
        return X;
    }

    Eigen::VectorXd poisson_counts(const Eigen::MatrixXd& X) {
        const Eigen::VectorXd rate = PoissonGLM::predict(true_weights_, X);
        Eigen::VectorXd y(X.rows());
        for (Eigen::Index r = 0; r < X.rows(); ++r) {
            std::poisson_distribution<int> draw(rate(r));
            y(r) = static_cast<double>(draw(gen_));
        }
        return y;
    }

    std::mt19937 gen_{42};
    Eigen::VectorXd true_weights_;
};

// ============================================================================
// Helpers
// ============================================================================

TEST_F(PoissonGLMTest, CircularShiftRolls) {
    Eigen::VectorXd y(4);
    y << 1, 2, 3, 4;

    Eigen::VectorXd expected(4);
    expected << 4, 1, 2, 3;
    EXPECT_EQ(circular_shift(y, 1), expected);
    EXPECT_EQ(circular_shift(y, 5), expected);

    expected << 2, 3, 4, 1;
    EXPECT_EQ(circular_shift(y, -1), expected);
    EXPECT_EQ(circular_shift(y, 0), y);
    EXPECT_EQ(circular_shift(Eigen::VectorXd{}, 3).size(), 0);
}

TEST_F(PoissonGLMTest, PseudoR2) {
    Eigen::VectorXd y(4);
    y << 0, 1, 2, 3;
    EXPECT_DOUBLE_EQ(*pseudo_r2(y, y), 1.0);

    const Eigen::VectorXd mean = Eigen::VectorXd::Constant(4, 1.5);
    EXPECT_NEAR(*pseudo_r2(y, mean), 0.0, 1e-12);

    EXPECT_FALSE(pseudo_r2(Eigen::VectorXd::Ones(4), y).has_value());
    EXPECT_FALSE(pseudo_r2(y, Eigen::VectorXd::Ones(3)).has_value());
}

TEST_F(PoissonGLMTest, DevianceOfPerfectFitIsZero) {
    Eigen::VectorXd y(3);
    y << 0.0, 2.0, 5.0;
    Eigen::VectorXd mu = y;
    mu(0) = 1e-300;
    EXPECT_NEAR(PoissonGLM::deviance(y, mu), 0.0, 1e-12);
}

// ============================================================================
// Single Fit
// ============================================================================

TEST_F(PoissonGLMTest, RecoversWeights) {
    const Eigen::MatrixXd X = random_design(5000);
    const Eigen::VectorXd y = poisson_counts(X);

    PoissonGLM glm;
    const auto fit = glm.fit(X, y);
    ASSERT_TRUE(fit.has_value()) << to_string(fit.error());
    ASSERT_EQ(fit->weights.size(), 3);
    for (Eigen::Index i = 0; i < 3; ++i) {
        EXPECT_NEAR(fit->weights(i), true_weights_(i), 0.08) << "weight " << i;
    }
    EXPECT_GT(fit->iterations, 0u);
    EXPECT_LT(fit->iterations, 50u);
}

TEST_F(PoissonGLMTest, SingularDesignReported) {
    Eigen::MatrixXd X = random_design(500);
    X.col(1) = X.col(0);
    const Eigen::VectorXd y = poisson_counts(random_design(500));

    PoissonGLM glm;
    const auto fit = glm.fit(X, y);
    ASSERT_FALSE(fit.has_value());
    EXPECT_EQ(fit.error(), FitError::SingularDesign);

    // A ridge penalty makes the same design solvable
    PoissonGLM ridge(PoissonGLM::Config{100, 1e-8, 1.0});
    EXPECT_TRUE(ridge.fit(X, y).has_value());
}

TEST_F(PoissonGLMTest, RejectsInvalidInput) {
    EXPECT_THROW(PoissonGLM(PoissonGLM::Config{0, 1e-8, 0.0}), std::invalid_argument);
    EXPECT_THROW(PoissonGLM(PoissonGLM::Config{100, 1e-8, -1.0}), std::invalid_argument);

    PoissonGLM glm;
    EXPECT_THROW(glm.fit(random_design(10), Eigen::VectorXd::Ones(9)), std::invalid_argument);
    EXPECT_THROW(PoissonGLM::predict(Eigen::VectorXd::Zero(2), random_design(4)),
                 std::invalid_argument);
}

// ============================================================================
// Shifted Fits
// ============================================================================

TEST_F(PoissonGLMTest, BestShiftIsZeroForInstantaneousCoupling) {
    const Eigen::MatrixXd train_X = random_design(4000);
    const Eigen::VectorXd train_y = poisson_counts(train_X);
    const Eigen::MatrixXd test_X = random_design(1000);
    const Eigen::VectorXd test_y = poisson_counts(test_X);

    ShiftedPoissonGLMFitter::Config config;
    config.min_shift = -3;
    config.max_shift = 3;
    ShiftedPoissonGLMFitter fitter(config);

    const UnitGLMResult result = fitter.fit(train_X, train_y, test_X, test_y);
    ASSERT_EQ(result.shifts, (std::vector<int>{-3, -2, -1, 0, 1, 2, 3}));
    ASSERT_EQ(result.fits.size(), 7u);
    EXPECT_EQ(result.failures(), 0u);
    EXPECT_EQ(result.best_shift(), 0);

    const ShiftFit& at_zero = *result.fits[3];
    EXPECT_EQ(at_zero.shift, 0);
    ASSERT_TRUE(at_zero.heldout_r2.has_value());
    EXPECT_GT(*at_zero.heldout_r2, 0.05);
    EXPECT_EQ(at_zero.predicted.size(), test_X.rows());
    for (size_t i = 0; i < result.fits.size(); ++i) {
        if (i != 3) {
            EXPECT_LT(*result.fits[i]->heldout_r2, *at_zero.heldout_r2);
        }
    }
}

TEST_F(PoissonGLMTest, InSampleFitsPredictOnFitRows) {
    const Eigen::MatrixXd X = random_design(2000);
    const Eigen::VectorXd y = poisson_counts(X);

    ShiftedPoissonGLMFitter fitter;
    const UnitGLMResult result = fitter.fit_in_sample(X, y);
    ASSERT_EQ(result.fits.size(), 11u);
    EXPECT_EQ(result.best_shift(), 0);
    for (const auto& f : result.fits) {
        ASSERT_TRUE(f.has_value());
        EXPECT_FALSE(f->heldout_r2.has_value());
        EXPECT_EQ(f->predicted.size(), X.rows());
    }
}

TEST_F(PoissonGLMTest, ConstantResponseFailsWithoutAborting) {
    const Eigen::MatrixXd X = random_design(300);
    const Eigen::VectorXd silent = Eigen::VectorXd::Zero(300);

    ShiftedPoissonGLMFitter fitter;
    const UnitGLMResult result = fitter.fit(X, silent, X, silent);
    ASSERT_EQ(result.fits.size(), 11u);
    EXPECT_EQ(result.failures(), 11u);
    EXPECT_FALSE(result.best_shift().has_value());
    for (const auto& f : result.fits) {
        EXPECT_EQ(f.error(), FitError::DegenerateResponse);
    }

    // Failed shifts are stored as zeros
    const GLMRecord record = result.to_record();
    EXPECT_EQ(record.weights.rows(), 11);
    EXPECT_EQ(record.weights.cols(), 3);
    EXPECT_EQ(record.predicted.cols(), 300);
    EXPECT_TRUE(record.weights.isZero());
    EXPECT_TRUE(record.r2.isZero());

    // The same fitter still works for the next unit
    const Eigen::VectorXd y = poisson_counts(X);
    EXPECT_EQ(fitter.fit(X, y, X, y).failures(), 0u);
}

TEST_F(PoissonGLMTest, EmptyPartitionReported) {
    ShiftedPoissonGLMFitter fitter;
    const UnitGLMResult result = fitter.fit_in_sample(Eigen::MatrixXd(0, 2), Eigen::VectorXd{});
    for (const auto& f : result.fits) {
        ASSERT_FALSE(f.has_value());
        EXPECT_EQ(f.error(), FitError::EmptyPartition);
    }
}

TEST_F(PoissonGLMTest, RecordMatchesSuccessfulFits) {
    const Eigen::MatrixXd X = random_design(1500);
    const Eigen::VectorXd y = poisson_counts(X);
    ShiftedPoissonGLMFitter fitter;

    const UnitGLMResult result = fitter.fit(X, y, X, y);
    const GLMRecord record = result.to_record();
    ASSERT_EQ(record.shifts, result.shifts);
    EXPECT_EQ(record.response, y);
    for (size_t i = 0; i < result.fits.size(); ++i) {
        const auto row = static_cast<Eigen::Index>(i);
        EXPECT_DOUBLE_EQ(record.r2(row), result.fits[i]->pseudo_r2);
        EXPECT_DOUBLE_EQ(record.heldout_r2(row), *result.fits[i]->heldout_r2);
        EXPECT_TRUE(record.weights.row(row).transpose().isApprox(result.fits[i]->weights));
    }
}

TEST_F(PoissonGLMTest, RejectsInvalidShiftWindow) {
    ShiftedPoissonGLMFitter::Config config;
    config.min_shift = 2;
    config.max_shift = 1;
    EXPECT_THROW(ShiftedPoissonGLMFitter{config}, std::invalid_argument);

    ShiftedPoissonGLMFitter fitter;
    EXPECT_THROW(fitter.fit(random_design(10), Eigen::VectorXd::Ones(10),
                            random_design(5), Eigen::VectorXd::Ones(4)),
                 std::invalid_argument);
}
