#pragma once

#include "types.hpp"
#include <expected>
#include <optional>
#include <string_view>

namespace orotune {

/**
 * @brief Why a single Poisson fit produced no estimate
 */
enum class FitError {
    SingularDesign,       // Weighted normal equations not invertible
    NotConverged,         // Iteration limit reached
    NonFiniteEstimate,    // Weights or rates overflowed
    DegenerateResponse,   // Constant response, pseudo-R² undefined
    EmptyPartition        // No rows to fit
};

std::string_view to_string(FitError error);

/// Roll y by tau bins: out[i] = y[(i - tau) mod n]
Eigen::VectorXd circular_shift(const Eigen::VectorXd& y, int tau);

/// 1 - SSE/SST; nullopt when the response is constant
std::optional<double> pseudo_r2(const Eigen::VectorXd& y, const Eigen::VectorXd& predicted);

/**
 * @brief Poisson regression with log link, fitted by IRLS
 *
 * Model: E[y] = exp(b0 + X*b). An intercept column is always added. The
 * optional ridge penalty shrinks the predictor weights, never the intercept.
 */
class PoissonGLM {
public:
    struct Config {
        size_t max_iterations = 100;
        double tolerance = 1e-8;      // On the change of deviance
        double ridge = 0.0;
    };

    struct Fit {
        Eigen::VectorXd weights;      // Intercept first
        Eigen::VectorXd fitted;       // exp(X1 * weights)
        double deviance = 0.0;
        size_t iterations = 0;
    };

    explicit PoissonGLM(const Config& config);
    PoissonGLM();

    /**
     * @brief Fit the model
     * @param X Predictors [n_bins x n_predictors], no intercept column
     * @param y Counts [n_bins]
     */
    std::expected<Fit, FitError> fit(const Eigen::MatrixXd& X, const Eigen::VectorXd& y) const;

    /// Predicted rates for new rows
    static Eigen::VectorXd predict(const Eigen::VectorXd& weights, const Eigen::MatrixXd& X);

    /// Poisson deviance 2 Σ [y log(y/μ) - (y - μ)]
    static double deviance(const Eigen::VectorXd& y, const Eigen::VectorXd& mu);

    const Config& config() const { return config_; }

private:
    Config config_;
};

/**
 * @brief Fit of one unit at one temporal shift
 */
struct ShiftFit {
    int shift = 0;
    Eigen::VectorXd weights;                 // Intercept first
    double pseudo_r2 = 0.0;                  // In-sample
    std::optional<double> heldout_r2;        // Absent without a test partition
    Eigen::VectorXd predicted;               // Test rows, or fit rows in-sample
    size_t iterations = 0;
};

/**
 * @brief Storage form of a unit's shifted fits, failed shifts zero-filled
 */
struct GLMRecord {
    std::vector<int> shifts;
    Eigen::VectorXd r2;
    Eigen::VectorXd heldout_r2;
    Eigen::MatrixXd weights;                 // [n_shifts x (n_predictors + 1)]
    Eigen::MatrixXd predicted;               // [n_shifts x n_rows]
    Eigen::VectorXd response;                // Unshifted counts the predictions refer to
};

/**
 * @brief All shifts of one unit, each an explicit success or failure
 */
struct UnitGLMResult {
    std::vector<int> shifts;
    std::vector<std::expected<ShiftFit, FitError>> fits;
    Eigen::VectorXd response;
    size_t n_predictors = 0;

    size_t failures() const;

    /// Shift with the highest in-sample pseudo-R² among successful fits
    std::optional<int> best_shift() const;

    GLMRecord to_record() const;
};

/**
 * @brief Poisson GLMs across a symmetric window of spike/behavior lags
 *
 * For every τ in [min_shift, max_shift] the spike counts are rolled by τ
 * bins and regressed on the unshifted design. A failure at one τ leaves the
 * other shifts untouched.
 */
class ShiftedPoissonGLMFitter {
public:
    struct Config {
        int min_shift = -5;
        int max_shift = 5;
        PoissonGLM::Config glm;
    };

    explicit ShiftedPoissonGLMFitter(const Config& config);
    ShiftedPoissonGLMFitter();

    /**
     * @brief Fit on the train partition, evaluate on the test partition
     *
     * Predictions and held-out pseudo-R² refer to the test counts rolled by
     * the same τ.
     */
    UnitGLMResult fit(const Eigen::MatrixXd& train_X, const Eigen::VectorXd& train_y,
                      const Eigen::MatrixXd& test_X, const Eigen::VectorXd& test_y) const;

    /// Fit and predict on the same rows
    UnitGLMResult fit_in_sample(const Eigen::MatrixXd& X, const Eigen::VectorXd& y) const;

    std::vector<int> shifts() const;

    const Config& config() const { return config_; }

private:
    Config config_;
    PoissonGLM glm_;

    std::expected<ShiftFit, FitError> fit_shift(int tau,
                                                const Eigen::MatrixXd& train_X,
                                                const Eigen::VectorXd& train_y,
                                                const Eigen::MatrixXd* test_X,
                                                const Eigen::VectorXd* test_y) const;
};

}  // namespace orotune
