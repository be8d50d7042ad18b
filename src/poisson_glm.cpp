#include "orotune/poisson_glm.hpp"
#include "orotune/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace orotune {

std::string_view to_string(FitError error) {
    switch (error) {
        case FitError::SingularDesign:     return "singular design";
        case FitError::NotConverged:       return "not converged";
        case FitError::NonFiniteEstimate:  return "non-finite estimate";
        case FitError::DegenerateResponse: return "degenerate response";
        case FitError::EmptyPartition:     return "empty partition";
    }
    return "unknown";
}

Eigen::VectorXd circular_shift(const Eigen::VectorXd& y, int tau) {
    const Eigen::Index n = y.size();
    if (n == 0) {
        return y;
    }
    Eigen::VectorXd out(n);
    const Eigen::Index k = ((static_cast<Eigen::Index>(tau) % n) + n) % n;
    for (Eigen::Index i = 0; i < n; ++i) {
        out((i + k) % n) = y(i);
    }
    return out;
}

std::optional<double> pseudo_r2(const Eigen::VectorXd& y, const Eigen::VectorXd& predicted) {
    if (y.size() == 0 || y.size() != predicted.size()) {
        return std::nullopt;
    }
    const double sst = (y.array() - y.mean()).square().sum();
    if (!(sst > 0.0)) {
        return std::nullopt;
    }
    const double sse = (y - predicted).squaredNorm();
    return 1.0 - sse / sst;
}

// ============================================================================
// Poisson GLM (IRLS)
// ============================================================================

PoissonGLM::PoissonGLM(const Config& config)
    : config_(config) {
    if (config_.max_iterations == 0 || config_.tolerance <= 0.0 || config_.ridge < 0.0) {
        throw std::invalid_argument("Invalid Poisson GLM configuration");
    }
}

PoissonGLM::PoissonGLM() : PoissonGLM(Config{}) {}

double PoissonGLM::deviance(const Eigen::VectorXd& y, const Eigen::VectorXd& mu) {
    double dev = 0.0;
    for (Eigen::Index i = 0; i < y.size(); ++i) {
        if (y(i) > 0.0) {
            dev += y(i) * std::log(y(i) / mu(i));
        }
        dev -= y(i) - mu(i);
    }
    return 2.0 * dev;
}

Eigen::VectorXd PoissonGLM::predict(const Eigen::VectorXd& weights, const Eigen::MatrixXd& X) {
    if (weights.size() != X.cols() + 1) {
        throw std::invalid_argument("predict: weight count does not match predictors");
    }
    const Eigen::VectorXd eta = (X * weights.tail(X.cols())).array() + weights(0);
    return eta.array().exp();
}

std::expected<PoissonGLM::Fit, FitError> PoissonGLM::fit(const Eigen::MatrixXd& X,
                                                        const Eigen::VectorXd& y) const {
    if (X.rows() != y.size()) {
        throw std::invalid_argument("PoissonGLM::fit: row count differs from response length");
    }
    const Eigen::Index n = X.rows();
    const Eigen::Index p = X.cols() + 1;
    if (n == 0) {
        return std::unexpected(FitError::EmptyPartition);
    }

    Eigen::MatrixXd X1(n, p);
    X1.col(0).setOnes();
    X1.rightCols(p - 1) = X;

    Eigen::MatrixXd penalty = Eigen::MatrixXd::Identity(p, p) * config_.ridge;
    penalty(0, 0) = 0.0;

    // Start between the data and its mean so log(mu) exists for zero counts
    Eigen::VectorXd mu = (y.array() + y.mean()) / 2.0;
    if ((mu.array() <= 0.0).any()) {
        return std::unexpected(FitError::DegenerateResponse);
    }
    Eigen::VectorXd eta = mu.array().log();
    Eigen::VectorXd beta = Eigen::VectorXd::Zero(p);
    double dev = deviance(y, mu);

    for (size_t iter = 1; iter <= config_.max_iterations; ++iter) {
        const Eigen::VectorXd z = eta.array() + (y - mu).array() / mu.array();
        const Eigen::MatrixXd XtW = X1.transpose() * mu.asDiagonal();
        const Eigen::MatrixXd A = XtW * X1 + penalty;
        const Eigen::VectorXd b = XtW * z;

        Eigen::LDLT<Eigen::MatrixXd> ldlt(A);
        if (ldlt.info() != Eigen::Success) {
            return std::unexpected(FitError::SingularDesign);
        }
        const Eigen::VectorXd d = ldlt.vectorD().cwiseAbs();
        if (d.minCoeff() <= 1e-12 * d.maxCoeff()) {
            return std::unexpected(FitError::SingularDesign);
        }

        beta = ldlt.solve(b);
        eta = X1 * beta;
        if (!beta.allFinite() || !eta.allFinite()) {
            return std::unexpected(FitError::NonFiniteEstimate);
        }
        mu = eta.array().exp();
        if (!mu.allFinite() || (mu.array() <= 0.0).any()) {
            return std::unexpected(FitError::NonFiniteEstimate);
        }

        const double dev_new = deviance(y, mu);
        if (!std::isfinite(dev_new)) {
            return std::unexpected(FitError::NonFiniteEstimate);
        }
        if (std::abs(dev_new - dev) <= config_.tolerance * (1.0 + std::abs(dev_new))) {
            return Fit{beta, mu, dev_new, iter};
        }
        dev = dev_new;
    }
    return std::unexpected(FitError::NotConverged);
}

// ============================================================================
// Unit Result
// ============================================================================

size_t UnitGLMResult::failures() const {
    return static_cast<size_t>(std::count_if(fits.begin(), fits.end(),
                                             [](const auto& f) { return !f.has_value(); }));
}

std::optional<int> UnitGLMResult::best_shift() const {
    std::optional<int> best;
    double best_r2 = -std::numeric_limits<double>::infinity();
    for (const auto& f : fits) {
        if (f && f->pseudo_r2 > best_r2) {
            best_r2 = f->pseudo_r2;
            best = f->shift;
        }
    }
    return best;
}

GLMRecord UnitGLMResult::to_record() const {
    GLMRecord record;
    const auto n_shifts = static_cast<Eigen::Index>(shifts.size());
    record.shifts = shifts;
    record.r2 = Eigen::VectorXd::Zero(n_shifts);
    record.heldout_r2 = Eigen::VectorXd::Zero(n_shifts);
    record.weights = Eigen::MatrixXd::Zero(n_shifts, static_cast<Eigen::Index>(n_predictors + 1));
    record.predicted = Eigen::MatrixXd::Zero(n_shifts, response.size());
    record.response = response;

    for (Eigen::Index i = 0; i < n_shifts; ++i) {
        const auto& f = fits[static_cast<size_t>(i)];
        if (!f) {
            continue;
        }
        record.r2(i) = f->pseudo_r2;
        record.heldout_r2(i) = f->heldout_r2.value_or(0.0);
        record.weights.row(i) = f->weights.transpose();
        record.predicted.row(i) = f->predicted.transpose();
    }
    return record;
}

// ============================================================================
// Shifted Fitter
// ============================================================================

ShiftedPoissonGLMFitter::ShiftedPoissonGLMFitter(const Config& config)
    : config_(config)
    , glm_(config.glm) {
    if (config_.min_shift > config_.max_shift) {
        throw std::invalid_argument("Shift window must satisfy min_shift <= max_shift");
    }
}

ShiftedPoissonGLMFitter::ShiftedPoissonGLMFitter()
    : ShiftedPoissonGLMFitter(Config{}) {}

std::vector<int> ShiftedPoissonGLMFitter::shifts() const {
    std::vector<int> taus;
    for (int tau = config_.min_shift; tau <= config_.max_shift; ++tau) {
        taus.push_back(tau);
    }
    return taus;
}

std::expected<ShiftFit, FitError> ShiftedPoissonGLMFitter::fit_shift(
    int tau,
    const Eigen::MatrixXd& train_X,
    const Eigen::VectorXd& train_y,
    const Eigen::MatrixXd* test_X,
    const Eigen::VectorXd* test_y) const {

    if (train_y.size() == 0) {
        return std::unexpected(FitError::EmptyPartition);
    }
    const Eigen::VectorXd y = circular_shift(train_y, tau);
    const double sst = (y.array() - y.mean()).square().sum();
    if (!(sst > 0.0)) {
        return std::unexpected(FitError::DegenerateResponse);
    }

    auto fit = glm_.fit(train_X, y);
    if (!fit) {
        return std::unexpected(fit.error());
    }

    ShiftFit result;
    result.shift = tau;
    result.weights = fit->weights;
    result.iterations = fit->iterations;
    result.pseudo_r2 = 1.0 - (y - fit->fitted).squaredNorm() / sst;

    if (test_X != nullptr && test_y != nullptr) {
        if (test_X->rows() == 0) {
            return std::unexpected(FitError::EmptyPartition);
        }
        const Eigen::VectorXd yt = circular_shift(*test_y, tau);
        result.predicted = PoissonGLM::predict(fit->weights, *test_X);
        if (!result.predicted.allFinite()) {
            return std::unexpected(FitError::NonFiniteEstimate);
        }
        const auto r2 = pseudo_r2(yt, result.predicted);
        if (!r2) {
            OROTUNE_LOG_DEBUG("Held-out counts are constant at shift " << tau
                              << ", held-out pseudo-R2 set to 0");
        }
        result.heldout_r2 = r2.value_or(0.0);
    } else {
        result.predicted = fit->fitted;
    }
    return result;
}

UnitGLMResult ShiftedPoissonGLMFitter::fit(const Eigen::MatrixXd& train_X,
                                           const Eigen::VectorXd& train_y,
                                           const Eigen::MatrixXd& test_X,
                                           const Eigen::VectorXd& test_y) const {
    if (train_X.rows() != train_y.size() || test_X.rows() != test_y.size() ||
        train_X.cols() != test_X.cols()) {
        throw std::invalid_argument("Design and response shapes disagree");
    }

    UnitGLMResult result;
    result.shifts = shifts();
    result.response = test_y;
    result.n_predictors = static_cast<size_t>(train_X.cols());
    for (int tau : result.shifts) {
        result.fits.push_back(fit_shift(tau, train_X, train_y, &test_X, &test_y));
        if (!result.fits.back()) {
            OROTUNE_LOG_DEBUG("GLM fit failed at shift " << tau << ": "
                              << to_string(result.fits.back().error()));
        }
    }
    return result;
}

UnitGLMResult ShiftedPoissonGLMFitter::fit_in_sample(const Eigen::MatrixXd& X,
                                                     const Eigen::VectorXd& y) const {
    if (X.rows() != y.size()) {
        throw std::invalid_argument("Design and response shapes disagree");
    }

    UnitGLMResult result;
    result.shifts = shifts();
    result.response = y;
    result.n_predictors = static_cast<size_t>(X.cols());
    for (int tau : result.shifts) {
        result.fits.push_back(fit_shift(tau, X, y, nullptr, nullptr));
        if (!result.fits.back()) {
            OROTUNE_LOG_DEBUG("GLM fit failed at shift " << tau << ": "
                              << to_string(result.fits.back().error()));
        }
    }
    return result;
}

}  // namespace orotune
