#include "orotune/circular_tuning.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace orotune {

CircularTuningEstimator::CircularTuningEstimator(const Config& config)
    : config_(config) {
    if (config_.n_bins < 3) {
        throw std::invalid_argument("Circular tuning needs at least 3 phase bins");
    }
}

CircularTuningEstimator::CircularTuningEstimator()
    : CircularTuningEstimator(Config{}) {}

// ============================================================================
// Histograms
// ============================================================================

std::vector<size_t> CircularTuningEstimator::phase_histogram(
    std::span<const double> phases) const {
    std::vector<size_t> counts(config_.n_bins, 0);
    const double width = TWO_PI / static_cast<double>(config_.n_bins);

    for (double p : phases) {
        if (!std::isfinite(p)) {
            continue;
        }
        auto bin = static_cast<size_t>(wrap_phase(p) / width);
        if (bin >= config_.n_bins) {
            bin = config_.n_bins - 1;
        }
        ++counts[bin];
    }
    return counts;
}

std::vector<double> CircularTuningEstimator::bin_centers() const {
    std::vector<double> centers(config_.n_bins);
    const double width = TWO_PI / static_cast<double>(config_.n_bins);
    for (size_t i = 0; i < config_.n_bins; ++i) {
        centers[i] = (static_cast<double>(i) + 0.5) * width;
    }
    return centers;
}

// ============================================================================
// Tuning Curve
// ============================================================================

TuningCurve CircularTuningEstimator::estimate(std::span<const double> spike_phases,
                                              std::span<const double> occupancy_phases,
                                              double sample_rate_hz) const {
    return estimate(spike_phases, phase_histogram(occupancy_phases), sample_rate_hz);
}

TuningCurve CircularTuningEstimator::estimate(std::span<const double> spike_phases,
                                              const std::vector<size_t>& occupancy,
                                              double sample_rate_hz) const {
    if (occupancy.size() != config_.n_bins) {
        throw std::invalid_argument("Occupancy histogram has the wrong bin count");
    }

    const std::vector<size_t> spikes = phase_histogram(spike_phases);

    TuningCurve curve;
    curve.bin_centers = bin_centers();
    curve.rates.resize(config_.n_bins);
    for (size_t i = 0; i < config_.n_bins; ++i) {
        curve.rates[i] = occupancy[i] > 0
            ? static_cast<double>(spikes[i]) / static_cast<double>(occupancy[i]) * sample_rate_hz
            : std::numeric_limits<double>::quiet_NaN();
    }

    const CosineFit fit = fit_cosine(curve.bin_centers, curve.rates);
    curve.preferred_phase = fit.preferred_phase;
    curve.modulation_index = fit.modulation_index;
    return curve;
}

// ============================================================================
// Cosine Fit
// ============================================================================

CircularTuningEstimator::CosineFit CircularTuningEstimator::fit_cosine(
    std::span<const double> x, std::span<const double> y) {
    CosineFit fit;
    if (x.size() != y.size()) {
        throw std::invalid_argument("fit_cosine: x and y differ in length");
    }

    std::vector<Eigen::Index> usable;
    for (size_t i = 0; i < x.size(); ++i) {
        if (std::isfinite(x[i]) && std::isfinite(y[i])) {
            usable.push_back(static_cast<Eigen::Index>(i));
        }
    }
    if (usable.size() < 3) {
        return fit;
    }

    const auto n = static_cast<Eigen::Index>(usable.size());
    Eigen::MatrixXd design(n, 3);
    Eigen::VectorXd target(n);
    for (Eigen::Index k = 0; k < n; ++k) {
        const auto i = static_cast<size_t>(usable[static_cast<size_t>(k)]);
        design(k, 0) = 1.0;
        design(k, 1) = std::cos(x[i]);
        design(k, 2) = std::sin(x[i]);
        target(k) = y[i];
    }

    const double mean = target.mean();
    if ((target.array() - mean).abs().maxCoeff() <= 1e-12 * std::max(1.0, std::abs(mean))) {
        return fit;
    }

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(design);
    if (qr.rank() < 3) {
        return fit;
    }
    const Eigen::Vector3d coef = qr.solve(target);

    const double a = coef(0);
    const double b = std::hypot(coef(1), coef(2));
    if (!(a > 0.0) || !std::isfinite(b)) {
        return fit;
    }

    fit.baseline = a;
    fit.amplitude = b;
    fit.preferred_phase = wrap_phase(std::atan2(coef(2), coef(1)));
    fit.modulation_index = b / a;
    fit.degenerate = false;
    return fit;
}

}  // namespace orotune
