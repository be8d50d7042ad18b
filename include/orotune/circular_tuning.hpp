#pragma once

#include "types.hpp"
#include <span>

namespace orotune {

/**
 * @brief Phase tuning curve and cosine fit for one unit
 *
 * Spike phases and behavioral phase occupancy are histogrammed into the same
 * equal-width bins over [0, 2π). The rate in each bin is
 * `spike_count / occupancy * sample_rate`, and a cosine
 * `a + b*cos(x - φ)` is fitted by least squares. The modulation index is b/a.
 */
class CircularTuningEstimator {
public:
    struct Config {
        size_t n_bins = 20;
    };

    /// Result of the three-parameter cosine fit
    struct CosineFit {
        double baseline = 0.0;           // a
        double amplitude = 0.0;          // b
        double preferred_phase = 0.0;    // φ in [0, 2π)
        double modulation_index = 0.0;   // b / a
        bool degenerate = true;          // Fit rejected, φ and MI reported as 0
    };

    explicit CircularTuningEstimator(const Config& config);
    CircularTuningEstimator();

    /// Counts of phases per bin; phases outside [0, 2π) are wrapped
    std::vector<size_t> phase_histogram(std::span<const double> phases) const;

    /// Centers of the phase bins
    std::vector<double> bin_centers() const;

    /**
     * @brief Build the tuning curve of one unit
     * @param spike_phases Behavioral phase at each spike
     * @param occupancy_phases Behavioral phase at every sample
     * @param sample_rate_hz Sampling rate of the behavioral trace
     */
    TuningCurve estimate(std::span<const double> spike_phases,
                         std::span<const double> occupancy_phases,
                         double sample_rate_hz) const;

    /// Same as above with a precomputed occupancy histogram
    TuningCurve estimate(std::span<const double> spike_phases,
                         const std::vector<size_t>& occupancy,
                         double sample_rate_hz) const;

    /**
     * @brief Least-squares fit of y = a + c1*cos(x) + c2*sin(x)
     *
     * Non-finite samples are ignored. Fewer than three usable points, a flat
     * response, a rank-deficient design or a non-positive baseline yield a
     * degenerate fit.
     */
    static CosineFit fit_cosine(std::span<const double> x, std::span<const double> y);

    const Config& config() const { return config_; }

private:
    Config config_;
};

}  // namespace orotune
