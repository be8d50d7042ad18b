#pragma once

#include "bandpass_filter.hpp"
#include "types.hpp"
#include <complex>
#include <memory>

namespace orotune {

/**
 * @brief Instantaneous amplitude and phase of a trials x samples trace
 *
 * Phase lies in (-π, π]. Callers that need [0, 2π) apply `to_positive_phase`.
 */
struct PhaseAmplitude {
    Eigen::MatrixXd amplitude;
    Eigen::MatrixXd phase;
};

/// Shifts phase from (-π, π] to [0, 2π), folding 2π onto 0
Eigen::MatrixXd to_positive_phase(const Eigen::MatrixXd& phase);

/**
 * @brief Band-limited analytic-signal decomposition of behavioral traces
 *
 * Each trial (row) is band-pass filtered with zero phase and transformed to
 * its analytic signal independently. Samples are never mixed across trials.
 */
class PhaseAmplitudeExtractor {
public:
    struct Config {
        double sample_rate_hz = 1.0 / 0.0034;
        double low_hz = 3.0;
        double high_hz = 15.0;
        uint8_t filter_order = 4;

        /// Jaw position from the side camera
        static Config jaw(double sample_rate_hz = 1.0 / 0.0034) {
            return {sample_rate_hz, 3.0, 15.0, 4};
        }

        /// Thermistor breathing after 100x downsampling of the 25 kHz trace
        static Config breathing(double sample_rate_hz = 250.0) {
            return {sample_rate_hz, 1.0, 15.0, 4};
        }

        /// Whisker pad motion energy
        static Config whisker(double sample_rate_hz = 1.0 / 0.0034) {
            return {sample_rate_hz, 3.0, 25.0, 4};
        }
    };

    explicit PhaseAmplitudeExtractor(const Config& config);
    PhaseAmplitudeExtractor();
    ~PhaseAmplitudeExtractor();

    PhaseAmplitudeExtractor(PhaseAmplitudeExtractor&&) noexcept;
    PhaseAmplitudeExtractor& operator=(PhaseAmplitudeExtractor&&) noexcept;

    /**
     * @brief Extract amplitude and phase per trial
     * @param traces Trials x samples
     * @return Matrices of the same shape
     */
    PhaseAmplitude extract(const Eigen::MatrixXd& traces) const;

    /// Extract from a single contiguous trace
    PhaseAmplitude extract(const Eigen::VectorXd& trace) const;

    /// Zero-phase band-pass of a single trace
    Eigen::VectorXd bandpass(const Eigen::VectorXd& trace) const;

    /**
     * @brief Analytic signal x + i*H(x) by FFT
     *
     * Keeps DC (and Nyquist for even lengths), doubles positive frequencies
     * and zeroes negative ones.
     */
    static Eigen::VectorXcd analytic_signal(const Eigen::VectorXd& x);

    const Config& config() const { return config_; }

private:
    Config config_;
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace orotune
