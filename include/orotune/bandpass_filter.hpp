#pragma once

#include "types.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <numbers>
#include <stdexcept>

namespace orotune {

/**
 * @brief Second-Order Section (Biquad) IIR Filter
 *
 * Direct Form II Transposed. Building block for the Butterworth cascade.
 */
class BiquadFilter {
public:
    // y[n] = b0*x[n] + b1*x[n-1] + b2*x[n-2] - a1*y[n-1] - a2*y[n-2]
    double b0 = 1.0, b1 = 0.0, b2 = 0.0;
    double a1 = 0.0, a2 = 0.0;

    double z1 = 0.0, z2 = 0.0;

    [[nodiscard]] inline double process(double x) noexcept {
        double y = b0 * x + z1;
        z1 = b1 * x - a1 * y + z2;
        z2 = b2 * x - a2 * y;
        return y;
    }

    /// Sets the state to the steady-state response of a constant input
    void prime(double x) noexcept {
        // Solve the DF2T fixed point for a DC input of value x
        const double gain = (b0 + b1 + b2) / (1.0 + a1 + a2);
        const double y = gain * x;
        z2 = b2 * x - a2 * y;
        z1 = y - b0 * x;
    }

    void reset() noexcept {
        z1 = z2 = 0.0;
    }
};

/// Band edges and order of a Butterworth band-pass
struct BandpassConfig {
    double sample_rate = 294.1176;   // Hz (tracking cameras)
    double low_cutoff = 3.0;         // Hz
    double high_cutoff = 15.0;       // Hz
    uint8_t order = 4;               // Per edge, 2 or 4
};

/**
 * @brief Butterworth Band-pass Filter
 *
 * Cascade of high-pass and low-pass biquads designed with the bilinear
 * transform. `filter_zero_phase` runs the cascade forward and backward so
 * that the phase of rhythmic behavior is not delayed.
 */
class ButterworthBandpass {
public:
    using Config = BandpassConfig;

    explicit ButterworthBandpass(const Config& config)
        : config_(config) {
        validate(config_);
        design_filter();
    }

    ButterworthBandpass() : ButterworthBandpass(Config{}) {}

    [[nodiscard]] inline double process(double x) noexcept {
        double y = x;
        for (size_t s = 0; s < num_sections_; ++s) {
            y = sections_[s].process(y);
        }
        return y;
    }

    void process_buffer(double* buffer, size_t num_samples) noexcept {
        for (size_t i = 0; i < num_samples; ++i) {
            buffer[i] = process(buffer[i]);
        }
    }

    /**
     * @brief Forward-backward filtering of one contiguous segment
     *
     * The segment is padded at both ends with its odd reflection and the
     * sections are primed on the first padded sample, which keeps the edge
     * transients small.
     */
    Eigen::VectorXd filter_zero_phase(const Eigen::VectorXd& input) {
        const Eigen::Index n = input.size();
        if (n < 2) {
            return input;
        }
        const Eigen::Index pad = std::min<Eigen::Index>(pad_length(), n - 1);

        Eigen::VectorXd ext(n + 2 * pad);
        for (Eigen::Index i = 0; i < pad; ++i) {
            ext(i) = 2.0 * input(0) - input(pad - i);
            ext(n + pad + i) = 2.0 * input(n - 1) - input(n - 2 - i);
        }
        ext.segment(pad, n) = input;

        run_primed(ext.data(), ext.size());
        ext.reverseInPlace();
        run_primed(ext.data(), ext.size());
        ext.reverseInPlace();

        return ext.segment(pad, n);
    }

    void reset() noexcept {
        for (auto& section : sections_) {
            section.reset();
        }
    }

    void reconfigure(const Config& config) {
        validate(config);
        config_ = config;
        design_filter();
        reset();
    }

    const Config& config() const { return config_; }

private:
    Config config_;
    std::array<BiquadFilter, 4> sections_;
    size_t num_sections_ = 0;

    static void validate(const Config& config) {
        if (config.sample_rate <= 0.0 || config.low_cutoff <= 0.0 ||
            config.high_cutoff <= config.low_cutoff ||
            config.high_cutoff >= config.sample_rate / 2.0) {
            throw std::invalid_argument(
                "Band-pass edges must satisfy 0 < low < high < Nyquist");
        }
        if (config.order != 2 && config.order != 4) {
            throw std::invalid_argument("Band-pass order must be 2 or 4");
        }
    }

    /// About three periods of the lower band edge
    Eigen::Index pad_length() const {
        return static_cast<Eigen::Index>(
            std::ceil(3.0 * config_.sample_rate / config_.low_cutoff));
    }

    void run_primed(double* data, Eigen::Index n) {
        reset();
        double x = data[0];
        for (size_t s = 0; s < num_sections_; ++s) {
            sections_[s].prime(x);
            x = x * (sections_[s].b0 + sections_[s].b1 + sections_[s].b2) /
                (1.0 + sections_[s].a1 + sections_[s].a2);
        }
        process_buffer(data, static_cast<size_t>(n));
    }

    void design_filter() {
        const double fs = config_.sample_rate;
        const double w1 = std::tan(std::numbers::pi * config_.low_cutoff / fs);
        const double w2 = std::tan(std::numbers::pi * config_.high_cutoff / fs);

        if (config_.order == 2) {
            num_sections_ = 2;
            design_highpass_biquad_q(sections_[0], w1, std::numbers::sqrt2 / 2.0);
            design_lowpass_biquad_q(sections_[1], w2, std::numbers::sqrt2 / 2.0);
        } else {
            num_sections_ = 4;
            // Pole angles π/8 and 3π/8
            const double q1 = 1.0 / (2.0 * std::cos(std::numbers::pi / 8.0));
            const double q2 = 1.0 / (2.0 * std::cos(3.0 * std::numbers::pi / 8.0));

            design_highpass_biquad_q(sections_[0], w1, q1);
            design_highpass_biquad_q(sections_[1], w1, q2);
            design_lowpass_biquad_q(sections_[2], w2, q1);
            design_lowpass_biquad_q(sections_[3], w2, q2);
        }
    }

    static void design_highpass_biquad_q(BiquadFilter& bq, double wc, double Q) {
        // H(s) = s^2 / (s^2 + s*wc/Q + wc^2), bilinear transformed
        const double wc2 = wc * wc;
        const double alpha = wc / Q;
        const double norm = 1.0 + alpha + wc2;

        bq.b0 = 1.0 / norm;
        bq.b1 = -2.0 / norm;
        bq.b2 = 1.0 / norm;
        bq.a1 = 2.0 * (wc2 - 1.0) / norm;
        bq.a2 = (1.0 - alpha + wc2) / norm;
    }

    static void design_lowpass_biquad_q(BiquadFilter& bq, double wc, double Q) {
        const double wc2 = wc * wc;
        const double alpha = wc / Q;
        const double norm = 1.0 + alpha + wc2;

        bq.b0 = wc2 / norm;
        bq.b1 = 2.0 * wc2 / norm;
        bq.b2 = wc2 / norm;
        bq.a1 = 2.0 * (wc2 - 1.0) / norm;
        bq.a2 = (1.0 - alpha + wc2) / norm;
    }
};

}  // namespace orotune
