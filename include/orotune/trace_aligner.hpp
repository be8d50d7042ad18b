#pragma once

#include "types.hpp"
#include <span>

namespace orotune {

// ============================================================================
// Signal Conditioning Primitives
// ============================================================================

namespace dsp {

/**
 * @brief Box-kernel moving average, output the same length as the input
 *
 * Sample i averages x[i - w + 1 + (w-1)/2 .. i + (w-1)/2] with zeros beyond
 * the ends, so the window is centered for odd w and leans left for even w.
 */
Eigen::VectorXd moving_average(const Eigen::VectorXd& x, size_t window);

/// Running median with zero padding. Even windows are widened by one.
Eigen::VectorXd median_filter(const Eigen::VectorXd& x, size_t window);

/// Keeps x[stride], x[2*stride], ...
Eigen::VectorXd decimate(const Eigen::VectorXd& x, size_t stride);

/// Length of decimate() output for an input of n samples
size_t decimated_length(size_t n, size_t stride);

/// Row-major concatenation of a trials x samples matrix
Eigen::VectorXd concatenate_rows(const Eigen::MatrixXd& trials);

/// Mean and population standard deviation
struct Moments {
    double mean = 0.0;
    double stddev = 0.0;
};

Moments moments(const Eigen::VectorXd& x);

/// Moments over the samples where mask != 0
Moments masked_moments(const Eigen::VectorXd& x, const Eigen::VectorXd& mask);

/// (x - mean) / std. A constant input maps to zeros.
Eigen::VectorXd zscore(const Eigen::VectorXd& x);
Eigen::MatrixXd zscore(const Eigen::MatrixXd& x);

/// Z-score with moments taken over the mask != 0 samples only
Eigen::VectorXd masked_zscore(const Eigen::VectorXd& x, const Eigen::VectorXd& mask);

/// Z-score with moments taken over the non-zero samples only
Eigen::VectorXd nonzero_zscore(const Eigen::VectorXd& x);

/**
 * @brief 1/0 confidence of a two-view tracked point
 * @return 1 where both views exceed the threshold
 */
Eigen::VectorXd confidence_mask(const Eigen::VectorXd& side, const Eigen::VectorXd& bottom,
                                double threshold);

/// Fourier-domain resampling to `num` samples (periodic signal assumption)
Eigen::VectorXd resample_fourier(const Eigen::VectorXd& x, size_t num);

/// Median of the finite samples (0 when empty)
double median(std::span<const double> x);

/**
 * @brief Orients a motion-decomposition component
 *
 * Motion components carry no canonical sign. When the median exceeds the
 * mean by more than `margin` the trace is negated. This is a heuristic and
 * does not guarantee a physically meaningful orientation.
 *
 * @return true if the sign was flipped
 */
bool correct_sign(Eigen::VectorXd& x, double margin = 0.1);
bool correct_sign(Eigen::MatrixXd& x, double margin = 0.1);

}  // namespace dsp

// ============================================================================
// Trace Aligner
// ============================================================================

/**
 * @brief Brings heterogeneous-rate streams onto a common bin grid
 *
 * A concatenated stream is smoothed with a window of
 * round(bin_width / native_interval) samples and decimated by the same
 * stride. Confidence masks go through the same grid. With moving-average
 * smoothing a bin stays valid only if every sample in its window was valid;
 * with median smoothing a majority of valid samples is enough.
 */
class TraceAligner {
public:
    enum class Smoothing {
        MovingAverage,
        Median          // Outlier-prone tracking channels
    };

    struct Config {
        double bin_width_s = 0.017;
        Smoothing smoothing = Smoothing::MovingAverage;
    };

    explicit TraceAligner(const Config& config);
    TraceAligner();

    /// Smoothing window (and decimation stride) for a native sample interval
    size_t window_for(double native_interval_s) const;

    /// Number of bins produced from n native samples
    size_t aligned_length(size_t n_samples, double native_interval_s) const;

    /// Smooth and decimate one concatenated stream
    Eigen::VectorXd align(const Eigen::VectorXd& concatenated, double native_interval_s) const;

    /// Concatenate trials (rows), then smooth and decimate
    Eigen::VectorXd align_trials(const Eigen::MatrixXd& trials, double native_interval_s) const;

    /// Align a 1/0 confidence mask; output is exactly 1 or 0
    Eigen::VectorXd align_mask(const Eigen::VectorXd& mask, double native_interval_s) const;

    const Config& config() const { return config_; }

private:
    Config config_;
};

}  // namespace orotune
