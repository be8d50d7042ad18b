#include "orotune/trace_aligner.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <stdexcept>
#include <vector>

#include <unsupported/Eigen/FFT>

namespace orotune {
namespace dsp {

// ============================================================================
// Smoothing
// ============================================================================

Eigen::VectorXd moving_average(const Eigen::VectorXd& x, size_t window) {
    if (window == 0) {
        throw std::invalid_argument("moving_average: window must be positive");
    }
    const Eigen::Index n = x.size();
    const auto w = static_cast<Eigen::Index>(window);
    const Eigen::Index lead = (w - 1) / 2;

    // Prefix sums make each window O(1)
    Eigen::VectorXd prefix(n + 1);
    prefix(0) = 0.0;
    for (Eigen::Index i = 0; i < n; ++i) {
        prefix(i + 1) = prefix(i) + x(i);
    }

    Eigen::VectorXd out(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const Eigen::Index hi = std::min(n - 1, i + lead);
        const Eigen::Index lo = std::max<Eigen::Index>(0, i + lead - w + 1);
        out(i) = hi >= lo ? (prefix(hi + 1) - prefix(lo)) / static_cast<double>(w) : 0.0;
    }
    return out;
}

Eigen::VectorXd median_filter(const Eigen::VectorXd& x, size_t window) {
    if (window == 0) {
        throw std::invalid_argument("median_filter: window must be positive");
    }
    const auto w = static_cast<Eigen::Index>(window | 1u);
    const Eigen::Index half = w / 2;
    const Eigen::Index n = x.size();

    Eigen::VectorXd out(n);
    std::vector<double> buf(static_cast<size_t>(w));
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index k = 0; k < w; ++k) {
            const Eigen::Index j = i - half + k;
            buf[static_cast<size_t>(k)] = (j >= 0 && j < n) ? x(j) : 0.0;
        }
        auto mid = buf.begin() + half;
        std::nth_element(buf.begin(), mid, buf.end());
        out(i) = *mid;
    }
    return out;
}

size_t decimated_length(size_t n, size_t stride) {
    if (stride == 0 || n <= stride) {
        return 0;
    }
    return (n - stride - 1) / stride + 1;
}

Eigen::VectorXd decimate(const Eigen::VectorXd& x, size_t stride) {
    const size_t m = decimated_length(static_cast<size_t>(x.size()), stride);
    Eigen::VectorXd out(static_cast<Eigen::Index>(m));
    for (size_t k = 0; k < m; ++k) {
        out(static_cast<Eigen::Index>(k)) = x(static_cast<Eigen::Index>((k + 1) * stride));
    }
    return out;
}

Eigen::VectorXd concatenate_rows(const Eigen::MatrixXd& trials) {
    Eigen::VectorXd flat(trials.size());
    Eigen::Index pos = 0;
    for (Eigen::Index r = 0; r < trials.rows(); ++r) {
        flat.segment(pos, trials.cols()) = trials.row(r).transpose();
        pos += trials.cols();
    }
    return flat;
}

// ============================================================================
// Normalization
// ============================================================================

Moments moments(const Eigen::VectorXd& x) {
    Moments m;
    if (x.size() == 0) {
        return m;
    }
    m.mean = x.mean();
    m.stddev = std::sqrt((x.array() - m.mean).square().mean());
    return m;
}

Moments masked_moments(const Eigen::VectorXd& x, const Eigen::VectorXd& mask) {
    if (x.size() != mask.size()) {
        throw std::invalid_argument("masked_moments: mask length differs");
    }
    Moments m;
    double sum = 0.0;
    size_t count = 0;
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        if (mask(i) != 0.0) {
            sum += x(i);
            ++count;
        }
    }
    if (count == 0) {
        return m;
    }
    m.mean = sum / static_cast<double>(count);
    double ss = 0.0;
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        if (mask(i) != 0.0) {
            ss += (x(i) - m.mean) * (x(i) - m.mean);
        }
    }
    m.stddev = std::sqrt(ss / static_cast<double>(count));
    return m;
}

namespace {

Eigen::VectorXd apply_moments(const Eigen::VectorXd& x, const Moments& m) {
    if (!(m.stddev > 0.0)) {
        return Eigen::VectorXd::Zero(x.size());
    }
    return (x.array() - m.mean) / m.stddev;
}

}  // namespace

Eigen::VectorXd zscore(const Eigen::VectorXd& x) {
    return apply_moments(x, moments(x));
}

Eigen::MatrixXd zscore(const Eigen::MatrixXd& x) {
    if (x.size() == 0) {
        return x;
    }
    const double mean = x.mean();
    const double stddev = std::sqrt((x.array() - mean).square().mean());
    if (!(stddev > 0.0)) {
        return Eigen::MatrixXd::Zero(x.rows(), x.cols());
    }
    return (x.array() - mean) / stddev;
}

Eigen::VectorXd masked_zscore(const Eigen::VectorXd& x, const Eigen::VectorXd& mask) {
    return apply_moments(x, masked_moments(x, mask));
}

Eigen::VectorXd nonzero_zscore(const Eigen::VectorXd& x) {
    const Eigen::VectorXd mask = (x.array() != 0.0).cast<double>();
    return masked_zscore(x, mask);
}

Eigen::VectorXd confidence_mask(const Eigen::VectorXd& side, const Eigen::VectorXd& bottom,
                                double threshold) {
    if (side.size() != bottom.size()) {
        throw std::invalid_argument("confidence_mask: camera views differ in length");
    }
    return ((side.array() > threshold) && (bottom.array() > threshold)).cast<double>();
}

// ============================================================================
// Resampling
// ============================================================================

Eigen::VectorXd resample_fourier(const Eigen::VectorXd& x, size_t num) {
    const auto n = static_cast<size_t>(x.size());
    if (num == 0 || n == 0) {
        return Eigen::VectorXd(static_cast<Eigen::Index>(num)).setZero();
    }
    if (num == n) {
        return x;
    }

    Eigen::FFT<double> fft;
    std::vector<double> input(x.data(), x.data() + n);
    std::vector<std::complex<double>> spectrum;
    fft.fwd(spectrum, input);

    // Copy the shared band of frequencies into a spectrum of length num
    std::vector<std::complex<double>> out(num, {0.0, 0.0});
    const size_t shared = std::min(n, num);
    const size_t nyquist = shared / 2;
    for (size_t k = 0; k <= nyquist; ++k) {
        out[k] = spectrum[k];
        if (k > 0) {
            out[num - k] = spectrum[n - k];
        }
    }
    if (shared % 2 == 0) {
        if (num < n) {
            // Fold both halves of the cut Nyquist bin together
            out[nyquist] = spectrum[nyquist] + spectrum[n - nyquist];
        } else {
            // Split the source Nyquist bin between ±nyquist
            out[nyquist] = 0.5 * spectrum[nyquist];
            out[num - nyquist] = 0.5 * spectrum[nyquist];
        }
    }

    std::vector<std::complex<double>> time;
    fft.inv(time, out);

    const double scale = static_cast<double>(num) / static_cast<double>(n);
    Eigen::VectorXd y(static_cast<Eigen::Index>(num));
    for (size_t i = 0; i < num; ++i) {
        y(static_cast<Eigen::Index>(i)) = time[i].real() * scale;
    }
    return y;
}

// ============================================================================
// Sign Correction
// ============================================================================

double median(std::span<const double> x) {
    std::vector<double> values;
    values.reserve(x.size());
    for (double v : x) {
        if (std::isfinite(v)) values.push_back(v);
    }
    if (values.empty()) {
        return 0.0;
    }
    const size_t mid = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid), values.end());
    const double upper = values[mid];
    if (values.size() % 2 == 1) {
        return upper;
    }
    const double lower = *std::max_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid));
    return 0.5 * (lower + upper);
}

bool correct_sign(Eigen::VectorXd& x, double margin) {
    if (x.size() == 0) {
        return false;
    }
    const double med = median(std::span<const double>(x.data(), static_cast<size_t>(x.size())));
    if (med > x.mean() + margin) {
        x = -x;
        return true;
    }
    return false;
}

bool correct_sign(Eigen::MatrixXd& x, double margin) {
    if (x.size() == 0) {
        return false;
    }
    const double med = median(std::span<const double>(x.data(), static_cast<size_t>(x.size())));
    if (med > x.mean() + margin) {
        x = -x;
        return true;
    }
    return false;
}

}  // namespace dsp

// ============================================================================
// Trace Aligner
// ============================================================================

TraceAligner::TraceAligner(const Config& config)
    : config_(config) {
    if (config_.bin_width_s <= 0.0) {
        throw std::invalid_argument("Bin width must be positive");
    }
}

TraceAligner::TraceAligner() : TraceAligner(Config{}) {}

size_t TraceAligner::window_for(double native_interval_s) const {
    if (native_interval_s <= 0.0) {
        throw std::invalid_argument("Native sample interval must be positive");
    }
    const long window = std::lround(config_.bin_width_s / native_interval_s);
    return static_cast<size_t>(std::max(1L, window));
}

size_t TraceAligner::aligned_length(size_t n_samples, double native_interval_s) const {
    return dsp::decimated_length(n_samples, window_for(native_interval_s));
}

Eigen::VectorXd TraceAligner::align(const Eigen::VectorXd& concatenated,
                                    double native_interval_s) const {
    const size_t w = window_for(native_interval_s);
    const Eigen::VectorXd smoothed = config_.smoothing == Smoothing::Median
        ? dsp::median_filter(concatenated, w)
        : dsp::moving_average(concatenated, w);
    return dsp::decimate(smoothed, w);
}

Eigen::VectorXd TraceAligner::align_trials(const Eigen::MatrixXd& trials,
                                           double native_interval_s) const {
    return align(dsp::concatenate_rows(trials), native_interval_s);
}

Eigen::VectorXd TraceAligner::align_mask(const Eigen::VectorXd& mask,
                                         double native_interval_s) const {
    const size_t w = window_for(native_interval_s);
    const Eigen::VectorXd valid = (mask.array() != 0.0).cast<double>();
    if (config_.smoothing == Smoothing::Median) {
        // Majority vote over the window
        return (dsp::decimate(dsp::median_filter(valid, w), w).array() > 0.5).cast<double>();
    }
    const Eigen::VectorXd fraction = dsp::decimate(dsp::moving_average(valid, w), w);
    return (fraction.array() >= 1.0 - 1e-9).cast<double>();
}

}  // namespace orotune
