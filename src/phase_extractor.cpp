#include "orotune/phase_extractor.hpp"

#include <unsupported/Eigen/FFT>

namespace orotune {

// ============================================================================
// Implementation
// ============================================================================

struct PhaseAmplitudeExtractor::Impl {
    BandpassConfig filter_config;

    explicit Impl(const Config& config) {
        filter_config.sample_rate = config.sample_rate_hz;
        filter_config.low_cutoff = config.low_hz;
        filter_config.high_cutoff = config.high_hz;
        filter_config.order = config.filter_order;
        // Throws std::invalid_argument on an unusable band
        ButterworthBandpass probe(filter_config);
    }

    Eigen::VectorXd bandpass(const Eigen::VectorXd& trace) const {
        // A fresh filter per trace keeps extract() const and reentrant
        ButterworthBandpass filter(filter_config);
        return filter.filter_zero_phase(trace);
    }
};

PhaseAmplitudeExtractor::PhaseAmplitudeExtractor(const Config& config)
    : config_(config)
    , impl_(std::make_unique<Impl>(config)) {}

PhaseAmplitudeExtractor::PhaseAmplitudeExtractor()
    : PhaseAmplitudeExtractor(Config{}) {}

PhaseAmplitudeExtractor::~PhaseAmplitudeExtractor() = default;
PhaseAmplitudeExtractor::PhaseAmplitudeExtractor(PhaseAmplitudeExtractor&&) noexcept = default;
PhaseAmplitudeExtractor& PhaseAmplitudeExtractor::operator=(PhaseAmplitudeExtractor&&) noexcept = default;

// ============================================================================
// Extraction
// ============================================================================

Eigen::VectorXd PhaseAmplitudeExtractor::bandpass(const Eigen::VectorXd& trace) const {
    return impl_->bandpass(trace);
}

PhaseAmplitude PhaseAmplitudeExtractor::extract(const Eigen::MatrixXd& traces) const {
    PhaseAmplitude result;
    result.amplitude.resize(traces.rows(), traces.cols());
    result.phase.resize(traces.rows(), traces.cols());

    for (Eigen::Index r = 0; r < traces.rows(); ++r) {
        const Eigen::VectorXd row = traces.row(r).transpose();
        const Eigen::VectorXcd z = analytic_signal(impl_->bandpass(row));
        for (Eigen::Index c = 0; c < z.size(); ++c) {
            result.amplitude(r, c) = std::abs(z(c));
            result.phase(r, c) = std::arg(z(c));
        }
    }
    return result;
}

PhaseAmplitude PhaseAmplitudeExtractor::extract(const Eigen::VectorXd& trace) const {
    return extract(Eigen::MatrixXd(trace.transpose()));
}

Eigen::VectorXcd PhaseAmplitudeExtractor::analytic_signal(const Eigen::VectorXd& x) {
    const Eigen::Index n = x.size();
    if (n == 0) {
        return {};
    }

    Eigen::FFT<double> fft;
    std::vector<double> input(x.data(), x.data() + n);
    std::vector<std::complex<double>> spectrum;
    fft.fwd(spectrum, input);

    // Weighting of the one-sided spectrum
    const Eigen::Index half = n / 2;
    if (n % 2 == 0) {
        for (Eigen::Index k = 1; k < half; ++k) spectrum[k] *= 2.0;
        for (Eigen::Index k = half + 1; k < n; ++k) spectrum[k] = 0.0;
    } else {
        for (Eigen::Index k = 1; k <= half; ++k) spectrum[k] *= 2.0;
        for (Eigen::Index k = half + 1; k < n; ++k) spectrum[k] = 0.0;
    }

    std::vector<std::complex<double>> time;
    fft.inv(time, spectrum);

    Eigen::VectorXcd z(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        z(i) = time[static_cast<size_t>(i)];
    }
    return z;
}

Eigen::MatrixXd to_positive_phase(const Eigen::MatrixXd& phase) {
    return phase.unaryExpr([](double p) { return wrap_phase(p + PI); });
}

}  // namespace orotune
