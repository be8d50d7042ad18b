#include "orotune/lick_analysis.hpp"
#include "orotune/circular_tuning.hpp"
#include "orotune/logging.hpp"
#include "orotune/trace_aligner.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace orotune {

std::vector<double> session_spike_times(const UnitSpikes& spikes, double trial_duration_s) {
    std::vector<double> out;
    for (size_t k = 0; k < spikes.size(); ++k) {
        const double offset = static_cast<double>(k) * trial_duration_s;
        for (double t : spikes[k]) {
            if (t >= 0.0 && t < trial_duration_s) {
                out.push_back(t + offset);
            }
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

double poisson_quantile(double q, double mean) {
    if (!(mean > 0.0)) {
        return 0.0;
    }
    // Each term from its own logarithm; exp(-mean) alone underflows past mean ~745
    const double log_mean = std::log(mean);
    auto pmf = [&](double k) { return std::exp(k * log_mean - mean - std::lgamma(k + 1.0)); };

    double k = 0.0;
    double cdf = pmf(0.0);
    // Upper bound far past any quantile below 1
    const double limit = mean + 50.0 * std::sqrt(mean) + 50.0;
    while (cdf < q && k < limit) {
        k += 1.0;
        cdf += pmf(k);
    }
    return k;
}

// ============================================================================
// Lick Response Analyzer
// ============================================================================

LickResponseAnalyzer::LickResponseAnalyzer(const Config& config)
    : config_(config) {
    if (config_.bin_width_s <= 0.0 || config_.quantile <= 0.0 || config_.quantile >= 1.0) {
        throw std::invalid_argument("Invalid lick response configuration");
    }
}

LickResponseAnalyzer::LickResponseAnalyzer() : LickResponseAnalyzer(Config{}) {}

std::vector<double> LickResponseAnalyzer::counts(std::span<const double> spike_times,
                                                 std::span<const double> events,
                                                 double before_s, double after_s) const {
    const auto n_bins = static_cast<size_t>(std::lround((before_s + after_s) / config_.bin_width_s));
    std::vector<double> y(n_bins, 0.0);
    for (double e : events) {
        auto it = std::upper_bound(spike_times.begin(), spike_times.end(), e - before_s);
        for (; it != spike_times.end() && *it < e + after_s; ++it) {
            const auto bin = static_cast<size_t>(std::floor((*it - e + before_s) / config_.bin_width_s));
            if (bin < n_bins) {
                y[bin] += 1.0;
            }
        }
    }
    return y;
}

Psth LickResponseAnalyzer::psth(std::span<const double> spike_times,
                                std::span<const double> events) const {
    Psth result;
    result.n_events = events.size();
    result.rate_hz = counts(spike_times, events, config_.psth_before_s, config_.psth_after_s);
    result.bin_centers.resize(result.rate_hz.size());
    for (size_t i = 0; i < result.rate_hz.size(); ++i) {
        result.bin_centers[i] = -config_.psth_before_s + (static_cast<double>(i) + 0.5) * config_.bin_width_s;
        if (!events.empty()) {
            result.rate_hz[i] /= static_cast<double>(events.size()) * config_.bin_width_s;
        }
    }
    return result;
}

std::optional<double> LickResponseAnalyzer::latency(std::span<const double> spike_times,
                                                    std::span<const double> events) const {
    if (events.empty()) {
        return std::nullopt;
    }
    const std::vector<double> y = counts(spike_times, events, config_.latency_before_s,
                                         config_.latency_after_s);
    const auto onset_bin = static_cast<size_t>(std::lround(config_.latency_before_s / config_.bin_width_s));
    if (onset_bin == 0 || onset_bin >= y.size()) {
        return std::nullopt;
    }

    double baseline = 0.0;
    for (size_t i = 0; i < onset_bin; ++i) baseline += y[i];
    baseline /= static_cast<double>(onset_bin);
    const double threshold = poisson_quantile(config_.quantile, baseline);

    for (size_t i = onset_bin; i + 1 < y.size(); ++i) {
        if (y[i] > threshold && y[i + 1] > threshold) {
            return static_cast<double>(i - onset_bin) * config_.bin_width_s;
        }
    }
    return std::nullopt;
}

namespace {

/// Values lying more than guard_s inside any bout, in input order
std::vector<double> inside_bouts(std::span<const double> values, const BoutEvents& bouts, double guard_s) {
    std::vector<double> out;
    for (size_t b = 0; b < bouts.size(); ++b) {
        const double lo = bouts.onsets[b] + guard_s;
        const double hi = bouts.offsets[b] - guard_s;
        for (double v : values) {
            if (v > lo && v < hi) {
                out.push_back(v);
            }
        }
    }
    return out;
}

/// Iterators bounding values strictly inside (lo, hi) of a sorted span
std::pair<std::span<const double>::iterator, std::span<const double>::iterator>
open_range(std::span<const double> sorted, double lo, double hi) {
    auto first = std::upper_bound(sorted.begin(), sorted.end(), lo);
    auto last = std::lower_bound(first, sorted.end(), hi);
    return {first, last};
}

}  // namespace

// ============================================================================
// Firing vs. Lick Rate
// ============================================================================

LickRateAnalyzer::LickRateAnalyzer(const Config& config)
    : config_(config) {
    if (config_.n_bins == 0 || config_.window_before_s + config_.window_after_s <= 0.0) {
        throw std::invalid_argument("Invalid lick rate configuration");
    }
}

LickRateAnalyzer::LickRateAnalyzer() : LickRateAnalyzer(Config{}) {}

std::vector<LickInterval> LickRateAnalyzer::intervals(std::span<const double> tongue_onsets,
                                                      const BoutEvents& lick_bouts) const {
    std::vector<LickInterval> out;
    for (size_t b = 0; b < lick_bouts.size(); ++b) {
        const BoutEvents bout{{lick_bouts.onsets[b]}, {lick_bouts.offsets[b]}};
        const std::vector<double> licks = inside_bouts(tongue_onsets, bout, config_.bout_guard_s);
        for (size_t i = 1; i < licks.size(); ++i) {
            const double dt = licks[i] - licks[i - 1];
            if (dt > 0.0) {
                out.push_back({licks[i], 1.0 / dt});
            }
        }
    }
    return out;
}

std::optional<LickRateTuning> LickRateAnalyzer::estimate(std::span<const double> spike_times,
                                                         const std::vector<LickInterval>& intervals) const {
    if (intervals.empty()) {
        return std::nullopt;
    }
    double lo = intervals.front().frequency_hz;
    double hi = lo;
    for (const auto& iv : intervals) {
        lo = std::min(lo, iv.frequency_hz);
        hi = std::max(hi, iv.frequency_hz);
    }
    if (!(hi - lo > 1e-9 * hi)) {
        return std::nullopt;
    }

    const size_t n = config_.n_bins;
    const double width = (hi - lo) / static_cast<double>(n);
    std::vector<double> edges(n + 1);
    for (size_t k = 0; k <= n; ++k) edges[k] = lo + static_cast<double>(k) * width;
    edges[n] = hi;

    const double window = config_.window_before_s + config_.window_after_s;
    std::vector<double> sum(n, 0.0);
    std::vector<double> count(n, 0.0);
    for (const auto& iv : intervals) {
        // Bins are (low, high], the lowest frequency joins the first bin
        const auto e = static_cast<size_t>(std::lower_bound(edges.begin(), edges.end(), iv.frequency_hz) - edges.begin());
        const size_t bin = std::min(e > 0 ? e - 1 : size_t{0}, n - 1);
        const auto [first, last] = open_range(spike_times, iv.onset - config_.window_before_s,
                                              iv.onset + config_.window_after_s);
        sum[bin] += static_cast<double>(last - first) / window;
        count[bin] += 1.0;
    }

    LickRateTuning tuning;
    tuning.frequency_bins.resize(n);
    tuning.spike_rate.resize(n);
    double sx = 0.0, sy = 0.0, sxx = 0.0, sxy = 0.0, m = 0.0;
    for (size_t k = 0; k < n; ++k) {
        const double x = 0.5 * (edges[k] + edges[k + 1]);
        tuning.frequency_bins[k] = x;
        if (count[k] == 0.0) {
            tuning.spike_rate[k] = std::numeric_limits<double>::quiet_NaN();
            continue;
        }
        const double y = sum[k] / count[k];
        tuning.spike_rate[k] = y;
        sx += x; sy += y; sxx += x * x; sxy += x * y; m += 1.0;
    }
    const double denom = m * sxx - sx * sx;
    if (m >= 2.0 && denom > 0.0) {
        tuning.slope = (m * sxy - sx * sy) / denom;
        tuning.intercept = (sy - tuning.slope * sx) / m;
    }
    return tuning;
}

// ============================================================================
// Breath-Lick Reset
// ============================================================================

std::vector<size_t> find_peaks(std::span<const double> x, double height, size_t min_distance) {
    std::vector<size_t> peaks;
    size_t i = 1;
    while (i + 1 < x.size()) {
        if (x[i - 1] < x[i]) {
            size_t ahead = i + 1;
            while (ahead + 1 < x.size() && x[ahead] == x[i]) ++ahead;
            if (x[ahead] < x[i]) {
                const size_t mid = (i + ahead - 1) / 2;
                if (x[mid] >= height) {
                    peaks.push_back(mid);
                }
                i = ahead;
                continue;
            }
        }
        ++i;
    }
    if (min_distance <= 1 || peaks.size() < 2) {
        return peaks;
    }

    // Suppress neighbours of higher peaks, highest first
    std::vector<size_t> order(peaks.size());
    for (size_t k = 0; k < order.size(); ++k) order[k] = k;
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return x[peaks[a]] < x[peaks[b]]; });
    std::vector<bool> keep(peaks.size(), true);
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        const size_t k = *it;
        if (!keep[k]) continue;
        for (size_t j = k; j-- > 0 && peaks[k] - peaks[j] < min_distance;) keep[j] = false;
        for (size_t j = k + 1; j < peaks.size() && peaks[j] - peaks[k] < min_distance; ++j) keep[j] = false;
    }
    std::vector<size_t> kept;
    for (size_t k = 0; k < peaks.size(); ++k) {
        if (keep[k]) kept.push_back(peaks[k]);
    }
    return kept;
}

LickResetAnalyzer::LickResetAnalyzer(const Config& config)
    : config_(config) {
    if (config_.bin_width_s <= 0.0 || config_.psth_end_s <= config_.psth_start_s) {
        throw std::invalid_argument("Invalid lick reset configuration");
    }
}

LickResetAnalyzer::LickResetAnalyzer() : LickResetAnalyzer(Config{}) {}

LickResetBreaths LickResetAnalyzer::select_breaths(std::span<const double> inspiration_onsets,
                                                   std::span<const double> tongue_onsets,
                                                   const BoutEvents& lick_bouts) const {
    LickResetBreaths result;
    result.interval_boundary = std::numeric_limits<double>::infinity();

    double max_ibi = 0.0;
    for (size_t i = 1; i < inspiration_onsets.size(); ++i) {
        max_ibi = std::max(max_ibi, inspiration_onsets[i] - inspiration_onsets[i - 1]);
    }

    const std::vector<double> l = inside_bouts(inspiration_onsets, lick_bouts, config_.bout_guard_s);
    const double m = config_.lick_margin_s;
    for (size_t i = 2; i + 2 < l.size(); ++i) {
        const auto [first, last] = open_range(tongue_onsets, l[i - 2], l[i + 2]);
        const std::span<const double> window(first, last);
        const auto [in_first, in_last] = open_range(window, l[i], l[i + 1]);
        if (in_first == in_last) continue;
        const auto before_end = std::lower_bound(window.begin(), window.end(), l[i]);
        if (before_end == window.begin()) continue;

        LickingBreath breath;
        breath.inspiration = l[i];
        breath.interval = l[i + 1] - l[i];
        breath.lick_before = *(before_end - 1) - l[i];
        breath.last_lick = *(in_last - 1) - l[i];
        breath.n_licks = static_cast<size_t>(in_last - in_first);
        if (breath.interval >= max_ibi) continue;
        // Licks too close to an inspiration blur the breath boundary
        if (breath.n_licks == 1 && breath.lick_before > -m) continue;
        if (breath.n_licks == 2 && breath.last_lick > breath.interval - m) continue;
        result.breaths.push_back(breath);
    }

    std::stable_sort(result.breaths.begin(), result.breaths.end(),
                     [](const LickingBreath& a, const LickingBreath& b) { return a.interval < b.interval; });
    std::reverse(result.breaths.begin(), result.breaths.end());

    double single_sum = 0.0, double_sum = 0.0;
    size_t n_single = 0, n_double = 0;
    for (const auto& b : result.breaths) {
        if (b.n_licks == 1) { single_sum += b.interval; ++n_single; }
        if (b.n_licks == 2) { double_sum += b.interval; ++n_double; }
    }
    if (n_single > 0 && n_double > 0) {
        result.interval_boundary = 0.5 * (single_sum / static_cast<double>(n_single) +
                                          double_sum / static_cast<double>(n_double));
    }

    for (size_t k = 0; k < result.breaths.size(); ++k) {
        const auto& b = result.breaths[k];
        if (b.n_licks == 1 && b.interval < result.interval_boundary &&
            result.single_lick.size() < config_.max_breaths) {
            result.single_lick.push_back(k);
        } else if (b.n_licks == 2) {
            result.double_lick.push_back(k);
        }
    }
    if (result.double_lick.size() > config_.max_breaths) {
        result.double_lick.erase(result.double_lick.begin(),
                                 result.double_lick.end() - static_cast<std::ptrdiff_t>(config_.max_breaths));
    }
    return result;
}

std::vector<double> LickResetAnalyzer::group_rate(std::span<const double> spike_times,
                                                  const LickResetBreaths& breaths,
                                                  const std::vector<size_t>& group) const {
    const double start = config_.psth_start_s;
    const double bw = config_.bin_width_s;
    const auto n_bins = static_cast<size_t>(std::lround((config_.psth_end_s - start) / bw)) - 1;
    if (group.empty()) {
        return std::vector<double>(n_bins, std::numeric_limits<double>::quiet_NaN());
    }

    std::vector<double> rate(n_bins, 0.0);
    const double upper = start + static_cast<double>(n_bins) * bw;
    for (size_t k : group) {
        const LickingBreath& b = breaths.breaths.at(k);
        const auto [first, last] = open_range(spike_times, b.inspiration + start, b.inspiration + config_.psth_end_s);
        for (auto it = first; it != last; ++it) {
            const double rel = (*it - b.inspiration) - b.lick_before;
            if (rel < start || rel > upper) continue;
            const auto bin = std::min(static_cast<size_t>(std::floor((rel - start) / bw)), n_bins - 1);
            rate[bin] += 1.0;
        }
    }
    for (double& r : rate) r /= static_cast<double>(group.size()) * bw;
    return rate;
}

std::vector<double> LickResetAnalyzer::peak_times(const std::vector<double>& rate,
                                                  const std::vector<double>& centers,
                                                  double distance_s, double min_s) const {
    std::vector<double> out;
    const auto distance = static_cast<size_t>(std::ceil(distance_s / config_.bin_width_s - 1e-9));
    for (size_t p : find_peaks(rate, config_.peak_height_hz, distance)) {
        if (centers[p] > min_s && centers[p] < config_.peak_max_s) {
            out.push_back(centers[p]);
        }
    }
    return out;
}

LickResetResponse LickResetAnalyzer::respond(std::span<const double> spike_times,
                                             const LickResetBreaths& breaths) const {
    LickResetResponse response;
    response.single_lick_rate_hz = group_rate(spike_times, breaths, breaths.single_lick);
    response.double_lick_rate_hz = group_rate(spike_times, breaths, breaths.double_lick);
    response.bin_centers.resize(response.single_lick_rate_hz.size());
    for (size_t k = 0; k < response.bin_centers.size(); ++k) {
        response.bin_centers[k] = config_.psth_start_s + (static_cast<double>(k) + 0.5) * config_.bin_width_s;
    }
    if (!breaths.single_lick.empty()) {
        response.single_lick_peaks = peak_times(response.single_lick_rate_hz, response.bin_centers,
                                                config_.single_peak_distance_s, config_.single_peak_min_s);
    }
    if (!breaths.double_lick.empty()) {
        response.double_lick_peaks = peak_times(response.double_lick_rate_hz, response.bin_centers,
                                                config_.double_peak_distance_s, config_.double_peak_min_s);
    }
    return response;
}

// ============================================================================
// Direction Tuning
// ============================================================================

DirectionTuningEstimator::DirectionTuningEstimator(const Config& config)
    : config_(config) {}

DirectionTuningEstimator::DirectionTuningEstimator() : DirectionTuningEstimator(Config{}) {}

DirectionTuning DirectionTuningEstimator::estimate(const UnitSpikes& spikes,
                                                   const std::vector<std::vector<double>>& contacts,
                                                   const std::vector<int>& water_ports) const {
    if (spikes.size() != contacts.size() || contacts.size() != water_ports.size()) {
        throw std::invalid_argument("Spikes, contacts and water ports differ in trial count");
    }

    std::array<double, kWaterPorts> spike_sum{};
    std::array<double, kWaterPorts> contact_count{};
    for (size_t tr = 0; tr < contacts.size(); ++tr) {
        const int port = water_ports[tr];
        if (port < 1 || port > static_cast<int>(kWaterPorts)) {
            OROTUNE_LOG_WARN("Trial " << tr << " has invalid water port " << port);
            continue;
        }
        const auto idx = static_cast<size_t>(port - 1);
        for (double c : contacts[tr]) {
            const double lo = c - config_.window_before_s;
            const double hi = c + config_.window_after_s;
            spike_sum[idx] += static_cast<double>(std::count_if(
                spikes[tr].begin(), spikes[tr].end(),
                [lo, hi](double t) { return t >= lo && t <= hi; }));
            contact_count[idx] += 1.0;
        }
    }

    DirectionTuning result;
    for (size_t p = 0; p < kWaterPorts; ++p) {
        result.spikes_per_contact[p] = contact_count[p] > 0.0
            ? spike_sum[p] / contact_count[p]
            : std::numeric_limits<double>::quiet_NaN();
    }

    std::vector<double> angles;
    std::vector<double> values;
    for (size_t a = 0; a < kAnglePorts.size(); ++a) {
        angles.push_back(static_cast<double>(a) * PI / 4.0);
        values.push_back(result.spikes_per_contact[kAnglePorts[a]]);
    }
    const auto fit = CircularTuningEstimator::fit_cosine(angles, values);
    result.preferred_direction = fit.preferred_phase;
    result.direction_index = fit.modulation_index;
    return result;
}

// ============================================================================
// Contact Detector
// ============================================================================

ContactDetector::ContactDetector(const Config& config)
    : config_(config) {
    if (config_.radius <= 0.0 || config_.min_run_frames >= config_.max_run_frames) {
        throw std::invalid_argument("Invalid contact detector configuration");
    }
}

ContactDetector::ContactDetector() : ContactDetector(Config{}) {}

std::vector<double> ContactDetector::detect(const TrialTracking& tongue,
                                            const LickPortTrack& port) const {
    std::vector<double> contacts;
    const Eigen::Index n = tongue.tongue_x.size();
    if (tongue.tongue_y.size() != n || tongue.tongue_z.size() != n) {
        throw std::invalid_argument("Tongue coordinates differ in length");
    }
    if (port.x.size() <= static_cast<Eigen::Index>(config_.reference_frame)) {
        return contacts;
    }

    const Eigen::VectorXd visible = dsp::confidence_mask(tongue.tongue_likelihood_side,
                                                         tongue.tongue_likelihood_bottom,
                                                         config_.likelihood_threshold);
    if (visible.size() != n) {
        throw std::invalid_argument("Tongue likelihood differs in length from position");
    }

    const auto ref = static_cast<Eigen::Index>(config_.reference_frame);
    auto tail_median = [ref](const Eigen::VectorXd& v) {
        return dsp::median(std::span<const double>(v.data() + ref, static_cast<size_t>(v.size() - ref)));
    };
    const double px = tail_median(port.x);
    const double py = tail_median(port.y);
    const double pz = tail_median(port.z);
    const double r2 = config_.radius * config_.radius;

    Eigen::Index i = 0;
    while (i < n) {
        if (visible(i) == 0.0) {
            ++i;
            continue;
        }
        const Eigen::Index start = i;
        while (i + 1 < n && visible(i + 1) != 0.0) ++i;
        const Eigen::Index last = i;
        ++i;

        // Run length counts frame intervals from first to last visible frame
        const auto span = static_cast<size_t>(last - start);
        if (span <= config_.min_run_frames || span >= config_.max_run_frames) {
            continue;
        }
        bool touched = false;
        for (Eigen::Index f = start; f < last && !touched; ++f) {
            const double dx = tongue.tongue_x(f) - px;
            const double dy = tongue.tongue_y(f) - py;
            const double dz = tongue.tongue_z(f) - pz;
            touched = dx * dx + dy * dy + dz * dz < r2;
        }
        if (touched) {
            contacts.push_back(static_cast<double>(start) * config_.frame_interval_s);
        }
    }
    return contacts;
}

}  // namespace orotune
