#pragma once

#include "types.hpp"
#include <array>
#include <optional>
#include <span>

namespace orotune {

/**
 * @brief Spike times of one unit on the concatenated session axis
 *
 * Trial k is offset by k * trial_duration_s. Spikes past the tracked window
 * of their trial are dropped.
 */
std::vector<double> session_spike_times(const UnitSpikes& spikes, double trial_duration_s);

/// Smallest k with P(X <= k) >= q for X ~ Poisson(mean)
double poisson_quantile(double q, double mean);

// ============================================================================
// Lick-Triggered Responses
// ============================================================================

/// Peri-event time histogram in spikes/s
struct Psth {
    std::vector<double> bin_centers;
    std::vector<double> rate_hz;
    size_t n_events = 0;
};

/**
 * @brief Peri-event histograms and response latency around lick-bout onsets
 *
 * Latency is the first post-onset bin that, together with the next bin,
 * exceeds the `quantile` of a Poisson distribution whose mean is the
 * average pre-onset count per bin.
 */
class LickResponseAnalyzer {
public:
    struct Config {
        double psth_before_s = 0.5;
        double psth_after_s = 0.5;
        double latency_before_s = 1.0;
        double latency_after_s = 0.5;
        double bin_width_s = 0.001;
        double quantile = 0.95;
    };

    explicit LickResponseAnalyzer(const Config& config);
    LickResponseAnalyzer();

    /// Histogram normalized by event count and bin width
    Psth psth(std::span<const double> spike_times, std::span<const double> events) const;

    /// Seconds after onset, or nullopt when the response never crosses
    std::optional<double> latency(std::span<const double> spike_times,
                                  std::span<const double> events) const;

    const Config& config() const { return config_; }

private:
    Config config_;

    /// Raw counts of event-relative spike times in [-before, after)
    std::vector<double> counts(std::span<const double> spike_times,
                               std::span<const double> events,
                               double before_s, double after_s) const;
};

// ============================================================================
// Firing vs. Lick Rate
// ============================================================================

/// A lick inside a bout with the instantaneous frequency of the interval ending at it
struct LickInterval {
    double onset = 0.0;             // Session seconds
    double frequency_hz = 0.0;
};

/// Mean firing around licks binned by lick frequency, with a linear fit
struct LickRateTuning {
    std::vector<double> frequency_bins;     // Bin centers (Hz)
    std::vector<double> spike_rate;         // Hz, NaN for empty bins
    double slope = 0.0;                     // Spike rate per Hz of lick frequency
    double intercept = 0.0;
};

/**
 * @brief Firing rate of a unit as a function of lick frequency
 *
 * Only licks more than `bout_guard_s` inside a lick bout count, each paired
 * with the previous lick of the same bout. The rate of a lick is its spike
 * count in (onset - window_before_s, onset + window_after_s) divided by the
 * window length. Frequencies are split into `n_bins` equal bins between the
 * lowest and highest frequency and a line is fitted to the bin means.
 */
class LickRateAnalyzer {
public:
    struct Config {
        double bout_guard_s = 0.2;
        double window_before_s = 0.025;
        double window_after_s = 0.075;
        size_t n_bins = 9;
    };

    explicit LickRateAnalyzer(const Config& config);
    LickRateAnalyzer();

    std::vector<LickInterval> intervals(std::span<const double> tongue_onsets,
                                        const BoutEvents& lick_bouts) const;

    /// nullopt when there are no intervals or they all share one frequency
    std::optional<LickRateTuning> estimate(std::span<const double> spike_times,
                                           const std::vector<LickInterval>& intervals) const;

    const Config& config() const { return config_; }

private:
    Config config_;
};

// ============================================================================
// Breath-Lick Reset
// ============================================================================

/**
 * @brief Indices of local maxima, in ascending order
 *
 * Flat peaks resolve to their middle sample. Peaks lower than `height` are
 * dropped, then peaks closer than `min_distance` samples to a higher kept
 * peak are removed.
 */
std::vector<size_t> find_peaks(std::span<const double> x, double height, size_t min_distance);

/// A breath during licking, lick times relative to its inspiration onset
struct LickingBreath {
    double inspiration = 0.0;       // Session seconds
    double interval = 0.0;          // Seconds to the next inspiration
    double lick_before = 0.0;       // Last lick before the inspiration, negative
    double last_lick = 0.0;         // Last lick inside the breath
    size_t n_licks = 0;             // Licks inside the breath
};

/// Breaths sorted by interval, longest first, with the two PSTH groups
struct LickResetBreaths {
    std::vector<LickingBreath> breaths;
    std::vector<size_t> single_lick;    // Indices into breaths
    std::vector<size_t> double_lick;
    double interval_boundary = 0.0;
};

struct LickResetResponse {
    std::vector<double> bin_centers;          // Seconds after the lick preceding the breath
    std::vector<double> single_lick_rate_hz;  // NaN without single-lick breaths
    std::vector<double> double_lick_rate_hz;  // NaN without double-lick breaths
    std::vector<double> single_lick_peaks;
    std::vector<double> double_lick_peaks;
};

/**
 * @brief Firing across breaths that contain one or two licks
 *
 * Breaths are taken from inspirations more than `bout_guard_s` inside a lick
 * bout. A breath qualifies if it holds at least one lick and a lick precedes
 * its inspiration within two breaths; breaths at least as long as the
 * longest inspiration interval of the session are dropped, as are
 * single-lick breaths whose previous lick falls within `lick_margin_s` of
 * the inspiration and double-lick breaths whose second lick falls within
 * `lick_margin_s` of the next one.
 *
 * The interval boundary is the midpoint of the mean single-lick and mean
 * double-lick intervals. The single-lick group holds the longest
 * `max_breaths` single-lick breaths shorter than the boundary, the
 * double-lick group the shortest `max_breaths` double-lick breaths.
 * Spikes are aligned to the lick preceding each breath.
 */
class LickResetAnalyzer {
public:
    struct Config {
        double psth_start_s = -0.4;         // Relative to the inspiration
        double psth_end_s = 1.0;
        double bin_width_s = 0.02;
        double bout_guard_s = 0.2;
        double lick_margin_s = 0.05;
        size_t max_breaths = 40;
        double peak_height_hz = 50.0;
        double single_peak_distance_s = 0.14;
        double double_peak_distance_s = 0.1;
        double single_peak_min_s = 0.12;
        double double_peak_min_s = 0.08;
        double peak_max_s = 0.35;
    };

    explicit LickResetAnalyzer(const Config& config);
    LickResetAnalyzer();

    LickResetBreaths select_breaths(std::span<const double> inspiration_onsets,
                                    std::span<const double> tongue_onsets,
                                    const BoutEvents& lick_bouts) const;

    LickResetResponse respond(std::span<const double> spike_times,
                              const LickResetBreaths& breaths) const;

    const Config& config() const { return config_; }

private:
    Config config_;

    std::vector<double> group_rate(std::span<const double> spike_times,
                                   const LickResetBreaths& breaths,
                                   const std::vector<size_t>& group) const;
    std::vector<double> peak_times(const std::vector<double>& rate,
                                   const std::vector<double>& centers,
                                   double distance_s, double min_s) const;
};

// ============================================================================
// Direction Tuning
// ============================================================================

constexpr size_t kWaterPorts = 9;

/**
 * @brief Firing around lick-port contacts, per target direction
 *
 * The nine ports form a 3x3 grid. The eight outer ports are placed on angles
 * 0, π/4, ..., 7π/4 and fitted with a cosine; the center port is reported
 * but not part of the fit.
 */
struct DirectionTuning {
    std::array<double, kWaterPorts> spikes_per_contact{};   // NaN without contacts
    double preferred_direction = 0.0;
    double direction_index = 0.0;
};

class DirectionTuningEstimator {
public:
    struct Config {
        double window_before_s = 0.05;
        double window_after_s = 0.1;
    };

    explicit DirectionTuningEstimator(const Config& config);
    DirectionTuningEstimator();

    /**
     * @param spikes Trial-relative spike trains
     * @param contacts Trial-relative contact times per trial
     * @param water_ports Port (1-9) rewarded in each trial
     */
    DirectionTuning estimate(const UnitSpikes& spikes,
                             const std::vector<std::vector<double>>& contacts,
                             const std::vector<int>& water_ports) const;

    /// Grid port (0-based) placed at each of the eight angles
    static constexpr std::array<size_t, 8> kAnglePorts{7, 8, 5, 2, 1, 0, 3, 6};

    const Config& config() const { return config_; }

private:
    Config config_;
};

// ============================================================================
// Lick-Port Contacts
// ============================================================================

/// 3-D lick-port position of one trial from the bottom camera
struct LickPortTrack {
    Eigen::VectorXd x;
    Eigen::VectorXd y;
    Eigen::VectorXd z;
};

/**
 * @brief Tongue contacts with the lick port
 *
 * A contact is a run of confidently tracked tongue frames whose length lies
 * strictly between `min_run_frames` and `max_run_frames` and during which
 * the tongue comes within `radius` of the median port position. The port
 * position is taken from `reference_frame` onward, once the port has moved
 * into place.
 */
class ContactDetector {
public:
    struct Config {
        double radius = 1.0;
        size_t min_run_frames = 10;
        size_t max_run_frames = 35;
        size_t reference_frame = 350;
        double likelihood_threshold = 0.95;
        double frame_interval_s = 0.0034;
    };

    explicit ContactDetector(const Config& config);
    ContactDetector();

    /// Trial-relative contact times (run starts)
    std::vector<double> detect(const TrialTracking& tongue, const LickPortTrack& port) const;

    const Config& config() const { return config_; }

private:
    Config config_;
};

}  // namespace orotune
