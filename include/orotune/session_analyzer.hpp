#pragma once

#include "bout_detector.hpp"
#include "design_matrix.hpp"
#include "latency_tracker.hpp"
#include "lick_analysis.hpp"
#include "permutation_test.hpp"
#include "phase_extractor.hpp"
#include "poisson_glm.hpp"
#include "session_source.hpp"
#include "types.hpp"
#include <expected>

namespace orotune {

// ============================================================================
// Session Records
// ============================================================================

/**
 * @brief Trials whose video cannot be used
 *
 * Bad trials were tracked with a frame count other than the canonical one,
 * missing trials are in the session but were never tracked by that camera.
 */
struct TrialScreening {
    std::vector<int32_t> bad_side;
    std::vector<int32_t> bad_bottom;
    std::vector<int32_t> missing_side;
    std::vector<int32_t> missing_bottom;

    /// Sorted union of all four lists
    std::vector<int32_t> excluded() const;

    bool excludes(int32_t trial) const;
};

enum class TuningChannel {
    Jaw,
    Breathing,
    Whisker
};

/// Phase tuning of one unit with its significance
struct UnitTuningRecord {
    int32_t unit = 0;
    TuningCurve curve;
    double kuiper_statistic = 0.0;
    double kuiper_p = 1.0;
    double permutation_p = 1.0;
    std::vector<double> null_modulation;
};

/**
 * @brief Onsets of the orofacial rhythms of one session
 *
 * Times are seconds on the concatenated axis of `trials`.
 */
struct MovementTiming {
    std::vector<int32_t> trials;
    std::vector<double> inspiration_onsets;
    std::vector<double> tongue_onsets;
    BoutEvents lick_bouts;
    std::vector<double> whisker_onsets;
    BoutEvents whisk_bouts;
};

enum class GLMVariant {
    Standard,       // Train/test holdout, eight predictors
    NoLick,         // Whole session outside lick bouts, in-sample
    NoLickBody      // As NoLick with a body-motion predictor
};

std::string_view to_string(GLMVariant variant);

struct UnitGLMRecord {
    int32_t unit = 0;
    UnitGLMResult result;
};

/**
 * @brief Shifted GLM fits of every unit in a session
 *
 * `design` holds the rows the predictions refer to: the test partition for
 * the standard variant, the restricted full-session design otherwise.
 */
struct SessionGLMResult {
    GLMVariant variant = GLMVariant::Standard;
    std::vector<int32_t> trials;
    DesignMatrix design;
    std::vector<UnitGLMRecord> units;
};

struct UnitLickResponse {
    int32_t unit = 0;
    Psth psth;
    std::optional<double> latency;
};

struct TrialContacts {
    int32_t trial = 0;
    std::vector<double> contact_times;   // Trial-relative seconds
};

struct UnitDirectionRecord {
    int32_t unit = 0;
    DirectionTuning tuning;
};

struct UnitLickRateRecord {
    int32_t unit = 0;
    LickRateTuning tuning;
};

struct UnitLickResetRecord {
    int32_t unit = 0;
    LickResetResponse response;
};

// ============================================================================
// Session Analyzer
// ============================================================================

/**
 * @brief Runs the per-session analyses against a SessionSource
 *
 * Every analysis either returns a complete result or an AnalysisError; no
 * partial result leaves a failed call. Per-unit work runs on a fixed pool
 * of worker threads, each unit writing only to its own output slot.
 *
 * Example:
 * @code
 *   orotune::InMemorySessionSource source;
 *   // ... populate source ...
 *   orotune::SessionAnalyzer analyzer(source);
 *   auto tuning = analyzer.phase_tuning(orotune::TuningChannel::Breathing);
 *   if (tuning) {
 *       for (const auto& unit : *tuning) { ... }
 *   }
 * @endcode
 */
class SessionAnalyzer {
public:
    struct Config {
        size_t n_threads = 0;                        // 0 = hardware concurrency
        TrackingConfig tracking = TrackingConfig::mtl_rig();
        UnitQualityCriteria unit_quality;

        // Phase tuning
        PhaseAmplitudeExtractor::Config jaw = PhaseAmplitudeExtractor::Config::jaw();
        PhaseAmplitudeExtractor::Config breathing = PhaseAmplitudeExtractor::Config::breathing();
        PhaseAmplitudeExtractor::Config whisker = PhaseAmplitudeExtractor::Config::whisker();
        double breathing_window_s = 5.0;             // Leading part of each trial
        size_t breathing_stride = 100;               // Downsampling of the raw trace
        PermutationSignificanceTester::Config permutation;

        // Movement timing
        double timing_bin_s = 0.0034;
        BoutDetector::Config licking = BoutDetector::Config::licking();
        BoutDetector::Config whisking = BoutDetector::Config::whisking();
        InspirationDetector::Config inspiration;

        // Encoding models
        DesignMatrixBuilder::Config design;
        ShiftedPoissonGLMFitter::Config glm;

        // Licking
        LickResponseAnalyzer::Config lick_response;
        DirectionTuningEstimator::Config direction;
        ContactDetector::Config contact;
        LickRateAnalyzer::Config lick_rate;
        LickResetAnalyzer::Config lick_reset;
    };

    /// The source must outlive the analyzer
    SessionAnalyzer(const SessionSource& source, const Config& config);
    explicit SessionAnalyzer(const SessionSource& source);

    SessionAnalyzer(const SessionAnalyzer&) = delete;
    SessionAnalyzer& operator=(const SessionAnalyzer&) = delete;

    /// Bad and missing video trials of both cameras
    TrialScreening screen_trials() const;

    /// Units passing the quality criteria
    std::vector<UnitInfo> good_units() const;

    /// 3-D tracked trials that survive screening
    std::vector<int32_t> kept_trials() const;

    /**
     * @brief Phase tuning of every good unit to one behavioral rhythm
     *
     * Jaw: side-camera jaw height of trials with the median frame count.
     * Breathing: first `breathing_window_s` of each trial, downsampled.
     * Whisker: first whisker motion component, one row per session trial.
     */
    std::expected<std::vector<UnitTuningRecord>, AnalysisError> phase_tuning(
        TuningChannel channel) const;

    /// Breathing, licking and whisking onsets on the `timing_bin_s` grid
    std::expected<MovementTiming, AnalysisError> movement_timing() const;

    std::expected<SessionGLMResult, AnalysisError> fit_glm(GLMVariant variant) const;

    /// PSTH and latency of every good unit around lick-bout onsets
    std::expected<std::vector<UnitLickResponse>, AnalysisError> lick_responses() const;

    /// Lick-port contacts of every tracked trial with a lick-port track
    std::expected<std::vector<TrialContacts>, AnalysisError> lick_contacts() const;

    std::expected<std::vector<UnitDirectionRecord>, AnalysisError> direction_tuning() const;

    /// Firing of every good unit against instantaneous lick frequency
    std::expected<std::vector<UnitLickRateRecord>, AnalysisError> lick_rate() const;

    /// Firing of every good unit across single- and double-lick breaths
    std::expected<std::vector<UnitLickResetRecord>, AnalysisError> lick_reset() const;

    /// Compute time per unit across all analyses run so far
    TimingStats unit_timing() const { return unit_timer_.get_stats(); }
    void reset_timing() { unit_timer_.reset(); }

    const Config& config() const { return config_; }

private:
    struct LickingSession {
        std::vector<UnitInfo> units;
        MovementTiming timing;
    };

    const SessionSource& source_;
    Config config_;
    mutable LatencyTracker unit_timer_;

    std::expected<SessionStreams, AnalysisError> load_streams(const std::vector<int32_t>& trials,
                                                              bool with_body) const;
    std::expected<MovementTiming, AnalysisError> timing_from_streams(
        const SessionStreams& streams) const;
    UnitSpikes fetch_spikes(int32_t unit, const std::vector<int32_t>& trials) const;
    /// True when every unit has a spike train on each of the trials
    bool spikes_cover(const std::vector<UnitInfo>& units, const std::vector<int32_t>& trials) const;
    std::expected<LickingSession, AnalysisError> licking_session() const;
    std::expected<std::vector<UnitTuningRecord>, AnalysisError> tune_units(
        const Eigen::MatrixXd& phase, const std::vector<int32_t>& trials,
        double sample_rate_hz, const char* channel) const;
};

}  // namespace orotune
