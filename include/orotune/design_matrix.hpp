#pragma once

#include "trace_aligner.hpp"
#include "types.hpp"
#include <expected>
#include <memory>
#include <string>

namespace orotune {

/**
 * @brief Raw behavioral streams of the kept trials of one session
 *
 * Per-trial entries are in numeric trial order and aligned 1:1 with
 * `trial_ids`. Motion components are flat, covering every trial of the
 * session, and are indexed by session trial number (1-based).
 */
struct SessionStreams {
    std::vector<int32_t> trial_ids;
    std::vector<TrialTracking> tracking;
    std::vector<BreathingTrace> breathing;
    Eigen::VectorXd whisker_motion;
    Eigen::VectorXd body_motion;        // Empty when no body camera
};

/**
 * @brief Predictor matrix on a fixed bin grid
 *
 * Rows are bins of `bin_width_s`, columns follow `predictor_names`.
 * `grid_bins[r]` is the index of row r on the unrestricted grid of the
 * partition, which is also the index into the binned spike counts.
 */
struct DesignMatrix {
    Eigen::MatrixXd values;
    std::vector<std::string> predictor_names;
    Eigen::VectorXd tongue_mask;            // 1 where the tongue was reliably tracked
    std::vector<size_t> trials;             // Indices into SessionStreams::trial_ids
    std::vector<Eigen::Index> grid_bins;
    size_t grid_size = 0;
    double bin_width_s = 0.017;
    double trial_duration_s = 0.0;

    Eigen::Index rows() const { return values.rows(); }
    Eigen::Index cols() const { return values.cols(); }
};

/// Train and held-out design matrices of one session
struct PartitionedDesign {
    DesignMatrix train;
    DesignMatrix test;
};

/**
 * @brief Histogram of a unit's spikes on the concatenated trial grid
 *
 * Spikes at or beyond `trial_duration_s` (or negative) are dropped. Trial k
 * of `trials` is offset by k * trial_duration_s.
 *
 * @param spikes Spike trains aligned with the session's kept trials
 * @param trials Which trials to concatenate, in order
 */
Eigen::VectorXd bin_spike_counts(const UnitSpikes& spikes, const std::vector<size_t>& trials,
                                 double trial_duration_s, double bin_width_s, size_t n_bins);

/// Spike counts on the rows of a design matrix
Eigen::VectorXd bin_spike_counts(const UnitSpikes& spikes, const DesignMatrix& design);

/**
 * @brief Assembles aligned, normalized predictors into design matrices
 *
 * Normalization statistics are taken over all kept trials. Smoothing and
 * decimation then run separately for each partition so that no smoothing
 * window straddles a train/test boundary.
 *
 * Predictor order: jaw x/y/z, tongue x/y/z, breathing, whisker[, body].
 */
class DesignMatrixBuilder {
public:
    struct Config {
        size_t holdout_stride = 5;           // Every n-th trial is held out
        bool include_body = false;
        bool correct_motion_sign = true;
        double sign_flip_margin = 0.1;
        double guard_interval_s = 0.2;       // Around lick bouts
        size_t body_frames_per_trial = 500;
        TraceAligner::Config aligner;        // Tracking channels
    };

    DesignMatrixBuilder(const Config& config, const TrackingConfig& tracking);
    explicit DesignMatrixBuilder(const TrackingConfig& tracking);
    ~DesignMatrixBuilder();

    DesignMatrixBuilder(DesignMatrixBuilder&&) noexcept;
    DesignMatrixBuilder& operator=(DesignMatrixBuilder&&) noexcept;

    /**
     * @brief Train/test design matrices with a deterministic trial holdout
     */
    std::expected<PartitionedDesign, AnalysisError> build_partitioned(
        const SessionStreams& streams) const;

    /// One design matrix over every kept trial
    std::expected<DesignMatrix, AnalysisError> build(const SessionStreams& streams) const;

    /**
     * @brief Design matrix restricted to bins away from lick bouts
     *
     * Rows closer than the guard interval to any bout are dropped and every
     * column is z-scored again over the remaining rows. Tongue columns use
     * only their non-zero rows and stay zero where tracking was unreliable.
     */
    std::expected<DesignMatrix, AnalysisError> build_outside_bouts(
        const SessionStreams& streams, const BoutEvents& lick_bouts) const;

    /// Trial positions {test, train}: test holds every `stride`-th trial from 0
    static std::pair<std::vector<size_t>, std::vector<size_t>> holdout_split(
        size_t n_trials, size_t stride);

    /// Bins whose start time keeps `guard_s` clear of every bout
    static std::vector<Eigen::Index> bins_outside_bouts(size_t n_bins, double bin_width_s,
                                                        const BoutEvents& bouts, double guard_s);

    static std::vector<std::string> predictor_names(bool include_body);

    const Config& config() const { return config_; }
    const TrackingConfig& tracking() const { return tracking_; }

private:
    Config config_;
    TrackingConfig tracking_;
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace orotune
