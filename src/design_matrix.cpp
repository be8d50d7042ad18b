#include "orotune/design_matrix.hpp"
#include "orotune/logging.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>

namespace orotune {

// ============================================================================
// Spike Binning
// ============================================================================

Eigen::VectorXd bin_spike_counts(const UnitSpikes& spikes, const std::vector<size_t>& trials,
                                 double trial_duration_s, double bin_width_s, size_t n_bins) {
    if (bin_width_s <= 0.0) {
        throw std::invalid_argument("bin_spike_counts: bin width must be positive");
    }
    Eigen::VectorXd counts = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n_bins));
    for (size_t k = 0; k < trials.size(); ++k) {
        if (trials[k] >= spikes.size()) {
            throw std::invalid_argument("bin_spike_counts: trial index out of range");
        }
        const double offset = static_cast<double>(k) * trial_duration_s;
        for (double t : spikes[trials[k]]) {
            if (t < 0.0 || t >= trial_duration_s) {
                continue;
            }
            const auto bin = static_cast<size_t>(std::floor((t + offset) / bin_width_s));
            if (bin < n_bins) {
                counts(static_cast<Eigen::Index>(bin)) += 1.0;
            }
        }
    }
    return counts;
}

Eigen::VectorXd bin_spike_counts(const UnitSpikes& spikes, const DesignMatrix& design) {
    const Eigen::VectorXd grid = bin_spike_counts(spikes, design.trials, design.trial_duration_s,
                                                  design.bin_width_s, design.grid_size);
    Eigen::VectorXd rows(static_cast<Eigen::Index>(design.grid_bins.size()));
    for (size_t r = 0; r < design.grid_bins.size(); ++r) {
        rows(static_cast<Eigen::Index>(r)) = grid(design.grid_bins[r]);
    }
    return rows;
}

// ============================================================================
// Implementation
// ============================================================================

namespace {

constexpr size_t kTongueColumns = 3;   // tongue x/y/z follow the jaw

Eigen::MatrixXd select_rows(const Eigen::MatrixXd& m, const std::vector<size_t>& rows) {
    Eigen::MatrixXd out(static_cast<Eigen::Index>(rows.size()), m.cols());
    for (size_t i = 0; i < rows.size(); ++i) {
        out.row(static_cast<Eigen::Index>(i)) = m.row(static_cast<Eigen::Index>(rows[i]));
    }
    return out;
}

/// Z-scores a matrix with moments taken where mask != 0
Eigen::MatrixXd masked_zscore(const Eigen::MatrixXd& m, const Eigen::MatrixXd& mask) {
    const Eigen::Map<const Eigen::VectorXd> flat(m.data(), m.size());
    const Eigen::Map<const Eigen::VectorXd> flat_mask(mask.data(), mask.size());
    const dsp::Moments mo = dsp::masked_moments(flat, flat_mask);
    if (!(mo.stddev > 0.0)) {
        return Eigen::MatrixXd::Zero(m.rows(), m.cols());
    }
    return (m.array() - mo.mean) / mo.stddev;
}

/// Reshapes a flat motion component into (trials x frames)
std::expected<Eigen::MatrixXd, AnalysisError> reshape_motion(const Eigen::VectorXd& flat,
                                                             size_t frames,
                                                             const char* view) {
    if (flat.size() == 0) {
        OROTUNE_LOG_WARN("No " << view << " motion component for this session");
        return std::unexpected(AnalysisError::EmptyInput);
    }
    if (static_cast<size_t>(flat.size()) % frames != 0) {
        OROTUNE_LOG_WARN("Bad " << view << " video: " << flat.size()
                         << " samples is not a multiple of " << frames << " frames");
        return std::unexpected(AnalysisError::CorruptDecomposition);
    }
    const auto n_trials = static_cast<Eigen::Index>(static_cast<size_t>(flat.size()) / frames);
    Eigen::MatrixXd out(n_trials, static_cast<Eigen::Index>(frames));
    for (Eigen::Index r = 0; r < n_trials; ++r) {
        out.row(r) = flat.segment(r * out.cols(), out.cols()).transpose();
    }
    return out;
}

/// Picks rows of a session-wide motion matrix by 1-based trial number
std::expected<Eigen::MatrixXd, AnalysisError> rows_for_trials(const Eigen::MatrixXd& motion,
                                                              const std::vector<int32_t>& ids) {
    Eigen::MatrixXd out(static_cast<Eigen::Index>(ids.size()), motion.cols());
    for (size_t i = 0; i < ids.size(); ++i) {
        if (ids[i] < 1 || ids[i] > motion.rows()) {
            OROTUNE_LOG_WARN("Trial " << ids[i] << " is outside the " << motion.rows()
                             << " trials of the motion decomposition");
            return std::unexpected(AnalysisError::TrialCountMismatch);
        }
        out.row(static_cast<Eigen::Index>(i)) = motion.row(ids[i] - 1);
    }
    return out;
}

}  // namespace

struct DesignMatrixBuilder::Impl {
    /// Session-normalized per-trial channels, trials x samples
    struct Prepared {
        std::array<Eigen::MatrixXd, 3> jaw;
        std::array<Eigen::MatrixXd, 3> tongue;
        Eigen::MatrixXd tongue_mask;
        Eigen::MatrixXd breathing;
        double breathing_interval_s = 0.0;
        Eigen::MatrixXd whisker;
        Eigen::MatrixXd body;
    };

    /// One partition on its own grid, before any row restriction
    struct Aligned {
        Eigen::MatrixXd values;
        Eigen::VectorXd tongue_mask;
    };

    Config config;
    TrackingConfig tracking;
    TraceAligner tracking_aligner;
    TraceAligner box_aligner;

    Impl(const Config& cfg, const TrackingConfig& trk)
        : config(cfg)
        , tracking(trk)
        , tracking_aligner(cfg.aligner)
        , box_aligner(TraceAligner::Config{cfg.aligner.bin_width_s,
                                           TraceAligner::Smoothing::MovingAverage}) {}

    std::expected<Prepared, AnalysisError> prepare(const SessionStreams& s) const {
        const size_t n = s.trial_ids.size();
        if (n == 0) {
            return std::unexpected(AnalysisError::EmptyInput);
        }
        if (s.tracking.size() != n || s.breathing.size() != n) {
            OROTUNE_LOG_WARN("Mismatch in tracking and breathing trial number: " << n << " trials, "
                             << s.tracking.size() << " tracked, " << s.breathing.size()
                             << " breathing");
            return std::unexpected(AnalysisError::TrialCountMismatch);
        }

        const auto frames = static_cast<Eigen::Index>(tracking.frames_per_trial);
        const auto rows = static_cast<Eigen::Index>(n);
        Prepared p;
        for (auto& m : p.jaw) m.resize(rows, frames);
        for (auto& m : p.tongue) m.resize(rows, frames);
        p.tongue_mask.resize(rows, frames);

        for (size_t i = 0; i < n; ++i) {
            const TrialTracking& t = s.tracking[i];
            const auto count = t.frame_count();
            if (!count || *count != tracking.frames_per_trial) {
                OROTUNE_LOG_WARN("Trial " << s.trial_ids[i] << " has "
                                 << (count ? std::to_string(*count) : std::string("inconsistent"))
                                 << " frames, expected " << tracking.frames_per_trial);
                return std::unexpected(AnalysisError::ShapeMismatch);
            }
            const auto r = static_cast<Eigen::Index>(i);
            p.jaw[0].row(r) = t.jaw_x.transpose();
            p.jaw[1].row(r) = t.jaw_y.transpose();
            p.jaw[2].row(r) = t.jaw_z.transpose();
            p.tongue[0].row(r) = t.tongue_x.transpose();
            p.tongue[1].row(r) = t.tongue_y.transpose();
            p.tongue[2].row(r) = t.tongue_z.transpose();
            p.tongue_mask.row(r) = dsp::confidence_mask(t.tongue_likelihood_side,
                                                        t.tongue_likelihood_bottom,
                                                        tracking.likelihood_threshold).transpose();
        }

        for (auto& m : p.jaw) m = dsp::zscore(m);
        for (auto& m : p.tongue) m = masked_zscore(m, p.tongue_mask);

        auto breathing = prepare_breathing(s);
        if (!breathing) {
            return std::unexpected(breathing.error());
        }
        p.breathing = std::move(*breathing);
        p.breathing_interval_s = s.breathing.front().sample_interval_s();

        auto whisker = prepare_motion(s.whisker_motion, tracking.frames_per_trial, s.trial_ids,
                                      "whisker");
        if (!whisker) {
            return std::unexpected(whisker.error());
        }
        p.whisker = std::move(*whisker);

        if (config.include_body) {
            auto body = prepare_motion(s.body_motion, config.body_frames_per_trial, s.trial_ids,
                                       "body");
            if (!body) {
                return std::unexpected(body.error());
            }
            p.body = std::move(*body);
        }
        return p;
    }

    /// Keeps samples before the end of the tracked window, z-scored over the session
    std::expected<Eigen::MatrixXd, AnalysisError> prepare_breathing(const SessionStreams& s) const {
        const double duration = tracking.trial_duration_s();
        const double interval = s.breathing.front().sample_interval_s();
        if (!(interval > 0.0)) {
            OROTUNE_LOG_WARN("Breathing timestamps do not define a sample interval");
            return std::unexpected(AnalysisError::ShapeMismatch);
        }

        std::vector<Eigen::VectorXd> kept;
        kept.reserve(s.breathing.size());
        for (size_t i = 0; i < s.breathing.size(); ++i) {
            const BreathingTrace& b = s.breathing[i];
            if (b.samples.size() != b.timestamps.size()) {
                return std::unexpected(AnalysisError::ShapeMismatch);
            }
            Eigen::Index count = 0;
            while (count < b.timestamps.size() && b.timestamps(count) < duration) ++count;
            kept.push_back(b.samples.head(count));
            if (kept.back().size() != kept.front().size() || count == 0) {
                OROTUNE_LOG_WARN("Breathing of trial " << s.trial_ids[i] << " has " << count
                                 << " samples in the tracked window, expected "
                                 << kept.front().size());
                return std::unexpected(AnalysisError::ShapeMismatch);
            }
        }

        Eigen::MatrixXd m(static_cast<Eigen::Index>(kept.size()), kept.front().size());
        for (size_t i = 0; i < kept.size(); ++i) {
            m.row(static_cast<Eigen::Index>(i)) = kept[i].transpose();
        }
        return dsp::zscore(m);
    }

    std::expected<Eigen::MatrixXd, AnalysisError> prepare_motion(const Eigen::VectorXd& flat,
                                                                 size_t frames,
                                                                 const std::vector<int32_t>& ids,
                                                                 const char* view) const {
        auto motion = reshape_motion(flat, frames, view);
        if (!motion) {
            return std::unexpected(motion.error());
        }
        Eigen::MatrixXd normalized = dsp::zscore(*motion);
        if (config.correct_motion_sign && dsp::correct_sign(normalized, config.sign_flip_margin)) {
            OROTUNE_LOG_DEBUG("Flipped sign of the " << view << " motion component");
        }
        return rows_for_trials(normalized, ids);
    }

    std::expected<Aligned, AnalysisError> align(const Prepared& p,
                                                const std::vector<size_t>& trials) const {
        if (trials.empty()) {
            return std::unexpected(AnalysisError::EmptyInput);
        }
        const double dt = tracking.frame_interval_s;
        const size_t grid = tracking_aligner.aligned_length(
            trials.size() * tracking.frames_per_trial, dt);

        std::vector<Eigen::VectorXd> columns;
        for (const auto& m : p.jaw) {
            columns.push_back(tracking_aligner.align_trials(select_rows(m, trials), dt));
        }
        Eigen::VectorXd mask = tracking_aligner.align_mask(
            dsp::concatenate_rows(select_rows(p.tongue_mask, trials)), dt);
        for (const auto& m : p.tongue) {
            columns.push_back(tracking_aligner.align_trials(select_rows(m, trials), dt));
        }
        columns.push_back(box_aligner.align_trials(select_rows(p.breathing, trials),
                                                   p.breathing_interval_s));
        columns.push_back(box_aligner.align_trials(select_rows(p.whisker, trials), dt));

        // Streams of other native rates may round to a slightly different grid
        size_t common = grid;
        const size_t tolerance = std::max<size_t>(1, trials.size());
        for (const auto& c : columns) {
            const auto len = static_cast<size_t>(c.size());
            const size_t diff = len > grid ? len - grid : grid - len;
            if (diff > tolerance) {
                OROTUNE_LOG_WARN("Aligned stream has " << len << " bins, tracking grid has " << grid);
                return std::unexpected(AnalysisError::ShapeMismatch);
            }
            common = std::min(common, len);
        }
        if (common == 0) {
            return std::unexpected(AnalysisError::EmptyInput);
        }
        for (const auto& c : columns) {
            if (static_cast<size_t>(c.size()) != common) {
                OROTUNE_LOG_WARN("Truncating aligned streams to " << common << " bins, one stream has "
                                 << c.size() << " and the tracking grid has " << grid);
                break;
            }
        }

        if (config.include_body) {
            columns.push_back(dsp::resample_fourier(
                dsp::concatenate_rows(select_rows(p.body, trials)), common));
        }

        Aligned a;
        const auto rows = static_cast<Eigen::Index>(common);
        a.values.resize(rows, static_cast<Eigen::Index>(columns.size()));
        for (size_t c = 0; c < columns.size(); ++c) {
            a.values.col(static_cast<Eigen::Index>(c)) = columns[c].head(rows);
        }
        a.tongue_mask = mask.head(rows);
        for (size_t c = kTongueColumns; c < kTongueColumns + 3; ++c) {
            a.values.col(static_cast<Eigen::Index>(c)).array() *= a.tongue_mask.array();
        }
        return a;
    }

    DesignMatrix to_design(Aligned&& a, std::vector<size_t> trials) const {
        DesignMatrix d;
        d.values = std::move(a.values);
        d.tongue_mask = std::move(a.tongue_mask);
        d.predictor_names = predictor_names(config.include_body);
        d.trials = std::move(trials);
        d.grid_size = static_cast<size_t>(d.values.rows());
        d.grid_bins.resize(d.grid_size);
        for (size_t r = 0; r < d.grid_size; ++r) {
            d.grid_bins[r] = static_cast<Eigen::Index>(r);
        }
        d.bin_width_s = config.aligner.bin_width_s;
        d.trial_duration_s = tracking.trial_duration_s();
        return d;
    }
};

// ============================================================================
// Construction
// ============================================================================

DesignMatrixBuilder::DesignMatrixBuilder(const Config& config, const TrackingConfig& tracking)
    : config_(config)
    , tracking_(tracking) {
    if (config_.holdout_stride < 2) {
        throw std::invalid_argument("Holdout stride must be at least 2");
    }
    if (!tracking_.is_valid() || config_.body_frames_per_trial == 0) {
        throw std::invalid_argument("Invalid tracking layout");
    }
    impl_ = std::make_unique<Impl>(config_, tracking_);
}

DesignMatrixBuilder::DesignMatrixBuilder(const TrackingConfig& tracking)
    : DesignMatrixBuilder(Config{}, tracking) {}

DesignMatrixBuilder::~DesignMatrixBuilder() = default;
DesignMatrixBuilder::DesignMatrixBuilder(DesignMatrixBuilder&&) noexcept = default;
DesignMatrixBuilder& DesignMatrixBuilder::operator=(DesignMatrixBuilder&&) noexcept = default;

// ============================================================================
// Building
// ============================================================================

std::expected<PartitionedDesign, AnalysisError> DesignMatrixBuilder::build_partitioned(
    const SessionStreams& streams) const {
    auto prepared = impl_->prepare(streams);
    if (!prepared) {
        return std::unexpected(prepared.error());
    }

    auto [test_trials, train_trials] = holdout_split(streams.trial_ids.size(),
                                                     config_.holdout_stride);
    if (train_trials.empty() || test_trials.empty()) {
        OROTUNE_LOG_WARN("Too few trials (" << streams.trial_ids.size() << ") for a holdout");
        return std::unexpected(AnalysisError::EmptyInput);
    }

    auto train = impl_->align(*prepared, train_trials);
    if (!train) {
        return std::unexpected(train.error());
    }
    auto test = impl_->align(*prepared, test_trials);
    if (!test) {
        return std::unexpected(test.error());
    }

    PartitionedDesign result;
    result.train = impl_->to_design(std::move(*train), std::move(train_trials));
    result.test = impl_->to_design(std::move(*test), std::move(test_trials));
    OROTUNE_LOG_INFO("Design matrix: " << result.train.rows() << " train bins, "
                     << result.test.rows() << " test bins, " << result.train.cols()
                     << " predictors");
    return result;
}

std::expected<DesignMatrix, AnalysisError> DesignMatrixBuilder::build(
    const SessionStreams& streams) const {
    auto prepared = impl_->prepare(streams);
    if (!prepared) {
        return std::unexpected(prepared.error());
    }
    std::vector<size_t> trials(streams.trial_ids.size());
    for (size_t i = 0; i < trials.size(); ++i) trials[i] = i;

    auto aligned = impl_->align(*prepared, trials);
    if (!aligned) {
        return std::unexpected(aligned.error());
    }
    return impl_->to_design(std::move(*aligned), std::move(trials));
}

std::expected<DesignMatrix, AnalysisError> DesignMatrixBuilder::build_outside_bouts(
    const SessionStreams& streams, const BoutEvents& lick_bouts) const {
    auto prepared = impl_->prepare(streams);
    if (!prepared) {
        return std::unexpected(prepared.error());
    }
    std::vector<size_t> trials(streams.trial_ids.size());
    for (size_t i = 0; i < trials.size(); ++i) trials[i] = i;

    auto aligned = impl_->align(*prepared, trials);
    if (!aligned) {
        return std::unexpected(aligned.error());
    }

    const std::vector<Eigen::Index> keep = bins_outside_bouts(
        static_cast<size_t>(aligned->values.rows()), config_.aligner.bin_width_s, lick_bouts,
        config_.guard_interval_s);
    if (keep.empty()) {
        OROTUNE_LOG_WARN("No bins left outside lick bouts");
        return std::unexpected(AnalysisError::EmptyInput);
    }

    const Eigen::Index cols = aligned->values.cols();
    Eigen::MatrixXd restricted(static_cast<Eigen::Index>(keep.size()), cols);
    Eigen::VectorXd mask(static_cast<Eigen::Index>(keep.size()));
    for (size_t r = 0; r < keep.size(); ++r) {
        restricted.row(static_cast<Eigen::Index>(r)) = aligned->values.row(keep[r]);
        mask(static_cast<Eigen::Index>(r)) = aligned->tongue_mask(keep[r]);
    }

    for (Eigen::Index c = 0; c < cols; ++c) {
        const Eigen::VectorXd column = restricted.col(c);
        const bool tongue = c >= static_cast<Eigen::Index>(kTongueColumns) &&
                            c < static_cast<Eigen::Index>(kTongueColumns + 3);
        restricted.col(c) = tongue
            ? Eigen::VectorXd(dsp::nonzero_zscore(column).array() * mask.array())
            : dsp::zscore(column);
    }

    DesignMatrix d = impl_->to_design(Impl::Aligned{std::move(restricted), mask}, std::move(trials));
    d.grid_size = static_cast<size_t>(aligned->values.rows());
    d.grid_bins = keep;
    OROTUNE_LOG_INFO("Design matrix outside lick bouts: " << d.rows() << " of " << d.grid_size
                     << " bins kept");
    return d;
}

// ============================================================================
// Partitioning
// ============================================================================

std::pair<std::vector<size_t>, std::vector<size_t>> DesignMatrixBuilder::holdout_split(
    size_t n_trials, size_t stride) {
    if (stride == 0) {
        throw std::invalid_argument("holdout_split: stride must be positive");
    }
    std::vector<size_t> test;
    std::vector<size_t> train;
    for (size_t i = 0; i < n_trials; ++i) {
        (i % stride == 0 ? test : train).push_back(i);
    }
    return {std::move(test), std::move(train)};
}

std::vector<Eigen::Index> DesignMatrixBuilder::bins_outside_bouts(size_t n_bins,
                                                                  double bin_width_s,
                                                                  const BoutEvents& bouts,
                                                                  double guard_s) {
    if (bouts.onsets.size() != bouts.offsets.size()) {
        throw std::invalid_argument("bins_outside_bouts: unpaired bout events");
    }
    std::vector<Eigen::Index> keep;
    keep.reserve(n_bins);
    for (size_t i = 0; i < n_bins; ++i) {
        const double t = static_cast<double>(i) * bin_width_s;
        bool clear = true;
        for (size_t b = 0; b < bouts.size(); ++b) {
            if (t >= bouts.onsets[b] - guard_s && t <= bouts.offsets[b] + guard_s) {
                clear = false;
                break;
            }
        }
        if (clear) {
            keep.push_back(static_cast<Eigen::Index>(i));
        }
    }
    return keep;
}

std::vector<std::string> DesignMatrixBuilder::predictor_names(bool include_body) {
    std::vector<std::string> names{"jaw_x", "jaw_y", "jaw_z",
                                   "tongue_x", "tongue_y", "tongue_z",
                                   "breathing", "whisker"};
    if (include_body) {
        names.emplace_back("body");
    }
    return names;
}

}  // namespace orotune
