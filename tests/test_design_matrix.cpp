#include <gtest/gtest.h>
#include <orotune/design_matrix.hpp>
#include <orotune/logging.hpp>
#include <orotune/trace_aligner.hpp>
#include <algorithm>
#include <cmath>
#include <random>
#include <set>
#include <string>

using namespace orotune;

class DesignMatrixTest : public ::testing::Test {
protected:
    static constexpr size_t kFrames = 1471;
    static constexpr double kFrameInterval = 0.0034;
    static constexpr double kBreathingInterval = 0.001;

    /// Kept trials 1..n_trials of a session with `session_trials` motion rows
    SessionStreams make_streams(size_t n_trials, size_t session_trials) {
        std::normal_distribution<double> noise(0.0, 1.0);
        SessionStreams s;
        for (size_t k = 0; k < n_trials; ++k) {
            s.trial_ids.push_back(static_cast<int32_t>(k + 1));

            TrialTracking t;
            for (Eigen::VectorXd* v : {&t.jaw_x, &t.jaw_y, &t.jaw_z,
                                       &t.tongue_x, &t.tongue_y, &t.tongue_z}) {
                v->resize(kFrames);
                for (Eigen::Index i = 0; i < v->size(); ++i) {
                    const double time = static_cast<double>(i) * kFrameInterval;
                    (*v)(i) = std::sin(TWO_PI * 6.0 * time) + 0.2 * noise(gen_);
                }
            }
            t.tongue_likelihood_side = Eigen::VectorXd::Constant(kFrames, 0.99);
            t.tongue_likelihood_bottom = Eigen::VectorXd::Constant(kFrames, 0.99);
            // Tongue only visible in the second half of every trial
            t.tongue_likelihood_bottom.head(kFrames / 2).setConstant(0.1);
            s.tracking.push_back(std::move(t));

            BreathingTrace b;
            const Eigen::Index n = 5500;
            b.samples.resize(n);
            b.timestamps.resize(n);
            for (Eigen::Index i = 0; i < n; ++i) {
                b.timestamps(i) = static_cast<double>(i) * kBreathingInterval;
                b.samples(i) = std::sin(TWO_PI * 4.0 * b.timestamps(i)) + 0.1 * noise(gen_);
            }
            s.breathing.push_back(std::move(b));
        }

        s.whisker_motion.resize(static_cast<Eigen::Index>(session_trials * kFrames));
        for (Eigen::Index i = 0; i < s.whisker_motion.size(); ++i) {
            s.whisker_motion(i) = noise(gen_);
        }
        s.body_motion.resize(static_cast<Eigen::Index>(session_trials * 500));
        for (Eigen::Index i = 0; i < s.body_motion.size(); ++i) {
            s.body_motion(i) = noise(gen_);
        }
        return s;
    }

    std::mt19937 gen_{42};
    TrackingConfig tracking_ = TrackingConfig::mtl_rig();
};

// ============================================================================
// Partitioning
// ============================================================================

TEST_F(DesignMatrixTest, HoldoutSplitEveryFifthTrial) {
    const auto [test, train] = DesignMatrixBuilder::holdout_split(12, 5);
    EXPECT_EQ(test, (std::vector<size_t>{0, 5, 10}));
    EXPECT_EQ(train, (std::vector<size_t>{1, 2, 3, 4, 6, 7, 8, 9, 11}));
    EXPECT_THROW(DesignMatrixBuilder::holdout_split(12, 0), std::invalid_argument);
}

TEST_F(DesignMatrixTest, PartitionsAreDisjointAndCoverSession) {
    const SessionStreams streams = make_streams(10, 10);
    DesignMatrixBuilder builder(tracking_);

    const auto partitioned = builder.build_partitioned(streams);
    ASSERT_TRUE(partitioned.has_value()) << to_string(partitioned.error());

    const auto& train = partitioned->train;
    const auto& test = partitioned->test;
    EXPECT_EQ(test.trials, (std::vector<size_t>{0, 5}));

    std::set<size_t> all(train.trials.begin(), train.trials.end());
    for (size_t t : test.trials) {
        EXPECT_EQ(all.count(t), 0u) << "trial " << t << " in both partitions";
        all.insert(t);
    }
    EXPECT_EQ(all.size(), 10u);

    // Separate smoothing per partition loses at most a bin per trial
    const auto full = builder.build(streams);
    ASSERT_TRUE(full.has_value());
    const auto split_rows = train.rows() + test.rows();
    EXPECT_LE(std::abs(split_rows - full->rows()), 10);

    EXPECT_EQ(train.cols(), 8);
    EXPECT_EQ(train.predictor_names, DesignMatrixBuilder::predictor_names(false));
    EXPECT_TRUE(train.values.allFinite());
    EXPECT_TRUE(test.values.allFinite());
}

TEST_F(DesignMatrixTest, BuildIsDeterministic) {
    const SessionStreams streams = make_streams(6, 6);
    DesignMatrixBuilder builder(tracking_);
    const auto a = builder.build_partitioned(streams);
    const auto b = builder.build_partitioned(streams);
    ASSERT_TRUE(a.has_value() && b.has_value());
    EXPECT_EQ(a->train.values, b->train.values);
    EXPECT_EQ(a->test.values, b->test.values);
}

TEST_F(DesignMatrixTest, TooFewTrialsForHoldout) {
    const SessionStreams streams = make_streams(1, 1);
    DesignMatrixBuilder builder(tracking_);
    const auto result = builder.build_partitioned(streams);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), AnalysisError::EmptyInput);
}

// ============================================================================
// Tongue Masking
// ============================================================================

TEST_F(DesignMatrixTest, TongueColumnsZeroWhereUntracked) {
    const SessionStreams streams = make_streams(5, 5);
    DesignMatrixBuilder builder(tracking_);
    const auto design = builder.build(streams);
    ASSERT_TRUE(design.has_value());

    ASSERT_EQ(design->tongue_mask.size(), design->rows());
    size_t masked = 0;
    for (Eigen::Index r = 0; r < design->rows(); ++r) {
        if (design->tongue_mask(r) == 0.0) {
            ++masked;
            for (Eigen::Index c = 3; c < 6; ++c) {
                EXPECT_EQ(design->values(r, c), 0.0);
            }
        }
    }
    // Roughly half of every trial is untracked
    EXPECT_GT(masked, static_cast<size_t>(design->rows()) / 3);
    EXPECT_LT(masked, static_cast<size_t>(design->rows()) * 2 / 3);
}

// ============================================================================
// Lick Bout Exclusion
// ============================================================================

TEST_F(DesignMatrixTest, BinsOutsideBouts) {
    BoutEvents bouts;
    bouts.onsets = {2.0};
    bouts.offsets = {3.0};
    const auto keep = DesignMatrixBuilder::bins_outside_bouts(100, 0.1, bouts, 0.2);

    auto kept = [&](Eigen::Index bin) {
        return std::find(keep.begin(), keep.end(), bin) != keep.end();
    };
    EXPECT_TRUE(kept(0));
    EXPECT_TRUE(kept(17));
    EXPECT_FALSE(kept(19));
    EXPECT_FALSE(kept(25));
    EXPECT_FALSE(kept(31));
    EXPECT_TRUE(kept(33));
    EXPECT_TRUE(kept(99));
    EXPECT_TRUE(std::is_sorted(keep.begin(), keep.end()));

    bouts.offsets.clear();
    EXPECT_THROW(DesignMatrixBuilder::bins_outside_bouts(100, 0.1, bouts, 0.2),
                 std::invalid_argument);
}

TEST_F(DesignMatrixTest, OutsideBoutsRenormalizes) {
    const SessionStreams streams = make_streams(4, 4);
    DesignMatrixBuilder builder(tracking_);

    BoutEvents bouts;
    bouts.onsets = {1.0, 8.0};
    bouts.offsets = {2.0, 9.5};
    const auto design = builder.build_outside_bouts(streams, bouts);
    ASSERT_TRUE(design.has_value()) << to_string(design.error());

    EXPECT_LT(design->rows(), static_cast<Eigen::Index>(design->grid_size));
    ASSERT_EQ(design->grid_bins.size(), static_cast<size_t>(design->rows()));
    for (Eigen::Index bin : design->grid_bins) {
        const double t = static_cast<double>(bin) * design->bin_width_s;
        EXPECT_FALSE(t > 0.9 && t < 2.1) << "bin at " << t << " s";
        EXPECT_FALSE(t > 7.9 && t < 9.6) << "bin at " << t << " s";
    }

    // Non-tongue predictors are z-scored over the kept rows
    for (Eigen::Index c : {0, 1, 2, 6, 7}) {
        const Eigen::VectorXd col = design->values.col(c);
        const double mean = col.mean();
        const double sd = std::sqrt((col.array() - mean).square().mean());
        EXPECT_NEAR(mean, 0.0, 1e-9) << design->predictor_names[static_cast<size_t>(c)];
        EXPECT_NEAR(sd, 1.0, 1e-9) << design->predictor_names[static_cast<size_t>(c)];
    }
    for (Eigen::Index r = 0; r < design->rows(); ++r) {
        if (design->tongue_mask(r) == 0.0) {
            EXPECT_EQ(design->values(r, 4), 0.0);
        }
    }
}

// ============================================================================
// Spike Binning
// ============================================================================

TEST_F(DesignMatrixTest, BinSpikeCountsConcatenatesTrials) {
    const UnitSpikes spikes{{0.0, 0.02, 6.0}, {0.01}, {-0.1, 0.55}};
    const Eigen::VectorXd counts = bin_spike_counts(spikes, {0, 2}, 1.0, 0.1, 20);

    ASSERT_EQ(counts.size(), 20);
    EXPECT_EQ(counts(0), 2.0);
    EXPECT_EQ(counts(15), 1.0);
    EXPECT_EQ(counts.sum(), 3.0);

    EXPECT_THROW(bin_spike_counts(spikes, {3}, 1.0, 0.1, 20), std::invalid_argument);
    EXPECT_THROW(bin_spike_counts(spikes, {0}, 1.0, 0.0, 20), std::invalid_argument);
}

TEST_F(DesignMatrixTest, SpikeCountsFollowDesignRows) {
    const SessionStreams streams = make_streams(5, 5);
    DesignMatrixBuilder builder(tracking_);

    BoutEvents bouts;
    bouts.onsets = {3.0};
    bouts.offsets = {4.0};
    const auto design = builder.build_outside_bouts(streams, bouts);
    ASSERT_TRUE(design.has_value());

    UnitSpikes spikes(5);
    for (auto& train : spikes) {
        for (double t = 0.005; t < 5.0; t += 0.05) train.push_back(t);
    }
    const Eigen::VectorXd rows = bin_spike_counts(spikes, *design);
    const Eigen::VectorXd grid = bin_spike_counts(spikes, design->trials, design->trial_duration_s,
                                                  design->bin_width_s, design->grid_size);
    ASSERT_EQ(rows.size(), design->rows());
    for (size_t r = 0; r < design->grid_bins.size(); ++r) {
        EXPECT_EQ(rows(static_cast<Eigen::Index>(r)), grid(design->grid_bins[r]));
    }
}

// ============================================================================
// Failure Modes
// ============================================================================

TEST_F(DesignMatrixTest, CorruptWhiskerDecomposition) {
    SessionStreams streams = make_streams(5, 5);
    streams.whisker_motion.conservativeResize(streams.whisker_motion.size() - 7);
    DesignMatrixBuilder builder(tracking_);

    const auto result = builder.build_partitioned(streams);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), AnalysisError::CorruptDecomposition);

    streams.whisker_motion.resize(0);
    EXPECT_EQ(builder.build(streams).error(), AnalysisError::EmptyInput);
}

TEST_F(DesignMatrixTest, FrameCountMismatch) {
    SessionStreams streams = make_streams(5, 5);
    streams.tracking[2].jaw_x.conservativeResize(kFrames - 1);
    DesignMatrixBuilder builder(tracking_);

    const auto result = builder.build(streams);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), AnalysisError::ShapeMismatch);
}

TEST_F(DesignMatrixTest, TrialCountMismatch) {
    SessionStreams streams = make_streams(5, 5);
    streams.breathing.pop_back();
    DesignMatrixBuilder builder(tracking_);
    EXPECT_EQ(builder.build(streams).error(), AnalysisError::TrialCountMismatch);

    // Trial 6 has no row in a five-trial motion decomposition
    streams = make_streams(5, 5);
    streams.trial_ids.back() = 6;
    EXPECT_EQ(builder.build(streams).error(), AnalysisError::TrialCountMismatch);
}

TEST_F(DesignMatrixTest, UnequalStreamLengthsTruncatedWithWarning) {
    // Five trials: the breathing grid comes out one bin longer than the tracking grid
    TraceAligner aligner;
    const size_t tracking_bins = aligner.aligned_length(5 * kFrames, kFrameInterval);
    const size_t breathing_bins = aligner.aligned_length(5 * 5002, kBreathingInterval);
    ASSERT_NE(tracking_bins, breathing_bins);

    const SessionStreams streams = make_streams(5, 5);
    DesignMatrixBuilder builder(tracking_);

    const LogVerbosity previous = get_log_verbosity();
    set_log_verbosity(LogVerbosity::Warn);
    testing::internal::CaptureStderr();
    const auto design = builder.build(streams);
    const std::string log = testing::internal::GetCapturedStderr();
    set_log_verbosity(previous);

    ASSERT_TRUE(design.has_value()) << to_string(design.error());
    EXPECT_EQ(static_cast<size_t>(design->rows()), std::min(tracking_bins, breathing_bins));
    EXPECT_NE(log.find("Truncating aligned streams"), std::string::npos) << log;
}

TEST_F(DesignMatrixTest, BodyPredictorAppended) {
    const SessionStreams streams = make_streams(6, 8);
    DesignMatrixBuilder::Config config;
    config.include_body = true;
    config.aligner.smoothing = TraceAligner::Smoothing::Median;
    DesignMatrixBuilder builder(config, tracking_);

    const auto design = builder.build(streams);
    ASSERT_TRUE(design.has_value()) << to_string(design.error());
    EXPECT_EQ(design->cols(), 9);
    EXPECT_EQ(design->predictor_names.back(), "body");
    EXPECT_TRUE(design->values.allFinite());
}

TEST_F(DesignMatrixTest, RejectsInvalidConfig) {
    DesignMatrixBuilder::Config config;
    config.holdout_stride = 1;
    EXPECT_THROW((DesignMatrixBuilder{config, tracking_}), std::invalid_argument);

    TrackingConfig broken = tracking_;
    broken.frame_interval_s = 0.0;
    EXPECT_THROW(DesignMatrixBuilder{broken}, std::invalid_argument);
}
