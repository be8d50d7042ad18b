#include "orotune/session_analyzer.hpp"
#include "orotune/logging.hpp"
#include "orotune/parallel.hpp"
#include "orotune/trace_aligner.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <span>
#include <stdexcept>

namespace orotune {

namespace {

std::span<const double> as_span(const Eigen::VectorXd& v) {
    return {v.data(), static_cast<size_t>(v.size())};
}

/// Elements of sorted `a` that are not in sorted `b`
std::vector<int32_t> difference(const std::vector<int32_t>& a, const std::vector<int32_t>& b) {
    std::vector<int32_t> out;
    std::set_difference(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
    return out;
}

/// Every stride-th sample starting with the first
Eigen::VectorXd strided(const Eigen::VectorXd& x, size_t stride) {
    const auto s = static_cast<Eigen::Index>(stride);
    const Eigen::Index n = (x.size() + s - 1) / s;
    Eigen::VectorXd out(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        out(i) = x(i * s);
    }
    return out;
}

Eigen::MatrixXd stack_rows(const std::vector<Eigen::VectorXd>& rows) {
    Eigen::MatrixXd out(static_cast<Eigen::Index>(rows.size()), rows.front().size());
    for (size_t r = 0; r < rows.size(); ++r) {
        out.row(static_cast<Eigen::Index>(r)) = rows[r].transpose();
    }
    return out;
}

Eigen::VectorXd first_row(const Eigen::MatrixXd& m) {
    return m.row(0).transpose();
}

}  // namespace

// ============================================================================
// Records
// ============================================================================

std::vector<int32_t> TrialScreening::excluded() const {
    std::vector<int32_t> all;
    for (const auto* list : {&bad_side, &bad_bottom, &missing_side, &missing_bottom}) {
        all.insert(all.end(), list->begin(), list->end());
    }
    std::sort(all.begin(), all.end());
    all.erase(std::unique(all.begin(), all.end()), all.end());
    return all;
}

bool TrialScreening::excludes(int32_t trial) const {
    for (const auto* list : {&bad_side, &bad_bottom, &missing_side, &missing_bottom}) {
        if (std::find(list->begin(), list->end(), trial) != list->end()) {
            return true;
        }
    }
    return false;
}

std::string_view to_string(GLMVariant variant) {
    switch (variant) {
        case GLMVariant::Standard:   return "standard";
        case GLMVariant::NoLick:     return "no-lick";
        case GLMVariant::NoLickBody: return "no-lick with body";
    }
    return "unknown";
}

// ============================================================================
// Construction
// ============================================================================

SessionAnalyzer::SessionAnalyzer(const SessionSource& source, const Config& config)
    : source_(source)
    , config_(config) {
    if (!config_.tracking.is_valid()) {
        throw std::invalid_argument("Invalid tracking layout");
    }
    if (config_.breathing_stride == 0 || !(config_.breathing_window_s > 0.0) ||
        !(config_.timing_bin_s > 0.0)) {
        throw std::invalid_argument("Invalid session analysis configuration");
    }
}

SessionAnalyzer::SessionAnalyzer(const SessionSource& source)
    : SessionAnalyzer(source, Config{}) {}

// ============================================================================
// Trial and Unit Selection
// ============================================================================

TrialScreening SessionAnalyzer::screen_trials() const {
    TrialScreening screening;
    const std::vector<int32_t> session = source_.session_trials();
    const auto frames = static_cast<Eigen::Index>(config_.tracking.frames_per_trial);

    for (Camera camera : {Camera::Side, Camera::Bottom}) {
        const bool side = camera == Camera::Side;
        const std::vector<int32_t> tracked = source_.camera_trials(camera);
        auto& bad = side ? screening.bad_side : screening.bad_bottom;
        for (int32_t trial : tracked) {
            if (source_.jaw_y(camera, trial).size() != frames) {
                bad.push_back(trial);
            }
        }
        (side ? screening.missing_side : screening.missing_bottom) = difference(session, tracked);
    }

    OROTUNE_LOG_INFO("Trial screening: " << screening.bad_side.size() << " bad side, "
                     << screening.bad_bottom.size() << " bad bottom, "
                     << screening.missing_side.size() << " missing side, "
                     << screening.missing_bottom.size() << " missing bottom");
    return screening;
}

std::vector<UnitInfo> SessionAnalyzer::good_units() const {
    std::vector<UnitInfo> units = source_.units();
    std::erase_if(units, [this](const UnitInfo& u) {
        return !config_.unit_quality.passes(u.quality);
    });
    return units;
}

std::vector<int32_t> SessionAnalyzer::kept_trials() const {
    return difference(source_.tracked_trials(), screen_trials().excluded());
}

UnitSpikes SessionAnalyzer::fetch_spikes(int32_t unit, const std::vector<int32_t>& trials) const {
    UnitSpikes spikes;
    spikes.reserve(trials.size());
    for (int32_t trial : trials) {
        spikes.push_back(source_.spike_times(unit, trial));
    }
    return spikes;
}

bool SessionAnalyzer::spikes_cover(const std::vector<UnitInfo>& units,
                                   const std::vector<int32_t>& trials) const {
    std::vector<int32_t> wanted = trials;
    std::sort(wanted.begin(), wanted.end());
    for (const UnitInfo& unit : units) {
        const std::vector<int32_t> recorded = source_.ephys_trials(unit.id);
        if (!std::includes(recorded.begin(), recorded.end(), wanted.begin(), wanted.end())) {
            OROTUNE_LOG_WARN("Mismatch in tracking trial and ephys trial number: unit " << unit.id
                             << " lacks spike trains on " << difference(wanted, recorded).size()
                             << " of " << wanted.size() << " trials");
            return false;
        }
    }
    return true;
}

std::expected<SessionStreams, AnalysisError> SessionAnalyzer::load_streams(
    const std::vector<int32_t>& trials, bool with_body) const {
    if (trials.empty()) {
        OROTUNE_LOG_WARN("No tracked trials left after screening");
        return std::unexpected(AnalysisError::EmptyInput);
    }

    SessionStreams streams;
    streams.trial_ids = trials;
    for (int32_t trial : trials) {
        auto tracking = source_.tracking(trial);
        auto breathing = source_.breathing(trial);
        if (!tracking || !breathing) {
            OROTUNE_LOG_WARN("Trial " << trial << " lacks "
                             << (tracking ? "breathing" : "tracking"));
            return std::unexpected(AnalysisError::TrialCountMismatch);
        }
        streams.tracking.push_back(std::move(*tracking));
        streams.breathing.push_back(std::move(*breathing));
    }
    streams.whisker_motion = source_.motion(MotionView::Whisker);
    if (with_body) {
        streams.body_motion = source_.motion(MotionView::Body);
    }
    return streams;
}

// ============================================================================
// Phase Tuning
// ============================================================================

std::expected<std::vector<UnitTuningRecord>, AnalysisError> SessionAnalyzer::tune_units(
    const Eigen::MatrixXd& phase, const std::vector<int32_t>& trials,
    double sample_rate_hz, const char* channel) const {

    const std::vector<UnitInfo> units = good_units();
    if (units.empty()) {
        OROTUNE_LOG_WARN("No units pass the quality criteria");
        return std::unexpected(AnalysisError::EmptyInput);
    }
    if (!spikes_cover(units, trials)) {
        return std::unexpected(AnalysisError::TrialCountMismatch);
    }

    const std::vector<double> all_phases(phase.data(), phase.data() + phase.size());
    const PermutationSignificanceTester tester(config_.permutation);
    const auto n_samples = static_cast<double>(phase.cols());

    std::vector<UnitTuningRecord> records(units.size());
    parallel_for(units.size(), config_.n_threads, [&](size_t u) {
        OROTUNE_TIMED_SCOPE(unit_timer_);
        const UnitSpikes spikes = fetch_spikes(units[u].id, trials);

        std::vector<double> spike_phases;
        for (size_t r = 0; r < spikes.size(); ++r) {
            for (double t : spikes[r]) {
                const double index = std::floor(t * sample_rate_hz);
                if (index >= 0.0 && index < n_samples) {
                    spike_phases.push_back(phase(static_cast<Eigen::Index>(r),
                                                 static_cast<Eigen::Index>(index)));
                }
            }
        }

        auto tested = tester.test(all_phases, spike_phases, sample_rate_hz,
                                  static_cast<uint64_t>(units[u].id));
        UnitTuningRecord& record = records[u];
        record.unit = units[u].id;
        record.curve = std::move(tested.observed);
        record.kuiper_statistic = tested.kuiper_statistic;
        record.kuiper_p = tested.kuiper_p;
        record.permutation_p = tested.permutation_p;
        record.null_modulation = std::move(tested.null_modulation);
        OROTUNE_LOG_INFO(channel << " tuning of unit " << record.unit << ": MI "
                         << record.curve.modulation_index << ", p " << record.permutation_p);
    });
    return records;
}

std::expected<std::vector<UnitTuningRecord>, AnalysisError> SessionAnalyzer::phase_tuning(
    TuningChannel channel) const {

    switch (channel) {
    case TuningChannel::Jaw: {
        const std::vector<int32_t> tracked = source_.camera_trials(Camera::Side);
        std::vector<Eigen::VectorXd> traces;
        std::vector<double> lengths;
        for (int32_t trial : tracked) {
            traces.push_back(source_.jaw_y(Camera::Side, trial));
            lengths.push_back(static_cast<double>(traces.back().size()));
        }
        if (traces.empty()) {
            OROTUNE_LOG_WARN("No side-camera jaw tracking");
            return std::unexpected(AnalysisError::EmptyInput);
        }

        // Trials of the typical length only
        const auto canonical = static_cast<Eigen::Index>(std::lround(dsp::median(lengths)));
        std::vector<int32_t> trials;
        std::vector<Eigen::VectorXd> kept;
        for (size_t i = 0; i < traces.size(); ++i) {
            if (traces[i].size() == canonical && canonical > 0) {
                trials.push_back(tracked[i]);
                kept.push_back(std::move(traces[i]));
            }
        }
        if (kept.empty()) {
            return std::unexpected(AnalysisError::EmptyInput);
        }

        const PhaseAmplitudeExtractor extractor(config_.jaw);
        const Eigen::MatrixXd phase = to_positive_phase(extractor.extract(stack_rows(kept)).phase);
        return tune_units(phase, trials, config_.jaw.sample_rate_hz, "Jaw");
    }

    case TuningChannel::Breathing: {
        std::vector<int32_t> trials;
        std::vector<Eigen::VectorXd> kept;
        double interval = 0.0;
        for (int32_t trial : source_.session_trials()) {
            const auto breathing = source_.breathing(trial);
            if (!breathing || !(breathing->sample_interval_s() > 0.0) ||
                breathing->samples.size() != breathing->timestamps.size()) {
                OROTUNE_LOG_DEBUG("Trial " << trial << " has no usable breathing");
                continue;
            }
            if (interval == 0.0) {
                interval = breathing->sample_interval_s();
            }
            const double downsampled_interval =
                interval * static_cast<double>(config_.breathing_stride);
            const auto expected = static_cast<Eigen::Index>(
                std::lround(config_.breathing_window_s / downsampled_interval));

            Eigen::Index count = 0;
            while (count < breathing->timestamps.size() &&
                   breathing->timestamps(count) < config_.breathing_window_s) {
                ++count;
            }
            Eigen::VectorXd trace = strided(breathing->samples.head(count),
                                            config_.breathing_stride);
            if (trace.size() == expected && expected > 0) {
                trials.push_back(trial);
                kept.push_back(std::move(trace));
            }
        }
        if (kept.empty()) {
            OROTUNE_LOG_WARN("No trial covers " << config_.breathing_window_s << " s of breathing");
            return std::unexpected(AnalysisError::EmptyInput);
        }

        PhaseAmplitudeExtractor::Config band = config_.breathing;
        band.sample_rate_hz = 1.0 / (interval * static_cast<double>(config_.breathing_stride));
        const PhaseAmplitudeExtractor extractor(band);
        const Eigen::MatrixXd phase = to_positive_phase(extractor.extract(stack_rows(kept)).phase);
        return tune_units(phase, trials, band.sample_rate_hz, "Breathing");
    }

    case TuningChannel::Whisker: {
        const Eigen::VectorXd flat = source_.motion(MotionView::Whisker);
        const size_t frames = config_.tracking.frames_per_trial;
        if (flat.size() == 0) {
            OROTUNE_LOG_WARN("No whisker motion component for this session");
            return std::unexpected(AnalysisError::EmptyInput);
        }
        if (static_cast<size_t>(flat.size()) % frames != 0) {
            OROTUNE_LOG_WARN("Bad videos in bottom view: " << flat.size()
                             << " samples is not a multiple of " << frames << " frames");
            return std::unexpected(AnalysisError::CorruptDecomposition);
        }

        const auto cols = static_cast<Eigen::Index>(frames);
        const Eigen::Index rows = flat.size() / cols;
        const std::vector<int32_t> trials = source_.session_trials();
        Eigen::MatrixXd traces(static_cast<Eigen::Index>(trials.size()), cols);
        for (size_t i = 0; i < trials.size(); ++i) {
            if (trials[i] < 1 || trials[i] > rows) {
                OROTUNE_LOG_WARN("Mismatch in motion and session trial number: trial "
                                 << trials[i] << ", " << rows << " motion trials");
                return std::unexpected(AnalysisError::TrialCountMismatch);
            }
            traces.row(static_cast<Eigen::Index>(i)) =
                flat.segment((trials[i] - 1) * cols, cols).transpose();
        }
        if (trials.empty()) {
            return std::unexpected(AnalysisError::EmptyInput);
        }

        const PhaseAmplitudeExtractor extractor(config_.whisker);
        const Eigen::MatrixXd phase = to_positive_phase(extractor.extract(traces).phase);
        return tune_units(phase, trials, config_.whisker.sample_rate_hz, "Whisker");
    }
    }
    return std::unexpected(AnalysisError::InvalidConfig);
}

// ============================================================================
// Movement Timing
// ============================================================================

std::expected<MovementTiming, AnalysisError> SessionAnalyzer::timing_from_streams(
    const SessionStreams& streams) const {

    DesignMatrixBuilder::Config grid = config_.design;
    grid.include_body = false;
    grid.aligner = TraceAligner::Config{config_.timing_bin_s,
                                        TraceAligner::Smoothing::MovingAverage};
    const DesignMatrixBuilder builder(grid, config_.tracking);
    auto design = builder.build(streams);
    if (!design) {
        return std::unexpected(design.error());
    }

    auto column = [&design](std::string_view name) -> Eigen::VectorXd {
        const auto& names = design->predictor_names;
        const auto it = std::find(names.begin(), names.end(), name);
        return design->values.col(static_cast<Eigen::Index>(it - names.begin()));
    };
    const double dt = config_.timing_bin_s;

    MovementTiming timing;
    timing.trials = streams.trial_ids;

    // Inspiration: phase crossings confirmed by an amplitude crossing
    const Eigen::VectorXd breathing = column("breathing");
    PhaseAmplitudeExtractor::Config breathing_band = config_.breathing;
    breathing_band.sample_rate_hz = 1.0 / dt;
    const Eigen::VectorXd breathing_phase = first_row(to_positive_phase(
        PhaseAmplitudeExtractor(breathing_band).extract(breathing).phase));
    timing.inspiration_onsets = InspirationDetector(config_.inspiration)
        .detect(as_span(breathing_phase), as_span(breathing), dt).onsets;

    // Licking: appearances of the reliably tracked tongue
    const auto licks = BoutDetector(config_.licking).detect(as_span(design->tongue_mask), dt);
    timing.tongue_onsets = licks.candidate_onsets;
    timing.lick_bouts = licks.bouts;

    // Whisking: crossings of the whisker band amplitude
    Eigen::VectorXd whisker = column("whisker");
    if (config_.design.correct_motion_sign &&
        dsp::correct_sign(whisker, config_.design.sign_flip_margin)) {
        OROTUNE_LOG_DEBUG("Flipped sign of the aligned whisker trace");
    }
    PhaseAmplitudeExtractor::Config whisker_band = config_.whisker;
    whisker_band.sample_rate_hz = 1.0 / dt;
    const Eigen::VectorXd whisker_amplitude = first_row(
        PhaseAmplitudeExtractor(whisker_band).extract(whisker).amplitude);
    const auto whisks = BoutDetector(config_.whisking).detect(as_span(whisker_amplitude), dt);
    timing.whisker_onsets = whisks.candidate_onsets;
    timing.whisk_bouts = whisks.bouts;

    OROTUNE_LOG_INFO("Movement timing: " << timing.inspiration_onsets.size() << " inspirations, "
                     << timing.lick_bouts.size() << " lick bouts, "
                     << timing.whisk_bouts.size() << " whisk bouts");
    return timing;
}

std::expected<MovementTiming, AnalysisError> SessionAnalyzer::movement_timing() const {
    auto streams = load_streams(kept_trials(), false);
    if (!streams) {
        return std::unexpected(streams.error());
    }
    return timing_from_streams(*streams);
}

// ============================================================================
// Encoding Models
// ============================================================================

std::expected<SessionGLMResult, AnalysisError> SessionAnalyzer::fit_glm(GLMVariant variant) const {
    const std::vector<UnitInfo> units = good_units();
    if (units.empty()) {
        OROTUNE_LOG_WARN("No units pass the quality criteria");
        return std::unexpected(AnalysisError::EmptyInput);
    }

    const bool with_body = variant == GLMVariant::NoLickBody;
    const std::vector<int32_t> trials = kept_trials();
    if (!spikes_cover(units, trials)) {
        return std::unexpected(AnalysisError::TrialCountMismatch);
    }
    auto streams = load_streams(trials, with_body);
    if (!streams) {
        return std::unexpected(streams.error());
    }

    DesignMatrixBuilder::Config design_config = config_.design;
    design_config.include_body = with_body;
    if (with_body) {
        design_config.aligner.smoothing = TraceAligner::Smoothing::Median;
    }
    const DesignMatrixBuilder builder(design_config, config_.tracking);
    const ShiftedPoissonGLMFitter fitter(config_.glm);

    SessionGLMResult result;
    result.variant = variant;
    result.trials = trials;
    result.units.resize(units.size());

    auto report = [&units](size_t u, const UnitGLMResult& fit) {
        const auto best = fit.best_shift();
        OROTUNE_LOG_INFO("GLM of unit " << units[u].id << ": " << fit.failures() << " of "
                         << fit.shifts.size() << " shifts failed, best shift "
                         << (best ? std::to_string(*best) : std::string("none")));
    };

    if (variant == GLMVariant::Standard) {
        auto partitioned = builder.build_partitioned(*streams);
        if (!partitioned) {
            return std::unexpected(partitioned.error());
        }
        const PartitionedDesign& design = *partitioned;
        parallel_for(units.size(), config_.n_threads, [&](size_t u) {
            OROTUNE_TIMED_SCOPE(unit_timer_);
            const UnitSpikes spikes = fetch_spikes(units[u].id, trials);
            UnitGLMResult fit = fitter.fit(design.train.values,
                                           bin_spike_counts(spikes, design.train),
                                           design.test.values,
                                           bin_spike_counts(spikes, design.test));
            report(u, fit);
            result.units[u] = UnitGLMRecord{units[u].id, std::move(fit)};
        });
        result.design = std::move(partitioned->test);
        return result;
    }

    auto timing = timing_from_streams(*streams);
    if (!timing) {
        return std::unexpected(timing.error());
    }
    auto design = builder.build_outside_bouts(*streams, timing->lick_bouts);
    if (!design) {
        return std::unexpected(design.error());
    }
    parallel_for(units.size(), config_.n_threads, [&](size_t u) {
        OROTUNE_TIMED_SCOPE(unit_timer_);
        const UnitSpikes spikes = fetch_spikes(units[u].id, trials);
        UnitGLMResult fit = fitter.fit_in_sample(design->values, bin_spike_counts(spikes, *design));
        report(u, fit);
        result.units[u] = UnitGLMRecord{units[u].id, std::move(fit)};
    });
    result.design = std::move(*design);
    return result;
}

// ============================================================================
// Licking
// ============================================================================

std::expected<SessionAnalyzer::LickingSession, AnalysisError> SessionAnalyzer::licking_session() const {
    LickingSession session;
    session.units = good_units();
    if (session.units.empty()) {
        OROTUNE_LOG_WARN("No units pass the quality criteria");
        return std::unexpected(AnalysisError::EmptyInput);
    }
    const std::vector<int32_t> trials = kept_trials();
    if (!spikes_cover(session.units, trials)) {
        return std::unexpected(AnalysisError::TrialCountMismatch);
    }
    auto streams = load_streams(trials, false);
    if (!streams) {
        return std::unexpected(streams.error());
    }
    auto timing = timing_from_streams(*streams);
    if (!timing) {
        return std::unexpected(timing.error());
    }
    session.timing = std::move(*timing);
    return session;
}

std::expected<std::vector<UnitLickResponse>, AnalysisError> SessionAnalyzer::lick_responses() const {
    auto session = licking_session();
    if (!session) {
        return std::unexpected(session.error());
    }
    const std::vector<UnitInfo>& units = session->units;
    const MovementTiming& timing = session->timing;
    if (timing.lick_bouts.empty()) {
        OROTUNE_LOG_WARN("No lick bouts in this session, latencies are undefined");
    }

    const LickResponseAnalyzer analyzer(config_.lick_response);
    const std::vector<double>& onsets = timing.lick_bouts.onsets;
    const double duration = config_.tracking.trial_duration_s();

    std::vector<UnitLickResponse> responses(units.size());
    parallel_for(units.size(), config_.n_threads, [&](size_t u) {
        OROTUNE_TIMED_SCOPE(unit_timer_);
        const std::vector<double> spikes = session_spike_times(fetch_spikes(units[u].id, timing.trials),
                                                               duration);
        UnitLickResponse& response = responses[u];
        response.unit = units[u].id;
        response.psth = analyzer.psth(spikes, onsets);
        response.latency = analyzer.latency(spikes, onsets);
    });
    return responses;
}

std::expected<std::vector<UnitLickRateRecord>, AnalysisError> SessionAnalyzer::lick_rate() const {
    auto session = licking_session();
    if (!session) {
        return std::unexpected(session.error());
    }
    const std::vector<UnitInfo>& units = session->units;
    const MovementTiming& timing = session->timing;

    const LickRateAnalyzer analyzer(config_.lick_rate);
    const std::vector<LickInterval> intervals = analyzer.intervals(timing.tongue_onsets, timing.lick_bouts);
    if (!analyzer.estimate({}, intervals)) {
        OROTUNE_LOG_WARN("Lick frequency does not vary inside the " << timing.lick_bouts.size()
                         << " lick bouts of this session");
        return std::unexpected(AnalysisError::EmptyInput);
    }
    const double duration = config_.tracking.trial_duration_s();

    std::vector<UnitLickRateRecord> records(units.size());
    parallel_for(units.size(), config_.n_threads, [&](size_t u) {
        OROTUNE_TIMED_SCOPE(unit_timer_);
        const std::vector<double> spikes = session_spike_times(fetch_spikes(units[u].id, timing.trials),
                                                               duration);
        records[u].unit = units[u].id;
        records[u].tuning = analyzer.estimate(spikes, intervals).value_or(LickRateTuning{});
        OROTUNE_LOG_DEBUG("Lick rate slope of unit " << records[u].unit << ": "
                          << records[u].tuning.slope);
    });
    return records;
}

std::expected<std::vector<UnitLickResetRecord>, AnalysisError> SessionAnalyzer::lick_reset() const {
    auto session = licking_session();
    if (!session) {
        return std::unexpected(session.error());
    }
    const std::vector<UnitInfo>& units = session->units;
    const MovementTiming& timing = session->timing;

    const LickResetAnalyzer analyzer(config_.lick_reset);
    const LickResetBreaths breaths = analyzer.select_breaths(timing.inspiration_onsets,
                                                             timing.tongue_onsets, timing.lick_bouts);
    if (breaths.single_lick.empty() && breaths.double_lick.empty()) {
        OROTUNE_LOG_WARN("None of " << breaths.breaths.size() << " licking breaths holds one or two licks");
        return std::unexpected(AnalysisError::EmptyInput);
    }
    const double duration = config_.tracking.trial_duration_s();

    std::vector<UnitLickResetRecord> records(units.size());
    parallel_for(units.size(), config_.n_threads, [&](size_t u) {
        OROTUNE_TIMED_SCOPE(unit_timer_);
        const std::vector<double> spikes = session_spike_times(fetch_spikes(units[u].id, timing.trials),
                                                               duration);
        records[u].unit = units[u].id;
        records[u].response = analyzer.respond(spikes, breaths);
    });
    return records;
}

std::expected<std::vector<TrialContacts>, AnalysisError> SessionAnalyzer::lick_contacts() const {
    const ContactDetector detector(config_.contact);
    std::vector<TrialContacts> contacts;
    for (int32_t trial : source_.tracked_trials()) {
        const auto tracking = source_.tracking(trial);
        const auto port = source_.lick_port(trial);
        if (!tracking || !port) {
            OROTUNE_LOG_DEBUG("Trial " << trial << " has no lick-port tracking");
            continue;
        }
        if (!tracking->frame_count() || port->y.size() != port->x.size() ||
            port->z.size() != port->x.size()) {
            OROTUNE_LOG_WARN("Trial " << trial << " has tongue or lick-port channels of unequal length");
            return std::unexpected(AnalysisError::ShapeMismatch);
        }
        contacts.push_back(TrialContacts{trial, detector.detect(*tracking, *port)});
    }
    if (contacts.empty()) {
        OROTUNE_LOG_WARN("No trial has both tongue and lick-port tracking");
        return std::unexpected(AnalysisError::EmptyInput);
    }
    return contacts;
}

std::expected<std::vector<UnitDirectionRecord>, AnalysisError> SessionAnalyzer::direction_tuning() const {
    const std::vector<UnitInfo> units = good_units();
    if (units.empty()) {
        OROTUNE_LOG_WARN("No units pass the quality criteria");
        return std::unexpected(AnalysisError::EmptyInput);
    }
    auto contacts = lick_contacts();
    if (!contacts) {
        return std::unexpected(contacts.error());
    }

    std::vector<int32_t> trials;
    std::vector<std::vector<double>> contact_times;
    std::vector<int> ports;
    for (auto& c : *contacts) {
        const auto port = source_.water_port(c.trial);
        if (!port) {
            continue;
        }
        trials.push_back(c.trial);
        contact_times.push_back(std::move(c.contact_times));
        ports.push_back(*port);
    }
    if (trials.empty()) {
        OROTUNE_LOG_WARN("No contact trial has a water port");
        return std::unexpected(AnalysisError::EmptyInput);
    }
    if (!spikes_cover(units, trials)) {
        return std::unexpected(AnalysisError::TrialCountMismatch);
    }

    const DirectionTuningEstimator estimator(config_.direction);
    std::vector<UnitDirectionRecord> records(units.size());
    parallel_for(units.size(), config_.n_threads, [&](size_t u) {
        OROTUNE_TIMED_SCOPE(unit_timer_);
        records[u].unit = units[u].id;
        records[u].tuning = estimator.estimate(fetch_spikes(units[u].id, trials),
                                               contact_times, ports);
    });
    return records;
}

}  // namespace orotune
