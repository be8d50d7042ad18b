/**
 * OroTune Synthetic Session
 *
 * Builds a small simulated recording with a breathing-locked unit and a
 * randomly firing unit, then runs the session analyses on it and prints
 * a summary of each.
 */

#include <orotune.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>

using namespace orotune;

namespace {

constexpr int32_t N_TRIALS = 20;
constexpr Eigen::Index FRAMES = 1471;
constexpr double FRAME_INTERVAL = 0.0034;
constexpr double BREATHING_INTERVAL = 0.0002;

Eigen::VectorXd rhythm(Eigen::Index n, double dt, double freq_hz, double noise_sd,
                       std::mt19937& gen) {
    std::normal_distribution<double> noise(0.0, noise_sd);
    Eigen::VectorXd v(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        v(i) = std::sin(TWO_PI * freq_hz * static_cast<double>(i) * dt) + noise(gen);
    }
    return v;
}

// Licking at 6 Hz from 1 s to 2.5 s
TrialTracking simulate_tracking(std::mt19937& gen) {
    std::normal_distribution<double> wobble(0.0, 0.05);
    TrialTracking t;
    t.jaw_x = rhythm(FRAMES, FRAME_INTERVAL, 6.0, 0.1, gen);
    t.jaw_y = rhythm(FRAMES, FRAME_INTERVAL, 6.0, 0.1, gen);
    t.jaw_z = rhythm(FRAMES, FRAME_INTERVAL, 6.0, 0.1, gen);
    t.tongue_x = Eigen::VectorXd::Constant(FRAMES, 10.0);
    t.tongue_y = Eigen::VectorXd::Constant(FRAMES, 10.0);
    t.tongue_z = Eigen::VectorXd::Constant(FRAMES, 10.0);
    t.tongue_likelihood_side = Eigen::VectorXd::Constant(FRAMES, 0.99);
    t.tongue_likelihood_bottom = Eigen::VectorXd::Constant(FRAMES, 0.1);
    for (int k = 0; k < 9; ++k) {
        const auto first = static_cast<Eigen::Index>(std::lround((1.0 + k / 6.0) / FRAME_INTERVAL));
        t.tongue_likelihood_bottom.segment(first, 20).setConstant(0.99);
        for (Eigen::Index i = first; i < first + 20; ++i) {
            t.tongue_x(i) = 0.5 + wobble(gen);
            t.tongue_y(i) = wobble(gen);
            t.tongue_z(i) = wobble(gen);
        }
    }
    return t;
}

InMemorySessionSource simulate_session() {
    std::mt19937 gen(42);
    std::normal_distribution<double> jitter(0.0, 0.005);
    std::uniform_real_distribution<double> uniform(0.0, 5.0);
    InMemorySessionSource source;

    std::vector<int32_t> trials;
    for (int32_t t = 1; t <= N_TRIALS; ++t) trials.push_back(t);
    source.set_session_trials(trials);

    for (int32_t trial : trials) {
        source.set_jaw_y(Camera::Side, trial, rhythm(FRAMES, FRAME_INTERVAL, 6.0, 0.1, gen));
        source.set_jaw_y(Camera::Bottom, trial, rhythm(FRAMES, FRAME_INTERVAL, 6.0, 0.1, gen));
        source.set_tracking(trial, simulate_tracking(gen));

        BreathingTrace breathing;
        breathing.samples = rhythm(27500, BREATHING_INTERVAL, 4.0, 0.05, gen);
        breathing.timestamps = Eigen::VectorXd::LinSpaced(27500, 0.0, 27499 * BREATHING_INTERVAL);
        source.set_breathing(trial, std::move(breathing));

        LickPortTrack port;
        port.x = Eigen::VectorXd::Zero(FRAMES);
        port.y = Eigen::VectorXd::Zero(FRAMES);
        port.z = Eigen::VectorXd::Zero(FRAMES);
        source.set_lick_port(trial, std::move(port));
        source.set_water_port(trial, (trial - 1) % 9 + 1);
    }

    source.set_motion(MotionView::Whisker,
                      rhythm(N_TRIALS * FRAMES, FRAME_INTERVAL, 8.0, 0.3, gen));
    source.set_motion(MotionView::Body, rhythm(N_TRIALS * 500, 0.01, 1.0, 1.0, gen));

    const UnitQuality good{0.95, 0.05, 5.0, 0.5, 200.0};
    source.add_unit(UnitInfo{1, good});
    source.add_unit(UnitInfo{2, good});

    for (int32_t trial : trials) {
        SpikeTrain locked;
        for (int k = 0; k < 19; ++k) {
            locked.push_back((static_cast<double>(k) + 0.25) / 4.0 + jitter(gen));
        }
        source.set_spike_times(1, trial, locked);

        SpikeTrain random;
        for (int k = 0; k < 30; ++k) random.push_back(uniform(gen));
        std::sort(random.begin(), random.end());
        source.set_spike_times(2, trial, random);
    }
    return source;
}

void print_tuning(const char* name, const SessionAnalyzer& analyzer, TuningChannel channel) {
    auto tuning = analyzer.phase_tuning(channel);
    std::cout << "\n=== " << name << " Tuning ===\n\n";
    if (!tuning) {
        std::cout << "  failed: " << to_string(tuning.error()) << "\n";
        return;
    }
    std::cout << std::left << std::setw(8) << "Unit" << std::right
              << std::setw(14) << "Pref (rad)"
              << std::setw(14) << "Modulation"
              << std::setw(14) << "Kuiper p"
              << std::setw(14) << "Perm p" << "\n";
    std::cout << std::string(64, '-') << "\n";
    for (const auto& unit : *tuning) {
        std::cout << std::left << std::setw(8) << unit.unit << std::right
                  << std::fixed << std::setprecision(3)
                  << std::setw(14) << unit.curve.preferred_phase
                  << std::setw(14) << unit.curve.modulation_index
                  << std::setw(14) << unit.kuiper_p
                  << std::setw(14) << unit.permutation_p << "\n";
    }
}

}  // namespace

int main() {
    std::cout << R"(
╔═══════════════════════════════════════════════════════════════╗
║               OroTune Synthetic Session Analysis              ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;

    std::cout << "Build: " << build_info() << "\n";

    const InMemorySessionSource source = simulate_session();

    SessionAnalyzer::Config config;
    config.permutation.seed = 7;
    SessionAnalyzer analyzer(source, config);

    const TrialScreening screening = analyzer.screen_trials();
    std::cout << "Trials:     " << source.session_trials().size() << "\n";
    std::cout << "Excluded:   " << screening.excluded().size() << "\n";
    std::cout << "Good units: " << analyzer.good_units().size() << "\n";

    print_tuning("Breathing", analyzer, TuningChannel::Breathing);
    print_tuning("Jaw", analyzer, TuningChannel::Jaw);

    std::cout << "\n=== Movement Timing ===\n\n";
    if (auto timing = analyzer.movement_timing()) {
        std::cout << "  Inspirations: " << timing->inspiration_onsets.size() << "\n";
        std::cout << "  Licks:        " << timing->tongue_onsets.size() << "\n";
        std::cout << "  Lick bouts:   " << timing->lick_bouts.size() << "\n";
        std::cout << "  Whisks:       " << timing->whisker_onsets.size() << "\n";
        std::cout << "  Whisk bouts:  " << timing->whisk_bouts.size() << "\n";
    } else {
        std::cout << "  failed: " << to_string(timing.error()) << "\n";
    }

    std::cout << "\n=== Encoding Model ===\n\n";
    if (auto glm = analyzer.fit_glm(GLMVariant::Standard)) {
        std::cout << "  Design: " << glm->design.values.rows() << " x " << glm->design.values.cols() << "\n";
        for (const auto& unit : glm->units) {
            const auto best = unit.result.best_shift();
            std::cout << "  Unit " << unit.unit << ": ";
            if (best) {
                std::cout << "best shift " << *best << " bins, "
                          << unit.result.failures() << " failed shifts\n";
            } else {
                std::cout << "no successful fit\n";
            }
        }
    } else {
        std::cout << "  failed: " << to_string(glm.error()) << "\n";
    }

    const TimingStats stats = analyzer.unit_timing();
    std::cout << "\nPer-unit compute: " << stats.sample_count << " runs, mean "
              << std::fixed << std::setprecision(2) << stats.mean_ms << " ms, p95 "
              << stats.p95_ms << " ms\n";

    return 0;
}
