#pragma once

#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <numbers>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Eigen/Dense>

namespace orotune {

// ============================================================================
// Timing Types
// ============================================================================
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;
using Duration = std::chrono::nanoseconds;

/// Converts duration to milliseconds (double precision)
inline double to_milliseconds(Duration d) {
    return std::chrono::duration<double, std::milli>(d).count();
}

// ============================================================================
// Angular Constants
// ============================================================================
constexpr double PI = std::numbers::pi;
constexpr double TWO_PI = 2.0 * std::numbers::pi;

/// Wraps an angle into [0, 2π)
inline double wrap_phase(double phase) {
    double wrapped = std::fmod(phase, TWO_PI);
    if (wrapped < 0.0) {
        wrapped += TWO_PI;
    }
    // fmod can round a tiny negative up to exactly 2π
    return wrapped >= TWO_PI ? 0.0 : wrapped;
}

// ============================================================================
// Tracking Configuration - Per-Rig Video Geometry
// ============================================================================

/**
 * @brief Video-tracking layout of a session
 *
 * Every tracked trial carries exactly `frames_per_trial` frames sampled every
 * `frame_interval_s`. Trials deviating from this are screened out upstream.
 */
struct TrackingConfig {
    size_t frames_per_trial = 1471;
    double frame_interval_s = 0.0034;      // 294 Hz cameras
    double likelihood_threshold = 0.95;    // Per-view tongue confidence
    std::string name = "RRig-MTL";

    /// Multi-target licking rig (side + bottom cameras)
    static TrackingConfig mtl_rig() {
        return {1471, 0.0034, 0.95, "RRig-MTL"};
    }

    /// Side camera jaw tracking, one frame shorter per trial
    static TrackingConfig jaw_side_camera() {
        return {1470, 0.0034, 0.95, "RRig-MTL side camera"};
    }

    static TrackingConfig custom(size_t frames, double interval_s,
                                 const std::string& name = "Custom") {
        return {frames, interval_s, 0.95, name};
    }

    double sample_rate_hz() const { return 1.0 / frame_interval_s; }
    double trial_duration_s() const {
        return static_cast<double>(frames_per_trial) * frame_interval_s;
    }

    bool is_valid() const {
        return frames_per_trial > 0 && frame_interval_s > 0.0 &&
               likelihood_threshold >= 0.0 && likelihood_threshold <= 1.0;
    }
};

// ============================================================================
// Session Data Model
// ============================================================================

/// One experimental trial of a session
struct Trial {
    int32_t id = 0;            // Session trial number (1-based)
    size_t index = 0;          // Ordinal position among kept trials
    double duration_s = 0.0;
    bool valid = true;
};

/// Trial-relative spike timestamps (seconds) for one unit in one trial
using SpikeTrain = std::vector<double>;

/// Spike trains of one unit, aligned 1:1 with a trial list
using UnitSpikes = std::vector<SpikeTrain>;

/// 3-D tracking of one trial (jaw from the side view, tongue from the bottom)
struct TrialTracking {
    Eigen::VectorXd jaw_x;
    Eigen::VectorXd jaw_y;
    Eigen::VectorXd jaw_z;
    Eigen::VectorXd tongue_x;
    Eigen::VectorXd tongue_y;
    Eigen::VectorXd tongue_z;
    Eigen::VectorXd tongue_likelihood_side;
    Eigen::VectorXd tongue_likelihood_bottom;

    /// Frame count shared by all channels, or nullopt if they disagree
    std::optional<size_t> frame_count() const;
};

/// Thermistor breathing of one trial with its own timestamps (seconds)
struct BreathingTrace {
    Eigen::VectorXd samples;
    Eigen::VectorXd timestamps;

    /// Native sample interval derived from the first two timestamps
    double sample_interval_s() const {
        return timestamps.size() > 1 ? timestamps(1) - timestamps(0) : 0.0;
    }
};

/**
 * @brief Phase tuning of one unit to one behavioral channel
 *
 * Rates are spike counts per phase bin divided by phase occupancy and scaled
 * by the sampling rate. Bins never visited by the behavior hold NaN.
 */
struct TuningCurve {
    std::vector<double> bin_centers;
    std::vector<double> rates;
    double preferred_phase = 0.0;     // [0, 2π)
    double modulation_index = 0.0;    // >= 0
};

/// Onset/offset pairs of one rhythmic behavior, in session seconds
struct BoutEvents {
    std::vector<double> onsets;
    std::vector<double> offsets;

    size_t size() const { return onsets.size(); }
    bool empty() const { return onsets.empty(); }
};

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief Session-level failures that abandon one analysis invocation
 */
enum class AnalysisError {
    ShapeMismatch,          // Frame or bin counts disagree between modalities
    TrialCountMismatch,     // Tracking and ephys trial lists disagree
    CorruptDecomposition,   // Motion trace length not a multiple of frames
    EmptyInput,             // Nothing left to analyze after screening
    InvalidConfig
};

std::string_view to_string(AnalysisError error);

}  // namespace orotune
