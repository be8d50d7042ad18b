#pragma once

#include "lick_analysis.hpp"
#include "types.hpp"
#include <map>
#include <optional>

namespace orotune {

enum class Camera {
    Side,       // Jaw and tongue, side view
    Bottom      // Tongue, whiskers and lick port, bottom view
};

enum class MotionView {
    Whisker,    // Whisker pad, bottom camera
    Body        // Body camera
};

// ============================================================================
// Unit Quality
// ============================================================================

/// Spike-sorting metrics of one unit
struct UnitQuality {
    double presence_ratio = 0.0;
    double amplitude_cutoff = 1.0;
    double avg_firing_rate = 0.0;
    double isi_violation = 0.0;
    double unit_amp = 0.0;
};

/**
 * @brief Thresholds a unit must pass to enter any per-unit analysis
 */
struct UnitQualityCriteria {
    double min_presence_ratio = 0.9;
    double max_amplitude_cutoff = 0.15;
    double min_avg_firing_rate = 0.2;
    double max_isi_violation = 10.0;
    double min_unit_amp = 150.0;

    bool passes(const UnitQuality& q) const {
        return q.presence_ratio > min_presence_ratio &&
               q.amplitude_cutoff < max_amplitude_cutoff &&
               q.avg_firing_rate > min_avg_firing_rate &&
               q.isi_violation < max_isi_violation &&
               q.unit_amp > min_unit_amp;
    }
};

struct UnitInfo {
    int32_t id = 0;
    UnitQuality quality;
};

// ============================================================================
// Session Source
// ============================================================================

/**
 * @brief Narrow fetch contract for the data of one recording session
 *
 * Trials are identified by their 1-based session trial number and every
 * trial list is returned in ascending order. Absent per-trial data is
 * reported as nullopt or an empty vector, never as an error; deciding
 * whether the absence matters is up to the analysis.
 *
 * Implementations must be safe to call concurrently from const methods.
 */
class SessionSource {
public:
    virtual ~SessionSource() = default;

    /// Every experimental trial of the session
    virtual std::vector<int32_t> session_trials() const = 0;

    /// Trials with 2-D jaw tracking from one camera
    virtual std::vector<int32_t> camera_trials(Camera camera) const = 0;

    /// 2-D jaw height from one camera, empty if the trial was not tracked
    virtual Eigen::VectorXd jaw_y(Camera camera, int32_t trial) const = 0;

    /// Trials with calibrated 3-D jaw and tongue tracking
    virtual std::vector<int32_t> tracked_trials() const = 0;

    virtual std::optional<TrialTracking> tracking(int32_t trial) const = 0;

    virtual std::optional<BreathingTrace> breathing(int32_t trial) const = 0;

    /// First motion component of a camera over the whole session, empty if none
    virtual Eigen::VectorXd motion(MotionView view) const = 0;

    /// Every sorted unit with its quality metrics
    virtual std::vector<UnitInfo> units() const = 0;

    /// Trials with a recorded spike train for the unit, empty trains included
    virtual std::vector<int32_t> ephys_trials(int32_t unit) const = 0;

    /// Trial-relative spike times, empty when the unit did not fire
    virtual SpikeTrain spike_times(int32_t unit, int32_t trial) const = 0;

    /// 3-D lick-port position over one trial
    virtual std::optional<LickPortTrack> lick_port(int32_t trial) const = 0;

    /// Rewarded port (1-9) of a multi-target licking trial
    virtual std::optional<int> water_port(int32_t trial) const = 0;
};

/**
 * @brief SessionSource backed by in-memory maps
 *
 * Populated with the setters, then shared read-only between analyses.
 */
class InMemorySessionSource : public SessionSource {
public:
    void set_session_trials(std::vector<int32_t> trials);
    void set_jaw_y(Camera camera, int32_t trial, Eigen::VectorXd jaw_y);
    void set_tracking(int32_t trial, TrialTracking tracking);
    void set_breathing(int32_t trial, BreathingTrace breathing);
    void set_motion(MotionView view, Eigen::VectorXd motion);
    void add_unit(const UnitInfo& unit);
    void set_spike_times(int32_t unit, int32_t trial, SpikeTrain spikes);
    void set_lick_port(int32_t trial, LickPortTrack track);
    void set_water_port(int32_t trial, int port);

    std::vector<int32_t> session_trials() const override;
    std::vector<int32_t> camera_trials(Camera camera) const override;
    Eigen::VectorXd jaw_y(Camera camera, int32_t trial) const override;
    std::vector<int32_t> tracked_trials() const override;
    std::optional<TrialTracking> tracking(int32_t trial) const override;
    std::optional<BreathingTrace> breathing(int32_t trial) const override;
    Eigen::VectorXd motion(MotionView view) const override;
    std::vector<UnitInfo> units() const override;
    std::vector<int32_t> ephys_trials(int32_t unit) const override;
    SpikeTrain spike_times(int32_t unit, int32_t trial) const override;
    std::optional<LickPortTrack> lick_port(int32_t trial) const override;
    std::optional<int> water_port(int32_t trial) const override;

private:
    std::vector<int32_t> session_trials_;
    std::map<int32_t, Eigen::VectorXd> jaw_side_;
    std::map<int32_t, Eigen::VectorXd> jaw_bottom_;
    std::map<int32_t, TrialTracking> tracking_;
    std::map<int32_t, BreathingTrace> breathing_;
    Eigen::VectorXd whisker_motion_;
    Eigen::VectorXd body_motion_;
    std::vector<UnitInfo> units_;
    std::map<std::pair<int32_t, int32_t>, SpikeTrain> spikes_;
    std::map<int32_t, LickPortTrack> lick_port_;
    std::map<int32_t, int> water_port_;
};

}  // namespace orotune
