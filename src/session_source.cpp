#include "orotune/session_source.hpp"

#include <algorithm>
#include <limits>

namespace orotune {

namespace {

template <typename Map>
std::vector<int32_t> keys_of(const Map& map) {
    std::vector<int32_t> keys;
    keys.reserve(map.size());
    for (const auto& [key, value] : map) {
        keys.push_back(key);
    }
    return keys;
}

template <typename Map>
auto find_or_none(const Map& map, int32_t key)
    -> std::optional<typename Map::mapped_type> {
    const auto it = map.find(key);
    if (it == map.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace

// ============================================================================
// Population
// ============================================================================

void InMemorySessionSource::set_session_trials(std::vector<int32_t> trials) {
    std::sort(trials.begin(), trials.end());
    session_trials_ = std::move(trials);
}

void InMemorySessionSource::set_jaw_y(Camera camera, int32_t trial, Eigen::VectorXd jaw_y) {
    (camera == Camera::Side ? jaw_side_ : jaw_bottom_)[trial] = std::move(jaw_y);
}

void InMemorySessionSource::set_tracking(int32_t trial, TrialTracking tracking) {
    tracking_[trial] = std::move(tracking);
}

void InMemorySessionSource::set_breathing(int32_t trial, BreathingTrace breathing) {
    breathing_[trial] = std::move(breathing);
}

void InMemorySessionSource::set_motion(MotionView view, Eigen::VectorXd motion) {
    (view == MotionView::Whisker ? whisker_motion_ : body_motion_) = std::move(motion);
}

void InMemorySessionSource::add_unit(const UnitInfo& unit) {
    units_.push_back(unit);
}

void InMemorySessionSource::set_spike_times(int32_t unit, int32_t trial, SpikeTrain spikes) {
    spikes_[{unit, trial}] = std::move(spikes);
}

void InMemorySessionSource::set_lick_port(int32_t trial, LickPortTrack track) {
    lick_port_[trial] = std::move(track);
}

void InMemorySessionSource::set_water_port(int32_t trial, int port) {
    water_port_[trial] = port;
}

// ============================================================================
// Fetch Contract
// ============================================================================

std::vector<int32_t> InMemorySessionSource::session_trials() const {
    return session_trials_;
}

std::vector<int32_t> InMemorySessionSource::camera_trials(Camera camera) const {
    return keys_of(camera == Camera::Side ? jaw_side_ : jaw_bottom_);
}

Eigen::VectorXd InMemorySessionSource::jaw_y(Camera camera, int32_t trial) const {
    return find_or_none(camera == Camera::Side ? jaw_side_ : jaw_bottom_, trial)
        .value_or(Eigen::VectorXd{});
}

std::vector<int32_t> InMemorySessionSource::tracked_trials() const {
    return keys_of(tracking_);
}

std::optional<TrialTracking> InMemorySessionSource::tracking(int32_t trial) const {
    return find_or_none(tracking_, trial);
}

std::optional<BreathingTrace> InMemorySessionSource::breathing(int32_t trial) const {
    return find_or_none(breathing_, trial);
}

Eigen::VectorXd InMemorySessionSource::motion(MotionView view) const {
    return view == MotionView::Whisker ? whisker_motion_ : body_motion_;
}

std::vector<UnitInfo> InMemorySessionSource::units() const {
    return units_;
}

std::vector<int32_t> InMemorySessionSource::ephys_trials(int32_t unit) const {
    std::vector<int32_t> trials;
    for (auto it = spikes_.lower_bound({unit, std::numeric_limits<int32_t>::min()});
         it != spikes_.end() && it->first.first == unit; ++it) {
        trials.push_back(it->first.second);
    }
    return trials;
}

SpikeTrain InMemorySessionSource::spike_times(int32_t unit, int32_t trial) const {
    const auto it = spikes_.find({unit, trial});
    return it == spikes_.end() ? SpikeTrain{} : it->second;
}

std::optional<LickPortTrack> InMemorySessionSource::lick_port(int32_t trial) const {
    return find_or_none(lick_port_, trial);
}

std::optional<int> InMemorySessionSource::water_port(int32_t trial) const {
    return find_or_none(water_port_, trial);
}

}  // namespace orotune
