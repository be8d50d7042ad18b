#include "orotune/bout_detector.hpp"
#include "orotune/logging.hpp"

#include <algorithm>
#include <stdexcept>

namespace orotune {

std::vector<size_t> threshold_crossings(std::span<const double> x, double threshold,
                                        CrossingDirection direction) {
    std::vector<size_t> crossings;
    if (x.size() < 2) {
        return crossings;
    }
    for (size_t i = 0; i + 1 < x.size(); ++i) {
        const bool crossed = direction == CrossingDirection::Rising
            ? (x[i] < threshold && x[i + 1] >= threshold)
            : (x[i] > threshold && x[i + 1] <= threshold);
        if (crossed) {
            crossings.push_back(i);
        }
    }
    return crossings;
}

// ============================================================================
// Bout Detector
// ============================================================================

BoutDetector::BoutDetector(const Config& config)
    : config_(config) {
    if (config_.min_frequency_hz < 0.0 ||
        config_.max_frequency_hz <= config_.min_frequency_hz) {
        throw std::invalid_argument("Bout frequency gate must satisfy 0 <= min < max");
    }
    if (config_.min_gap_cycles == 0 || config_.offset_cycles == 0) {
        throw std::invalid_argument("Bout gap and offset must be at least one cycle");
    }
}

BoutDetector::BoutDetector() : BoutDetector(Config{}) {}

BoutDetector::Detection BoutDetector::detect(std::span<const double> signal,
                                             double sample_interval_s) const {
    if (sample_interval_s <= 0.0) {
        throw std::invalid_argument("Sample interval must be positive");
    }

    Detection result;
    for (size_t idx : threshold_crossings(signal, config_.threshold, config_.direction)) {
        result.crossing_times.push_back(static_cast<double>(idx) * sample_interval_s);
    }
    if (result.crossing_times.size() < 2) {
        return result;
    }

    // Frequency gate on the interval to the next crossing
    const auto& t = result.crossing_times;
    result.candidate_onsets.assign(t.begin(), t.end() - 1);
    std::vector<size_t> gated;
    for (size_t i = 0; i + 1 < t.size(); ++i) {
        const double freq = 1.0 / (t[i + 1] - t[i]);
        if (freq > config_.min_frequency_hz && freq < config_.max_frequency_hz) {
            gated.push_back(i);
        }
    }

    // A cycle needs its successors to be gated candidates too. The last two
    // gated candidates can never be confirmed.
    for (size_t k = 0; k + 2 < gated.size(); ++k) {
        bool confirmed = true;
        for (size_t c = 0; c < config_.consecutive_cycles; ++c) {
            if (k + c + 1 >= gated.size() || gated[k + c + 1] - gated[k + c] != 1) {
                confirmed = false;
                break;
            }
        }
        if (confirmed) {
            result.cycle_indices.push_back(gated[k]);
        }
    }

    const auto& cycles = result.cycle_indices;
    if (cycles.empty()) {
        return result;
    }

    // Group cycles into bouts on gaps of >= min_gap_cycles
    std::vector<size_t> starts{0};
    std::vector<size_t> ends;
    for (size_t j = 1; j < cycles.size(); ++j) {
        if (cycles[j] - cycles[j - 1] >= config_.min_gap_cycles) {
            ends.push_back(j - 1);
            starts.push_back(j);
        }
    }
    ends.push_back(cycles.size() - 1);

    const auto& candidates = result.candidate_onsets;
    auto& bouts = result.bouts;
    for (size_t b = 0; b < starts.size(); ++b) {
        const double onset = candidates[cycles[starts[b]]];
        const size_t offset_idx = std::min(cycles[ends[b]] + config_.offset_cycles,
                                           candidates.size() - 1);
        const double offset = candidates[offset_idx];
        if (offset <= onset) {
            continue;
        }
        if (!bouts.offsets.empty() && bouts.offsets.back() >= onset) {
            // Previous bout runs into this one
            bouts.offsets.back() = std::max(bouts.offsets.back(), offset);
            continue;
        }
        bouts.onsets.push_back(onset);
        bouts.offsets.push_back(offset);
    }

    OROTUNE_LOG_DEBUG("Bout detector: " << t.size() << " crossings, " << gated.size()
                      << " gated, " << cycles.size() << " cycles, " << bouts.size() << " bouts");
    return result;
}

// ============================================================================
// Inspiration Detector
// ============================================================================

InspirationDetector::InspirationDetector(const Config& config)
    : config_(config) {}

InspirationDetector::InspirationDetector() : InspirationDetector(Config{}) {}

BoutEvents InspirationDetector::detect(std::span<const double> phase,
                                       std::span<const double> breathing,
                                       double sample_interval_s) const {
    if (phase.size() != breathing.size()) {
        throw std::invalid_argument("Breathing phase and amplitude differ in length");
    }

    const std::vector<size_t> onsets =
        threshold_crossings(phase, config_.phase_threshold, CrossingDirection::Rising);
    const std::vector<size_t> troughs =
        threshold_crossings(breathing, config_.amplitude_threshold, CrossingDirection::Falling);

    BoutEvents events;
    size_t trough = 0;
    for (size_t i = 0; i + 1 < onsets.size(); ++i) {
        while (trough < troughs.size() && troughs[trough] <= onsets[i]) {
            ++trough;
        }
        if (trough < troughs.size() && troughs[trough] < onsets[i + 1]) {
            events.onsets.push_back(static_cast<double>(onsets[i]) * sample_interval_s);
            events.offsets.push_back(static_cast<double>(onsets[i + 1]) * sample_interval_s);
        }
    }
    return events;
}

}  // namespace orotune
