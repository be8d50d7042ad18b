#pragma once

#include "types.hpp"
#include <span>

namespace orotune {

enum class CrossingDirection {
    Rising,     // x[i] < thr && x[i+1] >= thr
    Falling     // x[i] > thr && x[i+1] <= thr
};

/**
 * @brief Sample indices at which a trace crosses a threshold
 *
 * The reported index is the last sample before the crossing. The final sample
 * has no successor and never reports a crossing.
 */
std::vector<size_t> threshold_crossings(std::span<const double> x, double threshold,
                                        CrossingDirection direction);

/**
 * @brief Bout segmentation of a rhythmic behavior
 *
 * Detection runs in four stages on a trial-concatenated trace:
 *   1. Threshold crossings of the detection channel
 *   2. Frequency gate: the reciprocal of the interval to the next crossing
 *      must lie strictly inside (min_frequency_hz, max_frequency_hz)
 *   3. Cycle validation: a surviving crossing counts as a cycle when the next
 *      `consecutive_cycles` crossings also survived the gate
 *   4. Grouping: a gap of at least `min_gap_cycles` crossings between cycles
 *      closes a bout. The first cycle always opens a bout and the last
 *      always closes one.
 *
 * A bout offset is the crossing `offset_cycles` after its last cycle. Bouts
 * whose offset would reach the next onset are merged so that
 * onset[i] < offset[i] < onset[i+1] always holds.
 */
class BoutDetector {
public:
    struct Config {
        double threshold = 0.5;
        CrossingDirection direction = CrossingDirection::Rising;
        double min_frequency_hz = 3.0;
        double max_frequency_hz = 9.0;
        size_t consecutive_cycles = 1;
        size_t min_gap_cycles = 2;
        size_t offset_cycles = 2;

        /// Tongue visibility (thresholded likelihood) at 3-9 Hz
        static Config licking() {
            return {0.5, CrossingDirection::Rising, 3.0, 9.0, 1, 2, 2};
        }

        /// Whisker amplitude at 1-25 Hz, three crossings in a row
        static Config whisking() {
            return {1.0, CrossingDirection::Rising, 1.0, 25.0, 2, 2, 2};
        }
    };

    struct Detection {
        std::vector<double> crossing_times;    // Every threshold crossing
        std::vector<double> candidate_onsets;  // Crossings with a successor
        std::vector<size_t> cycle_indices;     // Into candidate_onsets
        BoutEvents bouts;
    };

    explicit BoutDetector(const Config& config);
    BoutDetector();

    /**
     * @brief Run detection on one concatenated trace
     * @param signal Detection channel
     * @param sample_interval_s Seconds per sample
     */
    Detection detect(std::span<const double> signal, double sample_interval_s) const;

    /// Bouts only
    BoutEvents detect_bouts(std::span<const double> signal, double sample_interval_s) const {
        return detect(signal, sample_interval_s).bouts;
    }

    const Config& config() const { return config_; }

private:
    Config config_;
};

/**
 * @brief Inspiration onsets from breathing phase and amplitude
 *
 * An onset is a rising crossing of the breathing phase through
 * `phase_threshold`. It is kept only when the z-scored breathing trace falls
 * through `amplitude_threshold` before the next phase crossing. Each kept
 * cycle ends at that next phase crossing.
 */
class InspirationDetector {
public:
    struct Config {
        double phase_threshold = PI;
        double amplitude_threshold = -0.5;
    };

    explicit InspirationDetector(const Config& config);
    InspirationDetector();

    /**
     * @param phase Breathing phase in [0, 2π)
     * @param breathing Z-scored breathing on the same grid
     * @param sample_interval_s Seconds per sample
     */
    BoutEvents detect(std::span<const double> phase, std::span<const double> breathing,
                      double sample_interval_s) const;

    const Config& config() const { return config_; }

private:
    Config config_;
};

}  // namespace orotune
