#pragma once

// OroTune - Neural Tuning to Orofacial Behavior
// Version 0.1.0

#include "orotune/types.hpp"
#include "orotune/logging.hpp"
#include "orotune/bandpass_filter.hpp"
#include "orotune/phase_extractor.hpp"
#include "orotune/circular_tuning.hpp"
#include "orotune/permutation_test.hpp"
#include "orotune/bout_detector.hpp"
#include "orotune/trace_aligner.hpp"
#include "orotune/design_matrix.hpp"
#include "orotune/poisson_glm.hpp"
#include "orotune/lick_analysis.hpp"
#include "orotune/latency_tracker.hpp"
#include "orotune/parallel.hpp"
#include "orotune/session_source.hpp"
#include "orotune/session_analyzer.hpp"

namespace orotune {

/// Library version
constexpr const char* VERSION = "0.1.0";

/// Library version components
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/**
 * @brief Get build information string
 */
const char* build_info();

}  // namespace orotune
