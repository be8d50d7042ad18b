#pragma once

#include <cstddef>
#include <functional>

namespace orotune {

/// Worker count for a request of `requested` threads (0 = hardware concurrency)
size_t resolve_thread_count(size_t requested);

/**
 * @brief Runs body(i) for every i in [0, count) on a fixed set of threads
 *
 * Each worker owns a contiguous, disjoint index range, so bodies that write
 * only to slot i of a pre-sized output need no synchronization. Returns after
 * all workers joined. The first exception thrown by any body is rethrown on
 * the calling thread; the remaining indices of that worker are skipped.
 */
void parallel_for(size_t count, size_t n_threads, const std::function<void(size_t)>& body);

}  // namespace orotune
