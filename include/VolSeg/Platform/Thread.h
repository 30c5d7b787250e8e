#pragma once

/**
 * @file Thread.h
 * @brief Data-parallel loop helpers
 *
 * Used by operations whose output voxels are independent (morphology).
 * Flood fill and statistics stay single-threaded so their results do not
 * depend on scheduling.
 *
 * @code
 * ParallelForRange(0, nz, [&](size_t zBegin, size_t zEnd) {
 *     for (size_t z = zBegin; z < zEnd; ++z) {
 *         processSlice(z);
 *     }
 * });
 * @endcode
 */

#include <algorithm>
#include <cstddef>
#include <future>
#include <vector>

namespace Vol::Seg::Platform {

// ============================================================================
// System Information
// ============================================================================

/**
 * @brief Get number of hardware threads (logical cores)
 * @return Number of threads, minimum 1
 */
size_t GetNumCores();

/**
 * @brief Check if parallel execution is worthwhile
 * @param workSize Number of loop iterations
 * @param workPerIteration Approximate cost of one iteration (e.g. voxels per slice)
 * @param minWork Minimum total work to justify spawning threads
 */
inline bool ShouldParallelize(size_t workSize, size_t workPerIteration,
                              size_t minWork = 1 << 16) {
    return workSize >= 2 && workSize * workPerIteration >= minWork && GetNumCores() > 1;
}

// ============================================================================
// Parallel For
// ============================================================================

/**
 * @brief Execute func(rangeBegin, rangeEnd) over chunks of [begin, end)
 *
 * @param begin Start index (inclusive)
 * @param end End index (exclusive)
 * @param func Callable taking (size_t rangeBegin, size_t rangeEnd)
 * @param workPerIteration Cost hint used to decide whether to go parallel
 *
 * Chunks run on std::async threads. The first exception thrown by a chunk
 * is rethrown in the caller after all chunks finish.
 */
template<typename Func>
void ParallelForRange(size_t begin, size_t end, Func&& func, size_t workPerIteration = 1) {
    if (begin >= end) return;

    size_t count = end - begin;
    if (!ShouldParallelize(count, workPerIteration)) {
        func(begin, end);
        return;
    }

    size_t numChunks = std::min(count, GetNumCores());
    size_t chunkSize = count / numChunks;
    size_t remainder = count % numChunks;

    std::vector<std::future<void>> futures;
    futures.reserve(numChunks);

    size_t current = begin;
    for (size_t chunk = 0; chunk < numChunks; ++chunk) {
        size_t chunkEnd = current + chunkSize + (chunk < remainder ? 1 : 0);
        futures.push_back(std::async(std::launch::async, [&func, current, chunkEnd]() {
            func(current, chunkEnd);
        }));
        current = chunkEnd;
    }

    // Wait for every chunk before propagating, chunks reference caller state
    for (auto& f : futures) {
        f.wait();
    }
    for (auto& f : futures) {
        f.get();
    }
}

} // namespace Vol::Seg::Platform
