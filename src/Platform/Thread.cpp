/**
 * @file Thread.cpp
 * @brief System information for parallel loops
 */

#include <VolSeg/Platform/Thread.h>

#include <thread>

namespace Vol::Seg::Platform {

size_t GetNumCores() {
    unsigned int cores = std::thread::hardware_concurrency();
    return cores > 0 ? static_cast<size_t>(cores) : 1;
}

} // namespace Vol::Seg::Platform
