#pragma once

/**
 * @file Log.h
 * @brief Library logger
 *
 * All VolSeg diagnostics go through a single spdlog logger named "volseg"
 * writing to stderr. The default level is warn, so a silent run prints
 * nothing unless a grower returns a degraded result.
 *
 * @code
 * Vol::Seg::Log::SetLevel(spdlog::level::debug);   // per-iteration bounds
 * Vol::Seg::Log::Get()->info("loaded {} voxels", grid.VoxelCount());
 * @endcode
 */

#include <VolSeg/Core/Export.h>

#include <spdlog/spdlog.h>

#include <memory>

namespace Vol::Seg::Log {

/// Logger name registered with spdlog
constexpr const char* LOGGER_NAME = "volseg";

/**
 * @brief Get the library logger, creating it on first use
 *
 * If the application already registered a logger named "volseg" (for
 * example with its own sinks), that logger is used instead.
 */
VOLSEG_API std::shared_ptr<spdlog::logger> Get();

/// Set the library log level
VOLSEG_API void SetLevel(spdlog::level::level_enum level);

} // namespace Vol::Seg::Log
