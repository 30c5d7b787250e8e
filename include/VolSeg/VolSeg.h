#pragma once

/**
 * @file VolSeg.h
 * @brief Main header file for VolSeg library
 *
 * VolSeg is a library for seeded region growing on 3D volumes with
 * binary morphological clean-up of the resulting masks.
 *
 * @version 0.1.0
 */

// Configuration and export macros
#include <VolSeg/VolSegConfig.h>
#include <VolSeg/Core/Export.h>

// Core types and utilities
#include <VolSeg/Core/Types.h>
#include <VolSeg/Core/Exception.h>
#include <VolSeg/Core/Log.h>
#include <VolSeg/Core/VolumeGrid.h>

// Feature modules
#include <VolSeg/Segment/RegionGrowing.h>
#include <VolSeg/Morphology/Morphology.h>

namespace Vol::Seg {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return VOLSEG_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = VOLSEG_VERSION_MAJOR;
    minor = VOLSEG_VERSION_MINOR;
    patch = VOLSEG_VERSION_PATCH;
}

} // namespace Vol::Seg
