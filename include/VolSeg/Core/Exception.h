#pragma once

#include <VolSeg/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for VolSeg
 *
 * Construction-time errors (bad seeds, bad bounds, bad parameters) are
 * always thrown. Errors raised while an iterative grower refines its
 * statistics are caught by the grower and reported through its result
 * status, see Segment/RegionGrowing.h.
 */

#include <stdexcept>
#include <string>

namespace Vol::Seg {

/**
 * @brief Base exception class for VolSeg
 */
class VOLSEG_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument exception
 */
class VOLSEG_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief Coordinate or component index outside the volume
 */
class VOLSEG_API OutOfRangeException : public Exception {
public:
    explicit OutOfRangeException(const std::string& message)
        : Exception("Out of range: " + message) {}
};

/**
 * @brief Seed coordinate outside the grid bounds
 */
class VOLSEG_API InvalidSeedException : public Exception {
public:
    explicit InvalidSeedException(const std::string& message)
        : Exception("Invalid seed: " + message) {}
};

/**
 * @brief Threshold interval with lower > upper
 */
class VOLSEG_API InvalidBoundsException : public Exception {
public:
    explicit InvalidBoundsException(const std::string& message)
        : Exception("Invalid bounds: " + message) {}
};

/**
 * @brief Too few voxels to estimate variance or covariance
 */
class VOLSEG_API InsufficientSamplesException : public Exception {
public:
    explicit InsufficientSamplesException(const std::string& message)
        : Exception("Insufficient samples: " + message) {}
};

/**
 * @brief Covariance matrix is not positive definite
 */
class VOLSEG_API SingularCovarianceException : public Exception {
public:
    explicit SingularCovarianceException(const std::string& message)
        : Exception("Singular covariance: " + message) {}
};

/**
 * @brief Iterative refinement reached statistics it cannot refine
 */
class VOLSEG_API DegenerateStatisticsException : public Exception {
public:
    explicit DegenerateStatisticsException(const std::string& message)
        : Exception("Degenerate statistics: " + message) {}
};

/**
 * @brief Volumes participating in one operation differ in shape
 */
class VOLSEG_API DimensionMismatchException : public Exception {
public:
    explicit DimensionMismatchException(const std::string& message)
        : Exception("Dimension mismatch: " + message) {}
};

} // namespace Vol::Seg
