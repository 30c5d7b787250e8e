#pragma once

/**
 * @file Solver.h
 * @brief Linear solvers for symmetric positive definite systems
 *
 * This module provides:
 * - Cholesky decomposition with a relative pivot check
 * - Forward / back substitution
 * - SPD inverse from a pre-computed Cholesky factor
 *
 * Used by:
 * - RegionStatistics.h (covariance inverse, Mahalanobis distance)
 *
 * A failed pivot is reported through CholeskyResult::valid rather than by
 * producing NaNs, so callers can raise a precise error.
 */

#include <VolSeg/Internal/Matrix.h>

namespace Vol::Seg::Internal {

// =============================================================================
// Constants
// =============================================================================

/// Pivot threshold relative to the largest diagonal element
constexpr double SOLVER_SINGULAR_THRESHOLD = 1e-12;

// =============================================================================
// Decomposition
// =============================================================================

/**
 * @brief Cholesky decomposition for symmetric positive definite matrices
 * Computes A = L * L^T where L is lower triangular
 *
 * A pivot d_j is rejected when d_j <= relTolerance * max_i |A(i,i)|, which
 * catches exactly singular and numerically rank-deficient covariances.
 *
 * @param A Input symmetric matrix (only the lower triangle is read)
 * @param relTolerance Relative pivot threshold
 * @return CholeskyResult with valid = false if A is not positive definite
 *
 * Complexity: O(n^3/3)
 */
CholeskyResult Cholesky_Decompose(const MatX& A,
                                  double relTolerance = SOLVER_SINGULAR_THRESHOLD);

// =============================================================================
// Triangular Solvers
// =============================================================================

/**
 * @brief Solve L x = b by forward substitution
 * @throws InvalidArgumentException on dimension mismatch or zero diagonal
 */
VecX SolveLowerTriangular(const MatX& L, const VecX& b);

/**
 * @brief Solve U x = b by back substitution
 * @throws InvalidArgumentException on dimension mismatch or zero diagonal
 */
VecX SolveUpperTriangular(const MatX& U, const VecX& b);

/**
 * @brief Solve A x = b from pre-computed Cholesky decomposition of A
 * @throws InvalidArgumentException if chol is invalid or sizes differ
 */
VecX SolveFromCholesky(const CholeskyResult& chol, const VecX& b);

/**
 * @brief Inverse of A from its Cholesky decomposition
 *
 * The result is symmetrized to remove round-off asymmetry.
 *
 * @throws InvalidArgumentException if chol is invalid
 */
MatX InverseFromCholesky(const CholeskyResult& chol);

} // namespace Vol::Seg::Internal
