/**
 * @file Solver.cpp
 * @brief Cholesky decomposition and triangular solvers
 */

#include <VolSeg/Internal/Solver.h>
#include <VolSeg/Core/Exception.h>

#include <algorithm>
#include <cmath>

namespace Vol::Seg::Internal {

// =============================================================================
// Cholesky Decomposition
// =============================================================================

CholeskyResult Cholesky_Decompose(const MatX& A, double relTolerance) {
    CholeskyResult result;
    int n = A.Rows();

    if (n != A.Cols()) {
        return result;
    }

    if (n == 0) {
        result.valid = true;
        return result;
    }

    double maxDiag = 0.0;
    for (int i = 0; i < n; ++i) {
        maxDiag = std::max(maxDiag, std::abs(A(i, i)));
    }
    if (!(maxDiag > 0.0) || !std::isfinite(maxDiag)) {
        result.failedPivot = 0;
        return result;
    }
    const double pivotMin = relTolerance * maxDiag;

    result.L = MatX::Zero(n, n);

    for (int j = 0; j < n; ++j) {
        // Diagonal element
        double sum = A(j, j);
        for (int k = 0; k < j; ++k) {
            sum -= result.L(j, k) * result.L(j, k);
        }

        if (!(sum > pivotMin)) {
            result.failedPivot = j;
            return result;
        }

        result.L(j, j) = std::sqrt(sum);

        // Off-diagonal elements
        for (int i = j + 1; i < n; ++i) {
            sum = A(i, j);
            for (int k = 0; k < j; ++k) {
                sum -= result.L(i, k) * result.L(j, k);
            }
            result.L(i, j) = sum / result.L(j, j);
        }
    }

    result.valid = true;
    return result;
}

// =============================================================================
// Triangular Solvers
// =============================================================================

VecX SolveLowerTriangular(const MatX& L, const VecX& b) {
    int n = L.Rows();
    if (L.Cols() != n || b.Size() != n) {
        throw InvalidArgumentException("SolveLowerTriangular: dimension mismatch");
    }

    VecX x(n);
    for (int i = 0; i < n; ++i) {
        double sum = b[i];
        for (int k = 0; k < i; ++k) {
            sum -= L(i, k) * x[k];
        }
        if (L(i, i) == 0.0) {
            throw InvalidArgumentException("SolveLowerTriangular: zero diagonal");
        }
        x[i] = sum / L(i, i);
    }
    return x;
}

VecX SolveUpperTriangular(const MatX& U, const VecX& b) {
    int n = U.Rows();
    if (U.Cols() != n || b.Size() != n) {
        throw InvalidArgumentException("SolveUpperTriangular: dimension mismatch");
    }

    VecX x(n);
    for (int i = n - 1; i >= 0; --i) {
        double sum = b[i];
        for (int k = i + 1; k < n; ++k) {
            sum -= U(i, k) * x[k];
        }
        if (U(i, i) == 0.0) {
            throw InvalidArgumentException("SolveUpperTriangular: zero diagonal");
        }
        x[i] = sum / U(i, i);
    }
    return x;
}

VecX SolveFromCholesky(const CholeskyResult& chol, const VecX& b) {
    if (!chol.valid) {
        throw InvalidArgumentException("SolveFromCholesky: decomposition is invalid");
    }
    if (b.Size() != chol.L.Rows()) {
        throw InvalidArgumentException("SolveFromCholesky: dimension mismatch");
    }

    // Solve Ly = b, then L^T x = y
    VecX y = SolveLowerTriangular(chol.L, b);
    return SolveUpperTriangular(chol.L.Transpose(), y);
}

// =============================================================================
// Inverse
// =============================================================================

MatX InverseFromCholesky(const CholeskyResult& chol) {
    if (!chol.valid) {
        throw InvalidArgumentException("InverseFromCholesky: decomposition is invalid");
    }

    int n = chol.L.Rows();
    MatX inv(n, n);
    MatX LT = chol.L.Transpose();

    for (int j = 0; j < n; ++j) {
        VecX e(n);
        e[j] = 1.0;
        VecX col = SolveUpperTriangular(LT, SolveLowerTriangular(chol.L, e));
        for (int i = 0; i < n; ++i) {
            inv(i, j) = col[i];
        }
    }

    for (int i = 0; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            double avg = 0.5 * (inv(i, j) + inv(j, i));
            inv(i, j) = avg;
            inv(j, i) = avg;
        }
    }
    return inv;
}

} // namespace Vol::Seg::Internal
