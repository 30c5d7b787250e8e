/**
 * @file test_solver.cpp
 * @brief Unit tests for Internal/Solver module
 */

#include <VolSeg/Internal/Solver.h>
#include <VolSeg/Internal/Matrix.h>
#include <VolSeg/Core/Exception.h>
#include <gtest/gtest.h>

#include <cmath>
#include <random>

namespace Vol::Seg::Internal {
namespace {

// =============================================================================
// Test Utilities
// =============================================================================

/// Create a random symmetric positive definite matrix
MatX RandomSPD(int n, std::mt19937& rng) {
    std::uniform_real_distribution<double> dist(-10.0, 10.0);
    MatX A(n, n);
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            A(i, j) = dist(rng);
        }
    }
    MatX ATA = A.Transpose() * A;
    for (int i = 0; i < n; ++i) {
        ATA(i, i) += n;
    }
    return ATA;
}

void ExpectMatrixNear(const MatX& A, const MatX& B, double tol) {
    ASSERT_EQ(A.Rows(), B.Rows());
    ASSERT_EQ(A.Cols(), B.Cols());
    for (int i = 0; i < A.Rows(); ++i) {
        for (int j = 0; j < A.Cols(); ++j) {
            EXPECT_NEAR(A(i, j), B(i, j), tol) << "at (" << i << ", " << j << ")";
        }
    }
}

// =============================================================================
// Cholesky Tests
// =============================================================================

TEST(SolverTest, CholeskyKnownMatrix) {
    MatX A(3, 3);
    A(0, 0) = 4;  A(0, 1) = 12;  A(0, 2) = -16;
    A(1, 0) = 12; A(1, 1) = 37;  A(1, 2) = -43;
    A(2, 0) = -16; A(2, 1) = -43; A(2, 2) = 98;

    auto chol = Cholesky_Decompose(A);
    ASSERT_TRUE(chol.valid);
    EXPECT_EQ(chol.failedPivot, -1);

    EXPECT_NEAR(chol.L(0, 0), 2.0, 1e-12);
    EXPECT_NEAR(chol.L(1, 0), 6.0, 1e-12);
    EXPECT_NEAR(chol.L(1, 1), 1.0, 1e-12);
    EXPECT_NEAR(chol.L(2, 0), -8.0, 1e-12);
    EXPECT_NEAR(chol.L(2, 1), 5.0, 1e-12);
    EXPECT_NEAR(chol.L(2, 2), 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(chol.L(0, 2), 0.0);
}

TEST(SolverTest, CholeskyReconstructsRandomSPD) {
    std::mt19937 rng(42);
    for (int n : {1, 2, 3, 5}) {
        MatX A = RandomSPD(n, rng);
        auto chol = Cholesky_Decompose(A);
        ASSERT_TRUE(chol.valid);
        ExpectMatrixNear(chol.L * chol.L.Transpose(), A, 1e-9);
    }
}

TEST(SolverTest, CholeskyRejectsSingular) {
    // Rank 1: [[1, 1], [1, 1]]
    MatX A(2, 2);
    A(0, 0) = 1; A(0, 1) = 1;
    A(1, 0) = 1; A(1, 1) = 1;

    auto chol = Cholesky_Decompose(A);
    EXPECT_FALSE(chol.valid);
    EXPECT_EQ(chol.failedPivot, 1);
}

TEST(SolverTest, CholeskyRejectsIndefinite) {
    MatX A(2, 2);
    A(0, 0) = 1; A(0, 1) = 2;
    A(1, 0) = 2; A(1, 1) = 1;
    EXPECT_FALSE(Cholesky_Decompose(A).valid);
}

TEST(SolverTest, CholeskyRejectsZeroMatrix) {
    EXPECT_FALSE(Cholesky_Decompose(MatX::Zero(3, 3)).valid);
}

TEST(SolverTest, CholeskyRelativePivotScalesWithMatrix) {
    // Small but well-conditioned covariance stays valid
    MatX A = MatX::Identity(2) * 1e-8;
    EXPECT_TRUE(Cholesky_Decompose(A).valid);

    // Nearly collinear relative to the diagonal scale fails
    MatX B(2, 2);
    B(0, 0) = 1e6;       B(0, 1) = 1e6;
    B(1, 0) = 1e6;       B(1, 1) = 1e6 + 1e-9;
    EXPECT_FALSE(Cholesky_Decompose(B).valid);
}

// =============================================================================
// Solve / Inverse Tests
// =============================================================================

TEST(SolverTest, TriangularSolves) {
    MatX L(2, 2);
    L(0, 0) = 2; L(1, 0) = 1; L(1, 1) = 4;
    VecX b{4.0, 10.0};

    VecX x = SolveLowerTriangular(L, b);
    EXPECT_NEAR(x[0], 2.0, 1e-12);
    EXPECT_NEAR(x[1], 2.0, 1e-12);

    VecX y = SolveUpperTriangular(L.Transpose(), VecX{4.0, 8.0});
    // [2 1; 0 4] y = [4; 8] -> y = [1, 2]
    EXPECT_NEAR(y[0], 1.0, 1e-12);
    EXPECT_NEAR(y[1], 2.0, 1e-12);
}

TEST(SolverTest, TriangularSolveSizeMismatchThrows) {
    MatX L = MatX::Identity(3);
    EXPECT_THROW(SolveLowerTriangular(L, VecX{1.0, 2.0}), InvalidArgumentException);
}

TEST(SolverTest, SolveFromCholesky) {
    std::mt19937 rng(7);
    MatX A = RandomSPD(4, rng);
    VecX xTrue{1.0, -2.0, 0.5, 3.0};
    VecX b = A * xTrue;

    auto chol = Cholesky_Decompose(A);
    ASSERT_TRUE(chol.valid);
    VecX x = SolveFromCholesky(chol, b);
    for (int i = 0; i < 4; ++i) {
        EXPECT_NEAR(x[i], xTrue[i], 1e-9);
    }
}

TEST(SolverTest, InverseFromCholesky) {
    std::mt19937 rng(3);
    MatX A = RandomSPD(3, rng);
    auto chol = Cholesky_Decompose(A);
    ASSERT_TRUE(chol.valid);

    MatX inv = InverseFromCholesky(chol);
    ExpectMatrixNear(A * inv, MatX::Identity(3), 1e-9);

    // Symmetric by construction
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            EXPECT_DOUBLE_EQ(inv(i, j), inv(j, i));
        }
    }
}

TEST(SolverTest, InverseFromInvalidCholeskyThrows) {
    CholeskyResult invalid;
    EXPECT_THROW(InverseFromCholesky(invalid), InvalidArgumentException);
    EXPECT_THROW(SolveFromCholesky(invalid, VecX{1.0}), InvalidArgumentException);
}

} // namespace
} // namespace Vol::Seg::Internal
