#pragma once

/**
 * @file Matrix.h
 * @brief Small dynamic-size matrix types for VolSeg
 *
 * This module provides:
 * - Dynamic-size vectors: VecX
 * - Dynamic-size matrices: MatX
 * - Decomposition result structures (for Solver.h)
 *
 * Used by:
 * - Solver.h (Cholesky, triangular solves, SPD inverse)
 * - RegionStatistics.h (mean vector, covariance, Mahalanobis distance)
 *
 * Design principles:
 * - Row-major storage
 * - Double precision only
 * - Sizes are the channel count of a vector volume, so no blocking or SIMD
 */

#include <cmath>
#include <initializer_list>
#include <stdexcept>
#include <vector>

namespace Vol::Seg::Internal {

// =============================================================================
// Dynamic-Size Vector: VecX
// =============================================================================

class VecX {
public:
    VecX() = default;

    explicit VecX(int size) : data_(size > 0 ? static_cast<size_t>(size) : 0, 0.0) {}

    VecX(int size, double value) : data_(size > 0 ? static_cast<size_t>(size) : 0, value) {}

    VecX(std::initializer_list<double> init) : data_(init) {}

    int Size() const { return static_cast<int>(data_.size()); }

    double& operator[](int i) { return data_[static_cast<size_t>(i)]; }
    const double& operator[](int i) const { return data_[static_cast<size_t>(i)]; }

    double* Data() { return data_.data(); }
    const double* Data() const { return data_.data(); }

    VecX operator+(const VecX& v) const {
        RequireSameSize(v);
        VecX result(Size());
        for (int i = 0; i < Size(); ++i) result[i] = (*this)[i] + v[i];
        return result;
    }

    VecX operator-(const VecX& v) const {
        RequireSameSize(v);
        VecX result(Size());
        for (int i = 0; i < Size(); ++i) result[i] = (*this)[i] - v[i];
        return result;
    }

    VecX operator*(double s) const {
        VecX result(Size());
        for (int i = 0; i < Size(); ++i) result[i] = (*this)[i] * s;
        return result;
    }

    VecX& operator+=(const VecX& v) {
        RequireSameSize(v);
        for (int i = 0; i < Size(); ++i) (*this)[i] += v[i];
        return *this;
    }

    VecX& operator*=(double s) {
        for (auto& x : data_) x *= s;
        return *this;
    }

    double Dot(const VecX& v) const {
        RequireSameSize(v);
        double sum = 0.0;
        for (int i = 0; i < Size(); ++i) sum += (*this)[i] * v[i];
        return sum;
    }

    double SquaredNorm() const { return Dot(*this); }
    double Norm() const { return std::sqrt(SquaredNorm()); }

    std::vector<double> ToStdVector() const { return data_; }

    static VecX Zero(int size) { return VecX(size); }

private:
    void RequireSameSize(const VecX& v) const {
        if (v.Size() != Size()) throw std::invalid_argument("VecX size mismatch");
    }

    std::vector<double> data_;
};

// =============================================================================
// Dynamic-Size Matrix: MatX
// =============================================================================

class MatX {
public:
    MatX() = default;

    MatX(int rows, int cols)
        : rows_(rows > 0 && cols > 0 ? rows : 0),
          cols_(rows > 0 && cols > 0 ? cols : 0),
          data_(static_cast<size_t>(rows_) * static_cast<size_t>(cols_), 0.0) {}

    int Rows() const { return rows_; }
    int Cols() const { return cols_; }
    bool Empty() const { return data_.empty(); }

    double& operator()(int row, int col) {
        return data_[static_cast<size_t>(row) * cols_ + col];
    }
    const double& operator()(int row, int col) const {
        return data_[static_cast<size_t>(row) * cols_ + col];
    }

    MatX operator*(const MatX& m) const {
        if (cols_ != m.rows_) throw std::invalid_argument("MatX size mismatch for multiply");
        MatX result(rows_, m.cols_);
        for (int i = 0; i < rows_; ++i) {
            for (int k = 0; k < cols_; ++k) {
                double a = (*this)(i, k);
                for (int j = 0; j < m.cols_; ++j) {
                    result(i, j) += a * m(k, j);
                }
            }
        }
        return result;
    }

    VecX operator*(const VecX& v) const {
        if (cols_ != v.Size()) throw std::invalid_argument("MatX-VecX size mismatch");
        VecX result(rows_);
        for (int i = 0; i < rows_; ++i) {
            double sum = 0.0;
            for (int j = 0; j < cols_; ++j) sum += (*this)(i, j) * v[j];
            result[i] = sum;
        }
        return result;
    }

    MatX operator*(double s) const {
        MatX result = *this;
        for (auto& x : result.data_) x *= s;
        return result;
    }

    MatX Transpose() const {
        MatX result(cols_, rows_);
        for (int i = 0; i < rows_; ++i) {
            for (int j = 0; j < cols_; ++j) result(j, i) = (*this)(i, j);
        }
        return result;
    }

    /// Add v * v^T (rank-1 update), square matrices only
    void AddOuterProduct(const VecX& v) {
        if (rows_ != v.Size() || cols_ != v.Size()) {
            throw std::invalid_argument("MatX outer product size mismatch");
        }
        for (int i = 0; i < rows_; ++i) {
            for (int j = 0; j < cols_; ++j) (*this)(i, j) += v[i] * v[j];
        }
    }

    /// Row-major copy of the elements
    std::vector<double> ToStdVector() const { return data_; }

    static MatX Zero(int rows, int cols) { return MatX(rows, cols); }

    static MatX Identity(int size) {
        MatX result(size, size);
        for (int i = 0; i < size; ++i) result(i, i) = 1.0;
        return result;
    }

private:
    int rows_ = 0;
    int cols_ = 0;
    std::vector<double> data_;
};

// =============================================================================
// Decomposition Results
// =============================================================================

/**
 * @brief Cholesky decomposition result
 * A = L * L^T (lower triangular)
 */
struct CholeskyResult {
    MatX L;                    ///< Lower triangular matrix
    bool valid = false;        ///< Whether matrix is positive definite
    int failedPivot = -1;      ///< Column whose pivot failed, -1 if valid
};

} // namespace Vol::Seg::Internal
