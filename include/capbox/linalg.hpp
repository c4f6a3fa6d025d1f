#pragma once
// Dense linear algebra on flat row-major square matrices.
//
// Sized for the 26x26 feature covariance: plain O(n^3) loops, no blocking.

#include "capbox/types.hpp"

#include <cstddef>
#include <string>

namespace capbox {
namespace linalg {

// n x n identity.
FlatMatrix identity(size_t n);

// Lower-triangular L with A = L * L^T.
// Throws NotPositiveDefinite(row) when a diagonal term is <= 0,
// DimensionMismatch when A.size() != n*n.
FlatMatrix cholesky(const FlatMatrix& A, size_t n);

// Inverse of a lower-triangular matrix by forward substitution.
// An exact-zero pivot is treated as 1.0 instead of dividing by zero.
FlatMatrix invert_lower_triangular(const FlatMatrix& L, size_t n);

// Keeps only the diagonal: 1/a_ii for positive entries, 1.0 otherwise.
FlatMatrix invert_diagonal(const FlatMatrix& A, size_t n);

enum class InverseQuality : uint8_t {
    OK,        // exact inverse via Cholesky
    DEGRADED   // diagonal approximation after Cholesky failed
};

struct InverseResult {
    FlatMatrix inverse;
    InverseQuality quality = InverseQuality::OK;
    std::string reason;   // why the fallback was taken (empty when OK)

    bool degraded() const { return quality == InverseQuality::DEGRADED; }
};

// Inverse of a symmetric matrix: A^-1 = L^-T * L^-1.
// Falls back to invert_diagonal() when A is not positive definite and logs a
// warning. Only a non-square input throws (DimensionMismatch).
InverseResult invert_symmetric(const FlatMatrix& A);

// sqrt(max(0, (x-y)^T * inv * (x-y))).
// Throws DimensionMismatch unless x, y have NUM_FEATURES entries and inv has
// NUM_MATRIX_ENTRIES.
double mahalanobis(const FeatureVector& x, const FeatureVector& y, const FlatMatrix& covariance_inverse);

// Same kernel without size checks; caller guarantees the shapes.
double mahalanobis_unchecked(const double* x, const double* y, const double* covariance_inverse, size_t n);

}  // namespace linalg
}  // namespace capbox
