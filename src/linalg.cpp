#include "capbox/linalg.hpp"
#include "capbox/errors.hpp"
#include "capbox/log_utils.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace capbox {
namespace linalg {

namespace {

void require_square(const FlatMatrix& A, size_t n, const char* what) {
    if (A.size() != n * n) {
        throw DimensionMismatch(std::string(what) + ": expected " + std::to_string(n * n) +
                                " entries, got " + std::to_string(A.size()));
    }
}

}  // namespace

FlatMatrix identity(size_t n) {
    FlatMatrix I(n * n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        I[i * n + i] = 1.0;
    }
    return I;
}

FlatMatrix cholesky(const FlatMatrix& A, size_t n) {
    require_square(A, n, "cholesky");
    FlatMatrix L(n * n, 0.0);

    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j <= i; ++j) {
            double sum = 0.0;

            if (j == i) {
                for (size_t k = 0; k < j; ++k) {
                    sum += L[j * n + k] * L[j * n + k];
                }
                const double diag = A[j * n + j] - sum;
                if (diag <= 0.0) {
                    throw NotPositiveDefinite(j);
                }
                L[j * n + j] = std::sqrt(diag);
            } else {
                for (size_t k = 0; k < j; ++k) {
                    sum += L[i * n + k] * L[j * n + k];
                }
                const double l_jj = L[j * n + j] != 0.0 ? L[j * n + j] : 1.0;
                L[i * n + j] = (A[i * n + j] - sum) / l_jj;
            }
        }
    }

    return L;
}

FlatMatrix invert_lower_triangular(const FlatMatrix& L, size_t n) {
    require_square(L, n, "invert_lower_triangular");
    FlatMatrix L_inv(n * n, 0.0);

    for (size_t i = 0; i < n; ++i) {
        const double l_ii = L[i * n + i] != 0.0 ? L[i * n + i] : 1.0;
        L_inv[i * n + i] = 1.0 / l_ii;

        for (size_t j = i + 1; j < n; ++j) {
            double sum = 0.0;
            for (size_t k = i; k < j; ++k) {
                sum += L[j * n + k] * L_inv[k * n + i];
            }
            const double l_jj = L[j * n + j] != 0.0 ? L[j * n + j] : 1.0;
            L_inv[j * n + i] = -sum / l_jj;
        }
    }

    return L_inv;
}

FlatMatrix invert_diagonal(const FlatMatrix& A, size_t n) {
    require_square(A, n, "invert_diagonal");
    FlatMatrix inv(n * n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        const double d = A[i * n + i];
        inv[i * n + i] = d > 0.0 ? 1.0 / d : 1.0;
    }
    return inv;
}

InverseResult invert_symmetric(const FlatMatrix& A) {
    const size_t n = static_cast<size_t>(std::llround(std::sqrt(static_cast<double>(A.size()))));
    if (n * n != A.size()) {
        throw DimensionMismatch("invert_symmetric: " + std::to_string(A.size()) +
                                " entries do not form a square matrix");
    }

    InverseResult result;
    try {
        const FlatMatrix L = cholesky(A, n);
        const FlatMatrix L_inv = invert_lower_triangular(L, n);

        // A^-1 = L^-T * L^-1; L_inv is lower triangular so k starts at max(i, j)
        result.inverse.assign(n * n, 0.0);
        for (size_t i = 0; i < n; ++i) {
            for (size_t j = i; j < n; ++j) {
                double sum = 0.0;
                for (size_t k = j; k < n; ++k) {
                    sum += L_inv[k * n + i] * L_inv[k * n + j];
                }
                result.inverse[i * n + j] = sum;
                result.inverse[j * n + i] = sum;
            }
        }
        result.quality = InverseQuality::OK;
    } catch (const NotPositiveDefinite& e) {
        log_utils::warn(std::string("Cholesky failed (") + e.what() +
                        "), using diagonal approximation of the inverse");
        result.inverse = invert_diagonal(A, n);
        result.quality = InverseQuality::DEGRADED;
        result.reason = e.what();
    }

    return result;
}

double mahalanobis_unchecked(const double* x, const double* y, const double* covariance_inverse, size_t n) {
    double diff[NUM_FEATURES];
    std::vector<double> heap_diff;
    double* d = diff;
    if (n > NUM_FEATURES) {
        heap_diff.resize(n);
        d = heap_diff.data();
    }
    for (size_t i = 0; i < n; ++i) {
        d[i] = x[i] - y[i];
    }

    double total = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double* row = covariance_inverse + i * n;
        double row_sum = 0.0;
        for (size_t j = 0; j < n; ++j) {
            row_sum += row[j] * d[j];
        }
        total += d[i] * row_sum;
    }

    return std::sqrt(std::max(0.0, total));
}

double mahalanobis(const FeatureVector& x, const FeatureVector& y, const FlatMatrix& covariance_inverse) {
    if (x.size() != NUM_FEATURES || y.size() != NUM_FEATURES) {
        throw DimensionMismatch("mahalanobis: expected " + std::to_string(NUM_FEATURES) +
                                " features, got x=" + std::to_string(x.size()) +
                                ", y=" + std::to_string(y.size()));
    }
    if (covariance_inverse.size() != NUM_MATRIX_ENTRIES) {
        throw DimensionMismatch("mahalanobis: expected " + std::to_string(NUM_MATRIX_ENTRIES) +
                                " covariance values, got " + std::to_string(covariance_inverse.size()));
    }
    return mahalanobis_unchecked(x.data(), y.data(), covariance_inverse.data(), NUM_FEATURES);
}

}  // namespace linalg
}  // namespace capbox
