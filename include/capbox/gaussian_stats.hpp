#pragma once
// Per-class Gaussian statistics over NUM_FEATURES-dimensional samples.

#include "capbox/types.hpp"

#include <vector>

namespace capbox {

// Per-feature arithmetic mean. All zeros for an empty class.
std::vector<double> class_means(const ClassSamples& samples);

// Unbiased (n-1) covariance, NUM_FEATURES x NUM_FEATURES row-major.
// Identity when n < 2.
FlatMatrix class_covariance(const ClassSamples& samples);

// (n_in * cov_in + n_out * cov_out) / (n_in + n_out); identity when n_in + n_out < 2.
FlatMatrix pooled_covariance(const ClassSamples& in_samples, const ClassSamples& out_samples);

// Mean and population std per feature, std floored at min_std.
// An empty class yields {0, min_std} for every feature.
std::vector<GaussianParams> fit_gaussian_params(const ClassSamples& samples, double min_std);

// Throws DimensionMismatch if n disagrees with the vector count or any
// vector is not NUM_FEATURES long.
void check_samples(const ClassSamples& samples, const char* what);

}  // namespace capbox
