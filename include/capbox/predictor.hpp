#pragma once
// Gaussian Naive Bayes scoring of one feature vector against a Model.
//
// Everything is accumulated in log space: with 26 features the raw
// likelihood product underflows for any box far from both class means.

#include "capbox/types.hpp"

#include <cstddef>

namespace capbox {

constexpr double PDF_FLOOR = 1e-300;

double gaussian_pdf(double x, double mean, double std);

// log(max(pdf, PDF_FLOOR))
double log_gaussian_pdf(double x, double mean, double std);

// log(sum(exp(vals))) without overflow; -inf for n == 0.
double log_sum_exp(const double* vals, size_t n);

// Label with the larger posterior, confidence = that posterior.
// Returns {IN, 0.5} when the posteriors are not finite.
// Throws DimensionMismatch if features is not NUM_FEATURES long.
Prediction predict_bayesian(const FeatureVector& features, const Model& model);

}  // namespace capbox
