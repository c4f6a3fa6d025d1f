#include "capbox/predictor.hpp"
#include "capbox/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace capbox {

namespace {
constexpr double PI = 3.14159265358979323846;
}

double gaussian_pdf(double x, double mean, double std) {
    if (std <= 0.0) {
        return std::abs(x - mean) < 1e-9 ? 1.0 : 1e-10;
    }
    const double variance = std * std;
    const double coefficient = 1.0 / std::sqrt(2.0 * PI * variance);
    const double d = x - mean;
    return coefficient * std::exp(-0.5 * d * d / variance);
}

double log_gaussian_pdf(double x, double mean, double std) {
    return std::log(std::max(gaussian_pdf(x, mean, std), PDF_FLOOR));
}

double log_sum_exp(const double* vals, size_t n) {
    if (n == 0) return -std::numeric_limits<double>::infinity();

    double max_val = vals[0];
    for (size_t i = 1; i < n; ++i) {
        if (vals[i] > max_val) max_val = vals[i];
    }
    if (max_val == -std::numeric_limits<double>::infinity()) return max_val;

    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        sum += std::exp(vals[i] - max_val);
    }
    return max_val + std::log(sum);
}

Prediction predict_bayesian(const FeatureVector& features, const Model& model) {
    if (features.size() != NUM_FEATURES) {
        throw DimensionMismatch("predict_bayesian: expected " + std::to_string(NUM_FEATURES) +
                                " features, got " + std::to_string(features.size()));
    }
    if (model.in_features.size() != NUM_FEATURES || model.out_features.size() != NUM_FEATURES) {
        throw DimensionMismatch("predict_bayesian: model does not carry " +
                                std::to_string(NUM_FEATURES) + " Gaussian parameters per class");
    }

    double ll_in = 0.0;
    double ll_out = 0.0;
    for (size_t i = 0; i < NUM_FEATURES; ++i) {
        ll_in += log_gaussian_pdf(features[i], model.in_features[i].mean, model.in_features[i].std);
        ll_out += log_gaussian_pdf(features[i], model.out_features[i].mean, model.out_features[i].std);
    }

    const double log_post_in = ll_in + std::log(model.prior_in);
    const double log_post_out = ll_out + std::log(model.prior_out);

    const double max_log = std::max(log_post_in, log_post_out);
    const double post_in = std::exp(log_post_in - max_log);
    const double post_out = std::exp(log_post_out - max_log);
    const double total = post_in + post_out;

    Prediction p;
    if (total == 0.0 || !std::isfinite(total)) {
        p.label = Label::IN;
        p.confidence = 0.5;
        return p;
    }

    const double prob_in = post_in / total;
    const double prob_out = post_out / total;
    if (prob_in > prob_out) {
        p.label = Label::IN;
        p.confidence = prob_in;
    } else {
        p.label = Label::OUT;
        p.confidence = prob_out;
    }
    return p;
}

}  // namespace capbox
