#include "capbox/gaussian_stats.hpp"
#include "capbox/errors.hpp"
#include "capbox/linalg.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace capbox {

void check_samples(const ClassSamples& samples, const char* what) {
    if (samples.n != samples.features.size()) {
        throw DimensionMismatch(std::string(what) + ": n=" + std::to_string(samples.n) +
                                " but " + std::to_string(samples.features.size()) + " vectors");
    }
    for (size_t s = 0; s < samples.features.size(); ++s) {
        if (samples.features[s].size() != NUM_FEATURES) {
            throw DimensionMismatch(std::string(what) + ": sample " + std::to_string(s) + " has " +
                                    std::to_string(samples.features[s].size()) + " features, expected " +
                                    std::to_string(NUM_FEATURES));
        }
    }
}

std::vector<double> class_means(const ClassSamples& samples) {
    check_samples(samples, "class_means");
    std::vector<double> means(NUM_FEATURES, 0.0);
    if (samples.n == 0) return means;

    for (const auto& sample : samples.features) {
        for (size_t i = 0; i < NUM_FEATURES; ++i) {
            means[i] += sample[i];
        }
    }
    for (size_t i = 0; i < NUM_FEATURES; ++i) {
        means[i] /= static_cast<double>(samples.n);
    }
    return means;
}

FlatMatrix class_covariance(const ClassSamples& samples) {
    check_samples(samples, "class_covariance");
    if (samples.n < 2) {
        return linalg::identity(NUM_FEATURES);
    }

    const std::vector<double> means = class_means(samples);
    const size_t n_samples = samples.features.size();

    // Centered copy so the pair loop below is a plain dot product per entry
    std::vector<double> centered(n_samples * NUM_FEATURES);
    for (size_t s = 0; s < n_samples; ++s) {
        for (size_t i = 0; i < NUM_FEATURES; ++i) {
            centered[s * NUM_FEATURES + i] = samples.features[s][i] - means[i];
        }
    }

    FlatMatrix cov(NUM_MATRIX_ENTRIES, 0.0);
    const double denom = static_cast<double>(samples.n - 1);

    // Each (i, j >= i) entry is written by exactly one iteration
    #pragma omp parallel for schedule(static)
    for (int ii = 0; ii < static_cast<int>(NUM_FEATURES); ++ii) {
        const size_t i = static_cast<size_t>(ii);
        for (size_t j = i; j < NUM_FEATURES; ++j) {
            double sum = 0.0;
            for (size_t s = 0; s < n_samples; ++s) {
                sum += centered[s * NUM_FEATURES + i] * centered[s * NUM_FEATURES + j];
            }
            cov[i * NUM_FEATURES + j] = sum / denom;
            cov[j * NUM_FEATURES + i] = sum / denom;
        }
    }

    return cov;
}

FlatMatrix pooled_covariance(const ClassSamples& in_samples, const ClassSamples& out_samples) {
    const size_t total = in_samples.n + out_samples.n;
    if (total < 2) {
        return linalg::identity(NUM_FEATURES);
    }

    const FlatMatrix cov_in = class_covariance(in_samples);
    const FlatMatrix cov_out = class_covariance(out_samples);

    const double w_in = static_cast<double>(in_samples.n);
    const double w_out = static_cast<double>(out_samples.n);
    const double w_total = static_cast<double>(total);

    FlatMatrix pooled(NUM_MATRIX_ENTRIES, 0.0);
    for (size_t k = 0; k < NUM_MATRIX_ENTRIES; ++k) {
        pooled[k] = (w_in * cov_in[k] + w_out * cov_out[k]) / w_total;
    }
    return pooled;
}

std::vector<GaussianParams> fit_gaussian_params(const ClassSamples& samples, double min_std) {
    const std::vector<double> means = class_means(samples);
    std::vector<GaussianParams> params(NUM_FEATURES);

    for (size_t i = 0; i < NUM_FEATURES; ++i) {
        double variance = 0.0;
        if (samples.n > 0) {
            for (const auto& sample : samples.features) {
                const double d = sample[i] - means[i];
                variance += d * d;
            }
            variance /= static_cast<double>(samples.n);
        }
        params[i].mean = means[i];
        params[i].std = std::max(std::sqrt(variance), min_std);
    }

    return params;
}

}  // namespace capbox
