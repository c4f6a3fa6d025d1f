#include "capbox/change_estimator.hpp"
#include "capbox/errors.hpp"
#include "capbox/linalg.hpp"
#include "capbox/log_utils.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace capbox {

namespace {

// Combines the three factors once the Mahalanobis distance is known.
double combine_factors(double confidence, double distance, const EngineConfig& config) {
    const double uncertainty = 1.0 - confidence;

    const double sigma = config.max_mahalanobis_distance;
    const double similarity = std::exp(-(distance * distance) / (2.0 * sigma * sigma));

    const double boundary = 1.0 - std::abs(confidence - 0.5) * 2.0;

    const double p = uncertainty * config.uncertainty_weight +
                     similarity * config.similarity_weight +
                     boundary * config.boundary_sensitivity_weight;
    return std::min(1.0, std::max(0.0, p));
}

void check_vector(const FeatureVector& v, const char* what) {
    if (v.size() != NUM_FEATURES) {
        throw DimensionMismatch(std::string(what) + " has " + std::to_string(v.size()) +
                                " features, expected " + std::to_string(NUM_FEATURES));
    }
}

void check_inverse(const FlatMatrix& inv) {
    if (inv.size() != NUM_MATRIX_ENTRIES) {
        throw DimensionMismatch("covariance inverse has " + std::to_string(inv.size()) +
                                " entries, expected " + std::to_string(NUM_MATRIX_ENTRIES));
    }
}

}  // namespace

double estimate_change_probability(const BoxWithPrediction& box,
                                   const Annotation& new_annotation,
                                   const FlatMatrix& covariance_inverse,
                                   const EngineConfig& config) {
    const double distance = linalg::mahalanobis(box.features, new_annotation.features, covariance_inverse);
    return combine_factors(box.current_prediction.confidence, distance, config);
}

std::vector<Candidate> identify_affected_boxes(const Annotation& new_annotation,
                                               const std::vector<BoxWithPrediction>& all_boxes,
                                               const FlatMatrix& covariance_inverse,
                                               const EngineConfig& config) {
    check_vector(new_annotation.features, "annotation");
    check_inverse(covariance_inverse);
    for (const auto& box : all_boxes) {
        check_vector(box.features, "box");
    }

    const int n = static_cast<int>(all_boxes.size());
    std::vector<double> scores(all_boxes.size(), 0.0);

    #pragma omp parallel for schedule(static)
    for (int i = 0; i < n; ++i) {
        const BoxWithPrediction& box = all_boxes[static_cast<size_t>(i)];
        const double distance = linalg::mahalanobis_unchecked(
            box.features.data(), new_annotation.features.data(),
            covariance_inverse.data(), NUM_FEATURES);
        scores[static_cast<size_t>(i)] = combine_factors(box.current_prediction.confidence, distance, config);
    }

    std::vector<Candidate> candidates;
    for (size_t i = 0; i < all_boxes.size(); ++i) {
        if (scores[i] >= config.min_change_probability) {
            candidates.push_back({all_boxes[i], scores[i]});
        }
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) {
                         return a.change_probability > b.change_probability;
                     });

    log_utils::debug(std::to_string(candidates.size()) + " of " + std::to_string(all_boxes.size()) +
                     " boxes above change probability " + log_utils::fmt(config.min_change_probability, 2));
    return candidates;
}

}  // namespace capbox
