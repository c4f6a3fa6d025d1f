#include "capbox/feature_importance.hpp"
#include "capbox/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace capbox {

std::vector<FisherScore> compute_fisher_scores(
    const std::vector<GaussianParams>& in_features,
    const std::vector<GaussianParams>& out_features)
{
    if (in_features.size() != NUM_FEATURES || out_features.size() != NUM_FEATURES) {
        throw DimensionMismatch("compute_fisher_scores: expected " + std::to_string(NUM_FEATURES) +
                                " features, got in=" + std::to_string(in_features.size()) +
                                ", out=" + std::to_string(out_features.size()));
    }

    std::vector<FisherScore> scores(NUM_FEATURES);
    double max_score = 0.0;

    for (size_t i = 0; i < NUM_FEATURES; ++i) {
        const GaussianParams& p_in = in_features[i];
        const GaussianParams& p_out = out_features[i];

        const double mean_diff = std::abs(p_in.mean - p_out.mean);
        const double variance_sum = p_in.std * p_in.std + p_out.std * p_out.std;

        FisherScore& f = scores[i];
        f.feature_index = i;
        f.feature_name = FEATURE_NAMES[i];
        f.mean_difference = mean_diff;
        f.fisher_score = variance_sum > 0.0 ? (mean_diff * mean_diff) / variance_sum : 0.0;
        max_score = std::max(max_score, f.fisher_score);
    }

    if (max_score > 0.0) {
        for (auto& f : scores) {
            f.importance_weight = f.fisher_score / max_score;
        }
    }

    return scores;
}

std::vector<FisherScore> top_features(const std::vector<FisherScore>& scores, size_t k) {
    std::vector<FisherScore> sorted = scores;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const FisherScore& a, const FisherScore& b) {
                         return a.fisher_score > b.fisher_score;
                     });
    if (sorted.size() > k) sorted.resize(k);
    return sorted;
}

}  // namespace capbox
