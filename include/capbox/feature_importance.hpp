#pragma once

#include "capbox/types.hpp"

#include <cstddef>
#include <vector>

namespace capbox {

// Fisher score per feature: (mu_in - mu_out)^2 / (sigma_in^2 + sigma_out^2),
// 0 when the variance sum is 0. importance_weight = score / max score.
// Throws DimensionMismatch unless both inputs have NUM_FEATURES entries.
std::vector<FisherScore> compute_fisher_scores(
    const std::vector<GaussianParams>& in_features,
    const std::vector<GaussianParams>& out_features);

// Copy of `scores` ordered by descending fisher_score, truncated to `k`.
std::vector<FisherScore> top_features(const std::vector<FisherScore>& scores, size_t k);

}  // namespace capbox
