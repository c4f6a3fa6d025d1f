#pragma once
// Hand-tuned starting model used before enough annotations exist.
//
// "in" (caption) boxes: well aligned, similar heights, clustered, wide, near
// the bottom of the frame. "out" (noise) boxes: scattered and varied.

#include "capbox/types.hpp"

#include <memory>
#include <vector>

namespace capbox {

constexpr const char* SEED_MODEL_VERSION = "seed_v2";
constexpr const char* TRAINED_MODEL_VERSION = "naive_bayes_v2";

const std::vector<GaussianParams>& seed_in_params();
const std::vector<GaussianParams>& seed_out_params();

// Priors 0.5/0.5, seed Gaussians, no covariance, revision 0.
std::shared_ptr<const Model> make_seed_model();

}  // namespace capbox
