#pragma once
// Ranks previously scored boxes by how likely a new annotation is to flip
// their prediction, so recalculation can start with the most volatile ones.
//
//   p = w_u * (1 - confidence)
//     + w_s * exp(-d_M^2 / (2 * sigma^2))      d_M: Mahalanobis to the annotation
//     + w_b * (1 - 2 * |confidence - 0.5|)
//
// clamped to [0, 1]; sigma = MAX_MAHALANOBIS_DISTANCE.

#include "capbox/config.hpp"
#include "capbox/types.hpp"

#include <vector>

namespace capbox {

struct Candidate {
    BoxWithPrediction box;
    double change_probability = 0.0;
};

// Throws DimensionMismatch on a wrong-sized feature vector or inverse.
double estimate_change_probability(const BoxWithPrediction& box,
                                   const Annotation& new_annotation,
                                   const FlatMatrix& covariance_inverse,
                                   const EngineConfig& config);

// Every box scoring >= MIN_CHANGE_PROBABILITY, highest first. Ties keep the
// input order. Sizes are checked up front; scoring runs in parallel.
std::vector<Candidate> identify_affected_boxes(const Annotation& new_annotation,
                                               const std::vector<BoxWithPrediction>& all_boxes,
                                               const FlatMatrix& covariance_inverse,
                                               const EngineConfig& config);

}  // namespace capbox
