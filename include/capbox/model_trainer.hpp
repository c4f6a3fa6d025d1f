#pragma once
/**
 * @file model_trainer.hpp
 * @brief Full retrain of the Gaussian Naive Bayes model from human annotations
 *
 * Training pipeline:
 *   1. Load annotations; below MIN_ANNOTATIONS_FOR_RETRAIN nothing is trained
 *   2. Extract a feature vector per annotation and bucket by label
 *   3. Per-feature Gaussians (population std, floored at MIN_STD) and priors
 *   4. Fisher importance once MIN_SAMPLES_FOR_IMPORTANCE samples exist
 *   5. Pooled covariance and its inverse for the change estimator
 *   6. Publish a new snapshot through the ModelStore
 */

#include "capbox/collaborators.hpp"
#include "capbox/config.hpp"
#include "capbox/types.hpp"

#include <memory>

namespace capbox {

enum class TrainStatus : uint8_t {
    TRAINED,
    INSUFFICIENT_DATA
};

enum class InsufficientReason : uint8_t {
    NONE,
    TOO_FEW_ANNOTATIONS,   // fewer than MIN_ANNOTATIONS_FOR_RETRAIN in total
    TOO_FEW_PER_CLASS,     // a class has fewer than 2 samples
    NO_LAYOUT              // no layout context to extract features with
};

inline const char* insufficient_reason_to_string(InsufficientReason reason) {
    switch (reason) {
        case InsufficientReason::TOO_FEW_ANNOTATIONS: return "too_few_annotations";
        case InsufficientReason::TOO_FEW_PER_CLASS: return "too_few_per_class";
        case InsufficientReason::NO_LAYOUT: return "no_layout";
        default: return "none";
    }
}

struct TrainOutcome {
    TrainStatus status = TrainStatus::INSUFFICIENT_DATA;
    InsufficientReason reason = InsufficientReason::NONE;

    // Set when annotations dropped below the threshold while the stored
    // model was trained on at least that many. The caller decides whether
    // to go back to the seed model.
    bool reset_to_seed = false;

    size_t n_annotations = 0;
    size_t n_in = 0;
    size_t n_out = 0;

    std::shared_ptr<const Model> model;   // set when TRAINED

    bool trained() const { return status == TrainStatus::TRAINED; }
};

// Pure model construction from already bucketed samples. Both classes need
// at least 2 samples. Throws DimensionMismatch on malformed samples.
std::shared_ptr<const Model> build_model(const ClassSamples& in_samples,
                                         const ClassSamples& out_samples,
                                         const EngineConfig& config,
                                         uint64_t revision);

class ModelTrainer {
public:
    ModelTrainer(const EngineConfig& config, ModelStore& store, const FeatureExtractor& extractor);

    // Retrain from every annotation the source provides. On success the new
    // model has already been saved. Save failures propagate as PersistenceError.
    TrainOutcome train(AnnotationSource& source);

    // Writes the seed model when the store is empty. Returns true if it wrote.
    bool initialize_seed_model();

private:
    const EngineConfig& config_;
    ModelStore& store_;
    const FeatureExtractor& extractor_;
};

}  // namespace capbox
