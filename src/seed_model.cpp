#include "capbox/seed_model.hpp"

#include <chrono>

namespace capbox {

const std::vector<GaussianParams>& seed_in_params() {
    static const std::vector<GaussianParams> params = {
        // Spatial
        {0.5, 0.5},      // topAlignment
        {0.5, 0.5},      // bottomAlignment
        {0.5, 0.5},      // heightSimilarity
        {0.5, 0.5},      // horizontalClustering
        {4.0, 2.0},      // aspectRatio
        {0.8, 0.1},      // normalizedY
        {0.02, 0.015},   // normalizedArea
        // User annotations
        {0.5, 0.5},      // isUserAnnotatedIn
        {0.5, 0.5},      // isUserAnnotatedOut
        // Edge positions
        {0.35, 0.15},    // normalizedLeft
        {0.75, 0.1},     // normalizedTop
        {0.65, 0.15},    // normalizedRight
        {0.85, 0.1},     // normalizedBottom
        // Character sets
        {0.5, 0.5}, {0.5, 0.5}, {0.5, 0.5}, {0.5, 0.5}, {0.5, 0.5}, {0.5, 0.5},
        {0.5, 0.5}, {0.5, 0.5}, {0.5, 0.5}, {0.5, 0.5}, {0.5, 0.5},
        // Temporal
        {300.0, 200.0},  // timeFromStart
        {300.0, 200.0},  // timeFromEnd
    };
    return params;
}

const std::vector<GaussianParams>& seed_out_params() {
    static const std::vector<GaussianParams> params = {
        // Spatial
        {1.5, 1.0},      // topAlignment
        {1.5, 1.0},      // bottomAlignment
        {1.5, 1.0},      // heightSimilarity
        {1.5, 1.0},      // horizontalClustering
        {2.0, 3.0},      // aspectRatio
        {0.5, 0.3},      // normalizedY
        {0.03, 0.03},    // normalizedArea
        // User annotations
        {0.5, 0.5},      // isUserAnnotatedIn
        {0.5, 0.5},      // isUserAnnotatedOut
        // Edge positions
        {0.5, 0.3},      // normalizedLeft
        {0.5, 0.3},      // normalizedTop
        {0.5, 0.3},      // normalizedRight
        {0.5, 0.3},      // normalizedBottom
        // Character sets
        {0.5, 0.5}, {0.5, 0.5}, {0.5, 0.5}, {0.5, 0.5}, {0.5, 0.5}, {0.5, 0.5},
        {0.5, 0.5}, {0.5, 0.5}, {0.5, 0.5}, {0.5, 0.5}, {0.5, 0.5},
        // Temporal
        {300.0, 250.0},  // timeFromStart
        {300.0, 250.0},  // timeFromEnd
    };
    return params;
}

std::shared_ptr<const Model> make_seed_model() {
    auto model = std::make_shared<Model>();
    model->version = SEED_MODEL_VERSION;
    model->revision = 0;
    model->trained_at = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    model->n_training_samples = 0;
    model->prior_in = 0.5;
    model->prior_out = 0.5;
    model->in_features = seed_in_params();
    model->out_features = seed_out_params();
    return model;
}

}  // namespace capbox
