#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace capbox {

// Feature layout is fixed by the upstream extractor: 26 named features per box.
constexpr size_t NUM_FEATURES = 26;
constexpr size_t NUM_MATRIX_ENTRIES = NUM_FEATURES * NUM_FEATURES;

extern const std::array<const char*, NUM_FEATURES> FEATURE_NAMES;

// One value per named feature, in FEATURE_NAMES order.
using FeatureVector = std::vector<double>;

// Square matrix, flat row-major (n*n entries).
using FlatMatrix = std::vector<double>;

enum class Label : uint8_t {
    IN = 0,   // caption character
    OUT = 1   // noise
};

inline const char* label_to_string(Label label) {
    return label == Label::IN ? "in" : "out";
}

// Returns std::nullopt for anything other than "in"/"out".
std::optional<Label> parse_label(const std::string& text);

// Identifies one OCR box within a video.
struct BoxRef {
    uint32_t frame_index = 0;
    uint32_t box_index = 0;

    bool operator==(const BoxRef& other) const {
        return frame_index == other.frame_index && box_index == other.box_index;
    }
};

struct BoxRefHash {
    size_t operator()(const BoxRef& ref) const {
        return (static_cast<uint64_t>(ref.frame_index) << 32 | ref.box_index) * 0x9E3779B97F4A7C15ULL >> 17;
    }
};

struct GaussianParams {
    double mean = 0.0;
    double std = 1.0;
};

struct ClassSamples {
    size_t n = 0;
    std::vector<FeatureVector> features;  // n x NUM_FEATURES

    static ClassSamples from(std::vector<FeatureVector> vectors) {
        ClassSamples samples;
        samples.n = vectors.size();
        samples.features = std::move(vectors);
        return samples;
    }
};

struct Prediction {
    Label label = Label::IN;
    double confidence = 0.5;  // probability of `label`, in [0.5, 1]
};

// One human judgment.
struct Annotation {
    Label label = Label::IN;
    FeatureVector features;
    BoxRef box_ref;
};

// A previously scored box that may be re-evaluated.
struct BoxWithPrediction {
    BoxRef box_ref;
    FeatureVector features;
    Prediction current_prediction;
};

struct FisherScore {
    size_t feature_index = 0;
    std::string feature_name;
    double fisher_score = 0.0;       // (mu_in - mu_out)^2 / (sigma_in^2 + sigma_out^2)
    double mean_difference = 0.0;    // |mu_in - mu_out|
    double importance_weight = 0.0;  // fisher_score / max fisher_score, in [0, 1]
};

// Immutable model snapshot. Readers hold a std::shared_ptr<const Model>;
// a retrain produces a new snapshot instead of touching this one.
struct Model {
    std::string version;
    uint64_t revision = 0;           // 0 for the seed model
    int64_t trained_at = 0;          // unix seconds
    size_t n_training_samples = 0;
    double prior_in = 0.5;
    double prior_out = 0.5;
    std::vector<GaussianParams> in_features;   // NUM_FEATURES
    std::vector<GaussianParams> out_features;  // NUM_FEATURES
    std::optional<std::vector<FisherScore>> feature_importance;
    std::optional<FlatMatrix> covariance_matrix;   // NUM_MATRIX_ENTRIES
    std::optional<FlatMatrix> covariance_inverse;  // NUM_MATRIX_ENTRIES
    bool inverse_degraded = false;   // inverse came from the diagonal fallback

    bool has_covariance() const {
        return covariance_matrix.has_value() && covariance_inverse.has_value();
    }

    bool is_seed() const { return revision == 0; }
};

enum class StopReason : uint8_t {
    REVERSAL_RATE,
    MAX_BOXES,
    EXHAUSTED_CANDIDATES
};

inline const char* stop_reason_to_string(StopReason reason) {
    switch (reason) {
        case StopReason::REVERSAL_RATE: return "reversal_rate";
        case StopReason::MAX_BOXES: return "max_boxes";
        default: return "exhausted_candidates";
    }
}

struct AdaptiveRecalcResult {
    size_t total_processed = 0;
    size_t total_reversals = 0;
    double final_reversal_rate = 0.0;
    bool stopped_early = false;
    StopReason reason = StopReason::EXHAUSTED_CANDIDATES;
};

// Layout of the video frame the boxes were detected in. Only the extractor
// interprets it; the engine just forwards it.
struct LayoutContext {
    uint32_t frame_width = 0;
    uint32_t frame_height = 0;
    uint32_t crop_left = 0;
    uint32_t crop_top = 0;
    uint32_t crop_right = 0;
    uint32_t crop_bottom = 0;
    std::optional<double> vertical_position;
    std::optional<double> vertical_std;
    std::optional<double> box_height;
    std::optional<double> box_height_std;
    std::optional<std::string> anchor_type;   // left | center | right
    std::optional<double> anchor_position;
    double duration_seconds = 0.0;
};

}  // namespace capbox
