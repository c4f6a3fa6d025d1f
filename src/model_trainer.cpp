#include "capbox/model_trainer.hpp"
#include "capbox/errors.hpp"
#include "capbox/feature_importance.hpp"
#include "capbox/gaussian_stats.hpp"
#include "capbox/linalg.hpp"
#include "capbox/log_utils.hpp"
#include "capbox/seed_model.hpp"

#include <chrono>
#include <string>

namespace capbox {

namespace {

int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string top_features_summary(const std::vector<FisherScore>& scores) {
    std::string out;
    for (const auto& f : top_features(scores, 5)) {
        if (!out.empty()) out += ", ";
        out += f.feature_name + "=" + log_utils::fmt(f.fisher_score, 2);
    }
    return out;
}

}  // namespace

std::shared_ptr<const Model> build_model(const ClassSamples& in_samples,
                                         const ClassSamples& out_samples,
                                         const EngineConfig& config,
                                         uint64_t revision) {
    check_samples(in_samples, "in samples");
    check_samples(out_samples, "out samples");
    if (in_samples.n < 2 || out_samples.n < 2) {
        throw CapboxError("build_model needs at least 2 samples per class (in=" +
                          std::to_string(in_samples.n) + ", out=" +
                          std::to_string(out_samples.n) + ")");
    }

    const size_t total = in_samples.n + out_samples.n;

    auto model = std::make_shared<Model>();
    model->revision = revision;
    model->version = std::string(TRAINED_MODEL_VERSION) + ".r" + std::to_string(revision);
    model->trained_at = unix_now();
    model->n_training_samples = total;
    model->prior_in = static_cast<double>(in_samples.n) / static_cast<double>(total);
    model->prior_out = static_cast<double>(out_samples.n) / static_cast<double>(total);
    model->in_features = fit_gaussian_params(in_samples, config.min_std);
    model->out_features = fit_gaussian_params(out_samples, config.min_std);

    if (total >= config.min_samples_for_importance) {
        model->feature_importance = compute_fisher_scores(model->in_features, model->out_features);
        log_utils::info("Feature importance (top 5): " + top_features_summary(*model->feature_importance));
    }

    FlatMatrix covariance = pooled_covariance(in_samples, out_samples);
    linalg::InverseResult inv = linalg::invert_symmetric(covariance);
    model->covariance_matrix = std::move(covariance);
    model->covariance_inverse = std::move(inv.inverse);
    model->inverse_degraded = inv.degraded();
    log_utils::debug(std::string("Computed pooled covariance (") + std::to_string(NUM_FEATURES) + "x" +
                     std::to_string(NUM_FEATURES) + ")" +
                     (inv.degraded() ? ", diagonal inverse" : ""));

    return model;
}

ModelTrainer::ModelTrainer(const EngineConfig& config, ModelStore& store, const FeatureExtractor& extractor)
    : config_(config), store_(store), extractor_(extractor) {}

TrainOutcome ModelTrainer::train(AnnotationSource& source) {
    auto t_start = std::chrono::steady_clock::now();
    TrainOutcome outcome;

    const std::vector<Annotation> annotations = source.load_annotations();
    outcome.n_annotations = annotations.size();

    if (annotations.size() < config_.min_annotations_for_retrain) {
        log_utils::info("Insufficient training data: " + std::to_string(annotations.size()) +
                        " samples (need " + std::to_string(config_.min_annotations_for_retrain) + "+)");
        outcome.reason = InsufficientReason::TOO_FEW_ANNOTATIONS;

        std::shared_ptr<const Model> current = store_.load_current_model();
        if (current && current->n_training_samples >= config_.min_annotations_for_retrain) {
            log_utils::info("Stored model was trained on " + std::to_string(current->n_training_samples) +
                            " samples; flagging reset to seed");
            outcome.reset_to_seed = true;
        }
        return outcome;
    }

    const std::optional<LayoutContext> layout = source.load_layout_config();
    if (!layout) {
        log_utils::warn("No layout configuration found; cannot extract features");
        outcome.reason = InsufficientReason::NO_LAYOUT;
        return outcome;
    }

    std::vector<FeatureVector> in_vectors;
    std::vector<FeatureVector> out_vectors;
    for (const auto& ann : annotations) {
        FeatureVector features = extractor_.extract_features(ann.box_ref, *layout);
        if (features.size() != NUM_FEATURES) {
            throw DimensionMismatch("extractor returned " + std::to_string(features.size()) +
                                    " features for box " + std::to_string(ann.box_ref.frame_index) +
                                    ":" + std::to_string(ann.box_ref.box_index));
        }
        if (ann.label == Label::IN) {
            in_vectors.push_back(std::move(features));
        } else {
            out_vectors.push_back(std::move(features));
        }
    }
    outcome.n_in = in_vectors.size();
    outcome.n_out = out_vectors.size();

    if (outcome.n_in < 2 || outcome.n_out < 2) {
        log_utils::info("Insufficient samples per class: in=" + std::to_string(outcome.n_in) +
                        ", out=" + std::to_string(outcome.n_out));
        outcome.reason = InsufficientReason::TOO_FEW_PER_CLASS;
        return outcome;
    }

    std::shared_ptr<const Model> previous = store_.load_current_model();
    const uint64_t revision = previous ? previous->revision + 1 : 1;

    std::shared_ptr<const Model> model = build_model(
        ClassSamples::from(std::move(in_vectors)),
        ClassSamples::from(std::move(out_vectors)),
        config_, revision);

    store_.save_model(model);

    outcome.status = TrainStatus::TRAINED;
    outcome.model = model;

    auto t_end = std::chrono::steady_clock::now();
    log_utils::info("Model " + model->version + " trained: " + std::to_string(outcome.n_in) + " 'in', " +
                    std::to_string(outcome.n_out) + " 'out' (" +
                    log_utils::format_elapsed(t_start, t_end) + ")");
    return outcome;
}

bool ModelTrainer::initialize_seed_model() {
    if (store_.load_current_model()) {
        log_utils::info("Model already exists, skipping seed initialization");
        return false;
    }
    store_.save_model(make_seed_model());
    log_utils::info(std::string("Seed model ") + SEED_MODEL_VERSION + " initialized");
    return true;
}

}  // namespace capbox
