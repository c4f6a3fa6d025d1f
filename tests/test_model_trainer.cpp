// tests/test_model_trainer.cpp
//
// ModelTrainer against in-memory collaborators:
//   - thresholds that yield "insufficient data" and the reset-to-seed flag
//   - a successful retrain (priors, std floor, importance, covariance, revision)
//   - seed initialization is idempotent
//   - store failures propagate

#include "capbox/errors.hpp"
#include "capbox/log_utils.hpp"
#include "capbox/model_store.hpp"
#include "capbox/model_trainer.hpp"
#include "capbox/seed_model.hpp"
#include "capbox/tabular_io.hpp"

#include <cmath>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace {

using namespace capbox;

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

class VectorAnnotationSource : public AnnotationSource {
public:
    VectorAnnotationSource(std::vector<Annotation> annotations, bool has_layout)
        : annotations_(std::move(annotations)), has_layout_(has_layout) {}

    std::vector<Annotation> load_annotations() override { return annotations_; }

    std::optional<LayoutContext> load_layout_config() override {
        if (!has_layout_) return std::nullopt;
        LayoutContext layout;
        layout.frame_width = 1920;
        layout.frame_height = 1080;
        return layout;
    }

private:
    std::vector<Annotation> annotations_;
    bool has_layout_;
};

class FailingStore : public ModelStore {
public:
    std::shared_ptr<const Model> load_current_model() override { return nullptr; }
    void save_model(std::shared_ptr<const Model>) override {
        throw PersistenceError("disk full");
    }
    void reset() override {}
};

// Noisy samples: "in" boxes sit around 0 on feature 0, "out" around 10.
// Every feature carries noise so the pooled covariance is positive definite.
std::vector<Annotation> make_annotations(size_t n_in, size_t n_out, uint32_t seed = 42) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> noise(0.0, 1.0);
    std::vector<Annotation> out;
    uint32_t box = 0;
    auto add = [&](Label label, double center) {
        Annotation ann;
        ann.label = label;
        ann.box_ref = {box / 10, box % 10};
        ++box;
        ann.features.resize(NUM_FEATURES);
        for (size_t i = 0; i < NUM_FEATURES; ++i) {
            ann.features[i] = noise(rng) + (i == 0 ? center : 0.0);
        }
        out.push_back(std::move(ann));
    };
    for (size_t i = 0; i < n_in; ++i) add(Label::IN, 0.0);
    for (size_t i = 0; i < n_out; ++i) add(Label::OUT, 10.0);
    return out;
}

std::shared_ptr<const Model> model_with_samples(size_t n) {
    auto m = std::make_shared<Model>(*make_seed_model());
    m->version = "naive_bayes_v2.r3";
    m->revision = 3;
    m->n_training_samples = n;
    return m;
}

int test_too_few_annotations() {
    std::cout << "[trainer] below MIN_ANNOTATIONS_FOR_RETRAIN\n";
    int failed = 0;
    EngineConfig config;

    {
        const auto anns = make_annotations(10, 9);  // 19 < 20
        InMemoryModelStore store;
        const auto extractor = PrecomputedFeatureExtractor::from_annotations(anns);
        VectorAnnotationSource source(anns, true);
        ModelTrainer trainer(config, store, extractor);

        const TrainOutcome outcome = trainer.train(source);
        expect(!outcome.trained(), "not trained", failed);
        expect(outcome.reason == InsufficientReason::TOO_FEW_ANNOTATIONS, "reason too_few_annotations", failed);
        expect(!outcome.reset_to_seed, "no reset without a stored model", failed);
        expect(store.save_count() == 0, "nothing saved", failed);
    }

    {
        // Stored model was trained on >= threshold: annotations were cleared
        const auto anns = make_annotations(5, 5);
        InMemoryModelStore store(model_with_samples(25));
        const auto extractor = PrecomputedFeatureExtractor::from_annotations(anns);
        VectorAnnotationSource source(anns, true);
        ModelTrainer trainer(config, store, extractor);

        const TrainOutcome outcome = trainer.train(source);
        expect(!outcome.trained(), "still not trained", failed);
        expect(outcome.reset_to_seed, "reset flagged for a model trained on 25", failed);
        expect(store.load_current_model()->revision == 3, "trainer does not discard the model itself", failed);
    }

    {
        const auto anns = make_annotations(5, 5);
        InMemoryModelStore store(model_with_samples(12));
        const auto extractor = PrecomputedFeatureExtractor::from_annotations(anns);
        VectorAnnotationSource source(anns, true);
        ModelTrainer trainer(config, store, extractor);
        expect(!trainer.train(source).reset_to_seed, "no reset for a model below threshold", failed);
    }

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_missing_layout_and_single_class() {
    std::cout << "[trainer] no layout / one class\n";
    int failed = 0;
    EngineConfig config;

    {
        const auto anns = make_annotations(15, 15);
        InMemoryModelStore store;
        const auto extractor = PrecomputedFeatureExtractor::from_annotations(anns);
        VectorAnnotationSource source(anns, false);
        ModelTrainer trainer(config, store, extractor);
        const TrainOutcome outcome = trainer.train(source);
        expect(outcome.reason == InsufficientReason::NO_LAYOUT, "reason no_layout", failed);
        expect(store.save_count() == 0, "nothing saved", failed);
    }

    {
        const auto anns = make_annotations(29, 1);
        InMemoryModelStore store;
        const auto extractor = PrecomputedFeatureExtractor::from_annotations(anns);
        VectorAnnotationSource source(anns, true);
        ModelTrainer trainer(config, store, extractor);
        const TrainOutcome outcome = trainer.train(source);
        expect(outcome.reason == InsufficientReason::TOO_FEW_PER_CLASS, "reason too_few_per_class", failed);
        expect(outcome.n_in == 29 && outcome.n_out == 1, "class counts reported", failed);
    }

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_successful_training() {
    std::cout << "[trainer] full retrain\n";
    int failed = 0;
    EngineConfig config;

    const auto anns = make_annotations(36, 24);  // 60 >= MIN_SAMPLES_FOR_IMPORTANCE
    InMemoryModelStore store;
    const auto extractor = PrecomputedFeatureExtractor::from_annotations(anns);
    VectorAnnotationSource source(anns, true);
    ModelTrainer trainer(config, store, extractor);

    const TrainOutcome outcome = trainer.train(source);
    expect(outcome.trained(), "trained", failed);
    if (!outcome.trained()) return failed;

    const Model& m = *outcome.model;
    expect(store.load_current_model() == outcome.model, "saved model is the returned snapshot", failed);
    expect(m.version == "naive_bayes_v2.r1" && m.revision == 1, "first revision, tagged version", failed);
    expect(m.n_training_samples == 60, "sample count", failed);
    expect(std::abs(m.prior_in + m.prior_out - 1.0) < 1e-12, "priors sum to 1", failed);
    expect(std::abs(m.prior_in - 0.6) < 1e-12, "prior_in = 36/60", failed);

    bool floored = m.in_features.size() == NUM_FEATURES && m.out_features.size() == NUM_FEATURES;
    for (size_t i = 0; i < NUM_FEATURES && floored; ++i) {
        floored = m.in_features[i].std >= config.min_std && m.out_features[i].std >= config.min_std;
    }
    expect(floored, "every std >= MIN_STD", failed);
    expect(std::abs(m.out_features[0].mean - 10.0) < 1.0, "out mean of feature 0 near 10", failed);

    expect(m.feature_importance.has_value(), "feature importance computed", failed);
    if (m.feature_importance) {
        const auto& fi = *m.feature_importance;
        size_t best = 0;
        for (size_t i = 1; i < fi.size(); ++i) {
            if (fi[i].fisher_score > fi[best].fisher_score) best = i;
        }
        expect(best == 0, "feature 0 is the most discriminative", failed);
    }

    expect(m.has_covariance(), "covariance and inverse stored", failed);
    expect(!m.inverse_degraded, "noisy data inverts exactly", failed);

    // Retraining bumps the revision
    const TrainOutcome again = trainer.train(source);
    expect(again.trained() && again.model->revision == 2, "second retrain is r2", failed);
    expect(again.model->version == "naive_bayes_v2.r2", "version tag follows revision", failed);
    expect(store.save_count() == 2, "two saves", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_importance_threshold() {
    std::cout << "[trainer] no importance below MIN_SAMPLES_FOR_IMPORTANCE\n";
    int failed = 0;
    EngineConfig config;

    const auto anns = make_annotations(15, 15);  // 30 < 50
    InMemoryModelStore store;
    const auto extractor = PrecomputedFeatureExtractor::from_annotations(anns);
    VectorAnnotationSource source(anns, true);
    ModelTrainer trainer(config, store, extractor);

    const TrainOutcome outcome = trainer.train(source);
    expect(outcome.trained(), "trained", failed);
    if (outcome.trained()) {
        expect(!outcome.model->feature_importance, "importance skipped", failed);
        expect(outcome.model->has_covariance(), "covariance still computed", failed);
    }

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_seed_initialization() {
    std::cout << "[trainer] initialize_seed_model is idempotent\n";
    int failed = 0;
    EngineConfig config;
    InMemoryModelStore store;
    PrecomputedFeatureExtractor extractor;
    ModelTrainer trainer(config, store, extractor);

    expect(trainer.initialize_seed_model(), "first call writes", failed);
    const auto seed = store.load_current_model();
    expect(seed && seed->version == SEED_MODEL_VERSION, "seed_v2 stored", failed);
    expect(seed && seed->n_training_samples == 0 && seed->prior_in == 0.5, "seed priors", failed);
    expect(!trainer.initialize_seed_model(), "second call is a no-op", failed);
    expect(store.save_count() == 1, "saved once", failed);
    expect(store.load_current_model() == seed, "same snapshot kept", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_store_failure_propagates() {
    std::cout << "[trainer] save failure propagates\n";
    int failed = 0;
    EngineConfig config;

    const auto anns = make_annotations(15, 15);
    FailingStore store;
    const auto extractor = PrecomputedFeatureExtractor::from_annotations(anns);
    VectorAnnotationSource source(anns, true);
    ModelTrainer trainer(config, store, extractor);

    bool threw = false;
    try {
        (void)trainer.train(source);
    } catch (const PersistenceError&) {
        threw = true;
    }
    expect(threw, "PersistenceError from train()", failed);

    threw = false;
    try {
        (void)trainer.initialize_seed_model();
    } catch (const PersistenceError&) {
        threw = true;
    }
    expect(threw, "PersistenceError from initialize_seed_model()", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_build_model_rejects_small_classes() {
    std::cout << "[trainer] build_model needs 2 samples per class\n";
    int failed = 0;
    EngineConfig config;

    std::vector<FeatureVector> one = {FeatureVector(NUM_FEATURES, 0.0)};
    std::vector<FeatureVector> two = {FeatureVector(NUM_FEATURES, 0.0), FeatureVector(NUM_FEATURES, 1.0)};
    bool threw = false;
    try {
        (void)build_model(ClassSamples::from(one), ClassSamples::from(two), config, 1);
    } catch (const CapboxError&) {
        threw = true;
    }
    expect(threw, "one-sample class rejected", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // namespace

int main() {
    capbox::log_utils::set_log_level(capbox::log_utils::LogLevel::QUIET);

    int total = 0;
    total += test_too_few_annotations();
    total += test_missing_layout_and_single_class();
    total += test_successful_training();
    total += test_importance_threshold();
    total += test_seed_initialization();
    total += test_store_failure_propagates();
    total += test_build_model_rejects_small_classes();

    if (total == 0) {
        std::cout << "\nAll model trainer tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " check(s) FAILED.\n";
    return 1;
}
