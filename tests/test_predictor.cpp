// tests/test_predictor.cpp
//
// Log-space Gaussian Naive Bayes scoring.

#include "capbox/errors.hpp"
#include "capbox/predictor.hpp"
#include "capbox/seed_model.hpp"

#include <cmath>
#include <iostream>
#include <limits>
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

Model two_cluster_model(double prior_in) {
    Model m;
    m.version = "test";
    m.prior_in = prior_in;
    m.prior_out = 1.0 - prior_in;
    m.in_features.assign(NUM_FEATURES, GaussianParams{0.0, 1.0});
    m.out_features.assign(NUM_FEATURES, GaussianParams{5.0, 1.0});
    return m;
}

int test_pdf_helpers() {
    std::cout << "[predict] pdf helpers\n";
    int failed = 0;

    const double peak = gaussian_pdf(0.0, 0.0, 1.0);
    expect(std::abs(peak - 0.3989422804014327) < 1e-12, "standard normal peak", failed);
    expect(gaussian_pdf(0.0, 0.0, 0.0) == 1.0, "zero std at the mean", failed);
    expect(gaussian_pdf(1.0, 0.0, 0.0) == 1e-10, "zero std away from the mean", failed);

    // Far tail underflows to 0 and is floored
    expect(log_gaussian_pdf(1e6, 0.0, 1.0) == std::log(PDF_FLOOR), "log pdf floored", failed);

    const double vals[] = {std::log(1.0), std::log(3.0)};
    expect(std::abs(log_sum_exp(vals, 2) - std::log(4.0)) < 1e-12, "log_sum_exp", failed);
    const double big[] = {1000.0, 1000.0};
    expect(std::abs(log_sum_exp(big, 2) - (1000.0 + std::log(2.0))) < 1e-9, "log_sum_exp no overflow", failed);
    expect(log_sum_exp(vals, 0) == -std::numeric_limits<double>::infinity(), "empty log_sum_exp", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_predict_clusters() {
    std::cout << "[predict] two well-separated clusters\n";
    int failed = 0;

    const Model m = two_cluster_model(0.5);
    const Prediction near_in = predict_bayesian(FeatureVector(NUM_FEATURES, 0.0), m);
    expect(near_in.label == Label::IN, "vector at the 'in' mean is in", failed);
    expect(near_in.confidence > 0.99, "with high confidence", failed);

    const Prediction near_out = predict_bayesian(FeatureVector(NUM_FEATURES, 5.0), m);
    expect(near_out.label == Label::OUT, "vector at the 'out' mean is out", failed);
    expect(near_out.confidence > 0.99, "with high confidence", failed);

    // Both likelihoods underflow without log space; the answer must stay finite
    const Prediction far = predict_bayesian(FeatureVector(NUM_FEATURES, 40.0), m);
    expect(far.label == Label::OUT, "far vector still closer to 'out'", failed);
    expect(std::isfinite(far.confidence) && far.confidence >= 0.5 && far.confidence <= 1.0,
           "confidence in [0.5, 1]", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_prior_breaks_tie() {
    std::cout << "[predict] prior decides when likelihoods tie\n";
    int failed = 0;

    // Midpoint: equal likelihood under both classes
    const FeatureVector mid(NUM_FEATURES, 2.5);
    const Prediction p_in = predict_bayesian(mid, two_cluster_model(0.8));
    expect(p_in.label == Label::IN, "prior_in 0.8 -> in", failed);
    expect(std::abs(p_in.confidence - 0.8) < 1e-9, "confidence equals prior", failed);

    const Prediction p_out = predict_bayesian(mid, two_cluster_model(0.2));
    expect(p_out.label == Label::OUT, "prior_in 0.2 -> out", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_seed_model_predicts() {
    std::cout << "[predict] seed model\n";
    int failed = 0;

    const std::shared_ptr<const Model> seed = make_seed_model();
    expect(seed->version == SEED_MODEL_VERSION, "seed version", failed);
    expect(seed->is_seed() && !seed->has_covariance(), "seed has no covariance", failed);

    // Typical caption box: wide, low in the frame, centered
    FeatureVector caption(NUM_FEATURES, 0.5);
    caption[4] = 4.0;    // aspectRatio
    caption[5] = 0.8;    // normalizedY
    caption[6] = 0.02;   // normalizedArea
    caption[9] = 0.35;   // normalizedLeft
    caption[10] = 0.75;  // normalizedTop
    caption[11] = 0.65;  // normalizedRight
    caption[12] = 0.85;  // normalizedBottom
    caption[24] = 300.0;
    caption[25] = 300.0;
    const Prediction p = predict_bayesian(caption, *seed);
    expect(p.label == Label::IN, "caption-shaped box is in", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_dimension_mismatch() {
    std::cout << "[predict] wrong-sized input rejected\n";
    int failed = 0;

    bool threw = false;
    try {
        (void)predict_bayesian(FeatureVector(3, 0.0), two_cluster_model(0.5));
    } catch (const DimensionMismatch&) {
        threw = true;
    }
    expect(threw, "DimensionMismatch thrown", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // namespace

int main() {
    int total = 0;
    total += test_pdf_helpers();
    total += test_predict_clusters();
    total += test_prior_breaks_tie();
    total += test_seed_model_predicts();
    total += test_dimension_mismatch();

    if (total == 0) {
        std::cout << "\nAll predictor tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " check(s) FAILED.\n";
    return 1;
}
