#include "capbox/retrain_trigger.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace capbox {

RetrainState RetrainState::from_model(const Model* model, size_t current_annotation_count) {
    RetrainState state;
    if (model) {
        state.last_retrain_time = model->trained_at;
        state.last_retrain_annotation_count = model->n_training_samples;
    }
    state.current_annotation_count = current_annotation_count;
    return state;
}

RetrainDecision should_trigger_full_retrain(const RetrainState& state,
                                            const EngineConfig& config,
                                            int64_t now) {
    RetrainDecision d;
    d.seconds_since_retrain = static_cast<double>(now - state.last_retrain_time);
    d.new_annotations = static_cast<int64_t>(state.current_annotation_count) -
                        static_cast<int64_t>(state.last_retrain_annotation_count);

    const double minutes = d.seconds_since_retrain / 60.0;
    d.annotation_rate_per_minute = minutes > 0.0 ? static_cast<double>(d.new_annotations) / minutes : 0.0;

    auto decide = [&d](bool retrain, const char* reason) {
        d.should_retrain = retrain;
        d.reason = reason;
        return d;
    };

    if (state.current_annotation_count < config.min_annotations_for_retrain) {
        return decide(false, "insufficient_total_annotations");
    }
    if (d.new_annotations == 0) {
        return decide(false, "no_new_annotations");
    }
    if (d.seconds_since_retrain < config.min_retrain_interval_seconds) {
        return decide(false, "min_interval_not_reached");
    }
    if (d.new_annotations >= static_cast<int64_t>(config.annotation_count_threshold)) {
        return decide(true, "annotation_count_threshold");
    }
    if (d.annotation_rate_per_minute >= config.high_annotation_rate_per_minute &&
        d.new_annotations >= static_cast<int64_t>(config.high_rate_min_annotations)) {
        return decide(true, "high_annotation_rate");
    }
    if (d.seconds_since_retrain >= config.max_retrain_interval_seconds) {
        return decide(true, "max_interval_exceeded");
    }
    return decide(false, "no_trigger_conditions_met");
}

std::string format_retrain_trigger_log(const RetrainDecision& decision) {
    std::ostringstream oss;
    oss << "[retrain] " << (decision.should_retrain ? "TRIGGERED: " : "Not triggered: ")
        << decision.reason
        << " (new=" << decision.new_annotations
        << ", elapsed=" << std::llround(decision.seconds_since_retrain) << "s"
        << ", rate=" << std::fixed << std::setprecision(1) << decision.annotation_rate_per_minute
        << "/min)";
    return oss.str();
}

}  // namespace capbox
