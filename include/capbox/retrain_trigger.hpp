#pragma once
// When to run a full retrain instead of relying on incremental re-scoring.
//
// Checks in order:
//   total < MIN_ANNOTATIONS_FOR_RETRAIN            -> no
//   no new annotations                             -> no
//   elapsed < MIN_RETRAIN_INTERVAL_SECONDS         -> no
//   new >= ANNOTATION_COUNT_THRESHOLD              -> yes
//   rate >= HIGH_ANNOTATION_RATE_PER_MINUTE
//     and new >= HIGH_RATE_MIN_ANNOTATIONS         -> yes
//   elapsed >= MAX_RETRAIN_INTERVAL_SECONDS        -> yes
//   otherwise                                      -> no

#include "capbox/config.hpp"
#include "capbox/types.hpp"

#include <cstdint>
#include <string>

namespace capbox {

struct RetrainState {
    int64_t last_retrain_time = 0;              // unix seconds
    size_t last_retrain_annotation_count = 0;
    size_t current_annotation_count = 0;

    // From the stored model (nullptr: never trained) and the current count.
    static RetrainState from_model(const Model* model, size_t current_annotation_count);
};

struct RetrainDecision {
    bool should_retrain = false;
    std::string reason;
    int64_t new_annotations = 0;        // negative when annotations were deleted
    double seconds_since_retrain = 0.0;
    double annotation_rate_per_minute = 0.0;
};

RetrainDecision should_trigger_full_retrain(const RetrainState& state,
                                            const EngineConfig& config,
                                            int64_t now);

// "[retrain] TRIGGERED: <reason> (new=N, elapsed=Ts, rate=R/min)"
std::string format_retrain_trigger_log(const RetrainDecision& decision);

}  // namespace capbox
