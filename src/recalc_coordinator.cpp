#include "capbox/recalc_coordinator.hpp"
#include "capbox/errors.hpp"
#include "capbox/log_utils.hpp"

#include <algorithm>
#include <string>

namespace capbox {

AdaptiveRecalculation::AdaptiveRecalculation(const std::vector<Candidate>& candidates,
                                             const EngineConfig& config)
    : candidates_(candidates),
      config_(config),
      limit_(std::min(candidates.size(), config.max_boxes_per_update)),
      window_(config.reversal_window_size) {
    if (config.batch_size == 0) {
        throw ConfigError("BATCH_SIZE must be positive");
    }
    if (candidates.empty()) {
        finish(StopReason::EXHAUSTED_CANDIDATES, false);
    } else if (limit_ == 0) {
        finish(StopReason::MAX_BOXES, false);
    }
}

bool AdaptiveRecalculation::step(const PredictAndUpdateFn& predict_and_update) {
    if (finished_) return false;

    // The final batch is cut at the cap so the run never exceeds it
    const size_t end = std::min(next_ + config_.batch_size, limit_);
    std::vector<Candidate> batch(candidates_.begin() + static_cast<std::ptrdiff_t>(next_),
                                 candidates_.begin() + static_cast<std::ptrdiff_t>(end));
    next_ = end;

    const std::vector<RescoreOutcome> results = predict_and_update(batch);
    if (results.size() != batch.size()) {
        log_utils::debug("predict_and_update returned " + std::to_string(results.size()) +
                         " results for a batch of " + std::to_string(batch.size()));
    }
    for (const auto& r : results) {
        window_.push(r.did_reverse);
        if (r.did_reverse) ++total_reversals_;
    }
    processed_ += batch.size();

    if (window_.size() >= config_.min_boxes_before_check && window_.full()) {
        const double rolling_rate = window_.rate();
        if (rolling_rate < config_.target_reversal_rate) {
            log_utils::info("Stopping early: reversal rate " + log_utils::fmt(rolling_rate) +
                            " below target " + log_utils::fmt(config_.target_reversal_rate) +
                            " after " + std::to_string(processed_) + " boxes");
            finish(StopReason::REVERSAL_RATE, true);
            return false;
        }
    }

    if (next_ >= limit_) {
        finish(processed_ >= config_.max_boxes_per_update ? StopReason::MAX_BOXES
                                                          : StopReason::EXHAUSTED_CANDIDATES,
               false);
        return false;
    }
    return true;
}

void AdaptiveRecalculation::finish(StopReason reason, bool stopped_early) {
    finished_ = true;
    reason_ = reason;
    stopped_early_ = stopped_early;
}

AdaptiveRecalcResult AdaptiveRecalculation::result() const {
    AdaptiveRecalcResult r;
    r.total_processed = processed_;
    r.total_reversals = total_reversals_;
    r.stopped_early = stopped_early_;
    r.reason = reason_;
    if (!window_.empty()) {
        r.final_reversal_rate = window_.rate();
    } else {
        r.final_reversal_rate = static_cast<double>(total_reversals_) /
                                static_cast<double>(std::max<size_t>(1, processed_));
    }
    return r;
}

AdaptiveRecalcResult run_adaptive_recalculation(const std::vector<Candidate>& candidates,
                                                const PredictAndUpdateFn& predict_and_update,
                                                const EngineConfig& config) {
    AdaptiveRecalculation run(candidates, config);
    while (run.step(predict_and_update)) {
    }
    return run.result();
}

std::optional<AdaptiveRecalcResult> run_adaptive_recalculation_cooperative(
    const std::vector<Candidate>& candidates,
    const PredictAndUpdateFn& predict_and_update,
    const YieldFn& yield_hook,
    const EngineConfig& config) {
    AdaptiveRecalculation run(candidates, config);
    while (run.step(predict_and_update)) {
        if (yield_hook && !yield_hook(run)) {
            log_utils::info("Recalculation cancelled after " + std::to_string(run.processed()) + " boxes");
            return std::nullopt;
        }
    }
    return run.result();
}

}  // namespace capbox
