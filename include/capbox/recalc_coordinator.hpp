#pragma once
/**
 * @file recalc_coordinator.hpp
 * @brief Adaptive re-scoring of ranked candidates after an annotation
 *
 * Candidates are processed in batches, highest change probability first.
 * Every re-scored box pushes its reversal flag into a sliding window; once
 * the window is full and its reversal rate falls below TARGET_REVERSAL_RATE
 * the remaining candidates are unlikely to flip and the run stops.
 *
 *   Running -> StoppedEarly (reversal_rate)
 *           -> StoppedMaxBoxes (max_boxes)
 *           -> StoppedExhausted (exhausted_candidates)
 *
 * The blocking and cooperative entry points both drive AdaptiveRecalculation
 * one batch at a time.
 */

#include "capbox/change_estimator.hpp"
#include "capbox/config.hpp"
#include "capbox/types.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <optional>
#include <vector>

namespace capbox {

struct RescoreOutcome {
    BoxWithPrediction box;
    Label old_label = Label::IN;
    Label new_label = Label::IN;
    bool did_reverse = false;
};

// Re-scores one batch and persists the new predictions.
using PredictAndUpdateFn = std::function<std::vector<RescoreOutcome>(const std::vector<Candidate>& batch)>;

// Fixed-capacity FIFO of reversal flags with a running count.
class ReversalWindow {
public:
    explicit ReversalWindow(size_t capacity) : capacity_(capacity) {}

    void push(bool reversed) {
        flags_.push_back(reversed);
        if (reversed) ++reversals_;
        if (flags_.size() > capacity_) {
            if (flags_.front()) --reversals_;
            flags_.pop_front();
        }
    }

    size_t size() const { return flags_.size(); }
    size_t capacity() const { return capacity_; }
    size_t reversals() const { return reversals_; }
    bool empty() const { return flags_.empty(); }
    bool full() const { return flags_.size() >= capacity_; }

    double rate() const {
        return flags_.empty() ? 0.0 : static_cast<double>(reversals_) / static_cast<double>(flags_.size());
    }

private:
    size_t capacity_;
    size_t reversals_ = 0;
    std::deque<bool> flags_;
};

class AdaptiveRecalculation {
public:
    // `candidates` must outlive the run.
    AdaptiveRecalculation(const std::vector<Candidate>& candidates, const EngineConfig& config);

    // Re-scores the next batch. Returns false once the run has stopped.
    bool step(const PredictAndUpdateFn& predict_and_update);

    bool finished() const { return finished_; }
    size_t processed() const { return processed_; }
    size_t total_reversals() const { return total_reversals_; }
    const ReversalWindow& window() const { return window_; }

    // Meaningful once finished().
    AdaptiveRecalcResult result() const;

private:
    void finish(StopReason reason, bool stopped_early);

    const std::vector<Candidate>& candidates_;
    const EngineConfig& config_;
    size_t limit_;                 // min(candidates, MAX_BOXES_PER_UPDATE)
    size_t next_ = 0;
    size_t processed_ = 0;
    size_t total_reversals_ = 0;
    ReversalWindow window_;
    bool finished_ = false;
    bool stopped_early_ = false;
    StopReason reason_ = StopReason::EXHAUSTED_CANDIDATES;
};

AdaptiveRecalcResult run_adaptive_recalculation(const std::vector<Candidate>& candidates,
                                                const PredictAndUpdateFn& predict_and_update,
                                                const EngineConfig& config);

// Called between batches with the run so far. Return false to cancel.
using YieldFn = std::function<bool(const AdaptiveRecalculation& run)>;

// Same decisions as run_adaptive_recalculation(). std::nullopt when the
// yield hook cancelled the run; batches already re-scored stay persisted.
std::optional<AdaptiveRecalcResult> run_adaptive_recalculation_cooperative(
    const std::vector<Candidate>& candidates,
    const PredictAndUpdateFn& predict_and_update,
    const YieldFn& yield_hook,
    const EngineConfig& config);

}  // namespace capbox
