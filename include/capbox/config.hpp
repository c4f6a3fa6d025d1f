#pragma once
// Engine configuration.
//
// Every constant has a compiled-in default and can be overridden from a
// KEY=VALUE file, CAPBOX_<KEY> environment variables, or --set KEY=VALUE on
// the command line (applied in that order). Keys are the upper-case names
// listed in config.cpp.

#include <cstddef>
#include <string>
#include <vector>

namespace capbox {

struct EngineConfig {
    // Training
    size_t min_annotations_for_retrain = 20;   // below this: "model not yet trained"
    double min_std = 0.01;                     // floor for per-feature std
    size_t min_samples_for_importance = 50;    // Fisher scores need stable variances

    // Change probability
    double max_mahalanobis_distance = 3.0;     // sigma of the similarity kernel
    double uncertainty_weight = 0.4;
    double similarity_weight = 0.4;
    double boundary_sensitivity_weight = 0.2;
    double min_change_probability = 0.05;

    // Adaptive recalculation
    size_t batch_size = 50;
    size_t max_boxes_per_update = 2000;
    size_t reversal_window_size = 100;
    size_t min_boxes_before_check = 50;
    double target_reversal_rate = 0.02;

    // Retrain triggers
    size_t annotation_count_threshold = 100;
    double min_retrain_interval_seconds = 20.0;
    double high_annotation_rate_per_minute = 20.0;
    size_t high_rate_min_annotations = 30;
    double max_retrain_interval_seconds = 300.0;

    // Throws ConfigError when a value is out of range.
    void validate() const;

    // Set one constant by its upper-case key. Throws ConfigError on an
    // unknown key or an unparsable value.
    void set(const std::string& key, const std::string& value);

    // Apply "KEY=VALUE" (or "KEY VALUE") lines from a file. '#' starts a comment.
    void load_file(const std::string& path);

    // Apply CAPBOX_<KEY> environment variables for every known key.
    void apply_env_overrides();

    // Render as KEY=VALUE lines, loadable by load_file().
    std::string to_string() const;

    static const std::vector<std::string>& keys();
};

}  // namespace capbox
