#pragma once
// Interfaces the engine consumes but does not implement: feature extraction
// and persistence. Concrete file-backed versions live in model_store.hpp and
// tabular_io.hpp.

#include "capbox/types.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace capbox {

// Deterministic and pure: the same box and layout always give the same vector.
class FeatureExtractor {
public:
    virtual ~FeatureExtractor() = default;
    virtual FeatureVector extract_features(const BoxRef& box, const LayoutContext& layout) const = 0;
};

class AnnotationSource {
public:
    virtual ~AnnotationSource() = default;

    // Human-sourced annotations only.
    virtual std::vector<Annotation> load_annotations() = 0;

    // std::nullopt when the video has no layout yet.
    virtual std::optional<LayoutContext> load_layout_config() = 0;
};

// Holder of the current Model. save_model() must replace the previous
// snapshot atomically: readers see either the old or the new Model. Failures
// throw PersistenceError.
class ModelStore {
public:
    virtual ~ModelStore() = default;

    // nullptr when no model has been written yet.
    virtual std::shared_ptr<const Model> load_current_model() = 0;

    virtual void save_model(std::shared_ptr<const Model> model) = 0;

    // Drop the current model so the next reader sees none.
    virtual void reset() = 0;
};

}  // namespace capbox
