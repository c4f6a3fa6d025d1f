#pragma once
/**
 * @file tabular_io.hpp
 * @brief Tab-separated annotation, box and layout files
 *
 * Formats (gzip-compressed when the file name ends in ".gz"):
 *
 *   annotations:  frame_index  box_index  label  <26 features>
 *   boxes:        frame_index  box_index  label  confidence  <26 features>
 *   layout:       key value    (one pair per line)
 *
 * Labels are "in" / "out". Lines starting with "frame_index" (header) or
 * '#' and blank lines are skipped. Any other malformed line throws
 * FormatError naming the file and line number.
 */

#include "capbox/collaborators.hpp"
#include "capbox/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <zlib.h>

namespace capbox {

constexpr size_t ANNOTATION_COLUMNS = 3 + NUM_FEATURES;
constexpr size_t BOX_COLUMNS = 4 + NUM_FEATURES;

// Line reader over zlib; reads plain and gzip input alike.
class GzLineReader {
public:
    static constexpr unsigned GZBUF_SIZE = 1024 * 1024;

    // Throws FormatError if the file cannot be opened.
    explicit GzLineReader(const std::string& path);
    ~GzLineReader();

    GzLineReader(const GzLineReader&) = delete;
    GzLineReader& operator=(const GzLineReader&) = delete;

    // Next line without the trailing newline; false at EOF.
    bool readline(std::string& line);

    size_t line_number() const { return line_number_; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    gzFile gz_ = nullptr;
    size_t line_number_ = 0;
};

std::vector<Annotation> read_annotations(const std::string& path);
std::vector<BoxWithPrediction> read_boxes(const std::string& path);

// std::nullopt when the file does not exist.
std::optional<LayoutContext> read_layout(const std::string& path);

// Writes a header line plus one row per box. Throws FormatError on I/O failure.
void write_boxes(const std::string& path, const std::vector<BoxWithPrediction>& boxes);

// AnnotationSource backed by an annotations file and an optional layout file.
class TsvAnnotationSource : public AnnotationSource {
public:
    TsvAnnotationSource(std::string annotations_path, std::string layout_path);

    std::vector<Annotation> load_annotations() override;
    std::optional<LayoutContext> load_layout_config() override;

private:
    std::string annotations_path_;
    std::string layout_path_;
};

// FeatureExtractor over vectors computed upstream and stored per box.
class PrecomputedFeatureExtractor : public FeatureExtractor {
public:
    PrecomputedFeatureExtractor() = default;

    static PrecomputedFeatureExtractor from_annotations(const std::vector<Annotation>& annotations);

    // Throws DimensionMismatch on a wrong-sized vector. Later adds replace earlier ones.
    void add(const BoxRef& box, FeatureVector features);

    // Throws CapboxError for an unknown box.
    FeatureVector extract_features(const BoxRef& box, const LayoutContext& layout) const override;

    size_t size() const { return vectors_.size(); }

private:
    std::unordered_map<BoxRef, FeatureVector, BoxRefHash> vectors_;
};

}  // namespace capbox
