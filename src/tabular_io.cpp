#include "capbox/tabular_io.hpp"
#include "capbox/errors.hpp"
#include "capbox/log_utils.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <limits>
#include <sstream>

namespace capbox {

namespace {

std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (start <= line.size()) {
        size_t tab = line.find('\t', start);
        if (tab == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    return fields;
}

bool is_skippable(const std::string& line) {
    if (line.empty() || line[0] == '#') return true;
    if (line.compare(0, 11, "frame_index") == 0) return true;
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

std::string where(const GzLineReader& reader) {
    return reader.path() + ":" + std::to_string(reader.line_number());
}

double parse_double(const std::string& field, const GzLineReader& reader, const char* what) {
    const char* begin = field.c_str();
    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE || !std::isfinite(value)) {
        throw FormatError(where(reader) + ": bad " + what + " '" + field + "'");
    }
    return value;
}

uint32_t parse_index(const std::string& field, const GzLineReader& reader, const char* what) {
    const char* begin = field.c_str();
    char* end = nullptr;
    errno = 0;
    const unsigned long value = std::strtoul(begin, &end, 10);
    if (end == begin || *end != '\0' || errno == ERANGE || field[0] == '-' ||
        value > std::numeric_limits<uint32_t>::max()) {
        throw FormatError(where(reader) + ": bad " + what + " '" + field + "'");
    }
    return static_cast<uint32_t>(value);
}

Label parse_label_field(const std::string& field, const GzLineReader& reader) {
    std::optional<Label> label = parse_label(field);
    if (!label) {
        throw FormatError(where(reader) + ": label must be 'in' or 'out', got '" + field + "'");
    }
    return *label;
}

FeatureVector parse_features(const std::vector<std::string>& fields, size_t first,
                             const GzLineReader& reader) {
    FeatureVector features(NUM_FEATURES);
    for (size_t i = 0; i < NUM_FEATURES; ++i) {
        features[i] = parse_double(fields[first + i], reader, FEATURE_NAMES[i]);
    }
    return features;
}

void check_columns(const std::vector<std::string>& fields, size_t expected, const GzLineReader& reader) {
    if (fields.size() != expected) {
        throw FormatError(where(reader) + ": expected " + std::to_string(expected) +
                          " columns, got " + std::to_string(fields.size()));
    }
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

// ---------------------------------------------------------------------------
// GzLineReader
// ---------------------------------------------------------------------------

GzLineReader::GzLineReader(const std::string& path) : path_(path) {
    gz_ = gzopen(path.c_str(), "rb");
    if (!gz_) {
        throw FormatError("cannot open " + path);
    }
    gzbuffer(gz_, GZBUF_SIZE);
}

GzLineReader::~GzLineReader() {
    if (gz_) gzclose(gz_);
}

bool GzLineReader::readline(std::string& line) {
    char buffer[65536];
    line.clear();
    bool got_any = false;
    while (gzgets(gz_, buffer, sizeof(buffer)) != nullptr) {
        got_any = true;
        line += buffer;
        if (!line.empty() && line.back() == '\n') break;
    }
    if (!got_any) {
        int err = Z_OK;
        const char* msg = gzerror(gz_, &err);
        if (err != Z_OK && err != Z_STREAM_END) {
            throw FormatError(path_ + ": read failed: " + msg);
        }
        return false;
    }
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    ++line_number_;
    return true;
}

// ---------------------------------------------------------------------------
// Readers
// ---------------------------------------------------------------------------

std::vector<Annotation> read_annotations(const std::string& path) {
    GzLineReader reader(path);
    std::vector<Annotation> annotations;
    std::string line;

    while (reader.readline(line)) {
        if (is_skippable(line)) continue;
        const std::vector<std::string> fields = split_tabs(line);
        check_columns(fields, ANNOTATION_COLUMNS, reader);

        Annotation ann;
        ann.box_ref.frame_index = parse_index(fields[0], reader, "frame_index");
        ann.box_ref.box_index = parse_index(fields[1], reader, "box_index");
        ann.label = parse_label_field(fields[2], reader);
        ann.features = parse_features(fields, 3, reader);
        annotations.push_back(std::move(ann));
    }

    log_utils::debug("Read " + std::to_string(annotations.size()) + " annotations from " + path);
    return annotations;
}

std::vector<BoxWithPrediction> read_boxes(const std::string& path) {
    GzLineReader reader(path);
    std::vector<BoxWithPrediction> boxes;
    std::string line;

    while (reader.readline(line)) {
        if (is_skippable(line)) continue;
        const std::vector<std::string> fields = split_tabs(line);
        check_columns(fields, BOX_COLUMNS, reader);

        BoxWithPrediction box;
        box.box_ref.frame_index = parse_index(fields[0], reader, "frame_index");
        box.box_ref.box_index = parse_index(fields[1], reader, "box_index");
        box.current_prediction.label = parse_label_field(fields[2], reader);
        box.current_prediction.confidence = parse_double(fields[3], reader, "confidence");
        if (box.current_prediction.confidence < 0.0 || box.current_prediction.confidence > 1.0) {
            throw FormatError(where(reader) + ": confidence outside [0, 1]");
        }
        box.features = parse_features(fields, 4, reader);
        boxes.push_back(std::move(box));
    }

    log_utils::debug("Read " + std::to_string(boxes.size()) + " boxes from " + path);
    return boxes;
}

std::optional<LayoutContext> read_layout(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }

    GzLineReader reader(path);
    LayoutContext layout;
    bool have_width = false;
    bool have_height = false;
    std::string line;

    while (reader.readline(line)) {
        if (line.empty() || line[0] == '#') continue;
        std::istringstream iss(line);
        std::string key, value;
        if (!(iss >> key)) continue;
        if (!(iss >> value)) {
            throw FormatError(where(reader) + ": missing value for '" + key + "'");
        }

        if (key == "anchor_type") {
            if (value != "left" && value != "center" && value != "right") {
                throw FormatError(where(reader) + ": anchor_type must be left, center or right");
            }
            layout.anchor_type = value;
        } else if (key == "frame_width") {
            layout.frame_width = parse_index(value, reader, "frame_width");
            have_width = true;
        } else if (key == "frame_height") {
            layout.frame_height = parse_index(value, reader, "frame_height");
            have_height = true;
        } else if (key == "crop_left") {
            layout.crop_left = parse_index(value, reader, "crop_left");
        } else if (key == "crop_top") {
            layout.crop_top = parse_index(value, reader, "crop_top");
        } else if (key == "crop_right") {
            layout.crop_right = parse_index(value, reader, "crop_right");
        } else if (key == "crop_bottom") {
            layout.crop_bottom = parse_index(value, reader, "crop_bottom");
        } else if (key == "vertical_position") {
            layout.vertical_position = parse_double(value, reader, "vertical_position");
        } else if (key == "vertical_std") {
            layout.vertical_std = parse_double(value, reader, "vertical_std");
        } else if (key == "box_height") {
            layout.box_height = parse_double(value, reader, "box_height");
        } else if (key == "box_height_std") {
            layout.box_height_std = parse_double(value, reader, "box_height_std");
        } else if (key == "anchor_position") {
            layout.anchor_position = parse_double(value, reader, "anchor_position");
        } else if (key == "duration_seconds") {
            layout.duration_seconds = parse_double(value, reader, "duration_seconds");
        } else {
            throw FormatError(where(reader) + ": unknown layout key '" + key + "'");
        }
    }

    if (!have_width || !have_height || layout.frame_width == 0 || layout.frame_height == 0) {
        throw FormatError(path + ": layout needs positive frame_width and frame_height");
    }
    return layout;
}

// ---------------------------------------------------------------------------
// Writer
// ---------------------------------------------------------------------------

void write_boxes(const std::string& path, const std::vector<BoxWithPrediction>& boxes) {
    // "wT" writes uncompressed through the same gz API
    gzFile out = gzopen(path.c_str(), ends_with(path, ".gz") ? "wb" : "wT");
    if (!out) {
        throw FormatError("cannot open for writing: " + path);
    }

    std::ostringstream oss;
    oss << "frame_index\tbox_index\tlabel\tconfidence";
    for (const char* name : FEATURE_NAMES) {
        oss << '\t' << name;
    }
    oss << '\n';

    oss << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (const auto& box : boxes) {
        if (box.features.size() != NUM_FEATURES) {
            gzclose(out);
            throw DimensionMismatch("box " + std::to_string(box.box_ref.frame_index) + ":" +
                                    std::to_string(box.box_ref.box_index) + " has " +
                                    std::to_string(box.features.size()) + " features");
        }
        oss << box.box_ref.frame_index << '\t' << box.box_ref.box_index << '\t'
            << label_to_string(box.current_prediction.label) << '\t'
            << box.current_prediction.confidence;
        for (double f : box.features) {
            oss << '\t' << f;
        }
        oss << '\n';
    }

    const std::string data = oss.str();
    const int written = data.empty() ? 0 : gzwrite(out, data.data(), static_cast<unsigned>(data.size()));
    const int close_status = gzclose(out);
    if (written != static_cast<int>(data.size()) || close_status != Z_OK) {
        throw FormatError("write failed: " + path);
    }
}

// ---------------------------------------------------------------------------
// Collaborator implementations
// ---------------------------------------------------------------------------

TsvAnnotationSource::TsvAnnotationSource(std::string annotations_path, std::string layout_path)
    : annotations_path_(std::move(annotations_path)), layout_path_(std::move(layout_path)) {}

std::vector<Annotation> TsvAnnotationSource::load_annotations() {
    return read_annotations(annotations_path_);
}

std::optional<LayoutContext> TsvAnnotationSource::load_layout_config() {
    return read_layout(layout_path_);
}

PrecomputedFeatureExtractor PrecomputedFeatureExtractor::from_annotations(
    const std::vector<Annotation>& annotations) {
    PrecomputedFeatureExtractor extractor;
    for (const auto& ann : annotations) {
        extractor.add(ann.box_ref, ann.features);
    }
    return extractor;
}

void PrecomputedFeatureExtractor::add(const BoxRef& box, FeatureVector features) {
    if (features.size() != NUM_FEATURES) {
        throw DimensionMismatch("feature vector for box " + std::to_string(box.frame_index) + ":" +
                                std::to_string(box.box_index) + " has " +
                                std::to_string(features.size()) + " entries");
    }
    vectors_[box] = std::move(features);
}

FeatureVector PrecomputedFeatureExtractor::extract_features(const BoxRef& box,
                                                            const LayoutContext& /*layout*/) const {
    auto it = vectors_.find(box);
    if (it == vectors_.end()) {
        throw CapboxError("no precomputed features for box " + std::to_string(box.frame_index) +
                          ":" + std::to_string(box.box_index));
    }
    return it->second;
}

}  // namespace capbox
