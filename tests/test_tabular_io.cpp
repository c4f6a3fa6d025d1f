// tests/test_tabular_io.cpp
//
// Annotation, box and layout files (plain and gzip), and the file-backed
// collaborators built on them.

#include "capbox/errors.hpp"
#include "capbox/log_utils.hpp"
#include "capbox/tabular_io.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

#include <zlib.h>

namespace {

using namespace capbox;
namespace fs = std::filesystem;

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

fs::path scratch_path(const std::string& name) {
    return fs::temp_directory_path() / ("capbox_io_" + std::to_string(::getpid()) + "_" + name);
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

void write_gz(const fs::path& path, const std::string& text) {
    gzFile gz = gzopen(path.string().c_str(), "wb");
    gzwrite(gz, text.data(), static_cast<unsigned>(text.size()));
    gzclose(gz);
}

// Row prefix followed by 26 features i * scale.
std::string row(const std::string& prefix, double scale) {
    std::ostringstream oss;
    oss << prefix;
    for (size_t i = 0; i < NUM_FEATURES; ++i) oss << '\t' << static_cast<double>(i) * scale;
    oss << '\n';
    return oss.str();
}

template <typename Fn>
std::string format_error_message(Fn fn) {
    try {
        fn();
    } catch (const FormatError& e) {
        return e.what();
    }
    return "";
}

int test_read_annotations() {
    std::cout << "[io] read annotations (plain and gzip)\n";
    int failed = 0;

    const std::string text =
        "frame_index\tbox_index\tlabel\t...\n"
        "# exported by the annotation tool\n"
        "\n" +
        row("3\t1\tin", 0.5) +
        row("4\t0\tout", 1.0);

    const fs::path plain = scratch_path("ann.tsv");
    const fs::path gz = scratch_path("ann.tsv.gz");
    write_text(plain, text);
    write_gz(gz, text);

    for (const fs::path& path : {plain, gz}) {
        const std::vector<Annotation> anns = read_annotations(path.string());
        expect(anns.size() == 2, path.filename().string() + ": two annotations", failed);
        if (anns.size() != 2) continue;
        expect(anns[0].box_ref == BoxRef{3, 1} && anns[0].label == Label::IN, "first row", failed);
        expect(anns[1].box_ref == BoxRef{4, 0} && anns[1].label == Label::OUT, "second row", failed);
        expect(anns[0].features.size() == NUM_FEATURES && anns[0].features[25] == 12.5, "features parsed", failed);
    }

    fs::remove(plain);
    fs::remove(gz);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_malformed_rows() {
    std::cout << "[io] malformed rows name file and line\n";
    int failed = 0;

    const fs::path path = scratch_path("bad.tsv");

    write_text(path, "# header comment\n" + row("1\t2\tin", 1.0) + "1\t2\tin\t0.5\n");
    std::string msg = format_error_message([&] { (void)read_annotations(path.string()); });
    expect(msg.find(":3: expected 29 columns, got 4") != std::string::npos, "column count, got: " + msg, failed);

    write_text(path, row("1\t2\tmaybe", 1.0));
    msg = format_error_message([&] { (void)read_annotations(path.string()); });
    expect(msg.find(":1: label must be 'in' or 'out'") != std::string::npos, "bad label, got: " + msg, failed);

    write_text(path, row("-1\t2\tin", 1.0));
    msg = format_error_message([&] { (void)read_annotations(path.string()); });
    expect(msg.find("bad frame_index") != std::string::npos, "negative index, got: " + msg, failed);

    write_text(path, row("1\t2\tin\t1.5", 1.0));
    msg = format_error_message([&] { (void)read_boxes(path.string()); });
    expect(msg.find("confidence outside [0, 1]") != std::string::npos, "confidence range, got: " + msg, failed);

    std::string nan_row = row("1\t2\tin\t0.7", 1.0);
    nan_row.replace(nan_row.rfind('\t') + 1, std::string::npos, "abc\n");
    write_text(path, nan_row);
    msg = format_error_message([&] { (void)read_boxes(path.string()); });
    expect(msg.find("bad timeFromEnd 'abc'") != std::string::npos, "bad feature, got: " + msg, failed);

    // Non-finite feature values never reach the statistics
    for (const std::string bad : {"nan", "inf", "-infinity"}) {
        std::string text = row("1\t2\tin", 1.0);
        text.replace(text.find("\t5\t"), 3, "\t" + bad + "\t");
        write_text(path, row("0\t0\tout", 1.0) + text);
        msg = format_error_message([&] { (void)read_annotations(path.string()); });
        expect(msg.find(":2: bad " + std::string(FEATURE_NAMES[5]) + " '" + bad + "'") != std::string::npos,
               "non-finite feature '" + bad + "', got: " + msg, failed);
    }

    std::string inf_conf = row("1\t2\tin\tinf", 1.0);
    write_text(path, inf_conf);
    msg = format_error_message([&] { (void)read_boxes(path.string()); });
    expect(msg.find("bad confidence 'inf'") != std::string::npos, "infinite confidence, got: " + msg, failed);

    msg = format_error_message([&] { (void)read_boxes(scratch_path("does_not_exist.tsv").string()); });
    expect(msg.find("cannot open") != std::string::npos, "missing file, got: " + msg, failed);

    fs::remove(path);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_write_then_read_boxes() {
    std::cout << "[io] write_boxes output reads back exactly\n";
    int failed = 0;

    std::vector<BoxWithPrediction> boxes(2);
    boxes[0].box_ref = {10, 2};
    boxes[0].current_prediction = {Label::IN, 0.7310585786300049};
    boxes[1].box_ref = {11, 0};
    boxes[1].current_prediction = {Label::OUT, 1.0};
    for (size_t i = 0; i < NUM_FEATURES; ++i) {
        boxes[0].features.push_back(1.0 / 3.0 + static_cast<double>(i));
        boxes[1].features.push_back(-0.1 * static_cast<double>(i));
    }

    for (const char* name : {"boxes.tsv", "boxes.tsv.gz"}) {
        const fs::path path = scratch_path(name);
        write_boxes(path.string(), boxes);
        const std::vector<BoxWithPrediction> back = read_boxes(path.string());
        expect(back.size() == 2, std::string(name) + ": two boxes", failed);
        if (back.size() == 2) {
            expect(back[0].box_ref == boxes[0].box_ref && back[1].box_ref == boxes[1].box_ref, "refs", failed);
            expect(back[0].current_prediction.confidence == boxes[0].current_prediction.confidence,
                   "confidence exact", failed);
            expect(back[1].current_prediction.label == Label::OUT, "label", failed);
            expect(back[0].features == boxes[0].features && back[1].features == boxes[1].features,
                   "features exact", failed);
        }
        fs::remove(path);
    }

    // gzip magic only for the .gz name
    const fs::path gz_path = scratch_path("magic.tsv.gz");
    write_boxes(gz_path.string(), boxes);
    std::ifstream in(gz_path, std::ios::binary);
    unsigned char magic[2] = {0, 0};
    in.read(reinterpret_cast<char*>(magic), 2);
    expect(magic[0] == 0x1f && magic[1] == 0x8b, ".gz output is gzip", failed);
    in.close();
    fs::remove(gz_path);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_read_layout() {
    std::cout << "[io] layout files\n";
    int failed = 0;

    expect(!read_layout("").has_value(), "empty path -> no layout", failed);
    expect(!read_layout(scratch_path("missing.layout").string()).has_value(), "missing file -> no layout", failed);

    const fs::path path = scratch_path("video.layout");
    write_text(path,
               "# layout\n"
               "frame_width 1920\n"
               "frame_height\t1080\n"
               "crop_top 700\n"
               "vertical_position 0.85\n"
               "anchor_type center\n"
               "anchor_position 960\n"
               "duration_seconds 312.5\n");
    const std::optional<LayoutContext> layout = read_layout(path.string());
    expect(layout.has_value(), "layout parsed", failed);
    if (layout) {
        expect(layout->frame_width == 1920 && layout->frame_height == 1080, "frame size", failed);
        expect(layout->crop_top == 700 && layout->crop_left == 0, "crop", failed);
        expect(layout->vertical_position && *layout->vertical_position == 0.85, "vertical position", failed);
        expect(!layout->box_height.has_value(), "absent keys stay unset", failed);
        expect(layout->anchor_type && *layout->anchor_type == "center", "anchor type", failed);
        expect(layout->duration_seconds == 312.5, "duration", failed);
    }

    write_text(path, "frame_width 1920\nframe_height 1080\nzoom 2\n");
    std::string msg = format_error_message([&] { (void)read_layout(path.string()); });
    expect(msg.find("unknown layout key 'zoom'") != std::string::npos, "unknown key, got: " + msg, failed);

    write_text(path, "frame_width 1920\nframe_height 1080\nanchor_type diagonal\n");
    msg = format_error_message([&] { (void)read_layout(path.string()); });
    expect(!msg.empty(), "bad anchor type", failed);

    write_text(path, "frame_width 1920\n");
    msg = format_error_message([&] { (void)read_layout(path.string()); });
    expect(msg.find("frame_height") != std::string::npos, "frame height required, got: " + msg, failed);

    fs::remove(path);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_collaborators() {
    std::cout << "[io] file-backed annotation source and extractor\n";
    int failed = 0;

    const fs::path ann_path = scratch_path("src.tsv.gz");
    const fs::path layout_path = scratch_path("src.layout");
    write_gz(ann_path, row("1\t0\tin", 1.0) + row("1\t1\tout", 2.0));
    write_text(layout_path, "frame_width 640\nframe_height 360\n");

    TsvAnnotationSource source(ann_path.string(), layout_path.string());
    const std::vector<Annotation> anns = source.load_annotations();
    expect(anns.size() == 2, "annotations loaded", failed);
    expect(source.load_layout_config().has_value(), "layout loaded", failed);

    TsvAnnotationSource no_layout(ann_path.string(), "");
    expect(!no_layout.load_layout_config().has_value(), "no layout path -> none", failed);

    PrecomputedFeatureExtractor extractor = PrecomputedFeatureExtractor::from_annotations(anns);
    expect(extractor.size() == 2, "one vector per box", failed);
    const LayoutContext layout;
    expect(extractor.extract_features({1, 1}, layout) == anns[1].features, "lookup by box", failed);

    bool threw = false;
    try {
        (void)extractor.extract_features({9, 9}, layout);
    } catch (const CapboxError&) {
        threw = true;
    }
    expect(threw, "unknown box rejected", failed);

    threw = false;
    try {
        extractor.add({2, 0}, FeatureVector(3, 0.0));
    } catch (const DimensionMismatch&) {
        threw = true;
    }
    expect(threw, "short vector rejected", failed);

    fs::remove(ann_path);
    fs::remove(layout_path);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // namespace

int main() {
    capbox::log_utils::set_log_level(capbox::log_utils::LogLevel::QUIET);

    int total = 0;
    total += test_read_annotations();
    total += test_malformed_rows();
    total += test_write_then_read_boxes();
    total += test_read_layout();
    total += test_collaborators();

    if (total == 0) {
        std::cout << "\nAll tabular I/O tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " check(s) FAILED.\n";
    return 1;
}
