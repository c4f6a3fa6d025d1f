// capbox recalc: re-score the boxes an annotation is most likely to flip
//
// The annotated box takes the human label with confidence 1. Every other box
// is ranked by change probability against it and re-scored with the stored
// model until the reversal rate says the rest are settled.

#include "subcommand.hpp"
#include "args.hpp"
#include "capbox/change_estimator.hpp"
#include "capbox/errors.hpp"
#include "capbox/linalg.hpp"
#include "capbox/model_store.hpp"
#include "capbox/predictor.hpp"
#include "capbox/recalc_coordinator.hpp"
#include "capbox/tabular_io.hpp"

#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <string>
#include <unordered_map>

namespace capbox {
namespace cli {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt(int) {
    g_interrupted = 1;
}

void print_recalc_usage() {
    std::cerr << "Usage: capbox recalc --model <file.cbm> --boxes <file.tsv[.gz]> --frame N --box M --label in|out [options]\n\n"
              << "Re-score boxes affected by a new annotation.\n\n"
              << "Required:\n"
              << "  --model <file>        Model snapshot file\n"
              << "  --boxes <file>        frame_index box_index label confidence f0..f25\n"
              << "  --frame <int>         Frame of the annotated box\n"
              << "  --box <int>           Box index of the annotated box\n"
              << "  --label in|out        Human label\n\n"
              << "Options:\n"
              << "  -o, --output <file>   Updated boxes (default: overwrite --boxes)\n"
              << "  --cooperative         Check for Ctrl-C between batches and stop cleanly\n\n"
              << common_options_help();
}

}  // namespace

int cmd_recalc(int argc, char* argv[]) {
    std::string model_file;
    std::string boxes_file;
    std::string output_file;
    BoxRef annotated;
    bool have_frame = false;
    bool have_box = false;
    std::optional<Label> label;
    bool cooperative = false;
    CommonOptions common;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (parse_common_option(argc, argv, i, common)) {
                continue;
            } else if (arg == "-h" || arg == "--help") {
                print_recalc_usage();
                return 0;
            } else if (arg == "--model") {
                model_file = require_value(argc, argv, i);
            } else if (arg == "--boxes") {
                boxes_file = require_value(argc, argv, i);
            } else if (arg == "-o" || arg == "--output") {
                output_file = require_value(argc, argv, i);
            } else if (arg == "--frame") {
                annotated.frame_index = parse_u32(arg, require_value(argc, argv, i));
                have_frame = true;
            } else if (arg == "--box") {
                annotated.box_index = parse_u32(arg, require_value(argc, argv, i));
                have_box = true;
            } else if (arg == "--label") {
                const std::string value = require_value(argc, argv, i);
                label = parse_label(value);
                if (!label) {
                    throw ParseArgsExit(1, "Error: --label must be 'in' or 'out', got '" + value + "'");
                }
            } else if (arg == "--cooperative") {
                cooperative = true;
            } else {
                throw ParseArgsExit(1, "Error: Unknown option: " + arg);
            }
        }
        if (model_file.empty() || boxes_file.empty() || !have_frame || !have_box || !label) {
            throw ParseArgsExit(1, "Error: --model, --boxes, --frame, --box and --label are required");
        }
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') std::cerr << e.what() << "\n";
        return e.exit_code();
    }
    if (output_file.empty()) output_file = boxes_file;

    try {
        apply_runtime_options(common);
        const EngineConfig config = load_engine_config(common);
        auto t_start = std::chrono::steady_clock::now();

        FileModelStore store(model_file);
        const std::shared_ptr<const Model> model = store.load_current_model();
        if (!model) {
            std::cerr << "Error: no model in " << model_file << "; run 'capbox seed' first\n";
            return 1;
        }

        std::vector<BoxWithPrediction> boxes = read_boxes(boxes_file);
        std::unordered_map<BoxRef, size_t, BoxRefHash> index;
        index.reserve(boxes.size());
        for (size_t i = 0; i < boxes.size(); ++i) {
            index[boxes[i].box_ref] = i;
        }

        auto it = index.find(annotated);
        if (it == index.end()) {
            std::cerr << "Error: box " << annotated.frame_index << ":" << annotated.box_index
                      << " not found in " << boxes_file << "\n";
            return 1;
        }

        Annotation annotation;
        annotation.box_ref = annotated;
        annotation.label = *label;
        annotation.features = boxes[it->second].features;
        boxes[it->second].current_prediction = {*label, 1.0};

        std::vector<BoxWithPrediction> others;
        others.reserve(boxes.size());
        for (const auto& box : boxes) {
            if (!(box.box_ref == annotated)) others.push_back(box);
        }

        // The seed model carries no covariance; plain Euclidean distance then
        FlatMatrix identity_inverse;
        const FlatMatrix* inverse = nullptr;
        if (model->has_covariance()) {
            inverse = &*model->covariance_inverse;
        } else {
            log_utils::info("Model " + model->version + " has no covariance; using identity metric");
            identity_inverse = linalg::identity(NUM_FEATURES);
            inverse = &identity_inverse;
        }

        const std::vector<Candidate> candidates = identify_affected_boxes(annotation, others, *inverse, config);
        log_utils::info(std::to_string(candidates.size()) + " candidate boxes for re-scoring");

        PredictAndUpdateFn predict_and_update = [&](const std::vector<Candidate>& batch) {
            std::vector<RescoreOutcome> results;
            results.reserve(batch.size());
            for (const auto& c : batch) {
                const Prediction p = predict_bayesian(c.box.features, *model);
                BoxWithPrediction& stored = boxes[index.at(c.box.box_ref)];

                RescoreOutcome r;
                r.old_label = stored.current_prediction.label;
                r.new_label = p.label;
                r.did_reverse = r.old_label != r.new_label;
                stored.current_prediction = p;
                r.box = stored;
                results.push_back(std::move(r));
            }
            return results;
        };

        std::optional<AdaptiveRecalcResult> result;
        if (cooperative) {
            g_interrupted = 0;
            auto previous = std::signal(SIGINT, on_interrupt);
            result = run_adaptive_recalculation_cooperative(
                candidates, predict_and_update,
                [](const AdaptiveRecalculation& run) {
                    log_utils::debug("  processed " + std::to_string(run.processed()) + ", window rate " +
                                     log_utils::fmt(run.window().rate()));
                    return g_interrupted == 0;
                },
                config);
            std::signal(SIGINT, previous);
        } else {
            result = run_adaptive_recalculation(candidates, predict_and_update, config);
        }

        // Boxes re-scored before a cancel are kept
        write_boxes(output_file, boxes);

        if (!result) {
            std::cout << "Recalculation cancelled; partial updates written to " << output_file << "\n";
            return 130;
        }

        std::cout << "Processed " << result->total_processed << " of " << candidates.size()
                  << " candidates, " << result->total_reversals << " reversals\n";
        std::cout << "Stop reason: " << stop_reason_to_string(result->reason)
                  << std::fixed << std::setprecision(4)
                  << " (final reversal rate " << result->final_reversal_rate << ")\n";
        if (result->reason == StopReason::MAX_BOXES) {
            std::cout << "Notice: update cap of " << config.max_boxes_per_update
                      << " boxes reached; remaining predictions may be stale until the next retrain\n";
        }

        auto t_end = std::chrono::steady_clock::now();
        log_utils::info("Recalc runtime: " + log_utils::format_elapsed(t_start, t_end));
    } catch (const CapboxError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

}  // namespace cli
}  // namespace capbox

namespace {
    struct RecalcRegistrar {
        RecalcRegistrar() {
            capbox::cli::SubcommandRegistry::instance().register_command(
                "recalc",
                "Re-score boxes affected by a new annotation",
                capbox::cli::cmd_recalc, 30);
        }
    };
    static RecalcRegistrar registrar;
}
