// capbox train: full retrain from the annotation file
//
// Features are read from the annotation rows themselves; the layout file
// only has to exist (a video without layout cannot be trained yet).

#include "subcommand.hpp"
#include "args.hpp"
#include "capbox/errors.hpp"
#include "capbox/feature_importance.hpp"
#include "capbox/model_store.hpp"
#include "capbox/model_trainer.hpp"
#include "capbox/tabular_io.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>

namespace capbox {
namespace cli {

namespace {

void print_train_usage() {
    std::cerr << "Usage: capbox train --model <file.cbm> --annotations <file.tsv[.gz]> --layout <file> [options]\n\n"
              << "Retrain the model from all human annotations.\n\n"
              << "Required:\n"
              << "  --model <file>        Model snapshot file (replaced on success)\n"
              << "  --annotations <file>  frame_index box_index label f0..f25\n"
              << "  --layout <file>       Layout key/value file\n\n"
              << common_options_help();
}

}  // namespace

int cmd_train(int argc, char* argv[]) {
    std::string model_file;
    std::string annotations_file;
    std::string layout_file;
    CommonOptions common;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (parse_common_option(argc, argv, i, common)) {
                continue;
            } else if (arg == "-h" || arg == "--help") {
                print_train_usage();
                return 0;
            } else if (arg == "--model") {
                model_file = require_value(argc, argv, i);
            } else if (arg == "--annotations") {
                annotations_file = require_value(argc, argv, i);
            } else if (arg == "--layout") {
                layout_file = require_value(argc, argv, i);
            } else {
                throw ParseArgsExit(1, "Error: Unknown option: " + arg);
            }
        }
        if (model_file.empty() || annotations_file.empty() || layout_file.empty()) {
            throw ParseArgsExit(1, "Error: --model, --annotations and --layout are required");
        }
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') std::cerr << e.what() << "\n";
        return e.exit_code();
    }

    try {
        apply_runtime_options(common);
        const EngineConfig config = load_engine_config(common);
        auto t_start = std::chrono::steady_clock::now();

        FileModelStore store(model_file);
        TsvAnnotationSource source(annotations_file, layout_file);
        const PrecomputedFeatureExtractor extractor =
            PrecomputedFeatureExtractor::from_annotations(source.load_annotations());
        ModelTrainer trainer(config, store, extractor);

        const TrainOutcome outcome = trainer.train(source);
        if (!outcome.trained()) {
            std::cout << "Model not yet trained: " << insufficient_reason_to_string(outcome.reason)
                      << " (" << outcome.n_annotations << " annotations, need "
                      << config.min_annotations_for_retrain << "+ with 2 per class)\n";
            if (outcome.reset_to_seed) {
                store.reset();
                trainer.initialize_seed_model();
                std::cout << "Annotations were cleared; model reset to seed\n";
            }
            return 0;
        }

        const Model& model = *outcome.model;
        std::cout << "Trained " << model.version << " on " << model.n_training_samples << " annotations ("
                  << outcome.n_in << " in, " << outcome.n_out << " out)\n";
        std::cout << std::fixed << std::setprecision(3)
                  << "  prior_in=" << model.prior_in << " prior_out=" << model.prior_out << "\n";
        if (model.inverse_degraded) {
            std::cout << "  covariance inverse degraded to diagonal approximation\n";
        }
        if (model.feature_importance) {
            std::cout << "  top features:";
            for (const auto& f : top_features(*model.feature_importance, 5)) {
                std::cout << " " << f.feature_name << "=" << std::setprecision(2) << f.fisher_score;
            }
            std::cout << "\n";
        }

        auto t_end = std::chrono::steady_clock::now();
        log_utils::info("Train runtime: " + log_utils::format_elapsed(t_start, t_end));
    } catch (const CapboxError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

}  // namespace cli
}  // namespace capbox

namespace {
    struct TrainRegistrar {
        TrainRegistrar() {
            capbox::cli::SubcommandRegistry::instance().register_command(
                "train",
                "Retrain the model from human annotations",
                capbox::cli::cmd_train, 20);
        }
    };
    static TrainRegistrar registrar;
}
