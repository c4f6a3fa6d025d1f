// capbox inspect: model summary, feature importance and retrain status

#include "subcommand.hpp"
#include "args.hpp"
#include "capbox/errors.hpp"
#include "capbox/feature_importance.hpp"
#include "capbox/model_store.hpp"
#include "capbox/retrain_trigger.hpp"
#include "capbox/tabular_io.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>

namespace capbox {
namespace cli {

namespace {

void print_inspect_usage() {
    std::cerr << "Usage: capbox inspect --model <file.cbm> [--annotations <file.tsv[.gz]>] [options]\n\n"
              << "Print the stored model and, given annotations, whether a retrain is due.\n\n"
              << "Required:\n"
              << "  --model <file>        Model snapshot file\n\n"
              << "Options:\n"
              << "  --annotations <file>  Current annotations, for the retrain decision\n"
              << "  --top <int>           Features to list by Fisher score (default: 10)\n\n"
              << common_options_help();
}

void print_model(const Model& model, size_t top_k, std::ostream& os) {
    os << "=== capbox model ===\n\n";
    os << "Version:             " << model.version << (model.is_seed() ? " (seed)" : "") << "\n";
    os << "Revision:            " << model.revision << "\n";
    os << "Trained at:          " << model.trained_at << " (unix)\n";
    os << "Training samples:    " << model.n_training_samples << "\n";
    os << std::fixed << std::setprecision(4);
    os << "Priors:              in=" << model.prior_in << " out=" << model.prior_out << "\n";
    os << "Covariance:          "
       << (model.has_covariance() ? (model.inverse_degraded ? "yes (diagonal inverse)" : "yes") : "no")
       << "\n";

    if (!model.feature_importance) {
        os << "\nFeature importance:  not computed\n";
        return;
    }

    os << "\nTop features by Fisher score:\n";
    os << "  " << std::left << std::setw(22) << "feature"
       << std::right << std::setw(10) << "fisher" << std::setw(10) << "|dmean|" << std::setw(10) << "weight"
       << "\n";
    for (const auto& f : top_features(*model.feature_importance, top_k)) {
        os << "  " << std::left << std::setw(22) << f.feature_name << std::right
           << std::setprecision(3)
           << std::setw(10) << f.fisher_score
           << std::setw(10) << f.mean_difference
           << std::setw(10) << f.importance_weight << "\n";
    }
}

}  // namespace

int cmd_inspect(int argc, char* argv[]) {
    std::string model_file;
    std::string annotations_file;
    size_t top_k = 10;
    CommonOptions common;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (parse_common_option(argc, argv, i, common)) {
                continue;
            } else if (arg == "-h" || arg == "--help") {
                print_inspect_usage();
                return 0;
            } else if (arg == "--model") {
                model_file = require_value(argc, argv, i);
            } else if (arg == "--annotations") {
                annotations_file = require_value(argc, argv, i);
            } else if (arg == "--top") {
                top_k = parse_u32(arg, require_value(argc, argv, i));
            } else {
                throw ParseArgsExit(1, "Error: Unknown option: " + arg);
            }
        }
        if (model_file.empty()) {
            throw ParseArgsExit(1, "Error: --model is required");
        }
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') std::cerr << e.what() << "\n";
        return e.exit_code();
    }

    try {
        apply_runtime_options(common);
        const EngineConfig config = load_engine_config(common);

        FileModelStore store(model_file);
        const std::shared_ptr<const Model> model = store.load_current_model();
        if (model) {
            print_model(*model, top_k, std::cout);
        } else {
            std::cout << "No model in " << model_file << "\n";
        }

        if (!annotations_file.empty()) {
            const size_t n_annotations = read_annotations(annotations_file).size();
            const int64_t now = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();

            const RetrainState state = RetrainState::from_model(model.get(), n_annotations);
            const RetrainDecision decision = should_trigger_full_retrain(state, config, now);
            std::cout << "\nAnnotations:         " << n_annotations << "\n";
            std::cout << format_retrain_trigger_log(decision) << "\n";
        }
    } catch (const CapboxError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

}  // namespace cli
}  // namespace capbox

namespace {
    struct InspectRegistrar {
        InspectRegistrar() {
            capbox::cli::SubcommandRegistry::instance().register_command(
                "inspect",
                "Show the stored model and retrain status",
                capbox::cli::cmd_inspect, 40);
        }
    };
    static InspectRegistrar registrar;
}
