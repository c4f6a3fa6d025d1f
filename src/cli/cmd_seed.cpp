// capbox seed: write the hand-tuned starting model when none exists

#include "subcommand.hpp"
#include "args.hpp"
#include "capbox/errors.hpp"
#include "capbox/model_store.hpp"
#include "capbox/model_trainer.hpp"
#include "capbox/tabular_io.hpp"

#include <iostream>
#include <string>

namespace capbox {
namespace cli {

namespace {

void print_seed_usage() {
    std::cerr << "Usage: capbox seed --model <file.cbm> [options]\n\n"
              << "Write the seed model if the model file does not exist yet.\n\n"
              << "Required:\n"
              << "  --model <file>        Model snapshot file\n\n"
              << common_options_help();
}

}  // namespace

int cmd_seed(int argc, char* argv[]) {
    std::string model_file;
    CommonOptions common;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (parse_common_option(argc, argv, i, common)) {
                continue;
            } else if (arg == "-h" || arg == "--help") {
                print_seed_usage();
                return 0;
            } else if (arg == "--model") {
                model_file = require_value(argc, argv, i);
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
        PrecomputedFeatureExtractor extractor;
        ModelTrainer trainer(config, store, extractor);

        if (trainer.initialize_seed_model()) {
            std::cout << "Seed model written to " << model_file << "\n";
        } else {
            std::cout << "Model already exists: " << model_file << "\n";
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
    struct SeedRegistrar {
        SeedRegistrar() {
            capbox::cli::SubcommandRegistry::instance().register_command(
                "seed",
                "Initialize the seed model (no-op if a model exists)",
                capbox::cli::cmd_seed, 10);
        }
    };
    static SeedRegistrar registrar;
}
