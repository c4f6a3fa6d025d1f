// capbox CLI entry point
//
// Usage:
//   capbox seed --model m.cbm                        Write the seed model if none exists
//   capbox train --model m.cbm --annotations a.tsv   Full retrain from annotations
//   capbox recalc --model m.cbm --boxes b.tsv ...    Re-score boxes after one annotation
//   capbox inspect --model m.cbm                     Model summary and retrain status

#include "subcommand.hpp"
#include "capbox/version.h"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    const auto& registry = capbox::cli::SubcommandRegistry::instance();

    if (argc < 2) {
        registry.print_help(argv[0], std::cerr);
        return 1;
    }

    const std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        registry.print_help(argv[0], std::cout);
        return 0;
    }
    if (command == "-V" || command == "--version") {
        std::cout << "capbox " << CAPBOX_VERSION << "\n";
        return 0;
    }

    // The subcommand sees its own name as argv[0]
    return registry.run_command(command, argc - 1, argv + 1);
}
