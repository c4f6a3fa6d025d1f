#include "subcommand.hpp"
#include "capbox/version.h"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace capbox {
namespace cli {

SubcommandRegistry& SubcommandRegistry::instance() {
    static SubcommandRegistry registry;
    return registry;
}

void SubcommandRegistry::register_command(const std::string& name,
                                          const std::string& description,
                                          SubcommandFn fn,
                                          int order) {
    const bool inserted = commands_.emplace(name, Command{description, std::move(fn), order}).second;
    if (!inserted) {
        throw std::logic_error("subcommand registered twice: " + name);
    }
}

const SubcommandRegistry::Command* SubcommandRegistry::find(const std::string& name) const {
    auto it = commands_.find(name);
    return it == commands_.end() ? nullptr : &it->second;
}

int SubcommandRegistry::run_command(const std::string& name, int argc, char* argv[]) const {
    const Command* cmd = find(name);
    if (!cmd) {
        std::cerr << "Unknown command: " << name << "\n"
                  << "Run 'capbox --help' for usage information.\n";
        return 1;
    }
    return cmd->run(argc, argv);
}

void SubcommandRegistry::print_help(const char* program_name, std::ostream& os) const {
    std::vector<std::pair<const std::string*, const Command*>> listing;
    size_t width = 0;
    for (const auto& [name, cmd] : commands_) {
        listing.emplace_back(&name, &cmd);
        width = std::max(width, name.size());
    }
    std::stable_sort(listing.begin(), listing.end(),
                     [](const auto& a, const auto& b) { return a.second->order < b.second->order; });

    os << "capbox v" << CAPBOX_VERSION << "\n"
       << "Incremental Bayesian reclassification of caption boxes\n\n"
       << "Usage: " << program_name << " <command> [options]\n\n"
       << "Commands (in workflow order):\n";
    for (const auto& [name, cmd] : listing) {
        os << "  " << std::left << std::setw(static_cast<int>(width + 2)) << *name
           << cmd->description << "\n";
    }
    os << "\nTypical session:\n"
       << "  " << program_name << " seed --model video.cbm\n"
       << "  " << program_name << " recalc --model video.cbm --boxes boxes.tsv.gz --frame F --box B --label in\n"
       << "  " << program_name << " train --model video.cbm --annotations ann.tsv.gz --layout video.layout\n"
       << "\nFor help on a specific command: " << program_name << " <command> --help\n";
}

}  // namespace cli
}  // namespace capbox
