#include "args.hpp"
#include "capbox/errors.hpp"

#include <limits>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace capbox {
namespace cli {

std::string require_value(int argc, char* argv[], int& i) {
    const std::string flag = argv[i];
    if (i + 1 >= argc) {
        throw ParseArgsExit(1, "Error: Missing value for " + flag);
    }
    return argv[++i];
}

uint32_t parse_u32(const std::string& flag, const std::string& value) {
    try {
        size_t idx = 0;
        unsigned long long parsed = std::stoull(value, &idx);
        if (idx != value.size() || value[0] == '-' || parsed > std::numeric_limits<uint32_t>::max()) {
            throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
        }
        return static_cast<uint32_t>(parsed);
    } catch (const std::invalid_argument&) {
        throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
    } catch (const std::out_of_range&) {
        throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
    }
}

bool parse_common_option(int argc, char* argv[], int& i, CommonOptions& opts) {
    const std::string arg = argv[i];

    if (arg == "--config") {
        opts.config_file = require_value(argc, argv, i);
    } else if (arg == "--set") {
        std::string kv = require_value(argc, argv, i);
        if (kv.find('=') == std::string::npos) {
            throw ParseArgsExit(1, "Error: --set expects KEY=VALUE, got '" + kv + "'");
        }
        opts.overrides.push_back(kv);
    } else if (arg == "-t" || arg == "--threads") {
        const std::string flag = arg;
        const uint32_t threads = parse_u32(flag, require_value(argc, argv, i));
        if (threads < 1) {
            throw ParseArgsExit(1, "Error: --threads must be >= 1");
        }
        opts.num_threads = static_cast<int>(threads);
    } else if (arg == "-v" || arg == "--verbose") {
        // -v -v turns on debug output
        opts.log_level = opts.log_level == log_utils::LogLevel::INFO ? log_utils::LogLevel::DEBUG
                                                                     : log_utils::LogLevel::INFO;
    } else if (arg == "-q" || arg == "--quiet") {
        opts.log_level = log_utils::LogLevel::QUIET;
    } else {
        return false;
    }
    return true;
}

EngineConfig load_engine_config(const CommonOptions& opts) {
    EngineConfig config;
    if (!opts.config_file.empty()) {
        config.load_file(opts.config_file);
    }
    config.apply_env_overrides();
    for (const auto& kv : opts.overrides) {
        const size_t eq = kv.find('=');
        config.set(kv.substr(0, eq), kv.substr(eq + 1));
    }
    config.validate();
    return config;
}

void apply_runtime_options(const CommonOptions& opts) {
    log_utils::set_log_level(opts.log_level);
#ifdef _OPENMP
    if (opts.num_threads > 0) {
        omp_set_num_threads(opts.num_threads);
    }
#else
    if (opts.num_threads > 1) {
        log_utils::warn("Built without OpenMP; --threads ignored");
    }
#endif
}

const char* common_options_help() {
    return "Common options:\n"
           "  --config <file>       KEY=VALUE engine configuration\n"
           "  --set KEY=VALUE       Override one configuration constant (repeatable)\n"
           "  -t, --threads <int>   Threads for parallel scoring (default: auto)\n"
           "  -v, --verbose         Progress output (twice for debug)\n"
           "  -q, --quiet           Errors only\n"
           "  -h, --help            Show this help message\n";
}

}  // namespace cli
}  // namespace capbox
