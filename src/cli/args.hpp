#ifndef CAPBOX_CLI_ARGS_HPP
#define CAPBOX_CLI_ARGS_HPP

#include "capbox/config.hpp"
#include "capbox/log_utils.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace capbox {
namespace cli {

// Thrown by argument parsing to leave a subcommand with `exit_code`.
// An empty message means nothing left to print (e.g. after --help).
class ParseArgsExit : public std::runtime_error {
public:
    explicit ParseArgsExit(int exit_code, const std::string& message = "")
        : std::runtime_error(message), exit_code_(exit_code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

// Flags shared by every subcommand.
struct CommonOptions {
    std::string config_file;                  // --config
    std::vector<std::string> overrides;       // --set KEY=VALUE, in order
    int num_threads = 0;                      // -t; 0 = OpenMP default
    log_utils::LogLevel log_level = log_utils::LogLevel::WARN;
};

// Value following argv[i]; advances i. Throws ParseArgsExit(1) when missing.
std::string require_value(int argc, char* argv[], int& i);

uint32_t parse_u32(const std::string& flag, const std::string& value);

// Consumes argv[i] (and its value) when it is a common flag.
bool parse_common_option(int argc, char* argv[], int& i, CommonOptions& opts);

// Defaults, then --config file, CAPBOX_<KEY> environment, --set overrides.
// Throws ConfigError on a bad key or value or when validation fails.
EngineConfig load_engine_config(const CommonOptions& opts);

// Log level and thread count.
void apply_runtime_options(const CommonOptions& opts);

// Help text for the common flags, appended to each subcommand's usage.
const char* common_options_help();

}  // namespace cli
}  // namespace capbox

#endif  // CAPBOX_CLI_ARGS_HPP
