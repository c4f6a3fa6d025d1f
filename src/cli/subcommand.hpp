#ifndef CAPBOX_CLI_SUBCOMMAND_HPP
#define CAPBOX_CLI_SUBCOMMAND_HPP

#include <functional>
#include <iosfwd>
#include <map>
#include <string>

namespace capbox {
namespace cli {

using SubcommandFn = std::function<int(int argc, char* argv[])>;

// Commands register themselves from static objects in their own
// translation unit; the dispatcher only looks them up by name.
class SubcommandRegistry {
public:
    struct Command {
        std::string description;
        SubcommandFn run;
        int order = 99;   // position in the workflow listing
    };

    static SubcommandRegistry& instance();

    // Registering a name twice is a programming error and throws std::logic_error.
    void register_command(const std::string& name,
                          const std::string& description,
                          SubcommandFn fn,
                          int order = 99);

    const Command* find(const std::string& name) const;

    // argv[0] is the command name itself.
    int run_command(const std::string& name, int argc, char* argv[]) const;

    void print_help(const char* program_name, std::ostream& os) const;

private:
    SubcommandRegistry() = default;
    std::map<std::string, Command> commands_;
};

int cmd_seed(int argc, char* argv[]);
int cmd_train(int argc, char* argv[]);
int cmd_recalc(int argc, char* argv[]);
int cmd_inspect(int argc, char* argv[]);

}  // namespace cli
}  // namespace capbox

#endif  // CAPBOX_CLI_SUBCOMMAND_HPP
