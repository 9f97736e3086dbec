#ifndef MHCBIND_CLI_SUBCOMMAND_HPP
#define MHCBIND_CLI_SUBCOMMAND_HPP

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace mhcbind {
namespace cli {

using SubcommandFn = std::function<int(int argc, char* argv[])>;

// Commands register themselves from static objects in their own translation
// units; order only affects the listing in --help.
class SubcommandRegistry {
public:
    struct Command {
        std::string name;
        std::string description;
        SubcommandFn handler;
        int order = 99;
    };

    static SubcommandRegistry& instance();

    void register_command(const std::string& name,
                          const std::string& description,
                          SubcommandFn fn,
                          int order = 99);

    const Command* find(const std::string& name) const;

    // Top-level entry: --help, --version, then the named command.
    int dispatch(int argc, char* argv[]) const;

    // Library errors escaping a handler are reported as "Error: <message>"
    // and turn into exit status 1.
    int run_command(const Command& cmd, int argc, char* argv[]) const;

    void print_help(const char* program_name) const;

    // Sorted by order, then name
    std::vector<const Command*> listing() const;

private:
    SubcommandRegistry() = default;
    std::map<std::string, Command> commands_;
};

int cmd_generate(int argc, char* argv[]);
int cmd_cv(int argc, char* argv[]);
int cmd_train(int argc, char* argv[]);
int cmd_predict(int argc, char* argv[]);

}  // namespace cli
}  // namespace mhcbind

#endif  // MHCBIND_CLI_SUBCOMMAND_HPP
