#include "subcommand.hpp"
#include "mhcbind/errors.hpp"
#include "mhcbind/version.h"

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace mhcbind {
namespace cli {

SubcommandRegistry& SubcommandRegistry::instance() {
    static SubcommandRegistry registry;
    return registry;
}

void SubcommandRegistry::register_command(const std::string& name,
                                          const std::string& description,
                                          SubcommandFn fn,
                                          int order) {
    commands_[name] = Command{name, description, std::move(fn), order};
}

const SubcommandRegistry::Command* SubcommandRegistry::find(const std::string& name) const {
    auto it = commands_.find(name);
    return it == commands_.end() ? nullptr : &it->second;
}

int SubcommandRegistry::dispatch(int argc, char* argv[]) const {
    if (argc < 2) {
        print_help(argv[0]);
        return 1;
    }
    const char* first = argv[1];
    if (strcmp(first, "--help") == 0 || strcmp(first, "-h") == 0) {
        print_help(argv[0]);
        return 0;
    }
    if (strcmp(first, "--version") == 0 || strcmp(first, "-V") == 0) {
        std::cout << "mhcbind " << MHCBIND_VERSION << "\n";
        return 0;
    }
    if (const Command* cmd = find(first)) {
        return run_command(*cmd, argc - 1, argv + 1);
    }
    std::cerr << "Unknown command: " << first << "\n";
    std::cerr << "Run 'mhcbind --help' for the list of commands.\n";
    return 1;
}

int SubcommandRegistry::run_command(const Command& cmd, int argc, char* argv[]) const {
    try {
        return cmd.handler(argc, argv);
    } catch (const mhcbind::Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
    } catch (const std::invalid_argument& e) {
        // std::stod / std::stoul on a malformed option value
        std::cerr << "Error: invalid numeric value for " << cmd.name << " option (" << e.what() << ")\n";
    } catch (const std::out_of_range& e) {
        std::cerr << "Error: numeric value out of range for " << cmd.name << " option (" << e.what() << ")\n";
    }
    return 1;
}

std::vector<const SubcommandRegistry::Command*> SubcommandRegistry::listing() const {
    std::vector<const Command*> out;
    out.reserve(commands_.size());
    for (const auto& [name, cmd] : commands_) out.push_back(&cmd);
    std::stable_sort(out.begin(), out.end(),
                     [](const Command* a, const Command* b) { return a->order < b->order; });
    return out;
}

void SubcommandRegistry::print_help(const char* program_name) const {
    const auto cmds = listing();
    size_t width = 0;
    for (const Command* cmd : cmds) width = std::max(width, cmd->name.size());

    std::cout << "mhcbind v" << MHCBIND_VERSION
              << ": peptide/MHC pair coefficients with alternating refinement\n\n";
    std::cout << "Usage: " << program_name << " <command> [options]\n\n";
    std::cout << "Commands (in workflow order):\n";
    for (const Command* cmd : cmds) {
        std::cout << "  " << std::left << std::setw(static_cast<int>(width + 2)) << cmd->name
                  << cmd->description << "\n";
    }
    std::cout << "\nRun '" << program_name << " <command> --help' for command options.\n";
}

}  // namespace cli
}  // namespace mhcbind
