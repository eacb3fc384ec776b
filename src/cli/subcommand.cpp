#include "subcommand.hpp"
#include "orfkit/version.h"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <tuple>
#include <utility>

namespace orfkit {
namespace cli {

SubcommandRegistry& SubcommandRegistry::instance() {
    static SubcommandRegistry registry;
    return registry;
}

void SubcommandRegistry::register_command(const std::string& name,
                                          const std::string& description,
                                          SubcommandFn fn,
                                          int order) {
    commands_.erase(std::remove_if(commands_.begin(), commands_.end(),
                                   [&](const Subcommand& c) { return c.name == name; }),
                    commands_.end());

    Subcommand entry{name, description, order, std::move(fn)};
    auto pos = std::upper_bound(commands_.begin(), commands_.end(), entry,
                                [](const Subcommand& a, const Subcommand& b) {
                                    return std::tie(a.order, a.name) < std::tie(b.order, b.name);
                                });
    commands_.insert(pos, std::move(entry));
}

const SubcommandRegistry::Subcommand* SubcommandRegistry::find(const std::string& name) const {
    for (const auto& c : commands_) {
        if (c.name == name) return &c;
    }
    return nullptr;
}

void SubcommandRegistry::print_help(std::ostream& os, const char* program_name) const {
    os << "orfkit v" << ORFKIT_VERSION << "\n";
    os << "Codon translation and reading-frame search for nucleotide FASTA\n\n";
    os << "Usage: " << program_name << " <command> [options]\n\n";
    os << "Commands:\n";

    size_t width = 0;
    for (const auto& c : commands_) width = std::max(width, c.name.size());
    for (const auto& c : commands_) {
        os << "  " << std::left << std::setw(static_cast<int>(width + 2)) << c.name
           << c.description << "\n";
    }

    os << "\nRun '" << program_name << " <command> --help' for the options of a command.\n";
}

int SubcommandRegistry::dispatch(int argc, char* argv[]) const {
    const char* program = argc > 0 ? argv[0] : "orfkit";
    if (argc < 2) {
        print_help(std::cerr, program);
        return 1;
    }

    const std::string first = argv[1];
    if (first == "-h" || first == "--help") {
        print_help(std::cout, program);
        return 0;
    }
    if (first == "-V" || first == "--version") {
        std::cout << "orfkit " << ORFKIT_VERSION << "\n";
        return 0;
    }

    const Subcommand* command = find(first);
    if (!command) {
        std::cerr << "Unknown command: " << first << "\n"
                  << "Run '" << program << " --help' for the list of commands.\n";
        return 1;
    }
    return command->fn(argc - 1, argv + 1);
}

}  // namespace cli
}  // namespace orfkit
