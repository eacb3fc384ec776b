#ifndef ORFKIT_CLI_SUBCOMMAND_HPP
#define ORFKIT_CLI_SUBCOMMAND_HPP

#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace orfkit {
namespace cli {

using SubcommandFn = std::function<int(int argc, char* argv[])>;

/**
 * Process-wide table of subcommands, filled by static registrars in the
 * cmd_*.cpp files before main() runs. Entries are kept sorted by order
 * (then name), which is the order `orfkit --help` lists them in.
 */
class SubcommandRegistry {
public:
    struct Subcommand {
        std::string name;
        std::string description;
        int order;
        SubcommandFn fn;
    };

    static SubcommandRegistry& instance();

    // Registering an existing name replaces its handler, description and order
    void register_command(const std::string& name,
                          const std::string& description,
                          SubcommandFn fn,
                          int order = 99);

    // nullptr if no command has this name
    const Subcommand* find(const std::string& name) const;

    const std::vector<Subcommand>& commands() const { return commands_; }

    void print_help(std::ostream& os, const char* program_name) const;

    /**
     * Run `orfkit <command> ...`: argv[1] names the command, which gets
     * argv[1..] (its own name first). Handles --help/-h, --version/-V and
     * a missing or unknown command; returns the process exit code.
     */
    int dispatch(int argc, char* argv[]) const;

private:
    SubcommandRegistry() = default;

    std::vector<Subcommand> commands_;
};

int cmd_translate(int argc, char* argv[]);
int cmd_orf(int argc, char* argv[]);
int cmd_cds(int argc, char* argv[]);
int cmd_nonstop(int argc, char* argv[]);
int cmd_tables(int argc, char* argv[]);

}  // namespace cli
}  // namespace orfkit

#endif  // ORFKIT_CLI_SUBCOMMAND_HPP
