#ifndef ORFKIT_CLI_ARGS_HPP
#define ORFKIT_CLI_ARGS_HPP

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace orfkit {
namespace cli {

enum class Command {
    TRANSLATE,
    ORF,
    CDS,
    NONSTOP,
    TABLES
};

const char* command_name(Command command);

// Thrown by parse_args() instead of calling exit(); exit_code 0 for
// --help/--version, 1 for usage errors (message is printed by the caller)
class ParseArgsExit : public std::runtime_error {
public:
    explicit ParseArgsExit(int exit_code, const std::string& message = "")
        : std::runtime_error(message), exit_code_(exit_code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

struct Options {
    std::string input_file;               // "-" for stdin
    std::string output_file = "-";       // "-" for stdout, ".gz" to compress
    int table_id = 1;                     // NCBI translation table
    std::string table_name;               // Set when -g was given a name instead of an id
    bool table_given = false;
    std::optional<int> strand;            // Default: 1 for translate, both for searches
    std::optional<size_t> lower;
    std::optional<size_t> upper;
    int strict = 1;                       // cds only
    bool partial5 = false;                // translate only
    bool six_frame = false;               // translate only
    bool protein = false;                 // orf/cds: write translated FASTA instead of TSV
    bool validate = false;                // Reject records with non-IUPAC symbols
    size_t line_width = 60;
    int num_threads = 0;
    bool verbose = false;
};

void print_version();

void print_usage(Command command);

// Parse a subcommand's arguments; argv[0] is the subcommand name.
// Throws ParseArgsExit for --help/--version (code 0) and errors (code 1).
Options parse_args(Command command, int argc, char* argv[]);

}  // namespace cli
}  // namespace orfkit

#endif  // ORFKIT_CLI_ARGS_HPP
