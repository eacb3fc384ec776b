#include "args.hpp"
#include "orfkit/version.h"
#include <iostream>
#include <string>

namespace orfkit {
namespace cli {

const char* command_name(Command command) {
    switch (command) {
        case Command::TRANSLATE: return "translate";
        case Command::ORF: return "orf";
        case Command::CDS: return "cds";
        case Command::NONSTOP: return "nonstop";
        case Command::TABLES: return "tables";
    }
    return "?";
}

void print_version() {
    std::cout << "orfkit " << ORFKIT_VERSION << "\n";
}

void print_usage(Command command) {
    const char* name = command_name(command);
    std::cout << "orfkit v" << ORFKIT_VERSION << "\n\n";

    if (command == Command::TABLES) {
        std::cout << "Usage: orfkit tables [-g <id|name>] [--strand <1|-1>]\n\n";
        std::cout << "Without -g, lists the available genetic codes. With -g, prints\n";
        std::cout << "the codon table (codon, residue, start flag) for one strand.\n\n";
        std::cout << "Options:\n";
        std::cout << "  -g, --table <id|name>    Genetic code\n";
        std::cout << "  --strand <int>           1 or -1 (default: 1)\n";
        std::cout << "  -o, --output <file>      Output file (default: stdout)\n";
        std::cout << "  -V, --version            Show version and exit\n";
        std::cout << "  -h, --help               Show this help message\n";
        return;
    }

    std::cout << "Usage: orfkit " << name << " <input.fa[.gz]|-> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -o, --output <file>      Output file (default: stdout, .gz to compress)\n";
    std::cout << "  -g, --table <id|name>    Genetic code (default: 1)\n";
    if (command == Command::TRANSLATE) {
        std::cout << "  --strand <int>           1 or -1 (default: 1)\n";
    } else {
        std::cout << "  --strand <int>           1, -1, or 0 for both (default: 0)\n";
    }
    if (command != Command::NONSTOP) {
        std::cout << "  --lower <int>            0-based start of the region (default: 0)\n";
        std::cout << "  --upper <int>            End of the region, exclusive (default: length)\n";
    }
    if (command == Command::TRANSLATE) {
        std::cout << "  --partial5               5' end is partial: do not force M at the start\n";
        std::cout << "  --six-frame              Translate all six reading frames\n";
    }
    if (command == Command::CDS) {
        std::cout << "  --strict <0|1|2>         0: no start or stop required\n";
        std::cout << "                           1: start required (default)\n";
        std::cout << "                           2: start and stop required\n";
    }
    if (command == Command::ORF || command == Command::CDS) {
        std::cout << "  --protein                Write translated regions as FASTA, not TSV\n";
    }
    std::cout << "  --validate               Reject records with non-IUPAC symbols\n";
    std::cout << "                           (default: drop them silently)\n";
    if (command == Command::TRANSLATE || command == Command::ORF || command == Command::CDS) {
        std::cout << "  --width <int>            FASTA line width, 0 for none (default: 60)\n";
    }
    std::cout << "  -t, --threads <int>      Number of threads (default: auto)\n";
    std::cout << "  -v, --verbose            Verbose output\n";
    std::cout << "  -V, --version            Show version and exit\n";
    std::cout << "  -h, --help               Show this help message\n";
}

Options parse_args(Command command, int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        auto parse_size = [&](const std::string& flag, const std::string& value) -> size_t {
            try {
                size_t idx = 0;
                if (!value.empty() && value[0] == '-') throw std::invalid_argument(value);
                size_t parsed = std::stoull(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                return parsed;
            } catch (const ParseArgsExit&) {
                throw;
            } catch (const std::exception&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
        };

        auto parse_int = [&](const std::string& flag, const std::string& value) -> int {
            try {
                size_t idx = 0;
                int parsed = std::stoi(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                return parsed;
            } catch (const ParseArgsExit&) {
                throw;
            } catch (const std::exception&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(command);
            throw ParseArgsExit(0);
        } else if (arg == "-V" || arg == "--version") {
            print_version();
            throw ParseArgsExit(0);
        } else if (arg == "-i" || arg == "--input") {
            opts.input_file = require_value(arg);
        } else if (arg == "-o" || arg == "--output") {
            opts.output_file = require_value(arg);
        } else if (arg == "-g" || arg == "--table") {
            std::string value = require_value(arg);
            opts.table_given = true;
            if (!value.empty() && value.find_first_not_of("0123456789") == std::string::npos) {
                opts.table_id = parse_int(arg, value);
                opts.table_name.clear();
            } else {
                opts.table_name = value;
            }
        } else if (arg == "--strand") {
            int strand = parse_int(arg, require_value(arg));
            bool both_allowed = command == Command::ORF || command == Command::CDS ||
                                command == Command::NONSTOP;
            if (strand != 1 && strand != -1 && !(strand == 0 && both_allowed)) {
                throw ParseArgsExit(1, "Error: Invalid --strand value: " + std::to_string(strand));
            }
            opts.strand = strand;
        } else if (arg == "--lower") {
            opts.lower = parse_size(arg, require_value(arg));
        } else if (arg == "--upper") {
            opts.upper = parse_size(arg, require_value(arg));
        } else if (arg == "--strict") {
            opts.strict = parse_int(arg, require_value(arg));
            if (opts.strict < 0 || opts.strict > 2) {
                throw ParseArgsExit(1, "Error: --strict must be 0, 1 or 2");
            }
        } else if (arg == "--partial5") {
            opts.partial5 = true;
        } else if (arg == "--six-frame") {
            opts.six_frame = true;
        } else if (arg == "--protein") {
            opts.protein = true;
        } else if (arg == "--validate") {
            opts.validate = true;
        } else if (arg == "--width") {
            opts.line_width = parse_size(arg, require_value(arg));
        } else if (arg == "-t" || arg == "--threads") {
            opts.num_threads = parse_int(arg, require_value(arg));
            if (opts.num_threads < 1) {
                throw ParseArgsExit(1, "Error: --threads must be >= 1");
            }
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg != "-" && arg[0] == '-') {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        } else if (opts.input_file.empty()) {
            opts.input_file = arg;
        } else {
            throw ParseArgsExit(1, "Error: Unexpected argument: " + arg);
        }
    }

    if (opts.lower && opts.upper && *opts.upper < *opts.lower) {
        throw ParseArgsExit(1, "Error: --upper must not be below --lower");
    }
    if (opts.six_frame && (opts.strand || opts.lower || opts.upper)) {
        throw ParseArgsExit(1, "Error: --six-frame cannot be combined with --strand/--lower/--upper");
    }
    if ((command == Command::NONSTOP || command == Command::TABLES) && (opts.lower || opts.upper)) {
        throw ParseArgsExit(1, std::string("Error: ") + command_name(command) +
                               " does not take --lower/--upper");
    }
    if (command != Command::TABLES && opts.input_file.empty()) {
        throw ParseArgsExit(1, "Error: No input file specified");
    }

    return opts;
}

}  // namespace cli
}  // namespace orfkit
