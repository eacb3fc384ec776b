/**
 * @file cmd_tables.cpp
 * @brief List the genetic codes, or print one as a codon table.
 */

#include "subcommand.hpp"
#include "args.hpp"
#include "records.hpp"
#include "orfkit/alphabet.hpp"
#include "orfkit/genetic_code.hpp"

#include <fstream>
#include <iostream>
#include <string>

namespace orfkit {
namespace cli {

namespace {

void list_tables(std::ostream& os) {
    os << "#id\tname\tstarts\n";
    for (int id : GeneticCode::available_ids()) {
        auto table = GeneticCode::get(id);
        std::string starts;
        for (const auto& codon : table->start_codons()) {
            if (!starts.empty()) starts += ',';
            starts += codon;
        }
        os << id << '\t' << table->name() << '\t' << starts << '\n';
    }
}

void print_table(std::ostream& os, const GeneticCode& table, int strand) {
    os << "# " << table.id() << ": " << table.name() << " (strand " << strand << ")\n";
    os << "#codon\tresidue\tabbrev\tstart\n";
    for (int i = 0; i < static_cast<int>(NUM_CODONS); ++i) {
        std::string codon = idx_to_codon(i);
        char aa = table.residue(codon, strand);
        const char* abbrev = aa_abbrev(aa);
        os << codon << '\t' << aa << '\t' << (abbrev ? abbrev : "?") << '\t'
           << (table.is_start(codon, strand) ? "M" : "-") << '\n';
    }
}

}  // namespace

int cmd_tables(int argc, char* argv[]) {
    Options opts;
    try {
        opts = parse_args(Command::TABLES, argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') std::cerr << e.what() << "\n";
        return e.exit_code();
    }

    try {
        std::ofstream ofs;
        std::ostream* os = &std::cout;
        if (opts.output_file != "-") {
            ofs.open(opts.output_file);
            if (!ofs) {
                std::cerr << "Error: Cannot open output file: " << opts.output_file << "\n";
                return 1;
            }
            os = &ofs;
        }

        if (opts.table_given) {
            print_table(*os, *select_table(opts), opts.strand.value_or(FORWARD));
        } else {
            list_tables(*os);
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace cli
}  // namespace orfkit

namespace {
    struct TablesRegistrar {
        TablesRegistrar() {
            orfkit::cli::SubcommandRegistry::instance().register_command(
                "tables",
                "List genetic codes or print a codon table",
                orfkit::cli::cmd_tables, 50);
        }
    };
    static TablesRegistrar registrar;
}
