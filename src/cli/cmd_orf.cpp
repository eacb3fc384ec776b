/**
 * @file cmd_orf.cpp
 * @brief Longest ORF (stop to stop) or CDS (start to stop) per record.
 *
 * Default output is TSV with 0-based half-open bounds and 1-based 5'/3'
 * ends; --protein writes the translated region as FASTA instead.
 */

#include "subcommand.hpp"
#include "args.hpp"
#include "records.hpp"
#include "orfkit/location.hpp"
#include "orfkit/log_utils.hpp"
#include "orfkit/sequence_io.hpp"
#include "orfkit/translator.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace orfkit {
namespace cli {

namespace {

struct RegionHit {
    Region region;
    std::string protein;  // Only with --protein
};

void write_tsv(std::ostream& os, const std::vector<InputRecord>& records,
               const std::vector<std::optional<RegionHit>>& hits) {
    os << "#id\tstrand\tlower\tupper\tlength\tend5\tend3\n";
    for (size_t i = 0; i < records.size(); ++i) {
        if (!records[i].error.empty() || !hits[i]) continue;
        const Region& r = hits[i]->region;
        Location loc = Location::from_region(r, records[i].record.id);
        os << loc.source() << '\t' << strand_symbol(r.strand) << '\t'
           << r.lower << '\t' << r.upper << '\t' << r.length() << '\t'
           << loc.end5() << '\t' << loc.end3() << '\n';
    }
}

int run_search(Command command, int argc, char* argv[]) {
    const char* name = command_name(command);

    Options opts;
    try {
        opts = parse_args(command, argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') std::cerr << e.what() << "\n";
        return e.exit_code();
    }

    try {
        log_utils::Stopwatch watch;

        Translator translator(select_table(opts));
        const SearchConfig config = search_config(opts);
        auto records = load_records(opts);
        if (opts.verbose) {
            std::cerr << "Loaded " << records.size() << " records from " << opts.input_file << "\n";
            std::cerr << "Searching " << name << "s, table " << translator.table().id()
                      << ", strand " << config.strand;
            if (command == Command::CDS) std::cerr << ", strict " << config.strict;
            std::cerr << "\n";
        }

        std::vector<std::optional<RegionHit>> hits(records.size());

        for_each_record(records, opts.num_threads, [&](InputRecord& rec, size_t i) {
            std::optional<Region> found = command == Command::CDS
                ? translator.get_cds(rec.clean, config)
                : translator.get_orf(rec.clean, config);
            if (!found) return;

            RegionHit hit{*found, {}};
            if (opts.protein) {
                // An ORF boundary is a stop, so it never starts with M
                hit.protein = translator.translate_region(rec.clean, *found,
                                                          command == Command::ORF, true);
            }
            hits[i] = std::move(hit);
        });

        size_t found = 0;
        for (const auto& h : hits) found += h ? 1 : 0;

        if (opts.protein) {
            FastaWriter writer(opts.output_file, opts.line_width);
            for (size_t i = 0; i < records.size(); ++i) {
                if (!records[i].error.empty() || !hits[i]) continue;
                const Region& r = hits[i]->region;
                std::string desc = std::string(name) + "=" + std::to_string(r.lower) + ".." +
                                   std::to_string(r.upper) + "(" + strand_symbol(r.strand) + ")";
                writer.write_sequence(records[i].record.id, desc, hits[i]->protein);
            }
            writer.close();
        } else if (opts.output_file == "-") {
            write_tsv(std::cout, records, hits);
        } else {
            std::ofstream ofs(opts.output_file);
            if (!ofs) {
                std::cerr << "Error: Cannot open output file: " << opts.output_file << "\n";
                return 1;
            }
            write_tsv(ofs, records, hits);
        }

        size_t failed = report_errors(records, name);
        if (opts.verbose) {
            std::cerr << "Found " << found << " " << name << "s in " << records.size()
                      << " records, " << failed << " failed ("
                      << watch.summary(records.size(), "records") << ")\n";
        }
        return failed == 0 ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace

int cmd_orf(int argc, char* argv[]) {
    return run_search(Command::ORF, argc, argv);
}

int cmd_cds(int argc, char* argv[]) {
    return run_search(Command::CDS, argc, argv);
}

}  // namespace cli
}  // namespace orfkit

namespace {
    struct OrfRegistrar {
        OrfRegistrar() {
            auto& registry = orfkit::cli::SubcommandRegistry::instance();
            registry.register_command(
                "orf",
                "Longest stop-to-stop open reading frame per record",
                orfkit::cli::cmd_orf, 20);
            registry.register_command(
                "cds",
                "Longest start-to-stop coding region per record",
                orfkit::cli::cmd_cds, 30);
        }
    };
    static OrfRegistrar registrar;
}
