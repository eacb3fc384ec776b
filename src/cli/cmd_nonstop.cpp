/**
 * @file cmd_nonstop.cpp
 * @brief Report the reading frames of each record that contain no stop codon.
 */

#include "subcommand.hpp"
#include "args.hpp"
#include "records.hpp"
#include "orfkit/log_utils.hpp"
#include "orfkit/translator.hpp"

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace orfkit {
namespace cli {

namespace {

// "2,3,-1" or "." when every frame has a stop
std::string join_frames(const std::vector<int>& frames) {
    if (frames.empty()) return ".";
    std::string out;
    for (size_t i = 0; i < frames.size(); ++i) {
        if (i > 0) out += ',';
        out += std::to_string(frames[i]);
    }
    return out;
}

void write_frames(std::ostream& os, const std::vector<InputRecord>& records,
                  const std::vector<std::vector<int>>& frames) {
    os << "#id\tlength\tframes\n";
    for (size_t i = 0; i < records.size(); ++i) {
        if (!records[i].error.empty()) continue;
        os << records[i].record.id << '\t' << records[i].clean.size() << '\t'
           << join_frames(frames[i]) << '\n';
    }
}

}  // namespace

int cmd_nonstop(int argc, char* argv[]) {
    Options opts;
    try {
        opts = parse_args(Command::NONSTOP, argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') std::cerr << e.what() << "\n";
        return e.exit_code();
    }

    try {
        log_utils::Stopwatch watch;

        Translator translator(select_table(opts));
        const SearchConfig config = search_config(opts);
        auto records = load_records(opts);

        std::vector<std::vector<int>> frames(records.size());
        for_each_record(records, opts.num_threads, [&](InputRecord& rec, size_t i) {
            frames[i] = translator.nonstop(rec.clean, config);
        });

        if (opts.output_file == "-") {
            write_frames(std::cout, records, frames);
        } else {
            std::ofstream ofs(opts.output_file);
            if (!ofs) {
                std::cerr << "Error: Cannot open output file: " << opts.output_file << "\n";
                return 1;
            }
            write_frames(ofs, records, frames);
        }

        size_t failed = report_errors(records, "nonstop");
        if (opts.verbose) {
            std::cerr << "Checked " << records.size() << " records, " << failed << " failed ("
                      << watch.summary(records.size(), "records") << ")\n";
        }
        return failed == 0 ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace cli
}  // namespace orfkit

namespace {
    struct NonstopRegistrar {
        NonstopRegistrar() {
            orfkit::cli::SubcommandRegistry::instance().register_command(
                "nonstop",
                "Reading frames without a stop codon",
                orfkit::cli::cmd_nonstop, 40);
        }
    };
    static NonstopRegistrar registrar;
}
