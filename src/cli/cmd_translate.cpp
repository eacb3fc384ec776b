/**
 * @file cmd_translate.cpp
 * @brief Translate nucleotide FASTA records to protein.
 */

#include "subcommand.hpp"
#include "args.hpp"
#include "records.hpp"
#include "orfkit/log_utils.hpp"
#include "orfkit/sequence_io.hpp"
#include "orfkit/translator.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace orfkit {
namespace cli {

namespace {

struct TranslatedRecord {
    std::string id;
    std::string description;
    std::string protein;
};

std::string frame_description(const FrameTranslation& ft) {
    return "frame=" + std::to_string(ft.frame) +
           " lower=" + std::to_string(ft.region.lower) +
           " upper=" + std::to_string(ft.region.upper);
}

}  // namespace

int cmd_translate(int argc, char* argv[]) {
    Options opts;
    try {
        opts = parse_args(Command::TRANSLATE, argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') std::cerr << e.what() << "\n";
        return e.exit_code();
    }

    try {
        log_utils::Stopwatch watch;

        Translator translator(select_table(opts));
        auto records = load_records(opts);
        if (opts.verbose) {
            std::cerr << "Loaded " << records.size() << " records from " << opts.input_file
                      << " (table " << translator.table().id() << ", "
                      << translator.table().name() << ")\n";
        }

        std::vector<std::vector<TranslatedRecord>> results(records.size());

        for_each_record(records, opts.num_threads, [&](InputRecord& rec, size_t i) {
            auto& out = results[i];
            if (opts.six_frame) {
                for (auto& ft : translator.translate6(rec.clean, true)) {
                    out.push_back({rec.record.id + "_" + std::to_string(ft.frame),
                                   frame_description(ft), std::move(ft.protein)});
                }
                return;
            }

            TranslateOptions topts;
            topts.strand = opts.strand.value_or(FORWARD);
            topts.lower = opts.lower.value_or(0);
            topts.upper = opts.upper;
            topts.partial5 = opts.partial5;
            topts.sanitized = true;
            out.push_back({rec.record.id, rec.record.description,
                           translator.translate(rec.clean, topts)});
        });

        FastaWriter writer(opts.output_file, opts.line_width);
        size_t written = 0;
        for (size_t i = 0; i < records.size(); ++i) {
            if (!records[i].error.empty()) continue;
            for (const auto& tr : results[i]) {
                writer.write_sequence(tr.id, tr.description, tr.protein);
                ++written;
            }
        }
        writer.close();

        size_t failed = report_errors(records, "translate");
        if (opts.verbose) {
            std::cerr << "Wrote " << written << " translations, " << failed << " records failed ("
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
    struct TranslateRegistrar {
        TranslateRegistrar() {
            orfkit::cli::SubcommandRegistry::instance().register_command(
                "translate",
                "Translate records in one frame or all six",
                orfkit::cli::cmd_translate, 10);
        }
    };
    static TranslateRegistrar registrar;
}
