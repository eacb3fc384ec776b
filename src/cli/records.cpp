#include "records.hpp"
#include "orfkit/alphabet.hpp"

#include <iostream>

namespace orfkit {
namespace cli {

std::shared_ptr<const GeneticCode> select_table(const Options& opts) {
    if (!opts.table_name.empty()) return GeneticCode::by_name(opts.table_name);
    return GeneticCode::get(opts.table_id);
}

std::vector<InputRecord> load_records(const Options& opts) {
    std::vector<InputRecord> records;
    SequenceReader reader(opts.input_file);
    if (reader.get_format() == SequenceReader::Format::UNKNOWN) {
        throw std::runtime_error("Input is not FASTA or FASTQ: " + opts.input_file);
    }

    SequenceRecord record;
    while (reader.read_next(record)) {
        InputRecord rec;
        rec.record = record;
        try {
            if (opts.validate) validate_dna(rec.record.sequence);
            rec.clean = clean_dna(rec.record.sequence);
        } catch (const std::exception& e) {
            rec.error = e.what();
        }
        records.push_back(std::move(rec));
    }
    return records;
}

SearchConfig search_config(const Options& opts) {
    SearchConfig config;
    config.strand = opts.strand.value_or(BOTH_STRANDS);
    config.lower = opts.lower.value_or(0);
    config.upper = opts.upper;
    config.strict = opts.strict;
    config.sanitized = true;
    return config;
}

size_t report_errors(const std::vector<InputRecord>& records, const char* command) {
    size_t failed = 0;
    for (const auto& rec : records) {
        if (rec.error.empty()) continue;
        std::cerr << "Warning: " << command << ": skipped " << rec.record.id
                  << ": " << rec.error << "\n";
        ++failed;
    }
    return failed;
}

}  // namespace cli
}  // namespace orfkit
