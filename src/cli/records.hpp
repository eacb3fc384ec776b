#ifndef ORFKIT_CLI_RECORDS_HPP
#define ORFKIT_CLI_RECORDS_HPP

#include "args.hpp"
#include "orfkit/genetic_code.hpp"
#include "orfkit/sequence_io.hpp"
#include "orfkit/types.hpp"

#include <exception>
#include <memory>
#include <string>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace orfkit {
namespace cli {

// One input record with its scan-ready sequence. A non-empty error means
// the record is skipped and reported.
struct InputRecord {
    SequenceRecord record;
    std::string clean;
    std::string error;
};

// Table selected by -g (id or name). Throws UnknownTableId.
std::shared_ptr<const GeneticCode> select_table(const Options& opts);

// Read and clean every record of the input; with --validate, records
// containing non-IUPAC symbols get an error instead
std::vector<InputRecord> load_records(const Options& opts);

// Search bounds/strand from the command line; strand defaults to both
SearchConfig search_config(const Options& opts);

// Print one warning per failed record; returns the number of failures
size_t report_errors(const std::vector<InputRecord>& records, const char* command);

/**
 * Run fn(record, index) over every record that loaded cleanly, in parallel
 * when built with OpenMP. An exception thrown for one record is stored in
 * its error field and does not stop the others.
 */
template <typename Fn>
void for_each_record(std::vector<InputRecord>& records, int num_threads, Fn fn) {
    const long n = static_cast<long>(records.size());

#ifdef _OPENMP
    if (num_threads > 0) omp_set_num_threads(num_threads);
    #pragma omp parallel for schedule(dynamic, 16)
#else
    (void)num_threads;
#endif
    for (long i = 0; i < n; ++i) {
        InputRecord& rec = records[i];
        if (!rec.error.empty()) continue;
        try {
            fn(rec, static_cast<size_t>(i));
        } catch (const std::exception& e) {
            rec.error = e.what();
        }
    }
}

}  // namespace cli
}  // namespace orfkit

#endif  // ORFKIT_CLI_RECORDS_HPP
