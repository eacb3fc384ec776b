#include "orfkit/translator.hpp"
#include "orfkit/alphabet.hpp"
#include "orfkit/errors.hpp"

#include <algorithm>

namespace orfkit {

Translator::Translator(int table_id)
    : table_(GeneticCode::get(table_id)) {}

Translator::Translator(std::shared_ptr<const GeneticCode> table)
    : table_(std::move(table)) {
    if (!table_) throw Error("Translator requires a genetic code table");
}

std::string_view Translator::prepare(std::string_view seq, bool sanitized,
                                     std::string& buffer) const {
    if (sanitized) return seq;
    buffer = clean_dna(seq);
    return buffer;
}

std::string Translator::translate(std::string_view seq, const TranslateOptions& opts) const {
    if (opts.strand != FORWARD && opts.strand != REVERSE) {
        throw InvalidStrand(opts.strand);
    }

    std::string buffer;
    std::string_view s = prepare(seq, opts.sanitized, buffer);

    const size_t lower = opts.lower;
    const size_t upper = opts.upper.value_or(s.size());
    if (lower > s.size() || upper > s.size()) {
        throw InvalidCoordinates("Region [" + std::to_string(lower) + ", " +
                                 std::to_string(upper) + ") exceeds sequence length " +
                                 std::to_string(s.size()));
    }
    if (upper < lower) {
        throw InvalidCoordinates("Region upper bound " + std::to_string(upper) +
                                 " is below lower bound " + std::to_string(lower));
    }

    const size_t n_codons = (upper - lower) / 3;
    std::string protein;
    protein.reserve(n_codons);

    for (size_t k = 0; k < n_codons; ++k) {
        // Reverse strand reads leftwards from upper through the reverse table
        const char* p = (opts.strand == FORWARD)
            ? s.data() + lower + 3 * k
            : s.data() + upper - 3 * (k + 1);

        if (k == 0 && !opts.partial5 && table_->is_start_at(p, opts.strand)) {
            protein += 'M';
            continue;
        }
        protein += table_->residue_at(p, opts.strand);
    }
    return protein;
}

std::string Translator::translate_region(std::string_view seq, const Region& region,
                                         bool partial5, bool sanitized) const {
    TranslateOptions opts;
    opts.strand = region.strand == REVERSE ? REVERSE : FORWARD;
    opts.lower = region.lower;
    opts.upper = region.upper;
    opts.partial5 = partial5;
    opts.sanitized = sanitized;
    return translate(seq, opts);
}

std::vector<FrameTranslation> Translator::translate6(std::string_view seq, bool sanitized) const {
    std::string buffer;
    std::string_view s = prepare(seq, sanitized, buffer);
    const size_t len = s.size();

    std::vector<FrameTranslation> frames;
    frames.reserve(6);

    for (int strand : {FORWARD, REVERSE}) {
        for (size_t f = 0; f < 3; ++f) {
            Region region;
            region.strand = strand;
            if (strand == FORWARD) {
                region.lower = std::min(f, len);
                region.upper = region.lower + 3 * ((len - region.lower) / 3);
            } else {
                region.upper = len > f ? len - f : 0;
                region.lower = region.upper % 3;
            }

            FrameTranslation ft;
            ft.frame = static_cast<int>(f + 1) * strand;
            ft.region = region;
            ft.protein = translate_region(s, region, true, true);
            frames.push_back(std::move(ft));
        }
    }
    return frames;
}

std::vector<std::string> Translator::codons(std::string_view key, int strand) const {
    return table_->matcher(key, strand).concrete_codons();
}

}  // namespace orfkit
