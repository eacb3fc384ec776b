#pragma once

#include "types.hpp"
#include "genetic_code.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace orfkit {

/**
 * Translation and reading-frame search over one genetic code.
 *
 * A Translator only holds a shared pointer to an immutable GeneticCode, so
 * one instance can be used from several threads at once. Every call takes
 * the raw sequence text; it is passed through clean_dna() first unless the
 * options say it is already sanitized.
 *
 * Scanning tests the 3-base window at every position, so overlapping
 * codons (e.g. "TAATAG" read in two frames) are all seen.
 */
class Translator {
public:
    // Standard code (NCBI table 1) unless an id is given. Throws UnknownTableId.
    explicit Translator(int table_id = 1);
    explicit Translator(std::shared_ptr<const GeneticCode> table);

    const GeneticCode& table() const { return *table_; }

    /**
     * Translate [lower, upper) on a strand to amino acids.
     *
     * Strand -1 reads the reverse complement, starting at upper. Whole
     * codons only; trailing bases are ignored. Degenerate codons give the
     * residue all readings agree on, else B/J/Z, else X. Unless partial5 is
     * set, a leading start codon translates as M.
     *
     * Throws InvalidCoordinates, InvalidStrand.
     */
    std::string translate(std::string_view seq, const TranslateOptions& opts = {}) const;

    // translate() over a search result; strand 0 reads as forward
    std::string translate_region(std::string_view seq, const Region& region,
                                 bool partial5 = false, bool sanitized = false) const;

    /**
     * All six reading frames, in the order 1, 2, 3, -1, -2, -3.
     * Reverse frames are aligned from the 3' end of the sequence, the same
     * numbering nonstop() uses. No start-codon substitution is applied.
     */
    std::vector<FrameTranslation> translate6(std::string_view seq, bool sanitized = false) const;

    // Copy of the concrete codons for a residue or start/lower/upper on a strand
    std::vector<std::string> codons(std::string_view key, int strand = FORWARD) const;

    // Positions where a residue (or start/lower/upper) codon begins, ascending
    std::vector<size_t> find(std::string_view seq, std::string_view key,
                             int strand = FORWARD, bool sanitized = false) const;

    /**
     * Longest stop-to-stop region.
     *
     * On the forward strand the closing stop codon is included at the upper
     * end; on the reverse strand it sits at the lower end of the next region.
     * Frames running off either end of the scan range are cut at the last
     * whole codon. Ties keep the first region found (strand -1 is searched
     * before strand 1). Length is always a multiple of 3.
     *
     * Returns nullopt when nothing of positive length is found, or when
     * upper < lower. Throws InvalidCoordinates, InvalidStrand.
     */
    std::optional<Region> get_orf(std::string_view seq, const SearchConfig& config = {}) const;

    /**
     * Longest start-to-stop region.
     *
     * strict 0: every frame is treated as open at the scan start and may
     *           run off the end.
     * strict 1: a real start codon is required; the region may run off the
     *           3' end without a stop.
     * strict 2: both a real start and a real stop are required.
     *
     * Internal start codons never reset an open forward frame. Throws
     * InvalidCoordinates, InvalidStrand, and Error for strict outside 0-2.
     */
    std::optional<Region> get_cds(std::string_view seq, const SearchConfig& config = {}) const;

    /**
     * Frames whose full-length reading contains no stop codon.
     * Labels are 1, 2, 3 for the forward frames starting at offsets 0, 1, 2
     * and -1, -2, -3 for the reverse frames ending 0, 1, 2 bases before the
     * 3' end of the sequence. Forward frames are listed first.
     */
    std::vector<int> nonstop(std::string_view seq, const SearchConfig& config = {}) const;

private:
    // Cleaned copy when needed; otherwise a view of the caller's text
    std::string_view prepare(std::string_view seq, bool sanitized, std::string& buffer) const;

    std::shared_ptr<const GeneticCode> table_;
};

}  // namespace orfkit
