#pragma once

#include "alphabet.hpp"
#include "codon_matcher.hpp"

#include <array>
#include <bitset>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace orfkit {

/**
 * Static definition of a genetic code, in the NCBI 64-column layout:
 *   residues: one residue per codon, '*' for stop
 *   starts:   'M' where the codon can initiate translation
 * Columns run TTT, TTC, TTA, TTG, TCT, ... GGG.
 */
struct GeneticCodeDefinition {
    int id;
    const char* name;
    const char* residues;
    const char* starts;
};

// NCBI translation tables, sorted by id
const std::vector<GeneticCodeDefinition>& ncbi_genetic_codes();

/**
 * Immutable codon <-> residue tables for one genetic code.
 *
 * Both strands are precomputed at construction. Strand -1 tables are keyed
 * by the codon as it reads on the forward text, so a scan of the forward
 * sequence can test reverse-strand codons in place: the reverse residue of
 * "CTA" is the forward residue of "TAG".
 *
 * Tables are shared through get(); the instance is never modified after
 * publication except for its append-only matcher cache.
 */
class GeneticCode {
public:
    /**
     * Registered table by NCBI id, built on first use and cached process-wide.
     * Throws UnknownTableId.
     */
    static std::shared_ptr<const GeneticCode> get(int id);

    // Case-insensitive lookup by table name. Throws UnknownTableId.
    static std::shared_ptr<const GeneticCode> by_name(std::string_view name);

    static std::vector<int> available_ids();

    /**
     * Build an unregistered table from a 64-column definition.
     * Throws InvalidTableDefinition if either string is not 64 symbols or
     * a residue is not an amino acid symbol.
     */
    static std::shared_ptr<const GeneticCode> custom(int id, std::string name,
                                                     std::string_view residues,
                                                     std::string_view starts);

    int id() const { return id_; }
    const std::string& name() const { return name_; }

    // Forward residue of a concrete codon index (0-63)
    char residue(int codon_idx) const { return concrete_[0][codon_idx]; }

    /**
     * Residue of a codon read on the forward text, for strand 1 or -1.
     * Degenerate codons resolve through ambiguous_residue(): the residue
     * every expansion agrees on, else B/J/Z, else X. Non-nucleotide
     * symbols give X. Throws InvalidStrand, and Error unless the codon is
     * exactly 3 symbols.
     */
    char residue(std::string_view codon, int strand = 1) const;

    // Unchecked form for scanning: p[0..2] must be readable and strand
    // already validated as 1 or -1
    char residue_at(const char* p, int strand) const {
        int idx = mask_codon_idx(p[0], p[1], p[2]);
        return idx < 0 ? UNKNOWN_RESIDUE : resolved_[strand_slot(strand)][idx];
    }

    // False for anything but a 3-symbol codon; throws InvalidStrand
    bool is_start(std::string_view codon, int strand = 1) const;

    bool is_start_at(const char* p, int strand) const {
        return matcher("start", strand).matches_at(p);
    }

    // Concrete codons encoding a residue on a strand (empty if none)
    const std::vector<std::string>& codons(char residue, int strand = 1) const;

    const std::vector<std::string>& start_codons(int strand = 1) const;

    /**
     * Matcher for a residue symbol or one of "start", "lower", "upper".
     * lower/upper are the CDS boundaries for the strand: on strand 1 lower
     * is the start codon and upper the stop; on strand -1 they swap.
     * Built lazily and memoized; throws InvalidResidue, InvalidStrand.
     */
    const CodonMatcher& matcher(std::string_view key, int strand = 1) const;

    // The 64-column residue / start strings this table was built from
    std::string residues_string() const;
    std::string starts_string() const;

private:
    GeneticCode(int id, std::string name, std::string_view residues, std::string_view starts);

    static int strand_slot(int strand) { return strand == -1 ? 1 : 0; }

    // Resolve "lower"/"upper"/"start"/residue into '^' (start) or a residue
    static char resolve_key(std::string_view key, int strand);

    std::bitset<NUM_CODONS> concrete_set(char key, int slot) const;

    int id_;
    std::string name_;

    // [0] forward, [1] reverse complement (keyed by forward-text codon)
    std::array<std::array<char, NUM_CODONS>, 2> concrete_{};
    std::array<std::bitset<NUM_CODONS>, 2> starts_;
    std::array<std::array<char, NUM_MASK_CODONS>, 2> resolved_{};
    std::array<std::map<char, std::vector<std::string>>, 2> residue_codons_;
    std::array<std::vector<std::string>, 2> start_codons_;

    mutable std::mutex matcher_mutex_;
    mutable std::map<std::pair<char, int>, std::unique_ptr<CodonMatcher>> matchers_;
};

}  // namespace orfkit
