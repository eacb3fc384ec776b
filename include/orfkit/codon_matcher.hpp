#pragma once

#include "alphabet.hpp"

#include <bitset>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace orfkit {

/**
 * Membership test for a 3-letter window over the IUPAC nucleotide alphabet.
 *
 * Built from a set of concrete codons. A degenerate codon (e.g. "TAR") is
 * accepted only if every concrete codon it expands to is in the set, so a
 * degenerate window never matches on a partial interpretation.
 */
class CodonMatcher {
public:
    CodonMatcher() = default;

    // concrete: bit i set if codon index i (T=0, C=1, A=2, G=3 order) is accepted
    explicit CodonMatcher(const std::bitset<NUM_CODONS>& concrete);

    // Unchecked: window p[0..2] must be readable
    bool matches_at(const char* p) const {
        int idx = mask_codon_idx(p[0], p[1], p[2]);
        return idx >= 0 && accepted_[idx];
    }

    bool matches(std::string_view codon) const {
        return codon.size() == 3 && matches_at(codon.data());
    }

    // Positions p in [from, to) where seq[p..p+2] matches, ascending
    std::vector<size_t> find_all(std::string_view seq, size_t from = 0,
                                 size_t to = std::string_view::npos) const;

    bool empty() const { return concrete_.none(); }

    // Concrete codons in table order
    std::vector<std::string> concrete_codons() const;

    // Number of accepted windows, degenerate ones included
    size_t accepted_count() const { return accepted_.count(); }

private:
    std::bitset<NUM_CODONS> concrete_;
    std::bitset<NUM_MASK_CODONS> accepted_;
};

}  // namespace orfkit
