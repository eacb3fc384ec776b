#include "orfkit/codon_matcher.hpp"

#include <algorithm>

namespace orfkit {

CodonMatcher::CodonMatcher(const std::bitset<NUM_CODONS>& concrete)
    : concrete_(concrete) {
    if (concrete_.none()) return;

    // Every non-empty base mask is an IUPAC symbol, so walk all 15^3 triples
    for (int m1 = 1; m1 < 16; ++m1) {
        for (int m2 = 1; m2 < 16; ++m2) {
            for (int m3 = 1; m3 < 16; ++m3) {
                bool all = true;
                for (int b1 = 0; b1 < 4 && all; ++b1) {
                    if (!(m1 & (1 << b1))) continue;
                    for (int b2 = 0; b2 < 4 && all; ++b2) {
                        if (!(m2 & (1 << b2))) continue;
                        for (int b3 = 0; b3 < 4 && all; ++b3) {
                            if (!(m3 & (1 << b3))) continue;
                            all = concrete_[b1 * 16 + b2 * 4 + b3];
                        }
                    }
                }
                if (all) accepted_.set((m1 << 8) | (m2 << 4) | m3);
            }
        }
    }
}

std::vector<size_t> CodonMatcher::find_all(std::string_view seq, size_t from, size_t to) const {
    std::vector<size_t> positions;
    if (seq.size() < 3) return positions;

    size_t last = seq.size() - 3;
    if (to != std::string_view::npos && to > 0) last = std::min(last, to - 1);
    if (to == 0) return positions;

    for (size_t p = from; p <= last; ++p) {
        if (matches_at(seq.data() + p)) positions.push_back(p);
    }
    return positions;
}

std::vector<std::string> CodonMatcher::concrete_codons() const {
    std::vector<std::string> codons;
    for (size_t i = 0; i < NUM_CODONS; ++i) {
        if (concrete_[i]) codons.push_back(idx_to_codon(static_cast<int>(i)));
    }
    return codons;
}

}  // namespace orfkit
