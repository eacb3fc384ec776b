/**
 * Nucleotide cleaning, complements and amino acid tables
 */

#include "orfkit/alphabet.hpp"
#include "orfkit/errors.hpp"

#include <algorithm>
#include <array>
#include <random>

namespace orfkit {

std::string expand_base(char c) {
    static constexpr char BASES[4] = {'T', 'C', 'A', 'G'};
    uint8_t mask = base_mask(c);
    std::string bases;
    // Alphabetical order reads better in messages: A, C, G, T
    for (int idx : {2, 1, 3, 0}) {
        if (mask & (1u << idx)) bases += BASES[idx];
    }
    return bases;
}

std::string clean_dna(std::string_view text) {
    std::string seq;
    seq.reserve(text.size());

    bool line_start = true;
    bool in_header = false;
    for (char c : text) {
        if (c == '\n' || c == '\r') {
            line_start = true;
            in_header = false;
            continue;
        }
        if (in_header) continue;
        if (line_start && c == '>') {
            in_header = true;
            continue;
        }
        line_start = false;

        char u = fast_upper(c);
        if (u == 'U') u = 'T';
        if (is_nucleotide(u)) seq += u;
    }
    return seq;
}

void validate_dna(std::string_view seq) {
    for (size_t i = 0; i < seq.size(); ++i) {
        if (!is_nucleotide(seq[i])) {
            throw InvalidSequenceSymbol(seq[i], i);
        }
    }
}

std::string reverse_complement(std::string_view seq) {
    std::string rc;
    rc.reserve(seq.length());
    for (auto it = seq.rbegin(); it != seq.rend(); ++it) {
        rc += fast_complement(*it);
    }
    return rc;
}

std::string random_dna(size_t length, uint64_t seed) {
    static constexpr char BASES[4] = {'A', 'C', 'G', 'T'};
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<int> pick(0, 3);

    std::string seq(length, 'N');
    for (auto& c : seq) c = BASES[pick(rng)];
    return seq;
}

namespace {

struct AmbiguityClass {
    char code;
    std::string_view members;
};

constexpr std::array<AmbiguityClass, 3> AMBIGUITY_CLASSES = {{
    {'B', "DN"},
    {'J', "IL"},
    {'Z', "EQ"},
}};

}  // namespace

char ambiguous_residue(std::string_view residues) {
    if (residues.empty()) return UNKNOWN_RESIDUE;

    char first = residues.front();
    bool all_same = std::all_of(residues.begin(), residues.end(),
                                [first](char r) { return r == first; });
    if (all_same) return first;

    for (const auto& cls : AMBIGUITY_CLASSES) {
        bool inside = std::all_of(residues.begin(), residues.end(), [&cls](char r) {
            return cls.members.find(r) != std::string_view::npos;
        });
        if (inside) return cls.code;
    }
    return UNKNOWN_RESIDUE;
}

std::string_view expand_residue(char aa) {
    for (const auto& cls : AMBIGUITY_CLASSES) {
        if (cls.code == fast_upper(aa)) return cls.members;
    }
    return {};
}

const char* aa_abbrev(char aa) {
    switch (fast_upper(aa)) {
        case 'A': return "Ala";
        case 'B': return "Asx";
        case 'C': return "Cys";
        case 'D': return "Asp";
        case 'E': return "Glu";
        case 'F': return "Phe";
        case 'G': return "Gly";
        case 'H': return "His";
        case 'I': return "Ile";
        case 'J': return "Xle";
        case 'K': return "Lys";
        case 'L': return "Leu";
        case 'M': return "Met";
        case 'N': return "Asn";
        case 'O': return "Pyl";
        case 'P': return "Pro";
        case 'Q': return "Gln";
        case 'R': return "Arg";
        case 'S': return "Ser";
        case 'T': return "Thr";
        case 'U': return "Sec";
        case 'V': return "Val";
        case 'W': return "Trp";
        case 'X': return "Xaa";
        case 'Y': return "Tyr";
        case 'Z': return "Glx";
        case '*': return "Ter";
        default: return nullptr;
    }
}

}  // namespace orfkit
