#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace orfkit {

/**
 * Nucleotide and amino acid alphabets
 *
 * Codon index encoding follows the NCBI table order: T=0, C=1, A=2, G=3,
 * index = base1*16 + base2*4 + base3.
 */

// All accepted nucleotide symbols, degenerate ones included (U folds to T)
constexpr std::string_view NUCLEOTIDES = "ABCDGHKMNRSTUVWY";
constexpr std::string_view DEGENERATES = "BDHKMNRSVWY";

constexpr std::string_view AMINO_ACIDS = "*ABCDEFGHIJKLMNOPQRSTUVWXYZ";
constexpr std::string_view STRICT_AMINO_ACIDS = "*ACDEFGHIKLMNPQRSTVWXY";
constexpr std::string_view AMBIGUOUS_AMINO_ACIDS = "BJZ";

constexpr char STOP_RESIDUE = '*';
constexpr char UNKNOWN_RESIDUE = 'X';

constexpr size_t NUM_CODONS = 64;
// 4-bit base masks per position, 3 positions
constexpr size_t NUM_MASK_CODONS = 4096;

inline char fast_upper(char c) {
    return (c >= 'a' && c <= 'z') ? (c - 32) : c;
}

// Complement over the full IUPAC alphabet, case preserved.
// Non-nucleotide symbols complement to N.
inline char fast_complement(char c) {
    switch (c) {
        case 'A': return 'T';
        case 'T': return 'A';
        case 'U': return 'A';
        case 'C': return 'G';
        case 'G': return 'C';
        case 'M': return 'K';
        case 'K': return 'M';
        case 'R': return 'Y';
        case 'Y': return 'R';
        case 'V': return 'B';
        case 'B': return 'V';
        case 'H': return 'D';
        case 'D': return 'H';
        case 'S': return 'S';
        case 'W': return 'W';
        case 'N': return 'N';
        case 'a': return 't';
        case 't': return 'a';
        case 'u': return 'a';
        case 'c': return 'g';
        case 'g': return 'c';
        case 'm': return 'k';
        case 'k': return 'm';
        case 'r': return 'y';
        case 'y': return 'r';
        case 'v': return 'b';
        case 'b': return 'v';
        case 'h': return 'd';
        case 'd': return 'h';
        case 's': return 's';
        case 'w': return 'w';
        case 'n': return 'n';
        default: return 'N';
    }
}

// Base to codon-table offset: T=0, C=1, A=2, G=3, anything else -1
inline int base_to_idx(char c) {
    switch (c) {
        case 'T': case 't': case 'U': case 'u': return 0;
        case 'C': case 'c': return 1;
        case 'A': case 'a': return 2;
        case 'G': case 'g': return 3;
        default: return -1;
    }
}

// Concrete codon to 0-63, or -1 if any base is not A/C/G/T
inline int codon_to_idx(char c1, char c2, char c3) {
    int i1 = base_to_idx(c1);
    int i2 = base_to_idx(c2);
    int i3 = base_to_idx(c3);
    if (i1 < 0 || i2 < 0 || i3 < 0) return -1;
    return i1 * 16 + i2 * 4 + i3;
}

inline std::string idx_to_codon(int idx) {
    static constexpr char BASES[4] = {'T', 'C', 'A', 'G'};
    return std::string{BASES[(idx >> 4) & 3], BASES[(idx >> 2) & 3], BASES[idx & 3]};
}

/**
 * IUPAC symbol to the set of concrete bases it stands for, as a bit mask
 * over the codon-table offsets (bit 0 = T, 1 = C, 2 = A, 3 = G).
 * Returns 0 for symbols outside the nucleotide alphabet.
 */
inline uint8_t base_mask(char c) {
    switch (fast_upper(c)) {
        case 'T': case 'U': return 0x1;
        case 'C': return 0x2;
        case 'A': return 0x4;
        case 'G': return 0x8;
        case 'Y': return 0x1 | 0x2;              // C/T
        case 'W': return 0x1 | 0x4;              // A/T
        case 'K': return 0x1 | 0x8;              // G/T
        case 'M': return 0x2 | 0x4;              // A/C
        case 'S': return 0x2 | 0x8;              // C/G
        case 'R': return 0x4 | 0x8;              // A/G
        case 'H': return 0x1 | 0x2 | 0x4;        // A/C/T
        case 'B': return 0x1 | 0x2 | 0x8;        // C/G/T
        case 'D': return 0x1 | 0x4 | 0x8;        // A/G/T
        case 'V': return 0x2 | 0x4 | 0x8;        // A/C/G
        case 'N': return 0xF;
        default: return 0;
    }
}

// Index of a (possibly degenerate) codon among the 4096 mask triples,
// or -1 if a symbol is not a nucleotide
inline int mask_codon_idx(char c1, char c2, char c3) {
    uint8_t m1 = base_mask(c1);
    uint8_t m2 = base_mask(c2);
    uint8_t m3 = base_mask(c3);
    if (!m1 || !m2 || !m3) return -1;
    return (m1 << 8) | (m2 << 4) | m3;
}

inline bool is_nucleotide(char c) {
    return NUCLEOTIDES.find(fast_upper(c)) != std::string_view::npos;
}

inline bool is_degenerate(char c) {
    return DEGENERATES.find(fast_upper(c)) != std::string_view::npos;
}

// Concrete bases a symbol stands for, e.g. 'R' -> "AG". Empty for non-nucleotides.
std::string expand_base(char c);

/**
 * Clean raw nucleotide text for scanning: drops header lines starting with
 * '>', whitespace and any symbol outside NUCLEOTIDES, uppercases, folds U to T.
 * Idempotent: clean_dna(clean_dna(s)) == clean_dna(s).
 */
std::string clean_dna(std::string_view text);

// Strict alternative to clean_dna(): throws InvalidSequenceSymbol on the
// first symbol outside NUCLEOTIDES (whitespace is not allowed either)
void validate_dna(std::string_view seq);

std::string reverse_complement(std::string_view seq);

// Random A/C/G/T sequence, reproducible for a given seed
std::string random_dna(size_t length = 100, uint64_t seed = 0);

/**
 * Collapse a set of residues into a single symbol: the residue itself if
 * there is one, B (D/N), J (I/L) or Z (E/Q) for the IUPAC ambiguity
 * classes, X otherwise.
 */
char ambiguous_residue(std::string_view residues);

// Concrete residues of an ambiguity code: 'B' -> "DN", 'J' -> "IL", 'Z' -> "EQ"
std::string_view expand_residue(char aa);

// One-letter amino acid code to three-letter abbreviation ("Ala"), or
// nullptr for symbols outside AMINO_ACIDS
const char* aa_abbrev(char aa);

}  // namespace orfkit
