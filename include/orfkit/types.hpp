#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace orfkit {

// Strand values. BOTH_STRANDS is a search-scope flag only; a concrete
// region found by a search is always FORWARD or REVERSE.
constexpr int FORWARD = 1;
constexpr int REVERSE = -1;
constexpr int BOTH_STRANDS = 0;

inline bool is_valid_strand(int strand) {
    return strand == FORWARD || strand == REVERSE || strand == BOTH_STRANDS;
}

inline char strand_symbol(int strand) {
    switch (strand) {
        case FORWARD: return '+';
        case REVERSE: return '-';
        default: return '.';
    }
}

/**
 * Half-open, 0-based interval [lower, upper) on one strand.
 * This is what ORF/CDS searches return and what translation consumes.
 */
struct Region {
    int strand = BOTH_STRANDS;
    size_t lower = 0;
    size_t upper = 0;

    size_t length() const { return upper - lower; }
    size_t phase() const { return length() % 3; }

    bool operator==(const Region& other) const = default;
};

/**
 * Options shared by get_orf(), get_cds() and nonstop()
 */
struct SearchConfig {
    int strand = BOTH_STRANDS;        // -1, 1, or 0 for both
    size_t lower = 0;                 // Scan start bound
    std::optional<size_t> upper;      // Scan end bound (default: sequence length)
    int strict = 1;                   // get_cds() only: 0, 1 or 2
    bool sanitized = false;           // Input already passed through clean_dna()
};

/**
 * Options for Translator::translate()
 */
struct TranslateOptions {
    int strand = FORWARD;             // -1 or 1
    size_t lower = 0;
    std::optional<size_t> upper;      // Default: sequence length
    bool partial5 = false;            // 5' end missing: never force the first codon to M
    bool sanitized = false;
};

/**
 * One reading frame of a six-frame translation.
 * Frames are labelled 1, 2, 3 (forward) and -1, -2, -3 (reverse).
 */
struct FrameTranslation {
    int frame = 1;
    Region region;
    std::string protein;
};

}  // namespace orfkit
