/**
 * ORF / CDS search
 *
 * Both searches walk the sequence once per strand, keeping for each of the
 * three frames (relative to the scan's lower bound) the position where the
 * currently open region began. Boundaries come from the table's codon
 * matchers; reverse-strand codons are matched in place on the forward text,
 * so coordinates never need to be flipped.
 */

#include "orfkit/translator.hpp"
#include "orfkit/errors.hpp"

#include <array>
#include <cstdint>

namespace orfkit {

namespace {

struct ScanBounds {
    size_t lower;
    size_t upper;
};

ScanBounds resolve_bounds(std::string_view seq, const SearchConfig& config) {
    if (!is_valid_strand(config.strand)) throw InvalidStrand(config.strand);

    ScanBounds b{config.lower, config.upper.value_or(seq.size())};
    if (b.lower > seq.size()) {
        throw InvalidCoordinates("Lower bound " + std::to_string(b.lower) +
                                 " exceeds sequence length " + std::to_string(seq.size()));
    }
    if (b.upper > seq.size()) {
        throw InvalidCoordinates("Upper bound " + std::to_string(b.upper) +
                                 " exceeds sequence length " + std::to_string(seq.size()));
    }
    return b;
}

std::vector<int> strands_to_search(int strand) {
    if (strand == BOTH_STRANDS) return {REVERSE, FORWARD};
    return {strand};
}

// Longest region seen so far; replaced only by a strictly longer one
struct Longest {
    Region region;
    int64_t length;

    void offer(int strand, size_t lower, size_t upper) {
        int64_t len = static_cast<int64_t>(upper) - static_cast<int64_t>(lower);
        if (len > length) {
            region = Region{strand, lower, upper};
            length = len;
        }
    }
};

}  // namespace

std::vector<size_t> Translator::find(std::string_view seq, std::string_view key,
                                     int strand, bool sanitized) const {
    std::string buffer;
    std::string_view s = prepare(seq, sanitized, buffer);
    return table_->matcher(key, strand).find_all(s);
}

std::optional<Region> Translator::get_orf(std::string_view seq, const SearchConfig& config) const {
    std::string buffer;
    std::string_view s = prepare(seq, config.sanitized, buffer);
    const ScanBounds b = resolve_bounds(s, config);
    if (b.upper < b.lower) return std::nullopt;

    Longest best{Region{BOTH_STRANDS, b.lower, b.lower}, 0};

    for (int strand : strands_to_search(config.strand)) {
        std::array<size_t, 3> lowers = {b.lower, b.lower + 1, b.lower + 2};
        const CodonMatcher& stop = table_->matcher("*", strand);

        // Every stop closes the region open in its frame and opens the next
        auto close_at = [&](size_t candidate) {
            size_t frame = (candidate - b.lower) % 3;
            best.offer(strand, lowers[frame], candidate);
            lowers[frame] = candidate;
        };

        for (size_t p = b.lower; p + 3 <= s.size(); ++p) {
            if (!stop.matches_at(s.data() + p)) continue;

            // Forward regions include their stop codon
            size_t candidate = p + (strand == FORWARD ? 3 : 0);
            if (candidate > b.upper) break;
            close_at(candidate);
        }

        // Frames running off the end, cut at the last whole codon
        for (size_t i = 0; i < 3; ++i) {
            if (b.upper < b.lower + i) break;
            close_at(b.upper - i);
        }
    }

    if (best.length <= 0) return std::nullopt;
    return best.region;
}

std::optional<Region> Translator::get_cds(std::string_view seq, const SearchConfig& config) const {
    if (config.strict < 0 || config.strict > 2) {
        throw Error("Invalid strict level: " + std::to_string(config.strict));
    }

    std::string buffer;
    std::string_view s = prepare(seq, config.sanitized, buffer);
    const ScanBounds b = resolve_bounds(s, config);
    if (b.upper < b.lower) return std::nullopt;

    const int strict = config.strict;
    Longest best{Region{BOTH_STRANDS, 0, 0}, -1};

    for (int strand : strands_to_search(config.strand)) {
        const CodonMatcher& lower_codon = table_->matcher("lower", strand);
        const CodonMatcher& upper_codon = table_->matcher("upper", strand);

        // Forward frames start closed unless strict is 0; reverse frames
        // start open (running off the 3' end) unless strict is 2.
        bool seed_open = !((strand == FORWARD && strict != 0) ||
                           (strand == REVERSE && strict == 2));

        std::array<std::optional<size_t>, 3> lowers;
        if (seed_open) {
            for (size_t f = 0; f < 3; ++f) lowers[f] = b.lower + f;
        }

        auto close_at = [&](size_t candidate) {
            size_t frame = (candidate - b.lower) % 3;
            if (!lowers[frame]) return;
            best.offer(strand, *lowers[frame], candidate);
            // A forward CDS has to start over after its stop
            if (strand == FORWARD) lowers[frame].reset();
        };

        for (size_t p = b.lower; p + 3 <= s.size(); ++p) {
            if (p > b.upper) break;

            const char* window = s.data() + p;
            size_t frame = (p - b.lower) % 3;

            if (lower_codon.matches_at(window)) {
                // Reverse strand: a stop, always moves the lower bound.
                // Forward strand: a start, internal starts keep the open one.
                if (strand == REVERSE || !lowers[frame]) lowers[frame] = p;
            } else if (upper_codon.matches_at(window)) {
                if (p + 3 > b.upper) break;
                close_at(p + 3);
            }
        }

        bool allow_runoff = !(strict == 2 || (strand == REVERSE && strict != 0));
        if (!allow_runoff) continue;

        for (size_t i = 0; i < 3; ++i) {
            if (b.upper < b.lower + i) break;
            close_at(b.upper - i);
        }
    }

    if (best.length <= 0) return std::nullopt;
    return best.region;
}

std::vector<int> Translator::nonstop(std::string_view seq, const SearchConfig& config) const {
    if (!is_valid_strand(config.strand)) throw InvalidStrand(config.strand);

    std::string buffer;
    std::string_view s = prepare(seq, config.sanitized, buffer);
    const int64_t len = static_cast<int64_t>(s.size());

    std::vector<int> frames;
    const std::vector<int> strands = config.strand == BOTH_STRANDS
        ? std::vector<int>{FORWARD, REVERSE}
        : std::vector<int>{config.strand};

    for (int strand : strands) {
        const CodonMatcher& stop = table_->matcher("*", strand);

        for (int64_t f = 0; f < 3; ++f) {
            bool has_stop = false;
            if (strand == FORWARD) {
                for (int64_t p = f; p + 3 <= len && !has_stop; p += 3) {
                    has_stop = stop.matches_at(s.data() + p);
                }
            } else {
                for (int64_t p = len - f - 3; p >= 0 && !has_stop; p -= 3) {
                    has_stop = stop.matches_at(s.data() + p);
                }
            }
            if (!has_stop) frames.push_back(static_cast<int>(f + 1) * strand);
        }
    }
    return frames;
}

}  // namespace orfkit
