#pragma once

#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace orfkit {

/**
 * Located interval on a named source sequence: 0-based lower bound,
 * length, optional strand. The source is free text (a record id) and may
 * be empty.
 *
 * Converts between the half-open [lower, upper) coordinates the engine
 * works in and 1-based inclusive 5'/3' ends:
 *
 *   e53(4, 9)  -> lower 3, length 6, strand +1
 *   e53(9, 4)  -> lower 3, length 6, strand -1
 *   e53(4, 4)  -> lower 3, length 1, strand unknown
 */
class Location {
public:
    Location() = default;
    Location(size_t lower, size_t length, std::optional<int> strand = std::nullopt,
             std::string source = {});

    // 1-based inclusive ends; both must be >= 1. Throws InvalidCoordinates.
    static Location e53(size_t end5, size_t end3, std::string source = {});

    // Throws InvalidCoordinates if upper < lower, InvalidStrand if strand is not -1/0/1
    static Location lus(size_t lower, size_t upper, std::optional<int> strand = std::nullopt,
                        std::string source = {});

    // Interval ending at upper. Throws InvalidCoordinates if length > upper.
    static Location ul(size_t upper, size_t length, std::optional<int> strand = std::nullopt,
                       std::string source = {});

    static Location from_region(const Region& region, std::string source = {});

    const std::string& source() const { return source_; }
    void set_source(std::string source) { source_ = std::move(source); }

    size_t lower() const { return lower_; }
    size_t upper() const { return lower_ + length_; }
    size_t length() const { return length_; }
    std::optional<int> strand() const { return strand_; }
    size_t phase() const { return length_ % 3; }

    size_t end5() const;
    size_t end3() const;

    void set_strand(std::optional<int> strand);

    // Move lower down by lower_by and upper up by upper_by; negative
    // offsets shrink. Throws InvalidCoordinates (leaving the location
    // unchanged) if lower would drop below 0 or upper below lower.
    Location& extend(int64_t by) { return extend(by, by); }
    Location& extend(int64_t lower_by, int64_t upper_by);

    // lower <= point <= upper
    bool contains(size_t point) const;

    // Interval tests compare coordinates only, never the source
    bool overlaps(const Location& other) const;

    // This interval covers other / lies within other
    bool outside(const Location& other) const;
    bool inside(const Location& other) const { return other.outside(*this); }

    // Overlapping part; strand and source are kept only when both agree
    std::optional<Location> intersection(const Location& other) const;

    // Substring of seq. Throws InvalidCoordinates if not contained.
    std::string_view sequence(std::string_view seq) const;

    // "[ lower upper strand ]", prefixed by "source " when there is one
    std::string to_string(int width = 6) const;
    // "<5' end5 end3 3'>", prefixed the same way
    std::string to_string_53(int width = 6) const;

    // Strand 0 when unknown; the source is dropped
    Region to_region() const;

    // Same source, bounds and strand
    bool operator==(const Location& other) const = default;

private:
    size_t lower_ = 0;
    size_t length_ = 0;
    std::optional<int> strand_;
    std::string source_;
};

}  // namespace orfkit
