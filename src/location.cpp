#include "orfkit/location.hpp"
#include "orfkit/errors.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace orfkit {

namespace {

void check_strand(const std::optional<int>& strand) {
    if (strand && !is_valid_strand(*strand)) throw InvalidStrand(*strand);
}

}  // namespace

Location::Location(size_t lower, size_t length, std::optional<int> strand, std::string source)
    : lower_(lower), length_(length), strand_(strand), source_(std::move(source)) {
    check_strand(strand_);
}

Location Location::e53(size_t end5, size_t end3, std::string source) {
    if (end5 == 0 || end3 == 0) {
        throw InvalidCoordinates("5'/3' ends are 1-based: got " + std::to_string(end5) +
                                 ", " + std::to_string(end3));
    }
    if (end5 < end3) return Location(end5 - 1, end3 - end5 + 1, FORWARD, std::move(source));
    if (end3 < end5) return Location(end3 - 1, end5 - end3 + 1, REVERSE, std::move(source));
    return Location(end5 - 1, 1, std::nullopt, std::move(source));
}

Location Location::lus(size_t lower, size_t upper, std::optional<int> strand,
                       std::string source) {
    if (upper < lower) {
        throw InvalidCoordinates("Upper bound " + std::to_string(upper) +
                                 " is below lower bound " + std::to_string(lower));
    }
    return Location(lower, upper - lower, strand, std::move(source));
}

Location Location::ul(size_t upper, size_t length, std::optional<int> strand,
                      std::string source) {
    if (length > upper) {
        throw InvalidCoordinates("Length " + std::to_string(length) +
                                 " exceeds upper bound " + std::to_string(upper));
    }
    return Location(upper - length, length, strand, std::move(source));
}

Location Location::from_region(const Region& region, std::string source) {
    std::optional<int> strand;
    if (region.strand != BOTH_STRANDS) strand = region.strand;
    return lus(region.lower, region.upper, strand, std::move(source));
}

size_t Location::end5() const {
    return strand_ == REVERSE ? upper() : lower_ + 1;
}

size_t Location::end3() const {
    return strand_ == REVERSE ? lower_ + 1 : upper();
}

void Location::set_strand(std::optional<int> strand) {
    check_strand(strand);
    strand_ = strand;
}

Location& Location::extend(int64_t lower_by, int64_t upper_by) {
    const int64_t new_lower = static_cast<int64_t>(lower_) - lower_by;
    const int64_t new_upper = static_cast<int64_t>(upper()) + upper_by;
    if (new_lower < 0 || new_upper < new_lower) {
        throw InvalidCoordinates("Cannot extend " + to_string(0) + " by (" +
                                 std::to_string(lower_by) + ", " + std::to_string(upper_by) + ")");
    }
    lower_ = static_cast<size_t>(new_lower);
    length_ = static_cast<size_t>(new_upper - new_lower);
    return *this;
}

bool Location::contains(size_t point) const {
    return lower_ <= point && point <= upper();
}

bool Location::overlaps(const Location& other) const {
    return lower_ < other.upper() && upper() > other.lower_;
}

bool Location::outside(const Location& other) const {
    return lower_ <= other.lower_ && upper() >= other.upper();
}

std::optional<Location> Location::intersection(const Location& other) const {
    if (!overlaps(other)) return std::nullopt;

    size_t lower = std::max(lower_, other.lower_);
    size_t upper = std::min(this->upper(), other.upper());
    std::optional<int> strand;
    if (strand_ == other.strand_) strand = strand_;
    std::string source;
    if (source_ == other.source_) source = source_;
    return Location(lower, upper - lower, strand, std::move(source));
}

std::string_view Location::sequence(std::string_view seq) const {
    if (seq.size() < upper()) {
        throw InvalidCoordinates("Location " + to_string(0) +
                                 " not contained in sequence of length " +
                                 std::to_string(seq.size()));
    }
    return seq.substr(lower_, length_);
}

std::string Location::to_string(int width) const {
    std::ostringstream oss;
    if (!source_.empty()) oss << source_ << ' ';
    oss << "[ " << std::setw(width) << lower_ << ' ' << std::setw(width) << upper() << ' ';
    if (strand_) {
        oss << std::setw(2) << *strand_;
    } else {
        oss << std::setw(2) << ' ';
    }
    oss << " ]";
    return oss.str();
}

std::string Location::to_string_53(int width) const {
    std::ostringstream oss;
    if (!source_.empty()) oss << source_ << ' ';
    oss << "<5' " << std::setw(width) << end5() << ' ' << std::setw(width) << end3() << " 3'>";
    return oss.str();
}

Region Location::to_region() const {
    return Region{strand_.value_or(BOTH_STRANDS), lower_, upper()};
}

}  // namespace orfkit
