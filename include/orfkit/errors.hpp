#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace orfkit {

// Base class for every error raised by the translation engine.
// All of them are local to a single call; nothing is retried.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Requested genetic-code id is not registered
class UnknownTableId : public Error {
public:
    explicit UnknownTableId(int id)
        : Error("Unknown genetic code table id: " + std::to_string(id)), id_(id) {}

    // Lookup by name; id() is 0
    explicit UnknownTableId(const std::string& name)
        : Error("Unknown genetic code table: " + name), id_(0) {}

    int id() const { return id_; }

private:
    int id_;
};

// Custom table definition is malformed (length, symbols)
class InvalidTableDefinition : public Error {
public:
    using Error::Error;
};

// Region bounds outside the sequence, or upper < lower
class InvalidCoordinates : public Error {
public:
    using Error::Error;
};

// Strand value outside {-1, 0, 1} (or 0 where a concrete strand is needed)
class InvalidStrand : public Error {
public:
    explicit InvalidStrand(int strand)
        : Error("Invalid strand: " + std::to_string(strand)), strand_(strand) {}

    int strand() const { return strand_; }

private:
    int strand_;
};

// Residue key is neither an amino-acid symbol nor start/lower/upper
class InvalidResidue : public Error {
public:
    using Error::Error;
};

// Raised by validate_dna() only; clean_dna() silently drops bad symbols
class InvalidSequenceSymbol : public Error {
public:
    InvalidSequenceSymbol(char symbol, size_t offset)
        : Error(std::string("Invalid nucleotide symbol '") + symbol +
                "' at offset " + std::to_string(offset)),
          symbol_(symbol), offset_(offset) {}

    char symbol() const { return symbol_; }
    size_t offset() const { return offset_; }

private:
    char symbol_;
    size_t offset_;
};

}  // namespace orfkit
