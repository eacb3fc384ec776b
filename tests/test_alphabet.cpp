// Tests for nucleotide cleaning, complements and amino acid tables

#include "orfkit/alphabet.hpp"
#include "orfkit/errors.hpp"

#include <cassert>
#include <cstring>
#include <iostream>
#include <string>

using namespace orfkit;

void test_clean_dna() {
    std::cout << "Testing clean_dna... ";
    assert(clean_dna("acgt") == "ACGT");
    assert(clean_dna("AC GT\nAC\r\nGT") == "ACGTACGT");
    assert(clean_dna("ACGU") == "ACGT");
    assert(clean_dna("AC-GT*12XN") == "ACGTN");
    assert(clean_dna(">seq1 some description\nACGT\nTTAA\n") == "ACGTTTAA");
    assert(clean_dna(">a\nAAA\n>b\nCCC") == "AAACCC");
    // '>' inside a line is just a dropped symbol
    assert(clean_dna("AC>GT") == "ACGT");
    assert(clean_dna("rykmswbdhvn") == "RYKMSWBDHVN");
    assert(clean_dna("").empty());
    std::cout << "PASSED\n";
}

void test_clean_dna_idempotent() {
    std::cout << "Testing clean_dna idempotence... ";
    const std::string inputs[] = {
        ">x\nacgu nnRY\n\n", "A-C-G-T", random_dna(500, 3), "u>u\n>uu\nuu", "12345",
    };
    for (const auto& s : inputs) {
        std::string once = clean_dna(s);
        assert(clean_dna(once) == once);
    }
    std::cout << "PASSED\n";
}

void test_validate_dna() {
    std::cout << "Testing validate_dna... ";
    validate_dna("ACGTNRYacgtu");
    bool threw = false;
    try {
        validate_dna("ACGTXA");
    } catch (const InvalidSequenceSymbol& e) {
        threw = true;
        assert(e.symbol() == 'X');
        assert(e.offset() == 4);
    }
    assert(threw);

    threw = false;
    try {
        validate_dna("AC GT");
    } catch (const Error& e) {
        threw = true;
        assert(std::string(e.what()).find("offset 2") != std::string::npos);
    }
    assert(threw);
    std::cout << "PASSED\n";
}

void test_reverse_complement() {
    std::cout << "Testing reverse_complement... ";
    assert(reverse_complement("ACGT") == "ACGT");
    assert(reverse_complement("AAACCC") == "GGGTTT");
    assert(reverse_complement("acgN") == "Ncgt");
    assert(reverse_complement("MRWSYKVHDBN") == "NVHDBMRSWYK");
    assert(reverse_complement("").empty());

    std::string seq = random_dna(200, 11);
    assert(reverse_complement(reverse_complement(seq)) == seq);
    std::cout << "PASSED\n";
}

void test_expand_base() {
    std::cout << "Testing expand_base... ";
    assert(expand_base('A') == "A");
    assert(expand_base('u') == "T");
    assert(expand_base('R') == "AG");
    assert(expand_base('Y') == "CT");
    assert(expand_base('N') == "ACGT");
    assert(expand_base('B') == "CGT");
    assert(expand_base('X').empty());
    assert(is_degenerate('n'));
    assert(!is_degenerate('A'));
    assert(is_nucleotide('u'));
    assert(!is_nucleotide('X'));
    std::cout << "PASSED\n";
}

void test_codon_index() {
    std::cout << "Testing codon indexing... ";
    assert(codon_to_idx('T', 'T', 'T') == 0);
    assert(codon_to_idx('A', 'T', 'G') == 35);
    assert(codon_to_idx('G', 'G', 'G') == 63);
    assert(codon_to_idx('a', 't', 'g') == 35);
    assert(codon_to_idx('A', 'N', 'G') == -1);
    for (int i = 0; i < static_cast<int>(NUM_CODONS); ++i) {
        std::string c = idx_to_codon(i);
        assert(codon_to_idx(c[0], c[1], c[2]) == i);
    }
    assert(mask_codon_idx('A', 'T', 'G') == ((0x4 << 8) | (0x1 << 4) | 0x8));
    assert(mask_codon_idx('A', 'X', 'G') == -1);
    std::cout << "PASSED\n";
}

void test_random_dna() {
    std::cout << "Testing random_dna... ";
    assert(random_dna().size() == 100);
    assert(random_dna(0).empty());
    std::string a = random_dna(1000, 42);
    assert(a == random_dna(1000, 42));
    assert(a != random_dna(1000, 43));
    assert(a.find_first_not_of("ACGT") == std::string::npos);
    assert(clean_dna(a) == a);
    std::cout << "PASSED\n";
}

void test_amino_acids() {
    std::cout << "Testing amino acid tables... ";
    assert(ambiguous_residue("K") == 'K');
    assert(ambiguous_residue("KK") == 'K');
    assert(ambiguous_residue("DN") == 'B');
    assert(ambiguous_residue("IL") == 'J');
    assert(ambiguous_residue("LI") == 'J');
    assert(ambiguous_residue("QE") == 'Z');
    assert(ambiguous_residue("KN") == 'X');
    assert(ambiguous_residue("*L") == 'X');
    assert(ambiguous_residue("") == 'X');

    assert(expand_residue('B') == "DN");
    assert(expand_residue('j') == "IL");
    assert(expand_residue('Z') == "EQ");
    assert(expand_residue('A').empty());

    assert(std::strcmp(aa_abbrev('A'), "Ala") == 0);
    assert(std::strcmp(aa_abbrev('w'), "Trp") == 0);
    assert(std::strcmp(aa_abbrev('*'), "Ter") == 0);
    assert(aa_abbrev('1') == nullptr);
    for (char aa : AMINO_ACIDS) assert(aa_abbrev(aa) != nullptr);
    for (char aa : STRICT_AMINO_ACIDS) {
        assert(AMINO_ACIDS.find(aa) != std::string_view::npos);
    }
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== Alphabet Tests ===\n\n";
    test_clean_dna();
    test_clean_dna_idempotent();
    test_validate_dna();
    test_reverse_complement();
    test_expand_base();
    test_codon_index();
    test_random_dna();
    test_amino_acids();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
