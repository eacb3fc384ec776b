// Tests for codon translation: single frame, regions, six frames

#include "orfkit/translator.hpp"
#include "orfkit/errors.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace orfkit;

// 60 bp, starts with CTG (a start codon in the standard table)
static const std::string EXAMPLE =
    "CTGATATCATGCATGCCATTCTCGACCGCTATGCGCCTCCTGTTCCTCGTGGGCCCAAAA";

template <typename E, typename Fn>
static bool throws(Fn fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

void test_worked_example() {
    std::cout << "Testing worked example... ";
    Translator t;

    TranslateOptions partial;
    partial.partial5 = true;
    assert(t.translate(EXAMPLE, partial) == "LISCMPFSTAMRLLFLVGPK");

    // Leading start codon becomes M
    assert(t.translate(EXAMPLE) == "MISCMPFSTAMRLLFLVGPK");

    TranslateOptions reverse;
    reverse.strand = -1;
    assert(t.translate(EXAMPLE, reverse) == "FWAHEEQEAHSGREWHA*YQ");
    std::cout << "PASSED\n";
}

void test_regions() {
    std::cout << "Testing region translation... ";
    Translator t;

    TranslateOptions opts;
    opts.lower = 3;
    opts.upper = 12;
    assert(t.translate(EXAMPLE, opts) == "ISC");

    // Trailing partial codon is dropped
    assert(t.translate("ATGAA") == "M");
    assert(t.translate("AT").empty());
    assert(t.translate("").empty());

    opts.lower = 5;
    opts.upper = 5;
    assert(t.translate(EXAMPLE, opts).empty());

    Region r{REVERSE, 28, 58};
    assert(t.translate_region(EXAMPLE, r) == "MGPRGTGGA*");
    assert(t.translate_region(EXAMPLE, r, true) == "LGPRGTGGA*");

    // Strandless regions read forward
    Region fwd{BOTH_STRANDS, 0, 9};
    assert(t.translate_region(EXAMPLE, fwd) == "MIS");
    std::cout << "PASSED\n";
}

void test_cleaning() {
    std::cout << "Testing input cleaning... ";
    Translator t;
    TranslateOptions partial;
    partial.partial5 = true;
    assert(t.translate("ctg ata\ntca", partial) == "LIS");
    assert(t.translate(">header line\nCUGAUAUCA\n", partial) == "LIS");

    // Bounds apply to the cleaned sequence
    TranslateOptions bounded;
    bounded.lower = 3;
    bounded.upper = 6;
    assert(t.translate("AAA--TAA", bounded) == "*");

    TranslateOptions sanitized;
    sanitized.sanitized = true;
    sanitized.partial5 = true;
    assert(t.translate("CTGATATCA", sanitized) == "LIS");
    std::cout << "PASSED\n";
}

void test_degenerate_translation() {
    std::cout << "Testing degenerate codons... ";
    Translator t;
    assert(t.translate("ATGNNNTAR") == "MX*");
    assert(t.translate("GAYRAYSARMTT") == "DBZJ");
    // A degenerate first codon is M only if every reading is a start
    assert(t.translate("YTGAAA") == "MK");
    assert(t.translate("NTGAAA") == "XK");
    assert(t.translate("ATGAAA", TranslateOptions{FORWARD, 0, std::nullopt, false, false}) == "MK");
    std::cout << "PASSED\n";
}

void test_other_tables() {
    std::cout << "Testing non-standard tables... ";
    Translator mito(2);
    assert(mito.table().id() == 2);
    assert(mito.translate("TGAAGA") == "W*");

    Translator bact(11);
    assert(bact.translate("GTGGTG") == "MV");
    assert(Translator(1).translate("GTGGTG") == "VV");

    assert(throws<UnknownTableId>([] { Translator bad(99); }));
    assert(throws<Error>([] { Translator bad{std::shared_ptr<const GeneticCode>()}; }));

    auto custom = GeneticCode::custom(500, "Stops only", std::string(64, '*'), std::string(64, '-'));
    Translator stops(custom);
    assert(stops.translate("ACGTTT") == "**");
    std::cout << "PASSED\n";
}

void test_errors() {
    std::cout << "Testing translation errors... ";
    Translator t;
    assert(throws<InvalidStrand>([&] {
        TranslateOptions o;
        o.strand = 0;
        t.translate("ATG", o);
    }));
    assert(throws<InvalidCoordinates>([&] {
        TranslateOptions o;
        o.lower = 4;
        t.translate("ATG", o);
    }));
    assert(throws<InvalidCoordinates>([&] {
        TranslateOptions o;
        o.upper = 10;
        t.translate("ATGAAA", o);
    }));
    assert(throws<InvalidCoordinates>([&] {
        TranslateOptions o;
        o.lower = 4;
        o.upper = 2;
        t.translate("ATGAAA", o);
    }));
    // Checked after cleaning: 5 bases remain
    assert(throws<InvalidCoordinates>([&] {
        TranslateOptions o;
        o.upper = 6;
        t.translate("AT-G-AA", o);
    }));
    std::cout << "PASSED\n";
}

void test_six_frames() {
    std::cout << "Testing six-frame translation... ";
    Translator t;
    auto frames = t.translate6(EXAMPLE);
    assert(frames.size() == 6);

    const int labels[] = {1, 2, 3, -1, -2, -3};
    for (size_t i = 0; i < 6; ++i) assert(frames[i].frame == labels[i]);

    assert(frames[0].protein == "LISCMPFSTAMRLLFLVGPK");
    assert(frames[1].protein == "*YHACHSRPLCASCSSWAQ");
    assert(frames[2].protein == "DIMHAILDRYAPPVPRGPK");
    assert(frames[3].protein == "FWAHEEQEAHSGREWHA*YQ");
    assert(frames[4].protein == "FGPTRNRRRIAVENGMHDI");
    assert(frames[5].protein == "LGPRGTGGA*RSRMACMIS");

    assert((frames[1].region == Region{FORWARD, 1, 58}));
    assert((frames[4].region == Region{REVERSE, 2, 59}));
    for (const auto& f : frames) assert(f.region.phase() == 0);

    auto tiny = t.translate6("AC");
    assert(tiny.size() == 6);
    for (const auto& f : tiny) assert(f.protein.empty());
    std::cout << "PASSED\n";
}

void test_codon_queries() {
    std::cout << "Testing codon lists and find... ";
    Translator t;
    assert((t.codons("*") == std::vector<std::string>{"TAA", "TAG", "TGA"}));
    assert((t.codons("lower", -1) == std::vector<std::string>{"TTA", "TCA", "CTA"}));
    assert((t.codons("start") == std::vector<std::string>{"TTG", "CTG", "ATG"}));
    assert(throws<InvalidResidue>([&] { t.codons("xyz"); }));

    // Every offset is tested: A[TGA]AA is a stop out of frame
    assert((t.find("ATGAAATAGTGA", "*") == std::vector<size_t>{1, 6, 9}));
    assert((t.find("ATGAAATAGTGA", "start") == std::vector<size_t>{0}));
    assert(t.find("ATGAAATAGTGA", "*", -1).empty());
    assert((t.find("atg aaa tag", "*") == std::vector<size_t>{1, 6}));
    assert((t.find("TTACTA", "*", -1) == std::vector<size_t>{0, 3}));
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== Translator Tests ===\n\n";
    test_worked_example();
    test_regions();
    test_cleaning();
    test_degenerate_translation();
    test_other_tables();
    test_errors();
    test_six_frames();
    test_codon_queries();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
