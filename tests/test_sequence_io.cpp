// Tests for FASTA/FASTQ reading and FASTA writing, plain and gzip

#include "orfkit/sequence_io.hpp"

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <zlib.h>

using namespace orfkit;

static std::string tmpdir;

static std::string path(const std::string& name) {
    return tmpdir + "/" + name;
}

static void write_text(const std::string& file, const std::string& text) {
    std::ofstream ofs(file);
    ofs << text;
}

static void write_gz(const std::string& file, const std::string& text) {
    gzFile gz = gzopen(file.c_str(), "wb");
    assert(gz != nullptr);
    assert(gzwrite(gz, text.data(), static_cast<unsigned>(text.size())) ==
           static_cast<int>(text.size()));
    gzclose(gz);
}

static std::string read_text(const std::string& file) {
    std::ifstream ifs(file);
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

static const std::string FASTA =
    ">seq1 first record\n"
    "ACGTACGT\n"
    "TTTT\n"
    "\n"
    ">seq2\n"
    "GGGG\r\n"
    ">empty\n"
    ">seq3\tdesc with tab\n"
    "AC\n";

static void check_fasta_records(SequenceReader& reader) {
    assert(reader.is_open());
    assert(reader.get_format() == SequenceReader::Format::FASTA);
    auto records = reader.read_all();
    assert(records.size() == 4);
    assert(records[0].id == "seq1");
    assert(records[0].description == "first record");
    assert(records[0].sequence == "ACGTACGTTTTT");
    assert(records[1].id == "seq2");
    assert(records[1].description.empty());
    assert(records[1].sequence == "GGGG");
    assert(records[2].id == "empty");
    assert(records[2].sequence.empty());
    assert(records[3].id == "seq3");
    assert(records[3].description == "desc with tab");
    assert(records[3].sequence == "AC");
}

void test_plain_fasta() {
    std::cout << "Testing plain FASTA... ";
    write_text(path("in.fa"), FASTA);
    SequenceReader reader(path("in.fa"));
    check_fasta_records(reader);
    std::cout << "PASSED\n";
}

void test_gzip_fasta() {
    std::cout << "Testing gzip FASTA... ";
    write_gz(path("in.fa.gz"), FASTA);
    SequenceReader reader(path("in.fa.gz"));
    check_fasta_records(reader);
    std::cout << "PASSED\n";
}

void test_long_lines() {
    std::cout << "Testing lines longer than the read buffer... ";
    std::string seq(200000, 'A');
    seq[123456] = 'C';
    write_gz(path("long.fa.gz"), ">long\n" + seq + "\n>next\nGG\n");
    SequenceReader reader(path("long.fa.gz"));
    SequenceRecord rec;
    assert(reader.read_next(rec));
    assert(rec.id == "long");
    assert(rec.sequence == seq);
    assert(reader.read_next(rec));
    assert(rec.id == "next" && rec.sequence == "GG");
    assert(!reader.read_next(rec));
    std::cout << "PASSED\n";
}

void test_fastq() {
    std::cout << "Testing FASTQ... ";
    write_text(path("in.fq"), "@r1 lane1\nACGT\n+\nIIII\n@r2\nTTAA\n+\n!!!!\n");
    SequenceReader reader(path("in.fq"));
    assert(reader.get_format() == SequenceReader::Format::FASTQ);
    size_t count = 0;
    reader.for_each([&](const SequenceRecord& r) {
        if (count == 0) {
            assert(r.id == "r1" && r.description == "lane1");
            assert(r.sequence == "ACGT" && r.quality == "IIII");
        } else {
            assert(r.id == "r2" && r.sequence == "TTAA" && r.quality == "!!!!");
        }
        ++count;
    });
    assert(count == 2);

    write_text(path("trunc.fq"), "@r1\nACGT\n+\n");
    SequenceReader truncated(path("trunc.fq"));
    SequenceRecord rec;
    bool threw = false;
    try {
        truncated.read_next(rec);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    std::cout << "PASSED\n";
}

void test_open_errors() {
    std::cout << "Testing open errors... ";
    bool threw = false;
    try {
        SequenceReader reader(path("missing.fa"));
    } catch (const std::runtime_error& e) {
        threw = true;
        assert(std::string(e.what()).find("missing.fa") != std::string::npos);
    }
    assert(threw);

    threw = false;
    try {
        FastaWriter writer(path("no_such_dir/out.fa"));
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    write_text(path("junk.txt"), "hello\n");
    SequenceReader junk(path("junk.txt"));
    assert(junk.get_format() == SequenceReader::Format::UNKNOWN);
    SequenceRecord rec;
    assert(!junk.read_next(rec));
    std::cout << "PASSED\n";
}

void test_writer_wrapping() {
    std::cout << "Testing FASTA writer... ";
    {
        FastaWriter writer(path("out.fa"), 4);
        writer.write_sequence("p1", "frame=1", "MKLVAB");
        writer.write_sequence("p2", "", "");
        SequenceRecord rec{"p3", "x y", "ABCD", ""};
        writer.write(rec);
    }
    assert(read_text(path("out.fa")) ==
           ">p1 frame=1\nMKLV\nAB\n>p2\n>p3 x y\nABCD\n");

    {
        FastaWriter writer(path("nowrap.fa"), 0);
        writer.write_sequence("p1", "", std::string(100, 'M'));
        writer.close();
        bool threw = false;
        try {
            writer.write_sequence("p2", "", "M");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
    }
    assert(read_text(path("nowrap.fa")) == ">p1\n" + std::string(100, 'M') + "\n");
    std::cout << "PASSED\n";
}

void test_writer_gzip_round_trip() {
    std::cout << "Testing gzip FASTA output... ";
    {
        FastaWriter writer(path("out.faa.gz"));
        writer.write_sequence("a", "desc", std::string(130, 'K'));
        writer.write_sequence("b", "", "MW*");
    }
    SequenceReader reader(path("out.faa.gz"));
    auto records = reader.read_all();
    assert(records.size() == 2);
    assert(records[0].id == "a" && records[0].description == "desc");
    assert(records[0].sequence == std::string(130, 'K'));
    assert(records[1].sequence == "MW*");
    std::cout << "PASSED\n";
}

int main() {
    char tmp_template[] = "/tmp/orfkit_io_XXXXXX";
    char* tmp = mkdtemp(tmp_template);
    if (!tmp) {
        std::cerr << "Failed to create temp dir\n";
        return 2;
    }
    tmpdir = tmp;

    std::cout << "\n=== Sequence I/O Tests ===\n\n";
    test_plain_fasta();
    test_gzip_fasta();
    test_long_lines();
    test_fastq();
    test_open_errors();
    test_writer_wrapping();
    test_writer_gzip_round_trip();

    std::string cleanup = "rm -rf '" + tmpdir + "'";
    if (std::system(cleanup.c_str()) != 0) {
        std::cerr << "Warning: could not remove " << tmpdir << "\n";
    }
    std::cout << "\nAll tests passed!\n";
    return 0;
}
