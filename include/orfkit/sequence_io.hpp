#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace orfkit {

/**
 * Sequence record from a FASTA/FASTQ file
 */
struct SequenceRecord {
    std::string id;
    std::string description;
    std::string sequence;
    std::string quality;  // Only for FASTQ
};

/**
 * FASTA/FASTQ file reader
 *
 * Supports:
 * - Uncompressed and gzip-compressed files (by ".gz" suffix)
 * - "-" for standard input
 * - Multi-line FASTA records
 */
class SequenceReader {
public:
    enum class Format { FASTA, FASTQ, UNKNOWN };

    // Throws std::runtime_error if the file cannot be opened
    explicit SequenceReader(const std::string& filename);
    ~SequenceReader();

    /**
     * Read next sequence
     * Returns false when end of file is reached
     */
    bool read_next(SequenceRecord& record);

    void for_each(const std::function<void(const SequenceRecord&)>& callback);

    std::vector<SequenceRecord> read_all();

    bool is_open() const;
    Format get_format() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * FASTA writer
 *
 * Output ending in ".gz" is gzip-compressed through zlib; "-" writes to
 * standard output. Sequence lines are wrapped at line_width columns
 * (0 disables wrapping).
 */
class FastaWriter {
public:
    explicit FastaWriter(const std::string& filename, size_t line_width = 60);
    ~FastaWriter();

    void write_sequence(const std::string& id,
                        const std::string& description,
                        const std::string& sequence);

    void write(const SequenceRecord& record) {
        write_sequence(record.id, record.description, record.sequence);
    }

    void close();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace orfkit
