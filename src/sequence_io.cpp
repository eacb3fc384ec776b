#include "orfkit/sequence_io.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <zlib.h>

namespace orfkit {

// Large I/O buffer for zlib streams
constexpr size_t GZBUF_SIZE = 4 * 1024 * 1024;

static bool has_gz_suffix(const std::string& filename) {
    return filename.size() > 3 && filename.compare(filename.size() - 3, 3, ".gz") == 0;
}

static void split_header(const std::string& line, SequenceRecord& record) {
    const char* hdr = line.c_str() + 1;  // Skip '>' or '@'
    const char* space = std::strpbrk(hdr, " \t");
    if (space) {
        record.id.assign(hdr, space - hdr);
        record.description.assign(space + 1);
    } else {
        record.id.assign(hdr);
        record.description.clear();
    }
}

// SequenceReader implementation
class SequenceReader::Impl {
public:
    std::ifstream file_;
    std::istream* in_ = nullptr;
    gzFile gz_file_ = nullptr;
    Format format_ = Format::UNKNOWN;
    bool is_gzipped_ = false;
    char buffer_[65536];
    std::string lookahead_line_;  // Next FASTA header, read past the record
    bool has_lookahead_ = false;

    bool open(const std::string& filename) {
        if (has_gz_suffix(filename)) {
            is_gzipped_ = true;
            gz_file_ = gzopen(filename.c_str(), "rb");
            if (!gz_file_) return false;
            gzbuffer(gz_file_, GZBUF_SIZE);

            int c = gzgetc(gz_file_);
            if (c != -1) gzungetc(c, gz_file_);
            format_ = detect(c);
            return true;
        }

        if (filename == "-") {
            in_ = &std::cin;
        } else {
            file_.open(filename);
            if (!file_) return false;
            in_ = &file_;
        }
        format_ = detect(in_->peek());
        return true;
    }

    static Format detect(int c) {
        return c == '>' ? Format::FASTA :
               c == '@' ? Format::FASTQ : Format::UNKNOWN;
    }

    // One line without its terminator. Lines longer than the buffer are
    // joined from successive gzgets() calls.
    bool getline(std::string& line) {
        if (!is_gzipped_) {
            if (!std::getline(*in_, line)) return false;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }

        line.clear();
        bool got_any = false;
        while (gzgets(gz_file_, buffer_, sizeof(buffer_))) {
            got_any = true;
            size_t len = std::strlen(buffer_);
            bool complete = len > 0 && buffer_[len - 1] == '\n';
            if (complete) len--;
            line.append(buffer_, len);
            if (complete) break;
        }
        if (!got_any) {
            int errnum = 0;
            const char* msg = gzerror(gz_file_, &errnum);
            if (errnum != Z_OK && errnum != Z_BUF_ERROR) {
                throw std::runtime_error(std::string("gzip read error: ") + msg);
            }
            return false;
        }
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return true;
    }

    bool is_open() const {
        return is_gzipped_ ? gz_file_ != nullptr : in_ != nullptr;
    }

    void close() {
        if (gz_file_) {
            gzclose(gz_file_);
            gz_file_ = nullptr;
        }
        if (file_.is_open()) file_.close();
    }

    ~Impl() {
        close();
    }
};

SequenceReader::SequenceReader(const std::string& filename)
    : impl_(std::make_unique<Impl>()) {
    if (!impl_->open(filename)) {
        throw std::runtime_error("Failed to open file: " + filename);
    }
}

SequenceReader::~SequenceReader() = default;

bool SequenceReader::read_next(SequenceRecord& record) {
    std::string line;

    if (impl_->format_ == Format::FASTA) {
        if (impl_->has_lookahead_) {
            line = std::move(impl_->lookahead_line_);
            impl_->has_lookahead_ = false;
        } else if (!impl_->getline(line)) {
            return false;
        }

        while (line.empty()) {
            if (!impl_->getline(line)) return false;
        }
        if (line[0] != '>') {
            throw std::runtime_error("Malformed FASTA: expected '>' header, got: " +
                                     line.substr(0, 40));
        }
        split_header(line, record);
        record.quality.clear();

        record.sequence.clear();
        while (impl_->getline(line)) {
            if (line.empty()) continue;
            if (line[0] == '>') {
                impl_->lookahead_line_ = std::move(line);
                impl_->has_lookahead_ = true;
                break;
            }
            record.sequence += line;
        }
        return true;
    }

    if (impl_->format_ == Format::FASTQ) {
        // 4 lines per record
        do {
            if (!impl_->getline(line)) return false;
        } while (line.empty());
        if (line[0] != '@') {
            throw std::runtime_error("Malformed FASTQ: expected '@' header, got: " +
                                     line.substr(0, 40));
        }
        split_header(line, record);

        if (!impl_->getline(record.sequence) ||
            !impl_->getline(line) ||
            !impl_->getline(record.quality)) {
            throw std::runtime_error("Truncated FASTQ record: " + record.id);
        }
        return true;
    }

    return false;
}

void SequenceReader::for_each(const std::function<void(const SequenceRecord&)>& callback) {
    SequenceRecord record;
    while (read_next(record)) {
        callback(record);
    }
}

std::vector<SequenceRecord> SequenceReader::read_all() {
    std::vector<SequenceRecord> records;
    SequenceRecord record;
    while (read_next(record)) {
        records.push_back(record);
    }
    return records;
}

bool SequenceReader::is_open() const {
    return impl_->is_open();
}

SequenceReader::Format SequenceReader::get_format() const {
    return impl_->format_;
}

// FastaWriter implementation
class FastaWriter::Impl {
public:
    std::ofstream file_;
    std::ostream* out_ = nullptr;
    gzFile gz_file_ = nullptr;
    size_t line_width_ = 60;

    void write(const char* data, size_t len) {
        if (gz_file_) {
            if (len > 0 && gzwrite(gz_file_, data, static_cast<unsigned>(len)) == 0) {
                int errnum = 0;
                throw std::runtime_error(std::string("gzip write error: ") +
                                         gzerror(gz_file_, &errnum));
            }
        } else {
            out_->write(data, static_cast<std::streamsize>(len));
        }
    }

    void write(const std::string& str) {
        write(str.data(), str.size());
    }

    void close() {
        if (gz_file_) {
            gzclose(gz_file_);
            gz_file_ = nullptr;
        } else if (file_.is_open()) {
            file_.close();
        } else if (out_) {
            out_->flush();
        }
        out_ = nullptr;
    }
};

FastaWriter::FastaWriter(const std::string& filename, size_t line_width)
    : impl_(std::make_unique<Impl>()) {
    impl_->line_width_ = line_width;

    if (filename == "-") {
        impl_->out_ = &std::cout;
        return;
    }

    if (has_gz_suffix(filename)) {
        impl_->gz_file_ = gzopen(filename.c_str(), "wb");
        if (!impl_->gz_file_) {
            throw std::runtime_error("Failed to open FASTA file: " + filename);
        }
        gzbuffer(impl_->gz_file_, GZBUF_SIZE);
        return;
    }

    impl_->file_.open(filename);
    if (!impl_->file_) {
        throw std::runtime_error("Failed to open FASTA file: " + filename);
    }
    impl_->out_ = &impl_->file_;
}

FastaWriter::~FastaWriter() {
    if (impl_) impl_->close();
}

void FastaWriter::write_sequence(const std::string& id,
                                 const std::string& description,
                                 const std::string& sequence) {
    if (!impl_->gz_file_ && !impl_->out_) {
        throw std::runtime_error("FASTA writer is closed");
    }

    impl_->write(">", 1);
    impl_->write(id);
    if (!description.empty()) {
        impl_->write(" ", 1);
        impl_->write(description);
    }
    impl_->write("\n", 1);

    const size_t width = impl_->line_width_ == 0 ? sequence.size() : impl_->line_width_;
    for (size_t i = 0; i < sequence.size(); i += width) {
        size_t line_len = std::min(width, sequence.size() - i);
        impl_->write(sequence.data() + i, line_len);
        impl_->write("\n", 1);
    }
}

void FastaWriter::close() {
    impl_->close();
}

}  // namespace orfkit
