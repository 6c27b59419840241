#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <zlib.h>

using CSVRow = std::vector<std::string>;

struct CSVRecord {
    CSVRow fields;
    // 1-based physical line the record starts on
    int64_t line_number = 0;
    // Record text without its terminator
    std::string raw_text;
};

// Streaming reader for plain or gzip-compressed delimited text.
// Quoted fields may embed delimiters, doubled quotes and newlines.
class CSVReader {
public:
    // Parsing state
    enum class ParseState {
        START_FIELD,
        IN_UNQUOTED_FIELD,
        IN_QUOTED_FIELD,
        QUOTE_IN_QUOTED_FIELD,
        END_OF_ROW
    };

    static constexpr size_t BUFFER_SIZE = 64 * 1024;

    CSVReader(const std::string& file_path, bool has_header = true, char delimiter = ',');

    CSVReader(const CSVReader&) = delete;
    CSVReader& operator=(const CSVReader&) = delete;
    CSVReader(CSVReader&&) = delete;
    CSVReader& operator=(CSVReader&&) = delete;

    ~CSVReader();

    // Read the entire file
    std::vector<CSVRow> read_all();

    // Next data record, blank lines skipped
    std::optional<CSVRecord> read_next();

    // Header fields, empty without a header
    const CSVRow& header() const { return header_; }

    // Header width, or the width of the first record without a header
    size_t column_count() const { return column_count_; }

    // Data records returned since the last reset
    int64_t rows_read() const { return rows_read_; }

    const std::string& file_path() const { return file_path_; }

    // Reset the reading position to the beginning of the file
    void reset();

private:
    int next_char();
    bool fill_buffer();
    std::optional<CSVRecord> parse_record();
    void read_header();

    std::string file_path_;
    bool has_header_;
    char delimiter_;

    gzFile file_ = nullptr;
    std::vector<char> buffer_;
    size_t buffer_pos_ = 0;
    size_t buffer_len_ = 0;
    bool eof_ = false;

    CSVRow header_;
    size_t column_count_ = 0;
    int64_t line_number_ = 1;
    int64_t rows_read_ = 0;
};
