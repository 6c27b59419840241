#include "CSVReader.h"
#include <cerrno>
#include <cstring>
#include "ConvertError.h"


CSVReader::CSVReader(const std::string& file_path, bool has_header, char delimiter)
    : file_path_(file_path), has_header_(has_header), delimiter_(delimiter), buffer_(BUFFER_SIZE) {

    // gzopen reads uncompressed files transparently
    errno = 0;
    file_ = gzopen(file_path.c_str(), "rb");
    if (!file_) {
        throw SourceUnreadableError(file_path, errno ? std::strerror(errno) : "gzopen failed");
    }
    gzbuffer(file_, BUFFER_SIZE * 2);

    read_header();
}

CSVReader::~CSVReader() {
    if (file_) {
        gzclose(file_);
    }
}

std::vector<CSVRow> CSVReader::read_all() {
    reset();
    std::vector<CSVRow> rows;
    while (auto record = read_next()) {
        rows.push_back(std::move(record->fields));
    }
    return rows;
}

std::optional<CSVRecord> CSVReader::read_next() {
    auto record = parse_record();
    if (!record) {
        return std::nullopt;
    }
    if (column_count_ == 0) {
        column_count_ = record->fields.size();
    }
    ++rows_read_;
    return record;
}

void CSVReader::reset() {
    if (gzrewind(file_) != 0) {
        int errnum = 0;
        throw SourceUnreadableError(file_path_, gzerror(file_, &errnum));
    }
    buffer_pos_ = 0;
    buffer_len_ = 0;
    eof_ = false;
    line_number_ = 1;
    rows_read_ = 0;
    header_.clear();
    column_count_ = 0;
    read_header();
}

void CSVReader::read_header() {
    if (!has_header_) {
        return;
    }
    if (auto record = parse_record()) {
        header_ = std::move(record->fields);
        column_count_ = header_.size();
    }
}

bool CSVReader::fill_buffer() {
    if (eof_) {
        return false;
    }
    int bytes = gzread(file_, buffer_.data(), static_cast<unsigned>(buffer_.size()));
    if (bytes < 0) {
        int errnum = 0;
        const char* message = gzerror(file_, &errnum);
        throw SourceUnreadableError(file_path_, errnum == Z_ERRNO ? std::strerror(errno) : message);
    }
    if (bytes == 0) {
        eof_ = true;
        return false;
    }
    buffer_pos_ = 0;
    buffer_len_ = static_cast<size_t>(bytes);
    return true;
}

int CSVReader::next_char() {
    if (buffer_pos_ >= buffer_len_ && !fill_buffer()) {
        return -1;
    }
    return static_cast<unsigned char>(buffer_[buffer_pos_++]);
}

std::optional<CSVRecord> CSVReader::parse_record() {
    while (true) {
        CSVRecord record;
        record.line_number = line_number_;

        std::string current_field;
        ParseState state = ParseState::START_FIELD;
        bool saw_eof = false;

        while (state != ParseState::END_OF_ROW) {
            int ch = next_char();
            if (ch < 0) {
                saw_eof = true;
                break;
            }
            char c = static_cast<char>(ch);

            if (c == '\n') {
                ++line_number_;
                if (state != ParseState::IN_QUOTED_FIELD) {
                    state = ParseState::END_OF_ROW;
                    break;
                }
            }
            record.raw_text += c;

            switch (state) {
                case ParseState::START_FIELD:
                    if (c == '"') {
                        state = ParseState::IN_QUOTED_FIELD;
                    } else if (c == delimiter_) {
                        record.fields.emplace_back();
                    } else {
                        current_field += c;
                        state = ParseState::IN_UNQUOTED_FIELD;
                    }
                    break;

                case ParseState::IN_UNQUOTED_FIELD:
                    if (c == delimiter_) {
                        record.fields.push_back(std::move(current_field));
                        current_field.clear();
                        state = ParseState::START_FIELD;
                    } else {
                        // quotes inside an unquoted field are literal
                        current_field += c;
                    }
                    break;

                case ParseState::IN_QUOTED_FIELD:
                    if (c == '"') {
                        state = ParseState::QUOTE_IN_QUOTED_FIELD;
                    } else {
                        current_field += c;
                    }
                    break;

                case ParseState::QUOTE_IN_QUOTED_FIELD:
                    if (c == '"') {
                        // Two consecutive quotes represent an escaped quote
                        current_field += '"';
                        state = ParseState::IN_QUOTED_FIELD;
                    } else if (c == delimiter_) {
                        record.fields.push_back(std::move(current_field));
                        current_field.clear();
                        state = ParseState::START_FIELD;
                    } else {
                        // Text after the closing quote stays in the same field
                        current_field += c;
                        state = ParseState::IN_UNQUOTED_FIELD;
                    }
                    break;

                case ParseState::END_OF_ROW:
                    break;
            }
        }

        if (state == ParseState::IN_QUOTED_FIELD && saw_eof) {
            throw CSVParseError(file_path_, rows_read_, record.line_number, "", "",
                                record.raw_text, "unterminated quoted field");
        }

        // CRLF terminator
        if (!record.raw_text.empty() && record.raw_text.back() == '\r') {
            record.raw_text.pop_back();
            if (!current_field.empty() && current_field.back() == '\r') {
                current_field.pop_back();
            }
        }

        if (record.raw_text.empty()) {
            if (saw_eof) {
                return std::nullopt;
            }
            // blank line
            continue;
        }

        record.fields.push_back(std::move(current_field));
        return record;
    }
}
