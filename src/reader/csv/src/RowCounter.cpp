#include "RowCounter.h"
#include <cerrno>
#include <cstring>
#include <memory>
#include <vector>
#include <zlib.h>
#include "ConvertError.h"
#include "LogUtils.h"


namespace {

    enum class ScanState {
        FIELD_START,
        UNQUOTED,
        QUOTED,
        QUOTE_IN_QUOTED
    };

    struct GzCloser {
        void operator()(gzFile_s* file) const {
            if (file) gzclose(file);
        }
    };

}

int64_t RowCounter::count(const std::string& file_path) const {
    errno = 0;
    std::unique_ptr<gzFile_s, GzCloser> file(gzopen(file_path.c_str(), "rb"));
    if (!file) {
        throw SourceUnreadableError(file_path, errno ? std::strerror(errno) : "gzopen failed");
    }

    std::vector<char> buffer(BUFFER_SIZE);
    ScanState state = ScanState::FIELD_START;
    int64_t records = 0;
    int64_t record_chars = 0;
    bool last_cr = false;

    auto end_record = [&]() {
        if (record_chars - (last_cr ? 1 : 0) > 0) {
            ++records;
        }
        record_chars = 0;
        last_cr = false;
        state = ScanState::FIELD_START;
    };

    while (true) {
        int bytes = gzread(file.get(), buffer.data(), static_cast<unsigned>(buffer.size()));
        if (bytes < 0) {
            int errnum = 0;
            const char* message = gzerror(file.get(), &errnum);
            throw SourceUnreadableError(file_path, errnum == Z_ERRNO ? std::strerror(errno) : message);
        }
        if (bytes == 0) {
            break;
        }

        for (int i = 0; i < bytes; ++i) {
            const char c = buffer[i];
            if (c == '\n' && state != ScanState::QUOTED) {
                end_record();
                continue;
            }

            ++record_chars;
            last_cr = (c == '\r');

            switch (state) {
                case ScanState::FIELD_START:
                    if (c == '"') {
                        state = ScanState::QUOTED;
                    } else if (c != delimiter_) {
                        state = ScanState::UNQUOTED;
                    }
                    break;
                case ScanState::UNQUOTED:
                    if (c == delimiter_) {
                        state = ScanState::FIELD_START;
                    }
                    break;
                case ScanState::QUOTED:
                    if (c == '"') {
                        state = ScanState::QUOTE_IN_QUOTED;
                    }
                    break;
                case ScanState::QUOTE_IN_QUOTED:
                    if (c == '"') {
                        state = ScanState::QUOTED;
                    } else if (c == delimiter_) {
                        state = ScanState::FIELD_START;
                    } else {
                        state = ScanState::UNQUOTED;
                    }
                    break;
            }
        }
    }

    // Final record without a trailing newline
    if (state == ScanState::QUOTED) {
        ++records;
    } else {
        end_record();
    }

    if (has_header_ && records > 0) {
        --records;
    }

    debugPrint("Counted %lld data rows in %s\n", static_cast<long long>(records), file_path.c_str());
    return records;
}
