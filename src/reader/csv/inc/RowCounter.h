#pragma once

#include <cstdint>
#include <string>


// Pre-flight data row count. A byte-level scan that never materializes
// fields, so its count is independent evidence for the converter's.
class RowCounter {
public:
    static constexpr size_t BUFFER_SIZE = 256 * 1024;

    explicit RowCounter(bool has_header = true, char delimiter = ',')
        : has_header_(has_header), delimiter_(delimiter) {}

    // Logical records excluding the header. Quoted newlines do not end a
    // record, blank lines are not records.
    int64_t count(const std::string& file_path) const;

private:
    bool has_header_;
    char delimiter_;
};
