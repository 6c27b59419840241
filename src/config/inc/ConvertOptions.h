#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>


struct ConvertOptions {
    static constexpr int DEFAULT_COMPRESSION_LEVEL = 3;
    static constexpr int MAX_COMPRESSION_LEVEL = 22;

    bool validate = true;
    // Falls back to the dataset's default_sample_size
    std::optional<size_t> sample_size;
    size_t batch_size = 100000;
    std::optional<uint64_t> seed;
    // ZSTD level, 0 stores pages uncompressed
    int compression_level = DEFAULT_COMPRESSION_LEVEL;
};
