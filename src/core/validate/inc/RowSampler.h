#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <vector>


// Uniform sampling of distinct row positions. A fixed seed makes the
// draw reproducible.
class RowSampler {
public:
    explicit RowSampler(std::optional<uint64_t> seed = std::nullopt);

    // min(count, population) distinct values of [0, population), ascending
    std::vector<int64_t> sample(int64_t population, size_t count);

    uint64_t seed() const noexcept { return seed_; }

private:
    uint64_t seed_;
    std::mt19937_64 engine_;
};
