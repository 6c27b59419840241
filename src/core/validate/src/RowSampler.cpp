#include "RowSampler.h"
#include <algorithm>
#include <unordered_set>


RowSampler::RowSampler(std::optional<uint64_t> seed)
    : seed_(seed ? *seed : std::random_device{}()), engine_(seed_) {}

std::vector<int64_t> RowSampler::sample(int64_t population, size_t count) {
    std::vector<int64_t> result;
    if (population <= 0 || count == 0) {
        return result;
    }
    const int64_t k = std::min<int64_t>(static_cast<int64_t>(count), population);

    // Floyd's algorithm, k draws without a population-sized buffer
    std::unordered_set<int64_t> chosen;
    chosen.reserve(static_cast<size_t>(k) * 2);
    for (int64_t j = population - k; j < population; ++j) {
        std::uniform_int_distribution<int64_t> dist(0, j);
        int64_t t = dist(engine_);
        if (!chosen.insert(t).second) {
            chosen.insert(j);
        }
    }

    result.assign(chosen.begin(), chosen.end());
    std::sort(result.begin(), result.end());
    return result;
}
