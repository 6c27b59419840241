#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "AggregationConfig.h"
#include "AggregationResult.h"
#include "ColumnType.h"
#include "RowSampler.h"


// Completeness, aggregation integrity and ordered-value checks of an
// aggregation output. Source groups are recomputed here without the
// aggregator's accumulators.
class AggregationValidator {
public:
    explicit AggregationValidator(const AggregationConfig& config, std::optional<uint64_t> seed = std::nullopt);

    AggregationValidator(const AggregationValidator&) = delete;
    AggregationValidator& operator=(const AggregationValidator&) = delete;

    virtual ~AggregationValidator() = default;

    AggregationValidationResult run(const std::string& source_path, const std::string& output_path);

    // Tier 1
    virtual void validate_completeness(const std::string& source_path, const std::string& output_path,
                                       AggregationValidationResult& result);

    // Tier 2: min, max, count and list length of sampled keys
    virtual void validate_integrity(const std::string& source_path, const std::string& output_path,
                                    AggregationValidationResult& result);

    // Tier 3: exact lists and last/first values of sampled keys
    virtual void validate_sample(const std::string& source_path, const std::string& output_path,
                                 AggregationValidationResult& result);

protected:
    struct SourceRow {
        ColumnType order;
        // One value per field, null for count fields
        RowType values;
    };
    using SourceGroups = std::map<ColumnType, std::vector<SourceRow>>;

    // Accepted source rows of the given keys, in source order
    SourceGroups collect_groups(const std::string& source_path, const std::set<ColumnType>& keys) const;

    // Sampled output rows and their positions
    std::vector<RowType> sample_output(const std::string& output_path, size_t count,
                                       std::vector<int64_t>& positions);

    AggregationConfig config_;
    RowSampler sampler_;
};
