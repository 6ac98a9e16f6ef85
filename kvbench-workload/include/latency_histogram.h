#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "types.h"

namespace kvbench {

/**
 * @brief Bounded latency histogram with a fixed number of significant
 * decimal digits (HdrHistogram bucket layout).
 *
 * Values are grouped in power-of-two buckets, each split into linear
 * sub-buckets, so the relative error of any recorded value stays below
 * 10^-significant_digits. Counts are plain integers: a histogram is owned by
 * one thread and merged into another only after that thread has finished.
 */
class LatencyHistogram {
   public:
    explicit LatencyHistogram(
        uint64_t lowest = DEFAULT_HISTOGRAM_LOWEST_US,
        uint64_t highest = DEFAULT_HISTOGRAM_HIGHEST_US,
        uint8_t significant_digits = DEFAULT_HISTOGRAM_SIGNIFICANT_DIGITS);

    /**
     * @brief Records one sample
     *
     * Samples above the configured highest value are clamped to it and
     * counted in SaturatedCount(); the total count is never skewed.
     */
    void Record(uint64_t value);

    /**
     * @brief Adds every count of `other` into this histogram
     * @return ErrorCode::INVALID_PARAMS if the bucket layouts differ
     */
    tl::expected<void, ErrorCode> Add(const LatencyHistogram& other);

    /**
     * @brief Value below which the fraction `quantile` of samples fall
     * @param quantile In [0, 1], clamped otherwise
     * @return std::nullopt when the histogram is empty
     */
    std::optional<uint64_t> ValueAtQuantile(double quantile) const;

    uint64_t TotalCount() const { return total_count_; }
    uint64_t SaturatedCount() const { return saturated_count_; }
    bool IsEmpty() const { return total_count_ == 0; }

    // All return 0 when empty.
    uint64_t Min() const;
    uint64_t Max() const;
    double Mean() const;

    void Reset();

    uint64_t lowest() const { return lowest_; }
    uint64_t highest() const { return highest_; }
    uint8_t significant_digits() const { return significant_digits_; }

    // Range of values that share a bucket with `value`.
    uint64_t LowestEquivalentValue(uint64_t value) const;
    uint64_t HighestEquivalentValue(uint64_t value) const;

   private:
    uint32_t BucketIndex(uint64_t value) const;
    uint32_t SubBucketIndex(uint64_t value, uint32_t bucket_index) const;
    size_t CountsIndex(uint64_t value) const;
    uint64_t ValueFromIndex(size_t index) const;
    uint64_t SizeOfEquivalentRange(uint64_t value) const;

    uint64_t lowest_;
    uint64_t highest_;
    uint8_t significant_digits_;

    uint32_t unit_magnitude_;
    uint32_t sub_bucket_count_;
    uint32_t sub_bucket_half_count_;
    uint32_t sub_bucket_half_count_magnitude_;
    uint64_t sub_bucket_mask_;
    uint32_t leading_zero_count_base_;
    uint32_t bucket_count_;

    std::vector<uint64_t> counts_;
    uint64_t total_count_ = 0;
    uint64_t saturated_count_ = 0;
};

}  // namespace kvbench
