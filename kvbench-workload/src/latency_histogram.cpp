#include "latency_histogram.h"

#include <glog/logging.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace kvbench {

namespace {
inline uint32_t Log2Floor(uint64_t value) {
    return 63 - static_cast<uint32_t>(__builtin_clzll(value));
}
}  // namespace

LatencyHistogram::LatencyHistogram(uint64_t lowest, uint64_t highest,
                                   uint8_t significant_digits)
    : lowest_(lowest),
      highest_(highest),
      significant_digits_(significant_digits) {
    if (lowest_ < 1) {
        throw std::invalid_argument("histogram lowest value must be >= 1");
    }
    if (highest_ < 2 * lowest_) {
        throw std::invalid_argument(
            "histogram highest value must be >= 2 * lowest, got " +
            std::to_string(highest_));
    }
    if (significant_digits_ < 1 || significant_digits_ > 5) {
        throw std::invalid_argument(
            "histogram significant digits must be in [1, 5]");
    }

    uint64_t largest_single_unit_value =
        2 * static_cast<uint64_t>(std::pow(10, significant_digits_));
    unit_magnitude_ = Log2Floor(lowest_);
    uint32_t sub_bucket_count_magnitude = static_cast<uint32_t>(
        std::ceil(std::log2(static_cast<double>(largest_single_unit_value))));
    sub_bucket_half_count_magnitude_ =
        std::max<uint32_t>(sub_bucket_count_magnitude, 1) - 1;
    sub_bucket_count_ = 1u << (sub_bucket_half_count_magnitude_ + 1);
    sub_bucket_half_count_ = sub_bucket_count_ / 2;
    sub_bucket_mask_ = static_cast<uint64_t>(sub_bucket_count_ - 1)
                       << unit_magnitude_;
    leading_zero_count_base_ =
        64 - unit_magnitude_ - sub_bucket_half_count_magnitude_ - 1;

    uint64_t smallest_untrackable =
        static_cast<uint64_t>(sub_bucket_count_) << unit_magnitude_;
    bucket_count_ = 1;
    while (smallest_untrackable <= highest_) {
        if (smallest_untrackable >
            static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) / 2) {
            ++bucket_count_;
            break;
        }
        smallest_untrackable <<= 1;
        ++bucket_count_;
    }

    counts_.assign(static_cast<size_t>(bucket_count_ + 1) *
                       sub_bucket_half_count_,
                   0);
}

uint32_t LatencyHistogram::BucketIndex(uint64_t value) const {
    return leading_zero_count_base_ -
           static_cast<uint32_t>(__builtin_clzll(value | sub_bucket_mask_));
}

uint32_t LatencyHistogram::SubBucketIndex(uint64_t value,
                                          uint32_t bucket_index) const {
    return static_cast<uint32_t>(value >> (bucket_index + unit_magnitude_));
}

size_t LatencyHistogram::CountsIndex(uint64_t value) const {
    uint32_t bucket_index = BucketIndex(value);
    uint32_t sub_bucket_index = SubBucketIndex(value, bucket_index);
    size_t bucket_base_index = static_cast<size_t>(bucket_index + 1)
                               << sub_bucket_half_count_magnitude_;
    return bucket_base_index + sub_bucket_index - sub_bucket_half_count_;
}

uint64_t LatencyHistogram::ValueFromIndex(size_t index) const {
    int64_t bucket_index =
        static_cast<int64_t>(index >> sub_bucket_half_count_magnitude_) - 1;
    uint64_t sub_bucket_index =
        (index & (sub_bucket_half_count_ - 1)) + sub_bucket_half_count_;
    if (bucket_index < 0) {
        sub_bucket_index -= sub_bucket_half_count_;
        bucket_index = 0;
    }
    return sub_bucket_index << (bucket_index + unit_magnitude_);
}

uint64_t LatencyHistogram::SizeOfEquivalentRange(uint64_t value) const {
    uint32_t bucket_index = BucketIndex(value);
    uint32_t sub_bucket_index = SubBucketIndex(value, bucket_index);
    uint32_t adjusted_bucket = sub_bucket_index >= sub_bucket_count_
                                   ? bucket_index + 1
                                   : bucket_index;
    return uint64_t{1} << (unit_magnitude_ + adjusted_bucket);
}

uint64_t LatencyHistogram::LowestEquivalentValue(uint64_t value) const {
    uint32_t bucket_index = BucketIndex(value);
    uint64_t sub_bucket_index = SubBucketIndex(value, bucket_index);
    return sub_bucket_index << (bucket_index + unit_magnitude_);
}

uint64_t LatencyHistogram::HighestEquivalentValue(uint64_t value) const {
    return LowestEquivalentValue(value) + SizeOfEquivalentRange(value) - 1;
}

void LatencyHistogram::Record(uint64_t value) {
    if (value > highest_) {
        VLOG(2) << "Latency sample " << value << " clamped to " << highest_;
        value = highest_;
        ++saturated_count_;
    }
    ++counts_[CountsIndex(value)];
    ++total_count_;
}

tl::expected<void, ErrorCode> LatencyHistogram::Add(
    const LatencyHistogram& other) {
    if (other.lowest_ != lowest_ || other.highest_ != highest_ ||
        other.significant_digits_ != significant_digits_) {
        LOG(ERROR) << "Cannot merge histograms with different layouts: ["
                   << lowest_ << ", " << highest_ << ", "
                   << static_cast<int>(significant_digits_) << "] vs ["
                   << other.lowest_ << ", " << other.highest_ << ", "
                   << static_cast<int>(other.significant_digits_) << "]";
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }
    for (size_t i = 0; i < counts_.size(); ++i) {
        counts_[i] += other.counts_[i];
    }
    total_count_ += other.total_count_;
    saturated_count_ += other.saturated_count_;
    return {};
}

std::optional<uint64_t> LatencyHistogram::ValueAtQuantile(
    double quantile) const {
    if (total_count_ == 0) {
        return std::nullopt;
    }
    quantile = std::clamp(quantile, 0.0, 1.0);
    uint64_t count_at_quantile = static_cast<uint64_t>(
        std::ceil(quantile * static_cast<double>(total_count_)));
    count_at_quantile = std::max<uint64_t>(count_at_quantile, 1);

    uint64_t running = 0;
    for (size_t i = 0; i < counts_.size(); ++i) {
        running += counts_[i];
        if (running >= count_at_quantile) {
            uint64_t value = ValueFromIndex(i);
            return quantile == 0.0 ? LowestEquivalentValue(value)
                                   : HighestEquivalentValue(value);
        }
    }
    // Unreachable while total_count_ matches the sum of counts_.
    return HighestEquivalentValue(highest_);
}

uint64_t LatencyHistogram::Min() const {
    for (size_t i = 0; i < counts_.size(); ++i) {
        if (counts_[i] != 0) {
            return LowestEquivalentValue(ValueFromIndex(i));
        }
    }
    return 0;
}

uint64_t LatencyHistogram::Max() const {
    for (size_t i = counts_.size(); i > 0; --i) {
        if (counts_[i - 1] != 0) {
            return HighestEquivalentValue(ValueFromIndex(i - 1));
        }
    }
    return 0;
}

double LatencyHistogram::Mean() const {
    if (total_count_ == 0) {
        return 0.0;
    }
    double sum = 0.0;
    for (size_t i = 0; i < counts_.size(); ++i) {
        if (counts_[i] == 0) continue;
        uint64_t value = ValueFromIndex(i);
        uint64_t median =
            LowestEquivalentValue(value) + (SizeOfEquivalentRange(value) >> 1);
        sum += static_cast<double>(median) * static_cast<double>(counts_[i]);
    }
    return sum / static_cast<double>(total_count_);
}

void LatencyHistogram::Reset() {
    std::fill(counts_.begin(), counts_.end(), 0);
    total_count_ = 0;
    saturated_count_ = 0;
}

}  // namespace kvbench
