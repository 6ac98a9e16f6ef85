#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

#include "types.h"

namespace kvbench {

class DefaultConfig;

/**
 * @brief Statistical shape of one benchmark run.
 *
 * Satisfies the workload interface the executors are written against:
 * name(), load_insert_count(), operation_count(), read_percent(),
 * write_percent(), key_size(), value_size_range() and thread_count().
 * Any other type exposing the same accessors can be executed as well.
 */
class WorkloadDescriptor {
   public:
    WorkloadDescriptor(std::string name, uint64_t load_insert_count,
                       uint64_t operation_count, double read_percent,
                       double write_percent, uint64_t key_size,
                       ValueSizeRange value_size_range, uint32_t thread_count)
        : name_(std::move(name)),
          load_insert_count_(load_insert_count),
          operation_count_(operation_count),
          read_percent_(read_percent),
          write_percent_(write_percent),
          key_size_(key_size),
          value_size_range_(value_size_range),
          thread_count_(thread_count) {}

    const std::string& name() const { return name_; }
    // Keys written during load; also the key cardinality of the run phase.
    uint64_t load_insert_count() const { return load_insert_count_; }
    // Operations issued by each worker (total = thread_count * this).
    uint64_t operation_count() const { return operation_count_; }
    double read_percent() const { return read_percent_; }
    double write_percent() const { return write_percent_; }
    uint64_t key_size() const { return key_size_; }
    ValueSizeRange value_size_range() const { return value_size_range_; }
    uint32_t thread_count() const { return thread_count_; }

   private:
    std::string name_;
    uint64_t load_insert_count_;
    uint64_t operation_count_;
    double read_percent_;
    double write_percent_;
    uint64_t key_size_;
    ValueSizeRange value_size_range_;
    uint32_t thread_count_;
};

std::ostream& operator<<(std::ostream& os, const WorkloadDescriptor& workload);

tl::expected<void, ErrorCode> ValidateWorkloadParams(
    const std::string& name, uint64_t load_insert_count, double read_percent,
    double write_percent, ValueSizeRange value_size_range);

/**
 * @brief Checks the operation mix and value sizing of a workload
 *
 * The load must insert at least one key. read_percent and write_percent
 * must each lie in [0, 1] and their sum in (0, 1]; the value size range must
 * be non-empty.
 * @return ErrorCode::INVALID_CONFIG on the first violated rule
 */
template <typename Workload>
tl::expected<void, ErrorCode> ValidateWorkload(const Workload& workload) {
    return ValidateWorkloadParams(
        workload.name(), workload.load_insert_count(), workload.read_percent(),
        workload.write_percent(), workload.value_size_range());
}

enum class WorkloadType {
    READ_WRITE = 0,  // 50% reads, 50% writes
    READ_HEAVY = 1,  // 95% reads, 5% writes
    READ_ONLY = 2,   // reads only
};

std::string WorkloadTypeToString(WorkloadType type);

std::optional<WorkloadType> StringToWorkloadType(const std::string& str);

WorkloadDescriptor GetPresetWorkload(WorkloadType type);

/**
 * @brief Overlays `workload.*` keys of a loaded properties file
 *
 * Keys that are absent keep the value of `base`. The result is validated.
 * @return ErrorCode::INVALID_CONFIG on unreadable values or a result that
 * fails ValidateWorkload
 */
tl::expected<WorkloadDescriptor, ErrorCode> ApplyWorkloadProperties(
    const WorkloadDescriptor& base, const DefaultConfig& properties);

/**
 * @brief Loads a YAML/JSON properties file and overlays it onto `base`
 * @param seed Replaced by the top-level `seed` key when present
 */
tl::expected<WorkloadDescriptor, ErrorCode> LoadWorkloadProperties(
    const WorkloadDescriptor& base, const std::string& path, uint64_t* seed);

}  // namespace kvbench
