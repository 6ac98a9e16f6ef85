#include "workload.h"

#include <glog/logging.h>

#include <cmath>
#include <exception>

#include "default_config.h"

namespace kvbench {

namespace {
constexpr uint64_t kPresetLoadInsertCount = 10'000;
constexpr uint64_t kPresetOperationCount = 8'000;
constexpr uint64_t kPresetKeySize = 128;
constexpr ValueSizeRange kPresetValueSizeRange{512, 1024};
constexpr uint32_t kPresetThreadCount = 16;

bool InUnitInterval(double v) { return v >= 0.0 && v <= 1.0; }
}  // namespace

std::ostream& operator<<(std::ostream& os, const WorkloadDescriptor& workload) {
    os << "name=" << workload.name()
       << ", load_insert_count=" << workload.load_insert_count()
       << ", operation_count=" << workload.operation_count()
       << ", read_percent=" << workload.read_percent()
       << ", write_percent=" << workload.write_percent()
       << ", key_size=" << workload.key_size() << ", value_size_range=["
       << workload.value_size_range().min << ", "
       << workload.value_size_range().max
       << "), thread_count=" << workload.thread_count();
    return os;
}

tl::expected<void, ErrorCode> ValidateWorkloadParams(
    const std::string& name, uint64_t load_insert_count, double read_percent,
    double write_percent, ValueSizeRange value_size_range) {
    if (load_insert_count == 0) {
        LOG(ERROR) << "Workload " << name
                   << ": load insert count must be positive";
        return tl::make_unexpected(ErrorCode::INVALID_CONFIG);
    }
    if (!InUnitInterval(read_percent)) {
        LOG(ERROR) << "Workload " << name
                   << ": read percent must be in [0, 1], got " << read_percent;
        return tl::make_unexpected(ErrorCode::INVALID_CONFIG);
    }
    if (!InUnitInterval(write_percent)) {
        LOG(ERROR) << "Workload " << name
                   << ": write percent must be in [0, 1], got "
                   << write_percent;
        return tl::make_unexpected(ErrorCode::INVALID_CONFIG);
    }
    double sum = read_percent + write_percent;
    if (sum <= 0.0) {
        LOG(ERROR) << "Workload " << name
                   << ": read and write both cannot be zero percent";
        return tl::make_unexpected(ErrorCode::INVALID_CONFIG);
    }
    if (sum > 1.0) {
        LOG(ERROR) << "Workload " << name
                   << ": read and write cannot combine to above 1, got "
                   << sum;
        return tl::make_unexpected(ErrorCode::INVALID_CONFIG);
    }
    if (value_size_range.max <= value_size_range.min) {
        LOG(ERROR) << "Workload " << name << ": value size range ["
                   << value_size_range.min << ", " << value_size_range.max
                   << ") is empty";
        return tl::make_unexpected(ErrorCode::INVALID_CONFIG);
    }
    if (sum < 1.0) {
        LOG(WARNING) << "Workload " << name << ": " << (1.0 - sum) * 100.0
                     << "% of run operations will be skipped";
    }
    return {};
}

std::string WorkloadTypeToString(WorkloadType type) {
    switch (type) {
        case WorkloadType::READ_WRITE:
            return "read_write";
        case WorkloadType::READ_HEAVY:
            return "read_heavy";
        case WorkloadType::READ_ONLY:
            return "read_only";
    }
    return "unknown";
}

std::optional<WorkloadType> StringToWorkloadType(const std::string& str) {
    if (str == "read_write") return WorkloadType::READ_WRITE;
    if (str == "read_heavy") return WorkloadType::READ_HEAVY;
    if (str == "read_only") return WorkloadType::READ_ONLY;
    return std::nullopt;
}

WorkloadDescriptor GetPresetWorkload(WorkloadType type) {
    switch (type) {
        case WorkloadType::READ_HEAVY:
            return WorkloadDescriptor(
                "ReadHeavy", kPresetLoadInsertCount, kPresetOperationCount,
                0.95, 0.05, kPresetKeySize, kPresetValueSizeRange,
                kPresetThreadCount);
        case WorkloadType::READ_ONLY:
            return WorkloadDescriptor(
                "ReadOnly", kPresetLoadInsertCount, kPresetOperationCount, 1.0,
                0.0, kPresetKeySize, kPresetValueSizeRange,
                kPresetThreadCount);
        case WorkloadType::READ_WRITE:
        default:
            return WorkloadDescriptor(
                "ReadWrite", kPresetLoadInsertCount, kPresetOperationCount,
                0.5, 0.5, kPresetKeySize, kPresetValueSizeRange,
                kPresetThreadCount);
    }
}

tl::expected<WorkloadDescriptor, ErrorCode> ApplyWorkloadProperties(
    const WorkloadDescriptor& base, const DefaultConfig& properties) {
    std::string name;
    uint64_t load_insert_count;
    uint64_t operation_count;
    double read_percent;
    double write_percent;
    uint64_t key_size;
    ValueSizeRange value_size_range;
    uint32_t thread_count;
    try {
        properties.GetString("workload.name", &name, base.name());
        properties.GetUInt64("workload.load_insert_count", &load_insert_count,
                             base.load_insert_count());
        properties.GetUInt64("workload.operation_count", &operation_count,
                             base.operation_count());
        properties.GetDouble("workload.read_percent", &read_percent,
                             base.read_percent());
        properties.GetDouble("workload.write_percent", &write_percent,
                             base.write_percent());
        properties.GetUInt64("workload.key_size", &key_size, base.key_size());
        properties.GetUInt64("workload.value_size_min", &value_size_range.min,
                             base.value_size_range().min);
        properties.GetUInt64("workload.value_size_max", &value_size_range.max,
                             base.value_size_range().max);
        properties.GetUInt32("workload.thread_count", &thread_count,
                             base.thread_count());
    } catch (const std::exception& e) {
        LOG(ERROR) << "Invalid workload property in " << properties.GetPath()
                   << ": " << e.what();
        return tl::make_unexpected(ErrorCode::INVALID_CONFIG);
    }

    WorkloadDescriptor workload(name, load_insert_count, operation_count,
                                read_percent, write_percent, key_size,
                                value_size_range, thread_count);
    auto valid = ValidateWorkload(workload);
    if (!valid) {
        return tl::make_unexpected(valid.error());
    }
    return workload;
}

tl::expected<WorkloadDescriptor, ErrorCode> LoadWorkloadProperties(
    const WorkloadDescriptor& base, const std::string& path, uint64_t* seed) {
    DefaultConfig properties;
    properties.SetPath(path);
    try {
        properties.Load();
        properties.GetUInt64("seed", seed, *seed);
    } catch (const std::exception& e) {
        LOG(ERROR) << "Failed to load properties from " << path << ": "
                   << e.what();
        return tl::make_unexpected(ErrorCode::INVALID_CONFIG);
    }
    return ApplyWorkloadProperties(base, properties);
}

}  // namespace kvbench
