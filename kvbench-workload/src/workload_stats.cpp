#include "workload_stats.h"

#include <glog/logging.h>

#include <cstdio>
#include <sstream>

namespace kvbench {

namespace {
std::string FormatPercentile(const LatencyHistogram& hist, double quantile) {
    auto value = hist.ValueAtQuantile(quantile);
    if (!value) {
        return "-";
    }
    return FormatWithSeparators(value.value());
}

void WriteRunSection(std::ostream& os, uint64_t ops,
                     std::chrono::nanoseconds wall_time,
                     std::chrono::nanoseconds op_time,
                     const LatencyHistogram& hist) {
    os << "ops: " << FormatWithSeparators(ops)
       << " | time: " << FormatDuration(wall_time) << " | throughput: "
       << FormatWithSeparators(static_cast<uint64_t>(Throughput(ops, op_time)))
       << " ops/s"
       << " | p50: " << FormatPercentile(hist, 0.50) << " µs"
       << " | p95: " << FormatPercentile(hist, 0.95) << " µs"
       << " | p99: " << FormatPercentile(hist, 0.99) << " µs"
       << " | p99.9: " << FormatPercentile(hist, 0.999) << " µs";
}
}  // namespace

double Throughput(uint64_t ops, std::chrono::nanoseconds duration) {
    if (ops == 0 || duration.count() <= 0) {
        return 0.0;
    }
    return static_cast<double>(ops) /
           std::chrono::duration<double>(duration).count();
}

std::string FormatWithSeparators(uint64_t value) {
    std::string digits = std::to_string(value);
    std::string result;
    result.reserve(digits.size() + digits.size() / 3);
    size_t lead = digits.size() % 3;
    for (size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && (i + 3 - lead) % 3 == 0) {
            result.push_back('_');
        }
        result.push_back(digits[i]);
    }
    return result;
}

std::string FormatDuration(std::chrono::nanoseconds duration) {
    int64_t ns = duration.count();
    if (ns < 0) {
        ns = 0;
    }
    double value = static_cast<double>(ns);
    const char* unit = "ns";
    if (ns >= 1'000'000'000) {
        value /= 1e9;
        unit = "s";
    } else if (ns >= 1'000'000) {
        value /= 1e6;
        unit = "ms";
    } else if (ns >= 1'000) {
        value /= 1e3;
        unit = "µs";
    }
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.1f%s", value, unit);
    return buf;
}

tl::expected<void, ErrorCode> MergeRunResults(
    const std::vector<RunResult>& results, std::chrono::nanoseconds wall_time,
    WorkloadStats* stats) {
    LatencyHistogram read_hist;
    LatencyHistogram write_hist;
    std::chrono::nanoseconds read_time{0};
    std::chrono::nanoseconds write_time{0};
    uint64_t read_ops = 0;
    uint64_t write_ops = 0;
    uint64_t skipped_ops = 0;

    for (const auto& result : results) {
        auto merged = read_hist.Add(result.read_hist);
        if (!merged) {
            LOG(ERROR) << "Failed to merge read histogram: " << merged.error();
            return tl::make_unexpected(merged.error());
        }
        merged = write_hist.Add(result.write_hist);
        if (!merged) {
            LOG(ERROR) << "Failed to merge write histogram: "
                       << merged.error();
            return tl::make_unexpected(merged.error());
        }
        read_time += result.read_duration;
        write_time += result.write_duration;
        read_ops += result.read_ops;
        write_ops += result.write_ops;
        skipped_ops += result.skipped_ops;
    }

    stats->run_wall_time = wall_time;
    stats->run_read_time = read_time;
    stats->run_write_time = write_time;
    stats->run_read_ops = read_ops;
    stats->run_write_ops = write_ops;
    stats->run_skipped_ops = skipped_ops;
    stats->run_read_hist = std::move(read_hist);
    stats->run_write_hist = std::move(write_hist);
    return {};
}

std::string WorkloadStats::ToString() const {
    std::ostringstream os;
    os << "=== LOAD ===\n";
    os << "ops: " << FormatWithSeparators(load_ops)
       << " | time: " << FormatDuration(load_time) << " | throughput: "
       << FormatWithSeparators(
              static_cast<uint64_t>(Throughput(load_ops, load_time)))
       << " ops/s\n";
    os << "=== RUN READ ===\n";
    WriteRunSection(os, run_read_ops, run_wall_time, run_read_time,
                    run_read_hist);
    os << "\n=== RUN WRITE ===\n";
    WriteRunSection(os, run_write_ops, run_wall_time, run_write_time,
                    run_write_hist);
    return os.str();
}

std::ostream& operator<<(std::ostream& os, const WorkloadStats& stats) {
    return os << stats.ToString();
}

}  // namespace kvbench
