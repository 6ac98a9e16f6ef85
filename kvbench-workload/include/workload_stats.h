#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "latency_histogram.h"
#include "types.h"

namespace kvbench {

/**
 * @brief Accumulators of one run-phase worker.
 *
 * Durations only cover the time spent inside backend get/set calls.
 */
struct RunResult {
    std::chrono::nanoseconds read_duration{0};
    std::chrono::nanoseconds write_duration{0};
    uint64_t read_ops = 0;
    uint64_t write_ops = 0;
    uint64_t skipped_ops = 0;
    LatencyHistogram read_hist;   // microseconds
    LatencyHistogram write_hist;  // microseconds
};

/**
 * @brief Aggregate statistics of one benchmark invocation.
 *
 * run_wall_time is the single wall-clock span of the run phase, while
 * run_read_time and run_write_time are sums over all workers.
 */
struct WorkloadStats {
    std::chrono::nanoseconds load_time{0};
    uint64_t load_ops = 0;

    std::chrono::nanoseconds run_wall_time{0};
    std::chrono::nanoseconds run_read_time{0};
    std::chrono::nanoseconds run_write_time{0};
    uint64_t run_read_ops = 0;
    uint64_t run_write_ops = 0;
    uint64_t run_skipped_ops = 0;
    LatencyHistogram run_read_hist;
    LatencyHistogram run_write_hist;

    /**
     * @brief Renders the LOAD, RUN READ and RUN WRITE sections
     *
     * Throughput uses the summed per-phase durations, the displayed run time
     * is the wall-clock span. Percentiles of an empty histogram print as "-".
     */
    std::string ToString() const;
};

std::ostream& operator<<(std::ostream& os, const WorkloadStats& stats);

/**
 * @brief Folds the per-worker results into the run fields of `stats`
 *
 * The run fields are replaced, never added to, so they always describe a
 * single run. Load fields are left alone.
 * @return ErrorCode::INVALID_PARAMS if a histogram cannot be merged; `stats`
 * is left untouched in that case
 */
tl::expected<void, ErrorCode> MergeRunResults(
    const std::vector<RunResult>& results, std::chrono::nanoseconds wall_time,
    WorkloadStats* stats);

// Operations per second; 0 when either argument is zero.
double Throughput(uint64_t ops, std::chrono::nanoseconds duration);

// 1234567 -> "1_234_567"
std::string FormatWithSeparators(uint64_t value);

// One decimal in the largest unit that fits: "1.5s", "12.0ms", "3.2µs",
// "800.0ns".
std::string FormatDuration(std::chrono::nanoseconds duration);

}  // namespace kvbench
