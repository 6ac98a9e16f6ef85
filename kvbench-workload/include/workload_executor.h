#pragma once

#include <glog/logging.h>

#include <chrono>
#include <cstdint>
#include <exception>
#include <random>
#include <system_error>
#include <thread>
#include <vector>

#include "generator.h"
#include "storage_backend.h"
#include "types.h"
#include "workload.h"
#include "workload_stats.h"

namespace kvbench {

namespace detail {

// Seed streams handed out by DeriveSeed. Stream 0 is the load phase, each
// run worker takes kStreamsPerWorker consecutive streams after it.
constexpr uint64_t kLoadStream = 0;
constexpr uint64_t kStreamsPerWorker = 3;

inline uint64_t WorkerStream(uint32_t worker, uint64_t slot) {
    return 1 + static_cast<uint64_t>(worker) * kStreamsPerWorker + slot;
}

inline uint64_t ElapsedMicros(std::chrono::steady_clock::time_point start,
                              std::chrono::steady_clock::time_point end) {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(end - start)
            .count());
}

template <typename Workload>
tl::expected<void, ErrorCode> RunWorker(const Workload& workload,
                                        StorageBackend& backend,
                                        uint64_t seed, uint32_t worker,
                                        RunResult* result) {
    const ValueSizeRange range = workload.value_size_range();
    auto sizes = SizeGenerator::Create(
        range.Width(), DeriveSeed(seed, WorkerStream(worker, 0)));
    if (!sizes) {
        return tl::make_unexpected(sizes.error());
    }
    auto bytes =
        ByteGenerator::Create(workload.load_insert_count(),
                              DeriveSeed(seed, WorkerStream(worker, 1)));
    if (!bytes) {
        return tl::make_unexpected(bytes.error());
    }
    std::mt19937_64 op_engine(DeriveSeed(seed, WorkerStream(worker, 2)));
    std::uniform_real_distribution<double> uniform(0.0, 1.0);

    const double read_percent = workload.read_percent();
    const double write_threshold = read_percent + workload.write_percent();
    const uint64_t key_size = workload.key_size();

    for (uint64_t i = 0; i < workload.operation_count(); ++i) {
        double x = uniform(op_engine);
        Bytes key = bytes->GetKeyBytes(key_size);
        if (x < read_percent) {
            auto start = std::chrono::steady_clock::now();
            auto res = backend.Get(AsStringView(key));
            auto end = std::chrono::steady_clock::now();
            if (!res) {
                LOG(ERROR) << "Worker " << worker << " read failed at op " << i
                           << ": " << res.error();
                return res;
            }
            result->read_duration += end - start;
            result->read_hist.Record(ElapsedMicros(start, end));
            ++result->read_ops;
        } else if (x < write_threshold) {
            uint64_t value_size = range.min + sizes->GetSize() - 1;
            Bytes value = bytes->GetValueBytes(value_size);
            auto start = std::chrono::steady_clock::now();
            auto res = backend.Set(AsStringView(key), AsStringView(value));
            auto end = std::chrono::steady_clock::now();
            if (!res) {
                LOG(ERROR) << "Worker " << worker << " write failed at op "
                           << i << ": " << res.error();
                return res;
            }
            result->write_duration += end - start;
            result->write_hist.Record(ElapsedMicros(start, end));
            ++result->write_ops;
        } else {
            ++result->skipped_ops;
        }
    }
    return {};
}

}  // namespace detail

/**
 * @brief Load phase: writes load_insert_count keys from a single thread
 *
 * Key i is filled from an engine seeded with i, followed by its value from
 * the same engine, so the loaded key set only depends on the workload and
 * every run-phase key lands inside it. Only the Set calls are timed.
 *
 * @param seed Seed of the value size stream
 * @param stats Receives load_time and load_ops on success
 * @return The validation or backend error that aborted the phase
 */
template <typename Workload>
tl::expected<void, ErrorCode> ExecLoad(const Workload& workload,
                                       StorageBackend& backend, uint64_t seed,
                                       WorkloadStats* stats) {
    auto valid = ValidateWorkload(workload);
    if (!valid) {
        return valid;
    }
    auto init = backend.Init();
    if (!init) {
        LOG(ERROR) << "Failed to init backend " << backend.Name() << ": "
                   << init.error();
        return init;
    }

    const ValueSizeRange range = workload.value_size_range();
    auto sizes = SizeGenerator::Create(range.Width(),
                                       DeriveSeed(seed, detail::kLoadStream));
    if (!sizes) {
        return tl::make_unexpected(sizes.error());
    }

    const uint64_t count = workload.load_insert_count();
    const uint64_t key_size = workload.key_size();
    std::chrono::nanoseconds load_time{0};
    Bytes key(key_size);
    Bytes value;
    for (uint64_t i = 0; i < count; ++i) {
        value.resize(range.min + sizes->GetSize() - 1);
        std::mt19937_64 engine(i);
        FillBytes(engine, key.data(), key.size());
        FillBytes(engine, value.data(), value.size());

        auto start = std::chrono::steady_clock::now();
        auto res = backend.Set(AsStringView(key), AsStringView(value));
        auto end = std::chrono::steady_clock::now();
        if (!res) {
            LOG(ERROR) << "Load failed at key " << i << " of " << count << ": "
                       << res.error();
            return res;
        }
        load_time += end - start;
        if (VLOG_IS_ON(1) && (i + 1) % 100000 == 0) {
            VLOG(1) << "Loaded " << (i + 1) << " / " << count << " keys";
        }
    }

    stats->load_time = load_time;
    stats->load_ops = count;
    LOG(INFO) << "Load of " << workload.name() << " finished: " << count
              << " keys in " << FormatDuration(load_time);
    return {};
}

/**
 * @brief Run phase: thread_count workers issue operation_count operations
 * each against the shared backend
 *
 * Each worker owns its generators and accumulators; nothing is shared
 * between workers except the backend. The wall time spans from before the
 * first worker starts until the last one has been joined. Statistics are
 * only published when every worker succeeded, and they replace the run
 * fields of `stats` left by an earlier run.
 *
 * @return The error of the lowest-indexed failed worker, if any;
 * ErrorCode::INTERNAL_ERROR when a worker cannot be started or throws
 */
template <typename Workload>
tl::expected<void, ErrorCode> ExecRun(const Workload& workload,
                                      StorageBackend& backend, uint64_t seed,
                                      WorkloadStats* stats) {
    auto valid = ValidateWorkload(workload);
    if (!valid) {
        return valid;
    }

    const uint32_t thread_count = workload.thread_count();
    std::vector<RunResult> results(thread_count);
    std::vector<tl::expected<void, ErrorCode>> errors(thread_count);
    std::vector<std::thread> workers;
    workers.reserve(thread_count);

    VLOG(1) << "Starting " << thread_count << " workers, "
            << workload.operation_count() << " operations each";
    auto start = std::chrono::steady_clock::now();
    bool spawn_failed = false;
    for (uint32_t w = 0; w < thread_count; ++w) {
        try {
            workers.emplace_back([&workload, &backend, &results, &errors,
                                  seed, w]() {
                try {
                    errors[w] = detail::RunWorker(workload, backend, seed, w,
                                                  &results[w]);
                } catch (const std::exception& e) {
                    LOG(ERROR) << "Worker " << w << " threw: " << e.what();
                    errors[w] = tl::make_unexpected(ErrorCode::INTERNAL_ERROR);
                }
            });
        } catch (const std::system_error& e) {
            LOG(ERROR) << "Failed to start worker " << w << " of "
                       << thread_count << ": " << e.what();
            spawn_failed = true;
            break;
        }
    }
    // Workers already started must be joined before returning.
    for (auto& worker : workers) {
        worker.join();
    }
    auto wall_time = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start);
    if (spawn_failed) {
        return tl::make_unexpected(ErrorCode::INTERNAL_ERROR);
    }

    for (uint32_t w = 0; w < thread_count; ++w) {
        if (!errors[w]) {
            LOG(ERROR) << "Run of " << workload.name() << " failed in worker "
                       << w << ": " << errors[w].error();
            return errors[w];
        }
    }

    auto merged = MergeRunResults(results, wall_time, stats);
    if (!merged) {
        return merged;
    }
    LOG(INFO) << "Run of " << workload.name() << " finished in "
              << FormatDuration(wall_time) << ": " << stats->run_read_ops
              << " reads, " << stats->run_write_ops << " writes, "
              << stats->run_skipped_ops << " skipped";
    return {};
}

}  // namespace kvbench
