/**
 * @file kvbench_main.cpp
 * @brief Two-phase (load, then run) key-value store benchmark
 *
 * USAGE EXAMPLES:
 *
 *   # 50/50 mix against the in-memory map
 *   ./kvbench --workload=read_write --backend=mem_btree
 *
 *   # 95/5 mix against RocksDB, reproducible
 *   ./kvbench --workload=read_heavy --backend=rocksdb --seed=42
 *
 *   # Preset overridden by a properties file
 *   ./kvbench --workload=read_write --properties=config/kvbench.yaml
 */

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <iostream>
#include <random>
#include <string>

#include "storage_backend.h"
#include "workload.h"
#include "workload_executor.h"
#include "workload_stats.h"

DEFINE_string(workload, "read_write",
              "Workload preset: read_write, read_heavy or read_only");
DEFINE_string(backend, "mem_btree",
              "Storage backend: mem_btree, rocksdb or rocksdb_txn");
DEFINE_string(properties, "",
              "Optional YAML/JSON properties file overriding the preset");
DEFINE_uint64(seed, 0, "Seed of all generators; 0 draws a random one");

namespace kvbench {
namespace {

int RunBenchmark() {
    auto workload_type = StringToWorkloadType(FLAGS_workload);
    if (!workload_type) {
        LOG(ERROR) << "Unknown workload: " << FLAGS_workload;
        return 1;
    }
    auto backend_type = StringToBackendType(FLAGS_backend);
    if (!backend_type) {
        LOG(ERROR) << "Unknown backend: " << FLAGS_backend;
        return 1;
    }

    // --seed wins over the seed of a properties file.
    uint64_t seed = 0;
    WorkloadDescriptor workload = GetPresetWorkload(workload_type.value());
    if (!FLAGS_properties.empty()) {
        auto loaded =
            LoadWorkloadProperties(workload, FLAGS_properties, &seed);
        if (!loaded) {
            LOG(ERROR) << "Failed to apply properties " << FLAGS_properties
                       << ": " << loaded.error();
            return 1;
        }
        workload = loaded.value();
    }
    if (FLAGS_seed != 0) {
        seed = FLAGS_seed;
    }
    if (seed == 0) {
        std::random_device rd;
        seed = (static_cast<uint64_t>(rd()) << 32) | rd();
    }
    LOG(INFO) << "Workload: " << workload;
    LOG(INFO) << "Seed: " << seed;

    auto backend = CreateStorageBackend(backend_type.value());
    if (!backend) {
        LOG(ERROR) << "Failed to create backend " << backend_type.value()
                   << ": " << backend.error();
        return 1;
    }

    WorkloadStats stats;
    auto load = ExecLoad(workload, *backend.value(), seed, &stats);
    if (!load) {
        LOG(ERROR) << "Load phase failed: " << load.error();
        return 1;
    }
    auto run = ExecRun(workload, *backend.value(), seed, &stats);
    if (!run) {
        LOG(ERROR) << "Run phase failed: " << run.error();
        return 1;
    }

    std::cout << "database: " << backend.value()->Name()
              << ", workload: " << workload.name() << "\n";
    std::cout << "==============================\n";
    std::cout << stats << std::endl;
    return 0;
}

}  // namespace
}  // namespace kvbench

int main(int argc, char** argv) {
    google::InitGoogleLogging("KvBench");
    FLAGS_logtostderr = true;
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    int rc = kvbench::RunBenchmark();

    google::ShutdownGoogleLogging();
    return rc;
}
