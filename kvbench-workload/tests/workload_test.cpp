#include "workload.h"

#include <glog/logging.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

#include "default_config.h"

namespace kvbench {

class WorkloadTest : public ::testing::Test {
   protected:
    void SetUp() override {
        google::InitGoogleLogging("WorkloadTest");
        FLAGS_logtostderr = true;
        dir_ = std::filesystem::temp_directory_path() /
               ("kvbench_workload_test_" + std::to_string(::getpid()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
        google::ShutdownGoogleLogging();
    }

    std::string WriteFile(const std::string& name, const std::string& body) {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << body;
        return path.string();
    }

    static WorkloadDescriptor WithMix(double read, double write) {
        return WorkloadDescriptor("Mix", 10, 10, read, write, 8, {16, 32}, 1);
    }

    std::filesystem::path dir_;
};

TEST_F(WorkloadTest, Presets) {
    auto read_write = GetPresetWorkload(WorkloadType::READ_WRITE);
    EXPECT_EQ("ReadWrite", read_write.name());
    EXPECT_EQ(10000u, read_write.load_insert_count());
    EXPECT_EQ(8000u, read_write.operation_count());
    EXPECT_DOUBLE_EQ(0.5, read_write.read_percent());
    EXPECT_DOUBLE_EQ(0.5, read_write.write_percent());
    EXPECT_EQ(128u, read_write.key_size());
    EXPECT_EQ(512u, read_write.value_size_range().min);
    EXPECT_EQ(1024u, read_write.value_size_range().max);
    EXPECT_EQ(16u, read_write.thread_count());

    auto read_heavy = GetPresetWorkload(WorkloadType::READ_HEAVY);
    EXPECT_EQ("ReadHeavy", read_heavy.name());
    EXPECT_DOUBLE_EQ(0.95, read_heavy.read_percent());
    EXPECT_DOUBLE_EQ(0.05, read_heavy.write_percent());

    auto read_only = GetPresetWorkload(WorkloadType::READ_ONLY);
    EXPECT_EQ("ReadOnly", read_only.name());
    EXPECT_DOUBLE_EQ(1.0, read_only.read_percent());
    EXPECT_DOUBLE_EQ(0.0, read_only.write_percent());

    for (auto type : {WorkloadType::READ_WRITE, WorkloadType::READ_HEAVY,
                      WorkloadType::READ_ONLY}) {
        EXPECT_TRUE(ValidateWorkload(GetPresetWorkload(type)).has_value());
    }
}

TEST_F(WorkloadTest, WorkloadTypeNames) {
    EXPECT_EQ(WorkloadType::READ_WRITE, StringToWorkloadType("read_write"));
    EXPECT_EQ(WorkloadType::READ_HEAVY, StringToWorkloadType("read_heavy"));
    EXPECT_EQ(WorkloadType::READ_ONLY, StringToWorkloadType("read_only"));
    EXPECT_EQ("read_heavy", WorkloadTypeToString(WorkloadType::READ_HEAVY));
    EXPECT_FALSE(StringToWorkloadType("range_scan").has_value());
}

TEST_F(WorkloadTest, ValidateRejectsBadMix) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    for (auto mix : {std::make_pair(1.2, 0.0), std::make_pair(-0.1, 0.5),
                     std::make_pair(0.5, 1.5), std::make_pair(nan, 0.5),
                     std::make_pair(0.5, nan), std::make_pair(0.0, 0.0),
                     std::make_pair(0.6, 0.6)}) {
        auto res = ValidateWorkload(WithMix(mix.first, mix.second));
        ASSERT_FALSE(res.has_value())
            << "read=" << mix.first << " write=" << mix.second;
        EXPECT_EQ(ErrorCode::INVALID_CONFIG, res.error());
    }
}

TEST_F(WorkloadTest, ValidateAcceptsPartialMix) {
    EXPECT_TRUE(ValidateWorkload(WithMix(0.4, 0.4)).has_value());
    EXPECT_TRUE(ValidateWorkload(WithMix(0.0, 1.0)).has_value());
    EXPECT_TRUE(ValidateWorkload(WithMix(0.0, 0.01)).has_value());
}

TEST_F(WorkloadTest, ValidateRejectsEmptyValueRange) {
    WorkloadDescriptor equal("Equal", 10, 10, 0.5, 0.5, 8, {32, 32}, 1);
    WorkloadDescriptor inverted("Inverted", 10, 10, 0.5, 0.5, 8, {64, 32}, 1);
    EXPECT_EQ(ErrorCode::INVALID_CONFIG, ValidateWorkload(equal).error());
    EXPECT_EQ(ErrorCode::INVALID_CONFIG, ValidateWorkload(inverted).error());
}

TEST_F(WorkloadTest, ValidateRejectsEmptyKeySpace) {
    WorkloadDescriptor empty("Empty", 0, 10, 0.5, 0.5, 8, {16, 32}, 1);
    auto res = ValidateWorkload(empty);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(ErrorCode::INVALID_CONFIG, res.error());
    EXPECT_TRUE(ValidateWorkload(WorkloadDescriptor(
                    "One", 1, 0, 0.5, 0.5, 8, {16, 32}, 1))
                    .has_value());
}

TEST_F(WorkloadTest, PrintsAllFields) {
    std::ostringstream os;
    os << GetPresetWorkload(WorkloadType::READ_HEAVY);
    EXPECT_NE(std::string::npos, os.str().find("name=ReadHeavy"));
    EXPECT_NE(std::string::npos, os.str().find("value_size_range=[512, 1024)"));
    EXPECT_NE(std::string::npos, os.str().find("thread_count=16"));
}

TEST_F(WorkloadTest, PropertiesOverrideOnlyPresentKeys) {
    DefaultConfig properties;
    properties.SetPath(WriteFile("overlay.yaml",
                                 "workload:\n"
                                 "  name: Small\n"
                                 "  thread_count: 2\n"
                                 "  value_size_max: 600\n"));
    properties.Load();

    auto base = GetPresetWorkload(WorkloadType::READ_HEAVY);
    auto workload = ApplyWorkloadProperties(base, properties);
    ASSERT_TRUE(workload.has_value());
    EXPECT_EQ("Small", workload->name());
    EXPECT_EQ(2u, workload->thread_count());
    EXPECT_EQ(600u, workload->value_size_range().max);
    EXPECT_EQ(base.value_size_range().min, workload->value_size_range().min);
    EXPECT_EQ(base.load_insert_count(), workload->load_insert_count());
    EXPECT_EQ(base.operation_count(), workload->operation_count());
    EXPECT_DOUBLE_EQ(base.read_percent(), workload->read_percent());
    EXPECT_DOUBLE_EQ(base.write_percent(), workload->write_percent());
    EXPECT_EQ(base.key_size(), workload->key_size());
}

TEST_F(WorkloadTest, LoadPropertiesFromJsonWithSeed) {
    std::string path = WriteFile("props.json",
                                 R"({"seed": 99, "workload": {)"
                                 R"("read_percent": 0.7, "write_percent": 0.3,)"
                                 R"("operation_count": 12}})");
    uint64_t seed = 1;
    auto workload = LoadWorkloadProperties(
        GetPresetWorkload(WorkloadType::READ_WRITE), path, &seed);
    ASSERT_TRUE(workload.has_value());
    EXPECT_EQ(99u, seed);
    EXPECT_DOUBLE_EQ(0.7, workload->read_percent());
    EXPECT_DOUBLE_EQ(0.3, workload->write_percent());
    EXPECT_EQ(12u, workload->operation_count());
    EXPECT_EQ("ReadWrite", workload->name());
}

TEST_F(WorkloadTest, LoadPropertiesKeepsSeedWhenAbsent) {
    std::string path = WriteFile("noseed.yaml", "workload:\n  key_size: 4\n");
    uint64_t seed = 5;
    auto workload = LoadWorkloadProperties(
        GetPresetWorkload(WorkloadType::READ_WRITE), path, &seed);
    ASSERT_TRUE(workload.has_value());
    EXPECT_EQ(5u, seed);
    EXPECT_EQ(4u, workload->key_size());
}

TEST_F(WorkloadTest, LoadPropertiesRejectsInvalidInput) {
    auto base = GetPresetWorkload(WorkloadType::READ_WRITE);
    uint64_t seed = 0;

    auto missing =
        LoadWorkloadProperties(base, (dir_ / "missing.yaml").string(), &seed);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(ErrorCode::INVALID_CONFIG, missing.error());

    auto unsupported = LoadWorkloadProperties(
        base, WriteFile("props.txt", "seed: 1\n"), &seed);
    ASSERT_FALSE(unsupported.has_value());
    EXPECT_EQ(ErrorCode::INVALID_CONFIG, unsupported.error());

    auto bad_value = LoadWorkloadProperties(
        base, WriteFile("bad.yaml", "workload:\n  read_percent: lots\n"),
        &seed);
    ASSERT_FALSE(bad_value.has_value());
    EXPECT_EQ(ErrorCode::INVALID_CONFIG, bad_value.error());

    auto over_one = LoadWorkloadProperties(
        base,
        WriteFile("sum.yaml",
                  "workload:\n  read_percent: 0.8\n  write_percent: 0.8\n"),
        &seed);
    ASSERT_FALSE(over_one.has_value());
    EXPECT_EQ(ErrorCode::INVALID_CONFIG, over_one.error());
}

}  // namespace kvbench
