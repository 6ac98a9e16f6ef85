#include "latency_histogram.h"

#include <glog/logging.h>
#include <gtest/gtest.h>

#include <random>
#include <stdexcept>

namespace kvbench {

class LatencyHistogramTest : public ::testing::Test {
   protected:
    void SetUp() override {
        google::InitGoogleLogging("LatencyHistogramTest");
        FLAGS_logtostderr = true;
    }

    void TearDown() override { google::ShutdownGoogleLogging(); }
};

TEST_F(LatencyHistogramTest, RejectsInvalidLayout) {
    EXPECT_THROW(LatencyHistogram(0, 1000, 3), std::invalid_argument);
    EXPECT_THROW(LatencyHistogram(10, 15, 3), std::invalid_argument);
    EXPECT_THROW(LatencyHistogram(1, 1000, 0), std::invalid_argument);
    EXPECT_THROW(LatencyHistogram(1, 1000, 6), std::invalid_argument);
}

TEST_F(LatencyHistogramTest, EmptyHasNoPercentiles) {
    LatencyHistogram hist;
    EXPECT_TRUE(hist.IsEmpty());
    EXPECT_EQ(0u, hist.TotalCount());
    EXPECT_FALSE(hist.ValueAtQuantile(0.5).has_value());
    EXPECT_FALSE(hist.ValueAtQuantile(0.999).has_value());
    EXPECT_EQ(0u, hist.Min());
    EXPECT_EQ(0u, hist.Max());
    EXPECT_EQ(0.0, hist.Mean());
}

TEST_F(LatencyHistogramTest, ExactBelowSubBucketRange) {
    LatencyHistogram hist;
    for (uint64_t v = 1; v <= 1000; ++v) {
        hist.Record(v);
    }
    EXPECT_EQ(1000u, hist.TotalCount());
    EXPECT_EQ(500u, hist.ValueAtQuantile(0.50).value());
    EXPECT_EQ(950u, hist.ValueAtQuantile(0.95).value());
    EXPECT_EQ(990u, hist.ValueAtQuantile(0.99).value());
    EXPECT_EQ(999u, hist.ValueAtQuantile(0.999).value());
    EXPECT_EQ(1000u, hist.ValueAtQuantile(1.0).value());
    EXPECT_EQ(1u, hist.ValueAtQuantile(0.0).value());
    EXPECT_EQ(1u, hist.Min());
    EXPECT_EQ(1000u, hist.Max());
    EXPECT_DOUBLE_EQ(500.5, hist.Mean());
}

TEST_F(LatencyHistogramTest, RelativeErrorWithinPrecision) {
    LatencyHistogram hist;
    for (uint64_t v : {1000ull, 2048ull, 4097ull, 123456ull, 9999999ull}) {
        uint64_t low = hist.LowestEquivalentValue(v);
        uint64_t high = hist.HighestEquivalentValue(v);
        EXPECT_LE(low, v);
        EXPECT_GE(high, v);
        EXPECT_LE((high - low + 1) * 1000, v) << "value " << v;
    }
}

TEST_F(LatencyHistogramTest, PercentilesAreMonotone) {
    LatencyHistogram hist;
    std::mt19937_64 engine(1);
    std::lognormal_distribution<double> latency(5.0, 1.5);
    for (int i = 0; i < 20000; ++i) {
        hist.Record(static_cast<uint64_t>(latency(engine)) + 1);
    }
    uint64_t previous = 0;
    for (double q : {0.0, 0.1, 0.5, 0.9, 0.95, 0.99, 0.999, 1.0}) {
        uint64_t value = hist.ValueAtQuantile(q).value();
        EXPECT_GE(value, previous) << "quantile " << q;
        previous = value;
    }
    EXPECT_LE(hist.ValueAtQuantile(1.0).value(), hist.Max());
}

TEST_F(LatencyHistogramTest, ClampsAboveHighest) {
    LatencyHistogram hist;
    hist.Record(5);
    hist.Record(20'000'000);
    EXPECT_EQ(2u, hist.TotalCount());
    EXPECT_EQ(1u, hist.SaturatedCount());
    uint64_t max = hist.ValueAtQuantile(1.0).value();
    EXPECT_GE(max, DEFAULT_HISTOGRAM_HIGHEST_US);
    EXPECT_LE(hist.LowestEquivalentValue(max), DEFAULT_HISTOGRAM_HIGHEST_US);
}

TEST_F(LatencyHistogramTest, AddIsCommutativeAndAssociative) {
    LatencyHistogram a, b, c;
    std::mt19937_64 engine(2);
    std::uniform_int_distribution<uint64_t> dist(1, 100000);
    for (int i = 0; i < 3000; ++i) {
        a.Record(dist(engine));
        b.Record(dist(engine) / 10 + 1);
        c.Record(dist(engine) * 10);
    }

    LatencyHistogram ab = a;
    ASSERT_TRUE(ab.Add(b).has_value());
    LatencyHistogram ba = b;
    ASSERT_TRUE(ba.Add(a).has_value());

    LatencyHistogram ab_c = ab;
    ASSERT_TRUE(ab_c.Add(c).has_value());
    LatencyHistogram bc = b;
    ASSERT_TRUE(bc.Add(c).has_value());
    LatencyHistogram a_bc = a;
    ASSERT_TRUE(a_bc.Add(bc).has_value());

    EXPECT_EQ(6000u, ab.TotalCount());
    EXPECT_EQ(9000u, a_bc.TotalCount());
    for (double q : {0.0, 0.5, 0.95, 0.99, 0.999, 1.0}) {
        EXPECT_EQ(ab.ValueAtQuantile(q), ba.ValueAtQuantile(q));
        EXPECT_EQ(ab_c.ValueAtQuantile(q), a_bc.ValueAtQuantile(q));
    }
}

TEST_F(LatencyHistogramTest, AddRejectsDifferentLayout) {
    LatencyHistogram a;
    LatencyHistogram b(1, 1000, 2);
    b.Record(10);
    auto res = a.Add(b);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(ErrorCode::INVALID_PARAMS, res.error());
    EXPECT_TRUE(a.IsEmpty());
}

TEST_F(LatencyHistogramTest, ResetClearsCounts) {
    LatencyHistogram hist;
    hist.Record(10);
    hist.Record(99'000'000);
    hist.Reset();
    EXPECT_TRUE(hist.IsEmpty());
    EXPECT_EQ(0u, hist.SaturatedCount());
    EXPECT_FALSE(hist.ValueAtQuantile(0.5).has_value());
}

}  // namespace kvbench
