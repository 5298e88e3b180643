/**
 * @file Gauge_uTest.cpp
 * @brief Unit tests for pulse::metrics gauges and batches.
 */

#include "src/metrics/inc/Gauge.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <thread>
#include <vector>

using pulse::metrics::Gauge;
using pulse::metrics::MetricsBatch;

/* ----------------------------- Gauge ----------------------------- */

/** @test New gauge reads zero and keeps its name. */
TEST(GaugeTest, DefaultZero) {
  const Gauge G("cpu.user");
  EXPECT_EQ(G.name(), "cpu.user");
  EXPECT_EQ(G.value(), 0.0);
}

/** @test update replaces the value. */
TEST(GaugeTest, LastValueWins) {
  Gauge g("cpu.idle");
  g.update(12.5);
  g.update(40.0);
  EXPECT_DOUBLE_EQ(g.value(), 40.0);
}

/** @test fill appends one named sample. */
TEST(GaugeTest, FillAppends) {
  Gauge g("system.load_avg");
  g.update(1.25);

  MetricsBatch batch;
  g.fill(batch);
  g.fill(batch);

  ASSERT_EQ(batch.size(), 2U);
  EXPECT_EQ(batch.samples[0].name, "system.load_avg");
  EXPECT_DOUBLE_EQ(batch.samples[0].value, 1.25);
  EXPECT_GT(batch.samples[0].timestampNs, 0U);
  EXPECT_GE(batch.samples[1].timestampNs, batch.samples[0].timestampNs);
}

/** @test Concurrent updates never tear the stored value. */
TEST(GaugeTest, ConcurrentUpdates) {
  Gauge g("cpu.system");
  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&g, t] {
      for (int i = 0; i < 1000; ++i) {
        g.update(static_cast<double>(t));
      }
    });
  }
  for (auto& w : writers) {
    w.join();
  }

  const double V = g.value();
  EXPECT_TRUE(V == 0.0 || V == 1.0 || V == 2.0 || V == 3.0);
}

/* ----------------------------- MetricsBatch ----------------------------- */

/** @test valueOf finds by name or falls back. */
TEST(MetricsBatchTest, ValueOf) {
  MetricsBatch batch;
  batch.add("a", 1.0, 1);
  batch.add("b", 2.0, 2);

  EXPECT_DOUBLE_EQ(batch.valueOf("b"), 2.0);
  EXPECT_DOUBLE_EQ(batch.valueOf("missing", -1.0), -1.0);
}

/** @test clear empties the batch. */
TEST(MetricsBatchTest, Clear) {
  MetricsBatch batch;
  EXPECT_TRUE(batch.empty());
  batch.add("a", 1.0, 1);
  EXPECT_FALSE(batch.empty());
  batch.clear();
  EXPECT_TRUE(batch.empty());
}

/** @test Text rendering lists one gauge per line. */
TEST(MetricsBatchTest, ToString) {
  MetricsBatch batch;
  batch.add("cpu.user", 42.0, 1);
  batch.add("cpu.idle", 58.0, 1);

  const std::string TEXT = batch.toString();
  EXPECT_NE(TEXT.find("cpu.user"), std::string::npos);
  EXPECT_NE(TEXT.find("42.00"), std::string::npos);
  EXPECT_NE(TEXT.find("58.00"), std::string::npos);
  EXPECT_EQ(std::count(TEXT.begin(), TEXT.end(), '\n'), 2);
}

/** @test JSON rendering is a flat object keyed by name. */
TEST(MetricsBatchTest, ToJson) {
  MetricsBatch batch;
  EXPECT_EQ(batch.toJson(), "{}");

  batch.add("cpu.user", 42.5, 1);
  batch.add("cpu.idle", 57.5, 1);
  EXPECT_EQ(batch.toJson(), "{\"cpu.user\": 42.5000, \"cpu.idle\": 57.5000}");
}
