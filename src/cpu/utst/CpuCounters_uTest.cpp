/**
 * @file CpuCounters_uTest.cpp
 * @brief Unit tests for pulse::cpu counter parsing and sources.
 *
 * Notes:
 *  - Live /proc/stat tests assert relations, not exact values.
 *  - File-backed tests write fixtures under the system temp directory.
 */

#include "src/cpu/inc/CpuCounters.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

using pulse::cpu::CounterReadStatus;
using pulse::cpu::CpuCategory;
using pulse::cpu::CpuCounterSnapshot;
using pulse::cpu::metricName;
using pulse::cpu::parseProcStat;
using pulse::cpu::ProcStatCounterSource;
using pulse::cpu::toString;

namespace {

constexpr const char* SAMPLE_STAT = "cpu  4705 150 1120 16250 520 0 30 0 0 0\n"
                                    "cpu0 2300 70 560 8100 260 0 15 0 0 0\n"
                                    "cpu1 2405 80 560 8150 260 0 15 0 0 0\n"
                                    "intr 114930548 113199788 3 0 5 263 0 4 0 1 0 0\n"
                                    "ctxt 1990473\n"
                                    "btime 1062191376\n";

} // namespace

/* ----------------------------- Snapshot ----------------------------- */

/** @test Default snapshot is zeroed. */
TEST(CpuCounterSnapshotTest, DefaultZero) {
  const CpuCounterSnapshot SNAP{};
  EXPECT_EQ(SNAP.total, 0U);
  for (const auto V : SNAP.counters) {
    EXPECT_EQ(V, 0U);
  }
}

/** @test updateTotal sums the four categories. */
TEST(CpuCounterSnapshotTest, UpdateTotal) {
  CpuCounterSnapshot snap{};
  snap.counters = {10, 20, 30, 40};
  snap.updateTotal();
  EXPECT_EQ(snap.total, 100U);
  EXPECT_EQ(snap.at(CpuCategory::IDLE), 30U);
}

/** @test Category names match gauge names. */
TEST(CpuCounterSnapshotTest, MetricNames) {
  EXPECT_EQ(std::string(metricName(CpuCategory::USER)), "cpu.user");
  EXPECT_EQ(std::string(metricName(CpuCategory::SYSTEM)), "cpu.system");
  EXPECT_EQ(std::string(metricName(CpuCategory::IDLE)), "cpu.idle");
  EXPECT_EQ(std::string(metricName(CpuCategory::NICE)), "cpu.nice");
}

/* ----------------------------- Parsing ----------------------------- */

/** @test Aggregate line maps /proc/stat column order onto categories. */
TEST(ParseProcStatTest, AggregateLine) {
  CpuCounterSnapshot snap{};
  ASSERT_EQ(parseProcStat(SAMPLE_STAT, snap), CounterReadStatus::OK);

  EXPECT_EQ(snap.at(CpuCategory::USER), 4705U);
  EXPECT_EQ(snap.at(CpuCategory::NICE), 150U);
  EXPECT_EQ(snap.at(CpuCategory::SYSTEM), 1120U);
  EXPECT_EQ(snap.at(CpuCategory::IDLE), 16250U);
  EXPECT_EQ(snap.total, 4705U + 150U + 1120U + 16250U);
}

/** @test Per-core lines alone are not accepted. */
TEST(ParseProcStatTest, PerCoreOnlyFails) {
  CpuCounterSnapshot snap{};
  EXPECT_EQ(parseProcStat("cpu0 1 2 3 4\ncpu1 1 2 3 4\n", snap), CounterReadStatus::PARSE_FAILED);
}

/** @test Too few fields fail. */
TEST(ParseProcStatTest, ShortLineFails) {
  CpuCounterSnapshot snap{};
  EXPECT_EQ(parseProcStat("cpu  1 2 3\n", snap), CounterReadStatus::PARSE_FAILED);
}

/** @test Aggregate line need not be first. */
TEST(ParseProcStatTest, AggregateAfterOtherLines) {
  CpuCounterSnapshot snap{};
  ASSERT_EQ(parseProcStat("ctxt 5\ncpu 1 2 3 4\n", snap), CounterReadStatus::OK);
  EXPECT_EQ(snap.total, 10U);
}

/** @test Null and empty input fail. */
TEST(ParseProcStatTest, EmptyInput) {
  CpuCounterSnapshot snap{};
  EXPECT_EQ(parseProcStat(nullptr, snap), CounterReadStatus::PARSE_FAILED);
  EXPECT_EQ(parseProcStat("", snap), CounterReadStatus::PARSE_FAILED);
}

/* ----------------------------- ProcStatCounterSource ----------------------------- */

class ProcStatSourceFileTest : public ::testing::Test {
protected:
  std::filesystem::path path_;

  void SetUp() override {
    path_ = std::filesystem::temp_directory_path() /
            ("pulse_stat_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
             "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  void writeFile(const std::string& content) {
    std::ofstream out(path_);
    out << content;
  }
};

/** @test Source parses a fixture file and stamps a timestamp. */
TEST_F(ProcStatSourceFileTest, ReadsFixture) {
  writeFile(SAMPLE_STAT);
  ProcStatCounterSource source(path_.string());

  CpuCounterSnapshot snap{};
  ASSERT_EQ(source.read(snap), CounterReadStatus::OK);
  EXPECT_EQ(snap.at(CpuCategory::USER), 4705U);
  EXPECT_GT(snap.timestampNs, 0U);
}

/** @test Malformed file reports PARSE_FAILED and leaves output untouched. */
TEST_F(ProcStatSourceFileTest, MalformedFile) {
  writeFile("garbage\n");
  ProcStatCounterSource source(path_.string());

  CpuCounterSnapshot snap{};
  snap.total = 77;
  EXPECT_EQ(source.read(snap), CounterReadStatus::PARSE_FAILED);
  EXPECT_EQ(snap.total, 77U);
}

/** @test Missing file reports OPEN_FAILED. */
TEST(ProcStatSourceTest, MissingFile) {
  ProcStatCounterSource source("/nonexistent/pulse/stat");
  CpuCounterSnapshot snap{};
  EXPECT_EQ(source.read(snap), CounterReadStatus::OPEN_FAILED);
  EXPECT_EQ(std::string(toString(CounterReadStatus::OPEN_FAILED)), "OPEN_FAILED");
}

/** @test Live /proc/stat reads and is monotonic. */
TEST(ProcStatSourceTest, LiveCountersNonDecreasing) {
  ProcStatCounterSource source;
  EXPECT_EQ(source.path(), "/proc/stat");

  CpuCounterSnapshot first{};
  CpuCounterSnapshot second{};
  ASSERT_EQ(source.read(first), CounterReadStatus::OK);
  ASSERT_EQ(source.read(second), CounterReadStatus::OK);

  EXPECT_GT(first.total, 0U);
  EXPECT_GE(second.total, first.total);
  EXPECT_GE(second.at(CpuCategory::USER), first.at(CpuCategory::USER));
  EXPECT_GE(second.timestampNs, first.timestampNs);
}
