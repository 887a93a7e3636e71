/**
 * @file Monitor_uTest.cpp
 * @brief Unit tests for irqmon::monitor::Monitor.
 *
 * Notes:
 *  - Sources and the irq/ affinity tree are fixture files in a private
 *    directory; CPU statistics come from a stub that does not sleep.
 */

#include "src/monitor/inc/Monitor.hpp"

#include <gtest/gtest.h>

#include <unistd.h> // getpid

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

using irqmon::cpu::CpuStatsLine;
using irqmon::cpu::CpuStatsSource;
using irqmon::cpu::CpuStatsStatus;
using irqmon::irq::CounterRow;
using irqmon::irq::parsePatternList;
using irqmon::monitor::applyPositionals;
using irqmon::monitor::makeCpuStatsSource;
using irqmon::monitor::MAX_INTERVAL_SEC;
using irqmon::monitor::Monitor;
using irqmon::monitor::MonitorConfig;
using irqmon::monitor::parseCycleCount;
using irqmon::monitor::parseInterval;

namespace fs = std::filesystem;

namespace {

/// CPU statistics stub: fixed lines, no blocking.
class StubCpuStats final : public CpuStatsSource {
public:
  explicit StubCpuStats(CpuStatsStatus status, std::function<void()> onSample = {})
      : status_(status), onSample_(std::move(onSample)) {}

  CpuStatsStatus sample(unsigned /*intervalSec*/, std::vector<CpuStatsLine>& out) override {
    if (onSample_) {
      onSample_();
    }
    out.clear();
    if (status_ == CpuStatsStatus::OK) {
      CpuStatsLine line{};
      line.cpu = 0;
      line.pct.idle = 100.0;
      out.push_back(line);
    }
    return status_;
  }
  const char* name() const noexcept override { return "stub"; }

private:
  CpuStatsStatus status_;
  std::function<void()> onSample_;
};

constexpr const char* HARD_1 = "           CPU0       CPU1       CPU2       CPU3\n"
                               " 95:         10         20         30          0  IR-PCI-MSI eth0\n"
                               " 96:          1          1          1          1  IR-PCI-MSI nvme0q1\n"
                               "LOC:        100        100        100        100  Local timer\n";

constexpr const char* HARD_2 = "           CPU0       CPU1       CPU2       CPU3\n"
                               " 95:         15         25         30          0  IR-PCI-MSI eth0\n"
                               " 96:          2          1          1          1  IR-PCI-MSI nvme0q1\n"
                               "LOC:        100        100        100        100  Local timer\n";

constexpr const char* SOFT_1 = "          CPU0       CPU1       CPU2       CPU3\n"
                               "  TIMER:     5          5          5          5\n";

constexpr const char* SOFT_2 = "          CPU0       CPU1       CPU2       CPU3\n"
                               "  TIMER:     5          5          5          6\n";

} // namespace

class MonitorTest : public ::testing::Test {
protected:
  fs::path dir_{};
  MonitorConfig config_{};

  void SetUp() override {
    dir_ = fs::temp_directory_path() / ("irqmon_monitor_" + std::to_string(::getpid()));
    fs::create_directories(dir_ / "irq" / "96");
    std::ofstream(dir_ / "irq" / "96" / "affinity_hint") << "00000000,00000002\n";
    std::ofstream(dir_ / "irq" / "96" / "smp_affinity_list") << "1\n";

    config_.interruptsPath = (dir_ / "interrupts").string();
    config_.softirqsPath = (dir_ / "softirqs").string();
    config_.procRoot = dir_.string();
    writeSources(HARD_1, SOFT_1);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  void writeSources(const char* hard, const char* soft) {
    std::ofstream(config_.interruptsPath, std::ios::trunc) << hard;
    std::ofstream(config_.softirqsPath, std::ios::trunc) << soft;
  }

  std::unique_ptr<Monitor> make(CpuStatsStatus cpuStatus = CpuStatsStatus::OK,
                                std::function<void()> onSample = {}) {
    return std::make_unique<Monitor>(
        config_, std::make_unique<StubCpuStats>(cpuStatus, std::move(onSample)));
  }
};

/* ----------------------------- Warm-up ----------------------------- */

/** @test The warm-up establishes baselines without changed rows. */
TEST_F(MonitorTest, WarmUpBaseline) {
  auto mon = make();
  std::string error;
  ASSERT_TRUE(mon->warmUp(error)) << error;
  EXPECT_EQ(mon->state().onlineCpus, 4U);
  EXPECT_EQ(mon->state().hard.size(), 3U);
  EXPECT_EQ(mon->state().hard.changedCount(), 0U);
  EXPECT_EQ(mon->state().soft.changedCount(), 0U);
}

/** @test A missing source is fatal and named in the error. */
TEST_F(MonitorTest, WarmUpMissingSource) {
  config_.interruptsPath = (dir_ / "missing").string();
  auto mon = make();
  std::string error;
  EXPECT_FALSE(mon->warmUp(error));
  EXPECT_NE(error.find("SOURCE_UNREADABLE"), std::string::npos);
  EXPECT_NE(error.find("missing"), std::string::npos);
}

/** @test A cycle cannot run before the warm-up. */
TEST_F(MonitorTest, CycleRequiresWarmUp) {
  auto mon = make();
  std::string frame;
  std::string error;
  EXPECT_FALSE(mon->cycle(frame, error));
  EXPECT_FALSE(error.empty());
}

/* ----------------------------- Cycle ----------------------------- */

/** @test End to end: excluded and tracked row counts toward the total only. */
TEST_F(MonitorTest, ExcludedTrackedRow) {
  config_.exclude = parsePatternList("eth");
  config_.tracked = parsePatternList("eth");
  auto mon = make();
  std::string error;
  ASSERT_TRUE(mon->warmUp(error)) << error;
  const std::int64_t AFTER_WARM_UP = mon->state().tracked[0].total;

  writeSources(HARD_2, SOFT_2);
  std::string frame;
  ASSERT_TRUE(mon->cycle(frame, error)) << error;

  const CounterRow* row = mon->state().hard.find("95");
  ASSERT_NE(row, nullptr);
  EXPECT_EQ(row->delta, (std::vector<std::int64_t>{5, 5, 0, 0}));
  EXPECT_FALSE(row->everChanged);
  EXPECT_EQ(mon->state().tracked[0].total - AFTER_WARM_UP, 10);

  EXPECT_EQ(frame.find(" 95:"), std::string::npos);
  EXPECT_NE(frame.find("eth: total="), std::string::npos);
}

/** @test A frame shows changed rows with affinity read from the irq tree. */
TEST_F(MonitorTest, FrameContents) {
  auto mon = make();
  std::string error;
  ASSERT_TRUE(mon->warmUp(error)) << error;

  writeSources(HARD_2, SOFT_2);
  std::string frame;
  ASSERT_TRUE(mon->cycle(frame, error)) << error;

  EXPECT_NE(frame.find("95:"), std::string::npos);
  EXPECT_NE(frame.find("nvme0q1  hint=1,aff=1"), std::string::npos);
  EXPECT_NE(frame.find("eth0  hint=none,aff=none"), std::string::npos);
  EXPECT_NE(frame.find("TIMER:"), std::string::npos);
  EXPECT_EQ(frame.find("LOC:"), std::string::npos);
  EXPECT_NE(frame.find("%idle"), std::string::npos);
  EXPECT_EQ(mon->cycles(), 1U);
}

/** @test A CPU statistics failure is fatal. */
TEST_F(MonitorTest, CpuStatsFailure) {
  auto mon = make(CpuStatsStatus::COMMAND_FAILED);
  std::string error;
  ASSERT_TRUE(mon->warmUp(error)) << error;
  std::string frame;
  EXPECT_FALSE(mon->cycle(frame, error));
  EXPECT_NE(error.find("COMMAND_FAILED"), std::string::npos);
  EXPECT_NE(error.find("stub"), std::string::npos);
}

/** @test A changed CPU count between cycles is fatal. */
TEST_F(MonitorTest, CpuCountChange) {
  auto mon = make();
  std::string error;
  ASSERT_TRUE(mon->warmUp(error)) << error;

  writeSources("  CPU0  CPU1\n 95: 1 2 eth0\n", SOFT_2);
  std::string frame;
  EXPECT_FALSE(mon->cycle(frame, error));
  EXPECT_NE(error.find("CPU_COUNT_MISMATCH"), std::string::npos);
}

/** @test done() reports completion after the configured cycle count. */
TEST_F(MonitorTest, CycleLimit) {
  config_.maxCycles = 2;
  auto mon = make();
  std::string error;
  std::string frame;
  ASSERT_TRUE(mon->warmUp(error)) << error;
  EXPECT_FALSE(mon->done());
  ASSERT_TRUE(mon->cycle(frame, error)) << error;
  EXPECT_FALSE(mon->done());
  ASSERT_TRUE(mon->cycle(frame, error)) << error;
  EXPECT_TRUE(mon->done());
}

/** @test Without a cycle count the monitor never reports done. */
TEST_F(MonitorTest, NoCycleLimit) {
  auto mon = make();
  std::string error;
  std::string frame;
  ASSERT_TRUE(mon->warmUp(error)) << error;
  ASSERT_TRUE(mon->cycle(frame, error)) << error;
  EXPECT_FALSE(mon->done());
}

/* ----------------------------- Run Loop ----------------------------- */

/** @test run() emits one frame per cycle up to the cycle limit. */
TEST_F(MonitorTest, RunUntilCycleLimit) {
  config_.maxCycles = 3;
  auto mon = make();
  std::string error;
  ASSERT_TRUE(mon->warmUp(error)) << error;

  std::vector<std::string> frames;
  EXPECT_TRUE(mon->run([] { return true; },
                       [&frames](const std::string& f) { frames.push_back(f); }, error))
      << error;
  EXPECT_EQ(frames.size(), 3U);
  EXPECT_TRUE(mon->done());
}

/** @test A stop request raised during the CPU sample drops that frame. */
TEST_F(MonitorTest, RunStopDuringSample) {
  bool stop = false;
  auto mon = make(CpuStatsStatus::OK, [&stop] { stop = true; });
  std::string error;
  ASSERT_TRUE(mon->warmUp(error)) << error;

  std::size_t frames = 0;
  EXPECT_TRUE(mon->run([&stop] { return !stop; },
                       [&frames](const std::string& /*f*/) { ++frames; }, error));
  EXPECT_EQ(frames, 0U);
  EXPECT_EQ(mon->cycles(), 1U);
}

/** @test A sampler failing because of the stop request is not an error. */
TEST_F(MonitorTest, RunStopWithSamplerFailure) {
  bool stop = false;
  auto mon = make(CpuStatsStatus::COMMAND_FAILED, [&stop] { stop = true; });
  std::string error;
  ASSERT_TRUE(mon->warmUp(error)) << error;

  std::size_t frames = 0;
  EXPECT_TRUE(mon->run([&stop] { return !stop; },
                       [&frames](const std::string& /*f*/) { ++frames; }, error));
  EXPECT_EQ(frames, 0U);
}

/** @test A sampler failure without a stop request is fatal. */
TEST_F(MonitorTest, RunSamplerFailure) {
  auto mon = make(CpuStatsStatus::COMMAND_FAILED);
  std::string error;
  ASSERT_TRUE(mon->warmUp(error)) << error;
  EXPECT_FALSE(mon->run([] { return true; }, [](const std::string& /*f*/) {}, error));
  EXPECT_NE(error.find("COMMAND_FAILED"), std::string::npos);
}

/* ----------------------------- Arguments ----------------------------- */

/** @test Interval accepts 1 through MAX_INTERVAL_SEC digits only. */
TEST(ParseIntervalTest, Bounds) {
  unsigned v = 7;
  EXPECT_TRUE(parseInterval("1", v));
  EXPECT_EQ(v, 1U);
  EXPECT_TRUE(parseInterval("86400", v));
  EXPECT_EQ(v, MAX_INTERVAL_SEC);

  v = 7;
  EXPECT_FALSE(parseInterval("abc", v));
  EXPECT_FALSE(parseInterval("0", v));
  EXPECT_FALSE(parseInterval("1x", v));
  EXPECT_FALSE(parseInterval("86401", v));
  EXPECT_FALSE(parseInterval("-1", v));
  EXPECT_FALSE(parseInterval("", v));
  EXPECT_FALSE(parseInterval("99999999999999999999999", v));
  EXPECT_EQ(v, 7U);
}

/** @test Cycle count must be a positive integer. */
TEST(ParseCycleCountTest, Values) {
  std::uint64_t n = 0;
  EXPECT_TRUE(parseCycleCount("5", n));
  EXPECT_EQ(n, 5U);
  EXPECT_FALSE(parseCycleCount("0", n));
  EXPECT_FALSE(parseCycleCount("two", n));
  EXPECT_FALSE(parseCycleCount("3s", n));
  EXPECT_EQ(n, 5U);
}

/** @test Positionals: none keeps the default, one sets the interval. */
TEST(ApplyPositionalsTest, Interval) {
  MonitorConfig cfg{};
  std::string error;
  ASSERT_TRUE(applyPositionals({}, cfg, error));
  EXPECT_EQ(cfg.intervalSec, 1U);
  ASSERT_TRUE(applyPositionals({"5"}, cfg, error)) << error;
  EXPECT_EQ(cfg.intervalSec, 5U);
}

/** @test Bad or extra positionals are rejected with a message. */
TEST(ApplyPositionalsTest, Rejected) {
  MonitorConfig cfg{};
  std::string error;
  EXPECT_FALSE(applyPositionals({"abc"}, cfg, error));
  EXPECT_NE(error.find("abc"), std::string::npos);
  EXPECT_FALSE(applyPositionals({"0"}, cfg, error));
  EXPECT_FALSE(applyPositionals({"2", "3"}, cfg, error));
  EXPECT_NE(error.find("'3'"), std::string::npos);
  EXPECT_EQ(cfg.intervalSec, 1U);
}

/* ----------------------------- Source Selection ----------------------------- */

/** @test The config selects the CPU statistics source. */
TEST(MakeCpuStatsSourceTest, Selection) {
  MonitorConfig cfg{};
  EXPECT_STREQ(makeCpuStatsSource(cfg)->name(), "procstat");
  cfg.useMpstat = true;
  EXPECT_STREQ(makeCpuStatsSource(cfg)->name(), "mpstat");
}
