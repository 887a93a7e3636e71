#ifndef IRQMON_CPU_STATS_SOURCE_HPP
#define IRQMON_CPU_STATS_SOURCE_HPP
/**
 * @file CpuStatsSource.hpp
 * @brief Per-CPU utilization for one sampling interval.
 * @note Linux-only.
 *
 * A sample() call blocks for the whole interval; the monitor loop uses it as
 * its only sleep. Two sources are available:
 *  - ProcStatCpuStats: two /proc/stat snapshots around a sleep (default)
 *  - MpstatCpuStats:   runs "mpstat -P ALL <interval> 1" and parses its rows
 */

#include "src/cpu/inc/CpuUtilization.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace irqmon {

namespace cpu {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Status codes for a CPU statistics sample.
 */
enum class CpuStatsStatus : std::uint8_t {
  OK = 0,
  SOURCE_UNREADABLE, ///< /proc/stat could not be read
  COMMAND_FAILED,    ///< mpstat could not be started or exited non-zero
  NO_DATA,           ///< Source produced no per-CPU rows
};

/// Human-readable status string.
[[nodiscard]] const char* toString(CpuStatsStatus status) noexcept;

/**
 * @brief Utilization of one CPU over the last interval.
 */
struct CpuStatsLine {
  std::size_t cpu{0};          ///< CPU id
  CpuUtilizationPercent pct{}; ///< Percentages, mpstat columns
};

/* ----------------------------- Interface ----------------------------- */

/**
 * @brief Source of per-CPU utilization samples.
 */
class CpuStatsSource {
public:
  virtual ~CpuStatsSource() = default;

  /**
   * @brief Block for intervalSec seconds and report per-CPU utilization.
   * @param intervalSec Sampling interval (>= 1).
   * @param out Replaced with one line per CPU, ascending by id.
   */
  [[nodiscard]] virtual CpuStatsStatus sample(unsigned intervalSec,
                                              std::vector<CpuStatsLine>& out) = 0;

  /// Short name for diagnostics.
  [[nodiscard]] virtual const char* name() const noexcept = 0;
};

/**
 * @brief /proc/stat snapshot, sleep, snapshot.
 */
class ProcStatCpuStats final : public CpuStatsSource {
public:
  explicit ProcStatCpuStats(std::string path = PROC_STAT);

  [[nodiscard]] CpuStatsStatus sample(unsigned intervalSec,
                                      std::vector<CpuStatsLine>& out) override;
  [[nodiscard]] const char* name() const noexcept override { return "procstat"; }

private:
  std::string path_;
};

/**
 * @brief External "mpstat" from sysstat.
 */
class MpstatCpuStats final : public CpuStatsSource {
public:
  [[nodiscard]] CpuStatsStatus sample(unsigned intervalSec,
                                      std::vector<CpuStatsLine>& out) override;
  [[nodiscard]] const char* name() const noexcept override { return "mpstat"; }
};

/* ----------------------------- Helpers ----------------------------- */

/**
 * @brief Command line run by MpstatCpuStats.
 * @return e.g. "LC_ALL=C mpstat -P ALL 2 1 2>/dev/null".
 */
[[nodiscard]] std::string mpstatCommand(unsigned intervalSec);

/**
 * @brief Extract per-CPU rows from mpstat output.
 *
 * Row layout: "time [AM|PM] cpu %usr %nice %sys %iowait %irq %soft %steal
 * %guest [%gnice] %idle". The banner, column headers, the "all" row, blank
 * lines and the "Average:" block are skipped, as are rows that do not parse.
 *
 * @param text Full command output.
 * @return Rows in output order.
 */
[[nodiscard]] std::vector<CpuStatsLine> parseMpstatOutput(std::string_view text);

} // namespace cpu

} // namespace irqmon

#endif // IRQMON_CPU_STATS_SOURCE_HPP
