#ifndef IRQMON_CPU_UTILIZATION_HPP
#define IRQMON_CPU_UTILIZATION_HPP
/**
 * @file CpuUtilization.hpp
 * @brief Per-core CPU time breakdown from /proc/stat.
 * @note Linux-only.
 *
 * Snapshot + delta: two /proc/stat snapshots taken an interval apart give
 * per-core percentages in the same columns mpstat reports.
 */

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace irqmon {

namespace cpu {

/// Maximum CPUs tracked in a snapshot.
inline constexpr std::size_t STAT_MAX_CPUS = 256;

/// Default CPU time source.
inline constexpr const char* PROC_STAT = "/proc/stat";

/* ----------------------------- Raw Counters ----------------------------- */

/**
 * @brief Raw CPU time counters from /proc/stat (in jiffies, cumulative).
 */
struct CpuTimeCounters {
  std::uint64_t user{0};      ///< Time in user mode
  std::uint64_t nice{0};      ///< Time in user mode with low priority
  std::uint64_t system{0};    ///< Time in kernel mode
  std::uint64_t idle{0};      ///< Time in idle task
  std::uint64_t iowait{0};    ///< Time waiting for I/O
  std::uint64_t irq{0};       ///< Time servicing hardware interrupts
  std::uint64_t softirq{0};   ///< Time servicing software interrupts
  std::uint64_t steal{0};     ///< Time stolen by hypervisor
  std::uint64_t guest{0};     ///< Time running guest OS
  std::uint64_t guestNice{0}; ///< Time running niced guest OS

  /// Total time across all fields except guest time, which the kernel
  /// already folds into user/nice.
  [[nodiscard]] std::uint64_t total() const noexcept;
};

/**
 * @brief Snapshot of CPU time counters for all CPUs.
 */
struct CpuUtilizationSnapshot {
  CpuTimeCounters perCore[STAT_MAX_CPUS]{}; ///< Indexed by CPU id
  bool present[STAT_MAX_CPUS]{};            ///< cpuN line seen (offline CPUs have none)
  std::size_t coreCount{0};                 ///< Highest CPU id seen + 1
  std::uint64_t timestampNs{0};             ///< Monotonic timestamp (ns)
};

/* ----------------------------- Percentages ----------------------------- */

/**
 * @brief CPU utilization percentages (0-100 scale), mpstat column order.
 */
struct CpuUtilizationPercent {
  double user{0.0};    ///< %usr
  double nice{0.0};    ///< %nice
  double system{0.0};  ///< %sys
  double iowait{0.0};  ///< %iowait
  double irq{0.0};     ///< %irq
  double softirq{0.0}; ///< %soft
  double steal{0.0};   ///< %steal
  double guest{0.0};   ///< %guest
  double idle{0.0};    ///< %idle
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse /proc/stat text into a snapshot.
 * @param text File contents; only "cpuN" lines are used.
 * @param out Snapshot (counters replaced; timestampNs left untouched).
 * @return true if at least one per-CPU line was found.
 */
[[nodiscard]] bool parseProcStat(std::string_view text, CpuUtilizationSnapshot& out) noexcept;

/**
 * @brief Capture /proc/stat counters.
 * @param path Source file (normally PROC_STAT).
 * @param out Snapshot with timestamp set.
 * @return false if the file could not be read or held no cpuN line.
 */
[[nodiscard]] bool getCpuUtilizationSnapshot(const char* path,
                                             CpuUtilizationSnapshot& out) noexcept;

/**
 * @brief Percentages for one CPU between two counter samples.
 * @return All zeros if no time elapsed or counters went backwards.
 */
[[nodiscard]] CpuUtilizationPercent computePercent(const CpuTimeCounters& before,
                                                   const CpuTimeCounters& after) noexcept;

} // namespace cpu

} // namespace irqmon

#endif // IRQMON_CPU_UTILIZATION_HPP
