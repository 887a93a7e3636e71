#ifndef IRQMON_MONITOR_PRESENTER_HPP
#define IRQMON_MONITOR_PRESENTER_HPP
/**
 * @file Presenter.hpp
 * @brief Render one monitor frame as text.
 *
 * Frame layout:
 *   header line (tool, interval, elapsed)
 *   per-CPU utilization table
 *   column header (CPU labels from the /proc/interrupts header)
 *   changed rows of both tables, merged and sorted by name
 *   one summary line per tracked pattern
 *
 * Affinity is looked up through a callback at render time so tests can
 * supply fixed values instead of reading /proc/irq.
 */

#include "src/cpu/inc/CpuStatsSource.hpp"
#include "src/irq/inc/IrqAffinity.hpp"
#include "src/irq/inc/IrqCollector.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace irqmon {

namespace monitor {

/// Affinity lookup for a numeric row name.
using AffinityLookup = std::function<irq::IrqAffinity(std::string_view irqName)>;

/* ----------------------------- Summary ----------------------------- */

/**
 * @brief Derived figures for one tracked total.
 */
struct TrackedSummary {
  std::int64_t total{0};     ///< Accumulated delta since start
  double perCpu{0.0};        ///< total / onlineCpus
  double perSec{0.0};        ///< total / intervalSec
  double perSecPerCpu{0.0};  ///< total / intervalSec / onlineCpus
};

/**
 * @brief Compute summary figures.
 * @return Figures whose divisor is zero are reported as 0.
 */
[[nodiscard]] TrackedSummary summarizeTracked(std::int64_t total, std::size_t onlineCpus,
                                              unsigned intervalSec) noexcept;

/* ----------------------------- Rendering ----------------------------- */

/**
 * @brief Per-frame values not held in IrqState.
 */
struct FrameInfo {
  std::string_view tool{};  ///< Tool name and version for the header
  unsigned intervalSec{1};  ///< Refresh interval
  double elapsedSec{0.0};   ///< Time since the monitor started
};

/**
 * @brief Render one counter row.
 * @param row Row to render (its delta vector supplies the CPU columns).
 * @param nameWidth Width of the name column.
 * @param affinity Appended verbatim if non-empty.
 * @return Line without trailing newline.
 */
[[nodiscard]] std::string renderRow(const irq::CounterRow& row, std::size_t nameWidth,
                                    std::string_view affinity);

/**
 * @brief Render the per-CPU utilization table.
 * @return Header plus one line per CPU, newline-terminated.
 */
[[nodiscard]] std::string renderCpuTable(const std::vector<cpu::CpuStatsLine>& lines);

/**
 * @brief Render the tracked-total summary lines.
 * @return One newline-terminated line per tracked pattern.
 */
[[nodiscard]] std::string renderSummary(const std::vector<irq::TrackedTotal>& tracked,
                                        std::size_t onlineCpus, unsigned intervalSec);

/**
 * @brief Render a full frame.
 * @param state Counter tables and totals.
 * @param cpuLines Utilization for the last interval.
 * @param info Header values.
 * @param affinity Called once per changed numeric row; may be empty to skip
 *                 the affinity block entirely.
 */
[[nodiscard]] std::string renderFrame(const irq::IrqState& state,
                                      const std::vector<cpu::CpuStatsLine>& cpuLines,
                                      const FrameInfo& info, const AffinityLookup& affinity);

} // namespace monitor

} // namespace irqmon

#endif // IRQMON_MONITOR_PRESENTER_HPP
