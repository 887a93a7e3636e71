#ifndef IRQMON_MONITOR_MONITOR_HPP
#define IRQMON_MONITOR_MONITOR_HPP
/**
 * @file Monitor.hpp
 * @brief Per-run monitor state and the warm-up / cycle control flow.
 * @note Linux-only. Single-threaded; the CPU statistics sample is the only
 *       blocking call and sets the refresh rate.
 *
 * Usage:
 * @code
 *   Monitor mon(cfg, makeCpuStatsSource(cfg));
 *   std::string err;
 *   if (!mon.warmUp(err)) { ... }
 *   if (!mon.run([] { return g_running != 0; },
 *                [](const std::string& frame) { fmt::print("{}", frame); }, err)) { ... }
 * @endcode
 */

#include "src/cpu/inc/CpuStatsSource.hpp"
#include "src/irq/inc/IrqAffinity.hpp"
#include "src/irq/inc/IrqCollector.hpp"
#include "src/irq/inc/LineMatcher.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace irqmon {

namespace monitor {

/// Tool name shown in the frame header and --version.
inline constexpr std::string_view TOOL_NAME = "irqmon";

/// Tool version.
inline constexpr std::string_view TOOL_VERSION = "1.0.0";

/* ----------------------------- Config ----------------------------- */

/**
 * @brief Monitor settings, filled from the command line.
 */
struct MonitorConfig {
  unsigned intervalSec{1};                             ///< Seconds between frames (>= 1)
  irq::PatternList exclude{};                          ///< Rows never marked changed
  irq::PatternList tracked{};                          ///< Rows whose deltas are totalled
  std::string interruptsPath{irq::PROC_INTERRUPTS};    ///< Hardware source
  std::string softirqsPath{irq::PROC_SOFTIRQS};        ///< Soft source
  std::string procRoot{irq::PROC_ROOT};                ///< Root holding irq/<n>/
  std::uint64_t maxCycles{0};                          ///< 0 = run until interrupted
  bool useMpstat{false};                               ///< CPU stats from mpstat
  bool clearScreen{true};                              ///< Clear between frames
};

/// Longest accepted refresh interval (seconds).
inline constexpr unsigned MAX_INTERVAL_SEC = 86400;

/**
 * @brief Parse the interval positional.
 * @param tok All-digit token in [1, MAX_INTERVAL_SEC].
 * @param out Set on success only.
 */
[[nodiscard]] bool parseInterval(std::string_view tok, unsigned& out) noexcept;

/**
 * @brief Parse the --count value.
 * @param tok All-digit token >= 1.
 * @param out Set on success only.
 */
[[nodiscard]] bool parseCycleCount(std::string_view tok, std::uint64_t& out) noexcept;

/**
 * @brief Apply the positional arguments (at most one interval) to a config.
 * @param error Set to a diagnostic on failure.
 * @return false for an extra positional or an invalid interval.
 */
[[nodiscard]] bool applyPositionals(const std::vector<std::string_view>& positionals,
                                    MonitorConfig& config, std::string& error);

/**
 * @brief Create the CPU statistics source selected by the config.
 */
[[nodiscard]] std::unique_ptr<cpu::CpuStatsSource>
makeCpuStatsSource(const MonitorConfig& config);

/* ----------------------------- Monitor ----------------------------- */

/**
 * @brief Owns the counter tables, tracked totals and CPU source for one run.
 */
class Monitor {
public:
  Monitor(MonitorConfig config, std::unique_ptr<cpu::CpuStatsSource> cpuStats);

  /**
   * @brief First pass over both sources: store baselines only.
   *
   * No row is marked changed. Tracked totals do include this pass.
   *
   * @param error Set to a diagnostic on failure.
   * @return false on any collection error (fatal).
   */
  [[nodiscard]] bool warmUp(std::string& error);

  /**
   * @brief One reporting cycle: collect both sources, sample CPU stats
   *        (blocks for the interval), render a frame.
   * @param frame Replaced with the rendered frame on success.
   * @param error Set to a diagnostic on failure.
   * @return false on any collection or CPU statistics error (fatal).
   */
  [[nodiscard]] bool cycle(std::string& frame, std::string& error);

  /**
   * @brief Run cycles until done() or until keepRunning() returns false.
   *
   * keepRunning() is polled before every cycle and again once the cycle
   * returns; a frame whose interval was interrupted is dropped, and a cycle
   * failure after an interruption is not reported.
   *
   * @param keepRunning Stop request check (signal flag).
   * @param sink Receives each rendered frame.
   * @param error Set to a diagnostic on failure.
   * @return false on a fatal cycle error.
   */
  [[nodiscard]] bool run(const std::function<bool()>& keepRunning,
                         const std::function<void(const std::string&)>& sink,
                         std::string& error);

  /// @brief True once maxCycles reporting cycles have completed.
  [[nodiscard]] bool done() const noexcept;

  [[nodiscard]] const irq::IrqState& state() const noexcept { return state_; }
  [[nodiscard]] const MonitorConfig& config() const noexcept { return config_; }
  [[nodiscard]] std::uint64_t cycles() const noexcept { return cycles_; }

private:
  bool collect(bool firstPass, std::string& error);

  MonitorConfig config_;
  std::unique_ptr<cpu::CpuStatsSource> cpuStats_;
  irq::IrqState state_;
  std::vector<cpu::CpuStatsLine> cpuLines_{};
  std::string toolLabel_;
  std::uint64_t startNs_{0};
  std::uint64_t cycles_{0};
  bool warm_{false};
};

} // namespace monitor

} // namespace irqmon

#endif // IRQMON_MONITOR_MONITOR_HPP
