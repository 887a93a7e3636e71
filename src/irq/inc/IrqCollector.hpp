#ifndef IRQMON_IRQ_IRQ_COLLECTOR_HPP
#define IRQMON_IRQ_IRQ_COLLECTOR_HPP
/**
 * @file IrqCollector.hpp
 * @brief Feed /proc/interrupts and /proc/softirqs into CounterTables.
 * @note Linux-only sources; parsing functions accept text for testing.
 * @note NOT thread-safe: mutates the caller's IrqState.
 *
 * Source format (both files):
 *   header: "           CPU0       CPU1 ..."
 *   rows:   "  95:   10   20   IR-PCI-MSI 524288-edge  eth0"
 *
 * The hardware header fixes the online CPU count for the whole run. The
 * softirq header may list more (possible) CPUs; extra columns are skipped.
 */

#include "src/irq/inc/CounterTable.hpp"
#include "src/irq/inc/LineMatcher.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace irqmon {

namespace irq {

/// Default hardware interrupt source.
inline constexpr const char* PROC_INTERRUPTS = "/proc/interrupts";

/// Default soft interrupt source.
inline constexpr const char* PROC_SOFTIRQS = "/proc/softirqs";

/* ----------------------------- Status ----------------------------- */

/**
 * @brief Outcome of one collection pass. Every non-OK value is fatal.
 */
enum class CollectStatus : std::uint8_t {
  OK = 0,
  SOURCE_UNREADABLE,  ///< Source could not be opened or read
  MISSING_HEADER,     ///< First line lists no CPU columns
  MALFORMED_LINE,     ///< Row without ':' or with fewer counts than online CPUs
  CPU_COUNT_MISMATCH, ///< Header column count incompatible with online CPUs
  NO_ONLINE_CPUS,     ///< Softirqs collected before the hardware header was seen
};

/// Human-readable status string.
[[nodiscard]] const char* toString(CollectStatus status) noexcept;

/**
 * @brief Status plus the 1-based source line it refers to (0 = whole source).
 */
struct CollectResult {
  CollectStatus status{CollectStatus::OK};
  std::size_t line{0};

  [[nodiscard]] bool ok() const noexcept { return status == CollectStatus::OK; }

  /// @brief Diagnostic such as "MALFORMED_LINE at line 7".
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief One counter row as read from the source, before it is applied.
 * @note Views reference the source text.
 */
struct ParsedRow {
  std::string_view raw{};               ///< Full source line
  std::string_view name{};              ///< Text before ':'
  std::vector<std::uint64_t> values{};  ///< One count per used CPU column
  std::vector<std::string_view> desc{}; ///< Tokens after the counts
  std::size_t lineNo{0};                ///< 1-based line number
};

/**
 * @brief Whole source split into header column count and rows.
 */
struct ParsedSource {
  std::size_t headerCpus{0};                    ///< CPU columns listed in the header
  std::vector<std::string_view> headerLabels{}; ///< Header tokens ("CPU0", "CPU2", ...)
  std::vector<ParsedRow> rows{};
};

/**
 * @brief Parse counter source text.
 * @param text Entire file contents.
 * @param usedCpus Columns to keep per row; 0 means "all header columns".
 *                 Must not exceed the header column count.
 * @param out Parsed result (replaced).
 * @return OK, MISSING_HEADER, CPU_COUNT_MISMATCH or MALFORMED_LINE.
 *
 * After usedCpus counts, up to (headerCpus - usedCpus) further numeric
 * tokens are skipped; the remaining tokens are description. A row holding a
 * single count and nothing else (ERR:, MIS:) is accepted as a kernel-wide
 * counter: the value lands in column 0 and the other columns are 0.
 */
[[nodiscard]] CollectResult parseCounterSource(std::string_view text, std::size_t usedCpus,
                                               ParsedSource& out);

/* ----------------------------- State ----------------------------- */

/**
 * @brief Running total for one tracked pattern.
 */
struct TrackedTotal {
  LinePattern pattern{};
  std::int64_t total{0}; ///< Sum of matching rows' deltas since start
};

/**
 * @brief All mutable monitoring state; one instance per run.
 */
struct IrqState {
  CounterTable hard{};                ///< /proc/interrupts rows
  CounterTable soft{};                ///< /proc/softirqs rows
  std::size_t onlineCpus{0};          ///< Set by the first hardware collection
  std::vector<std::string> cpuLabels{}; ///< Hardware header labels of the last pass
  std::vector<TrackedTotal> tracked{}; ///< One entry per tracked pattern, in order

  /// @brief Create state tracking the given patterns (totals start at 0).
  [[nodiscard]] static IrqState withTracked(const PatternList& patterns);
};

/* ----------------------------- Collection ----------------------------- */

/**
 * @brief Apply parsed rows to a table and the tracked totals.
 * @param src Parsed source (rows must have identical value counts).
 * @param firstPass True for the warm-up pass (never marks rows changed).
 * @param exclude Lines matching these never mark their row changed.
 * @param table Table to update.
 * @param tracked Totals to accumulate into; every matching pattern receives
 *                the row's delta total, on every pass.
 */
void applyParsedSource(const ParsedSource& src, bool firstPass, const PatternList& exclude,
                       CounterTable& table, std::vector<TrackedTotal>& tracked);

/**
 * @brief Collect hardware interrupts from text.
 * @return CPU_COUNT_MISMATCH if the header width differs from an earlier pass.
 * @note Sets state.onlineCpus on the first successful call and refreshes
 *       state.cpuLabels on every successful call.
 */
[[nodiscard]] CollectResult collectHardIrqs(std::string_view text, bool firstPass,
                                            const PatternList& exclude, IrqState& state);

/**
 * @brief Collect soft interrupts from text.
 * @return NO_ONLINE_CPUS if no hardware pass has run; CPU_COUNT_MISMATCH if
 *         the header lists fewer CPUs than are online.
 */
[[nodiscard]] CollectResult collectSoftIrqs(std::string_view text, bool firstPass,
                                            const PatternList& exclude, IrqState& state);

/// @brief collectHardIrqs() on a file (SOURCE_UNREADABLE if it cannot be read).
[[nodiscard]] CollectResult collectHardIrqsFromFile(const char* path, bool firstPass,
                                                    const PatternList& exclude,
                                                    IrqState& state);

/// @brief collectSoftIrqs() on a file (SOURCE_UNREADABLE if it cannot be read).
[[nodiscard]] CollectResult collectSoftIrqsFromFile(const char* path, bool firstPass,
                                                    const PatternList& exclude,
                                                    IrqState& state);

} // namespace irq

} // namespace irqmon

#endif // IRQMON_IRQ_IRQ_COLLECTOR_HPP
