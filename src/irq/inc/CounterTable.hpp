#ifndef IRQMON_IRQ_COUNTER_TABLE_HPP
#define IRQMON_IRQ_COUNTER_TABLE_HPP
/**
 * @file CounterTable.hpp
 * @brief Per-row, per-CPU interrupt counters with deltas and change flags.
 * @note NOT thread-safe: owned and mutated by the single monitoring loop.
 *
 * One table holds one counter source (hardware or soft interrupts). Rows are
 * created the first time a name is observed and are never removed; only rows
 * whose everChanged flag is set are displayed.
 */

#include <cstddef>
#include <cstdint>
#include <functional> // std::less
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace irqmon {

namespace irq {

/* ----------------------------- CounterRow ----------------------------- */

/**
 * @brief Counters for one interrupt vector or softirq class.
 */
struct CounterRow {
  std::string name{};                ///< Row name ("95", "LOC", "NET_RX")
  std::vector<std::uint64_t> current{}; ///< Last sampled value per CPU
  std::vector<std::int64_t> delta{};    ///< current_new - current_old per CPU
  std::vector<std::string> desc{};   ///< Trailing description tokens, verbatim
  bool everChanged{false};           ///< Latched once a reportable delta is seen

  /// @brief True if the name is all digits (a hardware vector number).
  [[nodiscard]] bool isNumeric() const noexcept;

  /// @brief Sum of the per-CPU deltas of the last sample.
  [[nodiscard]] std::int64_t deltaTotal() const noexcept;

  /// @brief Description tokens joined by single spaces.
  [[nodiscard]] std::string descText() const;
};

/**
 * @brief Apply one sample to a row.
 * @param row Row to update; current/delta are resized to values.size().
 * @param values New raw counter values, one per online CPU.
 * @param mayMarkChanged False on the warm-up pass and for excluded rows.
 * @return true if any per-CPU delta of this sample is non-zero.
 *
 * Each delta is computed from the stored value before it is overwritten.
 * everChanged is only ever set here, never cleared.
 */
bool applySample(CounterRow& row, std::span<const std::uint64_t> values,
                 bool mayMarkChanged);

/* ----------------------------- CounterTable ----------------------------- */

/**
 * @brief Name-ordered collection of CounterRow.
 */
class CounterTable {
public:
  using Rows = std::map<std::string, CounterRow, std::less<>>;

  /// @brief Find a row, creating an empty one on first sight.
  CounterRow& row(std::string_view name);

  /// @brief Find a row without creating it.
  /// @return Pointer to the row, or nullptr if never observed.
  [[nodiscard]] const CounterRow* find(std::string_view name) const noexcept;

  /// @brief Number of rows ever observed.
  [[nodiscard]] std::size_t size() const noexcept { return rows_.size(); }

  /// @brief Number of rows with everChanged set.
  [[nodiscard]] std::size_t changedCount() const noexcept;

  /// Rows in lexicographic name order.
  [[nodiscard]] Rows::const_iterator begin() const noexcept { return rows_.begin(); }
  [[nodiscard]] Rows::const_iterator end() const noexcept { return rows_.end(); }

private:
  Rows rows_{};
};

} // namespace irq

} // namespace irqmon

#endif // IRQMON_IRQ_COUNTER_TABLE_HPP
