#ifndef IRQMON_IRQ_LINE_MATCHER_HPP
#define IRQMON_IRQ_LINE_MATCHER_HPP
/**
 * @file LineMatcher.hpp
 * @brief Name patterns matched against raw /proc/interrupts lines.
 *
 * Used for two lists:
 *  - exclusion patterns: rows whose line matches never become "changed"
 *  - tracked patterns: rows whose line matches feed a running total
 *
 * Matching runs against the full raw source line (name, counts and
 * description), so "eth" matches every vector whose device is eth0, eth1...
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace irqmon {

namespace irq {

/* ----------------------------- LinePattern ----------------------------- */

/**
 * @brief How a pattern is compared against a line.
 */
enum class MatchKind : std::uint8_t {
  SUBSTRING = 0, ///< Pattern occurs anywhere in the line
  PREFIX,        ///< Line (after leading blanks) starts with the pattern
};

/// Human-readable match kind.
[[nodiscard]] const char* toString(MatchKind kind) noexcept;

/**
 * @brief One pattern and its match method.
 */
struct LinePattern {
  std::string text{};                      ///< Pattern text (non-empty)
  MatchKind kind{MatchKind::SUBSTRING};    ///< Comparison method

  /// @brief Test this pattern against a raw source line.
  [[nodiscard]] bool matches(std::string_view line) const noexcept;
};

/// Ordered list of patterns; any match triggers.
using PatternList = std::vector<LinePattern>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Check whether any pattern in the list matches the line.
 * @param patterns Patterns to evaluate in order.
 * @param line Raw source line.
 * @return true on the first match; false for an empty list.
 */
[[nodiscard]] bool matchesAny(const PatternList& patterns, std::string_view line) noexcept;

/**
 * @brief Build a pattern list from a comma-separated CLI value.
 * @param csv e.g. "eth,nvme". A field written as "^name" becomes a PREFIX
 *            pattern on "name"; everything else is SUBSTRING.
 * @return Patterns in input order; empty fields are skipped.
 */
[[nodiscard]] PatternList parsePatternList(std::string_view csv);

} // namespace irq

} // namespace irqmon

#endif // IRQMON_IRQ_LINE_MATCHER_HPP
