#ifndef IRQMON_IRQ_IRQ_AFFINITY_HPP
#define IRQMON_IRQ_IRQ_AFFINITY_HPP
/**
 * @file IrqAffinity.hpp
 * @brief Per-vector affinity lookup from /proc/irq/<n>/.
 * @note Linux-only. Both files are optional; absence is not an error.
 *
 * Looked up at render time for numeric vectors only and never cached, so a
 * changed affinity shows up on the next frame.
 */

#include "src/irq/inc/CpuMask.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace irqmon {

namespace irq {

/// Default procfs root holding irq/<n>/.
inline constexpr const char* PROC_ROOT = "/proc";

/**
 * @brief Affinity data for one vector.
 */
struct IrqAffinity {
  std::optional<CpuMask> hint{};        ///< affinity_hint as a mask
  std::optional<std::string> list{};    ///< smp_affinity_list, trimmed, verbatim

  /// @brief Render as "hint=<ranges|none>,aff=<list|none>".
  /// @note A zero hint (driver set none) also renders as "none".
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Read affinity_hint and smp_affinity_list for one vector.
 * @param procRoot procfs root (normally "/proc").
 * @param irqName Numeric vector name, e.g. "95".
 * @return Lookup result; fields are empty where a file is missing, empty or
 *         unparsable. A non-numeric irqName yields an empty result.
 */
[[nodiscard]] IrqAffinity readIrqAffinity(std::string_view procRoot, std::string_view irqName);

} // namespace irq

} // namespace irqmon

#endif // IRQMON_IRQ_IRQ_AFFINITY_HPP
