#ifndef IRQMON_IRQ_CPU_MASK_HPP
#define IRQMON_IRQ_CPU_MASK_HPP
/**
 * @file CpuMask.hpp
 * @brief 64-bit CPU mask <-> kernel CPU list conversion.
 * @note Thread-safe: All functions are pure.
 *
 * The kernel exposes IRQ affinity in two textual forms:
 *  - affinity_hint / smp_affinity: comma-grouped 32-bit hex words, most
 *    significant group first ("00000000,0000000f")
 *  - *_list files: CPU ranges ("0-3,17,19")
 *
 * encodeCpuMask() turns the bitmask form into the range form so both can be
 * displayed side by side.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace irqmon {

namespace irq {

/// Number of CPUs representable in a CpuMask.
inline constexpr unsigned CPU_MASK_BITS = 64;

/// Token rendered for an empty mask or a missing affinity file.
inline constexpr std::string_view NONE_TOKEN = "none";

/// Bit i set means CPU i is a member.
using CpuMask = std::uint64_t;

/**
 * @brief Compress a CPU mask into a kernel-style CPU list.
 * @param mask Bitmask, bit 0 = CPU 0.
 * @return Ascending comma-separated CPUs and inclusive "lo-hi" ranges
 *         (e.g. 0x5800a000f -> "0-3,17,19,31-32,34"), or "none" if no bit is set.
 * @note Runs of a single CPU are rendered as "n", never "n-n".
 */
[[nodiscard]] std::string encodeCpuMask(CpuMask mask);

/**
 * @brief Parse a kernel-style CPU list back into a mask.
 * @param list CPU list such as "0-3,17" ("none" and "" yield 0).
 * @return Mask, or std::nullopt if a field is not a number or a "lo-hi" range
 *         with lo <= hi. CPUs >= CPU_MASK_BITS are dropped.
 */
[[nodiscard]] std::optional<CpuMask> decodeCpuList(std::string_view list) noexcept;

/**
 * @brief Parse a comma-grouped hex bitmask as found in affinity_hint.
 * @param text File contents, e.g. "00000000,0000000f", "5,800a000f" or "5800a000f".
 * @return Mask built from the last group (low 32 bits) and the group before
 *         it (high 32 bits). A single ungrouped value is taken as the whole
 *         64-bit mask. std::nullopt if a group is not hex, or if a grouped
 *         word is wider than 32 bits.
 */
[[nodiscard]] std::optional<CpuMask> parseAffinityHint(std::string_view text) noexcept;

} // namespace irq

} // namespace irqmon

#endif // IRQMON_IRQ_CPU_MASK_HPP
