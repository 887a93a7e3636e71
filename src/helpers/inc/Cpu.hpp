#ifndef IRQMON_HELPERS_CPU_HPP
#define IRQMON_HELPERS_CPU_HPP
/**
 * @file Cpu.hpp
 * @brief Monotonic clock helper used for sample timestamps.
 */

#include <cstdint>
#include <ctime> // clock_gettime, CLOCK_MONOTONIC

namespace irqmon {
namespace helpers {
namespace cpu {

/// Nanoseconds in one second.
inline constexpr std::uint64_t NS_PER_SEC = 1'000'000'000ULL;

/**
 * @brief Get monotonic timestamp in nanoseconds.
 * @return Current CLOCK_MONOTONIC time in nanoseconds.
 */
[[nodiscard]] inline std::uint64_t getMonotonicNs() noexcept {
  struct timespec ts{};
  ::clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<std::uint64_t>(ts.tv_sec) * NS_PER_SEC +
         static_cast<std::uint64_t>(ts.tv_nsec);
}

} // namespace cpu
} // namespace helpers
} // namespace irqmon

#endif // IRQMON_HELPERS_CPU_HPP
