#ifndef PULSE_HELPERS_CPU_HPP
#define PULSE_HELPERS_CPU_HPP
/**
 * @file Cpu.hpp
 * @brief Monotonic timestamp helper for snapshots and metric samples.
 *
 * @note Syscall (clock_gettime), typically vDSO-accelerated.
 */

#include <cstdint>
#include <ctime> // clock_gettime, CLOCK_MONOTONIC

namespace pulse {
namespace helpers {
namespace cpu {

/// Nanoseconds per second.
inline constexpr std::uint64_t NS_PER_SEC = 1'000'000'000ULL;

/**
 * @brief Get monotonic timestamp in nanoseconds.
 *
 * CLOCK_MONOTONIC is unaffected by wall-clock adjustments, so consecutive
 * snapshot timestamps never go backwards.
 */
[[nodiscard]] inline std::uint64_t getMonotonicNs() noexcept {
  struct timespec ts{};
  ::clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<std::uint64_t>(ts.tv_sec) * NS_PER_SEC +
         static_cast<std::uint64_t>(ts.tv_nsec);
}

} // namespace cpu
} // namespace helpers
} // namespace pulse

#endif // PULSE_HELPERS_CPU_HPP
