#ifndef PULSE_CPU_COUNTER_RATE_HPP
#define PULSE_CPU_COUNTER_RATE_HPP
/**
 * @file CounterRate.hpp
 * @brief Per-category CPU percentages from consecutive counter snapshots.
 * @note Not thread-safe: CounterHistory is guarded by its owner's lock.
 */

#include "src/cpu/inc/CpuCounters.hpp"

#include <optional>

namespace pulse {

namespace cpu {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Share of elapsed CPU ticks spent in one category.
 * @param category Category to rate.
 * @param previous Earlier snapshot.
 * @param current Later snapshot.
 * @return Percentage (0-100 scale).
 * @note Pure computation, no allocation.
 *
 * Returns 0 when the totals are equal (startup, clock stall) regardless of the
 * category delta, and 0 when a counter went backwards.
 */
[[nodiscard]] double computeRate(CpuCategory category, const CpuCounterSnapshot& previous,
                                 const CpuCounterSnapshot& current) noexcept;

/* ----------------------------- CounterHistory ----------------------------- */

/**
 * @brief The previous/current snapshot pair.
 *
 * push() moves current to previous before storing the new snapshot. Rates are
 * 0 for every category until two snapshots exist.
 */
class CounterHistory {
public:
  /// Shift current into previous and store snap as current.
  void push(const CpuCounterSnapshot& snap) noexcept;

  /// Forget both snapshots.
  void clear() noexcept;

  /// Rate for one category, 0 while fewer than two snapshots are held.
  [[nodiscard]] double rate(CpuCategory category) const noexcept;

  [[nodiscard]] bool hasPrevious() const noexcept { return previous_.has_value(); }
  [[nodiscard]] bool hasCurrent() const noexcept { return current_.has_value(); }
  [[nodiscard]] const std::optional<CpuCounterSnapshot>& previous() const noexcept {
    return previous_;
  }
  [[nodiscard]] const std::optional<CpuCounterSnapshot>& current() const noexcept {
    return current_;
  }

private:
  std::optional<CpuCounterSnapshot> previous_;
  std::optional<CpuCounterSnapshot> current_;
};

} // namespace cpu

} // namespace pulse

#endif // PULSE_CPU_COUNTER_RATE_HPP
