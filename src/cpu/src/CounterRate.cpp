/**
 * @file CounterRate.cpp
 * @brief Counter delta to percentage conversion.
 */

#include "src/cpu/inc/CounterRate.hpp"

namespace pulse {

namespace cpu {

/* ----------------------------- API ----------------------------- */

double computeRate(CpuCategory category, const CpuCounterSnapshot& previous,
                   const CpuCounterSnapshot& current) noexcept {
  if (current.total <= previous.total) {
    // No ticks elapsed, or counters were reset
    return 0.0;
  }

  const std::uint64_t BEFORE = previous.at(category);
  const std::uint64_t AFTER = current.at(category);
  if (AFTER < BEFORE) {
    return 0.0;
  }

  const double TOTAL_DELTA = static_cast<double>(current.total - previous.total);
  return static_cast<double>(AFTER - BEFORE) / TOTAL_DELTA * 100.0;
}

/* ----------------------------- CounterHistory ----------------------------- */

void CounterHistory::push(const CpuCounterSnapshot& snap) noexcept {
  previous_ = current_;
  current_ = snap;
}

void CounterHistory::clear() noexcept {
  previous_.reset();
  current_.reset();
}

double CounterHistory::rate(CpuCategory category) const noexcept {
  if (!previous_ || !current_) {
    return 0.0;
  }
  return computeRate(category, *previous_, *current_);
}

} // namespace cpu

} // namespace pulse
