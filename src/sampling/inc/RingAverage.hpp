#ifndef PULSE_SAMPLING_RING_AVERAGE_HPP
#define PULSE_SAMPLING_RING_AVERAGE_HPP
/**
 * @file RingAverage.hpp
 * @brief Fixed-capacity sample ring with an attached exponential moving average.
 * @note Not thread-safe: Instances are guarded by the owning sampler's lock.
 *
 * Two views of the same sample stream:
 *  - peekEma() reacts quickly and is what gets reported as the gauge value
 *  - windowedAverage() averages overlapping half-windows of the ring and
 *    damps single-sample spikes before threshold comparison
 */

#include <cstddef>
#include <vector>

namespace pulse {

namespace sampling {

/* ----------------------------- RingAverage ----------------------------- */

class RingAverage {
public:
  /**
   * @brief Construct an empty ring.
   * @param alpha EMA weight of each new sample, in (0, 1].
   * @param capacity Retained sample count; 0 is raised to 1.
   */
  RingAverage(double alpha, std::size_t capacity);

  /**
   * @brief Add one sample.
   *
   * The very first sample seeds the EMA; later samples blend in with weight
   * alpha. The sample overwrites the oldest slot once the ring is full.
   */
  void add(double value) noexcept;

  /**
   * @brief Average of overlapping half-window averages.
   *
   * With n populated slots (capacity once full, else the write position),
   * takes the plain mean of every window of ceil(n/2) consecutive slots
   * starting at offsets 0..floor(n/2), then returns the mean of those
   * window means. Slots not yet written are never included.
   *
   * @return Smoothed value, 0 while the ring is empty.
   */
  [[nodiscard]] double windowedAverage() const noexcept;

  /// Current EMA, 0 before the first sample.
  [[nodiscard]] double peekEma() const noexcept { return ema_; }

  [[nodiscard]] double alpha() const noexcept { return alpha_; }
  [[nodiscard]] std::size_t capacity() const noexcept { return values_.size(); }
  [[nodiscard]] std::size_t writePos() const noexcept { return writePos_; }
  [[nodiscard]] bool filled() const noexcept { return filled_; }

  /// Raw ring slots in storage order (not chronological once wrapped).
  [[nodiscard]] const std::vector<double>& values() const noexcept { return values_; }

private:
  double alpha_;
  double ema_{0.0};
  std::vector<double> values_;
  std::size_t writePos_{0};
  bool filled_{false};
};

} // namespace sampling

} // namespace pulse

#endif // PULSE_SAMPLING_RING_AVERAGE_HPP
