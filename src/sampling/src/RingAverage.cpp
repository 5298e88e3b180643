/**
 * @file RingAverage.cpp
 * @brief Ring buffer EMA and overlapping-window average.
 */

#include "src/sampling/inc/RingAverage.hpp"

namespace pulse {

namespace sampling {

RingAverage::RingAverage(double alpha, std::size_t capacity)
    : alpha_(alpha), values_(capacity == 0 ? 1 : capacity, 0.0) {}

void RingAverage::add(double value) noexcept {
  if (writePos_ == 0 && !filled_) {
    ema_ = value;
  } else {
    ema_ = value * alpha_ + ema_ * (1.0 - alpha_);
  }

  values_[writePos_] = value;
  writePos_ = (writePos_ + 1) % values_.size();
  if (writePos_ == 0) {
    filled_ = true;
  }
}

double RingAverage::windowedAverage() const noexcept {
  if (values_.empty()) {
    return 0.0;
  }

  // Before the first wrap only [0, writePos) holds real samples
  const std::size_t LEN = filled_ ? values_.size() : writePos_;
  if (LEN == 0) {
    return 0.0;
  }

  const std::size_t WINDOW = (LEN / 2) + (LEN % 2);
  const std::size_t LAST_OFFSET = LEN / 2;

  // offset + WINDOW never exceeds LEN, so windows stay inside the populated slots
  double sumOfMeans = 0.0;
  for (std::size_t offset = 0; offset <= LAST_OFFSET; ++offset) {
    double sum = 0.0;
    for (std::size_t i = offset; i < offset + WINDOW; ++i) {
      sum += values_[i];
    }
    sumOfMeans += sum / static_cast<double>(WINDOW);
  }

  return sumOfMeans / static_cast<double>(LAST_OFFSET + 1);
}

} // namespace sampling

} // namespace pulse
