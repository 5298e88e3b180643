/**
 * @file SamplerConfig.cpp
 * @brief Derived smoothing parameters and validation.
 */

#include "src/sampling/inc/SamplerConfig.hpp"

#include <cmath> // std::isnan, std::llround

#include <fmt/core.h>

namespace pulse {

namespace sampling {

double SamplerConfig::alpha() const noexcept {
  if (sampleRate.count() <= 0 || reportingInterval.count() <= 0) {
    return 1.0;
  }
  const double RATIO =
      static_cast<double>(sampleRate.count()) / static_cast<double>(reportingInterval.count());
  return (RATIO > 1.0) ? 1.0 : RATIO;
}

std::size_t SamplerConfig::capacity() const noexcept {
  if (sampleRate.count() <= 0 || reportingInterval.count() <= 0) {
    return 1;
  }
  const long long SLOTS = std::llround(static_cast<double>(reportingInterval.count()) /
                                       static_cast<double>(sampleRate.count()));
  return (SLOTS < 1) ? 1 : static_cast<std::size_t>(SLOTS);
}

bool SamplerConfig::isValid() const noexcept {
  return sampleRate.count() > 0 && reportingInterval.count() > 0 && cooldown.count() >= 0 &&
         !std::isnan(threshold);
}

std::string SamplerConfig::toString() const {
  return fmt::format("threshold={:.1f}% sample={}ms report={}ms cooldown={}ms alpha={:.3f} "
                     "capacity={} host={}",
                     threshold, sampleRate.count(), reportingInterval.count(), cooldown.count(),
                     alpha(), capacity(), hostname);
}

} // namespace sampling

} // namespace pulse
