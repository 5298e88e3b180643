#ifndef PULSE_SAMPLING_SAMPLER_CONFIG_HPP
#define PULSE_SAMPLING_SAMPLER_CONFIG_HPP
/**
 * @file SamplerConfig.hpp
 * @brief Construction parameters for the CPU sampler.
 */

#include <chrono>
#include <cstddef>
#include <string>

namespace pulse {

namespace sampling {

/* ----------------------------- Defaults ----------------------------- */

inline constexpr double DEFAULT_THRESHOLD = 80.0;
inline constexpr std::chrono::milliseconds DEFAULT_SAMPLE_RATE{1000};
inline constexpr std::chrono::milliseconds DEFAULT_REPORTING_INTERVAL{10000};
inline constexpr std::chrono::milliseconds DEFAULT_COOLDOWN{300000};

/* ----------------------------- SamplerConfig ----------------------------- */

/**
 * @brief Sampler configuration.
 *
 * The smoothing parameters are derived from the two intervals: the EMA weight
 * is sampleRate / reportingInterval and the ring holds one reporting interval
 * worth of samples.
 */
struct SamplerConfig {
  double threshold{DEFAULT_THRESHOLD};                         ///< cpu.user alert level (percent)
  std::chrono::milliseconds sampleRate{DEFAULT_SAMPLE_RATE};   ///< Tick period
  std::chrono::milliseconds reportingInterval{DEFAULT_REPORTING_INTERVAL}; ///< Report period
  std::chrono::milliseconds cooldown{DEFAULT_COOLDOWN}; ///< Minimum gap between notifications
  std::string hostname;                                 ///< Included in every notification

  /// EMA weight, clamped to (0, 1].
  [[nodiscard]] double alpha() const noexcept;

  /// Ring capacity, round(reportingInterval / sampleRate), at least 1.
  [[nodiscard]] std::size_t capacity() const noexcept;

  /// @brief Validate configuration.
  /// @return true if both intervals are positive, cooldown is non-negative
  ///         and threshold is a number.
  [[nodiscard]] bool isValid() const noexcept;

  /// @note NOT hot-path safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

} // namespace sampling

} // namespace pulse

#endif // PULSE_SAMPLING_SAMPLER_CONFIG_HPP
