#ifndef PULSE_SAMPLING_ALERT_DEBOUNCER_HPP
#define PULSE_SAMPLING_ALERT_DEBOUNCER_HPP
/**
 * @file AlertDebouncer.hpp
 * @brief Hysteresis state machine turning threshold breaches into alert events.
 * @note Not thread-safe: Driven only by the sampling task.
 *
 * Three consecutive breaching ticks raise an ALERT, three consecutive clear
 * ticks after a trigger raise RESOLVED. Every notification must be separated
 * from the previous one by more than the cooldown.
 */

#include <chrono>
#include <cstdint>
#include <optional>

namespace pulse {

namespace sampling {

/* ----------------------------- Constants ----------------------------- */

/// Consecutive ticks needed to confirm a state change.
inline constexpr std::uint8_t CONFIRM_TICKS = 3;

/* ----------------------------- Enums ----------------------------- */

/**
 * @brief Notification emitted by an update.
 */
enum class AlertEvent : unsigned char {
  NONE = 0,
  ALERT,
  RESOLVED,
};

/**
 * @brief Observable phase of the debouncer.
 */
enum class AlertPhase : unsigned char {
  IDLE = 0,       ///< Not triggered, no pending breaches
  ALERT_RISING,   ///< Not triggered, breaches accumulating
  TRIGGERED,      ///< Alert sent, no pending clear ticks
  RESOLVE_RISING, ///< Alert sent, clear ticks accumulating
};

/// Human-readable event string.
[[nodiscard]] const char* toString(AlertEvent event) noexcept;

/// Human-readable phase string.
[[nodiscard]] const char* toString(AlertPhase phase) noexcept;

/* ----------------------------- AlertDebouncer ----------------------------- */

class AlertDebouncer {
public:
  using Clock = std::chrono::steady_clock;

  explicit AlertDebouncer(Clock::duration cooldown) noexcept;

  /**
   * @brief Feed one tick.
   * @param breach True if the observed value is at or above the threshold.
   * @param now Tick time.
   * @return Event to dispatch, NONE most of the time.
   *
   * An ALERT is repeated while the breach persists, but only once the
   * cooldown since the last notification has passed.
   */
  [[nodiscard]] AlertEvent update(bool breach, Clock::time_point now) noexcept;

  [[nodiscard]] AlertPhase phase() const noexcept;
  [[nodiscard]] std::uint8_t alertCount() const noexcept { return alertCount_; }
  [[nodiscard]] std::uint8_t resolveCount() const noexcept { return resolveCount_; }
  [[nodiscard]] bool triggered() const noexcept { return triggered_; }
  [[nodiscard]] Clock::duration cooldown() const noexcept { return cooldown_; }

  /// Time of the last ALERT or RESOLVED, empty before the first one.
  [[nodiscard]] std::optional<Clock::time_point> lastNotifiedAt() const noexcept {
    return lastNotifiedAt_;
  }

private:
  [[nodiscard]] bool cooledDown(Clock::time_point now) const noexcept;

  Clock::duration cooldown_;
  std::uint8_t alertCount_{0};
  std::uint8_t resolveCount_{0};
  bool triggered_{false};
  std::optional<Clock::time_point> lastNotifiedAt_;
};

} // namespace sampling

} // namespace pulse

#endif // PULSE_SAMPLING_ALERT_DEBOUNCER_HPP
