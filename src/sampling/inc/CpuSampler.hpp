#ifndef PULSE_SAMPLING_CPU_SAMPLER_HPP
#define PULSE_SAMPLING_CPU_SAMPLER_HPP
/**
 * @file CpuSampler.hpp
 * @brief Periodic CPU sampling, smoothing, alerting and gauge reporting.
 * @note Thread-safe: fill()/emaSnapshot() may run concurrently with ticks.
 *
 * Each tick reads a counter snapshot, converts it to per-category rates,
 * feeds one RingAverage per tracked category and checks the windowed
 * cpu.user average against the threshold. One lock covers the snapshot pair
 * and all averages; notification dispatch happens after it is released.
 *
 * Reporting is independent of the tick: fill() copies the current EMA of
 * every tracked category into its gauge and drains the gauges into a batch.
 */

#include "src/cpu/inc/CounterRate.hpp"
#include "src/cpu/inc/CpuCounters.hpp"
#include "src/metrics/inc/Gauge.hpp"
#include "src/notify/inc/Notifier.hpp"
#include "src/sampling/inc/AlertDebouncer.hpp"
#include "src/sampling/inc/RingAverage.hpp"
#include "src/sampling/inc/SamplerConfig.hpp"

#include <array>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>

namespace pulse {

namespace sampling {

/* ----------------------------- Constants ----------------------------- */

/// Categories with an average and a gauge, in gauge order.
inline constexpr std::array<cpu::CpuCategory, 3> TRACKED_CATEGORIES{
    cpu::CpuCategory::USER, cpu::CpuCategory::SYSTEM, cpu::CpuCategory::IDLE};

/* ----------------------------- Results ----------------------------- */

/**
 * @brief Outcome of one sampling tick.
 */
enum class TickStatus : unsigned char {
  OK = 0,
  READ_FAILED, ///< Counter read failed; tick aborted and snapshots cleared
};

/// Human-readable status string.
[[nodiscard]] const char* toString(TickStatus status) noexcept;

struct TickResult {
  TickStatus status{TickStatus::OK};
  cpu::CounterReadStatus readStatus{cpu::CounterReadStatus::OK};
  double userAverage{0.0};                                ///< Windowed cpu.user average
  AlertEvent event{AlertEvent::NONE};                     ///< Event raised this tick
  notify::NotifyStatus notifyStatus{notify::NotifyStatus::OK}; ///< Dispatch result, if any
};

/**
 * @brief EMA of every tracked category as of one completed tick.
 */
struct EmaSnapshot {
  double user{0.0};
  double system{0.0};
  double idle{0.0};
};

/**
 * @brief Notification text for an event.
 * @return Empty string for AlertEvent::NONE.
 */
[[nodiscard]] std::string formatAlertMessage(AlertEvent event, double average, double threshold);

/* ----------------------------- CpuSampler ----------------------------- */

class CpuSampler {
public:
  using Clock = AlertDebouncer::Clock;

  /**
   * @brief Construct a stopped sampler.
   * @param config Sampling parameters (see SamplerConfig::isValid()).
   * @param source Counter source; must outlive the sampler.
   * @param notifier Alert destination; must outlive the sampler.
   */
  CpuSampler(SamplerConfig config, cpu::CounterSource& source, notify::Notifier& notifier);

  /// Stops the background task.
  ~CpuSampler();

  CpuSampler(const CpuSampler&) = delete;
  CpuSampler& operator=(const CpuSampler&) = delete;

  /**
   * @brief Read one snapshot without updating averages.
   *
   * Gives the first tick a previous snapshot to diff against.
   */
  void prime() noexcept;

  /// Run one tick at the current time.
  TickResult tick() noexcept;

  /// Run one tick at an explicit time (drives the cooldown).
  TickResult tick(Clock::time_point now) noexcept;

  /**
   * @brief Prime and start ticking every sampleRate on a background thread.
   * @note No-op if already running.
   */
  void start();

  /// Wake and join the background thread. Safe to call when stopped.
  void stop() noexcept;

  [[nodiscard]] bool running() const noexcept { return running_.load(); }

  /**
   * @brief Copy the current EMA values into gauges and drain them into batch.
   *
   * Gauge values are the EMA, not the windowed average.
   */
  void fill(metrics::MetricsBatch& batch);

  /// EMA values consistent with the last completed tick.
  [[nodiscard]] EmaSnapshot emaSnapshot() const;

  /// Current windowed cpu.user average.
  [[nodiscard]] double userWindowedAverage() const;

  /// True while both snapshots of the counter history are present.
  [[nodiscard]] bool hasSnapshotPair() const;

  /// Number of samples added to the cpu.user ring so far (saturates at capacity).
  [[nodiscard]] std::size_t userSampleCount() const;

  /**
   * @brief Alert state machine.
   * @note Only read while the background task is stopped.
   */
  [[nodiscard]] const AlertDebouncer& debouncer() const noexcept { return debouncer_; }

  [[nodiscard]] const SamplerConfig& config() const noexcept { return config_; }

private:
  void run() noexcept;
  [[nodiscard]] notify::NotifyStatus dispatch(AlertEvent event, double average) noexcept;

  SamplerConfig config_;
  cpu::CounterSource& source_;
  notify::Notifier& notifier_;

  mutable std::mutex mtx_; ///< Guards history_ and averages_
  cpu::CounterHistory history_;
  std::array<RingAverage, TRACKED_CATEGORIES.size()> averages_;
  std::array<metrics::Gauge, TRACKED_CATEGORIES.size()> gauges_;

  AlertDebouncer debouncer_;

  std::mutex waitMtx_;
  std::condition_variable wake_;
  bool stopRequested_{false};
  std::atomic<bool> running_{false};
  std::thread worker_;
};

} // namespace sampling

} // namespace pulse

#endif // PULSE_SAMPLING_CPU_SAMPLER_HPP
