#ifndef PULSE_METRICS_GAUGE_HPP
#define PULSE_METRICS_GAUGE_HPP
/**
 * @file Gauge.hpp
 * @brief Named gauges and the batch they are drained into.
 * @note Thread-safe: Gauge values are atomic; a MetricsBatch is owned by one caller.
 */

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace pulse {

namespace metrics {

/* ----------------------------- MetricsBatch ----------------------------- */

/**
 * @brief One gauge reading inside a batch.
 */
struct MetricSample {
  std::string name;             ///< Gauge name, e.g. "cpu.user"
  double value{0.0};            ///< Value at fill time
  std::uint64_t timestampNs{0}; ///< Monotonic fill time
};

/**
 * @brief Collection of gauge readings handed to a metrics pipeline.
 */
struct MetricsBatch {
  std::vector<MetricSample> samples;

  /// Append one reading.
  void add(std::string name, double value, std::uint64_t timestampNs);

  /// Value of the first sample named name, or defaultVal.
  [[nodiscard]] double valueOf(const std::string& name, double defaultVal = 0.0) const noexcept;

  [[nodiscard]] bool empty() const noexcept { return samples.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return samples.size(); }
  void clear() noexcept { samples.clear(); }

  /// One "name value" pair per line.
  [[nodiscard]] std::string toString() const;

  /// Single-line JSON object keyed by gauge name.
  [[nodiscard]] std::string toJson() const;
};

/* ----------------------------- Gauge ----------------------------- */

/**
 * @brief Last-value gauge.
 */
class Gauge {
public:
  explicit Gauge(std::string name);

  Gauge(const Gauge&) = delete;
  Gauge& operator=(const Gauge&) = delete;

  /// Record the current value.
  void update(double value) noexcept;

  /// Last recorded value (0 before the first update).
  [[nodiscard]] double value() const noexcept;

  [[nodiscard]] const std::string& name() const noexcept { return name_; }

  /// Append the current value to a batch.
  void fill(MetricsBatch& batch) const;

private:
  std::string name_;
  std::atomic<double> value_{0.0};
};

} // namespace metrics

} // namespace pulse

#endif // PULSE_METRICS_GAUGE_HPP
