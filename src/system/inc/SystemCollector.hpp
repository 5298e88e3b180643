#ifndef PULSE_SYSTEM_COLLECTOR_HPP
#define PULSE_SYSTEM_COLLECTOR_HPP
/**
 * @file SystemCollector.hpp
 * @brief Load average, memory and swap usage gauges.
 * @note Linux-only. Reads /proc/loadavg and /proc/meminfo.
 * @note Thread-safe: collect() and fill() may run on different threads.
 */

#include "src/metrics/inc/Gauge.hpp"

#include <string>

namespace pulse {

namespace system {

/* ----------------------------- Status ----------------------------- */

/**
 * @brief Status codes for system collection.
 */
enum class SystemReadStatus : unsigned char {
  OK = 0,
  LOADAVG_FAILED, ///< /proc/loadavg missing or malformed
  MEMINFO_FAILED, ///< /proc/meminfo missing
};

/// Human-readable status string.
[[nodiscard]] const char* toString(SystemReadStatus status) noexcept;

/* ----------------------------- MemInfo ----------------------------- */

/**
 * @brief Fields of /proc/meminfo used for usage percentages (kB).
 */
struct MemInfo {
  double totalKb{0.0};     ///< MemTotal
  double freeKb{0.0};      ///< MemFree
  double buffersKb{0.0};   ///< Buffers
  double cachedKb{0.0};    ///< Cached
  double swapTotalKb{0.0}; ///< SwapTotal
  double swapFreeKb{0.0};  ///< SwapFree

  /// (total - (free + buffers + cached)) / total * 100, 0 when total is 0.
  [[nodiscard]] double memUsagePercent() const noexcept;

  /// (swapTotal - swapFree) / swapTotal * 100, 0 when no swap.
  [[nodiscard]] double swapUsagePercent() const noexcept;
};

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Parse the 1-minute load average (first field of /proc/loadavg).
 * @return true if a number was found.
 */
[[nodiscard]] bool parseLoadAvg(const char* text, double& out) noexcept;

/// Parse /proc/meminfo content. Missing keys stay 0.
[[nodiscard]] MemInfo parseMemInfo(const char* text) noexcept;

/* ----------------------------- SystemCollector ----------------------------- */

/**
 * @brief Reads host-wide gauges on demand.
 *
 * Gauges: system.load_avg, system.mem_usage, system.swap_usage. A failed
 * read leaves the affected gauges at their previous values.
 */
class SystemCollector {
public:
  SystemCollector();
  SystemCollector(std::string loadavgPath, std::string meminfoPath);

  /// Refresh all gauges.
  [[nodiscard]] SystemReadStatus collect() noexcept;

  /// Drain gauges into a batch.
  void fill(metrics::MetricsBatch& batch) const;

  [[nodiscard]] double loadAverage() const noexcept { return loadAvg_.value(); }
  [[nodiscard]] double memUsage() const noexcept { return memUsage_.value(); }
  [[nodiscard]] double swapUsage() const noexcept { return swapUsage_.value(); }

private:
  std::string loadavgPath_;
  std::string meminfoPath_;
  metrics::Gauge loadAvg_{"system.load_avg"};
  metrics::Gauge memUsage_{"system.mem_usage"};
  metrics::Gauge swapUsage_{"system.swap_usage"};
};

} // namespace system

} // namespace pulse

#endif // PULSE_SYSTEM_COLLECTOR_HPP
