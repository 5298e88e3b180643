#ifndef PULSE_CPU_COUNTERS_HPP
#define PULSE_CPU_COUNTERS_HPP
/**
 * @file CpuCounters.hpp
 * @brief Cumulative CPU tick counters and the sources that read them.
 * @note Linux-only. Reads the aggregate "cpu" line of /proc/stat.
 *
 * Design: Snapshot + delta approach.
 *  - CounterSource::read() captures raw jiffies into a CpuCounterSnapshot
 *  - CounterRate.hpp turns two snapshots into percentages
 *  - Caller controls sampling interval
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace pulse {

namespace cpu {

/* ----------------------------- Categories ----------------------------- */

/**
 * @brief Tracked CPU time categories, in snapshot order.
 */
enum class CpuCategory : unsigned char {
  USER = 0,
  SYSTEM,
  IDLE,
  NICE,
};

/// Number of categories held in a snapshot.
inline constexpr std::size_t CPU_CATEGORY_COUNT = 4;

/// Gauge-style name for a category (e.g. "cpu.user").
[[nodiscard]] const char* metricName(CpuCategory category) noexcept;

/* ----------------------------- CpuCounterSnapshot ----------------------------- */

/**
 * @brief One read of the cumulative tick counters (jiffies since boot).
 */
struct CpuCounterSnapshot {
  std::array<std::uint64_t, CPU_CATEGORY_COUNT> counters{}; ///< Indexed by CpuCategory
  std::uint64_t total{0};                                   ///< Sum of counters
  std::uint64_t timestampNs{0};                             ///< Monotonic capture time

  /// Counter for one category.
  [[nodiscard]] std::uint64_t at(CpuCategory category) const noexcept;

  /// Recompute total from counters.
  void updateTotal() noexcept;

  /// @note NOT hot-path safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Read Status ----------------------------- */

/**
 * @brief Status codes for counter reads.
 */
enum class CounterReadStatus : unsigned char {
  OK = 0,
  OPEN_FAILED,
  PARSE_FAILED,
};

/// Human-readable status string.
[[nodiscard]] const char* toString(CounterReadStatus status) noexcept;

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Parse the aggregate "cpu " line from /proc/stat content.
 * @param text Null-terminated file content (any number of lines).
 * @param out Snapshot to fill (timestamp untouched).
 * @return OK, or PARSE_FAILED if no aggregate line with at least four fields exists.
 *
 * Field order in /proc/stat is: user nice system idle iowait ...
 */
[[nodiscard]] CounterReadStatus parseProcStat(const char* text, CpuCounterSnapshot& out) noexcept;

/* ----------------------------- Sources ----------------------------- */

/**
 * @brief Source of cumulative counter snapshots.
 *
 * A failed read is a recoverable condition reported through the status.
 */
class CounterSource {
public:
  virtual ~CounterSource() = default;

  /// Fill out with a fresh snapshot.
  [[nodiscard]] virtual CounterReadStatus read(CpuCounterSnapshot& out) noexcept = 0;
};

/**
 * @brief Reads counters from /proc/stat (or another file in the same format).
 */
class ProcStatCounterSource final : public CounterSource {
public:
  ProcStatCounterSource() = default;
  explicit ProcStatCounterSource(std::string path);

  [[nodiscard]] CounterReadStatus read(CpuCounterSnapshot& out) noexcept override;

  [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
  std::string path_{"/proc/stat"};
};

} // namespace cpu

} // namespace pulse

#endif // PULSE_CPU_COUNTERS_HPP
