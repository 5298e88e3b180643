/**
 * @file CpuCounters.cpp
 * @brief Aggregate CPU counter collection from /proc/stat.
 */

#include "src/cpu/inc/CpuCounters.hpp"

#include "src/helpers/inc/Cpu.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <array>   // std::array
#include <cstdlib> // strtoull
#include <utility> // std::move

#include <fmt/core.h>

namespace pulse {

namespace cpu {

namespace {

using pulse::helpers::cpu::getMonotonicNs;
using pulse::helpers::files::PROC_STAT_BUFFER_SIZE;
using pulse::helpers::files::readFileToArray;
using pulse::helpers::strings::lineStartsWith;
using pulse::helpers::strings::nextLine;
using pulse::helpers::strings::skipWhitespace;

/// Columns of the "cpu " line we need: user nice system idle.
constexpr std::size_t REQUIRED_FIELDS = 4;

constexpr std::size_t index(CpuCategory category) noexcept {
  return static_cast<std::size_t>(category);
}

} // namespace

/* ----------------------------- Names ----------------------------- */

const char* metricName(CpuCategory category) noexcept {
  switch (category) {
  case CpuCategory::USER:
    return "cpu.user";
  case CpuCategory::SYSTEM:
    return "cpu.system";
  case CpuCategory::IDLE:
    return "cpu.idle";
  case CpuCategory::NICE:
    return "cpu.nice";
  }
  return "cpu.unknown";
}

const char* toString(CounterReadStatus status) noexcept {
  switch (status) {
  case CounterReadStatus::OK:
    return "OK";
  case CounterReadStatus::OPEN_FAILED:
    return "OPEN_FAILED";
  case CounterReadStatus::PARSE_FAILED:
    return "PARSE_FAILED";
  }
  return "UNKNOWN";
}

/* ----------------------------- CpuCounterSnapshot ----------------------------- */

std::uint64_t CpuCounterSnapshot::at(CpuCategory category) const noexcept {
  return counters[index(category)];
}

void CpuCounterSnapshot::updateTotal() noexcept {
  total = 0;
  for (const std::uint64_t V : counters) {
    total += V;
  }
}

std::string CpuCounterSnapshot::toString() const {
  return fmt::format("user={} system={} idle={} nice={} total={}", at(CpuCategory::USER),
                     at(CpuCategory::SYSTEM), at(CpuCategory::IDLE), at(CpuCategory::NICE),
                     total);
}

/* ----------------------------- Parsing ----------------------------- */

CounterReadStatus parseProcStat(const char* text, CpuCounterSnapshot& out) noexcept {
  if (text == nullptr) {
    return CounterReadStatus::PARSE_FAILED;
  }

  for (const char* line = text; *line != '\0'; line = nextLine(line)) {
    // Aggregate line only; "cpu0", "cpu1", ... are per-core
    if (!lineStartsWith(line, "cpu ")) {
      continue;
    }

    std::array<std::uint64_t, REQUIRED_FIELDS> vals{};
    const char* ptr = skipWhitespace(line + 3);
    for (std::size_t i = 0; i < vals.size(); ++i) {
      char* end = nullptr;
      vals[i] = std::strtoull(ptr, &end, 10);
      if (end == ptr) {
        return CounterReadStatus::PARSE_FAILED;
      }
      ptr = skipWhitespace(end);
    }

    out.counters[index(CpuCategory::USER)] = vals[0];
    out.counters[index(CpuCategory::NICE)] = vals[1];
    out.counters[index(CpuCategory::SYSTEM)] = vals[2];
    out.counters[index(CpuCategory::IDLE)] = vals[3];
    out.updateTotal();
    return CounterReadStatus::OK;
  }

  return CounterReadStatus::PARSE_FAILED;
}

/* ----------------------------- ProcStatCounterSource ----------------------------- */

ProcStatCounterSource::ProcStatCounterSource(std::string path) : path_(std::move(path)) {}

CounterReadStatus ProcStatCounterSource::read(CpuCounterSnapshot& out) noexcept {
  std::array<char, PROC_STAT_BUFFER_SIZE> buf{};
  if (readFileToArray(path_.c_str(), buf) == 0) {
    return CounterReadStatus::OPEN_FAILED;
  }

  CpuCounterSnapshot snap{};
  const CounterReadStatus STATUS = parseProcStat(buf.data(), snap);
  if (STATUS != CounterReadStatus::OK) {
    return STATUS;
  }

  snap.timestampNs = getMonotonicNs();
  out = snap;
  return CounterReadStatus::OK;
}

} // namespace cpu

} // namespace pulse
