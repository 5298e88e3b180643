/**
 * @file SystemCollector.cpp
 * @brief /proc/loadavg and /proc/meminfo parsing.
 */

#include "src/system/inc/SystemCollector.hpp"

#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <array>   // std::array
#include <cstdlib> // strtod
#include <cstring> // strchr
#include <utility> // std::move

#include <spdlog/spdlog.h>

namespace pulse {

namespace system {

using pulse::helpers::files::LOADAVG_BUFFER_SIZE;
using pulse::helpers::files::MEMINFO_BUFFER_SIZE;
using pulse::helpers::files::readFileToArray;
using pulse::helpers::strings::lineStartsWith;
using pulse::helpers::strings::nextLine;
using pulse::helpers::strings::skipWhitespace;

namespace {

/// Parse "FieldName:    12345 kB", return the number (kB).
inline double parseMemInfoKb(const char* line) noexcept {
  const char* colon = std::strchr(line, ':');
  if (colon == nullptr) {
    return 0.0;
  }
  const char* ptr = skipWhitespace(colon + 1);
  char* end = nullptr;
  const double VAL = std::strtod(ptr, &end);
  return (end == ptr) ? 0.0 : VAL;
}

} // namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(SystemReadStatus status) noexcept {
  switch (status) {
  case SystemReadStatus::OK:
    return "OK";
  case SystemReadStatus::LOADAVG_FAILED:
    return "LOADAVG_FAILED";
  case SystemReadStatus::MEMINFO_FAILED:
    return "MEMINFO_FAILED";
  }
  return "UNKNOWN";
}

/* ----------------------------- MemInfo ----------------------------- */

double MemInfo::memUsagePercent() const noexcept {
  if (totalKb == 0.0) {
    return 0.0;
  }
  const double AVAILABLE = freeKb + buffersKb + cachedKb;
  return (totalKb - AVAILABLE) / totalKb * 100.0;
}

double MemInfo::swapUsagePercent() const noexcept {
  if (swapTotalKb == 0.0) {
    return 0.0;
  }
  return (swapTotalKb - swapFreeKb) / swapTotalKb * 100.0;
}

/* ----------------------------- Parsing ----------------------------- */

bool parseLoadAvg(const char* text, double& out) noexcept {
  if (text == nullptr) {
    return false;
  }
  const char* ptr = skipWhitespace(text);
  char* end = nullptr;
  const double VAL = std::strtod(ptr, &end);
  if (end == ptr) {
    return false;
  }
  out = VAL;
  return true;
}

MemInfo parseMemInfo(const char* text) noexcept {
  MemInfo info{};
  if (text == nullptr) {
    return info;
  }

  for (const char* line = text; *line != '\0'; line = nextLine(line)) {
    if (lineStartsWith(line, "MemTotal:")) {
      info.totalKb = parseMemInfoKb(line);
    } else if (lineStartsWith(line, "MemFree:")) {
      info.freeKb = parseMemInfoKb(line);
    } else if (lineStartsWith(line, "Buffers:")) {
      info.buffersKb = parseMemInfoKb(line);
    } else if (lineStartsWith(line, "Cached:")) {
      info.cachedKb = parseMemInfoKb(line);
    } else if (lineStartsWith(line, "SwapTotal:")) {
      info.swapTotalKb = parseMemInfoKb(line);
    } else if (lineStartsWith(line, "SwapFree:")) {
      info.swapFreeKb = parseMemInfoKb(line);
    }
  }
  return info;
}

/* ----------------------------- SystemCollector ----------------------------- */

SystemCollector::SystemCollector() : SystemCollector("/proc/loadavg", "/proc/meminfo") {}

SystemCollector::SystemCollector(std::string loadavgPath, std::string meminfoPath)
    : loadavgPath_(std::move(loadavgPath)), meminfoPath_(std::move(meminfoPath)) {}

SystemReadStatus SystemCollector::collect() noexcept {
  std::array<char, LOADAVG_BUFFER_SIZE> loadBuf{};
  double load = 0.0;
  if (readFileToArray(loadavgPath_.c_str(), loadBuf) == 0 ||
      !parseLoadAvg(loadBuf.data(), load)) {
    spdlog::warn("system: could not read {}", loadavgPath_);
    return SystemReadStatus::LOADAVG_FAILED;
  }
  loadAvg_.update(load);

  std::array<char, MEMINFO_BUFFER_SIZE> memBuf{};
  if (readFileToArray(meminfoPath_.c_str(), memBuf) == 0) {
    spdlog::warn("system: could not read {}", meminfoPath_);
    return SystemReadStatus::MEMINFO_FAILED;
  }
  const MemInfo INFO = parseMemInfo(memBuf.data());
  memUsage_.update(INFO.memUsagePercent());
  swapUsage_.update(INFO.swapUsagePercent());
  return SystemReadStatus::OK;
}

void SystemCollector::fill(metrics::MetricsBatch& batch) const {
  loadAvg_.fill(batch);
  memUsage_.fill(batch);
  swapUsage_.fill(batch);
}

} // namespace system

} // namespace pulse
