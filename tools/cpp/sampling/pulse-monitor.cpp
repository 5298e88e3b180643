/**
 * @file pulse-monitor.cpp
 * @brief Host metrics sampler with smoothed CPU gauges and threshold alerts.
 *
 * Samples /proc/stat every --sample-ms, reports EMA gauges every --report-ms
 * and logs an alert when the smoothed cpu.user share stays at or above
 * --threshold for three consecutive samples.
 */

#include "src/cpu/inc/CpuCounters.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/metrics/inc/Gauge.hpp"
#include "src/notify/inc/Notifier.hpp"
#include "src/sampling/inc/CpuSampler.hpp"
#include "src/sampling/inc/SamplerConfig.hpp"
#include "src/system/inc/SystemCollector.hpp"

#include <unistd.h> // gethostname

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace args = pulse::helpers::args;
namespace sampling = pulse::sampling;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_THRESHOLD = 2,
  ARG_SAMPLE_MS = 3,
  ARG_REPORT_MS = 4,
  ARG_COOLDOWN_MS = 5,
  ARG_HOSTNAME = 6,
  ARG_COUNT = 7,
  ARG_SYSTEM = 8,
  ARG_VERBOSE = 9,
  ARG_STAT_PATH = 10,
};

constexpr std::string_view DESCRIPTION =
    "Host metrics sampler.\n"
    "Reports smoothed cpu.user/cpu.system/cpu.idle gauges and alerts on sustained\n"
    "high user CPU time.";

args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Print each report as a JSON line"};
  map[ARG_THRESHOLD] = {"--threshold", 1, false, "cpu.user alert threshold in percent (default: 80)"};
  map[ARG_SAMPLE_MS] = {"--sample-ms", 1, false, "Sampling period in ms (default: 1000)"};
  map[ARG_REPORT_MS] = {"--report-ms", 1, false, "Reporting interval in ms (default: 10000)"};
  map[ARG_COOLDOWN_MS] = {"--cooldown-ms", 1, false,
                          "Minimum ms between notifications (default: 300000)"};
  map[ARG_HOSTNAME] = {"--hostname", 1, false, "Host name used in notifications"};
  map[ARG_COUNT] = {"--count", 1, false, "Number of reports (default: infinite)"};
  map[ARG_SYSTEM] = {"--system", 0, false, "Also report load average, memory and swap"};
  map[ARG_VERBOSE] = {"--verbose", 0, false, "Log every sampling tick"};
  map[ARG_STAT_PATH] = {"--stat-path", 1, false, "Counter file (default: /proc/stat)"};
  return map;
}

std::string localHostname() {
  std::array<char, 256> buf{};
  if (::gethostname(buf.data(), buf.size() - 1) != 0) {
    return "unknown";
  }
  return std::string(buf.data());
}

sampling::SamplerConfig buildConfig(const args::ParsedArgs& pargs) {
  sampling::SamplerConfig cfg{};
  cfg.threshold = args::getDouble(pargs, ARG_THRESHOLD, sampling::DEFAULT_THRESHOLD);
  cfg.sampleRate = std::chrono::milliseconds(
      args::getLong(pargs, ARG_SAMPLE_MS, sampling::DEFAULT_SAMPLE_RATE.count()));
  cfg.reportingInterval = std::chrono::milliseconds(
      args::getLong(pargs, ARG_REPORT_MS, sampling::DEFAULT_REPORTING_INTERVAL.count()));
  cfg.cooldown = std::chrono::milliseconds(
      args::getLong(pargs, ARG_COOLDOWN_MS, sampling::DEFAULT_COOLDOWN.count()));
  cfg.hostname = args::getString(pargs, ARG_HOSTNAME, "");
  if (cfg.hostname.empty()) {
    cfg.hostname = localHostname();
  }
  return cfg;
}

/* ----------------------------- Output Functions ----------------------------- */

void printHumanReport(const pulse::metrics::MetricsBatch& batch, int reportNum) {
  fmt::print("Report {}\n", reportNum);
  fmt::print("{}", batch.toString());
  fmt::print("\n");
}

void printJsonReport(const pulse::metrics::MetricsBatch& batch, int reportNum) {
  fmt::print("{{\"report\": {}, \"gauges\": {}}}\n", reportNum, batch.toJson());
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;

  std::vector<std::string_view> argList;
  argList.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    argList.emplace_back(argv[i]);
  }

  std::string error;
  if (!args::parseArgs(argList, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }
  if (args::hasArg(pargs, ARG_HELP)) {
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 0;
  }

  const bool JSON_OUTPUT = args::hasArg(pargs, ARG_JSON);
  const bool WITH_SYSTEM = args::hasArg(pargs, ARG_SYSTEM);
  const long COUNT = args::getLong(pargs, ARG_COUNT, -1);
  if (args::hasArg(pargs, ARG_VERBOSE)) {
    spdlog::set_level(spdlog::level::debug);
  }

  const sampling::SamplerConfig CONFIG = buildConfig(pargs);
  if (!CONFIG.isValid()) {
    fmt::print(stderr, "Error: invalid configuration ({})\n", CONFIG.toString());
    return 1;
  }

  pulse::cpu::ProcStatCounterSource source(args::getString(pargs, ARG_STAT_PATH, "/proc/stat"));
  pulse::notify::LogNotifier notifier;
  sampling::CpuSampler sampler(CONFIG, source, notifier);
  pulse::system::SystemCollector systemCollector;

  sampler.start();

  for (int reportNum = 0; COUNT < 0 || reportNum < COUNT; ++reportNum) {
    std::this_thread::sleep_for(CONFIG.reportingInterval);

    pulse::metrics::MetricsBatch batch;
    sampler.fill(batch);
    if (WITH_SYSTEM) {
      const pulse::system::SystemReadStatus STATUS = systemCollector.collect();
      if (STATUS != pulse::system::SystemReadStatus::OK) {
        spdlog::warn("system: collection incomplete: {}", pulse::system::toString(STATUS));
      }
      systemCollector.fill(batch);
    }

    if (JSON_OUTPUT) {
      printJsonReport(batch, reportNum);
    } else {
      printHumanReport(batch, reportNum);
    }
  }

  sampler.stop();
  return 0;
}
