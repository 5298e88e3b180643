/**
 * @file CpuSampler.cpp
 * @brief Sampling loop, alert dispatch and EMA reporting.
 */

#include "src/sampling/inc/CpuSampler.hpp"

#include <exception>
#include <utility> // std::move

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace pulse {

namespace sampling {

namespace {

using cpu::CounterReadStatus;

constexpr std::size_t USER_SLOT = 0;
constexpr std::size_t SYSTEM_SLOT = 1;
constexpr std::size_t IDLE_SLOT = 2;

} // namespace

/* ----------------------------- Helpers ----------------------------- */

const char* toString(TickStatus status) noexcept {
  switch (status) {
  case TickStatus::OK:
    return "OK";
  case TickStatus::READ_FAILED:
    return "READ_FAILED";
  }
  return "UNKNOWN";
}

std::string formatAlertMessage(AlertEvent event, double average, double threshold) {
  switch (event) {
  case AlertEvent::ALERT:
    return fmt::format("[ALERT]: cpu.user average utilization {:f} is higher than {:f}", average,
                       threshold);
  case AlertEvent::RESOLVED:
    return fmt::format("[RESOLVED]: cpu.user average utilization {:f} is within threshold {:f}",
                       average, threshold);
  case AlertEvent::NONE:
    break;
  }
  return {};
}

/* ----------------------------- CpuSampler ----------------------------- */

// Only cpu.user feeds the alert, so system and idle keep a single slot.
CpuSampler::CpuSampler(SamplerConfig config, cpu::CounterSource& source,
                       notify::Notifier& notifier)
    : config_(std::move(config)), source_(source), notifier_(notifier),
      averages_{RingAverage{config_.alpha(), config_.capacity()},
                RingAverage{config_.alpha(), 1}, RingAverage{config_.alpha(), 1}},
      gauges_{metrics::Gauge{cpu::metricName(TRACKED_CATEGORIES[USER_SLOT])},
              metrics::Gauge{cpu::metricName(TRACKED_CATEGORIES[SYSTEM_SLOT])},
              metrics::Gauge{cpu::metricName(TRACKED_CATEGORIES[IDLE_SLOT])}},
      debouncer_(config_.cooldown) {}

CpuSampler::~CpuSampler() { stop(); }

void CpuSampler::prime() noexcept {
  cpu::CpuCounterSnapshot snap{};
  const CounterReadStatus STATUS = source_.read(snap);

  std::lock_guard<std::mutex> lock(mtx_);
  if (STATUS != CounterReadStatus::OK) {
    history_.clear();
    spdlog::warn("cpu: initial counter read failed: {}", cpu::toString(STATUS));
    return;
  }
  history_.push(snap);
}

TickResult CpuSampler::tick() noexcept { return tick(Clock::now()); }

TickResult CpuSampler::tick(Clock::time_point now) noexcept {
  TickResult result{};

  // Counter read stays outside the lock
  cpu::CpuCounterSnapshot snap{};
  result.readStatus = source_.read(snap);
  if (result.readStatus != CounterReadStatus::OK) {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      history_.clear();
    }
    spdlog::warn("cpu: counter read failed ({}), snapshots cleared",
                 cpu::toString(result.readStatus));
    result.status = TickStatus::READ_FAILED;
    return result;
  }

  {
    std::lock_guard<std::mutex> lock(mtx_);
    history_.push(snap);
    for (std::size_t i = 0; i < TRACKED_CATEGORIES.size(); ++i) {
      averages_[i].add(history_.rate(TRACKED_CATEGORIES[i]));
    }
    result.userAverage = averages_[USER_SLOT].windowedAverage();
  }

  result.event = debouncer_.update(result.userAverage >= config_.threshold, now);
  if (result.event != AlertEvent::NONE) {
    result.notifyStatus = dispatch(result.event, result.userAverage);
  }

  spdlog::debug("cpu: tick avg={:.2f} phase={}", result.userAverage,
                toString(debouncer_.phase()));
  return result;
}

notify::NotifyStatus CpuSampler::dispatch(AlertEvent event, double average) noexcept {
  notify::NotifyStatus status = notify::NotifyStatus::OK;
  try {
    const std::string MESSAGE = formatAlertMessage(event, average, config_.threshold);
    status = notifier_.notify(config_.hostname, MESSAGE);
  } catch (const std::exception& e) {
    spdlog::error("cpu: could not build {} message: {}", toString(event), e.what());
    return notify::NotifyStatus::SERIALIZE_FAILED;
  }

  if (status != notify::NotifyStatus::OK) {
    spdlog::error("cpu: {} notification failed: {}", toString(event), notify::toString(status));
  }
  return status;
}

/* ----------------------------- Background Task ----------------------------- */

void CpuSampler::start() {
  if (running_.exchange(true)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(waitMtx_);
    stopRequested_ = false;
  }
  prime();
  worker_ = std::thread([this]() { run(); });
  spdlog::info("cpu: sampler started ({})", config_.toString());
}

void CpuSampler::stop() noexcept {
  {
    std::lock_guard<std::mutex> lock(waitMtx_);
    stopRequested_ = true;
  }
  wake_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
  running_.store(false);
}

void CpuSampler::run() noexcept {
  auto next = Clock::now() + config_.sampleRate;
  std::unique_lock<std::mutex> lock(waitMtx_);
  while (!wake_.wait_until(lock, next, [this]() { return stopRequested_; })) {
    lock.unlock();
    (void)tick();
    lock.lock();

    // Fixed period; after a long stall resume from now instead of bursting
    next += config_.sampleRate;
    const auto NOW = Clock::now();
    if (next < NOW) {
      next = NOW + config_.sampleRate;
    }
  }
}

/* ----------------------------- Reporting ----------------------------- */

void CpuSampler::fill(metrics::MetricsBatch& batch) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    for (std::size_t i = 0; i < gauges_.size(); ++i) {
      gauges_[i].update(averages_[i].peekEma());
    }
  }
  for (const metrics::Gauge& gauge : gauges_) {
    gauge.fill(batch);
  }
}

EmaSnapshot CpuSampler::emaSnapshot() const {
  std::lock_guard<std::mutex> lock(mtx_);
  EmaSnapshot snap{};
  snap.user = averages_[USER_SLOT].peekEma();
  snap.system = averages_[SYSTEM_SLOT].peekEma();
  snap.idle = averages_[IDLE_SLOT].peekEma();
  return snap;
}

double CpuSampler::userWindowedAverage() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return averages_[USER_SLOT].windowedAverage();
}

bool CpuSampler::hasSnapshotPair() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return history_.hasPrevious() && history_.hasCurrent();
}

std::size_t CpuSampler::userSampleCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  const RingAverage& USER = averages_[USER_SLOT];
  return USER.filled() ? USER.capacity() : USER.writePos();
}

} // namespace sampling

} // namespace pulse
