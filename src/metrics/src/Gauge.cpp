/**
 * @file Gauge.cpp
 * @brief Gauge storage and batch rendering.
 */

#include "src/metrics/inc/Gauge.hpp"

#include "src/helpers/inc/Cpu.hpp"

#include <utility> // std::move

#include <fmt/core.h>

namespace pulse {

namespace metrics {

/* ----------------------------- MetricsBatch ----------------------------- */

void MetricsBatch::add(std::string name, double value, std::uint64_t timestampNs) {
  samples.push_back(MetricSample{std::move(name), value, timestampNs});
}

double MetricsBatch::valueOf(const std::string& name, double defaultVal) const noexcept {
  for (const MetricSample& s : samples) {
    if (s.name == name) {
      return s.value;
    }
  }
  return defaultVal;
}

std::string MetricsBatch::toString() const {
  std::string out;
  for (const MetricSample& s : samples) {
    out += fmt::format("{:<20} {:>8.2f}\n", s.name, s.value);
  }
  return out;
}

std::string MetricsBatch::toJson() const {
  std::string out = "{";
  bool first = true;
  for (const MetricSample& s : samples) {
    if (!first) {
      out += ", ";
    }
    first = false;
    out += fmt::format("\"{}\": {:.4f}", s.name, s.value);
  }
  out += "}";
  return out;
}

/* ----------------------------- Gauge ----------------------------- */

Gauge::Gauge(std::string name) : name_(std::move(name)) {}

void Gauge::update(double value) noexcept { value_.store(value, std::memory_order_relaxed); }

double Gauge::value() const noexcept { return value_.load(std::memory_order_relaxed); }

void Gauge::fill(MetricsBatch& batch) const {
  batch.add(name_, value(), pulse::helpers::cpu::getMonotonicNs());
}

} // namespace metrics

} // namespace pulse
