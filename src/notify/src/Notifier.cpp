/**
 * @file Notifier.cpp
 * @brief Report formatting and the logging fallback notifier.
 */

#include "src/notify/inc/Notifier.hpp"

#include <exception>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace pulse {

namespace notify {

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(NotifyStatus status) noexcept {
  switch (status) {
  case NotifyStatus::OK:
    return "OK";
  case NotifyStatus::SERIALIZE_FAILED:
    return "SERIALIZE_FAILED";
  case NotifyStatus::TRANSPORT_FAILED:
    return "TRANSPORT_FAILED";
  case NotifyStatus::TIMED_OUT:
    return "TIMED_OUT";
  }
  return "UNKNOWN";
}

std::string formatReport(std::string_view hostname, std::string_view text) {
  return fmt::format("report from host {}\n{}", hostname, text);
}

/* ----------------------------- LogNotifier ----------------------------- */

NotifyStatus LogNotifier::notify(std::string_view hostname, std::string_view text) noexcept {
  try {
    spdlog::warn("{}", formatReport(hostname, text));
  } catch (const std::exception&) {
    // Formatting allocates
    return NotifyStatus::SERIALIZE_FAILED;
  }
  return NotifyStatus::OK;
}

} // namespace notify

} // namespace pulse
