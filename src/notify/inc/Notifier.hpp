#ifndef PULSE_NOTIFY_NOTIFIER_HPP
#define PULSE_NOTIFY_NOTIFIER_HPP
/**
 * @file Notifier.hpp
 * @brief Outbound alert notifications.
 *
 * A Notifier sends an opaque text message on behalf of a host. Transports
 * live outside pulse; LogNotifier is the fallback used when no destination
 * is configured.
 */

#include <string>
#include <string_view>

namespace pulse {

namespace notify {

/* ----------------------------- NotifyStatus ----------------------------- */

/**
 * @brief Status codes for notification dispatch.
 */
enum class NotifyStatus : unsigned char {
  OK = 0,
  SERIALIZE_FAILED,
  TRANSPORT_FAILED,
  TIMED_OUT,
};

/// Human-readable status string.
[[nodiscard]] const char* toString(NotifyStatus status) noexcept;

/**
 * @brief Full report text as delivered to a destination.
 * @return "report from host <hostname>\n<text>"
 */
[[nodiscard]] std::string formatReport(std::string_view hostname, std::string_view text);

/* ----------------------------- Notifier ----------------------------- */

/**
 * @brief Destination for alert text.
 *
 * Implementations bound their own dispatch time and never throw.
 */
class Notifier {
public:
  virtual ~Notifier() = default;

  [[nodiscard]] virtual NotifyStatus notify(std::string_view hostname,
                                            std::string_view text) noexcept = 0;
};

/**
 * @brief Writes the report through the default logger.
 */
class LogNotifier final : public Notifier {
public:
  [[nodiscard]] NotifyStatus notify(std::string_view hostname,
                                    std::string_view text) noexcept override;
};

} // namespace notify

} // namespace pulse

#endif // PULSE_NOTIFY_NOTIFIER_HPP
