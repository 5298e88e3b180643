#ifndef PULSE_HELPERS_STRINGS_HPP
#define PULSE_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief Line-oriented parsing helpers for procfs text.
 *
 * @note Hot-path safe: All functions are noexcept with no allocations.
 */

#include <cstddef>
#include <cstring> // strlen, strncmp

namespace pulse {
namespace helpers {
namespace strings {

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Skip spaces and tabs.
 * @return Pointer to first non-blank character (or end of string).
 */
[[nodiscard]] inline const char* skipWhitespace(const char* ptr) noexcept {
  if (ptr == nullptr) {
    return nullptr;
  }
  while (*ptr == ' ' || *ptr == '\t') {
    ++ptr;
  }
  return ptr;
}

/// Check if a line starts with prefix.
[[nodiscard]] inline bool lineStartsWith(const char* line, const char* prefix) noexcept {
  if (line == nullptr || prefix == nullptr) {
    return false;
  }
  return std::strncmp(line, prefix, std::strlen(prefix)) == 0;
}

/**
 * @brief Advance to the start of the next line.
 * @return Pointer past the next '\n', or to the terminating null.
 */
[[nodiscard]] inline const char* nextLine(const char* ptr) noexcept {
  if (ptr == nullptr) {
    return nullptr;
  }
  while (*ptr != '\0' && *ptr != '\n') {
    ++ptr;
  }
  return (*ptr == '\n') ? ptr + 1 : ptr;
}

} // namespace strings
} // namespace helpers
} // namespace pulse

#endif // PULSE_HELPERS_STRINGS_HPP
