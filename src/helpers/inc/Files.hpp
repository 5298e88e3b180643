#ifndef PULSE_HELPERS_FILES_HPP
#define PULSE_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief Bounded procfs file reads into caller-owned buffers.
 *
 * The kernel counter files read by pulse (/proc/stat, /proc/meminfo,
 * /proc/loadavg) are small and regenerated on every open, so a single
 * open/read/close into a fixed buffer is enough.
 *
 * @note Hot-path safe: Uses open/read/close, no heap allocation.
 */

#include <fcntl.h>  // open, O_RDONLY, O_CLOEXEC
#include <unistd.h> // read, close

#include <array>
#include <cstddef>

namespace pulse {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Buffer size large enough for the aggregate section of /proc/stat.
inline constexpr std::size_t PROC_STAT_BUFFER_SIZE = 1024;

/// Buffer size for /proc/meminfo.
inline constexpr std::size_t MEMINFO_BUFFER_SIZE = 4096;

/// Buffer size for /proc/loadavg.
inline constexpr std::size_t LOADAVG_BUFFER_SIZE = 128;

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read up to bufSize-1 bytes of a file and null-terminate.
 * @param path File path to read.
 * @param buf Output buffer.
 * @param bufSize Size of output buffer.
 * @return Number of bytes read, 0 if the file could not be opened or was empty.
 *
 * Content beyond the buffer is silently truncated; callers size the buffer
 * for the prefix they actually parse.
 */
[[nodiscard]] inline std::size_t readFileToBuffer(const char* path, char* buf,
                                                  std::size_t bufSize) noexcept {
  if (buf == nullptr || bufSize == 0) {
    return 0;
  }
  buf[0] = '\0';
  if (path == nullptr) {
    return 0;
  }

  const int FD = ::open(path, O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return 0;
  }

  std::size_t total = 0;
  while (total < bufSize - 1) {
    const ssize_t N = ::read(FD, buf + total, bufSize - 1 - total);
    if (N <= 0) {
      break;
    }
    total += static_cast<std::size_t>(N);
  }

  ::close(FD);
  buf[total] = '\0';
  return total;
}

/**
 * @brief Read a file into a fixed-size array.
 * @tparam N Array size.
 * @return Number of bytes read, 0 on failure.
 */
template <std::size_t N>
[[nodiscard]] inline std::size_t readFileToArray(const char* path,
                                                 std::array<char, N>& out) noexcept {
  return readFileToBuffer(path, out.data(), out.size());
}

} // namespace files
} // namespace helpers
} // namespace pulse

#endif // PULSE_HELPERS_FILES_HPP
