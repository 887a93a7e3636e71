#ifndef IRQMON_HELPERS_FILES_HPP
#define IRQMON_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief Whole-file reads for /proc and /sys text sources.
 *
 * Uses open/read/close directly; /proc files report a size of zero, so the
 * content is read in chunks until EOF rather than sized up front.
 */

#include <fcntl.h>    // open, O_RDONLY, O_CLOEXEC
#include <unistd.h>   // read, close

#include <array>
#include <cstddef>
#include <new> // std::bad_alloc
#include <string>

namespace irqmon {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Chunk size for each read() call.
inline constexpr std::size_t FILE_READ_CHUNK_SIZE = 4096;

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read a whole file into a string.
 * @param path File path to read.
 * @param out Destination (replaced).
 * @return true if the file was opened and read to EOF; false on open or
 *         read failure (out is left empty).
 * @note Allocates; /proc/interrupts on large machines exceeds 100 KiB.
 */
[[nodiscard]] inline bool readFileToString(const char* path, std::string& out) noexcept {
  out.clear();
  if (path == nullptr) {
    return false;
  }

  const int FD = ::open(path, O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return false;
  }

  std::array<char, FILE_READ_CHUNK_SIZE> chunk{};
  bool ok = true;
  try {
    for (;;) {
      const ssize_t N = ::read(FD, chunk.data(), chunk.size());
      if (N == 0) {
        break;
      }
      if (N < 0) {
        ok = false;
        break;
      }
      out.append(chunk.data(), static_cast<std::size_t>(N));
    }
  } catch (const std::bad_alloc&) {
    ok = false;
  }

  ::close(FD);
  if (!ok) {
    out.clear();
  }
  return ok;
}

} // namespace files
} // namespace helpers
} // namespace irqmon

#endif // IRQMON_HELPERS_FILES_HPP
