#ifndef __APC_RAW_SOCKET_UTILS__
#define __APC_RAW_SOCKET_UTILS__

#include "Headers.hpp"

namespace apc {
/**
 * @brief Blocking helpers over plain descriptors, for the server side of a
 * socket pair.
 */
class RawSocketUtils {
 public:
  /**
   * @brief Writes the entire buffer, retrying on EAGAIN.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  static void writeAll(int fd, const string& data) {
    writeAll(fd, data.data(), data.length());
  }

  /**
   * @brief Reads one record, up to and including its ETX/ETB terminator.
   * @throws std::runtime_error when the peer closes first or `timeoutMs`
   * passes without a byte.
   */
  static string readRecord(int fd, int timeoutMs = 5000);
};
}  // namespace apc
#endif  // __APC_RAW_SOCKET_UTILS__
