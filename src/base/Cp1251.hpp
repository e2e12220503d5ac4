#ifndef __APC_CP1251__
#define __APC_CP1251__

#include "Headers.hpp"

namespace apc {
/**
 * @brief Windows-1251 <-> UTF-8 transcoding. The agent server still speaks
 * the legacy Cyrillic codepage on the wire.
 */
class Cp1251 {
 public:
  /**
   * @brief Decodes Windows-1251 bytes into UTF-8. The one unassigned byte
   * (0x98) becomes U+FFFD.
   */
  static string toUtf8(const string& cp1251);

  /**
   * @brief Encodes UTF-8 text into Windows-1251. Code points without a
   * mapping, and malformed UTF-8 sequences, become '?'.
   */
  static string fromUtf8(const string& utf8);
};
}  // namespace apc

#endif  // __APC_CP1251__
