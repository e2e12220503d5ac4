#include "Cp1251.hpp"

namespace apc {
namespace {
// Code points for bytes 0x80-0xBF. 0xC0-0xFF map linearly onto U+0410-U+044F.
const uint16_t HIGH_TABLE[64] = {
    0x0402, 0x0403, 0x201A, 0x0453, 0x201E, 0x2026, 0x2020, 0x2021,  //
    0x20AC, 0x2030, 0x0409, 0x2039, 0x040A, 0x040C, 0x040B, 0x040F,  //
    0x0452, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,  //
    0xFFFD, 0x2122, 0x0459, 0x203A, 0x045A, 0x045C, 0x045B, 0x045F,  //
    0x00A0, 0x040E, 0x045E, 0x0408, 0x00A4, 0x0490, 0x00A6, 0x00A7,  //
    0x0401, 0x00A9, 0x0404, 0x00AB, 0x00AC, 0x00AD, 0x00AE, 0x0407,  //
    0x00B0, 0x00B1, 0x0406, 0x0456, 0x0491, 0x00B5, 0x00B6, 0x00B7,  //
    0x0451, 0x2116, 0x0454, 0x00BB, 0x0458, 0x0405, 0x0455, 0x0457,  //
};

void appendUtf8(string* out, uint32_t codePoint) {
  if (codePoint < 0x80) {
    out->push_back(char(codePoint));
  } else if (codePoint < 0x800) {
    out->push_back(char(0xC0 | (codePoint >> 6)));
    out->push_back(char(0x80 | (codePoint & 0x3F)));
  } else {
    out->push_back(char(0xE0 | (codePoint >> 12)));
    out->push_back(char(0x80 | ((codePoint >> 6) & 0x3F)));
    out->push_back(char(0x80 | (codePoint & 0x3F)));
  }
}

char encodeCodePoint(uint32_t codePoint) {
  if (codePoint < 0x80) {
    return char(codePoint);
  }
  if (codePoint >= 0x0410 && codePoint <= 0x044F) {
    return char(0xC0 + (codePoint - 0x0410));
  }
  for (int i = 0; i < 64; i++) {
    if (HIGH_TABLE[i] == codePoint && codePoint != 0xFFFD) {
      return char(0x80 + i);
    }
  }
  return '?';
}
}  // namespace

string Cp1251::toUtf8(const string& cp1251) {
  string out;
  out.reserve(cp1251.length() * 2);
  for (char c : cp1251) {
    uint8_t byte = uint8_t(c);
    if (byte < 0x80) {
      out.push_back(c);
    } else if (byte < 0xC0) {
      appendUtf8(&out, HIGH_TABLE[byte - 0x80]);
    } else {
      appendUtf8(&out, 0x0410 + (byte - 0xC0));
    }
  }
  return out;
}

string Cp1251::fromUtf8(const string& utf8) {
  string out;
  out.reserve(utf8.length());
  size_t i = 0;
  while (i < utf8.length()) {
    uint8_t lead = uint8_t(utf8[i]);
    int extra;
    uint32_t codePoint;
    if (lead < 0x80) {
      out.push_back(char(lead));
      i++;
      continue;
    } else if ((lead & 0xE0) == 0xC0) {
      extra = 1;
      codePoint = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      extra = 2;
      codePoint = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      extra = 3;
      codePoint = lead & 0x07;
    } else {
      out.push_back('?');
      i++;
      continue;
    }
    if (i + extra >= utf8.length()) {
      // Truncated sequence at the end of the input
      out.push_back('?');
      break;
    }
    bool valid = true;
    for (int k = 1; k <= extra; k++) {
      uint8_t continuation = uint8_t(utf8[i + k]);
      if ((continuation & 0xC0) != 0x80) {
        valid = false;
        break;
      }
      codePoint = (codePoint << 6) | (continuation & 0x3F);
    }
    if (!valid) {
      out.push_back('?');
      i++;
      continue;
    }
    out.push_back(encodeCodePoint(codePoint));
    i += extra + 1;
  }
  return out;
}
}  // namespace apc
