#include "TerminalSanitizer.hpp"

namespace gm {
namespace {
const char ESC = 0x1b;
const char BEL = 0x07;

inline bool isStrippedControl(unsigned char c) {
  return c <= 0x08 || c == 0x0b || c == 0x0c || (c >= 0x0e && c <= 0x1f) ||
         c == 0x7f;
}

inline bool isSimpleEscapeFinal(unsigned char c) {
  return (c >= 0x40 && c <= 0x5a) || (c >= 0x5c && c <= 0x5f);
}

// Returns the index just past an OSC sequence starting at `start` (which
// points at ESC), or string::npos when the sequence is unterminated.
size_t skipOsc(const string& s, size_t start) {
  for (size_t i = start + 2; i < s.length(); i++) {
    if (s[i] == BEL) {
      return i + 1;
    }
    if (s[i] == ESC) {
      if (i + 1 < s.length() && s[i + 1] == '\\') {
        return i + 2;
      }
      return string::npos;
    }
  }
  return string::npos;
}

// Same contract as skipOsc for CSI: params, intermediates, then a final byte.
size_t skipCsi(const string& s, size_t start) {
  size_t i = start + 2;
  while (i < s.length() && (unsigned char)s[i] >= 0x30 &&
         (unsigned char)s[i] <= 0x3f) {
    i++;
  }
  while (i < s.length() && (unsigned char)s[i] >= 0x20 &&
         (unsigned char)s[i] <= 0x2f) {
    i++;
  }
  if (i < s.length() && (unsigned char)s[i] >= 0x40 &&
      (unsigned char)s[i] <= 0x7e) {
    return i + 1;
  }
  return string::npos;
}

string stripSequences(const string& s) {
  string out;
  out.reserve(s.length());
  size_t i = 0;
  while (i < s.length()) {
    unsigned char c = s[i];
    if (c == (unsigned char)ESC) {
      if (i + 1 < s.length()) {
        unsigned char next = s[i + 1];
        if (next == ']') {
          size_t end = skipOsc(s, i);
          // An unterminated OSC only loses its two byte introducer.
          i = (end == string::npos) ? i + 2 : end;
          continue;
        }
        if (next == '[') {
          size_t end = skipCsi(s, i);
          if (end != string::npos) {
            i = end;
            continue;
          }
          // Lone ESC, the '[' stays
          i++;
          continue;
        }
        if (isSimpleEscapeFinal(next)) {
          i += 2;
          continue;
        }
      }
      i++;
      continue;
    }
    if (isStrippedControl(c)) {
      i++;
      continue;
    }
    // C1 controls, U+0080..U+009F
    if (c == 0xc2 && i + 1 < s.length() && (unsigned char)s[i + 1] >= 0x80 &&
        (unsigned char)s[i + 1] <= 0x9f) {
      i += 2;
      continue;
    }
    out.push_back(s[i]);
    i++;
  }
  return out;
}

string normalizeLineEndings(const string& s) {
  string out;
  out.reserve(s.length());
  for (size_t i = 0; i < s.length(); i++) {
    if (s[i] == '\r') {
      out.push_back('\n');
      if (i + 1 < s.length() && s[i + 1] == '\n') {
        i++;
      }
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}
}  // namespace

string dropInvalidUtf8(const string& raw) {
  string out;
  out.reserve(raw.length());
  size_t i = 0;
  while (i < raw.length()) {
    unsigned char c = raw[i];
    int extra;
    uint32_t minimum;
    if (c < 0x80) {
      out.push_back(raw[i]);
      i++;
      continue;
    } else if ((c & 0xe0) == 0xc0) {
      extra = 1;
      minimum = 0x80;
    } else if ((c & 0xf0) == 0xe0) {
      extra = 2;
      minimum = 0x800;
    } else if ((c & 0xf8) == 0xf0) {
      extra = 3;
      minimum = 0x10000;
    } else {
      i++;
      continue;
    }
    if (i + extra >= raw.length()) {
      // Truncated sequence at the end of the buffer
      i++;
      continue;
    }
    uint32_t codepoint = c & (0x3f >> extra);
    bool valid = true;
    for (int a = 1; a <= extra; a++) {
      unsigned char cc = raw[i + a];
      if ((cc & 0xc0) != 0x80) {
        valid = false;
        break;
      }
      codepoint = (codepoint << 6) | (cc & 0x3f);
    }
    if (!valid || codepoint < minimum || codepoint > 0x10ffff ||
        (codepoint >= 0xd800 && codepoint <= 0xdfff)) {
      i++;
      continue;
    }
    out.append(raw, i, extra + 1);
    i += extra + 1;
  }
  return out;
}

string sanitizeTerminalOutput(const string& raw) {
  if (raw.empty()) {
    return raw;
  }
  string cleaned = normalizeLineEndings(stripSequences(dropInvalidUtf8(raw)));
  if (cleaned.empty() && raw.find_first_of("\r\n") != string::npos) {
    return "\n";
  }
  return cleaned;
}

optional<string> sanitizeTerminalOutput(const optional<string>& raw) {
  if (!raw) {
    return nullopt;
  }
  return sanitizeTerminalOutput(*raw);
}
}  // namespace gm
