#ifndef __GM_TERMINAL_SANITIZER__
#define __GM_TERMINAL_SANITIZER__

#include "Headers.hpp"

namespace gm {
/**
 * @brief Cleans raw terminal output so it can be shown as plain text.
 *
 * Strips OSC/CSI/two byte escape sequences, C0 and C1 control characters
 * (tab and newline survive) and bytes that are not valid UTF-8, then folds
 * CR+LF and lone CR into LF.  When everything was stripped from an input that
 * contained a line terminator, a single "\n" is returned so the receiver still
 * sees the blank line.
 *
 * Pure and idempotent: sanitizing already sanitized text is a no-op.
 */
string sanitizeTerminalOutput(const string& raw);

inline string sanitizeTerminalOutput(const char* raw) {
  return sanitizeTerminalOutput(string(raw));
}

/** @brief nullopt passes through untouched. */
optional<string> sanitizeTerminalOutput(const optional<string>& raw);

/**
 * @brief Drops every byte that is not part of a well formed UTF-8 sequence.
 */
string dropInvalidUtf8(const string& raw);
}  // namespace gm

#endif  // __GM_TERMINAL_SANITIZER__
