#pragma once

#include <string>
#include <string_view>

#include "psdconv/vector.hpp"

namespace psdconv {

// Maps a client supplied filename to a string usable as a single path component.
//
// Kept characters: ASCII letters and digits, '_', '-', '.', and the code points of the allowed alphabet.
// Any other code point (including '/' and '\') and each byte of a malformed UTF-8 sequence is replaced by one '_'.
// A '.' directly followed by another '.' is replaced too, so the result never contains ".." while the last dot of a
// run (the extension separator) is kept. The empty string maps to "_".
//
// Sanitization is deterministic and idempotent.
class FilenameSanitizer {
 public:
  // Throws std::invalid_argument if allowedAlphabet is not valid UTF-8.
  explicit FilenameSanitizer(std::string_view allowedAlphabet);

  [[nodiscard]] std::string sanitize(std::string_view filename) const;

 private:
  [[nodiscard]] bool isAllowed(char32_t codePoint) const noexcept;

  vector<char32_t> _allowedCodePoints;  // sorted
};

// Text after the last '.', or empty if there is no dot.
std::string_view FileExtension(std::string_view filename) noexcept;

// Final component without its suffix, following the usual path 'stem' rules:
// a leading dot does not start a suffix (".psd" has stem ".psd"), and "a.b.psd" has stem "a.b".
std::string_view FileStem(std::string_view filename) noexcept;

}  // namespace psdconv
