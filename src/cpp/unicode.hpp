#ifndef OTOSUB_UNICODE_HPP_
#define OTOSUB_UNICODE_HPP_

#include <optional>
#include <string>
#include <vector>

namespace otosub {

// Invalid UTF-8 sequences are replaced with U+FFFD
std::string sanitizeUtf8(const std::string &text);

// NFC normalization. Returns the sanitized input unchanged if ICU fails.
std::string normalize(const std::string &text);

// Splits text into user-perceived characters (extended grapheme clusters)
std::vector<std::string> graphemeClusters(const std::string &text);

// Last grapheme cluster, or nullopt for empty text
std::optional<std::string> lastGrapheme(const std::string &text);

} // namespace otosub

#endif // OTOSUB_UNICODE_HPP_
