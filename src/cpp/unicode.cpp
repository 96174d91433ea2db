#include "unicode.hpp"

#include <iterator>
#include <memory>

#include <spdlog/spdlog.h>
#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/unistr.h>
#include <utf8.h>

namespace otosub {

std::string sanitizeUtf8(const std::string &text) {
  if (utf8::is_valid(text.begin(), text.end())) {
    return text;
  }

  spdlog::warn("Replacing invalid UTF-8 in: {}", text);
  std::string fixed;
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(fixed));
  return fixed;
}

std::string normalize(const std::string &text) {
  std::string clean = sanitizeUtf8(text);

  UErrorCode status = U_ZERO_ERROR;
  const icu::Normalizer2 *nfc = icu::Normalizer2::getNFCInstance(status);
  if (U_FAILURE(status)) {
    spdlog::error("Failed to get NFC normalizer: {}", u_errorName(status));
    return clean;
  }

  icu::UnicodeString normalized =
      nfc->normalize(icu::UnicodeString::fromUTF8(clean), status);
  if (U_FAILURE(status)) {
    spdlog::error("NFC normalization failed: {}", u_errorName(status));
    return clean;
  }

  std::string result;
  normalized.toUTF8String(result);
  return result;
} /* normalize */

std::vector<std::string> graphemeClusters(const std::string &text) {
  std::vector<std::string> clusters;
  if (text.empty()) {
    return clusters;
  }

  icu::UnicodeString ustr = icu::UnicodeString::fromUTF8(sanitizeUtf8(text));

  UErrorCode status = U_ZERO_ERROR;
  std::unique_ptr<icu::BreakIterator> it(
      icu::BreakIterator::createCharacterInstance(icu::Locale::getRoot(),
                                                  status));
  if (U_FAILURE(status)) {
    // Fall back to one cluster per code point
    spdlog::error("Failed to create grapheme iterator: {}",
                  u_errorName(status));
    for (int32_t i = 0; i < ustr.length();) {
      UChar32 c = ustr.char32At(i);
      std::string cluster;
      icu::UnicodeString(c).toUTF8String(cluster);
      clusters.push_back(cluster);
      i += U16_LENGTH(c);
    }
    return clusters;
  }

  it->setText(ustr);
  int32_t start = it->first();
  for (int32_t end = it->next(); end != icu::BreakIterator::DONE;
       start = end, end = it->next()) {
    std::string cluster;
    ustr.tempSubStringBetween(start, end).toUTF8String(cluster);
    clusters.push_back(cluster);
  }

  return clusters;
} /* graphemeClusters */

std::optional<std::string> lastGrapheme(const std::string &text) {
  auto clusters = graphemeClusters(text);
  if (clusters.empty()) {
    return std::nullopt;
  }

  return clusters.back();
}

} // namespace otosub
