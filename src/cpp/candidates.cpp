#include "candidates.hpp"

#include <spdlog/spdlog.h>

#include "tables.hpp"
#include "unicode.hpp"

namespace otosub {

CandidateList defaultCandidates(const std::string &lyric) {
  return CandidateList{"- " + lyric, lyric};
}

std::optional<std::string> bareVowelSubstitute(const std::string &lyric) {
  auto tail = lastGrapheme(lyric);
  if (!tail) {
    return std::nullopt;
  }

  auto vowel = classifyVowel(*tail);
  if (!vowel) {
    return std::nullopt;
  }

  // "N" has no substitute, so ン keeps its lyric
  auto vowelTail = lastGrapheme(*vowel);
  if (!vowelTail) {
    return std::nullopt;
  }

  auto substitute = substituteBareVowel(*vowelTail);
  if (!substitute) {
    return std::nullopt;
  }

  spdlog::debug("Substituting '{}' with bare vowel '{}'", lyric, *substitute);
  return normalize(*substitute);
} /* bareVowelSubstitute */

std::string effectiveLyric(const Note &note) {
  if (note.phoneticHint && !note.phoneticHint->empty()) {
    return normalize(*note.phoneticHint);
  }

  return normalize(note.lyric);
}

std::optional<std::string> trailingVowel(const Note &note) {
  auto tail = lastGrapheme(effectiveLyric(note));
  if (!tail) {
    return std::nullopt;
  }

  return classifyVowel(*tail);
}

CandidateList vcvCandidates(const std::string &vowel,
                            const std::string &lyric) {
  return CandidateList{vowel + " " + lyric, "* " + lyric, lyric, "- " + lyric};
}

CandidateList buildCandidates(const std::string &lyric,
                              const std::optional<Note> &prevNeighbour) {
  if (prevNeighbour) {
    auto vowel = trailingVowel(*prevNeighbour);
    if (vowel) {
      return vcvCandidates(*vowel, lyric);
    }
  }

  return defaultCandidates(lyric);
}

} // namespace otosub
