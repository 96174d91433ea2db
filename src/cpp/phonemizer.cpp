#include "phonemizer.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "candidates.hpp"
#include "oto_resolver.hpp"
#include "unicode.hpp"

namespace otosub {

static PhonemizerResult singlePhoneme(const std::string &alias) {
  PhonemizerResult result;
  result.phonemes.push_back(Phoneme{alias});
  return result;
}

void SubstitutorPhonemizer::setSinger(std::shared_ptr<const Singer> singer) {
  this->singer = std::move(singer);
}

PhonemizerResult
SubstitutorPhonemizer::process(const std::vector<Note> &notes,
                               const std::optional<Note> &prevNeighbour) const {
  if (notes.empty()) {
    throw std::invalid_argument("No notes to phonemize");
  }

  const Note &note = notes[0];
  std::string currentLyric = normalize(note.lyric);

  if (!singer) {
    spdlog::warn("No singer set; passing through lyric '{}'", currentLyric);
    return singlePhoneme(currentLyric);
  }

  auto settings = probeSettingsFor(note);

  // Hint check
  if (note.phoneticHint && !note.phoneticHint->empty()) {
    CandidateList hintOnly{normalize(*note.phoneticHint)};
    auto oto = resolveOto(*singer, hintOnly, settings);
    if (oto) {
      return singlePhoneme(oto->alias);
    }

    spdlog::debug("No oto for hint '{}'; resolving lyric '{}'", hintOnly[0],
                  currentLyric);
  }

  // Fall back to the bare vowel when the syllable itself has no sample
  if (!resolveOto(*singer, defaultCandidates(currentLyric), settings)) {
    auto substitute = bareVowelSubstitute(currentLyric);
    if (substitute) {
      currentLyric = *substitute;
    }
  }

  auto candidates = buildCandidates(currentLyric, prevNeighbour);
  auto oto = resolveOto(*singer, candidates, settings);
  if (oto) {
    return singlePhoneme(oto->alias);
  }

  spdlog::warn("No oto found for '{}' at tone {}; using lyric as phoneme",
               currentLyric, settings.tone + settings.toneShift);
  return singlePhoneme(currentLyric);
} /* process */

PhonemizerResult
SubstitutorPhonemizer::process(const Note &note,
                               const std::optional<Note> &prevNeighbour) const {
  return process(std::vector<Note>{note}, prevNeighbour);
}

} // namespace otosub
