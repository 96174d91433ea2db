#ifndef OTOSUB_NOTE_HPP_
#define OTOSUB_NOTE_HPP_

#include <optional>
#include <string>
#include <vector>

namespace otosub {

struct PhonemeAttributes {
  // Phoneme position within the note; only index 0 is used here
  int index = 0;

  std::optional<std::string> voiceColor;
  int toneShift = 0;

  // Appended to each candidate to select an alternate sample, e.g. "2"
  std::optional<std::string> alternate;
};

struct Note {
  std::string lyric;
  std::optional<std::string> phoneticHint;

  // MIDI note number
  int tone = 60;

  std::vector<PhonemeAttributes> phonemeAttributes;
};

struct Phoneme {
  std::string alias;
};

struct PhonemizerResult {
  std::vector<Phoneme> phonemes;
};

// Index 0 attributes, or defaults when the note has none
inline PhonemeAttributes firstPhonemeAttributes(const Note &note) {
  for (const auto &attr : note.phonemeAttributes) {
    if (attr.index == 0) {
      return attr;
    }
  }

  return PhonemeAttributes();
}

} // namespace otosub

#endif // OTOSUB_NOTE_HPP_
