#include "note_input.hpp"

#include <sstream>
#include <utility>

#include <spdlog/spdlog.h>

#include "tables.hpp"
#include "unicode.hpp"

using json = nlohmann::json;

namespace otosub {

void resolveTextLine(const SubstitutorPhonemizer &phonemizer,
                     const std::string &line, const NoteDefaults &defaults,
                     std::ostream &out) {
  std::istringstream iss(line);
  std::string lyric;
  std::optional<Note> prevNeighbour;
  bool first = true;

  while (iss >> lyric) {
    Note note;
    note.lyric = lyric;
    note.tone = defaults.tone;
    if (defaults.voiceColor) {
      PhonemeAttributes attr;
      attr.voiceColor = defaults.voiceColor;
      note.phonemeAttributes.push_back(attr);
    }

    auto result = phonemizer.process(note, prevNeighbour);
    if (!first) {
      out << " ";
    }
    out << result.phonemes.front().alias;
    first = false;

    prevNeighbour = note;
  }

  out << std::endl;
} /* resolveTextLine */

Note parseNoteLine(const json &lineRoot, const NoteDefaults &defaults) {
  Note note;
  note.lyric = lineRoot.at("lyric").get<std::string>();
  note.tone = lineRoot.value("tone", defaults.tone);

  if (lineRoot.contains("hint")) {
    note.phoneticHint = lineRoot["hint"].get<std::string>();
  }

  PhonemeAttributes attr;
  attr.voiceColor = defaults.voiceColor;
  if (lineRoot.contains("color")) {
    attr.voiceColor = lineRoot["color"].get<std::string>();
  }
  attr.toneShift = lineRoot.value("tone_shift", 0);
  if (lineRoot.contains("alternate")) {
    attr.alternate = lineRoot["alternate"].get<std::string>();
  }
  note.phonemeAttributes.push_back(attr);

  return note;
} /* parseNoteLine */

JsonNoteReader::JsonNoteReader(const SubstitutorPhonemizer &phonemizer,
                               NoteDefaults defaults)
    : phonemizer(phonemizer), defaults(std::move(defaults)) {}

bool JsonNoteReader::resolveLine(const std::string &line, std::ostream &out) {
  if (line.empty()) {
    return false;
  }

  try {
    // value() throws type_error for anything but an object
    json lineRoot = json::parse(line);
    if (lineRoot.value("reset", false)) {
      prevNeighbour.reset();
    }

    auto note = parseNoteLine(lineRoot, defaults);
    auto result = phonemizer.process(note, prevNeighbour);
    out << result.phonemes.front().alias << std::endl;

    prevNeighbour = note;
    return true;
  } catch (const json::exception &e) {
    spdlog::error("Skipping invalid note line '{}': {}", line, e.what());
    prevNeighbour.reset();
    return false;
  }
} /* resolveLine */

void classifyLine(const std::string &line, std::ostream &out) {
  std::istringstream iss(line);
  std::string lyric;

  while (iss >> lyric) {
    std::string normalized = normalize(lyric);

    std::optional<std::string> vowel;
    auto tail = lastGrapheme(normalized);
    if (tail) {
      vowel = classifyVowel(*tail);
    }
    auto consonant = classifyConsonant(normalized);

    out << normalized << "\t" << vowel.value_or("-") << "\t"
        << consonant.value_or("-") << std::endl;
  }
}

} // namespace otosub
