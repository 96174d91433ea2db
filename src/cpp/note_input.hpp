#ifndef OTOSUB_NOTE_INPUT_HPP_
#define OTOSUB_NOTE_INPUT_HPP_

#include <optional>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

#include "note.hpp"
#include "phonemizer.hpp"

namespace otosub {

// Applied to notes that don't set their own tone or color
struct NoteDefaults {
  int tone = 60;
  std::optional<std::string> voiceColor;
};

// Whitespace-separated lyrics of one phrase. Each note's previous neighbour is
// the lyric before it on the same line. Writes the aliases space-separated.
void resolveTextLine(const SubstitutorPhonemizer &phonemizer,
                     const std::string &line, const NoteDefaults &defaults,
                     std::ostream &out);

// {
//   "lyric": str,          (required)
//   "hint": str,           (optional)
//   "tone": int,           (optional)
//   "color": str,          (optional)
//   "tone_shift": int,     (optional)
//   "alternate": str,      (optional)
//   "reset": bool          (optional, no previous neighbour)
// }
// Throws nlohmann::json::exception on a missing or mistyped field.
Note parseNoteLine(const nlohmann::json &lineRoot,
                   const NoteDefaults &defaults);

// Resolves JSON note lines, each one the previous neighbour of the next
class JsonNoteReader {
public:
  JsonNoteReader(const SubstitutorPhonemizer &phonemizer,
                 NoteDefaults defaults);

  // Writes one alias line. Returns false (and clears the previous
  // neighbour) if the line is not a valid note.
  bool resolveLine(const std::string &line, std::ostream &out);

private:
  const SubstitutorPhonemizer &phonemizer;
  NoteDefaults defaults;
  std::optional<Note> prevNeighbour;
};

// Writes "lyric<TAB>vowel<TAB>consonant" per lyric, "-" for a miss
void classifyLine(const std::string &line, std::ostream &out);

} // namespace otosub

#endif // OTOSUB_NOTE_INPUT_HPP_
