#ifndef OTOSUB_PHONEMIZER_HPP_
#define OTOSUB_PHONEMIZER_HPP_

#include <memory>
#include <optional>
#include <vector>

#include "note.hpp"
#include "singer.hpp"

namespace otosub {

// Japanese kana phonemizer that substitutes a missing syllable with its bare
// vowel and prefers VCV aliases when the previous note ends in a vowel.
class SubstitutorPhonemizer {
public:
  void setSinger(std::shared_ptr<const Singer> singer);

  // Resolves the first note of a note group to exactly one phoneme.
  // Throws std::invalid_argument for an empty group.
  PhonemizerResult process(const std::vector<Note> &notes,
                           const std::optional<Note> &prevNeighbour) const;

  // Single note convenience overload
  PhonemizerResult process(const Note &note,
                           const std::optional<Note> &prevNeighbour) const;

private:
  std::shared_ptr<const Singer> singer;
};

} // namespace otosub

#endif // OTOSUB_PHONEMIZER_HPP_
