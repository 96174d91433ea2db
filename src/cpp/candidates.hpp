#ifndef OTOSUB_CANDIDATES_HPP_
#define OTOSUB_CANDIDATES_HPP_

#include <optional>
#include <string>
#include <vector>

#include "note.hpp"

namespace otosub {

typedef std::vector<std::string> CandidateList;

// Utterance-initial alias and the bare lyric: ["- な", "な"]
CandidateList defaultCandidates(const std::string &lyric);

// Bare vowel kana for the lyric's tail vowel, e.g. "あ" for "か".
// nullopt when the tail vowel or its substitute is unknown.
std::optional<std::string> bareVowelSubstitute(const std::string &lyric);

// Hint if present, otherwise the lyric. Normalized.
std::string effectiveLyric(const Note &note);

// Tail vowel of a note's effective lyric, e.g. "a" for "きゃ"
std::optional<std::string> trailingVowel(const Note &note);

// ["a な", "* な", "な", "- な"]
CandidateList vcvCandidates(const std::string &vowel,
                            const std::string &lyric);

// VCV candidates when the previous neighbour has a known tail vowel,
// otherwise the defaults. Never empty.
CandidateList buildCandidates(const std::string &lyric,
                              const std::optional<Note> &prevNeighbour);

} // namespace otosub

#endif // OTOSUB_CANDIDATES_HPP_
