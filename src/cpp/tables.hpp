#ifndef OTOSUB_TABLES_HPP_
#define OTOSUB_TABLES_HPP_

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace otosub {

typedef std::unordered_map<std::string, std::string> ClassLookup;

struct ClassificationTables {
  // kana -> trailing vowel, e.g. "ゃ" -> "a"
  ClassLookup vowels;

  // kana or cluster -> leading consonant, e.g. "きゃ" -> "k"
  ClassLookup consonants;

  // romanized vowel -> bare vowel kana, e.g. "a" -> "あ"
  ClassLookup substitutes;
};

// Inverts lines of the form "class=g1,g2,..." into glyph -> class.
// Empty list items are skipped. Later duplicates overwrite earlier ones.
ClassLookup buildClassLookup(const std::vector<std::string> &lines,
                             char delimiter = ',');

// Built on first use, read-only afterwards.
const ClassificationTables &classificationTables();

std::optional<std::string> classifyVowel(const std::string &glyph);
std::optional<std::string> classifyConsonant(const std::string &cluster);
std::optional<std::string> substituteBareVowel(const std::string &glyph);

} // namespace otosub

#endif // OTOSUB_TABLES_HPP_
