#include "tables.hpp"

#include <spdlog/spdlog.h>

namespace otosub {

// Tail vowel of each kana. The romanized vowel maps to itself so that a
// romanized hint or substituted lyric still yields VCV context.
static const std::vector<std::string> VOWEL_TABLE = {
    "a=ぁ,あ,か,が,さ,ざ,た,だ,な,は,ば,ぱ,ま,ゃ,や,ら,わ,ァ,ア,カ,ガ,サ,ザ,タ,ダ,ナ,ハ,バ,パ,マ,ャ,ヤ,ラ,ワ,a",
    "e=ぇ,え,け,げ,せ,ぜ,て,で,ね,へ,べ,ぺ,め,れ,ゑ,ェ,エ,ケ,ゲ,セ,ゼ,テ,デ,ネ,ヘ,ベ,ペ,メ,レ,ヱ,e",
    "i=ぃ,い,き,ぎ,し,じ,ち,ぢ,に,ひ,び,ぴ,み,り,ゐ,ィ,イ,キ,ギ,シ,ジ,チ,ヂ,ニ,ヒ,ビ,ピ,ミ,リ,ヰ,i",
    "o=ぉ,お,こ,ご,そ,ぞ,と,ど,の,ほ,ぼ,ぽ,も,ょ,よ,ろ,を,ォ,オ,コ,ゴ,ソ,ゾ,ト,ド,ノ,ホ,ボ,ポ,モ,ョ,ヨ,ロ,ヲ,o",
    "n=ん,n",
    "u=ぅ,う,く,ぐ,す,ず,つ,づ,ぬ,ふ,ぶ,ぷ,む,ゅ,ゆ,る,ゥ,ウ,ク,グ,ス,ズ,ツ,ヅ,ヌ,フ,ブ,プ,ム,ュ,ユ,ル,ヴ,u",
    "N=ン,ng"};

// Bare vowel kana, keyed by the romanized vowel after inversion
static const std::vector<std::string> SUBSTITUTE_TABLE = {
    "あ=a", "え=e", "い=i", "お=o", "ん=n", "う=u"};

static const std::vector<std::string> CONSONANT_TABLE = {
    "k=か,き,く,け,こ,きゃ,きゅ,きょ",
    "g=が,ぎ,ぐ,げ,ご,ぎゃ,ぎゅ,ぎょ",
    "s=さ,し,す,せ,そ,しゃ,しゅ,しぇ,しょ",
    "z=ざ,じ,ず,ぜ,ぞ,じゃ,じゅ,じぇ,じょ",
    "t=た,ち,つ,て,と,ちゃ,ちゅ,ちぇ,ちょ",
    "d=だ,ぢ,でぃ,づ,どぅ,で,ど,",
    "n=な,に,ぬ,ね,の,にゃ,にゅ,にぇ,にょ",
    "h=は,ひ,ふ,へ,ほ,ひゃ,ひゅ,ひぇ,ひょ",
    "b=ば,び,ぶ,べ,ぼ,びゃ,びゅ,びぇ,びょ",
    "p=ぱ,ぴ,ぷ,ぺ,ぽ,ぴゃ,ぴゅ,ぴぇ,ぴょ",
    "m=ま,み,む,め,も,みゃ,みゅ,みぇ,みょ",
    "y=や,ゆ,いぇ,よ",
    "r=ら,り,る,れ,ろ,りゃ,りゅ,りぇ,りょ",
    "w=わ,うぃ,うぇ,を"};

ClassLookup buildClassLookup(const std::vector<std::string> &lines,
                             char delimiter) {
  ClassLookup lookup;

  for (const auto &line : lines) {
    auto equalsPos = line.find('=');
    if (equalsPos == std::string::npos) {
      spdlog::warn("Ignoring table line without '=': {}", line);
      continue;
    }

    std::string className = line.substr(0, equalsPos);
    std::string members = line.substr(equalsPos + 1);

    std::size_t start = 0;
    while (start <= members.size()) {
      auto end = members.find(delimiter, start);
      if (end == std::string::npos) {
        end = members.size();
      }

      std::string glyph = members.substr(start, end - start);
      if (!glyph.empty()) {
        lookup[glyph] = className;
      }

      start = end + 1;
    }
  }

  return lookup;
} /* buildClassLookup */

const ClassificationTables &classificationTables() {
  static const ClassificationTables tables = [] {
    ClassificationTables built;
    built.vowels = buildClassLookup(VOWEL_TABLE);
    built.consonants = buildClassLookup(CONSONANT_TABLE);
    built.substitutes = buildClassLookup(SUBSTITUTE_TABLE);

    spdlog::debug("Built classification tables (vowels={}, consonants={}, "
                  "substitutes={})",
                  built.vowels.size(), built.consonants.size(),
                  built.substitutes.size());
    return built;
  }();

  return tables;
}

static std::optional<std::string> findClass(const ClassLookup &lookup,
                                            const std::string &key) {
  auto it = lookup.find(key);
  if (it == lookup.end()) {
    return std::nullopt;
  }

  return it->second;
}

std::optional<std::string> classifyVowel(const std::string &glyph) {
  return findClass(classificationTables().vowels, glyph);
}

std::optional<std::string> classifyConsonant(const std::string &cluster) {
  return findClass(classificationTables().consonants, cluster);
}

std::optional<std::string> substituteBareVowel(const std::string &glyph) {
  return findClass(classificationTables().substitutes, glyph);
}

} // namespace otosub
