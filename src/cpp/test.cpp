#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "otosub.hpp"

using namespace std;

struct SmokeCase {
  string lyric;
  optional<string> prevLyric;
  int tone;
  optional<string> color;
  string expected;
};

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Need voicebank path" << std::endl;
    return 1;
  }

  shared_ptr<otosub::Voicebank> voicebank;
  try {
    voicebank =
        make_shared<otosub::Voicebank>(otosub::loadVoicebank(string(argv[1])));
  } catch (const exception &e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  otosub::SubstitutorPhonemizer phonemizer;
  phonemizer.setSinger(voicebank);

  vector<SmokeCase> cases = {
      {"か", string("さ"), 60, nullopt, "a か"},
      {"か", string("さ"), 64, string("power"), "a か_P"},
      {"な", string("ぽ"), 60, nullopt, "o な"},
      {"た", nullopt, 60, nullopt, "- あ"},
      {"ん", nullopt, 60, nullopt, "- ん"},
  };

  for (const auto &smokeCase : cases) {
    otosub::Note note;
    note.lyric = smokeCase.lyric;
    note.tone = smokeCase.tone;
    if (smokeCase.color) {
      otosub::PhonemeAttributes attr;
      attr.voiceColor = smokeCase.color;
      note.phonemeAttributes.push_back(attr);
    }

    optional<otosub::Note> prev;
    if (smokeCase.prevLyric) {
      prev.emplace();
      prev->lyric = *smokeCase.prevLyric;
    }

    auto alias = phonemizer.process(note, prev).phonemes.at(0).alias;
    if (alias != smokeCase.expected) {
      std::cerr << "ERROR: '" << smokeCase.lyric << "' resolved to '" << alias
                << "', expected '" << smokeCase.expected << "'" << std::endl;
      return EXIT_FAILURE;
    }
  }

  std::cout << "OK" << std::endl;

  return EXIT_SUCCESS;
}
