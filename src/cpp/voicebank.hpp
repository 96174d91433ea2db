#ifndef OTOSUB_VOICEBANK_HPP_
#define OTOSUB_VOICEBANK_HPP_

#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "singer.hpp"

namespace otosub {

typedef std::pair<int, int> ToneRange;

// Samples recorded for one color over a set of pitches, stored as
// prefix + alias + suffix
struct Subbank {
  std::string color;
  std::string prefix;
  std::string suffix;
  std::vector<ToneRange> toneRanges = {{0, 127}};

  bool containsTone(int tone) const;
};

struct VoicebankConfig {
  std::string name;
  std::vector<Subbank> subbanks;
  std::set<std::string> otos;
};

void parseVoicebankConfig(const nlohmann::json &configRoot,
                          VoicebankConfig &voicebankConfig);

class Voicebank : public Singer {
public:
  explicit Voicebank(VoicebankConfig config);

  std::optional<SampleMatch>
  tryGetMappedOto(const std::string &alias, int tone,
                  const std::string &color) const override;

  const VoicebankConfig &config() const { return voicebankConfig; }

private:
  const Subbank *findSubbank(int tone, const std::string &color) const;

  VoicebankConfig voicebankConfig;
};

// Throws std::runtime_error if the file can't be read or parsed
Voicebank loadVoicebank(const std::string &path);

} // namespace otosub

#endif // OTOSUB_VOICEBANK_HPP_
