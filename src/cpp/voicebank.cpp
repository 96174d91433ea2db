#include "voicebank.hpp"

#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace otosub {

bool Subbank::containsTone(int tone) const {
  for (const auto &range : toneRanges) {
    if (tone >= range.first && tone <= range.second) {
      return true;
    }
  }

  return false;
}

static Subbank parseSubbank(const json &subbankValue) {
  Subbank subbank;
  subbank.color = subbankValue.value("color", "");
  subbank.prefix = subbankValue.value("prefix", "");
  subbank.suffix = subbankValue.value("suffix", "");

  if (subbankValue.contains("tone_ranges")) {
    subbank.toneRanges.clear();
    for (auto &rangeValue : subbankValue["tone_ranges"]) {
      if (!rangeValue.is_array() || rangeValue.size() != 2) {
        throw std::runtime_error("Tone range must be [low, high]");
      }

      subbank.toneRanges.emplace_back(rangeValue[0].get<int>(),
                                      rangeValue[1].get<int>());
    }
  }

  return subbank;
}

void parseVoicebankConfig(const json &configRoot,
                          VoicebankConfig &voicebankConfig) {
  if (!configRoot.is_object()) {
    throw std::runtime_error("Voicebank config must be a JSON object");
  }

  voicebankConfig.name = configRoot.value("name", "");

  if (configRoot.contains("subbanks")) {
    for (auto &subbankValue : configRoot["subbanks"]) {
      voicebankConfig.subbanks.push_back(parseSubbank(subbankValue));
    }
  } else {
    // Single uncolored subbank over all tones
    voicebankConfig.subbanks.emplace_back();
  }

  if (!configRoot.contains("otos")) {
    throw std::runtime_error("Voicebank config has no otos");
  }

  for (auto &otoValue : configRoot["otos"]) {
    voicebankConfig.otos.insert(otoValue.get<std::string>());
  }

} /* parseVoicebankConfig */

Voicebank::Voicebank(VoicebankConfig config)
    : voicebankConfig(std::move(config)) {}

const Subbank *Voicebank::findSubbank(int tone,
                                      const std::string &color) const {
  for (const auto &subbank : voicebankConfig.subbanks) {
    if (subbank.color == color && subbank.containsTone(tone)) {
      return &subbank;
    }
  }

  // Unknown color falls back to the uncolored samples
  for (const auto &subbank : voicebankConfig.subbanks) {
    if (subbank.color.empty() && subbank.containsTone(tone)) {
      return &subbank;
    }
  }

  return nullptr;
}

std::optional<SampleMatch>
Voicebank::tryGetMappedOto(const std::string &alias, int tone,
                           const std::string &color) const {
  const Subbank *subbank = findSubbank(tone, color);
  if (subbank) {
    std::string mapped = subbank->prefix + alias + subbank->suffix;
    if (voicebankConfig.otos.count(mapped) > 0) {
      SampleMatch match{mapped, std::nullopt};
      if (!subbank->color.empty()) {
        match.color = subbank->color;
      }
      return match;
    }
  }

  if (voicebankConfig.otos.count(alias) == 0) {
    return std::nullopt;
  }

  // Unmapped alias belongs to the first subbank without prefix or suffix
  SampleMatch match{alias, std::nullopt};
  for (const auto &owner : voicebankConfig.subbanks) {
    if (owner.prefix.empty() && owner.suffix.empty()) {
      if (!owner.color.empty()) {
        match.color = owner.color;
      }
      break;
    }
  }

  return match;
} /* tryGetMappedOto */

Voicebank loadVoicebank(const std::string &path) {
  std::ifstream voicebankFile(path);
  if (!voicebankFile.good()) {
    throw std::runtime_error("Voicebank file doesn't exist: " + path);
  }

  VoicebankConfig config;
  try {
    json configRoot = json::parse(voicebankFile);
    parseVoicebankConfig(configRoot, config);
  } catch (const json::exception &e) {
    throw std::runtime_error("Failed to parse voicebank " + path + ": " +
                             e.what());
  }

  spdlog::debug("Loaded voicebank '{}' from {} ({} subbank(s), {} oto(s))",
                config.name, path, config.subbanks.size(), config.otos.size());

  return Voicebank(std::move(config));
} /* loadVoicebank */

} // namespace otosub
