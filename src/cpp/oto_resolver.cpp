#include "oto_resolver.hpp"

#include <vector>

#include <spdlog/spdlog.h>

namespace otosub {

ProbeSettings probeSettingsFor(const Note &note) {
  auto attr = firstPhonemeAttributes(note);

  ProbeSettings settings;
  settings.tone = note.tone;
  settings.toneShift = attr.toneShift;
  settings.color = attr.voiceColor;
  settings.alternate = attr.alternate;
  return settings;
}

std::optional<SampleMatch> resolveOto(const Singer &singer,
                                      const CandidateList &candidates,
                                      const ProbeSettings &settings) {
  int tone = settings.tone + settings.toneShift;
  std::string color = settings.color.value_or("");
  std::string alternate = settings.alternate.value_or("");

  std::vector<SampleMatch> hits;
  for (const auto &candidate : candidates) {
    std::optional<SampleMatch> hit;
    if (!alternate.empty()) {
      hit = singer.tryGetMappedOto(candidate + alternate, tone, color);
    }

    if (!hit) {
      hit = singer.tryGetMappedOto(candidate, tone, color);
    }

    if (hit) {
      spdlog::debug("Oto hit for '{}': {} (color='{}')", candidate, hit->alias,
                    hit->color.value_or(""));
      hits.push_back(*hit);
    }
  }

  if (hits.empty()) {
    return std::nullopt;
  }

  // A matching color beats a more specific candidate
  for (const auto &hit : hits) {
    if (hit.color.value_or("") == color) {
      return hit;
    }
  }

  return hits.front();
} /* resolveOto */

} // namespace otosub
