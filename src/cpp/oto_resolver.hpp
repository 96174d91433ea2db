#ifndef OTOSUB_OTO_RESOLVER_HPP_
#define OTOSUB_OTO_RESOLVER_HPP_

#include <optional>
#include <string>

#include "candidates.hpp"
#include "note.hpp"
#include "singer.hpp"

namespace otosub {

struct ProbeSettings {
  int tone = 60;
  int toneShift = 0;
  std::optional<std::string> color;
  std::optional<std::string> alternate;
};

// Tone and index 0 attributes of a note
ProbeSettings probeSettingsFor(const Note &note);

// Probes every candidate (alternate-tagged alias first) and returns the
// first hit whose color matches the requested one, else the first hit.
std::optional<SampleMatch> resolveOto(const Singer &singer,
                                      const CandidateList &candidates,
                                      const ProbeSettings &settings);

} // namespace otosub

#endif // OTOSUB_OTO_RESOLVER_HPP_
