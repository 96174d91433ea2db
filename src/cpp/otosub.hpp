#ifndef OTOSUB_H_
#define OTOSUB_H_

#include <string>

#include "candidates.hpp"
#include "note.hpp"
#include "note_input.hpp"
#include "oto_resolver.hpp"
#include "phonemizer.hpp"
#include "singer.hpp"
#include "tables.hpp"
#include "unicode.hpp"
#include "voicebank.hpp"

namespace otosub {

// Get version of otosub
std::string getVersion();

} // namespace otosub

#endif // OTOSUB_H_
