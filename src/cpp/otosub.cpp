#include "otosub.hpp"

#define OTOSUB_STR_(x) #x
#define OTOSUB_STR(x) OTOSUB_STR_(x)

#ifndef OTOSUB_VERSION_STRING
#define OTOSUB_VERSION_STRING 0.0.0
#endif

namespace otosub {

std::string getVersion() { return OTOSUB_STR(OTOSUB_VERSION_STRING); }

} // namespace otosub
