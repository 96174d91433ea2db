#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

#include "libotosub.hpp"

using namespace std;

int main(int argc, char* argv[]) {
  if (argc < 2) {
    std::cerr << "Need voicebank path" << std::endl;
    return 1;
  }

  // Set logging to INFO messages
  ::otosub_set_log_level(LIBOTOSUB_LEVEL_INFO);

  std::cout << "libotosub " << ::otosub_get_version() << std::endl;

  OtosubVoicebank* voicebank = ::otosub_load_voicebank(argv[1]);
  if (!voicebank) {
    std::cerr << "ERROR: Failed to load voicebank" << std::endl;
    return EXIT_FAILURE;
  }

  char alias[64];
  int length = ::otosub_resolve(voicebank, "か", NULL, 60, NULL, "さ", NULL,
                                alias, sizeof(alias));
  ::otosub_free_voicebank(voicebank);

  if (length < 0 || std::string(alias) != "a か") {
    std::cerr << "ERROR: Unexpected alias" << std::endl;
    return EXIT_FAILURE;
  }

  std::cout << "OK" << std::endl;

  return EXIT_SUCCESS;
}
