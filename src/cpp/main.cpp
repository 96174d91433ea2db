#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "otosub.hpp"

using namespace std;

enum InputType { INPUT_TEXT, INPUT_JSON, INPUT_CLASSIFY };

struct RunConfig {
  // Path to JSON voicebank description
  filesystem::path voicebankPath;

  // Type of input on stdin.
  // Default is whitespace-separated lyrics, one phrase per line.
  InputType inputType = INPUT_TEXT;

  // MIDI tone of notes in text input
  int tone = 60;

  // Voice color of notes in text input
  optional<string> color;
};

void parseArgs(int argc, char *argv[], RunConfig &runConfig);
void printUsage(char *argv[]);

int main(int argc, char *argv[]) {
  spdlog::set_default_logger(spdlog::stderr_color_st("otosub"));

  RunConfig runConfig;
  parseArgs(argc, argv, runConfig);

  if (runConfig.inputType == INPUT_CLASSIFY) {
    string line;
    while (getline(cin, line)) {
      otosub::classifyLine(line, cout);
    }

    return EXIT_SUCCESS;
  }

  otosub::SubstitutorPhonemizer phonemizer;
  try {
    auto voicebank = make_shared<otosub::Voicebank>(
        otosub::loadVoicebank(runConfig.voicebankPath.string()));
    spdlog::info("Loaded voicebank '{}' with {} oto(s)",
                 voicebank->config().name, voicebank->config().otos.size());
    phonemizer.setSinger(voicebank);
  } catch (const exception &e) {
    spdlog::error("Error loading voicebank: {}", e.what());
    return EXIT_FAILURE;
  }

  otosub::NoteDefaults defaults;
  defaults.tone = runConfig.tone;
  defaults.voiceColor = runConfig.color;

  otosub::JsonNoteReader jsonReader(phonemizer, defaults);
  string line;
  while (getline(cin, line)) {
    if (runConfig.inputType == INPUT_TEXT) {
      otosub::resolveTextLine(phonemizer, line, defaults, cout);
    } else {
      // Each line is a JSON object
      jsonReader.resolveLine(line, cout);
    }
  }

  return EXIT_SUCCESS;
}

void printUsage(char *argv[]) {
  cerr << endl;
  cerr << "usage: " << argv[0] << " [options]" << endl;
  cerr << endl;
  cerr << "options:" << endl;
  cerr << "   -h        --help              show this message and exit" << endl;
  cerr << "   -v  FILE  --voicebank   FILE  path to voicebank JSON file"
       << endl;
  cerr << "   --json-input                  stdin input is lines of JSON notes"
       << endl;
  cerr << "   --classify                    print vowel and consonant of each "
          "lyric"
       << endl;
  cerr << "   -t  NUM   --tone        NUM   MIDI tone of text input notes "
          "(default: 60)"
       << endl;
  cerr << "   -c  STR   --color       STR   voice color of text input notes"
       << endl;
  cerr << "   --version                     print version and exit" << endl;
  cerr << "   --debug                       print DEBUG messages to the console"
       << endl;
  cerr << "   -q        --quiet             disable logging" << endl;
  cerr << endl;
}

void ensureArg(int argc, char *argv[], int argi) {
  if ((argi + 1) >= argc) {
    printUsage(argv);
    exit(1);
  }
}

// Parse command-line arguments
void parseArgs(int argc, char *argv[], RunConfig &runConfig) {
  optional<filesystem::path> voicebankPath;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];

    if (arg == "-v" || arg == "--voicebank") {
      ensureArg(argc, argv, i);
      voicebankPath = filesystem::path(argv[++i]);
    } else if (arg == "--json_input" || arg == "--json-input") {
      runConfig.inputType = INPUT_JSON;
    } else if (arg == "--classify") {
      runConfig.inputType = INPUT_CLASSIFY;
    } else if (arg == "-t" || arg == "--tone") {
      ensureArg(argc, argv, i);
      try {
        runConfig.tone = stoi(argv[++i]);
      } catch (const logic_error &) {
        cerr << "Invalid tone: " << argv[i] << endl;
        exit(1);
      }
    } else if (arg == "-c" || arg == "--color") {
      ensureArg(argc, argv, i);
      runConfig.color = std::string(argv[++i]);
    } else if (arg == "--version") {
      std::cout << otosub::getVersion() << std::endl;
      exit(0);
    } else if (arg == "--debug") {
      // Set DEBUG logging
      spdlog::set_level(spdlog::level::debug);
    } else if (arg == "-q" || arg == "--quiet") {
      // Disable logging
      spdlog::set_level(spdlog::level::off);
    } else if (arg == "-h" || arg == "--help") {
      printUsage(argv);
      exit(0);
    } else {
      cerr << "Unknown argument: " << arg << endl;
      printUsage(argv);
      exit(1);
    }
  }

  if (runConfig.inputType == INPUT_CLASSIFY) {
    return;
  }

  if (!voicebankPath) {
    cerr << "A voicebank is required (--voicebank)" << endl;
    printUsage(argv);
    exit(1);
  }

  // Verify voicebank exists
  ifstream voicebankFile(voicebankPath->c_str());
  if (!voicebankFile.good()) {
    spdlog::error("Voicebank file doesn't exist: {}", voicebankPath->string());
    exit(1);
  }

  runConfig.voicebankPath = voicebankPath.value();
}
