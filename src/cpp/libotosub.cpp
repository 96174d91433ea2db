#include "otosub.hpp"
#include "libotosub.hpp"

#include <cstring>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

struct OtosubVoicebank {
  std::shared_ptr<const otosub::Voicebank> voicebank;
  otosub::SubstitutorPhonemizer phonemizer;
};

static bool hasText(const char* s) {
  return s != nullptr && s[0] != '\0';
}

extern "C"
{
  void otosub_set_log_level(int logLevel) {
    auto logger = spdlog::get("libotosub");
    if (!logger) {
      logger = spdlog::stderr_color_st("libotosub");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::level_enum{ logLevel });
  }

  const char* otosub_get_version() {
    static const std::string version = otosub::getVersion();
    return version.c_str();
  }

  OtosubVoicebank* otosub_load_voicebank(const char* path) {
    if (!path) {
      spdlog::error("No voicebank path given");
      return nullptr;
    }

    try {
      auto handle = std::make_unique<OtosubVoicebank>();
      handle->voicebank =
        std::make_shared<otosub::Voicebank>(otosub::loadVoicebank(path));
      handle->phonemizer.setSinger(handle->voicebank);
      return handle.release();
    } catch (const std::exception& e) {
      spdlog::error("Error loading voicebank: {}", e.what());
      return nullptr;
    }
  }

  void otosub_free_voicebank(OtosubVoicebank* voicebank) {
    delete voicebank;
  }

  int otosub_resolve(const OtosubVoicebank* voicebank,
                     const char* lyric, const char* hint, int tone,
                     const char* color, const char* prevLyric,
                     const char* prevHint, char* out, size_t outSize) {
    if (!voicebank || !lyric || !out || outSize == 0) {
      spdlog::error("otosub_resolve called with missing arguments");
      return -1;
    }

    otosub::Note note;
    note.lyric = lyric;
    note.tone = tone;
    if (hasText(hint)) {
      note.phoneticHint = std::string(hint);
    }
    if (hasText(color)) {
      otosub::PhonemeAttributes attr;
      attr.voiceColor = std::string(color);
      note.phonemeAttributes.push_back(attr);
    }

    std::optional<otosub::Note> prevNeighbour;
    if (prevLyric) {
      prevNeighbour.emplace();
      prevNeighbour->lyric = prevLyric;
      prevNeighbour->tone = tone;
      if (hasText(prevHint)) {
        prevNeighbour->phoneticHint = std::string(prevHint);
      }
    }

    std::string alias;
    try {
      alias = voicebank->phonemizer.process(note, prevNeighbour).phonemes.at(0).alias;
    } catch (const std::exception& e) {
      spdlog::error("Error resolving '{}': {}", lyric, e.what());
      return -1;
    }

    if (alias.size() + 1 > outSize) {
      spdlog::error("Output buffer too small for alias '{}' ({} < {})",
                    alias, outSize, alias.size() + 1);
      return -1;
    }

    std::memcpy(out, alias.c_str(), alias.size() + 1);
    return static_cast<int>(alias.size());
  }
}
