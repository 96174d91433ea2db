#ifndef LIBOTOSUB_H_
#define LIBOTOSUB_H_

#include <stddef.h>

#if defined(_WIN32) && !defined(__MINGW32__)
#    define OTOSUB_API __declspec(dllexport)
#else
#    define OTOSUB_API __attribute__ ((visibility ("default")))
#endif

extern "C" {
	typedef struct OtosubVoicebank OtosubVoicebank;

#define LIBOTOSUB_LEVEL_TRACE 0
#define LIBOTOSUB_LEVEL_DEBUG 1
#define LIBOTOSUB_LEVEL_INFO 2
#define LIBOTOSUB_LEVEL_WARN 3
#define LIBOTOSUB_LEVEL_ERROR 4
#define LIBOTOSUB_LEVEL_CRITICAL 5
#define LIBOTOSUB_LEVEL_OFF 6

	OTOSUB_API void otosub_set_log_level(int logLevel);
	OTOSUB_API const char* otosub_get_version();

	// Returns NULL (and logs) if the voicebank can't be loaded
	OTOSUB_API OtosubVoicebank* otosub_load_voicebank(const char* path);
	OTOSUB_API void otosub_free_voicebank(OtosubVoicebank* voicebank);

	// Writes the resolved alias (NUL terminated) to out. hint, color,
	// prevLyric and prevHint may be NULL.
	// Returns the alias length in bytes, or -1 on error.
	OTOSUB_API int otosub_resolve(const OtosubVoicebank* voicebank,
	                              const char* lyric, const char* hint, int tone,
	                              const char* color, const char* prevLyric,
	                              const char* prevHint, char* out, size_t outSize);
}

#endif // LIBOTOSUB_H_
