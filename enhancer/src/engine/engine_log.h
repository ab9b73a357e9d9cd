#pragma once

// ==============================================================================
// Engine Diagnostic Logging
// ==============================================================================
// printf-style trace to stderr for control-thread events (init, load,
// transport, destroy). Compiled out unless TONIC_ENGINE_LOGGING is non-zero
// (CMake option TONIC_ENABLE_LOGGING). Never call from the audio thread.
// ==============================================================================

#ifndef TONIC_ENGINE_LOGGING
#define TONIC_ENGINE_LOGGING 0
#endif

#if TONIC_ENGINE_LOGGING
#include <cstdarg>
#include <cstdio>

namespace Tonic::Enhancer {

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 1, 2)))
#endif
inline void logEngine(const char* fmt, ...) {
    char buf[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    fprintf(stderr, "[TONIC][ENGINE] %s\n", buf);
}

} // namespace Tonic::Enhancer

#define TONIC_LOG(...) ::Tonic::Enhancer::logEngine(__VA_ARGS__)
#else
#define TONIC_LOG(...) ((void)0)
#endif
