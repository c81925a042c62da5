#pragma once

#include <cstdio>

namespace evdevkit {

extern bool debug_logging_enabled;

void set_debug_logging(bool enabled);

} // namespace evdevkit

#ifdef EVDEVKIT_DEBUG
#define EVDEVKIT_DEBUG_LOG(...) if (evdevkit::debug_logging_enabled) { fprintf(stderr, __VA_ARGS__); }
#else
#define EVDEVKIT_DEBUG_LOG(...)
#endif
