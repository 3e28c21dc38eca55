#pragma once

#include <cstdio>
#include <cstdlib>
#include <cstring>

#ifdef MRNT_ENABLE_DEBUG_LOG
#define MRNT_DBG_LOG(...) std::fprintf(stderr, __VA_ARGS__)
#define MRNT_DBG_CODE(code) \
    do {                    \
        code;               \
    } while (0)
#else
#define MRNT_DBG_LOG(...) \
    do {                  \
    } while (0)
#define MRNT_DBG_CODE(code) \
    do {                    \
    } while (0)
#endif

namespace marionette::core {

// Environment switches are sampled once per process.
inline bool envFlagEnabled(const char* name) {
    const char* v = std::getenv(name);
    if (!v) return false;
    return std::strcmp(v, "1") == 0 || std::strcmp(v, "true") == 0 || std::strcmp(v, "TRUE") == 0;
}

inline bool traceParamBindingEnabled() {
    static const bool enabled = envFlagEnabled("MRNT_TRACE_PARAM_BIND");
    return enabled;
}

inline bool tracePhysicsEnabled() {
    static const bool enabled = envFlagEnabled("MRNT_TRACE_PHYSICS");
    return enabled;
}

} // namespace marionette::core
