#ifndef INKPAD_CORE_UTIL_H
#define INKPAD_CORE_UTIL_H

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
#else
#include <chrono>
// Polyfill for native testing
inline double emscripten_get_now() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now().time_since_epoch()).count();
}
#endif

namespace inkpad {

inline double nowMs() {
    return emscripten_get_now();
}

} // namespace inkpad

#endif // INKPAD_CORE_UTIL_H
