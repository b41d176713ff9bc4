#ifndef GEOLINER_CORE_UTIL_H
#define GEOLINER_CORE_UTIL_H

#include <cmath>

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
#else
#include <chrono>
// Polyfill for native builds and tests
inline double emscripten_get_now() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now().time_since_epoch()).count();
}
#endif

namespace geoliner {

constexpr float kPi = 3.14159265358979323846f;
constexpr float kDegToRad = kPi / 180.0f;
constexpr float kRadToDeg = 180.0f / kPi;

inline float clampf(float v, float lo, float hi) noexcept {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

// Maps any finite angle into [0, 360).
inline float normalizeDegrees(float deg) noexcept {
    if (!std::isfinite(deg)) return 0.0f;
    float r = std::fmod(deg, 360.0f);
    if (r < 0.0f) r += 360.0f;
    if (r >= 360.0f) r = 0.0f;
    return r;
}

} // namespace geoliner

#endif // GEOLINER_CORE_UTIL_H
