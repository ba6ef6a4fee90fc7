#include "inkpad/capture/coordinate_normalizer.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace inkpad {

namespace {

inline bool isPresent(const std::optional<double>& v) noexcept {
    return v.has_value() && std::isfinite(*v);
}

inline std::int32_t roundHalfUp(double v) noexcept {
    const double r = std::floor(v + 0.5);
    constexpr double lo = static_cast<double>(std::numeric_limits<std::int32_t>::min());
    constexpr double hi = static_cast<double>(std::numeric_limits<std::int32_t>::max());
    return static_cast<std::int32_t>(std::min(hi, std::max(lo, r)));
}

inline bool isPositiveFinite(double v) noexcept {
    return std::isfinite(v) && v > 0.0;
}

} // namespace

std::optional<Point> normalizePoint(const RawPoint& raw, double zoom) {
    if (!isPositiveFinite(zoom)) {
        throw std::invalid_argument("Zoom factor must be positive and finite, got " + std::to_string(zoom));
    }
    if (!isPresent(raw.x) || !isPresent(raw.y)) {
        return std::nullopt;
    }
    return Point{roundHalfUp(*raw.x / zoom), roundHalfUp(*raw.y / zoom)};
}

double fitZoom(double outerW, double outerH, double innerW, double innerH) {
    if (!isPositiveFinite(outerW) || !isPositiveFinite(outerH)
        || !isPositiveFinite(innerW) || !isPositiveFinite(innerH)) {
        throw std::invalid_argument("fitZoom requires positive finite sizes");
    }
    return std::min(outerW / innerW, outerH / innerH);
}

void CoordinateNormalizer::setZoom(double zoom) {
    if (!isPositiveFinite(zoom)) {
        throw std::invalid_argument("Zoom factor must be positive and finite, got " + std::to_string(zoom));
    }
    zoom_ = zoom;
}

} // namespace inkpad
