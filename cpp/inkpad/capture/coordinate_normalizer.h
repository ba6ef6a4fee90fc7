#pragma once

#include "inkpad/core/types.h"
#include <optional>

namespace inkpad {

// Maps device pixels into canonical space: (round(px / z), round(py / z)).
// Rounding is half-up so that results agree with the browser host.
// Throws std::invalid_argument if zoom is not positive and finite.
std::optional<Point> normalizePoint(const RawPoint& raw, double zoom);

// Layout routine: the zoom that fits a canvas of innerW x innerH into its
// outerW x outerH container. Throws std::invalid_argument on degenerate sizes.
double fitZoom(double outerW, double outerH, double innerW, double innerH);

class CoordinateNormalizer {
public:
    CoordinateNormalizer() = default;

    double zoom() const noexcept { return zoom_; }

    // Throws std::invalid_argument for zero, negative or non-finite values and
    // keeps the previous zoom.
    void setZoom(double zoom);

    // Returns std::nullopt when either coordinate is missing or non-finite.
    std::optional<Point> normalize(const RawPoint& raw) const {
        return normalizePoint(raw, zoom_);
    }

private:
    double zoom_{1.0};
};

} // namespace inkpad
