#pragma once

#include "inkpad/core/types.h"
#include "inkpad/render/stroke_render_buffer.h"
#include <cstdint>

namespace inkpad {

struct SessionOptions {
    std::uint32_t candidateLimit{defaultCandidateLimit};
    // Logical canvas size; finished strokes are cached over these bounds.
    float canvasWidth{0.0f};
    float canvasHeight{0.0f};
    double initialZoom{1.0};
    StrokeStyle strokeStyle{};
};

} // namespace inkpad
