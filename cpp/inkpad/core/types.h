#ifndef INKPAD_CORE_TYPES_H
#define INKPAD_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Lightweight types and constants shared by the capture pipeline.

namespace inkpad {

// Default number of candidates requested from the matcher per recompute.
static constexpr std::uint32_t defaultCandidateLimit = 8;

// Default pen style (canonical units / RGBA).
static constexpr float defaultStrokeWidth = 8.0f;
static constexpr float defaultStrokeR = 0.0f;
static constexpr float defaultStrokeG = 0.0f;
static constexpr float defaultStrokeB = 0.0f;
static constexpr float defaultStrokeA = 1.0f;

// Canonical (zoom-independent) point. Always integral.
struct Point {
    std::int32_t x;
    std::int32_t y;
};

inline bool operator==(const Point& a, const Point& b) noexcept { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point& a, const Point& b) noexcept { return !(a == b); }

// Device-space point as delivered by the host. Either coordinate may be
// missing on malformed events; such points never reach a stroke.
struct RawPoint {
    std::optional<double> x;
    std::optional<double> y;
};

using Stroke = std::vector<Point>;
using Candidate = std::string;       // one UTF-8 encoded character
using CandidateList = std::vector<Candidate>;

// Minimum point count for a stroke to be committed; shorter gestures are taps.
static constexpr std::size_t minCommittedStrokePoints = 2;

struct Bounds {
    float x;
    float y;
    float w;
    float h;
};

using StrokeHandle = std::uint32_t;
static constexpr StrokeHandle invalidStrokeHandle = 0;

enum class CaptureState : std::uint8_t {
    Idle = 0,
    Drawing = 1,
};

enum class MatcherState : std::uint8_t {
    NotReady = 0,
    Loading = 1,
    Ready = 2,
    Failed = 3,
};

enum class SessionError : std::uint32_t {
    Ok = 0,
    MatcherLoadFailed = 1,
    MatcherFailed = 2,
    RecordingFailed = 3,
    InvalidCandidate = 4,
};

const char* toString(MatcherState state) noexcept;
const char* toString(SessionError error) noexcept;

} // namespace inkpad

#endif // INKPAD_CORE_TYPES_H
