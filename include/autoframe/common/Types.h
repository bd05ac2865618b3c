#pragma once
// =============================================================================
// AutoFrame — Common Types
// Shared geometry and timing structures, constants, and type aliases.
// =============================================================================

#include <cstdint>
#include <string>

namespace AutoFrame
{

// All engine times are integer milliseconds.
using TimeMs = int64_t;

// Sentinel for a time that falls in a cut gap (or outside every window).
static constexpr TimeMs kNotVisible = -1;

struct Size
{
    double width = 0.0;
    double height = 0.0;

    bool isEmpty() const { return width <= 0.0 || height <= 0.0; }
};

// Pixel coordinates; the space (Source / Output / Screen) is implied by context.
struct Point
{
    double x = 0.0;
    double y = 0.0;
};

struct Rect
{
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    double right() const { return x + width; }
    double bottom() const { return y + height; }
    Point center() const { return {x + width / 2.0, y + height / 2.0}; }
    bool isEmpty() const { return width <= 0.0 || height <= 0.0; }

    bool operator==(const Rect& o) const
    {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    bool operator!=(const Rect& o) const { return !(*this == o); }
};

// Half-open [startMs, endMs) slice of Timeline time kept in the final cut.
struct OutputWindow
{
    std::string id;
    TimeMs startMs = 0;
    TimeMs endMs = 0;

    TimeMs duration() const { return endMs - startMs; }
};

// Half-open [start, end) range of Output time.
struct OutputRange
{
    TimeMs start = 0;
    TimeMs end = 0;
};

// Rect covering the whole canvas of the given size.
inline Rect fullRect(const Size& size)
{
    return {0.0, 0.0, size.width, size.height};
}

} // namespace AutoFrame
