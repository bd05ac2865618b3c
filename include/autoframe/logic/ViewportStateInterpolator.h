#pragma once
// =============================================================================
// AutoFrame — ViewportStateInterpolator
// Camera rectangle at any Output time, replaying the motion list with
// quadratic ease-in-out. A motion interrupted by the next one hands over its
// partially interpolated rect, so the camera never jumps.
// =============================================================================

#include "autoframe/common/Types.h"
#include "autoframe/common/ViewportMotion.h"
#include "autoframe/timing/TimeMapper.h"

#include <optional>
#include <vector>

namespace AutoFrame
{

class ViewportStateInterpolator
{
public:
    // A motion resolved to Output time.
    struct Span
    {
        TimeMs startMs = 0;
        TimeMs endMs = 0;
        TimeMs durationMs = 0;
        Rect rect;
        std::optional<EventType> reason;
    };

    // Maps, filters (gap endings are dropped) and sorts the motions once.
    ViewportStateInterpolator(const std::vector<ViewportMotion>& motions, const Size& outputSize,
                              const TimeMapper& timeMapper);

    // Per-frame query. No allocation.
    Rect stateAt(TimeMs outputTimeMs) const;

    // Visible motions ordered by start time, for timeline display.
    const std::vector<Span>& spans() const { return spans_; }

    // One-shot form of the above.
    static Rect getViewportStateAtTime(const std::vector<ViewportMotion>& motions, TimeMs outputTimeMs,
                                       const Size& outputSize, const TimeMapper& timeMapper);

    // t < 0.5 → 2t², else −1 + (4 − 2t)t
    static double easeInOut(double t);
    static Rect interpolate(const Rect& from, const Rect& to, double t);

private:
    std::vector<Span> spans_;
    Rect fullRect_;
};

} // namespace AutoFrame
