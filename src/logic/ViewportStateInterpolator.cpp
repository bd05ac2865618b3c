// =============================================================================
// AutoFrame — ViewportStateInterpolator
//
// Walk spans in start order carrying currentRect (initially full canvas):
//   query < start          → hold currentRect
//   interruption           = next.start if it precedes this end, else this end
//   progress               = (min(query, interruption) − start) / duration
//   query <= interruption  → return the interpolated rect
//   otherwise              → the interpolated rect seeds the next span
// Progress uses the motion's full duration so an interrupted motion keeps its
// speed and curve up to the hand-over point.
// =============================================================================

#include "autoframe/logic/ViewportStateInterpolator.h"

#include <algorithm>

namespace AutoFrame
{

ViewportStateInterpolator::ViewportStateInterpolator(const std::vector<ViewportMotion>& motions,
                                                     const Size& outputSize,
                                                     const TimeMapper& timeMapper)
    : fullRect_(fullRect(outputSize))
{
    spans_.reserve(motions.size());
    for (const auto& m : motions)
    {
        TimeMs end = timeMapper.mapSourceToOutputTime(m.sourceEndTimeMs);
        if (end == kNotVisible)
            continue;

        Span s;
        s.endMs = end;
        s.durationMs = std::max<TimeMs>(m.durationMs, 0);
        s.startMs = end - s.durationMs;
        s.rect = m.rect;
        s.reason = m.reason;
        spans_.push_back(s);
    }

    // Producers are not trusted to deliver start order
    std::stable_sort(spans_.begin(), spans_.end(),
                     [](const Span& a, const Span& b) { return a.startMs < b.startMs; });
}

Rect ViewportStateInterpolator::stateAt(TimeMs outputTimeMs) const
{
    Rect current = fullRect_;

    for (size_t i = 0; i < spans_.size(); ++i)
    {
        const Span& span = spans_[i];

        if (outputTimeMs < span.startMs)
            return current;

        TimeMs interruption = span.endMs;
        if (i + 1 < spans_.size() && spans_[i + 1].startMs < span.endMs)
            interruption = spans_[i + 1].startMs;

        TimeMs limit = std::min(outputTimeMs, interruption);

        double progress = 1.0; // zero duration snaps
        if (span.durationMs > 0)
        {
            progress = static_cast<double>(limit - span.startMs) / static_cast<double>(span.durationMs);
            progress = std::clamp(progress, 0.0, 1.0);
        }

        Rect interpolated = interpolate(current, span.rect, easeInOut(progress));

        if (outputTimeMs <= interruption)
            return interpolated;

        current = interpolated;
    }

    return current;
}

Rect ViewportStateInterpolator::getViewportStateAtTime(const std::vector<ViewportMotion>& motions,
                                                       TimeMs outputTimeMs, const Size& outputSize,
                                                       const TimeMapper& timeMapper)
{
    return ViewportStateInterpolator(motions, outputSize, timeMapper).stateAt(outputTimeMs);
}

double ViewportStateInterpolator::easeInOut(double t)
{
    return t < 0.5 ? 2.0 * t * t : -1.0 + (4.0 - 2.0 * t) * t;
}

Rect ViewportStateInterpolator::interpolate(const Rect& from, const Rect& to, double t)
{
    return {from.x + (to.x - from.x) * t,
            from.y + (to.y - from.y) * t,
            from.width + (to.width - from.width) * t,
            from.height + (to.height - from.height) * t};
}

} // namespace AutoFrame
