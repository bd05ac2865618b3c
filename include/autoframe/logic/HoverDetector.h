#pragma once
// =============================================================================
// AutoFrame — HoverDetector
// Synthesizes hover events from cursor samples: the cursor stays inside a small
// bounding box for at least a minimum dwell time, with no disruptive event
// (click, scroll, ...) in between.
// =============================================================================

#include "autoframe/common/Types.h"
#include "autoframe/common/UserEvent.h"

#include <vector>

namespace AutoFrame
{

class HoverDetector
{
public:
    struct Sample
    {
        TimeMs timestamp = 0;
        Point position;
    };

    // boxSize = boxFraction * max(inputW, inputH)
    explicit HoverDetector(const Size& inputSize,
                           double boxFraction = kDefaultBoxFraction,
                           TimeMs minDurationMs = kDefaultMinDurationMs);

    // samples must be ordered by timestamp. boundaries may be in any order.
    // Each returned hover lies strictly between two boundaries (or stream ends).
    std::vector<HoverEvent> detect(const std::vector<Sample>& samples,
                                   std::vector<TimeMs> boundaries) const;

    double boxSize() const { return boxSize_; }
    TimeMs minDurationMs() const { return minDurationMs_; }

    static constexpr double kDefaultBoxFraction = 0.1;
    static constexpr TimeMs kDefaultMinDurationMs = 1000;

private:
    double boxSize_ = 0.0;
    TimeMs minDurationMs_ = kDefaultMinDurationMs;
};

} // namespace AutoFrame
