#pragma once
// =============================================================================
// AutoFrame — ViewportMotion
// A camera transition that arrives at `rect` at Output time
// mapSourceToOutputTime(sourceEndTimeMs), having started durationMs earlier.
// =============================================================================

#include "autoframe/common/Types.h"
#include "autoframe/common/UserEvent.h"

#include <optional>

namespace AutoFrame
{

struct ViewportMotion
{
    TimeMs sourceEndTimeMs = 0;
    TimeMs durationMs = 0;
    Rect rect;                          // target camera window, Output space
    std::optional<EventType> reason;    // nullopt for the closing return to full view

    bool operator==(const ViewportMotion& o) const
    {
        return sourceEndTimeMs == o.sourceEndTimeMs && durationMs == o.durationMs &&
               rect == o.rect && reason == o.reason;
    }
    bool operator!=(const ViewportMotion& o) const { return !(*this == o); }
};

} // namespace AutoFrame
