#pragma once
// =============================================================================
// AutoFrame — MouseEffects
// Click and drag effects in Output time, for the cursor/click painters.
// Positions stay in Source space; painters project them with
// ViewMapper::projectToScreen.
// =============================================================================

#include "autoframe/common/Types.h"
#include "autoframe/common/UserEvent.h"
#include "autoframe/timing/TimeMapper.h"

#include <vector>

namespace AutoFrame
{

struct ClickEffect
{
    TimeMs timestampMs = 0;
    Point position;
};

struct DragEffect
{
    struct PathPoint
    {
        TimeMs timestampMs = 0;
        Point position;
    };

    TimeMs startMs = 0;
    TimeMs endMs = 0;
    Point start;
    Point end;
    std::vector<PathPoint> path;
};

struct MouseEffectSet
{
    std::vector<ClickEffect> clicks;
    std::vector<DragEffect> drags;
};

class MouseEffects
{
public:
    // Drags are mousedown → mouse* → mouseup runs. A mousedown during an
    // active drag is ignored; an unterminated drag closes at its last sample.
    static MouseEffectSet extract(const std::vector<UserEvent>& sourceEvents, const TimeMapper& timeMapper);
};

} // namespace AutoFrame
