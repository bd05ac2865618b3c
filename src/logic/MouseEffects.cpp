// =============================================================================
// AutoFrame — MouseEffects
// =============================================================================

#include "autoframe/logic/MouseEffects.h"

#include <algorithm>
#include <optional>

namespace AutoFrame
{

MouseEffectSet MouseEffects::extract(const std::vector<UserEvent>& sourceEvents, const TimeMapper& timeMapper)
{
    MouseEffectSet out;

    std::vector<const UserEvent*> ordered;
    ordered.reserve(sourceEvents.size());
    for (const auto& e : sourceEvents)
        ordered.push_back(&e);
    std::stable_sort(ordered.begin(), ordered.end(), [](const UserEvent* a, const UserEvent* b) {
        return eventTimestamp(*a) < eventTimestamp(*b);
    });

    std::optional<DragEffect> active;

    for (const UserEvent* e : ordered)
    {
        TimeMs t = timeMapper.mapSourceToOutputTime(eventTimestamp(*e));
        if (t == kNotVisible)
            continue;

        switch (eventType(*e))
        {
        case EventType::Click:
            out.clicks.push_back({t, std::get<ClickEvent>(*e).position});
            break;

        case EventType::MouseDown:
        {
            if (active)
                break; // already dragging
            Point p = std::get<MouseDownEvent>(*e).position;
            active = DragEffect{};
            active->startMs = t;
            active->start = p;
            active->path.push_back({t, p});
            break;
        }

        case EventType::Mouse:
            if (active)
                active->path.push_back({t, std::get<MouseEvent>(*e).position});
            break;

        case EventType::MouseUp:
            if (active)
            {
                Point p = std::get<MouseUpEvent>(*e).position;
                active->path.push_back({t, p});
                active->end = p;
                active->endMs = t;
                out.drags.push_back(std::move(*active));
                active.reset();
            }
            break;

        default:
            break;
        }
    }

    if (active)
    {
        const auto& last = active->path.back();
        active->end = last.position;
        active->endMs = last.timestampMs;
        out.drags.push_back(std::move(*active));
    }

    return out;
}

} // namespace AutoFrame
