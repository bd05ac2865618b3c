#pragma once
// =============================================================================
// AutoFrame — ViewportMotionScheduler
// Turns the interaction stream into a minimal list of camera motions that keeps
// every important moment visible without churning on insignificant changes.
//
// Pure function of its inputs: no state survives between calls, so repeated
// calls with identical inputs produce identical lists.
// =============================================================================

#include "autoframe/common/Types.h"
#include "autoframe/common/UserEvent.h"
#include "autoframe/common/ViewportMotion.h"
#include "autoframe/geometry/ViewMapper.h"
#include "autoframe/logic/HoverDetector.h"
#include "autoframe/timing/TimeMapper.h"

#include <vector>

namespace AutoFrame
{

class ViewportMotionScheduler
{
public:
    struct Config
    {
        double maxZoom = 2.0;                   // zoom-in ceiling, > 1
        TimeMs transitionDurationMs = 500;
        TimeMs endBufferMs = 3000;              // trailing span that never triggers motions
        TimeMs hoverMinDurationMs = HoverDetector::kDefaultMinDurationMs;
        double hoverBoxFraction = HoverDetector::kDefaultBoxFraction;
        double mustSeePaddingFraction = 0.1;    // scroll/typing target padding
        double viewportSizeEpsilonPx = 1.0;     // smaller size changes are not significant
    };

    // Both mappers are borrowed and must outlive the scheduler.
    ViewportMotionScheduler(const ViewMapper& viewMapper, const TimeMapper& timeMapper, Config config);

    // Full pipeline: Source-time events → Output time → hovers → motions.
    std::vector<ViewportMotion> calculateZoomSchedule(const std::vector<UserEvent>& sourceEvents) const;

    // Events moved to Output time; events in cut gaps are dropped. Order is kept.
    std::vector<UserEvent> mapEventsToOutputTime(const std::vector<UserEvent>& sourceEvents) const;

    // Hovers over Output-time cursor samples, bounded by disruptive events.
    std::vector<HoverEvent> detectHovers(const std::vector<UserEvent>& outputEvents) const;

    // Motions for Output-time events (hovers included). Any order accepted.
    std::vector<ViewportMotion> scheduleOutputEvents(std::vector<UserEvent> outputEvents) const;

    // Region an event requires to stay visible (Output space, inside canvas).
    Rect getMustSeeRect(const UserEvent& event) const;

    // Camera window for a must-see rect: at least outputSize / maxZoom, output
    // aspect, centered on the must-see rect, clamped to the canvas.
    Rect getViewport(const Rect& mustSee) const;

    const Config& config() const { return config_; }

    static Rect clampToCanvas(const Rect& r, const Size& canvas);
    static bool contains(const Rect& outer, const Rect& inner);
    static bool nearlyEqual(const Rect& a, const Rect& b, double epsilon);

private:
    struct ScheduleState
    {
        Rect lastViewport;
    };

    bool isSignificant(EventType type, const Rect& mustSee, const Rect& target,
                       const ScheduleState& state) const;
    Rect defaultMustSee(const Point& sourcePos) const;
    Rect contentMustSee(const Rect& sourceTarget, const Point& sourceCursor) const;
    double effectiveZoom() const;

    const ViewMapper& viewMapper_;
    const TimeMapper& timeMapper_;
    Config config_;
};

} // namespace AutoFrame
