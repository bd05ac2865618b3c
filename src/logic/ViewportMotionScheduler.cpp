// =============================================================================
// AutoFrame — ViewportMotionScheduler
//
// Events are processed in increasing Output time while tracking the last
// emitted viewport:
//   - hover:     emit only when the must-see rect leaves the current frame
//   - explicit:  emit when the must-see rect leaves the frame OR the target
//                viewport size differs by more than viewportSizeEpsilonPx
// Events inside the trailing end buffer never trigger motions. A final motion
// returns to full view unless the camera already rests there.
// =============================================================================

#include "autoframe/logic/ViewportMotionScheduler.h"
#include "autoframe/support/Log.h"

#include <algorithm>
#include <cmath>

namespace AutoFrame
{

// Containment tolerance for rects computed through different float paths
static constexpr double kContainTolerance = 1e-6;

ViewportMotionScheduler::ViewportMotionScheduler(const ViewMapper& viewMapper,
                                                 const TimeMapper& timeMapper, Config config)
    : viewMapper_(viewMapper)
    , timeMapper_(timeMapper)
    , config_(config)
{
}

std::vector<ViewportMotion> ViewportMotionScheduler::calculateZoomSchedule(
    const std::vector<UserEvent>& sourceEvents) const
{
    std::vector<UserEvent> outputEvents = mapEventsToOutputTime(sourceEvents);

    std::vector<HoverEvent> hovers = detectHovers(outputEvents);
    for (const auto& h : hovers)
        outputEvents.emplace_back(h);

    logger()->debug("Scheduler: {} source events, {} visible, {} hovers", sourceEvents.size(),
                    outputEvents.size() - hovers.size(), hovers.size());

    return scheduleOutputEvents(std::move(outputEvents));
}

std::vector<UserEvent> ViewportMotionScheduler::mapEventsToOutputTime(
    const std::vector<UserEvent>& sourceEvents) const
{
    std::vector<UserEvent> mapped;
    mapped.reserve(sourceEvents.size());

    for (const auto& e : sourceEvents)
    {
        TimeMs outputTime = timeMapper_.mapSourceToOutputTime(eventTimestamp(e));
        if (outputTime == kNotVisible)
            continue;
        mapped.push_back(withTimestamp(e, outputTime));
    }
    return mapped;
}

std::vector<HoverEvent> ViewportMotionScheduler::detectHovers(const std::vector<UserEvent>& outputEvents) const
{
    std::vector<HoverDetector::Sample> samples;
    std::vector<TimeMs> boundaries;

    for (const auto& e : outputEvents)
    {
        EventType type = eventType(e);
        if (type == EventType::Mouse)
        {
            const auto& m = std::get<MouseEvent>(e);
            samples.push_back({m.timestamp, m.position});
        }
        else if (breaksHover(type))
        {
            boundaries.push_back(eventTimestamp(e));
        }
    }

    std::stable_sort(samples.begin(), samples.end(),
                     [](const HoverDetector::Sample& a, const HoverDetector::Sample& b) {
                         return a.timestamp < b.timestamp;
                     });

    HoverDetector detector(viewMapper_.inputSize(), config_.hoverBoxFraction, config_.hoverMinDurationMs);
    return detector.detect(samples, std::move(boundaries));
}

std::vector<ViewportMotion> ViewportMotionScheduler::scheduleOutputEvents(std::vector<UserEvent> outputEvents) const
{
    std::vector<ViewportMotion> motions;
    const Size& outputSize = viewMapper_.outputSize();
    if (outputSize.isEmpty())
        return motions;

    std::stable_sort(outputEvents.begin(), outputEvents.end(),
                     [](const UserEvent& a, const UserEvent& b) {
                         return eventTimestamp(a) < eventTimestamp(b);
                     });

    const Rect full = fullRect(outputSize);
    const TimeMs cutoff = timeMapper_.getOutputDuration() - config_.endBufferMs;

    ScheduleState state;
    state.lastViewport = full;

    for (const auto& e : outputEvents)
    {
        EventType type = eventType(e);
        switch (type)
        {
        case EventType::Click:
        case EventType::Hover:
        case EventType::Scroll:
        case EventType::Typing:
        case EventType::Url:
            break;
        default:
            continue; // not a camera trigger
        }

        TimeMs t = eventTimestamp(e);
        if (t >= cutoff)
        {
            logger()->trace("Scheduler: {} at {}ms inside end buffer, ignored", eventTypeName(type), t);
            continue;
        }

        Rect mustSee = getMustSeeRect(e);
        Rect target = getViewport(mustSee);

        if (!isSignificant(type, mustSee, target, state))
        {
            logger()->trace("Scheduler: {} at {}ms already framed", eventTypeName(type), t);
            continue;
        }

        auto sourceEnd = timeMapper_.findSourceTime(t);
        if (!sourceEnd)
            continue; // fell in a cut gap

        ViewportMotion motion;
        motion.sourceEndTimeMs = *sourceEnd;
        motion.durationMs = config_.transitionDurationMs;
        motion.rect = target;
        motion.reason = type;
        motions.push_back(motion);
        state.lastViewport = target;

        logger()->trace("Scheduler: {} at {}ms → [{:.1f}, {:.1f}, {:.1f}x{:.1f}]", eventTypeName(type), t,
                        target.x, target.y, target.width, target.height);
    }

    if (!nearlyEqual(state.lastViewport, full, config_.viewportSizeEpsilonPx))
    {
        TimeMs arrival = cutoff + config_.transitionDurationMs;
        arrival = std::min(arrival, timeMapper_.getOutputDuration() - 1);
        arrival = std::max<TimeMs>(arrival, 0);

        auto sourceEnd = timeMapper_.findSourceTime(arrival);
        if (!sourceEnd)
        {
            logger()->warn("Scheduler: closing motion at {}ms not visible, camera stays zoomed", arrival);
        }
        else
        {
            ViewportMotion reset;
            reset.sourceEndTimeMs = *sourceEnd;
            reset.durationMs = config_.transitionDurationMs;
            reset.rect = full;
            motions.push_back(reset);
        }
    }

    logger()->debug("Scheduler: {} motions", motions.size());
    return motions;
}

bool ViewportMotionScheduler::isSignificant(EventType type, const Rect& mustSee, const Rect& target,
                                            const ScheduleState& state) const
{
    bool framed = contains(state.lastViewport, mustSee);

    // Hovers never cause churn while the user stays inside the frame
    if (type == EventType::Hover)
        return !framed;

    bool resized = std::abs(target.width - state.lastViewport.width) > config_.viewportSizeEpsilonPx ||
                   std::abs(target.height - state.lastViewport.height) > config_.viewportSizeEpsilonPx;
    return !framed || resized;
}

// ─── Target computation ──────────────────────────────────────────────────────

Rect ViewportMotionScheduler::getMustSeeRect(const UserEvent& event) const
{
    const Size& outputSize = viewMapper_.outputSize();

    switch (eventType(event))
    {
    case EventType::Click:
        return defaultMustSee(std::get<ClickEvent>(event).position);
    case EventType::Hover:
        return defaultMustSee(std::get<HoverEvent>(event).position);
    case EventType::Scroll:
    {
        const auto& s = std::get<ScrollEvent>(event);
        return contentMustSee(s.targetRect, s.position);
    }
    case EventType::Typing:
    {
        const auto& t = std::get<TypingEvent>(event);
        return contentMustSee(t.targetRect, t.position);
    }
    case EventType::Url:
        return fullRect(outputSize);
    default:
        break;
    }

    // Remaining variants only frame their cursor, if any
    auto pos = eventPosition(event);
    return pos ? defaultMustSee(*pos) : fullRect(outputSize);
}

Rect ViewportMotionScheduler::defaultMustSee(const Point& sourcePos) const
{
    const Size& outputSize = viewMapper_.outputSize();
    double zoom = effectiveZoom();

    // Half the tightest camera box: leaves framing headroom around the point
    double w = outputSize.width / (2.0 * zoom);
    double h = outputSize.height / (2.0 * zoom);
    Point c = viewMapper_.inputToOutputPoint(sourcePos);

    return clampToCanvas({c.x - w / 2.0, c.y - h / 2.0, w, h}, outputSize);
}

Rect ViewportMotionScheduler::contentMustSee(const Rect& sourceTarget, const Point& sourceCursor) const
{
    if (sourceTarget.isEmpty())
        return defaultMustSee(sourceCursor);

    const Size& outputSize = viewMapper_.outputSize();
    Rect target = viewMapper_.inputToOutputRect(sourceTarget);

    double pad = config_.mustSeePaddingFraction;
    Rect padded{target.x - target.width * pad / 2.0, target.y - target.height * pad / 2.0,
                target.width * (1.0 + pad), target.height * (1.0 + pad)};

    double width = std::min(padded.width, outputSize.width);
    double aspect = outputSize.width / outputSize.height;
    double viewportWidth = std::min(std::max(width, outputSize.width / effectiveZoom()), outputSize.width);
    double viewportHeight = viewportWidth / aspect;

    Point center = padded.center();
    Rect mustSee;
    if (padded.height <= viewportHeight)
    {
        mustSee = {center.x - width / 2.0, padded.y, width, padded.height};
    }
    else
    {
        // Tall content: follow the cursor vertically instead of the whole block
        Point cursor = viewMapper_.inputToOutputPoint(sourceCursor);
        mustSee = {center.x - width / 2.0, cursor.y - viewportHeight / 2.0, width, viewportHeight};
    }

    return clampToCanvas(mustSee, outputSize);
}

Rect ViewportMotionScheduler::getViewport(const Rect& mustSee) const
{
    const Size& outputSize = viewMapper_.outputSize();
    if (outputSize.isEmpty())
        return {};

    double aspect = outputSize.width / outputSize.height;
    double minWidth = outputSize.width / effectiveZoom();

    double width = std::max({minWidth, mustSee.width, mustSee.height * aspect});
    width = std::min(width, outputSize.width);
    double height = width / aspect;

    Point c = mustSee.center();
    return clampToCanvas({c.x - width / 2.0, c.y - height / 2.0, width, height}, outputSize);
}

double ViewportMotionScheduler::effectiveZoom() const
{
    // maxZoom <= 1 (or NaN) means "never zoom in"
    return config_.maxZoom > 1.0 ? config_.maxZoom : 1.0;
}

// ─── Rect helpers ────────────────────────────────────────────────────────────

Rect ViewportMotionScheduler::clampToCanvas(const Rect& r, const Size& canvas)
{
    Rect out = r;
    out.width = std::clamp(out.width, 0.0, std::max(canvas.width, 0.0));
    out.height = std::clamp(out.height, 0.0, std::max(canvas.height, 0.0));
    out.x = std::clamp(out.x, 0.0, std::max(canvas.width - out.width, 0.0));
    out.y = std::clamp(out.y, 0.0, std::max(canvas.height - out.height, 0.0));
    return out;
}

bool ViewportMotionScheduler::contains(const Rect& outer, const Rect& inner)
{
    return inner.x >= outer.x - kContainTolerance &&
           inner.y >= outer.y - kContainTolerance &&
           inner.right() <= outer.right() + kContainTolerance &&
           inner.bottom() <= outer.bottom() + kContainTolerance;
}

bool ViewportMotionScheduler::nearlyEqual(const Rect& a, const Rect& b, double epsilon)
{
    return std::abs(a.x - b.x) <= epsilon && std::abs(a.y - b.y) <= epsilon &&
           std::abs(a.width - b.width) <= epsilon && std::abs(a.height - b.height) <= epsilon;
}

} // namespace AutoFrame
