// =============================================================================
// AutoFrame — TimeMapper
// Linear walks over the output windows. Every loop is bounded by the window
// count, so malformed lists give inconsistent results but never hang.
// =============================================================================

#include "autoframe/timing/TimeMapper.h"

#include <algorithm>
#include <utility>

namespace AutoFrame
{

TimeMapper::TimeMapper(TimeMs timelineOffsetMs, std::vector<OutputWindow> windows)
    : timelineOffsetMs_(timelineOffsetMs)
    , windows_(std::move(windows))
{
    outputDuration_ = getOutputDuration(windows_);
}

TimeMs TimeMapper::mapTimelineToOutputTime(TimeMs timelineMs, const std::vector<OutputWindow>& windows)
{
    TimeMs accumulator = 0;

    for (const auto& win : windows)
    {
        // Half-open: endMs itself belongs to whatever follows
        if (timelineMs >= win.startMs && timelineMs < win.endMs)
            return accumulator + (timelineMs - win.startMs);

        // Before this window without matching an earlier one: inside a gap
        if (timelineMs < win.startMs)
            return kNotVisible;

        accumulator += win.endMs - win.startMs;
    }

    return kNotVisible;
}

TimeMs TimeMapper::mapOutputToTimelineTime(TimeMs outputMs, const std::vector<OutputWindow>& windows)
{
    if (outputMs < 0)
        return kNotVisible;

    TimeMs accumulator = 0;

    for (const auto& win : windows)
    {
        TimeMs duration = win.endMs - win.startMs;
        if (outputMs < accumulator + duration)
            return win.startMs + (outputMs - accumulator);
        accumulator += duration;
    }

    return kNotVisible;
}

TimeMs TimeMapper::mapSourceToOutputTime(TimeMs sourceMs, const std::vector<OutputWindow>& windows,
                                         TimeMs timelineOffsetMs)
{
    return mapTimelineToOutputTime(sourceMs + timelineOffsetMs, windows);
}

TimeMs TimeMapper::mapOutputToSourceTime(TimeMs outputMs, const std::vector<OutputWindow>& windows,
                                         TimeMs timelineOffsetMs)
{
    TimeMs timelineMs = mapOutputToTimelineTime(outputMs, windows);
    if (timelineMs == kNotVisible)
        return kNotVisible;
    return timelineMs - timelineOffsetMs;
}

std::optional<TimeMs> TimeMapper::findSourceTime(TimeMs outputMs, const std::vector<OutputWindow>& windows,
                                                 TimeMs timelineOffsetMs)
{
    if (outputMs < 0)
        return std::nullopt;

    TimeMs accumulator = 0;

    for (const auto& win : windows)
    {
        TimeMs duration = win.endMs - win.startMs;
        if (outputMs < accumulator + duration)
            return win.startMs + (outputMs - accumulator) - timelineOffsetMs;
        accumulator += duration;
    }

    return std::nullopt;
}

TimeMs TimeMapper::getOutputDuration(const std::vector<OutputWindow>& windows)
{
    TimeMs total = 0;
    for (const auto& win : windows)
        total += win.endMs - win.startMs;
    return total;
}

std::optional<OutputRange> TimeMapper::mapSourceRangeToOutputRange(TimeMs startMs, TimeMs endMs,
                                                                   const std::vector<OutputWindow>& windows,
                                                                   TimeMs timelineOffsetMs)
{
    TimeMs timelineStart = startMs + timelineOffsetMs;
    TimeMs timelineEnd = endMs + timelineOffsetMs;
    TimeMs accumulator = 0;

    for (const auto& win : windows)
    {
        if (timelineStart >= win.startMs && timelineStart < win.endMs)
        {
            TimeMs clampedEnd = std::min(std::max(timelineEnd, timelineStart), win.endMs);
            return OutputRange{accumulator + (timelineStart - win.startMs),
                               accumulator + (clampedEnd - win.startMs)};
        }

        if (timelineStart < win.startMs)
            return std::nullopt;

        accumulator += win.endMs - win.startMs;
    }

    return std::nullopt;
}

bool TimeMapper::validateWindows(const std::vector<OutputWindow>& windows)
{
    for (size_t i = 0; i < windows.size(); ++i)
    {
        if (windows[i].endMs < windows[i].startMs)
            return false;
        if (i > 0 && windows[i].startMs < windows[i - 1].endMs)
            return false;
    }
    return true;
}

// ─── Bound forms ─────────────────────────────────────────────────────────────

TimeMs TimeMapper::mapTimelineToOutputTime(TimeMs timelineMs) const
{
    return mapTimelineToOutputTime(timelineMs, windows_);
}

TimeMs TimeMapper::mapOutputToTimelineTime(TimeMs outputMs) const
{
    return mapOutputToTimelineTime(outputMs, windows_);
}

TimeMs TimeMapper::mapSourceToOutputTime(TimeMs sourceMs) const
{
    return mapSourceToOutputTime(sourceMs, windows_, timelineOffsetMs_);
}

TimeMs TimeMapper::mapOutputToSourceTime(TimeMs outputMs) const
{
    return mapOutputToSourceTime(outputMs, windows_, timelineOffsetMs_);
}

std::optional<TimeMs> TimeMapper::findSourceTime(TimeMs outputMs) const
{
    return findSourceTime(outputMs, windows_, timelineOffsetMs_);
}

std::optional<OutputRange> TimeMapper::mapSourceRangeToOutputRange(TimeMs startMs, TimeMs endMs) const
{
    return mapSourceRangeToOutputRange(startMs, endMs, windows_, timelineOffsetMs_);
}

} // namespace AutoFrame
