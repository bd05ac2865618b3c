#pragma once
// =============================================================================
// AutoFrame — TimeMapper
// Conversions between Source (recording), Timeline (with authoring gaps) and
// Output (continuous, gapless) time. Gap times map to kNotVisible.
//
// Windows must be sorted by startMs and non-overlapping; see validateWindows().
// =============================================================================

#include "autoframe/common/Types.h"

#include <optional>
#include <vector>

namespace AutoFrame
{

class TimeMapper
{
public:
    TimeMapper() = default;
    TimeMapper(TimeMs timelineOffsetMs, std::vector<OutputWindow> windows);

    // ── Static forms: explicit windows/offset ──

    static TimeMs mapTimelineToOutputTime(TimeMs timelineMs, const std::vector<OutputWindow>& windows);
    static TimeMs mapOutputToTimelineTime(TimeMs outputMs, const std::vector<OutputWindow>& windows);

    // Source + offset = Timeline. Returns the first occurrence or kNotVisible.
    static TimeMs mapSourceToOutputTime(TimeMs sourceMs, const std::vector<OutputWindow>& windows,
                                        TimeMs timelineOffsetMs);
    // A visible result of -1 (Source time before the recording start) cannot
    // be told apart from kNotVisible; use findSourceTime() where that matters.
    static TimeMs mapOutputToSourceTime(TimeMs outputMs, const std::vector<OutputWindow>& windows,
                                        TimeMs timelineOffsetMs);
    static std::optional<TimeMs> findSourceTime(TimeMs outputMs, const std::vector<OutputWindow>& windows,
                                                TimeMs timelineOffsetMs);

    static TimeMs getOutputDuration(const std::vector<OutputWindow>& windows);

    // Clamps [startMs, endMs) (Source time) to the part that survives the cut.
    // nullopt when the range starts inside a gap. A range straddling a gap is
    // truncated at the end of the window holding its start.
    static std::optional<OutputRange> mapSourceRangeToOutputRange(TimeMs startMs, TimeMs endMs,
                                                                  const std::vector<OutputWindow>& windows,
                                                                  TimeMs timelineOffsetMs);

    // True when every window is well-formed, sorted and non-overlapping.
    static bool validateWindows(const std::vector<OutputWindow>& windows);

    // ── Bound forms ──

    TimeMs mapTimelineToOutputTime(TimeMs timelineMs) const;
    TimeMs mapOutputToTimelineTime(TimeMs outputMs) const;
    TimeMs mapSourceToOutputTime(TimeMs sourceMs) const;
    TimeMs mapOutputToSourceTime(TimeMs outputMs) const;
    std::optional<TimeMs> findSourceTime(TimeMs outputMs) const;
    TimeMs getOutputDuration() const { return outputDuration_; }
    std::optional<OutputRange> mapSourceRangeToOutputRange(TimeMs startMs, TimeMs endMs) const;

    TimeMs timelineOffset() const { return timelineOffsetMs_; }
    const std::vector<OutputWindow>& windows() const { return windows_; }

private:
    TimeMs timelineOffsetMs_ = 0;
    std::vector<OutputWindow> windows_;
    TimeMs outputDuration_ = 0;
};

} // namespace AutoFrame
