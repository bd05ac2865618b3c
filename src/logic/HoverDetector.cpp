// =============================================================================
// AutoFrame — HoverDetector
//
// Single left-to-right scan. From sample i, grow [i, j) while the running
// bounding box stays within boxSize on both axes and no boundary is crossed.
// The furthest sample that already satisfies the dwell time closes the hover;
// scanning resumes right after it. Otherwise i advances by one.
// =============================================================================

#include "autoframe/logic/HoverDetector.h"

#include <algorithm>
#include <limits>

namespace AutoFrame
{

HoverDetector::HoverDetector(const Size& inputSize, double boxFraction, TimeMs minDurationMs)
    : boxSize_(std::max(inputSize.width, inputSize.height) * boxFraction)
    , minDurationMs_(minDurationMs)
{
}

std::vector<HoverEvent> HoverDetector::detect(const std::vector<Sample>& samples,
                                              std::vector<TimeMs> boundaries) const
{
    std::vector<HoverEvent> hovers;
    std::sort(boundaries.begin(), boundaries.end());

    const size_t n = samples.size();
    size_t i = 0;
    size_t boundaryIdx = 0;

    while (i < n)
    {
        const Sample& start = samples[i];

        // Next boundary strictly after the candidate start
        while (boundaryIdx < boundaries.size() && boundaries[boundaryIdx] <= start.timestamp)
            ++boundaryIdx;

        TimeMs nextBoundary = (boundaryIdx < boundaries.size())
                                  ? boundaries[boundaryIdx]
                                  : std::numeric_limits<TimeMs>::max();

        // Dwell cannot complete before the boundary interrupts it
        if (start.timestamp + minDurationMs_ >= nextBoundary)
        {
            ++i;
            continue;
        }

        double minX = start.position.x, maxX = start.position.x;
        double minY = start.position.y, maxY = start.position.y;
        size_t validEnd = n; // n == none found

        for (size_t j = i; j < n; ++j)
        {
            const Sample& p = samples[j];
            if (p.timestamp >= nextBoundary)
                break;

            double nMinX = std::min(minX, p.position.x);
            double nMaxX = std::max(maxX, p.position.x);
            double nMinY = std::min(minY, p.position.y);
            double nMaxY = std::max(maxY, p.position.y);
            if (nMaxX - nMinX > boxSize_ || nMaxY - nMinY > boxSize_)
                break;

            minX = nMinX;
            maxX = nMaxX;
            minY = nMinY;
            maxY = nMaxY;

            if (p.timestamp - start.timestamp >= minDurationMs_)
                validEnd = j;
        }

        if (validEnd == n)
        {
            ++i;
            continue;
        }

        double sumX = 0.0, sumY = 0.0;
        for (size_t k = i; k <= validEnd; ++k)
        {
            sumX += samples[k].position.x;
            sumY += samples[k].position.y;
        }
        double count = static_cast<double>(validEnd - i + 1);

        HoverEvent hover;
        hover.timestamp = start.timestamp;
        hover.endTime = samples[validEnd].timestamp;
        hover.position = {sumX / count, sumY / count};
        hovers.push_back(hover);

        i = validEnd + 1;
    }

    return hovers;
}

} // namespace AutoFrame
