#pragma once
// =============================================================================
// AutoFrame — ViewMapper
// Contain-fit placement of the Source recording inside the Output canvas
// (letterbox/pillarbox + padding), and projections between Source space,
// Output space and a camera Viewport.
// =============================================================================

#include "autoframe/common/Types.h"

#include <optional>

namespace AutoFrame
{

class ViewMapper
{
public:
    // Cached placement of the content inside the output canvas.
    struct ProjectedBox
    {
        double x = 0.0;
        double y = 0.0;
        double width = 0.0;
        double height = 0.0;
        double scale = 1.0;     // source pixels per output pixel
    };

    struct RenderRects
    {
        Rect sourceRect;    // region of the source bitmap to sample (Source space)
        Rect destRect;      // where to draw it on the final canvas (Screen space)
    };

    // paddingFraction is clamped to [0, 0.5). Zero-area input or output yields
    // an empty content box and identity projections.
    ViewMapper(const Size& inputSize, const Size& outputSize, double paddingFraction);

    Point inputToOutputPoint(const Point& p) const;
    Rect inputToOutputRect(const Rect& r) const;

    // Output → Source, inverse of inputToOutputPoint.
    Point outputToInputPoint(const Point& p) const;

    // nullopt when the viewport sees only padding/background.
    std::optional<RenderRects> resolveRenderRects(const Rect& viewport) const;

    // Source → Output → Screen coordinates relative to the viewport.
    Point projectToScreen(const Point& p, const Rect& viewport) const;

    // outputWidth / viewportWidth; 1.0 means the full canvas is visible.
    double getZoomScale(const Rect& viewport) const;

    const Size& inputSize() const { return inputSize_; }
    const Size& outputSize() const { return outputSize_; }
    double paddingFraction() const { return paddingFraction_; }
    const ProjectedBox& projectedBox() const { return box_; }
    Rect contentRect() const { return {box_.x, box_.y, box_.width, box_.height}; }
    bool isDegenerate() const { return degenerate_; }

    static std::optional<Rect> intersect(const Rect& a, const Rect& b);

    // Padding must stay strictly below one half; beyond that nothing fits.
    // Larger values are clamped to the largest double below the limit.
    static constexpr double kPaddingLimit = 0.5;

private:
    Size inputSize_;
    Size outputSize_;
    double paddingFraction_ = 0.0;
    ProjectedBox box_;
    bool degenerate_ = false;
};

} // namespace AutoFrame
