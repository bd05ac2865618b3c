// =============================================================================
// AutoFrame — ViewMapper
//
// Contain fit:
//   scale = max(inW / (outW * (1 - 2p)), inH / (outH * (1 - 2p)))
//   projected = input / scale, centered in the output canvas.
// The larger ratio wins so both padded dimensions fit with aspect preserved.
// =============================================================================

#include "autoframe/geometry/ViewMapper.h"
#include "autoframe/support/Log.h"

#include <algorithm>
#include <cmath>

namespace AutoFrame
{

ViewMapper::ViewMapper(const Size& inputSize, const Size& outputSize, double paddingFraction)
    : inputSize_(inputSize)
    , outputSize_(outputSize)
{
    if (!(paddingFraction >= 0.0))
        paddingFraction = 0.0; // also catches NaN
    if (paddingFraction >= kPaddingLimit)
    {
        double clamped = std::nextafter(kPaddingLimit, 0.0);
        logger()->warn("ViewMapper: padding {} out of range, clamped to {}", paddingFraction, clamped);
        paddingFraction = clamped;
    }
    paddingFraction_ = paddingFraction;

    if (inputSize_.isEmpty() || outputSize_.isEmpty())
    {
        logger()->warn("ViewMapper: degenerate geometry (input {}x{}, output {}x{}), using identity",
                       inputSize_.width, inputSize_.height, outputSize_.width, outputSize_.height);
        degenerate_ = true;
        return;
    }

    double usable = 1.0 - 2.0 * paddingFraction_;
    double scale = std::max(inputSize_.width / (outputSize_.width * usable),
                            inputSize_.height / (outputSize_.height * usable));

    box_.scale = scale;
    box_.width = inputSize_.width / scale;
    box_.height = inputSize_.height / scale;
    box_.x = (outputSize_.width - box_.width) / 2.0;
    box_.y = (outputSize_.height - box_.height) / 2.0;
}

Point ViewMapper::inputToOutputPoint(const Point& p) const
{
    if (degenerate_)
        return p;

    // Normalize in Source space, then place inside the content box
    double nx = p.x / inputSize_.width;
    double ny = p.y / inputSize_.height;
    return {box_.x + nx * box_.width, box_.y + ny * box_.height};
}

Rect ViewMapper::inputToOutputRect(const Rect& r) const
{
    Point p1 = inputToOutputPoint({r.x, r.y});
    Point p2 = inputToOutputPoint({r.x + r.width, r.y + r.height});
    return {std::min(p1.x, p2.x), std::min(p1.y, p2.y), std::abs(p2.x - p1.x), std::abs(p2.y - p1.y)};
}

Point ViewMapper::outputToInputPoint(const Point& p) const
{
    if (degenerate_)
        return p;

    double nx = (p.x - box_.x) / box_.width;
    double ny = (p.y - box_.y) / box_.height;
    return {nx * inputSize_.width, ny * inputSize_.height};
}

std::optional<ViewMapper::RenderRects> ViewMapper::resolveRenderRects(const Rect& viewport) const
{
    if (degenerate_ || viewport.isEmpty())
        return std::nullopt;

    // Part of the content visible through the viewport
    auto visible = intersect(viewport, contentRect());
    if (!visible)
        return std::nullopt;

    RenderRects out;
    out.sourceRect.x = (visible->x - box_.x) / box_.width * inputSize_.width;
    out.sourceRect.y = (visible->y - box_.y) / box_.height * inputSize_.height;
    out.sourceRect.width = visible->width / box_.width * inputSize_.width;
    out.sourceRect.height = visible->height / box_.height * inputSize_.height;

    double scaleX = outputSize_.width / viewport.width;
    double scaleY = outputSize_.height / viewport.height;
    out.destRect.x = (visible->x - viewport.x) * scaleX;
    out.destRect.y = (visible->y - viewport.y) * scaleY;
    out.destRect.width = visible->width * scaleX;
    out.destRect.height = visible->height * scaleY;

    return out;
}

Point ViewMapper::projectToScreen(const Point& p, const Rect& viewport) const
{
    Point out = inputToOutputPoint(p);
    if (viewport.isEmpty())
        return {out.x - viewport.x, out.y - viewport.y};

    double scaleX = outputSize_.width / viewport.width;
    double scaleY = outputSize_.height / viewport.height;
    return {(out.x - viewport.x) * scaleX, (out.y - viewport.y) * scaleY};
}

double ViewMapper::getZoomScale(const Rect& viewport) const
{
    // Uniform zoom assumed; width ratio is authoritative
    if (viewport.width <= 0.0 || outputSize_.width <= 0.0)
        return 1.0;
    return outputSize_.width / viewport.width;
}

std::optional<Rect> ViewMapper::intersect(const Rect& a, const Rect& b)
{
    double x = std::max(a.x, b.x);
    double y = std::max(a.y, b.y);
    double w = std::min(a.right(), b.right()) - x;
    double h = std::min(a.bottom(), b.bottom()) - y;

    if (w <= 0.0 || h <= 0.0)
        return std::nullopt;
    return Rect{x, y, w, h};
}

} // namespace AutoFrame
