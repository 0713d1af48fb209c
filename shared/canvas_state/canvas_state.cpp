#include "canvas_state.hpp"
#include "stroke_raster.hpp"
#include "region_fill.hpp"
#include "overlay.hpp"
#include "util/ImageOps.hpp"
#include <opencv2/opencv.hpp>

CanvasState::CanvasState(const LabelSettings& settings)
    : settings_(settings)
{
}

void CanvasState::beginFrame(const cv::Mat& frame)
{
    frame_ = frame;
    strokes_ = util::blankMask(frame_.size());
    region_ = util::blankMask(frame_.size());
    regionArea_ = 0;
    rebuildOverlay();
}

void CanvasState::releaseFrame()
{
    frame_.release();
    strokes_.release();
    region_.release();
    regionOverlay_.release();
    regionArea_ = 0;
}

void CanvasState::draw(const cv::Point& prev, const cv::Point& curr, const BrushState& brush)
{
    stamp(prev, curr, effectiveRadius(brush.radius, ToolMode::Draw, settings_.eraseScale), ToolMode::Draw);
}

void CanvasState::erase(const cv::Point& prev, const cv::Point& curr, const BrushState& brush)
{
    stamp(prev, curr, effectiveRadius(brush.radius, ToolMode::Erase, settings_.eraseScale), ToolMode::Erase);
}

void CanvasState::stamp(const cv::Point& prev, const cv::Point& curr, int radius, ToolMode mode)
{
    if (!hasFrame()) return;
    stampSegment(strokes_, prev, curr, radius, mode);
}

int CanvasState::fill()
{
    if (!hasFrame()) return 0;
    regionArea_ = fillEnclosedRegion(strokes_, region_, settings_.fillIncludesStroke);
    rebuildOverlay();
    return regionArea_;
}

void CanvasState::clear()
{
    if (!hasFrame()) return;
    strokes_.setTo(0);
    region_.setTo(0);
    regionArea_ = 0;
    rebuildOverlay();
}

bool CanvasState::hasStrokes() const
{
    return util::maskArea(strokes_) > 0;
}

void CanvasState::rebuildOverlay()
{
    regionOverlay_ = composeOverlay(frame_, region_, settings_);
}

cv::Mat CanvasState::render() const
{
    return composeDisplay(regionOverlay_, region_, strokes_, settings_);
}
