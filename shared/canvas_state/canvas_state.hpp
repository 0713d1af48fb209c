#pragma once
#include <opencv2/core.hpp>
#include "models/BrushState.hpp"
#include "models/LabelSettings.hpp"

/**
 * @class CanvasState
 * @brief Per-frame drawing buffers: the bound frame, its stroke buffer and its region mask.
 *
 * Strokes only ever touch the stroke buffer. The region mask changes only through fill()
 * or a reset (beginFrame/clear). The composed region overlay is cached and rebuilt on those
 * same three calls, so a render during a drag only paints strokes over the cache.
 * Without a bound frame every edit is a no-op.
 */
class CanvasState
{
public:
    explicit CanvasState(const LabelSettings& settings = LabelSettings());

    // Binds `frame` (CV_8UC3) and resets both buffers to all-zero
    void beginFrame(const cv::Mat& frame);
    void releaseFrame();

    void draw(const cv::Point& prev, const cv::Point& curr, const BrushState& brush);
    void erase(const cv::Point& prev, const cv::Point& curr, const BrushState& brush);

    // Recomputes the region from the current strokes; returns its area in pixels
    int fill();

    // Resets strokes and region, keeps the frame
    void clear();

    bool hasFrame() const { return !frame_.empty(); }
    bool hasStrokes() const;
    bool hasRegion() const { return regionArea_ > 0; }
    int regionArea() const { return regionArea_; }

    const cv::Mat& frame() const { return frame_; }
    const cv::Mat& strokes() const { return strokes_; }
    const cv::Mat& region() const { return region_; }

    // Saved artifact: frame with the filled region blended in
    const cv::Mat& regionOverlay() const { return regionOverlay_; }

    // On-screen view: region overlay + border + live strokes
    cv::Mat render() const;

private:
    void stamp(const cv::Point& prev, const cv::Point& curr, int radius, ToolMode mode);
    void rebuildOverlay();

    LabelSettings settings_;
    cv::Mat frame_;
    cv::Mat strokes_;
    cv::Mat region_;
    cv::Mat regionOverlay_;
    int regionArea_ {0};
};
