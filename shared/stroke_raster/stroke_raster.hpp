#pragma once
#include "models/ToolMode.hpp"
#include <opencv2/core.hpp>

// Stamps one pointer segment into a CV_8U stroke buffer {0,255}.
// Draw ORs a capsule of the given radius from `from` to `to` plus a disk at `to`;
// Erase clears the same shape. Both endpoints are clipped to the buffer.
// from == to stamps a single disk, so a click without drag is still visible.
void stampSegment(cv::Mat& strokes, const cv::Point& from, const cv::Point& to, int radius, ToolMode mode);

// Radius actually used for a brush radius under the given tool (the eraser is eraseScale times wider).
int effectiveRadius(int brushRadius, ToolMode mode, int eraseScale);
