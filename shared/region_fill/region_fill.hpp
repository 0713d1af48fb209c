#pragma once
#include <opencv2/core.hpp>

// Derives the region enclosed by a stroke outline.
//
// `strokes` is a CV_8U buffer where any non-zero pixel is a wall. Everything reachable from
// outside the frame without crossing a wall (4-connected) is exterior; the region is whatever
// is neither exterior nor wall. The result in `outRegion` is CV_8U {0,255}, same size as `strokes`,
// and depends only on `strokes`, so repeating the fill gives the same mask.
//
// An outline with a gap leaks and usually yields an empty region. An empty stroke buffer yields
// an empty region, never a full one.
//
// With includeStroke, stroke components that touch a non-empty region are added to it.
//
// Returns the number of region pixels.
int fillEnclosedRegion(const cv::Mat& strokes, cv::Mat& outRegion, bool includeStroke = false);
