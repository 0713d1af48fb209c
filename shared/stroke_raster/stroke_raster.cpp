#include "stroke_raster.hpp"
#include "util/ImageOps.hpp"
#include <opencv2/opencv.hpp>
#include <algorithm>

int effectiveRadius(int brushRadius, ToolMode mode, int eraseScale)
{
    int r = std::max(1, brushRadius);
    if (mode == ToolMode::Erase) r *= std::max(1, eraseScale);
    return r;
}

void stampSegment(cv::Mat& strokes, const cv::Point& from, const cv::Point& to, int radius, ToolMode mode)
{
    if (strokes.empty()) return;
    const cv::Point a = util::clampToImage(from, strokes.size());
    const cv::Point b = util::clampToImage(to, strokes.size());
    const int r = std::max(1, radius);
    const cv::Scalar value = (mode == ToolMode::Draw) ? cv::Scalar(255) : cv::Scalar(0);

    // Thick cv::line already has round caps; the explicit disks make the stamp independent of that
    if (a != b) cv::line(strokes, a, b, value, 2 * r + 1, cv::LINE_8);
    cv::circle(strokes, a, r, value, cv::FILLED, cv::LINE_8);
    cv::circle(strokes, b, r, value, cv::FILLED, cv::LINE_8);
}
