#pragma once
#include <opencv2/opencv.hpp>
#include <string>

namespace util {

// Clamp a point into [0, size.width-1] x [0, size.height-1]
cv::Point clampToImage(const cv::Point& p, const cv::Size& size);

// Number of non-zero pixels in a single-channel mask (0 for an empty Mat)
int maskArea(const cv::Mat& mask);

// Fresh all-zero CV_8U mask of the given size
cv::Mat blankMask(const cv::Size& size);

// Overlay/outline colors arrive as separate BGR ints from settings
cv::Scalar bgrScalar(int b, int g, int r);

// View pixel -> image pixel for an image drawn at `origin` scaled by `scale`, rounded to
// the nearest pixel. No clamping.
cv::Point viewToImage(const cv::Point& viewPt, const cv::Point& origin, double scale);

// Natural ("human") filename ordering: frame2 < frame10
bool naturalLess(const std::string& a, const std::string& b);

// .jpg .jpeg .png .bmp .webp, case-insensitive
bool isSupportedImageName(const std::string& fileName);

}
