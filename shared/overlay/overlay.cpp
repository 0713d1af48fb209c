#include "overlay.hpp"
#include "util/ImageOps.hpp"
#include <opencv2/opencv.hpp>
#include <algorithm>
#include <vector>

namespace
{
    // Per-pixel blend weight in [0, alpha], zero outside the region
    cv::Mat blendWeights(const cv::Mat& region, const LabelSettings& s)
    {
        const double alpha = std::clamp(s.overlayAlpha, 0.0, 1.0);
        cv::Mat inside; region.convertTo(inside, CV_32F, 1.0 / 255.0);
        cv::threshold(inside, inside, 0.0, 1.0, cv::THRESH_BINARY);
        if (s.featherRadius <= 0) return inside * alpha;

        const int k = std::max(1, s.featherRadius * 2 + 1);
        cv::Mat soft; cv::GaussianBlur(inside, soft, cv::Size(k, k), 0, 0, cv::BORDER_REPLICATE);
        cv::Mat w = soft.mul(inside);
        return w * alpha;
    }
}

cv::Mat composeOverlay(const cv::Mat& source, const cv::Mat& region, const LabelSettings& settings)
{
    cv::Mat out = source.clone();
    if (source.empty() || region.empty() || util::maskArea(region) == 0) return out;
    CV_Assert(source.type() == CV_8UC3 && region.type() == CV_8U && region.size() == source.size());

    const cv::Mat w = blendWeights(region, settings);
    const cv::Vec3d color(settings.overlayB, settings.overlayG, settings.overlayR);
    for (int y = 0; y < out.rows; ++y)
    {
        const uchar* m = region.ptr<uchar>(y);
        const float* a = w.ptr<float>(y);
        cv::Vec3b* px = out.ptr<cv::Vec3b>(y);
        for (int x = 0; x < out.cols; ++x)
        {
            if (!m[x]) continue;
            for (int c = 0; c < 3; ++c)
                px[x][c] = cv::saturate_cast<uchar>((1.0 - a[x]) * px[x][c] + a[x] * color[c]);
        }
    }
    return out;
}

cv::Mat composeDisplay(const cv::Mat& regionOverlay, const cv::Mat& region,
                       const cv::Mat& strokes, const LabelSettings& settings)
{
    cv::Mat display = regionOverlay.clone();
    if (display.empty()) return display;

    if (!region.empty() && util::maskArea(region) > 0)
    {
        std::vector<std::vector<cv::Point>> contours;
        cv::findContours(region.clone(), contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
        cv::drawContours(display, contours, -1,
                         util::bgrScalar(settings.overlayB, settings.overlayG, settings.overlayR), 1, cv::LINE_8);
    }
    if (!strokes.empty())
        display.setTo(util::bgrScalar(settings.outlineB, settings.outlineG, settings.outlineR), strokes);
    return display;
}

void drawHud(cv::Mat& display, const std::string& text)
{
    if (display.empty() || text.empty()) return;
    const cv::Point org(12, 28);
    cv::putText(display, text, org, cv::FONT_HERSHEY_SIMPLEX, 0.65, cv::Scalar(0, 0, 0), 3, cv::LINE_AA);
    cv::putText(display, text, org, cv::FONT_HERSHEY_SIMPLEX, 0.65, cv::Scalar(255, 255, 255), 1, cv::LINE_AA);
}
