#include "region_fill.hpp"
#include <opencv2/opencv.hpp>
#include <vector>

namespace
{
    // Pixels reachable from outside the frame without crossing a stroke (4-connected).
    // The stroke buffer is padded by one empty pixel on every side, so seeding at (0,0)
    // reaches the whole border ring even when strokes cover the frame corners.
    cv::Mat markExterior(const cv::Mat& strokes)
    {
        cv::Mat wall; cv::threshold(strokes, wall, 0, 255, cv::THRESH_BINARY);
        cv::Mat padded;
        cv::copyMakeBorder(wall, padded, 1, 1, 1, 1, cv::BORDER_CONSTANT, cv::Scalar(0));
        cv::Mat ff = cv::Mat::zeros(padded.rows + 2, padded.cols + 2, CV_8U);
        cv::floodFill(padded, ff, cv::Point(0,0), cv::Scalar(255), nullptr,
                      cv::Scalar(0), cv::Scalar(0), 4 | cv::FLOODFILL_MASK_ONLY | (255 << 8));
        return ff(cv::Rect(2, 2, strokes.cols, strokes.rows)).clone();
    }

    void addTouchingStroke(const cv::Mat& strokes, cv::Mat& region)
    {
        cv::Mat wall; cv::threshold(strokes, wall, 0, 255, cv::THRESH_BINARY);
        cv::Mat labels;
        const int n = cv::connectedComponents(wall, labels, 8, CV_32S);
        if (n <= 1) return;

        cv::Mat grown;
        cv::dilate(region, grown, cv::getStructuringElement(cv::MORPH_RECT, cv::Size(3, 3)));

        std::vector<bool> touching(static_cast<size_t>(n), false);
        for (int y = 0; y < labels.rows; ++y)
        {
            const int* lab = labels.ptr<int>(y);
            const uchar* g = grown.ptr<uchar>(y);
            for (int x = 0; x < labels.cols; ++x)
                if (lab[x] > 0 && g[x]) touching[static_cast<size_t>(lab[x])] = true;
        }
        for (int y = 0; y < labels.rows; ++y)
        {
            const int* lab = labels.ptr<int>(y);
            uchar* r = region.ptr<uchar>(y);
            for (int x = 0; x < labels.cols; ++x)
                if (lab[x] > 0 && touching[static_cast<size_t>(lab[x])]) r[x] = 255;
        }
    }
}

int fillEnclosedRegion(const cv::Mat& strokes, cv::Mat& outRegion, bool includeStroke)
{
    if (strokes.empty()) { outRegion.release(); return 0; }
    CV_Assert(strokes.type() == CV_8U);

    cv::Mat region = cv::Mat::zeros(strokes.size(), CV_8U);
    if (cv::countNonZero(strokes) == 0) { outRegion = region; return 0; }

    // Region = not exterior and not wall
    cv::Mat blocked;
    cv::bitwise_or(markExterior(strokes), strokes != 0, blocked);
    cv::bitwise_not(blocked, region);

    int area = cv::countNonZero(region);
    if (includeStroke && area > 0)
    {
        addTouchingStroke(strokes, region);
        area = cv::countNonZero(region);
    }
    outRegion = region;
    return area;
}
