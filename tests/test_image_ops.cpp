#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>
#include "util/ImageOps.hpp"

TEST(ImageOps, ClampToImageKeepsPointsInside)
{
    const cv::Size sz(100, 50);
    EXPECT_EQ(util::clampToImage(cv::Point(-5, -5), sz), cv::Point(0, 0));
    EXPECT_EQ(util::clampToImage(cv::Point(150, 70), sz), cv::Point(99, 49));
    EXPECT_EQ(util::clampToImage(cv::Point(10, 20), sz), cv::Point(10, 20));
}

TEST(ImageOps, MaskAreaOfEmptyMatIsZero)
{
    EXPECT_EQ(util::maskArea(cv::Mat()), 0);
    cv::Mat m = util::blankMask(cv::Size(10, 10));
    EXPECT_EQ(util::maskArea(m), 0);
    m.at<uchar>(3, 4) = 255;
    EXPECT_EQ(util::maskArea(m), 1);
}

TEST(ImageOps, NaturalOrderSortsDigitRunsByValue)
{
    std::vector<std::string> names { "frame10.png", "frame2.png", "frame1.png", "frame02b.png", "alpha.png" };
    std::sort(names.begin(), names.end(), util::naturalLess);
    const std::vector<std::string> expected { "alpha.png", "frame1.png", "frame2.png", "frame02b.png", "frame10.png" };
    EXPECT_EQ(names, expected);
}

TEST(ImageOps, SupportedExtensionsAreCaseInsensitive)
{
    EXPECT_TRUE(util::isSupportedImageName("a.JPG"));
    EXPECT_TRUE(util::isSupportedImageName("a.jpeg"));
    EXPECT_TRUE(util::isSupportedImageName("a.Png"));
    EXPECT_TRUE(util::isSupportedImageName("a.bmp"));
    EXPECT_TRUE(util::isSupportedImageName("a.webp"));
    EXPECT_FALSE(util::isSupportedImageName("a.tif"));
    EXPECT_FALSE(util::isSupportedImageName("notes.txt"));
    EXPECT_FALSE(util::isSupportedImageName("png"));
}

TEST(ImageOps, ViewToImageRoundsToNearestPixel)
{
    // 4x zoom, image drawn at (10, 20)
    const cv::Point origin(10, 20);
    EXPECT_EQ(util::viewToImage(cv::Point(10, 20), origin, 4.0), cv::Point(0, 0));
    EXPECT_EQ(util::viewToImage(cv::Point(13, 23), origin, 4.0), cv::Point(1, 1));  // 0.75 -> 1
    EXPECT_EQ(util::viewToImage(cv::Point(11, 21), origin, 4.0), cv::Point(0, 0));  // 0.25 -> 0
    EXPECT_EQ(util::viewToImage(cv::Point(50, 60), origin, 4.0), cv::Point(10, 10));
    EXPECT_EQ(util::viewToImage(cv::Point(50, 60), origin, 0.0), cv::Point(40, 40));  // bad scale -> 1:1
}
