
#include "util/ImageOps.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace util {

cv::Point clampToImage(const cv::Point& p, const cv::Size& size)
{
    return cv::Point(std::clamp(p.x, 0, std::max(0, size.width - 1)),
                     std::clamp(p.y, 0, std::max(0, size.height - 1)));
}

int maskArea(const cv::Mat& mask)
{
    if (mask.empty()) return 0;
    return cv::countNonZero(mask);
}

cv::Mat blankMask(const cv::Size& size)
{
    return cv::Mat::zeros(size, CV_8U);
}

cv::Scalar bgrScalar(int b, int g, int r)
{
    return cv::Scalar(std::clamp(b, 0, 255), std::clamp(g, 0, 255), std::clamp(r, 0, 255));
}

cv::Point viewToImage(const cv::Point& viewPt, const cv::Point& origin, double scale)
{
    if (scale <= 0) scale = 1.0;
    return cv::Point(int((viewPt.x - origin.x)/scale + 0.5), int((viewPt.y - origin.y)/scale + 0.5));
}

bool naturalLess(const std::string& a, const std::string& b)
{
    size_t i = 0, j = 0;
    while (i < a.size() && j < b.size())
    {
        const bool da = std::isdigit(static_cast<unsigned char>(a[i])) != 0;
        const bool db = std::isdigit(static_cast<unsigned char>(b[j])) != 0;
        if (da && db)
        {
            // Compare digit runs by value: strip leading zeros, then length, then digits
            size_t ei = i; while (ei < a.size() && std::isdigit(static_cast<unsigned char>(a[ei]))) ++ei;
            size_t ej = j; while (ej < b.size() && std::isdigit(static_cast<unsigned char>(b[ej]))) ++ej;
            size_t si = i; while (si + 1 < ei && a[si] == '0') ++si;
            size_t sj = j; while (sj + 1 < ej && b[sj] == '0') ++sj;
            const size_t li = ei - si, lj = ej - sj;
            if (li != lj) return li < lj;
            int cmp = a.compare(si, li, b, sj, lj);
            if (cmp != 0) return cmp < 0;
            i = ei; j = ej;
            continue;
        }
        if (a[i] != b[j]) return a[i] < b[j];
        ++i; ++j;
    }
    return (a.size() - i) < (b.size() - j);
}

bool isSupportedImageName(const std::string& fileName)
{
    std::string ext = std::filesystem::path(fileName).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return ext == ".jpg" || ext == ".jpeg" || ext == ".png" || ext == ".bmp" || ext == ".webp";
}

}
