#include "frame_store.hpp"
#include "util/ImageOps.hpp"
#include <opencv2/opencv.hpp>
#include <algorithm>
#include <map>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace {
    fs::path parentOf(const fs::path& dir)
    {
        // "frames/" and "frames" should both resolve to the folder's parent
        fs::path p = dir;
        if (!p.has_filename()) p = p.parent_path();
        return p.parent_path();
    }
}

FrameStore::FrameStore(const fs::path& framesDir, const LabelSettings& settings)
    : framesDir_(framesDir),
      masksDir_(parentOf(framesDir) / settings.masksDirName),
      overlaysDir_(parentOf(framesDir) / settings.overlaysDirName)
{
}

bool FrameStore::ensureOutputDirs() const
{
    for (const fs::path& dir : { masksDir_, overlaysDir_ })
    {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) { std::cerr << "[FrameStore::ensureOutputDirs] cannot create " << dir << ": " << ec.message() << "\n"; return false; }
    }
    return true;
}

std::vector<FrameInfo> FrameStore::listAllFrames() const
{
    return collectFrames(true);
}

std::vector<FrameInfo> FrameStore::collectFrames(bool reportCollisions) const
{
    std::vector<FrameInfo> frames;
    std::error_code ec;
    fs::directory_iterator it(framesDir_, ec);
    if (ec) { std::cerr << "[FrameStore::listAllFrames] cannot read " << framesDir_ << ": " << ec.message() << "\n"; return frames; }

    for (const fs::directory_entry& entry : it)
    {
        std::error_code fec;
        if (!entry.is_regular_file(fec)) continue;
        const std::string name = entry.path().filename().string();
        if (!util::isSupportedImageName(name)) continue;
        frames.push_back({ name, entry.path() });
    }
    std::sort(frames.begin(), frames.end(),
              [](const FrameInfo& a, const FrameInfo& b){ return util::naturalLess(a.id, b.id); });

    // One mask file per frame: a later frame whose mask name is taken is left out
    std::map<fs::path, std::string> owners;
    std::vector<FrameInfo> unique;
    unique.reserve(frames.size());
    for (FrameInfo& f : frames)
    {
        auto ins = owners.emplace(maskPathFor(f.id), f.id);
        if (!ins.second)
        {
            if (reportCollisions)
                std::cerr << "[FrameStore::listAllFrames] " << f.id << " skipped: mask name taken by "
                          << ins.first->second << "\n";
            continue;
        }
        unique.push_back(std::move(f));
    }
    return unique;
}

std::set<std::string> FrameStore::labeledIdentifiers() const
{
    std::set<std::string> labeled;
    for (const FrameInfo& f : collectFrames(false))
    {
        std::error_code ec;
        if (fs::exists(maskPathFor(f.id), ec)) labeled.insert(f.id);
    }
    return labeled;
}

std::vector<FrameInfo> FrameStore::listPendingFrames() const
{
    std::vector<FrameInfo> pending;
    for (FrameInfo& f : collectFrames(false))
    {
        std::error_code ec;
        if (!fs::exists(maskPathFor(f.id), ec)) pending.push_back(std::move(f));
    }
    return pending;
}

fs::path FrameStore::maskPathFor(const std::string& id) const
{
    return masksDir_ / (fs::path(id).stem().string() + ".png");
}

fs::path FrameStore::overlayPathFor(const std::string& id) const
{
    return overlaysDir_ / id;
}

bool FrameStore::loadFrame(const FrameInfo& info, cv::Mat& out) const
{
    cv::Mat img;
    try
    {
        img = cv::imread(info.path.string(), cv::IMREAD_COLOR);
    }
    catch (const cv::Exception& e)
    {
        std::cerr << "[FrameStore::loadFrame] " << info.id << ": " << e.what() << "\n";
        return false;
    }
    if (img.empty()) { std::cerr << "[FrameStore::loadFrame] cannot open: " << info.path.string() << "\n"; return false; }
    out = img;
    return true;
}

bool FrameStore::saveMask(const std::string& id, const cv::Mat& mask) const
{
    if (mask.empty() || mask.type() != CV_8U)
    {
        std::cerr << "[FrameStore::saveMask] " << id << ": expected a non-empty CV_8U mask\n";
        return false;
    }
    return writeImage(maskPathFor(id), mask, "[FrameStore::saveMask]");
}

bool FrameStore::saveOverlay(const std::string& id, const cv::Mat& overlay) const
{
    if (overlay.empty())
    {
        std::cerr << "[FrameStore::saveOverlay] " << id << ": empty overlay\n";
        return false;
    }
    return writeImage(overlayPathFor(id), overlay, "[FrameStore::saveOverlay]");
}

bool FrameStore::writeImage(const fs::path& path, const cv::Mat& img, const char* tag) const
{
    bool ok = false;
    try
    {
        ok = cv::imwrite(path.string(), img);
    }
    catch (const cv::Exception& e)
    {
        std::cerr << tag << " " << path.string() << ": " << e.what() << "\n";
        return false;
    }
    if (!ok) std::cerr << tag << " cannot write: " << path.string() << "\n";
    return ok;
}
