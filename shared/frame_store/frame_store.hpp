/*========================  frame_store.hpp  ========================

   Filesystem side of a labeling session.
   --------------------------------------------------------------------
   • enumerates supported images of one folder in natural order
   • masks/ and overlays/ live next to that folder (sibling dirs)
   • a frame counts as labeled once masks/<stem>.png exists
   • frames sharing a stem (a.jpg, a.png) keep only the first in order
   • every failure is reported as `false` plus a line on std::cerr

=====================================================================*/
#pragma once
#include <filesystem>
#include <set>
#include <string>
#include <vector>
#include "models/LabelSettings.hpp"
namespace cv { class Mat; }

struct FrameInfo
{
    std::string id;              // file name, e.g. "frame_0012.jpg"
    std::filesystem::path path;  // full source path
};

class FrameStore
{
public:
    explicit FrameStore(const std::filesystem::path& framesDir, const LabelSettings& settings = LabelSettings());

    const std::filesystem::path& framesDir() const { return framesDir_; }
    const std::filesystem::path& masksDir() const { return masksDir_; }
    const std::filesystem::path& overlaysDir() const { return overlaysDir_; }

    // Creates masks/ and overlays/ if missing
    bool ensureOutputDirs() const;

    // All supported images, natural filename order, one per mask name
    std::vector<FrameInfo> listAllFrames() const;

    // listAllFrames() minus the frames that already have a mask
    std::vector<FrameInfo> listPendingFrames() const;

    std::set<std::string> labeledIdentifiers() const;

    std::filesystem::path maskPathFor(const std::string& id) const;
    std::filesystem::path overlayPathFor(const std::string& id) const;

    // Loads as 8-bit BGR. Returns false for missing or undecodable files.
    bool loadFrame(const FrameInfo& info, cv::Mat& out) const;

    // Lossless single-channel PNG, 0/255
    bool saveMask(const std::string& id, const cv::Mat& mask) const;

    // Same file name (and codec) as the source frame
    bool saveOverlay(const std::string& id, const cv::Mat& overlay) const;

private:
    std::vector<FrameInfo> collectFrames(bool reportCollisions) const;
    bool writeImage(const std::filesystem::path& path, const cv::Mat& img, const char* tag) const;

    std::filesystem::path framesDir_;
    std::filesystem::path masksDir_;
    std::filesystem::path overlaysDir_;
};
