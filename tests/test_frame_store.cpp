#include <gtest/gtest.h>
#include <opencv2/opencv.hpp>
#include "frame_store.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;
using testsupport::TempDir;

namespace {
    std::vector<std::string> ids(const std::vector<FrameInfo>& frames)
    {
        std::vector<std::string> out;
        for (const auto& f : frames) out.push_back(f.id);
        return out;
    }
}

TEST(FrameStore, OutputFoldersAreSiblingsOfTheFramesFolder)
{
    TempDir tmp;
    FrameStore store(tmp.path() / "frames");
    EXPECT_EQ(store.masksDir(), tmp.path() / "masks");
    EXPECT_EQ(store.overlaysDir(), tmp.path() / "overlays");

    FrameStore trailing(tmp.path() / "frames" / "");
    EXPECT_EQ(trailing.masksDir(), tmp.path() / "masks");
}

TEST(FrameStore, OutputFolderNamesComeFromSettings)
{
    TempDir tmp;
    LabelSettings s;
    s.masksDirName = "gas_masks";
    s.overlaysDirName = "gas_overlays";
    FrameStore store(tmp.path() / "frames", s);
    EXPECT_EQ(store.masksDir(), tmp.path() / "gas_masks");
    EXPECT_EQ(store.overlaysDir(), tmp.path() / "gas_overlays");
}

TEST(FrameStore, ListsSupportedImagesInNaturalOrder)
{
    TempDir tmp;
    const fs::path frames = tmp.path() / "frames";
    testsupport::writeFrame(frames / "frame10.png");
    testsupport::writeFrame(frames / "frame2.png");
    testsupport::writeFrame(frames / "frame1.jpg");
    testsupport::writeGarbage(frames / "notes.txt");
    fs::create_directories(frames / "sub.png");

    FrameStore store(frames);
    const std::vector<std::string> expected { "frame1.jpg", "frame2.png", "frame10.png" };
    EXPECT_EQ(ids(store.listAllFrames()), expected);
}

TEST(FrameStore, MissingFolderListsNothing)
{
    TempDir tmp;
    FrameStore store(tmp.path() / "nope");
    EXPECT_TRUE(store.listAllFrames().empty());
    EXPECT_TRUE(store.listPendingFrames().empty());
}

TEST(FrameStore, FramesWithAMaskAreLabeled)
{
    TempDir tmp;
    const fs::path frames = tmp.path() / "frames";
    testsupport::writeFrame(frames / "a1.jpg");
    testsupport::writeFrame(frames / "a2.png");
    testsupport::writeFrame(frames / "a3.png");

    FrameStore store(frames);
    ASSERT_TRUE(store.ensureOutputDirs());
    cv::imwrite((store.masksDir() / "a1.png").string(), cv::Mat::zeros(100, 100, CV_8U));

    EXPECT_EQ(store.maskPathFor("a1.jpg"), store.masksDir() / "a1.png");
    EXPECT_EQ(store.overlayPathFor("a1.jpg"), store.overlaysDir() / "a1.jpg");
    EXPECT_EQ(store.labeledIdentifiers(), std::set<std::string>{ "a1.jpg" });
    const std::vector<std::string> expected { "a2.png", "a3.png" };
    EXPECT_EQ(ids(store.listPendingFrames()), expected);
}

TEST(FrameStore, LoadsFramesAsBgr)
{
    TempDir tmp;
    const fs::path frames = tmp.path() / "frames";
    testsupport::writeFrame(frames / "f.png", 64, 48);
    FrameStore store(frames);
    cv::Mat img;
    ASSERT_TRUE(store.loadFrame({ "f.png", frames / "f.png" }, img));
    EXPECT_EQ(img.size(), cv::Size(64, 48));
    EXPECT_EQ(img.type(), CV_8UC3);
}

TEST(FrameStore, UnreadableFrameFailsToLoad)
{
    TempDir tmp;
    const fs::path frames = tmp.path() / "frames";
    testsupport::writeGarbage(frames / "broken.png");
    FrameStore store(frames);
    cv::Mat img;
    EXPECT_FALSE(store.loadFrame({ "broken.png", frames / "broken.png" }, img));
    EXPECT_FALSE(store.loadFrame({ "gone.png", frames / "gone.png" }, img));
    EXPECT_TRUE(img.empty());
}

TEST(FrameStore, MaskIsSavedAsLosslessSingleChannelPng)
{
    TempDir tmp;
    const fs::path frames = tmp.path() / "frames";
    FrameStore store(frames);
    ASSERT_TRUE(store.ensureOutputDirs());

    cv::Mat mask = cv::Mat::zeros(100, 100, CV_8U);
    mask(cv::Rect(20, 20, 30, 30)).setTo(255);
    ASSERT_TRUE(store.saveMask("shot.jpg", mask));

    const cv::Mat back = cv::imread(store.maskPathFor("shot.jpg").string(), cv::IMREAD_UNCHANGED);
    ASSERT_FALSE(back.empty());
    EXPECT_EQ(back.channels(), 1);
    EXPECT_EQ(back.size(), mask.size());
    EXPECT_EQ(cv::norm(back, mask, cv::NORM_INF), 0.0);
}

TEST(FrameStore, SavingTwiceOverwrites)
{
    TempDir tmp;
    FrameStore store(tmp.path() / "frames");
    ASSERT_TRUE(store.ensureOutputDirs());
    ASSERT_TRUE(store.saveMask("x.png", cv::Mat::zeros(10, 10, CV_8U)));
    ASSERT_TRUE(store.saveMask("x.png", cv::Mat(10, 10, CV_8U, cv::Scalar(255))));
    const cv::Mat back = cv::imread(store.maskPathFor("x.png").string(), cv::IMREAD_UNCHANGED);
    EXPECT_EQ(cv::countNonZero(back), 100);
}

TEST(FrameStore, OverlayKeepsTheSourceFileName)
{
    TempDir tmp;
    FrameStore store(tmp.path() / "frames");
    ASSERT_TRUE(store.ensureOutputDirs());
    ASSERT_TRUE(store.saveOverlay("shot.jpg", testsupport::syntheticFrame()));
    EXPECT_TRUE(fs::exists(store.overlaysDir() / "shot.jpg"));
}

TEST(FrameStore, SaveFailuresAreReportedNotThrown)
{
    TempDir tmp;
    FrameStore store(tmp.path() / "frames");
    // Output folders never created
    EXPECT_FALSE(store.saveMask("a.png", cv::Mat::zeros(10, 10, CV_8U)));
    EXPECT_FALSE(store.saveOverlay("a.png", testsupport::syntheticFrame()));
    ASSERT_TRUE(store.ensureOutputDirs());
    EXPECT_FALSE(store.saveMask("a.png", cv::Mat()));
    EXPECT_FALSE(store.saveMask("a.png", cv::Mat::zeros(10, 10, CV_8UC3)));
}

TEST(FrameStore, FramesSharingAStemKeepOnlyTheFirst)
{
    TempDir tmp;
    const fs::path frames = tmp.path() / "frames";
    testsupport::writeFrame(frames / "a.png");
    testsupport::writeFrame(frames / "a.jpg");
    testsupport::writeFrame(frames / "b.png");

    FrameStore store(frames);
    const std::vector<std::string> expected { "a.jpg", "b.png" };
    EXPECT_EQ(ids(store.listAllFrames()), expected);
    EXPECT_EQ(ids(store.listPendingFrames()), expected);

    ASSERT_TRUE(store.ensureOutputDirs());
    ASSERT_TRUE(store.saveMask("a.jpg", cv::Mat(100, 100, CV_8U, cv::Scalar(255))));
    EXPECT_EQ(store.labeledIdentifiers(), std::set<std::string>{ "a.jpg" });
    const std::vector<std::string> pending { "b.png" };
    EXPECT_EQ(ids(store.listPendingFrames()), pending);
}
