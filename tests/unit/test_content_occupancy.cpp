/**
 * @file test_content_occupancy.cpp
 * @brief Unit tests for the free-space prior built from a frame image
 */

#include "raster/contentoccupancy.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

using namespace posterheat;

namespace {

const cv::Size kGrid(12, 21);

cv::Mat1b whiteFrame()
{
    return cv::Mat1b(210, 120, uchar(255));
}

} // anonymous namespace

class ContentOccupancyTest : public ::testing::Test {
protected:
    OccupancyConfig config_;
};

TEST_F(ContentOccupancyTest, BlankFrameIsFreeEverywhere) {
    cv::Mat1d occ = ContentOccupancy::build(whiteFrame(), kGrid, config_);
    ASSERT_EQ(occ.size(), kGrid);
    for (auto v : occ)
        EXPECT_DOUBLE_EQ(v, 1.0);
}

TEST_F(ContentOccupancyTest, ContentBoundsCoverDarkPixels) {
    cv::Mat1b frame = whiteFrame();
    frame(cv::Rect(30, 42, 30, 42)).setTo(0);

    const cv::Rect bounds = ContentOccupancy::contentBounds(frame, config_.threshold);
    EXPECT_EQ(bounds, cv::Rect(30, 42, 30, 42));
}

TEST_F(ContentOccupancyTest, ContentCellsGetResidualWeight) {
    cv::Mat1b frame = whiteFrame();
    frame(cv::Rect(30, 42, 30, 42)).setTo(0);   // пиксели x 30..59, y 42..83

    cv::Mat1d occ = ContentOccupancy::build(frame, kGrid, config_);

    // x: 30/120*12 = 3 .. 59/120*12 = 5.9 -> 5;  y: 42/210*21 = 4.2 -> 4 .. 83/210*21 = 8.3 -> 8
    for (int y = 0; y < occ.rows; ++y) {
        for (int x = 0; x < occ.cols; ++x) {
            const bool content = x >= 3 && x <= 5 && y >= 4 && y <= 8;
            EXPECT_DOUBLE_EQ(occ(y, x), content ? config_.residual : 1.0) << "cell " << x << "," << y;
        }
    }
}

TEST_F(ContentOccupancyTest, ThresholdIsStrict) {
    cv::Mat1b frame = whiteFrame();
    frame(0, 0) = static_cast<uchar>(config_.threshold);
    EXPECT_TRUE(ContentOccupancy::contentBounds(frame, config_.threshold).empty());

    frame(0, 0) = static_cast<uchar>(config_.threshold - 1);
    EXPECT_EQ(ContentOccupancy::contentBounds(frame, config_.threshold), cv::Rect(0, 0, 1, 1));
}

TEST_F(ContentOccupancyTest, LastPixelMapsToLastCell) {
    cv::Mat1b frame = whiteFrame();
    frame(209, 119) = 0;

    cv::Mat1d occ = ContentOccupancy::build(frame, kGrid, config_);
    EXPECT_DOUBLE_EQ(occ(20, 11), config_.residual);
    EXPECT_DOUBLE_EQ(cv::sum(occ)[0], kGrid.area() - 1 + config_.residual);
}

TEST_F(ContentOccupancyTest, ResidualIsConfigurable) {
    cv::Mat1b frame = whiteFrame();
    frame.setTo(0);
    config_.residual = 0.0;

    cv::Mat1d occ = ContentOccupancy::build(frame, kGrid, config_);
    EXPECT_DOUBLE_EQ(cv::norm(occ, cv::NORM_INF), 0.0);
}

TEST_F(ContentOccupancyTest, ReadsFrameFromImageFile) {
    const auto path = std::filesystem::temp_directory_path() / "posterheat_occupancy_frame.png";
    cv::Mat1b frame = whiteFrame();
    cv::rectangle(frame, cv::Rect(0, 0, 12, 10), cv::Scalar(0), cv::FILLED);
    ASSERT_TRUE(cv::imwrite(path.string(), frame));

    cv::Mat1d fromFile = ContentOccupancy::fromImageFile(path, kGrid, config_);
    cv::Mat1d direct = ContentOccupancy::build(frame, kGrid, config_);
    std::filesystem::remove(path);

    EXPECT_EQ(cv::norm(fromFile, direct, cv::NORM_INF), 0.0);
    EXPECT_DOUBLE_EQ(fromFile(0, 0), config_.residual);
    EXPECT_DOUBLE_EQ(fromFile(1, 1), 1.0);
}

TEST_F(ContentOccupancyTest, MissingImageThrows) {
    EXPECT_THROW(ContentOccupancy::fromImageFile("/nonexistent/poster.png", kGrid, config_),
                 std::runtime_error);
}
