/**
 * @file test_visualization.cpp
 * @brief Unit tests for heat panel rendering
 */

#include "visualization.hpp"

#include <gtest/gtest.h>

using namespace posterheat;

TEST(VisualizationTest, ColorizeUpscalesEveryCell) {
    cv::Mat1d g = cv::Mat1d::zeros(cv::Size(12, 21));
    g(0, 0) = 1.0;

    cv::Mat3b img = colorizeHeat(g, 10);
    ASSERT_EQ(img.size(), cv::Size(120, 210));
    EXPECT_EQ(img(0, 0), img(9, 9));
    EXPECT_NE(img(0, 0), img(0, 10));
}

TEST(VisualizationTest, OutOfRangeValuesAreClipped) {
    cv::Mat1d hot = (cv::Mat1d(1, 2) << 1.0, 7.5);
    cv::Mat3b img = colorizeHeat(hot, 1);
    EXPECT_EQ(img(0, 0), img(0, 1));
}

TEST(VisualizationTest, PanelTilesAllLines) {
    HeatmapRow row{{"title_heat", cv::Mat1d::zeros(cv::Size(12, 21))},
                   {"time_heat", cv::Mat1d(cv::Size(12, 21), 1.0)}};

    cv::Mat3b panel = renderHeatPanel(row, 3, 24);
    // две плитки 288×(504+22) с отступами по 8 пикселей
    EXPECT_EQ(panel.size(), cv::Size(2 * (288 + 8) + 8, 1 * (526 + 8) + 8));
}

TEST(VisualizationTest, EmptyRowRendersNothing) {
    EXPECT_TRUE(renderHeatPanel({}).empty());
}
