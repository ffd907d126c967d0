#pragma once
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <string>
#include <algorithm>
#include "heatmap/heatrow.hpp"
#include "utils.hpp"

namespace posterheat {

/* одна сетка -> увеличенная цветная картинка (ячейка = cellPx × cellPx) */
inline cv::Mat3b colorizeHeat(const cv::Mat1d& grid,
                              int cellPx = 24,
                              int colormap = cv::COLORMAP_PLASMA)
{
    CV_Assert(!grid.empty() && cellPx > 0);

    /* 1.  [0,1] -> [0,255], без растяжения, чтобы панели были сопоставимы */
    cv::Mat1d clipped;
    cv::min(grid, 1.0, clipped);
    cv::max(clipped, 0.0, clipped);

    cv::Mat color;
    if (!toDisplayable(clipped, color, /*applyColorMap=*/true, colormap))
        throw std::runtime_error("colorizeHeat: grid is not displayable");

    /* 2.  увеличиваем без интерполяции, ячейки остаются квадратами */
    cv::Mat3b big;
    cv::resize(color, big, cv::Size(grid.cols * cellPx, grid.rows * cellPx), 0, 0, cv::INTER_NEAREST);
    return big;
}

/**
 * @brief Tile every heat line of a row into one image with captions.
 *
 * @param row      heat lines (key + grid)
 * @param columns  panels per image row
 * @param cellPx   size of one grid cell in pixels
 */
inline cv::Mat3b renderHeatPanel(const HeatmapRow& row,
                                 int columns = 3,
                                 int cellPx = 24,
                                 int colormap = cv::COLORMAP_PLASMA)
{
    CV_Assert(columns > 0);
    if (row.empty())
        return cv::Mat3b();

    const int captionPx = 22;
    const int gapPx     = 8;
    const cv::Size tile(row.front().grid.cols * cellPx,
                        row.front().grid.rows * cellPx + captionPx);

    const int n    = static_cast<int>(row.size());
    const int cols = std::min(columns, n);
    const int rows = (n + cols - 1) / cols;

    cv::Mat3b canvas(rows * (tile.height + gapPx) + gapPx,
                     cols * (tile.width  + gapPx) + gapPx,
                     cv::Vec3b(40, 40, 40));

    for (int i = 0; i < n; ++i)
    {
        const auto& line = row[i];
        if (line.grid.cols * cellPx != tile.width ||
            line.grid.rows * cellPx + captionPx != tile.height)
            continue;                                   // сетка другого размера

        const cv::Point origin(gapPx + (i % cols) * (tile.width + gapPx),
                               gapPx + (i / cols) * (tile.height + gapPx));

        cv::putText(canvas, line.key, origin + cv::Point(2, captionPx - 6),
                    cv::FONT_HERSHEY_PLAIN, 0.9, {230, 230, 230}, 1, cv::LINE_AA);

        cv::Mat3b heat = colorizeHeat(line.grid, cellPx, colormap);
        heat.copyTo(canvas(cv::Rect(origin.x, origin.y + captionPx, heat.cols, heat.rows)));
    }
    return canvas;
}

} // namespace posterheat
