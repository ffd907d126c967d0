#ifndef POSTERHEAT_RASTERIZER_H
#define POSTERHEAT_RASTERIZER_H

#include <optional>
#include <opencv2/core.hpp>
#include "../annotation/shape.hpp"
#include "../config.hpp"

namespace posterheat {

/**
 * @brief Turns one percentage-space shape into an occupancy contribution on
 *        the target grid.
 *
 * Boxes are cell-voted (binary, inclusive floor ranges). Polygons are either
 * filled at native pixel resolution and area-averaged down to the grid, or
 * reduced to their bounding box and cell-voted, depending on RasterConfig.
 * The two strategies deliberately keep their own edge semantics.
 */
class Rasterizer {
public:
    Rasterizer(cv::Size gridSize, RasterConfig config);

    /**
     * Rasterize a shape onto a fresh zero grid.
     *
     * @param shape          box or polygon in percent
     * @param fallbackFrame  document frame used when a polygon carries none
     * @return               CV_64F grid of gridSize, or std::nullopt when an
     *                       exact-fill polygon has no known pixel frame
     */
    std::optional<cv::Mat1d> rasterize(const Shape& shape,
                                       const std::optional<cv::Size>& fallbackFrame = std::nullopt) const;

    cv::Size gridSize() const { return gridSize_; }

    /** Grid index of a percentage coordinate: floor(pct / (100/dimension)), clamped. */
    static int cellIndex(double pct, int dimension);

    /** Cell-vote: mark [gx0,gx1]×[gy0,gy1] (inclusive) with 1.0. */
    static cv::Mat1d cellVote(const Box& box, cv::Size gridSize);

    /** Exact-fill: pixel mask of the polygon, area-averaged to the grid. */
    static cv::Mat1d exactFill(const Polygon& poly, cv::Size frame, cv::Size gridSize);

    /**
     * Polygon mask at frame resolution (CV_8U, 1 inside, 0 outside): a pixel
     * is set exactly when its centre lies inside the polygon (even-odd rule).
     */
    static cv::Mat1b fillMask(const Polygon& poly, cv::Size frame);

    /**
     * Down-sample a mask: every cell is the mean of the source pixels whose
     * centre lies inside the cell footprint. Cells without any pixel centre
     * (source smaller than the grid) take the nearest pixel.
     */
    static cv::Mat1d downsampleMean(const cv::Mat1b& mask, cv::Size gridSize);

private:
    cv::Size     gridSize_;
    RasterConfig config_;
};

} // namespace posterheat

#endif // POSTERHEAT_RASTERIZER_H
