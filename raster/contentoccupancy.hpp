#ifndef POSTERHEAT_CONTENTOCCUPANCY_H
#define POSTERHEAT_CONTENTOCCUPANCY_H

#include <filesystem>
#include <opencv2/core.hpp>
#include "../config.hpp"

namespace posterheat {

/**
 * @brief Frame-level free-space prior derived from pixel intensity.
 *
 * Pixels darker than the threshold are content. The grid cells covered by
 * the bounding box of all content pixels get a small residual weight, every
 * other cell is free (1.0). A blank frame is free everywhere.
 */
class ContentOccupancy {
public:
    /**
     * @param gray      8-bit single channel frame
     * @param gridSize  target grid (cols × rows)
     * @param config    threshold and residual weight
     * @return          CV_64F grid of gridSize
     */
    static cv::Mat1d build(const cv::Mat1b& gray, cv::Size gridSize, const OccupancyConfig& config);

    /** Load a frame image as grayscale and build its occupancy grid. */
    static cv::Mat1d fromImageFile(const std::filesystem::path& path,
                                   cv::Size gridSize,
                                   const OccupancyConfig& config);

    /** Bounding box of content pixels, empty rect when there are none. */
    static cv::Rect contentBounds(const cv::Mat1b& gray, int threshold);
};

} // namespace posterheat

#endif // POSTERHEAT_CONTENTOCCUPANCY_H
