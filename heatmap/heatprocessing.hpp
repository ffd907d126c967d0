#ifndef POSTERHEAT_HEATPROCESSING_H
#define POSTERHEAT_HEATPROCESSING_H

#include <opencv2/core.hpp>
#include "../config.hpp"

namespace posterheat {

/**
 * @brief Smoothing, normalisation and quantisation of heat grids.
 *
 * All functions take a CV_64F grid and return a new one; the input is left
 * untouched.
 */
class HeatProcessing {
public:
    /** Isotropic Gaussian blur, sigma in grid cells; sigma == 0 returns a copy. */
    static cv::Mat1d smooth(const cv::Mat1d& grid, double sigma, double truncate = 4.0);

    /** Divide by the maximum so it becomes exactly 1.0; all-zero grids stay zero. */
    static cv::Mat1d normalize(const cv::Mat1d& grid);

    /** Round each cell to one decimal (half to even), clamped to [0,1]. */
    static cv::Mat1d quantize(const cv::Mat1d& grid);

    /** smooth -> normalize -> quantize. */
    static cv::Mat1d finalize(const cv::Mat1d& grid, const SmoothingConfig& config);
};

} // namespace posterheat

#endif // POSTERHEAT_HEATPROCESSING_H
