#include "heatprocessing.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <opencv2/imgproc.hpp>
#include "../utils.hpp"

namespace posterheat {

cv::Mat1d HeatProcessing::smooth(const cv::Mat1d& grid, double sigma, double truncate)
{
    if (sigma < 0.0)
        throw std::invalid_argument("HeatProcessing::smooth(): negative sigma");
    if (sigma == 0.0 || grid.empty())
        return grid.clone();

    // BORDER_REFLECT = (d c b a | a b c d), то же, что mode='reflect' в scipy
    const int ksize = getKernelSize(sigma, truncate);
    cv::Mat1d blurred;
    cv::GaussianBlur(grid, blurred, cv::Size(ksize, ksize), sigma, sigma, cv::BORDER_REFLECT);
    return blurred;
}

cv::Mat1d HeatProcessing::normalize(const cv::Mat1d& grid)
{
    cv::Mat1d out = grid.clone();
    if (grid.empty())
        return out;

    double minVal, maxVal;
    cv::minMaxLoc(grid, &minVal, &maxVal);
    if (maxVal > 0.0)
        out /= maxVal;
    return out;
}

cv::Mat1d HeatProcessing::quantize(const cv::Mat1d& grid)
{
    cv::Mat1d out(grid.size());
    for (int y = 0; y < grid.rows; ++y)
    {
        const double* src = grid[y];
        double*       dst = out[y];
        for (int x = 0; x < grid.cols; ++x)
        {
            // nearbyint: округление к чётному, как np.round
            const double q = std::nearbyint(src[x] * 10.0) / 10.0;
            dst[x] = std::clamp(q, 0.0, 1.0) + 0.0;   // + 0.0 убирает -0.0
        }
    }
    return out;
}

cv::Mat1d HeatProcessing::finalize(const cv::Mat1d& grid, const SmoothingConfig& config)
{
    return quantize(normalize(smooth(grid, config.sigma, config.truncate)));
}

} // namespace posterheat
