#include "contentoccupancy.hpp"

#include <vector>
#include <opencv2/imgproc.hpp>
#include "../utils.hpp"

namespace posterheat {

cv::Rect ContentOccupancy::contentBounds(const cv::Mat1b& gray, int threshold)
{
    CV_Assert(!gray.empty() && gray.type() == CV_8UC1);

    // контент = всё, что темнее порога (фон постера почти белый)
    cv::Mat1b content;
    cv::compare(gray, cv::Scalar(threshold), content, cv::CMP_LT);

    std::vector<cv::Point> pts;
    cv::findNonZero(content, pts);
    if (pts.empty())
        return cv::Rect();
    return cv::boundingRect(pts);
}

cv::Mat1d ContentOccupancy::build(const cv::Mat1b& gray, cv::Size gridSize, const OccupancyConfig& config)
{
    CV_Assert(gridSize.width > 0 && gridSize.height > 0);

    cv::Mat1d occ(gridSize, 1.0);
    const cv::Rect bounds = contentBounds(gray, config.threshold);
    if (bounds.empty())
        return occ;                             // пустой кадр: всё свободно

    /* координаты крайних пикселей контента (включительно) -> ячейки */
    const int W = gray.cols, H = gray.rows;
    const int x0 = bounds.x, x1 = bounds.x + bounds.width - 1;
    const int y0 = bounds.y, y1 = bounds.y + bounds.height - 1;

    const int gx0 = clampIndex(static_cast<int>(static_cast<double>(x0) / W * gridSize.width),  gridSize.width);
    const int gx1 = clampIndex(static_cast<int>(static_cast<double>(x1) / W * gridSize.width),  gridSize.width);
    const int gy0 = clampIndex(static_cast<int>(static_cast<double>(y0) / H * gridSize.height), gridSize.height);
    const int gy1 = clampIndex(static_cast<int>(static_cast<double>(y1) / H * gridSize.height), gridSize.height);

    occ(cv::Range(gy0, gy1 + 1), cv::Range(gx0, gx1 + 1)).setTo(config.residual);
    return occ;
}

cv::Mat1d ContentOccupancy::fromImageFile(const std::filesystem::path& path,
                                          cv::Size gridSize,
                                          const OccupancyConfig& config)
{
    return build(loadGrayImage(path), gridSize, config);
}

} // namespace posterheat
