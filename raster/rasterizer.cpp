#include "rasterizer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <type_traits>
#include <vector>
#include "../utils.hpp"

namespace posterheat {

namespace {

// Диапазон пиксельных индексов, центры которых попадают в [a, b).
std::pair<int, int> centreRange(int cell, int cells, int pixels)
{
    const double a = static_cast<double>(cell)     * pixels / cells;
    const double b = static_cast<double>(cell + 1) * pixels / cells;
    int first = static_cast<int>(std::ceil(a - 0.5));
    int last  = static_cast<int>(std::ceil(b - 0.5));   // exclusive
    first = std::clamp(first, 0, pixels);
    last  = std::clamp(last,  0, pixels);
    if (first >= last)
    {
        // ячейка меньше пикселя: берём ближайший
        const int nearest = clampIndex(static_cast<int>(std::floor((cell + 0.5) * pixels / cells)), pixels);
        return {nearest, nearest + 1};
    }
    return {first, last};
}

} // namespace

Rasterizer::Rasterizer(cv::Size gridSize, RasterConfig config)
    : gridSize_(gridSize), config_(config)
{
    if (gridSize_.width <= 0 || gridSize_.height <= 0)
        throw std::invalid_argument("Rasterizer: grid size must be positive");
}

int Rasterizer::cellIndex(double pct, int dimension)
{
    const double cell = std::floor(pct / (100.0 / dimension));
    if (!(cell > 0.0))                 // также ловит NaN
        return 0;
    if (cell >= dimension - 1)
        return dimension - 1;
    return static_cast<int>(cell);
}

cv::Mat1d Rasterizer::cellVote(const Box& box, cv::Size gridSize)
{
    cv::Mat1d grid = cv::Mat1d::zeros(gridSize);

    int gx0 = cellIndex(box.x,        gridSize.width);
    int gx1 = cellIndex(box.right(),  gridSize.width);
    int gy0 = cellIndex(box.y,        gridSize.height);
    int gy1 = cellIndex(box.bottom(), gridSize.height);
    if (gx0 > gx1) std::swap(gx0, gx1);   // отрицательная ширина
    if (gy0 > gy1) std::swap(gy0, gy1);

    grid(cv::Range(gy0, gy1 + 1), cv::Range(gx0, gx1 + 1)).setTo(1.0);
    return grid;
}

cv::Mat1b Rasterizer::fillMask(const Polygon& poly, cv::Size frame)
{
    CV_Assert(frame.width > 0 && frame.height > 0);
    cv::Mat1b mask = cv::Mat1b::zeros(frame);
    if (poly.points.size() < 3)
        return mask;

    /* проценты -> пиксели; пиксель i занимает [i, i+1), центр в i + 0.5 */
    std::vector<cv::Point2d> pts;
    pts.reserve(poly.points.size());
    for (const auto& p : poly.points)
    {
        const double px = std::clamp(p.x / 100.0 * frame.width,  -1.0 * frame.width,  2.0 * frame.width);
        const double py = std::clamp(p.y / 100.0 * frame.height, -1.0 * frame.height, 2.0 * frame.height);
        pts.emplace_back(px, py);
    }

    /* scanline по центрам пикселей, правило чёт-нечет:
     * пиксель закрашен тогда и только тогда, когда его центр внутри полигона */
    std::vector<double> xs;
    const std::size_t n = pts.size();
    for (int y = 0; y < frame.height; ++y)
    {
        const double yc = y + 0.5;
        xs.clear();
        for (std::size_t i = 0; i < n; ++i)
        {
            const cv::Point2d& a = pts[i];
            const cv::Point2d& b = pts[(i + 1) % n];
            if ((a.y <= yc) == (b.y <= yc))
                continue;                           // ребро не пересекает строку
            xs.push_back(a.x + (yc - a.y) * (b.x - a.x) / (b.y - a.y));
        }
        std::sort(xs.begin(), xs.end());

        uchar* row = mask[y];
        for (std::size_t k = 0; k + 1 < xs.size(); k += 2)
        {
            // центры i + 0.5 в [xs[k], xs[k+1])
            const int first = std::clamp(static_cast<int>(std::ceil(xs[k] - 0.5)),     0, frame.width);
            const int last  = std::clamp(static_cast<int>(std::ceil(xs[k + 1] - 0.5)), 0, frame.width);
            if (first < last)
                std::fill(row + first, row + last, uchar(1));
        }
    }
    return mask;
}

cv::Mat1d Rasterizer::downsampleMean(const cv::Mat1b& mask, cv::Size gridSize)
{
    CV_Assert(!mask.empty() && mask.type() == CV_8UC1);

    cv::Mat1d grid(gridSize, 0.0);
    for (int gy = 0; gy < gridSize.height; ++gy)
    {
        const auto [y0, y1] = centreRange(gy, gridSize.height, mask.rows);
        for (int gx = 0; gx < gridSize.width; ++gx)
        {
            const auto [x0, x1] = centreRange(gx, gridSize.width, mask.cols);
            const cv::Rect footprint(x0, y0, x1 - x0, y1 - y0);
            grid(gy, gx) = cv::mean(mask(footprint))[0];
        }
    }
    return grid;
}

cv::Mat1d Rasterizer::exactFill(const Polygon& poly, cv::Size frame, cv::Size gridSize)
{
    return downsampleMean(fillMask(poly, frame), gridSize);
}

std::optional<cv::Mat1d> Rasterizer::rasterize(const Shape& shape,
                                               const std::optional<cv::Size>& fallbackFrame) const
{
    return std::visit([&](const auto& s) -> std::optional<cv::Mat1d> {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Box>)
        {
            return cellVote(s, gridSize_);
        }
        else
        {
            if (config_.polygonStrategy == PolygonStrategy::BoundingBox)
                return cellVote(boundingBox(s), gridSize_);

            const std::optional<cv::Size> frame = s.frame ? s.frame : fallbackFrame;
            if (!frame)
                return std::nullopt;
            return exactFill(s, *frame, gridSize_);
        }
    }, shape);
}

} // namespace posterheat
