#pragma once
/*-----------------------------------------------------------------------------
 *  shape.hpp
 *
 *  Geometry of one annotated region in percentage-of-frame coordinates
 *  (0..100, origin top-left) and the document that owns a list of them.
 *---------------------------------------------------------------------------*/
#include <algorithm>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <opencv2/core.hpp>

namespace posterheat {

/**
 * @brief Axis-aligned rectangle, all fields in percent of the frame.
 */
struct Box
{
    double x      = 0.0;  ///< left edge
    double y      = 0.0;  ///< top edge
    double width  = 0.0;  ///< extent to the right
    double height = 0.0;  ///< extent downwards

    double right()  const noexcept { return x + width; }
    double bottom() const noexcept { return y + height; }
};

/**
 * @brief Closed polygon with percentage vertices.
 *
 * frame holds the pixel size of the annotated image (original_width /
 * original_height of the result record) when it is known.
 */
struct Polygon
{
    std::vector<cv::Point2d> points;   ///< (x%, y%) vertices in drawing order
    std::optional<cv::Size>  frame;    ///< source frame in pixels
};

using Shape = std::variant<Box, Polygon>;

/* raw label as exported + its geometry */
struct LabeledShape
{
    std::string label;
    Shape       shape;
};

/**
 * @brief One annotation task after schema normalisation.
 */
struct Document
{
    std::string               id;     ///< task id or file name, for diagnostics
    std::vector<LabeledShape> shapes;
    std::optional<cv::Size>   frame;  ///< first frame size seen in the task
};

/** Bounding box of a polygon, in the same percentage space. */
inline Box boundingBox(const Polygon& poly)
{
    if (poly.points.empty())
        return Box{};

    double x0 = poly.points.front().x, x1 = x0;
    double y0 = poly.points.front().y, y1 = y0;
    for (const auto& p : poly.points)
    {
        x0 = std::min(x0, p.x);  x1 = std::max(x1, p.x);
        y0 = std::min(y0, p.y);  y1 = std::max(y1, p.y);
    }
    return Box{x0, y0, x1 - x0, y1 - y0};
}

} // namespace posterheat
