#pragma once
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace posterheat {

/** One serialized heat line: "<key> v0 v1 ...", key e.g. "title_heat". */
struct HeatLine
{
    std::string key;
    cv::Mat1d   grid;   ///< rows × cols, row-major when flattened
};

/** All heat lines of one document, in category order. */
using HeatmapRow = std::vector<HeatLine>;

} // namespace posterheat
