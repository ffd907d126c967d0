#ifndef POSTERHEAT_UTILS_H
#define POSTERHEAT_UTILS_H

#include <stdexcept>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <sstream>
#include <string>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace posterheat {

// Загрузка кадра в оттенках серого (uint8).
static cv::Mat1b loadGrayImage(const std::filesystem::path& path) {
    cv::Mat img = cv::imread(path.string(), cv::IMREAD_GRAYSCALE);
    if (img.empty()) {
        throw std::runtime_error("Could not load image: " + path.string());
    }
    return img;
}

// Размер ядра Гаусса по sigma: радиус int(truncate*sigma + 0.5), как в scipy.ndimage.
static int getKernelSize(double sigma, double truncate = 4.0) {
    const int radius = static_cast<int>(truncate * sigma + 0.5);
    return 2 * radius + 1;
}

// Индекс ячейки сетки, ограниченный диапазоном [0, dimension-1].
static inline int clampIndex(int idx, int dimension) {
    return std::clamp(idx, 0, dimension - 1);
}

/// Читаемый вывод cv::Mat::type()
static std::string matTypeStr(int t)
{
    const int depth = t & CV_MAT_DEPTH_MASK;
    const int chans = 1 + (t >> CV_CN_SHIFT);

    const char* depthStr =
        depth == CV_8U  ? "CV_8U"  :
        depth == CV_8S  ? "CV_8S"  :
        depth == CV_16U ? "CV_16U" :
        depth == CV_16S ? "CV_16S" :
        depth == CV_32S ? "CV_32S" :
        depth == CV_32F ? "CV_32F" :
        depth == CV_64F ? "CV_64F" : "UNKNOWN";

    std::ostringstream oss;
    oss << depthStr << 'C' << chans;
    return oss.str();
}

/**
 * @brief   Проверить, что сетка совпадает по размеру и типу с эталонной.
 * @throws  std::invalid_argument с описанием обеих матриц.
 */
static void requireSameGrid(const cv::Mat& expected, const cv::Mat& actual, const char* where)
{
    if (expected.size() == actual.size() && expected.type() == actual.type())
        return;

    std::ostringstream oss;
    oss << "[" << where << "] grid mismatch: expected "
        << expected.cols << 'x' << expected.rows << ' ' << matTypeStr(expected.type())
        << ", got " << actual.cols << 'x' << actual.rows << ' ' << matTypeStr(actual.type());
    throw std::invalid_argument(oss.str());
}

/**
 *  Конвертирует произвольный cv::Mat -> CV_8U, 1 или 3 канала.
 *
 *  @param  src             одноканальная матрица любой глубины
 *  @param  applyColorMap   true  => применяем цветовую карту colormap
 *  @param  dst             результат, готовый для imwrite(...)
 *  @param  fixedRange      true  => [0,1] -> [0,255] без растяжения по min/max
 */
static inline bool toDisplayable(const cv::Mat& src,
                                 cv::Mat&       dst,
                                 bool           applyColorMap = false,
                                 int            colormap = cv::COLORMAP_PLASMA,
                                 bool           fixedRange = true)
{
    if(src.empty())
        return false;

    cv::Mat tmp;

    /* ---------- приведём глубину к 8‑бит -------------------------------- */
    if (src.depth() == CV_8U) {
        tmp = src;
    } else if (fixedRange) {
        src.convertTo(tmp, CV_8U, 255.0);
    } else {
        double minVal, maxVal;
        cv::minMaxLoc(src, &minVal, &maxVal);
        if (maxVal - minVal < 1e-12) maxVal = minVal + 1.0; // защита

        double scale = 255.0 / (maxVal - minVal);
        double shift = -minVal * scale;
        src.convertTo(tmp, CV_8U, scale, shift);
    }

    if (tmp.channels() != 1)
        return false;

    if (applyColorMap)
        cv::applyColorMap(tmp, dst, colormap);   // CV_8UC3
    else
        dst = tmp;
    return true;
}

} // namespace posterheat

#endif // POSTERHEAT_UTILS_H
