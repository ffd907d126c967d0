#ifndef POSTERHEAT_AGGREGATOR_H
#define POSTERHEAT_AGGREGATOR_H

#include <map>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "heatrow.hpp"

namespace posterheat {

/**
 * @brief Per-document union of shape contributions.
 */
class HeatAggregator {
public:
    /** acc = max(acc, contribution), element-wise. Sizes must match. */
    static void unionInto(cv::Mat1d& acc, const cv::Mat1d& contribution);
};

/**
 * @brief Cross-document mean of heat grids, keyed by heat line key.
 *
 * Only for inspection tooling: sums grids element-wise, counts documents and
 * divides at the end. Keys keep their first-seen order.
 */
class HeatAccumulator {
public:
    explicit HeatAccumulator(cv::Size gridSize);

    /** Add every line of one document and count the document once. */
    void addDocument(const HeatmapRow& row);

    /** Add one grid to the running sum of key (does not count a document). */
    void add(const std::string& key, const cv::Mat1d& grid);

    /** Count one more document without adding grids. */
    void countDocument() { ++count_; }

    /** Fold another accumulator in: sums add up, counts add up. */
    void merge(const HeatAccumulator& other);

    /** Mean grid of key (zero grid for unknown keys); sum / max(count, 1). */
    cv::Mat1d mean(const std::string& key) const;

    /** Running sum of key (zero grid for unknown keys). */
    cv::Mat1d sum(const std::string& key) const;

    /** All means in key order. */
    HeatmapRow means() const;

    const std::vector<std::string>& keys() const { return order_; }
    std::size_t documentCount() const { return count_; }
    cv::Size gridSize() const { return gridSize_; }

private:
    cv::Size                         gridSize_;
    std::map<std::string, cv::Mat1d> sums_;
    std::vector<std::string>         order_;
    std::size_t                      count_{0};
};

} // namespace posterheat

#endif // POSTERHEAT_AGGREGATOR_H
