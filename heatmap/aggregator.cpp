#include "aggregator.hpp"

#include <algorithm>
#include <stdexcept>
#include "../utils.hpp"

namespace posterheat {

void HeatAggregator::unionInto(cv::Mat1d& acc, const cv::Mat1d& contribution)
{
    requireSameGrid(acc, contribution, "HeatAggregator");
    cv::max(acc, contribution, acc);    // объединение голосов, не сумма
}

HeatAccumulator::HeatAccumulator(cv::Size gridSize)
    : gridSize_(gridSize)
{
    if (gridSize_.width <= 0 || gridSize_.height <= 0)
        throw std::invalid_argument("HeatAccumulator: grid size must be positive");
}

void HeatAccumulator::add(const std::string& key, const cv::Mat1d& grid)
{
    // проверяем до вставки, чтобы не оставить пустой ключ
    cv::Mat1d zero = cv::Mat1d::zeros(gridSize_);
    requireSameGrid(zero, grid, "HeatAccumulator");

    auto it = sums_.find(key);
    if (it == sums_.end())
    {
        it = sums_.emplace(key, zero).first;
        order_.push_back(key);
    }
    it->second += grid;
}

void HeatAccumulator::addDocument(const HeatmapRow& row)
{
    const cv::Mat1d zero = cv::Mat1d::zeros(gridSize_);
    for (const auto& line : row)
        requireSameGrid(zero, line.grid, "HeatAccumulator");

    for (const auto& line : row)
        add(line.key, line.grid);
    ++count_;
}

void HeatAccumulator::merge(const HeatAccumulator& other)
{
    if (other.gridSize_ != gridSize_)
        throw std::invalid_argument("HeatAccumulator::merge(): grid sizes differ");

    for (const auto& key : other.order_)
        add(key, other.sums_.at(key));
    count_ += other.count_;
}

cv::Mat1d HeatAccumulator::sum(const std::string& key) const
{
    auto it = sums_.find(key);
    return it == sums_.end() ? cv::Mat1d(cv::Mat1d::zeros(gridSize_)) : cv::Mat1d(it->second.clone());
}

cv::Mat1d HeatAccumulator::mean(const std::string& key) const
{
    cv::Mat1d m = sum(key);
    m /= static_cast<double>(std::max<std::size_t>(count_, 1));
    return m;
}

HeatmapRow HeatAccumulator::means() const
{
    HeatmapRow out;
    out.reserve(order_.size());
    for (const auto& key : order_)
        out.push_back({key, mean(key)});
    return out;
}

} // namespace posterheat
