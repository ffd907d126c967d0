#include "pipeline.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include "heatprocessing.hpp"
#include "rowcodec.hpp"

namespace posterheat {

HeatmapPipeline::HeatmapPipeline(HeatmapConfig config, CategoryRegistry registry)
    : config_(std::move(config)),
      registry_(std::move(registry)),
      rasterizer_(cv::Size(config_.gridConfig.cols, config_.gridConfig.rows), config_.rasterConfig)
{
    validateConfig(config_);
    if (registry_.empty())
        throw std::invalid_argument("HeatmapPipeline: empty category set");
}

cv::Size HeatmapPipeline::gridSize() const
{
    return rasterizer_.gridSize();
}

std::string HeatmapPipeline::systemPrompt() const
{
    if (!config_.datasetConfig.systemPrompt.empty())
        return config_.datasetConfig.systemPrompt;
    return CategoryRegistry::defaultSystemPrompt(config_.datasetConfig.preset);
}

HeatmapRow HeatmapPipeline::rasterizeDocument(const Document& doc) const
{
    /* 1. пустая сетка на каждую категорию, в порядке реестра */
    HeatmapRow row;
    std::unordered_map<const CategoryInfo*, std::size_t> slot;
    for (const CategoryInfo* c : registry_.categories())
    {
        slot[c] = row.size();
        row.push_back({c->heatKey(), cv::Mat1d::zeros(gridSize())});
    }

    /* 2. каждая фигура -> вклад, объединение по максимуму */
    for (const auto& ls : doc.shapes)
    {
        const CategoryInfo* category = registry_.canonicalize(ls.label);
        if (!category)
            continue;                               // чужая метка, пропускаем

        std::optional<cv::Mat1d> contribution = rasterizer_.rasterize(ls.shape, doc.frame);
        if (!contribution)
        {
            std::cerr << "[HeatmapPipeline] task '" << doc.id << "': polygon '" << ls.label
                      << "' has no original_width/original_height, skipped\n";
            continue;
        }
        HeatAggregator::unionInto(row[slot.at(category)].grid, *contribution);
    }
    return row;
}

HeatmapRow HeatmapPipeline::process(const Document& doc) const
{
    HeatmapRow row = rasterizeDocument(doc);
    for (auto& line : row)
        line.grid = HeatProcessing::finalize(line.grid, config_.smoothingConfig);
    return row;
}

LabelFilter HeatmapPipeline::labelFilter() const
{
    return [this](const std::string& label) { return registry_.canonicalize(label) != nullptr; };
}

HeatmapRow HeatmapPipeline::process(const nlohmann::json& task, const std::string& id) const
{
    return process(SchemaReader::readDocument(task, id, labelFilter()));
}

std::string HeatmapPipeline::userBlock(const nlohmann::json& task, const std::string& id) const
{
    return RowCodec::formatUserBlock(process(task, id));
}

std::string HeatmapPipeline::recordLine(const nlohmann::json& task, const std::string& id) const
{
    return RowCodec::dumpRecord(RowCodec::makeRecord(systemPrompt(), userBlock(task, id)));
}

BuildStats HeatmapPipeline::buildDataset(const std::vector<TaskEntry>& tasks, std::ostream& out) const
{
    BuildStats stats;
    for (const auto& entry : tasks)
    {
        std::string line;
        try {
            line = recordLine(entry.task, entry.origin);
        } catch (const SchemaError& e) {
            if (config_.datasetConfig.strict)
                throw;
            std::cerr << "[HeatmapPipeline] skipping " << entry.origin << ": " << e.what() << "\n";
            ++stats.skipped;
            continue;
        }
        out << line << '\n';
        ++stats.written;
    }
    return stats;
}

HeatAccumulator HeatmapPipeline::makeAccumulator() const
{
    HeatAccumulator acc(gridSize());
    for (const CategoryInfo* c : registry_.categories())
        acc.add(c->heatKey(), cv::Mat1d::zeros(gridSize()));
    return acc;
}

HeatAccumulator HeatmapPipeline::aggregateDocuments(const std::vector<TaskEntry>& tasks) const
{
    HeatAccumulator acc = makeAccumulator();
    for (const auto& entry : tasks)
    {
        try {
            acc.addDocument(rasterizeDocument(
                SchemaReader::readDocument(entry.task, entry.origin, labelFilter())));
        } catch (const SchemaError& e) {
            std::cerr << "[HeatmapPipeline] skipping " << entry.origin << ": " << e.what() << "\n";
        }
    }
    return acc;
}

HeatmapRow HeatmapPipeline::alignToRegistry(const HeatmapRow& parsed) const
{
    static const std::string kSuffix = "_heat";

    HeatmapRow row;
    std::unordered_map<const CategoryInfo*, std::size_t> slot;
    for (const CategoryInfo* c : registry_.categories())
    {
        slot[c] = row.size();
        row.push_back({c->heatKey(), cv::Mat1d::zeros(gridSize())});
    }

    for (const auto& line : parsed)
    {
        if (line.key.size() <= kSuffix.size() ||
            line.key.compare(line.key.size() - kSuffix.size(), kSuffix.size(), kSuffix) != 0)
            continue;
        const CategoryInfo* category = registry_.byTag(line.key.substr(0, line.key.size() - kSuffix.size()));
        if (!category || line.grid.size() != gridSize())
            continue;                               // тег не из набора категорий
        row[slot.at(category)].grid = line.grid.clone();
    }
    return row;
}

HeatAccumulator HeatmapPipeline::aggregateRecords(std::istream& jsonl) const
{
    HeatAccumulator acc = makeAccumulator();
    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(jsonl, line))
    {
        ++lineNo;
        if (line.find_first_not_of(" \t\r\n") == std::string::npos)
            continue;

        nlohmann::json record;
        try {
            record = nlohmann::json::parse(line);
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "[HeatmapPipeline] line " << lineNo << ": " << e.what() << "\n";
            continue;
        }
        const std::optional<std::string> user = RowCodec::userContent(record);
        if (!user)
        {
            std::cerr << "[HeatmapPipeline] line " << lineNo << ": no user turn\n";
            continue;
        }
        acc.addDocument(alignToRegistry(RowCodec::parseUserBlock(*user, gridSize())));
    }
    return acc;
}

} // namespace posterheat
