#ifndef POSTERHEAT_PIPELINE_H
#define POSTERHEAT_PIPELINE_H

#include <istream>
#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../annotation/categoryregistry.h"
#include "../annotation/schemareader.hpp"
#include "../annotation/tasksource.hpp"
#include "../raster/rasterizer.hpp"
#include "../config.hpp"
#include "aggregator.hpp"
#include "heatrow.hpp"

namespace posterheat {

/** Counters of one dataset build. */
struct BuildStats
{
    std::size_t written = 0;  ///< rows written
    std::size_t skipped = 0;  ///< documents rejected with SchemaError
};

/**
 * @brief Heat-map pipeline orchestrating all stages for one run.
 *
 * Schema normalisation -> label canonicalisation -> rasterization -> union
 * per category -> smoothing/normalisation/quantisation -> row emission.
 * The object holds only configuration; every call is independent.
 */
class HeatmapPipeline {
public:
    HeatmapPipeline(HeatmapConfig config, CategoryRegistry registry);

    /**
     * Raw (unsmoothed) per-category grids of one document, in registry order.
     * Categories without shapes get an all-zero grid.
     */
    HeatmapRow rasterizeDocument(const Document& doc) const;

    /** Final quantized heat row of a document. */
    HeatmapRow process(const Document& doc) const;

    /**
     * Final heat row of a decoded task.
     * @throws SchemaError if the task has no result list or bad geometry.
     */
    HeatmapRow process(const nlohmann::json& task, const std::string& id = "") const;

    /** User block of the training record for a task. */
    std::string userBlock(const nlohmann::json& task, const std::string& id = "") const;

    /** One JSONL line (without newline) for a task. */
    std::string recordLine(const nlohmann::json& task, const std::string& id = "") const;

    /**
     * Write one JSONL record per task, in input order.
     *
     * Documents failing with SchemaError are reported on std::cerr and skipped,
     * unless the configuration is strict, in which case the error propagates.
     */
    BuildStats buildDataset(const std::vector<TaskEntry>& tasks, std::ostream& out) const;

    /**
     * Mean of the raw per-document grids over all readable tasks.
     * Documents failing with SchemaError are skipped and not counted.
     */
    HeatAccumulator aggregateDocuments(const std::vector<TaskEntry>& tasks) const;

    /**
     * Mean of the heat lines of an existing JSONL dataset.
     *
     * Every record with a user turn counts as one document. Lines whose key
     * is not "<tag>_heat" of a registry category are ignored; a category
     * missing from a record contributes zeros. Unparsable lines are reported
     * on std::cerr and skipped.
     */
    HeatAccumulator aggregateRecords(std::istream& jsonl) const;

    /** Parsed heat lines reordered to the registry: unknown keys dropped, missing ones zero. */
    HeatmapRow alignToRegistry(const HeatmapRow& parsed) const;

    /** Grid size (cols × rows) from the configuration. */
    cv::Size gridSize() const;

    /** System prompt of the records: configured one or the preset default. */
    std::string systemPrompt() const;

    const HeatmapConfig&    config()   const { return config_; }
    const CategoryRegistry& registry() const { return registry_; }

private:
    /** Accumulator with every category key registered in registry order. */
    HeatAccumulator makeAccumulator() const;

    /** Label filter: accepts the labels of the active category set. */
    LabelFilter labelFilter() const;

    HeatmapConfig    config_;
    CategoryRegistry registry_;
    Rasterizer       rasterizer_;
};

} // namespace posterheat

#endif // POSTERHEAT_PIPELINE_H
