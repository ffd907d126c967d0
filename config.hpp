#pragma once
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace posterheat {

    /** Target grid resolution (columns × rows). */
    struct GridConfig {
        int cols = 12; ///< heat-map columns (HX)
        int rows = 21; ///< heat-map rows (HY)
    };

    /** Parameters of the Gaussian smoothing stage. */
    struct SmoothingConfig {
        double sigma = 1.0;    ///< blur sigma in grid cells, 0 disables blurring
        double truncate = 4.0; ///< kernel radius in sigmas
    };

    /** How polygon annotations are turned into grid occupancy. */
    enum class PolygonStrategy {
        ExactFill,   ///< pixel-accurate fill + area-average down-sampling
        BoundingBox  ///< cell-vote of the polygon's bounding box
    };

    /** Configuration for the shape rasterizer. */
    struct RasterConfig {
        PolygonStrategy polygonStrategy = PolygonStrategy::ExactFill;
    };

    /** Configuration for content-occupancy inference from a frame image. */
    struct OccupancyConfig {
        int threshold = 240;    ///< gray values >= threshold count as background
        double residual = 0.01; ///< weight of cells covered by content
    };

    /** One category declared in the configuration file. */
    struct CategoryConfig {
        std::string name;                ///< display name, e.g. "Host/organization"
        std::string tag;                 ///< explicit tag (empty = derived from name)
        std::vector<std::string> labels; ///< extra accepted raw labels
    };

    /** Dataset-building options. */
    struct DatasetConfig {
        std::string preset = "layout"; ///< built-in category preset
        std::string systemPrompt;      ///< empty = preset default
        bool bulk = false;             ///< source is one bulk-export JSON file
        bool strict = false;           ///< abort the batch on the first bad document
        std::vector<CategoryConfig> categories; ///< overrides the preset when non-empty
    };

    /** Combined configuration of the heat-map pipeline. */
    struct HeatmapConfig {
        GridConfig gridConfig;           ///< grid resolution
        SmoothingConfig smoothingConfig; ///< blur parameters
        RasterConfig rasterConfig;       ///< rasterizer parameters
        OccupancyConfig occupancyConfig; ///< content-occupancy parameters
        DatasetConfig datasetConfig;     ///< dataset-building options
    };

    /**
     * @brief Fill a HeatmapConfig from a parsed YAML document.
     *
     * Missing keys keep their defaults. Invalid values throw std::runtime_error
     * naming the offending key.
     */
    HeatmapConfig parseConfig(const YAML::Node& root);

    /** Load and parse a YAML configuration file. */
    HeatmapConfig loadConfig(const std::string& path);

    /** Check ranges of an assembled configuration (also after CLI overrides). */
    void validateConfig(const HeatmapConfig& config);

    PolygonStrategy polygonStrategyFromString(const std::string& s);

} // namespace posterheat
