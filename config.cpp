#include "config.hpp"
#include <stdexcept>

namespace posterheat {

namespace {

template <typename T>
void readOrDefault(const YAML::Node& node, const char* key, T& out)
{
    const YAML::Node child = node[key];
    if (!child)
        return;
    try {
        out = child.as<T>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("config: bad value for '") + key + "': " + e.what());
    }
}

std::vector<CategoryConfig> parseCategories(const YAML::Node& node)
{
    /* categories:
     *   Title: {}
     *   Image/Deco: { tag: image_deco, labels: [image, decoration] } */
    if (!node.IsMap())
        throw std::runtime_error("config: 'categories' must be a map");

    std::vector<CategoryConfig> out;
    for (const auto& kv : node)
    {
        CategoryConfig c;
        c.name = kv.first.as<std::string>();
        const YAML::Node body = kv.second;
        if (body && body.IsMap())
        {
            readOrDefault(body, "tag", c.tag);
            readOrDefault(body, "labels", c.labels);
        }
        out.push_back(std::move(c));
    }
    return out;
}

} // namespace

PolygonStrategy polygonStrategyFromString(const std::string& s)
{
    if (s == "exact_fill")
        return PolygonStrategy::ExactFill;
    if (s == "bounding_box")
        return PolygonStrategy::BoundingBox;
    throw std::runtime_error("config: unknown raster.polygon_strategy '" + s + "'");
}

void validateConfig(const HeatmapConfig& config)
{
    if (config.gridConfig.cols <= 0 || config.gridConfig.rows <= 0)
        throw std::runtime_error("config: grid.cols and grid.rows must be positive");
    if (config.smoothingConfig.sigma < 0.0)
        throw std::runtime_error("config: smoothing.sigma must not be negative");
    if (config.smoothingConfig.truncate <= 0.0)
        throw std::runtime_error("config: smoothing.truncate must be positive");
    if (config.occupancyConfig.threshold < 0 || config.occupancyConfig.threshold > 256)
        throw std::runtime_error("config: occupancy.threshold must be in [0,256]");
    if (config.occupancyConfig.residual < 0.0 || config.occupancyConfig.residual > 1.0)
        throw std::runtime_error("config: occupancy.residual must be in [0,1]");

    const std::string& preset = config.datasetConfig.preset;
    if (config.datasetConfig.categories.empty() &&
        preset != "layout" && preset != "image_deco" && preset != "image_deco_merged")
        throw std::runtime_error("config: unknown dataset.preset '" + preset + "'");
}

HeatmapConfig parseConfig(const YAML::Node& root)
{
    HeatmapConfig config;
    if (!root || root.IsNull())
        return config;
    if (!root.IsMap())
        throw std::runtime_error("config: top level must be a map");

    if (root["grid"])
    {
        auto gridNode = root["grid"];
        readOrDefault(gridNode, "cols", config.gridConfig.cols);
        readOrDefault(gridNode, "rows", config.gridConfig.rows);
    }
    if (root["smoothing"])
    {
        auto smoothNode = root["smoothing"];
        readOrDefault(smoothNode, "sigma", config.smoothingConfig.sigma);
        readOrDefault(smoothNode, "truncate", config.smoothingConfig.truncate);
    }
    if (root["raster"])
    {
        std::string strategy = "exact_fill";
        readOrDefault(root["raster"], "polygon_strategy", strategy);
        config.rasterConfig.polygonStrategy = polygonStrategyFromString(strategy);
    }
    if (root["occupancy"])
    {
        auto occNode = root["occupancy"];
        readOrDefault(occNode, "threshold", config.occupancyConfig.threshold);
        readOrDefault(occNode, "residual", config.occupancyConfig.residual);
    }
    if (root["dataset"])
    {
        auto dsNode = root["dataset"];
        readOrDefault(dsNode, "preset", config.datasetConfig.preset);
        readOrDefault(dsNode, "system_prompt", config.datasetConfig.systemPrompt);
        readOrDefault(dsNode, "bulk", config.datasetConfig.bulk);
        readOrDefault(dsNode, "strict", config.datasetConfig.strict);
    }
    if (root["categories"])
        config.datasetConfig.categories = parseCategories(root["categories"]);

    validateConfig(config);
    return config;
}

HeatmapConfig loadConfig(const std::string& path)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config file " + path + ": " + e.what());
    }
    return parseConfig(root);
}

} // namespace posterheat
