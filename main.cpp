#include <iostream>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include <filesystem>
#include <opencv2/imgcodecs.hpp>

#include "annotation/categoryregistry.h"
#include "annotation/tasksource.hpp"
#include "heatmap/heatprocessing.hpp"
#include "heatmap/pipeline.hpp"
#include "heatmap/rowcodec.hpp"
#include "raster/contentoccupancy.hpp"
#include "config.hpp"
#include "visualization.hpp"

using namespace posterheat;

namespace {

struct CliOptions
{
    std::string command;
    std::vector<std::string> positional;
    std::string configFile;
    std::string src;
    std::string dst;
    std::string jsonl;
    std::string output;     // png
    std::string text;       // text dump of aggregated grids
    std::string preset;
    std::optional<int> hx, hy;
    std::optional<double> sigma;
    bool bulk = false;
    bool strict = false;
};

void printUsage(const char* argv0)
{
    std::cerr << "Usage:\n"
              << "  " << argv0 << " build --src <dir|file.json> --dst <out.jsonl> [--bulk] [--strict]\n"
              << "  " << argv0 << " aggregate (--jsonl <rows.jsonl> | --src <dir|file.json> [--bulk])"
                                  " [--output heat.png] [--text heat.txt]\n"
              << "  " << argv0 << " prompt <poster.png>\n"
              << "  " << argv0 << " show <prompt.txt> --output <heat.png>\n"
              << "Common options: [--config file.yml] [--grid HX HY] [--sigma S] [--preset NAME]\n";
}

std::string requireValue(int& i, int argc, char** argv)
{
    if (i + 1 >= argc)
        throw std::runtime_error(std::string("missing value for ") + argv[i]);
    return argv[++i];
}

CliOptions parseArgs(int argc, char** argv)
{
    CliOptions opt;
    opt.command = argv[1];
    for (int i = 2; i < argc; ++i)
    {
        const std::string a = argv[i];
        if      (a == "--config") opt.configFile = requireValue(i, argc, argv);
        else if (a == "--src")    opt.src        = requireValue(i, argc, argv);
        else if (a == "--dst")    opt.dst        = requireValue(i, argc, argv);
        else if (a == "--jsonl")  opt.jsonl      = requireValue(i, argc, argv);
        else if (a == "--output") opt.output     = requireValue(i, argc, argv);
        else if (a == "--text")   opt.text       = requireValue(i, argc, argv);
        else if (a == "--preset") opt.preset     = requireValue(i, argc, argv);
        else if (a == "--sigma")  opt.sigma      = std::stod(requireValue(i, argc, argv));
        else if (a == "--grid")
        {
            opt.hx = std::stoi(requireValue(i, argc, argv));
            opt.hy = std::stoi(requireValue(i, argc, argv));
        }
        else if (a == "--bulk")   opt.bulk   = true;
        else if (a == "--strict") opt.strict = true;
        else if (!a.empty() && a[0] == '-')
            throw std::runtime_error("unknown option " + a);
        else
            opt.positional.push_back(a);
    }
    return opt;
}

// Конфигурация: файл (явный или default.yml рядом), затем флаги командной строки
HeatmapConfig resolveConfig(const CliOptions& opt)
{
    HeatmapConfig config;
    std::string configFile = opt.configFile;
    if (configFile.empty() && std::filesystem::exists("default.yml"))
        configFile = "default.yml";

    if (!configFile.empty())
    {
        config = loadConfig(configFile);
        std::cout << "Loaded config from: " << configFile << std::endl;
    }

    if (opt.hx) config.gridConfig.cols = *opt.hx;
    if (opt.hy) config.gridConfig.rows = *opt.hy;
    if (opt.sigma) config.smoothingConfig.sigma = *opt.sigma;
    if (!opt.preset.empty())
    {
        config.datasetConfig.preset = opt.preset;
        config.datasetConfig.categories.clear();
    }
    if (opt.bulk) config.datasetConfig.bulk = true;
    if (opt.strict) config.datasetConfig.strict = true;

    validateConfig(config);
    return config;
}

HeatmapPipeline makePipeline(const HeatmapConfig& config)
{
    return HeatmapPipeline(config, CategoryRegistry::fromConfig(config.datasetConfig));
}

void writePanel(const HeatmapRow& row, const std::string& path)
{
    if (path.empty())
        return;
    cv::Mat3b panel = renderHeatPanel(row);
    if (panel.empty())
    {
        std::cerr << "Nothing to render into " << path << std::endl;
        return;
    }
    if (!cv::imwrite(path, panel))
        throw std::runtime_error("Could not write image: " + path);
    std::cout << "Heat-map PNG -> " << path << std::endl;
}

void writeText(const std::string& text, const std::string& path)
{
    std::ofstream out(path);
    if (!out)
        throw std::runtime_error("Could not open output file: " + path);
    out << text << '\n';
    std::cout << "Heat lines -> " << path << std::endl;
}

int runBuild(const CliOptions& opt, const HeatmapConfig& config)
{
    if (opt.src.empty() || opt.dst.empty())
    {
        std::cerr << "build: --src and --dst are required" << std::endl;
        return 1;
    }

    HeatmapPipeline pipeline = makePipeline(config);
    TaskSource source(opt.src, config.datasetConfig.bulk);
    const std::vector<TaskEntry> tasks = source.load();
    std::cout << "Loaded " << tasks.size() << " tasks from " << opt.src << std::endl;

    std::ofstream out(opt.dst, std::ios::binary);
    if (!out)
        throw std::runtime_error("Could not open output file: " + opt.dst);

    const BuildStats stats = pipeline.buildDataset(tasks, out);
    std::cout << "Wrote " << stats.written << " rows -> " << opt.dst;
    if (stats.skipped + source.skipped() > 0)
        std::cout << " (skipped " << stats.skipped + source.skipped() << ")";
    std::cout << std::endl;
    return 0;
}

int runAggregate(const CliOptions& opt, const HeatmapConfig& config)
{
    if (!opt.jsonl.empty())
    {
        /* средние по уже готовому датасету, в порядке реестра категорий */
        std::ifstream in(opt.jsonl);
        if (!in)
            throw std::runtime_error("Could not open " + opt.jsonl);

        HeatmapPipeline pipeline = makePipeline(config);
        const HeatAccumulator acc = pipeline.aggregateRecords(in);

        std::cout << "Averaged " << acc.documentCount() << " rows from " << opt.jsonl << std::endl;
        const HeatmapRow means = acc.means();

        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3);
        for (const auto& m : means)
        {
            oss << m.key;
            for (auto v : m.grid)
                oss << ' ' << v;
            oss << '\n';
        }
        if (opt.text.empty())
            std::cout << oss.str();
        else
            writeText(oss.str(), opt.text);
        writePanel(means, opt.output);
        return 0;
    }

    if (!opt.src.empty())
    {
        /* средние по разметке: сырые сетки -> среднее -> сглаживание */
        HeatmapPipeline pipeline = makePipeline(config);
        const std::vector<TaskEntry> tasks = TaskSource(opt.src, config.datasetConfig.bulk).load();
        const HeatAccumulator acc = pipeline.aggregateDocuments(tasks);
        if (acc.documentCount() == 0)
        {
            std::cerr << "No readable annotation tasks in " << opt.src << std::endl;
            return 1;
        }

        HeatmapRow heat = acc.means();
        for (auto& h : heat)
            h.grid = HeatProcessing::finalize(h.grid, config.smoothingConfig);

        std::cout << "Aggregated " << acc.documentCount() << " documents from " << opt.src << std::endl;
        const std::string block = RowCodec::formatUserBlock(heat);
        if (opt.text.empty())
            std::cout << block << std::endl;
        else
            writeText(block, opt.text);
        writePanel(heat, opt.output);
        return 0;
    }

    std::cerr << "aggregate: --jsonl or --src is required" << std::endl;
    return 1;
}

int runPrompt(const CliOptions& opt, const HeatmapConfig& config)
{
    if (opt.positional.empty())
    {
        std::cerr << "prompt: image path is required" << std::endl;
        return 1;
    }

    const cv::Size gridSize(config.gridConfig.cols, config.gridConfig.rows);
    const cv::Mat1d occ = HeatProcessing::finalize(
        ContentOccupancy::fromImageFile(opt.positional.front(), gridSize, config.occupancyConfig),
        config.smoothingConfig);

    // одна и та же сетка свободного места для каждой категории
    HeatmapRow row;
    for (const CategoryInfo* c : CategoryRegistry::fromConfig(config.datasetConfig).categories())
        row.push_back({c->heatKey(), occ});

    HeatmapPipeline pipeline = makePipeline(config);
    const std::string prompt = pipeline.systemPrompt();
    const std::string marker = prompt.substr(0, prompt.find(' '));

    std::cout << marker << '\n' << RowCodec::formatUserBlock(row) << std::endl;
    return 0;
}

int runShow(const CliOptions& opt, const HeatmapConfig& config)
{
    if (opt.positional.empty() || opt.output.empty())
    {
        std::cerr << "show: prompt file and --output are required" << std::endl;
        return 1;
    }

    std::ifstream in(opt.positional.front());
    if (!in)
        throw std::runtime_error("Could not open " + opt.positional.front());
    std::stringstream buffer;
    buffer << in.rdbuf();

    const HeatmapRow row = RowCodec::parseUserBlock(
        buffer.str(), cv::Size(config.gridConfig.cols, config.gridConfig.rows));
    std::cout << "Found " << row.size() << " heat lines in " << opt.positional.front() << std::endl;
    writePanel(row, opt.output);
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    if(argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        const CliOptions opt = parseArgs(argc, argv);
        const HeatmapConfig config = resolveConfig(opt);

        if (opt.command == "build")     return runBuild(opt, config);
        if (opt.command == "aggregate") return runAggregate(opt, config);
        if (opt.command == "prompt")    return runPrompt(opt, config);
        if (opt.command == "show")      return runShow(opt, config);

        std::cerr << "Unknown command: " << opt.command << std::endl;
        printUsage(argv[0]);
        return 1;
    } catch (const SchemaError& e) {
        std::cerr << "Schema error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
