#include "tasksource.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace posterheat {

TaskSource::TaskSource(std::filesystem::path path, bool bulk)
    : path_(std::move(path)), bulk_(bulk)
{
}

nlohmann::json TaskSource::readJsonFile(const std::filesystem::path& path)
{
    std::ifstream f(path);
    if (!f)
        throw std::runtime_error("Could not open JSON file: " + path.string());
    try {
        return nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Could not parse " + path.string() + ": " + e.what());
    }
}

std::vector<TaskEntry> TaskSource::load() const
{
    skipped_ = 0;
    return bulk_ ? loadBulk() : loadDirectory();
}

std::vector<TaskEntry> TaskSource::loadBulk() const
{
    nlohmann::json data = readJsonFile(path_);
    const std::string name = path_.filename().string();

    std::vector<TaskEntry> tasks;
    if (data.is_array())
    {
        tasks.reserve(data.size());
        for (std::size_t i = 0; i < data.size(); ++i)
            tasks.push_back({name + "#" + std::to_string(i), std::move(data[i])});
    }
    else if (data.is_object())
    {
        // один объект = одна задача
        tasks.push_back({name, std::move(data)});
    }
    else
    {
        throw std::runtime_error("Bulk export " + path_.string() + " is neither an array nor an object");
    }
    return tasks;
}

std::vector<TaskEntry> TaskSource::loadDirectory() const
{
    if (!std::filesystem::is_directory(path_))
        throw std::runtime_error("Source is not a directory: " + path_.string() +
                                 " (use --bulk for a single export file)");

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(path_))
    {
        if (entry.is_regular_file() && entry.path().extension() == ".json")
            files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());

    std::vector<TaskEntry> tasks;
    tasks.reserve(files.size());
    for (const auto& f : files)
    {
        try {
            tasks.push_back({f.filename().string(), readJsonFile(f)});
        } catch (const std::runtime_error& e) {
            std::cerr << "[TaskSource] skipping " << f.filename().string() << ": " << e.what() << "\n";
            ++skipped_;
        }
    }
    return tasks;
}

} // namespace posterheat
