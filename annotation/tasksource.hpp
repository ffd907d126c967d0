#ifndef POSTERHEAT_TASKSOURCE_H
#define POSTERHEAT_TASKSOURCE_H

#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace posterheat {

/** One decoded task and where it came from. */
struct TaskEntry
{
    std::string    origin;  ///< file name, or "file.json#index" for bulk exports
    nlohmann::json task;
};

/**
 * @brief Loads annotation tasks from a bulk export or a directory of files.
 */
class TaskSource {
public:
    /**
     * @param path  directory with per-task *.json files, or one bulk JSON file
     * @param bulk  treat path as a bulk export (array of tasks)
     */
    TaskSource(std::filesystem::path path, bool bulk);

    /**
     * Read all tasks in a deterministic order (bulk: array order; directory:
     * file names sorted lexicographically). Unparseable directory entries are
     * reported on std::cerr and skipped.
     *
     * @throws std::runtime_error if the source itself cannot be read.
     */
    std::vector<TaskEntry> load() const;

    /** Number of directory entries skipped by the last load(). */
    std::size_t skipped() const { return skipped_; }

    /** Parse one JSON file. @throws std::runtime_error on I/O or parse errors. */
    static nlohmann::json readJsonFile(const std::filesystem::path& path);

private:
    std::vector<TaskEntry> loadBulk() const;
    std::vector<TaskEntry> loadDirectory() const;

    std::filesystem::path path_;
    bool                  bulk_;
    mutable std::size_t   skipped_{0};
};

} // namespace posterheat

#endif // POSTERHEAT_TASKSOURCE_H
